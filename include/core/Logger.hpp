/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - cstdint: Required for uint8_t type
// - mutex: Required for thread-safe logging
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace LockboxEngine {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (even in release for crashes)
  ERROR_LEVEL = 1,  // Renamed to avoid macro conflicts
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Full console logging in debug builds
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("Lockbox - [%s] %s: %s\n", system, getLevelString(level), message);
    fflush(stdout);
  }

private:
  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }
};

#define LOCKBOX_CRITICAL(system, msg)                                          \
  LockboxEngine::Logger::Log(LockboxEngine::LogLevel::CRITICAL, system, msg)
#define LOCKBOX_ERROR(system, msg)                                             \
  LockboxEngine::Logger::Log(LockboxEngine::LogLevel::ERROR_LEVEL, system, msg)
#define LOCKBOX_WARN(system, msg)                                              \
  LockboxEngine::Logger::Log(LockboxEngine::LogLevel::WARNING, system, msg)
#define LOCKBOX_INFO(system, msg)                                              \
  LockboxEngine::Logger::Log(LockboxEngine::LogLevel::INFO, system, msg)
#define LOCKBOX_DEBUG(system, msg)                                             \
  LockboxEngine::Logger::Log(LockboxEngine::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - critical/error only, written to a log file (Logger.cpp)
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static std::mutex s_logMutex; // Public for macro access

  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define LOCKBOX_CRITICAL(system, msg)                                          \
  LockboxEngine::Logger::Log("CRITICAL", system, msg)

#define LOCKBOX_ERROR(system, msg)                                             \
  LockboxEngine::Logger::Log("ERROR", system, msg)

#define LOCKBOX_WARN(system, msg) ((void)0)  // Zero overhead
#define LOCKBOX_INFO(system, msg) ((void)0)  // Zero overhead
#define LOCKBOX_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each system

#define EVENT_CRITICAL(msg) LOCKBOX_CRITICAL("EventManager", msg)
#define EVENT_ERROR(msg) LOCKBOX_ERROR("EventManager", msg)
#define EVENT_WARN(msg) LOCKBOX_WARN("EventManager", msg)
#define EVENT_INFO(msg) LOCKBOX_INFO("EventManager", msg)
#define EVENT_DEBUG(msg) LOCKBOX_DEBUG("EventManager", msg)

#define SETTINGS_CRITICAL(msg) LOCKBOX_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) LOCKBOX_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) LOCKBOX_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) LOCKBOX_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) LOCKBOX_DEBUG("SettingsManager", msg)

#define DIMMER_CRITICAL(msg) LOCKBOX_CRITICAL("ItemDimController", msg)
#define DIMMER_ERROR(msg) LOCKBOX_ERROR("ItemDimController", msg)
#define DIMMER_WARN(msg) LOCKBOX_WARN("ItemDimController", msg)
#define DIMMER_INFO(msg) LOCKBOX_INFO("ItemDimController", msg)
#define DIMMER_DEBUG(msg) LOCKBOX_DEBUG("ItemDimController", msg)

#define CATALOG_CRITICAL(msg) LOCKBOX_CRITICAL("ItemCatalog", msg)
#define CATALOG_ERROR(msg) LOCKBOX_ERROR("ItemCatalog", msg)
#define CATALOG_WARN(msg) LOCKBOX_WARN("ItemCatalog", msg)
#define CATALOG_INFO(msg) LOCKBOX_INFO("ItemCatalog", msg)
#define CATALOG_DEBUG(msg) LOCKBOX_DEBUG("ItemCatalog", msg)

#define UNLOCK_CRITICAL(msg) LOCKBOX_CRITICAL("UnlockedItemStore", msg)
#define UNLOCK_ERROR(msg) LOCKBOX_ERROR("UnlockedItemStore", msg)
#define UNLOCK_WARN(msg) LOCKBOX_WARN("UnlockedItemStore", msg)
#define UNLOCK_INFO(msg) LOCKBOX_INFO("UnlockedItemStore", msg)
#define UNLOCK_DEBUG(msg) LOCKBOX_DEBUG("UnlockedItemStore", msg)

#define HOST_CRITICAL(msg) LOCKBOX_CRITICAL("WidgetTree", msg)
#define HOST_ERROR(msg) LOCKBOX_ERROR("WidgetTree", msg)
#define HOST_WARN(msg) LOCKBOX_WARN("WidgetTree", msg)
#define HOST_INFO(msg) LOCKBOX_INFO("WidgetTree", msg)
#define HOST_DEBUG(msg) LOCKBOX_DEBUG("WidgetTree", msg)

#define DEMO_CRITICAL(msg) LOCKBOX_CRITICAL("LockboxDemo", msg)
#define DEMO_ERROR(msg) LOCKBOX_ERROR("LockboxDemo", msg)
#define DEMO_WARN(msg) LOCKBOX_WARN("LockboxDemo", msg)
#define DEMO_INFO(msg) LOCKBOX_INFO("LockboxDemo", msg)
#define DEMO_DEBUG(msg) LOCKBOX_DEBUG("LockboxDemo", msg)

// Benchmark mode convenience macros
#define LOCKBOX_ENABLE_BENCHMARK_MODE()                                        \
  LockboxEngine::Logger::SetBenchmarkMode(true)
#define LOCKBOX_DISABLE_BENCHMARK_MODE()                                       \
  LockboxEngine::Logger::SetBenchmarkMode(false)

} // namespace LockboxEngine

#endif // LOGGER_HPP
