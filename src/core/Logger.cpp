/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Release builds only - debug builds log to the console from the header
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace LockboxEngine {
namespace {

namespace fs = std::filesystem;

constexpr const char* LOG_PREFIX = "lockbox_";
constexpr size_t MAX_LOG_FILES = 5;

std::tm localTime(std::time_t t) {
    std::tm result{};
#ifdef _WIN32
    localtime_s(&result, &t);
#else
    localtime_r(&t, &result);
#endif
    return result;
}

std::string formatStamp(const std::tm& tm, bool forFilename) {
    if (forFilename) {
        return std::format("{:04}{:02}{:02}_{:02}{:02}{:02}", tm.tm_year + 1900,
                           tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
    }
    return std::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}", tm.tm_year + 1900,
                       tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
}

/**
 * Per-user log file under the SDL preference path:
 *   <pref>/logs/lockbox_YYYYmmdd_HHMMSS.log
 * Opened lazily on the first message; older files beyond MAX_LOG_FILES are
 * removed when a new one is created.
 */
class LogFile {
public:
    static LogFile& Instance() {
        static LogFile instance;
        return instance;
    }

    void append(const char* level, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (!m_openAttempted) {
            m_openAttempted = true;
            open();
        }
        if (!m_stream.is_open()) {
            return;
        }

        const auto now = std::chrono::system_clock::now();
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                now.time_since_epoch()).count() % 1000;
        const std::tm tm = localTime(std::chrono::system_clock::to_time_t(now));

        m_stream << formatStamp(tm, false) << std::format(".{:03}", millis)
                 << " [" << level << "] [" << system << "] " << message << '\n';
        // Only CRITICAL and ERROR reach here, flush each one
        m_stream.flush();
    }

    LogFile(const LogFile&) = delete;
    LogFile& operator=(const LogFile&) = delete;

private:
    LogFile() = default;
    ~LogFile() = default;

    void open() {
        // LOCKBOX_APP_NAME is defined via CMake
        char* prefPath = SDL_GetPrefPath("HammerForged", LOCKBOX_APP_NAME);
        if (prefPath == nullptr) {
            return;
        }
        const fs::path logDir = fs::path(prefPath) / "logs";
        SDL_free(prefPath);

        std::error_code ec;
        fs::create_directories(logDir, ec);
        if (ec) {
            return;
        }

        // Make room for the file about to be created
        pruneOldFiles(logDir, MAX_LOG_FILES - 1);

        const std::tm tm = localTime(std::time(nullptr));
        const fs::path logPath =
            logDir / (std::string(LOG_PREFIX) + formatStamp(tm, true) + ".log");

        m_stream.open(logPath, std::ios::out | std::ios::app);
        if (m_stream.is_open()) {
            m_stream << "=== " << LOCKBOX_APP_NAME << " Log, started "
                     << formatStamp(tm, false) << " ===\n";
        }
    }

    static void pruneOldFiles(const fs::path& logDir, size_t keep) {
        std::vector<fs::path> files;
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(logDir, ec)) {
            const std::string name = entry.path().filename().string();
            if (entry.path().extension() == ".log" && name.starts_with(LOG_PREFIX)) {
                files.push_back(entry.path());
            }
        }
        if (files.size() <= keep) {
            return;
        }

        // Timestamped names sort chronologically
        std::sort(files.begin(), files.end());
        const size_t excess = files.size() - keep;
        for (size_t i = 0; i < excess; ++i) {
            fs::remove(files[i], ec);
        }
    }

    std::mutex m_mutex;
    std::ofstream m_stream;
    bool m_openAttempted{false};
};

} // namespace

void Logger::Log(const char* level, const char* system,
                 const std::string& message) {
    Log(level, system, message.c_str());
}

void Logger::Log(const char* level, const char* system, const char* message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
        return;
    }
    LogFile::Instance().append(level, system, message);
}

} // namespace LockboxEngine

#endif // DEBUG
