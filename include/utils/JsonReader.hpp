/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef JSONREADER_HPP
#define JSONREADER_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace LockboxEngine {

class JsonValue;

using JsonObject = std::unordered_map<std::string, JsonValue>;
using JsonArray = std::vector<JsonValue>;

enum class JsonType { Null, Boolean, Number, String, Array, Object };

// Stream operator for JsonType (for Boost.Test)
inline std::ostream &operator<<(std::ostream &os, JsonType type) {
  switch (type) {
  case JsonType::Null:
    return os << "Null";
  case JsonType::Boolean:
    return os << "Boolean";
  case JsonType::Number:
    return os << "Number";
  case JsonType::String:
    return os << "String";
  case JsonType::Array:
    return os << "Array";
  case JsonType::Object:
    return os << "Object";
  }
  return os << "Unknown";
}

/**
 * @brief Immutable-by-default JSON document node
 *
 * Accessors named as*() throw std::bad_variant_access on type mismatch;
 * tryAs*() return an empty optional (or nullptr) instead.
 */
class JsonValue {
public:
  using ValueType = std::variant<std::nullptr_t, bool, double, std::string,
                                 JsonArray, JsonObject>;

  JsonValue() : m_value(nullptr) {}
  explicit JsonValue(bool value) : m_value(value) {}
  explicit JsonValue(double value) : m_value(value) {}
  explicit JsonValue(std::string value) : m_value(std::move(value)) {}
  explicit JsonValue(const char *value) : m_value(std::string(value)) {}
  explicit JsonValue(JsonArray value) : m_value(std::move(value)) {}
  explicit JsonValue(JsonObject value) : m_value(std::move(value)) {}

  JsonType getType() const;
  bool isNull() const {
    return std::holds_alternative<std::nullptr_t>(m_value);
  }
  bool isBool() const { return std::holds_alternative<bool>(m_value); }
  bool isNumber() const { return std::holds_alternative<double>(m_value); }
  bool isString() const { return std::holds_alternative<std::string>(m_value); }
  bool isArray() const { return std::holds_alternative<JsonArray>(m_value); }
  bool isObject() const { return std::holds_alternative<JsonObject>(m_value); }

  bool asBool() const { return std::get<bool>(m_value); }
  double asNumber() const { return std::get<double>(m_value); }
  // Truncates toward zero, saturating at the int range
  int asInt() const;
  const std::string &asString() const { return std::get<std::string>(m_value); }
  const JsonArray &asArray() const { return std::get<JsonArray>(m_value); }
  const JsonObject &asObject() const { return std::get<JsonObject>(m_value); }

  std::optional<bool> tryAsBool() const;
  std::optional<double> tryAsNumber() const;
  // Empty unless the number is whole and fits in an int
  std::optional<int> tryAsInt() const;
  std::optional<std::string> tryAsString() const;
  const JsonArray *tryAsArray() const;
  const JsonObject *tryAsObject() const;

  static std::optional<int> wholeNumberToInt(double value);

  // Missing keys / out of range indices yield a shared null value
  bool hasKey(const std::string &key) const;
  const JsonValue &operator[](const std::string &key) const;
  const JsonValue &operator[](size_t index) const;
  size_t size() const;

private:
  ValueType m_value;
};

/**
 * @brief Recursive-descent JSON reader (RFC 8259 subset, UTF-8 input)
 *
 * Usage:
 *   JsonReader reader;
 *   if (!reader.loadFromFile("res/items.json")) {
 *     CATALOG_ERROR(reader.getLastError());
 *   }
 *   const JsonValue& root = reader.getRoot();
 */
class JsonReader {
public:
  JsonReader() = default;

  bool loadFromFile(const std::string &path);
  bool parse(std::string_view jsonString);
  const JsonValue &getRoot() const { return m_root; }
  const std::string &getLastError() const { return m_lastError; }
  void clearError() { m_lastError.clear(); }

private:
  static constexpr int MAX_DEPTH = 64;

  std::optional<JsonValue> parseValue(int depth);
  std::optional<JsonValue> parseObject(int depth);
  std::optional<JsonValue> parseArray(int depth);
  std::optional<std::string> parseString();
  std::optional<JsonValue> parseNumber();
  bool parseLiteral(std::string_view literal);
  bool parseUnicodeEscape(uint32_t &codepoint);
  static void appendUtf8(std::string &out, uint32_t codepoint);

  char peek() const;
  char advance();
  void skipWhitespace();
  bool atEnd() const { return m_position >= m_input.size(); }
  void setError(const std::string &message);

  std::string_view m_input;
  size_t m_position{0};
  size_t m_line{1};
  size_t m_column{1};
  std::string m_lastError;
  JsonValue m_root;
};

} // namespace LockboxEngine

#endif // JSONREADER_HPP
