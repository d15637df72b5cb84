/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <charconv>
#include <cmath>
#include <format>
#include <fstream>
#include <limits>
#include <sstream>

namespace LockboxEngine {

namespace {
const JsonValue &nullValue() {
  static const JsonValue s_null;
  return s_null;
}
} // namespace

// JsonValue implementation
JsonType JsonValue::getType() const {
  switch (m_value.index()) {
  case 1:
    return JsonType::Boolean;
  case 2:
    return JsonType::Number;
  case 3:
    return JsonType::String;
  case 4:
    return JsonType::Array;
  case 5:
    return JsonType::Object;
  default:
    return JsonType::Null;
  }
}

std::optional<bool> JsonValue::tryAsBool() const {
  if (isBool())
    return asBool();
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (isNumber())
    return asNumber();
  return std::nullopt;
}

int JsonValue::asInt() const {
  const double value = std::get<double>(m_value);
  if (std::isnan(value))
    return 0;
  if (value <= static_cast<double>(std::numeric_limits<int>::min()))
    return std::numeric_limits<int>::min();
  if (value >= static_cast<double>(std::numeric_limits<int>::max()))
    return std::numeric_limits<int>::max();
  return static_cast<int>(value);
}

std::optional<int> JsonValue::wholeNumberToInt(double value) {
  if (!std::isfinite(value) || std::trunc(value) != value)
    return std::nullopt;
  if (value < static_cast<double>(std::numeric_limits<int>::min()) ||
      value > static_cast<double>(std::numeric_limits<int>::max()))
    return std::nullopt;
  return static_cast<int>(value);
}

std::optional<int> JsonValue::tryAsInt() const {
  if (isNumber())
    return wholeNumberToInt(asNumber());
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

const JsonArray *JsonValue::tryAsArray() const {
  return std::get_if<JsonArray>(&m_value);
}

const JsonObject *JsonValue::tryAsObject() const {
  return std::get_if<JsonObject>(&m_value);
}

bool JsonValue::hasKey(const std::string &key) const {
  const JsonObject *obj = tryAsObject();
  return obj != nullptr && obj->find(key) != obj->end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  const JsonObject *obj = tryAsObject();
  if (obj == nullptr)
    return nullValue();
  auto it = obj->find(key);
  return (it != obj->end()) ? it->second : nullValue();
}

const JsonValue &JsonValue::operator[](size_t index) const {
  const JsonArray *arr = tryAsArray();
  if (arr == nullptr || index >= arr->size())
    return nullValue();
  return (*arr)[index];
}

size_t JsonValue::size() const {
  if (const JsonArray *arr = tryAsArray())
    return arr->size();
  if (const JsonObject *obj = tryAsObject())
    return obj->size();
  return 0;
}

// JsonReader implementation
bool JsonReader::loadFromFile(const std::string &path) {
  m_lastError.clear();
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    setError("Failed to open file: " + path);
    return false;
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  const std::string content = buffer.str();
  return parse(content);
}

bool JsonReader::parse(std::string_view jsonString) {
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_lastError.clear();
  m_root = JsonValue();

  auto value = parseValue(0);
  if (value) {
    skipWhitespace();
    if (!atEnd()) {
      setError("Unexpected trailing characters");
      value.reset();
    }
  }

  // The view may reference a caller temporary; never keep it past parse()
  m_input = {};

  if (!value) {
    return false;
  }
  m_root = std::move(*value);
  return true;
}

std::optional<JsonValue> JsonReader::parseValue(int depth) {
  if (depth > MAX_DEPTH) {
    setError("Maximum nesting depth exceeded");
    return std::nullopt;
  }

  skipWhitespace();
  if (atEnd()) {
    setError("Unexpected end of input");
    return std::nullopt;
  }

  switch (peek()) {
  case '{':
    return parseObject(depth + 1);
  case '[':
    return parseArray(depth + 1);
  case '"': {
    auto str = parseString();
    if (!str)
      return std::nullopt;
    return JsonValue(std::move(*str));
  }
  case 't':
    if (!parseLiteral("true"))
      return std::nullopt;
    return JsonValue(true);
  case 'f':
    if (!parseLiteral("false"))
      return std::nullopt;
    return JsonValue(false);
  case 'n':
    if (!parseLiteral("null"))
      return std::nullopt;
    return JsonValue();
  default:
    return parseNumber();
  }
}

std::optional<JsonValue> JsonReader::parseObject(int depth) {
  advance(); // '{'
  JsonObject object;

  skipWhitespace();
  if (peek() == '}') {
    advance();
    return JsonValue(std::move(object));
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      setError("Expected string key in object");
      return std::nullopt;
    }
    auto key = parseString();
    if (!key)
      return std::nullopt;

    skipWhitespace();
    if (advance() != ':') {
      setError("Expected ':' after object key '" + *key + "'");
      return std::nullopt;
    }

    auto value = parseValue(depth);
    if (!value)
      return std::nullopt;
    object.insert_or_assign(std::move(*key), std::move(*value));

    skipWhitespace();
    const char c = advance();
    if (c == '}')
      break;
    if (c != ',') {
      setError("Expected ',' or '}' in object");
      return std::nullopt;
    }
  }

  return JsonValue(std::move(object));
}

std::optional<JsonValue> JsonReader::parseArray(int depth) {
  advance(); // '['
  JsonArray array;

  skipWhitespace();
  if (peek() == ']') {
    advance();
    return JsonValue(std::move(array));
  }

  while (true) {
    auto value = parseValue(depth);
    if (!value)
      return std::nullopt;
    array.push_back(std::move(*value));

    skipWhitespace();
    const char c = advance();
    if (c == ']')
      break;
    if (c != ',') {
      setError("Expected ',' or ']' in array");
      return std::nullopt;
    }
  }

  return JsonValue(std::move(array));
}

std::optional<std::string> JsonReader::parseString() {
  advance(); // opening quote
  std::string result;

  while (!atEnd()) {
    const char c = advance();
    if (c == '"') {
      return result;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      setError("Unescaped control character in string");
      return std::nullopt;
    }
    if (c != '\\') {
      result.push_back(c);
      continue;
    }

    if (atEnd())
      break;
    const char esc = advance();
    switch (esc) {
    case '"':
    case '\\':
    case '/':
      result.push_back(esc);
      break;
    case 'b':
      result.push_back('\b');
      break;
    case 'f':
      result.push_back('\f');
      break;
    case 'n':
      result.push_back('\n');
      break;
    case 'r':
      result.push_back('\r');
      break;
    case 't':
      result.push_back('\t');
      break;
    case 'u': {
      uint32_t codepoint = 0;
      if (!parseUnicodeEscape(codepoint))
        return std::nullopt;
      // Surrogate pair
      if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
        uint32_t low = 0;
        if (advance() != '\\' || advance() != 'u' || !parseUnicodeEscape(low) ||
            low < 0xDC00 || low > 0xDFFF) {
          setError("Invalid UTF-16 surrogate pair");
          return std::nullopt;
        }
        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
      }
      appendUtf8(result, codepoint);
      break;
    }
    default:
      setError(std::format("Invalid escape sequence '\\{}'", esc));
      return std::nullopt;
    }
  }

  setError("Unterminated string");
  return std::nullopt;
}

std::optional<JsonValue> JsonReader::parseNumber() {
  const size_t start = m_position;
  if (peek() == '-')
    advance();
  while (!atEnd()) {
    const char c = peek();
    if ((c >= '0' && c <= '9') || c == '.' || c == 'e' || c == 'E' ||
        c == '+' || c == '-') {
      advance();
    } else {
      break;
    }
  }

  const std::string_view text = m_input.substr(start, m_position - start);
  double number = 0.0;
  auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), number);
  if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
    setError("Invalid number '" + std::string(text) + "'");
    return std::nullopt;
  }
  return JsonValue(number);
}

bool JsonReader::parseLiteral(std::string_view literal) {
  if (m_input.substr(m_position, literal.size()) != literal) {
    setError("Invalid literal, expected '" + std::string(literal) + "'");
    return false;
  }
  for (size_t i = 0; i < literal.size(); ++i) {
    advance();
  }
  return true;
}

bool JsonReader::parseUnicodeEscape(uint32_t &codepoint) {
  codepoint = 0;
  for (int i = 0; i < 4; ++i) {
    if (atEnd()) {
      setError("Truncated unicode escape");
      return false;
    }
    const char c = advance();
    codepoint <<= 4;
    if (c >= '0' && c <= '9') {
      codepoint |= static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      codepoint |= static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      codepoint |= static_cast<uint32_t>(c - 'A' + 10);
    } else {
      setError("Invalid hex digit in unicode escape");
      return false;
    }
  }
  return true;
}

void JsonReader::appendUtf8(std::string &out, uint32_t codepoint) {
  if (codepoint < 0x80) {
    out.push_back(static_cast<char>(codepoint));
  } else if (codepoint < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
    out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
  } else if (codepoint < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
    out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
    out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
  }
}

char JsonReader::peek() const {
  return atEnd() ? '\0' : m_input[m_position];
}

char JsonReader::advance() {
  if (atEnd())
    return '\0';
  const char c = m_input[m_position++];
  if (c == '\n') {
    ++m_line;
    m_column = 1;
  } else {
    ++m_column;
  }
  return c;
}

void JsonReader::skipWhitespace() {
  while (!atEnd()) {
    const char c = peek();
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
      break;
    advance();
  }
}

void JsonReader::setError(const std::string &message) {
  // Keep the innermost (first) error
  if (m_lastError.empty()) {
    m_lastError = std::format("Line {}, column {}: {}", m_line, m_column,
                              message);
  }
}

} // namespace LockboxEngine
