/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>

namespace GridForge {

const char *jsonTypeToString(JsonType type) {
  switch (type) {
  case JsonType::Null:
    return "Null";
  case JsonType::Boolean:
    return "Boolean";
  case JsonType::Number:
    return "Number";
  case JsonType::String:
    return "String";
  case JsonType::Array:
    return "Array";
  case JsonType::Object:
    return "Object";
  }
  return "Unknown";
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

std::optional<int64_t> JsonValue::tryAsInteger() const {
  if (!isNumber())
    return std::nullopt;
  const double num = asNumber();
  // 2^63 is exactly representable; anything at or above it is out of range
  if (std::floor(num) != num || num < -9223372036854775808.0 ||
      num >= 9223372036854775808.0) {
    return std::nullopt;
  }
  return static_cast<int64_t>(num);
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

bool JsonValue::hasKey(const std::string &key) const {
  return isObject() && asObject().count(key) > 0;
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  static const JsonValue null_value;
  if (!isObject())
    return null_value;
  const auto &obj = asObject();
  auto it = obj.find(key);
  return (it != obj.end()) ? it->second : null_value;
}

const JsonValue &JsonValue::operator[](size_t index) const {
  static const JsonValue null_value;
  if (!isArray() || index >= asArray().size())
    return null_value;
  return asArray()[index];
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
}

std::string JsonValue::toString() const {
  std::ostringstream oss;
  writeToStream(oss);
  return oss.str();
}

void JsonValue::writeToStream(std::ostream &stream) const {
  switch (getType()) {
  case JsonType::Null:
    stream << "null";
    break;
  case JsonType::Boolean:
    stream << (asBool() ? "true" : "false");
    break;
  case JsonType::Number: {
    const double num = asNumber();
    if (std::floor(num) == num && std::abs(num) < 1e15) {
      stream << static_cast<long long>(num);
    } else {
      stream << num;
    }
    break;
  }
  case JsonType::String:
    stream << "\"" << asString() << "\"";
    break;
  case JsonType::Array: {
    stream << "[";
    const auto &arr = asArray();
    for (size_t i = 0; i < arr.size(); ++i) {
      if (i > 0)
        stream << ",";
      arr[i].writeToStream(stream);
    }
    stream << "]";
    break;
  }
  case JsonType::Object: {
    stream << "{";
    bool first = true;
    for (const auto &[key, value] : asObject()) {
      if (!first)
        stream << ",";
      first = false;
      stream << "\"" << key << "\":";
      value.writeToStream(stream);
    }
    stream << "}";
    break;
  }
  }
}

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    m_lastError = "Could not open file: " + path;
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  clearError();
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_root = JsonValue();

  skipWhitespace();
  if (m_position >= m_input.size()) {
    setError("Empty JSON input");
    return false;
  }

  JsonValue root = parseValue(0);
  if (failed()) {
    return false;
  }

  skipWhitespace();
  if (m_position < m_input.size()) {
    setError("Unexpected character after JSON value: " +
             std::string(1, peek()));
    return false;
  }

  m_root = std::move(root);
  return true;
}

char JsonReader::peek() const {
  return (m_position < m_input.size()) ? m_input[m_position] : '\0';
}

char JsonReader::advance() {
  if (m_position >= m_input.size())
    return '\0';

  const char c = m_input[m_position++];
  if (c == '\n') {
    m_line++;
    m_column = 1;
  } else {
    m_column++;
  }
  return c;
}

void JsonReader::skipWhitespace() {
  while (m_position < m_input.size()) {
    const char c = peek();
    if (c != ' ' && c != '\t' && c != '\r' && c != '\n')
      break;
    advance();
  }
}

void JsonReader::setError(const std::string &message) {
  if (failed())
    return; // Keep the first error
  m_lastError = "Line " + std::to_string(m_line) + ", Column " +
                std::to_string(m_column) + ": " + message;
}

JsonValue JsonReader::parseValue(size_t depth) {
  skipWhitespace();
  const char c = peek();

  // depth counts the containers already open around this value
  if ((c == '{' || c == '[') && depth >= MAX_DEPTH) {
    setError("Nesting deeper than " + std::to_string(MAX_DEPTH) + " levels");
    return JsonValue();
  }

  switch (c) {
  case '{':
    return parseObject(depth + 1);
  case '[':
    return parseArray(depth + 1);
  case '"':
    return JsonValue(parseString());
  case 't':
  case 'f':
  case 'n':
    return parseLiteral();
  default:
    if (c == '-' || (c >= '0' && c <= '9'))
      return parseNumber();
    if (c == '\0')
      setError("Unexpected end of input");
    else
      setError("Unexpected character: " + std::string(1, c));
    return JsonValue();
  }
}

JsonValue JsonReader::parseObject(size_t depth) {
  JsonObject result;
  advance(); // '{'

  skipWhitespace();
  if (peek() == '}') {
    advance();
    return JsonValue(std::move(result));
  }

  while (!failed()) {
    skipWhitespace();
    if (peek() != '"') {
      setError("Expected string key in object");
      break;
    }
    std::string key = parseString();
    if (failed())
      break;

    skipWhitespace();
    if (advance() != ':') {
      setError("Expected ':' after object key");
      break;
    }

    JsonValue value = parseValue(depth);
    if (failed())
      break;
    result[key] = std::move(value);

    skipWhitespace();
    const char next = advance();
    if (next == '}')
      return JsonValue(std::move(result));
    if (next != ',') {
      setError("Expected '}' or ',' in object");
      break;
    }
  }
  return JsonValue();
}

JsonValue JsonReader::parseArray(size_t depth) {
  JsonArray result;
  advance(); // '['

  skipWhitespace();
  if (peek() == ']') {
    advance();
    return JsonValue(std::move(result));
  }

  while (!failed()) {
    JsonValue value = parseValue(depth);
    if (failed())
      break;
    result.push_back(std::move(value));

    skipWhitespace();
    const char next = advance();
    if (next == ']')
      return JsonValue(std::move(result));
    if (next != ',') {
      setError("Expected ']' or ',' in array");
      break;
    }
  }
  return JsonValue();
}

std::string JsonReader::parseString() {
  advance(); // Opening quote

  std::string result;
  while (m_position < m_input.size()) {
    const char c = advance();

    if (c == '"')
      return result;

    if (static_cast<unsigned char>(c) < 0x20) {
      setError("Unescaped control character in string");
      return "";
    }

    if (c != '\\') {
      result += c;
      continue;
    }

    const char escaped = advance();
    switch (escaped) {
    case '"':
    case '\\':
    case '/':
      result += escaped;
      break;
    case 'b':
      result += '\b';
      break;
    case 'f':
      result += '\f';
      break;
    case 'n':
      result += '\n';
      break;
    case 'r':
      result += '\r';
      break;
    case 't':
      result += '\t';
      break;
    case 'u': {
      const uint32_t codepoint = parseHex4();
      if (failed())
        return "";
      // UTF-8 encode; surrogate pairs are not combined
      if (codepoint <= 0x7F) {
        result += static_cast<char>(codepoint);
      } else if (codepoint <= 0x7FF) {
        result += static_cast<char>(0xC0 | (codepoint >> 6));
        result += static_cast<char>(0x80 | (codepoint & 0x3F));
      } else {
        result += static_cast<char>(0xE0 | (codepoint >> 12));
        result += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        result += static_cast<char>(0x80 | (codepoint & 0x3F));
      }
      break;
    }
    case '\0':
      setError("Unexpected end of input in string escape");
      return "";
    default:
      setError("Invalid escape sequence: \\" + std::string(1, escaped));
      return "";
    }
  }

  setError("Unterminated string");
  return "";
}

JsonValue JsonReader::parseNumber() {
  const size_t start = m_position;
  const auto isDigit = [](char c) { return c >= '0' && c <= '9'; };

  if (peek() == '-')
    advance();

  if (peek() == '0') {
    advance();
  } else if (isDigit(peek())) {
    while (isDigit(peek()))
      advance();
  } else {
    setError("Invalid number format");
    return JsonValue();
  }

  if (peek() == '.') {
    advance();
    if (!isDigit(peek())) {
      setError("Invalid number format: expected digit after decimal point");
      return JsonValue();
    }
    while (isDigit(peek()))
      advance();
  }

  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (!isDigit(peek())) {
      setError("Invalid number format: expected digit in exponent");
      return JsonValue();
    }
    while (isDigit(peek()))
      advance();
  }

  const std::string text = m_input.substr(start, m_position - start);
  try {
    return JsonValue(std::stod(text));
  } catch (const std::exception &) {
    setError("Number out of range: " + text);
    return JsonValue();
  }
}

JsonValue JsonReader::parseLiteral() {
  const auto matches = [this](const char *word) {
    return m_input.compare(m_position, std::char_traits<char>::length(word),
                           word) == 0;
  };

  if (matches("true")) {
    for (int i = 0; i < 4; ++i)
      advance();
    return JsonValue(true);
  }
  if (matches("false")) {
    for (int i = 0; i < 5; ++i)
      advance();
    return JsonValue(false);
  }
  if (matches("null")) {
    for (int i = 0; i < 4; ++i)
      advance();
    return JsonValue();
  }

  setError("Invalid token starting with '" + std::string(1, peek()) + "'");
  return JsonValue();
}

uint32_t JsonReader::parseHex4() {
  uint32_t result = 0;
  for (int i = 0; i < 4; ++i) {
    const char c = advance();
    uint32_t digit;
    if (c >= '0' && c <= '9') {
      digit = static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      digit = static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      digit = static_cast<uint32_t>(c - 'A' + 10);
    } else {
      setError("Invalid Unicode escape sequence");
      return 0;
    }
    result = (result << 4) | digit;
  }
  return result;
}

} // namespace GridForge
