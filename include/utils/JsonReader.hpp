/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef JSONREADER_HPP
#define JSONREADER_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace GridForge {

class JsonValue;

// Ordered so that iteration (and warnings about unknown keys) is stable
using JsonObject = std::map<std::string, JsonValue>;
using JsonArray = std::vector<JsonValue>;

enum class JsonType { Null, Boolean, Number, String, Array, Object };

const char *jsonTypeToString(JsonType type);

// Stream operator for JsonType (for Boost.Test)
inline std::ostream &operator<<(std::ostream &os, JsonType type) {
  return os << jsonTypeToString(type);
}

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

  JsonType getType() const { return static_cast<JsonType>(m_value.index()); }
  bool isNull() const { return getType() == JsonType::Null; }
  bool isBool() const { return getType() == JsonType::Boolean; }
  bool isNumber() const { return getType() == JsonType::Number; }
  bool isString() const { return getType() == JsonType::String; }
  bool isArray() const { return getType() == JsonType::Array; }
  bool isObject() const { return getType() == JsonType::Object; }

  // Throw std::bad_variant_access on the wrong type
  bool asBool() const { return std::get<bool>(m_value); }
  double asNumber() const { return std::get<double>(m_value); }
  const std::string &asString() const { return std::get<std::string>(m_value); }
  const JsonArray &asArray() const { return std::get<JsonArray>(m_value); }
  const JsonObject &asObject() const { return std::get<JsonObject>(m_value); }

  std::optional<bool> tryAsBool() const;
  std::optional<double> tryAsNumber() const;
  // Only integral numbers in range convert
  std::optional<int64_t> tryAsInteger() const;
  std::optional<std::string> tryAsString() const;

  bool hasKey(const std::string &key) const;
  // Null value when absent or not an object
  const JsonValue &operator[](const std::string &key) const;
  // Null value when out of range or not an array
  const JsonValue &operator[](size_t index) const;
  size_t size() const;

  std::string toString() const;

private:
  ValueType m_value;

  void writeToStream(std::ostream &stream) const;
};

/**
 * @brief Recursive descent reader for configuration files
 *
 * Failures are reported the usual way: parse() and loadFromFile() return
 * false and getLastError() carries "Line L, Column C: message".
 */
class JsonReader {
public:
  JsonReader() = default;

  bool loadFromFile(const std::string &path);
  bool parse(const std::string &jsonString);

  const JsonValue &getRoot() const { return m_root; }
  const std::string &getLastError() const { return m_lastError; }
  void clearError() { m_lastError.clear(); }

  static constexpr size_t MAX_DEPTH = 64;

private:
  std::string m_input;
  size_t m_position{0};
  size_t m_line{1};
  size_t m_column{1};
  std::string m_lastError;
  JsonValue m_root;

  char peek() const;
  char advance();
  void skipWhitespace();
  bool failed() const { return !m_lastError.empty(); }
  void setError(const std::string &message);

  JsonValue parseValue(size_t depth);
  JsonValue parseObject(size_t depth);
  JsonValue parseArray(size_t depth);
  std::string parseString();
  JsonValue parseNumber();
  JsonValue parseLiteral();
  uint32_t parseHex4();
};

} // namespace GridForge

#endif // JSONREADER_HPP
