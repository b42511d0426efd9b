/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef JSONREADER_HPP
#define JSONREADER_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace MarkerSync {

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

class JsonValue {
public:
  using ValueType = std::variant<std::nullptr_t, bool, double, std::string,
                                 JsonArray, JsonObject>;

  JsonValue() : m_value(nullptr) {}
  explicit JsonValue(bool value) : m_value(value) {}
  explicit JsonValue(int value) : m_value(static_cast<double>(value)) {}
  explicit JsonValue(double value) : m_value(value) {}
  explicit JsonValue(const char *value) : m_value(std::string(value)) {}
  explicit JsonValue(std::string value) : m_value(std::move(value)) {}
  explicit JsonValue(JsonArray value) : m_value(std::move(value)) {}
  explicit JsonValue(JsonObject value) : m_value(std::move(value)) {}

  JsonType getType() const { return static_cast<JsonType>(m_value.index()); }
  bool isNull() const { return std::holds_alternative<std::nullptr_t>(m_value); }
  bool isBool() const { return std::holds_alternative<bool>(m_value); }
  bool isNumber() const { return std::holds_alternative<double>(m_value); }
  bool isString() const { return std::holds_alternative<std::string>(m_value); }
  bool isArray() const { return std::holds_alternative<JsonArray>(m_value); }
  bool isObject() const { return std::holds_alternative<JsonObject>(m_value); }

  // Throw std::bad_variant_access on type mismatch
  bool asBool() const { return std::get<bool>(m_value); }
  double asNumber() const { return std::get<double>(m_value); }
  int asInt() const { return static_cast<int>(std::get<double>(m_value)); }
  const std::string &asString() const { return std::get<std::string>(m_value); }
  const JsonArray &asArray() const { return std::get<JsonArray>(m_value); }
  const JsonObject &asObject() const { return std::get<JsonObject>(m_value); }

  std::optional<int> tryAsInt() const;
  std::optional<std::string> tryAsString() const;

  bool hasKey(const std::string &key) const;
  // Missing keys and out-of-range indices yield a shared null value
  const JsonValue &operator[](const std::string &key) const;
  const JsonValue &operator[](size_t index) const;
  size_t size() const;

private:
  ValueType m_value;
};

/**
 * @brief Recursive-descent JSON reader with line/column error reporting
 *
 * Usage:
 *   JsonReader reader;
 *   if (!reader.loadFromFile("res/settings.json")) {
 *     log(reader.getLastError());
 *   }
 *   const JsonValue& root = reader.getRoot();
 */
class JsonReader {
public:
  JsonReader() = default;

  bool loadFromFile(const std::string &path);
  bool parse(const std::string &jsonString);
  const JsonValue &getRoot() const { return m_root; }
  const std::string &getLastError() const { return m_lastError; }

private:
  static constexpr size_t MAX_DEPTH = 256;

  std::string m_input;
  size_t m_position{0};
  size_t m_line{1};
  size_t m_column{1};
  std::string m_lastError;
  JsonValue m_root;

  char peek() const;
  char advance();
  bool atEnd() const { return m_position >= m_input.size(); }
  void skipWhitespace();
  bool expectLiteral(const char *literal);
  void setError(const std::string &message);

  bool parseValue(JsonValue &out, size_t depth);
  bool parseObject(JsonValue &out, size_t depth);
  bool parseArray(JsonValue &out, size_t depth);
  bool parseString(std::string &out);
  bool parseNumber(JsonValue &out);
  bool parseUnicodeEscape(uint32_t &codePoint);
};

} // namespace MarkerSync

#endif // JSONREADER_HPP
