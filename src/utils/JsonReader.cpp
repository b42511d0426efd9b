/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"

#include <cerrno>
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>

namespace MarkerSync {

// ---------------------------
// JsonValue
// ---------------------------

std::optional<int> JsonValue::tryAsInt() const {
  if (isNumber())
    return asInt();
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

bool JsonValue::hasKey(const std::string &key) const {
  if (!isObject())
    return false;
  const auto &obj = asObject();
  return obj.find(key) != obj.end();
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

// ---------------------------
// JsonReader
// ---------------------------

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
  m_lastError.clear();
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_root = JsonValue();

  JsonValue root;
  if (!parseValue(root, 0)) {
    return false;
  }

  skipWhitespace();
  if (!atEnd()) {
    setError("Unexpected trailing characters");
    return false;
  }

  m_root = std::move(root);
  return true;
}

char JsonReader::peek() const {
  return atEnd() ? '\0' : m_input[m_position];
}

char JsonReader::advance() {
  if (atEnd())
    return '\0';
  char c = m_input[m_position++];
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
    char c = peek();
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
      break;
    advance();
  }
}

bool JsonReader::expectLiteral(const char *literal) {
  for (const char *p = literal; *p != '\0'; ++p) {
    if (peek() != *p) {
      setError(std::format("Invalid literal, expected '{}'", literal));
      return false;
    }
    advance();
  }
  return true;
}

void JsonReader::setError(const std::string &message) {
  if (m_lastError.empty()) {
    m_lastError =
        std::format("{} at line {}, column {}", message, m_line, m_column);
  }
}

bool JsonReader::parseValue(JsonValue &out, size_t depth) {
  if (depth > MAX_DEPTH) {
    setError("Maximum nesting depth exceeded");
    return false;
  }

  skipWhitespace();
  switch (peek()) {
  case '{':
    return parseObject(out, depth + 1);
  case '[':
    return parseArray(out, depth + 1);
  case '"': {
    std::string text;
    if (!parseString(text))
      return false;
    out = JsonValue(std::move(text));
    return true;
  }
  case 't':
    if (!expectLiteral("true"))
      return false;
    out = JsonValue(true);
    return true;
  case 'f':
    if (!expectLiteral("false"))
      return false;
    out = JsonValue(false);
    return true;
  case 'n':
    if (!expectLiteral("null"))
      return false;
    out = JsonValue();
    return true;
  case '\0':
    setError("Unexpected end of input");
    return false;
  default:
    if (peek() == '-' || (peek() >= '0' && peek() <= '9'))
      return parseNumber(out);
    setError(std::format("Unexpected character '{}'", peek()));
    return false;
  }
}

bool JsonReader::parseObject(JsonValue &out, size_t depth) {
  advance(); // '{'
  JsonObject object;

  skipWhitespace();
  if (peek() == '}') {
    advance();
    out = JsonValue(std::move(object));
    return true;
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      setError("Expected string key in object");
      return false;
    }
    std::string key;
    if (!parseString(key))
      return false;

    skipWhitespace();
    if (advance() != ':') {
      setError("Expected ':' after object key");
      return false;
    }

    JsonValue value;
    if (!parseValue(value, depth))
      return false;
    object[key] = std::move(value);

    skipWhitespace();
    char c = advance();
    if (c == '}')
      break;
    if (c != ',') {
      setError("Expected ',' or '}' in object");
      return false;
    }
  }

  out = JsonValue(std::move(object));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, size_t depth) {
  advance(); // '['
  JsonArray array;

  skipWhitespace();
  if (peek() == ']') {
    advance();
    out = JsonValue(std::move(array));
    return true;
  }

  while (true) {
    JsonValue element;
    if (!parseValue(element, depth))
      return false;
    array.push_back(std::move(element));

    skipWhitespace();
    char c = advance();
    if (c == ']')
      break;
    if (c != ',') {
      setError("Expected ',' or ']' in array");
      return false;
    }
  }

  out = JsonValue(std::move(array));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote
  out.clear();

  while (true) {
    if (atEnd()) {
      setError("Unterminated string");
      return false;
    }

    char c = advance();
    if (c == '"')
      return true;
    if (static_cast<unsigned char>(c) < 0x20) {
      setError("Control character in string");
      return false;
    }
    if (c != '\\') {
      out += c;
      continue;
    }

    char escaped = advance();
    switch (escaped) {
    case '"':
      out += '"';
      break;
    case '\\':
      out += '\\';
      break;
    case '/':
      out += '/';
      break;
    case 'b':
      out += '\b';
      break;
    case 'f':
      out += '\f';
      break;
    case 'n':
      out += '\n';
      break;
    case 'r':
      out += '\r';
      break;
    case 't':
      out += '\t';
      break;
    case 'u': {
      uint32_t codePoint = 0;
      if (!parseUnicodeEscape(codePoint))
        return false;
      // UTF-8 encode
      if (codePoint < 0x80) {
        out += static_cast<char>(codePoint);
      } else if (codePoint < 0x800) {
        out += static_cast<char>(0xC0 | (codePoint >> 6));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
      } else if (codePoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codePoint >> 12));
        out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
      } else {
        out += static_cast<char>(0xF0 | (codePoint >> 18));
        out += static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
      }
      break;
    }
    default:
      setError("Invalid escape sequence");
      return false;
    }
  }
}

bool JsonReader::parseUnicodeEscape(uint32_t &codePoint) {
  auto readHex4 = [this](uint32_t &value) {
    value = 0;
    for (int i = 0; i < 4; ++i) {
      char c = advance();
      value <<= 4;
      if (c >= '0' && c <= '9')
        value |= static_cast<uint32_t>(c - '0');
      else if (c >= 'a' && c <= 'f')
        value |= static_cast<uint32_t>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F')
        value |= static_cast<uint32_t>(c - 'A' + 10);
      else
        return false;
    }
    return true;
  };

  if (!readHex4(codePoint)) {
    setError("Invalid \\u escape");
    return false;
  }

  // Surrogate pair
  if (codePoint >= 0xD800 && codePoint <= 0xDBFF) {
    uint32_t low = 0;
    if (advance() != '\\' || advance() != 'u' || !readHex4(low) ||
        low < 0xDC00 || low > 0xDFFF) {
      setError("Invalid surrogate pair");
      return false;
    }
    codePoint = 0x10000 + ((codePoint - 0xD800) << 10) + (low - 0xDC00);
  }
  return true;
}

bool JsonReader::parseNumber(JsonValue &out) {
  size_t start = m_position;
  if (peek() == '-')
    advance();

  auto isDigit = [](char c) { return c >= '0' && c <= '9'; };

  if (!isDigit(peek())) {
    setError("Invalid number");
    return false;
  }
  while (isDigit(peek()))
    advance();
  if (peek() == '.') {
    advance();
    if (!isDigit(peek())) {
      setError("Expected digit after decimal point");
      return false;
    }
    while (isDigit(peek()))
      advance();
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (!isDigit(peek())) {
      setError("Expected digit in exponent");
      return false;
    }
    while (isDigit(peek()))
      advance();
  }

  std::string text = m_input.substr(start, m_position - start);
  errno = 0;
  double value = std::strtod(text.c_str(), nullptr);
  if (errno == ERANGE) {
    setError("Number out of range: " + text);
    return false;
  }
  out = JsonValue(value);
  return true;
}

} // namespace MarkerSync
