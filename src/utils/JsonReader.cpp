/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace TickGuard {

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

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

const JsonObject *JsonValue::tryAsObject() const {
  return std::get_if<JsonObject>(&m_value);
}

bool JsonValue::hasKey(const std::string &key) const {
  const JsonObject *obj = tryAsObject();
  return obj && obj->find(key) != obj->end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  static const JsonValue nullValue;
  const JsonObject *obj = tryAsObject();
  if (!obj)
    return nullValue;
  auto it = obj->find(key);
  return it != obj->end() ? it->second : nullValue;
}

const JsonValue &JsonValue::operator[](size_t index) const {
  static const JsonValue nullValue;
  const auto *arr = std::get_if<JsonArray>(&m_value);
  if (!arr || index >= arr->size())
    return nullValue;
  return (*arr)[index];
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
}

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    m_lastError = "Could not open file: " + path;
    m_root = JsonValue();
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_lastError.clear();

  JsonValue root;
  skipWhitespace();
  if (!parseValue(root, 0)) {
    m_root = JsonValue();
    return false;
  }
  skipWhitespace();
  if (m_position != m_input.size()) {
    m_root = JsonValue();
    return fail("Unexpected content after JSON value");
  }

  m_root = std::move(root);
  return true;
}

char JsonReader::advance() {
  if (m_position >= m_input.size())
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
  while (m_position < m_input.size()) {
    char c = peek();
    if (c != ' ' && c != '\t' && c != '\r' && c != '\n')
      break;
    advance();
  }
}

bool JsonReader::fail(const std::string &message) {
  m_lastError = "Line " + std::to_string(m_line) + ", Column " +
                std::to_string(m_column) + ": " + message;
  return false;
}

bool JsonReader::parseValue(JsonValue &out, int depth) {
  if (depth > MAX_DEPTH)
    return fail("Nesting too deep");

  switch (peek()) {
  case '{':
    return parseObject(out, depth + 1);
  case '[':
    return parseArray(out, depth + 1);
  case '"': {
    std::string str;
    if (!parseString(str))
      return false;
    out = JsonValue(std::move(str));
    return true;
  }
  case 't':
    return parseLiteral("true", JsonValue(true), out);
  case 'f':
    return parseLiteral("false", JsonValue(false), out);
  case 'n':
    return parseLiteral("null", JsonValue(), out);
  case '\0':
    return fail("Unexpected end of input");
  default:
    if (peek() == '-' || (peek() >= '0' && peek() <= '9'))
      return parseNumber(out);
    return fail(std::string("Unexpected character: ") + peek());
  }
}

bool JsonReader::parseObject(JsonValue &out, int depth) {
  advance(); // '{'
  JsonObject result;

  skipWhitespace();
  if (peek() == '}') {
    advance();
    out = JsonValue(std::move(result));
    return true;
  }

  for (;;) {
    skipWhitespace();
    if (peek() != '"')
      return fail("Expected string key in object");

    std::string key;
    if (!parseString(key))
      return false;

    skipWhitespace();
    if (advance() != ':')
      return fail("Expected ':' after object key");

    skipWhitespace();
    JsonValue value;
    if (!parseValue(value, depth))
      return false;
    result[key] = std::move(value);

    skipWhitespace();
    char c = advance();
    if (c == '}')
      break;
    if (c != ',')
      return fail("Expected '}' or ',' in object");
  }

  out = JsonValue(std::move(result));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, int depth) {
  advance(); // '['
  JsonArray result;

  skipWhitespace();
  if (peek() == ']') {
    advance();
    out = JsonValue(std::move(result));
    return true;
  }

  for (;;) {
    skipWhitespace();
    JsonValue value;
    if (!parseValue(value, depth))
      return false;
    result.push_back(std::move(value));

    skipWhitespace();
    char c = advance();
    if (c == ']')
      break;
    if (c != ',')
      return fail("Expected ']' or ',' in array");
  }

  out = JsonValue(std::move(result));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote

  while (m_position < m_input.size()) {
    char c = advance();

    if (c == '"')
      return true;

    if (static_cast<unsigned char>(c) < 0x20)
      return fail("Unescaped control character in string");

    if (c != '\\') {
      out += c;
      continue;
    }

    char escaped = advance();
    switch (escaped) {
    case '"':
    case '\\':
    case '/':
      out += escaped;
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
    case 'u':
      if (!appendUnicodeEscape(out))
        return false;
      break;
    default:
      return fail(std::string("Invalid escape sequence: \\") + escaped);
    }
  }

  return fail("Unterminated string");
}

bool JsonReader::appendUnicodeEscape(std::string &out) {
  uint32_t codepoint = 0;
  for (int i = 0; i < 4; ++i) {
    char c = advance();
    uint32_t digit;
    if (c >= '0' && c <= '9')
      digit = static_cast<uint32_t>(c - '0');
    else if (c >= 'a' && c <= 'f')
      digit = static_cast<uint32_t>(c - 'a' + 10);
    else if (c >= 'A' && c <= 'F')
      digit = static_cast<uint32_t>(c - 'A' + 10);
    else
      return fail("Invalid Unicode escape sequence");
    codepoint = (codepoint << 4) | digit;
  }

  // UTF-8 encode; surrogate pairs are not combined
  if (codepoint <= 0x7F) {
    out += static_cast<char>(codepoint);
  } else if (codepoint <= 0x7FF) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else {
    out += static_cast<char>(0xE0 | (codepoint >> 12));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  }
  return true;
}

bool JsonReader::parseNumber(JsonValue &out) {
  const size_t start = m_position;
  auto isDigit = [](char c) { return c >= '0' && c <= '9'; };

  if (peek() == '-')
    advance();

  if (peek() == '0') {
    advance();
  } else if (isDigit(peek())) {
    while (isDigit(peek()))
      advance();
  } else {
    return fail("Invalid number format");
  }

  if (peek() == '.') {
    advance();
    if (!isDigit(peek()))
      return fail("Invalid number format: expected digit after decimal point");
    while (isDigit(peek()))
      advance();
  }

  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (!isDigit(peek()))
      return fail("Invalid number format: expected digit in exponent");
    while (isDigit(peek()))
      advance();
  }

  const std::string text = m_input.substr(start, m_position - start);
  out = JsonValue(std::strtod(text.c_str(), nullptr));
  return true;
}

bool JsonReader::parseLiteral(const char *literal, JsonValue value, JsonValue &out) {
  for (const char *p = literal; *p != '\0'; ++p) {
    if (advance() != *p)
      return fail(std::string("Invalid literal, expected ") + literal);
  }
  out = std::move(value);
  return true;
}

} // namespace TickGuard
