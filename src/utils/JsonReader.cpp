/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstring>
#include <format>
#include <fstream>
#include <sstream>

namespace Deadlock {

const char *toString(JsonType type) {
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

const JsonArray *JsonValue::tryAsArray() const {
  return std::get_if<JsonArray>(&m_value);
}

const JsonObject *JsonValue::tryAsObject() const {
  return std::get_if<JsonObject>(&m_value);
}

bool JsonValue::hasKey(const std::string &key) const {
  return find(key) != nullptr;
}

const JsonValue *JsonValue::find(const std::string &key) const {
  const JsonObject *object = tryAsObject();
  if (!object)
    return nullptr;
  auto it = object->find(key);
  return it == object->end() ? nullptr : &it->second;
}

size_t JsonValue::size() const {
  if (const JsonArray *array = tryAsArray())
    return array->size();
  if (const JsonObject *object = tryAsObject())
    return object->size();
  return 0;
}

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    m_root = JsonValue();
    m_lastError = "Could not open file: " + path;
    return false;
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_lastError.clear();
  m_root = JsonValue();

  skipWhitespace();
  if (atEnd()) {
    return fail("Empty JSON input");
  }

  JsonValue root;
  if (!parseValue(root, 0)) {
    return false;
  }

  skipWhitespace();
  if (!atEnd()) {
    return fail("Unexpected content after JSON value");
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

bool JsonReader::fail(const std::string &message) {
  m_lastError = std::format("{}:{}: {}", m_line, m_column, message);
  m_root = JsonValue();
  return false;
}

bool JsonReader::parseValue(JsonValue &out, int depth) {
  if (depth > MAX_DEPTH) {
    return fail("Nesting too deep");
  }

  skipWhitespace();
  switch (peek()) {
  case '{':
    return parseObject(out, depth);
  case '[':
    return parseArray(out, depth);
  case '"': {
    std::string text;
    if (!parseString(text))
      return false;
    out = JsonValue(std::move(text));
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
    if (peek() == '-' || std::isdigit(static_cast<unsigned char>(peek())))
      return parseNumber(out);
    return fail(std::format("Unexpected character '{}'", peek()));
  }
}

bool JsonReader::parseObject(JsonValue &out, int depth) {
  advance(); // {
  JsonObject object;

  skipWhitespace();
  if (peek() == '}') {
    advance();
    out = JsonValue(std::move(object));
    return true;
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"')
      return fail("Expected string key in object");

    std::string key;
    if (!parseString(key))
      return false;

    skipWhitespace();
    if (advance() != ':')
      return fail("Expected ':' after object key");

    JsonValue value;
    if (!parseValue(value, depth + 1))
      return false;
    object.insert_or_assign(std::move(key), std::move(value));

    skipWhitespace();
    const char next = advance();
    if (next == '}')
      break;
    if (next != ',')
      return fail("Expected '}' or ',' in object");
  }

  out = JsonValue(std::move(object));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, int depth) {
  advance(); // [
  JsonArray array;

  skipWhitespace();
  if (peek() == ']') {
    advance();
    out = JsonValue(std::move(array));
    return true;
  }

  while (true) {
    JsonValue element;
    if (!parseValue(element, depth + 1))
      return false;
    array.push_back(std::move(element));

    skipWhitespace();
    const char next = advance();
    if (next == ']')
      break;
    if (next != ',')
      return fail("Expected ']' or ',' in array");
  }

  out = JsonValue(std::move(array));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote
  out.clear();

  while (!atEnd()) {
    const char c = advance();
    if (c == '"')
      return true;
    if (static_cast<unsigned char>(c) < 0x20)
      return fail("Unescaped control character in string");
    if (c != '\\') {
      out.push_back(c);
      continue;
    }

    const char escaped = advance();
    switch (escaped) {
    case '"':
    case '\\':
    case '/':
      out.push_back(escaped);
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'u':
      if (!parseUnicodeEscape(out))
        return false;
      break;
    default:
      return fail(std::format("Invalid escape sequence '\\{}'", escaped));
    }
  }
  return fail("Unterminated string");
}

bool JsonReader::parseUnicodeEscape(std::string &out) {
  if (m_position + 4 > m_input.size())
    return fail("Truncated unicode escape");

  uint32_t codepoint = 0;
  const char *first = m_input.data() + m_position;
  auto [ptr, ec] = std::from_chars(first, first + 4, codepoint, 16);
  if (ec != std::errc() || ptr != first + 4)
    return fail("Invalid unicode escape");
  for (int i = 0; i < 4; ++i)
    advance();

  // UTF-8 encode (surrogate pairs are passed through as-is)
  if (codepoint < 0x80) {
    out.push_back(static_cast<char>(codepoint));
  } else if (codepoint < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
    out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
    out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
  }
  return true;
}

bool JsonReader::parseNumber(JsonValue &out) {
  const size_t start = m_position;

  if (peek() == '-')
    advance();
  if (!std::isdigit(static_cast<unsigned char>(peek())))
    return fail("Invalid number: expected digit");
  if (peek() == '0') {
    advance();
  } else {
    while (std::isdigit(static_cast<unsigned char>(peek())))
      advance();
  }

  if (peek() == '.') {
    advance();
    if (!std::isdigit(static_cast<unsigned char>(peek())))
      return fail("Invalid number: expected digit after decimal point");
    while (std::isdigit(static_cast<unsigned char>(peek())))
      advance();
  }

  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (!std::isdigit(static_cast<unsigned char>(peek())))
      return fail("Invalid number: expected digit in exponent");
    while (std::isdigit(static_cast<unsigned char>(peek())))
      advance();
  }

  double value = 0.0;
  const char *first = m_input.data() + start;
  const char *last = m_input.data() + m_position;
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last || !std::isfinite(value))
    return fail("Number out of range");

  out = JsonValue(value);
  return true;
}

bool JsonReader::parseLiteral(const char *word, JsonValue value, JsonValue &out) {
  const size_t length = std::strlen(word);
  if (m_input.compare(m_position, length, word) != 0)
    return fail(std::format("Invalid literal, expected '{}'", word));
  for (size_t i = 0; i < length; ++i)
    advance();
  out = std::move(value);
  return true;
}

} // namespace Deadlock
