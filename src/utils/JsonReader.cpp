/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cctype>
#include <charconv>
#include <cmath>
#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace HiveEngine {

namespace {
const JsonValue &nullValue() {
  static const JsonValue value;
  return value;
}
} // namespace

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
  return obj != nullptr && obj->find(key) != obj->end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  const JsonObject *obj = tryAsObject();
  if (obj == nullptr)
    return nullValue();
  auto it = obj->find(key);
  return it != obj->end() ? it->second : nullValue();
}

const JsonValue &JsonValue::operator[](size_t index) const {
  const auto *arr = std::get_if<JsonArray>(&m_value);
  if (arr == nullptr || index >= arr->size())
    return nullValue();
  return (*arr)[index];
}

size_t JsonValue::size() const {
  if (const auto *arr = std::get_if<JsonArray>(&m_value))
    return arr->size();
  if (const auto *obj = std::get_if<JsonObject>(&m_value))
    return obj->size();
  return 0;
}

std::string JsonValue::toString() const {
  std::ostringstream oss;
  writeTo(oss);
  return oss.str();
}

void JsonValue::writeTo(std::ostream &stream) const {
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
    stream << '"';
    for (char c : asString()) {
      switch (c) {
      case '"':
        stream << "\\\"";
        break;
      case '\\':
        stream << "\\\\";
        break;
      case '\n':
        stream << "\\n";
        break;
      case '\t':
        stream << "\\t";
        break;
      default:
        stream << c;
      }
    }
    stream << '"';
    break;
  case JsonType::Array: {
    stream << '[';
    bool first = true;
    for (const auto &item : asArray()) {
      if (!first)
        stream << ',';
      item.writeTo(stream);
      first = false;
    }
    stream << ']';
    break;
  }
  case JsonType::Object: {
    stream << '{';
    bool first = true;
    for (const auto &[key, value] : asObject()) {
      if (!first)
        stream << ',';
      JsonValue(key).writeTo(stream);
      stream << ':';
      value.writeTo(stream);
      first = false;
    }
    stream << '}';
    break;
  }
  }
}

// ---------------------------------------------------------------------------
// JsonReader
// ---------------------------------------------------------------------------

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    m_root = JsonValue();
    m_lastError = std::format("Could not open file: {}", path);
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
  m_failed = false;
  m_lastError.clear();

  skipWhitespace();
  if (atEnd()) {
    fail("Empty document");
    m_root = JsonValue();
    return false;
  }

  JsonValue root = parseValue(0);
  if (!m_failed) {
    skipWhitespace();
    if (!atEnd()) {
      fail(std::format("Unexpected trailing character '{}'", peek()));
    }
  }

  m_root = m_failed ? JsonValue() : std::move(root);
  return !m_failed;
}

JsonValue JsonReader::parseValue(int depth) {
  if (depth > MAX_DEPTH) {
    fail("Maximum nesting depth exceeded");
    return JsonValue();
  }

  skipWhitespace();
  if (atEnd()) {
    fail("Unexpected end of input");
    return JsonValue();
  }

  const char c = peek();
  switch (c) {
  case '{':
    return parseObject(depth);
  case '[':
    return parseArray(depth);
  case '"':
    return JsonValue(parseString());
  case 't':
    return parseLiteral("true") ? JsonValue(true) : JsonValue();
  case 'f':
    return parseLiteral("false") ? JsonValue(false) : JsonValue();
  case 'n':
    parseLiteral("null");
    return JsonValue();
  default:
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
      return JsonValue(parseNumber());
    }
    fail(std::format("Unexpected character '{}'", c));
    return JsonValue();
  }
}

JsonValue JsonReader::parseObject(int depth) {
  advance(); // '{'
  JsonObject object;

  skipWhitespace();
  if (peek() == '}') {
    advance();
    return JsonValue(std::move(object));
  }

  while (!m_failed) {
    skipWhitespace();
    if (peek() != '"') {
      fail("Expected string key in object");
      break;
    }
    std::string key = parseString();
    if (m_failed)
      break;

    skipWhitespace();
    if (advance() != ':') {
      fail(std::format("Expected ':' after key '{}'", key));
      break;
    }

    JsonValue value = parseValue(depth + 1);
    if (m_failed)
      break;
    object.insert_or_assign(std::move(key), std::move(value));

    skipWhitespace();
    const char next = advance();
    if (next == '}')
      return JsonValue(std::move(object));
    if (next != ',') {
      fail("Expected ',' or '}' in object");
    }
  }
  return JsonValue();
}

JsonValue JsonReader::parseArray(int depth) {
  advance(); // '['
  JsonArray array;

  skipWhitespace();
  if (peek() == ']') {
    advance();
    return JsonValue(std::move(array));
  }

  while (!m_failed) {
    array.push_back(parseValue(depth + 1));
    if (m_failed)
      break;

    skipWhitespace();
    const char next = advance();
    if (next == ']')
      return JsonValue(std::move(array));
    if (next != ',') {
      fail("Expected ',' or ']' in array");
    }
  }
  return JsonValue();
}

std::string JsonReader::parseString() {
  advance(); // opening quote
  std::string out;

  while (!atEnd()) {
    const char c = advance();
    if (c == '"')
      return out;
    if (static_cast<unsigned char>(c) < 0x20) {
      fail("Unescaped control character in string");
      return out;
    }
    if (c != '\\') {
      out.push_back(c);
      continue;
    }

    if (atEnd())
      break;
    const char esc = advance();
    switch (esc) {
    case '"':
    case '\\':
    case '/':
      out.push_back(esc);
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
    case 'u': {
      if (m_position + 4 > m_input.size()) {
        fail("Truncated unicode escape");
        return out;
      }
      uint32_t codepoint = 0;
      const char *begin = m_input.data() + m_position;
      auto [ptr, ec] = std::from_chars(begin, begin + 4, codepoint, 16);
      if (ec != std::errc() || ptr != begin + 4) {
        fail("Invalid unicode escape");
        return out;
      }
      for (int i = 0; i < 4; ++i)
        advance();
      appendUtf8(out, codepoint);
      break;
    }
    default:
      fail(std::format("Invalid escape sequence '\\{}'", esc));
      return out;
    }
  }

  fail("Unterminated string");
  return out;
}

double JsonReader::parseNumber() {
  const size_t start = m_position;
  if (peek() == '-')
    advance();

  auto consumeDigits = [this]() {
    size_t count = 0;
    while (!atEnd() && std::isdigit(static_cast<unsigned char>(peek()))) {
      advance();
      ++count;
    }
    return count;
  };

  if (consumeDigits() == 0) {
    fail("Expected digits in number");
    return 0.0;
  }
  if (peek() == '.') {
    advance();
    if (consumeDigits() == 0) {
      fail("Expected digits after decimal point");
      return 0.0;
    }
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (consumeDigits() == 0) {
      fail("Expected digits in exponent");
      return 0.0;
    }
  }

  try {
    return std::stod(m_input.substr(start, m_position - start));
  } catch (const std::out_of_range &) {
    fail("Number out of range");
    return 0.0;
  }
}

bool JsonReader::parseLiteral(const char *literal) {
  const std::string_view expected(literal);
  if (m_input.compare(m_position, expected.size(), expected) != 0) {
    fail(std::format("Invalid literal, expected '{}'", expected));
    return false;
  }
  for (size_t i = 0; i < expected.size(); ++i)
    advance();
  return true;
}

void JsonReader::appendUtf8(std::string &out, uint32_t codepoint) {
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

void JsonReader::fail(const std::string &message) {
  if (m_failed)
    return;
  m_failed = true;
  m_lastError = std::format("{} at line {}, column {}", message, m_line, m_column);
}

} // namespace HiveEngine
