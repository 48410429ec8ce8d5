/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <cstdio>
#include <climits>
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace Chorus {

namespace {
const JsonValue NULL_VALUE{};

// Finite, no fractional part, and inside [low, high)
bool isIntegralIn(double value, double low, double high) {
  return std::isfinite(value) && std::trunc(value) == value && value >= low &&
         value < high;
}

constexpr double INT_LOW = static_cast<double>(INT_MIN);
constexpr double INT_HIGH = static_cast<double>(INT_MAX) + 1.0;
constexpr double INT64_LOW = -9223372036854775808.0;  // -2^63
constexpr double INT64_HIGH = 9223372036854775808.0;  // 2^63
constexpr double UINT64_HIGH = 18446744073709551616.0; // 2^64

void appendUtf8(std::string &out, uint32_t codePoint) {
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
}

void writeEscaped(std::string &out, const std::string &text) {
  out += '"';
  for (const char c : text) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        out += std::format("\\u{:04x}", static_cast<unsigned int>(c));
      } else {
        out += c;
      }
    }
  }
  out += '"';
}
} // anonymous namespace

// ---------------------------------------------------------------------------
// JsonValue
// ---------------------------------------------------------------------------

JsonType JsonValue::getType() const {
  return static_cast<JsonType>(m_value.index());
}

std::optional<bool> JsonValue::tryAsBool() const {
  if (isBool()) {
    return asBool();
  }
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (isNumber()) {
    return asNumber();
  }
  return std::nullopt;
}

int JsonValue::asInt() const {
  const double value = std::get<double>(m_value);
  if (!isIntegralIn(value, INT_LOW, INT_HIGH)) {
    throw std::out_of_range(std::format("JSON number {} is not an int", value));
  }
  return static_cast<int>(value);
}

int64_t JsonValue::asInt64() const {
  const double value = std::get<double>(m_value);
  if (!isIntegralIn(value, INT64_LOW, INT64_HIGH)) {
    throw std::out_of_range(std::format("JSON number {} is not an int64", value));
  }
  return static_cast<int64_t>(value);
}

std::optional<int> JsonValue::tryAsInt() const {
  if (isNumber() && isIntegralIn(asNumber(), INT_LOW, INT_HIGH)) {
    return static_cast<int>(asNumber());
  }
  return std::nullopt;
}

std::optional<int64_t> JsonValue::tryAsInt64() const {
  if (isNumber() && isIntegralIn(asNumber(), INT64_LOW, INT64_HIGH)) {
    return static_cast<int64_t>(asNumber());
  }
  return std::nullopt;
}

std::optional<uint64_t> JsonValue::tryAsUInt64() const {
  if (isNumber() && isIntegralIn(asNumber(), 0.0, UINT64_HIGH)) {
    return static_cast<uint64_t>(asNumber());
  }
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString()) {
    return asString();
  }
  return std::nullopt;
}

const JsonArray *JsonValue::tryAsArray() const {
  return std::get_if<JsonArray>(&m_value);
}

const JsonObject *JsonValue::tryAsObject() const {
  return std::get_if<JsonObject>(&m_value);
}

bool JsonValue::hasKey(const std::string &key) const {
  const JsonObject *object = tryAsObject();
  return object != nullptr && object->find(key) != object->end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  const JsonObject *object = tryAsObject();
  if (object == nullptr) {
    return NULL_VALUE;
  }
  auto it = object->find(key);
  return it != object->end() ? it->second : NULL_VALUE;
}

JsonValue &JsonValue::operator[](const std::string &key) {
  if (isNull()) {
    m_value = JsonObject{};
  }
  return asObject()[key];
}

const JsonValue &JsonValue::operator[](size_t index) const {
  const JsonArray *array = tryAsArray();
  if (array == nullptr || index >= array->size()) {
    return NULL_VALUE;
  }
  return (*array)[index];
}

JsonValue &JsonValue::operator[](size_t index) { return asArray().at(index); }

size_t JsonValue::size() const {
  if (const JsonArray *array = tryAsArray()) {
    return array->size();
  }
  if (const JsonObject *object = tryAsObject()) {
    return object->size();
  }
  return 0;
}

std::string JsonValue::toString() const {
  std::string out;
  writeTo(out);
  return out;
}

void JsonValue::writeTo(std::string &out) const {
  switch (getType()) {
  case JsonType::Null:
    out += "null";
    break;
  case JsonType::Boolean:
    out += asBool() ? "true" : "false";
    break;
  case JsonType::Number: {
    const double number = asNumber();
    if (std::isfinite(number) && number == std::floor(number) &&
        std::fabs(number) < 9.007199254740992e15) {
      out += std::format("{}", static_cast<int64_t>(number));
    } else {
      out += std::format("{}", number);
    }
    break;
  }
  case JsonType::String:
    writeEscaped(out, asString());
    break;
  case JsonType::Array: {
    out += '[';
    bool first = true;
    for (const auto &element : asArray()) {
      if (!first) {
        out += ',';
      }
      first = false;
      element.writeTo(out);
    }
    out += ']';
    break;
  }
  case JsonType::Object: {
    out += '{';
    bool first = true;
    for (const auto &[key, value] : asObject()) {
      if (!first) {
        out += ',';
      }
      first = false;
      writeEscaped(out, key);
      out += ':';
      value.writeTo(out);
    }
    out += '}';
    break;
  }
  }
}

// ---------------------------------------------------------------------------
// JsonReader
// ---------------------------------------------------------------------------

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    m_lastError = "Failed to open file: " + path;
    JSON_ERROR(m_lastError);
    return false;
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  const std::string content = buffer.str();
  return parse(content);
}

bool JsonReader::parse(std::string_view json) {
  m_input = json;
  m_pos = 0;
  m_line = 1;
  m_column = 1;
  m_lastError.clear();
  m_root = JsonValue();

  JsonValue root;
  skipWhitespace();
  if (atEnd()) {
    fail("Empty JSON input");
    m_input = {};
    return false;
  }
  if (!parseValue(root, 0)) {
    m_input = {};
    return false;
  }
  skipWhitespace();
  if (!atEnd()) {
    fail("Unexpected trailing characters");
    m_input = {};
    return false;
  }

  m_root = std::move(root);
  m_input = {};
  return true;
}

bool JsonReader::parseValue(JsonValue &out, int depth) {
  if (depth > MAX_DEPTH) {
    return fail("Maximum nesting depth exceeded");
  }

  skipWhitespace();
  switch (peek()) {
  case '{':
    return parseObject(out, depth + 1);
  case '[':
    return parseArray(out, depth + 1);
  case '"': {
    std::string text;
    if (!parseString(text)) {
      return false;
    }
    out = JsonValue(std::move(text));
    return true;
  }
  case 't':
    if (!parseLiteral("true")) {
      return false;
    }
    out = JsonValue(true);
    return true;
  case 'f':
    if (!parseLiteral("false")) {
      return false;
    }
    out = JsonValue(false);
    return true;
  case 'n':
    if (!parseLiteral("null")) {
      return false;
    }
    out = JsonValue();
    return true;
  default:
    if (peek() == '-' || (peek() >= '0' && peek() <= '9')) {
      return parseNumber(out);
    }
    return fail(atEnd() ? "Unexpected end of input"
                        : std::format("Unexpected character '{}'", peek()));
  }
}

bool JsonReader::parseObject(JsonValue &out, int depth) {
  advance(); // '{'
  JsonObject object;

  skipWhitespace();
  if (consume('}')) {
    out = JsonValue(std::move(object));
    return true;
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      return fail("Expected string key in object");
    }
    std::string key;
    if (!parseString(key)) {
      return false;
    }

    skipWhitespace();
    if (!consume(':')) {
      return fail("Expected ':' after object key");
    }

    JsonValue value;
    if (!parseValue(value, depth)) {
      return false;
    }
    object.insert_or_assign(std::move(key), std::move(value));

    skipWhitespace();
    if (consume('}')) {
      break;
    }
    if (!consume(',')) {
      return fail("Expected ',' or '}' in object");
    }
  }

  out = JsonValue(std::move(object));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, int depth) {
  advance(); // '['
  JsonArray array;

  skipWhitespace();
  if (consume(']')) {
    out = JsonValue(std::move(array));
    return true;
  }

  while (true) {
    JsonValue element;
    if (!parseValue(element, depth)) {
      return false;
    }
    array.push_back(std::move(element));

    skipWhitespace();
    if (consume(']')) {
      break;
    }
    if (!consume(',')) {
      return fail("Expected ',' or ']' in array");
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
      return fail("Unterminated string");
    }
    const char c = advance();
    if (c == '"') {
      return true;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      return fail("Unescaped control character in string");
    }
    if (c != '\\') {
      out += c;
      continue;
    }

    if (atEnd()) {
      return fail("Unterminated escape sequence");
    }
    const char escape = advance();
    switch (escape) {
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
      if (!parseUnicodeEscape(codePoint)) {
        return false;
      }
      // Surrogate pair
      if (codePoint >= 0xD800 && codePoint <= 0xDBFF) {
        uint32_t low = 0;
        if (!consume('\\') || !consume('u') || !parseUnicodeEscape(low) ||
            low < 0xDC00 || low > 0xDFFF) {
          return fail("Invalid UTF-16 surrogate pair");
        }
        codePoint = 0x10000 + ((codePoint - 0xD800) << 10) + (low - 0xDC00);
      }
      appendUtf8(out, codePoint);
      break;
    }
    default:
      return fail(std::format("Invalid escape sequence '\\{}'", escape));
    }
  }
}

bool JsonReader::parseUnicodeEscape(uint32_t &codePoint) {
  codePoint = 0;
  for (int i = 0; i < 4; ++i) {
    if (atEnd()) {
      return fail("Truncated unicode escape");
    }
    const char c = advance();
    codePoint <<= 4;
    if (c >= '0' && c <= '9') {
      codePoint |= static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      codePoint |= static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      codePoint |= static_cast<uint32_t>(c - 'A' + 10);
    } else {
      return fail("Invalid hex digit in unicode escape");
    }
  }
  return true;
}

bool JsonReader::parseNumber(JsonValue &out) {
  const size_t start = m_pos;
  auto digits = [this]() {
    size_t count = 0;
    while (!atEnd() && peek() >= '0' && peek() <= '9') {
      advance();
      ++count;
    }
    return count;
  };

  consume('-');
  if (peek() == '0') {
    advance();
  } else if (digits() == 0) {
    return fail("Invalid number");
  }
  if (consume('.') && digits() == 0) {
    return fail("Expected digits after decimal point");
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (!consume('+')) {
      consume('-');
    }
    if (digits() == 0) {
      return fail("Expected digits in exponent");
    }
  }

  const std::string text(m_input.substr(start, m_pos - start));
  out = JsonValue(std::strtod(text.c_str(), nullptr));
  return true;
}

bool JsonReader::parseLiteral(std::string_view literal) {
  if (m_input.substr(m_pos, literal.size()) != literal) {
    return fail(std::format("Invalid literal, expected '{}'", literal));
  }
  for (size_t i = 0; i < literal.size(); ++i) {
    advance();
  }
  return true;
}

void JsonReader::skipWhitespace() {
  while (!atEnd()) {
    const char c = peek();
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
      break;
    }
    advance();
  }
}

char JsonReader::advance() {
  const char c = m_input[m_pos++];
  if (c == '\n') {
    ++m_line;
    m_column = 1;
  } else {
    ++m_column;
  }
  return c;
}

bool JsonReader::consume(char expected) {
  if (!atEnd() && peek() == expected) {
    advance();
    return true;
  }
  return false;
}

bool JsonReader::fail(const std::string &message) {
  if (m_lastError.empty()) {
    m_lastError = std::format("{} at line {}, column {}", message, m_line, m_column);
  }
  return false;
}

} // namespace Chorus
