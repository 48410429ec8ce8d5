/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef JSONREADER_HPP
#define JSONREADER_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace Chorus {

class JsonValue;

// std::map keeps serialized request bodies in a stable key order
using JsonObject = std::map<std::string, JsonValue>;
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
  explicit JsonValue(std::nullptr_t) : m_value(nullptr) {}
  explicit JsonValue(bool value) : m_value(value) {}
  explicit JsonValue(int value) : m_value(static_cast<double>(value)) {}
  explicit JsonValue(int64_t value) : m_value(static_cast<double>(value)) {}
  explicit JsonValue(double value) : m_value(value) {}
  explicit JsonValue(std::string value) : m_value(std::move(value)) {}
  explicit JsonValue(const char *value) : m_value(std::string(value)) {}
  explicit JsonValue(JsonArray value) : m_value(std::move(value)) {}
  explicit JsonValue(JsonObject value) : m_value(std::move(value)) {}

  JsonType getType() const;
  bool isNull() const { return std::holds_alternative<std::nullptr_t>(m_value); }
  bool isBool() const { return std::holds_alternative<bool>(m_value); }
  bool isNumber() const { return std::holds_alternative<double>(m_value); }
  bool isString() const { return std::holds_alternative<std::string>(m_value); }
  bool isArray() const { return std::holds_alternative<JsonArray>(m_value); }
  bool isObject() const { return std::holds_alternative<JsonObject>(m_value); }

  // Throw std::bad_variant_access on type mismatch
  bool asBool() const { return std::get<bool>(m_value); }
  double asNumber() const { return std::get<double>(m_value); }
  // Also throw std::out_of_range unless the number is integral and fits
  int asInt() const;
  int64_t asInt64() const;
  const std::string &asString() const { return std::get<std::string>(m_value); }
  const JsonArray &asArray() const { return std::get<JsonArray>(m_value); }
  const JsonObject &asObject() const { return std::get<JsonObject>(m_value); }
  JsonArray &asArray() { return std::get<JsonArray>(m_value); }
  JsonObject &asObject() { return std::get<JsonObject>(m_value); }

  std::optional<bool> tryAsBool() const;
  std::optional<double> tryAsNumber() const;
  // nullopt unless the value is a number that is integral and fits the type
  std::optional<int> tryAsInt() const;
  std::optional<int64_t> tryAsInt64() const;
  std::optional<uint64_t> tryAsUInt64() const;
  std::optional<std::string> tryAsString() const;
  const JsonArray *tryAsArray() const;
  const JsonObject *tryAsObject() const;

  bool hasKey(const std::string &key) const;

  /**
   * @brief Object member lookup
   * The const overload returns a shared null value for missing keys or
   * non-object values; the mutable overload turns null into an object and
   * inserts the key.
   */
  const JsonValue &operator[](const std::string &key) const;
  JsonValue &operator[](const std::string &key);

  const JsonValue &operator[](size_t index) const;
  JsonValue &operator[](size_t index);
  size_t size() const;

  // Compact serialization
  std::string toString() const;

private:
  ValueType m_value;

  void writeTo(std::string &out) const;
};

/**
 * @brief Recursive-descent JSON parser
 *
 * Usage:
 *   JsonReader reader;
 *   if (reader.parse(body)) {
 *       const JsonValue& root = reader.getRoot();
 *   } else {
 *       log(reader.getLastError());
 *   }
 */
class JsonReader {
public:
  JsonReader() = default;

  bool loadFromFile(const std::string &path);
  bool parse(std::string_view json);

  const JsonValue &getRoot() const { return m_root; }
  const std::string &getLastError() const { return m_lastError; }
  void clearError() { m_lastError.clear(); }

private:
  static constexpr int MAX_DEPTH = 256;

  std::string_view m_input;
  size_t m_pos{0};
  size_t m_line{1};
  size_t m_column{1};
  std::string m_lastError;
  JsonValue m_root;

  bool parseValue(JsonValue &out, int depth);
  bool parseObject(JsonValue &out, int depth);
  bool parseArray(JsonValue &out, int depth);
  bool parseString(std::string &out);
  bool parseNumber(JsonValue &out);
  bool parseLiteral(std::string_view literal);
  bool parseUnicodeEscape(uint32_t &codePoint);

  void skipWhitespace();
  bool atEnd() const { return m_pos >= m_input.size(); }
  char peek() const { return atEnd() ? '\0' : m_input[m_pos]; }
  char advance();
  bool consume(char expected);
  bool fail(const std::string &message);
};

} // namespace Chorus

#endif // JSONREADER_HPP
