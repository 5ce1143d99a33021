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

namespace NightCage {

namespace {

void writeEscaped(std::ostream &stream, const std::string &text) {
  stream << '"';
  for (const char c : text) {
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
    case '\r':
      stream << "\\r";
      break;
    case '\t':
      stream << "\\t";
      break;
    case '\b':
      stream << "\\b";
      break;
    case '\f':
      stream << "\\f";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        stream << std::format("\\u{:04x}", static_cast<unsigned>(c));
      } else {
        stream << c;
      }
    }
  }
  stream << '"';
}

void appendUtf8(std::string &out, uint32_t codepoint) {
  if (codepoint < 0x80) {
    out += static_cast<char>(codepoint);
  } else if (codepoint < 0x800) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else if (codepoint < 0x10000) {
    out += static_cast<char>(0xE0 | (codepoint >> 12));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (codepoint >> 18));
    out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  }
}

} // namespace

// JsonValue

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

// Values that do not fit in an int are treated like a type mismatch
std::optional<int> JsonValue::tryAsInt() const {
  if (!isNumber())
    return std::nullopt;
  const double number = asNumber();
  if (!std::isfinite(number) ||
      number < static_cast<double>(std::numeric_limits<int>::min()) ||
      number > static_cast<double>(std::numeric_limits<int>::max()))
    return std::nullopt;
  return static_cast<int>(number);
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

const JsonArray *JsonValue::tryAsArray() const {
  return isArray() ? &asArray() : nullptr;
}

const JsonObject *JsonValue::tryAsObject() const {
  return isObject() ? &asObject() : nullptr;
}

bool JsonValue::hasKey(const std::string &key) const {
  return isObject() && asObject().contains(key);
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  static const JsonValue nullValue;
  if (!isObject())
    return nullValue;
  const auto &obj = asObject();
  auto it = obj.find(key);
  return it != obj.end() ? it->second : nullValue;
}

JsonValue &JsonValue::operator[](const std::string &key) {
  if (!isObject()) {
    m_value = JsonObject{};
  }
  return asObject()[key];
}

const JsonValue &JsonValue::operator[](size_t index) const {
  static const JsonValue nullValue;
  if (!isArray() || index >= asArray().size())
    return nullValue;
  return asArray()[index];
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
}

void JsonValue::push_back(JsonValue value) {
  if (!isArray()) {
    m_value = JsonArray{};
  }
  asArray().push_back(std::move(value));
}

std::string JsonValue::toString() const {
  std::ostringstream oss;
  write(oss, 0, 0);
  return oss.str();
}

std::string JsonValue::toPrettyString(int indentWidth) const {
  std::ostringstream oss;
  write(oss, indentWidth, 0);
  oss << '\n';
  return oss.str();
}

void JsonValue::write(std::ostream &stream, int indentWidth, int depth) const {
  const bool pretty = indentWidth > 0;
  auto newline = [&](int level) {
    if (pretty) {
      stream << '\n' << std::string(static_cast<size_t>(level * indentWidth), ' ');
    }
  };

  switch (getType()) {
  case JsonType::Null:
    stream << "null";
    break;
  case JsonType::Boolean:
    stream << (asBool() ? "true" : "false");
    break;
  case JsonType::Number: {
    const double num = asNumber();
    if (!std::isfinite(num)) {
      stream << "null";
    } else if (std::floor(num) == num && std::abs(num) < 1e15) {
      stream << static_cast<long long>(num);
    } else {
      stream << std::format("{}", num);
    }
    break;
  }
  case JsonType::String:
    writeEscaped(stream, asString());
    break;
  case JsonType::Array: {
    const auto &arr = asArray();
    if (arr.empty()) {
      stream << "[]";
      break;
    }
    stream << '[';
    for (size_t i = 0; i < arr.size(); ++i) {
      if (i > 0)
        stream << ',';
      newline(depth + 1);
      arr[i].write(stream, indentWidth, depth + 1);
    }
    newline(depth);
    stream << ']';
    break;
  }
  case JsonType::Object: {
    const auto &obj = asObject();
    if (obj.empty()) {
      stream << "{}";
      break;
    }
    stream << '{';
    bool first = true;
    for (const auto &[key, value] : obj) {
      if (!first)
        stream << ',';
      first = false;
      newline(depth + 1);
      writeEscaped(stream, key);
      stream << (pretty ? ": " : ":");
      value.write(stream, indentWidth, depth + 1);
    }
    newline(depth);
    stream << '}';
    break;
  }
  }
}

// JsonReader

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    m_line = 1;
    m_column = 1;
    return fail("Could not open file: " + path);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  const std::string contents = buffer.str();
  return parse(contents);
}

bool JsonReader::writeToFile(const std::string &path, const JsonValue &value) {
  std::ofstream file(path, std::ios::trunc);
  if (!file.is_open()) {
    return false;
  }
  file << value.toPrettyString();
  return static_cast<bool>(file);
}

bool JsonReader::parse(std::string_view jsonString) {
  clearError();
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_root = JsonValue();

  skipWhitespace();
  if (atEnd()) {
    return fail("Empty JSON input");
  }

  JsonValue root;
  if (!parseValue(root, 0)) {
    m_input = {};
    return false;
  }

  skipWhitespace();
  if (!atEnd()) {
    fail("Unexpected data after JSON value");
    m_input = {};
    return false;
  }

  m_root = std::move(root);
  m_input = {};
  return true;
}

bool JsonReader::fail(const std::string &message) {
  m_lastError = std::format("Line {}, Column {}: {}", m_line, m_column, message);
  return false;
}

char JsonReader::peek() const {
  return atEnd() ? '\0' : m_input[m_position];
}

char JsonReader::advance() {
  if (atEnd()) {
    return '\0';
  }
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
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
      break;
    }
    advance();
  }
}

bool JsonReader::parseValue(JsonValue &out, int depth) {
  if (depth > MAX_DEPTH) {
    return fail("Maximum nesting depth exceeded");
  }

  skipWhitespace();
  switch (peek()) {
  case '{':
    return parseObject(out, depth);
  case '[':
    return parseArray(out, depth);
  case '"': {
    std::string text;
    if (!parseString(text)) {
      return false;
    }
    out = JsonValue(std::move(text));
    return true;
  }
  case 't':
    if (!parseLiteral("true"))
      return false;
    out = JsonValue(true);
    return true;
  case 'f':
    if (!parseLiteral("false"))
      return false;
    out = JsonValue(false);
    return true;
  case 'n':
    if (!parseLiteral("null"))
      return false;
    out = JsonValue();
    return true;
  case '\0':
    return fail("Unexpected end of input");
  default:
    if (peek() == '-' || (peek() >= '0' && peek() <= '9')) {
      return parseNumber(out);
    }
    return fail(std::format("Unexpected character '{}'", peek()));
  }
}

bool JsonReader::parseObject(JsonValue &out, int depth) {
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
      return fail("Expected string key in object");
    }
    std::string key;
    if (!parseString(key)) {
      return false;
    }

    skipWhitespace();
    if (advance() != ':') {
      return fail("Expected ':' after object key");
    }

    JsonValue value;
    if (!parseValue(value, depth + 1)) {
      return false;
    }
    object.insert_or_assign(std::move(key), std::move(value));

    skipWhitespace();
    const char next = advance();
    if (next == '}') {
      break;
    }
    if (next != ',') {
      return fail("Expected '}' or ',' in object");
    }
  }

  out = JsonValue(std::move(object));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, int depth) {
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
    if (!parseValue(element, depth + 1)) {
      return false;
    }
    array.push_back(std::move(element));

    skipWhitespace();
    const char next = advance();
    if (next == ']') {
      break;
    }
    if (next != ',') {
      return fail("Expected ']' or ',' in array");
    }
  }

  out = JsonValue(std::move(array));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote
  out.clear();

  while (!atEnd()) {
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
      break;
    }
    const char escaped = advance();
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
      uint32_t codepoint = 0;
      if (!parseUnicodeEscape(codepoint)) {
        return false;
      }
      // Surrogate pair
      if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
        if (advance() != '\\' || advance() != 'u') {
          return fail("Unpaired high surrogate in string");
        }
        uint32_t low = 0;
        if (!parseUnicodeEscape(low)) {
          return false;
        }
        if (low < 0xDC00 || low > 0xDFFF) {
          return fail("Invalid low surrogate in string");
        }
        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
      }
      appendUtf8(out, codepoint);
      break;
    }
    default:
      return fail(std::format("Invalid escape sequence \\{}", escaped));
    }
  }

  return fail("Unterminated string");
}

bool JsonReader::parseUnicodeEscape(uint32_t &codepoint) {
  codepoint = 0;
  for (int i = 0; i < 4; ++i) {
    const char c = advance();
    codepoint <<= 4;
    if (c >= '0' && c <= '9') {
      codepoint |= static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      codepoint |= static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      codepoint |= static_cast<uint32_t>(c - 'A' + 10);
    } else {
      return fail("Invalid Unicode escape sequence");
    }
  }
  return true;
}

bool JsonReader::parseNumber(JsonValue &out) {
  const size_t start = m_position;
  auto digits = [this]() {
    size_t count = 0;
    while (peek() >= '0' && peek() <= '9') {
      advance();
      ++count;
    }
    return count;
  };

  if (peek() == '-') {
    advance();
  }
  if (peek() == '0') {
    advance();
  } else if (digits() == 0) {
    return fail("Invalid number: expected digit");
  }
  if (peek() == '.') {
    advance();
    if (digits() == 0) {
      return fail("Invalid number: expected digit after decimal point");
    }
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-') {
      advance();
    }
    if (digits() == 0) {
      return fail("Invalid number: expected digit in exponent");
    }
  }

  const std::string_view text = m_input.substr(start, m_position - start);
  double value = 0.0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return fail(std::format("Invalid number: {}", text));
  }
  out = JsonValue(value);
  return true;
}

bool JsonReader::parseLiteral(std::string_view literal) {
  if (m_input.substr(m_position, literal.size()) != literal) {
    return fail(std::format("Invalid literal, expected '{}'", literal));
  }
  for (size_t i = 0; i < literal.size(); ++i) {
    advance();
  }
  return true;
}

} // namespace NightCage
