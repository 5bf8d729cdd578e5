#ifndef TRACR_CORE_JSON_DOM_HPP_
#define TRACR_CORE_JSON_DOM_HPP_

#include <cctype>
#include <charconv>
#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace tracr::core::json {

// Deepest object/array nesting accepted. Telemetry lines arrive from remote
// devices; descriptors and config files stay far below this.
constexpr std::size_t kMaxNestingDepth = 64;

// Small JSON DOM shared by descriptor parsing, the LAN config store, the
// controller config loader and telemetry ingestion.
struct Value {
  enum class Type {
    kObject,
    kArray,
    kString,
    kNumber,
    kBool,
    kNull,
  };

  using Object = std::map<std::string, Value, std::less<>>;
  using Array = std::vector<Value>;

  Type type = Type::kNull;
  Object object_value;
  Array array_value;
  std::string string_value;
  double number_value = 0.0;
  bool bool_value = false;

  bool IsObject() const {
    return type == Type::kObject;
  }
  bool IsArray() const {
    return type == Type::kArray;
  }
  bool IsString() const {
    return type == Type::kString;
  }
  bool IsNumber() const {
    return type == Type::kNumber;
  }
  bool IsBool() const {
    return type == Type::kBool;
  }
  bool IsNull() const {
    return type == Type::kNull;
  }

  // Member named `key`, or nullptr when this is not an object or the key is
  // absent.
  const Value* Find(std::string_view key) const {
    if (type != Type::kObject) {
      return nullptr;
    }
    const auto it = object_value.find(key);
    return it == object_value.end() ? nullptr : &it->second;
  }
};

// Strict RFC 8259 reader. Duplicate object keys are rejected rather than
// resolved. Errors carry line/column so a malformed descriptor or config
// file points at the offending token.
class Parser {
public:
  explicit Parser(std::string_view input, std::size_t max_depth = kMaxNestingDepth)
      : input_(input), max_depth_(max_depth) {}

  bool Parse(Value& root, std::string& error) {
    SkipWhitespace();
    if (!ParseValue(root, 0, error)) {
      return false;
    }
    SkipWhitespace();
    if (!AtEnd()) {
      return Fail("unexpected trailing content after JSON value", error);
    }
    return true;
  }

private:
  bool ParseValue(Value& value, std::size_t depth, std::string& error) {
    if (AtEnd()) {
      return Fail("unexpected end of input while parsing value", error);
    }

    value = Value{};
    const char c = Peek();
    if (c == '{' || c == '[') {
      if (depth >= max_depth_) {
        return Fail("nesting deeper than " + std::to_string(max_depth_) + " levels", error);
      }
      return c == '{' ? ParseObject(value, depth + 1U, error)
                      : ParseArray(value, depth + 1U, error);
    }
    if (c == '"') {
      value.type = Value::Type::kString;
      return ParseString(value.string_value, error);
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
      value.type = Value::Type::kNumber;
      return ParseNumber(value.number_value, error);
    }
    if (ConsumeLiteral("true")) {
      value.type = Value::Type::kBool;
      value.bool_value = true;
      return true;
    }
    if (ConsumeLiteral("false")) {
      value.type = Value::Type::kBool;
      return true;
    }
    if (ConsumeLiteral("null")) {
      return true;
    }
    return Fail("expected JSON value", error);
  }

  bool ParseObject(Value& value, std::size_t depth, std::string& error) {
    value.type = Value::Type::kObject;
    Advance();
    SkipWhitespace();
    if (Match('}')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      std::string key;
      if (!ParseString(key, error)) {
        return false;
      }
      if (value.object_value.find(key) != value.object_value.end()) {
        return Fail("duplicate object key '" + key + "'", error);
      }
      SkipWhitespace();
      if (!ConsumeChar(':', "expected ':' after object key", error)) {
        return false;
      }
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, depth, error)) {
        return false;
      }
      value.object_value.emplace(std::move(key), std::move(item));

      SkipWhitespace();
      if (Match('}')) {
        return true;
      }
      if (!ConsumeChar(',', "expected ',' between object entries", error)) {
        return false;
      }
    }
  }

  bool ParseArray(Value& value, std::size_t depth, std::string& error) {
    value.type = Value::Type::kArray;
    Advance();
    SkipWhitespace();
    if (Match(']')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, depth, error)) {
        return false;
      }
      value.array_value.push_back(std::move(item));

      SkipWhitespace();
      if (Match(']')) {
        return true;
      }
      if (!ConsumeChar(',', "expected ',' between array items", error)) {
        return false;
      }
    }
  }

  bool ParseString(std::string& output, std::string& error) {
    output.clear();
    if (!ConsumeChar('"', "expected '\"' to start string", error)) {
      return false;
    }

    while (!AtEnd()) {
      const char c = Advance();
      if (c == '"') {
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20U) {
        return Fail("control character in string is not allowed", error);
      }
      if (c != '\\') {
        output.push_back(c);
        continue;
      }
      if (AtEnd()) {
        break;
      }
      const char esc = Advance();
      switch (esc) {
      case '"':
      case '\\':
      case '/':
        output.push_back(esc);
        break;
      case 'b':
        output.push_back('\b');
        break;
      case 'f':
        output.push_back('\f');
        break;
      case 'n':
        output.push_back('\n');
        break;
      case 'r':
        output.push_back('\r');
        break;
      case 't':
        output.push_back('\t');
        break;
      case 'u':
        if (!ParseUnicodeEscape(output, error)) {
          return false;
        }
        break;
      default:
        return Fail(std::string("invalid escape '\\") + esc + "' in string", error);
      }
    }
    return Fail("unterminated string literal", error);
  }

  // Scans the RFC 8259 number grammar, then converts the token.
  bool ParseNumber(double& output, std::string& error) {
    const std::size_t start = pos_;
    Match('-');
    if (!Match('0') && !ConsumeDigits()) {
      return Fail("expected digits in number", error);
    }
    if (Match('.') && !ConsumeDigits()) {
      return Fail("expected digits after decimal point", error);
    }
    if (Match('e') || Match('E')) {
      if (!Match('+')) {
        Match('-');
      }
      if (!ConsumeDigits()) {
        return Fail("expected exponent digits", error);
      }
    }

    const char* first = input_.data() + start;
    const char* last = input_.data() + pos_;
    const auto [ptr, ec] = std::from_chars(first, last, output);
    if (ec == std::errc::result_out_of_range) {
      return Fail("number out of range", error);
    }
    if (ec != std::errc() || ptr != last) {
      return Fail("invalid number token", error);
    }
    return true;
  }

  // `\uXXXX`, recombining a UTF-16 surrogate pair when one follows.
  bool ParseUnicodeEscape(std::string& output, std::string& error) {
    unsigned code_point = 0;
    if (!ParseHex4(code_point, error)) {
      return false;
    }
    if (code_point >= 0xD800U && code_point <= 0xDBFFU && ConsumeLiteral("\\u")) {
      unsigned low = 0;
      if (!ParseHex4(low, error)) {
        return false;
      }
      if (low < 0xDC00U || low > 0xDFFFU) {
        return Fail("unpaired UTF-16 surrogate in string", error);
      }
      code_point = 0x10000U + ((code_point - 0xD800U) << 10U) + (low - 0xDC00U);
    }
    AppendUtf8(output, code_point);
    return true;
  }

  bool ParseHex4(unsigned& code_point, std::string& error) {
    if (pos_ + 4U > input_.size()) {
      return Fail("truncated \\u escape in string", error);
    }
    const char* first = input_.data() + pos_;
    const auto [ptr, ec] = std::from_chars(first, first + 4, code_point, 16);
    if (ec != std::errc() || ptr != first + 4) {
      return Fail("invalid hex digits in \\u escape", error);
    }
    for (int i = 0; i < 4; ++i) {
      Advance();
    }
    return true;
  }

  static void AppendUtf8(std::string& output, unsigned code_point) {
    if (code_point < 0x80U) {
      output.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800U) {
      output.push_back(static_cast<char>(0xC0U | (code_point >> 6U)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    } else if (code_point < 0x10000U) {
      output.push_back(static_cast<char>(0xE0U | (code_point >> 12U)));
      output.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    } else {
      output.push_back(static_cast<char>(0xF0U | (code_point >> 18U)));
      output.push_back(static_cast<char>(0x80U | ((code_point >> 12U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    }
  }

  void SkipWhitespace() {
    while (!AtEnd() && (Peek() == ' ' || Peek() == '\t' || Peek() == '\n' || Peek() == '\r')) {
      Advance();
    }
  }

  bool ConsumeDigits() {
    const std::size_t start = pos_;
    while (!AtEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
    }
    return pos_ > start;
  }

  bool ConsumeChar(char expected, std::string_view message, std::string& error) {
    if (!Match(expected)) {
      return Fail(message, error);
    }
    return true;
  }

  bool ConsumeLiteral(std::string_view literal) {
    if (input_.substr(pos_, literal.size()) != literal) {
      return false;
    }
    for (std::size_t i = 0; i < literal.size(); ++i) {
      Advance();
    }
    return true;
  }

  bool Match(char expected) {
    if (AtEnd() || Peek() != expected) {
      return false;
    }
    Advance();
    return true;
  }

  char Peek() const {
    return input_[pos_];
  }

  char Advance() {
    const char c = input_[pos_++];
    if (c == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    return c;
  }

  bool AtEnd() const {
    return pos_ >= input_.size();
  }

  bool Fail(std::string_view message, std::string& error) const {
    error = "parse error at line " + std::to_string(line_) + ", col " + std::to_string(col_) +
            ": " + std::string(message);
    return false;
  }

  std::string_view input_;
  std::size_t max_depth_ = kMaxNestingDepth;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
  std::size_t col_ = 1;
};

inline bool Parse(std::string_view input, Value& root, std::string& error) {
  Parser parser(input);
  return parser.Parse(root, error);
}

} // namespace tracr::core::json

#endif // TRACR_CORE_JSON_DOM_HPP_
