#ifndef GLANCELAB_CORE_JSON_DOM_HPP_
#define GLANCELAB_CORE_JSON_DOM_HPP_

#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace glancelab::core::json {

// Small STL-only DOM for task-suite documents.
struct Value {
  enum class Type {
    kObject,
    kArray,
    kString,
    kNumber,
    kBool,
    kNull,
  };

  using Object = std::map<std::string, Value>;
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

  // Returns the member named `key`, or nullptr when absent or when this value
  // is not an object.
  const Value* Find(std::string_view key) const {
    if (type != Type::kObject) {
      return nullptr;
    }
    const auto it = object_value.find(std::string(key));
    if (it == object_value.end()) {
      return nullptr;
    }
    return &it->second;
  }
};

// Recursive-descent parser. Diagnostics carry line/column so a malformed task
// suite points at the offending character.
class Parser {
public:
  explicit Parser(std::string_view input) : input_(input) {}

  bool Parse(Value& root, std::string& error) {
    SkipWhitespace();
    if (!ParseValue(root, error)) {
      return false;
    }
    SkipWhitespace();
    if (!AtEnd()) {
      return Fail("unexpected trailing content after JSON value", error);
    }
    return true;
  }

private:
  bool ParseValue(Value& value, std::string& error) {
    if (AtEnd()) {
      return Fail("unexpected end of input while parsing value", error);
    }

    switch (Peek()) {
    case '{':
      return ParseObject(value, error);
    case '[':
      return ParseArray(value, error);
    case '"':
      value.type = Value::Type::kString;
      return ParseString(value.string_value, error);
    default:
      break;
    }

    const char c = Peek();
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
      value.type = Value::Type::kNumber;
      return ParseNumber(value.number_value, error);
    }
    if (ConsumeKeyword("true")) {
      value.type = Value::Type::kBool;
      value.bool_value = true;
      return true;
    }
    if (ConsumeKeyword("false")) {
      value.type = Value::Type::kBool;
      value.bool_value = false;
      return true;
    }
    if (ConsumeKeyword("null")) {
      value.type = Value::Type::kNull;
      return true;
    }

    return Fail("expected JSON value", error);
  }

  bool ParseObject(Value& value, std::string& error) {
    value = Value{};
    value.type = Value::Type::kObject;
    Advance(); // '{'
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
      SkipWhitespace();
      if (!Expect(':', "expected ':' after object key", error)) {
        return false;
      }
      SkipWhitespace();

      Value member;
      if (!ParseValue(member, error)) {
        return false;
      }
      value.object_value.insert_or_assign(std::move(key), std::move(member));

      SkipWhitespace();
      if (Match('}')) {
        return true;
      }
      if (!Expect(',', "expected ',' between object entries", error)) {
        return false;
      }
    }
  }

  bool ParseArray(Value& value, std::string& error) {
    value = Value{};
    value.type = Value::Type::kArray;
    Advance(); // '['
    SkipWhitespace();
    if (Match(']')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, error)) {
        return false;
      }
      value.array_value.push_back(std::move(item));

      SkipWhitespace();
      if (Match(']')) {
        return true;
      }
      if (!Expect(',', "expected ',' between array items", error)) {
        return false;
      }
    }
  }

  bool ParseString(std::string& output, std::string& error) {
    output.clear();
    if (!Expect('"', "expected '\"' to start string", error)) {
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
        return Fail("unterminated escape sequence in string", error);
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
        return Fail("invalid escape sequence in string", error);
      }
    }

    return Fail("unterminated string literal", error);
  }

  // Decodes \uXXXX (and surrogate pairs) into UTF-8. Task titles and
  // summaries are free text and may come from editors that escape non-ASCII.
  bool ParseUnicodeEscape(std::string& output, std::string& error) {
    std::uint32_t code_point = 0;
    if (!ReadHex4(code_point, error)) {
      return false;
    }

    if (code_point >= 0xD800U && code_point <= 0xDBFFU) {
      if (!(Match('\\') && Match('u'))) {
        return Fail("high surrogate must be followed by a low surrogate escape", error);
      }
      std::uint32_t low = 0;
      if (!ReadHex4(low, error)) {
        return false;
      }
      if (low < 0xDC00U || low > 0xDFFFU) {
        return Fail("invalid low surrogate in unicode escape", error);
      }
      code_point = 0x10000U + ((code_point - 0xD800U) << 10U) + (low - 0xDC00U);
    } else if (code_point >= 0xDC00U && code_point <= 0xDFFFU) {
      return Fail("unpaired low surrogate in unicode escape", error);
    }

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
    return true;
  }

  bool ReadHex4(std::uint32_t& out, std::string& error) {
    out = 0;
    for (int i = 0; i < 4; ++i) {
      if (AtEnd()) {
        return Fail("truncated unicode escape", error);
      }
      const char h = Advance();
      out <<= 4U;
      if (h >= '0' && h <= '9') {
        out |= static_cast<std::uint32_t>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        out |= static_cast<std::uint32_t>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        out |= static_cast<std::uint32_t>(h - 'A' + 10);
      } else {
        return Fail("invalid hex digit in unicode escape", error);
      }
    }
    return true;
  }

  bool ParseNumber(double& output, std::string& error) {
    const std::size_t start = pos_;

    (void)Match('-');
    if (!Match('0') && !ConsumeDigits()) {
      return Fail("expected digits in number", error);
    }
    if (Match('.') && !ConsumeDigits()) {
      return Fail("expected digits after decimal point", error);
    }
    if (Match('e') || Match('E')) {
      if (!Match('+')) {
        (void)Match('-');
      }
      if (!ConsumeDigits()) {
        return Fail("expected exponent digits", error);
      }
    }

    const std::string text(input_.substr(start, pos_ - start));
    char* parse_end = nullptr;
    errno = 0;
    const double parsed = std::strtod(text.c_str(), &parse_end);
    if (parse_end == nullptr || *parse_end != '\0') {
      return Fail("invalid number token", error);
    }
    if (errno == ERANGE) {
      return Fail("numeric value out of range", error);
    }
    output = parsed;
    return true;
  }

  void SkipWhitespace() {
    while (!AtEnd() && std::isspace(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
    }
  }

  bool ConsumeDigits() {
    std::size_t count = 0;
    while (!AtEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
      ++count;
    }
    return count > 0U;
  }

  bool ConsumeKeyword(std::string_view keyword) {
    if (input_.substr(pos_, keyword.size()) != keyword) {
      return false;
    }
    for (std::size_t i = 0; i < keyword.size(); ++i) {
      Advance();
    }
    return true;
  }

  bool Expect(char expected, std::string_view message, std::string& error) {
    if (!Match(expected)) {
      return Fail(message, error);
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
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
  std::size_t col_ = 1;
};

inline bool Parse(std::string_view input, Value& root, std::string& error) {
  Parser parser(input);
  return parser.Parse(root, error);
}

} // namespace glancelab::core::json

#endif // GLANCELAB_CORE_JSON_DOM_HPP_
