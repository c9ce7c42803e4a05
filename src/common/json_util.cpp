#include "oac/common/json_util.hpp"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

namespace oac::common {

namespace {

constexpr std::size_t MAX_NESTING_DEPTH = 512;

bool is_digit(const char ch) { return ch >= '0' && ch <= '9'; }

int hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

void append_utf8(std::string &out, std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

// Recursive-descent reader over a JSON text. Every parse method returns false
// on the first syntax error and leaves the reason in error(). When an output
// string is supplied the value is re-serialized into it in indented form.
class JsonReader {
public:
  JsonReader(const std::string &text, const std::size_t indent) : text_(text), indent_(indent) {}

  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] std::size_t pos() const { return pos_; }

  void skip_ws() { pos_ = json_skip_ws(text_, pos_); }

  [[nodiscard]] bool at_end() {
    skip_ws();
    return pos_ >= text_.size();
  }

  [[nodiscard]] char peek() const { return pos_ < text_.size() ? text_[pos_] : '\0'; }

  bool expect(const char ch) {
    skip_ws();
    if (peek() != ch) {
      return fail(std::string("expected '") + ch + "'");
    }
    ++pos_;
    return true;
  }

  bool value(std::string *out, const std::size_t level) {
    skip_ws();
    switch (peek()) {
    case '{':
      return object(out, level);
    case '[':
      return array(out, level);
    case '"': {
      const std::size_t start = pos_;
      if (!string_token(nullptr)) {
        return false;
      }
      if (out != nullptr) {
        out->append(text_, start, pos_ - start);
      }
      return true;
    }
    case 't':
      return literal("true", out);
    case 'f':
      return literal("false", out);
    case 'n':
      return literal("null", out);
    default:
      return number_token(out);
    }
  }

  bool string_token(std::string *decoded) {
    if (peek() != '"') {
      return fail("expected string");
    }
    ++pos_;
    while (pos_ < text_.size()) {
      const char ch = text_[pos_];
      if (ch == '"') {
        ++pos_;
        return true;
      }
      if (static_cast<unsigned char>(ch) < 0x20) {
        return fail("control character in string");
      }
      if (ch != '\\') {
        if (decoded != nullptr) {
          decoded->push_back(ch);
        }
        ++pos_;
        continue;
      }

      ++pos_;
      if (pos_ >= text_.size()) {
        break;
      }
      const char esc = text_[pos_++];
      char plain = '\0';
      switch (esc) {
      case '"':
      case '\\':
      case '/':
        plain = esc;
        break;
      case 'b':
        plain = '\b';
        break;
      case 'f':
        plain = '\f';
        break;
      case 'n':
        plain = '\n';
        break;
      case 'r':
        plain = '\r';
        break;
      case 't':
        plain = '\t';
        break;
      case 'u': {
        std::uint32_t cp = 0;
        if (!hex4(cp)) {
          return false;
        }
        if (cp >= 0xD800 && cp <= 0xDBFF && pos_ + 1 < text_.size() && text_[pos_] == '\\' &&
            text_[pos_ + 1] == 'u') {
          pos_ += 2;
          std::uint32_t low = 0;
          if (!hex4(low)) {
            return false;
          }
          if (low >= 0xDC00 && low <= 0xDFFF) {
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
          } else {
            if (decoded != nullptr) {
              append_utf8(*decoded, 0xFFFD);
            }
            cp = low;
          }
        }
        if (cp >= 0xD800 && cp <= 0xDFFF) {
          cp = 0xFFFD;
        }
        if (decoded != nullptr) {
          append_utf8(*decoded, cp);
        }
        continue;
      }
      default:
        return fail("invalid escape sequence");
      }
      if (decoded != nullptr) {
        decoded->push_back(plain);
      }
    }
    return fail("unterminated string");
  }

  bool fail(const std::string &what) {
    if (error_.empty()) {
      error_ = what + " at offset " + std::to_string(pos_);
    }
    return false;
  }

private:
  bool hex4(std::uint32_t &cp) {
    if (pos_ + 4 > text_.size()) {
      return fail("truncated unicode escape");
    }
    cp = 0;
    for (int i = 0; i < 4; ++i) {
      const int digit = hex_value(text_[pos_++]);
      if (digit < 0) {
        return fail("invalid unicode escape");
      }
      cp = (cp << 4) | static_cast<std::uint32_t>(digit);
    }
    return true;
  }

  bool literal(const std::string &word, std::string *out) {
    if (text_.compare(pos_, word.size(), word) != 0) {
      return fail("invalid literal");
    }
    pos_ += word.size();
    if (out != nullptr) {
      out->append(word);
    }
    return true;
  }

  bool number_token(std::string *out) {
    const std::size_t start = pos_;
    if (peek() == '-') {
      ++pos_;
    }
    if (peek() == '0') {
      ++pos_;
    } else if (is_digit(peek())) {
      while (is_digit(peek())) {
        ++pos_;
      }
    } else {
      return fail("unexpected character");
    }
    if (peek() == '.') {
      ++pos_;
      if (!is_digit(peek())) {
        return fail("digit expected after decimal point");
      }
      while (is_digit(peek())) {
        ++pos_;
      }
    }
    if (peek() == 'e' || peek() == 'E') {
      ++pos_;
      if (peek() == '+' || peek() == '-') {
        ++pos_;
      }
      if (!is_digit(peek())) {
        return fail("digit expected in exponent");
      }
      while (is_digit(peek())) {
        ++pos_;
      }
    }
    if (out != nullptr) {
      out->append(text_, start, pos_ - start);
    }
    return true;
  }

  void newline(std::string *out, const std::size_t level) const {
    if (out != nullptr) {
      out->push_back('\n');
      out->append(level * indent_, ' ');
    }
  }

  bool object(std::string *out, const std::size_t level) {
    if (level >= MAX_NESTING_DEPTH) {
      return fail("nesting too deep");
    }
    ++pos_;
    skip_ws();
    if (peek() == '}') {
      ++pos_;
      if (out != nullptr) {
        out->append("{}");
      }
      return true;
    }
    if (out != nullptr) {
      out->push_back('{');
    }
    bool first = true;
    while (true) {
      if (!first && out != nullptr) {
        out->push_back(',');
      }
      first = false;
      newline(out, level + 1);
      skip_ws();
      const std::size_t key_start = pos_;
      if (!string_token(nullptr)) {
        return false;
      }
      if (out != nullptr) {
        out->append(text_, key_start, pos_ - key_start);
        out->append(": ");
      }
      if (!expect(':') || !value(out, level + 1)) {
        return false;
      }
      skip_ws();
      if (peek() == ',') {
        ++pos_;
        continue;
      }
      if (peek() == '}') {
        ++pos_;
        break;
      }
      return fail("expected ',' or '}'");
    }
    newline(out, level);
    if (out != nullptr) {
      out->push_back('}');
    }
    return true;
  }

  bool array(std::string *out, const std::size_t level) {
    if (level >= MAX_NESTING_DEPTH) {
      return fail("nesting too deep");
    }
    ++pos_;
    skip_ws();
    if (peek() == ']') {
      ++pos_;
      if (out != nullptr) {
        out->append("[]");
      }
      return true;
    }
    if (out != nullptr) {
      out->push_back('[');
    }
    bool first = true;
    while (true) {
      if (!first && out != nullptr) {
        out->push_back(',');
      }
      first = false;
      newline(out, level + 1);
      if (!value(out, level + 1)) {
        return false;
      }
      skip_ws();
      if (peek() == ',') {
        ++pos_;
        continue;
      }
      if (peek() == ']') {
        ++pos_;
        break;
      }
      return fail("expected ',' or ']'");
    }
    newline(out, level);
    if (out != nullptr) {
      out->push_back(']');
    }
    return true;
  }

  const std::string &text_;
  std::size_t indent_ = 2;
  std::size_t pos_ = 0;
  std::string error_;
};

JsonKind kind_from_lead(const char ch) {
  switch (ch) {
  case '"':
    return JsonKind::String;
  case '{':
    return JsonKind::Object;
  case '[':
    return JsonKind::Array;
  case 't':
  case 'f':
    return JsonKind::Bool;
  case 'n':
    return JsonKind::Null;
  default:
    return JsonKind::Number;
  }
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buf;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() &&
         (text[pos] == ' ' || text[pos] == '\t' || text[pos] == '\n' || text[pos] == '\r')) {
    ++pos;
  }
  return pos;
}

Result<JsonObject> json_parse_object(const std::string &json) {
  JsonReader reader(json, 0);
  JsonObject object;

  if (!reader.expect('{')) {
    return Result<JsonObject>::failure(Error::format(reader.error()));
  }
  reader.skip_ws();
  if (reader.peek() == '}') {
    (void)reader.expect('}');
  } else {
    while (true) {
      reader.skip_ws();
      std::string key;
      if (!reader.string_token(&key) || !reader.expect(':')) {
        return Result<JsonObject>::failure(Error::format(reader.error()));
      }
      reader.skip_ws();
      JsonValue member;
      member.kind = kind_from_lead(reader.peek());
      const std::size_t start = reader.pos();
      const bool parsed = member.kind == JsonKind::String ? reader.string_token(&member.text)
                                                          : reader.value(nullptr, 1);
      if (!parsed) {
        return Result<JsonObject>::failure(Error::format(reader.error()));
      }
      if (member.kind != JsonKind::String) {
        member.text = json.substr(start, reader.pos() - start);
      }
      object[key] = std::move(member);

      reader.skip_ws();
      if (reader.peek() == ',') {
        (void)reader.expect(',');
        continue;
      }
      if (!reader.expect('}')) {
        return Result<JsonObject>::failure(Error::format(reader.error()));
      }
      break;
    }
  }

  if (!reader.at_end()) {
    (void)reader.fail("unexpected trailing data");
    return Result<JsonObject>::failure(Error::format(reader.error()));
  }
  return Result<JsonObject>::success(std::move(object));
}

std::optional<std::int64_t> json_number_to_int64(const std::string &number) {
  if (number.empty()) {
    return std::nullopt;
  }
  char *end = nullptr;
  const double parsed = std::strtod(number.c_str(), &end);
  if (end != number.c_str() + number.size() || !std::isfinite(parsed)) {
    return std::nullopt;
  }
  if (parsed >= static_cast<double>(std::numeric_limits<std::int64_t>::max()) ||
      parsed <= static_cast<double>(std::numeric_limits<std::int64_t>::min())) {
    return std::nullopt;
  }

  // Integers above 2^53 lose precision through double; parse them exactly.
  if (number.find_first_of(".eE") == std::string::npos) {
    errno = 0;
    const long long exact = std::strtoll(number.c_str(), &end, 10);
    if (errno == 0 && end == number.c_str() + number.size()) {
      return static_cast<std::int64_t>(exact);
    }
  }
  return static_cast<std::int64_t>(parsed);
}

Result<std::string> json_pretty_print(const std::string &json, const std::size_t indent) {
  JsonReader reader(json, indent);
  std::string out;
  out.reserve(json.size() + json.size() / 2);

  if (reader.at_end()) {
    (void)reader.fail("unexpected end of input");
    return Result<std::string>::failure(Error::format(reader.error()));
  }
  if (!reader.value(&out, 0)) {
    return Result<std::string>::failure(Error::format(reader.error()));
  }
  if (!reader.at_end()) {
    (void)reader.fail("unexpected trailing data");
    return Result<std::string>::failure(Error::format(reader.error()));
  }
  return Result<std::string>::success(std::move(out));
}

} // namespace oac::common
