// ============================================================================
// IO: JSON Reader (strict, line/column errors)
// File: cpp/engine/io/json_value.cpp
// ============================================================================

#include "engine/io/json_value.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <istream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace clirisk::io {
namespace {

// Recursive-descent reader over one in-memory JSON text. Tracks line/column
// alongside the byte position so every failure points at its source.
class JsonReader {
 public:
  JsonReader(std::string_view text, JsonParseError* err)
      : begin_(text.data()), pos_(text.data()), end_(text.data() + text.size()), err_(err) {}

  // Root value followed by nothing but whitespace.
  bool read_document(JsonValue& out) {
    if (!read_value(out)) return false;
    skip_whitespace();
    if (!at_end()) return fail("Trailing characters after JSON");
    return true;
  }

 private:
  bool at_end() const { return pos_ >= end_; }
  char peek() const { return *pos_; }
  bool peek_is(char ch) const { return !at_end() && *pos_ == ch; }
  bool peek_digit() const { return !at_end() && std::isdigit(static_cast<unsigned char>(*pos_)) != 0; }

  void step() {
    if (*pos_ == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    ++pos_;
  }

  bool fail(std::string msg) {
    if (err_) {
      err_->message = std::move(msg);
      err_->offset = static_cast<size_t>(pos_ - begin_);
      err_->line = line_;
      err_->col = col_;
    }
    return false;
  }

  void skip_whitespace() {
    while (!at_end()) {
      const char ch = peek();
      if (ch != ' ' && ch != '\t' && ch != '\r' && ch != '\n') return;
      step();
    }
  }

  bool consume(char ch) {
    skip_whitespace();
    if (!peek_is(ch)) return fail(std::string("Expected '") + ch + "'");
    step();
    return true;
  }

  // Literals never span lines, so the column advances by the literal length.
  bool consume_literal(std::string_view lit) {
    if (static_cast<size_t>(end_ - pos_) < lit.size()) return false;
    if (std::string_view(pos_, lit.size()) != lit) return false;
    pos_ += lit.size();
    col_ += static_cast<int>(lit.size());
    return true;
  }

  bool read_value(JsonValue& out) {
    skip_whitespace();
    if (at_end()) return fail("Unexpected EOF");

    switch (peek()) {
      case '{':
        return read_object(out);
      case '[':
        return read_array(out);
      case '"':
        out.type = JsonType::kString;
        return read_string(out.str);
      case 't':
      case 'f':
      case 'n':
        return read_literal(out);
      default:
        break;
    }
    if (peek() == '-' || peek_digit()) {
      out.type = JsonType::kNumber;
      return read_number(out.num);
    }
    return fail("Unexpected token");
  }

  bool read_literal(JsonValue& out) {
    if (consume_literal("true")) {
      out.type = JsonType::kBool;
      out.b = true;
    } else if (consume_literal("false")) {
      out.type = JsonType::kBool;
      out.b = false;
    } else if (consume_literal("null")) {
      out.type = JsonType::kNull;
    } else {
      return fail("Invalid literal");
    }
    return true;
  }

  bool open_container(char ch) {
    if (!consume(ch)) return false;
    if (++depth_ > kMaxJsonDepth) return fail("Nesting too deep");
    return true;
  }

  // After an element: ',' continues, `close` ends the container.
  // Returns false on error; sets `done` when the container closed.
  bool element_separator(char close, const char* eof_msg, bool& done) {
    skip_whitespace();
    if (at_end()) return fail(eof_msg);
    if (peek() == ',') {
      step();
      done = false;
      return true;
    }
    if (peek() == close) {
      step();
      --depth_;
      done = true;
      return true;
    }
    return fail(std::string("Expected ',' or '") + close + "'");
  }

  bool read_array(JsonValue& out) {
    if (!open_container('[')) return false;
    out.type = JsonType::kArray;
    out.arr.clear();

    skip_whitespace();
    if (peek_is(']')) {
      step();
      --depth_;
      return true;
    }

    for (bool done = false; !done;) {
      JsonValue item;
      if (!read_value(item)) return false;
      out.arr.push_back(std::move(item));
      if (!element_separator(']', "Unexpected EOF in array", done)) return false;
    }
    return true;
  }

  bool read_object(JsonValue& out) {
    if (!open_container('{')) return false;
    out.type = JsonType::kObject;
    out.obj.clear();

    skip_whitespace();
    if (peek_is('}')) {
      step();
      --depth_;
      return true;
    }

    for (bool done = false; !done;) {
      std::string name;
      if (!read_string(name)) return false;
      if (!consume(':')) return false;

      JsonValue member;
      if (!read_value(member)) return false;
      out.obj[std::move(name)] = std::move(member);  // duplicate: last wins
      if (!element_separator('}', "Unexpected EOF in object", done)) return false;
    }
    return true;
  }

  bool read_hex4(unsigned& code) {
    code = 0;
    for (int i = 0; i < 4; ++i) {
      if (at_end()) return fail("Unexpected EOF in \\uXXXX escape");
      const char ch = peek();
      unsigned nibble = 0;
      if (ch >= '0' && ch <= '9') {
        nibble = static_cast<unsigned>(ch - '0');
      } else if (ch >= 'a' && ch <= 'f') {
        nibble = 10u + static_cast<unsigned>(ch - 'a');
      } else if (ch >= 'A' && ch <= 'F') {
        nibble = 10u + static_cast<unsigned>(ch - 'A');
      } else {
        return fail("Invalid hex digit in \\uXXXX escape");
      }
      code = (code << 4) | nibble;
      step();
    }
    return true;
  }

  static void put_utf8(std::string& dst, unsigned cp) {
    if (cp < 0x80) {
      dst += static_cast<char>(cp);
      return;
    }
    char buf[4];
    int n = 0;
    if (cp < 0x800) {
      buf[n++] = static_cast<char>(0xC0 | (cp >> 6));
    } else if (cp < 0x10000) {
      buf[n++] = static_cast<char>(0xE0 | (cp >> 12));
      buf[n++] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    } else {
      buf[n++] = static_cast<char>(0xF0 | (cp >> 18));
      buf[n++] = static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
      buf[n++] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    }
    if (n < 4) buf[n++] = static_cast<char>(0x80 | (cp & 0x3F));
    dst.append(buf, static_cast<size_t>(n));
  }

  // Called after "\u". Combines surrogate pairs into one code point.
  bool read_unicode_escape(std::string& dst) {
    unsigned hi = 0;
    if (!read_hex4(hi)) return false;
    if (hi >= 0xDC00 && hi <= 0xDFFF) return fail("Unexpected low surrogate");
    if (hi < 0xD800 || hi > 0xDBFF) {
      put_utf8(dst, hi);
      return true;
    }

    if (!peek_is('\\')) return fail("High surrogate not followed by low surrogate");
    step();
    if (!peek_is('u')) return fail("High surrogate not followed by \\u");
    step();

    unsigned lo = 0;
    if (!read_hex4(lo)) return false;
    if (lo < 0xDC00 || lo > 0xDFFF) return fail("Invalid low surrogate");
    put_utf8(dst, 0x10000u + ((hi - 0xD800u) << 10) + (lo - 0xDC00u));
    return true;
  }

  bool read_escape(std::string& dst) {
    if (at_end()) return fail("Unexpected EOF in string escape");
    const char esc = peek();
    step();
    switch (esc) {
      case '"':  dst += '"';  return true;
      case '\\': dst += '\\'; return true;
      case '/':  dst += '/';  return true;
      case 'b':  dst += '\b'; return true;
      case 'f':  dst += '\f'; return true;
      case 'n':  dst += '\n'; return true;
      case 'r':  dst += '\r'; return true;
      case 't':  dst += '\t'; return true;
      case 'u':  return read_unicode_escape(dst);
      default:   return fail("Invalid escape sequence");
    }
  }

  bool read_string(std::string& dst) {
    skip_whitespace();
    if (!peek_is('"')) return fail("Expected string");
    step();
    dst.clear();

    while (!at_end()) {
      const char ch = peek();
      if (ch == '"') {
        step();
        return true;
      }
      if (static_cast<unsigned char>(ch) < 0x20) return fail("Unescaped control character in string");
      step();
      if (ch == '\\') {
        if (!read_escape(dst)) return false;
      } else {
        dst += ch;
      }
    }
    return fail("Unterminated string");
  }

  void skip_digits() {
    while (peek_digit()) step();
  }

  // Strict JSON number grammar: no '+', no leading zeros, no NaN/Inf.
  bool read_number(double& value) {
    skip_whitespace();
    const char* first = pos_;

    if (peek_is('-')) step();
    if (peek_is('0')) {
      step();
    } else if (peek_digit()) {
      skip_digits();
    } else {
      return fail(at_end() ? "Expected digits" : "Invalid number");
    }

    if (peek_is('.')) {
      step();
      if (!peek_digit()) return fail("Expected digits after '.'");
      skip_digits();
    }
    if (peek_is('e') || peek_is('E')) {
      step();
      if (peek_is('+') || peek_is('-')) step();
      if (!peek_digit()) return fail("Expected digits in exponent");
      skip_digits();
    }

    const std::string literal(first, pos_);
    errno = 0;
    char* stop = nullptr;
    const double v = std::strtod(literal.c_str(), &stop);
    if (stop != literal.c_str() + literal.size()) return fail("Failed to parse number");
    if (errno == ERANGE && std::isinf(v)) return fail("Number out of range");
    value = v;  // underflow to denormal/zero is accepted
    return true;
  }

  const char* begin_;
  const char* pos_;
  const char* end_;
  JsonParseError* err_;
  int line_ = 1;
  int col_ = 1;
  int depth_ = 0;
};

}  // namespace

const char* to_string(JsonType t) noexcept {
  switch (t) {
    case JsonType::kNull:   return "null";
    case JsonType::kBool:   return "bool";
    case JsonType::kNumber: return "number";
    case JsonType::kString: return "string";
    case JsonType::kObject: return "object";
    case JsonType::kArray:  return "array";
    default:                return "unknown";
  }
}

const JsonValue* JsonValue::find(const std::string& key) const noexcept {
  if (type != JsonType::kObject) return nullptr;
  auto it = obj.find(key);
  return (it == obj.end()) ? nullptr : &it->second;
}

bool parse_json(std::string_view json, JsonValue* out, JsonParseError* err) {
  if (!out) return false;
  JsonValue root;
  JsonReader reader(json, err);
  if (!reader.read_document(root)) return false;
  *out = std::move(root);
  return true;
}

bool parse_json(std::istream& is, JsonValue* out, JsonParseError* err) {
  std::ostringstream buffer;
  buffer << is.rdbuf();
  return parse_json(std::string_view(buffer.str()), out, err);
}

std::string format_parse_error(const JsonParseError& err) {
  std::ostringstream oss;
  oss << err.line << ":" << err.col << ": " << err.message;
  return oss.str();
}

}  // namespace clirisk::io
