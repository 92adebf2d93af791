// ============================================================================
// IO: Deterministic JSON Writer
// File: cpp/engine/io/json_writer.cpp
// ============================================================================

#include "engine/io/json_writer.hpp"

#include "engine/core/error.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <ostream>
#include <sstream>

namespace clirisk::io {

std::string escape_json(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 8);

  for (unsigned char c : s) {
    switch (c) {
      case '\"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (c < 0x20) {
          // Control characters -> \u00XX
          static const char* hex = "0123456789abcdef";
          out += "\\u00";
          out += hex[(c >> 4) & 0xF];
          out += hex[c & 0xF];
        } else {
          out += static_cast<char>(c);
        }
        break;
    }
  }
  return out;
}

JsonWriter::JsonWriter(std::ostream& os, const JsonWriteOptions& opt)
    : os_(os), opt_(opt) {
  if (opt_.indent_spaces < 0) opt_.indent_spaces = 0;
}

void JsonWriter::newline_and_indent() {
  if (!opt_.pretty) return;
  os_ << "\n";
  const int n = static_cast<int>(scopes_.size()) * opt_.indent_spaces;
  for (int i = 0; i < n; ++i) os_ << ' ';
}

// Array elements get their separator here; object members got theirs in key().
void JsonWriter::before_value() {
  if (pending_value_) {
    pending_value_ = false;
    return;
  }
  if (scopes_.empty()) return;

  Frame& f = scopes_.back();
  CLIRISK_ENSURE(f.kind == Scope::kArray, ErrorCode::kInternal, "JSON object value written without key");
  if (f.count > 0) os_ << ",";
  newline_and_indent();
  ++f.count;
}

void JsonWriter::begin_object() {
  before_value();
  os_ << "{";
  scopes_.push_back(Frame{Scope::kObject, 0});
}

void JsonWriter::end_object() {
  CLIRISK_ENSURE(!scopes_.empty() && scopes_.back().kind == Scope::kObject && !pending_value_,
                 ErrorCode::kInternal, "unbalanced JSON object");
  const int count = scopes_.back().count;
  scopes_.pop_back();
  if (count > 0) newline_and_indent();
  os_ << "}";
}

void JsonWriter::begin_array() {
  before_value();
  os_ << "[";
  scopes_.push_back(Frame{Scope::kArray, 0});
}

void JsonWriter::end_array() {
  CLIRISK_ENSURE(!scopes_.empty() && scopes_.back().kind == Scope::kArray,
                 ErrorCode::kInternal, "unbalanced JSON array");
  const int count = scopes_.back().count;
  scopes_.pop_back();
  if (count > 0) newline_and_indent();
  os_ << "]";
}

void JsonWriter::key(std::string_view k) {
  CLIRISK_ENSURE(!scopes_.empty() && scopes_.back().kind == Scope::kObject && !pending_value_,
                 ErrorCode::kInternal, "JSON key outside object");
  Frame& f = scopes_.back();
  if (f.count > 0) os_ << ",";
  newline_and_indent();
  ++f.count;

  os_ << "\"" << escape_json(k) << "\":";
  if (opt_.pretty) os_ << " ";
  pending_value_ = true;
}

void JsonWriter::string(std::string_view v) {
  before_value();
  os_ << "\"" << escape_json(v) << "\"";
}

void JsonWriter::boolean(bool v) {
  before_value();
  os_ << (v ? "true" : "false");
}

std::string format_json_number(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.15g", v);
  if (std::strtod(buf, nullptr) != v) {
    std::snprintf(buf, sizeof(buf), "%.*g", std::numeric_limits<double>::max_digits10, v);
  }
  return buf;
}

void JsonWriter::null_value() {
  before_value();
  os_ << "null";
}

void JsonWriter::number(double v) {
  if (!std::isfinite(v)) {
    null_value();
    return;
  }
  before_value();
  os_ << format_json_number(v);
}

void JsonWriter::integer(long long v) {
  before_value();
  os_ << v;
}

void JsonWriter::number_or_null(double v) {
  number(v);
}

void JsonWriter::key_number_optional(std::string_view k, double v) {
  if (std::isfinite(v)) {
    key(k);
    number(v);
  } else if (opt_.emit_null_for_unset) {
    key(k);
    null_value();
  }
}

void JsonWriter::value(const JsonValue& v) {
  switch (v.type) {
    case JsonType::kNull:   null_value(); break;
    case JsonType::kBool:   boolean(v.b); break;
    case JsonType::kNumber: number(v.num); break;
    case JsonType::kString: string(v.str); break;
    case JsonType::kObject:
      begin_object();
      for (const auto& kv : v.obj) {
        key(kv.first);
        value(kv.second);
      }
      end_object();
      break;
    case JsonType::kArray:
      begin_array();
      for (const auto& e : v.arr) value(e);
      end_array();
      break;
  }
}

void JsonWriter::number_array(const std::vector<double>& v) {
  begin_array();
  for (double x : v) number_or_null(x);
  end_array();
}

void JsonWriter::string_array(const std::vector<std::string>& v) {
  begin_array();
  for (const auto& s : v) string(s);
  end_array();
}

std::string to_compact_json(const JsonValue& v) {
  std::ostringstream ss;
  JsonWriteOptions opt;
  opt.pretty = false;
  JsonWriter w(ss, opt);
  w.value(v);
  return ss.str();
}

}  // namespace clirisk::io
