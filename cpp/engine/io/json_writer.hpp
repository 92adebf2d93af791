#pragma once

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "engine/io/json_value.hpp"

namespace clirisk::io {

struct JsonWriteOptions {
  // Pretty output = newlines + indentation
  bool pretty = true;
  int indent_spaces = 2;

  // JSON cannot represent NaN/Inf. If a numeric field is unset (NaN/Inf),
  // emit `null` instead of omitting the field.
  bool emit_null_for_unset = true;
};

std::string escape_json(std::string_view s);

// Finite `v` as a JSON number: 15 significant digits when that reads back
// exactly, otherwise 17 (always round-trips).
std::string format_json_number(double v);

// Streaming writer. Callers emit tokens in document order; the writer owns
// commas, indentation and key/value pairing.
//
//   w.begin_object();
//   w.key("pof"); w.number(0.25);
//   w.end_object();
class JsonWriter {
 public:
  JsonWriter(std::ostream& os, const JsonWriteOptions& opt);

  void begin_object();
  void end_object();
  void begin_array();
  void end_array();

  void key(std::string_view k);

  void string(std::string_view v);
  void boolean(bool v);
  void null_value();
  void number(double v);
  void integer(long long v);
  void number_or_null(double v);

  // key + numeric value if set, else null or nothing (emit_null_for_unset).
  void key_number_optional(std::string_view k, double v);

  // Whole-document helpers.
  void value(const JsonValue& v);
  void number_array(const std::vector<double>& v);
  void string_array(const std::vector<std::string>& v);

  const JsonWriteOptions& options() const noexcept { return opt_; }

 private:
  enum class Scope { kObject, kArray };

  struct Frame {
    Scope kind;
    int count;
  };

  void before_value();
  void newline_and_indent();

  std::ostream& os_;
  JsonWriteOptions opt_;
  std::vector<Frame> scopes_;
  bool pending_value_ = false;
};

// Compact single-line rendering of a JsonValue.
std::string to_compact_json(const JsonValue& v);

}  // namespace clirisk::io
