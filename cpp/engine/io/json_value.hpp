#pragma once

#include <cstddef>
#include <iosfwd>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace clirisk::io {

struct JsonParseError {
  std::string message;
  size_t offset = 0;  // byte offset in input
  int line = 1;       // 1-based
  int col = 1;        // 1-based
};

enum class JsonType { kNull, kBool, kNumber, kString, kObject, kArray };

const char* to_string(JsonType t) noexcept;

// Generic JSON document. Object keys are kept sorted so that anything
// re-serialized from a JsonValue is deterministic.
struct JsonValue {
  JsonType type = JsonType::kNull;
  bool b = false;
  double num = 0.0;
  std::string str;
  std::map<std::string, JsonValue> obj;
  std::vector<JsonValue> arr;

  bool is_null() const noexcept { return type == JsonType::kNull; }
  bool is_bool() const noexcept { return type == JsonType::kBool; }
  bool is_number() const noexcept { return type == JsonType::kNumber; }
  bool is_string() const noexcept { return type == JsonType::kString; }
  bool is_object() const noexcept { return type == JsonType::kObject; }
  bool is_array() const noexcept { return type == JsonType::kArray; }

  // nullptr when this is not an object or the key is absent.
  const JsonValue* find(const std::string& key) const noexcept;
};

/// Parse a complete JSON text.
/// - Rejects NaN/Inf numeric literals (not valid JSON).
/// - Rejects trailing characters after the root value.
/// - Duplicate object keys: last one wins.
/// - Nesting deeper than kMaxJsonDepth is rejected.
bool parse_json(std::string_view json, JsonValue* out, JsonParseError* err = nullptr);

/// Stream convenience (reads full stream into memory).
bool parse_json(std::istream& is, JsonValue* out, JsonParseError* err = nullptr);

inline constexpr int kMaxJsonDepth = 1024;

// "line:col: message"
std::string format_parse_error(const JsonParseError& err);

}  // namespace clirisk::io
