#pragma once

// warden/jsonlite.hpp - Strict, dependency-free JSON reader/writer.
//
// Used for TF definition documents, the engine config, findings streams,
// task packets, the waiver ledger and snapshot metadata.
//
// DETERMINISM GUARANTEES:
//   - Objects are std::map, so to_json() always emits keys in sorted order.
//   - Doubles are emitted through format_double() (fixed 6 decimals, trailing
//     zeros trimmed), never through iostreams.
//   - Duplicate keys are a parse error (json_duplicate_key), not last-wins.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace warden::jsonlite {

struct JsonError {
  std::string code;
  std::string message;
};

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Array, Object> v;
};

// Parse a document whose root must be an object. On error returns {} and
// fills *error.
Object parse(const std::string& text, std::optional<JsonError>* error);

// Parse any JSON value.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

std::optional<JsonError> validate_strict(const std::string& text);
std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error);

std::string to_json(const Value& v);
std::string escape(const std::string& s);
std::string format_double(double d);

// Type-safe extractors. A missing key or a type mismatch yields the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def);
bool get_bool(const Object& obj, const std::string& key, bool def);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def);
double get_double(const Object& obj, const std::string& key, double def);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);

// Borrowing accessors for nested documents. nullptr when absent or mistyped.
const Object* get_object(const Object& obj, const std::string& key);
const Array* get_array(const Object& obj, const std::string& key);

bool is_string(const Value& v);
bool is_number(const Value& v);
bool is_bool(const Value& v);
bool is_object(const Value& v);
bool is_array(const Value& v);

}  // namespace warden::jsonlite
