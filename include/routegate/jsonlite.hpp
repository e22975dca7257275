#pragma once

// routegate/jsonlite.hpp — Minimal strict JSON reader/writer.
//
// Used for policy documents, engine config files, CLI input and the
// simulation scenario format. Output side is mostly hand-built with
// ostringstream in each module's *_to_json(); escape() and format_double()
// here keep that output consistent.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace routegate::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v{nullptr};
};

struct JsonError {
  std::string code;     // "json_parse_error" | "json_duplicate_key"
  std::string message;
};

// Strict parse. Duplicate keys, trailing data, NaN/Infinity are errors.
// Returns an empty Object (and sets *error) when the text is not a JSON object.
Object parse(const std::string& text, std::optional<JsonError>* error);
std::optional<JsonError> validate_strict(const std::string& text);

// Canonical form: sorted keys, no whitespace, deterministic doubles.
std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error);
std::string to_json(const Value& v);

// Type-safe extractors
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);
const Object* get_object(const Object& obj, const std::string& key);
const Array* get_array(const Object& obj, const std::string& key);
bool has_key(const Object& obj, const std::string& key);

std::string escape(const std::string& s);
std::string format_double(double d);

}  // namespace routegate::jsonlite
