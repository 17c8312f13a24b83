#pragma once

// applogic/jsonlite.hpp - Strict JSON codec over applogic::Value.
//
// DETERMINISM GUARANTEES:
//   - to_json() is canonical: Map iteration is sorted, no whitespace, and
//     numbers go through format_number(), which is locale-independent.
//   - json_size(v) == to_json(v).size() for every v, without allocating.
//
// Errors are reported through the optional JsonError out-parameter. Nothing in
// this header throws.

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "applogic/value.hpp"

namespace applogic::jsonlite {

struct JsonError {
  std::string code;     // "json_parse_error" | "json_duplicate_key"
  std::string message;
};

// Parse any JSON document. Trailing non-whitespace is an error.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

// Parse a JSON document whose top level must be an object.
Map parse(const std::string& text, std::optional<JsonError>* error);

// Canonical compact serialization.
std::string to_json(const Value& v);

// Byte length of to_json(v), computed by walking the tree.
std::size_t json_size(const Value& v);

// Canonical number text: integers print without a fraction when |d| < 1e15,
// everything else uses the shortest of %.15g / %.17g that round-trips.
std::string format_number(double d);

std::string escape(const std::string& s);

// Type-safe extractors. Missing keys or wrong types yield the default.
std::string get_string(const Map& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Map& obj, const std::string& key, bool def = false);
std::vector<std::string> get_string_array(const Map& obj, const std::string& key);

}  // namespace applogic::jsonlite
