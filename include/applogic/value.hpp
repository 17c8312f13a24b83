#pragma once

// applogic/value.hpp - The single runtime type of the app logic language.
//
// DESIGN:
//   Value is a tagged union of null | bool | number | string | list | map.
//   Every expression result and every state field is a Value. Numbers are
//   IEEE 754 doubles; there is no separate integer tag. Maps are std::map so
//   iteration (and therefore serialization) is always in sorted key order.
//
// INVARIANTS:
//   - Equality is structural: lists compare element-wise, maps key-wise,
//     scalars exactly. Different tags are never equal and never an error.
//   - No implicit coercion happens inside Value. The only conversions are the
//     explicit ones below (to_display_string, truthy) used by the evaluator.
//
// MEMORY OWNERSHIP:
//   Values own their children. Copying a Value deep-copies the tree, which is
//   how the interpreter obtains its invocation-scoped working copy of state.

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace applogic {

struct Value;
using List = std::vector<Value>;
using Map  = std::map<std::string, Value>;

enum class ValueType {
  null,
  boolean,
  number,
  string,
  list,
  map,
};

std::string to_string(ValueType type);

struct Value {
  std::variant<std::nullptr_t, bool, double, std::string, List, Map> v;

  Value() : v(nullptr) {}
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(double d) : v(d) {}
  Value(int n) : v(static_cast<double>(n)) {}
  Value(std::int64_t n) : v(static_cast<double>(n)) {}
  Value(std::size_t n) : v(static_cast<double>(n)) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(List l) : v(std::move(l)) {}
  Value(Map m) : v(std::move(m)) {}

  ValueType type() const { return static_cast<ValueType>(v.index()); }

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(v); }
  bool is_bool() const { return std::holds_alternative<bool>(v); }
  bool is_number() const { return std::holds_alternative<double>(v); }
  bool is_string() const { return std::holds_alternative<std::string>(v); }
  bool is_list() const { return std::holds_alternative<List>(v); }
  bool is_map() const { return std::holds_alternative<Map>(v); }

  bool as_bool() const { return std::get<bool>(v); }
  double as_number() const { return std::get<double>(v); }
  const std::string& as_string() const { return std::get<std::string>(v); }
  const List& as_list() const { return std::get<List>(v); }
  List& as_list() { return std::get<List>(v); }
  const Map& as_map() const { return std::get<Map>(v); }
  Map& as_map() { return std::get<Map>(v); }
};

bool operator==(const Value& a, const Value& b);
inline bool operator!=(const Value& a, const Value& b) { return !(a == b); }

// Stringification used by `+` concatenation and template interpolation.
// null -> "", integral numbers without a fraction, containers as compact JSON.
std::string to_display_string(const Value& value);

// Conventional truthiness: false for null, false, 0, "", [] and {}.
bool truthy(const Value& value);

// True if d is finite, integral and exactly representable as an index.
bool is_integral(double d);

}  // namespace applogic
