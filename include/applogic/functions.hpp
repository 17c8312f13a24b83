#pragma once

// applogic/functions.hpp - Explicit registry of callable built-ins.
//
// DESIGN:
//   Expressions can only call functions registered here. The registry is an
//   ordinary value handed to the evaluator; there is no process-wide table,
//   so two engines in one process can expose different function sets.
//
// DEFAULT SET (FunctionRegistry::with_builtins):
//   len(x)            code points of a string, items of a list or map; 0 for null
//   contains(c, x)    list membership, substring test, or map key test
//   lower(s) upper(s) ASCII case conversion
//   str(x)            display string (same rules as `+` concatenation)
//   num(x)            number from a number, boolean or numeric string
//   bool(x)           truthiness
//   round(x[, n])     round half to even at n decimals (default 0)
//   abs(x) floor(x) ceil(x)
//   min(a, b, ...) max(a, b, ...)   also accept a single list argument
//
// Wall-clock and random helpers are deliberately absent: evaluation must stay
// deterministic. A host that wants them registers its own.

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "applogic/types.hpp"
#include "applogic/value.hpp"

namespace applogic {

// A built-in receives evaluated arguments and either returns a value or sets
// *error (type_mismatch / invalid_argument).
using BuiltinFn = std::function<Value(const List& args, std::optional<Error>* error)>;

struct Builtin {
  BuiltinFn   fn;
  std::size_t min_arity{0};
  std::size_t max_arity{0};  // kVariadic for no upper bound

  static constexpr std::size_t kVariadic = static_cast<std::size_t>(-1);
};

class FunctionRegistry {
 public:
  FunctionRegistry() = default;

  // The enumerated default set documented above.
  static FunctionRegistry with_builtins();

  void register_function(const std::string& name, BuiltinFn fn, std::size_t min_arity,
                         std::size_t max_arity);
  bool contains(const std::string& name) const { return functions_.contains(name); }
  const Builtin* find(const std::string& name) const;
  std::vector<std::string> names() const;

  // Keeps only the named functions. Returns the names that were not present.
  std::vector<std::string> restrict_to(const std::vector<std::string>& allowed);

 private:
  std::map<std::string, Builtin> functions_;
};

// Names of the default set, in registration order.
const std::vector<std::string>& builtin_function_names();

}  // namespace applogic
