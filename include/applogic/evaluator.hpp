#pragma once

// applogic/evaluator.hpp - Evaluates parsed expressions against an environment.
//
// SEMANTICS:
//   +            number + number, string concat when either side is a string
//                (the other side is stringified), list ++ list. Else type_mismatch.
//   - * /        numbers only; x / 0 is division_by_zero, never infinity.
//   < > <= >=    two numbers, or two strings (byte-wise lexicographic).
//   == !=        structural equality over any two values; never an error.
//   && ||        short-circuit; both operands must be booleans.
//   !            boolean only.   unary -   number only.
//   a.b  a[i]    reads are permissive: a missing key, an out-of-range index or
//                a read through null / a scalar yields null. A list index must
//                be a number and a map index a string.
//   f(args)      looked up in the FunctionRegistry at evaluation time; an
//                unregistered name is unknown_function.
//
// Nothing here throws; the first error aborts evaluation and is reported
// through the out-parameter.

#include <optional>
#include <string>

#include "applogic/expression.hpp"
#include "applogic/functions.hpp"
#include "applogic/types.hpp"
#include "applogic/value.hpp"

namespace applogic {

// Name resolution for identifiers. Returned pointers must stay valid for the
// duration of one evaluate() call.
class Environment {
 public:
  virtual ~Environment() = default;
  // nullptr when the name is unbound (evaluates to null).
  virtual const Value* lookup(const std::string& name) const = 0;
};

// A flat name -> value environment, convenient for hosts and tests.
class MapEnvironment : public Environment {
 public:
  MapEnvironment() = default;
  explicit MapEnvironment(Map bindings) : bindings_(std::move(bindings)) {}

  void bind(const std::string& name, Value value) { bindings_[name] = std::move(value); }
  const Value* lookup(const std::string& name) const override;

 private:
  Map bindings_;
};

Value evaluate(const Expr& expr, const Environment& env, const FunctionRegistry& functions,
               std::optional<Error>* error);

// Convenience: parse + evaluate in one step. Parse failures are reported as
// ErrorCode::parse_error with the offset in the message.
Value evaluate_source(const std::string& source, const Environment& env,
                      const FunctionRegistry& functions, std::optional<Error>* error,
                      const ParseOptions& options = ParseOptions{});

}  // namespace applogic
