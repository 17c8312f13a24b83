#pragma once

// applogic/expression.hpp - Tokenizer and precedence-climbing parser for the
// app logic expression language.
//
// GRAMMAR (highest precedence first; every binary level is left-associative):
//   1. ( expr )                 grouping
//   2. a.b   a[expr]            member / index access
//   3. name(args)               call (only directly on a bare identifier)
//   4. !x   -x                  unary
//   5. *  /
//   6. +  -
//   7. <  >  <=  >=
//   8. ==  !=
//   9. &&
//  10. ||
//   Primaries: numbers, 'single' / "double" quoted strings, `template`
//   strings with interpolation, true / false / null, identifiers,
//   [list, literals], {map: literals}.
//
// INVARIANTS:
//   - Parsing never consults an evaluation context. The resulting tree is
//     immutable and shared, so one parse is reused by every invocation and
//     every thread.
//   - Malformed input produces a ParseError with the byte offset of the
//     offending token. Nothing here throws.
//
// EXTENSION_POINT: interpolation_syntax
//   The delimiters that open and close an embedded expression inside template
//   text are ParseOptions, defaulting to "${" and "}". EngineConfig exposes
//   them so a host can match whatever its app authors already write.

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "applogic/value.hpp"

namespace applogic {

struct ParseOptions {
  std::string interpolation_open{"${"};
  std::string interpolation_close{"}"};
};

struct ParseError {
  std::string message;
  std::size_t offset{0};
};

enum class ExprKind {
  literal,
  identifier,
  member,
  index,
  call,
  unary,
  binary,
  list,
  map,
  interpolation,
};

enum class UnaryOp { logical_not, negate };

enum class BinaryOp {
  mul,
  div,
  add,
  sub,
  lt,
  gt,
  le,
  ge,
  eq,
  ne,
  logical_and,
  logical_or,
};

std::string to_string(UnaryOp op);
std::string to_string(BinaryOp op);

// One syntax tree node. Which fields are meaningful depends on kind:
//   literal        literal
//   identifier     name
//   member         operands[0] = object, name = key
//   index          operands[0] = object, operands[1] = index
//   call           name = function, operands = arguments
//   unary          unary_op, operands[0]
//   binary         binary_op, operands[0..1]
//   list           operands = elements
//   map            keys[i] -> operands[i]
//   interpolation  operands = parts, concatenated after stringification
struct Expr {
  ExprKind    kind{ExprKind::literal};
  std::size_t offset{0};
  Value       literal;
  std::string name;
  UnaryOp     unary_op{UnaryOp::logical_not};
  BinaryOp    binary_op{BinaryOp::add};
  std::vector<std::shared_ptr<const Expr>> operands;
  std::vector<std::string> keys;
};

using ExprPtr = std::shared_ptr<const Expr>;

// Parse a complete expression. Returns nullptr and sets *error on failure.
ExprPtr parse_expression(std::string_view source, const ParseOptions& options,
                         std::optional<ParseError>* error);

// Parse plain text as a template: literal text with embedded expressions
// between the configured delimiters. Used for human-readable message fields.
ExprPtr parse_template(std::string_view text, const ParseOptions& options,
                       std::optional<ParseError>* error);

// A parsed expression together with the JSON form it was loaded from.
// Two Expressions are equal when their sources are equal.
struct Expression {
  Value   source;
  ExprPtr root;

  bool empty() const { return root == nullptr; }
};

inline bool operator==(const Expression& a, const Expression& b) { return a.source == b.source; }

// ---------------------------------------------------------------------------
// Static inspection helpers used by definition loading and the interpreter.
// ---------------------------------------------------------------------------

// A name an expression reads from its environment: `root` plus, when the
// expression immediately selects a member of it, that member. `indexed` is
// true for `root[expr]` and `root[expr].member`.
struct Reference {
  std::string                root;
  std::optional<std::string> member;
  bool                       indexed{false};
  std::size_t                offset{0};
};

std::vector<Reference> collect_references(const Expr& expr);

// Names of every function the expression calls.
std::vector<std::string> collect_calls(const Expr& expr);

// A member/index chain rooted at an identifier, e.g. agents[params.to].balance
// becomes root "agents" with steps [index(params.to), key("balance")].
struct ChainStep {
  const Expr* index{nullptr};  // non-null for [expr] steps
  std::string key;             // set for .key steps
};

bool decompose_chain(const Expr& expr, std::string* root, std::vector<ChainStep>* steps);

}  // namespace applogic
