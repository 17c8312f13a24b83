#include <cstdlib>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include "applogic/evaluator.hpp"
#include "applogic/expression.hpp"
#include "applogic/functions.hpp"
#include "applogic/jsonlite.hpp"
#include "applogic/value.hpp"

using applogic::ErrorCode;
using applogic::List;
using applogic::Map;
using applogic::Value;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

const applogic::FunctionRegistry& builtins() {
  static const applogic::FunctionRegistry r = applogic::FunctionRegistry::with_builtins();
  return r;
}

// Evaluates `src` and fails the test on any error.
Value eval_ok(const std::string& src, const applogic::Environment& env) {
  std::optional<applogic::Error> err;
  Value v = applogic::evaluate_source(src, env, builtins(), &err);
  expect(!err, "unexpected error for '" + src + "': " + (err ? err->message : ""));
  return v;
}

Value eval_ok(const std::string& src) {
  applogic::MapEnvironment env;
  return eval_ok(src, env);
}

ErrorCode eval_err(const std::string& src, const applogic::Environment& env) {
  std::optional<applogic::Error> err;
  applogic::evaluate_source(src, env, builtins(), &err);
  expect(err.has_value(), "expected an error for '" + src + "'");
  return err->code;
}

ErrorCode eval_err(const std::string& src) {
  applogic::MapEnvironment env;
  return eval_err(src, env);
}

applogic::ParseError parse_err(const std::string& src) {
  std::optional<applogic::ParseError> err;
  auto root = applogic::parse_expression(src, applogic::ParseOptions{}, &err);
  expect(root == nullptr && err.has_value(), "expected a parse error for '" + src + "'");
  return *err;
}

std::string render(const std::string& text, const applogic::Environment& env,
                   const applogic::ParseOptions& options = applogic::ParseOptions{}) {
  std::optional<applogic::ParseError> perr;
  auto root = applogic::parse_template(text, options, &perr);
  expect(root != nullptr, "template should parse: " + text);
  std::optional<applogic::Error> err;
  Value v = applogic::evaluate(*root, env, builtins(), &err);
  expect(!err && v.is_string(), "template should render: " + text);
  return v.as_string();
}

// ============================================================================
// Parser: precedence and shape
// ============================================================================

void test_arithmetic_precedence() {
  expect(eval_ok("1+2*3") == Value{6}, "1+2*3 == 6");
  expect(eval_ok("(1+2)*3") == Value{9}, "(1+2)*3 == 9");
  expect(eval_ok("10 - 2 - 3") == Value{5}, "subtraction is left-associative");
  expect(eval_ok("8 / 2 / 2") == Value{2}, "division is left-associative");
  expect(eval_ok("-2 * 3") == Value{-6}, "unary minus binds tighter than *");
  expect(eval_ok("- -2") == Value{2}, "double negation");
  expect(eval_ok("1.5e2") == Value{150}, "exponent literal");
  expect(eval_ok(".5 + 1") == Value{1.5}, "leading-dot literal");
  expect(eval_ok("2 * -.25") == Value{-0.5}, "leading-dot literal after an operator");
  expect(eval_ok("[.5, .75][1]") == Value{0.75}, "leading-dot literals in a list");
}

void test_logical_precedence() {
  expect(eval_ok("!true && false") == Value{false}, "!true && false == false");
  expect(eval_ok("true || false && false") == Value{true}, "&& binds tighter than ||");
  expect(eval_ok("1 < 2 == true") == Value{true}, "relational binds tighter than equality");
  expect(eval_ok("1 + 1 == 2 && 3 > 2") == Value{true}, "arithmetic, comparison, logic");
  expect(eval_ok("!(1 == 2)") == Value{true}, "grouped negation");
}

void test_member_and_index_access() {
  applogic::MapEnvironment env;
  env.bind("a", Value{Map{{"b", Value{List{Value{5}, Value{6}}}}}});
  expect(eval_ok("a.b[0]==5", env) == Value{true}, "a.b[0]==5");
  expect(eval_ok("a.b[1] * 2", env) == Value{12}, "index then arithmetic");
  expect(eval_ok("a['b'][1]", env) == Value{6}, "string index on a map");
  expect(eval_ok("{x: [1, 2, 3]}.x[2]", env) == Value{3}, "access on a literal");
  expect(eval_ok("(a).b[0]", env) == Value{5}, "'.' after ')' stays member access");
}

void test_literals() {
  expect(eval_ok("[1, 'two', null, true,]") ==
             Value{List{Value{1}, Value{"two"}, Value{nullptr}, Value{true}}},
         "list literal with trailing comma");
  expect(eval_ok("{a: 1, \"b c\": 'x'}") == Value{Map{{"a", Value{1}}, {"b c", Value{"x"}}}},
         "map literal with bare and quoted keys");
  expect(eval_ok("'it\\'s'") == Value{"it's"}, "escaped quote");
  expect(eval_ok("\"line\\nbreak\"") == Value{"line\nbreak"}, "newline escape");
}

void test_parse_errors_carry_offsets() {
  auto e = parse_err("1 +");
  expect(e.offset == 3, "dangling operator reported at end of input");

  e = parse_err("1 + * 2");
  expect(e.offset == 4, "unexpected operator reported at its offset");

  e = parse_err("(1 + 2");
  expect(e.offset == 6 && e.message.find("')'") != std::string::npos, "missing ')' reported");

  e = parse_err("'abc");
  expect(e.offset == 0 && e.message.find("unterminated") != std::string::npos, "unterminated string");

  e = parse_err("a..b");
  expect(e.offset == 2, "missing field name after '.'");

  e = parse_err("1 2");
  expect(e.offset == 2, "trailing token after a complete expression");

  e = parse_err("1 .5");
  expect(e.offset == 3, "'.' after a number is not a second literal");

  e = parse_err("2 + 1e999");
  expect(e.offset == 4 && e.message.find("out of range") != std::string::npos,
         "literal that overflows a double");

  e = parse_err("x.f(1)");
  expect(e.message.find("named functions") != std::string::npos, "calls only on bare identifiers");

  e = parse_err("a # b");
  expect(e.offset == 2, "unknown character");

  e = parse_err("{a: 1, a: 2}");
  expect(e.message.find("duplicate") != std::string::npos, "duplicate map key");

  e = parse_err("   ");
  expect(e.message.find("empty") != std::string::npos, "blank expression");
}

void test_deep_nesting_rejected() {
  std::string deep(500, '(');
  deep += "1";
  deep += std::string(500, ')');
  auto e = parse_err(deep);
  expect(e.message.find("nested too deeply") != std::string::npos, "pathological nesting is a parse error");
}

// ============================================================================
// Evaluator semantics
// ============================================================================

void test_plus_semantics() {
  expect(eval_ok("'x' + 1") == Value{"x1"}, "string + number concatenates");
  expect(eval_ok("1 + 'x'") == Value{"1x"}, "number + string concatenates");
  expect(eval_ok("2.5 + 'x'") == Value{"2.5x"}, "fractional numbers stringify minimally");
  expect(eval_ok("'a' + true") == Value{"atrue"}, "boolean stringifies");
  expect(eval_ok("null + 'x'") == Value{"x"}, "null stringifies to empty");
  expect(eval_ok("[1] + [2, 3]") == Value{List{Value{1}, Value{2}, Value{3}}}, "list concatenation");
  expect(eval_err("true + 1") == ErrorCode::type_mismatch, "boolean + number");
  expect(eval_err("[1] + 1") == ErrorCode::type_mismatch, "list + number");
}

void test_arithmetic_errors() {
  expect(eval_err("1 / 0") == ErrorCode::division_by_zero, "division by zero");
  expect(eval_err("5 / (2 - 2)") == ErrorCode::division_by_zero, "computed zero divisor");
  expect(eval_err("'a' * 2") == ErrorCode::type_mismatch, "string * number");
  expect(eval_err("-'a'") == ErrorCode::type_mismatch, "negating a string");
  expect(eval_err("!1") == ErrorCode::type_mismatch, "! needs a boolean");
  expect(eval_err("1 < 'a'") == ErrorCode::type_mismatch, "mixed comparison");
}

void test_numeric_overflow() {
  expect(eval_err("1e308 * 10") == ErrorCode::invalid_argument, "product past the double range");
  expect(eval_err("1e308 + 1e308") == ErrorCode::invalid_argument, "sum past the double range");
  expect(eval_err("-1e308 - 1e308") == ErrorCode::invalid_argument, "difference past the double range");
  expect(eval_err("1e308 / 1e-10") == ErrorCode::invalid_argument, "quotient past the double range");
  expect(eval_err("max(1e308, 5) * 2") == ErrorCode::invalid_argument, "overflow on a call result");

  applogic::FunctionRegistry fns = applogic::FunctionRegistry::with_builtins();
  fns.register_function("huge", [](const List&, std::optional<applogic::Error>*) {
    return Value{std::numeric_limits<double>::infinity()};
  }, 0, 0);
  applogic::MapEnvironment env;
  std::optional<applogic::Error> err;
  applogic::evaluate_source("huge()", env, fns, &err);
  expect(err && err->code == ErrorCode::invalid_argument, "non-finite function result is rejected");
  expect(eval_ok("1e308 * 1") == Value{1e308}, "largest finite values are kept");
  expect(applogic::jsonlite::format_number(std::numeric_limits<double>::infinity()) == "null",
         "infinity never reaches JSON as a number");
  expect(applogic::jsonlite::format_number(std::numeric_limits<double>::quiet_NaN()) == "null",
         "NaN never reaches JSON as a number");
}

void test_comparisons() {
  expect(eval_ok("'apple' < 'banana'") == Value{true}, "lexicographic <");
  expect(eval_ok("2 >= 2") == Value{true}, ">=");
  expect(eval_ok("[1, {a: 2}] == [1, {a: 2}]") == Value{true}, "structural equality");
  expect(eval_ok("1 == '1'") == Value{false}, "no coercion in ==");
  expect(eval_ok("null != 0") == Value{true}, "null is not zero");
}

void test_missing_paths_read_null() {
  applogic::MapEnvironment env;
  env.bind("m", Value{Map{{"list", Value{List{Value{1}}}}}});
  expect(eval_ok("nobody", env).is_null(), "unbound identifier is null");
  expect(eval_ok("m.missing", env).is_null(), "missing key is null");
  expect(eval_ok("m.missing.deeper[3]", env).is_null(), "read through null is null");
  expect(eval_ok("m.list[7]", env).is_null(), "out of range index is null");
  expect(eval_ok("m.list[0].x", env).is_null(), "member of a scalar is null");
  expect(eval_err("m.list['x']", env) == ErrorCode::type_mismatch, "string index on a list");
  expect(eval_err("m[0]", env) == ErrorCode::type_mismatch, "numeric index on a map");
}

void test_logical_operands_must_be_boolean() {
  expect(eval_err("1 && true") == ErrorCode::type_mismatch, "number on the left of &&");
  expect(eval_err("true && 'x'") == ErrorCode::type_mismatch, "string on the right of &&");
  expect(eval_ok("false && 1") == Value{false}, "short-circuit skips a bad right operand");
  expect(eval_ok("true || 'x'") == Value{true}, "short-circuit for ||");
}

int g_side_effects = 0;

void test_short_circuit_side_effects() {
  applogic::FunctionRegistry fns = applogic::FunctionRegistry::with_builtins();
  fns.register_function("tick", [](const List&, std::optional<applogic::Error>*) {
    ++g_side_effects;
    return Value{true};
  }, 0, 0);
  applogic::MapEnvironment env;

  auto run = [&](const std::string& src) {
    std::optional<applogic::Error> err;
    Value v = applogic::evaluate_source(src, env, fns, &err);
    expect(!err, "tick expression should evaluate: " + src);
    return v;
  };

  g_side_effects = 0;
  expect(run("false && tick()") == Value{false}, "false && ...");
  expect(g_side_effects == 0, "right side of false && never runs");

  expect(run("true || tick()") == Value{true}, "true || ...");
  expect(g_side_effects == 0, "right side of true || never runs");

  expect(run("true && tick()") == Value{true}, "true && tick()");
  expect(g_side_effects == 1, "right side of true && runs exactly once");

  expect(run("false || tick() || tick()") == Value{true}, "chained ||");
  expect(g_side_effects == 2, "chained || stops at the first true");
}

void test_unknown_function() {
  expect(eval_err("nosuch(1)") == ErrorCode::unknown_function, "unregistered name");
  expect(eval_err("false || nosuch()") == ErrorCode::unknown_function, "reported when reached");
  expect(eval_ok("false && nosuch()") == Value{false}, "not reported when skipped");
}

// ============================================================================
// Builtin functions
// ============================================================================

void test_builtin_functions() {
  expect(eval_ok("len('abc')") == Value{3}, "len string");
  expect(eval_ok("len('h\xc3\xa9llo')") == Value{5}, "len counts code points");
  expect(eval_ok("len(null)") == Value{0}, "len of null");
  expect(eval_ok("len([1, 2])") == Value{2}, "len list");
  expect(eval_ok("len({a: 1})") == Value{1}, "len map");
  expect(eval_ok("contains([1, 2], 2)") == Value{true}, "contains list");
  expect(eval_ok("contains('hello', 'ell')") == Value{true}, "contains substring");
  expect(eval_ok("contains({k: 1}, 'k')") == Value{true}, "contains key");
  expect(eval_ok("upper('ab') + lower('CD')") == Value{"ABcd"}, "case conversion");
  expect(eval_ok("str(3)") == Value{"3"}, "str integral");
  expect(eval_ok("num('4.5') + 1") == Value{5.5}, "num parses strings");
  expect(eval_ok("bool('') || bool(0)") == Value{false}, "bool truthiness");
  expect(eval_ok("round(2.5)") == Value{2}, "round half to even, down");
  expect(eval_ok("round(3.5)") == Value{4}, "round half to even, up");
  expect(eval_ok("round(-2.5)") == Value{-2}, "round negative half to even");
  expect(eval_ok("round(2.6)") == Value{3}, "round above half");
  expect(eval_ok("round(3.14159, 2)") == Value{3.14}, "round to digits");
  expect(eval_ok("abs(-3) + floor(2.7) + ceil(2.1)") == Value{8}, "abs/floor/ceil");
  expect(eval_ok("min(3, 1, 2)") == Value{1}, "min variadic");
  expect(eval_ok("max([4, 9, 2])") == Value{9}, "max of a list");
}

void test_builtin_argument_errors() {
  expect(eval_err("len()") == ErrorCode::invalid_argument, "too few arguments");
  expect(eval_err("len(1, 2)") == ErrorCode::invalid_argument, "too many arguments");
  expect(eval_err("len(5)") == ErrorCode::type_mismatch, "len of a number");
  expect(eval_err("num('abc')") == ErrorCode::invalid_argument, "unparseable number");
  expect(eval_err("min([])") == ErrorCode::invalid_argument, "min of nothing");
  expect(eval_err("round(1, 99)") == ErrorCode::invalid_argument, "round digits out of range");
}

void test_registry_restriction() {
  applogic::FunctionRegistry fns = applogic::FunctionRegistry::with_builtins();
  auto missing = fns.restrict_to({"len", "upper", "sqrt"});
  expect(missing.size() == 1 && missing[0] == "sqrt", "missing names are reported");
  expect(fns.contains("len") && !fns.contains("max"), "registry keeps only the allowed set");
  expect(fns.names().size() == 2, "two functions remain");
}

// ============================================================================
// Interpolation
// ============================================================================

void test_template_literals() {
  applogic::MapEnvironment env;
  env.bind("name", Value{"Bob"});
  env.bind("n", Value{3});
  expect(eval_ok("`Hello ${name}!`", env) == Value{"Hello Bob!"}, "template literal in an expression");
  expect(eval_ok("`n=${n * 2}`", env) == Value{"n=6"}, "expression inside a template");
  expect(eval_ok("`${ {a: 1}.a }`", env) == Value{"1"}, "braces inside an interpolation");
  expect(eval_ok("`${'}'}`", env) == Value{"}"}, "quoted close delimiter is not the end");
}

void test_template_text() {
  applogic::MapEnvironment env;
  env.bind("params", Value{Map{{"amount", Value{50}}, {"to", Value{"bob"}}}});
  expect(render("Sent ${params.amount} to ${params.to}", env) == "Sent 50 to bob", "plain template");
  expect(render("no interpolation here", env) == "no interpolation here", "literal text only");
  expect(render("", env).empty(), "empty template");
  expect(render("${params.missing}|", env) == "|", "null renders empty");
}

void test_custom_delimiters() {
  applogic::MapEnvironment env;
  env.bind("name", Value{"Bob"});
  applogic::ParseOptions opts;
  opts.interpolation_open = "{{";
  opts.interpolation_close = "}}";
  expect(render("Hi {{name}}, ${name}", env, opts) == "Hi Bob, ${name}", "configured delimiters only");
}

void test_template_errors() {
  std::optional<applogic::ParseError> err;
  auto root = applogic::parse_template("ab ${1 +}", applogic::ParseOptions{}, &err);
  expect(!root && err && err->offset == 8, "error inside an interpolation is offset into the template");

  err.reset();
  root = applogic::parse_template("value ${oops", applogic::ParseOptions{}, &err);
  expect(!root && err && err->offset == 6, "unterminated interpolation");
}

// ============================================================================
// Static inspection
// ============================================================================

void test_collect_references() {
  std::optional<applogic::ParseError> err;
  auto root = applogic::parse_expression(
      "params.amount > agent.balance && agents[params.to].balance >= 0 && len(item) > 0",
      applogic::ParseOptions{}, &err);
  expect(root != nullptr, "reference expression parses");
  auto refs = applogic::collect_references(*root);

  auto has = [&](const std::string& r, const std::string& member, bool indexed) {
    for (const auto& ref : refs) {
      if (ref.root == r && ref.member.value_or("") == member && ref.indexed == indexed) return true;
    }
    return false;
  };
  expect(has("params", "amount", false), "params.amount");
  expect(has("agent", "balance", false), "agent.balance");
  expect(has("agents", "balance", true), "agents[...].balance");
  expect(has("params", "to", false), "index expression is visited");
  expect(has("item", "", false), "bare identifier in a call argument");

  auto calls = applogic::collect_calls(*root);
  expect(calls.size() == 1 && calls[0] == "len", "collect_calls");
}

void test_decompose_chain() {
  std::optional<applogic::ParseError> err;
  auto root = applogic::parse_expression("agents[params.to].balance", applogic::ParseOptions{}, &err);
  std::string r;
  std::vector<applogic::ChainStep> steps;
  expect(applogic::decompose_chain(*root, &r, &steps), "chain decomposes");
  expect(r == "agents" && steps.size() == 2, "root and two steps");
  expect(steps[0].index != nullptr && steps[1].key == "balance", "index step then key step");

  root = applogic::parse_expression("a + b", applogic::ParseOptions{}, &err);
  expect(!applogic::decompose_chain(*root, &r, &steps), "arithmetic is not a chain");
}

void test_parse_once_evaluate_many() {
  std::optional<applogic::ParseError> perr;
  auto root = applogic::parse_expression("x * 2", applogic::ParseOptions{}, &perr);
  for (int i = 0; i < 10; ++i) {
    applogic::MapEnvironment env;
    env.bind("x", Value{i});
    std::optional<applogic::Error> err;
    Value v = applogic::evaluate(*root, env, builtins(), &err);
    expect(!err && v == Value{i * 2}, "shared tree evaluates against each environment");
  }
}

}  // namespace

int main() {
  std::cout << "=== App Logic Expression Test Suite ===\n";

  std::cout << "\n[Parser] Precedence and shape\n";
  run_test("arithmetic precedence", test_arithmetic_precedence);
  run_test("logical precedence", test_logical_precedence);
  run_test("member and index access", test_member_and_index_access);
  run_test("literals", test_literals);
  run_test("parse errors carry offsets", test_parse_errors_carry_offsets);
  run_test("deep nesting rejected", test_deep_nesting_rejected);

  std::cout << "\n[Evaluator] Semantics\n";
  run_test("+ semantics", test_plus_semantics);
  run_test("arithmetic errors", test_arithmetic_errors);
  run_test("numeric overflow", test_numeric_overflow);
  run_test("comparisons", test_comparisons);
  run_test("missing paths read null", test_missing_paths_read_null);
  run_test("logical operands must be boolean", test_logical_operands_must_be_boolean);
  run_test("short-circuit side effects", test_short_circuit_side_effects);
  run_test("unknown function", test_unknown_function);

  std::cout << "\n[Functions] Builtins\n";
  run_test("builtin functions", test_builtin_functions);
  run_test("builtin argument errors", test_builtin_argument_errors);
  run_test("registry restriction", test_registry_restriction);

  std::cout << "\n[Interpolation]\n";
  run_test("template literals", test_template_literals);
  run_test("template text", test_template_text);
  run_test("custom delimiters", test_custom_delimiters);
  run_test("template errors", test_template_errors);

  std::cout << "\n[Inspection]\n";
  run_test("collect references", test_collect_references);
  run_test("decompose chain", test_decompose_chain);
  run_test("parse once, evaluate many", test_parse_once_evaluate_many);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
