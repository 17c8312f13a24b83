#include "applogic/evaluator.hpp"

#include <cmath>

// Evaluation strategy:
//   Identifier / member / index chains are resolved by pointer into the
//   environment (resolve_ref) so that reading `shared.ledger.entries[3]` does
//   not copy the ledger. Everything else produces owned Values.

namespace applogic {

namespace {

struct Evaluator {
  const Environment& env;
  const FunctionRegistry& functions;
  std::optional<Error> err;

  void fail(ErrorCode code, std::string message) {
    if (!err) err = make_error(code, std::move(message));
  }

  // Numbers must stay finite: state is persisted as JSON, which has no inf or NaN.
  Value finite(double d, const std::string& what) {
    if (!std::isfinite(d)) {
      fail(ErrorCode::invalid_argument, "numeric overflow in " + what);
      return {};
    }
    return Value{d};
  }

  // Resolves a path chain without copying. A chain whose base is not an
  // identifier (a call, a literal, ...) is materialized into `scratch`.
  const Value* resolve_ref(const Expr& e, Value& scratch) {
    switch (e.kind) {
      case ExprKind::identifier:
        return env.lookup(e.name);
      case ExprKind::member: {
        const Value* base = resolve_ref(*e.operands[0], scratch);
        if (err || !base || !base->is_map()) return nullptr;
        auto it = base->as_map().find(e.name);
        return it == base->as_map().end() ? nullptr : &it->second;
      }
      case ExprKind::index: {
        const Value* base = resolve_ref(*e.operands[0], scratch);
        if (err) return nullptr;
        Value key = eval(*e.operands[1]);
        if (err || !base) return nullptr;
        if (base->is_list()) {
          if (!key.is_number()) {
            fail(ErrorCode::type_mismatch, "list index must be a number, got " + to_string(key.type()));
            return nullptr;
          }
          const double d = key.as_number();
          if (!is_integral(d) || d < 0 || d >= static_cast<double>(base->as_list().size())) return nullptr;
          return &base->as_list()[static_cast<std::size_t>(d)];
        }
        if (base->is_map()) {
          if (!key.is_string()) {
            fail(ErrorCode::type_mismatch, "map key must be a string, got " + to_string(key.type()));
            return nullptr;
          }
          auto it = base->as_map().find(key.as_string());
          return it == base->as_map().end() ? nullptr : &it->second;
        }
        return nullptr;
      }
      default:
        scratch = eval(e);
        return err ? nullptr : &scratch;
    }
  }

  Value eval(const Expr& e) {
    if (err) return {};
    switch (e.kind) {
      case ExprKind::literal:
        return e.literal;
      case ExprKind::identifier:
      case ExprKind::member:
      case ExprKind::index: {
        Value scratch;
        const Value* v = resolve_ref(e, scratch);
        if (err || !v) return {};
        return *v;
      }
      case ExprKind::call:
        return eval_call(e);
      case ExprKind::unary:
        return eval_unary(e);
      case ExprKind::binary:
        return eval_binary(e);
      case ExprKind::list: {
        List out;
        out.reserve(e.operands.size());
        for (const auto& item : e.operands) {
          out.push_back(eval(*item));
          if (err) return {};
        }
        return Value{std::move(out)};
      }
      case ExprKind::map: {
        Map out;
        for (std::size_t i = 0; i < e.operands.size(); ++i) {
          out[e.keys[i]] = eval(*e.operands[i]);
          if (err) return {};
        }
        return Value{std::move(out)};
      }
      case ExprKind::interpolation: {
        std::string out;
        for (const auto& part : e.operands) {
          Value v = eval(*part);
          if (err) return {};
          out += to_display_string(v);
        }
        return Value{std::move(out)};
      }
    }
    fail(ErrorCode::internal_error, "unknown expression node");
    return {};
  }

  Value eval_call(const Expr& e) {
    const Builtin* fn = functions.find(e.name);
    if (!fn) {
      fail(ErrorCode::unknown_function, "unknown function '" + e.name + "'");
      return {};
    }
    const std::size_t n = e.operands.size();
    if (n < fn->min_arity || (fn->max_arity != Builtin::kVariadic && n > fn->max_arity)) {
      fail(ErrorCode::invalid_argument,
           e.name + "() takes " + std::to_string(fn->min_arity) +
               (fn->max_arity == fn->min_arity ? "" : "+") + " argument(s), got " + std::to_string(n));
      return {};
    }
    List args;
    args.reserve(n);
    for (const auto& a : e.operands) {
      args.push_back(eval(*a));
      if (err) return {};
    }
    std::optional<Error> call_err;
    Value out = fn->fn(args, &call_err);
    if (call_err) {
      err = std::move(call_err);
      return {};
    }
    if (out.is_number()) return finite(out.as_number(), e.name + "()");
    return out;
  }

  Value eval_unary(const Expr& e) {
    Value v = eval(*e.operands[0]);
    if (err) return {};
    if (e.unary_op == UnaryOp::logical_not) {
      if (!v.is_bool()) {
        fail(ErrorCode::type_mismatch, "operator ! needs a boolean, got " + to_string(v.type()));
        return {};
      }
      return Value{!v.as_bool()};
    }
    if (!v.is_number()) {
      fail(ErrorCode::type_mismatch, "unary - needs a number, got " + to_string(v.type()));
      return {};
    }
    return Value{-v.as_number()};
  }

  Value mismatch(BinaryOp op, const Value& a, const Value& b) {
    fail(ErrorCode::type_mismatch, "operator " + to_string(op) + " cannot combine " +
                                       to_string(a.type()) + " and " + to_string(b.type()));
    return {};
  }

  Value eval_logical(const Expr& e) {
    const bool is_and = e.binary_op == BinaryOp::logical_and;
    Value lhs = eval(*e.operands[0]);
    if (err) return {};
    if (!lhs.is_bool()) {
      fail(ErrorCode::type_mismatch, "operator " + to_string(e.binary_op) +
                                         " needs booleans, got " + to_string(lhs.type()));
      return {};
    }
    // Short circuit: the right operand is never evaluated when the left
    // operand decides the result.
    if (is_and && !lhs.as_bool()) return Value{false};
    if (!is_and && lhs.as_bool()) return Value{true};
    Value rhs = eval(*e.operands[1]);
    if (err) return {};
    if (!rhs.is_bool()) {
      fail(ErrorCode::type_mismatch, "operator " + to_string(e.binary_op) +
                                         " needs booleans, got " + to_string(rhs.type()));
      return {};
    }
    return Value{rhs.as_bool()};
  }

  Value eval_binary(const Expr& e) {
    if (e.binary_op == BinaryOp::logical_and || e.binary_op == BinaryOp::logical_or) {
      return eval_logical(e);
    }
    Value a = eval(*e.operands[0]);
    if (err) return {};
    Value b = eval(*e.operands[1]);
    if (err) return {};

    switch (e.binary_op) {
      case BinaryOp::eq: return Value{a == b};
      case BinaryOp::ne: return Value{a != b};
      case BinaryOp::add:
        if (a.is_number() && b.is_number()) return finite(a.as_number() + b.as_number(), "operator +");
        if (a.is_string() || b.is_string()) return Value{to_display_string(a) + to_display_string(b)};
        if (a.is_list() && b.is_list()) {
          List out = a.as_list();
          out.insert(out.end(), b.as_list().begin(), b.as_list().end());
          return Value{std::move(out)};
        }
        return mismatch(e.binary_op, a, b);
      case BinaryOp::sub:
      case BinaryOp::mul:
      case BinaryOp::div: {
        if (!a.is_number() || !b.is_number()) return mismatch(e.binary_op, a, b);
        const double x = a.as_number();
        const double y = b.as_number();
        if (e.binary_op == BinaryOp::sub) return finite(x - y, "operator -");
        if (e.binary_op == BinaryOp::mul) return finite(x * y, "operator *");
        if (y == 0.0) {
          fail(ErrorCode::division_by_zero, "division by zero");
          return {};
        }
        return finite(x / y, "operator /");
      }
      case BinaryOp::lt:
      case BinaryOp::gt:
      case BinaryOp::le:
      case BinaryOp::ge: {
        int cmp = 0;
        if (a.is_number() && b.is_number()) {
          cmp = a.as_number() < b.as_number() ? -1 : (a.as_number() > b.as_number() ? 1 : 0);
        } else if (a.is_string() && b.is_string()) {
          const int c = a.as_string().compare(b.as_string());
          cmp = c < 0 ? -1 : (c > 0 ? 1 : 0);
        } else {
          return mismatch(e.binary_op, a, b);
        }
        switch (e.binary_op) {
          case BinaryOp::lt: return Value{cmp < 0};
          case BinaryOp::gt: return Value{cmp > 0};
          case BinaryOp::le: return Value{cmp <= 0};
          default:           return Value{cmp >= 0};
        }
      }
      default:
        break;
    }
    fail(ErrorCode::internal_error, "unhandled operator " + to_string(e.binary_op));
    return {};
  }
};

}  // namespace

const Value* MapEnvironment::lookup(const std::string& name) const {
  auto it = bindings_.find(name);
  return it == bindings_.end() ? nullptr : &it->second;
}

Value evaluate(const Expr& expr, const Environment& env, const FunctionRegistry& functions,
               std::optional<Error>* error) {
  Evaluator ev{env, functions};
  Value out = ev.eval(expr);
  if (error) *error = ev.err;
  if (ev.err) return {};
  return out;
}

Value evaluate_source(const std::string& source, const Environment& env,
                      const FunctionRegistry& functions, std::optional<Error>* error,
                      const ParseOptions& options) {
  std::optional<ParseError> perr;
  ExprPtr root = parse_expression(source, options, &perr);
  if (perr) {
    if (error) {
      *error = make_error(ErrorCode::parse_error,
                          perr->message + " at offset " + std::to_string(perr->offset));
    }
    return {};
  }
  return evaluate(*root, env, functions, error);
}

}  // namespace applogic
