#include "applogic/functions.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace applogic {

namespace {

Value fail(std::optional<Error>* error, ErrorCode code, std::string message) {
  *error = make_error(code, std::move(message));
  return {};
}

bool need_number(const std::string& fn, const Value& v, std::optional<Error>* error) {
  if (v.is_number()) return true;
  fail(error, ErrorCode::type_mismatch, fn + "() needs a number, got " + to_string(v.type()));
  return false;
}

Value fn_len(const List& args, std::optional<Error>* error) {
  const Value& v = args[0];
  if (v.is_null()) return Value{0};
  if (v.is_string()) {
    // Code points, matching the param length bounds.
    std::size_t n = 0;
    for (unsigned char c : v.as_string()) {
      if ((c & 0xC0) != 0x80) ++n;
    }
    return Value{n};
  }
  if (v.is_list()) return Value{v.as_list().size()};
  if (v.is_map()) return Value{v.as_map().size()};
  return fail(error, ErrorCode::type_mismatch, "len() needs a string, list, map or null, got " + to_string(v.type()));
}

Value fn_contains(const List& args, std::optional<Error>* error) {
  const Value& c = args[0];
  const Value& x = args[1];
  if (c.is_list()) {
    const List& l = c.as_list();
    return Value{std::find(l.begin(), l.end(), x) != l.end()};
  }
  if (c.is_string()) {
    if (!x.is_string()) {
      return fail(error, ErrorCode::type_mismatch, "contains() on a string needs a string needle");
    }
    return Value{c.as_string().find(x.as_string()) != std::string::npos};
  }
  if (c.is_map()) {
    if (!x.is_string()) return fail(error, ErrorCode::type_mismatch, "contains() on a map needs a string key");
    return Value{c.as_map().contains(x.as_string())};
  }
  if (c.is_null()) return Value{false};
  return fail(error, ErrorCode::type_mismatch, "contains() needs a list, string or map, got " + to_string(c.type()));
}

Value change_case(const List& args, std::optional<Error>* error, bool upper) {
  if (!args[0].is_string()) {
    return fail(error, ErrorCode::type_mismatch,
                std::string(upper ? "upper" : "lower") + "() needs a string, got " + to_string(args[0].type()));
  }
  std::string s = args[0].as_string();
  for (char& ch : s) {
    const auto uc = static_cast<unsigned char>(ch);
    ch = static_cast<char>(upper ? std::toupper(uc) : std::tolower(uc));
  }
  return Value{std::move(s)};
}

Value fn_num(const List& args, std::optional<Error>* error) {
  const Value& v = args[0];
  if (v.is_number()) return v;
  if (v.is_bool()) return Value{v.as_bool() ? 1.0 : 0.0};
  if (v.is_string()) {
    const std::string& s = v.as_string();
    char* end = nullptr;
    const double d = std::strtod(s.c_str(), &end);
    if (!s.empty() && end == s.c_str() + s.size() && std::isfinite(d)) return Value{d};
    return fail(error, ErrorCode::invalid_argument, "num() cannot parse '" + s + "'");
  }
  return fail(error, ErrorCode::type_mismatch, "num() cannot convert " + to_string(v.type()));
}

Value fn_round(const List& args, std::optional<Error>* error) {
  if (!need_number("round", args[0], error)) return {};
  double digits = 0.0;
  if (args.size() > 1) {
    if (!need_number("round", args[1], error)) return {};
    digits = args[1].as_number();
    if (!is_integral(digits) || digits < 0 || digits > 15) {
      return fail(error, ErrorCode::invalid_argument, "round() digits must be an integer in [0, 15]");
    }
  }
  // Halves round to even. The default FE_TONEAREST mode is never changed here.
  const double scale = std::pow(10.0, digits);
  const double scaled = args[0].as_number() * scale;
  if (!std::isfinite(scaled)) return args[0];
  return Value{std::nearbyint(scaled) / scale};
}

Value unary_math(const char* name, double (*op)(double), const List& args, std::optional<Error>* error) {
  if (!need_number(name, args[0], error)) return {};
  return Value{op(args[0].as_number())};
}

Value extremum(const char* name, bool want_max, const List& args, std::optional<Error>* error) {
  const List& items = (args.size() == 1 && args[0].is_list()) ? args[0].as_list() : args;
  if (items.empty()) return fail(error, ErrorCode::invalid_argument, std::string(name) + "() of an empty list");
  double best = 0.0;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (!need_number(name, items[i], error)) return {};
    const double d = items[i].as_number();
    if (i == 0 || (want_max ? d > best : d < best)) best = d;
  }
  return Value{best};
}

}  // namespace

const std::vector<std::string>& builtin_function_names() {
  static const std::vector<std::string> kNames = {
    "len", "contains", "lower", "upper", "str", "num", "bool",
    "round", "abs", "floor", "ceil", "min", "max",
  };
  return kNames;
}

FunctionRegistry FunctionRegistry::with_builtins() {
  FunctionRegistry r;
  r.register_function("len", fn_len, 1, 1);
  r.register_function("contains", fn_contains, 2, 2);
  r.register_function("lower", [](const List& a, std::optional<Error>* e) { return change_case(a, e, false); }, 1, 1);
  r.register_function("upper", [](const List& a, std::optional<Error>* e) { return change_case(a, e, true); }, 1, 1);
  r.register_function("str", [](const List& a, std::optional<Error>*) { return Value{to_display_string(a[0])}; }, 1, 1);
  r.register_function("num", fn_num, 1, 1);
  r.register_function("bool", [](const List& a, std::optional<Error>*) { return Value{truthy(a[0])}; }, 1, 1);
  r.register_function("round", fn_round, 1, 2);
  r.register_function("abs", [](const List& a, std::optional<Error>* e) {
    return unary_math("abs", [](double d) { return std::fabs(d); }, a, e);
  }, 1, 1);
  r.register_function("floor", [](const List& a, std::optional<Error>* e) {
    return unary_math("floor", [](double d) { return std::floor(d); }, a, e);
  }, 1, 1);
  r.register_function("ceil", [](const List& a, std::optional<Error>* e) {
    return unary_math("ceil", [](double d) { return std::ceil(d); }, a, e);
  }, 1, 1);
  r.register_function("min", [](const List& a, std::optional<Error>* e) { return extremum("min", false, a, e); },
                      1, Builtin::kVariadic);
  r.register_function("max", [](const List& a, std::optional<Error>* e) { return extremum("max", true, a, e); },
                      1, Builtin::kVariadic);
  return r;
}

void FunctionRegistry::register_function(const std::string& name, BuiltinFn fn, std::size_t min_arity,
                                         std::size_t max_arity) {
  functions_[name] = Builtin{std::move(fn), min_arity, max_arity};
}

const Builtin* FunctionRegistry::find(const std::string& name) const {
  auto it = functions_.find(name);
  return it == functions_.end() ? nullptr : &it->second;
}

std::vector<std::string> FunctionRegistry::names() const {
  std::vector<std::string> out;
  out.reserve(functions_.size());
  for (const auto& [name, _] : functions_) out.push_back(name);
  return out;
}

std::vector<std::string> FunctionRegistry::restrict_to(const std::vector<std::string>& allowed) {
  std::vector<std::string> missing;
  for (const auto& name : allowed) {
    if (!functions_.contains(name)) missing.push_back(name);
  }
  for (auto it = functions_.begin(); it != functions_.end();) {
    if (std::find(allowed.begin(), allowed.end(), it->first) == allowed.end()) {
      it = functions_.erase(it);
    } else {
      ++it;
    }
  }
  return missing;
}

}  // namespace applogic
