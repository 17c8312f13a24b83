#include "applogic/definition.hpp"

// Definition loading runs in two passes:
//
//   1. Reader      JSON Value -> AppDefinition. Shape and type checks, alias
//                  spellings, defaults, and one parse per expression. Stops at
//                  the first problem (definition_error / parse_error).
//   2. Validator   AppDefinition -> ok | error. Cross-references: every
//                  identifier an expression reads must name a param, a state
//                  field, a config key or a loop binding visible at that block.
//
// Error messages name the location with a JSON-ish path such as
// `actions.transfer.logic[1].then[0].target` so authors can find the block.

#include <algorithm>
#include <cctype>
#include <regex>
#include <set>

#include "applogic/jsonlite.hpp"
#include "applogic/version.hpp"

namespace applogic {

namespace {

const char* const kReservedRoots[] = {"params", "agent", "agents", "shared", "config"};
const char* const kKeywords[] = {"true", "false", "null"};

bool is_identifier(const std::string& s) {
  if (s.empty()) return false;
  if (!(std::isalpha(static_cast<unsigned char>(s[0])) || s[0] == '_')) return false;
  for (char c : s) {
    if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) return false;
  }
  for (const char* kw : kKeywords) {
    if (s == kw) return false;
  }
  return true;
}

std::optional<AppCategory> category_from_string(const std::string& s) {
  if (s == "payment")       return AppCategory::payment;
  if (s == "shopping")      return AppCategory::shopping;
  if (s == "communication") return AppCategory::communication;
  if (s == "calendar")      return AppCategory::calendar;
  if (s == "social")        return AppCategory::social;
  if (s == "custom")        return AppCategory::custom;
  return std::nullopt;
}

std::optional<AccessType> access_from_string(const std::string& s) {
  if (s == "shared")          return AccessType::shared;
  if (s == "role_restricted") return AccessType::role_restricted;
  if (s == "per_agent")       return AccessType::per_agent;
  return std::nullopt;
}

std::optional<FieldType> field_type_from_string(const std::string& s) {
  if (s == "string")                  return FieldType::string;
  if (s == "number")                  return FieldType::number;
  if (s == "boolean")                 return FieldType::boolean;
  if (s == "array" || s == "list")    return FieldType::array;
  if (s == "object" || s == "map")    return FieldType::object;
  if (s == "any")                     return FieldType::any;
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// Pass 1: Reader
// ---------------------------------------------------------------------------

struct Reader {
  const ParseOptions& options;
  std::optional<Error> err;

  void fail(const std::string& where, const std::string& msg) {
    if (!err) err = make_error(ErrorCode::definition_error, where + ": " + msg);
  }

  static const Value* field(const Map& m, const char* key, const char* alias = nullptr) {
    auto it = m.find(key);
    if (it != m.end()) return &it->second;
    if (alias) {
      it = m.find(alias);
      if (it != m.end()) return &it->second;
    }
    return nullptr;
  }

  const Map* as_object(const Value& v, const std::string& where) {
    if (!v.is_map()) { fail(where, "expected an object"); return nullptr; }
    return &v.as_map();
  }

  std::string req_string(const Map& m, const char* key, const std::string& where, const char* alias = nullptr) {
    const Value* v = field(m, key, alias);
    if (!v || !v->is_string()) { fail(where + "." + key, "required string"); return {}; }
    return v->as_string();
  }

  std::string opt_string(const Map& m, const char* key, const std::string& where, const std::string& def = "",
                         const char* alias = nullptr) {
    const Value* v = field(m, key, alias);
    if (!v || v->is_null()) return def;
    if (!v->is_string()) { fail(where + "." + key, "expected a string"); return def; }
    return v->as_string();
  }

  bool opt_bool(const Map& m, const char* key, const std::string& where, bool def, const char* alias = nullptr) {
    const Value* v = field(m, key, alias);
    if (!v || v->is_null()) return def;
    if (!v->is_bool()) { fail(where + "." + key, "expected a boolean"); return def; }
    return v->as_bool();
  }

  std::optional<double> opt_number(const Map& m, const char* key, const std::string& where,
                                   const char* alias = nullptr) {
    const Value* v = field(m, key, alias);
    if (!v || v->is_null()) return std::nullopt;
    if (!v->is_number()) { fail(where + "." + key, "expected a number"); return std::nullopt; }
    return v->as_number();
  }

  std::optional<std::size_t> opt_count(const Map& m, const char* key, const std::string& where,
                                        const char* alias = nullptr) {
    auto d = opt_number(m, key, where, alias);
    if (!d) return std::nullopt;
    if (!is_integral(*d) || *d < 0) { fail(where + "." + key, "expected a non-negative integer"); return std::nullopt; }
    return static_cast<std::size_t>(*d);
  }

  std::optional<Value> opt_value(const Map& m, const char* key) {
    const Value* v = field(m, key);
    if (!v) return std::nullopt;
    return *v;
  }

  FieldType field_type(const Map& m, const std::string& where, FieldType def, bool required) {
    const Value* v = field(m, "type");
    if (!v) {
      if (required) fail(where + ".type", "required string");
      return def;
    }
    if (!v->is_string()) { fail(where + ".type", "expected a string"); return def; }
    auto t = field_type_from_string(v->as_string());
    if (!t) { fail(where + ".type", "unknown type '" + v->as_string() + "'"); return def; }
    return *t;
  }

  void parse_failed(const std::string& where, const ParseError& pe) {
    if (!err) {
      err = make_error(ErrorCode::parse_error,
                       where + ": " + pe.message + " at offset " + std::to_string(pe.offset));
    }
  }

  Expression expr(const Value* v, const std::string& where) {
    if (!v || !v->is_string()) { fail(where, "required expression string"); return {}; }
    std::optional<ParseError> pe;
    ExprPtr root = parse_expression(v->as_string(), options, &pe);
    if (pe) { parse_failed(where, *pe); return {}; }
    return Expression{*v, std::move(root)};
  }

  Expression templ(const Value* v, const std::string& where) {
    if (!v || !v->is_string()) { fail(where, "required message string"); return {}; }
    std::optional<ParseError> pe;
    ExprPtr root = parse_template(v->as_string(), options, &pe);
    if (pe) { parse_failed(where, *pe); return {}; }
    return Expression{*v, std::move(root)};
  }

  ExprPtr spec_node(const Value& v, const std::string& where) {
    if (err) return nullptr;
    if (v.is_string()) {
      std::optional<ParseError> pe;
      ExprPtr root = parse_expression(v.as_string(), options, &pe);
      if (pe) { parse_failed(where, *pe); return nullptr; }
      return root;
    }
    auto node = std::make_shared<Expr>();
    if (v.is_list()) {
      node->kind = ExprKind::list;
      const List& l = v.as_list();
      for (std::size_t i = 0; i < l.size(); ++i) {
        node->operands.push_back(spec_node(l[i], where + "[" + std::to_string(i) + "]"));
        if (err) return nullptr;
      }
      return node;
    }
    if (v.is_map()) {
      node->kind = ExprKind::map;
      for (const auto& [k, item] : v.as_map()) {
        node->keys.push_back(k);
        node->operands.push_back(spec_node(item, where + "." + k));
        if (err) return nullptr;
      }
      return node;
    }
    node->kind = ExprKind::literal;
    node->literal = v;
    return node;
  }

  Expression value_spec(const Value& v, const std::string& where) {
    ExprPtr root = spec_node(v, where);
    if (err) return {};
    return Expression{v, std::move(root)};
  }

  BlockList blocks(const Value* v, const std::string& where) {
    BlockList out;
    if (!v || v->is_null()) return out;
    if (!v->is_list()) { fail(where, "expected a list of blocks"); return out; }
    const List& l = v->as_list();
    for (std::size_t i = 0; i < l.size() && !err; ++i) {
      out.push_back(block(l[i], where + "[" + std::to_string(i) + "]"));
    }
    return out;
  }

  LogicBlock block(const Value& v, const std::string& where) {
    const Map* m = as_object(v, where);
    if (!m) return {};
    const std::string type = req_string(*m, "type", where);
    if (err) return {};

    if (type == "validate") {
      ValidateBlock b;
      b.condition = expr(field(*m, "condition"), where + ".condition");
      const Value* msg = field(*m, "error_message", "errorMessage");
      const Value fallback{"Validation failed"};
      b.error_message = templ(msg ? msg : &fallback, where + ".error_message");
      b.error_code = opt_string(*m, "error_code", where, "validation_failed", "errorCode");
      return LogicBlock{std::move(b)};
    }
    if (type == "update") {
      UpdateBlock b;
      b.target = expr(field(*m, "target"), where + ".target");
      const std::string op = req_string(*m, "operation", where);
      if (err) return {};
      auto parsed = update_op_from_string(op);
      if (!parsed) { fail(where + ".operation", "unknown operation '" + op + "'"); return {}; }
      b.operation = *parsed;
      const Value* val = field(*m, "value");
      if (!val) { fail(where + ".value", "required"); return {}; }
      b.value = value_spec(*val, where + ".value");
      return LogicBlock{std::move(b)};
    }
    if (type == "notify") {
      NotifyBlock b;
      const Value* to = field(*m, "to");
      if (to && !to->is_null()) b.to = expr(to, where + ".to");
      b.message = templ(field(*m, "message"), where + ".message");
      const Value* data = field(*m, "data");
      if (data && !data->is_null()) b.data = value_spec(*data, where + ".data");
      return LogicBlock{std::move(b)};
    }
    if (type == "return") {
      ReturnBlock b;
      const Value* val = field(*m, "value");
      if (val) b.value = value_spec(*val, where + ".value");
      return LogicBlock{std::move(b)};
    }
    if (type == "error") {
      ErrorBlock b;
      b.message = templ(field(*m, "message"), where + ".message");
      b.code = opt_string(*m, "code", where, "action_error", "error_code");
      return LogicBlock{std::move(b)};
    }
    if (type == "branch") {
      BranchBlock b;
      b.condition = expr(field(*m, "condition"), where + ".condition");
      b.then_blocks = blocks(field(*m, "then"), where + ".then");
      b.else_blocks = blocks(field(*m, "else"), where + ".else");
      return LogicBlock{std::move(b)};
    }
    if (type == "loop") {
      LoopBlock b;
      b.iterable = expr(field(*m, "iterable", "collection"), where + ".iterable");
      b.binding = opt_string(*m, "binding", where, "item", "item");
      b.body = blocks(field(*m, "body"), where + ".body");
      return LogicBlock{std::move(b)};
    }
    fail(where + ".type", "unknown block type '" + type + "'");
    return {};
  }

  std::vector<Value> choices(const Map& m, const char* key, const std::string& where) {
    std::vector<Value> out;
    const Value* v = field(m, key);
    if (!v || v->is_null()) return out;
    if (!v->is_list()) { fail(where + "." + key, "expected a list"); return out; }
    return v->as_list();
  }

  ParamSpec param(const Value& v, const std::string& where, const std::string& name_hint) {
    ParamSpec p;
    const Map* m = as_object(v, where);
    if (!m) return p;
    p.name = name_hint.empty() ? req_string(*m, "name", where) : opt_string(*m, "name", where, name_hint);
    if (!name_hint.empty() && p.name != name_hint) fail(where + ".name", "does not match key '" + name_hint + "'");
    p.type = field_type(*m, where, FieldType::string, true);
    p.description = opt_string(*m, "description", where);
    p.required = opt_bool(*m, "required", where, false);
    p.default_value = opt_value(*m, "default");
    if (p.default_value && p.default_value->is_null()) p.default_value.reset();
    p.min_value = opt_number(*m, "min_value", where, "minValue");
    p.max_value = opt_number(*m, "max_value", where, "maxValue");
    p.min_length = opt_count(*m, "min_length", where, "minLength");
    p.max_length = opt_count(*m, "max_length", where, "maxLength");
    const Value* pat = field(*m, "pattern");
    if (pat && !pat->is_null()) {
      if (!pat->is_string()) fail(where + ".pattern", "expected a string");
      else p.pattern = pat->as_string();
    }
    p.choices = choices(*m, "enum", where);
    return p;
  }

  std::vector<ParamSpec> params(const Map& action, const std::string& where) {
    std::vector<ParamSpec> out;
    if (const Value* v = field(action, "params")) {
      if (!v->is_list()) { fail(where + ".params", "expected a list"); return out; }
      const List& l = v->as_list();
      for (std::size_t i = 0; i < l.size() && !err; ++i) {
        out.push_back(param(l[i], where + ".params[" + std::to_string(i) + "]", ""));
      }
      return out;
    }
    if (const Value* v = field(action, "parameters")) {
      if (!v->is_map()) { fail(where + ".parameters", "expected an object"); return out; }
      for (const auto& [k, item] : v->as_map()) {
        if (err) break;
        out.push_back(param(item, where + ".parameters." + k, k));
      }
    }
    return out;
  }

  ActionDefinition action(const Value& v, const std::string& where, const std::string& name_hint) {
    ActionDefinition a;
    const Map* m = as_object(v, where);
    if (!m) return a;
    a.name = name_hint.empty() ? req_string(*m, "name", where) : opt_string(*m, "name", where, name_hint);
    if (!name_hint.empty() && a.name != name_hint) fail(where + ".name", "does not match key '" + name_hint + "'");
    a.description = opt_string(*m, "description", where);
    const std::string tool = opt_string(*m, "tool_type", where, "write", "toolType");
    if (tool == "read") a.tool_type = ToolType::read;
    else if (tool == "write") a.tool_type = ToolType::write;
    else fail(where + ".tool_type", "unknown tool type '" + tool + "'");
    a.params = params(*m, where);
    a.logic = blocks(field(*m, "logic"), where + ".logic");
    if (const Value* r = field(*m, "returns")) a.returns = *r;
    return a;
  }

  StateField state_field(const Value& v, const std::string& where) {
    StateField f;
    const Map* m = as_object(v, where);
    if (!m) return f;
    f.name = req_string(*m, "name", where);
    f.type = field_type(*m, where, FieldType::any, true);
    f.default_value = opt_value(*m, "default");
    if (f.default_value && f.default_value->is_null()) f.default_value.reset();
    f.per_agent = opt_bool(*m, "per_agent", where, true, "perAgent");
    f.description = opt_string(*m, "description", where);
    f.observable = opt_bool(*m, "observable", where, true);
    return f;
  }

  ConfigField config_field(const Value& v, const std::string& where) {
    ConfigField f;
    const Map* m = as_object(v, where);
    if (!m) return f;
    f.name = req_string(*m, "name", where);
    f.label = opt_string(*m, "label", where, f.name);
    f.type = opt_string(*m, "type", where, "string");
    if (f.type != "string" && f.type != "number" && f.type != "boolean" && f.type != "select") {
      fail(where + ".type", "unknown config type '" + f.type + "'");
    }
    f.default_value = opt_value(*m, "default");
    if (f.default_value && f.default_value->is_null()) f.default_value.reset();
    f.required = opt_bool(*m, "required", where, false);
    f.min_value = opt_number(*m, "min", where, "min_value");
    f.max_value = opt_number(*m, "max", where, "max_value");
    f.description = opt_string(*m, "description", where);
    f.options = choices(*m, "options", where);
    return f;
  }

  std::vector<std::string> string_list(const Map& m, const char* key, const std::string& where,
                                       const char* alias = nullptr) {
    std::vector<std::string> out;
    const Value* v = field(m, key, alias);
    if (!v || v->is_null()) return out;
    if (!v->is_list()) { fail(where + "." + key, "expected a list of strings"); return out; }
    for (const auto& item : v->as_list()) {
      if (!item.is_string()) { fail(where + "." + key, "expected a list of strings"); break; }
      out.push_back(item.as_string());
    }
    return out;
  }

  AppDefinition app(const Value& v) {
    AppDefinition d;
    const Map* m = as_object(v, "definition");
    if (!m) return d;

    if (auto fv = opt_number(*m, "format_version", "definition", "formatVersion")) {
      if (!is_integral(*fv) || *fv < 0) {
        fail("format_version", "expected a positive integer");
        return d;
      }
      d.format_version = static_cast<uint32_t>(*fv);
    }

    d.app_id = req_string(*m, "app_id", "definition", "appId");
    d.name = req_string(*m, "name", "definition");
    d.description = opt_string(*m, "description", "definition");
    const std::string cat = opt_string(*m, "category", "definition", "custom");
    if (auto c = category_from_string(cat)) d.category = *c;
    else fail("category", "unknown category '" + cat + "'");
    d.version = opt_string(*m, "version", "definition", "1.0");
    d.icon = opt_string(*m, "icon", "definition");
    const std::string access = opt_string(*m, "access_type", "definition", "shared", "accessType");
    if (auto a = access_from_string(access)) d.access_type = *a;
    else fail("access_type", "unknown access type '" + access + "'");
    d.allowed_roles = string_list(*m, "allowed_roles", "definition", "allowedRoles");
    if (err) return d;

    if (const Value* s = field(*m, "state_schema", "stateSchema")) {
      if (!s->is_list()) { fail("state_schema", "expected a list"); return d; }
      const List& l = s->as_list();
      for (std::size_t i = 0; i < l.size() && !err; ++i) {
        d.state_schema.push_back(state_field(l[i], "state_schema[" + std::to_string(i) + "]"));
      }
    }
    if (const Value* c = field(*m, "config_schema", "configSchema")) {
      if (!c->is_list()) { fail("config_schema", "expected a list"); return d; }
      const List& l = c->as_list();
      for (std::size_t i = 0; i < l.size() && !err; ++i) {
        d.config_schema.push_back(config_field(l[i], "config_schema[" + std::to_string(i) + "]"));
      }
    }
    if (const Value* ic = field(*m, "initial_config", "initialConfig")) {
      if (!ic->is_map() && !ic->is_null()) { fail("initial_config", "expected an object"); return d; }
      if (ic->is_map()) d.initial_config = ic->as_map();
    }

    const Value* acts = field(*m, "actions");
    if (acts && acts->is_list()) {
      const List& l = acts->as_list();
      for (std::size_t i = 0; i < l.size() && !err; ++i) {
        ActionDefinition a = action(l[i], "actions[" + std::to_string(i) + "]", "");
        if (err) break;
        if (d.actions.contains(a.name)) { fail("actions", "duplicate action '" + a.name + "'"); break; }
        d.actions.emplace(a.name, std::move(a));
      }
    } else if (acts && acts->is_map()) {
      for (const auto& [k, item] : acts->as_map()) {
        if (err) break;
        ActionDefinition a = action(item, "actions." + k, k);
        d.actions.emplace(k, std::move(a));
      }
    } else if (acts && !acts->is_null()) {
      fail("actions", "expected a list or an object");
    }
    return d;
  }
};

// ---------------------------------------------------------------------------
// Pass 2: Validator
// ---------------------------------------------------------------------------

struct Validator {
  const AppDefinition& def;
  std::set<std::string> agent_fields;
  std::set<std::string> shared_fields;
  std::set<std::string> config_keys;
  std::optional<Error> err;

  void fail(const std::string& where, const std::string& msg) {
    if (!err) err = make_error(ErrorCode::definition_error, where + ": " + msg);
  }

  bool is_binding(const std::vector<std::string>& bindings, const std::string& name) const {
    return std::find(bindings.begin(), bindings.end(), name) != bindings.end();
  }

  bool is_bare_name(const ActionDefinition& action, const std::string& name) const {
    return action.find_param(name) || agent_fields.contains(name) || shared_fields.contains(name);
  }

  void check_reference(const Reference& r, const ActionDefinition& action,
                       const std::vector<std::string>& bindings, const std::string& where) {
    const std::string at = where + " (offset " + std::to_string(r.offset) + ")";
    if (is_binding(bindings, r.root)) return;
    if (r.root == "params") {
      if (r.member && !action.find_param(*r.member)) fail(at, "unknown param '" + *r.member + "'");
      return;
    }
    if (r.root == "agent") {
      if (r.member && *r.member != "id" && !agent_fields.contains(*r.member)) {
        fail(at, "unknown per-agent field '" + *r.member + "'");
      }
      return;
    }
    if (r.root == "agents") {
      if (r.member && !r.indexed) fail(at, "agents must be indexed by agent id, as in agents[id]." + *r.member);
      else if (r.member && !agent_fields.contains(*r.member)) fail(at, "unknown per-agent field '" + *r.member + "'");
      return;
    }
    if (r.root == "shared") {
      if (r.member && !shared_fields.contains(*r.member)) fail(at, "unknown shared field '" + *r.member + "'");
      return;
    }
    if (r.root == "config") {
      if (r.member && !config_keys.contains(*r.member)) fail(at, "unknown config key '" + *r.member + "'");
      return;
    }
    if (!is_bare_name(action, r.root)) fail(at, "unknown name '" + r.root + "'");
  }

  void check_expr(const Expression& e, const ActionDefinition& action,
                  const std::vector<std::string>& bindings, const std::string& where) {
    if (!e.root || err) return;
    for (const auto& r : collect_references(*e.root)) {
      check_reference(r, action, bindings, where);
      if (err) return;
    }
  }

  void check_target(const UpdateBlock& b, const ActionDefinition& action,
                    const std::vector<std::string>& bindings, const std::string& where) {
    std::string root;
    std::vector<ChainStep> steps;
    if (!b.target.root || !decompose_chain(*b.target.root, &root, &steps)) {
      fail(where, "update target must be a path such as agent.field, agents[id].field or shared.field");
      return;
    }
    auto first_key = [&](std::size_t i) -> const std::string* {
      if (i >= steps.size() || steps[i].index) return nullptr;
      return &steps[i].key;
    };
    if (root == "agent") {
      const std::string* k = first_key(0);
      if (!k) fail(where, "update target agent.<field> must name a field");
      else if (!agent_fields.contains(*k)) fail(where, "unknown per-agent field '" + *k + "'");
    } else if (root == "agents") {
      const std::string* k = first_key(1);
      if (steps.empty() || !steps[0].index || !k) fail(where, "update target must look like agents[id].field");
      else if (!agent_fields.contains(*k)) fail(where, "unknown per-agent field '" + *k + "'");
    } else if (root == "shared") {
      const std::string* k = first_key(0);
      if (!k) fail(where, "update target shared.<field> must name a field");
      else if (!shared_fields.contains(*k)) fail(where, "unknown shared field '" + *k + "'");
    } else if (is_binding(bindings, root) || action.find_param(root) || is_reserved_name(root)) {
      fail(where, "'" + root + "' is not writable; update targets live in agent, agents[id] or shared");
    } else if (!agent_fields.contains(root) && !shared_fields.contains(root)) {
      fail(where, "unknown state field '" + root + "'");
    }
    if (!err) check_expr(b.target, action, bindings, where);
  }

  void check_blocks(const BlockList& blocks, const ActionDefinition& action,
                    std::vector<std::string>& bindings, const std::string& where) {
    for (std::size_t i = 0; i < blocks.size() && !err; ++i) {
      const std::string at = where + "[" + std::to_string(i) + "]";
      std::visit([&](const auto& b) { check_block(b, action, bindings, at); }, blocks[i].node);
    }
  }

  void check_block(const ValidateBlock& b, const ActionDefinition& a, std::vector<std::string>& s,
                   const std::string& at) {
    check_expr(b.condition, a, s, at + ".condition");
    check_expr(b.error_message, a, s, at + ".error_message");
    if (b.error_code.empty()) fail(at + ".error_code", "must not be empty");
  }
  void check_block(const UpdateBlock& b, const ActionDefinition& a, std::vector<std::string>& s,
                   const std::string& at) {
    check_target(b, a, s, at + ".target");
    check_expr(b.value, a, s, at + ".value");
  }
  void check_block(const NotifyBlock& b, const ActionDefinition& a, std::vector<std::string>& s,
                   const std::string& at) {
    if (b.to) check_expr(*b.to, a, s, at + ".to");
    check_expr(b.message, a, s, at + ".message");
    if (b.data) check_expr(*b.data, a, s, at + ".data");
  }
  void check_block(const ReturnBlock& b, const ActionDefinition& a, std::vector<std::string>& s,
                   const std::string& at) {
    if (b.value) check_expr(*b.value, a, s, at + ".value");
  }
  void check_block(const ErrorBlock& b, const ActionDefinition& a, std::vector<std::string>& s,
                   const std::string& at) {
    check_expr(b.message, a, s, at + ".message");
    if (b.code.empty()) fail(at + ".code", "must not be empty");
  }
  void check_block(const BranchBlock& b, const ActionDefinition& a, std::vector<std::string>& s,
                   const std::string& at) {
    check_expr(b.condition, a, s, at + ".condition");
    check_blocks(b.then_blocks, a, s, at + ".then");
    check_blocks(b.else_blocks, a, s, at + ".else");
  }
  void check_block(const LoopBlock& b, const ActionDefinition& a, std::vector<std::string>& s,
                   const std::string& at) {
    check_expr(b.iterable, a, s, at + ".iterable");
    if (!is_identifier(b.binding) || is_reserved_name(b.binding)) {
      fail(at + ".binding", "'" + b.binding + "' is not a usable loop variable name");
      return;
    }
    s.push_back(b.binding);
    check_blocks(b.body, a, s, at + ".body");
    s.pop_back();
  }

  void check_default(const std::optional<Value>& v, FieldType type, const std::string& where) {
    if (v && !value_matches(type, *v)) {
      fail(where + ".default", "default is " + to_string(v->type()) + ", declared " + to_string(type));
    }
  }

  void run() {
    static const std::regex kAppId("^[a-z][a-z0-9_]{1,49}$");
    if (!std::regex_match(def.app_id, kAppId)) {
      fail("app_id", "'" + def.app_id + "' must match ^[a-z][a-z0-9_]{1,49}$");
      return;
    }
    if (def.name.empty()) { fail("name", "must not be empty"); return; }
    if (def.access_type == AccessType::role_restricted && def.allowed_roles.empty()) {
      fail("allowed_roles", "role_restricted apps must list at least one role");
      return;
    }

    for (std::size_t i = 0; i < def.state_schema.size() && !err; ++i) {
      const StateField& f = def.state_schema[i];
      const std::string at = "state_schema[" + std::to_string(i) + "]";
      if (!is_identifier(f.name) || is_reserved_name(f.name)) {
        fail(at + ".name", "'" + f.name + "' is not a usable field name");
      } else if (agent_fields.contains(f.name) || shared_fields.contains(f.name)) {
        fail(at + ".name", "duplicate state field '" + f.name + "'");
      } else if (f.per_agent && f.name == "id") {
        fail(at + ".name", "per-agent field 'id' is reserved for the agent id");
      }
      check_default(f.default_value, f.type, at);
      (f.per_agent ? agent_fields : shared_fields).insert(f.name);
    }

    for (std::size_t i = 0; i < def.config_schema.size() && !err; ++i) {
      const ConfigField& f = def.config_schema[i];
      const std::string at = "config_schema[" + std::to_string(i) + "]";
      if (f.name.empty()) fail(at + ".name", "must not be empty");
      else if (config_keys.contains(f.name)) fail(at + ".name", "duplicate config field '" + f.name + "'");
      config_keys.insert(f.name);
    }
    for (const auto& [k, _] : def.initial_config) config_keys.insert(k);
    if (err) return;

    for (const auto& [name, action] : def.actions) {
      const std::string at = "actions." + name;
      if (!is_identifier(name)) { fail(at, "'" + name + "' is not a valid action name"); return; }
      std::set<std::string> seen;
      for (std::size_t i = 0; i < action.params.size() && !err; ++i) {
        const ParamSpec& p = action.params[i];
        const std::string pat = at + ".params[" + std::to_string(i) + "]";
        if (!is_identifier(p.name) || is_reserved_name(p.name)) {
          fail(pat + ".name", "'" + p.name + "' is not a usable param name");
        } else if (!seen.insert(p.name).second) {
          fail(pat + ".name", "duplicate param '" + p.name + "'");
        }
        check_default(p.default_value, p.type, pat);
        if (p.min_value && p.max_value && *p.min_value > *p.max_value) fail(pat, "min_value > max_value");
        if (p.min_length && p.max_length && *p.min_length > *p.max_length) fail(pat, "min_length > max_length");
        if (p.pattern) {
          try {
            std::regex re(*p.pattern, std::regex::ECMAScript);
          } catch (const std::regex_error& e) {
            fail(pat + ".pattern", std::string("invalid regular expression: ") + e.what());
          }
        }
      }
      std::vector<std::string> bindings;
      check_blocks(action.logic, action, bindings, at + ".logic");
      if (err) return;
    }
  }
};

Value spec_to_value(const Expression& e) { return e.source; }

Value block_to_value(const LogicBlock& block);

Value blocks_to_value(const BlockList& blocks) {
  List out;
  out.reserve(blocks.size());
  for (const auto& b : blocks) out.push_back(block_to_value(b));
  return Value{std::move(out)};
}

struct BlockWriter {
  Map operator()(const ValidateBlock& b) const {
    return Map{{"type", "validate"}, {"condition", spec_to_value(b.condition)},
               {"error_message", spec_to_value(b.error_message)}, {"error_code", b.error_code}};
  }
  Map operator()(const UpdateBlock& b) const {
    return Map{{"type", "update"}, {"target", spec_to_value(b.target)},
               {"operation", to_string(b.operation)}, {"value", spec_to_value(b.value)}};
  }
  Map operator()(const NotifyBlock& b) const {
    Map m{{"type", "notify"}, {"message", spec_to_value(b.message)}};
    if (b.to) m["to"] = spec_to_value(*b.to);
    if (b.data) m["data"] = spec_to_value(*b.data);
    return m;
  }
  Map operator()(const ReturnBlock& b) const {
    Map m{{"type", "return"}};
    if (b.value) m["value"] = spec_to_value(*b.value);
    return m;
  }
  Map operator()(const ErrorBlock& b) const {
    return Map{{"type", "error"}, {"message", spec_to_value(b.message)}, {"code", b.code}};
  }
  Map operator()(const BranchBlock& b) const {
    return Map{{"type", "branch"}, {"condition", spec_to_value(b.condition)},
               {"then", blocks_to_value(b.then_blocks)}, {"else", blocks_to_value(b.else_blocks)}};
  }
  Map operator()(const LoopBlock& b) const {
    return Map{{"type", "loop"}, {"iterable", spec_to_value(b.iterable)},
               {"binding", b.binding}, {"body", blocks_to_value(b.body)}};
  }
};

Value block_to_value(const LogicBlock& block) { return Value{std::visit(BlockWriter{}, block.node)}; }

void put_optional(Map& m, const char* key, const std::optional<Value>& v) {
  if (v) m[key] = *v;
}

void put_optional(Map& m, const char* key, const std::optional<double>& v) {
  if (v) m[key] = Value{*v};
}

}  // namespace

// ---------------------------------------------------------------------------
// Enum helpers
// ---------------------------------------------------------------------------

std::string to_string(AppCategory c) {
  switch (c) {
    case AppCategory::payment:       return "payment";
    case AppCategory::shopping:      return "shopping";
    case AppCategory::communication: return "communication";
    case AppCategory::calendar:      return "calendar";
    case AppCategory::social:        return "social";
    case AppCategory::custom:        return "custom";
  }
  return "custom";
}

std::string to_string(AccessType a) {
  switch (a) {
    case AccessType::shared:          return "shared";
    case AccessType::role_restricted: return "role_restricted";
    case AccessType::per_agent:       return "per_agent";
  }
  return "shared";
}

std::string to_string(FieldType t) {
  switch (t) {
    case FieldType::string:  return "string";
    case FieldType::number:  return "number";
    case FieldType::boolean: return "boolean";
    case FieldType::array:   return "array";
    case FieldType::object:  return "object";
    case FieldType::any:     return "any";
  }
  return "any";
}

std::string to_string(ToolType t) { return t == ToolType::read ? "read" : "write"; }

bool value_matches(FieldType type, const Value& v) {
  switch (type) {
    case FieldType::string:  return v.is_string();
    case FieldType::number:  return v.is_number();
    case FieldType::boolean: return v.is_bool();
    case FieldType::array:   return v.is_list();
    case FieldType::object:  return v.is_map();
    case FieldType::any:     return true;
  }
  return false;
}

Value type_default(FieldType type) {
  switch (type) {
    case FieldType::string:  return Value{""};
    case FieldType::number:  return Value{0};
    case FieldType::boolean: return Value{false};
    case FieldType::array:   return Value{List{}};
    case FieldType::object:  return Value{Map{}};
    case FieldType::any:     return Value{};
  }
  return Value{};
}

bool is_reserved_name(const std::string& name) {
  for (const char* r : kReservedRoots) {
    if (name == r) return true;
  }
  return false;
}

bool operator==(const LogicBlock& a, const LogicBlock& b) { return a.node == b.node; }

std::string block_type_name(const LogicBlock& block) {
  static const char* const kNames[] = {"validate", "update", "notify", "return", "error", "branch", "loop"};
  return kNames[block.node.index()];
}

const ParamSpec* ActionDefinition::find_param(const std::string& param_name) const {
  for (const auto& p : params) {
    if (p.name == param_name) return &p;
  }
  return nullptr;
}

const ActionDefinition* AppDefinition::find_action(const std::string& action_name) const {
  auto it = actions.find(action_name);
  return it == actions.end() ? nullptr : &it->second;
}

const StateField* AppDefinition::find_field(const std::string& field_name) const {
  for (const auto& f : state_schema) {
    if (f.name == field_name) return &f;
  }
  return nullptr;
}

// ---------------------------------------------------------------------------
// Load / validate / serialize
// ---------------------------------------------------------------------------

std::optional<AppDefinition> definition_from_value(const Value& json, const ParseOptions& options,
                                                   std::optional<Error>* error) {
  Reader r{options};
  AppDefinition def = r.app(json);
  if (!r.err) {
    auto compat = version::check_definition_format(def.format_version);
    if (!compat.ok) r.err = make_error(ErrorCode::definition_error, compat.description);
  }
  if (error) *error = r.err;
  if (r.err) return std::nullopt;
  return def;
}

std::optional<Error> validate_definition(const AppDefinition& def) {
  Validator v{def};
  v.run();
  return v.err;
}

std::optional<AppDefinition> load_definition(const std::string& json_text, const ParseOptions& options,
                                             std::optional<Error>* error) {
  std::optional<jsonlite::JsonError> jerr;
  Value json = jsonlite::parse_value(json_text, &jerr);
  if (jerr) {
    if (error) {
      *error = make_error(jerr->code == "json_duplicate_key" ? ErrorCode::json_duplicate_key
                                                             : ErrorCode::json_parse_error,
                          jerr->message);
    }
    return std::nullopt;
  }
  auto def = definition_from_value(json, options, error);
  if (!def) return std::nullopt;
  if (auto verr = validate_definition(*def)) {
    if (error) *error = std::move(verr);
    return std::nullopt;
  }
  if (error) error->reset();
  return def;
}

Value definition_to_value(const AppDefinition& def) {
  Map out;
  out["format_version"] = Value{static_cast<double>(def.format_version)};
  out["app_id"] = def.app_id;
  out["name"] = def.name;
  out["description"] = def.description;
  out["category"] = to_string(def.category);
  out["version"] = def.version;
  out["icon"] = def.icon;
  out["access_type"] = to_string(def.access_type);

  List roles;
  for (const auto& r : def.allowed_roles) roles.push_back(Value{r});
  out["allowed_roles"] = Value{std::move(roles)};

  List schema;
  for (const auto& f : def.state_schema) {
    Map m{{"name", f.name}, {"type", to_string(f.type)}, {"per_agent", f.per_agent},
          {"description", f.description}, {"observable", f.observable}};
    put_optional(m, "default", f.default_value);
    schema.push_back(Value{std::move(m)});
  }
  out["state_schema"] = Value{std::move(schema)};

  List config;
  for (const auto& f : def.config_schema) {
    Map m{{"name", f.name}, {"label", f.label}, {"type", f.type}, {"required", f.required},
          {"description", f.description}};
    put_optional(m, "default", f.default_value);
    put_optional(m, "min", f.min_value);
    put_optional(m, "max", f.max_value);
    if (!f.options.empty()) m["options"] = Value{List(f.options.begin(), f.options.end())};
    config.push_back(Value{std::move(m)});
  }
  out["config_schema"] = Value{std::move(config)};
  out["initial_config"] = Value{def.initial_config};

  List actions;
  for (const auto& [name, a] : def.actions) {
    List params;
    for (const auto& p : a.params) {
      Map m{{"name", p.name}, {"type", to_string(p.type)}, {"description", p.description},
            {"required", p.required}};
      put_optional(m, "default", p.default_value);
      put_optional(m, "min_value", p.min_value);
      put_optional(m, "max_value", p.max_value);
      if (p.min_length) m["min_length"] = Value{*p.min_length};
      if (p.max_length) m["max_length"] = Value{*p.max_length};
      if (p.pattern) m["pattern"] = *p.pattern;
      if (!p.choices.empty()) m["enum"] = Value{List(p.choices.begin(), p.choices.end())};
      params.push_back(Value{std::move(m)});
    }
    Map am{{"name", name}, {"description", a.description}, {"tool_type", to_string(a.tool_type)},
           {"params", Value{std::move(params)}}, {"logic", blocks_to_value(a.logic)}, {"returns", a.returns}};
    actions.push_back(Value{std::move(am)});
  }
  out["actions"] = Value{std::move(actions)};
  return Value{std::move(out)};
}

std::string definition_to_json(const AppDefinition& def) {
  return jsonlite::to_json(definition_to_value(def));
}

}  // namespace applogic
