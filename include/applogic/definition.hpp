#pragma once

// applogic/definition.hpp - Declarative app definitions: the "programs" the
// interpreter runs.
//
// LIFECYCLE:
//   JSON text -> load_definition() -> immutable AppDefinition. Every
//   expression is parsed exactly once here; every name an expression reads is
//   checked against the state schema, params, config and loop bindings in
//   scope. A definition that loads is guaranteed to contain no parse errors
//   and no dangling references; what remains for run time are value-dependent
//   failures (types, division by zero, limits).
//
// JSON SHAPE (canonical keys; camelCase spellings are accepted on input):
//   {
//     "format_version": 1,
//     "app_id": "paypal", "name": "PayPal", "description": "...",
//     "category": "payment", "version": "1.0", "icon": "",
//     "access_type": "shared", "allowed_roles": [],
//     "state_schema":  [{"name":"balance","type":"number","default":100,"per_agent":true}],
//     "config_schema": [{"name":"fee","label":"Fee","type":"number","default":0}],
//     "initial_config": {},
//     "actions": [{"name":"transfer","params":[...],"logic":[...],"returns":{}}]
//   }
//
// Blocks are discriminated objects; see LogicBlock below.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "applogic/expression.hpp"
#include "applogic/path.hpp"
#include "applogic/types.hpp"
#include "applogic/value.hpp"

namespace applogic {

enum class AppCategory { payment, shopping, communication, calendar, social, custom };
enum class AccessType { shared, role_restricted, per_agent };
enum class FieldType { string, number, boolean, array, object, any };
enum class ToolType { read, write };

std::string to_string(AppCategory c);
std::string to_string(AccessType a);
std::string to_string(FieldType t);
std::string to_string(ToolType t);

// True if `v` is acceptable for a field declared as `type`.
bool value_matches(FieldType type, const Value& v);
// "", 0, false, [], {} or null for `any`.
Value type_default(FieldType type);

// ---------------------------------------------------------------------------
// Schema pieces
// ---------------------------------------------------------------------------

struct StateField {
  std::string          name;
  FieldType            type{FieldType::any};
  std::optional<Value> default_value;
  bool                 per_agent{true};
  std::string          description;
  bool                 observable{true};

  // Declared default, or the type default when none is declared.
  Value initial_value() const { return default_value ? *default_value : type_default(type); }

  bool operator==(const StateField&) const = default;
};

struct ConfigField {
  std::string           name;
  std::string           label;
  std::string           type{"string"};  // string | number | boolean | select
  std::optional<Value>  default_value;
  bool                  required{false};
  std::optional<double> min_value;
  std::optional<double> max_value;
  std::string           description;
  std::vector<Value>    options;          // select choices

  bool operator==(const ConfigField&) const = default;
};

struct ParamSpec {
  std::string                name;
  FieldType                  type{FieldType::string};
  std::string                description;
  bool                       required{false};
  std::optional<Value>       default_value;
  std::optional<double>      min_value;
  std::optional<double>      max_value;
  std::optional<std::size_t> min_length;
  std::optional<std::size_t> max_length;
  std::optional<std::string> pattern;
  std::vector<Value>         choices;     // "enum"; empty = unrestricted

  bool operator==(const ParamSpec&) const = default;
};

// ---------------------------------------------------------------------------
// Logic blocks
// ---------------------------------------------------------------------------
//   {"type":"validate","condition":E,"error_message":T,"error_code":S}
//   {"type":"update","target":P,"operation":OP,"value":V}
//   {"type":"notify","to":E?,"message":T,"data":V?}     no "to" = broadcast
//   {"type":"return","value":V?}
//   {"type":"error","message":T,"code":S}
//   {"type":"branch","condition":E,"then":[...],"else":[...]}
//   {"type":"loop","iterable":E,"binding":S,"body":[...]}
// E expression string, T template text, P target path expression,
// V value spec (a string is an expression, other scalars are literals,
// objects / arrays are structured literals with expression string leaves).

struct LogicBlock;
using BlockList = std::vector<LogicBlock>;

bool operator==(const LogicBlock& a, const LogicBlock& b);

struct ValidateBlock {
  Expression  condition;
  Expression  error_message;
  std::string error_code{"validation_failed"};

  bool operator==(const ValidateBlock&) const = default;
};

struct UpdateBlock {
  Expression target;
  UpdateOp   operation{UpdateOp::set};
  Expression value;

  bool operator==(const UpdateBlock&) const = default;
};

struct NotifyBlock {
  std::optional<Expression> to;    // nullopt = broadcast
  Expression                message;
  std::optional<Expression> data;

  bool operator==(const NotifyBlock&) const = default;
};

struct ReturnBlock {
  std::optional<Expression> value;  // nullopt = return null

  bool operator==(const ReturnBlock&) const = default;
};

struct ErrorBlock {
  Expression  message;
  std::string code{"action_error"};

  bool operator==(const ErrorBlock&) const = default;
};

struct BranchBlock {
  Expression condition;
  BlockList  then_blocks;
  BlockList  else_blocks;

  bool operator==(const BranchBlock&) const = default;
};

struct LoopBlock {
  Expression  iterable;
  std::string binding{"item"};
  BlockList   body;

  bool operator==(const LoopBlock&) const = default;
};

struct LogicBlock {
  std::variant<ValidateBlock, UpdateBlock, NotifyBlock, ReturnBlock, ErrorBlock, BranchBlock, LoopBlock> node;
};

// "validate", "update", ... for diagnostics and events.
std::string block_type_name(const LogicBlock& block);

// ---------------------------------------------------------------------------
// Actions and apps
// ---------------------------------------------------------------------------

struct ActionDefinition {
  std::string            name;
  std::string            description;
  ToolType               tool_type{ToolType::write};
  std::vector<ParamSpec> params;
  BlockList              logic;
  Value                  returns{Map{}};  // declared return shape, informational

  const ParamSpec* find_param(const std::string& param_name) const;

  bool operator==(const ActionDefinition&) const = default;
};

struct AppDefinition {
  uint32_t                                format_version{1};
  std::string                             app_id;
  std::string                             name;
  std::string                             description;
  AppCategory                             category{AppCategory::custom};
  std::string                             version{"1.0"};
  std::string                             icon;
  std::vector<StateField>                 state_schema;
  std::map<std::string, ActionDefinition> actions;
  std::vector<ConfigField>                config_schema;
  Map                                     initial_config;
  AccessType                              access_type{AccessType::shared};
  std::vector<std::string>                allowed_roles;

  const ActionDefinition* find_action(const std::string& action_name) const;
  const StateField* find_field(const std::string& field_name) const;

  bool operator==(const AppDefinition&) const = default;
};

// ---------------------------------------------------------------------------
// Loading and serialization
// ---------------------------------------------------------------------------

// Structural decode of an already-parsed JSON value. Parses every expression.
// Reports definition_error or parse_error.
std::optional<AppDefinition> definition_from_value(const Value& json, const ParseOptions& options,
                                                   std::optional<Error>* error);

// Semantic checks: identifiers, uniqueness, reserved names, path references,
// update targets, regex patterns, default types.
std::optional<Error> validate_definition(const AppDefinition& def);

// JSON text -> decoded -> validated. The one entry point hosts should use.
std::optional<AppDefinition> load_definition(const std::string& json_text, const ParseOptions& options,
                                             std::optional<Error>* error);

Value definition_to_value(const AppDefinition& def);
std::string definition_to_json(const AppDefinition& def);

// Root names with fixed meaning inside expressions.
bool is_reserved_name(const std::string& name);

}  // namespace applogic
