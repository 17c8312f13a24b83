#pragma once

// applogic/interpreter.hpp - Executes an action's logic blocks in order.
//
// CONTROL FLOW:
//   Blocks run top to bottom. Return ends the run with a value; Validate (on a
//   false condition) and Error end it with a user-facing failure; any
//   evaluation error ends it with that error; a governor refusal ends it with
//   a safety_limit failure. Falling off the end completes with value null.
//
// INVARIANTS:
//   - Every write goes to ExecutionContext's working copy. Whether that copy
//     is published is the engine's decision, based on RunOutcome::status.
//   - Dispatch is a closed std::visit over the seven block structs; adding a
//     block type is a compile error until every visitor handles it.

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "applogic/context.hpp"
#include "applogic/definition.hpp"
#include "applogic/functions.hpp"
#include "applogic/types.hpp"
#include "applogic/value.hpp"

namespace applogic {

// A message for one agent (or everyone) produced by a Notify block.
struct Notification {
  bool                 broadcast{false};
  std::string          target;   // agent id; empty when broadcast
  std::string          message;
  std::optional<Value> data;     // always a map when present

  bool operator==(const Notification&) const = default;
};

// User-facing failure. `code` is an ErrorCode string for engine-detected
// failures, or the author's own code for Validate / Error blocks.
struct ActionError {
  ErrorCategory category{ErrorCategory::internal};
  ErrorCode     kind{ErrorCode::internal_error};  // engine classification
  std::string   code;
  std::string   message;
};

enum class RunStatus {
  returned,   // a Return block ran
  completed,  // fell off the end of the logic list
  errored,    // Validate / Error block, or an evaluation error
  exhausted,  // a safety limit was crossed
};

std::string to_string(RunStatus status);

struct RunOutcome {
  RunStatus                  status{RunStatus::completed};
  Value                      value;
  std::optional<ActionError> error;
  std::vector<Notification>  notifications;
  std::size_t                blocks_executed{0};

  bool ok() const { return status == RunStatus::returned || status == RunStatus::completed; }
};

class Interpreter {
 public:
  explicit Interpreter(const FunctionRegistry& functions) : functions_(functions) {}

  RunOutcome run(const ActionDefinition& action, ExecutionContext& ctx) const;

 private:
  const FunctionRegistry& functions_;
};

}  // namespace applogic
