#pragma once

// applogic/engine.hpp - Public entry point: load app definitions, execute
// actions against caller-owned state.
//
// EXECUTION PIPELINE (execute):
//   1. action lookup            unknown_action
//   2. access check             access_denied (role_restricted apps)
//   3. parameter validation     invalid_params; defaults filled in
//   4. config resolution        schema defaults < initial_config < request.config
//   5. interpreter run          on a private copy of the caller's state
//   6. publish                  new_state + state_digest only on success
//   7. emit ActionEvent         always, when EngineConfig::emit_events
//
// INVARIANTS:
//   - execute() is total: every failure, including an unexpected exception
//     from a host-registered function, comes back as an ActionResult.
//   - The caller's state is never modified. A failed run returns no
//     new_state at all, so partial writes cannot leak.
//   - The engine holds no per-invocation mutable state. Concurrent execute()
//     calls are safe; the definition cache is the only shared structure and
//     it is mutex-protected.
//
// EXTENSION_POINT: host_functions
//   Hosts pass their own FunctionRegistry to add domain functions. The
//   registry is copied at construction and read-only afterwards.

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "applogic/config.hpp"
#include "applogic/definition.hpp"
#include "applogic/functions.hpp"
#include "applogic/interpreter.hpp"
#include "applogic/state.hpp"

namespace applogic {

struct InvocationRequest {
  std::string app_instance_id;
  std::string agent_id;
  std::string agent_role;   // checked against allowed_roles for role_restricted apps
  std::string action_name;
  Map         params;
  Map         config;       // per-instance overrides
};

struct ExecutionStats {
  std::size_t blocks_executed{0};
  std::size_t loop_iterations{0};
  std::size_t max_depth{0};
  std::size_t state_bytes{0};
  uint64_t    duration_ns{0};
};

struct ActionResult {
  bool                       success{false};
  Value                      value;
  std::optional<ActionError> error;
  std::vector<Notification>  notifications;
  std::optional<AppState>    new_state;     // success only
  std::string                state_digest;  // success only
  ExecutionStats             stats;
};

struct LoadResult {
  bool                                 ok{false};
  std::shared_ptr<const AppDefinition> definition;
  std::optional<Error>                 error;
  std::string                          digest;  // BLAKE3 of the canonical JSON
};

class Engine {
 public:
  Engine();
  explicit Engine(EngineConfig config, FunctionRegistry functions = FunctionRegistry::with_builtins());

  // Parses and validates a definition, or returns the cached copy of an
  // identical one.
  LoadResult load(const std::string& definition_json);

  ActionResult execute(const AppDefinition& def, const InvocationRequest& request,
                       const AppState& current_state) const;

  Map resolve_config(const AppDefinition& def, const Map& overrides) const;

  const EngineConfig& config() const { return config_; }
  const FunctionRegistry& functions() const { return functions_; }
  // Names listed in enabled_functions that the registry did not provide.
  const std::vector<std::string>& unavailable_functions() const { return unavailable_functions_; }
  std::size_t cached_definitions() const;
  // Raw-text lookups in front of the canonical cache; at most kMaxSourceAliases.
  std::size_t cached_source_aliases() const;

  static constexpr std::size_t kMaxSourceAliases = 256;

 private:
  EngineConfig             config_;
  FunctionRegistry         functions_;
  std::vector<std::string> unavailable_functions_;

  mutable std::mutex                                          cache_mu_;
  std::map<std::string, std::shared_ptr<const AppDefinition>> by_source_;     // raw text digest
  std::map<std::string, std::shared_ptr<const AppDefinition>> by_canonical_;  // definition_hash
};

// Checks `given` against the action's ParamSpecs and writes the accepted
// params, with declared defaults filled in, to *resolved. A null value counts
// as not provided.
std::optional<Error> validate_params(const ActionDefinition& action, const Map& given, Map* resolved);

}  // namespace applogic
