#pragma once

// applogic/context.hpp - Per-invocation name resolution and working state.
//
// An ExecutionContext is created by the engine for one execute() call and
// discarded afterwards. It owns a private working copy of the app state;
// nothing it does is visible to the caller unless the run succeeds and the
// engine hands the copy back as ActionResult::new_state.
//
// NAME RESOLUTION (first match wins):
//   1. loop bindings, innermost first
//   2. params, agent, agents, shared, config
//   3. a declared param                  amount      -> params.amount
//   4. a per-agent field of the caller   balance     -> agent.balance
//   5. a shared field                    total_sales -> shared.total_sales
//   `agent` is the caller's record with "id" added; `agents` is the whole
//   per-agent partition keyed by agent id.

#include <string>
#include <utility>
#include <vector>

#include "applogic/definition.hpp"
#include "applogic/evaluator.hpp"
#include "applogic/governor.hpp"
#include "applogic/state.hpp"
#include "applogic/value.hpp"

namespace applogic {

class ExecutionContext : public Environment {
 public:
  ExecutionContext(const AppDefinition& def, AppState state, Map params, std::string agent_id, Map config,
                   SafetyLimits limits);

  const Value* lookup(const std::string& name) const override;

  const AppDefinition& definition() const { return def_; }
  const std::string& agent_id() const { return agent_id_; }
  const Map& params() const { return params_.as_map(); }
  const Map& config() const { return config_.as_map(); }

  const AppState& state() const { return state_; }
  // Callers that write through this must call mark_state_changed().
  AppState& mutable_state() { return state_; }
  void mark_state_changed() { agent_view_dirty_ = true; }
  AppState take_state() { return std::move(state_); }

  SafetyGovernor& governor() { return governor_; }
  const SafetyGovernor& governor() const { return governor_; }

  void push_binding(const std::string& name, Value value) { bindings_.emplace_back(name, std::move(value)); }
  void set_binding(Value value) { bindings_.back().second = std::move(value); }
  void pop_binding() { bindings_.pop_back(); }

 private:
  const Value& agent_view() const;

  const AppDefinition&                       def_;
  AppState                                   state_;
  Value                                      params_;
  std::string                                agent_id_;
  Value                                      config_;
  SafetyGovernor                             governor_;
  std::vector<std::pair<std::string, Value>> bindings_;

  mutable Value agent_view_;
  mutable bool  agent_view_dirty_{true};
};

}  // namespace applogic
