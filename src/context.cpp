#include "applogic/context.hpp"

namespace applogic {

ExecutionContext::ExecutionContext(const AppDefinition& def, AppState state, Map params, std::string agent_id,
                                   Map config, SafetyLimits limits)
    : def_(def),
      state_(std::move(state)),
      params_(std::move(params)),
      agent_id_(std::move(agent_id)),
      config_(std::move(config)),
      governor_(limits) {}

const Value& ExecutionContext::agent_view() const {
  if (!agent_view_dirty_) return agent_view_;
  Map view;
  if (const Map* record = state_.agent(agent_id_)) view = *record;
  for (const auto& f : def_.state_schema) {
    if (f.per_agent && !view.contains(f.name)) view.emplace(f.name, f.initial_value());
  }
  view["id"] = agent_id_;
  agent_view_ = Value{std::move(view)};
  agent_view_dirty_ = false;
  return agent_view_;
}

const Value* ExecutionContext::lookup(const std::string& name) const {
  for (auto it = bindings_.rbegin(); it != bindings_.rend(); ++it) {
    if (it->first == name) return &it->second;
  }

  if (name == "params") return &params_;
  if (name == "agent") return &agent_view();
  if (name == "agents") return &state_.per_agent;
  if (name == "shared") return &state_.shared;
  if (name == "config") return &config_;

  const Map& p = params_.as_map();
  if (auto it = p.find(name); it != p.end()) return &it->second;

  if (const StateField* f = def_.find_field(name)) {
    if (f->per_agent) {
      const Map& view = agent_view().as_map();
      auto it = view.find(name);
      return it == view.end() ? nullptr : &it->second;
    }
    const Map& shared = state_.shared_map();
    auto it = shared.find(name);
    return it == shared.end() ? nullptr : &it->second;
  }
  return nullptr;
}

}  // namespace applogic
