#include "applogic/state.hpp"

#include "applogic/hash.hpp"
#include "applogic/jsonlite.hpp"

namespace applogic {

namespace {

Map agent_record(const AppDefinition& def) {
  Map record;
  for (const auto& f : def.state_schema) {
    if (f.per_agent) record.emplace(f.name, f.initial_value());
  }
  return record;
}

}  // namespace

const Map* AppState::agent(const std::string& agent_id) const {
  const Map& agents = agents_map();
  auto it = agents.find(agent_id);
  if (it == agents.end() || !it->second.is_map()) return nullptr;
  return &it->second.as_map();
}

Map* AppState::agent(const std::string& agent_id) {
  Map& agents = agents_map();
  auto it = agents.find(agent_id);
  if (it == agents.end() || !it->second.is_map()) return nullptr;
  return &it->second.as_map();
}

Value state_to_value(const AppState& state) {
  return Value{Map{{"per_agent", state.per_agent}, {"shared", state.shared}}};
}

std::string state_to_json(const AppState& state) { return jsonlite::to_json(state_to_value(state)); }

std::optional<AppState> state_from_value(const Value& json, std::optional<Error>* error) {
  auto fail = [&](const std::string& msg) -> std::optional<AppState> {
    if (error) *error = make_error(ErrorCode::type_mismatch, msg);
    return std::nullopt;
  };
  if (!json.is_map()) return fail("state must be an object");
  AppState state;
  const Map& m = json.as_map();
  if (auto it = m.find("shared"); it != m.end() && !it->second.is_null()) {
    if (!it->second.is_map()) return fail("state.shared must be an object");
    state.shared = it->second;
  }
  if (auto it = m.find("per_agent"); it != m.end() && !it->second.is_null()) {
    if (!it->second.is_map()) return fail("state.per_agent must be an object");
    for (const auto& [id, record] : it->second.as_map()) {
      if (!record.is_map()) return fail("state.per_agent." + id + " must be an object");
    }
    state.per_agent = it->second;
  }
  if (error) error->reset();
  return state;
}

std::optional<AppState> state_from_json(const std::string& text, std::optional<Error>* error) {
  std::optional<jsonlite::JsonError> jerr;
  Value json = jsonlite::parse_value(text, &jerr);
  if (jerr) {
    if (error) *error = make_error(ErrorCode::json_parse_error, jerr->message);
    return std::nullopt;
  }
  return state_from_value(json, error);
}

std::size_t serialized_size(const AppState& state) {
  // {"per_agent":<P>,"shared":<S>}
  static constexpr std::size_t kEnvelope = sizeof("{\"per_agent\":,\"shared\":}") - 1;
  return kEnvelope + jsonlite::json_size(state.per_agent) + jsonlite::json_size(state.shared);
}

std::string state_digest(const AppState& state) { return state_hash(state_to_json(state)); }

AppState initial_state(const AppDefinition& def, const std::vector<std::string>& agent_ids) {
  AppState state;
  for (const auto& f : def.state_schema) {
    if (!f.per_agent) state.shared_map().emplace(f.name, f.initial_value());
  }
  const Map record = agent_record(def);
  for (const auto& id : agent_ids) state.agents_map().emplace(id, Value{record});
  return state;
}

Map& ensure_agent(AppState& state, const AppDefinition& def, const std::string& agent_id) {
  Value& slot = state.agents_map()[agent_id];
  if (!slot.is_map()) slot = Value{Map{}};
  Map& record = slot.as_map();
  for (const auto& f : def.state_schema) {
    if (f.per_agent && !record.contains(f.name)) record.emplace(f.name, f.initial_value());
  }
  return record;
}

}  // namespace applogic
