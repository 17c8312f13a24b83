#pragma once

// applogic/state.hpp - App instance state: one shared partition plus one
// record per agent.
//
// SHAPE:
//   {"per_agent": {"<agent id>": {"<field>": value, ...}, ...},
//    "shared":    {"<field>": value, ...}}
//   Both partitions are always maps. The host owns state between calls; the
//   engine only ever reads the caller's copy and hands back a new one.
//
// INVARIANTS:
//   - serialized_size() is the byte length of state_to_json(), computed
//     without building the string. The safety governor compares it with
//     max_state_bytes after every update.
//   - state_to_json() is canonical (sorted keys, shortest numbers), so two
//     equal states always hash to the same state_digest.

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "applogic/definition.hpp"
#include "applogic/types.hpp"
#include "applogic/value.hpp"

namespace applogic {

struct AppState {
  Value shared{Map{}};
  Value per_agent{Map{}};

  Map& shared_map() { return shared.as_map(); }
  const Map& shared_map() const { return shared.as_map(); }
  Map& agents_map() { return per_agent.as_map(); }
  const Map& agents_map() const { return per_agent.as_map(); }

  // nullptr when the agent has no record yet.
  const Map* agent(const std::string& agent_id) const;
  Map* agent(const std::string& agent_id);

  bool operator==(const AppState&) const = default;
};

Value state_to_value(const AppState& state);
std::string state_to_json(const AppState& state);

// Accepts the envelope above. Missing partitions default to {}; a partition
// or agent record that is not an object is rejected with type_mismatch.
std::optional<AppState> state_from_value(const Value& json, std::optional<Error>* error);
std::optional<AppState> state_from_json(const std::string& text, std::optional<Error>* error);

std::size_t serialized_size(const AppState& state);

// BLAKE3 over state_to_json(), "state:" domain.
std::string state_digest(const AppState& state);

// Fresh state for a definition: shared fields and a record per listed agent,
// each field holding its declared default or its type default.
AppState initial_state(const AppDefinition& def, const std::vector<std::string>& agent_ids);

// Creates the record for `agent_id` from schema defaults when missing; also
// fills in fields added to the schema after the record was created.
Map& ensure_agent(AppState& state, const AppDefinition& def, const std::string& agent_id);

}  // namespace applogic
