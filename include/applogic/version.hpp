#pragma once

// applogic/version.hpp - Explicit version manifest for every persisted format.
//
// PURPOSE:
//   Prevent silent format drift between the definitions and states a host has
//   stored and the engine that reads them. Every component that reads a
//   versioned format checks its constant here first.
//
// INVARIANT:
//   Never silently accept data from a newer format version than the engine
//   was compiled against.

#include <cstdint>
#include <string>

namespace applogic {
namespace version {

// ---------------------------------------------------------------------------
// DEFINITION_FORMAT_VERSION
// Layout of AppDefinition JSON (keys, block discriminators, value specs).
// A definition may declare "format_version"; newer values are rejected.
// ---------------------------------------------------------------------------
constexpr uint32_t DEFINITION_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// STATE_FORMAT_VERSION
// The {"per_agent":{...},"shared":{...}} state envelope.
// ---------------------------------------------------------------------------
constexpr uint32_t STATE_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// EXPRESSION_GRAMMAR_VERSION
// Bump when operators, precedence levels or literal syntax change.
// ---------------------------------------------------------------------------
constexpr uint32_t EXPRESSION_GRAMMAR_VERSION = 1;

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3-256, hex encoded, "def:" / "state:" domain prefixes.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// ---------------------------------------------------------------------------
// EVENT_LOG_VERSION
// JSONL schema of ActionEvent lines written to APPLOGIC_EVENT_LOG.
// ---------------------------------------------------------------------------
constexpr uint32_t EVENT_LOG_VERSION = 1;

struct VersionManifest {
  uint32_t definition_format{DEFINITION_FORMAT_VERSION};
  uint32_t state_format{STATE_FORMAT_VERSION};
  uint32_t expression_grammar{EXPRESSION_GRAMMAR_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t event_log{EVENT_LOG_VERSION};
  std::string engine_semver;
  std::string hash_primitive;
};

VersionManifest current_manifest(const std::string& engine_semver = "");

std::string manifest_to_json(const VersionManifest& m);

// ---------------------------------------------------------------------------
// Definition format check - called by load_definition().
// Never throws.
// ---------------------------------------------------------------------------
struct CompatibilityResult {
  bool ok{true};
  std::string error_code;    // Empty if ok
  std::string description;
};

CompatibilityResult check_definition_format(uint32_t declared_version);

}  // namespace version
}  // namespace applogic
