#pragma once

// applogic/config.hpp - Engine-wide configuration.
//
// JSON FORM (every key optional):
//   {
//     "config_version": "1",
//     "limits": {"max_loop_iterations": 1000, "max_nesting_depth": 10,
//                "max_state_bytes": 1048576},
//     "interpolation": {"open": "${", "close": "}"},
//     "functions": ["len", "str", ...],   // absent = every builtin
//     "emit_events": true
//   }
//
// validate_config() never throws. Unknown keys are warnings so that a newer
// host config still loads on an older engine; out-of-range values are errors.

#include <string>
#include <vector>

#include "applogic/expression.hpp"
#include "applogic/governor.hpp"

namespace applogic {

constexpr const char* kConfigVersion = "1";

struct EngineConfig {
  SafetyLimits limits;
  ParseOptions parse;
  // Empty = every builtin function is available.
  std::vector<std::string> enabled_functions;
  bool emit_events{true};
};

struct ConfigValidationResult {
  bool ok{false};
  std::string config_version;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
  EngineConfig config;  // meaningful only when ok
};

ConfigValidationResult validate_config(const std::string& config_json);

}  // namespace applogic
