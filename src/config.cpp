#include "applogic/config.hpp"

#include <algorithm>

#include "applogic/functions.hpp"
#include "applogic/jsonlite.hpp"

namespace applogic {

namespace {

void read_limit(const Map& limits, const char* key, std::size_t* out, ConfigValidationResult& r) {
  auto it = limits.find(key);
  if (it == limits.end()) return;
  const Value& v = it->second;
  if (!v.is_number() || !is_integral(v.as_number()) || v.as_number() <= 0) {
    r.errors.push_back(std::string("limits.") + key + " must be a positive integer");
    return;
  }
  *out = static_cast<std::size_t>(v.as_number());
}

void warn_unknown(const Map& obj, const std::vector<std::string>& known, const std::string& prefix,
                  ConfigValidationResult& r) {
  for (const auto& [k, _] : obj) {
    if (std::find(known.begin(), known.end(), k) == known.end()) {
      r.warnings.push_back("unknown key: " + prefix + k);
    }
  }
}

}  // namespace

ConfigValidationResult validate_config(const std::string& config_json) {
  ConfigValidationResult r;
  std::optional<jsonlite::JsonError> err;
  Value root = jsonlite::parse_value(config_json, &err);
  if (err) {
    r.errors.push_back("JSON parse error: " + err->message);
    return r;
  }
  if (!root.is_map()) {
    r.errors.push_back("config must be a JSON object");
    return r;
  }
  const Map& obj = root.as_map();
  warn_unknown(obj, {"config_version", "limits", "interpolation", "functions", "emit_events"}, "", r);

  r.config_version = jsonlite::get_string(obj, "config_version", kConfigVersion);
  if (r.config_version != kConfigVersion) {
    r.errors.push_back("unsupported config_version: " + r.config_version);
  }

  EngineConfig& cfg = r.config;
  if (auto it = obj.find("limits"); it != obj.end()) {
    if (!it->second.is_map()) {
      r.errors.push_back("limits must be an object");
    } else {
      const Map& limits = it->second.as_map();
      warn_unknown(limits, {"max_loop_iterations", "max_nesting_depth", "max_state_bytes"}, "limits.", r);
      read_limit(limits, "max_loop_iterations", &cfg.limits.max_loop_iterations, r);
      read_limit(limits, "max_nesting_depth", &cfg.limits.max_nesting_depth, r);
      read_limit(limits, "max_state_bytes", &cfg.limits.max_state_bytes, r);
    }
  }

  if (auto it = obj.find("interpolation"); it != obj.end()) {
    if (!it->second.is_map()) {
      r.errors.push_back("interpolation must be an object");
    } else {
      const Map& interp = it->second.as_map();
      warn_unknown(interp, {"open", "close"}, "interpolation.", r);
      cfg.parse.interpolation_open = jsonlite::get_string(interp, "open", cfg.parse.interpolation_open);
      cfg.parse.interpolation_close = jsonlite::get_string(interp, "close", cfg.parse.interpolation_close);
      if (cfg.parse.interpolation_open.empty() || cfg.parse.interpolation_close.empty()) {
        r.errors.push_back("interpolation delimiters must not be empty");
      } else if (cfg.parse.interpolation_open == cfg.parse.interpolation_close) {
        r.errors.push_back("interpolation open and close delimiters must differ");
      }
    }
  }

  if (obj.contains("functions")) {
    if (!obj.at("functions").is_list()) {
      r.errors.push_back("functions must be a list of names");
    } else {
      const auto& known = builtin_function_names();
      for (const auto& name : jsonlite::get_string_array(obj, "functions")) {
        if (std::find(known.begin(), known.end(), name) == known.end()) {
          r.errors.push_back("unknown function: " + name);
        } else {
          cfg.enabled_functions.push_back(name);
        }
      }
    }
  }

  cfg.emit_events = jsonlite::get_bool(obj, "emit_events", true);

  r.ok = r.errors.empty();
  return r;
}

}  // namespace applogic
