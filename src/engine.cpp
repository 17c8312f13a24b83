#include "applogic/engine.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <regex>

#include "applogic/context.hpp"
#include "applogic/hash.hpp"
#include "applogic/jsonlite.hpp"
#include "applogic/observability.hpp"

namespace applogic {

namespace {

std::size_t text_length(const std::string& s) {
  // Code points, so length bounds match what authors see.
  std::size_t n = 0;
  for (unsigned char c : s) {
    if ((c & 0xC0) != 0x80) ++n;
  }
  return n;
}

Error param_error(const std::string& msg) { return make_error(ErrorCode::invalid_params, msg); }

std::optional<Error> check_param(const ParamSpec& spec, const Value& v) {
  const std::string name = "parameter '" + spec.name + "'";
  if (!value_matches(spec.type, v)) {
    return param_error(name + " must be " + to_string(spec.type) + ", got " + to_string(v.type()));
  }
  if (v.is_number()) {
    const double d = v.as_number();
    if (!std::isfinite(d)) return param_error(name + " must be a finite number");
    if (spec.min_value && d < *spec.min_value) {
      return param_error(name + " must be >= " + jsonlite::format_number(*spec.min_value));
    }
    if (spec.max_value && d > *spec.max_value) {
      return param_error(name + " must be <= " + jsonlite::format_number(*spec.max_value));
    }
  }
  if (v.is_string()) {
    const std::size_t len = text_length(v.as_string());
    if (spec.min_length && len < *spec.min_length) {
      return param_error(name + " must be at least " + std::to_string(*spec.min_length) + " characters");
    }
    if (spec.max_length && len > *spec.max_length) {
      return param_error(name + " must be at most " + std::to_string(*spec.max_length) + " characters");
    }
    if (spec.pattern) {
      // Compiles at load time already, so regex_error here is unexpected.
      const std::regex re(*spec.pattern, std::regex::ECMAScript);
      if (!std::regex_match(v.as_string(), re)) {
        return param_error(name + " does not match pattern " + *spec.pattern);
      }
    }
  }
  if (!spec.choices.empty()) {
    bool found = false;
    for (const auto& c : spec.choices) {
      if (c == v) {
        found = true;
        break;
      }
    }
    if (!found) return param_error(name + " must be one of " + jsonlite::to_json(Value{List(spec.choices)}));
  }
  return std::nullopt;
}

ActionResult failure(ErrorCode code, const std::string& message) {
  ActionResult r;
  r.error = ActionError{category_of(code), code, to_string(code), message};
  return r;
}

}  // namespace

std::optional<Error> validate_params(const ActionDefinition& action, const Map& given, Map* resolved) {
  std::string unknown;
  for (const auto& [k, _] : given) {
    if (!action.find_param(k)) unknown += (unknown.empty() ? "" : ", ") + k;
  }
  if (!unknown.empty()) return param_error("unknown parameters: " + unknown);

  Map out;
  for (const auto& spec : action.params) {
    auto it = given.find(spec.name);
    const bool provided = it != given.end() && !it->second.is_null();
    if (!provided) {
      if (spec.default_value) {
        out[spec.name] = *spec.default_value;
      } else if (spec.required) {
        return param_error("parameter '" + spec.name + "' is required");
      }
      continue;
    }
    if (auto err = check_param(spec, it->second)) return err;
    out[spec.name] = it->second;
  }
  if (resolved) *resolved = std::move(out);
  return std::nullopt;
}

Engine::Engine() : Engine(EngineConfig{}) {}

Engine::Engine(EngineConfig config, FunctionRegistry functions)
    : config_(std::move(config)), functions_(std::move(functions)) {
  if (!config_.enabled_functions.empty()) {
    unavailable_functions_ = functions_.restrict_to(config_.enabled_functions);
  }
}

LoadResult Engine::load(const std::string& definition_json) {
  LoadResult result;
  const std::string source_key = hash_domain("src:", definition_json);
  {
    std::lock_guard<std::mutex> lk(cache_mu_);
    if (auto it = by_source_.find(source_key); it != by_source_.end()) {
      global_engine_stats().definition_cache_hits.fetch_add(1, std::memory_order_relaxed);
      result.ok = true;
      result.definition = it->second;
      result.digest = definition_hash(definition_to_json(*it->second));
      return result;
    }
  }

  std::optional<Error> err;
  auto def = load_definition(definition_json, config_.parse, &err);
  if (!def) {
    result.error = err ? *err : make_error(ErrorCode::definition_error, "definition rejected");
    return result;
  }
  result.digest = definition_hash(definition_to_json(*def));

  std::lock_guard<std::mutex> lk(cache_mu_);
  auto& shared = by_canonical_[result.digest];
  if (shared) {
    global_engine_stats().definition_cache_hits.fetch_add(1, std::memory_order_relaxed);
  } else {
    shared = std::make_shared<const AppDefinition>(std::move(*def));
    global_engine_stats().definitions_loaded.fetch_add(1, std::memory_order_relaxed);
  }
  // Formatting variants of one definition each get an alias; drop them all
  // rather than grow without bound. The canonical entries stay.
  if (by_source_.size() >= kMaxSourceAliases) by_source_.clear();
  by_source_[source_key] = shared;
  result.ok = true;
  result.definition = shared;
  return result;
}

std::size_t Engine::cached_definitions() const {
  std::lock_guard<std::mutex> lk(cache_mu_);
  return by_canonical_.size();
}

std::size_t Engine::cached_source_aliases() const {
  std::lock_guard<std::mutex> lk(cache_mu_);
  return by_source_.size();
}

Map Engine::resolve_config(const AppDefinition& def, const Map& overrides) const {
  Map out;
  for (const auto& f : def.config_schema) {
    if (f.default_value) out[f.name] = *f.default_value;
  }
  for (const auto& [k, v] : def.initial_config) out[k] = v;
  for (const auto& [k, v] : overrides) out[k] = v;
  return out;
}

ActionResult Engine::execute(const AppDefinition& def, const InvocationRequest& request,
                             const AppState& current_state) const {
  ActionResult result;
  ActionEvent ev;
  ev.app_id = def.app_id;
  ev.app_instance_id = request.app_instance_id;
  ev.agent_id = request.agent_id;
  ev.action = request.action_name;

  {
    ScopeTimer timer(result.stats.duration_ns);
    try {
      const ActionDefinition* action = def.find_action(request.action_name);
      Map params;
      if (!action) {
        result = failure(ErrorCode::unknown_action, "unknown action: " + request.action_name);
      } else if (def.access_type == AccessType::role_restricted &&
                 std::find(def.allowed_roles.begin(), def.allowed_roles.end(), request.agent_role) ==
                     def.allowed_roles.end()) {
        result = failure(ErrorCode::access_denied,
                         "role '" + request.agent_role + "' may not use app " + def.app_id);
      } else if (auto perr = validate_params(*action, request.params, &params)) {
        result = failure(perr->code, perr->message);
      } else {
        ExecutionContext ctx(def, current_state, std::move(params), request.agent_id,
                             resolve_config(def, request.config), config_.limits);
        Interpreter interpreter(functions_);
        RunOutcome outcome = interpreter.run(*action, ctx);

        result.stats.blocks_executed = outcome.blocks_executed;
        result.stats.loop_iterations = ctx.governor().iterations();
        result.stats.max_depth = ctx.governor().max_depth_seen();
        result.notifications = std::move(outcome.notifications);
        if (outcome.ok()) {
          result.success = true;
          result.value = std::move(outcome.value);
          AppState next = ctx.take_state();
          result.stats.state_bytes = serialized_size(next);
          result.state_digest = state_digest(next);
          result.new_state = std::move(next);
        } else {
          result.error = std::move(outcome.error);
          result.stats.state_bytes = ctx.governor().last_state_bytes();
          // Notifications from a failed run were never delivered.
          result.notifications.clear();
        }
      }
    } catch (const std::exception& e) {
      result = failure(ErrorCode::internal_error, std::string("internal error: ") + e.what());
    } catch (...) {
      result = failure(ErrorCode::internal_error, "internal error: non-standard exception");
    }
  }

  if (config_.emit_events) {
    ev.ok = result.success;
    if (result.error) {
      ev.failure = result.error->kind;
      ev.error_code = result.error->code;
      ev.error_category = to_string(result.error->category);
    }
    ev.duration_ns = result.stats.duration_ns;
    ev.blocks_executed = result.stats.blocks_executed;
    ev.loop_iterations = result.stats.loop_iterations;
    ev.max_depth = result.stats.max_depth;
    ev.notifications = result.notifications.size();
    ev.state_bytes = result.stats.state_bytes;
    ev.state_digest = result.state_digest;
    emit_action_event(ev);
  }
  return result;
}

}  // namespace applogic
