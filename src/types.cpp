#include "applogic/types.hpp"

namespace applogic {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::json_duplicate_key: return "json_duplicate_key";
    case ErrorCode::parse_error: return "parse_error";
    case ErrorCode::definition_error: return "definition_error";
    case ErrorCode::type_mismatch: return "type_mismatch";
    case ErrorCode::division_by_zero: return "division_by_zero";
    case ErrorCode::unknown_function: return "unknown_function";
    case ErrorCode::invalid_argument: return "invalid_argument";
    case ErrorCode::path_not_found: return "path_not_found";
    case ErrorCode::loop_limit_exceeded: return "loop_limit_exceeded";
    case ErrorCode::nesting_limit_exceeded: return "nesting_limit_exceeded";
    case ErrorCode::state_size_exceeded: return "state_size_exceeded";
    case ErrorCode::unknown_action: return "unknown_action";
    case ErrorCode::invalid_params: return "invalid_params";
    case ErrorCode::access_denied: return "access_denied";
    case ErrorCode::validation_failed: return "validation_failed";
    case ErrorCode::action_error: return "action_error";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::internal_error: return "internal_error";
  }
  return "";
}

std::string to_string(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::definition:   return "definition";
    case ErrorCategory::parse:        return "parse";
    case ErrorCategory::evaluation:   return "evaluation";
    case ErrorCategory::validation:   return "validation";
    case ErrorCategory::safety_limit: return "safety_limit";
    case ErrorCategory::internal:     return "internal";
  }
  return "internal";
}

ErrorCategory category_of(ErrorCode code) {
  switch (code) {
    case ErrorCode::json_parse_error:
    case ErrorCode::json_duplicate_key:
    case ErrorCode::definition_error:
    case ErrorCode::config_invalid:
      return ErrorCategory::definition;
    case ErrorCode::parse_error:
      return ErrorCategory::parse;
    case ErrorCode::type_mismatch:
    case ErrorCode::division_by_zero:
    case ErrorCode::unknown_function:
    case ErrorCode::invalid_argument:
    case ErrorCode::path_not_found:
      return ErrorCategory::evaluation;
    case ErrorCode::unknown_action:
    case ErrorCode::invalid_params:
    case ErrorCode::access_denied:
    case ErrorCode::validation_failed:
    case ErrorCode::action_error:
      return ErrorCategory::validation;
    case ErrorCode::loop_limit_exceeded:
    case ErrorCode::nesting_limit_exceeded:
    case ErrorCode::state_size_exceeded:
      return ErrorCategory::safety_limit;
    case ErrorCode::none:
    case ErrorCode::internal_error:
      return ErrorCategory::internal;
  }
  return ErrorCategory::internal;
}

}  // namespace applogic
