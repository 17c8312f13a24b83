#pragma once

// applogic/types.hpp - Shared error vocabulary for the app logic runtime.
//
// DESIGN:
//   Every failure that can leave a public API is described by an ErrorCode
//   plus a human-readable message. Errors travel as values (std::optional<Error>
//   out-parameters or members), never as exceptions. The string form returned
//   by to_string() is the machine-readable code that ends up in
//   ActionResult::error.code and in the JSONL event log.
//
// CATEGORIES:
//   definition  : schema / reference problems found while loading an app.
//   parse       : malformed expression syntax, found while loading an app.
//   evaluation  : type_mismatch, division_by_zero, unknown_function, ... at run time.
//   validation  : a Validate/Error block fired, or params/access were rejected.
//   safety_limit: loop, nesting or state-size ceiling crossed.
//
// EXTENSION_POINT: localized_messages
//   Messages are English only. Codes are stable and are what callers match on.

#include <optional>
#include <string>
#include <utility>

namespace applogic {

enum class ErrorCode {
  none,
  json_parse_error,
  json_duplicate_key,
  parse_error,
  definition_error,
  type_mismatch,
  division_by_zero,
  unknown_function,
  invalid_argument,
  path_not_found,
  loop_limit_exceeded,
  nesting_limit_exceeded,
  state_size_exceeded,
  unknown_action,
  invalid_params,
  access_denied,
  validation_failed,
  action_error,
  config_invalid,
  internal_error,
};

std::string to_string(ErrorCode code);

enum class ErrorCategory {
  definition,
  parse,
  evaluation,
  validation,
  safety_limit,
  internal,
};

std::string to_string(ErrorCategory category);

// Maps a code onto the taxonomy bucket it belongs to.
ErrorCategory category_of(ErrorCode code);

struct Error {
  ErrorCode   code{ErrorCode::none};
  std::string message;
};

inline Error make_error(ErrorCode code, std::string message) {
  return Error{code, std::move(message)};
}

}  // namespace applogic
