#include "applogic/governor.hpp"

#include <algorithm>

namespace applogic {

std::optional<Error> SafetyGovernor::enter_iteration() {
  if (iterations_ >= limits_.max_loop_iterations) {
    return make_error(ErrorCode::loop_limit_exceeded,
                      "loop iteration limit of " + std::to_string(limits_.max_loop_iterations) +
                          " exceeded");
  }
  ++iterations_;
  return std::nullopt;
}

std::optional<Error> SafetyGovernor::enter_body() {
  if (depth_ + 1 > limits_.max_nesting_depth) {
    return make_error(ErrorCode::nesting_limit_exceeded,
                      "nesting depth limit of " + std::to_string(limits_.max_nesting_depth) +
                          " exceeded");
  }
  ++depth_;
  max_depth_seen_ = std::max(max_depth_seen_, depth_);
  return std::nullopt;
}

std::optional<Error> SafetyGovernor::check_state(const AppState& state) {
  last_state_bytes_ = serialized_size(state);
  if (last_state_bytes_ > limits_.max_state_bytes) {
    return make_error(ErrorCode::state_size_exceeded,
                      "state size " + std::to_string(last_state_bytes_) + " bytes exceeds limit of " +
                          std::to_string(limits_.max_state_bytes));
  }
  return std::nullopt;
}

}  // namespace applogic
