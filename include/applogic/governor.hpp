#pragma once

// applogic/governor.hpp - Invocation-wide resource ceilings.
//
// One SafetyGovernor lives for exactly one execute() call. Counters are
// cumulative across the whole invocation: nested loops share one iteration
// budget, and depth counts every branch/loop body currently open.
//
// INVARIANTS:
//   - enter_iteration() refuses once `iterations == max_loop_iterations`, so a
//     loop over N > max elements runs exactly max bodies and then fails.
//   - enter_body() refuses when the new depth would exceed max_nesting_depth.
//     The top-level logic list is depth 0.
//   - check_state() runs after every Update block. On any violation the
//     invocation ends and the working state is discarded by the caller.

#include <cstddef>
#include <optional>

#include "applogic/state.hpp"
#include "applogic/types.hpp"

namespace applogic {

struct SafetyLimits {
  std::size_t max_loop_iterations{1000};
  std::size_t max_nesting_depth{10};
  std::size_t max_state_bytes{1048576};  // 1 MiB
};

class SafetyGovernor {
 public:
  explicit SafetyGovernor(SafetyLimits limits) : limits_(limits) {}

  std::optional<Error> enter_iteration();
  std::optional<Error> enter_body();
  void exit_body() {
    if (depth_ > 0) --depth_;
  }
  std::optional<Error> check_state(const AppState& state);

  const SafetyLimits& limits() const { return limits_; }
  std::size_t iterations() const { return iterations_; }
  std::size_t depth() const { return depth_; }
  std::size_t max_depth_seen() const { return max_depth_seen_; }
  std::size_t last_state_bytes() const { return last_state_bytes_; }

 private:
  SafetyLimits limits_;
  std::size_t  iterations_{0};
  std::size_t  depth_{0};
  std::size_t  max_depth_seen_{0};
  std::size_t  last_state_bytes_{0};
};

// RAII depth guard for one branch arm or loop body.
class BodyScope {
 public:
  explicit BodyScope(SafetyGovernor& governor) : governor_(governor), error_(governor.enter_body()) {}
  ~BodyScope() {
    if (!error_) governor_.exit_body();
  }
  BodyScope(const BodyScope&) = delete;
  BodyScope& operator=(const BodyScope&) = delete;

  const std::optional<Error>& error() const { return error_; }

 private:
  SafetyGovernor&      governor_;
  std::optional<Error> error_;
};

}  // namespace applogic
