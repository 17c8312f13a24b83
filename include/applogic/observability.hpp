#pragma once

// applogic/observability.hpp - Structured per-action observability.
//
// DESIGN:
//   ActionEvent is the canonical observable unit. Every Engine::execute() call
//   emits exactly one ActionEvent, which is:
//     - recorded in the process-wide EngineStats (always);
//     - passed to a registered hook, if one is set;
//     - otherwise JSONL-appended to the file named by APPLOGIC_EVENT_LOG.
//
// EXTENSION_POINT: simulation_timeline
//   Current: events carry identity, outcome and cost metrics only.
//   Upgrade: a hook that forwards events into the simulation's own timeline
//   store, keyed by app_instance_id.
//   Invariant: event emission must NEVER throw into execute().
//
// Events carry digests and counters only; param and state values never leave
// the engine through this layer.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "applogic/types.hpp"

namespace applogic {

// ---------------------------------------------------------------------------
// ActionEvent - per-invocation observable unit
// ---------------------------------------------------------------------------
struct ActionEvent {
  std::string app_id;
  std::string app_instance_id;
  std::string agent_id;
  std::string action;

  // Outcome
  bool        ok{false};
  ErrorCode   failure{ErrorCode::none};  // engine classification
  std::string error_code;                // as reported to the caller
  std::string error_category;

  // Cost
  uint64_t duration_ns{0};
  size_t   blocks_executed{0};
  size_t   loop_iterations{0};
  size_t   max_depth{0};
  size_t   notifications{0};
  size_t   state_bytes{0};
  std::string state_digest;  // empty on failure
};

std::string event_to_json(const ActionEvent& ev);

// ---------------------------------------------------------------------------
// LatencyHistogram - power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);
  void reset();

  // Approximate percentile, p in [0.0, 1.0]. Microseconds; 0.0 if empty.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  uint64_t sum_us() const { return sum_us_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
  // MICRO_DOCUMENTED: buckets_ and the totals sit on separate cache lines so
  // concurrent record() calls from engine threads do not false-share.
};

// ---------------------------------------------------------------------------
// FailureCounts - failures bucketed by ErrorCode
// ---------------------------------------------------------------------------
struct FailureCounts {
  static constexpr size_t kCodes = static_cast<size_t>(ErrorCode::internal_error) + 1;
  std::array<uint64_t, kCodes> counts{};

  void record(ErrorCode code) { ++counts[static_cast<size_t>(code)]; }
  uint64_t count(ErrorCode code) const { return counts[static_cast<size_t>(code)]; }
  uint64_t total() const;

  // {"<code>": n, ...} for non-zero codes only.
  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// EngineStats - global aggregated statistics
// ---------------------------------------------------------------------------
// Thread-safe. Counters are atomic; failure counts and the ring buffer use
// short mutexes.
class EngineStats {
 public:
  void record_action(const ActionEvent& ev);
  std::string to_json() const;

  alignas(64) std::atomic<uint64_t> total_actions{0};
  alignas(64) std::atomic<uint64_t> successful_actions{0};
  alignas(64) std::atomic<uint64_t> failed_actions{0};
  alignas(64) std::atomic<uint64_t> validation_failures{0};
  alignas(64) std::atomic<uint64_t> safety_violations{0};

  // Work done across all invocations.
  alignas(64) std::atomic<uint64_t> blocks_executed{0};
  alignas(64) std::atomic<uint64_t> loop_iterations{0};
  alignas(64) std::atomic<uint64_t> notifications{0};

  // Definition cache (Engine::load).
  alignas(64) std::atomic<uint64_t> definitions_loaded{0};
  alignas(64) std::atomic<uint64_t> definition_cache_hits{0};

  FailureCounts failure_snapshot() const;
  void record_failure(ErrorCode code);

  LatencyHistogram latency_histogram;

  // MICRO_OPT: O(1) circular buffer; ring_head_ is the next slot to overwrite
  // (the oldest entry once full).
  static constexpr size_t kMaxRecentEvents = 1000;
  std::vector<ActionEvent> recent_events_snapshot() const;

  // Zeroes everything. Tests only; not safe against concurrent record_action().
  void reset();

 private:
  mutable std::mutex failure_mu_;
  FailureCounts failures_;

  mutable std::mutex ring_mu_;
  std::vector<ActionEvent> ring_buffer_;
  size_t ring_head_{0};
};

// Singleton accessor
EngineStats& global_engine_stats();

// Records the event in global stats, then forwards it to the hook, or to the
// APPLOGIC_EVENT_LOG JSONL file when no hook is set. Never throws.
void emit_action_event(const ActionEvent& ev);

using ActionEventHook = void (*)(const ActionEvent&);
// nullptr restores the default JSONL sink.
void set_action_event_hook(ActionEventHook hook);

// ---------------------------------------------------------------------------
// ScopeTimer - RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace applogic
