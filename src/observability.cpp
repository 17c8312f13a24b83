#include "applogic/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>

#include "applogic/jsonlite.hpp"
#include "applogic/version.hpp"

namespace applogic {

namespace {

// MICRO_OPT: bit_width gives the bucket index in O(1) (BSR / CLZ).
// Equivalent to floor(log2(x)) + 1 for x > 0.
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

void append_fixed(std::string& out, const char* fmt, double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), fmt, v);
  out += buf;
}

}  // namespace

std::string event_to_json(const ActionEvent& ev) {
  std::string line;
  line.reserve(320);
  line += "{\"event_version\":";
  line += std::to_string(version::EVENT_LOG_VERSION);
  line += ",\"app_id\":\"";
  line += jsonlite::escape(ev.app_id);
  line += "\",\"app_instance_id\":\"";
  line += jsonlite::escape(ev.app_instance_id);
  line += "\",\"agent_id\":\"";
  line += jsonlite::escape(ev.agent_id);
  line += "\",\"action\":\"";
  line += jsonlite::escape(ev.action);
  line += "\",\"ok\":";
  line += ev.ok ? "true" : "false";
  line += ",\"error_code\":\"";
  line += jsonlite::escape(ev.error_code);
  line += "\",\"error_category\":\"";
  line += ev.error_category;
  line += "\",\"duration_ns\":";
  line += std::to_string(ev.duration_ns);
  line += ",\"blocks_executed\":";
  line += std::to_string(ev.blocks_executed);
  line += ",\"loop_iterations\":";
  line += std::to_string(ev.loop_iterations);
  line += ",\"max_depth\":";
  line += std::to_string(ev.max_depth);
  line += ",\"notifications\":";
  line += std::to_string(ev.notifications);
  line += ",\"state_bytes\":";
  line += std::to_string(ev.state_bytes);
  line += ",\"state_digest\":\"";
  line += ev.state_digest;
  line += "\"}";
  return line;
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

void LatencyHistogram::reset() {
  for (auto& b : buckets_) b.store(0, std::memory_order_relaxed);
  count_.store(0, std::memory_order_relaxed);
  sum_us_.store(0, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  uint64_t counts[kBuckets];
  for (size_t i = 0; i < kBuckets; ++i) {
    counts[i] = buckets_[i].load(std::memory_order_relaxed);
  }

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += counts[i];
    if (cumulative >= target) {
      // Midpoint of bucket i; bucket 0 reports 0.5us.
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(192);
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_us\":";
  append_fixed(out, "%.2f", mean_us());
  out += ",\"p50_us\":";
  append_fixed(out, "%.2f", percentile(0.50));
  out += ",\"p95_us\":";
  append_fixed(out, "%.2f", percentile(0.95));
  out += ",\"p99_us\":";
  append_fixed(out, "%.2f", percentile(0.99));
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// FailureCounts
// ---------------------------------------------------------------------------

uint64_t FailureCounts::total() const {
  uint64_t sum = 0;
  for (uint64_t c : counts) sum += c;
  return sum;
}

std::string FailureCounts::to_json() const {
  std::string out = "{";
  bool first = true;
  for (size_t i = 0; i < kCodes; ++i) {
    if (counts[i] == 0) continue;
    if (!first) out += ',';
    first = false;
    out += '"';
    out += to_string(static_cast<ErrorCode>(i));
    out += "\":";
    out += std::to_string(counts[i]);
  }
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

void EngineStats::record_failure(ErrorCode code) {
  std::lock_guard<std::mutex> lk(failure_mu_);
  failures_.record(code);
}

FailureCounts EngineStats::failure_snapshot() const {
  std::lock_guard<std::mutex> lk(failure_mu_);
  return failures_;
}

void EngineStats::record_action(const ActionEvent& ev) {
  total_actions.fetch_add(1, std::memory_order_relaxed);
  if (ev.ok) {
    successful_actions.fetch_add(1, std::memory_order_relaxed);
  } else {
    failed_actions.fetch_add(1, std::memory_order_relaxed);
    const ErrorCategory cat = category_of(ev.failure);
    if (cat == ErrorCategory::validation) validation_failures.fetch_add(1, std::memory_order_relaxed);
    if (cat == ErrorCategory::safety_limit) safety_violations.fetch_add(1, std::memory_order_relaxed);
    record_failure(ev.failure);
  }
  blocks_executed.fetch_add(ev.blocks_executed, std::memory_order_relaxed);
  loop_iterations.fetch_add(ev.loop_iterations, std::memory_order_relaxed);
  notifications.fetch_add(ev.notifications, std::memory_order_relaxed);

  latency_histogram.record(ev.duration_ns);

  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) {
    ring_buffer_.push_back(ev);
  } else {
    ring_buffer_[ring_head_] = ev;
  }
  ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
}

std::vector<ActionEvent> EngineStats::recent_events_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) return ring_buffer_;
  // Full: oldest entry is at ring_head_.
  std::vector<ActionEvent> out;
  out.reserve(ring_buffer_.size());
  for (size_t i = 0; i < ring_buffer_.size(); ++i) {
    out.push_back(ring_buffer_[(ring_head_ + i) % kMaxRecentEvents]);
  }
  return out;
}

void EngineStats::reset() {
  for (auto* c : {&total_actions, &successful_actions, &failed_actions, &validation_failures,
                  &safety_violations, &blocks_executed, &loop_iterations, &notifications,
                  &definitions_loaded, &definition_cache_hits}) {
    c->store(0, std::memory_order_relaxed);
  }
  latency_histogram.reset();
  {
    std::lock_guard<std::mutex> lk(failure_mu_);
    failures_ = FailureCounts{};
  }
  std::lock_guard<std::mutex> lk(ring_mu_);
  ring_buffer_.clear();
  ring_head_ = 0;
}

std::string EngineStats::to_json() const {
  std::string out;
  out.reserve(768);

  const uint64_t total = total_actions.load(std::memory_order_relaxed);
  const uint64_t ok = successful_actions.load(std::memory_order_relaxed);
  const double success_rate = total > 0 ? static_cast<double>(ok) / static_cast<double>(total) : 0.0;

  out += "{\"total_actions\":";
  out += std::to_string(total);
  out += ",\"successful_actions\":";
  out += std::to_string(ok);
  out += ",\"failed_actions\":";
  out += std::to_string(failed_actions.load(std::memory_order_relaxed));
  out += ",\"success_rate\":";
  append_fixed(out, "%.6f", success_rate);
  out += ",\"validation_failures\":";
  out += std::to_string(validation_failures.load(std::memory_order_relaxed));
  out += ",\"safety_violations\":";
  out += std::to_string(safety_violations.load(std::memory_order_relaxed));

  out += ",\"work\":{\"blocks_executed\":";
  out += std::to_string(blocks_executed.load(std::memory_order_relaxed));
  out += ",\"loop_iterations\":";
  out += std::to_string(loop_iterations.load(std::memory_order_relaxed));
  out += ",\"notifications\":";
  out += std::to_string(notifications.load(std::memory_order_relaxed));
  out += "}";

  out += ",\"definitions\":{\"loaded\":";
  out += std::to_string(definitions_loaded.load(std::memory_order_relaxed));
  out += ",\"cache_hits\":";
  out += std::to_string(definition_cache_hits.load(std::memory_order_relaxed));
  out += "}";

  out += ",\"latency\":";
  out += latency_histogram.to_json();

  out += ",\"failures\":";
  out += failure_snapshot().to_json();
  out += "}";
  return out;
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

EngineStats& global_engine_stats() {
  static EngineStats inst;
  return inst;
}

namespace {
std::atomic<ActionEventHook> g_event_hook{nullptr};
std::mutex g_log_mu;
}  // namespace

void set_action_event_hook(ActionEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_action_event(const ActionEvent& ev) {
  global_engine_stats().record_action(ev);

  ActionEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  // Activation: APPLOGIC_EVENT_LOG=/path/to/events.jsonl, one object per line.
  const char* log_path = std::getenv("APPLOGIC_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  std::string line = event_to_json(ev);
  line += '\n';

  std::lock_guard<std::mutex> lk(g_log_mu);
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace applogic
