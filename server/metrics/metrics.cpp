#include "server/metrics/metrics.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace pdserve {

namespace {

void RenderCounter(std::ostringstream &out, const std::string &name, const std::string &help,
                   const std::string &role, uint64_t value) {
  out << "# HELP " << name << " " << help << "\n";
  out << "# TYPE " << name << " counter\n";
  out << name << "{role=\"" << role << "\"} " << value << "\n";
}

void RenderGauge(std::ostringstream &out, const std::string &name, const std::string &help,
                 const std::string &role, int64_t value) {
  out << "# HELP " << name << " " << help << "\n";
  out << "# TYPE " << name << " gauge\n";
  out << name << "{role=\"" << role << "\"} " << value << "\n";
}

void RenderHistogram(std::ostringstream &out, const std::string &name, const std::string &help,
                     const std::string &role, const LatencyHistogram &h) {
  out << "# HELP " << name << " " << help << "\n";
  out << "# TYPE " << name << " histogram\n";
  for (std::size_t i = 0; i < LatencyHistogram::kBuckets.size(); ++i) {
    out << name << "_bucket{role=\"" << role << "\",le=\"" << std::fixed << std::setprecision(0)
        << LatencyHistogram::kBuckets[i] << "\"} " << h.counts[i].load() << "\n";
  }
  out << name << "_bucket{role=\"" << role << "\",le=\"+Inf\"} "
      << h.counts[LatencyHistogram::kBuckets.size()].load() << "\n";
  out << name << "_sum{role=\"" << role << "\"} " << h.sum_ms.load() << "\n";
  out << name << "_count{role=\"" << role << "\"} " << h.total.load() << "\n";
}

}  // namespace

void LatencyHistogram::Record(double ms) {
  total.fetch_add(1, std::memory_order_relaxed);
  sum_ms.fetch_add(static_cast<uint64_t>(std::max(0.0, ms)), std::memory_order_relaxed);
  // All buckets are cumulative: increment every bucket >= ms.
  for (std::size_t i = 0; i < kBuckets.size(); ++i) {
    if (ms <= kBuckets[i]) {
      counts[i].fetch_add(1, std::memory_order_relaxed);
    }
  }
  counts[kBuckets.size()].fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::SetRole(const std::string &role) {
  std::lock_guard<std::mutex> lock(role_mutex_);
  role_ = role;
}

void MetricsRegistry::RecordSuccess(int prompt_tokens, int completion_tokens) {
  total_requests_.fetch_add(1, std::memory_order_relaxed);
  total_prompt_tokens_.fetch_add(static_cast<uint64_t>(std::max(0, prompt_tokens)),
                                 std::memory_order_relaxed);
  total_completion_tokens_.fetch_add(static_cast<uint64_t>(std::max(0, completion_tokens)),
                                     std::memory_order_relaxed);
}

void MetricsRegistry::RecordError() { total_errors_.fetch_add(1, std::memory_order_relaxed); }

void MetricsRegistry::RecordRouterDecision(bool remote) {
  (remote ? remote_decisions_ : local_decisions_).fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordEnqueueFailure() {
  enqueue_failures_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordTransferTimeout() {
  transfer_timeouts_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordTransferWait(double wait_ms) { transfer_wait_latency_.Record(wait_ms); }

void MetricsRegistry::RecordLatency(double request_ms) { request_latency_.Record(request_ms); }

void MetricsRegistry::RecordPrefillProcessed(double prefill_ms) {
  prefill_processed_.fetch_add(1, std::memory_order_relaxed);
  prefill_latency_.Record(prefill_ms);
}

void MetricsRegistry::RecordPrefillDropped() {
  prefill_dropped_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordPrefillDuplicate() {
  prefill_duplicates_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordMetadataLoad() {
  metadata_loads_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::SetQueueDepth(int depth) { queue_depth_.store(depth, std::memory_order_relaxed); }

void MetricsRegistry::IncrementConnections() {
  active_connections_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::DecrementConnections() {
  active_connections_.fetch_sub(1, std::memory_order_relaxed);
}

std::string MetricsRegistry::RenderPrometheus() const {
  std::string role;
  {
    std::lock_guard<std::mutex> lock(role_mutex_);
    role = role_;
  }
  std::ostringstream out;

  // --- Counters ---
  RenderCounter(out, "pdserve_requests_total", "Generation requests completed", role,
                total_requests_.load());
  RenderCounter(out, "pdserve_errors_total", "Generation requests that ended in error", role,
                total_errors_.load());
  RenderCounter(out, "pdserve_prompt_tokens_total", "Prompt tokens processed", role,
                total_prompt_tokens_.load());
  RenderCounter(out, "pdserve_completion_tokens_total", "Completion tokens produced", role,
                total_completion_tokens_.load());
  RenderCounter(out, "pdserve_router_local_total", "Requests prefilled locally", role,
                local_decisions_.load());
  RenderCounter(out, "pdserve_router_remote_total", "Requests offloaded to the prefill pool", role,
                remote_decisions_.load());
  RenderCounter(out, "pdserve_enqueue_failures_total", "Prefill enqueues that exhausted retries",
                role, enqueue_failures_.load());
  RenderCounter(out, "pdserve_transfer_timeouts_total",
                "Remote KV transfers that missed the completion ceiling", role,
                transfer_timeouts_.load());
  RenderCounter(out, "pdserve_prefill_processed_total", "Prefill requests executed", role,
                prefill_processed_.load());
  RenderCounter(out, "pdserve_prefill_dropped_total", "Prefill requests dropped on error", role,
                prefill_dropped_.load());
  RenderCounter(out, "pdserve_prefill_duplicates_total", "Redelivered prefill requests skipped",
                role, prefill_duplicates_.load());
  RenderCounter(out, "pdserve_metadata_loads_total", "Remote engine metadata imports", role,
                metadata_loads_.load());

  // --- Gauges ---
  RenderGauge(out, "pdserve_prefill_queue_depth", "Last observed prefill queue depth", role,
              queue_depth_.load());
  RenderGauge(out, "pdserve_active_connections", "Open HTTP connections", role,
              active_connections_.load());

  // --- Histograms ---
  RenderHistogram(out, "pdserve_request_duration_ms", "End-to-end generation latency", role,
                  request_latency_);
  RenderHistogram(out, "pdserve_transfer_wait_ms", "Wait for remote KV state", role,
                  transfer_wait_latency_);
  RenderHistogram(out, "pdserve_prefill_duration_ms", "Prefill execution time", role,
                  prefill_latency_);
  return out.str();
}

}  // namespace pdserve
