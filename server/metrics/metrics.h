#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

namespace pdserve {

// Latency histogram with fixed buckets (in milliseconds).
// Prometheus-compatible: cumulative counts per bucket + _sum + _count.
struct LatencyHistogram {
  // Upper bounds in milliseconds: 10, 50, 100, 250, 500, 1000, 2500, 5000, +Inf
  static constexpr std::array<double, 8> kBuckets{
      10.0, 50.0, 100.0, 250.0, 500.0, 1000.0, 2500.0, 5000.0};
  std::array<std::atomic<uint64_t>, 9> counts{};  // 8 finite + 1 +Inf
  std::atomic<uint64_t> sum_ms{0};
  std::atomic<uint64_t> total{0};

  void Record(double ms);
};

// Process counters for the coordinator.  One instance per process, owned by
// main() and passed to the workers and the HTTP server.
class MetricsRegistry {
 public:
  void SetRole(const std::string &role);

  // Decode path.
  void RecordSuccess(int prompt_tokens, int completion_tokens);
  void RecordError();
  void RecordRouterDecision(bool remote);
  void RecordEnqueueFailure();
  void RecordTransferTimeout();
  void RecordTransferWait(double wait_ms);
  void RecordLatency(double request_ms);

  // Prefill path.
  void RecordPrefillProcessed(double prefill_ms);
  void RecordPrefillDropped();
  void RecordPrefillDuplicate();
  void RecordMetadataLoad();

  // Gauges.
  void SetQueueDepth(int depth);
  void IncrementConnections();
  void DecrementConnections();

  uint64_t Errors() const { return total_errors_.load(); }
  uint64_t LocalDecisions() const { return local_decisions_.load(); }
  uint64_t RemoteDecisions() const { return remote_decisions_.load(); }
  uint64_t EnqueueFailures() const { return enqueue_failures_.load(); }
  uint64_t TransferTimeouts() const { return transfer_timeouts_.load(); }
  uint64_t PrefillProcessed() const { return prefill_processed_.load(); }
  uint64_t PrefillDropped() const { return prefill_dropped_.load(); }
  uint64_t PrefillDuplicates() const { return prefill_duplicates_.load(); }
  uint64_t MetadataLoads() const { return metadata_loads_.load(); }

  std::string RenderPrometheus() const;

 private:
  mutable std::mutex role_mutex_;
  std::string role_{"decode"};

  std::atomic<uint64_t> total_requests_{0};
  std::atomic<uint64_t> total_errors_{0};
  std::atomic<uint64_t> total_prompt_tokens_{0};
  std::atomic<uint64_t> total_completion_tokens_{0};
  std::atomic<uint64_t> local_decisions_{0};
  std::atomic<uint64_t> remote_decisions_{0};
  std::atomic<uint64_t> enqueue_failures_{0};
  std::atomic<uint64_t> transfer_timeouts_{0};
  std::atomic<uint64_t> prefill_processed_{0};
  std::atomic<uint64_t> prefill_dropped_{0};
  std::atomic<uint64_t> prefill_duplicates_{0};
  std::atomic<uint64_t> metadata_loads_{0};

  LatencyHistogram request_latency_;
  LatencyHistogram transfer_wait_latency_;
  LatencyHistogram prefill_latency_;

  std::atomic<int> queue_depth_{0};
  std::atomic<int> active_connections_{0};
};

}  // namespace pdserve
