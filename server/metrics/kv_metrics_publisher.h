#pragma once

#include "runtime/engine/inference_engine.h"
#include "runtime/store/kv_backend.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace pdserve {

// Load snapshot consumed by external routing/orchestration.
struct LoadSnapshot {
  int active_slots{0};
  int total_slots{0};
  int active_kv_blocks{0};
  int total_kv_blocks{0};
  int num_waiting{0};
  double gpu_cache_usage_perc{0.0};
  double gpu_prefix_cache_hit_rate{0.0};
  int64_t published_unix_ms{0};

  std::string ToJson() const;
};

// Latest-value publisher.  Publish() swaps in a new immutable snapshot and
// never blocks on readers or on the flusher; superseded values are simply
// overwritten.
class KvMetricsPublisher {
 public:
  KvMetricsPublisher() = default;
  ~KvMetricsPublisher();
  KvMetricsPublisher(const KvMetricsPublisher &) = delete;
  KvMetricsPublisher &operator=(const KvMetricsPublisher &) = delete;

  void Publish(int active_slots, int total_slots, int active_kv_blocks, int total_kv_blocks,
               int num_waiting, double gpu_cache_usage_perc, double gpu_prefix_cache_hit_rate);
  void PublishStats(const EngineStats &stats);

  // Null until the first Publish().
  std::shared_ptr<const LoadSnapshot> Snapshot() const;
  uint64_t Version() const { return version_.load(std::memory_order_acquire); }

  // Writes the latest snapshot to `key` every `interval`, skipping
  // intervals in which nothing was published.
  void StartFlusher(std::shared_ptr<KeyValueBackend> backend, std::string key,
                    std::chrono::milliseconds interval);
  void StopFlusher();

  // "load_metrics/{ns}/{component}/{instance_id}"
  static std::string FlushKey(const std::string &ns, const std::string &component,
                              const std::string &instance_id);

  std::string RenderPrometheus() const;

 private:
  void FlushLoop(std::shared_ptr<KeyValueBackend> backend, std::string key,
                 std::chrono::milliseconds interval);

  std::shared_ptr<const LoadSnapshot> snapshot_;
  std::atomic<uint64_t> version_{0};

  std::mutex flusher_mutex_;
  std::condition_variable flusher_cv_;
  bool stop_flusher_{false};
  std::thread flusher_;
};

}  // namespace pdserve
