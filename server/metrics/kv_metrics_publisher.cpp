#include "server/metrics/kv_metrics_publisher.h"

#include "runtime/errors.h"
#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <sstream>

namespace pdserve {

std::string LoadSnapshot::ToJson() const {
  nlohmann::json j = {{"active_slots", active_slots},
                      {"total_slots", total_slots},
                      {"active_kv_blocks", active_kv_blocks},
                      {"total_kv_blocks", total_kv_blocks},
                      {"num_waiting", num_waiting},
                      {"gpu_cache_usage_perc", gpu_cache_usage_perc},
                      {"gpu_prefix_cache_hit_rate", gpu_prefix_cache_hit_rate},
                      {"published_unix_ms", published_unix_ms}};
  return j.dump();
}

KvMetricsPublisher::~KvMetricsPublisher() { StopFlusher(); }

void KvMetricsPublisher::Publish(int active_slots, int total_slots, int active_kv_blocks,
                                 int total_kv_blocks, int num_waiting,
                                 double gpu_cache_usage_perc, double gpu_prefix_cache_hit_rate) {
  auto next = std::make_shared<LoadSnapshot>();
  next->active_slots = active_slots;
  next->total_slots = total_slots;
  next->active_kv_blocks = active_kv_blocks;
  next->total_kv_blocks = total_kv_blocks;
  next->num_waiting = num_waiting;
  next->gpu_cache_usage_perc = gpu_cache_usage_perc;
  next->gpu_prefix_cache_hit_rate = gpu_prefix_cache_hit_rate;
  next->published_unix_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::system_clock::now().time_since_epoch())
                                .count();
  std::atomic_store(&snapshot_, std::shared_ptr<const LoadSnapshot>(std::move(next)));
  version_.fetch_add(1, std::memory_order_acq_rel);
}

void KvMetricsPublisher::PublishStats(const EngineStats &stats) {
  Publish(stats.active_slots, stats.total_slots, stats.active_kv_blocks, stats.total_kv_blocks,
          stats.num_waiting, stats.gpu_cache_usage_perc, stats.gpu_prefix_cache_hit_rate);
}

std::shared_ptr<const LoadSnapshot> KvMetricsPublisher::Snapshot() const {
  return std::atomic_load(&snapshot_);
}

std::string KvMetricsPublisher::FlushKey(const std::string &ns, const std::string &component,
                                         const std::string &instance_id) {
  return "load_metrics/" + ns + "/" + component + "/" + instance_id;
}

void KvMetricsPublisher::StartFlusher(std::shared_ptr<KeyValueBackend> backend, std::string key,
                                      std::chrono::milliseconds interval) {
  std::lock_guard<std::mutex> lock(flusher_mutex_);
  if (flusher_.joinable()) return;
  stop_flusher_ = false;
  flusher_ = std::thread(&KvMetricsPublisher::FlushLoop, this, std::move(backend), std::move(key),
                         interval);
}

void KvMetricsPublisher::StopFlusher() {
  std::thread flusher;
  {
    std::lock_guard<std::mutex> lock(flusher_mutex_);
    stop_flusher_ = true;
    flusher = std::move(flusher_);
  }
  flusher_cv_.notify_all();
  if (flusher.joinable()) flusher.join();
}

void KvMetricsPublisher::FlushLoop(std::shared_ptr<KeyValueBackend> backend, std::string key,
                                   std::chrono::milliseconds interval) {
  uint64_t flushed_version = 0;
  while (true) {
    {
      std::unique_lock<std::mutex> lock(flusher_mutex_);
      if (flusher_cv_.wait_for(lock, interval, [this] { return stop_flusher_; })) return;
    }
    const uint64_t version = Version();
    if (version == flushed_version) continue;
    auto snapshot = Snapshot();
    if (!snapshot) continue;
    try {
      backend->Put(key, snapshot->ToJson());
      flushed_version = version;
    } catch (const BrokerUnavailable &e) {
      log::Warn("kv_metrics", "load snapshot flush failed", "key=" + key + " error=" + e.what());
    }
  }
}

std::string KvMetricsPublisher::RenderPrometheus() const {
  auto snapshot = Snapshot();
  if (!snapshot) return {};
  std::ostringstream out;
  auto gauge = [&out](const char *name, const char *help, double value) {
    out << "# HELP " << name << " " << help << "\n";
    out << "# TYPE " << name << " gauge\n";
    out << name << " " << value << "\n";
  };
  gauge("pdserve_load_active_slots", "Sequence slots in use", snapshot->active_slots);
  gauge("pdserve_load_total_slots", "Sequence slots available", snapshot->total_slots);
  gauge("pdserve_load_active_kv_blocks", "KV blocks in use", snapshot->active_kv_blocks);
  gauge("pdserve_load_total_kv_blocks", "KV blocks available", snapshot->total_kv_blocks);
  gauge("pdserve_load_num_waiting", "Requests waiting for a slot", snapshot->num_waiting);
  gauge("pdserve_load_gpu_cache_usage_perc", "KV cache usage fraction",
        snapshot->gpu_cache_usage_perc);
  gauge("pdserve_load_gpu_prefix_cache_hit_rate", "Prefix cache hit rate",
        snapshot->gpu_prefix_cache_hit_rate);
  gauge("pdserve_load_snapshot_version", "Load snapshots published",
        static_cast<double>(Version()));
  return out.str();
}

}  // namespace pdserve
