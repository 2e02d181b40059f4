#pragma once

#include "runtime/disaggregated/prefill_request.h"
#include "runtime/disaggregated/stream_broker.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace pdserve {
namespace disaggregated {

struct PrefillQueueOptions {
  std::string stream;
  int max_retries{3};
  std::chrono::milliseconds retry_backoff{50};
  std::chrono::milliseconds max_backoff{2000};
  std::chrono::milliseconds dequeue_timeout{1000};
};

// Shared queue of pending remote-prefill requests on top of a StreamBroker.
// One instance per process; the broker connection is reused for its lifetime.
class PrefillQueue {
 public:
  PrefillQueue(std::shared_ptr<StreamBroker> broker, PrefillQueueOptions options);

  // "{namespace}_prefill_queue"; falls back to the served model name, then
  // to "pdserve", when the namespace is empty.
  static std::string StreamName(const std::string &ns, const std::string &served_model_name);

  // Retries transient broker failures with exponential backoff.  Throws
  // QueueError once the retry budget is spent or after Close().
  void Enqueue(const PrefillRequest &request);

  // Waits up to the dequeue timeout.  nullopt on timeout, on a transient
  // broker failure, or when the payload was malformed (logged and
  // discarded).  Successfully decoded messages are acknowledged.
  std::optional<PrefillRequest> Dequeue();

  // Approximate pending depth.  On a broker failure the last observed value
  // is returned.
  int Size() const;

  void Close();
  bool Closed() const { return closed_.load(); }

  const std::string &Stream() const { return options_.stream; }
  uint64_t DiscardedPayloads() const { return discarded_.load(); }

 private:
  void EnsureStream();

  std::shared_ptr<StreamBroker> broker_;
  PrefillQueueOptions options_;
  std::mutex stream_mutex_;
  bool stream_ready_{false};
  std::atomic<bool> closed_{false};
  mutable std::atomic<int> last_size_{0};
  std::atomic<uint64_t> discarded_{0};
};

}  // namespace disaggregated
}  // namespace pdserve
