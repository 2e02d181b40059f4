#pragma once

#include "runtime/cancellation.h"
#include "runtime/component/endpoint_registry.h"
#include "runtime/disaggregated/metadata_store.h"
#include "runtime/disaggregated/prefill_queue.h"
#include "runtime/disaggregated/transfer_session.h"
#include "runtime/engine/encoder.h"
#include "runtime/engine/inference_engine.h"
#include "server/config/worker_config.h"
#include "server/metrics/kv_metrics_publisher.h"
#include "server/metrics/metrics.h"
#include "worker/worker_state.h"

#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

namespace pdserve {

// Collaborators are owned by the caller and must outlive the worker.
struct PrefillWorkerDeps {
  InferenceEngine *engine{nullptr};
  disaggregated::PrefillQueue *queue{nullptr};
  disaggregated::MetadataStore *metadata{nullptr};
  disaggregated::TransferSession *session{nullptr};
  component::EndpointRegistry *registry{nullptr};
  KvMetricsPublisher *publisher{nullptr};
  MetricsRegistry *metrics{nullptr};
  // Optional; multimodal requests are dropped without one.
  Encoder *encoder{nullptr};
};

// Consumes the prefill queue, runs prefill on the local engine and ships the
// resulting KV state to the requesting decode engine.
//
// Created -> Initializing -> Ready -> Draining -> Stopped.  Request-scoped
// failures drop the request; anything else escaping the consumer thread is
// handed to the fatal handler, which by default exits the process.
class PrefillWorker : public WorkerStatus {
 public:
  static constexpr int kFatalExitCode = 2;
  using FatalHandler = std::function<void(const std::string &)>;

  PrefillWorker(const WorkerConfig &config, PrefillWorkerDeps deps,
                const CancellationToken &cancel);
  ~PrefillWorker() override;

  // Quorum check, metadata publication, consumer start.  Throws QuorumError
  // when not enough decode workers registered in time.
  void Initialize();
  // Stops the consumer and closes the engine.  Best effort; idempotent.
  void Drain();

  WorkerState State() const override { return state_.load(); }

  // One dequeue plus execution.  True when a request was executed.
  bool PollOnce();
  // Executes one request.  Returns false when it was dropped or skipped as a
  // duplicate; only unexpected errors propagate.
  bool ProcessRequest(const disaggregated::PrefillRequest &request);

  bool IsMetadataLoaded(const std::string &engine_id) const;
  std::size_t LoadedMetadataCount() const;

  void SetFatalHandler(FatalHandler handler) { fatal_handler_ = std::move(handler); }

 private:
  void ConsumeLoop();
  void Execute(const disaggregated::PrefillRequest &request);
  void EnsureRemoteMetadata(const std::string &engine_id);
  bool SeenCompleted(const std::string &request_id) const;
  void MarkCompleted(const std::string &request_id);

  const WorkerConfig &config_;
  PrefillWorkerDeps deps_;
  const CancellationToken &cancel_;
  std::atomic<WorkerState> state_{WorkerState::kCreated};
  std::atomic<bool> stop_{false};
  std::thread consumer_;
  FatalHandler fatal_handler_;

  std::shared_ptr<disaggregated::Descriptor> embeddings_;

  // Held across fetch + import so an engine is never imported twice.
  mutable std::mutex metadata_mutex_;
  mutable std::mutex mutex_;
  // Engines whose metadata was already imported into the local engine.
  std::unordered_set<std::string> loaded_metadata_;
  // Recently completed request ids, oldest first.
  std::deque<std::string> completed_order_;
  std::unordered_set<std::string> completed_;
};

}  // namespace pdserve
