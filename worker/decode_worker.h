#pragma once

#include "runtime/disaggregated/disagg_router.h"
#include "runtime/disaggregated/metadata_store.h"
#include "runtime/disaggregated/prefill_queue.h"
#include "runtime/disaggregated/transfer_session.h"
#include "runtime/engine/inference_engine.h"
#include "server/config/worker_config.h"
#include "server/metrics/kv_metrics_publisher.h"
#include "server/metrics/metrics.h"
#include "worker/worker_state.h"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace pdserve {

// Typed generation request, validated at the HTTP boundary.
struct GenerateRequest {
  // Client-supplied correlation id, logged only.  The prefill request id is
  // always generated so retries and colliding clients never alias.
  std::string request_id;
  std::vector<int32_t> token_ids;
  SamplingParams sampling;
};

// One streamed increment.  finish_reason is set only on the terminal delta.
struct ResponseDelta {
  std::vector<int32_t> token_ids;
  std::string finish_reason;
  std::string stop_reason;
};

using DeltaCallback = std::function<void(const ResponseDelta &)>;

struct DecodeWorkerDeps {
  InferenceEngine *engine{nullptr};
  KvMetricsPublisher *publisher{nullptr};
  MetricsRegistry *metrics{nullptr};
  // Required when router.remote_prefill is set.
  disaggregated::PrefillQueue *queue{nullptr};
  disaggregated::TransferSession *session{nullptr};
  // Where prefill workers look up this engine's transfer metadata.
  disaggregated::MetadataStore *metadata{nullptr};
};

// Accepts generation requests, decides local vs remote prefill and streams
// the engine output back as response deltas.
class DecodeWorker : public WorkerStatus {
 public:
  DecodeWorker(const WorkerConfig &config, DecodeWorkerDeps deps);
  ~DecodeWorker() override;

  // Registers the KV receive buffers, publishes the engine metadata and the
  // startup load snapshot.
  void Initialize();
  void Drain();

  WorkerState State() const override { return state_.load(); }

  // Runs on the calling thread.  Always ends the stream with exactly one
  // delta carrying finish_reason; request-level failures become
  // finish_reason "error" and never throw.
  void Generate(const GenerateRequest &request, const DeltaCallback &on_delta);

  // No outputs -> "error"; finished -> "stop" with no tokens; otherwise the
  // increment's tokens and no finish_reason.
  static ResponseDelta MapResult(const EngineResult &result);

  const disaggregated::DisaggregatedRouter &Router() const { return router_; }
  bool RemotePrefillEnabled() const { return pool_ != nullptr; }

 private:
  bool DecideRemote(std::size_t prompt_length);
  void RunRemote(const EngineRequest &request, const ResultCallback &on_result);
  std::string NextRequestId();

  const WorkerConfig &config_;
  DecodeWorkerDeps deps_;
  disaggregated::DisaggregatedRouter router_;
  std::unique_ptr<disaggregated::DescriptorPool> pool_;
  std::atomic<WorkerState> state_{WorkerState::kCreated};
  std::string id_prefix_;
  std::atomic<uint64_t> next_id_{0};
};

}  // namespace pdserve
