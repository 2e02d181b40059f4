#include "worker/prefill_worker.h"

#include "runtime/errors.h"
#include "server/logging/logger.h"

#include <chrono>
#include <cstdio>
#include <cstdlib>

namespace pdserve {

PrefillWorker::PrefillWorker(const WorkerConfig &config, PrefillWorkerDeps deps,
                             const CancellationToken &cancel)
    : config_(config), deps_(deps), cancel_(cancel) {
  if (!deps_.engine || !deps_.queue || !deps_.metadata || !deps_.session || !deps_.registry ||
      !deps_.publisher || !deps_.metrics) {
    throw ConfigError("prefill worker is missing a collaborator");
  }
  fatal_handler_ = [](const std::string &reason) {
    log::Error("prefill", "consumer failed, exiting", "error=" + reason);
    std::fflush(stderr);
    // Other threads are still running; skip static destructors.
    std::_Exit(kFatalExitCode);
  };
}

PrefillWorker::~PrefillWorker() { Drain(); }

void PrefillWorker::Initialize() {
  WorkerState expected = WorkerState::kCreated;
  if (!state_.compare_exchange_strong(expected, WorkerState::kInitializing)) {
    throw ConfigError(std::string("prefill worker cannot initialize from state ") +
                      WorkerStateName(expected));
  }
  try {
    if (config_.prefill.min_peer_workers > 0) {
      component::EndpointAddress peers{config_.ns, config_.prefill.peer_component,
                                       config_.prefill.peer_endpoint};
      auto client = deps_.registry->Client(peers);
      const bool ok = client.WaitForInstances(
          static_cast<std::size_t>(config_.prefill.min_peer_workers),
          std::chrono::milliseconds(config_.prefill.peer_wait_timeout_ms), &cancel_);
      if (!ok) {
        throw QuorumError("fewer than " + std::to_string(config_.prefill.min_peer_workers) +
                          " instances of " + peers.Url() + " registered within " +
                          std::to_string(config_.prefill.peer_wait_timeout_ms) + "ms");
      }
    }

    deps_.metadata->Put(deps_.engine->Metadata());

    if (deps_.encoder != nullptr) {
      embeddings_ = deps_.session->Register(
          disaggregated::TransferBuffer{deps_.encoder->EmbeddingSpec(), {}},
          config_.transfer.eager_registration ? disaggregated::RegistrationMode::kEager
                                              : disaggregated::RegistrationMode::kLazy);
    }

    const EngineStats stats = deps_.engine->Stats();
    deps_.publisher->Publish(0, stats.total_slots, 0, stats.total_kv_blocks, 0, 0.0, 0.0);
  } catch (...) {
    state_.store(WorkerState::kStopped);
    throw;
  }

  stop_.store(false);
  consumer_ = std::thread(&PrefillWorker::ConsumeLoop, this);
  state_.store(WorkerState::kReady);
  log::Info("prefill", "prefill worker ready",
            "stream=" + deps_.queue->Stream() + " engine_id=" + deps_.engine->Metadata().engine_id);
}

void PrefillWorker::Drain() {
  WorkerState current = state_.load();
  if (current == WorkerState::kStopped || current == WorkerState::kDraining) return;
  state_.store(WorkerState::kDraining);
  stop_.store(true);
  if (consumer_.joinable()) {
    if (consumer_.get_id() == std::this_thread::get_id()) {
      consumer_.detach();
    } else {
      consumer_.join();
    }
  }
  try {
    deps_.engine->Close();
  } catch (const std::exception &e) {
    log::Warn("prefill", "engine close failed", std::string("error=") + e.what());
  }
  state_.store(WorkerState::kStopped);
  log::Info("prefill", "prefill worker stopped");
}

void PrefillWorker::ConsumeLoop() {
  while (!stop_.load() && !cancel_.IsCancelled()) {
    try {
      PollOnce();
    } catch (const std::exception &e) {
      fatal_handler_(e.what());
      return;
    }
  }
}

bool PrefillWorker::PollOnce() {
  auto request = deps_.queue->Dequeue();
  deps_.metrics->SetQueueDepth(deps_.queue->Size());
  if (!request) return false;
  return ProcessRequest(*request);
}

bool PrefillWorker::ProcessRequest(const disaggregated::PrefillRequest &request) {
  if (SeenCompleted(request.request_id)) {
    deps_.metrics->RecordPrefillDuplicate();
    log::Info("prefill", "skipping redelivered request", "request_id=" + request.request_id);
    return false;
  }
  const auto start = std::chrono::steady_clock::now();
  try {
    Execute(request);
  } catch (const PayloadError &e) {
    deps_.metrics->RecordPrefillDropped();
    log::Error("prefill", "dropping malformed request",
               "request_id=" + request.request_id + " error=" + e.what());
    return false;
  } catch (const MetadataUnavailable &e) {
    deps_.metrics->RecordPrefillDropped();
    log::Error("prefill", "dropping request, decode engine metadata unavailable",
               "request_id=" + request.request_id + " error=" + e.what());
    return false;
  } catch (const TransferError &e) {
    deps_.metrics->RecordPrefillDropped();
    log::Error("prefill", "dropping request, transfer failed",
               "request_id=" + request.request_id + " error=" + e.what());
    return false;
  } catch (const EngineError &e) {
    deps_.metrics->RecordPrefillDropped();
    log::Error("prefill", "dropping request, engine rejected it",
               "request_id=" + request.request_id + " error=" + e.what());
    return false;
  }
  MarkCompleted(request.request_id);
  const double ms =
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
  deps_.metrics->RecordPrefillProcessed(ms);
  deps_.publisher->PublishStats(deps_.engine->Stats());
  return true;
}

void PrefillWorker::Execute(const disaggregated::PrefillRequest &request) {
  if (request.prompt_token_ids.empty()) {
    throw PayloadError("request has no prompt tokens");
  }
  EnsureRemoteMetadata(request.engine_id);

  EngineRequest engine_request;
  engine_request.request_id = request.request_id;
  engine_request.token_ids = request.prompt_token_ids;
  engine_request.sampling = request.sampling_params;
  engine_request.sampling.max_tokens = 1;
  engine_request.sampling.min_tokens = 1;

  // Embeddings stay locked in the registered buffer until generation ends.
  std::unique_ptr<disaggregated::WritableOperation> embeddings_write;
  if (request.multimodal_data_source) {
    const std::string &url = request.multimodal_data_source->image_url;
    if (url.empty()) throw PayloadError("multimodal request without image_url");
    if (deps_.encoder == nullptr || !embeddings_) {
      throw PayloadError("multimodal request but no encoder is configured");
    }
    embeddings_write = deps_.session->CreateWritable(embeddings_);
    deps_.encoder->Encode(request.request_id, url, embeddings_write->Serialize());
    if (!embeddings_write->WaitForCompletion(
            std::chrono::milliseconds(config_.transfer.completion_timeout_ms))) {
      throw TransferError("embeddings for " + request.request_id + " not written in time");
    }
    engine_request.embeddings = embeddings_;
  }

  RemotePrefillParams remote;
  remote.is_remote_decode = true;
  remote.decode_block_ids = request.block_ids;
  remote.decode_computed_block_ids = request.computed_block_ids;
  remote.decode_engine_id = request.engine_id;
  remote.transfer_descriptor = request.transfer_descriptor;

  deps_.engine->Generate(engine_request, remote, [](const EngineResult &) {});
  log::Debug("prefill", "prefill complete",
             "request_id=" + request.request_id +
                 " tokens=" + std::to_string(request.prompt_token_ids.size()));
}

void PrefillWorker::EnsureRemoteMetadata(const std::string &engine_id) {
  std::lock_guard<std::mutex> guard(metadata_mutex_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (loaded_metadata_.count(engine_id) > 0) return;
  }
  const EngineMetadata metadata = deps_.metadata->Get(engine_id, &cancel_);
  deps_.engine->AddRemoteMetadata(metadata);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    loaded_metadata_.insert(engine_id);
  }
  deps_.metrics->RecordMetadataLoad();
  log::Info("prefill", "imported decode engine metadata", "engine_id=" + engine_id);
}

bool PrefillWorker::IsMetadataLoaded(const std::string &engine_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return loaded_metadata_.count(engine_id) > 0;
}

std::size_t PrefillWorker::LoadedMetadataCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return loaded_metadata_.size();
}

bool PrefillWorker::SeenCompleted(const std::string &request_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return completed_.count(request_id) > 0;
}

void PrefillWorker::MarkCompleted(const std::string &request_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!completed_.insert(request_id).second) return;
  completed_order_.push_back(request_id);
  while (completed_order_.size() > static_cast<std::size_t>(config_.prefill.completed_cache_size)) {
    completed_.erase(completed_order_.front());
    completed_order_.pop_front();
  }
}

}  // namespace pdserve
