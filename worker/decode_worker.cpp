#include "worker/decode_worker.h"

#include "runtime/component/endpoint_registry.h"
#include "runtime/errors.h"
#include "server/logging/logger.h"

#include <chrono>

namespace pdserve {

namespace {

ResponseDelta ErrorDelta() {
  ResponseDelta delta;
  delta.finish_reason = "error";
  return delta;
}

}  // namespace

DecodeWorker::DecodeWorker(const WorkerConfig &config, DecodeWorkerDeps deps)
    : config_(config), deps_(deps),
      router_(disaggregated::RouterOptions{config.router.max_local_prefill_length,
                                           config.router.max_prefill_queue_size}),
      id_prefix_(component::EndpointRegistry::NewInstanceId().substr(0, 8)) {
  if (!deps_.engine || !deps_.publisher || !deps_.metrics) {
    throw ConfigError("decode worker is missing a collaborator");
  }
  if (config_.router.remote_prefill && (!deps_.queue || !deps_.session || !deps_.metadata)) {
    throw ConfigError("remote prefill needs a prefill queue, a transfer session and a metadata store");
  }
}

DecodeWorker::~DecodeWorker() { Drain(); }

void DecodeWorker::Initialize() {
  WorkerState expected = WorkerState::kCreated;
  if (!state_.compare_exchange_strong(expected, WorkerState::kInitializing)) {
    throw ConfigError(std::string("decode worker cannot initialize from state ") +
                      WorkerStateName(expected));
  }
  try {
    if (config_.router.remote_prefill) {
      disaggregated::TensorSpec spec;
      spec.shape = {config_.transfer.kv_buffer_bytes};
      spec.dtype = "uint8";
      pool_ = std::make_unique<disaggregated::DescriptorPool>(
          *deps_.session, static_cast<std::size_t>(config_.transfer.descriptor_pool_size), spec,
          config_.transfer.eager_registration ? disaggregated::RegistrationMode::kEager
                                              : disaggregated::RegistrationMode::kLazy);
      deps_.metadata->Put(deps_.engine->Metadata());
    }
    // Consumers see no signal until the first publication.
    const EngineStats stats = deps_.engine->Stats();
    deps_.publisher->Publish(0, stats.total_slots, 0, stats.total_kv_blocks, 0, 0.0, 0.0);
  } catch (...) {
    state_.store(WorkerState::kStopped);
    throw;
  }
  state_.store(WorkerState::kReady);
  log::Info("decode", "decode worker ready",
            std::string("remote_prefill=") + (pool_ ? "true" : "false") +
                " engine_id=" + deps_.engine->Metadata().engine_id);
}

void DecodeWorker::Drain() {
  WorkerState current = state_.load();
  if (current == WorkerState::kStopped || current == WorkerState::kDraining) return;
  state_.store(WorkerState::kDraining);
  try {
    deps_.engine->Close();
  } catch (const std::exception &e) {
    log::Warn("decode", "engine close failed", std::string("error=") + e.what());
  }
  state_.store(WorkerState::kStopped);
  log::Info("decode", "decode worker stopped");
}

std::string DecodeWorker::NextRequestId() {
  return "req-" + id_prefix_ + "-" + std::to_string(next_id_.fetch_add(1));
}

ResponseDelta DecodeWorker::MapResult(const EngineResult &result) {
  ResponseDelta delta;
  if (result.outputs.empty()) {
    delta.finish_reason = "error";
    return delta;
  }
  if (result.finished) {
    delta.finish_reason = "stop";
    delta.stop_reason = result.outputs.front().stop_reason;
    return delta;
  }
  delta.token_ids = result.outputs.front().token_ids;
  return delta;
}

bool DecodeWorker::DecideRemote(std::size_t prompt_length) {
  if (!pool_) return false;
  bool remote = true;
  if (config_.router.conditional_disagg) {
    const int depth = deps_.queue->Size();
    deps_.metrics->SetQueueDepth(depth);
    remote = router_.Decide(static_cast<int>(prompt_length), 0.0, depth);
  }
  if (remote && deps_.engine->KvStateBytes(prompt_length) >
                    static_cast<std::size_t>(config_.transfer.kv_buffer_bytes)) {
    log::Warn("decode", "prompt KV state exceeds the receive buffer, prefilling locally",
              "tokens=" + std::to_string(prompt_length));
    remote = false;
  }
  return remote;
}

void DecodeWorker::RunRemote(const EngineRequest &request, const ResultCallback &on_result) {
  const auto ceiling = std::chrono::milliseconds(config_.transfer.completion_timeout_ms);
  auto lease = pool_->Acquire(ceiling);
  if (!lease) {
    throw TransferError("no KV receive buffer became free within " +
                        std::to_string(ceiling.count()) + "ms");
  }
  // Declared after the lease: the operation must be released first.
  auto writable = deps_.session->CreateWritable(lease.Get());
  const std::string handle = writable->Serialize();

  RemotePrefillParams remote;
  remote.is_remote_prefill = true;
  remote.remote_kv = lease.Get();
  remote.remote_prefill_request_callback = [this, &handle](const RemotePrefillRequest &r) {
    disaggregated::PrefillRequest prefill;
    prefill.request_id = r.request_id;
    prefill.engine_id = r.engine_id;
    prefill.prompt_token_ids = r.prompt_token_ids;
    prefill.block_ids = r.block_ids;
    prefill.computed_block_ids = r.computed_block_ids;
    prefill.sampling_params = r.sampling_params;
    prefill.transfer_descriptor = handle;
    deps_.queue->Enqueue(prefill);
  };
  remote.wait_for_remote_kv = [this, &writable, ceiling, &request]() {
    const auto start = std::chrono::steady_clock::now();
    const bool done = writable->WaitForCompletion(ceiling);
    deps_.metrics->RecordTransferWait(
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start)
            .count());
    if (!done) {
      deps_.metrics->RecordTransferTimeout();
      log::Warn("decode", "remote prefill timed out", "request_id=" + request.request_id);
    }
    return done;
  };
  deps_.engine->Generate(request, remote, on_result);
}

void DecodeWorker::Generate(const GenerateRequest &request, const DeltaCallback &on_delta) {
  const auto start = std::chrono::steady_clock::now();
  EngineRequest engine_request;
  engine_request.request_id = NextRequestId();
  const std::string log_ids =
      "request_id=" + engine_request.request_id +
      (request.request_id.empty() ? "" : " client_request_id=" + request.request_id);
  engine_request.token_ids = request.token_ids;
  engine_request.sampling = request.sampling;

  bool terminated = false;
  bool failed = false;
  int completion_tokens = 0;
  auto emit = [&](const ResponseDelta &delta) {
    if (terminated) return;
    if (!delta.finish_reason.empty()) {
      terminated = true;
      failed = delta.finish_reason == "error";
    }
    completion_tokens += static_cast<int>(delta.token_ids.size());
    on_delta(delta);
  };
  auto fail = [&](const std::string &what, const std::string &error) {
    log::Error("decode", what, log_ids + " error=" + error);
    emit(ErrorDelta());
  };

  if (state_.load() != WorkerState::kReady) {
    fail("worker not ready", WorkerStateName(state_.load()));
  } else if (request.token_ids.empty()) {
    fail("rejecting request", "empty token_ids");
  } else {
    auto on_result = [&](const EngineResult &result) { emit(MapResult(result)); };
    try {
      const bool remote = DecideRemote(request.token_ids.size());
      deps_.metrics->RecordRouterDecision(remote);
      log::Debug("decode", remote ? "prefilling remotely" : "prefilling locally",
                 log_ids + " prompt_tokens=" + std::to_string(request.token_ids.size()));
      if (remote) {
        RunRemote(engine_request, on_result);
      } else {
        deps_.engine->Generate(engine_request, RemotePrefillParams{}, on_result);
      }
    } catch (const QueueError &e) {
      deps_.metrics->RecordEnqueueFailure();
      fail("prefill enqueue failed", e.what());
    } catch (const TransferError &e) {
      fail("KV transfer failed", e.what());
    } catch (const EngineError &e) {
      fail("engine error", e.what());
    } catch (const std::exception &e) {
      fail("request failed", e.what());
    }
    if (!terminated) fail("engine ended without a terminal result", "");
  }

  const double ms =
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
  deps_.metrics->RecordLatency(ms);
  if (failed) {
    deps_.metrics->RecordError();
  } else {
    deps_.metrics->RecordSuccess(static_cast<int>(request.token_ids.size()), completion_tokens);
  }
  if (state_.load() == WorkerState::kReady) {
    deps_.publisher->PublishStats(deps_.engine->Stats());
  }
}

}  // namespace pdserve
