#include <catch2/catch.hpp>

#include "runtime/cancellation.h"
#include "runtime/component/endpoint_registry.h"
#include "runtime/disaggregated/stream_broker.h"
#include "runtime/engine/echo_engine.h"
#include "runtime/errors.h"
#include "runtime/store/kv_backend.h"
#include "worker/decode_worker.h"
#include "worker/prefill_worker.h"

#include <chrono>
#include <memory>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

using namespace pdserve;
using namespace pdserve::disaggregated;
using namespace std::chrono_literals;

namespace {

class UnreachableBroker : public StreamBroker {
 public:
  void EnsureStream(const std::string &) override {}
  void Publish(const std::string &, std::string) override {
    throw BrokerUnavailable("connection refused");
  }
  std::optional<QueueMessage> Pull(const std::string &, std::chrono::milliseconds) override {
    throw BrokerUnavailable("connection refused");
  }
  void Ack(const QueueMessage &) override {}
  void Nack(const QueueMessage &) override {}
  std::size_t Pending(const std::string &) const override {
    throw BrokerUnavailable("connection refused");
  }
};

// Fails with something other than a broker error.
class FaultyDiskBroker : public InMemoryStreamBroker {
 public:
  void Publish(const std::string &, std::string) override {
    throw std::system_error(std::make_error_code(std::errc::permission_denied), "publish");
  }
};

PrefillQueueOptions QueueOptions() {
  PrefillQueueOptions options;
  options.stream = "dynamo_prefill_queue";
  options.max_retries = 1;
  options.retry_backoff = 1ms;
  options.max_backoff = 2ms;
  options.dequeue_timeout = 20ms;
  return options;
}

WorkerConfig DecodeConfig(bool remote_prefill) {
  WorkerConfig cfg;
  cfg.router.remote_prefill = remote_prefill;
  cfg.router.max_local_prefill_length = 50;
  cfg.router.max_prefill_queue_size = 2;
  cfg.transfer.descriptor_pool_size = 2;
  cfg.transfer.kv_buffer_bytes = 4096;
  cfg.transfer.completion_timeout_ms = 5000;
  return cfg;
}

// Everything a decode worker needs, wired the way main() does it.
struct DecodeHarness {
  explicit DecodeHarness(WorkerConfig cfg,
                         std::shared_ptr<StreamBroker> broker = std::make_shared<InMemoryStreamBroker>(),
                         std::shared_ptr<KeyValueBackend> store =
                             std::make_shared<InMemoryKeyValueBackend>())
      : config(std::move(cfg)),
        backend(std::move(store)),
        broker(std::move(broker)),
        queue(this->broker, QueueOptions()),
        metadata(backend, MetadataStoreOptions{1000ms}),
        session(config.TransferNamespace()),
        engine(EngineArgs{}, session),
        worker(config, DecodeWorkerDeps{&engine, &publisher, &metrics, &queue, &session, &metadata}) {
    session.Initialize();
  }

  WorkerConfig config;
  std::shared_ptr<KeyValueBackend> backend;
  std::shared_ptr<StreamBroker> broker;
  PrefillQueue queue;
  MetadataStore metadata;
  TransferSession session;
  EchoEngine engine;
  KvMetricsPublisher publisher;
  MetricsRegistry metrics;
  DecodeWorker worker;
};

struct Stream {
  std::vector<int32_t> tokens;
  std::vector<std::string> finish_reasons;
  int deltas{0};
};

DeltaCallback Collect(Stream *out) {
  return [out](const ResponseDelta &delta) {
    ++out->deltas;
    out->tokens.insert(out->tokens.end(), delta.token_ids.begin(), delta.token_ids.end());
    if (!delta.finish_reason.empty()) out->finish_reasons.push_back(delta.finish_reason);
  };
}

template <typename Pred>
bool Eventually(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(5ms);
  }
  return pred();
}

// A prefill worker sharing the decode side's broker and store.
struct PrefillSide {
  PrefillSide(std::shared_ptr<StreamBroker> broker, std::shared_ptr<KeyValueBackend> store)
      : queue(broker, QueueOptions()),
        metadata(store, MetadataStoreOptions{1000ms}),
        session("dynamo"),
        engine(EngineArgs{}, session),
        registry(store),
        worker(Config(), PrefillWorkerDeps{&engine, &queue, &metadata, &session, &registry,
                                           &publisher, &metrics, nullptr},
               cancel) {
    session.Initialize();
    worker.SetFatalHandler([this](const std::string &reason) { fatal = reason; });
    worker.Initialize();
  }

  static const WorkerConfig &Config() {
    static const WorkerConfig cfg = [] {
      WorkerConfig c;
      c.role = WorkerRole::kPrefill;
      c.prefill.min_peer_workers = 0;
      return c;
    }();
    return cfg;
  }

  PrefillQueue queue;
  MetadataStore metadata;
  TransferSession session;
  EchoEngine engine;
  component::EndpointRegistry registry;
  KvMetricsPublisher publisher;
  MetricsRegistry metrics;
  CancellationToken cancel;
  std::string fatal;
  PrefillWorker worker;
};

GenerateRequest Prompt(std::size_t length, int max_tokens = 16) {
  GenerateRequest request;
  for (std::size_t i = 0; i < length; ++i) request.token_ids.push_back(static_cast<int32_t>(i + 1));
  request.sampling.max_tokens = max_tokens;
  return request;
}

}  // namespace

TEST_CASE("MapResult translates engine increments", "[decode_worker]") {
  EngineResult empty;
  REQUIRE(DecodeWorker::MapResult(empty).finish_reason == "error");

  EngineResult step;
  step.outputs.push_back(EngineOutput{{42}, {}, {}});
  auto delta = DecodeWorker::MapResult(step);
  REQUIRE(delta.token_ids == std::vector<int32_t>{42});
  REQUIRE(delta.finish_reason.empty());

  EngineResult last;
  last.finished = true;
  last.outputs.push_back(EngineOutput{{7}, "length", "eos"});
  delta = DecodeWorker::MapResult(last);
  REQUIRE(delta.token_ids.empty());
  REQUIRE(delta.finish_reason == "stop");
  REQUIRE(delta.stop_reason == "eos");
}

TEST_CASE("Requests before Initialize end with an error delta", "[decode_worker]") {
  DecodeHarness h(DecodeConfig(false));
  REQUIRE_FALSE(h.worker.Ready());
  Stream out;
  h.worker.Generate(Prompt(3), Collect(&out));
  REQUIRE(out.finish_reasons == std::vector<std::string>{"error"});
  REQUIRE(h.metrics.Errors() == 1);
}

TEST_CASE("Local prefill streams the echo and one terminal delta", "[decode_worker]") {
  DecodeHarness h(DecodeConfig(false));
  h.worker.Initialize();
  REQUIRE(h.worker.Ready());
  REQUIRE_FALSE(h.worker.RemotePrefillEnabled());
  REQUIRE(h.publisher.Snapshot() != nullptr);

  Stream out;
  h.worker.Generate(Prompt(5), Collect(&out));
  REQUIRE(out.tokens == std::vector<int32_t>{1, 2, 3, 4, 5});
  REQUIRE(out.finish_reasons == std::vector<std::string>{"stop"});
  REQUIRE(out.deltas == 6);
  REQUIRE(h.metrics.LocalDecisions() == 1);
  REQUIRE(h.metrics.Errors() == 0);
}

TEST_CASE("Empty prompts are rejected with an error delta", "[decode_worker]") {
  DecodeHarness h(DecodeConfig(false));
  h.worker.Initialize();
  Stream out;
  h.worker.Generate(GenerateRequest{}, Collect(&out));
  REQUIRE(out.finish_reasons == std::vector<std::string>{"error"});
  REQUIRE(out.deltas == 1);
}

TEST_CASE("Initialize publishes the engine metadata for prefill workers", "[decode_worker]") {
  DecodeHarness h(DecodeConfig(true));
  h.worker.Initialize();
  REQUIRE(h.worker.RemotePrefillEnabled());
  auto published = h.metadata.TryGet(h.engine.Metadata().engine_id);
  REQUIRE(published.has_value());
  REQUIRE(published->blob == h.engine.Metadata().blob);
  REQUIRE_THROWS_AS(h.worker.Initialize(), ConfigError);
}

TEST_CASE("Short prompts stay local even with remote prefill enabled", "[decode_worker]") {
  DecodeHarness h(DecodeConfig(true));
  h.worker.Initialize();
  Stream out;
  h.worker.Generate(Prompt(50), Collect(&out));
  REQUIRE(out.finish_reasons == std::vector<std::string>{"stop"});
  REQUIRE(h.metrics.LocalDecisions() == 1);
  REQUIRE(h.metrics.RemoteDecisions() == 0);
  REQUIRE(h.queue.Size() == 0);
}

TEST_CASE("Long prompts are prefilled by a prefill worker", "[decode_worker]") {
  auto broker = std::make_shared<InMemoryStreamBroker>();
  auto store = std::make_shared<InMemoryKeyValueBackend>();
  DecodeHarness decode(DecodeConfig(true), broker, store);
  decode.worker.Initialize();
  PrefillSide prefill(broker, store);

  for (int round = 0; round < 3; ++round) {
    Stream out;
    auto request = Prompt(200);
    request.request_id = "remote-" + std::to_string(round);
    decode.worker.Generate(request, Collect(&out));
    REQUIRE(out.finish_reasons == std::vector<std::string>{"stop"});
    REQUIRE(out.tokens.size() == 16);
    REQUIRE(out.tokens.front() == 1);
    REQUIRE(out.tokens.back() == 16);
  }
  REQUIRE(decode.metrics.RemoteDecisions() == 3);
  REQUIRE(decode.metrics.Errors() == 0);
  REQUIRE(Eventually([&] { return prefill.metrics.PrefillProcessed() == 3; }));
  // Metadata is imported once for the decode engine, not per request.
  REQUIRE(prefill.engine.RemoteMetadataImports() == 1);
  REQUIRE(prefill.worker.IsMetadataLoaded(decode.engine.Metadata().engine_id));

  prefill.worker.Drain();
  REQUIRE(prefill.fatal.empty());
}

TEST_CASE("Repeated client request ids each get their own prefill", "[decode_worker]") {
  auto broker = std::make_shared<InMemoryStreamBroker>();
  auto store = std::make_shared<InMemoryKeyValueBackend>();
  WorkerConfig cfg = DecodeConfig(true);
  cfg.transfer.completion_timeout_ms = 2000;
  DecodeHarness decode(cfg, broker, store);
  decode.worker.Initialize();
  PrefillSide prefill(broker, store);

  for (int round = 0; round < 2; ++round) {
    Stream out;
    auto request = Prompt(200);
    request.request_id = "client-retry";
    decode.worker.Generate(request, Collect(&out));
    REQUIRE(out.finish_reasons == std::vector<std::string>{"stop"});
    REQUIRE(out.tokens.size() == 16);
  }
  REQUIRE(decode.metrics.TransferTimeouts() == 0);
  REQUIRE(Eventually([&] { return prefill.metrics.PrefillProcessed() == 2; }));
  REQUIRE(prefill.metrics.PrefillDuplicates() == 0);

  prefill.worker.Drain();
  REQUIRE(prefill.fatal.empty());
}

TEST_CASE("A missing prefill worker times out into an error delta", "[decode_worker]") {
  WorkerConfig cfg = DecodeConfig(true);
  cfg.transfer.completion_timeout_ms = 50;
  DecodeHarness h(cfg);
  h.worker.Initialize();

  Stream out;
  const auto start = std::chrono::steady_clock::now();
  h.worker.Generate(Prompt(200), Collect(&out));
  REQUIRE(std::chrono::steady_clock::now() - start < 5000ms);
  REQUIRE(out.finish_reasons == std::vector<std::string>{"error"});
  REQUIRE(out.tokens.empty());
  REQUIRE(h.metrics.Errors() == 1);
  REQUIRE(h.queue.Size() == 1);
  REQUIRE(h.engine.Stats().active_slots == 0);
}

TEST_CASE("A congested prefill queue keeps requests local", "[decode_worker]") {
  WorkerConfig cfg = DecodeConfig(true);
  cfg.transfer.completion_timeout_ms = 20;
  DecodeHarness h(cfg);
  h.worker.Initialize();
  for (int i = 0; i < 3; ++i) {
    Stream out;
    h.worker.Generate(Prompt(200), Collect(&out));
  }
  REQUIRE(h.queue.Size() == 3);
  REQUIRE(h.metrics.RemoteDecisions() == 3);

  Stream out;
  h.worker.Generate(Prompt(200), Collect(&out));
  REQUIRE(out.finish_reasons == std::vector<std::string>{"stop"});
  REQUIRE(h.metrics.LocalDecisions() == 1);
}

TEST_CASE("Prompts too large for the receive buffer prefill locally", "[decode_worker]") {
  WorkerConfig cfg = DecodeConfig(true);
  cfg.router.conditional_disagg = false;
  cfg.transfer.kv_buffer_bytes = 64;
  DecodeHarness h(cfg);
  h.worker.Initialize();
  Stream out;
  h.worker.Generate(Prompt(100), Collect(&out));
  REQUIRE(out.finish_reasons == std::vector<std::string>{"stop"});
  REQUIRE(h.metrics.LocalDecisions() == 1);
}

TEST_CASE("Enqueue failures become an error delta", "[decode_worker]") {
  DecodeHarness h(DecodeConfig(true), std::make_shared<UnreachableBroker>());
  h.worker.Initialize();
  Stream out;
  h.worker.Generate(Prompt(200), Collect(&out));
  REQUIRE(out.finish_reasons == std::vector<std::string>{"error"});
  REQUIRE(h.metrics.EnqueueFailures() == 1);
  REQUIRE(h.metrics.Errors() == 1);

  // The worker keeps serving.
  Stream local;
  h.worker.Generate(Prompt(3), Collect(&local));
  REQUIRE(local.finish_reasons == std::vector<std::string>{"stop"});
}

TEST_CASE("Unexpected failures still end with one error delta", "[decode_worker]") {
  DecodeHarness h(DecodeConfig(true), std::make_shared<FaultyDiskBroker>());
  h.worker.Initialize();
  Stream out;
  REQUIRE_NOTHROW(h.worker.Generate(Prompt(200), Collect(&out)));
  REQUIRE(out.finish_reasons == std::vector<std::string>{"error"});
  REQUIRE(out.deltas == 1);
  REQUIRE(h.metrics.Errors() == 1);

  Stream local;
  h.worker.Generate(Prompt(3), Collect(&local));
  REQUIRE(local.finish_reasons == std::vector<std::string>{"stop"});
}

TEST_CASE("Drain stops the worker", "[decode_worker]") {
  DecodeHarness h(DecodeConfig(false));
  h.worker.Initialize();
  h.worker.Drain();
  REQUIRE(h.worker.State() == WorkerState::kStopped);
  Stream out;
  h.worker.Generate(Prompt(3), Collect(&out));
  REQUIRE(out.finish_reasons == std::vector<std::string>{"error"});
  h.worker.Drain();
}

TEST_CASE("Remote prefill requires its collaborators", "[decode_worker]") {
  WorkerConfig cfg = DecodeConfig(true);
  TransferSession session("dynamo");
  EchoEngine engine(EngineArgs{}, session);
  KvMetricsPublisher publisher;
  MetricsRegistry metrics;
  REQUIRE_THROWS_AS(DecodeWorker(cfg, DecodeWorkerDeps{&engine, &publisher, &metrics}),
                    ConfigError);
}
