#include <catch2/catch.hpp>

#include "runtime/cancellation.h"
#include "runtime/component/endpoint_registry.h"
#include "runtime/disaggregated/stream_broker.h"
#include "runtime/engine/echo_engine.h"
#include "runtime/engine/encoder.h"
#include "runtime/errors.h"
#include "runtime/store/kv_backend.h"
#include "worker/prefill_worker.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

using namespace pdserve;
using namespace pdserve::disaggregated;
using namespace std::chrono_literals;

namespace {

// Counts how often the worker imports peer metadata into the engine.
class ProbeEngine : public InferenceEngine {
 public:
  ProbeEngine(const EngineArgs &args, TransferSession &session) : inner_(args, session) {}

  EngineMetadata Metadata() const override { return inner_.Metadata(); }
  void AddRemoteMetadata(const EngineMetadata &metadata) override {
    add_calls.fetch_add(1);
    inner_.AddRemoteMetadata(metadata);
  }
  void Generate(const EngineRequest &request, const RemotePrefillParams &remote,
                const ResultCallback &on_result) override {
    inner_.Generate(request, remote, on_result);
  }
  std::size_t KvStateBytes(std::size_t num_tokens) const override {
    return inner_.KvStateBytes(num_tokens);
  }
  EngineStats Stats() const override { return inner_.Stats(); }
  void Close() override { inner_.Close(); }

  int EmbeddingsConsumed() const { return inner_.EmbeddingsConsumed(); }

  std::atomic<int> add_calls{0};

 private:
  EchoEngine inner_;
};

PrefillQueueOptions QueueOptions() {
  PrefillQueueOptions options;
  options.stream = "dynamo_prefill_queue";
  options.max_retries = 1;
  options.retry_backoff = 1ms;
  options.dequeue_timeout = 20ms;
  return options;
}

WorkerConfig PrefillConfig() {
  WorkerConfig cfg;
  cfg.role = WorkerRole::kPrefill;
  cfg.prefill.min_peer_workers = 0;
  cfg.prefill.peer_wait_timeout_ms = 50;
  cfg.transfer.completion_timeout_ms = 1000;
  return cfg;
}

// A prefill worker plus a stand-in decode engine that owns the KV buffers.
struct PrefillHarness {
  explicit PrefillHarness(WorkerConfig cfg, bool with_encoder = false)
      : config(std::move(cfg)),
        store(std::make_shared<InMemoryKeyValueBackend>()),
        broker(std::make_shared<InMemoryStreamBroker>()),
        queue(broker, QueueOptions()),
        metadata(store, MetadataStoreOptions{100ms}),
        registry(store),
        decode_session("dynamo"),
        prefill_session("dynamo"),
        decode_engine(EngineArgs{}, decode_session),
        engine(EngineArgs{}, prefill_session),
        encoder(prefill_session, TensorSpec{{4, 8}, "float32"}),
        worker(config,
               PrefillWorkerDeps{&engine, &queue, &metadata, &prefill_session, &registry,
                                 &publisher, &metrics, with_encoder ? &encoder : nullptr},
               cancel) {
    decode_session.Initialize();
    prefill_session.Initialize();
    metadata.Put(decode_engine.Metadata());
    worker.SetFatalHandler([this](const std::string &reason) { fatal = reason; });
  }

  // A decode-side buffer the next request writes into.
  struct Target {
    std::shared_ptr<Descriptor> descriptor;
    std::unique_ptr<WritableOperation> writable;
  };

  Target NewTarget() {
    Target target;
    target.descriptor = decode_session.Register(TransferBuffer{TensorSpec{{1024}, "uint8"}, {}});
    target.writable = decode_session.CreateWritable(target.descriptor);
    return target;
  }

  PrefillRequest Request(const std::string &id, const Target &target) {
    PrefillRequest request;
    request.request_id = id;
    request.engine_id = decode_engine.Metadata().engine_id;
    request.prompt_token_ids = {11, 12, 13, 14};
    request.block_ids = {0};
    request.transfer_descriptor = target.writable->Serialize();
    return request;
  }

  WorkerConfig config;
  std::shared_ptr<InMemoryKeyValueBackend> store;
  std::shared_ptr<InMemoryStreamBroker> broker;
  PrefillQueue queue;
  MetadataStore metadata;
  component::EndpointRegistry registry;
  TransferSession decode_session;
  TransferSession prefill_session;
  EchoEngine decode_engine;
  ProbeEngine engine;
  EchoEncoder encoder;
  KvMetricsPublisher publisher;
  MetricsRegistry metrics;
  CancellationToken cancel;
  std::string fatal;
  PrefillWorker worker;
};

}  // namespace

TEST_CASE("Prefill writes the KV state into the decode buffer", "[prefill_worker]") {
  PrefillHarness h(PrefillConfig());
  h.worker.Initialize();
  REQUIRE(h.worker.Ready());
  // Its own metadata is published for peers.
  REQUIRE(h.metadata.TryGet(h.engine.Metadata().engine_id).has_value());

  auto target = h.NewTarget();
  REQUIRE(h.worker.ProcessRequest(h.Request("req-1", target)));
  REQUIRE(target.writable->WaitForCompletion(0ms));
  REQUIRE(EchoEngine::DecodeKvState(target.descriptor->Data(), target.descriptor->Size()) ==
          std::vector<int32_t>{11, 12, 13, 14});
  REQUIRE(h.metrics.PrefillProcessed() == 1);
  REQUIRE(h.engine.Stats().active_slots == 0);
}

TEST_CASE("Decode engine metadata is imported exactly once", "[prefill_worker]") {
  PrefillHarness h(PrefillConfig());
  h.worker.Initialize();
  const std::string engine_id = h.decode_engine.Metadata().engine_id;
  REQUIRE_FALSE(h.worker.IsMetadataLoaded(engine_id));

  auto first = h.NewTarget();
  auto second = h.NewTarget();
  REQUIRE(h.worker.ProcessRequest(h.Request("req-1", first)));
  REQUIRE(h.worker.ProcessRequest(h.Request("req-2", second)));

  REQUIRE(h.engine.add_calls.load() == 1);
  REQUIRE(h.worker.IsMetadataLoaded(engine_id));
  REQUIRE(h.worker.LoadedMetadataCount() == 1);
  REQUIRE(h.metrics.MetadataLoads() == 1);
}

TEST_CASE("Concurrent requests for one engine import it once", "[prefill_worker]") {
  PrefillHarness h(PrefillConfig());
  h.worker.Initialize();
  auto a = h.NewTarget();
  auto b = h.NewTarget();
  const auto ra = h.Request("req-a", a);
  const auto rb = h.Request("req-b", b);
  std::thread other([&] { h.worker.ProcessRequest(ra); });
  h.worker.ProcessRequest(rb);
  other.join();
  REQUIRE(h.engine.add_calls.load() == 1);
}

TEST_CASE("Redelivered requests are skipped", "[prefill_worker]") {
  PrefillHarness h(PrefillConfig());
  h.worker.Initialize();
  auto first = h.NewTarget();
  REQUIRE(h.worker.ProcessRequest(h.Request("req-1", first)));

  auto again = h.NewTarget();
  REQUIRE_FALSE(h.worker.ProcessRequest(h.Request("req-1", again)));
  REQUIRE(again.writable->State() == TransferState::kCreated);
  REQUIRE(h.metrics.PrefillProcessed() == 1);
}

TEST_CASE("Unknown decode engines are dropped", "[prefill_worker]") {
  PrefillHarness h(PrefillConfig());
  h.worker.Initialize();
  auto target = h.NewTarget();
  auto request = h.Request("req-1", target);
  request.engine_id = "echo-gone";
  REQUIRE_FALSE(h.worker.ProcessRequest(request));
  REQUIRE(h.metrics.PrefillDropped() == 1);
  REQUIRE(target.writable->State() == TransferState::kCreated);
  REQUIRE(h.fatal.empty());
}

TEST_CASE("Requests for a revoked buffer are dropped", "[prefill_worker]") {
  PrefillHarness h(PrefillConfig());
  h.worker.Initialize();
  PrefillRequest request;
  {
    auto target = h.NewTarget();
    request = h.Request("req-1", target);
  }
  REQUIRE_FALSE(h.worker.ProcessRequest(request));
  REQUIRE(h.metrics.PrefillDropped() == 1);
}

TEST_CASE("Multimodal requests need an image url and an encoder", "[prefill_worker]") {
  SECTION("empty url") {
    PrefillHarness h(PrefillConfig(), true);
    h.worker.Initialize();
    auto target = h.NewTarget();
    auto request = h.Request("req-1", target);
    request.multimodal_data_source = MultimodalDataSource{""};
    REQUIRE_FALSE(h.worker.ProcessRequest(request));
    REQUIRE(h.metrics.PrefillDropped() == 1);
  }
  SECTION("no encoder configured") {
    PrefillHarness h(PrefillConfig());
    h.worker.Initialize();
    auto target = h.NewTarget();
    auto request = h.Request("req-1", target);
    request.multimodal_data_source = MultimodalDataSource{"https://example.com/a.png"};
    REQUIRE_FALSE(h.worker.ProcessRequest(request));
  }
  SECTION("encoded embeddings reach the engine") {
    PrefillHarness h(PrefillConfig(), true);
    h.worker.Initialize();
    auto target = h.NewTarget();
    auto request = h.Request("req-1", target);
    request.multimodal_data_source = MultimodalDataSource{"https://example.com/a.png"};
    REQUIRE(h.worker.ProcessRequest(request));
    REQUIRE(h.engine.EmbeddingsConsumed() == 1);
    REQUIRE(target.writable->WaitForCompletion(0ms));
  }
}

TEST_CASE("The consumer skips malformed payloads and keeps going", "[prefill_worker]") {
  PrefillHarness h(PrefillConfig());
  h.worker.Initialize();
  h.broker->EnsureStream(h.queue.Stream());
  h.broker->Publish(h.queue.Stream(), "{\"engine_id\":\"echo-1\"}");

  auto target = h.NewTarget();
  h.queue.Enqueue(h.Request("req-1", target));
  REQUIRE(target.writable->WaitForCompletion(5000ms));
  REQUIRE(h.queue.DiscardedPayloads() == 1);
  REQUIRE(h.fatal.empty());
}

TEST_CASE("Initialize fails without enough decode workers", "[prefill_worker]") {
  WorkerConfig cfg = PrefillConfig();
  cfg.prefill.min_peer_workers = 1;
  PrefillHarness h(cfg);
  REQUIRE_THROWS_AS(h.worker.Initialize(), QuorumError);
  REQUIRE(h.worker.State() == WorkerState::kStopped);
}

TEST_CASE("Initialize waits for registered decode workers", "[prefill_worker]") {
  WorkerConfig cfg = PrefillConfig();
  cfg.prefill.min_peer_workers = 1;
  cfg.prefill.peer_wait_timeout_ms = 5000;
  PrefillHarness h(cfg);
  component::InstanceInfo decode;
  decode.role = "decode";
  h.registry.Register(component::EndpointAddress{cfg.ns, cfg.prefill.peer_component,
                                                 cfg.prefill.peer_endpoint},
                      decode);
  REQUIRE_NOTHROW(h.worker.Initialize());
  REQUIRE(h.worker.Ready());
}

TEST_CASE("Drain is idempotent and stops the consumer", "[prefill_worker]") {
  PrefillHarness h(PrefillConfig());
  h.worker.Initialize();
  h.worker.Drain();
  REQUIRE(h.worker.State() == WorkerState::kStopped);
  h.worker.Drain();
  REQUIRE_THROWS_AS(h.worker.Initialize(), ConfigError);
}
