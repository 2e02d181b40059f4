#include "runtime/cancellation.h"
#include "runtime/component/endpoint_registry.h"
#include "runtime/disaggregated/metadata_store.h"
#include "runtime/disaggregated/prefill_queue.h"
#include "runtime/disaggregated/stream_broker.h"
#include "runtime/disaggregated/transfer_session.h"
#include "runtime/engine/encoder.h"
#include "runtime/engine/engine_factory.h"
#include "runtime/errors.h"
#include "runtime/store/kv_backend.h"
#include "server/config/worker_config.h"
#include "server/http/http_server.h"
#include "server/logging/logger.h"
#include "server/metrics/kv_metrics_publisher.h"
#include "server/metrics/metrics.h"
#include "worker/decode_worker.h"
#include "worker/prefill_worker.h"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr const char *kComponent = "main";

pdserve::CancellationToken g_shutdown;

void SignalHandler(int) { g_shutdown.CancelFromSignal(); }

void PrintUsage(const char *argv0) {
  std::cerr << "usage: " << argv0
            << " --config <worker.yaml> [--role decode|prefill]" << std::endl;
}

pdserve::EngineArgs EngineArgsFor(const pdserve::WorkerConfig &config) {
  pdserve::EngineArgs args;
  args.backend = config.engine.backend;
  args.served_model_name = config.served_model_name;
  args.block_size = config.engine.block_size;
  args.kv_total_blocks = config.engine.kv_total_blocks;
  args.max_num_seqs = config.engine.max_num_seqs;
  args.enable_chunked_prefill = config.engine.enable_chunked_prefill;
  args.enable_prefix_caching = config.engine.enable_prefix_caching;
  args.pipeline_parallel_size = config.engine.pipeline_parallel_size;
  args.enforce_eager = config.engine.enforce_eager;
  args.remote_prefill = config.router.remote_prefill;
  args.prefill_role = config.role == pdserve::WorkerRole::kPrefill;
  return args;
}

std::shared_ptr<pdserve::disaggregated::StreamBroker>
MakeBroker(const pdserve::WorkerConfig &config) {
  std::chrono::milliseconds ack_wait(config.queue.ack_wait_ms);
  if (config.store.backend == "directory") {
    return std::make_shared<pdserve::disaggregated::DirectoryStreamBroker>(
        config.store.BrokerRoot(), ack_wait);
  }
  return std::make_shared<pdserve::disaggregated::InMemoryStreamBroker>(
      static_cast<std::size_t>(config.queue.capacity), ack_wait);
}

}  // namespace

int main(int argc, char **argv) {
  std::string config_path;
  std::string role_override;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--role" && i + 1 < argc) {
      role_override = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      return 0;
    } else {
      PrintUsage(argv[0]);
      return 1;
    }
  }

  pdserve::WorkerConfig config;
  try {
    if (!config_path.empty()) {
      config = pdserve::LoadWorkerConfig(config_path);
    }
    pdserve::ApplyEnvOverrides(&config);
    if (!role_override.empty()) {
      config.role = pdserve::ParseWorkerRole(role_override);
    }
    pdserve::ValidateWorkerConfig(&config);
  } catch (const pdserve::ConfigError &e) {
    std::cerr << "pdserve: " << e.what() << std::endl;
    return 1;
  }

  pdserve::log::SetJsonMode(config.logging.format == "json");
  pdserve::log::Level level = pdserve::log::Level::INFO;
  if (pdserve::log::ParseLevel(config.logging.level, &level)) {
    pdserve::log::SetMinLevel(level);
  }

  const bool is_prefill = config.role == pdserve::WorkerRole::kPrefill;
  pdserve::log::Info(kComponent, "starting worker",
                     std::string("role=") + pdserve::WorkerRoleName(config.role) +
                         " ns=" + config.ns + " store=" + config.store.backend);

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  int exit_code = 0;
  try {
    auto backend = pdserve::MakeKeyValueBackend(config.store.backend,
                                                config.store.KeyRoot());
    auto broker = MakeBroker(config);

    pdserve::disaggregated::PrefillQueueOptions queue_options;
    queue_options.stream = config.QueueStream();
    queue_options.max_retries = config.queue.max_retries;
    queue_options.retry_backoff =
        std::chrono::milliseconds(config.queue.retry_backoff_ms);
    queue_options.dequeue_timeout =
        std::chrono::milliseconds(config.queue.dequeue_timeout_ms);
    pdserve::disaggregated::PrefillQueue queue(broker, queue_options);

    pdserve::disaggregated::MetadataStoreOptions metadata_options;
    metadata_options.get_timeout =
        std::chrono::milliseconds(config.prefill.metadata_timeout_ms);
    pdserve::disaggregated::MetadataStore metadata(backend, metadata_options);

    pdserve::disaggregated::TransferSession session(config.TransferNamespace());
    session.Initialize();

    auto engine = pdserve::EngineFactory::Create(EngineArgsFor(config), session);

    pdserve::MetricsRegistry metrics;
    metrics.SetRole(pdserve::WorkerRoleName(config.role));
    pdserve::KvMetricsPublisher publisher;
    pdserve::component::EndpointRegistry registry(backend);

    std::unique_ptr<pdserve::EchoEncoder> encoder;
    std::unique_ptr<pdserve::PrefillWorker> prefill_worker;
    std::unique_ptr<pdserve::DecodeWorker> decode_worker;
    const pdserve::WorkerStatus *status = nullptr;
    pdserve::component::EndpointAddress address;
    address.ns = config.ns;
    address.name = "generate";

    if (is_prefill) {
      pdserve::disaggregated::TensorSpec embeddings_spec;
      embeddings_spec.shape = config.prefill.embeddings_shape;
      embeddings_spec.dtype = config.prefill.embeddings_dtype;
      if (embeddings_spec.dtype == "float32") {
        encoder = std::make_unique<pdserve::EchoEncoder>(session, embeddings_spec);
      } else {
        pdserve::log::Warn(kComponent, "multimodal encoder disabled",
                           "dtype=" + embeddings_spec.dtype);
      }
      pdserve::PrefillWorkerDeps deps;
      deps.engine = engine.get();
      deps.queue = &queue;
      deps.metadata = &metadata;
      deps.session = &session;
      deps.registry = &registry;
      deps.publisher = &publisher;
      deps.metrics = &metrics;
      deps.encoder = encoder.get();
      prefill_worker =
          std::make_unique<pdserve::PrefillWorker>(config, deps, g_shutdown);
      prefill_worker->Initialize();
      status = prefill_worker.get();
      address.component = "prefill";
    } else {
      pdserve::DecodeWorkerDeps deps;
      deps.engine = engine.get();
      deps.publisher = &publisher;
      deps.metrics = &metrics;
      deps.queue = &queue;
      deps.session = &session;
      deps.metadata = &metadata;
      decode_worker = std::make_unique<pdserve::DecodeWorker>(config, deps);
      decode_worker->Initialize();
      status = decode_worker.get();
      address.component = config.component;
    }

    pdserve::component::InstanceInfo info;
    info.role = pdserve::WorkerRoleName(config.role);
    info.host = config.server.host;
    info.http_port = config.server.http_port;
    info.engine_id = engine->Metadata().engine_id;
    std::string instance_id = registry.Register(address, info);
    publisher.StartFlusher(
        backend,
        pdserve::KvMetricsPublisher::FlushKey(address.ns, address.component,
                                              instance_id),
        std::chrono::milliseconds(config.metrics.publish_interval_ms));

    pdserve::HttpServer::TlsConfig tls;
    tls.enabled = config.server.tls_enabled;
    tls.cert_path = config.server.tls_cert_path;
    tls.key_path = config.server.tls_key_path;
    pdserve::HttpServer server(config.server.host, config.server.http_port,
                               config.role, status, decode_worker.get(),
                               &metrics, &publisher, tls,
                               config.server.http_workers);
    server.Start();
    pdserve::log::Info(kComponent, "worker ready",
                       "instance_id=" + instance_id + " endpoint=" + address.Url());

    while (!g_shutdown.WaitFor(std::chrono::milliseconds(200))) {
    }
    pdserve::log::Info(kComponent, "shutdown requested");

    // Teardown continues past individual failures.
    server.Stop();
    if (prefill_worker) {
      prefill_worker->Drain();
    }
    if (decode_worker) {
      decode_worker->Drain();
    }
    try {
      registry.Deregister(address, instance_id);
    } catch (const std::exception &e) {
      pdserve::log::Warn(kComponent, "deregister failed", e.what());
    }
    publisher.StopFlusher();
    queue.Close();
  } catch (const pdserve::QuorumError &e) {
    pdserve::log::Error(kComponent, "peer quorum not reached", e.what());
    exit_code = pdserve::PrefillWorker::kFatalExitCode;
  } catch (const pdserve::ConfigError &e) {
    pdserve::log::Error(kComponent, "invalid configuration", e.what());
    exit_code = 1;
  } catch (const std::exception &e) {
    pdserve::log::Error(kComponent, "worker failed", e.what());
    exit_code = pdserve::PrefillWorker::kFatalExitCode;
  }

  pdserve::log::Info(kComponent, "stopped", "exit_code=" + std::to_string(exit_code));
  return exit_code;
}
