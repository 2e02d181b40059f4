#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace pdserve {

enum class WorkerRole { kDecode, kPrefill };

const char *WorkerRoleName(WorkerRole role);

struct ServerSection {
  std::string host{"0.0.0.0"};
  int http_port{8080};
  int http_workers{4};
  bool tls_enabled{false};
  std::string tls_cert_path;
  std::string tls_key_path;
};

struct StoreSection {
  std::string backend{"memory"};  // memory | directory
  std::string path{"/tmp/pdserve"};

  // Directory layout: keys under <path>/kv, queue streams under
  // <path>/streams.  Listing keys never walks queue files.
  std::string KeyRoot() const { return path + "/kv"; }
  std::string BrokerRoot() const { return path; }
};

struct QueueSection {
  std::string stream;  // empty = derived from namespace / served model name
  int max_retries{3};
  int retry_backoff_ms{50};
  int dequeue_timeout_ms{1000};
  int ack_wait_ms{30000};
  int capacity{1024};
};

struct RouterSection {
  bool remote_prefill{false};
  bool conditional_disagg{true};
  int max_local_prefill_length{1000};
  int max_prefill_queue_size{2};
};

struct TransferSection {
  std::string ns;  // empty = top-level namespace
  int completion_timeout_ms{30000};
  int descriptor_pool_size{8};
  int64_t kv_buffer_bytes{1 << 20};
  bool eager_registration{true};
};

struct PrefillSection {
  int min_peer_workers{1};
  std::string peer_component{"vllm"};
  std::string peer_endpoint{"generate"};
  int peer_wait_timeout_ms{60000};
  int metadata_timeout_ms{30000};
  std::vector<int64_t> embeddings_shape{1, 576, 4096};
  std::string embeddings_dtype{"float32"};
  int completed_cache_size{1024};
};

struct EngineSection {
  std::string backend{"echo"};
  int block_size{16};
  int kv_total_blocks{1024};
  int max_num_seqs{64};
  bool enable_chunked_prefill{false};
  bool enable_prefix_caching{false};
  int pipeline_parallel_size{1};
  bool enforce_eager{false};
};

struct MetricsSection {
  int publish_interval_ms{1000};
};

struct LoggingSection {
  std::string format{"text"};  // text | json
  std::string level{"info"};
};

// Process configuration.  Built once at startup and passed by const
// reference; nothing reads configuration from globals.
struct WorkerConfig {
  WorkerRole role{WorkerRole::kDecode};
  std::string ns{"dynamo"};
  std::string component{"vllm"};
  std::string served_model_name;
  ServerSection server;
  StoreSection store;
  QueueSection queue;
  RouterSection router;
  TransferSection transfer;
  PrefillSection prefill;
  EngineSection engine;
  MetricsSection metrics;
  LoggingSection logging;

  std::string QueueStream() const;
  std::string TransferNamespace() const { return transfer.ns.empty() ? ns : transfer.ns; }
};

WorkerRole ParseWorkerRole(const std::string &text);

// Parses the YAML file at `path`.  Missing keys keep their defaults.
// Throws ConfigError on unreadable files, bad YAML and wrongly typed values.
WorkerConfig LoadWorkerConfig(const std::string &path);
// Same, from an in-memory YAML document.
WorkerConfig ParseWorkerConfig(const std::string &yaml_text);

// PDSERVE_* environment overrides, applied after the file.
void ApplyEnvOverrides(WorkerConfig *config);

// Normalises conflicting engine arguments (logged) and rejects invalid
// values with ConfigError.
void ValidateWorkerConfig(WorkerConfig *config);

}  // namespace pdserve
