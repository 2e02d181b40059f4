#include "server/config/worker_config.h"

#include "runtime/disaggregated/prefill_queue.h"
#include "runtime/engine/engine_factory.h"
#include "runtime/errors.h"
#include "server/logging/logger.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <sstream>

namespace pdserve {

namespace {

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool ParseBool(const std::string &value) {
  auto lowered = ToLower(value);
  return lowered == "true" || lowered == "1" || lowered == "yes";
}

template <typename T>
void Read(const YAML::Node &node, const char *key, T *out) {
  if (node && node[key]) *out = node[key].as<T>();
}

int EnvInt(const char *name, const char *value) {
  try {
    std::size_t used = 0;
    const int parsed = std::stoi(value, &used);
    if (used != std::string(value).size()) throw std::invalid_argument(value);
    return parsed;
  } catch (const std::exception &) {
    throw ConfigError(std::string(name) + " must be an integer, got '" + value + "'");
  }
}

void RequirePositive(const char *field, int64_t value) {
  if (value <= 0) {
    throw ConfigError(std::string(field) + " must be > 0, got " + std::to_string(value));
  }
}

void RequireNonNegative(const char *field, int64_t value) {
  if (value < 0) {
    throw ConfigError(std::string(field) + " must be >= 0, got " + std::to_string(value));
  }
}

WorkerConfig FromYaml(const YAML::Node &config) {
  WorkerConfig cfg;
  if (!config || config.IsNull()) return cfg;
  if (!config.IsMap()) throw ConfigError("configuration root must be a mapping");

  if (config["role"]) cfg.role = ParseWorkerRole(config["role"].as<std::string>());
  Read(config, "namespace", &cfg.ns);
  Read(config, "component", &cfg.component);
  Read(config, "served_model_name", &cfg.served_model_name);

  if (const auto server = config["server"]) {
    Read(server, "host", &cfg.server.host);
    Read(server, "http_port", &cfg.server.http_port);
    Read(server, "http_workers", &cfg.server.http_workers);
    if (const auto tls = server["tls"]) {
      Read(tls, "enabled", &cfg.server.tls_enabled);
      Read(tls, "cert_path", &cfg.server.tls_cert_path);
      Read(tls, "key_path", &cfg.server.tls_key_path);
    }
  }
  if (const auto store = config["store"]) {
    Read(store, "backend", &cfg.store.backend);
    Read(store, "path", &cfg.store.path);
  }
  if (const auto queue = config["queue"]) {
    Read(queue, "stream", &cfg.queue.stream);
    Read(queue, "max_retries", &cfg.queue.max_retries);
    Read(queue, "retry_backoff_ms", &cfg.queue.retry_backoff_ms);
    Read(queue, "dequeue_timeout_ms", &cfg.queue.dequeue_timeout_ms);
    Read(queue, "ack_wait_ms", &cfg.queue.ack_wait_ms);
    Read(queue, "capacity", &cfg.queue.capacity);
  }
  if (const auto router = config["router"]) {
    Read(router, "remote_prefill", &cfg.router.remote_prefill);
    Read(router, "conditional_disagg", &cfg.router.conditional_disagg);
    Read(router, "max_local_prefill_length", &cfg.router.max_local_prefill_length);
    Read(router, "max_prefill_queue_size", &cfg.router.max_prefill_queue_size);
  }
  if (const auto transfer = config["transfer"]) {
    Read(transfer, "namespace", &cfg.transfer.ns);
    Read(transfer, "completion_timeout_ms", &cfg.transfer.completion_timeout_ms);
    Read(transfer, "descriptor_pool_size", &cfg.transfer.descriptor_pool_size);
    Read(transfer, "kv_buffer_bytes", &cfg.transfer.kv_buffer_bytes);
    Read(transfer, "eager_registration", &cfg.transfer.eager_registration);
  }
  if (const auto prefill = config["prefill"]) {
    Read(prefill, "min_peer_workers", &cfg.prefill.min_peer_workers);
    Read(prefill, "peer_component", &cfg.prefill.peer_component);
    Read(prefill, "peer_endpoint", &cfg.prefill.peer_endpoint);
    Read(prefill, "peer_wait_timeout_ms", &cfg.prefill.peer_wait_timeout_ms);
    Read(prefill, "metadata_timeout_ms", &cfg.prefill.metadata_timeout_ms);
    Read(prefill, "completed_cache_size", &cfg.prefill.completed_cache_size);
    if (const auto embeddings = prefill["embeddings"]) {
      Read(embeddings, "shape", &cfg.prefill.embeddings_shape);
      Read(embeddings, "dtype", &cfg.prefill.embeddings_dtype);
    }
  }
  if (const auto engine = config["engine"]) {
    Read(engine, "backend", &cfg.engine.backend);
    Read(engine, "block_size", &cfg.engine.block_size);
    Read(engine, "kv_total_blocks", &cfg.engine.kv_total_blocks);
    Read(engine, "max_num_seqs", &cfg.engine.max_num_seqs);
    Read(engine, "enable_chunked_prefill", &cfg.engine.enable_chunked_prefill);
    Read(engine, "enable_prefix_caching", &cfg.engine.enable_prefix_caching);
    Read(engine, "pipeline_parallel_size", &cfg.engine.pipeline_parallel_size);
    Read(engine, "enforce_eager", &cfg.engine.enforce_eager);
  }
  if (const auto metrics = config["metrics"]) {
    Read(metrics, "publish_interval_ms", &cfg.metrics.publish_interval_ms);
  }
  if (const auto logging = config["logging"]) {
    Read(logging, "format", &cfg.logging.format);
    Read(logging, "level", &cfg.logging.level);
  }
  return cfg;
}

}  // namespace

const char *WorkerRoleName(WorkerRole role) {
  return role == WorkerRole::kPrefill ? "prefill" : "decode";
}

WorkerRole ParseWorkerRole(const std::string &text) {
  const auto lowered = ToLower(text);
  if (lowered == "decode") return WorkerRole::kDecode;
  if (lowered == "prefill") return WorkerRole::kPrefill;
  throw ConfigError("unknown role '" + text + "' (expected decode or prefill)");
}

std::string WorkerConfig::QueueStream() const {
  if (!queue.stream.empty()) return queue.stream;
  return disaggregated::PrefillQueue::StreamName(ns, served_model_name);
}

WorkerConfig ParseWorkerConfig(const std::string &yaml_text) {
  try {
    return FromYaml(YAML::Load(yaml_text));
  } catch (const YAML::Exception &e) {
    throw ConfigError(std::string("invalid configuration: ") + e.what());
  }
}

WorkerConfig LoadWorkerConfig(const std::string &path) {
  if (!std::filesystem::exists(path)) {
    throw ConfigError("config file " + path + " does not exist");
  }
  try {
    return FromYaml(YAML::LoadFile(path));
  } catch (const YAML::Exception &e) {
    throw ConfigError("error parsing config file " + path + ": " + e.what());
  }
}

void ApplyEnvOverrides(WorkerConfig *config) {
  if (const char *env_role = std::getenv("PDSERVE_ROLE")) {
    config->role = ParseWorkerRole(env_role);
  }
  if (const char *env_ns = std::getenv("PDSERVE_NAMESPACE")) {
    config->ns = env_ns;
  }
  if (const char *env_model = std::getenv("PDSERVE_SERVED_MODEL_NAME")) {
    config->served_model_name = env_model;
  }
  if (const char *env_host = std::getenv("PDSERVE_HOST_OVERRIDE")) {
    config->server.host = env_host;
  }
  if (const char *env_port = std::getenv("PDSERVE_PORT_OVERRIDE")) {
    config->server.http_port = EnvInt("PDSERVE_PORT_OVERRIDE", env_port);
  }
  if (const char *env_workers = std::getenv("PDSERVE_HTTP_WORKERS")) {
    config->server.http_workers = EnvInt("PDSERVE_HTTP_WORKERS", env_workers);
  }
  if (const char *env_tls = std::getenv("PDSERVE_TLS_ENABLED")) {
    config->server.tls_enabled = ParseBool(env_tls);
  }
  if (const char *env_tls_cert = std::getenv("PDSERVE_TLS_CERT_PATH")) {
    config->server.tls_cert_path = env_tls_cert;
  }
  if (const char *env_tls_key = std::getenv("PDSERVE_TLS_KEY_PATH")) {
    config->server.tls_key_path = env_tls_key;
  }
  if (const char *env_store = std::getenv("PDSERVE_STORE_BACKEND")) {
    config->store.backend = env_store;
  }
  if (const char *env_store_path = std::getenv("PDSERVE_STORE_PATH")) {
    config->store.path = env_store_path;
  }
  if (const char *env_remote = std::getenv("PDSERVE_REMOTE_PREFILL")) {
    config->router.remote_prefill = ParseBool(env_remote);
  }
  if (const char *env_threshold = std::getenv("PDSERVE_MAX_LOCAL_PREFILL_LENGTH")) {
    config->router.max_local_prefill_length =
        EnvInt("PDSERVE_MAX_LOCAL_PREFILL_LENGTH", env_threshold);
  }
  if (const char *env_queue = std::getenv("PDSERVE_MAX_PREFILL_QUEUE_SIZE")) {
    config->router.max_prefill_queue_size = EnvInt("PDSERVE_MAX_PREFILL_QUEUE_SIZE", env_queue);
  }
  if (const char *env_backend = std::getenv("PDSERVE_ENGINE_BACKEND")) {
    config->engine.backend = env_backend;
  }
  if (const char *env_format = std::getenv("PDSERVE_LOG_FORMAT")) {
    config->logging.format = env_format;
  }
  if (const char *env_level = std::getenv("PDSERVE_LOG_LEVEL")) {
    config->logging.level = env_level;
  }
}

void ValidateWorkerConfig(WorkerConfig *config) {
  auto &cfg = *config;
  if (cfg.ns.empty()) throw ConfigError("namespace must not be empty");
  if (cfg.component.empty()) throw ConfigError("component must not be empty");

  if (cfg.server.http_port < 0 || cfg.server.http_port > 65535) {
    throw ConfigError("server.http_port out of range: " + std::to_string(cfg.server.http_port));
  }
  RequirePositive("server.http_workers", cfg.server.http_workers);
  if (cfg.server.tls_enabled &&
      (cfg.server.tls_cert_path.empty() || cfg.server.tls_key_path.empty())) {
    throw ConfigError("server.tls requires cert_path and key_path");
  }

  cfg.store.backend = ToLower(cfg.store.backend);
  if (cfg.store.backend != "memory" && cfg.store.backend != "directory") {
    throw ConfigError("unknown store backend '" + cfg.store.backend + "'");
  }
  if (cfg.store.backend == "directory" && cfg.store.path.empty()) {
    throw ConfigError("store.path is required for the directory backend");
  }

  RequireNonNegative("queue.max_retries", cfg.queue.max_retries);
  RequireNonNegative("queue.retry_backoff_ms", cfg.queue.retry_backoff_ms);
  RequirePositive("queue.dequeue_timeout_ms", cfg.queue.dequeue_timeout_ms);
  RequirePositive("queue.ack_wait_ms", cfg.queue.ack_wait_ms);
  RequirePositive("queue.capacity", cfg.queue.capacity);

  RequireNonNegative("router.max_local_prefill_length", cfg.router.max_local_prefill_length);
  RequireNonNegative("router.max_prefill_queue_size", cfg.router.max_prefill_queue_size);

  RequirePositive("transfer.completion_timeout_ms", cfg.transfer.completion_timeout_ms);
  RequirePositive("transfer.descriptor_pool_size", cfg.transfer.descriptor_pool_size);
  RequirePositive("transfer.kv_buffer_bytes", cfg.transfer.kv_buffer_bytes);

  RequireNonNegative("prefill.min_peer_workers", cfg.prefill.min_peer_workers);
  RequirePositive("prefill.peer_wait_timeout_ms", cfg.prefill.peer_wait_timeout_ms);
  RequirePositive("prefill.metadata_timeout_ms", cfg.prefill.metadata_timeout_ms);
  RequirePositive("prefill.completed_cache_size", cfg.prefill.completed_cache_size);
  if (cfg.prefill.embeddings_shape.empty()) {
    throw ConfigError("prefill.embeddings.shape must not be empty");
  }
  for (int64_t dim : cfg.prefill.embeddings_shape) {
    RequirePositive("prefill.embeddings.shape[]", dim);
  }

  cfg.engine.backend = EngineFactory::NormalizeBackend(cfg.engine.backend);
  if (!EngineFactory::HasAdapter(cfg.engine.backend)) {
    throw ConfigError("unknown engine backend '" + cfg.engine.backend + "'");
  }
  RequirePositive("engine.block_size", cfg.engine.block_size);
  RequirePositive("engine.kv_total_blocks", cfg.engine.kv_total_blocks);
  RequirePositive("engine.max_num_seqs", cfg.engine.max_num_seqs);
  RequirePositive("engine.pipeline_parallel_size", cfg.engine.pipeline_parallel_size);

  RequirePositive("metrics.publish_interval_ms", cfg.metrics.publish_interval_ms);

  cfg.logging.format = ToLower(cfg.logging.format);
  if (cfg.logging.format != "text" && cfg.logging.format != "json") {
    throw ConfigError("logging.format must be text or json, got '" + cfg.logging.format + "'");
  }
  log::Level level;
  if (!log::ParseLevel(cfg.logging.level, &level)) {
    throw ConfigError("unknown logging.level '" + cfg.logging.level + "'");
  }

  // Remote prefill hands whole prompts to another engine; chunking and
  // pipeline parallelism are not supported on the decode side.
  if (cfg.role == WorkerRole::kDecode && cfg.router.remote_prefill) {
    if (cfg.engine.enable_chunked_prefill) {
      log::Info("config", "chunked prefill disabled for remote prefill");
      cfg.engine.enable_chunked_prefill = false;
    }
    if (cfg.engine.pipeline_parallel_size != 1) {
      log::Info("config", "pipeline parallel size forced to 1 for remote prefill",
                "was=" + std::to_string(cfg.engine.pipeline_parallel_size));
      cfg.engine.pipeline_parallel_size = 1;
    }
  }
  if (cfg.role == WorkerRole::kPrefill) {
    if (!cfg.engine.enforce_eager) {
      log::Info("config", "eager mode enabled for prefill worker");
      cfg.engine.enforce_eager = true;
    }
    if (cfg.engine.enable_prefix_caching) {
      log::Info("config", "prefix caching disabled for prefill worker");
      cfg.engine.enable_prefix_caching = false;
    }
  }
}

}  // namespace pdserve
