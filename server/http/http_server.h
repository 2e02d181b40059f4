#pragma once

#include "server/config/worker_config.h"
#include "server/metrics/kv_metrics_publisher.h"
#include "server/metrics/metrics.h"
#include "worker/decode_worker.h"
#include "worker/worker_state.h"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include <openssl/ssl.h>

namespace pdserve {

// Raw-socket HTTP/1.1 front end: health probes and metrics for both roles,
// POST /v1/generate for decode workers.
class HttpServer {
 public:
  struct TlsConfig {
    bool enabled{false};
    std::string cert_path;
    std::string key_path;
  };

  HttpServer(std::string host,
             int port,
             WorkerRole role,
             const WorkerStatus *status,
             DecodeWorker *decode_worker,
             MetricsRegistry *metrics,
             const KvMetricsPublisher *publisher,
             TlsConfig tls_config,
             int num_workers = 4);
  ~HttpServer();

  // Throws ConfigError when the TLS context cannot be built.
  void Start();
  void Stop();
  bool Running() const { return running_.load(); }

 private:
  struct ClientSession {
    int fd{-1};
    SSL *ssl{nullptr};
  };

  void Run();
  void WorkerLoop();
  void HandleClient(ClientSession &session);
  void HandleGenerate(ClientSession &session, const std::string &body);

  bool SendAll(ClientSession &session, const std::string &payload);
  ssize_t Receive(ClientSession &session, char *buffer, std::size_t length);
  void CloseSession(ClientSession &session);

  std::string host_;
  int port_;
  WorkerRole role_;
  const WorkerStatus *status_;
  DecodeWorker *decode_worker_;
  MetricsRegistry *metrics_;
  const KvMetricsPublisher *publisher_;
  TlsConfig tls_config_;
  bool tls_enabled_{false};
  SSL_CTX *ssl_ctx_{nullptr};
  std::atomic<bool> running_{false};
  std::atomic<int> server_fd_{-1};
  int num_workers_;
  std::thread accept_thread_;
  std::vector<std::thread> workers_;
  std::queue<ClientSession> client_queue_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
};

}  // namespace pdserve
