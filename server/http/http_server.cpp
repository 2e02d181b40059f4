#include "server/http/http_server.h"

#include "runtime/errors.h"
#include "server/http/generate_codec.h"
#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

#include <openssl/err.h>
#include <openssl/ssl.h>

using json = nlohmann::json;

namespace pdserve {

namespace {

constexpr const char *kComponent = "http";

std::string BuildResponse(const std::string &body, int status = 200,
                          const std::string &status_text = "OK",
                          const std::string &content_type = "application/json") {
  std::string headers =
      "HTTP/1.1 " + std::to_string(status) + " " + status_text + "\r\n";
  headers += "Content-Type: " + content_type + "\r\n";
  headers += "Connection: close\r\n";
  headers += "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n";
  return headers + body;
}

std::string BuildErrorBody(const std::string &error) {
  return json({{"error", error}}).dump();
}

// Case-insensitive lookup of Content-Length in the raw header block.
bool ParseContentLength(const std::string &headers, std::size_t *out) {
  std::string lower(headers);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  auto pos = lower.find("\r\ncontent-length:");
  if (pos == std::string::npos) {
    *out = 0;
    return true;
  }
  auto start = pos + 17;
  auto end = lower.find("\r\n", start);
  std::string value = headers.substr(start, end == std::string::npos
                                                ? std::string::npos
                                                : end - start);
  value.erase(0, value.find_first_not_of(" \t"));
  value.erase(value.find_last_not_of(" \t") + 1);
  if (value.empty() ||
      !std::all_of(value.begin(), value.end(),
                   [](unsigned char c) { return std::isdigit(c) != 0; })) {
    return false;
  }
  try {
    *out = static_cast<std::size_t>(std::stoull(value));
  } catch (const std::out_of_range &) {
    return false;
  }
  return true;
}

}  // namespace

HttpServer::HttpServer(std::string host, int port, WorkerRole role,
                       const WorkerStatus *status, DecodeWorker *decode_worker,
                       MetricsRegistry *metrics,
                       const KvMetricsPublisher *publisher,
                       TlsConfig tls_config, int num_workers)
    : host_(std::move(host)), port_(port), role_(role), status_(status),
      decode_worker_(decode_worker), metrics_(metrics), publisher_(publisher),
      tls_config_(std::move(tls_config)),
      num_workers_(num_workers > 0 ? num_workers : 4) {}

HttpServer::~HttpServer() {
  Stop();
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
}

void HttpServer::Start() {
  if (running_) {
    return;
  }
  if (tls_config_.enabled && !ssl_ctx_) {
    if (tls_config_.cert_path.empty() || tls_config_.key_path.empty()) {
      throw ConfigError("server.tls.enabled requires cert_path and key_path");
    }
    ssl_ctx_ = SSL_CTX_new(TLS_server_method());
    if (!ssl_ctx_) {
      throw ConfigError("failed to initialize TLS context");
    }
    SSL_CTX_set_ecdh_auto(ssl_ctx_, 1);
    if (SSL_CTX_use_certificate_file(ssl_ctx_, tls_config_.cert_path.c_str(),
                                     SSL_FILETYPE_PEM) <= 0) {
      SSL_CTX_free(ssl_ctx_);
      ssl_ctx_ = nullptr;
      throw ConfigError("failed to load TLS certificate: " +
                        tls_config_.cert_path);
    }
    if (SSL_CTX_use_PrivateKey_file(ssl_ctx_, tls_config_.key_path.c_str(),
                                    SSL_FILETYPE_PEM) <= 0) {
      SSL_CTX_free(ssl_ctx_);
      ssl_ctx_ = nullptr;
      throw ConfigError("failed to load TLS key: " + tls_config_.key_path);
    }
    tls_enabled_ = true;
    log::Info(kComponent, "TLS enabled", "cert=" + tls_config_.cert_path);
  }
  running_ = true;
  for (int i = 0; i < num_workers_; ++i) {
    workers_.emplace_back(&HttpServer::WorkerLoop, this);
  }
  accept_thread_ = std::thread(&HttpServer::Run, this);
}

void HttpServer::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  // Closing the listener unblocks accept() in Run().
  int fd = server_fd_.exchange(-1);
  if (fd >= 0) {
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
  }
  queue_cv_.notify_all();
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  for (auto &w : workers_) {
    if (w.joinable()) {
      w.join();
    }
  }
  workers_.clear();
  std::lock_guard<std::mutex> lock(queue_mutex_);
  while (!client_queue_.empty()) {
    auto session = client_queue_.front();
    client_queue_.pop();
    CloseSession(session);
  }
}

void HttpServer::WorkerLoop() {
  while (true) {
    ClientSession session;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock,
                     [this] { return !client_queue_.empty() || !running_; });
      if (!running_ && client_queue_.empty()) {
        return;
      }
      session = client_queue_.front();
      client_queue_.pop();
    }
    if (session.fd >= 0) {
      HandleClient(session);
      CloseSession(session);
    }
  }
}

void HttpServer::Run() {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    log::Error(kComponent, "socket() failed", std::strerror(errno));
    return;
  }

  int opt = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(port_));
  if (::inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) != 1) {
    log::Error(kComponent, "invalid listen address", "host=" + host_);
    ::close(fd);
    return;
  }

  if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    log::Error(kComponent, "bind() failed",
               "port=" + std::to_string(port_) + " " + std::strerror(errno));
    ::close(fd);
    return;
  }
  if (::listen(fd, 128) < 0) {
    log::Error(kComponent, "listen() failed", std::strerror(errno));
    ::close(fd);
    return;
  }

  server_fd_.store(fd);
  log::Info(kComponent, "listening",
            "addr=" + host_ + ":" + std::to_string(port_) +
                " role=" + WorkerRoleName(role_));

  while (running_) {
    sockaddr_in client_addr;
    socklen_t client_len = sizeof(client_addr);
    int client_fd =
        ::accept(fd, reinterpret_cast<sockaddr *>(&client_addr), &client_len);
    if (client_fd < 0) {
      break;
    }
    if (!running_) {
      ::close(client_fd);
      break;
    }
    ClientSession session;
    session.fd = client_fd;
    if (tls_enabled_) {
      SSL *ssl = SSL_new(ssl_ctx_);
      if (!ssl) {
        ::close(client_fd);
        continue;
      }
      SSL_set_fd(ssl, client_fd);
      if (SSL_accept(ssl) != 1) {
        log::Debug(kComponent, "TLS handshake failed");
        SSL_free(ssl);
        ::close(client_fd);
        continue;
      }
      session.ssl = ssl;
    }
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      client_queue_.push(session);
    }
    queue_cv_.notify_one();
  }

  int expected = fd;
  if (server_fd_.compare_exchange_strong(expected, -1)) {
    ::close(fd);
  }
}

void HttpServer::HandleClient(ClientSession &session) {
  struct ConnectionGuard {
    MetricsRegistry *metrics;
    ~ConnectionGuard() {
      if (metrics) {
        metrics->DecrementConnections();
      }
    }
  } guard{metrics_};
  if (metrics_) {
    metrics_->IncrementConnections();
  }

  constexpr std::size_t kInitialBuf = 4096;
  constexpr std::size_t kMaxRequest = 16 * 1024 * 1024;
  std::string request;
  std::size_t header_end = std::string::npos;
  char buffer[kInitialBuf];

  while (header_end == std::string::npos) {
    if (request.size() >= kMaxRequest) {
      SendAll(session, BuildResponse(BuildErrorBody("request_too_large"), 413,
                                     "Payload Too Large"));
      return;
    }
    ssize_t bytes = Receive(session, buffer, sizeof(buffer));
    if (bytes <= 0) {
      return;
    }
    request.append(buffer, static_cast<std::size_t>(bytes));
    header_end = request.find("\r\n\r\n");
  }

  std::string headers = request.substr(0, header_end);
  std::size_t content_length = 0;
  if (!ParseContentLength(headers, &content_length)) {
    SendAll(session, BuildResponse(BuildErrorBody("invalid_content_length"),
                                   400, "Bad Request"));
    return;
  }
  if (content_length > kMaxRequest) {
    SendAll(session, BuildResponse(BuildErrorBody("request_too_large"), 413,
                                   "Payload Too Large"));
    return;
  }
  std::size_t needed = header_end + 4 + content_length;
  while (request.size() < needed) {
    ssize_t bytes = Receive(session, buffer,
                            std::min(sizeof(buffer), needed - request.size()));
    if (bytes <= 0) {
      return;
    }
    request.append(buffer, static_cast<std::size_t>(bytes));
  }
  std::string body = request.substr(header_end + 4, content_length);

  auto first_line_end = headers.find("\r\n");
  std::string first_line = headers.substr(0, first_line_end);
  auto method_end = first_line.find(' ');
  auto path_end = first_line.find(' ', method_end + 1);
  if (method_end == std::string::npos) {
    SendAll(session, BuildResponse(BuildErrorBody("malformed_request_line"),
                                   400, "Bad Request"));
    return;
  }
  std::string method = first_line.substr(0, method_end);
  std::string path =
      first_line.substr(method_end + 1, path_end == std::string::npos
                                            ? std::string::npos
                                            : path_end - method_end - 1);
  auto query = path.find('?');
  if (query != std::string::npos) {
    path.resize(query);
  }

  if (method == "GET" && path == "/livez") {
    SendAll(session, BuildResponse(json({{"status", "ok"}}).dump()));
    return;
  }
  if (method == "GET" && (path == "/readyz" || path == "/healthz")) {
    WorkerState state = status_ ? status_->State() : WorkerState::kStopped;
    bool ready = state == WorkerState::kReady;
    json out = {{"status", ready ? "ready" : "not_ready"},
                {"role", WorkerRoleName(role_)}};
    if (!ready) {
      out["reason"] = std::string("worker ") + WorkerStateName(state);
    }
    SendAll(session, BuildResponse(out.dump(), ready ? 200 : 503,
                                   ready ? "OK" : "Service Unavailable"));
    return;
  }
  if (method == "GET" && path == "/metrics") {
    std::string text = metrics_ ? metrics_->RenderPrometheus() : "";
    if (publisher_) {
      text += publisher_->RenderPrometheus();
    }
    SendAll(session, BuildResponse(text, 200, "OK",
                                   "text/plain; version=0.0.4"));
    return;
  }
  if (path == "/v1/generate") {
    if (method != "POST") {
      SendAll(session, BuildResponse(BuildErrorBody("method_not_allowed"), 405,
                                     "Method Not Allowed"));
      return;
    }
    if (!decode_worker_) {
      SendAll(session,
              BuildResponse(BuildErrorBody("generate is served by decode "
                                           "workers only"),
                            404, "Not Found"));
      return;
    }
    HandleGenerate(session, body);
    return;
  }

  SendAll(session, BuildResponse(BuildErrorBody("not_found"), 404, "Not Found"));
}

void HttpServer::HandleGenerate(ClientSession &session,
                                const std::string &body) {
  GenerateBody parsed;
  std::string error;
  if (!ParseGenerateBody(body, &parsed, &error)) {
    SendAll(session, BuildResponse(BuildErrorBody(error), 400, "Bad Request"));
    return;
  }
  if (!decode_worker_->Ready()) {
    SendAll(session, BuildResponse(BuildErrorBody("worker not ready"), 503,
                                   "Service Unavailable"));
    return;
  }

  if (parsed.stream) {
    const std::string stream_headers = "HTTP/1.1 200 OK\r\n"
                                       "Content-Type: text/event-stream\r\n"
                                       "Cache-Control: no-cache\r\n"
                                       "Connection: close\r\n\r\n";
    if (!SendAll(session, stream_headers)) {
      return;
    }
    // Writes stop once the client is gone; the request still runs to the end.
    bool client_alive = true;
    decode_worker_->Generate(parsed.request, [&](const ResponseDelta &delta) {
      if (client_alive) {
        client_alive = SendAll(session, "data: " + RenderDelta(delta) + "\n\n");
      }
    });
    if (client_alive) {
      SendAll(session, "data: [DONE]\n\n");
    }
    return;
  }

  ResponseDelta aggregate;
  decode_worker_->Generate(parsed.request, [&](const ResponseDelta &delta) {
    aggregate.token_ids.insert(aggregate.token_ids.end(),
                               delta.token_ids.begin(), delta.token_ids.end());
    if (!delta.finish_reason.empty()) {
      aggregate.finish_reason = delta.finish_reason;
      aggregate.stop_reason = delta.stop_reason;
    }
  });
  if (aggregate.finish_reason == "error") {
    SendAll(session, BuildResponse(RenderDelta(aggregate), 500,
                                   "Internal Server Error"));
    return;
  }
  SendAll(session, BuildResponse(RenderDelta(aggregate)));
}

bool HttpServer::SendAll(ClientSession &session, const std::string &payload) {
  const char *data = payload.c_str();
  std::size_t remaining = payload.size();
  while (remaining > 0) {
    int sent = 0;
    if (session.ssl) {
      sent = SSL_write(session.ssl, data, static_cast<int>(remaining));
      if (sent <= 0) {
        int err = SSL_get_error(session.ssl, sent);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
          continue;
        }
        return false;
      }
    } else {
      sent = static_cast<int>(::send(session.fd, data, remaining, MSG_NOSIGNAL));
      if (sent <= 0) {
        if (errno == EINTR) {
          continue;
        }
        return false;
      }
    }
    data += sent;
    remaining -= static_cast<std::size_t>(sent);
  }
  return true;
}

ssize_t HttpServer::Receive(ClientSession &session, char *buffer,
                            std::size_t length) {
  if (session.ssl) {
    while (true) {
      int received = SSL_read(session.ssl, buffer, static_cast<int>(length));
      if (received > 0) {
        return received;
      }
      int err = SSL_get_error(session.ssl, received);
      if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
        continue;
      }
      return -1;
    }
  }
  while (true) {
    ssize_t received = ::recv(session.fd, buffer, length, 0);
    if (received < 0 && errno == EINTR) {
      continue;
    }
    return received;
  }
}

void HttpServer::CloseSession(ClientSession &session) {
  if (session.ssl) {
    SSL_shutdown(session.ssl);
    SSL_free(session.ssl);
    session.ssl = nullptr;
  }
  if (session.fd >= 0) {
    ::close(session.fd);
    session.fd = -1;
  }
}

}  // namespace pdserve
