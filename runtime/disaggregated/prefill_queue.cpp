#include "runtime/disaggregated/prefill_queue.h"

#include "runtime/errors.h"
#include "server/logging/logger.h"

#include <algorithm>
#include <thread>

namespace pdserve {
namespace disaggregated {

PrefillQueue::PrefillQueue(std::shared_ptr<StreamBroker> broker, PrefillQueueOptions options)
    : broker_(std::move(broker)), options_(std::move(options)) {
  if (!broker_) throw ConfigError("prefill queue needs a broker");
  if (options_.stream.empty()) throw ConfigError("prefill queue stream name is empty");
  if (options_.max_retries < 0) throw ConfigError("queue.max_retries must be >= 0");
}

std::string PrefillQueue::StreamName(const std::string &ns, const std::string &served_model_name) {
  std::string base = !ns.empty() ? ns : (!served_model_name.empty() ? served_model_name : "pdserve");
  // Broker stream names double as directory names.
  for (char &c : base) {
    if (c == '/' || c == '.' || c == ' ') c = '_';
  }
  return base + "_prefill_queue";
}

void PrefillQueue::EnsureStream() {
  std::lock_guard<std::mutex> lock(stream_mutex_);
  if (stream_ready_) return;
  broker_->EnsureStream(options_.stream);
  stream_ready_ = true;
}

void PrefillQueue::Enqueue(const PrefillRequest &request) {
  if (closed_.load()) throw QueueError("prefill queue is closed");
  const std::string payload = EncodePrefillRequest(request);
  auto backoff = options_.retry_backoff;
  std::string last_error;
  for (int attempt = 0; attempt <= options_.max_retries; ++attempt) {
    try {
      EnsureStream();
      broker_->Publish(options_.stream, payload);
      log::Debug("queue", "enqueued prefill request",
                 "request_id=" + request.request_id + " stream=" + options_.stream);
      return;
    } catch (const BrokerUnavailable &e) {
      last_error = e.what();
      log::Warn("queue", "enqueue attempt failed",
                "request_id=" + request.request_id + " attempt=" + std::to_string(attempt + 1) +
                    " error=" + last_error);
    }
    if (attempt < options_.max_retries) {
      std::this_thread::sleep_for(backoff);
      backoff = std::min(backoff * 2, options_.max_backoff);
    }
  }
  throw QueueError("enqueue of " + request.request_id + " failed after " +
                   std::to_string(options_.max_retries + 1) + " attempts: " + last_error);
}

std::optional<PrefillRequest> PrefillQueue::Dequeue() {
  std::optional<QueueMessage> message;
  try {
    EnsureStream();
    message = broker_->Pull(options_.stream, options_.dequeue_timeout);
  } catch (const BrokerUnavailable &e) {
    log::Warn("queue", "dequeue failed", std::string("error=") + e.what());
    std::this_thread::sleep_for(options_.retry_backoff);
    return std::nullopt;
  }
  if (!message) return std::nullopt;

  std::optional<PrefillRequest> request;
  try {
    request = DecodePrefillRequest(message->payload);
  } catch (const PayloadError &e) {
    discarded_.fetch_add(1);
    log::Error("queue", "discarding malformed prefill payload",
               "message_id=" + message->message_id + " error=" + e.what());
  }
  try {
    broker_->Ack(*message);
  } catch (const BrokerUnavailable &e) {
    // Redelivered after ack_wait; consumers tolerate duplicates.
    log::Warn("queue", "ack failed",
              "message_id=" + message->message_id + " error=" + e.what());
  }
  return request;
}

int PrefillQueue::Size() const {
  try {
    const int size = static_cast<int>(broker_->Pending(options_.stream));
    last_size_.store(size);
    return size;
  } catch (const BrokerUnavailable &e) {
    log::Warn("queue", "queue size unavailable", std::string("error=") + e.what());
    return last_size_.load();
  }
}

void PrefillQueue::Close() {
  if (closed_.exchange(true)) return;
  log::Info("queue", "prefill queue closed", "stream=" + options_.stream);
}

}  // namespace disaggregated
}  // namespace pdserve
