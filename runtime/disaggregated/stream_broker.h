#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace pdserve {
namespace disaggregated {

// One broker delivery.  `payload` is the serialized PrefillRequest; the rest
// is delivery metadata owned by the broker.
struct QueueMessage {
  std::string stream;
  std::string message_id;
  std::string payload;
  uint32_t delivery_count{1};
  // Broker-private handle used by Ack()/Nack().
  std::string receipt;
  std::chrono::steady_clock::time_point publish_time{std::chrono::steady_clock::now()};
};

// Durable multi-producer/multi-consumer stream broker.  Delivery is
// at-least-once: a pulled message that is neither acknowledged nor
// negatively acknowledged within the ack wait is delivered again.
//
// Transient failures (broker unreachable, stream full, I/O errors) throw
// BrokerUnavailable; callers decide whether to retry.
class StreamBroker {
 public:
  virtual ~StreamBroker() = default;
  // Idempotent.
  virtual void EnsureStream(const std::string &stream) = 0;
  virtual void Publish(const std::string &stream, std::string payload) = 0;
  // Blocks up to `timeout`; nullopt when nothing arrived.
  virtual std::optional<QueueMessage> Pull(const std::string &stream,
                                           std::chrono::milliseconds timeout) = 0;
  virtual void Ack(const QueueMessage &message) = 0;
  virtual void Nack(const QueueMessage &message) = 0;
  // Messages published but not yet claimed by a consumer.
  virtual std::size_t Pending(const std::string &stream) const = 0;
};

// Thread-safe in-process broker.  Default when `store.backend: memory`.
class InMemoryStreamBroker : public StreamBroker {
 public:
  explicit InMemoryStreamBroker(std::size_t capacity = 1024,
                                std::chrono::milliseconds ack_wait = std::chrono::seconds(30));

  void EnsureStream(const std::string &stream) override;
  void Publish(const std::string &stream, std::string payload) override;
  std::optional<QueueMessage> Pull(const std::string &stream,
                                   std::chrono::milliseconds timeout) override;
  void Ack(const QueueMessage &message) override;
  void Nack(const QueueMessage &message) override;
  std::size_t Pending(const std::string &stream) const override;

  std::size_t InFlight(const std::string &stream) const;

 private:
  struct InFlightEntry {
    QueueMessage message;
    std::chrono::steady_clock::time_point deadline;
  };
  struct StreamState {
    std::deque<QueueMessage> pending;
    std::unordered_map<std::string, InFlightEntry> in_flight;
  };

  // Moves expired in-flight deliveries back to the head of `state.pending`.
  void RequeueExpiredLocked(StreamState &state);

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::unordered_map<std::string, StreamState> streams_;
  std::size_t capacity_;
  std::chrono::milliseconds ack_wait_;
  uint64_t next_id_{0};
};

// Filesystem-backed broker shared by every process on the host that points
// at the same root.  Layout per stream:
//   <root>/streams/<stream>/pending/<id>.<delivery>
//   <root>/streams/<stream>/inflight/<id>.<delivery>
// Consumers claim a message by renaming it into inflight/ (atomic on POSIX),
// acknowledge by unlinking it, and expired claims are renamed back.
class DirectoryStreamBroker : public StreamBroker {
 public:
  explicit DirectoryStreamBroker(std::filesystem::path root,
                                 std::chrono::milliseconds ack_wait = std::chrono::seconds(30),
                                 std::chrono::milliseconds poll_interval = std::chrono::milliseconds(10));

  void EnsureStream(const std::string &stream) override;
  void Publish(const std::string &stream, std::string payload) override;
  std::optional<QueueMessage> Pull(const std::string &stream,
                                   std::chrono::milliseconds timeout) override;
  void Ack(const QueueMessage &message) override;
  void Nack(const QueueMessage &message) override;
  std::size_t Pending(const std::string &stream) const override;

 private:
  std::filesystem::path StreamDir(const std::string &stream) const;
  std::optional<QueueMessage> TryClaim(const std::string &stream);
  void RequeueExpired(const std::string &stream);
  static std::string MakeMessageId();

  std::filesystem::path root_;
  std::chrono::milliseconds ack_wait_;
  std::chrono::milliseconds poll_interval_;
};

}  // namespace disaggregated
}  // namespace pdserve
