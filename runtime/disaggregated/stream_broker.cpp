#include "runtime/disaggregated/stream_broker.h"

#include "runtime/errors.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <thread>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;

namespace pdserve {
namespace disaggregated {

namespace {

std::atomic<uint64_t> g_msg_seq{0};

// "<id>.<delivery>" -> (id, delivery)
bool SplitReceipt(const std::string &name, std::string *id, uint32_t *delivery) {
  auto dot = name.rfind('.');
  if (dot == std::string::npos || dot == 0) {
    return false;
  }
  try {
    *delivery = static_cast<uint32_t>(std::stoul(name.substr(dot + 1)));
  } catch (const std::exception &) {
    return false;
  }
  *id = name.substr(0, dot);
  return true;
}

std::string ReadFile(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw BrokerUnavailable("cannot read " + path.string());
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

// The pending/ directory is what makes a stream exist.
bool StreamExists(const fs::path &pending) {
  std::error_code ec;
  const bool exists = fs::exists(pending, ec);
  if (ec) {
    throw BrokerUnavailable("cannot stat " + pending.string() + ": " + ec.message());
  }
  return exists;
}

}  // namespace

// ---------------------------------------------------------------------------
// InMemoryStreamBroker
// ---------------------------------------------------------------------------

InMemoryStreamBroker::InMemoryStreamBroker(std::size_t capacity,
                                           std::chrono::milliseconds ack_wait)
    : capacity_(std::max<std::size_t>(1, capacity)), ack_wait_(ack_wait) {}

void InMemoryStreamBroker::EnsureStream(const std::string &stream) {
  std::lock_guard<std::mutex> lock(mutex_);
  streams_.emplace(stream, StreamState{});
}

void InMemoryStreamBroker::Publish(const std::string &stream, std::string payload) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = streams_.find(stream);
    if (it == streams_.end()) {
      throw BrokerUnavailable("stream '" + stream + "' does not exist");
    }
    if (it->second.pending.size() >= capacity_) {
      throw BrokerUnavailable("stream '" + stream + "' is full");
    }
    QueueMessage message;
    message.stream = stream;
    message.message_id = stream + "-" + std::to_string(++next_id_);
    message.payload = std::move(payload);
    it->second.pending.push_back(std::move(message));
  }
  cv_.notify_one();
}

void InMemoryStreamBroker::RequeueExpiredLocked(StreamState &state) {
  auto now = std::chrono::steady_clock::now();
  for (auto it = state.in_flight.begin(); it != state.in_flight.end();) {
    if (it->second.deadline <= now) {
      QueueMessage redelivery = std::move(it->second.message);
      redelivery.delivery_count += 1;
      state.pending.push_front(std::move(redelivery));
      it = state.in_flight.erase(it);
    } else {
      ++it;
    }
  }
}

std::optional<QueueMessage> InMemoryStreamBroker::Pull(const std::string &stream,
                                                       std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    auto it = streams_.find(stream);
    if (it == streams_.end()) {
      throw BrokerUnavailable("stream '" + stream + "' does not exist");
    }
    StreamState &state = it->second;
    RequeueExpiredLocked(state);
    if (!state.pending.empty()) {
      QueueMessage message = std::move(state.pending.front());
      state.pending.pop_front();
      message.receipt = message.message_id;
      state.in_flight[message.receipt] =
          InFlightEntry{message, std::chrono::steady_clock::now() + ack_wait_};
      return message;
    }
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return std::nullopt;
    }
    // Wake at the earlier of the caller deadline and the next redelivery.
    auto wake = deadline;
    for (const auto &entry : state.in_flight) {
      wake = std::min(wake, entry.second.deadline);
    }
    cv_.wait_until(lock, wake);
  }
}

void InMemoryStreamBroker::Ack(const QueueMessage &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = streams_.find(message.stream);
  if (it != streams_.end()) {
    it->second.in_flight.erase(message.receipt);
  }
}

void InMemoryStreamBroker::Nack(const QueueMessage &message) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = streams_.find(message.stream);
    if (it == streams_.end()) {
      return;
    }
    auto entry = it->second.in_flight.find(message.receipt);
    if (entry == it->second.in_flight.end()) {
      return;
    }
    QueueMessage redelivery = std::move(entry->second.message);
    redelivery.delivery_count += 1;
    it->second.in_flight.erase(entry);
    it->second.pending.push_front(std::move(redelivery));
  }
  cv_.notify_one();
}

std::size_t InMemoryStreamBroker::Pending(const std::string &stream) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = streams_.find(stream);
  return it == streams_.end() ? 0 : it->second.pending.size();
}

std::size_t InMemoryStreamBroker::InFlight(const std::string &stream) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = streams_.find(stream);
  return it == streams_.end() ? 0 : it->second.in_flight.size();
}

// ---------------------------------------------------------------------------
// DirectoryStreamBroker
// ---------------------------------------------------------------------------

DirectoryStreamBroker::DirectoryStreamBroker(fs::path root,
                                             std::chrono::milliseconds ack_wait,
                                             std::chrono::milliseconds poll_interval)
    : root_(std::move(root)), ack_wait_(ack_wait), poll_interval_(poll_interval) {}

fs::path DirectoryStreamBroker::StreamDir(const std::string &stream) const {
  if (stream.empty() || stream.find('/') != std::string::npos || stream == "." ||
      stream == "..") {
    throw std::invalid_argument("invalid stream name '" + stream + "'");
  }
  return root_ / "streams" / stream;
}

// static
std::string DirectoryStreamBroker::MakeMessageId() {
  // Zero-padded wall-clock nanoseconds keep lexical order close to publish
  // order across processes; pid + counter make the name unique.
  auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                std::chrono::system_clock::now().time_since_epoch())
                .count();
  std::ostringstream oss;
  oss << std::setw(20) << std::setfill('0') << ns << "-" << ::getpid() << "-"
      << g_msg_seq.fetch_add(1, std::memory_order_relaxed);
  return oss.str();
}

void DirectoryStreamBroker::EnsureStream(const std::string &stream) {
  fs::path dir = StreamDir(stream);
  std::error_code ec;
  fs::create_directories(dir / "pending", ec);
  if (!ec) {
    fs::create_directories(dir / "inflight", ec);
  }
  if (ec) {
    throw BrokerUnavailable("cannot create stream " + dir.string() + ": " + ec.message());
  }
}

void DirectoryStreamBroker::Publish(const std::string &stream, std::string payload) {
  fs::path dir = StreamDir(stream);
  if (!StreamExists(dir / "pending")) {
    throw BrokerUnavailable("stream '" + stream + "' does not exist");
  }
  std::string id = MakeMessageId();
  fs::path tmp = dir / (id + ".tmp");
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw BrokerUnavailable("cannot open " + tmp.string());
    }
    out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    if (!out) {
      out.close();
      std::error_code ignored;
      fs::remove(tmp, ignored);
      throw BrokerUnavailable("short write to " + tmp.string());
    }
  }
  std::error_code ec;
  fs::rename(tmp, dir / "pending" / (id + ".1"), ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    throw BrokerUnavailable("publish rename failed: " + ec.message());
  }
}

void DirectoryStreamBroker::RequeueExpired(const std::string &stream) {
  fs::path dir = StreamDir(stream);
  std::error_code ec;
  auto now = fs::file_time_type::clock::now();
  for (fs::directory_iterator it(dir / "inflight", ec), end; !ec && it != end;
       it.increment(ec)) {
    const auto &entry = *it;
    std::error_code stat_ec;
    auto mtime = fs::last_write_time(entry.path(), stat_ec);
    if (stat_ec || now - mtime < ack_wait_) {
      continue;
    }
    std::string id;
    uint32_t delivery = 0;
    if (!SplitReceipt(entry.path().filename().string(), &id, &delivery)) {
      continue;
    }
    std::error_code mv_ec;
    fs::rename(entry.path(), dir / "pending" / (id + "." + std::to_string(delivery + 1)),
               mv_ec);
  }
  if (ec) {
    throw BrokerUnavailable("cannot scan " + (dir / "inflight").string() + ": " +
                            ec.message());
  }
}

std::optional<QueueMessage> DirectoryStreamBroker::TryClaim(const std::string &stream) {
  fs::path dir = StreamDir(stream);
  std::error_code ec;
  std::vector<std::string> names;
  for (fs::directory_iterator it(dir / "pending", ec), end; !ec && it != end;
       it.increment(ec)) {
    names.push_back(it->path().filename().string());
  }
  if (ec) {
    throw BrokerUnavailable("cannot scan " + (dir / "pending").string() + ": " +
                            ec.message());
  }
  std::sort(names.begin(), names.end());
  for (const auto &name : names) {
    fs::path claimed = dir / "inflight" / name;
    std::error_code mv_ec;
    fs::rename(dir / "pending" / name, claimed, mv_ec);
    if (mv_ec) {
      // Another consumer won the race.
      continue;
    }
    std::error_code touch_ec;
    fs::last_write_time(claimed, fs::file_time_type::clock::now(), touch_ec);
    QueueMessage message;
    message.stream = stream;
    message.receipt = name;
    if (!SplitReceipt(name, &message.message_id, &message.delivery_count)) {
      message.message_id = name;
    }
    message.payload = ReadFile(claimed);
    return message;
  }
  return std::nullopt;
}

std::optional<QueueMessage> DirectoryStreamBroker::Pull(const std::string &stream,
                                                        std::chrono::milliseconds timeout) {
  if (!StreamExists(StreamDir(stream) / "pending")) {
    throw BrokerUnavailable("stream '" + stream + "' does not exist");
  }
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    RequeueExpired(stream);
    if (auto message = TryClaim(stream)) {
      return message;
    }
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return std::nullopt;
    }
    std::this_thread::sleep_for(
        std::min<std::chrono::steady_clock::duration>(poll_interval_, deadline - now));
  }
}

void DirectoryStreamBroker::Ack(const QueueMessage &message) {
  std::error_code ec;
  fs::remove(StreamDir(message.stream) / "inflight" / message.receipt, ec);
}

void DirectoryStreamBroker::Nack(const QueueMessage &message) {
  fs::path dir = StreamDir(message.stream);
  std::error_code ec;
  fs::rename(dir / "inflight" / message.receipt,
             dir / "pending" /
                 (message.message_id + "." + std::to_string(message.delivery_count + 1)),
             ec);
}

std::size_t DirectoryStreamBroker::Pending(const std::string &stream) const {
  std::error_code ec;
  std::size_t count = 0;
  for (fs::directory_iterator it(StreamDir(stream) / "pending", ec), end; !ec && it != end;
       it.increment(ec)) {
    ++count;
  }
  return count;
}

}  // namespace disaggregated
}  // namespace pdserve
