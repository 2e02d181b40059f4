#include <catch2/catch.hpp>

#include "runtime/disaggregated/prefill_queue.h"
#include "runtime/errors.h"

#include <atomic>
#include <chrono>
#include <memory>

using namespace pdserve;
using namespace pdserve::disaggregated;
using namespace std::chrono_literals;

namespace {

// Broker that is always unreachable on publish.
class UnreachableBroker : public StreamBroker {
 public:
  void EnsureStream(const std::string &) override {}
  void Publish(const std::string &, std::string) override {
    publishes.fetch_add(1);
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

  std::atomic<int> publishes{0};
};

PrefillQueueOptions FastOptions() {
  PrefillQueueOptions options;
  options.stream = "test_prefill_queue";
  options.max_retries = 2;
  options.retry_backoff = 1ms;
  options.max_backoff = 4ms;
  options.dequeue_timeout = 20ms;
  return options;
}

PrefillRequest MakeRequest(const std::string &id, std::size_t tokens) {
  PrefillRequest r;
  r.request_id = id;
  r.engine_id = "echo-1";
  for (std::size_t i = 0; i < tokens; ++i) r.prompt_token_ids.push_back(static_cast<int32_t>(i));
  r.block_ids = {0};
  r.transfer_descriptor = "handle";
  return r;
}

}  // namespace

TEST_CASE("StreamName derives from namespace, then model name", "[prefill_queue]") {
  REQUIRE(PrefillQueue::StreamName("dynamo", "llama") == "dynamo_prefill_queue");
  REQUIRE(PrefillQueue::StreamName("", "meta/llama-3.1") == "meta_llama-3_1_prefill_queue");
  REQUIRE(PrefillQueue::StreamName("", "") == "pdserve_prefill_queue");
}

TEST_CASE("Enqueued requests are dequeued intact", "[prefill_queue]") {
  auto broker = std::make_shared<InMemoryStreamBroker>();
  PrefillQueue queue(broker, FastOptions());
  const auto request = MakeRequest("req-1", 200);
  queue.Enqueue(request);
  REQUIRE(queue.Size() == 1);

  auto got = queue.Dequeue();
  REQUIRE(got.has_value());
  REQUIRE(*got == request);
  REQUIRE(got->prompt_token_ids.size() == 200);
  REQUIRE(queue.Size() == 0);
  REQUIRE(broker->InFlight(queue.Stream()) == 0);
}

TEST_CASE("Dequeue times out with nothing queued", "[prefill_queue]") {
  PrefillQueue queue(std::make_shared<InMemoryStreamBroker>(), FastOptions());
  REQUIRE_FALSE(queue.Dequeue().has_value());
}

TEST_CASE("Malformed payload is discarded and the next request still arrives", "[prefill_queue]") {
  auto broker = std::make_shared<InMemoryStreamBroker>();
  PrefillQueue queue(broker, FastOptions());
  broker->EnsureStream(queue.Stream());
  broker->Publish(queue.Stream(), "{\"engine_id\":\"echo-1\",\"token_ids\":[1]}");
  queue.Enqueue(MakeRequest("req-2", 3));

  REQUIRE_FALSE(queue.Dequeue().has_value());
  REQUIRE(queue.DiscardedPayloads() == 1);
  // The bad message was acknowledged, not left for redelivery.
  REQUIRE(broker->InFlight(queue.Stream()) == 0);

  auto next = queue.Dequeue();
  REQUIRE(next.has_value());
  REQUIRE(next->request_id == "req-2");
}

TEST_CASE("Enqueue gives up after the retry budget", "[prefill_queue]") {
  auto broker = std::make_shared<UnreachableBroker>();
  PrefillQueue queue(broker, FastOptions());
  REQUIRE_THROWS_AS(queue.Enqueue(MakeRequest("req-3", 1)), QueueError);
  REQUIRE(broker->publishes.load() == 3);
}

TEST_CASE("Broker outages do not escape Dequeue or Size", "[prefill_queue]") {
  PrefillQueue queue(std::make_shared<UnreachableBroker>(), FastOptions());
  REQUIRE_FALSE(queue.Dequeue().has_value());
  REQUIRE(queue.Size() == 0);
}

TEST_CASE("Closed queue refuses new requests", "[prefill_queue]") {
  PrefillQueue queue(std::make_shared<InMemoryStreamBroker>(), FastOptions());
  queue.Close();
  REQUIRE(queue.Closed());
  REQUIRE_THROWS_AS(queue.Enqueue(MakeRequest("req-4", 1)), QueueError);
}

TEST_CASE("Queue construction validates options", "[prefill_queue]") {
  PrefillQueueOptions options = FastOptions();
  options.stream.clear();
  REQUIRE_THROWS_AS(PrefillQueue(std::make_shared<InMemoryStreamBroker>(), options), ConfigError);
}
