#include <catch2/catch.hpp>

#include "runtime/disaggregated/metadata_store.h"
#include "runtime/errors.h"

#include <chrono>
#include <memory>
#include <thread>

using namespace pdserve;
using namespace pdserve::disaggregated;
using namespace std::chrono_literals;

namespace {

MetadataStoreOptions FastOptions(std::chrono::milliseconds timeout) {
  MetadataStoreOptions options;
  options.get_timeout = timeout;
  options.initial_poll = 1ms;
  options.max_poll = 5ms;
  return options;
}

}  // namespace

TEST_CASE("Metadata round-trips unchanged", "[metadata]") {
  auto backend = std::make_shared<InMemoryKeyValueBackend>();
  MetadataStore store(backend, FastOptions(100ms));
  const std::string blob("{\"engine_id\":\"echo-1\"}\0tail", 27);
  store.Put(EngineMetadata{"echo-1", blob});

  const EngineMetadata got = store.Get("echo-1");
  REQUIRE(got.engine_id == "echo-1");
  REQUIRE(got.blob == blob);
  REQUIRE(backend->Get("engine_metadata/echo-1").has_value());
}

TEST_CASE("TryGet does not block", "[metadata]") {
  MetadataStore store(std::make_shared<InMemoryKeyValueBackend>(), FastOptions(5000ms));
  const auto start = std::chrono::steady_clock::now();
  REQUIRE_FALSE(store.TryGet("echo-missing").has_value());
  REQUIRE(std::chrono::steady_clock::now() - start < 1000ms);
}

TEST_CASE("Get waits for a late publisher", "[metadata]") {
  auto backend = std::make_shared<InMemoryKeyValueBackend>();
  MetadataStore reader(backend, FastOptions(2000ms));
  MetadataStore writer(backend);
  std::thread publisher([&] {
    std::this_thread::sleep_for(30ms);
    writer.Put(EngineMetadata{"echo-late", "blob"});
  });
  const EngineMetadata got = reader.Get("echo-late");
  publisher.join();
  REQUIRE(got.blob == "blob");
}

TEST_CASE("Get past its bound is MetadataUnavailable", "[metadata]") {
  MetadataStore store(std::make_shared<InMemoryKeyValueBackend>(), FastOptions(20ms));
  REQUIRE_THROWS_AS(store.Get("echo-never"), MetadataUnavailable);
}

TEST_CASE("Get stops early on cancellation", "[metadata]") {
  MetadataStore store(std::make_shared<InMemoryKeyValueBackend>(), FastOptions(10000ms));
  CancellationToken cancel;
  cancel.Cancel();
  const auto start = std::chrono::steady_clock::now();
  REQUIRE_THROWS_AS(store.Get("echo-never", &cancel), MetadataUnavailable);
  REQUIRE(std::chrono::steady_clock::now() - start < 1000ms);
}

TEST_CASE("Engine ids cannot address other keys", "[metadata]") {
  MetadataStore store(std::make_shared<InMemoryKeyValueBackend>());
  REQUIRE_THROWS_AS(store.Put(EngineMetadata{"../instances", "x"}), MetadataUnavailable);
  REQUIRE_THROWS_AS(store.TryGet(""), MetadataUnavailable);
}
