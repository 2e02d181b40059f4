#include <catch2/catch.hpp>

#include "runtime/engine/echo_engine.h"
#include "runtime/engine/engine_factory.h"
#include "runtime/errors.h"

#include <algorithm>

using namespace pdserve;

namespace {

class CountingAdapter : public EngineAdapter {
 public:
  explicit CountingAdapter(int *created) : created_(created) {}
  std::string Name() const override { return "Counting"; }
  std::unique_ptr<InferenceEngine> Create(const EngineArgs &args,
                                          disaggregated::TransferSession &session) const override {
    ++*created_;
    return std::make_unique<EchoEngine>(args, session);
  }

 private:
  int *created_;
};

}  // namespace

TEST_CASE("NormalizeBackend lowercases, trims and defaults to echo", "[engine_factory]") {
  REQUIRE(EngineFactory::NormalizeBackend("") == "echo");
  REQUIRE(EngineFactory::NormalizeBackend("  ECHO ") == "echo");
  REQUIRE(EngineFactory::NormalizeBackend("Echo") == "echo");
}

TEST_CASE("EngineFactory builds the echo engine by default", "[engine_factory]") {
  disaggregated::TransferSession session("factory");
  REQUIRE(EngineFactory::HasAdapter("echo"));
  REQUIRE(EngineFactory::HasAdapter(""));

  EngineArgs args;
  args.backend = " Echo ";
  auto engine = EngineFactory::Create(args, session);
  REQUIRE(engine != nullptr);
  REQUIRE(dynamic_cast<EchoEngine *>(engine.get()) != nullptr);
  REQUIRE(engine->Stats().total_kv_blocks == args.kv_total_blocks);
}

TEST_CASE("EngineFactory rejects unknown backends", "[engine_factory]") {
  disaggregated::TransferSession session("factory");
  EngineArgs args;
  args.backend = "tensorrt";
  REQUIRE_FALSE(EngineFactory::HasAdapter("tensorrt"));
  REQUIRE_THROWS_AS(EngineFactory::Create(args, session), ConfigError);
}

TEST_CASE("EngineFactory reports rejected arguments as config errors", "[engine_factory]") {
  disaggregated::TransferSession session("factory");
  EngineArgs args;
  args.max_num_seqs = 0;
  REQUIRE_THROWS_AS(EngineFactory::Create(args, session), ConfigError);
}

TEST_CASE("Registered adapters are selectable by normalized name", "[engine_factory]") {
  int created = 0;
  EngineFactory::RegisterAdapter(std::make_shared<CountingAdapter>(&created));
  REQUIRE(EngineFactory::HasAdapter("COUNTING"));
  const auto names = EngineFactory::Adapters();
  REQUIRE(std::find(names.begin(), names.end(), "counting") != names.end());
  REQUIRE(std::find(names.begin(), names.end(), "echo") != names.end());

  disaggregated::TransferSession session("factory");
  EngineArgs args;
  args.backend = "counting";
  auto engine = EngineFactory::Create(args, session);
  REQUIRE(engine != nullptr);
  REQUIRE(created == 1);
}
