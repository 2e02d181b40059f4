#include <catch2/catch.hpp>

#include "runtime/disaggregated/disagg_router.h"
#include "runtime/errors.h"

using namespace pdserve;
using namespace pdserve::disaggregated;

TEST_CASE("Router defaults", "[router]") {
  DisaggregatedRouter router;
  REQUIRE(router.Options().max_local_prefill_length == 1000);
  REQUIRE(router.Options().max_prefill_queue_size == 2);
}

TEST_CASE("Prompts at or below the threshold stay local", "[router]") {
  DisaggregatedRouter router(RouterOptions{50, 2});
  REQUIRE_FALSE(router.Decide(0, 0.0, 0));
  REQUIRE_FALSE(router.Decide(50, 0.0, 0));
  REQUIRE(router.Decide(51, 0.0, 0));
  REQUIRE(router.Decide(200, 0.0, 0));
}

TEST_CASE("A congested queue forces local prefill", "[router]") {
  DisaggregatedRouter router(RouterOptions{50, 2});
  REQUIRE(router.Decide(200, 0.0, 2));
  REQUIRE_FALSE(router.Decide(200, 0.0, 3));
  REQUIRE_FALSE(router.Decide(10000, 0.0, 100));
}

TEST_CASE("Prefix hit rate does not change the decision", "[router]") {
  DisaggregatedRouter router(RouterOptions{50, 2});
  REQUIRE(router.Decide(200, 0.0, 0) == router.Decide(200, 1.0, 0));
  REQUIRE(router.Decide(10, 0.0, 0) == router.Decide(10, 0.9, 0));
}

TEST_CASE("Zero thresholds", "[router]") {
  DisaggregatedRouter router(RouterOptions{0, 0});
  REQUIRE(router.Decide(1, 0.0, 0));
  REQUIRE_FALSE(router.Decide(1, 0.0, 1));
}

TEST_CASE("Negative thresholds are rejected", "[router]") {
  REQUIRE_THROWS_AS(DisaggregatedRouter(RouterOptions{-1, 2}), ConfigError);
  REQUIRE_THROWS_AS(DisaggregatedRouter(RouterOptions{10, -1}), ConfigError);
}
