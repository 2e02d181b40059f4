#pragma once

#include <cstddef>

namespace pdserve {
namespace disaggregated {

struct RouterOptions {
  // Prompts at or below this length are always prefilled locally.
  int max_local_prefill_length{1000};
  // Above this queue depth remote prefill is considered congested.
  int max_prefill_queue_size{2};
};

// Local-vs-remote prefill policy.  Pure and stateless; safe to call from any
// number of threads.
class DisaggregatedRouter {
 public:
  explicit DisaggregatedRouter(RouterOptions options = {});

  // True when prefill should be offloaded to the prefill pool.
  // `prefix_hit_rate` is accepted for callers that have it but does not
  // influence the decision.
  bool Decide(int prompt_length, double prefix_hit_rate, int queue_depth) const;

  const RouterOptions &Options() const { return options_; }

 private:
  RouterOptions options_;
};

}  // namespace disaggregated
}  // namespace pdserve
