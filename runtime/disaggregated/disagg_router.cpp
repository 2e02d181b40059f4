#include "runtime/disaggregated/disagg_router.h"

#include "runtime/errors.h"

#include <string>

namespace pdserve {
namespace disaggregated {

DisaggregatedRouter::DisaggregatedRouter(RouterOptions options) : options_(options) {
  if (options_.max_local_prefill_length < 0) {
    throw ConfigError("router.max_local_prefill_length must be >= 0, got " +
                      std::to_string(options_.max_local_prefill_length));
  }
  if (options_.max_prefill_queue_size < 0) {
    throw ConfigError("router.max_prefill_queue_size must be >= 0, got " +
                      std::to_string(options_.max_prefill_queue_size));
  }
}

bool DisaggregatedRouter::Decide(int prompt_length, double /*prefix_hit_rate*/,
                                 int queue_depth) const {
  if (prompt_length <= options_.max_local_prefill_length) return false;
  // Congestion overrides the size preference.
  if (queue_depth > options_.max_prefill_queue_size) return false;
  return true;
}

}  // namespace disaggregated
}  // namespace pdserve
