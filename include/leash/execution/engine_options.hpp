#pragma once

#include <leash/schema/primitives.hpp>
#include <cstdint>

namespace leash::execution {

struct engine_options final {
  /// Compare-and-swap attempts before an operation reports contention.
  uint32_t max_cas_retries{8};
  /// Renewal look-ahead is max(duration * ratio / 100, floor).
  uint32_t lookahead_ratio_percent{10};
  leash::schema::duration_seconds_t lookahead_floor_seconds{3600};
  /// Challenges unanswered for longer than this are expired by the sweep.
  leash::schema::duration_seconds_t challenge_ttl_seconds{900};
  leash::schema::duration_seconds_t renewal_interval_seconds{60};
};

}  // namespace leash::execution
