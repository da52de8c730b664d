#pragma once
#include <estate/schema/primitives.hpp>

// Schema type: timelock config.
// Marketplace workflow: lower-bound delays for every time-gated transition.
// A zero bid expiry disables expiry.
namespace estate::schema {

template <uint16_t Version>
struct timelock_config;

template <>
struct timelock_config<1> final {
  uint16_t version{1};
  duration_nanoseconds_t bid_expiry{7 * kNanosecondsPerDay};
  duration_nanoseconds_t escrow_release_delay{kNanosecondsPerDay};
  duration_nanoseconds_t lost_bid_claim_delay{kNanosecondsPerDay};

  bool operator==(const timelock_config&) const = default;
};

using timelock_config_t = timelock_config<1>;

}  // namespace estate::schema
