#include <estate/execution/timelock_policy.hpp>

#include <limits>

namespace estate::execution {

using namespace estate::schema;

timelock_policy::timelock_policy(timelock_config_t config)
    : config_{std::move(config)} {}

void timelock_policy::set_config(const timelock_config_t& config) {
  config_ = config;
}

std::optional<timestamp_nanoseconds_t> timelock_policy::bid_expires_at(
    const timestamp_nanoseconds_t now) const {
  if (config_.bid_expiry == 0) {
    return std::nullopt;
  }
  if (now > std::numeric_limits<timestamp_nanoseconds_t>::max() -
                config_.bid_expiry) {
    return std::numeric_limits<timestamp_nanoseconds_t>::max();
  }
  return now + config_.bid_expiry;
}

bool timelock_policy::is_bid_expired(const bid_state_t& bid,
                                     const timestamp_nanoseconds_t now) const {
  return bid.expires_at.has_value() && now >= *bid.expires_at;
}

bool timelock_policy::escrow_release_elapsed(
    const bid_state_t& bid,
    const timestamp_nanoseconds_t now) const {
  if (!bid.docs_confirmed_at) {
    return false;
  }
  return timeout_elapsed(*bid.docs_confirmed_at, config_.escrow_release_delay,
                         now);
}

bool timelock_policy::lost_bid_claim_elapsed(
    const timestamp_nanoseconds_t completed_at,
    const timestamp_nanoseconds_t now) const {
  return timeout_elapsed(completed_at, config_.lost_bid_claim_delay, now);
}

bool timelock_policy::timeout_elapsed(const timestamp_nanoseconds_t since,
                                      const duration_nanoseconds_t timeout,
                                      const timestamp_nanoseconds_t now) {
  if (now < since) {
    return false;
  }
  return now - since >= timeout;
}

}  // namespace estate::execution
