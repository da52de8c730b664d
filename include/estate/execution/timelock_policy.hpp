#pragma once

#include <estate/schema/bid_state.hpp>
#include <estate/schema/primitives.hpp>
#include <estate/schema/timelock_config.hpp>
#include <optional>

namespace estate::execution {

/// Time gates of the bid lifecycle. Delays are lower bounds against block
/// time; all arithmetic saturates instead of wrapping.
class timelock_policy final {
 public:
  timelock_policy() = default;
  explicit timelock_policy(estate::schema::timelock_config_t config);

  const estate::schema::timelock_config_t& config() const { return config_; }
  void set_config(const estate::schema::timelock_config_t& config);

  /// Expiry stamped on a new bid; nullopt when bid expiry is disabled.
  std::optional<estate::schema::timestamp_nanoseconds_t> bid_expires_at(
      estate::schema::timestamp_nanoseconds_t now) const;

  bool is_bid_expired(const estate::schema::bid_state_t& bid,
                      estate::schema::timestamp_nanoseconds_t now) const;

  /// False until docs were confirmed and the release delay has passed.
  bool escrow_release_elapsed(
      const estate::schema::bid_state_t& bid,
      estate::schema::timestamp_nanoseconds_t now) const;

  bool lost_bid_claim_elapsed(
      estate::schema::timestamp_nanoseconds_t completed_at,
      estate::schema::timestamp_nanoseconds_t now) const;

  static bool timeout_elapsed(estate::schema::timestamp_nanoseconds_t since,
                              estate::schema::duration_nanoseconds_t timeout,
                              estate::schema::timestamp_nanoseconds_t now);

 private:
  estate::schema::timelock_config_t config_{};
};

}  // namespace estate::execution
