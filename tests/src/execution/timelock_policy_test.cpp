#include <estate/execution/timelock_policy.hpp>
#include <gtest/gtest.h>

#include <limits>

namespace {

constexpr auto kDay = estate::schema::kNanosecondsPerDay;

}  // namespace

TEST(timelock_policy, defaults_match_marketplace_delays) {
  auto policy = estate::execution::timelock_policy{};
  EXPECT_EQ(policy.config().bid_expiry, 7 * kDay);
  EXPECT_EQ(policy.config().escrow_release_delay, kDay);
  EXPECT_EQ(policy.config().lost_bid_claim_delay, kDay);
}

TEST(timelock_policy, bid_expiry_is_inclusive_and_optional) {
  auto policy = estate::execution::timelock_policy{};
  auto expires_at = policy.bid_expires_at(10);
  ASSERT_TRUE(expires_at.has_value());
  EXPECT_EQ(*expires_at, 10 + 7 * kDay);

  auto bid = estate::schema::bid_state_t{.expires_at = expires_at};
  EXPECT_FALSE(policy.is_bid_expired(bid, *expires_at - 1));
  EXPECT_TRUE(policy.is_bid_expired(bid, *expires_at));

  policy.set_config(estate::schema::timelock_config_t{.bid_expiry = 0});
  EXPECT_FALSE(policy.bid_expires_at(10).has_value());
  EXPECT_FALSE(policy.is_bid_expired(estate::schema::bid_state_t{},
                                     std::numeric_limits<uint64_t>::max()));
}

TEST(timelock_policy, bid_expiry_saturates) {
  auto policy = estate::execution::timelock_policy{};
  const auto max = std::numeric_limits<estate::schema::timestamp_nanoseconds_t>::max();
  EXPECT_EQ(*policy.bid_expires_at(max - 1), max);
}

TEST(timelock_policy, escrow_release_needs_confirmation_and_delay) {
  auto policy = estate::execution::timelock_policy{};
  auto bid = estate::schema::bid_state_t{};
  EXPECT_FALSE(policy.escrow_release_elapsed(bid, 100 * kDay));

  bid.docs_confirmed_at = 5 * kDay;
  EXPECT_FALSE(policy.escrow_release_elapsed(bid, 6 * kDay - 1));
  EXPECT_TRUE(policy.escrow_release_elapsed(bid, 6 * kDay));
}

TEST(timelock_policy, timeout_is_false_when_clock_is_behind) {
  EXPECT_FALSE(estate::execution::timelock_policy::timeout_elapsed(100, 0, 50));
  EXPECT_TRUE(estate::execution::timelock_policy::timeout_elapsed(100, 0, 100));
  EXPECT_TRUE(estate::execution::timelock_policy::timeout_elapsed(
      0, std::numeric_limits<uint64_t>::max(),
      std::numeric_limits<uint64_t>::max()));
}

TEST(timelock_policy, lost_bid_claim_counts_from_completion) {
  auto policy = estate::execution::timelock_policy{};
  EXPECT_FALSE(policy.lost_bid_claim_elapsed(3 * kDay, 4 * kDay - 1));
  EXPECT_TRUE(policy.lost_bid_claim_elapsed(3 * kDay, 4 * kDay));
}
