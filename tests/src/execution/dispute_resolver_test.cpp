#include <estate/execution/dispute_resolver.hpp>
#include <gtest/gtest.h>

using estate::schema::dispute_status_t;
using estate::schema::dispute_winner_t;
using estate::schema::error_code;

namespace {

estate::schema::lease_state_t make_lease() {
  return estate::schema::lease_state_t{.id = 1,
                                       .property_id = 2,
                                       .bid_id = 3,
                                       .tenant = "alice.near",
                                       .owner = "seller.near",
                                       .start_time = 0,
                                       .duration = 100,
                                       .escrow_amount = 500,
                                       .escrow_token = "usdc.token"};
}

}  // namespace

TEST(dispute_resolver, only_lease_parties_raise) {
  auto resolver = estate::execution::dispute_resolver{};
  auto lease = make_lease();
  EXPECT_EQ(resolver.raise(lease, "mallory.near", "damage", 5),
            error_code::not_lease_party);
  EXPECT_FALSE(lease.dispute.has_value());

  ASSERT_EQ(resolver.raise(lease, "seller.near", "damage", 5), error_code::ok);
  EXPECT_EQ(lease.dispute->status, dispute_status_t::raised);
  EXPECT_EQ(lease.dispute->raised_by, "seller.near");
  EXPECT_EQ(lease.dispute->raised_at, 5u);
  EXPECT_TRUE(estate::execution::dispute_resolver::is_open(lease));
  EXPECT_EQ(resolver.raise(lease, "alice.near", "again", 6),
            error_code::dispute_already_raised);
}

TEST(dispute_resolver, inactive_lease_cannot_be_disputed) {
  auto resolver = estate::execution::dispute_resolver{};
  auto lease = make_lease();
  lease.active = false;
  EXPECT_EQ(resolver.raise(lease, "alice.near", "damage", 5),
            error_code::lease_not_active);
}

TEST(dispute_resolver, tenant_response_round) {
  auto resolver = estate::execution::dispute_resolver{};
  auto lease = make_lease();
  EXPECT_EQ(resolver.request_tenant_response(lease),
            error_code::dispute_not_raised);
  resolver.raise(lease, "seller.near", "damage", 5);
  EXPECT_EQ(resolver.submit_tenant_response(lease, "alice.near", "early"),
            error_code::dispute_not_raised);
  ASSERT_EQ(resolver.request_tenant_response(lease), error_code::ok);
  EXPECT_EQ(lease.dispute->status, dispute_status_t::pending_tenant_response);
  EXPECT_EQ(resolver.submit_tenant_response(lease, "seller.near", "me"),
            error_code::not_tenant);
  ASSERT_EQ(resolver.submit_tenant_response(lease, "alice.near", "wear"),
            error_code::ok);
  EXPECT_EQ(*lease.dispute->tenant_response, "wear");
  EXPECT_TRUE(estate::execution::dispute_resolver::is_open(lease));
}

TEST(dispute_resolver, votes_are_tallied_once_per_admin) {
  auto resolver = estate::execution::dispute_resolver{};
  auto lease = make_lease();
  EXPECT_EQ(resolver.vote(lease, "admin.near", true),
            error_code::dispute_not_raised);
  resolver.raise(lease, "alice.near", "deposit", 5);
  ASSERT_EQ(resolver.vote(lease, "admin.near", true), error_code::ok);
  ASSERT_EQ(resolver.vote(lease, "admin2.near", false), error_code::ok);
  EXPECT_EQ(resolver.vote(lease, "admin.near", false),
            error_code::duplicate_vote);
  EXPECT_EQ(lease.dispute->votes_for_tenant, 1u);
  EXPECT_EQ(lease.dispute->votes_for_owner, 1u);
}

TEST(dispute_resolver, payout_plan_splits_escrow) {
  auto resolver = estate::execution::dispute_resolver{};
  auto lease = make_lease();
  EXPECT_EQ(resolver.plan_payout(lease, dispute_winner_t::owner, 1).code,
            error_code::dispute_not_raised);
  resolver.raise(lease, "seller.near", "damage", 5);

  EXPECT_EQ(resolver.plan_payout(lease, dispute_winner_t::owner, 501).code,
            error_code::payout_exceeds_escrow);

  auto plan = resolver.plan_payout(lease, dispute_winner_t::owner, 200);
  ASSERT_EQ(plan.code, error_code::ok);
  EXPECT_EQ(plan.winner_account, "seller.near");
  EXPECT_EQ(plan.counterparty_account, "alice.near");
  EXPECT_EQ(plan.payout, 200);
  EXPECT_EQ(plan.remainder, 300);

  auto tenant = resolver.plan_payout(lease, dispute_winner_t::tenant, 500);
  EXPECT_EQ(tenant.winner_account, "alice.near");
  EXPECT_EQ(tenant.remainder, 0);
}

TEST(dispute_resolver, oracle_nonce_must_match) {
  auto resolver = estate::execution::dispute_resolver{};
  auto lease = make_lease();
  EXPECT_EQ(resolver.request_oracle(lease, 1), error_code::dispute_not_raised);
  resolver.raise(lease, "seller.near", "damage", 5);
  EXPECT_EQ(resolver.check_oracle_response(lease, 1),
            error_code::oracle_nonce_mismatch);
  ASSERT_EQ(resolver.request_oracle(lease, 7), error_code::ok);
  EXPECT_EQ(resolver.check_oracle_response(lease, 6),
            error_code::oracle_nonce_mismatch);
  EXPECT_EQ(resolver.check_oracle_response(lease, 7), error_code::ok);
}

TEST(dispute_resolver, resolution_closes_the_dispute) {
  auto resolver = estate::execution::dispute_resolver{};
  auto lease = make_lease();
  resolver.raise(lease, "seller.near", "damage", 5);
  resolver.mark_resolved(lease, dispute_winner_t::tenant, "admin.near",
                         "seller.near", 9);
  EXPECT_EQ(lease.dispute->status, dispute_status_t::resolved);
  EXPECT_EQ(*lease.dispute->winner, dispute_winner_t::tenant);
  EXPECT_EQ(*lease.dispute->resolved_by, "admin.near");
  EXPECT_EQ(*lease.dispute->resolved_at, 9u);
  EXPECT_FALSE(estate::execution::dispute_resolver::is_open(lease));
  EXPECT_EQ(resolver.raise(lease, "alice.near", "again", 10),
            error_code::dispute_already_raised);
}
