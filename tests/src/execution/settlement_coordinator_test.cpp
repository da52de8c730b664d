#include <estate/execution/settlement_coordinator.hpp>
#include <gtest/gtest.h>

using estate::schema::error_code;
using estate::schema::lock_kind_t;
using estate::schema::make_lock_key;
using estate::schema::settlement_kind_t;

namespace {

constexpr auto kToken = "usdc.token";

class settlement_coordinator_test : public ::testing::Test {
 protected:
  void SetUp() override { balances_.credit(kToken, 1000); }

  estate::schema::settlement_continuation_t draft(
      const estate::schema::entity_id_t bid_id,
      const estate::schema::amount_t& amount) {
    return estate::schema::settlement_continuation_t{
        .kind = settlement_kind_t::reject_bid,
        .token = kToken,
        .recipient = "alice.near",
        .amount = amount,
        .bid_id = bid_id,
        .locks = {make_lock_key(lock_kind_t::bid, bid_id)},
        .initiated_by = "seller.near"};
  }

  estate::execution::lock_registry locks_;
  estate::ledger::balance_ledger balances_;
  estate::execution::settlement_coordinator coordinator_{locks_, balances_};
};

}  // namespace

TEST_F(settlement_coordinator_test, begin_locks_and_builds_request) {
  auto issue = coordinator_.begin(draft(5, 300));
  ASSERT_EQ(issue.code, error_code::ok);
  ASSERT_TRUE(issue.request.has_value());
  EXPECT_EQ(issue.request->continuation_id, 1u);
  EXPECT_EQ(issue.request->recipient, "alice.near");
  EXPECT_EQ(issue.request->amount, 300);
  EXPECT_EQ(issue.request->transfer_budget, estate::schema::kTransferCallBudget);
  EXPECT_EQ(issue.request->callback_budget,
            estate::schema::kTransferCallbackBudget);
  EXPECT_EQ(*locks_.holder_of(make_lock_key(lock_kind_t::bid, 5)), 1u);
  EXPECT_EQ(coordinator_.pending().size(), 1u);
  // Funds leave only on a successful callback.
  EXPECT_EQ(balances_.balance_of(kToken), 1000);
}

TEST_F(settlement_coordinator_test, conflicting_begin_is_reentrancy) {
  ASSERT_EQ(coordinator_.begin(draft(5, 300)).code, error_code::ok);
  auto second = coordinator_.begin(draft(5, 300));
  EXPECT_EQ(second.code, error_code::reentrancy_violation);
  EXPECT_FALSE(second.request.has_value());
  EXPECT_EQ(coordinator_.pending().size(), 1u);
  EXPECT_EQ(coordinator_.next_id(), 2u);
}

TEST_F(settlement_coordinator_test, begin_refuses_unbacked_amount) {
  EXPECT_EQ(coordinator_.can_begin({}, kToken, 1001),
            error_code::arithmetic_underflow);
  auto issue = coordinator_.begin(draft(5, 1001));
  EXPECT_EQ(issue.code, error_code::arithmetic_underflow);
  EXPECT_TRUE(locks_.held().empty());
}

TEST_F(settlement_coordinator_test, success_debits_and_releases) {
  auto id = coordinator_.begin(draft(5, 300)).request->continuation_id;
  auto outcome = coordinator_.resolve(id, true);
  ASSERT_EQ(outcome.code, error_code::ok);
  EXPECT_TRUE(outcome.succeeded);
  ASSERT_TRUE(outcome.continuation.has_value());
  EXPECT_EQ(*outcome.continuation->bid_id, 5u);
  EXPECT_EQ(balances_.balance_of(kToken), 700);
  EXPECT_TRUE(locks_.held().empty());
  EXPECT_EQ(coordinator_.find(id), nullptr);
}

TEST_F(settlement_coordinator_test, failure_releases_without_debit) {
  auto id = coordinator_.begin(draft(5, 300)).request->continuation_id;
  auto outcome = coordinator_.resolve(id, false);
  ASSERT_EQ(outcome.code, error_code::ok);
  EXPECT_FALSE(outcome.succeeded);
  EXPECT_EQ(balances_.balance_of(kToken), 1000);
  EXPECT_TRUE(locks_.held().empty());
}

TEST_F(settlement_coordinator_test, callbacks_resolve_exactly_once) {
  auto id = coordinator_.begin(draft(5, 300)).request->continuation_id;
  ASSERT_EQ(coordinator_.resolve(id, true).code, error_code::ok);
  EXPECT_EQ(coordinator_.resolve(id, true).code,
            error_code::settlement_missing);
  EXPECT_EQ(coordinator_.resolve(99, false).code,
            error_code::settlement_missing);
  EXPECT_EQ(balances_.balance_of(kToken), 700);
}

TEST_F(settlement_coordinator_test, underflow_on_commit_keeps_continuation) {
  auto id = coordinator_.begin(draft(5, 800)).request->continuation_id;
  balances_.debit(kToken, 500);
  auto outcome = coordinator_.resolve(id, true);
  EXPECT_EQ(outcome.code, error_code::arithmetic_underflow);
  EXPECT_NE(coordinator_.find(id), nullptr);
  EXPECT_TRUE(locks_.is_held(make_lock_key(lock_kind_t::bid, 5)));
  EXPECT_EQ(balances_.balance_of(kToken), 500);
}

TEST_F(settlement_coordinator_test, restore_advances_next_id) {
  auto continuation = draft(5, 10);
  continuation.id = 41;
  coordinator_.restore(continuation);
  EXPECT_EQ(coordinator_.next_id(), 42u);
  EXPECT_NE(coordinator_.find(41), nullptr);
}
