#include <estate/ledger/bid_ledger.hpp>
#include <gtest/gtest.h>

#include <limits>

namespace {

using estate::schema::bid_status_t;

estate::schema::bid_state_t make_bid(const estate::schema::entity_id_t id,
                                     const estate::schema::entity_id_t property,
                                     const std::string& bidder,
                                     const estate::schema::amount_t& amount,
                                     const bid_status_t status =
                                         bid_status_t::pending) {
  return estate::schema::bid_state_t{.id = id,
                                     .property_id = property,
                                     .bidder = bidder,
                                     .token = "usdc.token",
                                     .amount = amount,
                                     .status = status};
}

}  // namespace

TEST(bid_ledger, outstanding_is_zero_for_terminal_bids) {
  EXPECT_EQ(estate::ledger::outstanding(make_bid(1, 1, "a", 100)), 100);
  EXPECT_EQ(estate::ledger::outstanding(
                make_bid(1, 1, "a", 100, bid_status_t::expired)),
            100);
  EXPECT_EQ(estate::ledger::outstanding(
                make_bid(1, 1, "a", 100, bid_status_t::completed)),
            0);
  EXPECT_EQ(estate::ledger::outstanding(
                make_bid(1, 1, "a", 100, bid_status_t::refunded)),
            0);

  auto released = make_bid(1, 1, "a", 100, bid_status_t::payment_released);
  released.settled_amount = 80;
  EXPECT_EQ(estate::ledger::outstanding(released), 20);
}

TEST(bid_ledger, indexes_by_property_and_bidder) {
  auto ledger = estate::ledger::bid_ledger{};
  ledger.insert(make_bid(1, 10, "alice", 100));
  ledger.insert(make_bid(2, 10, "bob", 200, bid_status_t::rejected));
  ledger.insert(make_bid(3, 11, "alice", 300));

  EXPECT_EQ(ledger.for_property(10).size(), 2u);
  auto open = ledger.open_for_property(10);
  ASSERT_EQ(open.size(), 1u);
  EXPECT_EQ(open[0].id, 1u);

  auto alice = ledger.for_bidder("alice");
  ASSERT_EQ(alice.size(), 2u);
  EXPECT_EQ(alice[0].id, 1u);
  EXPECT_EQ(alice[1].id, 3u);
  EXPECT_TRUE(ledger.for_bidder("carol").empty());
  EXPECT_EQ(ledger.find(4), nullptr);
}

TEST(bid_ledger, mutations_through_find_mutable_are_visible) {
  auto ledger = estate::ledger::bid_ledger{};
  ledger.insert(make_bid(1, 10, "alice", 100));
  ledger.find_mutable(1)->status = bid_status_t::cancelled;
  EXPECT_EQ(ledger.find(1)->status, bid_status_t::cancelled);
  EXPECT_TRUE(ledger.open_for_property(10).empty());
}

TEST(bid_ledger, obligations_sum_open_bids_per_token) {
  auto ledger = estate::ledger::bid_ledger{};
  ledger.insert(make_bid(1, 10, "alice", 100));
  ledger.insert(make_bid(2, 10, "bob", 250));
  ledger.insert(make_bid(3, 10, "carol", 999, bid_status_t::completed));
  auto dai = make_bid(4, 10, "dave", 7);
  dai.token = "dai.token";
  ledger.insert(dai);

  EXPECT_EQ(*ledger.obligations("usdc.token"), 350);
  EXPECT_EQ(*ledger.obligations("dai.token"), 7);
  EXPECT_EQ(*ledger.obligations("eur.token"), 0);
}

TEST(bid_ledger, obligations_report_overflow) {
  auto ledger = estate::ledger::bid_ledger{};
  ledger.insert(
      make_bid(1, 10, "alice", std::numeric_limits<estate::schema::amount_t>::max()));
  ledger.insert(make_bid(2, 10, "bob", 1));
  EXPECT_FALSE(ledger.obligations("usdc.token").has_value());
}
