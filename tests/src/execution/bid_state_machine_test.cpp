#include <estate/execution/bid_state_machine.hpp>
#include <gtest/gtest.h>

#include <array>

namespace bsm = estate::execution::bid_state_machine;
using estate::schema::bid_status_t;
using estate::schema::error_code;

namespace {

constexpr auto kAll = std::array{
    bid_status_t::pending,       bid_status_t::accepted,
    bid_status_t::docs_released, bid_status_t::docs_confirmed,
    bid_status_t::payment_released, bid_status_t::completed,
    bid_status_t::rejected,      bid_status_t::cancelled,
    bid_status_t::expired,       bid_status_t::refunded,
    bid_status_t::disputed};

}  // namespace

TEST(bid_state_machine, escrow_path_walks_forward) {
  auto bid = estate::schema::bid_state_t{};
  auto now = uint64_t{1};
  for (auto next : {bid_status_t::accepted, bid_status_t::docs_released,
                    bid_status_t::docs_confirmed,
                    bid_status_t::payment_released, bid_status_t::completed}) {
    ASSERT_EQ(bsm::advance(bid, next, ++now), error_code::ok);
    EXPECT_EQ(bid.status, next);
    EXPECT_EQ(bid.updated_at, now);
  }
}

TEST(bid_state_machine, illegal_edge_leaves_bid_untouched) {
  auto bid = estate::schema::bid_state_t{.status = bid_status_t::accepted,
                                         .updated_at = 9};
  EXPECT_EQ(bsm::advance(bid, bid_status_t::payment_released, 10),
            error_code::invalid_bid_state);
  EXPECT_EQ(bid.status, bid_status_t::accepted);
  EXPECT_EQ(bid.updated_at, 9u);
}

TEST(bid_state_machine, expired_bids_never_complete) {
  EXPECT_FALSE(bsm::is_legal(bid_status_t::expired, bid_status_t::completed));
  EXPECT_FALSE(bsm::is_legal(bid_status_t::expired, bid_status_t::accepted));
  EXPECT_TRUE(bsm::is_legal(bid_status_t::expired, bid_status_t::refunded));
}

TEST(bid_state_machine, dispute_edges) {
  for (auto from : {bid_status_t::accepted, bid_status_t::docs_released,
                    bid_status_t::docs_confirmed}) {
    EXPECT_TRUE(bsm::is_legal(from, bid_status_t::disputed));
  }
  EXPECT_FALSE(bsm::is_legal(bid_status_t::pending, bid_status_t::disputed));
  EXPECT_FALSE(
      bsm::is_legal(bid_status_t::payment_released, bid_status_t::disputed));
  EXPECT_TRUE(bsm::is_legal(bid_status_t::disputed, bid_status_t::refunded));
  EXPECT_TRUE(
      bsm::is_legal(bid_status_t::disputed, bid_status_t::payment_released));
  EXPECT_FALSE(bsm::is_legal(bid_status_t::disputed, bid_status_t::completed));
}

TEST(bid_state_machine, timeout_refund_only_before_confirmation) {
  EXPECT_TRUE(bsm::is_legal(bid_status_t::accepted, bid_status_t::refunded));
  EXPECT_TRUE(
      bsm::is_legal(bid_status_t::docs_released, bid_status_t::refunded));
  EXPECT_FALSE(
      bsm::is_legal(bid_status_t::docs_confirmed, bid_status_t::refunded));
}

TEST(bid_state_machine, terminal_states_have_no_exits) {
  for (auto from : kAll) {
    if (!bsm::is_terminal(from)) {
      EXPECT_TRUE(bsm::is_open(from));
      continue;
    }
    EXPECT_FALSE(bsm::is_open(from));
    for (auto to : kAll) {
      EXPECT_FALSE(bsm::is_legal(from, to));
    }
  }
}

TEST(bid_state_machine, no_self_loops) {
  for (auto status : kAll) {
    EXPECT_FALSE(bsm::is_legal(status, status));
  }
}
