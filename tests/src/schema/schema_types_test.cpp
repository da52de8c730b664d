#include <estate/schema/bid_action.hpp>
#include <estate/schema/bid_status.hpp>
#include <estate/schema/deposit_message.hpp>
#include <estate/schema/dispute_winner.hpp>
#include <estate/schema/encoding/scale/encoder.hpp>
#include <estate/schema/engine_config.hpp>
#include <estate/schema/error_code.hpp>
#include <estate/schema/key/engine_keys.hpp>
#include <estate/schema/listing_status.hpp>
#include <estate/schema/settlement_continuation.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <limits>

namespace {

using encoder_t = estate::schema::encoding::scale_encoder_t;
using estate::schema::error_category_t;
using estate::schema::error_code;

}  // namespace

TEST(schema_types, enum_names_round_trip) {
  using estate::schema::bid_status_t;
  for (auto status : {bid_status_t::pending, bid_status_t::docs_confirmed,
                      bid_status_t::payment_released, bid_status_t::disputed}) {
    auto name = estate::schema::to_string(status);
    EXPECT_EQ(estate::schema::try_from_string<bid_status_t>(name), status);
  }
  EXPECT_EQ(estate::schema::to_string(
                estate::schema::listing_status_t::listed_for_lease),
            "listed_for_lease");
  EXPECT_EQ(estate::schema::try_from_string<estate::schema::bid_action_t>(
                "lease"),
            estate::schema::bid_action_t::lease);
  EXPECT_FALSE(estate::schema::try_from_string<estate::schema::bid_action_t>(
                   "rent")
                   .has_value());
  EXPECT_EQ(estate::schema::try_from_string<estate::schema::escrow_winner_t>(
                "seller"),
            estate::schema::escrow_winner_t::seller);
}

TEST(schema_types, error_codes_map_to_categories) {
  EXPECT_EQ(estate::schema::category_of(error_code::ok),
            error_category_t::none);
  EXPECT_EQ(estate::schema::category_of(error_code::bid_missing),
            error_category_t::validation);
  EXPECT_EQ(estate::schema::category_of(error_code::not_oracle),
            error_category_t::authorization);
  EXPECT_EQ(estate::schema::category_of(error_code::arithmetic_underflow),
            error_category_t::arithmetic);
  EXPECT_EQ(estate::schema::category_of(error_code::external_call_failed),
            error_category_t::external_call);
  EXPECT_EQ(estate::schema::category_of(error_code::timelock_not_elapsed),
            error_category_t::timelock);
  EXPECT_EQ(estate::schema::category_of(error_code::reentrancy_violation),
            error_category_t::reentrancy);

  EXPECT_EQ(estate::schema::codespace_of(error_code::not_admin),
            "estate.authorization");
  EXPECT_EQ(estate::schema::codespace_of(error_code::reentrancy_violation),
            "estate.reentrancy");
  EXPECT_EQ(estate::schema::codespace_of(error_code::ok), "");
}

TEST(schema_types, error_codes_are_stable_numbers) {
  EXPECT_EQ(static_cast<uint32_t>(error_code::invalid_message), 1u);
  EXPECT_EQ(static_cast<uint32_t>(error_code::not_contract_owner), 100u);
  EXPECT_EQ(static_cast<uint32_t>(error_code::arithmetic_overflow), 200u);
  EXPECT_EQ(static_cast<uint32_t>(error_code::timelock_not_elapsed), 400u);
  EXPECT_EQ(static_cast<uint32_t>(error_code::reentrancy_violation), 500u);
}

TEST(schema_types, entity_keys_sort_by_id) {
  auto low = estate::schema::key::make_bid_key(2);
  auto high = estate::schema::key::make_bid_key(256);
  EXPECT_TRUE(std::lexicographical_compare(std::begin(low), std::end(low),
                                           std::begin(high), std::end(high)));
  auto prefix = estate::schema::key::make_prefix_key(
      estate::schema::key::kStatePrefix);
  EXPECT_TRUE(std::equal(std::begin(prefix), std::end(prefix),
                         std::begin(low)));
  EXPECT_NE(estate::schema::key::make_bid_key(1),
            estate::schema::key::make_lease_key(1));
}

TEST(schema_types, event_keys_parse_back) {
  const auto max = std::numeric_limits<uint64_t>::max();
  for (auto sequence : {uint64_t{0}, uint64_t{7}, max}) {
    auto key = estate::schema::key::make_event_key(sequence);
    auto parsed = estate::schema::key::parse_event_key(
        estate::schema::make_bytes_view(key));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, sequence);
  }
  auto foreign = estate::schema::key::make_bid_key(7);
  EXPECT_FALSE(estate::schema::key::parse_event_key(
                   estate::schema::make_bytes_view(foreign))
                   .has_value());
}

TEST(schema_types, lock_keys_distinguish_kind_and_entity) {
  using estate::schema::lock_kind_t;
  auto bid = estate::schema::make_lock_key(lock_kind_t::bid, 1);
  auto lease = estate::schema::make_lock_key(lock_kind_t::lease, 1);
  EXPECT_NE(bid, lease);
  EXPECT_EQ(estate::schema::to_string(bid), "bid#1");
  EXPECT_NE(estate::schema::key::make_lock_key(bid),
            estate::schema::key::make_lock_key(lease));
}

TEST(schema_types, deposit_message_decodes_from_scale) {
  auto encoder = encoder_t{};
  auto message = estate::schema::deposit_message_t{
      .property_id = 12,
      .action = estate::schema::bid_action_t::lease,
      .token_account = "usdc.token"};
  auto encoded = encoder.encode(message);
  auto decoded = encoder.try_decode<estate::schema::deposit_message_t>(
      estate::schema::make_bytes_view(encoded));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->version, 1u);
  EXPECT_EQ(decoded->property_id, 12u);
  EXPECT_EQ(decoded->action, estate::schema::bid_action_t::lease);
  EXPECT_EQ(decoded->token_account, "usdc.token");
}

TEST(schema_types, truncated_deposit_message_is_rejected) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(estate::schema::deposit_message_t{
      .property_id = 12, .token_account = "usdc.token"});
  encoded.resize(5);
  EXPECT_FALSE(encoder
                   .try_decode<estate::schema::deposit_message_t>(
                       estate::schema::make_bytes_view(encoded))
                   .has_value());
}

TEST(schema_types, continuation_survives_encoding) {
  auto encoder = encoder_t{};
  auto continuation = estate::schema::settlement_continuation_t{
      .id = 9,
      .kind = estate::schema::settlement_kind_t::dispute_payout,
      .token = "usdc.token",
      .recipient = "alice.near",
      .amount = std::numeric_limits<estate::schema::amount_t>::max(),
      .lease_id = 4,
      .locks = {estate::schema::make_lock_key(
          estate::schema::lock_kind_t::lease, 4)},
      .initiated_by = "admin.near",
      .dispute_winner = estate::schema::dispute_winner_t::tenant};
  auto decoded = encoder.decode<estate::schema::settlement_continuation_t>(
      estate::schema::make_bytes_view(encoder.encode(continuation)));
  EXPECT_EQ(decoded.id, 9u);
  EXPECT_EQ(decoded.kind, estate::schema::settlement_kind_t::dispute_payout);
  EXPECT_EQ(decoded.amount, continuation.amount);
  EXPECT_FALSE(decoded.bid_id.has_value());
  EXPECT_EQ(*decoded.lease_id, 4u);
  ASSERT_EQ(decoded.locks.size(), 1u);
  EXPECT_EQ(decoded.locks[0], continuation.locks[0]);
  EXPECT_EQ(*decoded.dispute_winner, estate::schema::dispute_winner_t::tenant);
}
