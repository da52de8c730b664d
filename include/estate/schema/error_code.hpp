#pragma once

#include <cstdint>
#include <string_view>

namespace estate::schema {

enum class error_code : uint32_t {
  ok = 0,
  // validation
  invalid_message = 1,
  unsupported_token = 2,
  token_mismatch = 3,
  property_missing = 4,
  property_not_listed = 5,
  bid_missing = 6,
  invalid_bid_state = 7,
  lease_missing = 8,
  lease_not_active = 9,
  dispute_not_raised = 10,
  dispute_already_raised = 11,
  payout_exceeds_escrow = 12,
  invalid_amount = 13,
  bid_not_claimable = 14,
  settlement_missing = 15,
  oracle_not_configured = 16,
  oracle_nonce_mismatch = 17,
  duplicate_vote = 18,
  property_has_open_bids = 19,
  insufficient_surplus = 20,
  token_has_balance = 21,
  lease_not_expired = 22,
  property_under_contract = 24,
  invalid_listing = 25,
  // authorization
  not_contract_owner = 100,
  not_admin = 101,
  not_property_owner = 102,
  not_bidder = 103,
  not_lease_party = 104,
  not_oracle = 105,
  not_tenant = 106,
  not_transaction_party = 107,
  // arithmetic
  arithmetic_overflow = 200,
  arithmetic_underflow = 201,
  // external call
  external_call_failed = 300,
  // timelock
  timelock_not_elapsed = 400,
  // reentrancy
  reentrancy_violation = 500,
};

enum class error_category_t : uint8_t {
  none = 0,
  validation = 1,
  authorization = 2,
  arithmetic = 3,
  external_call = 4,
  timelock = 5,
  reentrancy = 6
};

constexpr error_category_t category_of(const error_code code) {
  const auto value = static_cast<uint32_t>(code);
  if (value == 0) {
    return error_category_t::none;
  }
  if (value < 100) {
    return error_category_t::validation;
  }
  if (value < 200) {
    return error_category_t::authorization;
  }
  if (value < 300) {
    return error_category_t::arithmetic;
  }
  if (value < 400) {
    return error_category_t::external_call;
  }
  if (value < 500) {
    return error_category_t::timelock;
  }
  return error_category_t::reentrancy;
}

constexpr std::string_view codespace_of(const error_code code) {
  switch (category_of(code)) {
    case error_category_t::none:
      return "";
    case error_category_t::validation:
      return "estate.validation";
    case error_category_t::authorization:
      return "estate.authorization";
    case error_category_t::arithmetic:
      return "estate.arithmetic";
    case error_category_t::external_call:
      return "estate.settlement";
    case error_category_t::timelock:
      return "estate.timelock";
    case error_category_t::reentrancy:
      return "estate.reentrancy";
  }
  return "";
}

}  // namespace estate::schema
