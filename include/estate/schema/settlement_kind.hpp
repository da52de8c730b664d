#pragma once

#include <estate/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: settlement kind.
// Settlement workflow: which effect a continuation applies when its transfer
// callback arrives.
namespace estate::schema {

enum class settlement_kind_t : uint8_t {
  accept_bid = 0,
  reject_bid = 1,
  cancel_bid = 2,
  refund_competing_bid = 3,
  refund_expired_bid = 4,
  release_escrow = 5,
  refund_escrow_timeout = 6,
  bid_dispute_refund = 7,
  bid_dispute_release = 8,
  claim_lost_bid = 9,
  expire_lease = 10,
  dispute_payout = 11,
  dispute_remainder = 12,
  withdraw_surplus = 13,
  admin_refund_bid = 14
};

inline constexpr auto kSettlementKindMappings = std::array{
    std::pair<std::string_view, settlement_kind_t>{"accept_bid", settlement_kind_t::accept_bid},
    std::pair<std::string_view, settlement_kind_t>{"reject_bid", settlement_kind_t::reject_bid},
    std::pair<std::string_view, settlement_kind_t>{"cancel_bid", settlement_kind_t::cancel_bid},
    std::pair<std::string_view, settlement_kind_t>{"refund_competing_bid", settlement_kind_t::refund_competing_bid},
    std::pair<std::string_view, settlement_kind_t>{"refund_expired_bid", settlement_kind_t::refund_expired_bid},
    std::pair<std::string_view, settlement_kind_t>{"release_escrow", settlement_kind_t::release_escrow},
    std::pair<std::string_view, settlement_kind_t>{"refund_escrow_timeout", settlement_kind_t::refund_escrow_timeout},
    std::pair<std::string_view, settlement_kind_t>{"bid_dispute_refund", settlement_kind_t::bid_dispute_refund},
    std::pair<std::string_view, settlement_kind_t>{"bid_dispute_release", settlement_kind_t::bid_dispute_release},
    std::pair<std::string_view, settlement_kind_t>{"claim_lost_bid", settlement_kind_t::claim_lost_bid},
    std::pair<std::string_view, settlement_kind_t>{"expire_lease", settlement_kind_t::expire_lease},
    std::pair<std::string_view, settlement_kind_t>{"dispute_payout", settlement_kind_t::dispute_payout},
    std::pair<std::string_view, settlement_kind_t>{"dispute_remainder", settlement_kind_t::dispute_remainder},
    std::pair<std::string_view, settlement_kind_t>{"withdraw_surplus", settlement_kind_t::withdraw_surplus},
    std::pair<std::string_view, settlement_kind_t>{"admin_refund_bid", settlement_kind_t::admin_refund_bid}};

template <>
inline std::optional<settlement_kind_t> try_from_string<settlement_kind_t>(
    const std::string_view value) {
  return from_string(value, kSettlementKindMappings);
}

inline constexpr std::string_view to_string(const settlement_kind_t value) {
  return to_string(value, kSettlementKindMappings);
}

}  // namespace estate::schema
