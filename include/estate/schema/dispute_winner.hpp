#pragma once

#include <estate/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: dispute winner.
// Marketplace workflow: which party receives the payout of a resolved lease
// dispute (tenant/owner) or bid dispute (buyer/seller).
namespace estate::schema {

enum class dispute_winner_t : uint8_t { tenant = 0, owner = 1 };

enum class escrow_winner_t : uint8_t { buyer = 0, seller = 1 };

inline constexpr auto kDisputeWinnerMappings = std::array{
    std::pair<std::string_view, dispute_winner_t>{"tenant",
                                                  dispute_winner_t::tenant},
    std::pair<std::string_view, dispute_winner_t>{"owner",
                                                  dispute_winner_t::owner}};

inline constexpr auto kEscrowWinnerMappings = std::array{
    std::pair<std::string_view, escrow_winner_t>{"buyer",
                                                 escrow_winner_t::buyer},
    std::pair<std::string_view, escrow_winner_t>{"seller",
                                                 escrow_winner_t::seller}};

template <>
inline std::optional<dispute_winner_t> try_from_string<dispute_winner_t>(
    const std::string_view value) {
  return from_string(value, kDisputeWinnerMappings);
}

template <>
inline std::optional<escrow_winner_t> try_from_string<escrow_winner_t>(
    const std::string_view value) {
  return from_string(value, kEscrowWinnerMappings);
}

inline constexpr std::string_view to_string(const dispute_winner_t value) {
  return to_string(value, kDisputeWinnerMappings);
}

inline constexpr std::string_view to_string(const escrow_winner_t value) {
  return to_string(value, kEscrowWinnerMappings);
}

}  // namespace estate::schema
