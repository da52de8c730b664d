#pragma once

#include <estate/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: bid status.
// Marketplace workflow: node of the bid lifecycle graph (direct accept and
// escrow lifecycle share one enum).
namespace estate::schema {

enum class bid_status_t : uint8_t {
  pending = 0,
  accepted = 1,
  docs_released = 2,
  docs_confirmed = 3,
  payment_released = 4,
  completed = 5,
  rejected = 6,
  cancelled = 7,
  expired = 8,
  refunded = 9,
  disputed = 10
};

inline constexpr auto kBidStatusMappings = std::array{
    std::pair<std::string_view, bid_status_t>{"pending", bid_status_t::pending},
    std::pair<std::string_view, bid_status_t>{"accepted", bid_status_t::accepted},
    std::pair<std::string_view, bid_status_t>{"docs_released", bid_status_t::docs_released},
    std::pair<std::string_view, bid_status_t>{"docs_confirmed", bid_status_t::docs_confirmed},
    std::pair<std::string_view, bid_status_t>{"payment_released", bid_status_t::payment_released},
    std::pair<std::string_view, bid_status_t>{"completed", bid_status_t::completed},
    std::pair<std::string_view, bid_status_t>{"rejected", bid_status_t::rejected},
    std::pair<std::string_view, bid_status_t>{"cancelled", bid_status_t::cancelled},
    std::pair<std::string_view, bid_status_t>{"expired", bid_status_t::expired},
    std::pair<std::string_view, bid_status_t>{"refunded", bid_status_t::refunded},
    std::pair<std::string_view, bid_status_t>{"disputed", bid_status_t::disputed}};

template <>
inline std::optional<bid_status_t> try_from_string<bid_status_t>(
    const std::string_view value) {
  return from_string(value, kBidStatusMappings);
}

inline constexpr std::string_view to_string(const bid_status_t value) {
  return to_string(value, kBidStatusMappings);
}

}  // namespace estate::schema
