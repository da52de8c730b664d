#pragma once

#include <estate/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: bid action.
// Marketplace workflow: what a deposit is bidding for.
namespace estate::schema {

enum class bid_action_t : uint8_t {
  purchase = 0,
  lease = 1
};

inline constexpr auto kBidActionMappings = std::array{
    std::pair<std::string_view, bid_action_t>{"purchase", bid_action_t::purchase},
    std::pair<std::string_view, bid_action_t>{"lease", bid_action_t::lease}};

template <>
inline std::optional<bid_action_t> try_from_string<bid_action_t>(
    const std::string_view value) {
  return from_string(value, kBidActionMappings);
}

inline constexpr std::string_view to_string(const bid_action_t value) {
  return to_string(value, kBidActionMappings);
}

}  // namespace estate::schema
