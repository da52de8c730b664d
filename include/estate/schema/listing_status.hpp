#pragma once

#include <estate/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: listing status.
// Marketplace workflow: where a property sits between listing and a completed
// sale or lease.
namespace estate::schema {

enum class listing_status_t : uint8_t {
  listed_for_sale = 0,
  listed_for_lease = 1,
  sold = 2,
  leased = 3,
  delisted = 4
};

inline constexpr auto kListingStatusMappings = std::array{
    std::pair<std::string_view, listing_status_t>{"listed_for_sale", listing_status_t::listed_for_sale},
    std::pair<std::string_view, listing_status_t>{"listed_for_lease", listing_status_t::listed_for_lease},
    std::pair<std::string_view, listing_status_t>{"sold", listing_status_t::sold},
    std::pair<std::string_view, listing_status_t>{"leased", listing_status_t::leased},
    std::pair<std::string_view, listing_status_t>{"delisted", listing_status_t::delisted}};

template <>
inline std::optional<listing_status_t> try_from_string<listing_status_t>(
    const std::string_view value) {
  return from_string(value, kListingStatusMappings);
}

inline constexpr std::string_view to_string(const listing_status_t value) {
  return to_string(value, kListingStatusMappings);
}

}  // namespace estate::schema
