#pragma once
#include <estate/schema/listing_status.hpp>
#include <estate/schema/primitives.hpp>
#include <optional>
#include <string>

// Schema type: property listing.
// Marketplace workflow: terms a property owner publishes when listing. Price
// is advisory; bids may carry any amount.
namespace estate::schema {

template <uint16_t Version>
struct property_listing;

template <>
struct property_listing<1> final {
  uint16_t version{1};
  listing_status_t status{listing_status_t::listed_for_sale};
  amount_t price{};
  std::optional<duration_nanoseconds_t> lease_duration;
  amount_t damage_escrow{};
  std::string metadata_uri;
};

using property_listing_t = property_listing<1>;

}  // namespace estate::schema
