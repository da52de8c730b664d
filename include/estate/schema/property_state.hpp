#pragma once
#include <estate/schema/listing_status.hpp>
#include <estate/schema/primitives.hpp>
#include <optional>
#include <string>

// Schema type: property state.
// Marketplace workflow: the tokenized property record. Ownership moves to the
// buyer when a purchase completes; `completed_at` starts the lost-bid claim
// window for the bids that did not win.
namespace estate::schema {

template <uint16_t Version>
struct property_state;

template <>
struct property_state<1> final {
  uint16_t version{1};
  entity_id_t id{};
  account_id_t owner;
  listing_status_t status{listing_status_t::listed_for_sale};
  amount_t price{};
  std::optional<duration_nanoseconds_t> lease_duration;
  amount_t damage_escrow{};
  std::string metadata_uri;
  std::optional<entity_id_t> accepted_bid_id;
  std::optional<entity_id_t> winning_bid_id;
  std::optional<entity_id_t> active_lease_id;
  std::optional<timestamp_nanoseconds_t> completed_at;
  timestamp_nanoseconds_t created_at{};
};

using property_state_t = property_state<1>;

}  // namespace estate::schema
