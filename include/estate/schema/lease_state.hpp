#pragma once
#include <estate/schema/dispute_info.hpp>
#include <estate/schema/primitives.hpp>
#include <optional>

// Schema type: lease state.
// Marketplace workflow: created once per accepted lease bid; holds the damage
// escrow until expiry or dispute resolution.
namespace estate::schema {

template <uint16_t Version>
struct lease_state;

template <>
struct lease_state<1> final {
  uint16_t version{1};
  entity_id_t id{};
  entity_id_t property_id{};
  entity_id_t bid_id{};
  account_id_t tenant;
  account_id_t owner;
  timestamp_nanoseconds_t start_time{};
  duration_nanoseconds_t duration{};
  amount_t escrow_amount{};
  account_id_t escrow_token;
  bool active{true};
  std::optional<dispute_info_t> dispute;
};

using lease_state_t = lease_state<1>;

}  // namespace estate::schema
