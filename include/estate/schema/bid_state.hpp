#pragma once
#include <estate/schema/bid_action.hpp>
#include <estate/schema/bid_status.hpp>
#include <estate/schema/primitives.hpp>
#include <optional>
#include <string>

// Schema type: bid state.
// Marketplace workflow: a deposit held against a property. `escrow` marks the
// document-exchange lifecycle; `settled_amount` is what has already left
// custody towards the seller.
namespace estate::schema {

template <uint16_t Version>
struct bid_state;

template <>
struct bid_state<1> final {
  uint16_t version{1};
  entity_id_t id{};
  entity_id_t property_id{};
  account_id_t bidder;
  account_id_t token;
  amount_t amount{};
  bid_action_t action{bid_action_t::purchase};
  bid_status_t status{bid_status_t::pending};
  bool escrow{};
  timestamp_nanoseconds_t created_at{};
  timestamp_nanoseconds_t updated_at{};
  std::optional<timestamp_nanoseconds_t> expires_at;
  std::optional<std::string> document_token_id;
  std::optional<timestamp_nanoseconds_t> docs_confirmed_at;
  std::optional<std::string> dispute_reason;
  amount_t settled_amount{};
};

using bid_state_t = bid_state<1>;

}  // namespace estate::schema
