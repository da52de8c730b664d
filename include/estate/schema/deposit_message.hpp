#pragma once
#include <estate/schema/bid_action.hpp>
#include <estate/schema/primitives.hpp>

// Schema type: deposit message.
// Marketplace workflow: opaque payload a bidder attaches to a token transfer
// into custody; SCALE-encoded.
namespace estate::schema {

template <uint16_t Version>
struct deposit_message;

template <>
struct deposit_message<1> final {
  uint16_t version{1};
  entity_id_t property_id{};
  bid_action_t action{bid_action_t::purchase};
  account_id_t token_account;
};

using deposit_message_t = deposit_message<1>;

}  // namespace estate::schema
