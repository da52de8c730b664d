#pragma once

#include <estate/schema/primitives.hpp>

// Schema type: oracle request.
// Dispute workflow: outbound resolution request; the oracle echoes the nonce
// on its callback.
namespace estate::schema {

template <uint16_t Version>
struct oracle_request;

template <>
struct oracle_request<1> final {
  uint16_t version{1};
  entity_id_t lease_id{};
  entity_id_t property_id{};
  uint64_t nonce{};
  account_id_t oracle_account;
};

using oracle_request_t = oracle_request<1>;

}  // namespace estate::schema
