#pragma once

#include <estate/schema/bid_status.hpp>
#include <estate/schema/dispute_winner.hpp>
#include <estate/schema/lock_key.hpp>
#include <estate/schema/primitives.hpp>
#include <estate/schema/settlement_kind.hpp>
#include <optional>
#include <vector>

// Schema type: settlement continuation.
// Settlement workflow: everything a transfer callback needs to commit or roll
// back. Written before the transfer request leaves and is the only input the
// callback trusts.
namespace estate::schema {

template <uint16_t Version>
struct settlement_continuation;

template <>
struct settlement_continuation<1> final {
  uint16_t version{1};
  entity_id_t id{};
  settlement_kind_t kind{settlement_kind_t::accept_bid};
  account_id_t token;
  account_id_t recipient;
  amount_t amount{};
  std::optional<entity_id_t> bid_id;
  std::optional<entity_id_t> property_id;
  std::optional<entity_id_t> lease_id;
  std::vector<lock_key_t> locks;
  timestamp_nanoseconds_t issued_at{};
  account_id_t initiated_by;
  std::optional<bid_status_t> target_status;
  std::optional<dispute_winner_t> dispute_winner;
};

using settlement_continuation_t = settlement_continuation<1>;

}  // namespace estate::schema
