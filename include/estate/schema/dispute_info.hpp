#pragma once
#include <estate/schema/dispute_status.hpp>
#include <estate/schema/dispute_winner.hpp>
#include <estate/schema/primitives.hpp>
#include <optional>
#include <string>
#include <vector>

// Schema type: dispute info.
// Marketplace workflow: lease dispute embedded in the lease record; tallies
// are advisory, only a resolution (admin or oracle) moves funds.
namespace estate::schema {

template <uint16_t Version>
struct dispute_info;

template <>
struct dispute_info<1> final {
  uint16_t version{1};
  dispute_status_t status{dispute_status_t::none};
  std::string reason;
  account_id_t raised_by;
  timestamp_nanoseconds_t raised_at{};
  uint32_t votes_for_tenant{};
  uint32_t votes_for_owner{};
  std::vector<account_id_t> voters;
  std::optional<uint64_t> oracle_nonce;
  std::optional<std::string> tenant_response;
  std::optional<dispute_winner_t> winner;
  std::optional<account_id_t> resolved_by;
  std::optional<timestamp_nanoseconds_t> resolved_at;
  std::optional<account_id_t> remainder_recipient;
};

using dispute_info_t = dispute_info<1>;

}  // namespace estate::schema
