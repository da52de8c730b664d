#pragma once

#include <estate/schema/dispute_winner.hpp>
#include <estate/schema/error_code.hpp>
#include <estate/schema/lease_state.hpp>
#include <estate/schema/primitives.hpp>
#include <string>

namespace estate::execution {

/// Accounts and amounts of a dispute settlement.
struct payout_plan final {
  estate::schema::error_code code{estate::schema::error_code::ok};
  estate::schema::account_id_t winner_account;
  estate::schema::account_id_t counterparty_account;
  estate::schema::amount_t payout{};
  estate::schema::amount_t remainder{};
};

/// Lease dispute rules: None -> Raised -> {PendingTenantResponse | Resolved}.
///
/// Votes are tallies only; the oracle is a single trusted account. Role
/// checks against the admin roster belong to the caller; per-lease party
/// checks happen here. Every mutator leaves the lease untouched on error.
class dispute_resolver final {
 public:
  static bool is_open(const estate::schema::lease_state_t& lease);

  estate::schema::error_code raise(estate::schema::lease_state_t& lease,
                                   const estate::schema::account_id_t& caller,
                                   std::string reason,
                                   estate::schema::timestamp_nanoseconds_t now) const;

  estate::schema::error_code request_tenant_response(
      estate::schema::lease_state_t& lease) const;

  estate::schema::error_code submit_tenant_response(
      estate::schema::lease_state_t& lease,
      const estate::schema::account_id_t& caller,
      std::string response) const;

  estate::schema::error_code vote(estate::schema::lease_state_t& lease,
                                  const estate::schema::account_id_t& admin,
                                  bool for_tenant) const;

  payout_plan plan_payout(const estate::schema::lease_state_t& lease,
                          estate::schema::dispute_winner_t winner,
                          const estate::schema::amount_t& payout) const;

  /// Record the nonce of an outbound oracle request.
  estate::schema::error_code request_oracle(
      estate::schema::lease_state_t& lease,
      uint64_t nonce) const;

  estate::schema::error_code check_oracle_response(
      const estate::schema::lease_state_t& lease,
      uint64_t nonce) const;

  /// Stamp the resolution once the payout transfer committed.
  void mark_resolved(estate::schema::lease_state_t& lease,
                     estate::schema::dispute_winner_t winner,
                     const estate::schema::account_id_t& resolved_by,
                     const estate::schema::account_id_t& remainder_recipient,
                     estate::schema::timestamp_nanoseconds_t now) const;
};

}  // namespace estate::execution
