#include <estate/execution/dispute_resolver.hpp>

#include <algorithm>

namespace estate::execution {

using namespace estate::schema;

bool dispute_resolver::is_open(const lease_state_t& lease) {
  if (!lease.dispute) {
    return false;
  }
  return lease.dispute->status == dispute_status_t::raised ||
         lease.dispute->status == dispute_status_t::pending_tenant_response;
}

error_code dispute_resolver::raise(lease_state_t& lease,
                                   const account_id_t& caller,
                                   std::string reason,
                                   const timestamp_nanoseconds_t now) const {
  if (caller != lease.tenant && caller != lease.owner) {
    return error_code::not_lease_party;
  }
  if (!lease.active) {
    return error_code::lease_not_active;
  }
  if (lease.dispute && lease.dispute->status != dispute_status_t::none) {
    return error_code::dispute_already_raised;
  }
  lease.dispute = dispute_info_t{.status = dispute_status_t::raised,
                                 .reason = std::move(reason),
                                 .raised_by = caller,
                                 .raised_at = now};
  return error_code::ok;
}

error_code dispute_resolver::request_tenant_response(
    lease_state_t& lease) const {
  if (!lease.dispute || lease.dispute->status != dispute_status_t::raised) {
    return error_code::dispute_not_raised;
  }
  lease.dispute->status = dispute_status_t::pending_tenant_response;
  return error_code::ok;
}

error_code dispute_resolver::submit_tenant_response(
    lease_state_t& lease,
    const account_id_t& caller,
    std::string response) const {
  if (caller != lease.tenant) {
    return error_code::not_tenant;
  }
  if (!lease.dispute ||
      lease.dispute->status != dispute_status_t::pending_tenant_response) {
    return error_code::dispute_not_raised;
  }
  lease.dispute->tenant_response = std::move(response);
  return error_code::ok;
}

error_code dispute_resolver::vote(lease_state_t& lease,
                                  const account_id_t& admin,
                                  const bool for_tenant) const {
  if (!is_open(lease)) {
    return error_code::dispute_not_raised;
  }
  auto& voters = lease.dispute->voters;
  if (std::find(std::begin(voters), std::end(voters), admin) !=
      std::end(voters)) {
    return error_code::duplicate_vote;
  }
  voters.push_back(admin);
  if (for_tenant) {
    ++lease.dispute->votes_for_tenant;
  } else {
    ++lease.dispute->votes_for_owner;
  }
  return error_code::ok;
}

payout_plan dispute_resolver::plan_payout(const lease_state_t& lease,
                                          const dispute_winner_t winner,
                                          const amount_t& payout) const {
  auto plan = payout_plan{};
  if (!is_open(lease)) {
    plan.code = error_code::dispute_not_raised;
    return plan;
  }
  if (payout > lease.escrow_amount) {
    plan.code = error_code::payout_exceeds_escrow;
    return plan;
  }
  if (winner == dispute_winner_t::tenant) {
    plan.winner_account = lease.tenant;
    plan.counterparty_account = lease.owner;
  } else {
    plan.winner_account = lease.owner;
    plan.counterparty_account = lease.tenant;
  }
  plan.payout = payout;
  plan.remainder = lease.escrow_amount - payout;
  return plan;
}

error_code dispute_resolver::request_oracle(lease_state_t& lease,
                                            const uint64_t nonce) const {
  if (!is_open(lease)) {
    return error_code::dispute_not_raised;
  }
  lease.dispute->oracle_nonce = nonce;
  return error_code::ok;
}

error_code dispute_resolver::check_oracle_response(const lease_state_t& lease,
                                                   const uint64_t nonce) const {
  if (!is_open(lease)) {
    return error_code::dispute_not_raised;
  }
  if (!lease.dispute->oracle_nonce || *lease.dispute->oracle_nonce != nonce) {
    return error_code::oracle_nonce_mismatch;
  }
  return error_code::ok;
}

void dispute_resolver::mark_resolved(lease_state_t& lease,
                                     const dispute_winner_t winner,
                                     const account_id_t& resolved_by,
                                     const account_id_t& remainder_recipient,
                                     const timestamp_nanoseconds_t now) const {
  if (!lease.dispute) {
    lease.dispute = dispute_info_t{};
  }
  lease.dispute->status = dispute_status_t::resolved;
  lease.dispute->winner = winner;
  lease.dispute->resolved_by = resolved_by;
  lease.dispute->resolved_at = now;
  lease.dispute->remainder_recipient = remainder_recipient;
}

}  // namespace estate::execution
