#pragma once

#include <estate/execution/dispatchers.hpp>
#include <estate/execution/dispute_resolver.hpp>
#include <estate/execution/lock_registry.hpp>
#include <estate/execution/settlement_coordinator.hpp>
#include <estate/execution/timelock_policy.hpp>
#include <estate/ledger/balance_ledger.hpp>
#include <estate/ledger/bid_ledger.hpp>
#include <estate/ledger/lease_ledger.hpp>
#include <estate/schema/balance_entry.hpp>
#include <estate/schema/bid_state.hpp>
#include <estate/schema/dispute_winner.hpp>
#include <estate/schema/encoding/scale/encoder.hpp>
#include <estate/schema/engine_config.hpp>
#include <estate/schema/engine_counters.hpp>
#include <estate/schema/lease_state.hpp>
#include <estate/schema/operation_result.hpp>
#include <estate/schema/primitives.hpp>
#include <estate/schema/property_listing.hpp>
#include <estate/schema/property_state.hpp>
#include <estate/schema/settlement_continuation.hpp>
#include <estate/schema/state_event.hpp>
#include <estate/schema/timelock_config.hpp>
#include <estate/storage/rocksdb/storage.hpp>
#include <spdlog/spdlog.h>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace estate::execution {

using encoder_t = estate::schema::encoding::scale_encoder_t;
using storage_t =
    estate::storage::storage<estate::storage::rocksdb_storage_tag>;

/// Escrow-backed bid and lease settlement engine.
///
/// Every public call is serialized by one mutex. An operation validates from
/// local state first; rejected operations leave every entity and the state
/// root untouched. Accepted operations flush their row changes as a single
/// write batch, then hand outbound transfer and oracle requests to the
/// installed dispatchers after the mutex is released, so a dispatcher may
/// answer synchronously through `on_transfer_result`.
class engine final {
 public:
  /// Load persisted state, seeding configuration from `seed` on a fresh
  /// database.
  engine(encoder_t& encoder,
         storage_t& storage,
         estate::schema::engine_config_t seed);

  void set_transfer_dispatcher(transfer_dispatcher_t dispatcher);
  void set_oracle_dispatcher(oracle_dispatcher_t dispatcher);

  /// Advance the block clock every time gate is evaluated against.
  estate::schema::operation_result_t set_block_time(
      estate::schema::timestamp_nanoseconds_t now);
  estate::schema::timestamp_nanoseconds_t block_time() const;

  // Property collaborator surface.
  estate::schema::operation_result_t list_property(
      const estate::schema::account_id_t& caller,
      const estate::schema::property_listing_t& listing);
  estate::schema::operation_result_t delist_property(
      const estate::schema::account_id_t& caller,
      estate::schema::entity_id_t property_id);

  /// Inbound deposit from the token-custody rail. `unused_amount` is zero
  /// when the deposit became a bid and the full amount otherwise.
  estate::schema::deposit_result_t on_deposit(
      const estate::schema::account_id_t& token_account,
      const estate::schema::account_id_t& sender,
      const estate::schema::amount_t& amount,
      const estate::schema::bytes_view_t& message);

  // Bid lifecycle.
  /// Direct acceptance by the property owner. Pays the seller share and
  /// finalizes the deal once the transfer commits; an expired bid is refunded
  /// instead.
  estate::schema::operation_result_t accept_bid(
      const estate::schema::account_id_t& caller,
      estate::schema::entity_id_t bid_id);
  /// Accept into escrow: funds stay held until document exchange and the
  /// release delay complete. Competing bids are refunded immediately.
  estate::schema::operation_result_t accept_bid_with_escrow(
      const estate::schema::account_id_t& caller,
      estate::schema::entity_id_t bid_id);
  estate::schema::operation_result_t reject_bid(
      const estate::schema::account_id_t& caller,
      estate::schema::entity_id_t bid_id);
  estate::schema::operation_result_t cancel_bid(
      const estate::schema::account_id_t& caller,
      estate::schema::entity_id_t bid_id);
  /// Seller records the released title document token.
  estate::schema::operation_result_t confirm_document_release(
      const estate::schema::account_id_t& caller,
      estate::schema::entity_id_t bid_id,
      const std::string& document_token_id);
  /// Buyer acknowledges the documents; starts the escrow release delay.
  estate::schema::operation_result_t confirm_document_receipt(
      const estate::schema::account_id_t& caller,
      estate::schema::entity_id_t bid_id);
  /// Buyer pays the seller share out of escrow once the release delay has
  /// elapsed since receipt.
  estate::schema::operation_result_t release_escrow(
      const estate::schema::account_id_t& caller,
      estate::schema::entity_id_t bid_id);
  /// Either party finalizes a released escrow: ownership moves for a
  /// purchase, a lease is opened for a lease bid.
  estate::schema::operation_result_t complete_transaction(
      const estate::schema::account_id_t& caller,
      estate::schema::entity_id_t bid_id);
  /// Keeper refund of an escrow that has not reached document confirmation
  /// within `timeout` of its last transition.
  estate::schema::operation_result_t refund_escrow_timeout(
      const estate::schema::account_id_t& caller,
      estate::schema::entity_id_t bid_id,
      estate::schema::duration_nanoseconds_t timeout);
  estate::schema::operation_result_t raise_bid_dispute(
      const estate::schema::account_id_t& caller,
      estate::schema::entity_id_t bid_id,
      const std::string& reason);
  estate::schema::operation_result_t resolve_bid_dispute(
      const estate::schema::account_id_t& caller,
      estate::schema::entity_id_t bid_id,
      estate::schema::escrow_winner_t winner);
  estate::schema::operation_result_t refund_expired_bid(
      const estate::schema::account_id_t& caller,
      estate::schema::entity_id_t bid_id);
  /// Bidder recovers an open bid on a property sold or leased to someone
  /// else, after the lost-bid claim delay.
  estate::schema::operation_result_t claim_lost_bid(
      const estate::schema::account_id_t& caller,
      estate::schema::entity_id_t bid_id);
  /// Admin refund of every pending or expired bid on a property. Each bid
  /// gets its own continuation; a bid whose refund cannot start is skipped
  /// and a bounced refund leaves only that bid open.
  estate::schema::operation_result_t refund_property_bids(
      const estate::schema::account_id_t& caller,
      estate::schema::entity_id_t property_id);

  // Leases and lease disputes.
  estate::schema::operation_result_t expire_lease(
      const estate::schema::account_id_t& caller,
      estate::schema::entity_id_t lease_id);
  /// Expire every due lease; one lease failing validation does not stop the
  /// others.
  estate::schema::operation_result_t process_expired_leases(
      const estate::schema::account_id_t& caller);
  estate::schema::operation_result_t raise_lease_dispute(
      const estate::schema::account_id_t& caller,
      estate::schema::entity_id_t lease_id,
      const std::string& reason);
  estate::schema::operation_result_t request_tenant_response(
      const estate::schema::account_id_t& caller,
      estate::schema::entity_id_t lease_id);
  estate::schema::operation_result_t submit_tenant_response(
      const estate::schema::account_id_t& caller,
      estate::schema::entity_id_t lease_id,
      const std::string& response);
  estate::schema::operation_result_t vote_on_dispute(
      const estate::schema::account_id_t& caller,
      estate::schema::entity_id_t lease_id,
      bool for_tenant);
  estate::schema::operation_result_t resolve_dispute(
      const estate::schema::account_id_t& caller,
      estate::schema::entity_id_t lease_id,
      estate::schema::dispute_winner_t winner,
      const estate::schema::amount_t& payout);
  estate::schema::operation_result_t request_oracle_dispute(
      const estate::schema::account_id_t& caller,
      estate::schema::entity_id_t lease_id);
  estate::schema::operation_result_t resolve_dispute_from_oracle(
      const estate::schema::account_id_t& caller,
      estate::schema::entity_id_t lease_id,
      uint64_t nonce,
      estate::schema::dispute_winner_t winner,
      const estate::schema::amount_t& payout);
  /// Retry the counterparty remainder of a resolved dispute.
  estate::schema::operation_result_t release_lease_remainder(
      const estate::schema::account_id_t& caller,
      estate::schema::entity_id_t lease_id);

  // Settlement callbacks.
  /// Ledger answer for a continuation. A failed transfer rolls the
  /// continuation back, commits the rollback and reports
  /// `external_call_failed`.
  estate::schema::operation_result_t on_transfer_result(
      estate::schema::entity_id_t continuation_id,
      bool succeeded);
  /// Owner-only recovery for a callback that never arrived. Settles the
  /// continuation as if the ledger had answered `succeeded` and records an
  /// audit event carrying `note`.
  estate::schema::operation_result_t force_resolve_settlement(
      const estate::schema::account_id_t& caller,
      estate::schema::entity_id_t continuation_id,
      bool succeeded,
      const std::string& note);

  // Administration.
  estate::schema::operation_result_t set_timelock_config(
      const estate::schema::account_id_t& caller,
      const estate::schema::timelock_config_t& config);
  estate::schema::operation_result_t set_oracle_account(
      const estate::schema::account_id_t& caller,
      const std::optional<estate::schema::account_id_t>& oracle);
  estate::schema::operation_result_t add_admin(
      const estate::schema::account_id_t& caller,
      const estate::schema::account_id_t& admin);
  estate::schema::operation_result_t remove_admin(
      const estate::schema::account_id_t& caller,
      const estate::schema::account_id_t& admin);
  estate::schema::operation_result_t add_supported_token(
      const estate::schema::account_id_t& caller,
      const estate::schema::account_id_t& token);
  estate::schema::operation_result_t remove_supported_token(
      const estate::schema::account_id_t& caller,
      const estate::schema::account_id_t& token);
  /// Withdraw custody not backing any open bid or lease escrow.
  estate::schema::operation_result_t withdraw_surplus(
      const estate::schema::account_id_t& caller,
      const estate::schema::account_id_t& token,
      const estate::schema::amount_t& amount,
      const estate::schema::account_id_t& recipient);

  // Reads.
  std::optional<estate::schema::property_state_t> property(
      estate::schema::entity_id_t id) const;
  std::optional<estate::schema::bid_state_t> bid(
      estate::schema::entity_id_t id) const;
  std::optional<estate::schema::lease_state_t> lease(
      estate::schema::entity_id_t id) const;
  std::vector<estate::schema::bid_state_t> bids_for_property(
      estate::schema::entity_id_t property_id) const;
  std::vector<estate::schema::bid_state_t> open_bids_for_property(
      estate::schema::entity_id_t property_id) const;
  std::vector<estate::schema::bid_state_t> bids_for_bidder(
      const estate::schema::account_id_t& bidder) const;
  std::vector<estate::schema::lease_state_t> leases_for_tenant(
      const estate::schema::account_id_t& tenant) const;
  estate::schema::amount_t balance_of(
      const estate::schema::account_id_t& token) const;
  /// Open bid funds plus held lease escrow in `token`.
  estate::schema::amount_t obligations_of(
      const estate::schema::account_id_t& token) const;
  std::vector<estate::schema::balance_entry_t> balances() const;
  estate::schema::timelock_config_t timelock_config() const;
  estate::schema::engine_config_t config() const;
  std::vector<std::pair<estate::schema::lock_key_t, lock_holder_t>>
  held_locks() const;
  std::vector<estate::schema::settlement_continuation_t> pending_settlements()
      const;
  /// Persisted state-change records with sequence in [from, to).
  std::vector<std::pair<uint64_t, estate::schema::state_event_t>> events(
      uint64_t from,
      uint64_t to) const;
  /// BLAKE3 over every persisted state row in key order.
  estate::schema::hash32_t state_root() const;

 private:
  /// Rows touched, records emitted and requests queued by one operation.
  struct operation_context final {
    std::set<estate::schema::entity_id_t> properties;
    std::set<estate::schema::entity_id_t> bids;
    std::set<estate::schema::entity_id_t> leases;
    std::set<estate::schema::entity_id_t> continuations;
    std::set<estate::schema::account_id_t> balances;
    std::set<estate::schema::lock_key_t> locks;
    bool config{};
    bool counters{};
    /// Flush even though the operation reports an error.
    bool commit_on_error{};
    std::vector<estate::schema::state_event_t> events;
    std::vector<estate::schema::transfer_request_t> transfers;
    std::vector<estate::schema::oracle_request_t> oracle_requests;
    std::vector<estate::schema::entity_id_t> continuation_ids;
  };

  /// Run `operation` under the mutex, flush on success and dispatch queued
  /// requests once the mutex is released.
  template <typename Operation>
  estate::schema::operation_result_t run(std::string_view name,
                                         Operation&& operation);

  void load_persisted_state(estate::schema::engine_config_t seed);
  void flush(operation_context& ctx);
  void dispatch(const std::vector<estate::schema::transfer_request_t>& transfers,
                const std::vector<estate::schema::oracle_request_t>& oracles);

  // Authorization.
  bool is_owner(const estate::schema::account_id_t& account) const;
  bool is_admin(const estate::schema::account_id_t& account) const;
  bool is_supported_token(const estate::schema::account_id_t& token) const;

  // Lookups used by the operation bodies.
  estate::schema::property_state_t* find_property(
      estate::schema::entity_id_t id);
  estate::schema::amount_t seller_amount(
      const estate::schema::bid_state_t& bid,
      const estate::schema::property_state_t& property) const;
  std::optional<estate::schema::amount_t> checked_obligations(
      const estate::schema::account_id_t& token) const;

  /// Record, lock and queue a transfer; zero amounts settle on the spot.
  estate::schema::error_code issue_settlement(
      operation_context& ctx,
      estate::schema::settlement_continuation_t draft);
  /// Resolve a continuation and apply its effects.
  estate::schema::error_code settle(operation_context& ctx,
                                    estate::schema::entity_id_t continuation_id,
                                    bool succeeded);
  void apply_settlement_success(
      operation_context& ctx,
      const estate::schema::settlement_continuation_t& continuation);
  void apply_settlement_failure(
      operation_context& ctx,
      const estate::schema::settlement_continuation_t& continuation);

  /// Refund every other open bid on the property, each independently.
  void refund_competing_bids(operation_context& ctx,
                             estate::schema::entity_id_t property_id,
                             estate::schema::entity_id_t winning_bid_id,
                             const estate::schema::account_id_t& initiated_by);
  /// Hand the property to the winning bid: ownership for a purchase, a new
  /// lease holding the remaining funds for a lease.
  void finalize_property(operation_context& ctx,
                         estate::schema::bid_state_t& bid,
                         estate::schema::property_state_t& property);
  void relist_for_lease(operation_context& ctx,
                        estate::schema::entity_id_t property_id);
  /// Move a pending bid to expired and issue its refund.
  estate::schema::error_code expire_and_refund(
      operation_context& ctx,
      estate::schema::bid_state_t& bid,
      const estate::schema::account_id_t& initiated_by);
  estate::schema::error_code issue_lease_expiry(
      operation_context& ctx,
      estate::schema::entity_id_t lease_id,
      const estate::schema::account_id_t& initiated_by);
  estate::schema::error_code issue_dispute_payout(
      operation_context& ctx,
      estate::schema::entity_id_t lease_id,
      estate::schema::dispute_winner_t winner,
      const estate::schema::amount_t& payout,
      const estate::schema::account_id_t& resolved_by);
  estate::schema::error_code issue_lease_remainder(
      operation_context& ctx,
      estate::schema::entity_id_t lease_id,
      const estate::schema::account_id_t& initiated_by);

  void emit(operation_context& ctx, estate::schema::state_event_t event);

  mutable std::mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  estate::schema::engine_config_t config_;
  estate::schema::engine_counters_t counters_;
  std::map<estate::schema::entity_id_t, estate::schema::property_state_t>
      properties_;
  estate::ledger::balance_ledger balances_;
  estate::ledger::bid_ledger bids_;
  estate::ledger::lease_ledger leases_;
  lock_registry locks_;
  settlement_coordinator settlement_{locks_, balances_};
  timelock_policy timelocks_;
  dispute_resolver disputes_;
  transfer_dispatcher_t transfer_dispatcher_;
  oracle_dispatcher_t oracle_dispatcher_;
};

template <typename Operation>
estate::schema::operation_result_t engine::run(const std::string_view name,
                                               Operation&& operation) {
  auto result = estate::schema::operation_result_t{};
  auto transfers = std::vector<estate::schema::transfer_request_t>{};
  auto oracles = std::vector<estate::schema::oracle_request_t>{};
  {
    auto lock = std::scoped_lock{mutex_};
    auto ctx = operation_context{};
    result = operation(ctx);
    if (result.code != 0 && !ctx.commit_on_error) {
      spdlog::debug("{} rejected: [{}] {}", name, result.code, result.log);
      return result;
    }
    flush(ctx);
    result.continuation_ids = ctx.continuation_ids;
    result.events = ctx.events;
    transfers = std::move(ctx.transfers);
    oracles = std::move(ctx.oracle_requests);
  }
  dispatch(transfers, oracles);
  return result;
}

}  // namespace estate::execution
