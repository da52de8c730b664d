#include <spdlog/spdlog.h>
#include <estate/execution/bid_state_machine.hpp>
#include <estate/execution/engine.hpp>
#include <estate/execution/operation_results.hpp>

#include <cstddef>

using namespace estate::schema;

namespace estate::execution {

namespace {

listing_status_t listing_for(const bid_action_t action) {
  return action == bid_action_t::purchase ? listing_status_t::listed_for_sale
                                          : listing_status_t::listed_for_lease;
}

std::vector<lock_key_t> bid_locks(const bid_state_t& bid) {
  return {make_lock_key(lock_kind_t::bid, bid.id)};
}

std::vector<lock_key_t> deal_locks(const bid_state_t& bid) {
  return {make_lock_key(lock_kind_t::bid, bid.id),
          make_lock_key(lock_kind_t::property, bid.property_id)};
}

}  // namespace

error_code engine::expire_and_refund(operation_context& ctx,
                                     bid_state_t& bid,
                                     const account_id_t& initiated_by) {
  auto locks = bid_locks(bid);
  const auto amount = estate::ledger::outstanding(bid);
  auto code = settlement_.can_begin(locks, bid.token, amount);
  if (code != error_code::ok) {
    return code;
  }
  if (bid.status == bid_status_t::pending) {
    bid_state_machine::advance(bid, bid_status_t::expired, counters_.block_time);
    ctx.bids.insert(bid.id);
    emit(ctx, make_bid_event("BidExpired", bid));
  }
  return issue_settlement(
      ctx, settlement_continuation_t{.kind = settlement_kind_t::refund_expired_bid,
                                     .token = bid.token,
                                     .recipient = bid.bidder,
                                     .amount = amount,
                                     .bid_id = bid.id,
                                     .property_id = bid.property_id,
                                     .locks = std::move(locks),
                                     .initiated_by = initiated_by,
                                     .target_status = bid_status_t::refunded});
}

void engine::refund_competing_bids(operation_context& ctx,
                                   const entity_id_t property_id,
                                   const entity_id_t winning_bid_id,
                                   const account_id_t& initiated_by) {
  for (const auto& other : bids_.open_for_property(property_id)) {
    if (other.id == winning_bid_id) {
      continue;
    }
    if (other.status != bid_status_t::pending &&
        other.status != bid_status_t::expired) {
      continue;
    }
    const auto target = other.status == bid_status_t::pending
                            ? bid_status_t::rejected
                            : bid_status_t::refunded;
    auto code = issue_settlement(
        ctx,
        settlement_continuation_t{.kind = settlement_kind_t::refund_competing_bid,
                                  .token = other.token,
                                  .recipient = other.bidder,
                                  .amount = estate::ledger::outstanding(other),
                                  .bid_id = other.id,
                                  .property_id = property_id,
                                  .locks = bid_locks(other),
                                  .initiated_by = initiated_by,
                                  .target_status = target});
    if (code != error_code::ok) {
      // The bid stays open and can be claimed once the claim delay passes.
      spdlog::warn("Skipping refund of competing bid {}: error {}", other.id,
                   static_cast<uint32_t>(code));
    }
  }
}

void engine::finalize_property(operation_context& ctx,
                               bid_state_t& bid,
                               property_state_t& property) {
  const auto now = counters_.block_time;
  if (bid_state_machine::advance(bid, bid_status_t::completed, now) !=
      error_code::ok) {
    spdlog::error("Bid {} finalized from status {}", bid.id,
                  to_string(bid.status));
  }
  ctx.bids.insert(bid.id);
  ctx.properties.insert(property.id);

  property.completed_at = now;
  property.winning_bid_id = bid.id;
  property.accepted_bid_id.reset();

  auto seller = property.owner;
  if (bid.action == bid_action_t::purchase) {
    property.owner = bid.bidder;
    property.status = listing_status_t::sold;
  } else {
    const auto lease_id = counters_.next_lease_id++;
    ctx.counters = true;
    auto escrow = estate::ledger::checked_sub(bid.amount, bid.settled_amount);
    auto lease = lease_state_t{.id = lease_id,
                               .property_id = property.id,
                               .bid_id = bid.id,
                               .tenant = bid.bidder,
                               .owner = property.owner,
                               .start_time = now,
                               .duration = property.lease_duration.value_or(0),
                               .escrow_amount = escrow.value_or(amount_t{0}),
                               .escrow_token = bid.token,
                               .active = true};
    if (!leases_.insert(lease)) {
      spdlog::error("Property {} already has an active lease", property.id);
    }
    ctx.leases.insert(lease_id);
    property.status = listing_status_t::leased;
    property.active_lease_id = lease_id;
    emit(ctx, make_lease_event(
                  "LeaseCreated", lease,
                  {make_attribute("owner", lease.owner, true),
                   make_attribute("duration", std::to_string(lease.duration)),
                   make_attribute("escrow_amount",
                                  to_string(lease.escrow_amount))}));
  }
  emit(ctx, make_bid_event("DealFinalized", bid,
                           {make_attribute("seller", seller, true),
                            make_attribute("amount", to_string(bid.amount))}));
}

operation_result_t engine::accept_bid(const account_id_t& caller,
                                      const entity_id_t bid_id) {
  return run("accept_bid", [&](operation_context& ctx) {
    auto* bid = bids_.find_mutable(bid_id);
    if (bid == nullptr) {
      return make_error(error_code::bid_missing, "bid not found");
    }
    auto* property = find_property(bid->property_id);
    if (property == nullptr) {
      return make_error(error_code::property_missing, "property not found");
    }
    if (caller != property->owner) {
      return make_error(error_code::not_property_owner,
                        "only the property owner may accept");
    }
    if (bid->status != bid_status_t::pending) {
      return make_error(error_code::invalid_bid_state, "bid is not pending");
    }
    if (property->accepted_bid_id) {
      return make_error(error_code::property_under_contract,
                        "property is under contract");
    }
    if (property->status != listing_for(bid->action) ||
        leases_.active_for_property(property->id)) {
      return make_error(error_code::property_not_listed,
                        "property is not available for this bid");
    }
    if (timelocks_.is_bid_expired(*bid, counters_.block_time)) {
      auto code = expire_and_refund(ctx, *bid, caller);
      if (code != error_code::ok) {
        return make_error(code, "expired bid refund cannot start");
      }
      return make_success(bid_id, "bid expired; refund issued");
    }

    auto locks = deal_locks(*bid);
    const auto amount = seller_amount(*bid, *property);
    auto code = settlement_.can_begin(locks, bid->token, amount);
    if (code != error_code::ok) {
      return make_error(code, "bid settlement cannot start");
    }
    code = issue_settlement(
        ctx, settlement_continuation_t{.kind = settlement_kind_t::accept_bid,
                                       .token = bid->token,
                                       .recipient = property->owner,
                                       .amount = amount,
                                       .bid_id = bid->id,
                                       .property_id = property->id,
                                       .locks = std::move(locks),
                                       .initiated_by = caller,
                                       .target_status = bid_status_t::completed});
    if (code != error_code::ok) {
      return make_error(code, "bid settlement cannot start");
    }
    return make_success(bid_id);
  });
}

operation_result_t engine::accept_bid_with_escrow(const account_id_t& caller,
                                                  const entity_id_t bid_id) {
  return run("accept_bid_with_escrow", [&](operation_context& ctx) {
    auto* bid = bids_.find_mutable(bid_id);
    if (bid == nullptr) {
      return make_error(error_code::bid_missing, "bid not found");
    }
    auto* property = find_property(bid->property_id);
    if (property == nullptr) {
      return make_error(error_code::property_missing, "property not found");
    }
    if (caller != property->owner) {
      return make_error(error_code::not_property_owner,
                        "only the property owner may accept");
    }
    if (bid->status != bid_status_t::pending) {
      return make_error(error_code::invalid_bid_state, "bid is not pending");
    }
    if (property->accepted_bid_id) {
      return make_error(error_code::property_under_contract,
                        "property is under contract");
    }
    if (property->status != listing_for(bid->action) ||
        leases_.active_for_property(property->id)) {
      return make_error(error_code::property_not_listed,
                        "property is not available for this bid");
    }
    if (timelocks_.is_bid_expired(*bid, counters_.block_time)) {
      auto code = expire_and_refund(ctx, *bid, caller);
      if (code != error_code::ok) {
        return make_error(code, "expired bid refund cannot start");
      }
      return make_success(bid_id, "bid expired; refund issued");
    }
    if (locks_.any_held(deal_locks(*bid))) {
      return make_error(error_code::reentrancy_violation,
                        "bid settlement in flight");
    }

    bid_state_machine::advance(*bid, bid_status_t::accepted,
                               counters_.block_time);
    bid->escrow = true;
    property->accepted_bid_id = bid->id;
    ctx.bids.insert(bid->id);
    ctx.properties.insert(property->id);
    emit(ctx, make_bid_event("BidAccepted", *bid,
                             {make_attribute("escrow", "true"),
                              make_attribute("amount", to_string(bid->amount))}));
    refund_competing_bids(ctx, property->id, bid->id, caller);
    return make_success(bid_id);
  });
}

operation_result_t engine::reject_bid(const account_id_t& caller,
                                      const entity_id_t bid_id) {
  return run("reject_bid", [&](operation_context& ctx) {
    const auto* bid = bids_.find(bid_id);
    if (bid == nullptr) {
      return make_error(error_code::bid_missing, "bid not found");
    }
    const auto* property = find_property(bid->property_id);
    if (property == nullptr) {
      return make_error(error_code::property_missing, "property not found");
    }
    if (caller != property->owner) {
      return make_error(error_code::not_property_owner,
                        "only the property owner may reject");
    }
    if (bid->status != bid_status_t::pending) {
      return make_error(error_code::invalid_bid_state, "bid is not pending");
    }
    auto locks = bid_locks(*bid);
    const auto amount = estate::ledger::outstanding(*bid);
    auto code = settlement_.can_begin(locks, bid->token, amount);
    if (code != error_code::ok) {
      return make_error(code, "refund cannot start");
    }
    code = issue_settlement(
        ctx, settlement_continuation_t{.kind = settlement_kind_t::reject_bid,
                                       .token = bid->token,
                                       .recipient = bid->bidder,
                                       .amount = amount,
                                       .bid_id = bid->id,
                                       .property_id = bid->property_id,
                                       .locks = std::move(locks),
                                       .initiated_by = caller,
                                       .target_status = bid_status_t::rejected});
    if (code != error_code::ok) {
      return make_error(code, "refund cannot start");
    }
    return make_success(bid_id);
  });
}

operation_result_t engine::cancel_bid(const account_id_t& caller,
                                      const entity_id_t bid_id) {
  return run("cancel_bid", [&](operation_context& ctx) {
    const auto* bid = bids_.find(bid_id);
    if (bid == nullptr) {
      return make_error(error_code::bid_missing, "bid not found");
    }
    if (caller != bid->bidder) {
      return make_error(error_code::not_bidder,
                        "only the bidder may cancel");
    }
    if (bid->status != bid_status_t::pending) {
      return make_error(error_code::invalid_bid_state, "bid is not pending");
    }
    auto locks = bid_locks(*bid);
    const auto amount = estate::ledger::outstanding(*bid);
    auto code = settlement_.can_begin(locks, bid->token, amount);
    if (code != error_code::ok) {
      return make_error(code, "refund cannot start");
    }
    code = issue_settlement(
        ctx, settlement_continuation_t{.kind = settlement_kind_t::cancel_bid,
                                       .token = bid->token,
                                       .recipient = bid->bidder,
                                       .amount = amount,
                                       .bid_id = bid->id,
                                       .property_id = bid->property_id,
                                       .locks = std::move(locks),
                                       .initiated_by = caller,
                                       .target_status = bid_status_t::cancelled});
    if (code != error_code::ok) {
      return make_error(code, "refund cannot start");
    }
    return make_success(bid_id);
  });
}

operation_result_t engine::confirm_document_release(
    const account_id_t& caller,
    const entity_id_t bid_id,
    const std::string& document_token_id) {
  return run("confirm_document_release", [&](operation_context& ctx) {
    auto* bid = bids_.find_mutable(bid_id);
    if (bid == nullptr) {
      return make_error(error_code::bid_missing, "bid not found");
    }
    const auto* property = find_property(bid->property_id);
    if (property == nullptr) {
      return make_error(error_code::property_missing, "property not found");
    }
    if (caller != property->owner) {
      return make_error(error_code::not_property_owner,
                        "only the seller may release documents");
    }
    if (bid->status != bid_status_t::accepted) {
      return make_error(error_code::invalid_bid_state, "bid is not accepted");
    }
    if (document_token_id.empty()) {
      return make_error(error_code::invalid_message,
                        "document token id is empty");
    }
    if (locks_.any_held(deal_locks(*bid))) {
      return make_error(error_code::reentrancy_violation,
                        "bid settlement in flight");
    }

    bid_state_machine::advance(*bid, bid_status_t::docs_released,
                               counters_.block_time);
    bid->document_token_id = document_token_id;
    ctx.bids.insert(bid->id);
    emit(ctx, make_bid_event("DocumentReleased", *bid,
                             {make_attribute("document_token_id",
                                             document_token_id, true)}));
    return make_success(bid_id);
  });
}

operation_result_t engine::confirm_document_receipt(const account_id_t& caller,
                                                    const entity_id_t bid_id) {
  return run("confirm_document_receipt", [&](operation_context& ctx) {
    auto* bid = bids_.find_mutable(bid_id);
    if (bid == nullptr) {
      return make_error(error_code::bid_missing, "bid not found");
    }
    if (caller != bid->bidder) {
      return make_error(error_code::not_bidder,
                        "only the buyer may confirm receipt");
    }
    if (bid->status != bid_status_t::docs_released) {
      return make_error(error_code::invalid_bid_state,
                        "documents were not released");
    }
    if (locks_.any_held(deal_locks(*bid))) {
      return make_error(error_code::reentrancy_violation,
                        "bid settlement in flight");
    }

    const auto now = counters_.block_time;
    bid_state_machine::advance(*bid, bid_status_t::docs_confirmed, now);
    bid->docs_confirmed_at = now;
    ctx.bids.insert(bid->id);
    emit(ctx, make_bid_event("DocumentReceiptConfirmed", *bid,
                             {make_attribute("confirmed_at",
                                             std::to_string(now))}));
    return make_success(bid_id);
  });
}

operation_result_t engine::release_escrow(const account_id_t& caller,
                                          const entity_id_t bid_id) {
  return run("release_escrow", [&](operation_context& ctx) {
    const auto* bid = bids_.find(bid_id);
    if (bid == nullptr) {
      return make_error(error_code::bid_missing, "bid not found");
    }
    const auto* property = find_property(bid->property_id);
    if (property == nullptr) {
      return make_error(error_code::property_missing, "property not found");
    }
    if (caller != bid->bidder) {
      return make_error(error_code::not_bidder,
                        "only the buyer may release escrow");
    }
    if (bid->status != bid_status_t::docs_confirmed) {
      return make_error(error_code::invalid_bid_state,
                        "document receipt not confirmed");
    }
    if (!timelocks_.escrow_release_elapsed(*bid, counters_.block_time)) {
      return make_error(error_code::timelock_not_elapsed,
                        "escrow release delay has not elapsed");
    }
    auto locks = deal_locks(*bid);
    const auto amount = seller_amount(*bid, *property);
    auto code = settlement_.can_begin(locks, bid->token, amount);
    if (code != error_code::ok) {
      return make_error(code, "escrow release cannot start");
    }
    code = issue_settlement(
        ctx, settlement_continuation_t{
                 .kind = settlement_kind_t::release_escrow,
                 .token = bid->token,
                 .recipient = property->owner,
                 .amount = amount,
                 .bid_id = bid->id,
                 .property_id = bid->property_id,
                 .locks = std::move(locks),
                 .initiated_by = caller,
                 .target_status = bid_status_t::payment_released});
    if (code != error_code::ok) {
      return make_error(code, "escrow release cannot start");
    }
    return make_success(bid_id);
  });
}

operation_result_t engine::complete_transaction(const account_id_t& caller,
                                                const entity_id_t bid_id) {
  return run("complete_transaction", [&](operation_context& ctx) {
    auto* bid = bids_.find_mutable(bid_id);
    if (bid == nullptr) {
      return make_error(error_code::bid_missing, "bid not found");
    }
    auto* property = find_property(bid->property_id);
    if (property == nullptr) {
      return make_error(error_code::property_missing, "property not found");
    }
    if (caller != bid->bidder && caller != property->owner) {
      return make_error(error_code::not_transaction_party,
                        "only the buyer or seller may complete");
    }
    if (bid->status != bid_status_t::payment_released) {
      return make_error(error_code::invalid_bid_state,
                        "payment has not been released");
    }
    if (bid->action == bid_action_t::lease &&
        leases_.active_for_property(property->id)) {
      return make_error(error_code::property_not_listed,
                        "property already has an active lease");
    }
    if (locks_.any_held(deal_locks(*bid))) {
      return make_error(error_code::reentrancy_violation,
                        "bid settlement in flight");
    }

    finalize_property(ctx, *bid, *property);
    return make_success(bid_id);
  });
}

operation_result_t engine::refund_escrow_timeout(
    const account_id_t& caller,
    const entity_id_t bid_id,
    const duration_nanoseconds_t timeout) {
  return run("refund_escrow_timeout", [&](operation_context& ctx) {
    const auto* bid = bids_.find(bid_id);
    if (bid == nullptr) {
      return make_error(error_code::bid_missing, "bid not found");
    }
    if (bid->status != bid_status_t::accepted &&
        bid->status != bid_status_t::docs_released) {
      return make_error(error_code::invalid_bid_state,
                        "bid is not awaiting documents");
    }
    if (!timelock_policy::timeout_elapsed(bid->updated_at, timeout,
                                          counters_.block_time)) {
      return make_error(error_code::timelock_not_elapsed,
                        "escrow timeout has not elapsed");
    }
    auto locks = deal_locks(*bid);
    const auto amount = estate::ledger::outstanding(*bid);
    auto code = settlement_.can_begin(locks, bid->token, amount);
    if (code != error_code::ok) {
      return make_error(code, "escrow refund cannot start");
    }
    code = issue_settlement(
        ctx, settlement_continuation_t{
                 .kind = settlement_kind_t::refund_escrow_timeout,
                 .token = bid->token,
                 .recipient = bid->bidder,
                 .amount = amount,
                 .bid_id = bid->id,
                 .property_id = bid->property_id,
                 .locks = std::move(locks),
                 .initiated_by = caller,
                 .target_status = bid_status_t::refunded});
    if (code != error_code::ok) {
      return make_error(code, "escrow refund cannot start");
    }
    return make_success(bid_id);
  });
}

operation_result_t engine::raise_bid_dispute(const account_id_t& caller,
                                             const entity_id_t bid_id,
                                             const std::string& reason) {
  return run("raise_bid_dispute", [&](operation_context& ctx) {
    auto* bid = bids_.find_mutable(bid_id);
    if (bid == nullptr) {
      return make_error(error_code::bid_missing, "bid not found");
    }
    const auto* property = find_property(bid->property_id);
    if (property == nullptr) {
      return make_error(error_code::property_missing, "property not found");
    }
    if (caller != bid->bidder && caller != property->owner) {
      return make_error(error_code::not_transaction_party,
                        "only the buyer or seller may dispute");
    }
    if (bid->status != bid_status_t::accepted &&
        bid->status != bid_status_t::docs_released &&
        bid->status != bid_status_t::docs_confirmed) {
      return make_error(error_code::invalid_bid_state,
                        "bid is not in the escrow lifecycle");
    }
    if (locks_.any_held(deal_locks(*bid))) {
      return make_error(error_code::reentrancy_violation,
                        "bid settlement in flight");
    }

    bid_state_machine::advance(*bid, bid_status_t::disputed,
                               counters_.block_time);
    bid->dispute_reason = reason;
    ctx.bids.insert(bid->id);
    emit(ctx, make_bid_event("BidDisputeRaised", *bid,
                             {make_attribute("raised_by", caller, true),
                              make_attribute("reason", reason)}));
    return make_success(bid_id);
  });
}

operation_result_t engine::resolve_bid_dispute(const account_id_t& caller,
                                               const entity_id_t bid_id,
                                               const escrow_winner_t winner) {
  return run("resolve_bid_dispute", [&](operation_context& ctx) {
    if (!is_admin(caller)) {
      return make_error(error_code::not_admin,
                        "only an admin may resolve disputes");
    }
    const auto* bid = bids_.find(bid_id);
    if (bid == nullptr) {
      return make_error(error_code::bid_missing, "bid not found");
    }
    const auto* property = find_property(bid->property_id);
    if (property == nullptr) {
      return make_error(error_code::property_missing, "property not found");
    }
    if (bid->status != bid_status_t::disputed) {
      return make_error(error_code::invalid_bid_state, "bid is not disputed");
    }

    auto draft = settlement_continuation_t{.token = bid->token,
                                           .bid_id = bid->id,
                                           .property_id = bid->property_id,
                                           .locks = deal_locks(*bid),
                                           .initiated_by = caller};
    if (winner == escrow_winner_t::buyer) {
      draft.kind = settlement_kind_t::bid_dispute_refund;
      draft.recipient = bid->bidder;
      draft.amount = estate::ledger::outstanding(*bid);
      draft.target_status = bid_status_t::refunded;
    } else {
      draft.kind = settlement_kind_t::bid_dispute_release;
      draft.recipient = property->owner;
      draft.amount = seller_amount(*bid, *property);
      draft.target_status = bid_status_t::payment_released;
    }
    auto code = settlement_.can_begin(draft.locks, draft.token, draft.amount);
    if (code != error_code::ok) {
      return make_error(code, "dispute settlement cannot start");
    }
    code = issue_settlement(ctx, std::move(draft));
    if (code != error_code::ok) {
      return make_error(code, "dispute settlement cannot start");
    }
    return make_success(bid_id);
  });
}

operation_result_t engine::refund_expired_bid(const account_id_t& caller,
                                              const entity_id_t bid_id) {
  return run("refund_expired_bid", [&](operation_context& ctx) {
    auto* bid = bids_.find_mutable(bid_id);
    if (bid == nullptr) {
      return make_error(error_code::bid_missing, "bid not found");
    }
    if (bid->status == bid_status_t::pending &&
        !timelocks_.is_bid_expired(*bid, counters_.block_time)) {
      return make_error(error_code::timelock_not_elapsed,
                        "bid has not expired");
    }
    if (bid->status != bid_status_t::pending &&
        bid->status != bid_status_t::expired) {
      return make_error(error_code::invalid_bid_state,
                        "bid is not pending or expired");
    }
    auto code = expire_and_refund(ctx, *bid, caller);
    if (code != error_code::ok) {
      return make_error(code, "expired bid refund cannot start");
    }
    return make_success(bid_id);
  });
}

operation_result_t engine::claim_lost_bid(const account_id_t& caller,
                                          const entity_id_t bid_id) {
  return run("claim_lost_bid", [&](operation_context& ctx) {
    const auto* bid = bids_.find(bid_id);
    if (bid == nullptr) {
      return make_error(error_code::bid_missing, "bid not found");
    }
    if (caller != bid->bidder) {
      return make_error(error_code::not_bidder,
                        "only the bidder may claim a bid");
    }
    if (bid->status != bid_status_t::pending &&
        bid->status != bid_status_t::expired) {
      return make_error(error_code::bid_not_claimable,
                        "bid is not claimable");
    }
    const auto* property = find_property(bid->property_id);
    if (property == nullptr) {
      return make_error(error_code::property_missing, "property not found");
    }
    if (!property->winning_bid_id || *property->winning_bid_id == bid->id ||
        !property->completed_at || bid->created_at > *property->completed_at) {
      return make_error(error_code::bid_not_claimable,
                        "property not yet sold or leased to another party");
    }
    if (!timelocks_.lost_bid_claim_elapsed(*property->completed_at,
                                           counters_.block_time)) {
      return make_error(error_code::timelock_not_elapsed,
                        "lost bid claim delay has not elapsed");
    }
    auto locks = bid_locks(*bid);
    const auto amount = estate::ledger::outstanding(*bid);
    auto code = settlement_.can_begin(locks, bid->token, amount);
    if (code != error_code::ok) {
      return make_error(code, "claim cannot start");
    }
    const auto target = bid->status == bid_status_t::pending
                            ? bid_status_t::cancelled
                            : bid_status_t::refunded;
    code = issue_settlement(
        ctx, settlement_continuation_t{.kind = settlement_kind_t::claim_lost_bid,
                                       .token = bid->token,
                                       .recipient = bid->bidder,
                                       .amount = amount,
                                       .bid_id = bid->id,
                                       .property_id = bid->property_id,
                                       .locks = std::move(locks),
                                       .initiated_by = caller,
                                       .target_status = target});
    if (code != error_code::ok) {
      return make_error(code, "claim cannot start");
    }
    return make_success(bid_id);
  });
}

operation_result_t engine::refund_property_bids(const account_id_t& caller,
                                                const entity_id_t property_id) {
  return run("refund_property_bids", [&](operation_context& ctx) {
    if (!is_admin(caller)) {
      return make_error(error_code::not_admin,
                        "only an admin may refund property bids");
    }
    if (find_property(property_id) == nullptr) {
      return make_error(error_code::property_missing, "property not found");
    }

    auto candidates = std::size_t{0};
    auto issued = std::size_t{0};
    auto last_error = error_code::ok;
    for (const auto& bid : bids_.open_for_property(property_id)) {
      if (bid.status != bid_status_t::pending &&
          bid.status != bid_status_t::expired) {
        continue;
      }
      ++candidates;
      auto locks = bid_locks(bid);
      const auto amount = estate::ledger::outstanding(bid);
      auto code = settlement_.can_begin(locks, bid.token, amount);
      if (code == error_code::ok) {
        const auto target = bid.status == bid_status_t::pending
                                ? bid_status_t::cancelled
                                : bid_status_t::refunded;
        code = issue_settlement(
            ctx, settlement_continuation_t{
                     .kind = settlement_kind_t::admin_refund_bid,
                     .token = bid.token,
                     .recipient = bid.bidder,
                     .amount = amount,
                     .bid_id = bid.id,
                     .property_id = property_id,
                     .locks = std::move(locks),
                     .initiated_by = caller,
                     .target_status = target});
      }
      if (code != error_code::ok) {
        spdlog::warn("Skipping admin refund of bid {}: error {}", bid.id,
                     static_cast<uint32_t>(code));
        last_error = code;
        continue;
      }
      ++issued;
    }

    if (candidates == 0) {
      return make_error(error_code::invalid_bid_state,
                        "property has no refundable bids");
    }
    if (issued == 0) {
      return make_error(last_error, "no bid refund could start");
    }
    emit(ctx, make_event("PropertyBidsRefunded",
                         {make_attribute("property_id",
                                         std::to_string(property_id), true),
                          make_attribute("refunds", std::to_string(issued)),
                          make_attribute("skipped",
                                         std::to_string(candidates - issued)),
                          make_attribute("admin", caller, true)}));
    return make_success(property_id);
  });
}

}  // namespace estate::execution
