#include <spdlog/spdlog.h>
#include <estate/execution/bid_state_machine.hpp>
#include <estate/execution/engine.hpp>
#include <estate/execution/operation_results.hpp>

using namespace estate::schema;

namespace estate::execution {

namespace {

std::vector<state_event_attribute_t> settlement_attributes(
    const settlement_continuation_t& continuation) {
  return {make_attribute("continuation_id", std::to_string(continuation.id),
                         true),
          make_attribute("kind", std::string{to_string(continuation.kind)}),
          make_attribute("token", continuation.token),
          make_attribute("recipient", continuation.recipient, true),
          make_attribute("amount", to_string(continuation.amount))};
}

const char* bid_event_for(const settlement_kind_t kind) {
  switch (kind) {
    case settlement_kind_t::reject_bid:
      return "BidRejected";
    case settlement_kind_t::cancel_bid:
      return "BidCancelled";
    case settlement_kind_t::refund_escrow_timeout:
      return "EscrowRefunded";
    case settlement_kind_t::bid_dispute_refund:
    case settlement_kind_t::bid_dispute_release:
      return "BidDisputeResolved";
    case settlement_kind_t::claim_lost_bid:
      return "LostBidClaimed";
    case settlement_kind_t::release_escrow:
      return "EscrowReleased";
    default:
      return "BidRefunded";
  }
}

}  // namespace

error_code engine::issue_settlement(operation_context& ctx,
                                    settlement_continuation_t draft) {
  draft.issued_at = counters_.block_time;
  auto locks = draft.locks;
  auto issue = settlement_.begin(std::move(draft));
  if (issue.code != error_code::ok) {
    return issue.code;
  }

  const auto& request = *issue.request;
  const auto id = request.continuation_id;
  ctx.counters = true;
  ctx.continuations.insert(id);
  ctx.locks.insert(std::begin(locks), std::end(locks));
  ctx.continuation_ids.push_back(id);
  emit(ctx, make_event("SettlementIssued",
                       settlement_attributes(*settlement_.find(id))));

  if (request.amount == 0) {
    return settle(ctx, id, true);
  }
  ctx.transfers.push_back(request);
  return error_code::ok;
}

error_code engine::settle(operation_context& ctx,
                          const entity_id_t continuation_id,
                          const bool succeeded) {
  auto outcome = settlement_.resolve(continuation_id, succeeded);
  if (outcome.code != error_code::ok) {
    return outcome.code;
  }
  const auto& continuation = *outcome.continuation;
  ctx.continuations.insert(continuation_id);
  ctx.locks.insert(std::begin(continuation.locks),
                   std::end(continuation.locks));
  if (succeeded) {
    ctx.balances.insert(continuation.token);
    apply_settlement_success(ctx, continuation);
  } else {
    apply_settlement_failure(ctx, continuation);
  }
  return error_code::ok;
}

void engine::apply_settlement_success(
    operation_context& ctx,
    const settlement_continuation_t& continuation) {
  const auto now = counters_.block_time;
  switch (continuation.kind) {
    case settlement_kind_t::withdraw_surplus: {
      emit(ctx, make_event("SurplusWithdrawn",
                           settlement_attributes(continuation)));
      return;
    }
    case settlement_kind_t::expire_lease:
    case settlement_kind_t::dispute_payout:
    case settlement_kind_t::dispute_remainder: {
      auto* lease = leases_.find_mutable(continuation.lease_id.value_or(0));
      if (lease == nullptr) {
        spdlog::error("Settlement {} committed for unknown lease",
                      continuation.id);
        return;
      }
      ctx.leases.insert(lease->id);
      lease->escrow_amount =
          estate::ledger::checked_sub(lease->escrow_amount, continuation.amount)
              .value_or(amount_t{0});
      if (continuation.kind == settlement_kind_t::expire_lease) {
        leases_.close(lease->id);
        relist_for_lease(ctx, lease->property_id);
        emit(ctx, make_lease_event("LeaseExpired", *lease,
                                   {make_attribute("returned",
                                                   to_string(continuation.amount))}));
        return;
      }
      if (continuation.kind == settlement_kind_t::dispute_remainder) {
        emit(ctx, make_lease_event(
                      "LeaseRemainderReleased", *lease,
                      {make_attribute("recipient", continuation.recipient, true),
                       make_attribute("amount", to_string(continuation.amount))}));
        return;
      }

      const auto winner =
          continuation.dispute_winner.value_or(dispute_winner_t::owner);
      const auto& counterparty =
          winner == dispute_winner_t::tenant ? lease->owner : lease->tenant;
      disputes_.mark_resolved(*lease, winner, continuation.initiated_by,
                              counterparty, now);
      leases_.close(lease->id);
      relist_for_lease(ctx, lease->property_id);
      emit(ctx, make_lease_event(
                    "DisputeResolved", *lease,
                    {make_attribute("winner", std::string{to_string(winner)}),
                     make_attribute("payout", to_string(continuation.amount)),
                     make_attribute("remainder", to_string(lease->escrow_amount)),
                     make_attribute("resolved_by", continuation.initiated_by)}));
      if (lease->escrow_amount > 0) {
        auto code = issue_lease_remainder(ctx, lease->id,
                                          continuation.initiated_by);
        if (code != error_code::ok) {
          spdlog::warn("Remainder of lease {} not released: error {}",
                       lease->id, static_cast<uint32_t>(code));
        }
      }
      return;
    }
    default:
      break;
  }

  auto* bid = bids_.find_mutable(continuation.bid_id.value_or(0));
  if (bid == nullptr) {
    spdlog::error("Settlement {} committed for unknown bid", continuation.id);
    return;
  }
  ctx.bids.insert(bid->id);
  auto* property = find_property(bid->property_id);

  switch (continuation.kind) {
    case settlement_kind_t::accept_bid: {
      bid->settled_amount = continuation.amount;
      emit(ctx, make_bid_event("BidAccepted", *bid,
                               {make_attribute("escrow", "false"),
                                make_attribute("amount", to_string(bid->amount))}));
      if (property == nullptr) {
        spdlog::error("Accepted bid {} has no property", bid->id);
        return;
      }
      finalize_property(ctx, *bid, *property);
      refund_competing_bids(ctx, property->id, bid->id,
                            continuation.initiated_by);
      return;
    }
    case settlement_kind_t::release_escrow:
    case settlement_kind_t::bid_dispute_release: {
      bid->settled_amount =
          estate::ledger::checked_add(bid->settled_amount, continuation.amount)
              .value_or(bid->amount);
      break;
    }
    default:
      break;
  }

  const auto target = continuation.target_status.value_or(bid->status);
  if (bid_state_machine::advance(*bid, target, now) != error_code::ok) {
    spdlog::error("Settlement {} cannot move bid {} from {} to {}",
                  continuation.id, bid->id, to_string(bid->status),
                  to_string(target));
  }
  if (target == bid_status_t::refunded && property != nullptr &&
      property->accepted_bid_id == bid->id) {
    property->accepted_bid_id.reset();
    ctx.properties.insert(property->id);
  }

  auto extra = std::vector<state_event_attribute_t>{
      make_attribute("amount", to_string(continuation.amount)),
      make_attribute("recipient", continuation.recipient)};
  if (continuation.kind == settlement_kind_t::bid_dispute_refund) {
    extra.push_back(make_attribute("winner", "buyer"));
  } else if (continuation.kind == settlement_kind_t::bid_dispute_release) {
    extra.push_back(make_attribute("winner", "seller"));
  }
  emit(ctx, make_bid_event(bid_event_for(continuation.kind), *bid,
                           std::move(extra)));
}

void engine::apply_settlement_failure(
    operation_context& ctx,
    const settlement_continuation_t& continuation) {
  spdlog::warn("Settlement {} ({}) failed; state rolled back",
               continuation.id, to_string(continuation.kind));
  auto attributes = settlement_attributes(continuation);
  const auto code = error_code::external_call_failed;
  attributes.push_back(
      make_attribute("code", std::to_string(static_cast<uint32_t>(code))));
  attributes.push_back(
      make_attribute("codespace", std::string{codespace_of(code)}));
  emit(ctx, make_event("SettlementFailed", std::move(attributes)));
}

operation_result_t engine::on_transfer_result(const entity_id_t continuation_id,
                                              const bool succeeded) {
  return run("on_transfer_result", [&](operation_context& ctx) {
    auto code = settle(ctx, continuation_id, succeeded);
    if (code != error_code::ok) {
      spdlog::warn("Transfer callback for settlement {} rejected: error {}",
                   continuation_id, static_cast<uint32_t>(code));
      return make_error(code, "settlement cannot be resolved");
    }
    if (!succeeded) {
      ctx.commit_on_error = true;
      auto failed = make_error(error_code::external_call_failed,
                               "transfer failed; settlement rolled back");
      failed.entity_id = continuation_id;
      return failed;
    }
    return make_success(continuation_id, "settled");
  });
}

operation_result_t engine::force_resolve_settlement(
    const account_id_t& caller,
    const entity_id_t continuation_id,
    const bool succeeded,
    const std::string& note) {
  return run("force_resolve_settlement", [&](operation_context& ctx) {
    if (!is_owner(caller)) {
      return make_error(error_code::not_contract_owner,
                        "only the owner may force a settlement");
    }
    auto code = settle(ctx, continuation_id, succeeded);
    if (code != error_code::ok) {
      return make_error(code, "settlement cannot be resolved");
    }
    emit(ctx, make_event("SettlementForceResolved",
                         {make_attribute("continuation_id",
                                         std::to_string(continuation_id), true),
                          make_attribute("outcome",
                                         succeeded ? "success" : "failure"),
                          make_attribute("note", note),
                          make_attribute("caller", caller, true)}));
    return make_success(continuation_id, succeeded ? "settled" : "rolled back");
  });
}

}  // namespace estate::execution
