#include <spdlog/spdlog.h>
#include <estate/execution/engine.hpp>
#include <estate/execution/operation_results.hpp>

using namespace estate::schema;

namespace estate::execution {

namespace {

std::vector<lock_key_t> lease_locks(const lease_state_t& lease) {
  return {make_lock_key(lock_kind_t::lease, lease.id)};
}

bool lease_term_ended(const lease_state_t& lease,
                      const timestamp_nanoseconds_t now) {
  if (lease.start_time > now) {
    return false;
  }
  return now - lease.start_time >= lease.duration;
}

}  // namespace

void engine::relist_for_lease(operation_context& ctx,
                              const entity_id_t property_id) {
  auto* property = find_property(property_id);
  if (property == nullptr) {
    spdlog::error("Lease closed on unknown property {}", property_id);
    return;
  }
  property->status = listing_status_t::listed_for_lease;
  property->active_lease_id.reset();
  property->accepted_bid_id.reset();
  ctx.properties.insert(property_id);
  spdlog::info("Property {} relisted for lease", property_id);
}

error_code engine::issue_lease_expiry(operation_context& ctx,
                                      const entity_id_t lease_id,
                                      const account_id_t& initiated_by) {
  const auto* lease = leases_.find(lease_id);
  if (lease == nullptr) {
    return error_code::lease_missing;
  }
  if (!lease->active) {
    return error_code::lease_not_active;
  }
  if (!lease_term_ended(*lease, counters_.block_time)) {
    return error_code::lease_not_expired;
  }
  if (dispute_resolver::is_open(*lease)) {
    return error_code::dispute_already_raised;
  }
  auto locks = lease_locks(*lease);
  auto code =
      settlement_.can_begin(locks, lease->escrow_token, lease->escrow_amount);
  if (code != error_code::ok) {
    return code;
  }
  return issue_settlement(
      ctx, settlement_continuation_t{.kind = settlement_kind_t::expire_lease,
                                     .token = lease->escrow_token,
                                     .recipient = lease->tenant,
                                     .amount = lease->escrow_amount,
                                     .bid_id = lease->bid_id,
                                     .property_id = lease->property_id,
                                     .lease_id = lease->id,
                                     .locks = std::move(locks),
                                     .initiated_by = initiated_by});
}

error_code engine::issue_dispute_payout(operation_context& ctx,
                                        const entity_id_t lease_id,
                                        const dispute_winner_t winner,
                                        const amount_t& payout,
                                        const account_id_t& resolved_by) {
  const auto* lease = leases_.find(lease_id);
  if (lease == nullptr) {
    return error_code::lease_missing;
  }
  auto plan = disputes_.plan_payout(*lease, winner, payout);
  if (plan.code != error_code::ok) {
    return plan.code;
  }
  auto locks = lease_locks(*lease);
  auto code = settlement_.can_begin(locks, lease->escrow_token, plan.payout);
  if (code != error_code::ok) {
    return code;
  }
  return issue_settlement(
      ctx, settlement_continuation_t{.kind = settlement_kind_t::dispute_payout,
                                     .token = lease->escrow_token,
                                     .recipient = plan.winner_account,
                                     .amount = plan.payout,
                                     .bid_id = lease->bid_id,
                                     .property_id = lease->property_id,
                                     .lease_id = lease->id,
                                     .locks = std::move(locks),
                                     .initiated_by = resolved_by,
                                     .dispute_winner = winner});
}

error_code engine::issue_lease_remainder(operation_context& ctx,
                                         const entity_id_t lease_id,
                                         const account_id_t& initiated_by) {
  const auto* lease = leases_.find(lease_id);
  if (lease == nullptr) {
    return error_code::lease_missing;
  }
  if (!lease->dispute || lease->dispute->status != dispute_status_t::resolved ||
      !lease->dispute->remainder_recipient) {
    return error_code::dispute_not_raised;
  }
  if (lease->escrow_amount == 0) {
    return error_code::invalid_amount;
  }
  auto locks = lease_locks(*lease);
  auto code =
      settlement_.can_begin(locks, lease->escrow_token, lease->escrow_amount);
  if (code != error_code::ok) {
    return code;
  }
  return issue_settlement(
      ctx,
      settlement_continuation_t{.kind = settlement_kind_t::dispute_remainder,
                                .token = lease->escrow_token,
                                .recipient = *lease->dispute->remainder_recipient,
                                .amount = lease->escrow_amount,
                                .bid_id = lease->bid_id,
                                .property_id = lease->property_id,
                                .lease_id = lease->id,
                                .locks = std::move(locks),
                                .initiated_by = initiated_by,
                                .dispute_winner = lease->dispute->winner});
}

operation_result_t engine::expire_lease(const account_id_t& caller,
                                        const entity_id_t lease_id) {
  return run("expire_lease", [&](operation_context& ctx) {
    auto code = issue_lease_expiry(ctx, lease_id, caller);
    if (code != error_code::ok) {
      return make_error(code, "lease cannot expire");
    }
    return make_success(lease_id);
  });
}

operation_result_t engine::process_expired_leases(const account_id_t& caller) {
  return run("process_expired_leases", [&](operation_context& ctx) {
    auto processed = size_t{0};
    for (const auto lease_id : leases_.expired(counters_.block_time)) {
      auto code = issue_lease_expiry(ctx, lease_id, caller);
      if (code != error_code::ok) {
        spdlog::warn("Skipping expiry of lease {}: error {}", lease_id,
                     static_cast<uint32_t>(code));
        continue;
      }
      ++processed;
    }
    return make_success(std::nullopt,
                        std::to_string(processed) + " lease(s) expired");
  });
}

operation_result_t engine::raise_lease_dispute(const account_id_t& caller,
                                               const entity_id_t lease_id,
                                               const std::string& reason) {
  return run("raise_lease_dispute", [&](operation_context& ctx) {
    auto* lease = leases_.find_mutable(lease_id);
    if (lease == nullptr) {
      return make_error(error_code::lease_missing, "lease not found");
    }
    if (locks_.any_held(lease_locks(*lease))) {
      return make_error(error_code::reentrancy_violation,
                        "lease settlement in flight");
    }
    auto code = disputes_.raise(*lease, caller, reason, counters_.block_time);
    if (code != error_code::ok) {
      return make_error(code, "dispute cannot be raised");
    }
    ctx.leases.insert(lease_id);
    emit(ctx, make_lease_event("DisputeRaised", *lease,
                               {make_attribute("raised_by", caller, true),
                                make_attribute("reason", reason)}));
    return make_success(lease_id);
  });
}

operation_result_t engine::request_tenant_response(const account_id_t& caller,
                                                   const entity_id_t lease_id) {
  return run("request_tenant_response", [&](operation_context& ctx) {
    if (!is_admin(caller)) {
      return make_error(error_code::not_admin,
                        "only an admin may request a response");
    }
    auto* lease = leases_.find_mutable(lease_id);
    if (lease == nullptr) {
      return make_error(error_code::lease_missing, "lease not found");
    }
    auto code = disputes_.request_tenant_response(*lease);
    if (code != error_code::ok) {
      return make_error(code, "no raised dispute on lease");
    }
    ctx.leases.insert(lease_id);
    emit(ctx, make_lease_event("TenantResponseRequested", *lease,
                               {make_attribute("requested_by", caller)}));
    return make_success(lease_id);
  });
}

operation_result_t engine::submit_tenant_response(const account_id_t& caller,
                                                  const entity_id_t lease_id,
                                                  const std::string& response) {
  return run("submit_tenant_response", [&](operation_context& ctx) {
    auto* lease = leases_.find_mutable(lease_id);
    if (lease == nullptr) {
      return make_error(error_code::lease_missing, "lease not found");
    }
    auto code = disputes_.submit_tenant_response(*lease, caller, response);
    if (code != error_code::ok) {
      return make_error(code, "tenant response not accepted");
    }
    ctx.leases.insert(lease_id);
    emit(ctx, make_lease_event("TenantResponseSubmitted", *lease,
                               {make_attribute("response", response)}));
    return make_success(lease_id);
  });
}

operation_result_t engine::vote_on_dispute(const account_id_t& caller,
                                           const entity_id_t lease_id,
                                           const bool for_tenant) {
  return run("vote_on_dispute", [&](operation_context& ctx) {
    if (!is_admin(caller)) {
      return make_error(error_code::not_admin, "only an admin may vote");
    }
    auto* lease = leases_.find_mutable(lease_id);
    if (lease == nullptr) {
      return make_error(error_code::lease_missing, "lease not found");
    }
    auto code = disputes_.vote(*lease, caller, for_tenant);
    if (code != error_code::ok) {
      return make_error(code, "vote not accepted");
    }
    ctx.leases.insert(lease_id);
    emit(ctx,
         make_lease_event(
             "DisputeVoteCast", *lease,
             {make_attribute("voter", caller, true),
              make_attribute("for_tenant", for_tenant ? "true" : "false"),
              make_attribute("votes_for_tenant",
                             std::to_string(lease->dispute->votes_for_tenant)),
              make_attribute("votes_for_owner",
                             std::to_string(lease->dispute->votes_for_owner))}));
    return make_success(lease_id);
  });
}

operation_result_t engine::resolve_dispute(const account_id_t& caller,
                                           const entity_id_t lease_id,
                                           const dispute_winner_t winner,
                                           const amount_t& payout) {
  return run("resolve_dispute", [&](operation_context& ctx) {
    if (!is_admin(caller)) {
      return make_error(error_code::not_admin,
                        "only an admin may resolve disputes");
    }
    auto code = issue_dispute_payout(ctx, lease_id, winner, payout, caller);
    if (code != error_code::ok) {
      return make_error(code, "dispute payout cannot start");
    }
    return make_success(lease_id);
  });
}

operation_result_t engine::request_oracle_dispute(const account_id_t& caller,
                                                  const entity_id_t lease_id) {
  return run("request_oracle_dispute", [&](operation_context& ctx) {
    if (!is_admin(caller)) {
      return make_error(error_code::not_admin,
                        "only an admin may involve the oracle");
    }
    if (!config_.oracle_account) {
      return make_error(error_code::oracle_not_configured,
                        "no oracle account configured");
    }
    auto* lease = leases_.find_mutable(lease_id);
    if (lease == nullptr) {
      return make_error(error_code::lease_missing, "lease not found");
    }
    const auto nonce = counters_.next_oracle_nonce;
    auto code = disputes_.request_oracle(*lease, nonce);
    if (code != error_code::ok) {
      return make_error(code, "no open dispute on lease");
    }
    ++counters_.next_oracle_nonce;
    ctx.counters = true;
    ctx.leases.insert(lease_id);
    ctx.oracle_requests.push_back(
        oracle_request_t{.lease_id = lease_id,
                         .property_id = lease->property_id,
                         .nonce = nonce,
                         .oracle_account = *config_.oracle_account});
    emit(ctx, make_lease_event("OracleDisputeRequested", *lease,
                               {make_attribute("nonce", std::to_string(nonce)),
                                make_attribute("oracle",
                                               *config_.oracle_account)}));
    return make_success(lease_id);
  });
}

operation_result_t engine::resolve_dispute_from_oracle(
    const account_id_t& caller,
    const entity_id_t lease_id,
    const uint64_t nonce,
    const dispute_winner_t winner,
    const amount_t& payout) {
  return run("resolve_dispute_from_oracle", [&](operation_context& ctx) {
    if (!config_.oracle_account) {
      return make_error(error_code::oracle_not_configured,
                        "no oracle account configured");
    }
    if (caller != *config_.oracle_account) {
      return make_error(error_code::not_oracle,
                        "only the oracle may answer");
    }
    const auto* lease = leases_.find(lease_id);
    if (lease == nullptr) {
      return make_error(error_code::lease_missing, "lease not found");
    }
    auto code = disputes_.check_oracle_response(*lease, nonce);
    if (code != error_code::ok) {
      return make_error(code, "oracle response does not match a request");
    }
    code = issue_dispute_payout(ctx, lease_id, winner, payout, caller);
    if (code != error_code::ok) {
      return make_error(code, "dispute payout cannot start");
    }
    return make_success(lease_id);
  });
}

operation_result_t engine::release_lease_remainder(const account_id_t& caller,
                                                   const entity_id_t lease_id) {
  return run("release_lease_remainder", [&](operation_context& ctx) {
    auto code = issue_lease_remainder(ctx, lease_id, caller);
    if (code != error_code::ok) {
      return make_error(code, "lease remainder cannot be released");
    }
    return make_success(lease_id);
  });
}

}  // namespace estate::execution
