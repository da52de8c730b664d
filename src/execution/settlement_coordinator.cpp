#include <estate/execution/settlement_coordinator.hpp>

#include <spdlog/spdlog.h>

namespace estate::execution {

using namespace estate::schema;

settlement_coordinator::settlement_coordinator(
    lock_registry& locks,
    estate::ledger::balance_ledger& balances)
    : locks_{locks}, balances_{balances} {}

error_code settlement_coordinator::can_begin(
    const std::vector<lock_key_t>& locks,
    const account_id_t& token,
    const amount_t& amount) const {
  if (locks_.any_held(locks)) {
    return error_code::reentrancy_violation;
  }
  if (!balances_.can_debit(token, amount)) {
    return error_code::arithmetic_underflow;
  }
  return error_code::ok;
}

settlement_issue settlement_coordinator::begin(
    settlement_continuation_t draft) {
  auto issue = settlement_issue{};
  issue.code = can_begin(draft.locks, draft.token, draft.amount);
  if (issue.code != error_code::ok) {
    return issue;
  }

  draft.id = next_id_;
  auto tokens = locks_.try_acquire_all(draft.locks, draft.id);
  if (!tokens) {
    issue.code = error_code::reentrancy_violation;
    return issue;
  }
  ++next_id_;

  issue.request = transfer_request_t{.continuation_id = draft.id,
                                     .recipient = draft.recipient,
                                     .token_account = draft.token,
                                     .amount = draft.amount};
  spdlog::info("Settlement {} issued: {} {} {} to '{}'", draft.id,
               to_string(draft.kind), to_string(draft.amount), draft.token,
               draft.recipient);
  continuations_.emplace(draft.id, std::move(draft));
  return issue;
}

settlement_outcome settlement_coordinator::resolve(const entity_id_t id,
                                                   const bool succeeded) {
  auto outcome = settlement_outcome{};
  auto it = continuations_.find(id);
  if (it == std::end(continuations_)) {
    outcome.code = error_code::settlement_missing;
    return outcome;
  }

  const auto& continuation = it->second;
  if (succeeded) {
    if (!balances_.debit(continuation.token, continuation.amount)) {
      spdlog::error("Settlement {} would underflow balance of '{}'", id,
                    continuation.token);
      outcome.code = error_code::arithmetic_underflow;
      return outcome;
    }
  }

  for (const auto& key : continuation.locks) {
    locks_.release(key);
  }
  outcome.succeeded = succeeded;
  outcome.continuation = std::move(it->second);
  continuations_.erase(it);
  return outcome;
}

const settlement_continuation_t* settlement_coordinator::find(
    const entity_id_t id) const {
  auto it = continuations_.find(id);
  if (it == std::end(continuations_)) {
    return nullptr;
  }
  return &it->second;
}

std::vector<settlement_continuation_t> settlement_coordinator::pending()
    const {
  auto out = std::vector<settlement_continuation_t>{};
  out.reserve(continuations_.size());
  for (const auto& [id, continuation] : continuations_) {
    out.push_back(continuation);
  }
  return out;
}

void settlement_coordinator::restore(settlement_continuation_t continuation) {
  auto id = continuation.id;
  continuations_.insert_or_assign(id, std::move(continuation));
  if (id >= next_id_) {
    next_id_ = id + 1;
  }
}

}  // namespace estate::execution
