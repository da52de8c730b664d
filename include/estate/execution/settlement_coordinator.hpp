#pragma once

#include <estate/execution/lock_registry.hpp>
#include <estate/ledger/balance_ledger.hpp>
#include <estate/schema/error_code.hpp>
#include <estate/schema/settlement_continuation.hpp>
#include <estate/schema/transfer_request.hpp>
#include <map>
#include <optional>
#include <vector>

namespace estate::execution {

struct settlement_issue final {
  estate::schema::error_code code{estate::schema::error_code::ok};
  std::optional<estate::schema::transfer_request_t> request;
};

struct settlement_outcome final {
  estate::schema::error_code code{estate::schema::error_code::ok};
  bool succeeded{};
  std::optional<estate::schema::settlement_continuation_t> continuation;
};

/// Issues outbound transfers and settles their callbacks.
///
/// `begin` takes the draft's locks and records the continuation; `resolve`
/// debits the balance on success, then releases the locks and drops the
/// continuation on either outcome. Bid and lease effects are the caller's,
/// applied from the returned continuation only.
class settlement_coordinator final {
 public:
  settlement_coordinator(lock_registry& locks,
                         estate::ledger::balance_ledger& balances);

  /// Pure pre-check of `begin` for callers that must validate before they
  /// mutate anything.
  estate::schema::error_code can_begin(
      const std::vector<estate::schema::lock_key_t>& locks,
      const estate::schema::account_id_t& token,
      const estate::schema::amount_t& amount) const;

  /// Allocate the continuation id, acquire every lock and record the draft.
  settlement_issue begin(estate::schema::settlement_continuation_t draft);

  settlement_outcome resolve(estate::schema::entity_id_t id, bool succeeded);

  const estate::schema::settlement_continuation_t* find(
      estate::schema::entity_id_t id) const;
  std::vector<estate::schema::settlement_continuation_t> pending() const;

  /// Reinstall a persisted continuation; its locks are restored separately.
  void restore(estate::schema::settlement_continuation_t continuation);

  estate::schema::entity_id_t next_id() const { return next_id_; }
  void set_next_id(estate::schema::entity_id_t next_id) { next_id_ = next_id; }

 private:
  lock_registry& locks_;
  estate::ledger::balance_ledger& balances_;
  std::map<estate::schema::entity_id_t,
           estate::schema::settlement_continuation_t>
      continuations_;
  estate::schema::entity_id_t next_id_{1};
};

}  // namespace estate::execution
