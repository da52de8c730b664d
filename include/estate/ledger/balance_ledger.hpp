#pragma once

#include <estate/schema/balance_entry.hpp>
#include <estate/schema/primitives.hpp>
#include <map>
#include <optional>
#include <vector>

namespace estate::ledger {

/// Overflow-checked 128-bit addition.
std::optional<estate::schema::amount_t> checked_add(
    const estate::schema::amount_t& lhs,
    const estate::schema::amount_t& rhs);

/// Underflow-checked 128-bit subtraction.
std::optional<estate::schema::amount_t> checked_sub(
    const estate::schema::amount_t& lhs,
    const estate::schema::amount_t& rhs);

/// Running balance per externally-custodied token.
///
/// Mutated only when a deposit is accepted or a settlement commits; every
/// other path reads. Callers commit each fact exactly once.
class balance_ledger final {
 public:
  /// Add `amount`; returns the new balance, or nullopt (unchanged) on overflow.
  std::optional<estate::schema::amount_t> credit(
      const estate::schema::account_id_t& token,
      const estate::schema::amount_t& amount);

  /// Subtract `amount`; returns the new balance, or nullopt (unchanged) on
  /// underflow.
  std::optional<estate::schema::amount_t> debit(
      const estate::schema::account_id_t& token,
      const estate::schema::amount_t& amount);

  bool can_credit(const estate::schema::account_id_t& token,
                  const estate::schema::amount_t& amount) const;
  bool can_debit(const estate::schema::account_id_t& token,
                 const estate::schema::amount_t& amount) const;

  estate::schema::amount_t balance_of(
      const estate::schema::account_id_t& token) const;

  /// Snapshot ordered by token.
  std::vector<estate::schema::balance_entry_t> entries() const;

  /// Install a persisted entry, replacing any in-memory value.
  void restore(const estate::schema::balance_entry_t& entry);

 private:
  std::map<estate::schema::account_id_t, estate::schema::amount_t> balances_;
};

}  // namespace estate::ledger
