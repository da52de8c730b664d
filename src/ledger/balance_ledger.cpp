#include <estate/ledger/balance_ledger.hpp>

#include <limits>

namespace estate::ledger {

std::optional<estate::schema::amount_t> checked_add(
    const estate::schema::amount_t& lhs,
    const estate::schema::amount_t& rhs) {
  if (lhs > std::numeric_limits<estate::schema::amount_t>::max() - rhs) {
    return std::nullopt;
  }
  return estate::schema::amount_t{lhs + rhs};
}

std::optional<estate::schema::amount_t> checked_sub(
    const estate::schema::amount_t& lhs,
    const estate::schema::amount_t& rhs) {
  if (rhs > lhs) {
    return std::nullopt;
  }
  return estate::schema::amount_t{lhs - rhs};
}

std::optional<estate::schema::amount_t> balance_ledger::credit(
    const estate::schema::account_id_t& token,
    const estate::schema::amount_t& amount) {
  auto updated = checked_add(balance_of(token), amount);
  if (!updated) {
    return std::nullopt;
  }
  balances_[token] = *updated;
  return updated;
}

std::optional<estate::schema::amount_t> balance_ledger::debit(
    const estate::schema::account_id_t& token,
    const estate::schema::amount_t& amount) {
  auto updated = checked_sub(balance_of(token), amount);
  if (!updated) {
    return std::nullopt;
  }
  balances_[token] = *updated;
  return updated;
}

bool balance_ledger::can_credit(const estate::schema::account_id_t& token,
                                const estate::schema::amount_t& amount) const {
  return checked_add(balance_of(token), amount).has_value();
}

bool balance_ledger::can_debit(const estate::schema::account_id_t& token,
                               const estate::schema::amount_t& amount) const {
  return checked_sub(balance_of(token), amount).has_value();
}

estate::schema::amount_t balance_ledger::balance_of(
    const estate::schema::account_id_t& token) const {
  auto it = balances_.find(token);
  if (it == std::end(balances_)) {
    return estate::schema::amount_t{0};
  }
  return it->second;
}

std::vector<estate::schema::balance_entry_t> balance_ledger::entries() const {
  auto out = std::vector<estate::schema::balance_entry_t>{};
  out.reserve(balances_.size());
  for (const auto& [token, amount] : balances_) {
    out.push_back(
        estate::schema::balance_entry_t{.token = token, .amount = amount});
  }
  return out;
}

void balance_ledger::restore(const estate::schema::balance_entry_t& entry) {
  balances_[entry.token] = entry.amount;
}

}  // namespace estate::ledger
