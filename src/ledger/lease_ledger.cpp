#include <estate/ledger/balance_ledger.hpp>
#include <estate/ledger/lease_ledger.hpp>

#include <algorithm>

namespace estate::ledger {

using namespace estate::schema;

bool lease_ledger::insert(lease_state_t lease) {
  if (lease.active) {
    auto existing = active_by_property_.find(lease.property_id);
    if (existing != std::end(active_by_property_) &&
        existing->second != lease.id) {
      return false;
    }
    active_by_property_[lease.property_id] = lease.id;
  }
  by_tenant_[lease.tenant].insert(lease.id);
  auto id = lease.id;
  leases_.insert_or_assign(id, std::move(lease));
  return true;
}

const lease_state_t* lease_ledger::find(const entity_id_t id) const {
  auto it = leases_.find(id);
  if (it == std::end(leases_)) {
    return nullptr;
  }
  return &it->second;
}

lease_state_t* lease_ledger::find_mutable(const entity_id_t id) {
  auto it = leases_.find(id);
  if (it == std::end(leases_)) {
    return nullptr;
  }
  return &it->second;
}

std::vector<lease_state_t> lease_ledger::for_tenant(
    const account_id_t& tenant) const {
  auto out = std::vector<lease_state_t>{};
  auto it = by_tenant_.find(tenant);
  if (it == std::end(by_tenant_)) {
    return out;
  }
  for (const auto id : it->second) {
    out.push_back(leases_.at(id));
  }
  return out;
}

std::optional<entity_id_t> lease_ledger::active_for_property(
    const entity_id_t property_id) const {
  auto it = active_by_property_.find(property_id);
  if (it == std::end(active_by_property_)) {
    return std::nullopt;
  }
  return it->second;
}

void lease_ledger::close(const entity_id_t id) {
  auto* lease = find_mutable(id);
  if (lease == nullptr) {
    return;
  }
  lease->active = false;
  auto it = active_by_property_.find(lease->property_id);
  if (it != std::end(active_by_property_) && it->second == id) {
    active_by_property_.erase(it);
  }
}

std::optional<amount_t> lease_ledger::obligations(
    const account_id_t& token) const {
  auto total = amount_t{0};
  for (const auto& [id, lease] : leases_) {
    if (lease.escrow_token != token) {
      continue;
    }
    auto next = checked_add(total, lease.escrow_amount);
    if (!next) {
      return std::nullopt;
    }
    total = *next;
  }
  return total;
}

std::vector<entity_id_t> lease_ledger::expired(
    const timestamp_nanoseconds_t now) const {
  auto out = std::vector<entity_id_t>{};
  for (const auto& [property_id, lease_id] : active_by_property_) {
    const auto& lease = leases_.at(lease_id);
    auto end = lease.start_time + lease.duration;
    if (end < lease.start_time) {
      continue;
    }
    if (end <= now) {
      out.push_back(lease_id);
    }
  }
  std::sort(std::begin(out), std::end(out));
  return out;
}

}  // namespace estate::ledger
