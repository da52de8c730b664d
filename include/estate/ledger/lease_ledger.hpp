#pragma once

#include <estate/schema/lease_state.hpp>
#include <estate/schema/primitives.hpp>
#include <map>
#include <optional>
#include <set>
#include <vector>

namespace estate::ledger {

/// Lease arena with tenant index and the active-lease-per-property index.
///
/// `active` may only be cleared through `close`, which keeps the property
/// index in step. `escrow_amount` is the part of the damage escrow still held.
class lease_ledger final {
 public:
  /// Insert a lease; false when the property already has an active lease.
  bool insert(estate::schema::lease_state_t lease);

  const estate::schema::lease_state_t* find(
      estate::schema::entity_id_t id) const;
  estate::schema::lease_state_t* find_mutable(estate::schema::entity_id_t id);

  std::vector<estate::schema::lease_state_t> for_tenant(
      const estate::schema::account_id_t& tenant) const;

  std::optional<estate::schema::entity_id_t> active_for_property(
      estate::schema::entity_id_t property_id) const;

  /// Mark the lease inactive and drop it from the property index.
  void close(estate::schema::entity_id_t id);

  /// Sum of held damage escrow in `token`; nullopt on overflow.
  std::optional<estate::schema::amount_t> obligations(
      const estate::schema::account_id_t& token) const;

  /// Active leases whose term ended at or before `now`, ordered by id.
  std::vector<estate::schema::entity_id_t> expired(
      estate::schema::timestamp_nanoseconds_t now) const;

  const std::map<estate::schema::entity_id_t, estate::schema::lease_state_t>&
  all() const {
    return leases_;
  }

 private:
  std::map<estate::schema::entity_id_t, estate::schema::lease_state_t> leases_;
  std::map<estate::schema::account_id_t, std::set<estate::schema::entity_id_t>>
      by_tenant_;
  std::map<estate::schema::entity_id_t, estate::schema::entity_id_t>
      active_by_property_;
};

}  // namespace estate::ledger
