#pragma once

#include <estate/schema/bid_state.hpp>
#include <estate/schema/primitives.hpp>
#include <map>
#include <optional>
#include <set>
#include <vector>

namespace estate::ledger {

/// Amount of a bid still in engine custody; zero once the bid is terminal.
estate::schema::amount_t outstanding(const estate::schema::bid_state_t& bid);

/// Bid arena with property and bidder indices.
///
/// Index keys (property, bidder) never change after insert, so mutable access
/// through `find_mutable` keeps the indices valid.
class bid_ledger final {
 public:
  /// Insert or replace a bid by id.
  void insert(estate::schema::bid_state_t bid);

  const estate::schema::bid_state_t* find(estate::schema::entity_id_t id) const;
  estate::schema::bid_state_t* find_mutable(estate::schema::entity_id_t id);

  std::vector<estate::schema::bid_state_t> for_property(
      estate::schema::entity_id_t property_id) const;

  /// Bids on the property that still hold funds (non-terminal).
  std::vector<estate::schema::bid_state_t> open_for_property(
      estate::schema::entity_id_t property_id) const;

  std::vector<estate::schema::bid_state_t> for_bidder(
      const estate::schema::account_id_t& bidder) const;

  /// Sum of outstanding bid funds in `token`; nullopt on overflow.
  std::optional<estate::schema::amount_t> obligations(
      const estate::schema::account_id_t& token) const;

  const std::map<estate::schema::entity_id_t, estate::schema::bid_state_t>&
  all() const {
    return bids_;
  }

 private:
  std::map<estate::schema::entity_id_t, estate::schema::bid_state_t> bids_;
  std::map<estate::schema::entity_id_t, std::set<estate::schema::entity_id_t>>
      by_property_;
  std::map<estate::schema::account_id_t, std::set<estate::schema::entity_id_t>>
      by_bidder_;
};

}  // namespace estate::ledger
