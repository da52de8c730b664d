#include <estate/ledger/balance_ledger.hpp>
#include <estate/ledger/bid_ledger.hpp>

namespace estate::ledger {

using namespace estate::schema;

amount_t outstanding(const bid_state_t& bid) {
  switch (bid.status) {
    case bid_status_t::completed:
    case bid_status_t::rejected:
    case bid_status_t::cancelled:
    case bid_status_t::refunded:
      return amount_t{0};
    default:
      break;
  }
  if (bid.settled_amount >= bid.amount) {
    return amount_t{0};
  }
  return amount_t{bid.amount - bid.settled_amount};
}

void bid_ledger::insert(bid_state_t bid) {
  auto id = bid.id;
  by_property_[bid.property_id].insert(id);
  by_bidder_[bid.bidder].insert(id);
  bids_.insert_or_assign(id, std::move(bid));
}

const bid_state_t* bid_ledger::find(const entity_id_t id) const {
  auto it = bids_.find(id);
  if (it == std::end(bids_)) {
    return nullptr;
  }
  return &it->second;
}

bid_state_t* bid_ledger::find_mutable(const entity_id_t id) {
  auto it = bids_.find(id);
  if (it == std::end(bids_)) {
    return nullptr;
  }
  return &it->second;
}

std::vector<bid_state_t> bid_ledger::for_property(
    const entity_id_t property_id) const {
  auto out = std::vector<bid_state_t>{};
  auto it = by_property_.find(property_id);
  if (it == std::end(by_property_)) {
    return out;
  }
  for (const auto id : it->second) {
    out.push_back(bids_.at(id));
  }
  return out;
}

std::vector<bid_state_t> bid_ledger::open_for_property(
    const entity_id_t property_id) const {
  auto out = std::vector<bid_state_t>{};
  for (auto& bid : for_property(property_id)) {
    if (outstanding(bid) > 0) {
      out.push_back(std::move(bid));
    }
  }
  return out;
}

std::vector<bid_state_t> bid_ledger::for_bidder(
    const account_id_t& bidder) const {
  auto out = std::vector<bid_state_t>{};
  auto it = by_bidder_.find(bidder);
  if (it == std::end(by_bidder_)) {
    return out;
  }
  for (const auto id : it->second) {
    out.push_back(bids_.at(id));
  }
  return out;
}

std::optional<amount_t> bid_ledger::obligations(
    const account_id_t& token) const {
  auto total = amount_t{0};
  for (const auto& [id, bid] : bids_) {
    if (bid.token != token) {
      continue;
    }
    auto next = checked_add(total, outstanding(bid));
    if (!next) {
      return std::nullopt;
    }
    total = *next;
  }
  return total;
}

}  // namespace estate::ledger
