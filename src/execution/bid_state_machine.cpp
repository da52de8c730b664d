#include <estate/execution/bid_state_machine.hpp>

#include <spdlog/spdlog.h>

namespace estate::execution::bid_state_machine {

using estate::schema::bid_status_t;

bool is_legal(const bid_status_t from, const bid_status_t to) {
  switch (from) {
    case bid_status_t::pending:
      return to == bid_status_t::completed || to == bid_status_t::rejected ||
             to == bid_status_t::cancelled || to == bid_status_t::expired ||
             to == bid_status_t::accepted;
    case bid_status_t::accepted:
      return to == bid_status_t::docs_released ||
             to == bid_status_t::disputed || to == bid_status_t::refunded;
    case bid_status_t::docs_released:
      return to == bid_status_t::docs_confirmed ||
             to == bid_status_t::disputed || to == bid_status_t::refunded;
    case bid_status_t::docs_confirmed:
      return to == bid_status_t::payment_released ||
             to == bid_status_t::disputed;
    case bid_status_t::payment_released:
      return to == bid_status_t::completed;
    case bid_status_t::disputed:
      return to == bid_status_t::refunded ||
             to == bid_status_t::payment_released;
    case bid_status_t::expired:
      return to == bid_status_t::refunded;
    case bid_status_t::completed:
    case bid_status_t::rejected:
    case bid_status_t::cancelled:
    case bid_status_t::refunded:
      return false;
  }
  return false;
}

estate::schema::error_code advance(
    estate::schema::bid_state_t& bid,
    const bid_status_t to,
    const estate::schema::timestamp_nanoseconds_t now) {
  if (!is_legal(bid.status, to)) {
    spdlog::warn("Refusing bid {} transition {} -> {}", bid.id,
                 estate::schema::to_string(bid.status),
                 estate::schema::to_string(to));
    return estate::schema::error_code::invalid_bid_state;
  }
  bid.status = to;
  bid.updated_at = now;
  return estate::schema::error_code::ok;
}

bool is_terminal(const bid_status_t status) {
  switch (status) {
    case bid_status_t::completed:
    case bid_status_t::rejected:
    case bid_status_t::cancelled:
    case bid_status_t::refunded:
      return true;
    default:
      return false;
  }
}

bool is_open(const bid_status_t status) {
  return !is_terminal(status);
}

}  // namespace estate::execution::bid_state_machine
