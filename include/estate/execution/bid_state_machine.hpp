#pragma once

#include <estate/schema/bid_state.hpp>
#include <estate/schema/bid_status.hpp>
#include <estate/schema/error_code.hpp>
#include <estate/schema/primitives.hpp>

// Bid lifecycle graph.
//
// Direct accept:   pending -> completed | rejected | cancelled | expired
//                  expired -> refunded
// Escrow:          pending -> accepted -> docs_released -> docs_confirmed
//                  -> payment_released -> completed
//                  accepted | docs_released | docs_confirmed -> disputed
//                  accepted | docs_released -> refunded (timeout)
//                  disputed -> refunded (buyer wins)
//                  disputed -> payment_released (seller wins)
namespace estate::execution::bid_state_machine {

bool is_legal(estate::schema::bid_status_t from, estate::schema::bid_status_t to);

/// Move `bid` along a legal edge and stamp `updated_at`; the bid is left
/// untouched and invalid_bid_state returned for any other edge.
estate::schema::error_code advance(estate::schema::bid_state_t& bid,
                                   estate::schema::bid_status_t to,
                                   estate::schema::timestamp_nanoseconds_t now);

bool is_terminal(estate::schema::bid_status_t status);

/// Statuses in which the engine may still hold funds for the bid.
bool is_open(estate::schema::bid_status_t status);

}  // namespace estate::execution::bid_state_machine
