#pragma once

#include <estate/schema/bid_state.hpp>
#include <estate/schema/error_code.hpp>
#include <estate/schema/lease_state.hpp>
#include <estate/schema/operation_result.hpp>
#include <estate/schema/primitives.hpp>
#include <estate/schema/state_event.hpp>
#include <optional>
#include <string>
#include <vector>

namespace estate::execution {

estate::schema::operation_result_t make_error(estate::schema::error_code code,
                                              std::string log);

estate::schema::operation_result_t make_success(
    std::optional<estate::schema::entity_id_t> entity_id = std::nullopt,
    std::string info = {});

estate::schema::state_event_attribute_t make_attribute(std::string key,
                                                       std::string value,
                                                       bool index = false);

estate::schema::state_event_t make_event(
    std::string name,
    std::vector<estate::schema::state_event_attribute_t> attributes);

/// Record keyed by bid id, property id and bidder, followed by `extra`.
estate::schema::state_event_t make_bid_event(
    std::string name,
    const estate::schema::bid_state_t& bid,
    std::vector<estate::schema::state_event_attribute_t> extra = {});

/// Record keyed by lease id, property id and tenant, followed by `extra`.
estate::schema::state_event_t make_lease_event(
    std::string name,
    const estate::schema::lease_state_t& lease,
    std::vector<estate::schema::state_event_attribute_t> extra = {});

}  // namespace estate::execution
