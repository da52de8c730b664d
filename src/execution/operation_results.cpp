#include <estate/execution/operation_results.hpp>

#include <iterator>

namespace estate::execution {

using namespace estate::schema;

operation_result_t make_error(const error_code code, std::string log) {
  auto result = operation_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.codespace = std::string{codespace_of(code)};
  return result;
}

operation_result_t make_success(const std::optional<entity_id_t> entity_id,
                                std::string info) {
  auto result = operation_result_t{};
  result.code = 0;
  result.info = std::move(info);
  result.entity_id = entity_id;
  return result;
}

state_event_attribute_t make_attribute(std::string key,
                                       std::string value,
                                       const bool index) {
  return state_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

state_event_t make_event(std::string name,
                         std::vector<state_event_attribute_t> attributes) {
  return state_event_t{.name = std::move(name),
                       .attributes = std::move(attributes)};
}

state_event_t make_bid_event(std::string name,
                             const bid_state_t& bid,
                             std::vector<state_event_attribute_t> extra) {
  auto attributes = std::vector<state_event_attribute_t>{
      make_attribute("bid_id", std::to_string(bid.id), true),
      make_attribute("property_id", std::to_string(bid.property_id), true),
      make_attribute("bidder", bid.bidder, true),
      make_attribute("status", std::string{to_string(bid.status)})};
  attributes.insert(std::end(attributes),
                    std::make_move_iterator(std::begin(extra)),
                    std::make_move_iterator(std::end(extra)));
  return make_event(std::move(name), std::move(attributes));
}

state_event_t make_lease_event(std::string name,
                               const lease_state_t& lease,
                               std::vector<state_event_attribute_t> extra) {
  auto attributes = std::vector<state_event_attribute_t>{
      make_attribute("lease_id", std::to_string(lease.id), true),
      make_attribute("property_id", std::to_string(lease.property_id), true),
      make_attribute("tenant", lease.tenant, true)};
  attributes.insert(std::end(attributes),
                    std::make_move_iterator(std::begin(extra)),
                    std::make_move_iterator(std::end(extra)));
  return make_event(std::move(name), std::move(attributes));
}

}  // namespace estate::execution
