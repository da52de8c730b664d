#pragma once

#include <cstdint>
#include <string>

// Schema type: state event attribute.
// Marketplace workflow: key/value pair of a state-change record; `index`
// marks attributes an off-chain indexer should key on.
namespace estate::schema {

template <uint16_t Version>
struct state_event_attribute;

template <>
struct state_event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
  bool index{};
};

using state_event_attribute_t = state_event_attribute<1>;

}  // namespace estate::schema
