#pragma once

#include <estate/schema/state_event_attribute.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: state event.
// Marketplace workflow: append-only state-change record consumed by external
// indexers. New attributes may be added; existing ones never change meaning.
namespace estate::schema {

template <uint16_t Version>
struct state_event;

template <>
struct state_event<1> final {
  uint16_t version{1};
  std::string name;
  std::vector<state_event_attribute_t> attributes;
};

using state_event_t = state_event<1>;

}  // namespace estate::schema
