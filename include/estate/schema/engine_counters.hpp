#pragma once

#include <estate/schema/primitives.hpp>

// Schema type: engine counters.
// Id allocators; persisted with every operation that allocates.
namespace estate::schema {

template <uint16_t Version>
struct engine_counters;

template <>
struct engine_counters<1> final {
  uint16_t version{1};
  entity_id_t next_property_id{1};
  entity_id_t next_bid_id{1};
  entity_id_t next_lease_id{1};
  entity_id_t next_continuation_id{1};
  uint64_t next_oracle_nonce{1};
  uint64_t next_event_sequence{};
  timestamp_nanoseconds_t block_time{};
};

using engine_counters_t = engine_counters<1>;

}  // namespace estate::schema
