#pragma once

#include <estate/schema/error_code.hpp>
#include <estate/schema/primitives.hpp>
#include <estate/schema/state_event.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace estate::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  std::optional<entity_id_t> entity_id;
  std::vector<entity_id_t> continuation_ids;
  std::vector<state_event_t> events;

  bool ok() const { return code == 0; }
  error_code error() const { return static_cast<error_code>(code); }
};

using operation_result_t = operation_result<1>;

template <uint16_t Version>
struct deposit_result;

template <>
struct deposit_result<1> final {
  uint16_t version{1};
  operation_result_t result;
  /// Part of the deposit handed back to the sender; 0 means fully accepted.
  amount_t unused_amount{};
};

using deposit_result_t = deposit_result<1>;

}  // namespace estate::schema
