#pragma once

#include <estate/schema/primitives.hpp>

// Schema type: balance entry.
// Custody workflow: recorded amount of one externally-custodied token.
namespace estate::schema {

template <uint16_t Version>
struct balance_entry;

template <>
struct balance_entry<1> final {
  uint16_t version{1};
  account_id_t token;
  amount_t amount{};
};

using balance_entry_t = balance_entry<1>;

}  // namespace estate::schema
