#pragma once
#include <estate/schema/primitives.hpp>
#include <estate/schema/timelock_config.hpp>
#include <optional>
#include <vector>

// Schema type: engine config.
// Marketplace workflow: role roster, token whitelist, timelocks and oracle.
// Seeds a fresh database; the persisted copy wins afterwards.
namespace estate::schema {

template <uint16_t Version>
struct engine_config;

template <>
struct engine_config<1> final {
  uint16_t version{1};
  account_id_t owner;
  std::vector<account_id_t> admins;
  std::vector<account_id_t> supported_tokens;
  timelock_config_t timelocks{};
  std::optional<account_id_t> oracle_account;
};

using engine_config_t = engine_config<1>;

}  // namespace estate::schema
