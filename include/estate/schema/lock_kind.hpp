#pragma once

#include <estate/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: lock kind.
// Settlement workflow: operation family a reentrancy lock is keyed under.
namespace estate::schema {

enum class lock_kind_t : uint8_t {
  deposit = 0,
  bid = 1,
  property = 2,
  lease = 3,
  token = 4
};

inline constexpr auto kLockKindMappings = std::array{
    std::pair<std::string_view, lock_kind_t>{"deposit", lock_kind_t::deposit},
    std::pair<std::string_view, lock_kind_t>{"bid", lock_kind_t::bid},
    std::pair<std::string_view, lock_kind_t>{"property", lock_kind_t::property},
    std::pair<std::string_view, lock_kind_t>{"lease", lock_kind_t::lease},
    std::pair<std::string_view, lock_kind_t>{"token", lock_kind_t::token}};

template <>
inline std::optional<lock_kind_t> try_from_string<lock_kind_t>(
    const std::string_view value) {
  return from_string(value, kLockKindMappings);
}

inline constexpr std::string_view to_string(const lock_kind_t value) {
  return to_string(value, kLockKindMappings);
}

}  // namespace estate::schema
