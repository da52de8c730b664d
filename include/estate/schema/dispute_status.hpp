#pragma once

#include <estate/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: dispute status.
// Marketplace workflow: lease dispute progression.
namespace estate::schema {

enum class dispute_status_t : uint8_t {
  none = 0,
  raised = 1,
  pending_tenant_response = 2,
  resolved = 3
};

inline constexpr auto kDisputeStatusMappings = std::array{
    std::pair<std::string_view, dispute_status_t>{"none", dispute_status_t::none},
    std::pair<std::string_view, dispute_status_t>{"raised", dispute_status_t::raised},
    std::pair<std::string_view, dispute_status_t>{"pending_tenant_response", dispute_status_t::pending_tenant_response},
    std::pair<std::string_view, dispute_status_t>{"resolved", dispute_status_t::resolved}};

template <>
inline std::optional<dispute_status_t> try_from_string<dispute_status_t>(
    const std::string_view value) {
  return from_string(value, kDisputeStatusMappings);
}

inline constexpr std::string_view to_string(const dispute_status_t value) {
  return to_string(value, kDisputeStatusMappings);
}

}  // namespace estate::schema
