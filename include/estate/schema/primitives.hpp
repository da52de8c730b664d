#pragma once
#include <array>
#include <boost/endian/buffers.hpp>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace estate::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
// Account names on the custody rail, e.g. "alice.near" or "usdc.token".
using account_id_t = std::string;
using amount_t = boost::multiprecision::uint128_t;
using timestamp_nanoseconds_t = uint64_t;
using duration_nanoseconds_t = uint64_t;
using entity_id_t = uint64_t;

inline constexpr auto kNanosecondsPerSecond = duration_nanoseconds_t{1'000'000'000};
inline constexpr auto kNanosecondsPerDay =
    duration_nanoseconds_t{24 * 60 * 60} * kNanosecondsPerSecond;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

/// Decimal rendering of an amount, used in logs and event attributes.
std::string to_string(const amount_t& amount);
/// Parse a non-negative decimal amount; nullopt on garbage or > 2^128 - 1.
std::optional<amount_t> try_parse_amount(std::string_view text);

}  // namespace estate::schema
