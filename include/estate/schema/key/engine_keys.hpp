#pragma once

#include <estate/schema/lock_key.hpp>
#include <estate/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema key type: engine keys.
// Marketplace workflow: canonical key prefixes and key codecs for engine
// state and the event log. Entity ids and event sequences are big-endian so
// prefix scans return rows in allocation order.
namespace estate::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kConfigKey{"SYS|STATE|CONFIG"};
inline constexpr std::string_view kCountersKey{"SYS|STATE|COUNTERS"};
inline constexpr std::string_view kPropertyKeyPrefix{"SYS|STATE|PROPERTY|"};
inline constexpr std::string_view kBidKeyPrefix{"SYS|STATE|BID|"};
inline constexpr std::string_view kLeaseKeyPrefix{"SYS|STATE|LEASE|"};
inline constexpr std::string_view kBalanceKeyPrefix{"SYS|STATE|BALANCE|"};
inline constexpr std::string_view kContinuationKeyPrefix{
    "SYS|STATE|CONTINUATION|"};
inline constexpr std::string_view kLockKeyPrefix{"SYS|STATE|LOCK|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

inline constexpr std::array<std::string_view, 10> kEngineKeyspaces{
    kStatePrefix,       kConfigKey,          kCountersKey,
    kPropertyKeyPrefix, kBidKeyPrefix,       kLeaseKeyPrefix,
    kBalanceKeyPrefix,  kContinuationKeyPrefix, kLockKeyPrefix,
    kEventPrefix};

estate::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                          const estate::schema::bytes_t& id);
estate::schema::bytes_t make_prefix_key(std::string_view prefix);

estate::schema::bytes_t make_config_key();
estate::schema::bytes_t make_counters_key();
estate::schema::bytes_t make_property_key(estate::schema::entity_id_t id);
estate::schema::bytes_t make_bid_key(estate::schema::entity_id_t id);
estate::schema::bytes_t make_lease_key(estate::schema::entity_id_t id);
estate::schema::bytes_t make_balance_key(
    const estate::schema::account_id_t& token);
estate::schema::bytes_t make_continuation_key(estate::schema::entity_id_t id);
estate::schema::bytes_t make_lock_key(const estate::schema::lock_key_t& lock);
estate::schema::bytes_t make_event_key(uint64_t sequence);

/// Recover the sequence number from an event key; nullopt on foreign keys.
std::optional<uint64_t> parse_event_key(
    const estate::schema::bytes_view_t& key);

}  // namespace estate::schema::key
