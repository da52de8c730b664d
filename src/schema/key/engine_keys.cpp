#include <estate/schema/key/engine_keys.hpp>

#include <estate/schema/encoding/scale/encoder.hpp>

#include <boost/endian/buffers.hpp>
#include <cstring>
#include <iterator>

namespace estate::schema::key {

namespace {

using key_encoder_t = estate::schema::encoding::scale_encoder_t;

estate::schema::bytes_t big_endian_bytes(const uint64_t value) {
  auto buffer = boost::endian::big_uint64_buf_t{value};
  const auto* begin = buffer.data();
  return estate::schema::bytes_t{begin, begin + sizeof(uint64_t)};
}

}  // namespace

estate::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                          const estate::schema::bytes_t& id) {
  auto key = estate::schema::make_bytes(prefix);
  key.reserve(key.size() + id.size());
  key.insert(std::end(key), std::begin(id), std::end(id));
  return key;
}

estate::schema::bytes_t make_prefix_key(std::string_view prefix) {
  return estate::schema::make_bytes(prefix);
}

estate::schema::bytes_t make_config_key() {
  return estate::schema::make_bytes(kConfigKey);
}

estate::schema::bytes_t make_counters_key() {
  return estate::schema::make_bytes(kCountersKey);
}

estate::schema::bytes_t make_property_key(
    const estate::schema::entity_id_t id) {
  return make_prefixed_key(kPropertyKeyPrefix, big_endian_bytes(id));
}

estate::schema::bytes_t make_bid_key(const estate::schema::entity_id_t id) {
  return make_prefixed_key(kBidKeyPrefix, big_endian_bytes(id));
}

estate::schema::bytes_t make_lease_key(const estate::schema::entity_id_t id) {
  return make_prefixed_key(kLeaseKeyPrefix, big_endian_bytes(id));
}

estate::schema::bytes_t make_balance_key(
    const estate::schema::account_id_t& token) {
  return make_prefixed_key(kBalanceKeyPrefix, key_encoder_t{}.encode(token));
}

estate::schema::bytes_t make_continuation_key(
    const estate::schema::entity_id_t id) {
  return make_prefixed_key(kContinuationKeyPrefix, big_endian_bytes(id));
}

estate::schema::bytes_t make_lock_key(const estate::schema::lock_key_t& lock) {
  return make_prefixed_key(kLockKeyPrefix, key_encoder_t{}.encode(lock));
}

estate::schema::bytes_t make_event_key(const uint64_t sequence) {
  return make_prefixed_key(kEventPrefix, big_endian_bytes(sequence));
}

std::optional<uint64_t> parse_event_key(
    const estate::schema::bytes_view_t& key) {
  if (key.size() != kEventPrefix.size() + sizeof(uint64_t)) {
    return std::nullopt;
  }
  if (std::memcmp(key.data(), kEventPrefix.data(), kEventPrefix.size()) != 0) {
    return std::nullopt;
  }
  auto buffer = boost::endian::big_uint64_buf_t{};
  std::memcpy(buffer.data(), key.data() + kEventPrefix.size(),
              sizeof(uint64_t));
  return buffer.value();
}

}  // namespace estate::schema::key
