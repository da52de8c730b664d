#pragma once
#include <estate/schema/lock_kind.hpp>
#include <estate/schema/primitives.hpp>
#include <compare>
#include <string>

// Schema type: lock key.
// Settlement workflow: (operation kind, entity) pair guarded across a
// suspension point.
namespace estate::schema {

template <uint16_t Version>
struct lock_key;

template <>
struct lock_key<1> final {
  uint16_t version{1};
  lock_kind_t kind{lock_kind_t::bid};
  std::string entity;

  auto operator<=>(const lock_key&) const = default;
};

using lock_key_t = lock_key<1>;

inline lock_key_t make_lock_key(const lock_kind_t kind, const entity_id_t id) {
  return lock_key_t{.kind = kind, .entity = std::to_string(id)};
}

inline lock_key_t make_lock_key(const lock_kind_t kind,
                                const std::string& entity) {
  return lock_key_t{.kind = kind, .entity = entity};
}

inline std::string to_string(const lock_key_t& key) {
  auto out = std::string{to_string(key.kind)};
  out.push_back('#');
  out.append(key.entity);
  return out;
}

}  // namespace estate::schema
