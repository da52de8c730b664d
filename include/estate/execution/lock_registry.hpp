#pragma once

#include <estate/schema/lock_key.hpp>
#include <estate/schema/primitives.hpp>
#include <map>
#include <optional>
#include <vector>

namespace estate::execution {

/// Identifies who holds a lock; settlement locks are held by their
/// continuation id, transient locks by 0.
using lock_holder_t = estate::schema::entity_id_t;

inline constexpr auto kTransientLockHolder = lock_holder_t{0};

/// Proof of acquisition. Must be handed back through `release` on every exit
/// path of the callback that completes the guarded operation.
struct lock_token final {
  estate::schema::lock_key_t key;
  lock_holder_t holder{};
};

/// Registry of held reentrancy locks, one holder per key.
class lock_registry final {
 public:
  /// Acquire `key`; nullopt when it is already held.
  std::optional<lock_token> try_acquire(const estate::schema::lock_key_t& key,
                                        lock_holder_t holder);

  /// Acquire every key or none of them.
  std::optional<std::vector<lock_token>> try_acquire_all(
      const std::vector<estate::schema::lock_key_t>& keys,
      lock_holder_t holder);

  /// Release `key`; releasing a free key is a no-op.
  void release(const estate::schema::lock_key_t& key);
  void release(const lock_token& token);

  bool is_held(const estate::schema::lock_key_t& key) const;
  bool any_held(const std::vector<estate::schema::lock_key_t>& keys) const;
  std::optional<lock_holder_t> holder_of(
      const estate::schema::lock_key_t& key) const;

  const std::map<estate::schema::lock_key_t, lock_holder_t>& held() const {
    return held_;
  }

 private:
  std::map<estate::schema::lock_key_t, lock_holder_t> held_;
};

}  // namespace estate::execution
