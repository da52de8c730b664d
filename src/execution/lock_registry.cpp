#include <estate/execution/lock_registry.hpp>

#include <spdlog/spdlog.h>

namespace estate::execution {

std::optional<lock_token> lock_registry::try_acquire(
    const estate::schema::lock_key_t& key,
    const lock_holder_t holder) {
  auto [it, inserted] = held_.try_emplace(key, holder);
  if (!inserted) {
    spdlog::debug("Lock '{}' already held by {}", estate::schema::to_string(key),
                  it->second);
    return std::nullopt;
  }
  return lock_token{.key = key, .holder = holder};
}

std::optional<std::vector<lock_token>> lock_registry::try_acquire_all(
    const std::vector<estate::schema::lock_key_t>& keys,
    const lock_holder_t holder) {
  if (any_held(keys)) {
    return std::nullopt;
  }
  auto tokens = std::vector<lock_token>{};
  tokens.reserve(keys.size());
  for (const auto& key : keys) {
    auto token = try_acquire(key, holder);
    if (!token) {
      // Duplicate key inside `keys`.
      for (const auto& acquired : tokens) {
        release(acquired);
      }
      return std::nullopt;
    }
    tokens.push_back(std::move(*token));
  }
  return tokens;
}

void lock_registry::release(const estate::schema::lock_key_t& key) {
  held_.erase(key);
}

void lock_registry::release(const lock_token& token) {
  release(token.key);
}

bool lock_registry::is_held(const estate::schema::lock_key_t& key) const {
  return held_.contains(key);
}

bool lock_registry::any_held(
    const std::vector<estate::schema::lock_key_t>& keys) const {
  for (const auto& key : keys) {
    if (is_held(key)) {
      return true;
    }
  }
  return false;
}

std::optional<lock_holder_t> lock_registry::holder_of(
    const estate::schema::lock_key_t& key) const {
  auto it = held_.find(key);
  if (it == std::end(held_)) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace estate::execution
