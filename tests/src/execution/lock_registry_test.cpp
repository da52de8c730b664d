#include <estate/execution/lock_registry.hpp>
#include <gtest/gtest.h>

using estate::schema::lock_kind_t;
using estate::schema::make_lock_key;

TEST(lock_registry, second_acquire_of_same_key_fails) {
  auto registry = estate::execution::lock_registry{};
  auto bid = make_lock_key(lock_kind_t::bid, 7);
  auto first = registry.try_acquire(bid, 1);
  ASSERT_TRUE(first.has_value());
  EXPECT_FALSE(registry.try_acquire(bid, 2).has_value());
  EXPECT_EQ(*registry.holder_of(bid), 1u);

  registry.release(*first);
  EXPECT_FALSE(registry.is_held(bid));
  EXPECT_TRUE(registry.try_acquire(bid, 2).has_value());
}

TEST(lock_registry, kinds_do_not_collide) {
  auto registry = estate::execution::lock_registry{};
  EXPECT_TRUE(registry.try_acquire(make_lock_key(lock_kind_t::bid, 7), 1));
  EXPECT_TRUE(registry.try_acquire(make_lock_key(lock_kind_t::lease, 7), 1));
  EXPECT_TRUE(registry.try_acquire(make_lock_key(lock_kind_t::property, 7), 1));
  EXPECT_EQ(registry.held().size(), 3u);
}

TEST(lock_registry, acquire_all_is_all_or_nothing) {
  auto registry = estate::execution::lock_registry{};
  auto property = make_lock_key(lock_kind_t::property, 3);
  ASSERT_TRUE(registry.try_acquire(property, 9));

  auto keys = std::vector{make_lock_key(lock_kind_t::bid, 1), property};
  EXPECT_FALSE(registry.try_acquire_all(keys, 10).has_value());
  EXPECT_FALSE(registry.is_held(keys[0]));
  EXPECT_EQ(*registry.holder_of(property), 9u);

  registry.release(property);
  auto tokens = registry.try_acquire_all(keys, 10);
  ASSERT_TRUE(tokens.has_value());
  EXPECT_EQ(tokens->size(), 2u);
  EXPECT_TRUE(registry.any_held(keys));
}

TEST(lock_registry, duplicate_keys_in_one_request_acquire_nothing) {
  auto registry = estate::execution::lock_registry{};
  auto bid = make_lock_key(lock_kind_t::bid, 1);
  EXPECT_FALSE(registry.try_acquire_all({bid, bid}, 4).has_value());
  EXPECT_TRUE(registry.held().empty());
}

TEST(lock_registry, release_is_idempotent) {
  auto registry = estate::execution::lock_registry{};
  auto key = make_lock_key(lock_kind_t::token, std::string{"usdc.token"});
  registry.release(key);
  ASSERT_TRUE(registry.try_acquire(key, estate::execution::kTransientLockHolder));
  registry.release(key);
  registry.release(key);
  EXPECT_FALSE(registry.is_held(key));
  EXPECT_FALSE(registry.holder_of(key).has_value());
}
