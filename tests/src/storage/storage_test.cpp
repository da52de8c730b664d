#include <estate/schema/balance_entry.hpp>
#include <estate/schema/encoding/scale/encoder.hpp>
#include <estate/storage/rocksdb/storage.hpp>
#include <estate/storage/storage.hpp>
#include <estate/testing/common.hpp>
#include <gtest/gtest.h>

#include <string>

namespace {

using storage_t = estate::storage::storage<estate::storage::rocksdb_storage_tag>;
using encoder_t = estate::schema::encoding::scale_encoder_t;
using estate::schema::make_bytes;
using estate::schema::make_bytes_view;

}  // namespace

TEST(storage, write_batch_defaults_empty) {
  auto batch = estate::storage::write_batch{};
  EXPECT_TRUE(batch.empty());
  batch.deletes.push_back(make_bytes(std::string{"k"}));
  EXPECT_FALSE(batch.empty());

  auto entry = estate::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());
}

TEST(storage, typed_put_and_get_round_trip) {
  auto db = estate::testing::make_db_path("estate_storage_typed");
  {
    auto storage =
        estate::storage::make_storage<estate::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto key = make_bytes(std::string{"SYS|STATE|BALANCE|usdc"});
    auto entry =
        estate::schema::balance_entry_t{.token = "usdc.token", .amount = 1234};
    storage.put(encoder, make_bytes_view(key), entry);

    auto loaded = storage.get<estate::schema::balance_entry_t>(
        encoder, make_bytes_view(key));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->token, "usdc.token");
    EXPECT_EQ(loaded->amount, 1234);

    auto missing = make_bytes(std::string{"SYS|STATE|BALANCE|dai"});
    EXPECT_FALSE(storage
                     .get<estate::schema::balance_entry_t>(
                         encoder, make_bytes_view(missing))
                     .has_value());

    auto batch = estate::storage::write_batch{};
    batch.deletes.push_back(key);
    storage.apply(batch);
    EXPECT_FALSE(storage
                     .get<estate::schema::balance_entry_t>(
                         encoder, make_bytes_view(key))
                     .has_value());
  }
  estate::testing::remove_path(db);
}

TEST(storage, list_by_prefix_is_ordered_and_bounded) {
  auto db = estate::testing::make_db_path("estate_storage_prefix");
  {
    auto storage =
        estate::storage::make_storage<estate::storage::rocksdb_storage_tag>(db);
    auto batch = estate::storage::write_batch{};
    batch.puts.emplace_back(make_bytes(std::string{"A|2"}),
                            make_bytes(std::string{"two"}));
    batch.puts.emplace_back(make_bytes(std::string{"A|1"}),
                            make_bytes(std::string{"one"}));
    batch.puts.emplace_back(make_bytes(std::string{"B|1"}),
                            make_bytes(std::string{"other"}));
    storage.apply(batch);

    auto rows = storage.list_by_prefix(
        make_bytes_view(make_bytes(std::string{"A|"})));
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(estate::schema::make_string(rows[0].first), "A|1");
    EXPECT_EQ(estate::schema::make_string(rows[0].second), "one");
    EXPECT_EQ(estate::schema::make_string(rows[1].first), "A|2");
  }
  estate::testing::remove_path(db);
}

TEST(storage, apply_commits_puts_and_deletes_together) {
  auto db = estate::testing::make_db_path("estate_storage_batch");
  {
    auto storage =
        estate::storage::make_storage<estate::storage::rocksdb_storage_tag>(db);
    auto first = estate::storage::write_batch{};
    first.puts.emplace_back(make_bytes(std::string{"K|old"}),
                            make_bytes(std::string{"x"}));
    storage.apply(first);

    auto second = estate::storage::write_batch{};
    second.deletes.push_back(make_bytes(std::string{"K|old"}));
    second.puts.emplace_back(make_bytes(std::string{"K|new"}),
                             make_bytes(std::string{"y"}));
    storage.apply(second);
    storage.apply(estate::storage::write_batch{});

    auto rows =
        storage.list_by_prefix(make_bytes_view(make_bytes(std::string{"K|"})));
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(estate::schema::make_string(rows[0].first), "K|new");
  }
  estate::testing::remove_path(db);
}

TEST(storage, data_survives_reopen) {
  auto db = estate::testing::make_db_path("estate_storage_reopen");
  auto key = make_bytes(std::string{"SYS|STATE|BALANCE|usdc"});
  auto encoder = encoder_t{};
  {
    auto storage =
        estate::storage::make_storage<estate::storage::rocksdb_storage_tag>(db);
    storage.put(encoder, make_bytes_view(key),
                estate::schema::balance_entry_t{.token = "usdc.token",
                                                .amount = 77});
  }
  {
    auto storage =
        estate::storage::make_storage<estate::storage::rocksdb_storage_tag>(db);
    auto loaded = storage.get<estate::schema::balance_entry_t>(
        encoder, make_bytes_view(key));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->amount, 77);
  }
  estate::testing::remove_path(db);
}
