#pragma once

#include <estate/execution/engine.hpp>
#include <estate/schema/deposit_message.hpp>
#include <estate/schema/primitives.hpp>
#include <estate/storage/rocksdb/storage.hpp>
#include <estate/testing/common.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace estate::testing {

using storage_t = estate::storage::storage<estate::storage::rocksdb_storage_tag>;

inline estate::schema::engine_config_t make_seed_config() {
  return estate::schema::engine_config_t{
      .owner = std::string{kOwner},
      .admins = {std::string{kAdmin}, std::string{kSecondAdmin}},
      .supported_tokens = {std::string{kToken}, std::string{kOtherToken}},
      .oracle_account = std::string{kOracle}};
}

/// Engine over a throwaway RocksDB directory with recording dispatchers.
/// Transfers stay queued until the test answers them.
class engine_fixture final {
 public:
  explicit engine_fixture(const std::string_view db_prefix)
      : db_path_{make_db_path(db_prefix)} {
    open();
    engine_->set_block_time(days(100));
  }

  engine_fixture(const engine_fixture&) = delete;
  engine_fixture& operator=(const engine_fixture&) = delete;
  engine_fixture(engine_fixture&&) = delete;
  engine_fixture& operator=(engine_fixture&&) = delete;

  ~engine_fixture() {
    engine_.reset();
    storage_.reset();
    remove_path(db_path_);
  }

  estate::execution::engine& engine() { return *engine_; }
  estate::execution::encoder_t& encoder() { return encoder_; }

  /// Drop the engine and storage handles and load everything back from disk.
  void reopen() {
    engine_.reset();
    storage_.reset();
    open();
  }

  void advance(const estate::schema::duration_nanoseconds_t by) {
    engine_->set_block_time(engine_->block_time() + by);
  }

  std::vector<estate::schema::transfer_request_t>& transfers() {
    return transfers_;
  }
  std::vector<estate::schema::oracle_request_t>& oracle_requests() {
    return oracle_requests_;
  }

  estate::schema::entity_id_t list(
      const estate::schema::listing_status_t status,
      const estate::schema::amount_t& price,
      const estate::schema::amount_t& damage_escrow = 0,
      const std::string_view seller = kSeller) {
    auto listing = estate::schema::property_listing_t{
        .status = status,
        .price = price,
        .damage_escrow = damage_escrow,
        .metadata_uri = "ipfs://listing"};
    if (status == estate::schema::listing_status_t::listed_for_lease) {
      listing.lease_duration = days(30);
    }
    auto result = engine_->list_property(std::string{seller}, listing);
    return result.entity_id.value_or(0);
  }

  estate::schema::bytes_t deposit_message(
      const estate::schema::entity_id_t property_id,
      const estate::schema::bid_action_t action,
      const std::string_view token = kToken) {
    return encoder_.encode(estate::schema::deposit_message_t{
        .property_id = property_id,
        .action = action,
        .token_account = std::string{token}});
  }

  estate::schema::deposit_result_t deposit(
      const std::string_view bidder,
      const estate::schema::entity_id_t property_id,
      const estate::schema::amount_t& amount,
      const estate::schema::bid_action_t action =
          estate::schema::bid_action_t::purchase) {
    auto message = deposit_message(property_id, action);
    return engine_->on_deposit(std::string{kToken}, std::string{bidder}, amount,
                               estate::schema::make_bytes_view(message));
  }

  /// Answer the oldest outstanding transfer.
  estate::schema::operation_result_t answer_next(const bool succeeded) {
    auto request = transfers_.front();
    transfers_.erase(std::begin(transfers_));
    return engine_->on_transfer_result(request.continuation_id, succeeded);
  }

  /// Answer every outstanding transfer, including ones issued by answers.
  void answer_all(const bool succeeded) {
    while (!transfers_.empty()) {
      answer_next(succeeded);
    }
  }

 private:
  void open() {
    storage_ = std::make_unique<storage_t>(
        estate::storage::make_storage<estate::storage::rocksdb_storage_tag>(
            db_path_));
    engine_ = std::make_unique<estate::execution::engine>(encoder_, *storage_,
                                                          make_seed_config());
    engine_->set_transfer_dispatcher(
        [this](const estate::schema::transfer_request_t& request) {
          transfers_.push_back(request);
        });
    engine_->set_oracle_dispatcher(
        [this](const estate::schema::oracle_request_t& request) {
          oracle_requests_.push_back(request);
        });
  }

  std::string db_path_;
  estate::execution::encoder_t encoder_;
  std::unique_ptr<storage_t> storage_;
  std::unique_ptr<estate::execution::engine> engine_;
  std::vector<estate::schema::transfer_request_t> transfers_;
  std::vector<estate::schema::oracle_request_t> oracle_requests_;
};

}  // namespace estate::testing
