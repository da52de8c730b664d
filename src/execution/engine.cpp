#include <spdlog/spdlog.h>
#include <algorithm>
#include <estate/blake3/hash.hpp>
#include <estate/common/critical.hpp>
#include <estate/execution/engine.hpp>
#include <estate/execution/operation_results.hpp>
#include <estate/schema/deposit_message.hpp>
#include <estate/schema/key/engine_keys.hpp>
#include <iterator>
#include <limits>
#include <tuple>
#include <utility>

using namespace estate::schema;

namespace {

using lock_row_t = std::tuple<lock_key_t, uint64_t>;

template <typename T>
std::vector<T> load_rows(estate::execution::storage_t& storage,
                         estate::execution::encoder_t& encoder,
                         const std::string_view prefix) {
  auto rows = std::vector<T>{};
  auto prefix_key = key::make_prefix_key(prefix);
  for (const auto& [row_key, value] :
       storage.list_by_prefix(make_bytes_view(prefix_key))) {
    auto decoded = encoder.template try_decode<T>(make_bytes_view(value));
    if (!decoded) {
      spdlog::error("Undecodable row under '{}'", prefix);
      estate::common::critical("failed to decode persisted engine row");
    }
    rows.push_back(std::move(*decoded));
  }
  return rows;
}

bool contains(const std::vector<account_id_t>& accounts,
              const account_id_t& account) {
  return std::find(std::begin(accounts), std::end(accounts), account) !=
         std::end(accounts);
}

}  // namespace

namespace estate::execution {

engine::engine(encoder_t& encoder, storage_t& storage, engine_config_t seed)
    : encoder_{encoder}, storage_{storage} {
  auto lock = std::scoped_lock{mutex_};
  load_persisted_state(std::move(seed));
  spdlog::info(
      "Settlement engine ready: {} properties, {} bids, {} leases, {} pending "
      "settlements",
      properties_.size(), bids_.all().size(), leases_.all().size(),
      settlement_.pending().size());
}

void engine::load_persisted_state(engine_config_t seed) {
  auto stored_config =
      storage_.get<engine_config_t>(encoder_, make_bytes_view(key::make_config_key()));
  if (stored_config) {
    config_ = std::move(*stored_config);
    spdlog::debug("Loaded persisted configuration owned by '{}'",
                  config_.owner);
  } else {
    config_ = std::move(seed);
    storage_.put(encoder_, make_bytes_view(key::make_config_key()), config_);
    spdlog::info("Seeded configuration owned by '{}'", config_.owner);
  }
  timelocks_.set_config(config_.timelocks);

  auto stored_counters = storage_.get<engine_counters_t>(
      encoder_, make_bytes_view(key::make_counters_key()));
  if (stored_counters) {
    counters_ = *stored_counters;
  }

  for (auto& property :
       load_rows<property_state_t>(storage_, encoder_, key::kPropertyKeyPrefix)) {
    auto id = property.id;
    properties_.insert_or_assign(id, std::move(property));
  }
  for (auto& bid : load_rows<bid_state_t>(storage_, encoder_, key::kBidKeyPrefix)) {
    bids_.insert(std::move(bid));
  }
  for (auto& lease :
       load_rows<lease_state_t>(storage_, encoder_, key::kLeaseKeyPrefix)) {
    if (!leases_.insert(std::move(lease))) {
      estate::common::critical("persisted state holds two active leases");
    }
  }
  for (const auto& entry :
       load_rows<balance_entry_t>(storage_, encoder_, key::kBalanceKeyPrefix)) {
    balances_.restore(entry);
  }
  for (auto& continuation : load_rows<settlement_continuation_t>(
           storage_, encoder_, key::kContinuationKeyPrefix)) {
    settlement_.restore(std::move(continuation));
  }
  for (const auto& [lock_key, holder] :
       load_rows<lock_row_t>(storage_, encoder_, key::kLockKeyPrefix)) {
    if (!locks_.try_acquire(lock_key, holder)) {
      estate::common::critical("persisted state holds a lock twice");
    }
  }
  settlement_.set_next_id(
      std::max(settlement_.next_id(), counters_.next_continuation_id));
  spdlog::debug("Loaded {} held lock(s), block time {}", locks_.held().size(),
                counters_.block_time);
}

void engine::flush(operation_context& ctx) {
  auto batch = estate::storage::write_batch{};
  auto put = [&](bytes_t row_key, const auto& value) {
    batch.puts.emplace_back(std::move(row_key), encoder_.encode(value));
  };

  for (const auto id : ctx.properties) {
    put(key::make_property_key(id), properties_.at(id));
  }
  for (const auto id : ctx.bids) {
    put(key::make_bid_key(id), *bids_.find(id));
  }
  for (const auto id : ctx.leases) {
    put(key::make_lease_key(id), *leases_.find(id));
  }
  for (const auto& token : ctx.balances) {
    put(key::make_balance_key(token),
        balance_entry_t{.token = token, .amount = balances_.balance_of(token)});
  }
  for (const auto id : ctx.continuations) {
    if (const auto* continuation = settlement_.find(id)) {
      put(key::make_continuation_key(id), *continuation);
    } else {
      batch.deletes.push_back(key::make_continuation_key(id));
    }
  }
  for (const auto& lock_key : ctx.locks) {
    if (auto holder = locks_.holder_of(lock_key)) {
      put(key::make_lock_key(lock_key), lock_row_t{lock_key, *holder});
    } else {
      batch.deletes.push_back(key::make_lock_key(lock_key));
    }
  }
  if (ctx.config) {
    put(key::make_config_key(), config_);
  }
  for (const auto& event : ctx.events) {
    put(key::make_event_key(counters_.next_event_sequence++), event);
  }
  if (batch.empty() && !ctx.counters) {
    return;
  }
  counters_.next_continuation_id = settlement_.next_id();
  put(key::make_counters_key(), counters_);
  storage_.apply(batch);
}

void engine::dispatch(const std::vector<transfer_request_t>& transfers,
                      const std::vector<oracle_request_t>& oracles) {
  auto transfer_dispatcher = transfer_dispatcher_t{};
  auto oracle_dispatcher = oracle_dispatcher_t{};
  {
    auto lock = std::scoped_lock{mutex_};
    transfer_dispatcher = transfer_dispatcher_;
    oracle_dispatcher = oracle_dispatcher_;
  }
  for (const auto& request : transfers) {
    if (!transfer_dispatcher) {
      spdlog::warn("No transfer dispatcher; settlement {} awaits its callback",
                   request.continuation_id);
      continue;
    }
    transfer_dispatcher(request);
  }
  for (const auto& request : oracles) {
    if (!oracle_dispatcher) {
      spdlog::warn("No oracle dispatcher; lease {} awaits oracle nonce {}",
                   request.lease_id, request.nonce);
      continue;
    }
    oracle_dispatcher(request);
  }
}

void engine::emit(operation_context& ctx, state_event_t event) {
  spdlog::info("{} {}", event.name, [&] {
    auto rendered = std::string{};
    for (const auto& attribute : event.attributes) {
      if (!rendered.empty()) {
        rendered.push_back(' ');
      }
      rendered.append(attribute.key);
      rendered.push_back('=');
      rendered.append(attribute.value);
    }
    return rendered;
  }());
  ctx.events.push_back(std::move(event));
}

void engine::set_transfer_dispatcher(transfer_dispatcher_t dispatcher) {
  auto lock = std::scoped_lock{mutex_};
  transfer_dispatcher_ = std::move(dispatcher);
}

void engine::set_oracle_dispatcher(oracle_dispatcher_t dispatcher) {
  auto lock = std::scoped_lock{mutex_};
  oracle_dispatcher_ = std::move(dispatcher);
}

operation_result_t engine::set_block_time(const timestamp_nanoseconds_t now) {
  return run("set_block_time", [&](operation_context& ctx) {
    counters_.block_time = now;
    ctx.counters = true;
    return make_success();
  });
}

timestamp_nanoseconds_t engine::block_time() const {
  auto lock = std::scoped_lock{mutex_};
  return counters_.block_time;
}

bool engine::is_owner(const account_id_t& account) const {
  return account == config_.owner;
}

bool engine::is_admin(const account_id_t& account) const {
  return contains(config_.admins, account);
}

bool engine::is_supported_token(const account_id_t& token) const {
  return contains(config_.supported_tokens, token);
}

property_state_t* engine::find_property(const entity_id_t id) {
  auto it = properties_.find(id);
  if (it == std::end(properties_)) {
    return nullptr;
  }
  return &it->second;
}

amount_t engine::seller_amount(const bid_state_t& bid,
                               const property_state_t& property) const {
  if (bid.action == bid_action_t::lease) {
    if (bid.amount <= property.damage_escrow) {
      return amount_t{0};
    }
    return amount_t{bid.amount - property.damage_escrow};
  }
  return bid.amount;
}

std::optional<amount_t> engine::checked_obligations(
    const account_id_t& token) const {
  auto bid_total = bids_.obligations(token);
  auto lease_total = leases_.obligations(token);
  if (!bid_total || !lease_total) {
    return std::nullopt;
  }
  return estate::ledger::checked_add(*bid_total, *lease_total);
}

operation_result_t engine::list_property(const account_id_t& caller,
                                         const property_listing_t& listing) {
  return run("list_property", [&](operation_context& ctx) {
    if (listing.status != listing_status_t::listed_for_sale &&
        listing.status != listing_status_t::listed_for_lease) {
      return make_error(error_code::invalid_listing,
                        "listing must be for sale or for lease");
    }
    if (listing.status == listing_status_t::listed_for_lease &&
        listing.lease_duration.value_or(0) == 0) {
      return make_error(error_code::invalid_listing,
                        "lease listing requires a lease duration");
    }

    auto id = counters_.next_property_id++;
    ctx.counters = true;
    properties_.emplace(
        id, property_state_t{.id = id,
                             .owner = caller,
                             .status = listing.status,
                             .price = listing.price,
                             .lease_duration = listing.lease_duration,
                             .damage_escrow = listing.damage_escrow,
                             .metadata_uri = listing.metadata_uri,
                             .created_at = counters_.block_time});
    ctx.properties.insert(id);
    emit(ctx, make_event("PropertyListed",
                         {make_attribute("property_id", std::to_string(id), true),
                          make_attribute("owner", caller, true),
                          make_attribute("status",
                                         std::string{to_string(listing.status)}),
                          make_attribute("price", to_string(listing.price))}));
    return make_success(id);
  });
}

operation_result_t engine::delist_property(const account_id_t& caller,
                                           const entity_id_t property_id) {
  return run("delist_property", [&](operation_context& ctx) {
    auto* property = find_property(property_id);
    if (property == nullptr) {
      return make_error(error_code::property_missing, "property not found");
    }
    if (caller != property->owner) {
      return make_error(error_code::not_property_owner,
                        "only the property owner may delist");
    }
    if (property->status != listing_status_t::listed_for_sale &&
        property->status != listing_status_t::listed_for_lease) {
      return make_error(error_code::property_not_listed,
                        "property is not listed");
    }
    if (!bids_.open_for_property(property_id).empty()) {
      return make_error(error_code::property_has_open_bids,
                        "property still holds open bids");
    }
    if (locks_.is_held(make_lock_key(lock_kind_t::property, property_id))) {
      return make_error(error_code::reentrancy_violation,
                        "property settlement in flight");
    }

    property->status = listing_status_t::delisted;
    ctx.properties.insert(property_id);
    emit(ctx, make_event("PropertyDelisted",
                         {make_attribute("property_id",
                                         std::to_string(property_id), true),
                          make_attribute("owner", caller, true)}));
    return make_success(property_id);
  });
}

deposit_result_t engine::on_deposit(const account_id_t& token_account,
                                     const account_id_t& sender,
                                     const amount_t& amount,
                                     const bytes_view_t& message) {
  auto result = run("on_deposit", [&](operation_context& ctx) {
    auto decoded = encoder_.try_decode<deposit_message_t>(message);
    if (!decoded || decoded->version != 1) {
      return make_error(error_code::invalid_message,
                        "deposit message does not decode");
    }
    const auto& request = *decoded;
    if (!is_supported_token(token_account)) {
      return make_error(error_code::unsupported_token,
                        "token is not whitelisted");
    }
    if (request.token_account != token_account) {
      return make_error(error_code::token_mismatch,
                        "message token differs from notifying token");
    }
    if (amount == 0) {
      return make_error(error_code::invalid_amount, "deposit amount is zero");
    }
    const auto* property = find_property(request.property_id);
    if (property == nullptr) {
      return make_error(error_code::property_missing, "property not found");
    }
    const auto wanted = request.action == bid_action_t::purchase
                            ? listing_status_t::listed_for_sale
                            : listing_status_t::listed_for_lease;
    if (property->status != wanted) {
      return make_error(error_code::property_not_listed,
                        "property is not listed for this action");
    }
    if (property->accepted_bid_id) {
      return make_error(error_code::property_under_contract,
                        "property is under contract");
    }
    if (request.action == bid_action_t::lease &&
        amount < property->damage_escrow) {
      return make_error(error_code::invalid_amount,
                        "lease deposit does not cover the damage escrow");
    }
    if (!balances_.can_credit(token_account, amount)) {
      return make_error(error_code::arithmetic_overflow,
                        "deposit overflows token balance");
    }

    auto channel = make_lock_key(lock_kind_t::deposit, token_account);
    auto token = locks_.try_acquire(channel, kTransientLockHolder);
    if (!token) {
      return make_error(error_code::reentrancy_violation,
                        "deposit channel busy");
    }

    const auto now = counters_.block_time;
    const auto id = counters_.next_bid_id++;
    ctx.counters = true;
    bids_.insert(bid_state_t{.id = id,
                             .property_id = request.property_id,
                             .bidder = sender,
                             .token = token_account,
                             .amount = amount,
                             .action = request.action,
                             .status = bid_status_t::pending,
                             .created_at = now,
                             .updated_at = now,
                             .expires_at = timelocks_.bid_expires_at(now)});
    ctx.bids.insert(id);
    balances_.credit(token_account, amount);
    ctx.balances.insert(token_account);
    locks_.release(*token);

    emit(ctx, make_event("BidPlaced",
                         {make_attribute("bid_id", std::to_string(id), true),
                          make_attribute("property_id",
                                         std::to_string(request.property_id),
                                         true),
                          make_attribute("bidder", sender, true),
                          make_attribute("token", token_account),
                          make_attribute("amount", to_string(amount)),
                          make_attribute("action",
                                         std::string{to_string(request.action)})}));
    return make_success(id);
  });

  auto deposit = deposit_result_t{};
  deposit.unused_amount = result.ok() ? amount_t{0} : amount;
  deposit.result = std::move(result);
  return deposit;
}

operation_result_t engine::set_timelock_config(
    const account_id_t& caller,
    const timelock_config_t& config) {
  return run("set_timelock_config", [&](operation_context& ctx) {
    if (!is_owner(caller)) {
      return make_error(error_code::not_contract_owner,
                        "only the owner may change timelocks");
    }
    config_.timelocks = config;
    config_.timelocks.version = 1;
    timelocks_.set_config(config_.timelocks);
    ctx.config = true;
    emit(ctx,
         make_event("TimelockConfigUpdated",
                    {make_attribute("bid_expiry",
                                    std::to_string(config.bid_expiry)),
                     make_attribute("escrow_release_delay",
                                    std::to_string(config.escrow_release_delay)),
                     make_attribute("lost_bid_claim_delay",
                                    std::to_string(config.lost_bid_claim_delay))}));
    return make_success();
  });
}

operation_result_t engine::set_oracle_account(
    const account_id_t& caller,
    const std::optional<account_id_t>& oracle) {
  return run("set_oracle_account", [&](operation_context& ctx) {
    if (!is_owner(caller)) {
      return make_error(error_code::not_contract_owner,
                        "only the owner may set the oracle");
    }
    config_.oracle_account = oracle;
    ctx.config = true;
    emit(ctx, make_event("OracleAccountUpdated",
                         {make_attribute("oracle", oracle.value_or(""))}));
    return make_success();
  });
}

operation_result_t engine::add_admin(const account_id_t& caller,
                                     const account_id_t& admin) {
  return run("add_admin", [&](operation_context& ctx) {
    if (!is_owner(caller)) {
      return make_error(error_code::not_contract_owner,
                        "only the owner may add admins");
    }
    if (is_admin(admin)) {
      return make_success(std::nullopt, "already an admin");
    }
    config_.admins.push_back(admin);
    ctx.config = true;
    emit(ctx, make_event("AdminAdded", {make_attribute("admin", admin, true)}));
    return make_success();
  });
}

operation_result_t engine::remove_admin(const account_id_t& caller,
                                        const account_id_t& admin) {
  return run("remove_admin", [&](operation_context& ctx) {
    if (!is_owner(caller)) {
      return make_error(error_code::not_contract_owner,
                        "only the owner may remove admins");
    }
    if (!is_admin(admin)) {
      return make_success(std::nullopt, "not an admin");
    }
    std::erase(config_.admins, admin);
    ctx.config = true;
    emit(ctx,
         make_event("AdminRemoved", {make_attribute("admin", admin, true)}));
    return make_success();
  });
}

operation_result_t engine::add_supported_token(const account_id_t& caller,
                                               const account_id_t& token) {
  return run("add_supported_token", [&](operation_context& ctx) {
    if (!is_owner(caller)) {
      return make_error(error_code::not_contract_owner,
                        "only the owner may whitelist tokens");
    }
    if (is_supported_token(token)) {
      return make_success(std::nullopt, "already whitelisted");
    }
    config_.supported_tokens.push_back(token);
    ctx.config = true;
    emit(ctx, make_event("TokenWhitelisted",
                         {make_attribute("token", token, true)}));
    return make_success();
  });
}

operation_result_t engine::remove_supported_token(const account_id_t& caller,
                                                  const account_id_t& token) {
  return run("remove_supported_token", [&](operation_context& ctx) {
    if (!is_owner(caller)) {
      return make_error(error_code::not_contract_owner,
                        "only the owner may remove tokens");
    }
    if (!is_supported_token(token)) {
      return make_error(error_code::unsupported_token,
                        "token is not whitelisted");
    }
    if (balances_.balance_of(token) != 0) {
      return make_error(error_code::token_has_balance,
                        "token still has a custodied balance");
    }
    std::erase(config_.supported_tokens, token);
    ctx.config = true;
    emit(ctx,
         make_event("TokenRemoved", {make_attribute("token", token, true)}));
    return make_success();
  });
}

operation_result_t engine::withdraw_surplus(const account_id_t& caller,
                                            const account_id_t& token,
                                            const amount_t& amount,
                                            const account_id_t& recipient) {
  return run("withdraw_surplus", [&](operation_context& ctx) {
    if (!is_owner(caller)) {
      return make_error(error_code::not_contract_owner,
                        "only the owner may withdraw surplus");
    }
    if (amount == 0) {
      return make_error(error_code::invalid_amount, "withdrawal is zero");
    }
    auto obligations = checked_obligations(token);
    if (!obligations) {
      return make_error(error_code::arithmetic_overflow,
                        "obligations overflow");
    }
    auto surplus =
        estate::ledger::checked_sub(balances_.balance_of(token), *obligations);
    if (!surplus || amount > *surplus) {
      return make_error(error_code::insufficient_surplus,
                        "withdrawal exceeds unobligated balance");
    }
    auto locks = std::vector<lock_key_t>{make_lock_key(lock_kind_t::token, token)};
    auto code = settlement_.can_begin(locks, token, amount);
    if (code != error_code::ok) {
      return make_error(code, "surplus withdrawal cannot start");
    }
    code = issue_settlement(
        ctx, settlement_continuation_t{.kind = settlement_kind_t::withdraw_surplus,
                                       .token = token,
                                       .recipient = recipient,
                                       .amount = amount,
                                       .locks = std::move(locks),
                                       .initiated_by = caller});
    if (code != error_code::ok) {
      return make_error(code, "surplus withdrawal cannot start");
    }
    return make_success();
  });
}

std::optional<property_state_t> engine::property(const entity_id_t id) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = properties_.find(id);
  if (it == std::end(properties_)) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<bid_state_t> engine::bid(const entity_id_t id) const {
  auto lock = std::scoped_lock{mutex_};
  const auto* found = bids_.find(id);
  if (found == nullptr) {
    return std::nullopt;
  }
  return *found;
}

std::optional<lease_state_t> engine::lease(const entity_id_t id) const {
  auto lock = std::scoped_lock{mutex_};
  const auto* found = leases_.find(id);
  if (found == nullptr) {
    return std::nullopt;
  }
  return *found;
}

std::vector<bid_state_t> engine::bids_for_property(
    const entity_id_t property_id) const {
  auto lock = std::scoped_lock{mutex_};
  return bids_.for_property(property_id);
}

std::vector<bid_state_t> engine::open_bids_for_property(
    const entity_id_t property_id) const {
  auto lock = std::scoped_lock{mutex_};
  return bids_.open_for_property(property_id);
}

std::vector<bid_state_t> engine::bids_for_bidder(
    const account_id_t& bidder) const {
  auto lock = std::scoped_lock{mutex_};
  return bids_.for_bidder(bidder);
}

std::vector<lease_state_t> engine::leases_for_tenant(
    const account_id_t& tenant) const {
  auto lock = std::scoped_lock{mutex_};
  return leases_.for_tenant(tenant);
}

amount_t engine::balance_of(const account_id_t& token) const {
  auto lock = std::scoped_lock{mutex_};
  return balances_.balance_of(token);
}

amount_t engine::obligations_of(const account_id_t& token) const {
  auto lock = std::scoped_lock{mutex_};
  auto total = checked_obligations(token);
  if (!total) {
    spdlog::error("Obligations for '{}' overflow", token);
    return std::numeric_limits<amount_t>::max();
  }
  return *total;
}

std::vector<balance_entry_t> engine::balances() const {
  auto lock = std::scoped_lock{mutex_};
  return balances_.entries();
}

timelock_config_t engine::timelock_config() const {
  auto lock = std::scoped_lock{mutex_};
  return timelocks_.config();
}

engine_config_t engine::config() const {
  auto lock = std::scoped_lock{mutex_};
  return config_;
}

std::vector<std::pair<lock_key_t, lock_holder_t>> engine::held_locks() const {
  auto lock = std::scoped_lock{mutex_};
  return {std::begin(locks_.held()), std::end(locks_.held())};
}

std::vector<settlement_continuation_t> engine::pending_settlements() const {
  auto lock = std::scoped_lock{mutex_};
  return settlement_.pending();
}

std::vector<std::pair<uint64_t, state_event_t>> engine::events(
    const uint64_t from,
    const uint64_t to) const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<std::pair<uint64_t, state_event_t>>{};
  auto prefix = key::make_prefix_key(key::kEventPrefix);
  for (const auto& [row_key, value] :
       storage_.list_by_prefix(make_bytes_view(prefix))) {
    auto sequence = key::parse_event_key(make_bytes_view(row_key));
    if (!sequence || *sequence < from) {
      continue;
    }
    if (*sequence >= to) {
      break;
    }
    out.emplace_back(*sequence,
                     encoder_.decode<state_event_t>(make_bytes_view(value)));
  }
  return out;
}

hash32_t engine::state_root() const {
  auto lock = std::scoped_lock{mutex_};
  auto hasher = estate::blake3::hasher{};
  auto prefix = key::make_prefix_key(key::kStatePrefix);
  for (const auto& [row_key, value] :
       storage_.list_by_prefix(make_bytes_view(prefix))) {
    auto framed = encoder_.encode(std::tuple{row_key, value});
    hasher.update(make_bytes_view(framed));
  }
  return hasher.finalize();
}

}  // namespace estate::execution
