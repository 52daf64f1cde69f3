#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <launchpad/common/error.hpp>
#include <launchpad/factory/protocol.hpp>
#include <launchpad/factory/token_factory.hpp>
#include <launchpad/schema/encoding/scale/encoder.hpp>
#include <launchpad/schema/key/keys.hpp>
#include <set>

using namespace launchpad::schema;
using launchpad::execution::capability_t;

namespace launchpad::factory {

void validate_creation_request(const std::vector<account_id_t>& signers,
                               const token_spec_t& token) {
  if (signers.size() < 2) {
    launchpad::common::fail(
        transaction_error_code::invalid_signer_count,
        fmt::format("at least 2 signers required, got {}", signers.size()));
  }
  auto unique = std::set<account_id_t>{std::begin(signers), std::end(signers)};
  if (unique.size() != signers.size()) {
    launchpad::common::fail(transaction_error_code::duplicate_signer,
                            "signer list contains duplicates");
  }
  if (token.name.empty()) {
    launchpad::common::fail(transaction_error_code::empty_name,
                            "token name must not be empty");
  }
  if (token.symbol.empty()) {
    launchpad::common::fail(transaction_error_code::empty_symbol,
                            "token symbol must not be empty");
  }
  if (token.total_supply == 0) {
    launchpad::common::fail(transaction_error_code::invalid_supply,
                            "total supply must be positive");
  }
  if (token.supply_capped && token.max_supply < token.total_supply) {
    launchpad::common::fail(
        transaction_error_code::invalid_supply,
        fmt::format("max supply {} is below total supply {}",
                    to_string(token.max_supply),
                    to_string(token.total_supply)));
  }
}

token_factory::token_factory(
    const account_id_t& identity,
    launchpad::execution::authorization_policy& policy,
    launchpad::storage::rocksdb_storage_t& storage,
    launchpad::token::token_deployer& deployer,
    launchpad::liquidity::liquidity_bootstrap& bootstrap)
    : identity_{identity},
      policy_{policy},
      storage_{storage},
      deployer_{deployer},
      bootstrap_{&bootstrap} {
  load_persisted_state();
}

void token_factory::set_coordinator(
    const account_id_t& caller,
    launchpad::coordinator::signature_registry& coordinator) {
  policy_.require(caller, capability_t::administer);
  auto lock = std::unique_lock{binding_mutex_};
  if (coordinator_ != nullptr) {
    policy_.revoke(capability_t::execute_creation, coordinator_->identity());
  }
  policy_.grant(capability_t::execute_creation, coordinator.identity());
  coordinator_ = &coordinator;
  spdlog::info("Factory bound to coordinator {}",
               to_hex(coordinator.identity()));
}

void token_factory::set_liquidity_bootstrap(
    const account_id_t& caller,
    launchpad::liquidity::liquidity_bootstrap& bootstrap) {
  policy_.require(caller, capability_t::administer);
  auto lock = std::unique_lock{binding_mutex_};
  bootstrap_ = &bootstrap;
  spdlog::info("Factory bound to liquidity bootstrap {}",
               to_hex(bootstrap.identity()));
}

request_id_t token_factory::submit_creation_request(
    const std::vector<account_id_t>& signers,
    const account_id_t& requester,
    const token_spec_t& token,
    launchpad::execution::journal& tx) {
  validate_creation_request(signers, token);

  auto* coordinator =
      [this]() -> launchpad::coordinator::signature_registry* {
    auto lock = std::shared_lock{binding_mutex_};
    return coordinator_;
  }();
  if (coordinator == nullptr) {
    launchpad::common::fail(transaction_error_code::coordinator_unbound,
                            "no coordinator is bound to the factory");
  }

  auto id = request_id_t{};
  auto entry = std::shared_ptr<slot>{};
  {
    auto lock = std::unique_lock{table_mutex_};
    id = next_id_++;
    auto& existing = slots_[id];
    if (!existing) {
      existing = std::make_shared<slot>();
    }
    entry = existing;
  }
  tx.hold(entry->mutex);
  tx.on_rollback([this, id, entry] {
    entry->record.reset();
    auto lock = std::unique_lock{table_mutex_};
    // The id was never committed, so handing it out again is not a reuse.
    if (next_id_ == id + 1) {
      next_id_ = id;
    }
  });

  entry->record = creation_request_t{.id = id,
                                     .requester = requester,
                                     .signers = signers,
                                     .status = request_status_t::pending,
                                     .token = token,
                                     .created_token = std::nullopt,
                                     .created_pool = std::nullopt};
  tx.put(key::make_request_key(id), *entry->record);

  coordinator->open_signature_set(identity_, id, requester, signers, tx);

  tx.emit("request_queued", {{"request_id", std::to_string(id)},
                             {"requester", to_hex(requester)},
                             {"signers", std::to_string(signers.size())},
                             {"symbol", token.symbol}});
  return id;
}

request_id_t token_factory::submit_creation_request(
    const std::vector<account_id_t>& signers,
    const account_id_t& requester,
    const token_spec_t& token) {
  auto tx = launchpad::execution::journal{storage_};
  auto id = submit_creation_request(signers, requester, token, tx);
  tx.commit();
  return id;
}

void token_factory::execute_creation(const account_id_t& caller,
                                     const request_id_t request_id,
                                     launchpad::execution::journal& tx) {
  policy_.require_or_administrator(caller, capability_t::execute_creation);

  auto entry = find_slot(request_id);
  if (!entry) {
    launchpad::common::fail(
        transaction_error_code::not_found,
        fmt::format("creation request {} does not exist", request_id));
  }
  tx.hold(entry->mutex);
  if (!entry->record) {
    launchpad::common::fail(
        transaction_error_code::not_found,
        fmt::format("creation request {} does not exist", request_id));
  }
  if (entry->record->status == request_status_t::executed) {
    launchpad::common::fail(
        transaction_error_code::transaction_already_executed,
        fmt::format("creation request {} was already executed", request_id));
  }

  auto* bootstrap = [this] {
    auto lock = std::shared_lock{binding_mutex_};
    return bootstrap_;
  }();

  auto token = address_t{};
  auto pool = pool_id_t{};
  try {
    token = deployer_.deploy(identity_, entry->record->token,
                             entry->record->requester, tx);
    pool = bootstrap->initialize_pool(kReferenceCurrency, token, kPoolFee,
                                      kPoolTickSpacing, kStartingSqrtPriceX96,
                                      tx);
  } catch (const launchpad::common::error&) {
    throw;
  } catch (const std::exception& e) {
    spdlog::warn("Creation request {} failed downstream: {}", request_id,
                 e.what());
    launchpad::common::fail(
        transaction_error_code::integration_failure,
        fmt::format("creation request {} failed: {}", request_id, e.what()));
  }

  auto previous = *entry->record;
  tx.on_rollback([entry, previous] { entry->record = previous; });
  entry->record->status = request_status_t::executed;
  entry->record->created_token = token;
  entry->record->created_pool = pool;
  tx.put(key::make_request_key(request_id), *entry->record);

  tx.emit("memecoin_created", {{"request_id", std::to_string(request_id)},
                               {"token", to_hex(token)},
                               {"pool_id", to_hex(pool)},
                               {"symbol", entry->record->token.symbol}});
}

void token_factory::execute_creation(const account_id_t& caller,
                                     const request_id_t request_id) {
  auto tx = launchpad::execution::journal{storage_};
  execute_creation(caller, request_id, tx);
  tx.commit();
}

creation_request_t token_factory::get_request(
    const request_id_t request_id) const {
  auto record = try_get_request(request_id);
  if (!record) {
    launchpad::common::fail(
        transaction_error_code::not_found,
        fmt::format("creation request {} does not exist", request_id));
  }
  return *record;
}

std::optional<creation_request_t> token_factory::try_get_request(
    const request_id_t request_id) const {
  auto entry = find_slot(request_id);
  if (!entry) {
    return std::nullopt;
  }
  auto lock = std::scoped_lock{entry->mutex};
  return entry->record;
}

size_t token_factory::request_count() const {
  auto lock = std::shared_lock{table_mutex_};
  return next_id_ - 1;
}

std::shared_ptr<token_factory::slot> token_factory::find_slot(
    const request_id_t request_id) const {
  auto lock = std::shared_lock{table_mutex_};
  auto it = slots_.find(request_id);
  if (it == std::end(slots_)) {
    return nullptr;
  }
  return it->second;
}

void token_factory::load_persisted_state() {
  auto lock = std::unique_lock{table_mutex_};
  auto encoder = launchpad::scale_encoder_t{};
  auto prefix = key::make_prefix(key::kRequestPrefix);
  for (const auto& [row_key, value] :
       storage_.list_by_prefix(make_bytes_view(prefix))) {
    auto record = encoder.decode<creation_request_t>(make_bytes_view(value));
    next_id_ = std::max(next_id_, record.id + 1);
    auto entry = std::make_shared<slot>();
    auto id = record.id;
    entry->record = std::move(record);
    slots_.emplace(id, std::move(entry));
  }
  spdlog::debug("Loaded {} creation request(s); next id {}", slots_.size(),
                next_id_);
}

}  // namespace launchpad::factory
