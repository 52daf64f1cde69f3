#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <launchpad/blake3/hash.hpp>
#include <launchpad/common/error.hpp>
#include <launchpad/schema/encoding/scale/encoder.hpp>
#include <launchpad/schema/key/builder.hpp>
#include <launchpad/schema/key/keys.hpp>
#include <launchpad/token/token_registry.hpp>

using namespace launchpad::schema;

namespace launchpad::token {

token_registry::token_registry(
    launchpad::execution::authorization_policy& policy,
    launchpad::storage::rocksdb_storage_t& storage)
    : policy_{policy}, storage_{storage} {
  load_persisted_state();
}

address_t token_registry::deploy(const account_id_t& caller,
                                 const token_spec_t& spec,
                                 const account_id_t& owner,
                                 launchpad::execution::journal& tx) {
  policy_.require_or_administrator(
      caller, launchpad::execution::capability_t::deploy_token);
  if (spec.name.empty()) {
    launchpad::common::fail(transaction_error_code::empty_name,
                            "token name must not be empty");
  }
  if (spec.symbol.empty()) {
    launchpad::common::fail(transaction_error_code::empty_symbol,
                            "token symbol must not be empty");
  }
  tx.hold(mutex_);

  auto nonce = nonce_++;
  auto address_builder = key::builder{};
  address_builder.write(std::string_view{"launchpad/token"})
      .write(nonce)
      .write(owner)
      .write(spec.name)
      .write(std::string_view{"|"})
      .write(spec.symbol);
  auto address = launchpad::blake3::hash(make_bytes_view(address_builder.data));
  if (tokens_.contains(address)) {
    launchpad::common::fail(
        transaction_error_code::integration_failure,
        fmt::format("token address {} already deployed", to_hex(address)));
  }

  auto state = token_state_t{
      .address = address, .owner = owner, .spec = spec,
      .minted = spec.total_supply};
  tokens_.emplace(address, state);
  tx.on_rollback([this, address, nonce] {
    tokens_.erase(address);
    nonce_ = nonce;
  });

  tx.put(key::make_token_key(address), state);
  tx.put(key::make_meta_key(key::kTokenNonceKey), nonce_);
  tx.emit("token_deployed", {{"address", to_hex(address)},
                             {"owner", to_hex(owner)},
                             {"name", spec.name},
                             {"symbol", spec.symbol},
                             {"minted", to_string(spec.total_supply)}});
  return address;
}

std::optional<token_state_t> token_registry::get(
    const address_t& address) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = tokens_.find(address);
  if (it == std::end(tokens_)) {
    return std::nullopt;
  }
  return it->second;
}

size_t token_registry::size() const {
  auto lock = std::scoped_lock{mutex_};
  return tokens_.size();
}

void token_registry::load_persisted_state() {
  auto lock = std::scoped_lock{mutex_};
  auto encoder = launchpad::scale_encoder_t{};
  auto nonce_key = key::make_meta_key(key::kTokenNonceKey);
  nonce_ = storage_.get<uint64_t>(encoder, make_bytes_view(nonce_key))
               .value_or(0);
  auto prefix = key::make_prefix(key::kTokenPrefix);
  for (const auto& [row_key, value] :
       storage_.list_by_prefix(make_bytes_view(prefix))) {
    auto state = encoder.decode<token_state_t>(make_bytes_view(value));
    tokens_.emplace(state.address, std::move(state));
  }
  spdlog::debug("Loaded {} token(s); nonce {}", tokens_.size(), nonce_);
}

}  // namespace launchpad::token
