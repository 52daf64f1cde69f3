#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <launchpad/common/error.hpp>
#include <launchpad/execution/engine.hpp>
#include <launchpad/execution/journal.hpp>
#include <launchpad/schema/engine_info.hpp>
#include <launchpad/schema/transaction_error_code.hpp>
#include <algorithm>
#include <variant>

using namespace launchpad::schema;

namespace launchpad::execution {

namespace {

transaction_result_t make_error_result(const transaction_error_code code,
                                       std::string log,
                                       std::string info,
                                       const std::string_view codespace) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

query_result_t make_query_error(const query_error_code code,
                                std::string log,
                                const bytes_view_t& key) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.key = make_bytes(key);
  result.codespace = std::string{kQueryCodespace};
  return result;
}

template <typename T>
query_result_t make_query_value(const std::optional<T>& value,
                                const bytes_view_t& key,
                                const std::string_view what) {
  if (!value) {
    return make_query_error(query_error_code::not_found,
                            fmt::format("{} not found", what), key);
  }
  auto encoder = launchpad::scale_encoder_t{};
  auto result = query_result_t{};
  result.key = make_bytes(key);
  result.value = encoder.encode(*value);
  result.codespace = std::string{kQueryCodespace};
  return result;
}

std::optional<hash32_t> read_hash(const bytes_view_t& data,
                                  const size_t offset) {
  if (data.size() < offset + 32) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::copy_n(std::begin(data) + offset, hash.size(), std::begin(hash));
  return hash;
}

std::optional<transaction_t> decode_transaction(const bytes_view_t& raw_tx) {
  auto encoder = launchpad::scale_encoder_t{};
  return encoder.try_decode<transaction_t>(raw_tx);
}

}  // namespace

engine::engine(launchpad::storage::rocksdb_storage_t& storage,
               launchpad::factory::token_factory& factory,
               launchpad::coordinator::signer_coordinator& coordinator,
               launchpad::attestation::attestation_registry& attestations,
               launchpad::token::token_registry& tokens,
               launchpad::liquidity::pool_manager& pools,
               launchpad::liquidity::vesting_registry& vesting)
    : storage_{storage},
      factory_{factory},
      coordinator_{coordinator},
      attestations_{attestations},
      tokens_{tokens},
      pools_{pools},
      vesting_{vesting} {
  spdlog::info("Execution engine ready with {} request(s), quorum rule {}",
               factory_.request_count(), to_string(coordinator_.rule()));
}

transaction_result_t engine::apply(const bytes_view_t& raw_tx) {
  auto maybe_tx = decode_transaction(raw_tx);
  if (!maybe_tx) {
    ++rejected_;
    return make_error_result(transaction_error_code::invalid_transaction,
                             "invalid transaction", "decode failed",
                             kApplyCodespace);
  }
  if (maybe_tx->version != 1) {
    ++rejected_;
    return make_error_result(
        transaction_error_code::unsupported_transaction_version,
        "unsupported transaction version", "expected version 1",
        kApplyCodespace);
  }

  auto result = transaction_result_t{};
  try {
    auto scope = journal{storage_};
    result.data = execute(*maybe_tx, scope);
    result.events = scope.commit();
  } catch (const launchpad::common::error& e) {
    ++rejected_;
    spdlog::warn("Transaction rejected [{}]: {}", to_string(e.code()),
                 e.what());
    return make_error_result(e.code(), e.what(),
                             std::string{to_string(e.category())},
                             kApplyCodespace);
  }
  ++applied_;
  result.code = 0;
  result.codespace = std::string{kApplyCodespace};
  return result;
}

bytes_t engine::execute(const transaction_t& tx, journal& scope) {
  auto data = bytes_t{};
  std::visit(
      overloaded{
          [&](const submit_creation_request_t& payload) {
            auto id = factory_.submit_creation_request(
                payload.signers, tx.caller, payload.token, scope);
            auto encoder = launchpad::scale_encoder_t{};
            data = encoder.encode(id);
          },
          [&](const sign_request_t& payload) {
            coordinator_.sign(payload.request_id, tx.caller, scope);
          },
          [&](const unsign_request_t& payload) {
            coordinator_.unsign(payload.request_id, tx.caller, scope);
          },
          [&](const retry_execution_t& payload) {
            coordinator_.retry_execution(tx.caller, payload.request_id, scope);
          },
          [&](const add_liquidity_t& payload) {
            pools_.add_liquidity(tx.caller, payload.pool_id, payload.amount,
                                 payload.timestamp, scope);
          }},
      tx.payload);
  return data;
}

transaction_result_t engine::check(const bytes_view_t& raw_tx) const {
  auto maybe_tx = decode_transaction(raw_tx);
  if (!maybe_tx) {
    return make_error_result(transaction_error_code::invalid_transaction,
                             "invalid transaction", "decode failed",
                             kCheckCodespace);
  }
  if (maybe_tx->version != 1) {
    return make_error_result(
        transaction_error_code::unsupported_transaction_version,
        "unsupported transaction version", "expected version 1",
        kCheckCodespace);
  }
  try {
    std::visit(
        overloaded{
            [](const submit_creation_request_t& payload) {
              launchpad::factory::validate_creation_request(payload.signers,
                                                            payload.token);
            },
            [](const sign_request_t& payload) {
              if (payload.request_id == kSentinelRequestId) {
                launchpad::common::fail(transaction_error_code::not_found,
                                        "request id 0 is reserved");
              }
            },
            [](const unsign_request_t& payload) {
              if (payload.request_id == kSentinelRequestId) {
                launchpad::common::fail(transaction_error_code::not_found,
                                        "request id 0 is reserved");
              }
            },
            [](const retry_execution_t& payload) {
              if (payload.request_id == kSentinelRequestId) {
                launchpad::common::fail(transaction_error_code::not_found,
                                        "request id 0 is reserved");
              }
            },
            [](const add_liquidity_t& payload) {
              if (payload.amount == 0) {
                launchpad::common::fail(
                    transaction_error_code::invalid_liquidity,
                    "liquidity amount must be positive");
              }
            }},
        maybe_tx->payload);
  } catch (const launchpad::common::error& e) {
    return make_error_result(e.code(), e.what(),
                             std::string{to_string(e.category())},
                             kCheckCodespace);
  }
  auto result = transaction_result_t{};
  result.codespace = std::string{kCheckCodespace};
  return result;
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) const {
  auto encoder = launchpad::scale_encoder_t{};
  auto read_id = [&]() { return encoder.try_decode<uint64_t>(data); };

  if (path == "/request") {
    auto id = read_id();
    if (!id) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE u64 request id", data);
    }
    return make_query_value(factory_.try_get_request(*id), data, "request");
  }
  if (path == "/signatures") {
    auto id = read_id();
    if (!id) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE u64 request id", data);
    }
    return make_query_value(coordinator_.try_get_signature_set(*id), data,
                            "signature set");
  }
  if (path == "/attestation") {
    auto id = read_id();
    if (!id) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE u64 attestation id", data);
    }
    return make_query_value(attestations_.get(*id), data, "attestation");
  }
  if (path == "/token") {
    auto address = read_hash(data, 0);
    if (!address || data.size() != 32) {
      return make_query_error(query_error_code::invalid_key,
                              "expected 32-byte token address", data);
    }
    return make_query_value(tokens_.get(*address), data, "token");
  }
  if (path == "/pool") {
    auto pool_id = read_hash(data, 0);
    if (!pool_id || data.size() != 32) {
      return make_query_error(query_error_code::invalid_key,
                              "expected 32-byte pool id", data);
    }
    return make_query_value(pools_.get_pool(*pool_id), data, "pool");
  }
  if (path == "/vesting") {
    auto pool_id = read_hash(data, 0);
    auto beneficiary = read_hash(data, 32);
    if (!pool_id || !beneficiary || data.size() != 64) {
      return make_query_error(query_error_code::invalid_key,
                              "expected pool id followed by beneficiary",
                              data);
    }
    return make_query_value(vesting_.get(*pool_id, *beneficiary), data,
                            "vesting grant");
  }
  if (path == "/engine/info") {
    auto info = engine_info_t{
        .request_count = factory_.request_count(),
        .applied_transactions = applied_.load(),
        .rejected_transactions = rejected_.load(),
        .quorum_rule = std::string{to_string(coordinator_.rule())}};
    return make_query_value(std::optional{info}, data, "engine info");
  }
  return make_query_error(query_error_code::unsupported_path,
                          fmt::format("unsupported path {}", path), data);
}

}  // namespace launchpad::execution
