#pragma once

#include <launchpad/attestation/attestation_registry.hpp>
#include <launchpad/coordinator/signer_coordinator.hpp>
#include <launchpad/factory/token_factory.hpp>
#include <launchpad/liquidity/pool_manager.hpp>
#include <launchpad/liquidity/vesting_registry.hpp>
#include <launchpad/schema/encoding/scale/encoder.hpp>
#include <launchpad/schema/primitives.hpp>
#include <launchpad/schema/query_result.hpp>
#include <launchpad/schema/transaction.hpp>
#include <launchpad/schema/transaction_result.hpp>
#include <launchpad/storage/rocksdb/storage.hpp>
#include <launchpad/token/token_registry.hpp>

#include <atomic>
#include <cstdint>
#include <string_view>

namespace launchpad::execution {

inline constexpr auto kApplyCodespace = std::string_view{"launchpad.apply"};
inline constexpr auto kCheckCodespace = std::string_view{"launchpad.check"};
inline constexpr auto kQueryCodespace = std::string_view{"launchpad.query"};

/// Transaction entry point of the launch workflow.
///
/// The host execution layer serializes calls and authenticates the `caller`
/// of each transaction. Every applied transaction runs in its own journal:
/// it either commits all of its effects and events or none of them.
class engine final {
 public:
  engine(launchpad::storage::rocksdb_storage_t& storage,
         launchpad::factory::token_factory& factory,
         launchpad::coordinator::signer_coordinator& coordinator,
         launchpad::attestation::attestation_registry& attestations,
         launchpad::token::token_registry& tokens,
         launchpad::liquidity::pool_manager& pools,
         launchpad::liquidity::vesting_registry& vesting);

  /// Decode and execute one transaction.
  launchpad::schema::transaction_result_t apply(
      const launchpad::schema::bytes_view_t& raw_tx);

  /// Decode and shape-check one transaction without touching state.
  launchpad::schema::transaction_result_t check(
      const launchpad::schema::bytes_view_t& raw_tx) const;

  /// Read-only lookup by route. Keys are SCALE-encoded ids or raw 32-byte
  /// hashes, depending on the route.
  launchpad::schema::query_result_t query(
      std::string_view path,
      const launchpad::schema::bytes_view_t& data) const;

 private:
  launchpad::schema::bytes_t execute(
      const launchpad::schema::transaction_t& tx,
      journal& scope);

  launchpad::storage::rocksdb_storage_t& storage_;
  launchpad::factory::token_factory& factory_;
  launchpad::coordinator::signer_coordinator& coordinator_;
  launchpad::attestation::attestation_registry& attestations_;
  launchpad::token::token_registry& tokens_;
  launchpad::liquidity::pool_manager& pools_;
  launchpad::liquidity::vesting_registry& vesting_;
  std::atomic<uint64_t> applied_{0};
  std::atomic<uint64_t> rejected_{0};
};

}  // namespace launchpad::execution
