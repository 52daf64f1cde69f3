#pragma once

#include <launchpad/coordinator/signature_registry.hpp>
#include <launchpad/execution/authorization_policy.hpp>
#include <launchpad/factory/creation_executor.hpp>
#include <launchpad/liquidity/liquidity_bootstrap.hpp>
#include <launchpad/schema/creation_request.hpp>
#include <launchpad/storage/rocksdb/storage.hpp>
#include <launchpad/token/token_deployer.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace launchpad::factory {

/// Queues memecoin creation requests and, once the bound coordinator reports
/// quorum, deploys the token and bootstraps its pool.
class token_factory final : public creation_executor {
 public:
  token_factory(const launchpad::schema::account_id_t& identity,
                launchpad::execution::authorization_policy& policy,
                launchpad::storage::rocksdb_storage_t& storage,
                launchpad::token::token_deployer& deployer,
                launchpad::liquidity::liquidity_bootstrap& bootstrap);

  const launchpad::schema::account_id_t& identity() const {
    return identity_;
  }

  /// Bind the coordinator allowed to call execute_creation. The previous
  /// coordinator, if any, loses that capability.
  void set_coordinator(const launchpad::schema::account_id_t& caller,
                       launchpad::coordinator::signature_registry& coordinator);

  void set_liquidity_bootstrap(
      const launchpad::schema::account_id_t& caller,
      launchpad::liquidity::liquidity_bootstrap& bootstrap);

  launchpad::schema::request_id_t submit_creation_request(
      const std::vector<launchpad::schema::account_id_t>& signers,
      const launchpad::schema::account_id_t& requester,
      const launchpad::schema::token_spec_t& token,
      launchpad::execution::journal& tx);
  launchpad::schema::request_id_t submit_creation_request(
      const std::vector<launchpad::schema::account_id_t>& signers,
      const launchpad::schema::account_id_t& requester,
      const launchpad::schema::token_spec_t& token);

  void execute_creation(const launchpad::schema::account_id_t& caller,
                        launchpad::schema::request_id_t request_id,
                        launchpad::execution::journal& tx) override;
  void execute_creation(const launchpad::schema::account_id_t& caller,
                        launchpad::schema::request_id_t request_id);

  /// Throws `not_found` for an unknown id.
  launchpad::schema::creation_request_t get_request(
      launchpad::schema::request_id_t request_id) const;
  std::optional<launchpad::schema::creation_request_t> try_get_request(
      launchpad::schema::request_id_t request_id) const;

  size_t request_count() const;

 private:
  struct slot final {
    std::mutex mutex;
    std::optional<launchpad::schema::creation_request_t> record;
  };

  std::shared_ptr<slot> find_slot(
      launchpad::schema::request_id_t request_id) const;
  void load_persisted_state();

  launchpad::schema::account_id_t identity_;
  launchpad::execution::authorization_policy& policy_;
  launchpad::storage::rocksdb_storage_t& storage_;
  launchpad::token::token_deployer& deployer_;

  mutable std::shared_mutex binding_mutex_;
  launchpad::coordinator::signature_registry* coordinator_{nullptr};
  launchpad::liquidity::liquidity_bootstrap* bootstrap_{nullptr};

  // Slots are never erased; a rolled-back submission leaves a vacant slot.
  mutable std::shared_mutex table_mutex_;
  launchpad::schema::request_id_t next_id_{1};
  std::map<launchpad::schema::request_id_t, std::shared_ptr<slot>> slots_;
};

/// Checks a submission against the creation rules; throws on violation.
void validate_creation_request(
    const std::vector<launchpad::schema::account_id_t>& signers,
    const launchpad::schema::token_spec_t& token);

}  // namespace launchpad::factory
