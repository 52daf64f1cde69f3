#pragma once

#include <launchpad/attestation/attestation_notifier.hpp>
#include <launchpad/coordinator/signature_registry.hpp>
#include <launchpad/execution/authorization_policy.hpp>
#include <launchpad/factory/creation_executor.hpp>
#include <launchpad/schema/quorum_rule.hpp>
#include <launchpad/schema/signature_set.hpp>
#include <launchpad/storage/rocksdb/storage.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>

namespace launchpad::coordinator {

/// Collects signer approvals per request and hands the request to the
/// executor when the configured quorum is reached.
///
/// The approval that reaches quorum is consumed by the execution: it is
/// attested but not added to the collected set, which is cleared and marked
/// executed. A failed execution aborts the whole `sign` call.
class signer_coordinator final : public signature_registry {
 public:
  signer_coordinator(
      const launchpad::schema::account_id_t& identity,
      launchpad::execution::authorization_policy& policy,
      launchpad::storage::rocksdb_storage_t& storage,
      launchpad::factory::creation_executor& executor,
      launchpad::attestation::attestation_notifier& notifier,
      launchpad::schema::quorum_rule_t rule =
          launchpad::schema::quorum_rule_t::all_but_one);

  const launchpad::schema::account_id_t& identity() const override {
    return identity_;
  }

  launchpad::schema::quorum_rule_t rule() const { return rule_; }

  void open_signature_set(
      const launchpad::schema::account_id_t& caller,
      launchpad::schema::request_id_t request_id,
      const launchpad::schema::account_id_t& requester,
      const std::vector<launchpad::schema::account_id_t>& signers,
      launchpad::execution::journal& tx) override;

  void sign(launchpad::schema::request_id_t request_id,
            const launchpad::schema::account_id_t& signer,
            launchpad::execution::journal& tx);
  void sign(launchpad::schema::request_id_t request_id,
            const launchpad::schema::account_id_t& signer);

  void unsign(launchpad::schema::request_id_t request_id,
              const launchpad::schema::account_id_t& signer,
              launchpad::execution::journal& tx);
  void unsign(launchpad::schema::request_id_t request_id,
              const launchpad::schema::account_id_t& signer);

  /// Administrator recovery after a failed execution: re-runs execution for
  /// an open set that is exactly one approval short of quorum.
  void retry_execution(const launchpad::schema::account_id_t& caller,
                       launchpad::schema::request_id_t request_id,
                       launchpad::execution::journal& tx);
  void retry_execution(const launchpad::schema::account_id_t& caller,
                       launchpad::schema::request_id_t request_id);

  /// Throws `not_found` when no set was opened for the id.
  launchpad::schema::signature_set_t get_signature_set(
      launchpad::schema::request_id_t request_id) const;
  std::optional<launchpad::schema::signature_set_t> try_get_signature_set(
      launchpad::schema::request_id_t request_id) const;

 private:
  struct entry final {
    std::mutex mutex;
    launchpad::schema::signature_set_t set;
  };

  std::shared_ptr<entry> find_entry(
      launchpad::schema::request_id_t request_id) const;
  std::shared_ptr<entry> lock_open_entry(
      launchpad::schema::request_id_t request_id,
      launchpad::execution::journal& tx) const;
  void execute(launchpad::schema::request_id_t request_id,
               entry& target,
               launchpad::execution::journal& tx);
  void load_persisted_state();

  launchpad::schema::account_id_t identity_;
  launchpad::execution::authorization_policy& policy_;
  launchpad::storage::rocksdb_storage_t& storage_;
  launchpad::factory::creation_executor& executor_;
  launchpad::attestation::attestation_notifier& notifier_;
  launchpad::schema::quorum_rule_t rule_;

  mutable std::shared_mutex table_mutex_;
  std::map<launchpad::schema::request_id_t, std::shared_ptr<entry>> entries_;
};

}  // namespace launchpad::coordinator
