#pragma once

#include <launchpad/attestation/attestation_notifier.hpp>
#include <launchpad/execution/authorization_policy.hpp>
#include <launchpad/schema/attestation_record.hpp>
#include <launchpad/storage/rocksdb/storage.hpp>

#include <map>
#include <mutex>
#include <optional>
#include <utility>

namespace launchpad::attestation {

/// Local attestation ledger. Ids are issued sequentially from 1 and rows are
/// persisted under the `ATTEST|` key space.
class attestation_registry final : public attestation_notifier {
 public:
  attestation_registry(launchpad::execution::authorization_policy& policy,
                       launchpad::storage::rocksdb_storage_t& storage);

  launchpad::schema::attestation_id_t record_signature(
      const launchpad::schema::account_id_t& caller,
      launchpad::schema::request_id_t request_id,
      const launchpad::schema::account_id_t& signer,
      launchpad::execution::journal& tx) override;

  void revoke_signature(const launchpad::schema::account_id_t& caller,
                        launchpad::schema::attestation_id_t attestation_id,
                        const std::string& reason,
                        launchpad::execution::journal& tx) override;

  std::optional<launchpad::schema::attestation_record_t> get(
      launchpad::schema::attestation_id_t attestation_id) const;

  /// Most recent attestation issued for this signer on this request.
  std::optional<launchpad::schema::attestation_record_t> latest_for(
      launchpad::schema::request_id_t request_id,
      const launchpad::schema::account_id_t& signer) const;

 private:
  using latest_key_t = std::pair<launchpad::schema::request_id_t,
                                 launchpad::schema::account_id_t>;

  void load_persisted_state();

  launchpad::execution::authorization_policy& policy_;
  launchpad::storage::rocksdb_storage_t& storage_;
  mutable std::mutex mutex_;
  launchpad::schema::attestation_id_t next_id_{1};
  std::map<launchpad::schema::attestation_id_t,
           launchpad::schema::attestation_record_t>
      records_;
  std::map<latest_key_t, launchpad::schema::attestation_id_t> latest_;
};

}  // namespace launchpad::attestation
