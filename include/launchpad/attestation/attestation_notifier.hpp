#pragma once

#include <launchpad/execution/journal.hpp>
#include <launchpad/schema/primitives.hpp>

#include <string>

namespace launchpad::attestation {

/// Trust-anchoring collaborator notified of every approval and withdrawal.
class attestation_notifier {
 public:
  virtual ~attestation_notifier() = default;

  /// Notarize that `signer` approved request `request_id`.
  virtual launchpad::schema::attestation_id_t record_signature(
      const launchpad::schema::account_id_t& caller,
      launchpad::schema::request_id_t request_id,
      const launchpad::schema::account_id_t& signer,
      launchpad::execution::journal& tx) = 0;

  /// Mark an earlier attestation as no longer valid.
  virtual void revoke_signature(
      const launchpad::schema::account_id_t& caller,
      launchpad::schema::attestation_id_t attestation_id,
      const std::string& reason,
      launchpad::execution::journal& tx) = 0;
};

}  // namespace launchpad::attestation
