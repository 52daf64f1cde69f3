#pragma once

#include <launchpad/execution/journal.hpp>
#include <launchpad/schema/primitives.hpp>

#include <vector>

namespace launchpad::coordinator {

/// Approval tracker a factory opens one signature set per request with.
class signature_registry {
 public:
  virtual ~signature_registry() = default;

  virtual const launchpad::schema::account_id_t& identity() const = 0;

  virtual void open_signature_set(
      const launchpad::schema::account_id_t& caller,
      launchpad::schema::request_id_t request_id,
      const launchpad::schema::account_id_t& requester,
      const std::vector<launchpad::schema::account_id_t>& signers,
      launchpad::execution::journal& tx) = 0;
};

}  // namespace launchpad::coordinator
