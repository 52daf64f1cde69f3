#pragma once

#include <launchpad/execution/journal.hpp>
#include <launchpad/schema/primitives.hpp>
#include <launchpad/schema/token_spec.hpp>

namespace launchpad::token {

/// Creates a token contract described by a token_spec_t.
class token_deployer {
 public:
  virtual ~token_deployer() = default;

  virtual launchpad::schema::address_t deploy(
      const launchpad::schema::account_id_t& caller,
      const launchpad::schema::token_spec_t& spec,
      const launchpad::schema::account_id_t& owner,
      launchpad::execution::journal& tx) = 0;
};

}  // namespace launchpad::token
