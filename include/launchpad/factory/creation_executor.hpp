#pragma once

#include <launchpad/execution/journal.hpp>
#include <launchpad/schema/primitives.hpp>

namespace launchpad::factory {

/// Entry point the coordinator calls once a request reaches quorum.
class creation_executor {
 public:
  virtual ~creation_executor() = default;

  virtual void execute_creation(const launchpad::schema::account_id_t& caller,
                                launchpad::schema::request_id_t request_id,
                                launchpad::execution::journal& tx) = 0;
};

}  // namespace launchpad::factory
