#pragma once
#include <launchpad/schema/primitives.hpp>

// Schema type: retry execution.
// Transaction payload: administrator re-triggers execution of a request whose
// final approval failed downstream.
namespace launchpad::schema {

template <uint16_t Version>
struct retry_execution;

template <>
struct retry_execution<1> final {
  uint16_t version{1};
  request_id_t request_id{};
};

using retry_execution_t = retry_execution<1>;

}  // namespace launchpad::schema
