#pragma once
#include <launchpad/schema/add_liquidity.hpp>
#include <launchpad/schema/primitives.hpp>
#include <launchpad/schema/retry_execution.hpp>
#include <launchpad/schema/sign_request.hpp>
#include <launchpad/schema/submit_creation_request.hpp>
#include <launchpad/schema/unsign_request.hpp>
#include <variant>

namespace launchpad::schema {

using transaction_payload_t = std::variant<submit_creation_request_t,
                                           sign_request_t,
                                           unsign_request_t,
                                           retry_execution_t,
                                           add_liquidity_t>;

template <uint16_t Version>
struct transaction;

/// The host execution layer authenticates `caller` before the transaction
/// reaches the engine.
template <>
struct transaction<1> final {
  uint16_t version{1};
  account_id_t caller{};
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

}  // namespace launchpad::schema
