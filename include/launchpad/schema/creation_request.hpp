#pragma once
#include <launchpad/schema/primitives.hpp>
#include <launchpad/schema/request_status.hpp>
#include <launchpad/schema/token_spec.hpp>
#include <optional>
#include <vector>

// Schema type: creation request.
// Launch workflow: durable ledger row owned by the token factory. The signer
// list is fixed at submission; `created_token` is written exactly once.
namespace launchpad::schema {

template <uint16_t Version>
struct creation_request;

template <>
struct creation_request<1> final {
  uint16_t version{1};
  request_id_t id{};
  account_id_t requester{};
  std::vector<account_id_t> signers;
  request_status_t status{request_status_t::pending};
  token_spec_t token;
  std::optional<address_t> created_token;
  std::optional<pool_id_t> created_pool;
};

using creation_request_t = creation_request<1>;

}  // namespace launchpad::schema
