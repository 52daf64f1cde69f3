#pragma once
#include <launchpad/schema/primitives.hpp>
#include <launchpad/schema/token_spec.hpp>
#include <vector>

// Schema type: submit creation request.
// Transaction payload: queue a token creation; the transaction caller is the
// requester.
namespace launchpad::schema {

template <uint16_t Version>
struct submit_creation_request;

template <>
struct submit_creation_request<1> final {
  uint16_t version{1};
  std::vector<account_id_t> signers;
  token_spec_t token;
};

using submit_creation_request_t = submit_creation_request<1>;

}  // namespace launchpad::schema
