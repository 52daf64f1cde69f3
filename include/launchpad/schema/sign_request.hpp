#pragma once
#include <launchpad/schema/primitives.hpp>

// Schema type: sign request.
// Transaction payload: the caller approves a pending creation request.
namespace launchpad::schema {

template <uint16_t Version>
struct sign_request;

template <>
struct sign_request<1> final {
  uint16_t version{1};
  request_id_t request_id{};
};

using sign_request_t = sign_request<1>;

}  // namespace launchpad::schema
