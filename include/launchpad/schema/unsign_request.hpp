#pragma once
#include <launchpad/schema/primitives.hpp>

// Schema type: unsign request.
// Transaction payload: the caller withdraws an earlier approval.
namespace launchpad::schema {

template <uint16_t Version>
struct unsign_request;

template <>
struct unsign_request<1> final {
  uint16_t version{1};
  request_id_t request_id{};
};

using unsign_request_t = unsign_request<1>;

}  // namespace launchpad::schema
