#pragma once

#include <launchpad/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: query result.
// Read API envelope: deterministic query output plus key echo and error
// metadata.
namespace launchpad::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  not_found = 2,
  unsupported_path = 3,
};

template <uint16_t Version>
struct query_result;

template <>
struct query_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  bytes_t key;
  bytes_t value;
  std::string codespace;
};

using query_result_t = query_result<1>;

}  // namespace launchpad::schema
