#pragma once

#include <launchpad/schema/primitives.hpp>

#include <cstdint>
#include <string>

// Schema type: engine info.
// Counters and configuration reported by the `/engine/info` query.
namespace launchpad::schema {

template <uint16_t Version>
struct engine_info;

template <>
struct engine_info<1> final {
  uint16_t version{1};
  uint64_t request_count{};
  uint64_t applied_transactions{};
  uint64_t rejected_transactions{};
  std::string quorum_rule;
};

using engine_info_t = engine_info<1>;

}  // namespace launchpad::schema
