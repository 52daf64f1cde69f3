#pragma once

#include <launchpad/schema/enum_string.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: request status.
// Launch workflow: a creation request is pending until its token is deployed;
// executed is terminal.
namespace launchpad::schema {

enum class request_status_t : uint8_t { pending = 0, executed = 1 };

inline constexpr auto kRequestStatusMappings =
    enum_mappings_t<request_status_t, 2>{
        std::pair<std::string_view, request_status_t>{
            "pending", request_status_t::pending},
        std::pair<std::string_view, request_status_t>{
            "executed", request_status_t::executed}};

template <>
inline std::optional<request_status_t> try_from_string<request_status_t>(
    const std::string_view value) {
  return from_string(value, kRequestStatusMappings);
}

inline constexpr std::string_view to_string(const request_status_t value) {
  return to_string(value, kRequestStatusMappings);
}

}  // namespace launchpad::schema
