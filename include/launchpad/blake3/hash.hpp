#pragma once
#include <launchpad/schema/primitives.hpp>
#include <span>
#include <string_view>

namespace launchpad::blake3 {

launchpad::schema::hash32_t hash(const std::string_view& str);
launchpad::schema::hash32_t hash(const launchpad::schema::bytes_view_t& bytes);

}  // namespace launchpad::blake3
