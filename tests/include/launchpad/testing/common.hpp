#pragma once

#include <launchpad/blake3/hash.hpp>
#include <launchpad/schema/primitives.hpp>
#include <launchpad/schema/token_spec.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace launchpad::testing {

inline launchpad::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = launchpad::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline launchpad::schema::account_id_t make_identity(
    const std::string_view name) {
  return launchpad::blake3::hash(name);
}

inline launchpad::schema::token_spec_t make_token_spec(
    const std::string_view name = "Doge Two",
    const std::string_view symbol = "DOGE2") {
  return launchpad::schema::token_spec_t{.name = std::string{name},
                                         .symbol = std::string{symbol},
                                         .total_supply = 1'000'000'000,
                                         .max_supply = 2'000'000'000,
                                         .mintable = true,
                                         .burnable = true,
                                         .supply_capped = true};
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace launchpad::testing
