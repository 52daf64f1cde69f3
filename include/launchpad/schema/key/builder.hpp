#pragma once
#include <launchpad/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace launchpad::schema::key {

/// Byte-level key assembly for storage rows. Integers are written big-endian
/// so that prefix iteration visits numeric ids in ascending order.
struct builder final {
  launchpad::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& write(const hash32_t& hash);

  builder& hash(const std::string_view& str);
  builder& hash(const std::span<const uint8_t>& bytes);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    for (size_t i = sizeof(T); i > 0; --i) {
      data.push_back(static_cast<uint8_t>((value >> ((i - 1) * 8)) & 0xFF));
    }
    return *this;
  }
};

}  // namespace launchpad::schema::key
