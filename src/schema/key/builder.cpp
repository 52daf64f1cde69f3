#include <algorithm>
#include <iterator>
#include <launchpad/blake3/hash.hpp>
#include <launchpad/schema/key/builder.hpp>
#include <ranges>

using namespace launchpad::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const hash32_t& hash) {
  return write(std::span<const uint8_t>{hash.data(), hash.size()});
}

builder& builder::hash(const std::string_view& str) {
  return write(launchpad::blake3::hash(str));
}

builder& builder::hash(const std::span<const uint8_t>& bytes) {
  return write(launchpad::blake3::hash(bytes));
}
