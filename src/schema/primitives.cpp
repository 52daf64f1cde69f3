#include <launchpad/common/critical.hpp>
#include <launchpad/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <limits>
#include <string_view>

namespace launchpad::schema {

namespace {

std::string_view strip_hex_prefix(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes.data(), bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

hash32_t make_hash32(const bytes_t& bytes) {
  if (bytes.size() != 32) {
    launchpad::common::critical("make_hash32 expected exactly 32 bytes, got {}",
                                bytes.size());
  }
  auto hash = hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

hash32_t make_hash32(const std::string_view& hex) {
  auto hash = try_make_hash32(hex);
  if (!hash.has_value()) {
    launchpad::common::critical("'{}' is not a 32 byte hex string", hex);
  }
  return *hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != 32) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::copy(std::begin(*decoded), std::end(*decoded), std::begin(hash));
  return hash;
}

hash32_t make_zero_hash() {
  return {};
}

bool is_zero(const hash32_t& hash) {
  return std::ranges::all_of(hash, [](const uint8_t b) { return b == 0; });
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::string to_hex(const hash32_t& hash) {
  return to_hex(bytes_view_t{hash.data(), hash.size()});
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  hex = strip_hex_prefix(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }
  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

bytes_t from_hex(const std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded.has_value()) {
    launchpad::common::critical("invalid hex input");
  }
  return *decoded;
}

std::optional<amount_t> try_make_amount(const std::string_view decimal) {
  if (decimal.empty() || decimal.size() > 78) {
    return std::nullopt;
  }
  auto value = boost::multiprecision::cpp_int{};
  for (const auto c : decimal) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    value = (value * 10) + (c - '0');
  }
  if (value > boost::multiprecision::cpp_int{
                  std::numeric_limits<amount_t>::max()}) {
    return std::nullopt;
  }
  return static_cast<amount_t>(value);
}

std::string to_string(const amount_t& amount) {
  return amount.str();
}

}  // namespace launchpad::schema
