#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace launchpad::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;

// Identities of requesters, signers and components.
using account_id_t = hash32_t;
// Deployed token contracts and pool currencies.
using address_t = hash32_t;
using pool_id_t = hash32_t;
using request_id_t = uint64_t;
using attestation_id_t = uint64_t;
using amount_t = boost::multiprecision::uint256_t;
using sqrt_price_x96_t = boost::multiprecision::uint256_t;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;

/// Request id 0 never names a record.
inline constexpr auto kSentinelRequestId = request_id_t{0};

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();
bool is_zero(const hash32_t& hash);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
std::optional<bytes_t> try_from_hex(const std::string_view hex);
bytes_t from_hex(const std::string_view hex);

/// Parse a base-10 unsigned integer that fits in 256 bits.
std::optional<amount_t> try_make_amount(const std::string_view decimal);
std::string to_string(const amount_t& amount);

}  // namespace launchpad::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
