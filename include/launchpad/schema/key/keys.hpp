#pragma once
#include <launchpad/schema/primitives.hpp>
#include <string_view>

// Storage key spaces. Row prefixes never prefix one another so that
// list_by_prefix on one table never returns rows of another.
namespace launchpad::schema::key {

inline constexpr auto kRequestPrefix = std::string_view{"REQUEST|"};
inline constexpr auto kSignatureSetPrefix = std::string_view{"SIGSET|"};
inline constexpr auto kAttestationPrefix = std::string_view{"ATTEST|"};
inline constexpr auto kTokenPrefix = std::string_view{"TOKEN|"};
inline constexpr auto kPoolPrefix = std::string_view{"POOL|"};
inline constexpr auto kPositionPrefix = std::string_view{"POSITION|"};
inline constexpr auto kVestingPrefix = std::string_view{"VEST|"};

inline constexpr auto kTokenNonceKey = std::string_view{"META|TOKEN|NONCE"};

bytes_t make_prefix(const std::string_view& prefix);
bytes_t make_meta_key(const std::string_view& key);

bytes_t make_request_key(request_id_t id);
bytes_t make_signature_set_key(request_id_t id);
bytes_t make_attestation_key(attestation_id_t id);
bytes_t make_token_key(const address_t& address);
bytes_t make_pool_key(const pool_id_t& pool_id);
bytes_t make_position_key(const pool_id_t& pool_id,
                          const account_id_t& provider);
bytes_t make_vesting_key(const pool_id_t& pool_id,
                         const account_id_t& beneficiary);

}  // namespace launchpad::schema::key
