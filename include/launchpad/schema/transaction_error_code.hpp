#pragma once

#include <launchpad/schema/enum_string.hpp>

#include <cstdint>
#include <string_view>

// Stable numeric result codes returned for rejected transactions. Gaps
// separate the failure families so that clients can branch on ranges.
namespace launchpad::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,

  // validation
  invalid_signer_count = 10,
  duplicate_signer = 11,
  empty_name = 12,
  empty_symbol = 13,
  invalid_supply = 14,
  invalid_pool_key = 15,
  invalid_liquidity = 16,

  // authorization
  not_authorized = 20,
  not_a_signer = 21,

  // state conflict
  already_signed = 30,
  not_signed = 31,
  transaction_already_executed = 32,
  pool_already_initialized = 33,
  pool_not_initialized = 34,
  quorum_not_reached = 35,
  attestation_already_revoked = 36,
  coordinator_unbound = 37,

  // lookups
  not_found = 40,

  // downstream collaborators
  integration_failure = 50,
};

enum class error_category : uint8_t {
  validation = 0,
  authorization = 1,
  state_conflict = 2,
  not_found = 3,
  integration_failure = 4,
};

constexpr error_category category_of(const transaction_error_code code) {
  const auto value = static_cast<uint32_t>(code);
  if (value < 20) {
    return error_category::validation;
  }
  if (value < 30) {
    return error_category::authorization;
  }
  if (value < 40) {
    return error_category::state_conflict;
  }
  if (value < 50) {
    return error_category::not_found;
  }
  return error_category::integration_failure;
}

inline constexpr auto kTransactionErrorCodeMappings = enum_mappings_t<
    transaction_error_code, 21>{
    std::pair{"invalid_transaction",
              transaction_error_code::invalid_transaction},
    std::pair{"unsupported_transaction_version",
              transaction_error_code::unsupported_transaction_version},
    std::pair{"invalid_signer_count",
              transaction_error_code::invalid_signer_count},
    std::pair{"duplicate_signer", transaction_error_code::duplicate_signer},
    std::pair{"empty_name", transaction_error_code::empty_name},
    std::pair{"empty_symbol", transaction_error_code::empty_symbol},
    std::pair{"invalid_supply", transaction_error_code::invalid_supply},
    std::pair{"invalid_pool_key", transaction_error_code::invalid_pool_key},
    std::pair{"invalid_liquidity", transaction_error_code::invalid_liquidity},
    std::pair{"not_authorized", transaction_error_code::not_authorized},
    std::pair{"not_a_signer", transaction_error_code::not_a_signer},
    std::pair{"already_signed", transaction_error_code::already_signed},
    std::pair{"not_signed", transaction_error_code::not_signed},
    std::pair{"transaction_already_executed",
              transaction_error_code::transaction_already_executed},
    std::pair{"pool_already_initialized",
              transaction_error_code::pool_already_initialized},
    std::pair{"pool_not_initialized",
              transaction_error_code::pool_not_initialized},
    std::pair{"quorum_not_reached", transaction_error_code::quorum_not_reached},
    std::pair{"attestation_already_revoked",
              transaction_error_code::attestation_already_revoked},
    std::pair{"coordinator_unbound",
              transaction_error_code::coordinator_unbound},
    std::pair{"not_found", transaction_error_code::not_found},
    std::pair{"integration_failure",
              transaction_error_code::integration_failure}};

inline constexpr std::string_view to_string(
    const transaction_error_code value) {
  return to_string(value, kTransactionErrorCodeMappings);
}

inline constexpr auto kErrorCategoryMappings =
    enum_mappings_t<error_category, 5>{
        std::pair{"validation", error_category::validation},
        std::pair{"authorization", error_category::authorization},
        std::pair{"state_conflict", error_category::state_conflict},
        std::pair{"not_found", error_category::not_found},
        std::pair{"integration_failure", error_category::integration_failure}};

inline constexpr std::string_view to_string(const error_category value) {
  return to_string(value, kErrorCategoryMappings);
}

}  // namespace launchpad::schema
