#pragma once
#include <launchpad/schema/enum_string.hpp>
#include <launchpad/schema/primitives.hpp>
#include <string>

// Schema type: attestation record.
// Launch workflow: notarized evidence that a signer approved a request. A
// withdrawn approval flips the record to revoked and keeps the reason.
namespace launchpad::schema {

enum class attestation_status_t : uint8_t { active = 0, revoked = 1 };

inline constexpr auto kAttestationStatusMappings =
    enum_mappings_t<attestation_status_t, 2>{
        std::pair<std::string_view, attestation_status_t>{
            "active", attestation_status_t::active},
        std::pair<std::string_view, attestation_status_t>{
            "revoked", attestation_status_t::revoked}};

inline constexpr std::string_view to_string(const attestation_status_t value) {
  return to_string(value, kAttestationStatusMappings);
}

template <uint16_t Version>
struct attestation_record;

template <>
struct attestation_record<1> final {
  uint16_t version{1};
  attestation_id_t id{};
  request_id_t request_id{};
  account_id_t signer{};
  attestation_status_t status{attestation_status_t::active};
  std::string revoke_reason;
};

using attestation_record_t = attestation_record<1>;

}  // namespace launchpad::schema
