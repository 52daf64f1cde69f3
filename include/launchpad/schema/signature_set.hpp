#pragma once
#include <launchpad/schema/enum_string.hpp>
#include <launchpad/schema/primitives.hpp>
#include <launchpad/schema/quorum_rule.hpp>
#include <vector>

// Schema type: signature set.
// Launch workflow: working approval state owned by the signer coordinator.
// Collected signatures keep insertion order and never repeat a signer.
// The quorum rule is fixed when the set is opened.
namespace launchpad::schema {

enum class signature_set_status_t : uint8_t {
  vacant = 0,
  open = 1,
  executed = 2
};

inline constexpr auto kSignatureSetStatusMappings =
    enum_mappings_t<signature_set_status_t, 3>{
        std::pair<std::string_view, signature_set_status_t>{
            "vacant", signature_set_status_t::vacant},
        std::pair<std::string_view, signature_set_status_t>{
            "open", signature_set_status_t::open},
        std::pair<std::string_view, signature_set_status_t>{
            "executed", signature_set_status_t::executed}};

inline constexpr std::string_view to_string(
    const signature_set_status_t value) {
  return to_string(value, kSignatureSetStatusMappings);
}

template <uint16_t Version>
struct collected_signature;

template <>
struct collected_signature<1> final {
  uint16_t version{1};
  account_id_t signer{};
  attestation_id_t attestation_id{};
};

using collected_signature_t = collected_signature<1>;

template <uint16_t Version>
struct signature_set;

template <>
struct signature_set<1> final {
  uint16_t version{1};
  request_id_t request_id{};
  account_id_t requester{};
  signature_set_status_t status{signature_set_status_t::vacant};
  quorum_rule_t quorum_rule{quorum_rule_t::all_but_one};
  std::vector<account_id_t> eligible_signers;
  std::vector<collected_signature_t> collected_signatures;
};

using signature_set_t = signature_set<1>;

}  // namespace launchpad::schema
