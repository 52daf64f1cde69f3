#pragma once

#include <launchpad/schema/enum_string.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: quorum rule.
// all_but_one executes on the approval that leaves exactly one signer
// outstanding; unanimous waits for every signer.
namespace launchpad::schema {

enum class quorum_rule_t : uint8_t { all_but_one = 0, unanimous = 1 };

inline constexpr auto kQuorumRuleMappings = enum_mappings_t<quorum_rule_t, 2>{
    std::pair<std::string_view, quorum_rule_t>{"all-but-one",
                                               quorum_rule_t::all_but_one},
    std::pair<std::string_view, quorum_rule_t>{"unanimous",
                                               quorum_rule_t::unanimous}};

template <>
inline std::optional<quorum_rule_t> try_from_string<quorum_rule_t>(
    const std::string_view value) {
  return from_string(value, kQuorumRuleMappings);
}

inline constexpr std::string_view to_string(const quorum_rule_t value) {
  return to_string(value, kQuorumRuleMappings);
}

/// Approvals needed to execute a request with `signer_count` signers.
inline constexpr size_t required_approvals(const quorum_rule_t rule,
                                           const size_t signer_count) {
  return rule == quorum_rule_t::unanimous ? signer_count : signer_count - 1;
}

}  // namespace launchpad::schema
