#pragma once

#include <launchpad/schema/enum_string.hpp>
#include <launchpad/schema/primitives.hpp>

#include <map>
#include <set>
#include <shared_mutex>
#include <string_view>

namespace launchpad::execution {

enum class capability_t : uint8_t {
  administer = 0,
  execute_creation = 1,
  open_signature_set = 2,
  deploy_token = 3,
  record_attestation = 4,
};

inline constexpr auto kCapabilityMappings =
    launchpad::schema::enum_mappings_t<capability_t, 5>{
        std::pair<std::string_view, capability_t>{"administer",
                                                  capability_t::administer},
        std::pair<std::string_view, capability_t>{
            "execute_creation", capability_t::execute_creation},
        std::pair<std::string_view, capability_t>{
            "open_signature_set", capability_t::open_signature_set},
        std::pair<std::string_view, capability_t>{"deploy_token",
                                                  capability_t::deploy_token},
        std::pair<std::string_view, capability_t>{
            "record_attestation", capability_t::record_attestation}};

inline constexpr std::string_view to_string(const capability_t value) {
  return launchpad::schema::to_string(value, kCapabilityMappings);
}

/// Capability check injected into every component. Components call
/// `require` before any mutation; nothing compares caller identities inline.
class authorization_policy {
 public:
  virtual ~authorization_policy() = default;

  virtual bool permits(const launchpad::schema::account_id_t& caller,
                       capability_t capability) const = 0;
  virtual void grant(capability_t capability,
                     const launchpad::schema::account_id_t& identity) = 0;
  virtual void revoke(capability_t capability,
                      const launchpad::schema::account_id_t& identity) = 0;

  /// Throws `not_authorized` unless `caller` holds `capability`.
  void require(const launchpad::schema::account_id_t& caller,
               capability_t capability) const;

  /// Throws `not_authorized` unless `caller` holds `capability` or is an
  /// administrator.
  void require_or_administrator(const launchpad::schema::account_id_t& caller,
                                capability_t capability) const;
};

/// In-memory capability table seeded with one administrator.
class role_table_policy final : public authorization_policy {
 public:
  explicit role_table_policy(
      const launchpad::schema::account_id_t& administrator);

  bool permits(const launchpad::schema::account_id_t& caller,
               capability_t capability) const override;
  void grant(capability_t capability,
             const launchpad::schema::account_id_t& identity) override;
  void revoke(capability_t capability,
              const launchpad::schema::account_id_t& identity) override;

 private:
  mutable std::shared_mutex mutex_;
  std::map<capability_t, std::set<launchpad::schema::account_id_t>> grants_;
};

}  // namespace launchpad::execution
