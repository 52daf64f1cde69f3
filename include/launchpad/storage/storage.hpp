#pragma once
#include <launchpad/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace launchpad::storage {

using key_value_entry_t =
    std::pair<launchpad::schema::bytes_t, launchpad::schema::bytes_t>;

/// One staged mutation; an empty value deletes the key.
struct write_operation final {
  launchpad::schema::bytes_t key;
  std::optional<launchpad::schema::bytes_t> value;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const launchpad::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const launchpad::schema::bytes_view_t& key,
           const T& value);

  /// Apply every staged operation atomically, in order.
  void write(const std::vector<write_operation>& operations) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const launchpad::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace launchpad::storage
