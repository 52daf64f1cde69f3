#pragma once
#include <launchpad/schema/primitives.hpp>
#include <optional>
#include <span>

namespace launchpad::schema::encoding {

/// Codec front-end selected at build time by tag. Storage rows, transaction
/// payloads and query results all go through the same codec.
template <typename Library>
struct encoder {
  template <typename T>
  launchpad::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, launchpad::schema::bytes_t& out);

  template <typename T>
  T decode(const launchpad::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const launchpad::schema::bytes_view_t& bytes);
};

}  // namespace launchpad::schema::encoding
