#include <blake3.h>
#include <launchpad/blake3/hash.hpp>

namespace launchpad::blake3 {

namespace {

launchpad::schema::hash32_t finalize(const void* data, const size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = launchpad::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<launchpad::schema::hash32_t>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

launchpad::schema::hash32_t hash(const std::string_view& str) {
  return finalize(str.data(), str.size());
}

launchpad::schema::hash32_t hash(const launchpad::schema::bytes_view_t& bytes) {
  return finalize(bytes.data(), bytes.size());
}

}  // namespace launchpad::blake3
