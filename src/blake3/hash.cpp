#include <blake3.h>
#include <strongroom/blake3/hash.hpp>

namespace strongroom::blake3 {

namespace {

strongroom::schema::hash32_t digest(const void* data, const std::size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  // BLAKE3_OUT_LEN
  auto output = strongroom::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

strongroom::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

strongroom::schema::hash32_t hash(
    const strongroom::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace strongroom::blake3
