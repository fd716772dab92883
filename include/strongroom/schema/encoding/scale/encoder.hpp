#pragma once
#include <strongroom/common/critical.hpp>
#include <strongroom/schema/encoding/encoder.hpp>
#include <strongroom/schema/encoding/scale/asset_kind.hpp>
#include <strongroom/schema/encoding/scale/operation_kind.hpp>
#include <strongroom/schema/encoding/scale/operation_status.hpp>
#include <strongroom/schema/encoding/scale/vote.hpp>
#include <algorithm>
#include <iterator>
#include <scale/scale.hpp>

namespace strongroom::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  strongroom::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, strongroom::schema::bytes_t& out);

  template <typename T>
  T decode(const strongroom::schema::bytes_view_t& bytes);

  /// Decode, std::nullopt on malformed input or unconsumed trailing bytes.
  template <typename T>
  std::optional<T> try_decode(const strongroom::schema::bytes_view_t& bytes);
};

template <typename T>
strongroom::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    strongroom::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        strongroom::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const strongroom::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    strongroom::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const strongroom::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  // Re-encoding must reproduce the input exactly; this rejects trailing
  // garbage and non-canonical compact lengths.
  auto reencoded = ::scale::impl::memory::encode(decoded.value());
  if (!reencoded || reencoded.value().size() != bytes.size() ||
      !std::equal(std::begin(bytes), std::end(bytes),
                  std::begin(reencoded.value()))) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace strongroom::schema::encoding
