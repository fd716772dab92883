#pragma once
#include <strongroom/schema/primitives.hpp>

namespace strongroom::schema {

template <uint16_t Version>
struct transfer;

template <>
struct transfer<1> final {
  uint16_t version{1};
  hash32_t guid_hash{};
  address_t destination{};
  amount_t amount{};

  bool operator==(const transfer&) const = default;
};

using transfer_t = transfer<1>;

template <uint16_t Version>
struct spl_transfer;

template <>
struct spl_transfer<1> final {
  uint16_t version{1};
  hash32_t guid_hash{};
  address_t destination{};
  address_t mint{};
  amount_t amount{};

  bool operator==(const spl_transfer&) const = default;
};

using spl_transfer_t = spl_transfer<1>;

}  // namespace strongroom::schema
