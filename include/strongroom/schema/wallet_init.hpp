#pragma once
#include <strongroom/schema/primitives.hpp>

#include <vector>

namespace strongroom::schema {

template <uint16_t Version>
struct wallet_init;

template <>
struct wallet_init<1> final {
  uint16_t version{1};
  std::vector<address_t> signers;
  uint8_t quorum{};
  duration_milliseconds_t approval_timeout{};
  std::vector<address_t> guardians;
  uint8_t guardian_quorum{};

  bool operator==(const wallet_init&) const = default;
};

using wallet_init_t = wallet_init<1>;

}  // namespace strongroom::schema
