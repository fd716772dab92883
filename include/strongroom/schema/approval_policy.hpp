#pragma once
#include <strongroom/schema/primitives.hpp>

#include <cstdint>

namespace strongroom::schema {

// Per balance account overrides of the wallet defaults. Zero means "use the
// wallet value" for quorum and timeout, and "no large-transfer tier" for the
// minimum.
struct approval_policy_t final {
  uint8_t transfer_quorum{};
  amount_t large_transfer_minimum{};
  uint8_t large_transfer_quorum{};
  duration_milliseconds_t approval_timeout{};

  bool operator==(const approval_policy_t&) const = default;
};

}  // namespace strongroom::schema
