#pragma once
#include <strongroom/schema/bounded_set.hpp>
#include <strongroom/schema/limits.hpp>
#include <strongroom/schema/primitives.hpp>

namespace strongroom::schema {

template <uint16_t Version>
struct wallet_state;

/// Root authorization record of a wallet.
///
/// `quorum` never exceeds the signer count. When guardians are configured,
/// `guardian_quorum` of them must also approve high-risk operations.
template <>
struct wallet_state<1> final {
  uint16_t version{1};
  bounded_set<address_t, kMaxSigners> signers{};
  uint8_t quorum{};
  duration_milliseconds_t approval_timeout{};
  bounded_set<address_t, kMaxGuardians> guardians{};
  uint8_t guardian_quorum{};
  address_t dapp_book{};
  bool config_update_locked{};
  uint64_t revision{};

  bool operator==(const wallet_state&) const = default;
};

using wallet_state_t = wallet_state<1>;

}  // namespace strongroom::schema
