#pragma once

#include <strongroom/schema/primitives.hpp>

#include <cstddef>
#include <cstdint>

// Fixed capacities of the persisted records and the account sizes clients
// allocate for them.
namespace strongroom::schema {

inline constexpr std::size_t kMaxSigners = 24;
inline constexpr std::size_t kMaxGuardians = 8;
inline constexpr std::size_t kMaxWhitelistEntries = 64;
inline constexpr std::size_t kMaxDAppBookEntries = 32;
inline constexpr std::size_t kMaxVotes = kMaxSigners + kMaxGuardians;
inline constexpr std::size_t kMaxDAppAccounts = 16;
inline constexpr std::size_t kMaxDAppPayload = 512;

inline constexpr duration_milliseconds_t kMinApprovalTimeout = 60'000;
inline constexpr duration_milliseconds_t kMaxApprovalTimeout =
    365ull * 24ull * 60ull * 60ull * 1000ull;

inline constexpr std::size_t kRecordHeaderSize = 5;
inline constexpr std::size_t kWalletAccountSize = 1280;
inline constexpr std::size_t kBalanceAccountSize = 4352;
inline constexpr std::size_t kDAppBookAccountSize = 2176;
inline constexpr std::size_t kMultisigOpAccountSize = 8192;

}  // namespace strongroom::schema
