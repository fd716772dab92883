#pragma once
#include <strongroom/schema/approval_policy.hpp>
#include <strongroom/schema/asset_kind.hpp>
#include <strongroom/schema/bounded_set.hpp>
#include <strongroom/schema/limits.hpp>
#include <strongroom/schema/primitives.hpp>
#include <strongroom/schema/whitelist_entry.hpp>

namespace strongroom::schema {

template <uint16_t Version>
struct balance_account_state;

/// Named sub-ledger of a wallet holding a single asset.
template <>
struct balance_account_state<1> final {
  uint16_t version{1};
  address_t wallet{};
  hash32_t guid_hash{};
  hash32_t name_hash{};
  asset_ref_t asset{};
  bool whitelist_enabled{};
  bool dapps_enabled{};
  bounded_set<whitelist_entry_t, kMaxWhitelistEntries> whitelist{};
  approval_policy_t policy{};
  bool active{true};
  bool policy_update_locked{};
  uint64_t revision{};

  bool operator==(const balance_account_state&) const = default;
};

using balance_account_state_t = balance_account_state<1>;

}  // namespace strongroom::schema
