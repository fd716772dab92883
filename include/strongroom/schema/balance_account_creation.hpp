#pragma once
#include <strongroom/schema/approval_policy.hpp>
#include <strongroom/schema/asset_kind.hpp>
#include <strongroom/schema/primitives.hpp>
#include <strongroom/schema/whitelist_entry.hpp>

#include <vector>

namespace strongroom::schema {

template <uint16_t Version>
struct balance_account_creation;

template <>
struct balance_account_creation<1> final {
  uint16_t version{1};
  hash32_t guid_hash{};
  hash32_t name_hash{};
  asset_ref_t asset{};
  bool whitelist_enabled{};
  bool dapps_enabled{};
  approval_policy_t policy{};
  std::vector<whitelist_entry_t> whitelist;

  bool operator==(const balance_account_creation&) const = default;
};

using balance_account_creation_t = balance_account_creation<1>;

}  // namespace strongroom::schema
