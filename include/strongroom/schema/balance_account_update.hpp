#pragma once
#include <strongroom/schema/approval_policy.hpp>
#include <strongroom/schema/primitives.hpp>

namespace strongroom::schema {

template <uint16_t Version>
struct balance_account_update;

template <>
struct balance_account_update<1> final {
  uint16_t version{1};
  hash32_t guid_hash{};
  hash32_t name_hash{};
  bool dapps_enabled{};
  approval_policy_t policy{};
  bool active{true};

  bool operator==(const balance_account_update&) const = default;
};

using balance_account_update_t = balance_account_update<1>;

}  // namespace strongroom::schema
