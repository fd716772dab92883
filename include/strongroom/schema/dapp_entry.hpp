#pragma once
#include <strongroom/schema/primitives.hpp>

#include <compare>

namespace strongroom::schema {

struct dapp_entry_t final {
  address_t program_id{};
  hash32_t name_hash{};

  auto operator<=>(const dapp_entry_t&) const = default;
};

}  // namespace strongroom::schema
