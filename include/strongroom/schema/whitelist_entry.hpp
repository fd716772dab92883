#pragma once
#include <strongroom/schema/primitives.hpp>

#include <compare>

namespace strongroom::schema {

struct whitelist_entry_t final {
  address_t address{};
  hash32_t name_hash{};

  auto operator<=>(const whitelist_entry_t&) const = default;
};

}  // namespace strongroom::schema
