#pragma once
#include <strongroom/schema/primitives.hpp>
#include <strongroom/schema/whitelist_entry.hpp>

#include <optional>
#include <vector>

namespace strongroom::schema {

template <uint16_t Version>
struct whitelist_update;

// Removals are applied before additions. A status-only update leaves both
// lists empty and sets `whitelist_enabled`.
template <>
struct whitelist_update<1> final {
  uint16_t version{1};
  hash32_t guid_hash{};
  std::optional<bool> whitelist_enabled{std::nullopt};
  std::vector<whitelist_entry_t> add;
  std::vector<address_t> remove;

  bool operator==(const whitelist_update&) const = default;
};

using whitelist_update_t = whitelist_update<1>;

}  // namespace strongroom::schema
