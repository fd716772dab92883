#pragma once
#include <strongroom/schema/bounded_set.hpp>
#include <strongroom/schema/dapp_entry.hpp>
#include <strongroom/schema/limits.hpp>
#include <strongroom/schema/primitives.hpp>

namespace strongroom::schema {

template <uint16_t Version>
struct dapp_book_state;

template <>
struct dapp_book_state<1> final {
  uint16_t version{1};
  address_t wallet{};
  bounded_set<dapp_entry_t, kMaxDAppBookEntries> entries{};
  bool update_locked{};
  uint64_t revision{};

  bool operator==(const dapp_book_state&) const = default;
};

using dapp_book_state_t = dapp_book_state<1>;

}  // namespace strongroom::schema
