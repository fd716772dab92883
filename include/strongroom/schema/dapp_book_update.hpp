#pragma once
#include <strongroom/schema/dapp_entry.hpp>
#include <strongroom/schema/primitives.hpp>

#include <vector>

namespace strongroom::schema {

template <uint16_t Version>
struct dapp_book_update;

template <>
struct dapp_book_update<1> final {
  uint16_t version{1};
  std::vector<dapp_entry_t> add;
  std::vector<address_t> remove;

  bool operator==(const dapp_book_update&) const = default;
};

using dapp_book_update_t = dapp_book_update<1>;

}  // namespace strongroom::schema
