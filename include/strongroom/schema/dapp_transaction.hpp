#pragma once
#include <strongroom/schema/primitives.hpp>

#include <compare>
#include <vector>

namespace strongroom::schema {

struct dapp_account_meta_t final {
  address_t address{};
  bool is_writable{};

  auto operator<=>(const dapp_account_meta_t&) const = default;
};

template <uint16_t Version>
struct dapp_transaction;

/// Invocation of a whitelisted external program with a balance account as
/// the signing authority. `accounts` must match, in order, the accounts
/// passed after the program account.
template <>
struct dapp_transaction<1> final {
  uint16_t version{1};
  hash32_t guid_hash{};
  address_t program_id{};
  bytes_t payload;
  std::vector<dapp_account_meta_t> accounts;

  bool operator==(const dapp_transaction&) const = default;
};

using dapp_transaction_t = dapp_transaction<1>;

}  // namespace strongroom::schema
