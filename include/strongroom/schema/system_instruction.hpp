#pragma once
#include <strongroom/schema/primitives.hpp>

#include <variant>

// Instructions of the host's built-in system program (program id zero).
namespace strongroom::schema {

template <uint16_t Version>
struct create_account;

// accounts: [funder (signer, writable), new account (writable)]
template <>
struct create_account<1> final {
  uint16_t version{1};
  uint64_t lamports{};
  uint64_t space{};
  address_t owner{};
};

using create_account_t = create_account<1>;

template <uint16_t Version>
struct transfer_lamports;

// accounts: [from (signer, writable), to (writable)]
template <>
struct transfer_lamports<1> final {
  uint16_t version{1};
  uint64_t lamports{};
};

using transfer_lamports_t = transfer_lamports<1>;

using system_instruction_t =
    std::variant<create_account_t, transfer_lamports_t>;

}  // namespace strongroom::schema
