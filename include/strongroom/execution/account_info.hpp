#pragma once

#include <strongroom/schema/primitives.hpp>

#include <cstdint>
#include <span>

namespace strongroom::execution {

/// One account as handed to the program by the host for a single
/// instruction. `is_signer` and `is_writable` are set by the host after it
/// authenticated the transaction.
struct account_info_t final {
  strongroom::schema::address_t key{};
  strongroom::schema::address_t owner{};
  uint64_t lamports{};
  strongroom::schema::bytes_t data;
  bool is_signer{};
  bool is_writable{};
  bool executable{};
};

using accounts_t = std::span<account_info_t>;

}  // namespace strongroom::execution
