#pragma once

#include <cstdint>

// Schema type: record kind.
// Discriminant stored in the first byte of every program-owned account. The
// router dispatches on it before interpreting the rest of the account data.
namespace strongroom::schema {

enum class record_kind_t : uint8_t {
  uninitialized = 0,
  wallet = 1,
  balance_account = 2,
  dapp_book = 3,
  multisig_op = 4
};

}  // namespace strongroom::schema
