#pragma once

#include <cstdint>

namespace strongroom::schema {

// Host level failures. Program failures surface as instruction_failed with
// the program result attached.
enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  missing_signature = 5,
  signature_verification_failed = 6,
  unknown_program = 7,
  duplicate_account = 8,
  readonly_account_modified = 9,
  unowned_account_modified = 10,
  lamports_not_conserved = 11,
  instruction_failed = 12,
  insufficient_funds = 13,
  account_in_use = 14,
  invalid_system_instruction = 15,
};

}  // namespace strongroom::schema
