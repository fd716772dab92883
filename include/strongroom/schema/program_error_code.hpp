#pragma once

#include <strongroom/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace strongroom::schema {

enum class program_error_code : uint32_t {
  // validation
  invalid_instruction = 1,
  not_enough_account_keys = 2,
  invalid_account_owner = 3,
  invalid_account_kind = 4,
  invalid_account_data = 5,
  account_not_writable = 6,
  account_data_too_small = 7,
  account_mismatch = 8,
  invalid_threshold = 9,
  duplicate_signer = 10,
  too_many_signers = 11,
  invalid_approval_timeout = 12,
  invalid_update = 13,
  whitelist_full = 14,
  dapp_book_full = 15,
  entry_missing = 16,
  entry_exists = 17,
  asset_mismatch = 18,
  invalid_amount = 19,
  params_hash_mismatch = 20,
  wallet_init_not_proposable = 21,
  unsupported_instruction_version = 22,
  // authorization
  missing_required_signature = 40,
  unauthorized_signer = 41,
  duplicate_vote = 42,
  guardian_not_permitted = 43,
  // policy
  destination_not_whitelisted = 50,
  program_not_whitelisted = 51,
  dapps_disabled = 52,
  // state
  account_already_initialized = 60,
  operation_not_pending = 61,
  operation_kind_mismatch = 62,
  operation_not_expired = 63,
  operation_not_terminal = 64,
  concurrent_operation_not_allowed = 65,
  balance_account_inactive = 66,
  // expiry
  operation_expired = 70,
  // execution
  insufficient_funds = 80,
  external_invocation_failed = 81,
};

enum class error_kind_t : uint8_t {
  validation,
  authorization,
  policy_violation,
  state,
  expiry,
  execution
};

inline constexpr error_kind_t kind_of(const program_error_code code) {
  auto value = static_cast<uint32_t>(code);
  if (value < 40) {
    return error_kind_t::validation;
  }
  if (value < 50) {
    return error_kind_t::authorization;
  }
  if (value < 60) {
    return error_kind_t::policy_violation;
  }
  if (value < 70) {
    return error_kind_t::state;
  }
  if (value < 80) {
    return error_kind_t::expiry;
  }
  return error_kind_t::execution;
}

inline constexpr auto kErrorKindMappings = std::array{
    std::pair<std::string_view, error_kind_t>{"ValidationError",
                                              error_kind_t::validation},
    std::pair<std::string_view, error_kind_t>{"AuthorizationError",
                                              error_kind_t::authorization},
    std::pair<std::string_view, error_kind_t>{"PolicyViolation",
                                              error_kind_t::policy_violation},
    std::pair<std::string_view, error_kind_t>{"StateError",
                                              error_kind_t::state},
    std::pair<std::string_view, error_kind_t>{"ExpiryError",
                                              error_kind_t::expiry},
    std::pair<std::string_view, error_kind_t>{"ExecutionError",
                                              error_kind_t::execution}};

inline constexpr std::string_view to_string(const error_kind_t value) {
  return to_string(value, kErrorKindMappings).value_or("unknown");
}

std::string_view to_string(program_error_code code);

}  // namespace strongroom::schema
