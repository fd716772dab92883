#pragma once

#include <strongroom/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: operation kind.
// Tag of the proposed action carried by a pending multisig operation.
namespace strongroom::schema {

enum class operation_kind_t : uint8_t {
  wallet_init = 0,
  config_update = 1,
  balance_account_create = 2,
  balance_account_update = 3,
  whitelist_update = 4,
  transfer = 5,
  spl_transfer = 6,
  dapp_transaction = 7,
  dapp_book_update = 8
};

inline constexpr auto kOperationKindMappings = std::array{
    std::pair<std::string_view, operation_kind_t>{
        "wallet_init", operation_kind_t::wallet_init},
    std::pair<std::string_view, operation_kind_t>{
        "config_update", operation_kind_t::config_update},
    std::pair<std::string_view, operation_kind_t>{
        "balance_account_create", operation_kind_t::balance_account_create},
    std::pair<std::string_view, operation_kind_t>{
        "balance_account_update", operation_kind_t::balance_account_update},
    std::pair<std::string_view, operation_kind_t>{
        "whitelist_update", operation_kind_t::whitelist_update},
    std::pair<std::string_view, operation_kind_t>{"transfer",
                                                  operation_kind_t::transfer},
    std::pair<std::string_view, operation_kind_t>{
        "spl_transfer", operation_kind_t::spl_transfer},
    std::pair<std::string_view, operation_kind_t>{
        "dapp_transaction", operation_kind_t::dapp_transaction},
    std::pair<std::string_view, operation_kind_t>{
        "dapp_book_update", operation_kind_t::dapp_book_update}};

inline constexpr std::string_view to_string(const operation_kind_t value) {
  return to_string(value, kOperationKindMappings).value_or("unknown");
}

}  // namespace strongroom::schema
