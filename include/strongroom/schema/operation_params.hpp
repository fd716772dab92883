#pragma once
#include <strongroom/schema/balance_account_creation.hpp>
#include <strongroom/schema/balance_account_update.hpp>
#include <strongroom/schema/dapp_book_update.hpp>
#include <strongroom/schema/dapp_transaction.hpp>
#include <strongroom/schema/operation_kind.hpp>
#include <strongroom/schema/transfer.hpp>
#include <strongroom/schema/wallet_config_update.hpp>
#include <strongroom/schema/wallet_init.hpp>
#include <strongroom/schema/whitelist_update.hpp>

#include <variant>

// Schema type: operation params.
// Closed union of proposed actions. Alternative order matches
// operation_kind_t so the variant index is the kind.
namespace strongroom::schema {

using operation_params_t = std::variant<wallet_init_t,
                                        wallet_config_update_t,
                                        balance_account_creation_t,
                                        balance_account_update_t,
                                        whitelist_update_t,
                                        transfer_t,
                                        spl_transfer_t,
                                        dapp_transaction_t,
                                        dapp_book_update_t>;

inline operation_kind_t kind_of(const operation_params_t& params) {
  return static_cast<operation_kind_t>(params.index());
}

inline uint16_t version_of(const operation_params_t& params) {
  return std::visit([](const auto& value) { return value.version; }, params);
}

}  // namespace strongroom::schema
