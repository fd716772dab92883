#pragma once

#include <strongroom/schema/balance_account_state.hpp>
#include <strongroom/schema/dapp_book_state.hpp>
#include <strongroom/schema/operation_params.hpp>
#include <strongroom/schema/primitives.hpp>
#include <strongroom/schema/program_error_code.hpp>
#include <strongroom/schema/wallet_state.hpp>

#include <optional>

// The only code paths that change wallet, balance account and dapp book
// records. The operation machine runs them on a scratch copy when an
// operation is initiated and on the live record when it is approved. A
// failed mutation may leave its target partially modified; callers discard
// it.
namespace strongroom::execution {

std::optional<strongroom::schema::program_error_code> apply_mutation(
    strongroom::schema::wallet_state_t& wallet,
    const strongroom::schema::operation_params_t& params);

std::optional<strongroom::schema::program_error_code> apply_mutation(
    strongroom::schema::balance_account_state_t& balance_account,
    const strongroom::schema::address_t& wallet_address,
    const strongroom::schema::wallet_state_t& wallet,
    const strongroom::schema::operation_params_t& params);

std::optional<strongroom::schema::program_error_code> apply_mutation(
    strongroom::schema::dapp_book_state_t& dapp_book,
    const strongroom::schema::operation_params_t& params);

}  // namespace strongroom::execution
