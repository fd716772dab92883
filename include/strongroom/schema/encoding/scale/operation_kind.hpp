#pragma once

#include <strongroom/schema/operation_kind.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    strongroom::schema,
    operation_kind_t,
    strongroom::schema::operation_kind_t::wallet_init,
    strongroom::schema::operation_kind_t::config_update,
    strongroom::schema::operation_kind_t::balance_account_create,
    strongroom::schema::operation_kind_t::balance_account_update,
    strongroom::schema::operation_kind_t::whitelist_update,
    strongroom::schema::operation_kind_t::transfer,
    strongroom::schema::operation_kind_t::spl_transfer,
    strongroom::schema::operation_kind_t::dapp_transaction,
    strongroom::schema::operation_kind_t::dapp_book_update)
