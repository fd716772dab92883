#pragma once
#include <strongroom/schema/balance_account_state.hpp>
#include <strongroom/schema/dapp_book_state.hpp>
#include <strongroom/schema/limits.hpp>
#include <strongroom/schema/multisig_op_state.hpp>
#include <strongroom/schema/primitives.hpp>
#include <strongroom/schema/program_error_code.hpp>
#include <strongroom/schema/record_kind.hpp>
#include <strongroom/schema/wallet_state.hpp>

#include <cstdint>
#include <optional>
#include <span>

// Record envelope codec.
// Account data layout: [kind u8][payload length u32 LE][SCALE payload][zero
// padding]. Every payload starts with its uint16 layout version.
namespace strongroom::schema {

template <typename T>
struct record_traits;

template <>
struct record_traits<wallet_state_t> final {
  static constexpr auto kind = record_kind_t::wallet;
  static constexpr auto account_size = kWalletAccountSize;
};

template <>
struct record_traits<balance_account_state_t> final {
  static constexpr auto kind = record_kind_t::balance_account;
  static constexpr auto account_size = kBalanceAccountSize;
};

template <>
struct record_traits<dapp_book_state_t> final {
  static constexpr auto kind = record_kind_t::dapp_book;
  static constexpr auto account_size = kDAppBookAccountSize;
};

template <>
struct record_traits<multisig_op_state_t> final {
  static constexpr auto kind = record_kind_t::multisig_op;
  static constexpr auto account_size = kMultisigOpAccountSize;
};

/// Kind byte of the account, std::nullopt when too short or unknown.
std::optional<record_kind_t> peek_record_kind(const bytes_view_t& data);

/// True when the account carries no record yet (kind byte zero).
bool is_uninitialized(const bytes_view_t& data);

/// Decode a record of type T from account data.
///
/// Fails with invalid_account_kind when the kind byte differs and with
/// invalid_account_data when the length, version, padding or any bounded set
/// is malformed.
template <typename T>
std::optional<program_error_code> load_record(const bytes_view_t& data,
                                              T& out);

/// Build the full account image of `record` for an account of `capacity`
/// bytes. Fails with account_data_too_small, never truncates.
template <typename T>
std::optional<program_error_code> encode_record(const T& record,
                                                std::size_t capacity,
                                                bytes_t& out);

/// encode_record followed by an overwrite of `data`.
template <typename T>
std::optional<program_error_code> store_record(const T& record,
                                               std::span<uint8_t> data);

bool well_formed(const wallet_state_t& record);
bool well_formed(const balance_account_state_t& record);
bool well_formed(const dapp_book_state_t& record);
bool well_formed(const multisig_op_state_t& record);

}  // namespace strongroom::schema
