#include <spdlog/spdlog.h>
#include <strongroom/execution/operation_machine.hpp>
#include <strongroom/execution/result.hpp>
#include <strongroom/execution/router.hpp>
#include <strongroom/schema/encoding/scale/encoder.hpp>
#include <strongroom/schema/instruction.hpp>
#include <strongroom/schema/record.hpp>

#include <initializer_list>
#include <iterator>

using namespace strongroom::schema;

namespace {

using encoder_t = strongroom::schema::encoding::encoder<
    strongroom::schema::encoding::scale_encoder_tag>;
using error_t = std::optional<program_error_code>;
using strongroom::execution::account_info_t;
using strongroom::execution::accounts_t;
using strongroom::execution::invoke_context_t;
using strongroom::execution::operation_frame_t;

enum class frame_mode_t { initiate, vote, reap };

bytes_view_t data_of(const account_info_t& account) {
  return bytes_view_t{account.data.data(), account.data.size()};
}

error_t require_owned(const invoke_context_t& context,
                      const account_info_t& account) {
  if (account.owner != context.program_id) {
    return program_error_code::invalid_account_owner;
  }
  return std::nullopt;
}

error_t require_writable(const account_info_t& account) {
  if (!account.is_writable) {
    return program_error_code::account_not_writable;
  }
  return std::nullopt;
}

error_t require_signer(const account_info_t& account) {
  if (!account.is_signer) {
    return program_error_code::missing_required_signature;
  }
  return std::nullopt;
}

error_t require_uninitialized(const invoke_context_t& context,
                              const account_info_t& account) {
  if (auto error = require_owned(context, account)) {
    return error;
  }
  auto kind = peek_record_kind(data_of(account));
  if (!kind.has_value()) {
    return program_error_code::account_data_too_small;
  }
  if (*kind != record_kind_t::uninitialized) {
    return program_error_code::account_already_initialized;
  }
  return std::nullopt;
}

// Each role must be played by a different account. A config update targets
// the wallet itself, so one account bound to two roles is allowed.
error_t require_distinct(
    std::initializer_list<const account_info_t*> accounts) {
  for (auto it = std::begin(accounts); it != std::end(accounts); ++it) {
    if (*it == nullptr) {
      continue;
    }
    for (auto other = std::next(it); other != std::end(accounts); ++other) {
      if (*other != nullptr && *other != *it && (*other)->key == (*it)->key) {
        return program_error_code::account_mismatch;
      }
    }
  }
  return std::nullopt;
}

template <typename T>
error_t load_owned(const invoke_context_t& context,
                   const account_info_t& account,
                   T& out) {
  if (auto error = require_owned(context, account)) {
    return error;
  }
  return load_record(data_of(account), out);
}

std::size_t account_count(const operation_kind_t kind) {
  switch (kind) {
    case operation_kind_t::config_update:
      return 3;
    case operation_kind_t::balance_account_create:
    case operation_kind_t::balance_account_update:
    case operation_kind_t::whitelist_update:
    case operation_kind_t::dapp_book_update:
      return 4;
    case operation_kind_t::transfer:
    case operation_kind_t::spl_transfer:
      return 5;
    case operation_kind_t::dapp_transaction:
      return 6;
    case operation_kind_t::wallet_init:
      break;
  }
  return 0;
}

bool targets_balance_account(const operation_kind_t kind) {
  switch (kind) {
    case operation_kind_t::balance_account_create:
    case operation_kind_t::balance_account_update:
    case operation_kind_t::whitelist_update:
    case operation_kind_t::transfer:
    case operation_kind_t::spl_transfer:
    case operation_kind_t::dapp_transaction:
      return true;
    default:
      return false;
  }
}

std::optional<hash32_t> guid_of(const operation_params_t& params) {
  auto guid = std::optional<hash32_t>{};
  std::visit(
      overloaded{
          [&](const balance_account_creation_t& value) {
            guid = value.guid_hash;
          },
          [&](const balance_account_update_t& value) {
            guid = value.guid_hash;
          },
          [&](const whitelist_update_t& value) { guid = value.guid_hash; },
          [&](const transfer_t& value) { guid = value.guid_hash; },
          [&](const spl_transfer_t& value) { guid = value.guid_hash; },
          [&](const dapp_transaction_t& value) { guid = value.guid_hash; },
          [&](const auto&) {}},
      params);
  return guid;
}

std::optional<address_t> destination_of(const operation_params_t& params) {
  auto destination = std::optional<address_t>{};
  std::visit(overloaded{[&](const transfer_t& value) {
                          destination = value.destination;
                        },
                        [&](const spl_transfer_t& value) {
                          destination = value.destination;
                        },
                        [&](const auto&) {}},
             params);
  return destination;
}

error_t bind_balance_account(const invoke_context_t& context,
                             account_info_t& account,
                             const operation_kind_t kind,
                             const frame_mode_t mode,
                             const operation_params_t* params,
                             operation_frame_t& frame) {
  if (auto error = require_writable(account)) {
    return error;
  }
  if (kind == operation_kind_t::balance_account_create) {
    if (mode == frame_mode_t::reap) {
      return require_owned(context, account);
    }
    return require_uninitialized(context, account);
  }

  auto balance_account = balance_account_state_t{};
  if (auto error = load_owned(context, account, balance_account)) {
    return error;
  }
  if (balance_account.wallet != frame.wallet_account->key) {
    return program_error_code::account_mismatch;
  }
  if (params != nullptr && guid_of(*params) != balance_account.guid_hash) {
    return program_error_code::account_mismatch;
  }
  frame.balance_account = balance_account;
  return std::nullopt;
}

error_t bind_dapp_book(const invoke_context_t& context,
                       account_info_t& account,
                       operation_frame_t& frame) {
  if (account.key != frame.wallet.dapp_book) {
    return program_error_code::account_mismatch;
  }
  auto dapp_book = dapp_book_state_t{};
  if (auto error = load_owned(context, account, dapp_book)) {
    return error;
  }
  if (dapp_book.wallet != frame.wallet_account->key) {
    return program_error_code::account_mismatch;
  }
  frame.dapp_book = dapp_book;
  frame.dapp_book_account = &account;
  return std::nullopt;
}

error_t bind_dapp_accounts(const invoke_context_t& context,
                           accounts_t accounts,
                           const operation_params_t* params,
                           operation_frame_t& frame) {
  auto& program = accounts[5];
  frame.program = &program;
  frame.remaining = accounts.subspan(6);
  if (program.key == context.program_id) {
    return program_error_code::invalid_instruction;
  }
  if (!program.executable) {
    return program_error_code::account_mismatch;
  }
  for (const auto& account : frame.remaining) {
    if (account.owner == context.program_id) {
      return program_error_code::invalid_account_owner;
    }
  }
  if (params == nullptr) {
    return std::nullopt;
  }

  const auto& transaction = std::get<dapp_transaction_t>(*params);
  if (program.key != transaction.program_id ||
      frame.remaining.size() != transaction.accounts.size()) {
    return program_error_code::account_mismatch;
  }
  for (std::size_t i = 0; i < transaction.accounts.size(); ++i) {
    const auto& meta = transaction.accounts[i];
    const auto& account = frame.remaining[i];
    if (account.key != meta.address ||
        (meta.is_writable && !account.is_writable)) {
      return program_error_code::account_mismatch;
    }
  }
  return std::nullopt;
}

// Resolves the account layout shared by initiation, votes and reaping:
// [operation, wallet, caller, kind specific targets...].
error_t bind_frame(const invoke_context_t& context,
                   accounts_t accounts,
                   const operation_kind_t kind,
                   const frame_mode_t mode,
                   const operation_params_t* initiation_params,
                   operation_frame_t& frame) {
  if (kind == operation_kind_t::wallet_init) {
    return program_error_code::wallet_init_not_proposable;
  }
  if (accounts.size() < account_count(kind)) {
    return program_error_code::not_enough_account_keys;
  }

  frame.operation_account = &accounts[0];
  frame.wallet_account = &accounts[1];
  frame.caller = &accounts[2];

  if (auto error = require_writable(*frame.operation_account)) {
    return error;
  }
  if (mode == frame_mode_t::initiate) {
    if (auto error = require_uninitialized(context, *frame.operation_account)) {
      return error;
    }
  } else {
    auto operation = multisig_op_state_t{};
    if (auto error = load_owned(context, *frame.operation_account, operation)) {
      return error;
    }
    if (operation.wallet != frame.wallet_account->key) {
      return program_error_code::account_mismatch;
    }
    if (operation.kind != kind) {
      return program_error_code::operation_kind_mismatch;
    }
    frame.operation = std::move(operation);
  }

  if (auto error = load_owned(context, *frame.wallet_account, frame.wallet)) {
    return error;
  }
  if (mode != frame_mode_t::reap) {
    if (auto error = require_signer(*frame.caller)) {
      return error;
    }
  }

  const auto* params = initiation_params;
  if (params == nullptr && frame.operation.has_value() &&
      frame.operation->params.has_value()) {
    params = &frame.operation->params.value();
  }

  if (kind == operation_kind_t::config_update) {
    frame.target_account = frame.wallet_account;
    if (auto error = require_writable(*frame.wallet_account)) {
      return error;
    }
  } else if (kind == operation_kind_t::dapp_book_update) {
    frame.target_account = &accounts[3];
    if (auto error = require_writable(accounts[3])) {
      return error;
    }
    if (auto error = bind_dapp_book(context, accounts[3], frame)) {
      return error;
    }
  } else if (targets_balance_account(kind)) {
    frame.target_account = &accounts[3];
    if (auto error = bind_balance_account(context, accounts[3], kind, mode,
                                          params, frame)) {
      return error;
    }
  }

  if (frame.operation.has_value() &&
      frame.operation->target != frame.target_account->key) {
    return program_error_code::account_mismatch;
  }

  if (kind == operation_kind_t::transfer ||
      kind == operation_kind_t::spl_transfer) {
    frame.destination = &accounts[4];
    if (auto error = require_writable(*frame.destination)) {
      return error;
    }
    if (params != nullptr &&
        destination_of(*params) != frame.destination->key) {
      return program_error_code::account_mismatch;
    }
  }

  if (kind == operation_kind_t::dapp_transaction) {
    if (auto error = bind_dapp_book(context, accounts[4], frame)) {
      return error;
    }
    if (auto error = bind_dapp_accounts(context, accounts, params, frame)) {
      return error;
    }
  }
  return require_distinct({frame.operation_account, frame.wallet_account,
                           frame.target_account, frame.destination,
                           frame.dapp_book_account, frame.program});
}

strongroom::schema::program_result_t route_init_wallet(
    const invoke_context_t& context,
    accounts_t accounts,
    const wallet_init_t& init) {
  if (accounts.size() < 3) {
    return strongroom::execution::make_error_result(
        program_error_code::not_enough_account_keys);
  }
  auto& wallet = accounts[0];
  auto& dapp_book = accounts[1];
  auto& initiator = accounts[2];
  if (wallet.key == dapp_book.key) {
    return strongroom::execution::make_error_result(
        program_error_code::account_mismatch);
  }
  for (const auto* account : {&wallet, &dapp_book}) {
    if (auto error = require_writable(*account)) {
      return strongroom::execution::make_error_result(*error);
    }
    if (auto error = require_uninitialized(context, *account)) {
      return strongroom::execution::make_error_result(*error);
    }
  }
  if (auto error = require_signer(initiator)) {
    return strongroom::execution::make_error_result(*error);
  }
  auto machine = strongroom::execution::operation_machine{context};
  return machine.init_wallet(wallet, dapp_book, init);
}

strongroom::schema::program_result_t route_close(const invoke_context_t& context,
                                                 accounts_t accounts) {
  if (accounts.size() < 2) {
    return strongroom::execution::make_error_result(
        program_error_code::not_enough_account_keys);
  }
  auto& operation = accounts[0];
  auto& rent_collector = accounts[1];
  if (auto error = require_owned(context, operation)) {
    return strongroom::execution::make_error_result(*error);
  }
  if (peek_record_kind(data_of(operation)) != record_kind_t::multisig_op) {
    return strongroom::execution::make_error_result(
        program_error_code::invalid_account_kind);
  }
  for (const auto* account : {&operation, &rent_collector}) {
    if (auto error = require_writable(*account)) {
      return strongroom::execution::make_error_result(*error);
    }
  }
  auto machine = strongroom::execution::operation_machine{context};
  return machine.close(operation, rent_collector);
}

}  // namespace

namespace strongroom::execution {

program_result_t process_instruction(const invoke_context_t& context,
                                     accounts_t accounts,
                                     const bytes_view_t& instruction_data) {
  auto encoder = encoder_t{};
  auto instruction = encoder.try_decode<instruction_t>(instruction_data);
  if (!instruction.has_value()) {
    spdlog::debug("Rejected undecodable instruction ({} bytes)",
                  instruction_data.size());
    return make_error_result(program_error_code::invalid_instruction);
  }
  if (version_of(*instruction) != kInstructionVersion) {
    return make_error_result(
        program_error_code::unsupported_instruction_version);
  }

  if (const auto* init = std::get_if<wallet_init_t>(&instruction.value())) {
    return route_init_wallet(context, accounts, *init);
  }
  if (std::holds_alternative<close_operation_t>(*instruction)) {
    return route_close(context, accounts);
  }

  auto machine = operation_machine{context};
  auto frame = operation_frame_t{};
  if (auto params = to_operation_params(*instruction)) {
    if (auto error = bind_frame(context, accounts, kind_of(*params),
                                frame_mode_t::initiate, &params.value(),
                                frame)) {
      return make_error_result(*error);
    }
    return machine.initiate(frame, *params);
  }

  auto result = program_result_t{};
  std::visit(
      overloaded{
          [&](const approve_t& value) {
            if (auto error = bind_frame(context, accounts, value.kind,
                                        frame_mode_t::vote, nullptr, frame)) {
              result = make_error_result(*error);
              return;
            }
            result = machine.vote(frame, value.params_hash, vote_t::approve);
          },
          [&](const disapprove_t& value) {
            if (auto error = bind_frame(context, accounts, value.kind,
                                        frame_mode_t::vote, nullptr, frame)) {
              result = make_error_result(*error);
              return;
            }
            result =
                machine.vote(frame, value.params_hash, vote_t::disapprove);
          },
          [&](const reap_operation_t& value) {
            if (auto error = bind_frame(context, accounts, value.kind,
                                        frame_mode_t::reap, nullptr, frame)) {
              result = make_error_result(*error);
              return;
            }
            result = machine.reap(frame);
          },
          [&](const auto&) {
            result = make_error_result(program_error_code::invalid_instruction);
          }},
      *instruction);
  return result;
}

}  // namespace strongroom::execution
