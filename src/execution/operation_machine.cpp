#include <spdlog/spdlog.h>
#include <strongroom/blake3/hash.hpp>
#include <strongroom/execution/mutation.hpp>
#include <strongroom/execution/operation_machine.hpp>
#include <strongroom/execution/result.hpp>
#include <strongroom/policy/evaluator.hpp>
#include <strongroom/schema/encoding/scale/encoder.hpp>
#include <strongroom/schema/limits.hpp>
#include <strongroom/schema/record.hpp>

#include <algorithm>
#include <iterator>

using namespace strongroom::schema;

namespace {

using encoder_t = strongroom::schema::encoding::encoder<
    strongroom::schema::encoding::scale_encoder_tag>;
using error_t = std::optional<program_error_code>;

error_t check_transfer(const balance_account_state_t& balance_account,
                       const address_t& destination,
                       const amount_t amount,
                       const asset_ref_t& asset) {
  if (!balance_account.active) {
    return program_error_code::balance_account_inactive;
  }
  if (amount == 0) {
    return program_error_code::invalid_amount;
  }
  if (!(balance_account.asset == asset)) {
    return program_error_code::asset_mismatch;
  }
  if (!strongroom::policy::destination_allowed(balance_account, destination)) {
    return program_error_code::destination_not_whitelisted;
  }
  return std::nullopt;
}

error_t check_dapp_transaction(const balance_account_state_t& balance_account,
                               const dapp_book_state_t& dapp_book,
                               const dapp_transaction_t& transaction) {
  if (!balance_account.active) {
    return program_error_code::balance_account_inactive;
  }
  if (!strongroom::policy::dapps_allowed(balance_account)) {
    return program_error_code::dapps_disabled;
  }
  if (!strongroom::policy::program_allowed(dapp_book, transaction.program_id)) {
    return program_error_code::program_not_whitelisted;
  }
  if (transaction.payload.size() > kMaxDAppPayload ||
      transaction.accounts.size() > kMaxDAppAccounts) {
    return program_error_code::invalid_instruction;
  }
  return std::nullopt;
}

asset_ref_t native_asset() {
  return asset_ref_t{.kind = asset_kind_t::native, .mint = make_zero_hash()};
}

asset_ref_t token_asset(const address_t& mint) {
  return asset_ref_t{.kind = asset_kind_t::token, .mint = mint};
}

}  // namespace

namespace strongroom::execution {

hash32_t hash_params(const operation_params_t& params) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(params);
  return strongroom::blake3::hash(bytes_view_t{encoded.data(), encoded.size()});
}

template <typename T>
operation_machine::error_t operation_machine::staged_writes::stage(
    account_info_t& account,
    const T& record) {
  auto image = bytes_t{};
  if (auto error = encode_record(record, account.data.size(), image)) {
    return error;
  }
  images_.emplace_back(&account, std::move(image));
  return std::nullopt;
}

void operation_machine::staged_writes::commit() {
  for (auto& [account, image] : images_) {
    account->data = std::move(image);
  }
  images_.clear();
}

operation_machine::operation_machine(const invoke_context_t& context)
    : context_{context} {}

program_result_t operation_machine::init_wallet(
    account_info_t& wallet_account,
    account_info_t& dapp_book_account,
    const wallet_init_t& init) {
  auto wallet = wallet_state_t{};
  if (auto error = apply_mutation(wallet, operation_params_t{init})) {
    return make_error_result(*error);
  }
  wallet.dapp_book = dapp_book_account.key;
  auto dapp_book =
      dapp_book_state_t{.wallet = wallet_account.key, .revision = 1};

  auto writes = staged_writes{};
  if (auto error = writes.stage(wallet_account, wallet)) {
    return make_error_result(*error);
  }
  if (auto error = writes.stage(dapp_book_account, dapp_book)) {
    return make_error_result(*error);
  }
  writes.commit();

  spdlog::info("Initialized wallet {} with {} signer(s), quorum {}",
               to_hex(wallet_account.key), wallet.signers.count, wallet.quorum);
  return make_success_result("wallet initialized", wallet.revision);
}

operation_machine::error_t operation_machine::validate_initiation(
    const operation_frame_t& frame,
    const operation_params_t& params) const {
  const auto& wallet_key = frame.wallet_account->key;
  auto error = error_t{};
  std::visit(
      overloaded{
          [&](const wallet_init_t&) {
            error = program_error_code::wallet_init_not_proposable;
          },
          [&](const wallet_config_update_t&) {
            if (frame.wallet.config_update_locked) {
              error = program_error_code::concurrent_operation_not_allowed;
              return;
            }
            auto scratch = frame.wallet;
            error = apply_mutation(scratch, params);
          },
          [&](const balance_account_creation_t&) {
            auto scratch = balance_account_state_t{};
            error = apply_mutation(scratch, wallet_key, frame.wallet, params);
          },
          [&](const balance_account_update_t&) {
            if (frame.balance_account->policy_update_locked) {
              error = program_error_code::concurrent_operation_not_allowed;
              return;
            }
            auto scratch = *frame.balance_account;
            error = apply_mutation(scratch, wallet_key, frame.wallet, params);
          },
          [&](const whitelist_update_t&) {
            if (frame.balance_account->policy_update_locked) {
              error = program_error_code::concurrent_operation_not_allowed;
              return;
            }
            auto scratch = *frame.balance_account;
            error = apply_mutation(scratch, wallet_key, frame.wallet, params);
          },
          [&](const transfer_t& value) {
            error = check_transfer(*frame.balance_account, value.destination,
                                   value.amount, native_asset());
          },
          [&](const spl_transfer_t& value) {
            error = check_transfer(*frame.balance_account, value.destination,
                                   value.amount, token_asset(value.mint));
          },
          [&](const dapp_transaction_t& value) {
            error = check_dapp_transaction(*frame.balance_account,
                                           *frame.dapp_book, value);
          },
          [&](const dapp_book_update_t&) {
            if (frame.dapp_book->update_locked) {
              error = program_error_code::concurrent_operation_not_allowed;
              return;
            }
            auto scratch = *frame.dapp_book;
            error = apply_mutation(scratch, params);
          }},
      params);
  return error;
}

operation_machine::error_t operation_machine::authorize_voter(
    const operation_frame_t& frame) const {
  const auto& key = frame.caller->key;
  if (frame.wallet.signers.contains(key)) {
    return std::nullopt;
  }
  if (frame.wallet.guardians.contains(key)) {
    if (strongroom::policy::is_high_risk(frame.operation->kind)) {
      return std::nullopt;
    }
    return program_error_code::guardian_not_permitted;
  }
  return program_error_code::unauthorized_signer;
}

operation_machine::error_t operation_machine::recheck_policy(
    const operation_frame_t& frame) const {
  auto error = error_t{};
  std::visit(overloaded{[&](const transfer_t& value) {
                          error = check_transfer(*frame.balance_account,
                                                 value.destination,
                                                 value.amount, native_asset());
                        },
                        [&](const spl_transfer_t& value) {
                          error = check_transfer(
                              *frame.balance_account, value.destination,
                              value.amount, token_asset(value.mint));
                        },
                        [&](const dapp_transaction_t& value) {
                          error = check_dapp_transaction(
                              *frame.balance_account, *frame.dapp_book, value);
                        },
                        [&](const auto&) {}},
             *frame.operation->params);
  return error;
}

operation_machine::error_t operation_machine::apply_to_target(
    operation_frame_t& frame) const {
  const auto& params = *frame.operation->params;
  const auto& wallet_key = frame.wallet_account->key;
  auto error = error_t{};
  std::visit(
      overloaded{[&](const wallet_config_update_t&) {
                   error = apply_mutation(frame.wallet, params);
                 },
                 [&](const balance_account_creation_t&) {
                   auto created = balance_account_state_t{};
                   error = apply_mutation(created, wallet_key, frame.wallet,
                                          params);
                   if (!error) {
                     frame.balance_account = created;
                   }
                 },
                 [&](const balance_account_update_t&) {
                   error = apply_mutation(*frame.balance_account, wallet_key,
                                          frame.wallet, params);
                 },
                 [&](const whitelist_update_t&) {
                   error = apply_mutation(*frame.balance_account, wallet_key,
                                          frame.wallet, params);
                 },
                 [&](const dapp_book_update_t&) {
                   error = apply_mutation(*frame.dapp_book, params);
                 },
                 [&](const auto&) {}},
      params);
  return error;
}

operation_machine::error_t operation_machine::run_host_effect(
    const operation_frame_t& frame) const {
  const auto& authority = frame.target_account->key;
  auto& host = context_.host;
  auto error = error_t{};
  std::visit(
      overloaded{
          [&](const transfer_t& value) {
            if (!host.transfer_native) {
              error = program_error_code::external_invocation_failed;
              return;
            }
            error = host.transfer_native(authority, value.destination,
                                         value.amount);
          },
          [&](const spl_transfer_t& value) {
            if (!host.transfer_token) {
              error = program_error_code::external_invocation_failed;
              return;
            }
            error = host.transfer_token(authority, value.destination,
                                        value.mint, value.amount);
          },
          [&](const dapp_transaction_t& value) {
            if (!host.invoke) {
              error = program_error_code::external_invocation_failed;
              return;
            }
            error = host.invoke(
                value.program_id, authority, frame.remaining,
                bytes_view_t{value.payload.data(), value.payload.size()});
          },
          [&](const auto&) {}},
      *frame.operation->params);
  return error;
}

void operation_machine::set_lock(operation_frame_t& frame,
                                 const bool locked) const {
  switch (frame.operation->kind) {
    case operation_kind_t::config_update:
      frame.wallet.config_update_locked = locked;
      break;
    case operation_kind_t::balance_account_update:
    case operation_kind_t::whitelist_update:
      if (frame.balance_account.has_value()) {
        frame.balance_account->policy_update_locked = locked;
      }
      break;
    case operation_kind_t::dapp_book_update:
      if (frame.dapp_book.has_value()) {
        frame.dapp_book->update_locked = locked;
      }
      break;
    default:
      break;
  }
}

std::size_t operation_machine::threshold(const operation_frame_t& frame) const {
  const auto* balance_account = frame.balance_account.has_value()
                                    ? &frame.balance_account.value()
                                    : nullptr;
  return strongroom::policy::required_threshold(
      frame.wallet, *frame.operation->params, balance_account);
}

operation_machine::error_t operation_machine::settle(operation_frame_t& frame,
                                                     bool& run_effect) const {
  auto& operation = *frame.operation;
  auto status =
      strongroom::policy::evaluate(frame.wallet, operation, threshold(frame));
  if (status == operation_status_t::approved) {
    if (auto error = recheck_policy(frame)) {
      return error;
    }
    if (auto error = apply_to_target(frame)) {
      return error;
    }
    set_lock(frame, false);
    operation.status = operation_status_t::approved;
    run_effect = true;
  } else if (status == operation_status_t::rejected) {
    set_lock(frame, false);
    operation.status = operation_status_t::rejected;
  }
  return std::nullopt;
}

program_result_t operation_machine::commit(operation_frame_t& frame,
                                           const bool run_effect,
                                           const std::string_view info) const {
  const auto& operation = *frame.operation;
  auto writes = staged_writes{};
  if (auto error = writes.stage(*frame.operation_account, operation)) {
    return make_error_result(*error);
  }

  auto revision = uint64_t{};
  auto error = error_t{};
  switch (operation.kind) {
    case operation_kind_t::config_update:
      error = writes.stage(*frame.wallet_account, frame.wallet);
      revision = frame.wallet.revision;
      break;
    case operation_kind_t::balance_account_create:
    case operation_kind_t::balance_account_update:
    case operation_kind_t::whitelist_update:
      if (frame.balance_account.has_value()) {
        error = writes.stage(*frame.target_account, *frame.balance_account);
        revision = frame.balance_account->revision;
      }
      break;
    case operation_kind_t::dapp_book_update:
      error = writes.stage(*frame.target_account, *frame.dapp_book);
      revision = frame.dapp_book->revision;
      break;
    default:
      if (frame.balance_account.has_value()) {
        revision = frame.balance_account->revision;
      }
      break;
  }
  if (error) {
    return make_error_result(*error);
  }

  if (run_effect) {
    if (auto effect_error = run_host_effect(frame)) {
      spdlog::warn("Host primitive failed for {} operation: {}",
                   to_string(operation.kind), to_string(*effect_error));
      return make_error_result(*effect_error);
    }
  }
  writes.commit();

  spdlog::debug("Operation {} ({}) is {} with {} vote(s)",
                to_hex(frame.operation_account->key), to_string(operation.kind),
                to_string(operation.status), operation.votes.count);
  return make_success_result(info, revision, operation.status);
}

program_result_t operation_machine::initiate(operation_frame_t& frame,
                                             const operation_params_t& params) {
  const auto& caller = *frame.caller;
  if (!frame.wallet.signers.contains(caller.key)) {
    return make_error_result(program_error_code::unauthorized_signer);
  }
  if (auto error = validate_initiation(frame, params)) {
    return make_error_result(*error);
  }

  const auto* balance_account = frame.balance_account.has_value()
                                    ? &frame.balance_account.value()
                                    : nullptr;
  auto timeout = strongroom::policy::approval_timeout(frame.wallet,
                                                      balance_account);
  frame.operation = multisig_op_state_t{
      .wallet = frame.wallet_account->key,
      .initiator = caller.key,
      .target = frame.target_account->key,
      .kind = kind_of(params),
      .params_hash = hash_params(params),
      .params = params,
      .started_at = context_.now,
      .expires_at = context_.now + timeout};
  frame.operation->votes.add(
      vote_record_t{.voter = caller.key, .vote = vote_t::approve});
  set_lock(frame, true);

  auto run_effect = false;
  if (auto error = settle(frame, run_effect)) {
    return make_error_result(*error);
  }
  spdlog::info("Initiated {} operation {} by {}",
               to_string(frame.operation->kind),
               to_hex(frame.operation_account->key), to_hex(caller.key));
  return commit(frame, run_effect, "operation initiated");
}

program_result_t operation_machine::vote(operation_frame_t& frame,
                                         const hash32_t& params_hash,
                                         const vote_t vote) {
  auto& operation = *frame.operation;
  if (operation.status == operation_status_t::expired) {
    return make_error_result(program_error_code::operation_expired);
  }
  if (operation.status != operation_status_t::pending) {
    return make_error_result(program_error_code::operation_not_pending);
  }
  if (!strongroom::policy::within_validity_window(
          context_.now, operation.started_at, operation.expires_at)) {
    return make_error_result(program_error_code::operation_expired);
  }
  if (params_hash != operation.params_hash) {
    return make_error_result(program_error_code::params_hash_mismatch);
  }
  if (auto error = authorize_voter(frame)) {
    return make_error_result(*error);
  }
  const auto& voter = frame.caller->key;
  auto previous = operation.votes.find(
      voter, [](const vote_record_t& record) { return record.voter; });
  if (previous.has_value()) {
    return make_error_result(program_error_code::duplicate_vote);
  }
  if (!operation.votes.add(vote_record_t{.voter = voter, .vote = vote})) {
    return make_error_result(program_error_code::too_many_signers);
  }

  auto run_effect = false;
  if (auto error = settle(frame, run_effect)) {
    return make_error_result(*error);
  }
  return commit(frame, run_effect,
                vote == vote_t::approve ? "approval recorded"
                                        : "disapproval recorded");
}

program_result_t operation_machine::reap(operation_frame_t& frame) {
  auto& operation = *frame.operation;
  if (operation.status != operation_status_t::pending) {
    return make_error_result(program_error_code::operation_not_pending);
  }
  if (context_.now <= operation.expires_at) {
    return make_error_result(program_error_code::operation_not_expired);
  }
  operation.status = operation_status_t::expired;
  operation.params = std::nullopt;
  set_lock(frame, false);
  spdlog::info("Reaped expired {} operation {}", to_string(operation.kind),
               to_hex(frame.operation_account->key));
  return commit(frame, false, "operation expired");
}

program_result_t operation_machine::close(account_info_t& operation_account,
                                          account_info_t& rent_collector) {
  auto operation = multisig_op_state_t{};
  if (auto error = load_record(
          bytes_view_t{operation_account.data.data(),
                       operation_account.data.size()},
          operation)) {
    return make_error_result(*error);
  }
  if (!is_terminal(operation.status)) {
    return make_error_result(program_error_code::operation_not_terminal);
  }
  if (rent_collector.key != operation.initiator) {
    return make_error_result(program_error_code::account_mismatch);
  }
  rent_collector.lamports += operation_account.lamports;
  operation_account.lamports = 0;
  std::fill(std::begin(operation_account.data),
            std::end(operation_account.data), uint8_t{0});
  return make_success_result("operation closed", 0, operation.status);
}

}  // namespace strongroom::execution
