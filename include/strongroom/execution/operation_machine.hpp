#pragma once

#include <strongroom/execution/account_info.hpp>
#include <strongroom/execution/invoke_context.hpp>
#include <strongroom/schema/balance_account_state.hpp>
#include <strongroom/schema/dapp_book_state.hpp>
#include <strongroom/schema/multisig_op_state.hpp>
#include <strongroom/schema/operation_params.hpp>
#include <strongroom/schema/primitives.hpp>
#include <strongroom/schema/program_error_code.hpp>
#include <strongroom/schema/program_result.hpp>
#include <strongroom/schema/vote.hpp>
#include <strongroom/schema/wallet_state.hpp>

#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace strongroom::execution {

/// BLAKE3 digest of the SCALE encoded params; voters echo it back.
strongroom::schema::hash32_t hash_params(
    const strongroom::schema::operation_params_t& params);

/// Accounts and decoded records of one operation instruction, already
/// checked by the router for ownership, kind, writability and linkage.
///
/// `target_account` is the record the operation mutates: the wallet for
/// config updates, the balance account for balance account, whitelist,
/// transfer and dapp kinds, the dapp book for dapp book updates.
struct operation_frame_t final {
  account_info_t* operation_account{};
  account_info_t* wallet_account{};
  account_info_t* caller{};
  account_info_t* target_account{};
  account_info_t* destination{};
  account_info_t* dapp_book_account{};
  account_info_t* program{};
  accounts_t remaining{};

  std::optional<strongroom::schema::multisig_op_state_t> operation{};
  strongroom::schema::wallet_state_t wallet{};
  std::optional<strongroom::schema::balance_account_state_t> balance_account{};
  std::optional<strongroom::schema::dapp_book_state_t> dapp_book{};
};

/// Lifecycle of a multisig operation: Pending -> {Approved, Rejected,
/// Expired}.
///
/// Every transition stages its record images first and writes them only
/// after all checks and host primitives succeeded, so a failed call leaves
/// every account untouched.
class operation_machine final {
 public:
  explicit operation_machine(const invoke_context_t& context);

  /// Create the wallet and its empty dapp book.
  strongroom::schema::program_result_t init_wallet(
      account_info_t& wallet_account,
      account_info_t& dapp_book_account,
      const strongroom::schema::wallet_init_t& init);

  /// Start a new operation. The initiator's approval is recorded and quorum
  /// is evaluated immediately.
  strongroom::schema::program_result_t initiate(
      operation_frame_t& frame,
      const strongroom::schema::operation_params_t& params);

  /// Record an approval or disapproval against the live wallet config.
  strongroom::schema::program_result_t vote(
      operation_frame_t& frame,
      const strongroom::schema::hash32_t& params_hash,
      strongroom::schema::vote_t vote);

  /// Expire a pending operation whose deadline has passed.
  strongroom::schema::program_result_t reap(operation_frame_t& frame);

  /// Zero a terminal operation and return its lamports to the initiator.
  strongroom::schema::program_result_t close(account_info_t& operation_account,
                                             account_info_t& rent_collector);

 private:
  using error_t = std::optional<strongroom::schema::program_error_code>;

  class staged_writes final {
   public:
    template <typename T>
    error_t stage(account_info_t& account, const T& record);
    void commit();

   private:
    std::vector<std::pair<account_info_t*, strongroom::schema::bytes_t>>
        images_;
  };

  error_t validate_initiation(
      const operation_frame_t& frame,
      const strongroom::schema::operation_params_t& params) const;
  error_t authorize_voter(const operation_frame_t& frame) const;
  error_t recheck_policy(const operation_frame_t& frame) const;
  error_t apply_to_target(operation_frame_t& frame) const;
  error_t run_host_effect(const operation_frame_t& frame) const;
  void set_lock(operation_frame_t& frame, bool locked) const;
  std::size_t threshold(const operation_frame_t& frame) const;

  /// Re-evaluate quorum; on approval apply the mutation and queue the host
  /// effect, on rejection release locks.
  error_t settle(operation_frame_t& frame, bool& run_effect) const;
  strongroom::schema::program_result_t commit(operation_frame_t& frame,
                                              bool run_effect,
                                              std::string_view info) const;

  const invoke_context_t& context_;
};

}  // namespace strongroom::execution
