#pragma once

#include <strongroom/execution/account_info.hpp>
#include <strongroom/execution/invoke_context.hpp>
#include <strongroom/schema/account_record.hpp>
#include <strongroom/schema/encoding/scale/encoder.hpp>
#include <strongroom/schema/primitives.hpp>
#include <strongroom/schema/transaction.hpp>
#include <strongroom/schema/transaction_error_code.hpp>
#include <strongroom/schema/transaction_result.hpp>
#include <strongroom/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string_view>

namespace strongroom::runtime {

using signature_verifier_t =
    std::function<bool(const strongroom::schema::bytes_view_t& message,
                       const strongroom::schema::address_t& signer,
                       const strongroom::schema::ed25519_signature_t& signature)>;

/// Program the ledger can invoke on behalf of the wallet program (or
/// directly from a transaction, then with a zero authority).
using external_program_t = std::function<strongroom::execution::host_error_t(
    const strongroom::schema::address_t& authority,
    strongroom::execution::accounts_t accounts,
    const strongroom::schema::bytes_view_t& payload)>;

inline constexpr auto kLedgerCodespace = std::string_view{"strongroom.ledger"};

/// Id of the built-in system program.
inline constexpr auto kSystemProgramId = strongroom::schema::address_t{};

/// Bytes every signer of `tx` signs: SCALE of
/// (version, chain_id, nonce, signers, instructions).
strongroom::schema::bytes_t make_signing_payload(
    const strongroom::schema::transaction_t& tx);

/// Minimal deterministic host for the wallet program.
///
/// Executes one signed transaction at a time. Every instruction of a
/// transaction runs against a shared working set; if any instruction fails
/// the working set is dropped and only the payer's nonce advances. A
/// successful transaction is written in a single RocksDB batch and folded
/// into the state root.
class ledger final {
 public:
  using encoder_t = strongroom::schema::encoding::encoder<
      strongroom::schema::encoding::scale_encoder_tag>;
  using storage_t =
      strongroom::storage::storage<strongroom::storage::rocksdb_storage_tag>;

  ledger(encoder_t& encoder,
         storage_t& storage,
         const strongroom::schema::hash32_t& chain_id,
         const strongroom::schema::address_t& wallet_program_id);

  /// Replace the ed25519 verifier (OpenSSL by default).
  void set_signature_verifier(signature_verifier_t verifier);

  /// Clock handed to the program as `now` for subsequent transactions.
  void set_block_time(strongroom::schema::timestamp_milliseconds_t now);
  strongroom::schema::timestamp_milliseconds_t block_time() const;

  /// Genesis helpers; they bypass transactions.
  void credit(const strongroom::schema::address_t& address, uint64_t lamports);
  void mint_tokens(const strongroom::schema::address_t& owner,
                   const strongroom::schema::address_t& mint,
                   strongroom::schema::amount_t amount);

  /// Register an invocable program and mark its account executable.
  void register_program(const strongroom::schema::address_t& program_id,
                        external_program_t program);

  strongroom::schema::transaction_result_t execute(
      const strongroom::schema::bytes_view_t& raw_tx);
  strongroom::schema::transaction_result_t execute(
      const strongroom::schema::transaction_t& tx);

  std::optional<strongroom::schema::account_record_t> account(
      const strongroom::schema::address_t& address) const;
  strongroom::schema::amount_t token_balance(
      const strongroom::schema::address_t& owner,
      const strongroom::schema::address_t& mint) const;
  uint64_t nonce(const strongroom::schema::address_t& signer) const;
  strongroom::schema::hash32_t state_root() const;
  uint64_t height() const;
  const strongroom::schema::hash32_t& chain_id() const;

 private:
  using token_key_t =
      std::pair<strongroom::schema::address_t, strongroom::schema::address_t>;

  struct working_set final {
    std::map<strongroom::schema::address_t,
             strongroom::schema::account_record_t>
        accounts;
    std::map<token_key_t, strongroom::schema::amount_t> tokens;
  };

  strongroom::schema::transaction_result_t validate_transaction(
      const strongroom::schema::transaction_t& tx) const;
  strongroom::schema::transaction_result_t execute_instruction(
      const strongroom::schema::transaction_t& tx,
      const strongroom::schema::ledger_instruction_t& instruction,
      working_set& working);
  std::optional<strongroom::schema::transaction_error_code> run_system_program(
      strongroom::execution::accounts_t accounts,
      const strongroom::schema::bytes_view_t& data) const;

  strongroom::schema::account_record_t& load_account(
      working_set& working,
      const strongroom::schema::address_t& address) const;
  strongroom::schema::amount_t& load_tokens(
      working_set& working,
      const strongroom::schema::address_t& owner,
      const strongroom::schema::address_t& mint) const;
  std::optional<strongroom::schema::account_record_t> read_account(
      const strongroom::schema::address_t& address) const;
  strongroom::schema::amount_t read_tokens(
      const strongroom::schema::address_t& owner,
      const strongroom::schema::address_t& mint) const;
  uint64_t read_nonce(const strongroom::schema::address_t& signer) const;

  mutable std::mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  strongroom::schema::hash32_t chain_id_{};
  strongroom::schema::address_t wallet_program_id_{};
  strongroom::schema::timestamp_milliseconds_t block_time_{};
  uint64_t height_{};
  strongroom::schema::hash32_t state_root_{};
  signature_verifier_t signature_verifier_;
  std::map<strongroom::schema::address_t, external_program_t> programs_;
};

}  // namespace strongroom::runtime
