#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <limits>
#include <set>
#include <strongroom/blake3/hash.hpp>
#include <strongroom/common/critical.hpp>
#include <strongroom/crypto/verify.hpp>
#include <strongroom/execution/router.hpp>
#include <strongroom/runtime/ledger.hpp>
#include <strongroom/schema/key/ledger_keys.hpp>
#include <strongroom/schema/system_instruction.hpp>
#include <tuple>
#include <utility>

using namespace strongroom::schema;

namespace {

using strongroom::execution::account_info_t;
using strongroom::execution::accounts_t;
using strongroom::execution::host_error_t;
using strongroom::execution::host_services_t;
using strongroom::execution::invoke_context_t;

using ledger_error_t = std::optional<transaction_error_code>;

// Largest account a create_account instruction may allocate.
constexpr auto kMaxAccountSpace = uint64_t{10 * 1024 * 1024};

hash32_t fold_state_root(const hash32_t& seed,
                         const bytes_view_t& tx,
                         uint64_t height) {
  auto material = bytes_t{};
  material.reserve(seed.size() + tx.size() + 8);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(tx), std::end(tx));

  auto encoder = strongroom::runtime::ledger::encoder_t{};
  auto encoded_height = encoder.encode(height);
  material.insert(std::end(material), std::begin(encoded_height),
                  std::end(encoded_height));
  return strongroom::blake3::hash(bytes_view_t{material.data(), material.size()});
}

transaction_result_t make_ledger_error(const transaction_error_code code,
                                       const std::string_view log,
                                       const std::string_view info = {}) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{log};
  result.info = std::string{info};
  result.codespace = std::string{strongroom::runtime::kLedgerCodespace};
  return result;
}

void set_ledger_error(transaction_result_t& result,
                      const transaction_error_code code,
                      const std::string_view log,
                      const std::string_view info = {}) {
  auto error = make_ledger_error(code, log, info);
  result.code = error.code;
  result.log = std::move(error.log);
  result.info = std::move(error.info);
  result.codespace = std::move(error.codespace);
}

account_info_t* find_account(accounts_t accounts, const address_t& key) {
  auto it = std::find_if(
      std::begin(accounts), std::end(accounts),
      [&](const account_info_t& account) { return account.key == key; });
  if (it == std::end(accounts)) {
    return nullptr;
  }
  return &*it;
}

bool contains(const std::vector<address_t>& keys, const address_t& key) {
  return std::find(std::begin(keys), std::end(keys), key) != std::end(keys);
}

}  // namespace

namespace strongroom::runtime {

bytes_t make_signing_payload(const transaction_t& tx) {
  auto encoder = ledger::encoder_t{};
  return encoder.encode(std::tuple{tx.version, tx.chain_id, tx.nonce,
                                   tx.signers, tx.instructions});
}

ledger::ledger(encoder_t& encoder,
               storage_t& storage,
               const hash32_t& chain_id,
               const address_t& wallet_program_id)
    : encoder_{encoder},
      storage_{storage},
      chain_id_{chain_id},
      wallet_program_id_{wallet_program_id},
      signature_verifier_{[](const bytes_view_t& message,
                             const address_t& signer,
                             const ed25519_signature_t& signature) {
        return strongroom::crypto::verify_signature(message, signer,
                                                    signature);
      }} {
  auto lock = std::scoped_lock{mutex_};
  auto committed = storage_.load_committed_state();
  if (committed.has_value()) {
    height_ = committed->height;
    state_root_ = committed->state_root;
  } else {
    state_root_ = make_zero_hash();
  }
  if (!strongroom::crypto::available()) {
    spdlog::warn("OpenSSL ed25519 is unavailable; signatures will not verify");
  }
  spdlog::info("Ledger ready at height {} with state root {}", height_,
               to_hex(bytes_view_t{state_root_.data(), state_root_.size()}));
}

void ledger::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  signature_verifier_ = std::move(verifier);
}

void ledger::set_block_time(const timestamp_milliseconds_t now) {
  auto lock = std::scoped_lock{mutex_};
  block_time_ = now;
}

timestamp_milliseconds_t ledger::block_time() const {
  auto lock = std::scoped_lock{mutex_};
  return block_time_;
}

void ledger::credit(const address_t& address, const uint64_t lamports) {
  auto lock = std::scoped_lock{mutex_};
  auto record = read_account(address).value_or(account_record_t{});
  if (record.lamports > std::numeric_limits<uint64_t>::max() - lamports) {
    strongroom::common::critical("credit overflows account lamports");
  }
  record.lamports += lamports;
  auto key = key::make_account_key(encoder_, address);
  storage_.put(encoder_, bytes_view_t{key.data(), key.size()}, record);
}

void ledger::mint_tokens(const address_t& owner,
                         const address_t& mint,
                         const amount_t amount) {
  auto lock = std::scoped_lock{mutex_};
  auto balance = read_tokens(owner, mint);
  if (balance > std::numeric_limits<amount_t>::max() - amount) {
    strongroom::common::critical("mint overflows token balance");
  }
  auto key = key::make_token_balance_key(encoder_, owner, mint);
  storage_.put(encoder_, bytes_view_t{key.data(), key.size()},
               amount_t{balance + amount});
}

void ledger::register_program(const address_t& program_id,
                              external_program_t program) {
  auto lock = std::scoped_lock{mutex_};
  programs_[program_id] = std::move(program);
  auto record = read_account(program_id).value_or(account_record_t{});
  record.executable = true;
  auto key = key::make_account_key(encoder_, program_id);
  storage_.put(encoder_, bytes_view_t{key.data(), key.size()}, record);
  spdlog::info("Registered program {}",
               to_hex(bytes_view_t{program_id.data(), program_id.size()}));
}

transaction_result_t ledger::execute(const transaction_t& tx) {
  auto raw_tx = encoder_.encode(tx);
  return execute(bytes_view_t{raw_tx.data(), raw_tx.size()});
}

transaction_result_t ledger::execute(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto maybe_tx = encoder_.try_decode<transaction_t>(raw_tx);
  if (!maybe_tx.has_value()) {
    return make_ledger_error(transaction_error_code::invalid_transaction,
                             "invalid transaction",
                             "failed to decode transaction");
  }
  const auto& tx = maybe_tx.value();
  auto result = validate_transaction(tx);
  if (result.code != 0) {
    spdlog::debug("Rejected transaction: {}", result.log);
    return result;
  }

  auto working = working_set{};
  auto failed = false;
  for (const auto& instruction : tx.instructions) {
    auto instruction_result = execute_instruction(tx, instruction, working);
    std::move(std::begin(instruction_result.instruction_results),
              std::end(instruction_result.instruction_results),
              std::back_inserter(result.instruction_results));
    if (instruction_result.code != 0) {
      result.code = instruction_result.code;
      result.log = std::move(instruction_result.log);
      result.info = std::move(instruction_result.info);
      result.codespace = std::move(instruction_result.codespace);
      failed = true;
      break;
    }
  }

  auto entries = std::vector<strongroom::storage::key_value_entry_t>{};
  auto nonce_key = key::make_nonce_key(encoder_, tx.signers.front());
  entries.emplace_back(std::move(nonce_key), encoder_.encode(tx.nonce + 1));
  if (!failed) {
    for (const auto& [address, record] : working.accounts) {
      entries.emplace_back(key::make_account_key(encoder_, address),
                           encoder_.encode(record));
    }
    for (const auto& [owner_mint, amount] : working.tokens) {
      entries.emplace_back(key::make_token_balance_key(
                               encoder_, owner_mint.first, owner_mint.second),
                           encoder_.encode(amount));
    }
  } else {
    spdlog::warn("Transaction failed and was rolled back: {}", result.log);
  }

  ++height_;
  state_root_ = fold_state_root(state_root_, raw_tx, height_);
  storage_.commit(entries, strongroom::storage::committed_state{
                               .height = height_, .state_root = state_root_});
  result.height = height_;
  result.state_root = state_root_;
  spdlog::debug("Committed transaction at height {} (code {})", height_,
                result.code);
  return result;
}

transaction_result_t ledger::validate_transaction(
    const transaction_t& tx) const {
  if (tx.version != 1) {
    return make_ledger_error(
        transaction_error_code::unsupported_transaction_version,
        "unsupported transaction version", "expected version 1");
  }
  if (tx.chain_id != chain_id_) {
    return make_ledger_error(transaction_error_code::invalid_chain_id,
                             "invalid chain id");
  }
  if (tx.instructions.empty()) {
    return make_ledger_error(transaction_error_code::invalid_transaction,
                             "invalid transaction", "no instructions");
  }
  if (tx.signers.empty() || tx.signatures.size() != tx.signers.size()) {
    return make_ledger_error(transaction_error_code::missing_signature,
                             "missing signature");
  }
  auto unique_signers = std::set<address_t>{std::begin(tx.signers),
                                            std::end(tx.signers)};
  if (unique_signers.size() != tx.signers.size()) {
    return make_ledger_error(transaction_error_code::duplicate_account,
                             "duplicate signer");
  }
  if (!signature_verifier_) {
    return make_ledger_error(
        transaction_error_code::signature_verification_failed,
        "signature verification failed", "no signature verifier installed");
  }
  auto payload = make_signing_payload(tx);
  for (std::size_t i = 0; i < tx.signers.size(); ++i) {
    if (!signature_verifier_(bytes_view_t{payload.data(), payload.size()},
                             tx.signers[i], tx.signatures[i])) {
      return make_ledger_error(
          transaction_error_code::signature_verification_failed,
          "signature verification failed",
          to_hex(bytes_view_t{tx.signers[i].data(), tx.signers[i].size()}));
    }
  }
  auto expected_nonce = read_nonce(tx.signers.front());
  if (tx.nonce != expected_nonce) {
    return make_ledger_error(transaction_error_code::invalid_nonce,
                             "invalid nonce",
                             "expected " + std::to_string(expected_nonce));
  }
  return transaction_result_t{};
}

transaction_result_t ledger::execute_instruction(
    const transaction_t& tx,
    const ledger_instruction_t& instruction,
    working_set& working) {
  auto result = transaction_result_t{};
  auto infos = std::vector<account_info_t>{};
  infos.reserve(instruction.accounts.size());
  for (const auto& meta : instruction.accounts) {
    if (find_account(accounts_t{infos}, meta.key) != nullptr) {
      set_ledger_error(result, transaction_error_code::duplicate_account,
                       "duplicate account in instruction");
      return result;
    }
    if (meta.is_signer && !contains(tx.signers, meta.key)) {
      set_ledger_error(result, transaction_error_code::missing_signature,
                       "missing signature",
                       to_hex(bytes_view_t{meta.key.data(), meta.key.size()}));
      return result;
    }
    const auto& record = load_account(working, meta.key);
    infos.push_back(account_info_t{.key = meta.key,
                                   .owner = record.owner,
                                   .lamports = record.lamports,
                                   .data = record.data,
                                   .is_signer = meta.is_signer,
                                   .is_writable = meta.is_writable,
                                   .executable = record.executable});
  }
  const auto before = infos;
  auto accounts = accounts_t{infos};
  auto invoked = std::set<address_t>{};

  auto host = host_services_t{};
  host.transfer_native = [&](const address_t& from, const address_t& to,
                             const amount_t amount) -> host_error_t {
    auto* source = find_account(accounts, from);
    auto* destination = find_account(accounts, to);
    if (source == nullptr || destination == nullptr || !source->is_writable ||
        !destination->is_writable || source->owner != wallet_program_id_) {
      return program_error_code::external_invocation_failed;
    }
    if (source->lamports < amount) {
      return program_error_code::insufficient_funds;
    }
    if (destination->lamports > std::numeric_limits<uint64_t>::max() - amount) {
      return program_error_code::external_invocation_failed;
    }
    source->lamports -= amount;
    destination->lamports += amount;
    return std::nullopt;
  };
  host.transfer_token = [&](const address_t& from_owner,
                            const address_t& to_owner, const address_t& mint,
                            const amount_t amount) -> host_error_t {
    auto* authority = find_account(accounts, from_owner);
    if (authority == nullptr || authority->owner != wallet_program_id_) {
      return program_error_code::external_invocation_failed;
    }
    auto& source = load_tokens(working, from_owner, mint);
    if (source < amount) {
      return program_error_code::insufficient_funds;
    }
    auto& destination = load_tokens(working, to_owner, mint);
    if (destination > std::numeric_limits<amount_t>::max() - amount) {
      return program_error_code::external_invocation_failed;
    }
    source -= amount;
    destination += amount;
    return std::nullopt;
  };
  host.invoke = [&](const address_t& program, const address_t& authority,
                    accounts_t invoke_accounts,
                    const bytes_view_t& payload) -> host_error_t {
    auto it = programs_.find(program);
    if (it == std::end(programs_)) {
      return program_error_code::external_invocation_failed;
    }
    invoked.insert(program);
    return it->second(authority, invoke_accounts, payload);
  };

  auto data = bytes_view_t{instruction.data.data(), instruction.data.size()};
  if (instruction.program_id == kSystemProgramId) {
    if (auto error = run_system_program(accounts, data)) {
      set_ledger_error(result, *error, "system program failed");
      return result;
    }
  } else if (instruction.program_id == wallet_program_id_) {
    auto context = invoke_context_t{.program_id = wallet_program_id_,
                                    .now = block_time_,
                                    .host = host};
    auto program_result =
        strongroom::execution::process_instruction(context, accounts, data);
    auto failed = program_result.code != 0;
    auto log = program_result.log;
    result.instruction_results.push_back(std::move(program_result));
    if (failed) {
      set_ledger_error(result, transaction_error_code::instruction_failed,
                       "instruction failed", log);
      return result;
    }
  } else if (auto it = programs_.find(instruction.program_id);
             it != std::end(programs_)) {
    invoked.insert(instruction.program_id);
    if (auto error = it->second(kSystemProgramId, accounts, data)) {
      set_ledger_error(result, transaction_error_code::instruction_failed,
                       "instruction failed", to_string(*error));
      return result;
    }
  } else {
    set_ledger_error(result, transaction_error_code::unknown_program,
                     "unknown program");
    return result;
  }

  auto may_modify = [&](const address_t& owner) {
    return owner == instruction.program_id || invoked.contains(owner);
  };
  auto lamports_before = uint64_t{};
  auto lamports_after = uint64_t{};
  for (std::size_t i = 0; i < infos.size(); ++i) {
    const auto& old_state = before[i];
    const auto& new_state = infos[i];
    lamports_before += old_state.lamports;
    lamports_after += new_state.lamports;
    auto changed = old_state.owner != new_state.owner ||
                   old_state.lamports != new_state.lamports ||
                   old_state.data != new_state.data ||
                   old_state.executable != new_state.executable;
    if (!changed) {
      continue;
    }
    if (!old_state.is_writable || old_state.executable != new_state.executable) {
      set_ledger_error(result,
                       transaction_error_code::readonly_account_modified,
                       "read-only account modified",
                       to_hex(bytes_view_t{old_state.key.data(),
                                           old_state.key.size()}));
      return result;
    }
    auto debited = new_state.lamports < old_state.lamports;
    if ((old_state.owner != new_state.owner ||
         old_state.data != new_state.data || debited) &&
        !may_modify(old_state.owner)) {
      set_ledger_error(result,
                       transaction_error_code::unowned_account_modified,
                       "unowned account modified",
                       to_hex(bytes_view_t{old_state.key.data(),
                                           old_state.key.size()}));
      return result;
    }
  }
  if (lamports_before != lamports_after) {
    set_ledger_error(result, transaction_error_code::lamports_not_conserved,
                     "lamports not conserved");
    return result;
  }

  for (const auto& account : infos) {
    auto& record = load_account(working, account.key);
    record.owner = account.owner;
    record.lamports = account.lamports;
    record.data = account.data;
  }
  return result;
}

ledger_error_t ledger::run_system_program(accounts_t accounts,
                                          const bytes_view_t& data) const {
  auto instruction = encoder_.try_decode<system_instruction_t>(data);
  if (!instruction.has_value() || accounts.size() != 2) {
    return transaction_error_code::invalid_system_instruction;
  }
  auto& source = accounts[0];
  auto& target = accounts[1];
  if (!source.is_signer || !source.is_writable || !target.is_writable ||
      source.owner != kSystemProgramId) {
    return transaction_error_code::invalid_system_instruction;
  }
  return std::visit(
      overloaded{
          [&](const create_account_t& create) -> ledger_error_t {
            if (!target.is_signer || create.space > kMaxAccountSpace) {
              return transaction_error_code::invalid_system_instruction;
            }
            if (target.owner != kSystemProgramId || target.lamports != 0 ||
                !target.data.empty() || target.executable) {
              return transaction_error_code::account_in_use;
            }
            if (source.lamports < create.lamports) {
              return transaction_error_code::insufficient_funds;
            }
            source.lamports -= create.lamports;
            target.lamports = create.lamports;
            target.data.assign(create.space, 0);
            target.owner = create.owner;
            return std::nullopt;
          },
          [&](const transfer_lamports_t& transfer) -> ledger_error_t {
            if (source.lamports < transfer.lamports) {
              return transaction_error_code::insufficient_funds;
            }
            if (target.lamports >
                std::numeric_limits<uint64_t>::max() - transfer.lamports) {
              return transaction_error_code::invalid_system_instruction;
            }
            source.lamports -= transfer.lamports;
            target.lamports += transfer.lamports;
            return std::nullopt;
          }},
      instruction.value());
}

account_record_t& ledger::load_account(working_set& working,
                                       const address_t& address) const {
  auto it = working.accounts.find(address);
  if (it == std::end(working.accounts)) {
    it = working.accounts
             .emplace(address,
                      read_account(address).value_or(account_record_t{}))
             .first;
  }
  return it->second;
}

amount_t& ledger::load_tokens(working_set& working,
                              const address_t& owner,
                              const address_t& mint) const {
  auto key = token_key_t{owner, mint};
  auto it = working.tokens.find(key);
  if (it == std::end(working.tokens)) {
    it = working.tokens.emplace(key, read_tokens(owner, mint)).first;
  }
  return it->second;
}

std::optional<account_record_t> ledger::read_account(
    const address_t& address) const {
  auto key = key::make_account_key(encoder_, address);
  return storage_.get<encoder_t, account_record_t>(
      encoder_, bytes_view_t{key.data(), key.size()});
}

amount_t ledger::read_tokens(const address_t& owner,
                             const address_t& mint) const {
  auto key = key::make_token_balance_key(encoder_, owner, mint);
  return storage_
      .get<encoder_t, amount_t>(encoder_, bytes_view_t{key.data(), key.size()})
      .value_or(0);
}

uint64_t ledger::read_nonce(const address_t& signer) const {
  auto key = key::make_nonce_key(encoder_, signer);
  return storage_
      .get<encoder_t, uint64_t>(encoder_, bytes_view_t{key.data(), key.size()})
      .value_or(0);
}

std::optional<account_record_t> ledger::account(const address_t& address) const {
  auto lock = std::scoped_lock{mutex_};
  return read_account(address);
}

amount_t ledger::token_balance(const address_t& owner,
                               const address_t& mint) const {
  auto lock = std::scoped_lock{mutex_};
  return read_tokens(owner, mint);
}

uint64_t ledger::nonce(const address_t& signer) const {
  auto lock = std::scoped_lock{mutex_};
  return read_nonce(signer);
}

hash32_t ledger::state_root() const {
  auto lock = std::scoped_lock{mutex_};
  return state_root_;
}

uint64_t ledger::height() const {
  auto lock = std::scoped_lock{mutex_};
  return height_;
}

const hash32_t& ledger::chain_id() const {
  return chain_id_;
}

}  // namespace strongroom::runtime
