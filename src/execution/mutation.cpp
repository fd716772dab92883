#include <strongroom/execution/mutation.hpp>
#include <strongroom/schema/limits.hpp>

#include <algorithm>
#include <vector>

using namespace strongroom::schema;

namespace strongroom::execution {

namespace {

using error_t = std::optional<program_error_code>;

template <std::size_t N>
error_t make_member_set(const std::vector<address_t>& members,
                        bounded_set<address_t, N>& out) {
  if (members.size() > N) {
    return program_error_code::too_many_signers;
  }
  out.clear();
  for (const auto& member : members) {
    if (!out.add(member)) {
      return program_error_code::duplicate_signer;
    }
  }
  return std::nullopt;
}

error_t validate_timeout(const duration_milliseconds_t timeout) {
  if (timeout < kMinApprovalTimeout || timeout > kMaxApprovalTimeout) {
    return program_error_code::invalid_approval_timeout;
  }
  return std::nullopt;
}

// Shared by wallet init and config update.
template <typename Config>
error_t apply_config(wallet_state_t& wallet, const Config& config) {
  if (config.signers.empty()) {
    return program_error_code::invalid_threshold;
  }
  if (auto error = make_member_set(config.signers, wallet.signers)) {
    return error;
  }
  if (auto error = make_member_set(config.guardians, wallet.guardians)) {
    return error;
  }
  for (const auto& guardian : wallet.guardians.entries()) {
    if (wallet.signers.contains(guardian)) {
      return program_error_code::duplicate_signer;
    }
  }
  if (config.quorum == 0 || config.quorum > wallet.signers.count) {
    return program_error_code::invalid_threshold;
  }
  if (wallet.guardians.count == 0 ? config.guardian_quorum != 0
                                  : (config.guardian_quorum == 0 ||
                                     config.guardian_quorum >
                                         wallet.guardians.count)) {
    return program_error_code::invalid_threshold;
  }
  if (auto error = validate_timeout(config.approval_timeout)) {
    return error;
  }
  wallet.quorum = config.quorum;
  wallet.guardian_quorum = config.guardian_quorum;
  wallet.approval_timeout = config.approval_timeout;
  return std::nullopt;
}

error_t validate_policy(const approval_policy_t& policy,
                        const wallet_state_t& wallet) {
  if (policy.transfer_quorum > wallet.signers.count ||
      policy.large_transfer_quorum > wallet.signers.count) {
    return program_error_code::invalid_threshold;
  }
  if ((policy.large_transfer_minimum == 0) !=
      (policy.large_transfer_quorum == 0)) {
    return program_error_code::invalid_threshold;
  }
  if (policy.approval_timeout != 0) {
    return validate_timeout(policy.approval_timeout);
  }
  return std::nullopt;
}

error_t validate_asset(const asset_ref_t& asset) {
  auto has_mint = !is_zero(asset.mint);
  if ((asset.kind == asset_kind_t::native) == has_mint) {
    return program_error_code::asset_mismatch;
  }
  return std::nullopt;
}

error_t add_whitelist_entry(balance_account_state_t& balance_account,
                            const whitelist_entry_t& entry) {
  auto existing = balance_account.whitelist.find(
      entry.address, [](const whitelist_entry_t& e) { return e.address; });
  if (existing.has_value()) {
    return program_error_code::entry_exists;
  }
  if (!balance_account.whitelist.add(entry)) {
    return program_error_code::whitelist_full;
  }
  return std::nullopt;
}

error_t mutate(wallet_state_t& wallet, const wallet_init_t& init) {
  if (wallet.revision != 0) {
    return program_error_code::account_already_initialized;
  }
  if (auto error = apply_config(wallet, init)) {
    return error;
  }
  wallet.revision = 1;
  return std::nullopt;
}

error_t mutate(wallet_state_t& wallet, const wallet_config_update_t& update) {
  auto before = wallet;
  if (auto error = apply_config(wallet, update)) {
    return error;
  }
  if (wallet == before) {
    return program_error_code::invalid_update;
  }
  ++wallet.revision;
  return std::nullopt;
}

error_t mutate(balance_account_state_t& balance_account,
               const address_t& wallet_address,
               const wallet_state_t& wallet,
               const balance_account_creation_t& creation) {
  if (balance_account.revision != 0) {
    return program_error_code::account_already_initialized;
  }
  if (auto error = validate_asset(creation.asset)) {
    return error;
  }
  if (auto error = validate_policy(creation.policy, wallet)) {
    return error;
  }
  if (creation.whitelist.size() > kMaxWhitelistEntries) {
    return program_error_code::whitelist_full;
  }
  balance_account = balance_account_state_t{
      .wallet = wallet_address,
      .guid_hash = creation.guid_hash,
      .name_hash = creation.name_hash,
      .asset = creation.asset,
      .whitelist_enabled = creation.whitelist_enabled,
      .dapps_enabled = creation.dapps_enabled,
      .policy = creation.policy,
      .active = true};
  for (const auto& entry : creation.whitelist) {
    if (auto error = add_whitelist_entry(balance_account, entry)) {
      return error;
    }
  }
  balance_account.revision = 1;
  return std::nullopt;
}

error_t mutate(balance_account_state_t& balance_account,
               const wallet_state_t& wallet,
               const balance_account_update_t& update) {
  if (balance_account.guid_hash != update.guid_hash) {
    return program_error_code::account_mismatch;
  }
  if (auto error = validate_policy(update.policy, wallet)) {
    return error;
  }
  if (balance_account.name_hash == update.name_hash &&
      balance_account.dapps_enabled == update.dapps_enabled &&
      balance_account.policy == update.policy &&
      balance_account.active == update.active) {
    return program_error_code::invalid_update;
  }
  balance_account.name_hash = update.name_hash;
  balance_account.dapps_enabled = update.dapps_enabled;
  balance_account.policy = update.policy;
  balance_account.active = update.active;
  ++balance_account.revision;
  return std::nullopt;
}

error_t mutate(balance_account_state_t& balance_account,
               const whitelist_update_t& update) {
  if (balance_account.guid_hash != update.guid_hash) {
    return program_error_code::account_mismatch;
  }
  if (!balance_account.active) {
    return program_error_code::balance_account_inactive;
  }
  if (!update.whitelist_enabled.has_value() && update.add.empty() &&
      update.remove.empty()) {
    return program_error_code::invalid_update;
  }
  for (const auto& address : update.remove) {
    auto removed = balance_account.whitelist.remove_if(
        [&](const whitelist_entry_t& entry) { return entry.address == address; });
    if (removed == 0) {
      return program_error_code::entry_missing;
    }
  }
  for (const auto& entry : update.add) {
    if (auto error = add_whitelist_entry(balance_account, entry)) {
      return error;
    }
  }
  if (update.whitelist_enabled.has_value()) {
    balance_account.whitelist_enabled = *update.whitelist_enabled;
  }
  ++balance_account.revision;
  return std::nullopt;
}

error_t mutate(dapp_book_state_t& dapp_book, const dapp_book_update_t& update) {
  if (update.add.empty() && update.remove.empty()) {
    return program_error_code::invalid_update;
  }
  for (const auto& program_id : update.remove) {
    auto removed = dapp_book.entries.remove_if(
        [&](const dapp_entry_t& entry) { return entry.program_id == program_id; });
    if (removed == 0) {
      return program_error_code::entry_missing;
    }
  }
  for (const auto& entry : update.add) {
    auto existing = dapp_book.entries.find(
        entry.program_id, [](const dapp_entry_t& e) { return e.program_id; });
    if (existing.has_value()) {
      return program_error_code::entry_exists;
    }
    if (!dapp_book.entries.add(entry)) {
      return program_error_code::dapp_book_full;
    }
  }
  ++dapp_book.revision;
  return std::nullopt;
}

}  // namespace

error_t apply_mutation(wallet_state_t& wallet,
                       const operation_params_t& params) {
  auto error = error_t{program_error_code::invalid_instruction};
  std::visit(overloaded{[&](const wallet_init_t& value) {
                          error = mutate(wallet, value);
                        },
                        [&](const wallet_config_update_t& value) {
                          error = mutate(wallet, value);
                        },
                        [&](const auto&) {}},
             params);
  return error;
}

error_t apply_mutation(balance_account_state_t& balance_account,
                       const address_t& wallet_address,
                       const wallet_state_t& wallet,
                       const operation_params_t& params) {
  auto error = error_t{program_error_code::invalid_instruction};
  std::visit(overloaded{[&](const balance_account_creation_t& value) {
                          error = mutate(balance_account, wallet_address,
                                         wallet, value);
                        },
                        [&](const balance_account_update_t& value) {
                          error = mutate(balance_account, wallet, value);
                        },
                        [&](const whitelist_update_t& value) {
                          error = mutate(balance_account, value);
                        },
                        [&](const auto&) {}},
             params);
  return error;
}

error_t apply_mutation(dapp_book_state_t& dapp_book,
                       const operation_params_t& params) {
  auto error = error_t{program_error_code::invalid_instruction};
  std::visit(overloaded{[&](const dapp_book_update_t& value) {
                          error = mutate(dapp_book, value);
                        },
                        [&](const auto&) {}},
             params);
  return error;
}

}  // namespace strongroom::execution
