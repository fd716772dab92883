#include <strongroom/policy/evaluator.hpp>

#include <algorithm>
#include <iterator>

using namespace strongroom::schema;

namespace strongroom::policy {

std::size_t count_votes(votes_view_t votes, const vote_t vote) {
  return static_cast<std::size_t>(
      std::count_if(std::begin(votes), std::end(votes),
                    [&](const auto& record) { return record.vote == vote; }));
}

bool quorum_met(votes_view_t votes, const std::size_t threshold) {
  return count_votes(votes, vote_t::approve) >= threshold;
}

bool quorum_failed(votes_view_t votes,
                   const std::size_t signer_count,
                   const std::size_t threshold) {
  if (threshold > signer_count) {
    return true;
  }
  return count_votes(votes, vote_t::disapprove) > signer_count - threshold;
}

bool within_validity_window(const timestamp_milliseconds_t now,
                            const timestamp_milliseconds_t created_at,
                            const timestamp_milliseconds_t deadline) {
  return created_at <= now && now <= deadline;
}

bool destination_allowed(const balance_account_state_t& balance_account,
                         const address_t& destination) {
  if (!balance_account.whitelist_enabled ||
      balance_account.whitelist.count == 0) {
    return true;
  }
  return balance_account.whitelist
      .find(destination, [](const whitelist_entry_t& entry) {
        return entry.address;
      })
      .has_value();
}

bool program_allowed(const dapp_book_state_t& dapp_book,
                     const address_t& target_program) {
  return dapp_book.entries
      .find(target_program,
            [](const dapp_entry_t& entry) { return entry.program_id; })
      .has_value();
}

bool dapps_allowed(const balance_account_state_t& balance_account) {
  return balance_account.dapps_enabled;
}

bool is_high_risk(const operation_kind_t kind) {
  return kind == operation_kind_t::config_update ||
         kind == operation_kind_t::dapp_book_update;
}

std::size_t transfer_threshold(const wallet_state_t& wallet,
                               const balance_account_state_t& balance_account,
                               const amount_t amount) {
  const auto& policy = balance_account.policy;
  auto threshold = static_cast<std::size_t>(
      policy.transfer_quorum != 0 ? policy.transfer_quorum : wallet.quorum);
  if (policy.large_transfer_minimum != 0 && policy.large_transfer_quorum != 0 &&
      amount >= policy.large_transfer_minimum) {
    threshold = std::max(threshold,
                         static_cast<std::size_t>(policy.large_transfer_quorum));
  }
  threshold = std::min(threshold, static_cast<std::size_t>(wallet.signers.count));
  return std::max(threshold, std::size_t{1});
}

std::size_t required_threshold(const wallet_state_t& wallet,
                               const operation_params_t& params,
                               const balance_account_state_t* balance_account) {
  auto threshold = static_cast<std::size_t>(wallet.quorum);
  if (balance_account == nullptr) {
    return threshold;
  }
  std::visit(overloaded{[&](const transfer_t& value) {
                          threshold = transfer_threshold(
                              wallet, *balance_account, value.amount);
                        },
                        [&](const spl_transfer_t& value) {
                          threshold = transfer_threshold(
                              wallet, *balance_account, value.amount);
                        },
                        [&](const dapp_transaction_t&) {
                          threshold =
                              transfer_threshold(wallet, *balance_account, 0);
                        },
                        [&](const auto&) {}},
             params);
  return threshold;
}

duration_milliseconds_t approval_timeout(
    const wallet_state_t& wallet,
    const balance_account_state_t* balance_account) {
  if (balance_account != nullptr &&
      balance_account->policy.approval_timeout != 0) {
    return balance_account->policy.approval_timeout;
  }
  return wallet.approval_timeout;
}

operation_status_t evaluate(const wallet_state_t& wallet,
                            const multisig_op_state_t& operation,
                            const std::size_t threshold) {
  auto signer_votes = eligible_votes(operation.votes.entries(), wallet.signers);
  if (quorum_failed(signer_votes, wallet.signers.count, threshold)) {
    return operation_status_t::rejected;
  }

  auto guardians_required =
      is_high_risk(operation.kind) && wallet.guardians.count != 0;
  auto guardians_met = true;
  if (guardians_required) {
    auto guardian_votes =
        eligible_votes(operation.votes.entries(), wallet.guardians);
    if (quorum_failed(guardian_votes, wallet.guardians.count,
                      wallet.guardian_quorum)) {
      return operation_status_t::rejected;
    }
    guardians_met = quorum_met(guardian_votes, wallet.guardian_quorum);
  }

  if (quorum_met(signer_votes, threshold) && guardians_met) {
    return operation_status_t::approved;
  }
  return operation_status_t::pending;
}

}  // namespace strongroom::policy
