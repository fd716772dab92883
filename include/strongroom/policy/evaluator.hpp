#pragma once

#include <strongroom/schema/balance_account_state.hpp>
#include <strongroom/schema/bounded_set.hpp>
#include <strongroom/schema/dapp_book_state.hpp>
#include <strongroom/schema/multisig_op_state.hpp>
#include <strongroom/schema/operation_kind.hpp>
#include <strongroom/schema/operation_status.hpp>
#include <strongroom/schema/primitives.hpp>
#include <strongroom/schema/vote.hpp>
#include <strongroom/schema/wallet_state.hpp>

#include <cstddef>
#include <span>
#include <vector>

// Authorization predicates. Every quorum, expiry, whitelist and dapp book
// decision made by the operation machine goes through this header.
namespace strongroom::policy {

using votes_view_t = std::span<const strongroom::schema::vote_record_t>;

std::size_t count_votes(votes_view_t votes, strongroom::schema::vote_t vote);

/// approve count >= threshold.
bool quorum_met(votes_view_t votes, std::size_t threshold);

/// disapprove count > signer_count - threshold, or threshold > signer_count.
bool quorum_failed(votes_view_t votes,
                   std::size_t signer_count,
                   std::size_t threshold);

/// created_at <= now <= deadline.
bool within_validity_window(strongroom::schema::timestamp_milliseconds_t now,
                            strongroom::schema::timestamp_milliseconds_t created_at,
                            strongroom::schema::timestamp_milliseconds_t deadline);

/// Whitelist disabled, whitelist empty, or destination listed.
bool destination_allowed(
    const strongroom::schema::balance_account_state_t& balance_account,
    const strongroom::schema::address_t& destination);

bool program_allowed(const strongroom::schema::dapp_book_state_t& dapp_book,
                     const strongroom::schema::address_t& target_program);

bool dapps_allowed(
    const strongroom::schema::balance_account_state_t& balance_account);

/// Config and dapp book changes; these also need guardian quorum.
bool is_high_risk(strongroom::schema::operation_kind_t kind);

/// Votes cast by members of `voters`.
template <std::size_t N>
std::vector<strongroom::schema::vote_record_t> eligible_votes(
    votes_view_t votes,
    const strongroom::schema::bounded_set<strongroom::schema::address_t, N>&
        voters) {
  auto out = std::vector<strongroom::schema::vote_record_t>{};
  for (const auto& vote : votes) {
    if (voters.contains(vote.voter)) {
      out.push_back(vote);
    }
  }
  return out;
}

/// Approvals required to move `amount` out of `balance_account`. The account
/// override (or the large transfer tier when `amount` reaches its minimum)
/// replaces the wallet quorum and is capped at the current signer count.
std::size_t transfer_threshold(
    const strongroom::schema::wallet_state_t& wallet,
    const strongroom::schema::balance_account_state_t& balance_account,
    strongroom::schema::amount_t amount);

/// Approvals required for `params`. `balance_account` is consulted for
/// transfer and dapp transaction kinds and may be null otherwise.
std::size_t required_threshold(
    const strongroom::schema::wallet_state_t& wallet,
    const strongroom::schema::operation_params_t& params,
    const strongroom::schema::balance_account_state_t* balance_account);

/// Validity window of a new operation.
strongroom::schema::duration_milliseconds_t approval_timeout(
    const strongroom::schema::wallet_state_t& wallet,
    const strongroom::schema::balance_account_state_t* balance_account);

/// Status an operation should hold given its votes, the live wallet config
/// and `threshold`. Only votes of current signers (and, for high-risk kinds,
/// current guardians) count.
strongroom::schema::operation_status_t evaluate(
    const strongroom::schema::wallet_state_t& wallet,
    const strongroom::schema::multisig_op_state_t& operation,
    std::size_t threshold);

}  // namespace strongroom::policy
