#pragma once
#include <strongroom/schema/bounded_set.hpp>
#include <strongroom/schema/limits.hpp>
#include <strongroom/schema/operation_kind.hpp>
#include <strongroom/schema/operation_params.hpp>
#include <strongroom/schema/operation_status.hpp>
#include <strongroom/schema/primitives.hpp>
#include <strongroom/schema/vote.hpp>

#include <optional>

namespace strongroom::schema {

template <uint16_t Version>
struct multisig_op_state;

/// Pending multisig operation.
///
/// `params_hash` is the BLAKE3 digest of the SCALE encoded params and stays
/// set after the params are discarded on expiry. `target` is the record the
/// operation mutates (wallet, balance account or dapp book).
template <>
struct multisig_op_state<1> final {
  uint16_t version{1};
  address_t wallet{};
  address_t initiator{};
  address_t target{};
  operation_kind_t kind{operation_kind_t::wallet_init};
  hash32_t params_hash{};
  std::optional<operation_params_t> params{std::nullopt};
  timestamp_milliseconds_t started_at{};
  timestamp_milliseconds_t expires_at{};
  bounded_set<vote_record_t, kMaxVotes> votes{};
  operation_status_t status{operation_status_t::pending};

  bool operator==(const multisig_op_state&) const = default;
};

using multisig_op_state_t = multisig_op_state<1>;

}  // namespace strongroom::schema
