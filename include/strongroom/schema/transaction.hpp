#pragma once
#include <strongroom/schema/primitives.hpp>

#include <vector>

namespace strongroom::schema {

struct account_meta_t final {
  address_t key{};
  bool is_signer{};
  bool is_writable{};
};

template <uint16_t Version>
struct ledger_instruction;

template <>
struct ledger_instruction<1> final {
  uint16_t version{1};
  address_t program_id{};
  std::vector<account_meta_t> accounts;
  bytes_t data;
};

using ledger_instruction_t = ledger_instruction<1>;

template <uint16_t Version>
struct transaction;

/// Signed ledger transaction. `signers[0]` pays and owns the nonce;
/// `signatures[i]` is the ed25519 signature of `signers[i]` over
/// make_signing_payload(tx).
template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  std::vector<address_t> signers;
  std::vector<ledger_instruction_t> instructions;
  std::vector<ed25519_signature_t> signatures;
};

using transaction_t = transaction<1>;

}  // namespace strongroom::schema
