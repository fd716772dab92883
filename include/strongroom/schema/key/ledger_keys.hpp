#pragma once

#include <strongroom/schema/primitives.hpp>

#include <array>
#include <string_view>
#include <tuple>

// Schema key type: ledger keys.
// Canonical RocksDB key prefixes and key codecs of the reference host.
namespace strongroom::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kAccountKeyPrefix{"SYS|STATE|ACCOUNT|"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kTokenBalanceKeyPrefix{"SYS|STATE|TOKEN|"};
inline constexpr std::string_view kCommittedStateKey{"SYS|APP|COMMITTED"};

inline constexpr std::array<std::string_view, 4> kLedgerKeyspaces{
    kAccountKeyPrefix, kNonceKeyPrefix, kTokenBalanceKeyPrefix,
    kCommittedStateKey};

template <typename Encoder, typename T>
strongroom::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                              std::string_view prefix,
                                              const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
strongroom::schema::bytes_t make_prefix_key(Encoder& encoder,
                                            std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
strongroom::schema::bytes_t make_account_key(
    Encoder& encoder,
    const strongroom::schema::address_t& address) {
  return make_prefixed_key(encoder, kAccountKeyPrefix, address);
}

template <typename Encoder>
strongroom::schema::bytes_t make_nonce_key(
    Encoder& encoder,
    const strongroom::schema::address_t& signer) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, signer);
}

template <typename Encoder>
strongroom::schema::bytes_t make_token_balance_key(
    Encoder& encoder,
    const strongroom::schema::address_t& owner,
    const strongroom::schema::address_t& mint) {
  return make_prefixed_key(encoder, kTokenBalanceKeyPrefix,
                           std::tuple{owner, mint});
}

}  // namespace strongroom::schema::key
