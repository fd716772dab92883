#pragma once
#include <strongroom/schema/primitives.hpp>

namespace strongroom::schema {

template <uint16_t Version>
struct account_record;

/// Ledger account as persisted by the reference host. A zero owner is the
/// system program.
template <>
struct account_record<1> final {
  uint16_t version{1};
  address_t owner{};
  uint64_t lamports{};
  bytes_t data;
  bool executable{};

  bool operator==(const account_record&) const = default;
};

using account_record_t = account_record<1>;

}  // namespace strongroom::schema
