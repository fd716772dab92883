#pragma once
#include <strongroom/schema/operation_kind.hpp>
#include <strongroom/schema/primitives.hpp>

namespace strongroom::schema {

template <uint16_t Version>
struct approve;

template <>
struct approve<1> final {
  uint16_t version{1};
  operation_kind_t kind{};
  hash32_t params_hash{};
};

using approve_t = approve<1>;

template <uint16_t Version>
struct disapprove;

template <>
struct disapprove<1> final {
  uint16_t version{1};
  operation_kind_t kind{};
  hash32_t params_hash{};
};

using disapprove_t = disapprove<1>;

template <uint16_t Version>
struct reap_operation;

template <>
struct reap_operation<1> final {
  uint16_t version{1};
  operation_kind_t kind{};
};

using reap_operation_t = reap_operation<1>;

template <uint16_t Version>
struct close_operation;

template <>
struct close_operation<1> final {
  uint16_t version{1};
};

using close_operation_t = close_operation<1>;

}  // namespace strongroom::schema
