#pragma once

#include <strongroom/schema/operation_status.hpp>
#include <strongroom/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace strongroom::schema {

template <uint16_t Version>
struct program_result;

/// Outcome of one instruction. `code` is zero on success, otherwise a
/// program_error_code; `revision` is the revision of the record the
/// instruction touched.
template <>
struct program_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  uint64_t revision{};
  std::optional<operation_status_t> status{std::nullopt};
};

using program_result_t = program_result<1>;

}  // namespace strongroom::schema
