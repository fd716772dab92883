#pragma once

#include <strongroom/schema/primitives.hpp>
#include <strongroom/schema/program_result.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace strongroom::schema {

template <uint16_t Version>
struct transaction_result;

template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  uint64_t height{};
  hash32_t state_root{};
  std::vector<program_result_t> instruction_results;
};

using transaction_result_t = transaction_result<1>;

}  // namespace strongroom::schema
