#pragma once

#include <strongroom/schema/operation_status.hpp>
#include <strongroom/schema/program_error_code.hpp>
#include <strongroom/schema/program_result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace strongroom::execution {

inline constexpr auto kProgramCodespace = std::string_view{"strongroom.program"};

inline strongroom::schema::program_result_t make_error_result(
    const strongroom::schema::program_error_code code) {
  auto result = strongroom::schema::program_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{strongroom::schema::to_string(code)};
  result.info = std::string{
      strongroom::schema::to_string(strongroom::schema::kind_of(code))};
  result.codespace = std::string{kProgramCodespace};
  return result;
}

inline strongroom::schema::program_result_t make_success_result(
    const std::string_view info,
    const uint64_t revision,
    const std::optional<strongroom::schema::operation_status_t> status =
        std::nullopt) {
  auto result = strongroom::schema::program_result_t{};
  result.info = std::string{info};
  result.revision = revision;
  result.status = status;
  return result;
}

}  // namespace strongroom::execution
