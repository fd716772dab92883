#pragma once

#include <strongroom/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: operation status.
// Pending is the only non-terminal state; transitions never reverse.
namespace strongroom::schema {

enum class operation_status_t : uint8_t {
  pending = 0,
  approved = 1,
  rejected = 2,
  expired = 3
};

inline constexpr auto kOperationStatusMappings =
    std::array{std::pair<std::string_view, operation_status_t>{
                   "pending", operation_status_t::pending},
               std::pair<std::string_view, operation_status_t>{
                   "approved", operation_status_t::approved},
               std::pair<std::string_view, operation_status_t>{
                   "rejected", operation_status_t::rejected},
               std::pair<std::string_view, operation_status_t>{
                   "expired", operation_status_t::expired}};

inline constexpr std::string_view to_string(const operation_status_t value) {
  return to_string(value, kOperationStatusMappings).value_or("unknown");
}

inline constexpr bool is_terminal(const operation_status_t value) {
  return value != operation_status_t::pending;
}

}  // namespace strongroom::schema
