#pragma once

#include <strongroom/schema/enum_string.hpp>
#include <strongroom/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: asset kind.
// A balance account holds either the ledger's native asset or one token mint.
namespace strongroom::schema {

enum class asset_kind_t : uint8_t { native = 0, token = 1 };

inline constexpr auto kAssetKindMappings = std::array{
    std::pair<std::string_view, asset_kind_t>{"native", asset_kind_t::native},
    std::pair<std::string_view, asset_kind_t>{"token", asset_kind_t::token}};

inline constexpr std::string_view to_string(const asset_kind_t value) {
  return to_string(value, kAssetKindMappings).value_or("unknown");
}

struct asset_ref_t final {
  asset_kind_t kind{asset_kind_t::native};
  address_t mint{};  // zero for native

  bool operator==(const asset_ref_t&) const = default;
};

}  // namespace strongroom::schema
