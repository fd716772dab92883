#pragma once
#include <strongroom/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace strongroom::blake3 {

strongroom::schema::hash32_t hash(const std::string_view& str);
strongroom::schema::hash32_t hash(const strongroom::schema::bytes_view_t& bytes);

}  // namespace strongroom::blake3
