#pragma once

#include <strongroom/schema/primitives.hpp>

#include <compare>
#include <cstdint>

// Schema type: vote.
// One signer's disposition on one pending operation.
namespace strongroom::schema {

enum class vote_t : uint8_t { approve = 0, disapprove = 1 };

struct vote_record_t final {
  address_t voter{};
  vote_t vote{vote_t::approve};

  auto operator<=>(const vote_record_t&) const = default;
};

}  // namespace strongroom::schema
