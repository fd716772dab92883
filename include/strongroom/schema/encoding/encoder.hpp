#pragma once
#include <strongroom/schema/primitives.hpp>
#include <optional>
#include <span>

namespace strongroom::schema::encoding {

// Encoding backend is a build time choice; callers name the tag they want.
template <typename Library>
struct encoder {
  template <typename T>
  strongroom::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, strongroom::schema::bytes_t& out);

  template <typename T>
  T decode(const strongroom::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const strongroom::schema::bytes_view_t& bytes);
};

}  // namespace strongroom::schema::encoding
