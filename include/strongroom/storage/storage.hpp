#pragma once
#include <strongroom/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace strongroom::storage {

using key_value_entry_t =
    std::pair<strongroom::schema::bytes_t, strongroom::schema::bytes_t>;

/// Last committed checkpoint persisted by the storage backend.
struct committed_state final {
  uint64_t height{};
  strongroom::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const strongroom::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const strongroom::schema::bytes_view_t& key,
           const T& value);

  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Atomically persist `entries` together with the checkpoint.
  void commit(const std::vector<key_value_entry_t>& entries,
              const committed_state& state) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const strongroom::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace strongroom::storage
