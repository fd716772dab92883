#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <span>

// Schema type: bounded set.
// Fixed-capacity ordered set persisted as an occupancy count followed by every
// slot. Occupied slots are sorted and unique; free slots hold T{}. Members are
// not named like a container so the SCALE codec treats the type
// as a plain aggregate.
namespace strongroom::schema {

template <typename T, std::size_t Capacity>
struct bounded_set final {
  static_assert(Capacity <= UINT8_MAX);

  uint8_t count{};
  std::array<T, Capacity> slots{};

  static constexpr std::size_t kCapacity = Capacity;

  std::span<const T> entries() const {
    return std::span<const T>{slots.data(), count};
  }

  bool full() const { return count == Capacity; }

  bool contains(const T& value) const {
    auto occupied = entries();
    return std::binary_search(std::begin(occupied), std::end(occupied), value);
  }

  template <typename Key, typename Projection>
  std::optional<T> find(const Key& key, Projection projection) const {
    for (const auto& entry : entries()) {
      if (projection(entry) == key) {
        return entry;
      }
    }
    return std::nullopt;
  }

  /// Insert keeping order. Returns false when present or at capacity.
  bool add(const T& value) {
    if (contains(value) || full()) {
      return false;
    }
    auto last = std::begin(slots) + count;
    auto position = std::lower_bound(std::begin(slots), last, value);
    std::move_backward(position, last, last + 1);
    *position = value;
    ++count;
    return true;
  }

  /// Remove and zero the freed slot. Returns false when absent.
  bool remove(const T& value) {
    auto last = std::begin(slots) + count;
    auto position = std::lower_bound(std::begin(slots), last, value);
    if (position == last || !(*position == value)) {
      return false;
    }
    std::move(position + 1, last, position);
    --count;
    slots[count] = T{};
    return true;
  }

  template <typename Predicate>
  std::size_t remove_if(Predicate predicate) {
    auto last = std::begin(slots) + count;
    auto kept = std::remove_if(std::begin(slots), last, predicate);
    auto removed = static_cast<std::size_t>(last - kept);
    std::fill(kept, last, T{});
    count = static_cast<uint8_t>(count - removed);
    return removed;
  }

  void clear() {
    slots.fill(T{});
    count = 0;
  }

  /// Occupancy within capacity, occupied slots strictly increasing, free
  /// slots zeroed.
  bool well_formed() const {
    if (count > Capacity) {
      return false;
    }
    for (std::size_t i = 1; i < count; ++i) {
      if (!(slots[i - 1] < slots[i])) {
        return false;
      }
    }
    for (std::size_t i = count; i < Capacity; ++i) {
      if (!(slots[i] == T{})) {
        return false;
      }
    }
    return true;
  }

  bool operator==(const bounded_set&) const = default;
};

}  // namespace strongroom::schema
