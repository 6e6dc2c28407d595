#pragma once
#include <leash/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace leash::storage {

using key_value_entry_t =
    std::pair<leash::schema::bytes_t, leash::schema::bytes_t>;

/// Expected current value of a key. std::nullopt means the key must be absent.
struct precondition final {
  leash::schema::bytes_t key;
  std::optional<leash::schema::bytes_t> expected;
};

/// Value to write at key. std::nullopt deletes the key.
struct mutation final {
  leash::schema::bytes_t key;
  std::optional<leash::schema::bytes_t> value;
};

template <typename Library>
struct storage {
  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const leash::schema::bytes_view_t& key,
           const T& value) const;

  /// Return the stored bytes at key, or std::nullopt when missing.
  std::optional<leash::schema::bytes_t> get_raw(
      const leash::schema::bytes_view_t& key) const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const leash::schema::bytes_view_t& prefix) const;

  /// Apply all mutations atomically.
  void write(const std::vector<mutation>& mutations) const;

  /// Apply all mutations atomically iff every precondition still holds.
  /// Returns false, writing nothing, when any precondition fails.
  bool conditional_write(const std::vector<precondition>& preconditions,
                         const std::vector<mutation>& mutations) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace leash::storage
