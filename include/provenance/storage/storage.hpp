#pragma once
#include <provenance/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace provenance::storage {

using key_value_entry_t =
    std::pair<provenance::schema::bytes_t, provenance::schema::bytes_t>;

/// Puts and deletes applied together or not at all.
struct write_batch final {
  std::vector<key_value_entry_t> puts;
  std::vector<provenance::schema::bytes_t> deletes;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const provenance::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const provenance::schema::bytes_view_t& key,
           const T& value) const;

  /// True when a value exists at key.
  bool contains(const provenance::schema::bytes_view_t& key) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const provenance::schema::bytes_view_t& prefix) const;

  /// Atomically apply every put and delete in batch.
  void write(const write_batch& batch) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace provenance::storage
