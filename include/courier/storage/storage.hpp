#pragma once
#include <courier/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace courier::storage {

using key_value_entry_t =
    std::pair<courier::schema::bytes_t, courier::schema::bytes_t>;

template <typename Library>
struct write_batch;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const courier::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const courier::schema::bytes_view_t& key,
           const T& value);

  /// Apply every staged write of the batch, all or nothing.
  void commit(const write_batch<Library>& batch);

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const courier::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace courier::storage
