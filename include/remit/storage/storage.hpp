#pragma once
#include <remit/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace remit::storage {

using key_value_entry_t =
    std::pair<remit::schema::bytes_t, remit::schema::bytes_t>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const remit::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const remit::schema::bytes_view_t& key,
           const T& value) const;

  /// Delete key; missing keys are not an error.
  void remove(const remit::schema::bytes_view_t& key) const;

  /// Atomically apply all puts and deletes.
  void write_batch(const std::vector<key_value_entry_t>& puts,
                   const std::vector<remit::schema::bytes_t>& deletes) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const remit::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace remit::storage
