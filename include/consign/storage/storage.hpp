#pragma once
#include <consign/model/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace consign::storage {

using key_value_entry_t =
    std::pair<consign::model::bytes_t, consign::model::bytes_t>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const consign::model::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const consign::model::bytes_view_t& key,
           const T& value) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const consign::model::bytes_view_t& prefix) const;

  /// Atomically persist all entries; either every entry lands or none does.
  void write(const std::vector<key_value_entry_t>& entries) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace consign::storage
