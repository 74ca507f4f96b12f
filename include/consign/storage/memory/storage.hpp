#pragma once
#include <consign/common/critical.hpp>
#include <consign/storage/storage.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string_view>

namespace consign::storage {

struct memory_storage_tag {};

// Ordered map backend with the same semantics as the RocksDB one. Copies of
// the handle share one map.
template <>
struct storage<memory_storage_tag> final {
  struct state final {
    mutable std::mutex mutex;
    std::map<consign::model::bytes_t, consign::model::bytes_t> entries;
  };

  std::shared_ptr<state> data;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const consign::model::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const consign::model::bytes_view_t& key,
           const T& value) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const consign::model::bytes_view_t& prefix) const;
  void write(const std::vector<key_value_entry_t>& entries) const;
};

using memory_storage_t = storage<memory_storage_tag>;

/// `path` is ignored; every call yields a fresh, empty store.
template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<memory_storage_tag>::get(
    Encoder& encoder,
    const consign::model::bytes_view_t& key) const {
  if (!data) {
    consign::common::critical("memory storage is not initialized");
  }
  auto value = consign::model::bytes_t{};
  {
    auto lock = std::scoped_lock{data->mutex};
    auto it = data->entries.find(consign::model::make_bytes(key));
    if (it == std::end(data->entries)) {
      return std::nullopt;
    }
    value = it->second;
  }
  return {encoder.template decode<T>(consign::model::make_bytes_view(value))};
}

template <typename T, typename Encoder>
void storage<memory_storage_tag>::put(Encoder& encoder,
                                      const consign::model::bytes_view_t& key,
                                      const T& value) const {
  if (!data) {
    consign::common::critical("memory storage is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto lock = std::scoped_lock{data->mutex};
  data->entries.insert_or_assign(consign::model::make_bytes(key),
                                 std::move(encoded_value));
}

}  // namespace consign::storage
