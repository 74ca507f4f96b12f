#include <consign/storage/memory/storage.hpp>

#include <algorithm>
#include <spdlog/spdlog.h>

namespace consign::storage {

template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path) {
  spdlog::debug("Opened in-memory stash (requested path '{}')", path);
  return storage<memory_storage_tag>{
      .data = std::make_shared<storage<memory_storage_tag>::state>()};
}

std::vector<key_value_entry_t> storage<memory_storage_tag>::list_by_prefix(
    const consign::model::bytes_view_t& prefix) const {
  if (!data) {
    consign::common::critical("memory storage is not initialized");
  }
  auto entries = std::vector<key_value_entry_t>{};
  auto lock = std::scoped_lock{data->mutex};
  for (auto it = data->entries.lower_bound(consign::model::make_bytes(prefix));
       it != std::end(data->entries); ++it) {
    const auto& key = it->first;
    if (key.size() < prefix.size() ||
        !std::equal(std::begin(prefix), std::end(prefix), std::begin(key))) {
      break;
    }
    entries.push_back(*it);
  }
  return entries;
}

void storage<memory_storage_tag>::write(
    const std::vector<key_value_entry_t>& entries) const {
  if (!data) {
    consign::common::critical("memory storage is not initialized");
  }
  auto lock = std::scoped_lock{data->mutex};
  for (const auto& [key, value] : entries) {
    data->entries.insert_or_assign(key, value);
  }
}

}  // namespace consign::storage
