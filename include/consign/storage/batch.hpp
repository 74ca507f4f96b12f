#pragma once
#include <consign/model/primitives.hpp>
#include <consign/storage/storage.hpp>
#include <algorithm>
#include <map>
#include <optional>
#include <vector>

namespace consign::storage {

/// Staged write set over a stash store.
///
/// Reads see staged writes first and fall through to the store. Nothing
/// reaches the store until `commit`, which persists the whole set in one
/// atomic write; dropping the batch discards it.
template <typename Library, typename Encoder>
class stash_batch final {
 public:
  stash_batch(const storage<Library>& store, Encoder& encoder)
      : store_{store}, encoder_{encoder} {}

  template <typename T>
  std::optional<T> retrieve(const consign::model::bytes_view_t& key) const {
    auto it = staged_.find(consign::model::make_bytes(key));
    if (it != std::end(staged_)) {
      return encoder_.template decode<T>(
          consign::model::make_bytes_view(it->second));
    }
    return store_.template get<T>(encoder_, key);
  }

  /// Overwrite whatever is stored at key.
  template <typename T>
  void store(const consign::model::bytes_view_t& key, const T& value) {
    staged_.insert_or_assign(consign::model::make_bytes(key),
                             encoder_.encode(value));
  }

  /// Store `value`, or merge it into the value already present. Returns
  /// false, staging nothing, when the two cannot be merged.
  template <typename T>
  bool store_merge(const consign::model::bytes_view_t& key, const T& value) {
    auto existing = retrieve<T>(key);
    if (!existing) {
      store(key, value);
      return true;
    }
    if (!merge(*existing, value)) {
      return false;
    }
    store(key, *existing);
    return true;
  }

  /// Add `member` to the sorted set stored at key.
  template <typename T>
  void insert_into_set(const consign::model::bytes_view_t& key,
                       const T& member) {
    auto members = retrieve<std::vector<T>>(key).value_or(std::vector<T>{});
    auto position = std::ranges::lower_bound(members, member);
    if (position != std::end(members) && *position == member) {
      return;
    }
    members.insert(position, member);
    store(key, members);
  }

  std::size_t size() const { return staged_.size(); }

  void commit() {
    if (staged_.empty()) {
      return;
    }
    auto entries = std::vector<key_value_entry_t>{};
    entries.reserve(staged_.size());
    for (auto& [key, value] : staged_) {
      entries.emplace_back(key, std::move(value));
    }
    store_.write(entries);
    staged_.clear();
  }

 private:
  const storage<Library>& store_;
  Encoder& encoder_;
  std::map<consign::model::bytes_t, consign::model::bytes_t> staged_;
};

}  // namespace consign::storage
