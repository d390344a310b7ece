#pragma once
#include <sharevault/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace sharevault::storage {

using key_value_entry_t =
    std::pair<sharevault::schema::bytes_t, sharevault::schema::bytes_t>;

/// Last committed checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  sharevault::schema::hash32_t state_root{};
};

/// Block-level mutations flushed together with the committed checkpoint.
struct write_set final {
  std::vector<key_value_entry_t> puts;
  std::vector<sharevault::schema::bytes_t> erases;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const sharevault::schema::bytes_view_t& key) const;

  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Atomically apply `writes` and advance the committed checkpoint.
  void commit(const write_set& writes, const committed_state& state) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const sharevault::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace sharevault::storage
