#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <sharevault/common/critical.hpp>
#include <sharevault/schema/encoding/scale/encoder.hpp>
#include <sharevault/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string_view>
#include <tuple>

namespace sharevault::storage {

namespace detail {

using encoder_t = sharevault::schema::encoding::encoder<
    sharevault::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedHeightKey =
    std::string_view{"SYS|APP|COMMITTED_HEIGHT"};

inline sharevault::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const sharevault::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline sharevault::schema::bytes_t encode_committed_state(
    const committed_state& state) {
  auto encoder = encoder_t{};
  return encoder.encode(std::tuple{state.height, state.state_root});
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const sharevault::schema::bytes_view_t& key) const;

  std::optional<committed_state> load_committed_state() const;
  void commit(const write_set& writes, const committed_state& state) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const sharevault::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename Encoder, typename T>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const sharevault::schema::bytes_view_t& key) const {
  if (!database) {
    sharevault::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
      sharevault::common::critical("Failed to get value from RocksDB");
    }
  }
  return {encoder.template decode<T>(sharevault::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  if (!database) {
    sharevault::common::critical("RocksDB database is not initialized");
  }
  auto state = committed_state{};

  auto committed_raw = std::string{};
  auto committed_status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    std::string{detail::kCommittedHeightKey}, &committed_raw);
  if (committed_status.IsNotFound()) {
    return std::nullopt;
  }
  if (!committed_status.ok()) {
    sharevault::common::critical("failed to load committed state");
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, sharevault::schema::hash32_t>>(
          sharevault::schema::bytes_view_t{
              reinterpret_cast<const uint8_t*>(committed_raw.data()),
              committed_raw.size()});
  if (!decoded.has_value()) {
    sharevault::common::critical("failed to decode committed state");
  }
  state.height = std::get<0>(decoded.value());
  state.state_root = std::get<1>(decoded.value());

  return state;
}

inline void storage<rocksdb_storage_tag>::commit(
    const write_set& writes,
    const committed_state& state) const {
  if (!database) {
    sharevault::common::critical("RocksDB database is not initialized");
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& key : writes.erases) {
    auto delete_status =
        batch.Delete(detail::to_slice(sharevault::schema::bytes_view_t{key}));
    if (!delete_status.ok()) {
      sharevault::common::critical("failed deleting key during commit");
    }
  }
  for (const auto& [key, value] : writes.puts) {
    auto put_status =
        batch.Put(detail::to_slice(sharevault::schema::bytes_view_t{key}),
                  detail::to_slice(sharevault::schema::bytes_view_t{value}));
    if (!put_status.ok()) {
      sharevault::common::critical("failed writing key during commit");
    }
  }
  auto encoded = detail::encode_committed_state(state);
  auto state_status =
      batch.Put(std::string{detail::kCommittedHeightKey},
                detail::to_slice(sharevault::schema::bytes_view_t{encoded}));
  if (!state_status.ok()) {
    sharevault::common::critical("failed writing committed height");
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit block to RocksDB: {}",
                  write_status.ToString());
    sharevault::common::critical("failed to persist committed block");
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const sharevault::schema::bytes_view_t& prefix) const {
  if (!database) {
    sharevault::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    sharevault::common::critical("failed to scan RocksDB prefix");
  }
  return entries;
}

}  // namespace sharevault::storage
