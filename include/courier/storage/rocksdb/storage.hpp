#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <courier/common/critical.hpp>
#include <courier/storage/storage.hpp>
#include <iterator>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace courier::storage {

namespace detail {

inline courier::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const courier::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const courier::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const courier::schema::bytes_view_t& key,
           const T& value);

  /// Raw committed bytes at key.
  std::optional<courier::schema::bytes_t> read(
      const courier::schema::bytes_view_t& key) const;

  void commit(const write_batch<rocksdb_storage_tag>& batch);

  std::vector<key_value_entry_t> list_by_prefix(
      const courier::schema::bytes_view_t& prefix) const;
};

/// Writes staged against committed state. Reads see staged values first.
/// Nothing reaches the database until `storage::commit`; dropping the batch
/// discards every staged write.
template <>
struct write_batch<rocksdb_storage_tag> final {
  explicit write_batch(const storage<rocksdb_storage_tag>& store)
      : store_{&store} {}

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const courier::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const courier::schema::bytes_view_t& key,
           const T& value);

  bool empty() const { return staged_.empty(); }
  std::size_t size() const { return staged_.size(); }
  const std::map<courier::schema::bytes_t, courier::schema::bytes_t>& staged()
      const {
    return staged_;
  }

 private:
  const storage<rocksdb_storage_tag>* store_;
  std::map<courier::schema::bytes_t, courier::schema::bytes_t> staged_;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline std::optional<courier::schema::bytes_t>
storage<rocksdb_storage_tag>::read(
    const courier::schema::bytes_view_t& key) const {
  if (!database) {
    courier::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    courier::common::critical("Failed to get value from RocksDB");
  }
  return courier::schema::bytes_t{std::begin(value), std::end(value)};
}

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const courier::schema::bytes_view_t& key) const {
  auto value = read(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      courier::schema::bytes_view_t{value->data(), value->size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const courier::schema::bytes_view_t& key,
                                       const T& value) {
  if (!database) {
    courier::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(courier::schema::bytes_view_t{encoded_value.data(),
                                                     encoded_value.size()}));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    courier::common::critical("Failed to put value into RocksDB");
  }
}

inline void storage<rocksdb_storage_tag>::commit(
    const write_batch<rocksdb_storage_tag>& batch) {
  if (!database) {
    courier::common::critical("RocksDB database is not initialized");
  }
  if (batch.empty()) {
    return;
  }
  auto rocks_batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : batch.staged()) {
    auto put_status = rocks_batch.Put(
        detail::to_slice(courier::schema::bytes_view_t{key.data(), key.size()}),
        detail::to_slice(
            courier::schema::bytes_view_t{value.data(), value.size()}));
    if (!put_status.ok()) {
      courier::common::critical("failed staging key in write batch");
    }
  }
  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &rocks_batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit write batch: {}", write_status.ToString());
    courier::common::critical("failed to commit write batch");
  }
  spdlog::debug("Committed write batch with {} entries", batch.size());
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const courier::schema::bytes_view_t& prefix) const {
  if (!database) {
    courier::common::critical("RocksDB database is not initialized");
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
    courier::common::critical("RocksDB iteration failed");
  }
  return entries;
}

template <typename T, typename Encoder>
std::optional<T> write_batch<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const courier::schema::bytes_view_t& key) const {
  auto it = staged_.find(courier::schema::bytes_t{key.begin(), key.end()});
  if (it == std::end(staged_)) {
    return store_->get<T>(encoder, key);
  }
  return {encoder.template decode<T>(
      courier::schema::bytes_view_t{it->second.data(), it->second.size()})};
}

template <typename T, typename Encoder>
void write_batch<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const courier::schema::bytes_view_t& key,
    const T& value) {
  staged_.insert_or_assign(courier::schema::bytes_t{key.begin(), key.end()},
                           encoder.encode(value));
}

}  // namespace courier::storage
