#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <array>
#include <leash/common/critical.hpp>
#include <leash/schema/encoding/scale/encoder.hpp>
#include <leash/storage/storage.hpp>
#include <memory>
#include <mutex>
#include <string_view>

namespace leash::storage {

namespace detail {

inline constexpr std::size_t kLockStripes = 64;

using lock_table_t = std::array<std::mutex, kLockStripes>;

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const leash::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline leash::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

/// RocksDB backend. Conditional writes serialize on a striped lock table
/// keyed by the touched keys, so two writers whose key sets do not collide
/// proceed in parallel while any read-compare-write on a shared key is
/// linearized.
template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;
  std::unique_ptr<detail::lock_table_t> locks;

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const leash::schema::bytes_view_t& key,
           const T& value) const;

  std::optional<leash::schema::bytes_t> get_raw(
      const leash::schema::bytes_view_t& key) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const leash::schema::bytes_view_t& prefix) const;
  void write(const std::vector<mutation>& mutations) const;
  bool conditional_write(const std::vector<precondition>& preconditions,
                         const std::vector<mutation>& mutations) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename Encoder, typename T>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const leash::schema::bytes_view_t& key,
                                       const T& value) const {
  write({mutation{leash::schema::make_bytes(key), encoder.encode(value)}});
}

}  // namespace leash::storage
