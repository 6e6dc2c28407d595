#include <algorithm>
#include <functional>
#include <leash/common/critical.hpp>
#include <leash/storage/rocksdb/storage.hpp>

namespace leash::storage {

namespace {

std::size_t stripe_of(const leash::schema::bytes_t& key) {
  auto view = leash::schema::make_string_view(key);
  return std::hash<std::string_view>{}(view) % detail::kLockStripes;
}

std::vector<std::size_t> stripes_of(
    const std::vector<precondition>& preconditions,
    const std::vector<mutation>& mutations) {
  auto stripes = std::vector<std::size_t>{};
  stripes.reserve(preconditions.size() + mutations.size());
  for (const auto& item : preconditions) {
    stripes.push_back(stripe_of(item.key));
  }
  for (const auto& item : mutations) {
    stripes.push_back(stripe_of(item.key));
  }
  // Ascending acquisition order rules out lock-order inversion between
  // concurrent writers.
  std::ranges::sort(stripes);
  auto duplicates = std::ranges::unique(stripes);
  stripes.erase(std::begin(duplicates), std::end(duplicates));
  return stripes;
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    leash::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);
  store.locks = std::make_unique<detail::lock_table_t>();

  return store;
}

std::optional<leash::schema::bytes_t> storage<rocksdb_storage_tag>::get_raw(
    const leash::schema::bytes_view_t& key) const {
  if (!database) {
    leash::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    leash::common::critical("Failed to get value from RocksDB");
  }
  return leash::schema::make_bytes(value);
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const leash::schema::bytes_view_t& prefix) const {
  if (!database) {
    leash::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_view = std::string_view{
      reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(detail::to_slice(prefix));
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_view)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    leash::common::critical("RocksDB iteration failed");
  }
  return entries;
}

void storage<rocksdb_storage_tag>::write(
    const std::vector<mutation>& mutations) const {
  if (!conditional_write({}, mutations)) {
    leash::common::critical("unconditional write rejected");
  }
}

bool storage<rocksdb_storage_tag>::conditional_write(
    const std::vector<precondition>& preconditions,
    const std::vector<mutation>& mutations) const {
  if (!database || !locks) {
    leash::common::critical("RocksDB database is not initialized");
  }

  auto guards = std::vector<std::unique_lock<std::mutex>>{};
  for (auto stripe : stripes_of(preconditions, mutations)) {
    guards.emplace_back((*locks)[stripe]);
  }

  for (const auto& item : preconditions) {
    auto current = get_raw(leash::schema::make_bytes_view(item.key));
    if (current != item.expected) {
      return false;
    }
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& item : mutations) {
    auto status = item.value
                      ? batch.Put(detail::to_slice(item.key),
                                  detail::to_slice(*item.value))
                      : batch.Delete(detail::to_slice(item.key));
    if (!status.ok()) {
      spdlog::error("Failed to stage RocksDB mutation: {}", status.ToString());
      leash::common::critical("Failed to stage RocksDB mutation");
    }
  }

  auto status = database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!status.ok()) {
    spdlog::error("Failed to commit RocksDB batch: {}", status.ToString());
    leash::common::critical("Failed to commit RocksDB batch");
  }
  return true;
}

}  // namespace leash::storage
