#include <gtest/gtest.h>
#include <leash/schema/encoding/scale/encoder.hpp>
#include <leash/storage/rocksdb/storage.hpp>
#include <leash/testing/common.hpp>

#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

using storage_t = leash::storage::storage<leash::storage::rocksdb_storage_tag>;
using encoder_t = leash::schema::encoding::encoder<
    leash::schema::encoding::scale_encoder_tag>;
using leash::schema::make_bytes;
using leash::schema::make_bytes_view;

leash::schema::bytes_t bytes_of(std::string_view text) {
  return make_bytes(text);
}

}  // namespace

TEST(rocksdb_storage, typed_values_round_trip) {
  auto db = leash::testing::make_db_path("leash_storage_typed");
  {
    auto storage =
        leash::storage::make_storage<leash::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto key = bytes_of("SYS|STATE|TEST|1");
    auto record = leash::schema::execution_record_t{
        .record_id = "er_1",
        .session_key_id = "sk_1",
        .action = leash::schema::wallet_action_t::swap,
        .amount = leash::schema::amount_t{42},
        .timestamp = 7,
        .outcome = leash::schema::execution_outcome_t::admitted,
        .note = "ok"};
    storage.put(encoder, make_bytes_view(key), record);

    auto raw = storage.get_raw(make_bytes_view(key));
    ASSERT_TRUE(raw.has_value());
    auto loaded = encoder.try_decode<leash::schema::execution_record_t>(
        make_bytes_view(*raw));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->record_id, "er_1");
    EXPECT_EQ(loaded->action, leash::schema::wallet_action_t::swap);
    EXPECT_EQ(loaded->amount, leash::schema::amount_t{42});
    EXPECT_FALSE(loaded->rejection_code.has_value());

    EXPECT_FALSE(
        storage.get_raw(make_bytes_view(bytes_of("SYS|STATE|TEST|2")))
            .has_value());

  }
  leash::testing::remove_path(db);
}

TEST(rocksdb_storage, list_by_prefix_returns_only_matching_keys_in_order) {
  auto db = leash::testing::make_db_path("leash_storage_prefix");
  {
    auto storage =
        leash::storage::make_storage<leash::storage::rocksdb_storage_tag>(db);
    storage.write({
        leash::storage::mutation{bytes_of("A|2"), bytes_of("two")},
        leash::storage::mutation{bytes_of("A|1"), bytes_of("one")},
        leash::storage::mutation{bytes_of("B|1"), bytes_of("other")},
    });

    auto entries = storage.list_by_prefix(make_bytes_view(bytes_of("A|")));
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].first, bytes_of("A|1"));
    EXPECT_EQ(entries[1].second, bytes_of("two"));
  }
  leash::testing::remove_path(db);
}

TEST(rocksdb_storage, conditional_write_checks_every_precondition) {
  auto db = leash::testing::make_db_path("leash_storage_cas");
  {
    auto storage =
        leash::storage::make_storage<leash::storage::rocksdb_storage_tag>(db);
    auto key = bytes_of("K");
    auto other = bytes_of("L");

    // Absent precondition on a missing key holds.
    EXPECT_TRUE(storage.conditional_write(
        {leash::storage::precondition{key, std::nullopt}},
        {leash::storage::mutation{key, bytes_of("v1")}}));
    // ...and fails once the key exists.
    EXPECT_FALSE(storage.conditional_write(
        {leash::storage::precondition{key, std::nullopt}},
        {leash::storage::mutation{key, bytes_of("v2")}}));

    // A stale expectation writes nothing, not even unrelated mutations.
    EXPECT_FALSE(storage.conditional_write(
        {leash::storage::precondition{key, bytes_of("v0")}},
        {leash::storage::mutation{key, bytes_of("v2")},
         leash::storage::mutation{other, bytes_of("x")}}));
    EXPECT_FALSE(storage.get_raw(make_bytes_view(other)).has_value());
    EXPECT_EQ(storage.get_raw(make_bytes_view(key)), bytes_of("v1"));

    // Matching expectation applies every mutation, deletes included.
    EXPECT_TRUE(storage.conditional_write(
        {leash::storage::precondition{key, bytes_of("v1")}},
        {leash::storage::mutation{key, std::nullopt},
         leash::storage::mutation{other, bytes_of("x")}}));
    EXPECT_FALSE(storage.get_raw(make_bytes_view(key)).has_value());
    EXPECT_EQ(storage.get_raw(make_bytes_view(other)), bytes_of("x"));
  }
  leash::testing::remove_path(db);
}

TEST(rocksdb_storage, concurrent_increments_are_linearized) {
  auto db = leash::testing::make_db_path("leash_storage_counter");
  {
    auto storage =
        leash::storage::make_storage<leash::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto key = bytes_of("COUNTER");
    storage.put(encoder, make_bytes_view(key), uint64_t{0});

    constexpr auto kThreads = 8;
    constexpr auto kIncrements = 50;
    auto workers = std::vector<std::thread>{};
    for (auto t = 0; t < kThreads; ++t) {
      workers.emplace_back([&storage, &key] {
        auto local = encoder_t{};
        for (auto i = 0; i < kIncrements; ++i) {
          while (true) {
            auto raw = storage.get_raw(make_bytes_view(key));
            auto value = local.try_decode<uint64_t>(make_bytes_view(*raw));
            ASSERT_TRUE(value.has_value());
            if (storage.conditional_write(
                    {leash::storage::precondition{key, *raw}},
                    {leash::storage::mutation{key, local.encode(*value + 1)}})) {
              break;
            }
          }
        }
      });
    }
    for (auto& worker : workers) {
      worker.join();
    }

    auto raw = storage.get_raw(make_bytes_view(key));
    ASSERT_TRUE(raw.has_value());
    auto total = encoder.try_decode<uint64_t>(make_bytes_view(*raw));
    ASSERT_TRUE(total.has_value());
    EXPECT_EQ(*total, static_cast<uint64_t>(kThreads * kIncrements));
  }
  leash::testing::remove_path(db);
}
