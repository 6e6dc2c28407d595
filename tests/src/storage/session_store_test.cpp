#include <gtest/gtest.h>
#include <leash/storage/session_store.hpp>
#include <leash/testing/common.hpp>

#include <optional>
#include <string>

namespace {

leash::schema::session_key_state_t make_session(std::string id,
                                                std::string wallet) {
  return leash::schema::session_key_state_t{
      .session_key_id = std::move(id),
      .wallet_id = std::move(wallet),
      .user_id = "user-1",
      .agent_type = "payments",
      .created_at = leash::testing::kEpoch,
      .expires_at = leash::testing::kEpoch + 3600,
      .duration_seconds = 3600,
      .status = leash::schema::session_status_t::pending,
      .permissions = leash::schema::session_permissions_t{
          .allowed_actions = {leash::schema::wallet_action_t::transfer},
          .spending_limit = leash::schema::amount_t{1000}}};
}

leash::schema::delegation_challenge_t make_challenge(std::string id,
                                                     std::string session) {
  return leash::schema::delegation_challenge_t{
      .challenge_id = std::move(id),
      .session_key_id = std::move(session),
      .kind = leash::schema::challenge_kind_t::create,
      .status = leash::schema::challenge_status_t::awaiting_confirmation,
      .created_at = leash::testing::kEpoch};
}

struct store_fixture final {
  explicit store_fixture(const std::string& prefix)
      : db{leash::testing::make_db_path(prefix)},
        storage{leash::storage::make_storage<
            leash::storage::rocksdb_storage_tag>(db)},
        store{encoder, storage} {}

  ~store_fixture() {
    storage.database.reset();
    leash::testing::remove_path(db);
  }

  std::string db;
  leash::storage::encoder_t encoder;
  leash::storage::rocksdb_storage_t storage;
  leash::storage::session_store store;
};

}  // namespace

TEST(session_store, put_maintains_wallet_and_live_indexes) {
  auto fixture = store_fixture{"leash_store_indexes"};
  auto& store = fixture.store;

  auto session = make_session("sk_1", "w1");
  auto created = store.begin()
                     .expect_absent_session(session.session_key_id)
                     .put(session)
                     .commit();
  ASSERT_TRUE(created);
  EXPECT_EQ(store.wallet_session_ids("w1"),
            (std::vector<leash::schema::identifier_t>{"sk_1"}));
  EXPECT_EQ(store.live_session_ids(),
            (std::vector<leash::schema::identifier_t>{"sk_1"}));

  auto current = store.load_session("sk_1");
  ASSERT_TRUE(current.has_value());
  auto revoked = current->value;
  revoked.status = leash::schema::session_status_t::revoked;
  ASSERT_TRUE(store.begin().expect(*current).put(revoked).commit());

  EXPECT_TRUE(store.live_session_ids().empty());
  EXPECT_EQ(store.wallet_session_ids("w1").size(), 1u);
  EXPECT_TRUE(store.wallet_session_ids("w10").empty());
}

TEST(session_store, stale_expectation_commits_nothing) {
  auto fixture = store_fixture{"leash_store_stale"};
  auto& store = fixture.store;

  ASSERT_TRUE(store.begin().put(make_session("sk_1", "w1")).commit());
  auto first = store.load_session("sk_1");
  ASSERT_TRUE(first.has_value());

  auto updated = first->value;
  updated.status = leash::schema::session_status_t::active;
  ASSERT_TRUE(store.begin().expect(*first).put(updated).commit());

  auto lost = first->value;
  lost.status = leash::schema::session_status_t::revoked;
  auto record = leash::schema::execution_record_t{
      .record_id = "er_1", .session_key_id = "sk_1", .timestamp = 1};
  EXPECT_FALSE(store.begin().expect(*first).put(lost).append(record).commit());

  auto reloaded = store.load_session("sk_1");
  ASSERT_TRUE(reloaded.has_value());
  EXPECT_EQ(reloaded->value.status, leash::schema::session_status_t::active);
  EXPECT_TRUE(store.history("sk_1").empty());
}

TEST(session_store, open_challenge_index_follows_status) {
  auto fixture = store_fixture{"leash_store_challenges"};
  auto& store = fixture.store;

  auto challenge = make_challenge("ch_1", "sk_1");
  ASSERT_TRUE(store.begin()
                  .expect_absent_challenge(challenge.challenge_id)
                  .put(challenge)
                  .commit());
  EXPECT_EQ(store.open_challenge_ids().size(), 1u);
  EXPECT_FALSE(store.begin()
                   .expect_absent_challenge(challenge.challenge_id)
                   .put(challenge)
                   .commit());

  auto current = store.load_challenge("ch_1");
  ASSERT_TRUE(current.has_value());
  auto confirmed = current->value;
  confirmed.status = leash::schema::challenge_status_t::confirmed;
  confirmed.resolved_at = leash::testing::kEpoch + 5;
  ASSERT_TRUE(store.begin().expect(*current).put(confirmed).commit());
  EXPECT_TRUE(store.open_challenge_ids().empty());

  auto reloaded = store.load_challenge("ch_1");
  ASSERT_TRUE(reloaded.has_value());
  EXPECT_EQ(reloaded->value.resolved_at, leash::testing::kEpoch + 5);
}

TEST(session_store, wallet_holder_is_guarded) {
  auto fixture = store_fixture{"leash_store_holder"};
  auto& store = fixture.store;

  EXPECT_FALSE(store.wallet_holder("w1").has_value());
  ASSERT_TRUE(store.begin()
                  .expect_wallet_holder("w1", std::nullopt)
                  .set_wallet_holder("w1", std::string{"sk_1"})
                  .commit());
  EXPECT_EQ(store.wallet_holder("w1"), std::optional<std::string>{"sk_1"});

  EXPECT_FALSE(store.begin()
                   .expect_wallet_holder("w1", std::nullopt)
                   .set_wallet_holder("w1", std::string{"sk_2"})
                   .commit());
  ASSERT_TRUE(store.begin()
                  .expect_wallet_holder("w1", std::string{"sk_1"})
                  .set_wallet_holder("w1", std::nullopt)
                  .commit());
  EXPECT_FALSE(store.wallet_holder("w1").has_value());
}

TEST(session_store, history_is_ordered_by_timestamp) {
  auto fixture = store_fixture{"leash_store_history"};
  auto& store = fixture.store;

  store.append_record(leash::schema::execution_record_t{
      .record_id = "er_b", .session_key_id = "sk_1", .timestamp = 300});
  store.append_record(leash::schema::execution_record_t{
      .record_id = "er_a", .session_key_id = "sk_1", .timestamp = 20});
  store.append_record(leash::schema::execution_record_t{
      .record_id = "er_c", .session_key_id = "sk_2", .timestamp = 1});

  auto history = store.history("sk_1");
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0].record_id, "er_a");
  EXPECT_EQ(history[1].record_id, "er_b");
}

TEST(session_store, same_second_records_keep_write_order) {
  auto fixture = store_fixture{"leash_store_write_order"};
  auto& store = fixture.store;

  // Ids chosen so that sorting by id would reverse the write order.
  store.append_record(leash::schema::execution_record_t{
      .record_id = "er_z",
      .session_key_id = "sk_1",
      .timestamp = 50,
      .outcome = leash::schema::execution_outcome_t::admitted});
  ASSERT_TRUE(store.begin()
                  .append(leash::schema::execution_record_t{
                      .record_id = "er_m",
                      .session_key_id = "sk_1",
                      .timestamp = 50,
                      .outcome = leash::schema::execution_outcome_t::reversed})
                  .commit());
  store.append_record(leash::schema::execution_record_t{
      .record_id = "er_a",
      .session_key_id = "sk_1",
      .timestamp = 50,
      .outcome = leash::schema::execution_outcome_t::rejected});

  auto history = store.history("sk_1");
  ASSERT_EQ(history.size(), 3u);
  EXPECT_EQ(history[0].record_id, "er_z");
  EXPECT_EQ(history[1].record_id, "er_m");
  EXPECT_EQ(history[2].record_id, "er_a");
  EXPECT_LT(history[0].sequence, history[1].sequence);
  EXPECT_LT(history[1].sequence, history[2].sequence);
}
