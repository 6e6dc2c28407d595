#pragma once

#include <leash/catalog/permission_catalog.hpp>
#include <leash/execution/engine.hpp>
#include <leash/storage/rocksdb/storage.hpp>
#include <leash/storage/session_store.hpp>
#include <leash/testing/common.hpp>

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace leash::testing {

inline constexpr std::string_view kWallet{"wallet-1"};
inline constexpr std::string_view kUser{"user-1"};
// Transfer-only profile with a 100.00 limit and a 7 day lifetime.
inline constexpr std::string_view kScenarioAgent{"scenario"};

inline leash::schema::agent_profile_t scenario_profile() {
  return leash::schema::agent_profile_t{
      .agent_type = std::string{kScenarioAgent},
      .known = true,
      .display_name = "Scenario Agent",
      .description = "transfer only, 100.00 limit",
      .allowed_actions = {leash::schema::wallet_action_t::transfer},
      .spending_limit = leash::schema::amount_t{100'00},
      .duration_seconds = 7 * leash::schema::kSecondsPerDay,
      .max_renewals = 3};
}

/// Opts a session into renewal, manual and scheduled alike.
inline leash::schema::permission_overrides_t auto_renewing() {
  return leash::schema::permission_overrides_t{.auto_renew = true};
}

class engine_fixture final {
 public:
  explicit engine_fixture(const std::string_view db_prefix,
                          leash::execution::engine_options options = {})
      : db_path_{make_db_path(db_prefix)},
        clock_{},
        dispatcher_{},
        encoder_{},
        storage_{leash::storage::make_storage<
            leash::storage::rocksdb_storage_tag>(db_path_)},
        engine_{encoder_,
                storage_,
                options,
                leash::catalog::permission_catalog{
                    std::vector{scenario_profile()}},
                clock_.source(),
                dispatcher_.dispatcher()},
        store_{encoder_, storage_} {}

  engine_fixture(const engine_fixture&) = delete;
  engine_fixture& operator=(const engine_fixture&) = delete;
  engine_fixture(engine_fixture&&) = delete;
  engine_fixture& operator=(engine_fixture&&) = delete;

  ~engine_fixture() {
    engine_.stop_scheduler();
    storage_.database.reset();
    remove_path(db_path_);
  }

  leash::execution::engine& engine() { return engine_; }
  leash::storage::session_store& store() { return store_; }
  leash::storage::rocksdb_storage_t& storage() { return storage_; }
  manual_clock& clock() { return clock_; }
  const recording_dispatcher& dispatcher() const { return dispatcher_; }

  /// Create and confirm a session; fails the calling test on any error.
  std::string activate(std::string_view agent_type = kScenarioAgent,
                       std::string_view wallet_id = kWallet,
                       const std::optional<leash::schema::permission_overrides_t>&
                           overrides = std::nullopt) {
    auto created =
        engine_.create_session(wallet_id, kUser, agent_type, overrides);
    EXPECT_EQ(created.code, 0u) << created.log;
    auto completed = engine_.complete_challenge(
        leash::schema::challenge_confirmation_t{
            .challenge_id = created.challenge_id,
            .success = true,
            .delegate_address = "0xdelegate"});
    EXPECT_EQ(completed.code, 0u) << completed.log;
    return created.session_key_id;
  }

  leash::schema::authorization_result_t authorize(
      std::string_view session_key_id,
      leash::schema::wallet_action_t action,
      uint64_t amount) {
    return engine_.authorize(leash::schema::authorization_request_t{
        .session_key_id = std::string{session_key_id},
        .action = action,
        .amount = leash::schema::amount_t{amount}});
  }

 private:
  std::string db_path_;
  manual_clock clock_;
  recording_dispatcher dispatcher_;
  leash::storage::encoder_t encoder_;
  leash::storage::rocksdb_storage_t storage_;
  leash::execution::engine engine_;
  leash::storage::session_store store_;
};

inline uint32_t code_of(leash::schema::session_error_code code) {
  return leash::schema::to_code(code);
}

}  // namespace leash::testing
