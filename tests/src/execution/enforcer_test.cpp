#include <gtest/gtest.h>
#include <leash/execution/enforcer.hpp>
#include <leash/testing/engine_fixture.hpp>

#include <atomic>
#include <limits>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

using leash::schema::amount_t;
using leash::schema::execution_outcome_t;
using leash::schema::session_error_code;
using leash::schema::session_status_t;
using leash::schema::wallet_action_t;
using leash::testing::code_of;

constexpr auto kUsdc = "0xusdc";

leash::schema::session_permissions_t make_permissions() {
  return leash::schema::session_permissions_t{
      .allowed_actions = {wallet_action_t::transfer, wallet_action_t::bridge},
      .spending_limit = amount_t{1000},
      .max_amount_per_transaction = amount_t{100},
      .allowed_chains = {"BASE-SEPOLIA"},
      .allowed_tokens = {kUsdc}};
}

}  // namespace

TEST(check_step, evaluates_action_chain_token_and_cap) {
  auto permissions = make_permissions();
  auto base = std::optional<std::string>{"BASE-SEPOLIA"};
  auto usdc = std::optional<std::string>{kUsdc};

  EXPECT_FALSE(leash::execution::check_step(permissions,
                                            wallet_action_t::transfer,
                                            amount_t{100}, base, usdc)
                   .has_value());
  EXPECT_EQ(leash::execution::check_step(permissions, wallet_action_t::swap,
                                         amount_t{1}, base, usdc),
            session_error_code::action_not_permitted);
  EXPECT_EQ(leash::execution::check_step(permissions, wallet_action_t::transfer,
                                         amount_t{1}, std::nullopt, usdc),
            session_error_code::chain_not_permitted);
  EXPECT_EQ(leash::execution::check_step(permissions, wallet_action_t::transfer,
                                         amount_t{1},
                                         std::string{"POLYGON-AMOY"}, usdc),
            session_error_code::chain_not_permitted);
  EXPECT_EQ(leash::execution::check_step(permissions, wallet_action_t::transfer,
                                         amount_t{1}, base, std::nullopt),
            session_error_code::token_not_permitted);
  EXPECT_EQ(leash::execution::check_step(permissions, wallet_action_t::transfer,
                                         amount_t{1}, base,
                                         std::string{"0xeurc"}),
            session_error_code::token_not_permitted);
  EXPECT_EQ(leash::execution::check_step(permissions, wallet_action_t::transfer,
                                         amount_t{101}, base, usdc),
            session_error_code::per_transaction_limit_exceeded);

  permissions.allowed_chains.clear();
  permissions.allowed_tokens.clear();
  EXPECT_FALSE(leash::execution::check_step(permissions,
                                            wallet_action_t::transfer,
                                            amount_t{1}, std::nullopt,
                                            std::nullopt)
                   .has_value());
}

TEST(enforcer, transfer_scenario_with_limit_and_revocation) {
  auto fixture = leash::testing::engine_fixture{"leash_enforcer_scenario"};
  auto& engine = fixture.engine();
  auto id = fixture.activate();

  auto first = fixture.authorize(id, wallet_action_t::transfer, 40'00);
  ASSERT_EQ(first.code, 0u) << first.log;
  EXPECT_EQ(first.spending_used, amount_t{40'00});
  ASSERT_EQ(first.record_ids.size(), 1u);

  auto too_much = fixture.authorize(id, wallet_action_t::transfer, 70'00);
  EXPECT_EQ(too_much.code, code_of(session_error_code::spending_limit_exceeded));
  ASSERT_TRUE(too_much.headroom.has_value());
  EXPECT_EQ(*too_much.headroom, amount_t{60'00});
  EXPECT_EQ(too_much.spending_used, amount_t{40'00});

  auto bridge = fixture.authorize(id, wallet_action_t::bridge, 10'00);
  EXPECT_EQ(bridge.code, code_of(session_error_code::action_not_permitted));

  auto revoked = engine.revoke_session(id);
  EXPECT_TRUE(revoked.changed);

  auto after = fixture.authorize(id, wallet_action_t::transfer, 1'00);
  EXPECT_EQ(after.code, code_of(session_error_code::inactive));

  auto history = engine.history(id);
  ASSERT_EQ(history.size(), 4u);
  auto admitted = 0;
  auto rejected = 0;
  for (const auto& record : history) {
    admitted += record.outcome == execution_outcome_t::admitted ? 1 : 0;
    rejected += record.outcome == execution_outcome_t::rejected ? 1 : 0;
  }
  EXPECT_EQ(admitted, 1);
  EXPECT_EQ(rejected, 3);

  auto reconciled = engine.reconcile(id);
  EXPECT_TRUE(reconciled.consistent) << reconciled.log;
  EXPECT_EQ(reconciled.ledger_spent, amount_t{40'00});
  EXPECT_EQ(reconciled.rejected_count, 3u);
}

TEST(enforcer, lapsed_session_expires_on_next_authorize) {
  auto fixture = leash::testing::engine_fixture{"leash_enforcer_lapse"};
  auto& engine = fixture.engine();
  auto id = fixture.activate();

  fixture.clock().advance(7 * leash::schema::kSecondsPerDay - 1);
  EXPECT_EQ(fixture.authorize(id, wallet_action_t::transfer, 1).code, 0u);

  fixture.clock().advance(1);
  auto lapsed = fixture.authorize(id, wallet_action_t::transfer, 1);
  EXPECT_EQ(lapsed.code, code_of(session_error_code::expired));

  auto stored = fixture.store().load_session(id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->value.status, session_status_t::expired);
  EXPECT_FALSE(engine.active_session(leash::testing::kWallet).has_value());

  // Terminal is permanent, whatever the clock says.
  fixture.clock().set(leash::testing::kEpoch);
  EXPECT_EQ(fixture.authorize(id, wallet_action_t::transfer, 1).code,
            code_of(session_error_code::inactive));
}

TEST(enforcer, unknown_and_pending_sessions_are_rejected) {
  auto fixture = leash::testing::engine_fixture{"leash_enforcer_states"};
  auto& engine = fixture.engine();

  auto missing = fixture.authorize("sk_missing", wallet_action_t::transfer, 1);
  EXPECT_EQ(missing.code, code_of(session_error_code::not_found));
  EXPECT_TRUE(missing.record_ids.empty());

  auto empty = fixture.authorize("", wallet_action_t::transfer, 1);
  EXPECT_EQ(empty.code, code_of(session_error_code::invalid_request));

  auto created = engine.create_session(leash::testing::kWallet,
                                       leash::testing::kUser,
                                       leash::testing::kScenarioAgent);
  auto pending =
      fixture.authorize(created.session_key_id, wallet_action_t::transfer, 1);
  EXPECT_EQ(pending.code, code_of(session_error_code::not_yet_active));
}

TEST(enforcer, agent_mismatch_is_rejected) {
  auto fixture = leash::testing::engine_fixture{"leash_enforcer_agent"};
  auto& engine = fixture.engine();
  auto id = fixture.activate();

  auto request = leash::schema::authorization_request_t{
      .session_key_id = id,
      .action = wallet_action_t::transfer,
      .amount = amount_t{1},
      .agent_type = std::string{"payments"}};
  EXPECT_EQ(engine.authorize(request).code,
            code_of(session_error_code::agent_mismatch));

  request.agent_type = std::string{leash::testing::kScenarioAgent};
  EXPECT_EQ(engine.authorize(request).code, 0u);
}

TEST(enforcer, chain_and_per_transaction_limits_apply) {
  auto fixture = leash::testing::engine_fixture{"leash_enforcer_remit"};
  auto& engine = fixture.engine();
  auto id = fixture.activate("remittance");

  auto request = leash::schema::authorization_request_t{
      .session_key_id = id,
      .action = wallet_action_t::bridge,
      .amount = amount_t{10},
      .chain = std::string{"BASE-SEPOLIA"}};
  EXPECT_EQ(engine.authorize(request).code, 0u);

  request.chain = std::string{"SOLANA-DEVNET"};
  EXPECT_EQ(engine.authorize(request).code,
            code_of(session_error_code::chain_not_permitted));

  auto payments = fixture.activate("payments", "wallet-2");
  auto capped = fixture.authorize(payments, wallet_action_t::transfer,
                                  1'000'000'001);
  EXPECT_EQ(capped.code,
            code_of(session_error_code::per_transaction_limit_exceeded));
  EXPECT_EQ(fixture.authorize(payments, wallet_action_t::transfer,
                              1'000'000'000)
                .code,
            0u);
}

TEST(enforcer, token_restriction_applies_to_single_and_batch) {
  auto fixture = leash::testing::engine_fixture{"leash_enforcer_tokens"};
  auto& engine = fixture.engine();
  auto id = fixture.activate(
      leash::testing::kScenarioAgent, leash::testing::kWallet,
      leash::schema::permission_overrides_t{
          .allowed_tokens = std::vector<std::string>{kUsdc}});
  EXPECT_EQ(engine.view(id)->allowed_tokens, std::vector<std::string>{kUsdc});

  auto request = leash::schema::authorization_request_t{
      .session_key_id = id,
      .action = wallet_action_t::transfer,
      .amount = amount_t{10},
      .token = std::string{kUsdc}};
  EXPECT_EQ(engine.authorize(request).code, 0u);

  request.token = std::string{"0xeurc"};
  EXPECT_EQ(engine.authorize(request).code,
            code_of(session_error_code::token_not_permitted));
  request.token.reset();
  EXPECT_EQ(engine.authorize(request).code,
            code_of(session_error_code::token_not_permitted));

  auto batch = leash::schema::batch_authorization_request_t{
      .session_key_id = id,
      .steps = {{.action = wallet_action_t::transfer,
                 .amount = amount_t{1},
                 .token = std::string{kUsdc}},
                {.action = wallet_action_t::transfer,
                 .amount = amount_t{1},
                 .token = std::string{"0xeurc"}}}};
  EXPECT_EQ(engine.authorize_batch(batch).code,
            code_of(session_error_code::token_not_permitted));
  EXPECT_EQ(engine.view(id)->spending_used, amount_t{10});
}

TEST(enforcer, batch_is_all_or_nothing) {
  auto fixture = leash::testing::engine_fixture{"leash_enforcer_batch"};
  auto& engine = fixture.engine();
  auto id = fixture.activate();

  auto fits = leash::schema::batch_authorization_request_t{
      .session_key_id = id,
      .steps = {{.action = wallet_action_t::transfer, .amount = amount_t{30'00}},
                {.action = wallet_action_t::transfer,
                 .amount = amount_t{20'00}}}};
  auto admitted = engine.authorize_batch(fits);
  ASSERT_EQ(admitted.code, 0u) << admitted.log;
  EXPECT_EQ(admitted.record_ids.size(), 2u);
  EXPECT_EQ(admitted.spending_used, amount_t{50'00});

  auto too_much = leash::schema::batch_authorization_request_t{
      .session_key_id = id,
      .steps = {{.action = wallet_action_t::transfer, .amount = amount_t{30'00}},
                {.action = wallet_action_t::transfer,
                 .amount = amount_t{30'00}}}};
  auto rejected = engine.authorize_batch(too_much);
  EXPECT_EQ(rejected.code, code_of(session_error_code::spending_limit_exceeded));
  EXPECT_EQ(rejected.headroom, amount_t{50'00});

  auto bad_step = leash::schema::batch_authorization_request_t{
      .session_key_id = id,
      .steps = {{.action = wallet_action_t::transfer, .amount = amount_t{1}},
                {.action = wallet_action_t::swap, .amount = amount_t{1}}}};
  EXPECT_EQ(engine.authorize_batch(bad_step).code,
            code_of(session_error_code::action_not_permitted));

  auto huge = (std::numeric_limits<amount_t>::max)();
  auto overflow = leash::schema::batch_authorization_request_t{
      .session_key_id = id,
      .steps = {{.action = wallet_action_t::transfer, .amount = huge},
                {.action = wallet_action_t::transfer, .amount = huge}}};
  EXPECT_EQ(engine.authorize_batch(overflow).code,
            code_of(session_error_code::spending_limit_exceeded));

  auto empty = leash::schema::batch_authorization_request_t{.session_key_id = id};
  EXPECT_EQ(engine.authorize_batch(empty).code,
            code_of(session_error_code::invalid_request));

  EXPECT_EQ(engine.view(id)->spending_used, amount_t{50'00});
}

TEST(enforcer, reverse_releases_and_clamps) {
  auto fixture = leash::testing::engine_fixture{"leash_enforcer_reverse"};
  auto& engine = fixture.engine();
  auto id = fixture.activate();

  // Same second throughout: the ledger must still keep write order.
  ASSERT_EQ(fixture.authorize(id, wallet_action_t::transfer, 40'00).code, 0u);
  auto partial = engine.reverse(id, amount_t{15'00});
  ASSERT_EQ(partial.code, 0u) << partial.log;
  EXPECT_FALSE(partial.clamped);
  EXPECT_EQ(partial.amount_reversed, amount_t{15'00});
  EXPECT_EQ(partial.spending_used, amount_t{25'00});

  auto clamped = engine.reverse(id, amount_t{99'00});
  ASSERT_EQ(clamped.code, 0u);
  EXPECT_TRUE(clamped.clamped);
  EXPECT_EQ(clamped.amount_reversed, amount_t{25'00});
  EXPECT_EQ(clamped.spending_used, amount_t{0});

  auto history = engine.history(id);
  ASSERT_EQ(history.size(), 3u);
  EXPECT_EQ(history[0].outcome, execution_outcome_t::admitted);
  EXPECT_EQ(history[1].outcome, execution_outcome_t::reversed);
  EXPECT_EQ(history[1].amount, amount_t{15'00});
  EXPECT_LT(history[0].sequence, history[1].sequence);
  EXPECT_EQ(history.back().outcome, execution_outcome_t::reversed);
  EXPECT_FALSE(history.back().action.has_value());
  EXPECT_NE(history.back().note.find("clamped"), std::string::npos);

  EXPECT_TRUE(engine.reconcile(id).consistent);
  EXPECT_EQ(engine.reverse("sk_missing", amount_t{1}).code,
            code_of(session_error_code::not_found));
}

TEST(enforcer, concurrent_authorizations_never_overspend) {
  auto options = leash::execution::engine_options{};
  options.max_cas_retries = 64;
  auto fixture =
      leash::testing::engine_fixture{"leash_enforcer_concurrent", options};
  auto& engine = fixture.engine();
  auto id = fixture.activate();

  constexpr auto kThreads = 20;
  constexpr auto kAttempts = 10;
  auto admitted = std::atomic<int>{};
  auto contended = std::atomic<int>{};
  auto workers = std::vector<std::thread>{};
  for (auto t = 0; t < kThreads; ++t) {
    workers.emplace_back([&] {
      for (auto i = 0; i < kAttempts; ++i) {
        auto result = fixture.authorize(id, wallet_action_t::transfer, 10'00);
        if (result.code == 0) {
          ++admitted;
        } else if (result.code == code_of(session_error_code::contention)) {
          ++contended;
        } else {
          EXPECT_EQ(result.code,
                    code_of(session_error_code::spending_limit_exceeded));
        }
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  EXPECT_LE(admitted.load(), 10);
  if (contended.load() == 0) {
    EXPECT_EQ(admitted.load(), 10);
  }
  auto view = engine.view(id);
  ASSERT_TRUE(view.has_value());
  EXPECT_EQ(view->spending_used, amount_t{10'00} * admitted.load());

  auto reconciled = engine.reconcile(id);
  EXPECT_TRUE(reconciled.consistent) << reconciled.log;
  EXPECT_EQ(reconciled.admitted_count, static_cast<uint64_t>(admitted.load()));
}
