#include <leash/execution/engine.hpp>

#include <leash/execution/result.hpp>

#include <spdlog/spdlog.h>

namespace leash::execution {

using leash::schema::execution_outcome_t;
using leash::schema::session_error_code;

leash::schema::session_view_t make_view(
    const leash::schema::session_key_state_t& session) {
  const auto& permissions = session.permissions;
  return leash::schema::session_view_t{
      .session_key_id = session.session_key_id,
      .wallet_id = session.wallet_id,
      .agent_type = session.agent_type,
      .delegate_address = session.delegate_address,
      .status = session.status,
      .created_at = session.created_at,
      .expires_at = session.expires_at,
      .spending_used = permissions.spending_used,
      .spending_limit = permissions.spending_limit,
      .headroom = permissions.spending_limit - permissions.spending_used,
      .allowed_actions = permissions.allowed_actions,
      .max_amount_per_transaction = permissions.max_amount_per_transaction,
      .allowed_chains = permissions.allowed_chains,
      .allowed_tokens = permissions.allowed_tokens,
      .auto_renew = permissions.auto_renew,
      .renewals_used = permissions.renewals_used,
      .max_renewals = permissions.max_renewals};
}

engine::engine(leash::storage::encoder_t& encoder,
               leash::storage::rocksdb_storage_t& storage,
               engine_options options,
               leash::catalog::permission_catalog catalog,
               time_source_t clock,
               challenge_dispatcher_t dispatcher)
    : options_{options},
      catalog_{std::move(catalog)},
      clock_{std::move(clock)},
      store_{encoder, storage},
      coordinator_{store_, catalog_, options_, clock_, std::move(dispatcher)},
      enforcer_{store_, options_, clock_},
      revocations_{store_, clock_},
      scheduler_{store_, coordinator_, options_, clock_} {
  if (options_.max_cas_retries == 0) {
    spdlog::warn("max_cas_retries is 0; raising to 1");
    options_.max_cas_retries = 1;
  }
  if (options_.renewal_interval_seconds == 0) {
    spdlog::warn("renewal_interval_seconds is 0; raising to 1");
    options_.renewal_interval_seconds = 1;
  }
  spdlog::info(
      "Session engine ready: {} agent profile(s), cas retries {}, look-ahead "
      "{}% (floor {}s), challenge ttl {}s",
      catalog_.profiles().size(), options_.max_cas_retries,
      options_.lookahead_ratio_percent, options_.lookahead_floor_seconds,
      options_.challenge_ttl_seconds);
}

leash::schema::create_session_result_t engine::create_session(
    std::string_view wallet_id,
    std::string_view user_id,
    std::string_view agent_type,
    const std::optional<leash::schema::permission_overrides_t>& overrides) {
  return coordinator_.begin_create(wallet_id, user_id, agent_type, overrides);
}

leash::schema::challenge_completion_result_t engine::complete_challenge(
    const leash::schema::challenge_confirmation_t& confirmation) {
  return coordinator_.complete_challenge(confirmation);
}

leash::schema::renewal_result_t engine::renew_session(
    std::string_view session_key_id) {
  return coordinator_.begin_renew(session_key_id);
}

leash::schema::revocation_result_t engine::revoke_session(
    std::string_view session_key_id,
    leash::schema::revocation_reason_t reason) {
  return revocations_.revoke(session_key_id, reason);
}

leash::schema::wallet_revocation_result_t engine::revoke_wallet(
    std::string_view wallet_id,
    leash::schema::revocation_reason_t reason) {
  return revocations_.revoke_wallet(wallet_id, reason);
}

std::optional<leash::schema::session_view_t> engine::view(
    std::string_view session_key_id) {
  auto current = load_session_at(store_, session_key_id, clock_());
  if (!current) {
    return std::nullopt;
  }
  return make_view(current->value);
}

std::vector<leash::schema::session_view_t> engine::list_wallet_sessions(
    std::string_view wallet_id) {
  auto views = std::vector<leash::schema::session_view_t>{};
  auto now = clock_();
  for (const auto& session_key_id : store_.wallet_session_ids(wallet_id)) {
    auto current = load_session_at(store_, session_key_id, now);
    if (current) {
      views.push_back(make_view(current->value));
    }
  }
  return views;
}

std::optional<leash::schema::session_view_t> engine::active_session(
    std::string_view wallet_id) {
  auto holder = store_.wallet_holder(wallet_id);
  if (!holder) {
    return std::nullopt;
  }
  auto current = view(*holder);
  if (!current || !leash::schema::is_spendable(current->status)) {
    return std::nullopt;
  }
  return current;
}

leash::schema::authorization_result_t engine::authorize(
    const leash::schema::authorization_request_t& request) {
  return enforcer_.authorize(request);
}

leash::schema::authorization_result_t engine::authorize_batch(
    const leash::schema::batch_authorization_request_t& request) {
  return enforcer_.authorize_batch(request);
}

leash::schema::reversal_result_t engine::reverse(
    std::string_view session_key_id,
    const leash::schema::amount_t& amount) {
  return enforcer_.reverse(session_key_id, amount);
}

std::vector<leash::schema::execution_record_t> engine::history(
    std::string_view session_key_id) const {
  return store_.history(session_key_id);
}

leash::schema::reconciliation_result_t engine::reconcile(
    std::string_view session_key_id) const {
  using result_t = leash::schema::reconciliation_result_t;
  auto session = store_.load_session(session_key_id);
  if (!session) {
    return make_error<result_t>(session_error_code::not_found);
  }

  auto result = result_t{};
  auto admitted = leash::schema::amount_t{};
  auto reversed = leash::schema::amount_t{};
  for (const auto& record : store_.history(session_key_id)) {
    switch (record.outcome) {
      case execution_outcome_t::admitted:
        admitted += record.amount;
        ++result.admitted_count;
        break;
      case execution_outcome_t::reversed:
        reversed += record.amount;
        ++result.reversed_count;
        break;
      case execution_outcome_t::rejected:
        ++result.rejected_count;
        break;
    }
  }

  result.counter_spent = session->value.permissions.spending_used;
  result.consistent = reversed <= admitted;
  if (result.consistent) {
    result.ledger_spent = admitted - reversed;
    result.consistent = result.ledger_spent == result.counter_spent;
  }
  result.log = result.consistent ? "consistent" : "ledger and counter disagree";
  if (!result.consistent) {
    spdlog::warn("session {} ledger spent {} but counter is {}",
                 session_key_id, leash::schema::to_string(result.ledger_spent),
                 leash::schema::to_string(result.counter_spent));
  }
  return result;
}

leash::schema::renewal_pass_report_t engine::run_renewal_pass() {
  return scheduler_.run_once();
}

void engine::start_scheduler() {
  scheduler_.start();
}

void engine::stop_scheduler() {
  scheduler_.stop();
}

const leash::catalog::permission_catalog& engine::catalog() const {
  return catalog_;
}

const engine_options& engine::options() const {
  return options_;
}

}  // namespace leash::execution
