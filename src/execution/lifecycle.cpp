#include <leash/execution/lifecycle.hpp>

#include <leash/crypto/random.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace leash::execution {

using leash::schema::session_status_t;

bool is_lapsed(const leash::schema::session_key_state_t& session,
               leash::schema::timestamp_seconds_t now) {
  return leash::schema::is_spendable(session.status) &&
         now >= session.expires_at;
}

leash::schema::duration_seconds_t lookahead_window(
    leash::schema::duration_seconds_t duration,
    const engine_options& options) {
  auto proportional = duration * options.lookahead_ratio_percent / 100;
  return std::max(proportional, options.lookahead_floor_seconds);
}

bool renewal_due(const leash::schema::session_key_state_t& session,
                 leash::schema::timestamp_seconds_t now,
                 const engine_options& options) {
  if (session.status != session_status_t::active ||
      !session.permissions.auto_renew ||
      session.permissions.renewals_used >= session.permissions.max_renewals ||
      now >= session.expires_at) {
    return false;
  }
  return session.expires_at - now <=
         lookahead_window(session.duration_seconds, options);
}

leash::schema::session_key_state_t stage_termination(
    leash::storage::session_store& store,
    leash::storage::session_store::transaction& txn,
    const versioned_session_t& current,
    session_status_t status,
    std::optional<leash::schema::revocation_reason_t> reason,
    leash::schema::timestamp_seconds_t now) {
  auto updated = current.value;
  updated.status = status;
  updated.terminated_at = now;
  if (status == session_status_t::revoked) {
    updated.revocation_reason = reason;
  }

  txn.expect(current).put(updated);
  auto holder = store.wallet_holder(updated.wallet_id);
  if (holder && *holder == updated.session_key_id) {
    txn.expect_wallet_holder(updated.wallet_id, holder)
        .set_wallet_holder(updated.wallet_id, std::nullopt);
  }
  return updated;
}

termination_outcome terminate_session(
    leash::storage::session_store& store,
    std::string_view session_key_id,
    session_status_t status,
    std::optional<leash::schema::revocation_reason_t> reason,
    leash::schema::timestamp_seconds_t now) {
  while (true) {
    auto current = store.load_session(session_key_id);
    if (!current) {
      return {};
    }
    auto previous = current->value.status;
    if (leash::schema::is_terminal(previous)) {
      return termination_outcome{.session = current->value,
                                 .previous_status = previous};
    }

    auto txn = store.begin();
    auto updated =
        stage_termination(store, txn, *current, status, reason, now);
    if (txn.commit()) {
      if (status == session_status_t::revoked) {
        spdlog::info("session {} revoked ({}) from {}", session_key_id,
                     leash::schema::to_string(
                         reason.value_or(leash::schema::revocation_reason_t::
                                             administrative)),
                     leash::schema::to_string(previous));
      } else {
        spdlog::info("session {} {} from {}", session_key_id,
                     leash::schema::to_string(status),
                     leash::schema::to_string(previous));
      }
      return termination_outcome{.session = std::move(updated),
                                 .previous_status = previous,
                                 .changed = true};
    }
  }
}

std::optional<versioned_session_t> load_session_at(
    leash::storage::session_store& store,
    std::string_view session_key_id,
    leash::schema::timestamp_seconds_t now) {
  while (true) {
    auto current = store.load_session(session_key_id);
    if (!current || !is_lapsed(current->value, now)) {
      return current;
    }
    spdlog::debug("session {} lapsed at {}, expiring", session_key_id,
                  current->value.expires_at);
    terminate_session(store, session_key_id, session_status_t::expired,
                      std::nullopt, now);
  }
}

leash::schema::execution_record_t make_record(
    std::string_view session_key_id,
    std::optional<leash::schema::wallet_action_t> action,
    const leash::schema::amount_t& amount,
    leash::schema::timestamp_seconds_t now,
    leash::schema::execution_outcome_t outcome,
    std::string note) {
  return leash::schema::execution_record_t{
      .record_id =
          leash::crypto::make_identifier(leash::crypto::kExecutionRecordIdPrefix),
      .session_key_id = std::string{session_key_id},
      .action = action,
      .amount = amount,
      .timestamp = now,
      .outcome = outcome,
      .note = std::move(note)};
}

}  // namespace leash::execution
