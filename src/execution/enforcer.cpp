#include <leash/execution/enforcer.hpp>

#include <leash/execution/result.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>

namespace leash::execution {

using leash::schema::execution_outcome_t;
using leash::schema::session_error_code;
using leash::schema::session_status_t;

std::optional<session_error_code> check_step(
    const leash::schema::session_permissions_t& permissions,
    leash::schema::wallet_action_t action,
    const leash::schema::amount_t& amount,
    const std::optional<std::string>& chain,
    const std::optional<std::string>& token) {
  if (std::ranges::find(permissions.allowed_actions, action) ==
      std::end(permissions.allowed_actions)) {
    return session_error_code::action_not_permitted;
  }
  if (!permissions.allowed_chains.empty() &&
      (!chain || std::ranges::find(permissions.allowed_chains, *chain) ==
                     std::end(permissions.allowed_chains))) {
    return session_error_code::chain_not_permitted;
  }
  if (!permissions.allowed_tokens.empty() &&
      (!token || std::ranges::find(permissions.allowed_tokens, *token) ==
                     std::end(permissions.allowed_tokens))) {
    return session_error_code::token_not_permitted;
  }
  if (permissions.max_amount_per_transaction &&
      amount > *permissions.max_amount_per_transaction) {
    return session_error_code::per_transaction_limit_exceeded;
  }
  return std::nullopt;
}

enforcer::enforcer(leash::storage::session_store& store,
                   const engine_options& options,
                   time_source_t clock)
    : store_{store}, options_{options}, clock_{std::move(clock)} {}

leash::schema::authorization_result_t enforcer::authorize(
    const leash::schema::authorization_request_t& request) {
  using result_t = leash::schema::authorization_result_t;
  if (request.session_key_id.empty()) {
    return make_error<result_t>(session_error_code::invalid_request,
                                "session key id is required");
  }

  auto last_used = leash::schema::amount_t{};
  for (uint32_t attempt = 0; attempt < options_.max_cas_retries; ++attempt) {
    auto now = clock_();
    auto current = store_.load_session(request.session_key_id);
    if (!current) {
      return make_error<result_t>(session_error_code::not_found);
    }
    const auto& session = current->value;
    const auto& permissions = session.permissions;
    last_used = permissions.spending_used;

    auto code = check_session(*current, request.agent_type, now);
    if (!code) {
      code = check_step(permissions, request.action, request.amount,
                        request.chain, request.token);
    }
    if (code) {
      return reject(session.session_key_id, permissions.spending_used,
                    request.action, request.amount, *code, now);
    }

    // spending_used <= spending_limit holds, so headroom cannot underflow
    // and comparing against it cannot overflow.
    auto headroom = permissions.spending_limit - permissions.spending_used;
    if (request.amount > headroom) {
      auto result = reject(session.session_key_id, permissions.spending_used,
                           request.action, request.amount,
                           session_error_code::spending_limit_exceeded, now);
      result.headroom = headroom;
      return result;
    }
    auto projected = permissions.spending_used + request.amount;

    auto updated = session;
    updated.permissions.spending_used = projected;
    updated.last_used_at = now;
    auto record = make_record(session.session_key_id, request.action,
                              request.amount, now,
                              execution_outcome_t::admitted);
    auto txn = store_.begin();
    txn.expect(*current).put(updated).append(record);
    if (txn.commit()) {
      spdlog::debug("admitted {} {} on session {} ({} of {})",
                    leash::schema::to_string(request.action),
                    leash::schema::to_string(request.amount),
                    session.session_key_id, leash::schema::to_string(projected),
                    leash::schema::to_string(permissions.spending_limit));
      auto result = result_t{};
      result.log = "admitted";
      result.spending_used = projected;
      result.record_ids.push_back(record.record_id);
      return result;
    }
  }

  spdlog::warn("authorization on session {} gave up after {} attempts",
               request.session_key_id, options_.max_cas_retries);
  return reject(request.session_key_id, last_used, request.action,
                request.amount, session_error_code::contention, clock_());
}

leash::schema::authorization_result_t enforcer::authorize_batch(
    const leash::schema::batch_authorization_request_t& request) {
  using result_t = leash::schema::authorization_result_t;
  if (request.session_key_id.empty() || request.steps.empty()) {
    return make_error<result_t>(session_error_code::invalid_request,
                                "session key id and at least one step are "
                                "required");
  }

  // Saturating sum; a saturated total can never fit any headroom.
  const auto max_amount =
      (std::numeric_limits<leash::schema::amount_t>::max)();
  auto total = leash::schema::amount_t{};
  for (const auto& step : request.steps) {
    if (step.amount > max_amount - total) {
      total = max_amount;
    } else {
      total += step.amount;
    }
  }

  auto last_used = leash::schema::amount_t{};
  for (uint32_t attempt = 0; attempt < options_.max_cas_retries; ++attempt) {
    auto now = clock_();
    auto current = store_.load_session(request.session_key_id);
    if (!current) {
      return make_error<result_t>(session_error_code::not_found);
    }
    const auto& session = current->value;
    const auto& permissions = session.permissions;
    last_used = permissions.spending_used;

    if (auto code = check_session(*current, request.agent_type, now)) {
      return reject(session.session_key_id, permissions.spending_used,
                    std::nullopt, total, *code, now);
    }
    for (const auto& step : request.steps) {
      if (auto code = check_step(permissions, step.action, step.amount,
                                 step.chain, step.token)) {
        return reject(session.session_key_id, permissions.spending_used,
                      step.action, step.amount, *code, now);
      }
    }

    auto headroom = permissions.spending_limit - permissions.spending_used;
    if (total > headroom) {
      auto result = reject(session.session_key_id, permissions.spending_used,
                           std::nullopt, total,
                           session_error_code::spending_limit_exceeded, now);
      result.headroom = headroom;
      return result;
    }
    auto projected = permissions.spending_used + total;

    auto updated = session;
    updated.permissions.spending_used = projected;
    updated.last_used_at = now;
    auto txn = store_.begin();
    txn.expect(*current).put(updated);
    auto result = result_t{};
    for (const auto& step : request.steps) {
      auto record = make_record(session.session_key_id, step.action,
                                step.amount, now, execution_outcome_t::admitted);
      result.record_ids.push_back(record.record_id);
      txn.append(record);
    }
    if (txn.commit()) {
      spdlog::debug("admitted {}-step flow of {} on session {}",
                    request.steps.size(), leash::schema::to_string(total),
                    session.session_key_id);
      result.log = "admitted";
      result.spending_used = projected;
      return result;
    }
  }

  spdlog::warn("batch authorization on session {} gave up after {} attempts",
               request.session_key_id, options_.max_cas_retries);
  return reject(request.session_key_id, last_used, std::nullopt, total,
                session_error_code::contention, clock_());
}

leash::schema::reversal_result_t enforcer::reverse(
    std::string_view session_key_id,
    const leash::schema::amount_t& amount) {
  using result_t = leash::schema::reversal_result_t;
  if (session_key_id.empty()) {
    return make_error<result_t>(session_error_code::invalid_request,
                                "session key id is required");
  }

  for (uint32_t attempt = 0; attempt < options_.max_cas_retries; ++attempt) {
    auto now = clock_();
    auto current = load_session_at(store_, session_key_id, now);
    if (!current) {
      return make_error<result_t>(session_error_code::not_found);
    }
    const auto& session = current->value;
    if (session.status == session_status_t::pending) {
      return make_error<result_t>(session_error_code::not_yet_active);
    }

    const auto& reserved = session.permissions.spending_used;
    auto released = std::min(amount, reserved);
    auto clamped = amount > reserved;
    auto note = std::string{};
    if (clamped) {
      note = "clamped: requested " + leash::schema::to_string(amount) +
             ", reserved " + leash::schema::to_string(reserved);
    }

    auto updated = session;
    updated.permissions.spending_used = reserved - released;
    auto record = make_record(session_key_id, std::nullopt, released, now,
                              execution_outcome_t::reversed, note);
    auto txn = store_.begin();
    txn.expect(*current).put(updated).append(record);
    if (txn.commit()) {
      if (clamped) {
        spdlog::warn("reversal on session {} exceeds reservation; {}",
                     session_key_id, note);
      } else {
        spdlog::info("reversed {} on session {}",
                     leash::schema::to_string(released), session_key_id);
      }
      auto result = result_t{};
      result.log = clamped ? "reversed (clamped)" : "reversed";
      result.amount_reversed = released;
      result.spending_used = updated.permissions.spending_used;
      result.clamped = clamped;
      result.record_id = record.record_id;
      return result;
    }
  }

  spdlog::warn("reversal on session {} gave up after {} attempts",
               session_key_id, options_.max_cas_retries);
  return make_error<result_t>(session_error_code::contention);
}

std::optional<session_error_code> enforcer::check_session(
    const versioned_session_t& current,
    const std::optional<std::string>& agent_type,
    leash::schema::timestamp_seconds_t now) {
  const auto& session = current.value;
  if (leash::schema::is_terminal(session.status)) {
    return session_error_code::inactive;
  }
  if (session.status == session_status_t::pending) {
    return session_error_code::not_yet_active;
  }
  if (now >= session.expires_at) {
    terminate_session(store_, session.session_key_id,
                      session_status_t::expired, std::nullopt, now);
    return session_error_code::expired;
  }
  if (agent_type && *agent_type != session.agent_type) {
    return session_error_code::agent_mismatch;
  }
  return std::nullopt;
}

leash::schema::authorization_result_t enforcer::reject(
    std::string_view session_key_id,
    const leash::schema::amount_t& spending_used,
    std::optional<leash::schema::wallet_action_t> action,
    const leash::schema::amount_t& amount,
    session_error_code code,
    leash::schema::timestamp_seconds_t now) {
  auto record = make_record(session_key_id, action, amount, now,
                            execution_outcome_t::rejected,
                            std::string{leash::schema::to_string(code)});
  record.rejection_code = leash::schema::to_code(code);
  store_.append_record(record);
  spdlog::debug("rejected on session {}: {}", session_key_id,
                leash::schema::to_string(code));

  auto result =
      make_error<leash::schema::authorization_result_t>(code);
  result.spending_used = spending_used;
  result.record_ids.push_back(record.record_id);
  return result;
}

}  // namespace leash::execution
