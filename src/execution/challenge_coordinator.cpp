#include <leash/execution/challenge_coordinator.hpp>

#include <leash/crypto/random.hpp>
#include <leash/execution/result.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace leash::execution {

using leash::schema::challenge_kind_t;
using leash::schema::challenge_status_t;
using leash::schema::revocation_reason_t;
using leash::schema::session_error_code;
using leash::schema::session_status_t;

namespace {

template <typename T>
bool contains(const std::vector<T>& values, const T& value) {
  return std::ranges::find(values, value) != std::end(values);
}

permission_grant invalid_override(std::string log) {
  auto grant = permission_grant{};
  grant.code = leash::schema::to_code(session_error_code::invalid_override);
  grant.log = std::move(log);
  return grant;
}

}  // namespace

permission_grant merge_overrides(
    const leash::schema::agent_profile_t& profile,
    const std::optional<leash::schema::permission_overrides_t>& overrides) {
  auto grant = permission_grant{};
  grant.duration_seconds = profile.duration_seconds;
  grant.permissions.allowed_actions = profile.allowed_actions;
  grant.permissions.spending_limit = profile.spending_limit;
  grant.permissions.max_amount_per_transaction =
      profile.max_amount_per_transaction;
  grant.permissions.allowed_chains = profile.allowed_chains;
  grant.permissions.allowed_tokens = profile.allowed_tokens;
  grant.permissions.max_renewals = profile.max_renewals;
  if (!overrides) {
    return grant;
  }

  const auto& requested = overrides.value();
  if (requested.allowed_actions) {
    auto actions = std::vector<leash::schema::wallet_action_t>{};
    for (auto action : requested.allowed_actions.value()) {
      if (!contains(profile.allowed_actions, action)) {
        return invalid_override("action '" +
                                std::string{leash::schema::to_string(action)} +
                                "' exceeds catalog defaults");
      }
      if (!contains(actions, action)) {
        actions.push_back(action);
      }
    }
    grant.permissions.allowed_actions = std::move(actions);
  }

  if (requested.spending_limit) {
    if (requested.spending_limit.value() > profile.spending_limit) {
      return invalid_override("spending limit exceeds catalog default");
    }
    grant.permissions.spending_limit = requested.spending_limit.value();
  }

  if (requested.duration_seconds) {
    if (requested.duration_seconds.value() == 0 ||
        requested.duration_seconds.value() > profile.duration_seconds) {
      return invalid_override("duration must be positive and within default");
    }
    grant.duration_seconds = requested.duration_seconds.value();
  }

  if (requested.max_amount_per_transaction) {
    if (profile.max_amount_per_transaction &&
        requested.max_amount_per_transaction.value() >
            profile.max_amount_per_transaction.value()) {
      return invalid_override("per-transaction cap exceeds catalog default");
    }
    grant.permissions.max_amount_per_transaction =
        requested.max_amount_per_transaction;
  }

  if (requested.allowed_chains) {
    const auto& chains = requested.allowed_chains.value();
    if (!profile.allowed_chains.empty()) {
      // An empty list means "any chain", which widens a restricted profile.
      if (chains.empty()) {
        return invalid_override("chain restriction cannot be lifted");
      }
      for (const auto& chain : chains) {
        if (!contains(profile.allowed_chains, chain)) {
          return invalid_override("chain '" + chain +
                                  "' exceeds catalog defaults");
        }
      }
    }
    grant.permissions.allowed_chains = chains;
  }

  if (requested.allowed_tokens) {
    const auto& tokens = requested.allowed_tokens.value();
    if (!profile.allowed_tokens.empty()) {
      if (tokens.empty()) {
        return invalid_override("token restriction cannot be lifted");
      }
      for (const auto& token : tokens) {
        if (!contains(profile.allowed_tokens, token)) {
          return invalid_override("token '" + token +
                                  "' exceeds catalog defaults");
        }
      }
    }
    grant.permissions.allowed_tokens = tokens;
  }

  if (requested.max_renewals) {
    if (requested.max_renewals.value() > profile.max_renewals) {
      return invalid_override("max renewals exceeds catalog default");
    }
    grant.permissions.max_renewals = requested.max_renewals.value();
  }

  grant.permissions.auto_renew = requested.auto_renew.value_or(false);
  return grant;
}

challenge_coordinator::challenge_coordinator(
    leash::storage::session_store& store,
    const leash::catalog::permission_catalog& catalog,
    const engine_options& options,
    time_source_t clock,
    challenge_dispatcher_t dispatcher)
    : store_{store},
      catalog_{catalog},
      options_{options},
      clock_{std::move(clock)},
      dispatcher_{std::move(dispatcher)} {}

leash::schema::create_session_result_t challenge_coordinator::begin_create(
    std::string_view wallet_id,
    std::string_view user_id,
    std::string_view agent_type,
    const std::optional<leash::schema::permission_overrides_t>& overrides) {
  using result_t = leash::schema::create_session_result_t;
  if (wallet_id.empty() || user_id.empty() || agent_type.empty()) {
    return make_error<result_t>(session_error_code::invalid_request,
                                "wallet, user and agent type are required");
  }

  auto profile = catalog_.defaults_for(agent_type);
  if (!profile.known) {
    return make_error<result_t>(
        session_error_code::unknown_agent_type,
        "unknown agent type '" + std::string{agent_type} + "'");
  }

  auto grant = merge_overrides(profile, overrides);
  if (grant.code != 0) {
    spdlog::debug("create rejected for wallet {}: {}", wallet_id, grant.log);
    auto result = result_t{};
    result.code = grant.code;
    result.log = std::move(grant.log);
    return result;
  }

  auto now = clock_();
  auto session = leash::schema::session_key_state_t{
      .session_key_id =
          leash::crypto::make_identifier(leash::crypto::kSessionKeyIdPrefix),
      .wallet_id = std::string{wallet_id},
      .user_id = std::string{user_id},
      .agent_type = std::string{agent_type},
      .created_at = now,
      // Provisional; activation restarts the clock.
      .expires_at = now + grant.duration_seconds,
      .duration_seconds = grant.duration_seconds,
      .status = session_status_t::pending,
      .permissions = std::move(grant.permissions)};
  auto challenge = leash::schema::delegation_challenge_t{
      .challenge_id =
          leash::crypto::make_identifier(leash::crypto::kChallengeIdPrefix),
      .session_key_id = session.session_key_id,
      .kind = challenge_kind_t::create,
      .status = challenge_status_t::awaiting_confirmation,
      .created_at = now};

  auto txn = store_.begin();
  txn.expect_absent_session(session.session_key_id)
      .expect_absent_challenge(challenge.challenge_id)
      .put(session)
      .put(challenge);
  if (!txn.commit()) {
    return make_error<result_t>(session_error_code::contention);
  }

  spdlog::info("session {} pending for wallet {} agent {} (challenge {})",
               session.session_key_id, wallet_id, agent_type,
               challenge.challenge_id);
  dispatch(session, challenge);

  auto result = result_t{};
  result.session_key_id = session.session_key_id;
  result.challenge_id = challenge.challenge_id;
  return result;
}

leash::schema::renewal_result_t challenge_coordinator::begin_renew(
    std::string_view session_key_id) {
  using result_t = leash::schema::renewal_result_t;
  for (uint32_t attempt = 0; attempt < options_.max_cas_retries; ++attempt) {
    auto current = load_session_at(store_, session_key_id, clock_());
    if (!current) {
      return make_error<result_t>(session_error_code::not_found);
    }
    const auto& session = current->value;
    switch (session.status) {
      case session_status_t::pending:
        return make_error<result_t>(session_error_code::not_yet_active);
      case session_status_t::expired:
        return make_error<result_t>(session_error_code::expired);
      case session_status_t::revoked:
        return make_error<result_t>(session_error_code::inactive);
      case session_status_t::renewing:
        return make_error<result_t>(session_error_code::renewal_in_progress);
      case session_status_t::active:
        break;
    }
    if (!session.permissions.auto_renew) {
      return make_error<result_t>(session_error_code::renewal_not_enabled);
    }
    if (session.permissions.renewals_used >= session.permissions.max_renewals) {
      return make_error<result_t>(session_error_code::renewal_quota_exhausted);
    }

    auto started = try_begin_renew(*current);
    if (started) {
      return started.value();
    }
  }
  spdlog::warn("renewal of session {} gave up after {} attempts",
               session_key_id, options_.max_cas_retries);
  return make_error<result_t>(session_error_code::contention);
}

std::optional<leash::schema::renewal_result_t>
challenge_coordinator::try_begin_renew(const versioned_session_t& current) {
  auto now = clock_();
  auto renewing = current.value;
  renewing.status = session_status_t::renewing;
  auto challenge = leash::schema::delegation_challenge_t{
      .challenge_id =
          leash::crypto::make_identifier(leash::crypto::kChallengeIdPrefix),
      .session_key_id = renewing.session_key_id,
      .kind = challenge_kind_t::renew,
      .status = challenge_status_t::awaiting_confirmation,
      .created_at = now};

  auto txn = store_.begin();
  txn.expect(current)
      .expect_absent_challenge(challenge.challenge_id)
      .put(renewing)
      .put(challenge);
  if (!txn.commit()) {
    return std::nullopt;
  }

  spdlog::info("session {} renewing ({}/{} used, challenge {})",
               renewing.session_key_id, renewing.permissions.renewals_used,
               renewing.permissions.max_renewals, challenge.challenge_id);
  dispatch(renewing, challenge);

  auto result = leash::schema::renewal_result_t{};
  result.challenge_id = challenge.challenge_id;
  return result;
}

leash::schema::challenge_completion_result_t
challenge_coordinator::complete_challenge(
    const leash::schema::challenge_confirmation_t& confirmation) {
  using result_t = leash::schema::challenge_completion_result_t;
  if (confirmation.challenge_id.empty()) {
    return make_error<result_t>(session_error_code::invalid_request,
                                "challenge id is required");
  }

  for (uint32_t attempt = 0; attempt < options_.max_cas_retries; ++attempt) {
    auto challenge = store_.load_challenge(confirmation.challenge_id);
    if (!challenge) {
      return make_error<result_t>(session_error_code::challenge_not_found);
    }
    auto session = store_.load_session(challenge->value.session_key_id);
    if (!session) {
      leash::common::critical("challenge {} references missing session {}",
                              challenge->value.challenge_id,
                              challenge->value.session_key_id);
    }

    if (challenge->value.status != challenge_status_t::awaiting_confirmation) {
      // Duplicate delivery: report what the first delivery decided.
      auto result = result_t{};
      result.log = "challenge already resolved";
      result.challenge_status = challenge->value.status;
      result.session_status = session->value.status;
      return result;
    }

    auto txn = store_.begin();
    auto staged = stage_resolution(
        txn, *challenge, *session,
        confirmation.success ? resolution::confirmed : resolution::declined,
        confirmation.delegate_address, clock_());
    if (txn.commit()) {
      spdlog::info("challenge {} {}: session {} {}",
                   challenge->value.challenge_id,
                   leash::schema::to_string(staged.challenge_status),
                   challenge->value.session_key_id,
                   leash::schema::to_string(
                       staged.session_status.value_or(session->value.status)));
      return staged;
    }
  }
  spdlog::warn("completion of challenge {} gave up after {} attempts",
               confirmation.challenge_id, options_.max_cas_retries);
  return make_error<result_t>(session_error_code::contention);
}

uint64_t challenge_coordinator::expire_stale_challenges() {
  auto expired = uint64_t{};
  auto now = clock_();
  for (const auto& challenge_id : store_.open_challenge_ids()) {
    for (uint32_t attempt = 0; attempt < options_.max_cas_retries; ++attempt) {
      auto challenge = store_.load_challenge(challenge_id);
      if (!challenge ||
          challenge->value.status != challenge_status_t::awaiting_confirmation ||
          now < challenge->value.created_at + options_.challenge_ttl_seconds) {
        break;
      }
      auto session = store_.load_session(challenge->value.session_key_id);
      if (!session) {
        leash::common::critical("challenge {} references missing session {}",
                                challenge_id, challenge->value.session_key_id);
      }

      auto txn = store_.begin();
      stage_resolution(txn, *challenge, *session, resolution::timed_out,
                       std::nullopt, now);
      if (txn.commit()) {
        spdlog::info("challenge {} for session {} expired unanswered",
                     challenge_id, challenge->value.session_key_id);
        ++expired;
        break;
      }
    }
  }
  return expired;
}

leash::schema::challenge_completion_result_t
challenge_coordinator::stage_resolution(
    leash::storage::session_store::transaction& txn,
    const versioned_challenge_t& challenge,
    const versioned_session_t& session,
    resolution outcome,
    const std::optional<std::string>& delegate_address,
    leash::schema::timestamp_seconds_t now) {
  auto result = leash::schema::challenge_completion_result_t{};
  result.applied = true;

  auto resolved = challenge.value;
  resolved.resolved_at = now;
  resolved.status = outcome == resolution::timed_out
                        ? challenge_status_t::expired
                        : challenge_status_t::failed;
  txn.expect(challenge);

  auto expected_status = challenge.value.kind == challenge_kind_t::create
                             ? session_status_t::pending
                             : session_status_t::renewing;
  if (session.value.status != expected_status) {
    // Revoked, expired or otherwise moved on while the provider was
    // deciding; the late answer grants nothing.
    txn.put(resolved);
    result.applied = false;
    result.log = "session no longer awaiting this challenge";
    result.challenge_status = resolved.status;
    result.session_status = session.value.status;
    return result;
  }

  auto updated = session.value;
  if (challenge.value.kind == challenge_kind_t::create) {
    if (outcome == resolution::confirmed) {
      resolved.status = challenge_status_t::confirmed;
      updated.status = session_status_t::active;
      updated.expires_at = now + updated.duration_seconds;
      updated.delegate_address = delegate_address;
      txn.expect(session);
      stage_activation(txn, updated, now);
    } else {
      updated = stage_termination(store_, txn, session,
                                  session_status_t::revoked,
                                  revocation_reason_t::challenge_failed, now);
      result.code = leash::schema::to_code(session_error_code::challenge_failed);
      result.log = "custody provider declined the delegation";
    }
  } else {
    auto lapsed = now >= session.value.expires_at;
    if (outcome == resolution::confirmed && !lapsed) {
      resolved.status = challenge_status_t::confirmed;
      updated.status = session_status_t::active;
      updated.expires_at += updated.duration_seconds;
      updated.permissions.renewals_used += 1;
      if (delegate_address) {
        updated.delegate_address = delegate_address;
      }
      txn.expect(session).put(updated);
    } else if (lapsed) {
      if (outcome == resolution::confirmed) {
        resolved.status = challenge_status_t::expired;
      }
      updated = stage_termination(store_, txn, session,
                                  session_status_t::expired, std::nullopt, now);
      result.code = leash::schema::to_code(session_error_code::expired);
      result.log = "session lapsed before renewal completed";
    } else {
      updated.status = session_status_t::active;
      txn.expect(session).put(updated);
      result.code = leash::schema::to_code(session_error_code::challenge_failed);
      result.log = "renewal not confirmed; session continues until expiry";
    }
  }

  txn.put(resolved);
  result.challenge_status = resolved.status;
  result.session_status = updated.status;
  return result;
}

void challenge_coordinator::stage_activation(
    leash::storage::session_store::transaction& txn,
    leash::schema::session_key_state_t& session,
    leash::schema::timestamp_seconds_t now) {
  auto holder = store_.wallet_holder(session.wallet_id);
  if (holder && *holder != session.session_key_id) {
    auto previous = store_.load_session(*holder);
    if (previous && !leash::schema::is_terminal(previous->value.status)) {
      spdlog::info("session {} will supersede {} on wallet {}",
                   session.session_key_id, *holder, session.wallet_id);
      stage_termination(store_, txn, *previous, session_status_t::revoked,
                        revocation_reason_t::superseded, now);
    }
  }
  txn.put(session)
      .expect_wallet_holder(session.wallet_id, holder)
      .set_wallet_holder(session.wallet_id, session.session_key_id);
}

void challenge_coordinator::dispatch(
    const leash::schema::session_key_state_t& session,
    const leash::schema::delegation_challenge_t& challenge) const {
  if (!dispatcher_) {
    return;
  }
  dispatcher_(leash::schema::delegation_request_t{
      .challenge_id = challenge.challenge_id,
      .session_key_id = session.session_key_id,
      .wallet_id = session.wallet_id,
      .user_id = session.user_id,
      .agent_type = session.agent_type,
      .kind = challenge.kind,
      .allowed_actions = session.permissions.allowed_actions,
      .spending_limit = session.permissions.spending_limit,
      .duration_seconds = session.duration_seconds});
}

}  // namespace leash::execution
