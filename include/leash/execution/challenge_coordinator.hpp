#pragma once

#include <leash/catalog/permission_catalog.hpp>
#include <leash/execution/challenge_dispatcher.hpp>
#include <leash/execution/engine_options.hpp>
#include <leash/execution/lifecycle.hpp>
#include <leash/execution/time_source.hpp>
#include <leash/schema/challenge_confirmation.hpp>
#include <leash/schema/lifecycle_results.hpp>
#include <leash/schema/permission_overrides.hpp>
#include <leash/storage/session_store.hpp>

#include <optional>
#include <string_view>

namespace leash::execution {

/// Result of merging catalog defaults with caller overrides.
struct permission_grant final {
  uint32_t code{};
  std::string log;
  leash::schema::session_permissions_t permissions;
  leash::schema::duration_seconds_t duration_seconds{};
};

/// Narrow `profile` by `overrides`. Any attempt to widen a default yields
/// invalid_override.
permission_grant merge_overrides(
    const leash::schema::agent_profile_t& profile,
    const std::optional<leash::schema::permission_overrides_t>& overrides);

/// Drives the custody handshake that turns a create or renew request into a
/// confirmed session.
///
/// Opening a challenge only persists state and hands a request to the
/// dispatcher; the provider's answer arrives later through
/// complete_challenge, which is idempotent because the provider's callback
/// channel may deliver duplicates.
class challenge_coordinator final {
 public:
  challenge_coordinator(leash::storage::session_store& store,
                        const leash::catalog::permission_catalog& catalog,
                        const engine_options& options,
                        time_source_t clock,
                        challenge_dispatcher_t dispatcher);

  leash::schema::create_session_result_t begin_create(
      std::string_view wallet_id,
      std::string_view user_id,
      std::string_view agent_type,
      const std::optional<leash::schema::permission_overrides_t>& overrides);

  /// Manual renewal. Applies passive expiry first; only sessions granted
  /// auto-renew with quota left may renew.
  leash::schema::renewal_result_t begin_renew(std::string_view session_key_id);

  /// One Active -> Renewing attempt guarded on `current` being unchanged.
  /// std::nullopt when another writer got there first.
  std::optional<leash::schema::renewal_result_t> try_begin_renew(
      const versioned_session_t& current);

  leash::schema::challenge_completion_result_t complete_challenge(
      const leash::schema::challenge_confirmation_t& confirmation);

  /// Expire challenges left unanswered for at least the challenge TTL.
  /// Returns how many were expired.
  uint64_t expire_stale_challenges();

 private:
  enum class resolution { confirmed, declined, timed_out };

  /// Stage the challenge and its session moving to their resolved states.
  /// Returns the completion result to report if the commit lands.
  leash::schema::challenge_completion_result_t stage_resolution(
      leash::storage::session_store::transaction& txn,
      const versioned_challenge_t& challenge,
      const versioned_session_t& session,
      resolution outcome,
      const std::optional<std::string>& delegate_address,
      leash::schema::timestamp_seconds_t now);

  void stage_activation(leash::storage::session_store::transaction& txn,
                        leash::schema::session_key_state_t& session,
                        leash::schema::timestamp_seconds_t now);

  void dispatch(const leash::schema::session_key_state_t& session,
                const leash::schema::delegation_challenge_t& challenge) const;

  leash::storage::session_store& store_;
  const leash::catalog::permission_catalog& catalog_;
  const engine_options& options_;
  time_source_t clock_;
  challenge_dispatcher_t dispatcher_;
};

}  // namespace leash::execution
