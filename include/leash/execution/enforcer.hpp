#pragma once

#include <leash/execution/engine_options.hpp>
#include <leash/execution/lifecycle.hpp>
#include <leash/execution/time_source.hpp>
#include <leash/schema/authorization_request.hpp>
#include <leash/schema/authorization_result.hpp>
#include <leash/schema/session_error_code.hpp>
#include <leash/storage/session_store.hpp>

#include <optional>
#include <string_view>

namespace leash::execution {

/// The choke point every agent action passes before a signing request is
/// sent to the custody provider.
///
/// A decision never submits anything; it only reserves budget. Reservation
/// is a compare-and-swap on the session record: when another writer moved
/// the record between read and write, the whole evaluation reruns against
/// the fresh record, up to `max_cas_retries` times, then reports
/// contention. The sum of admitted amounts (net of reversals) therefore
/// never exceeds the spending limit, whatever the interleaving.
class enforcer final {
 public:
  enforcer(leash::storage::session_store& store,
           const engine_options& options,
           time_source_t clock);

  leash::schema::authorization_result_t authorize(
      const leash::schema::authorization_request_t& request);

  /// All steps are admitted with one reservation, or none is.
  leash::schema::authorization_result_t authorize_batch(
      const leash::schema::batch_authorization_request_t& request);

  /// Compensate a reservation whose signed transfer failed downstream.
  /// Releases at most what is currently reserved.
  leash::schema::reversal_result_t reverse(std::string_view session_key_id,
                                           const leash::schema::amount_t& amount);

 private:
  /// Status, expiry and agent checks shared by single and batch requests.
  /// Lapsed sessions are expired as a side effect.
  std::optional<leash::schema::session_error_code> check_session(
      const versioned_session_t& current,
      const std::optional<std::string>& agent_type,
      leash::schema::timestamp_seconds_t now);

  /// Build a rejection and append it to the ledger.
  leash::schema::authorization_result_t reject(
      std::string_view session_key_id,
      const leash::schema::amount_t& spending_used,
      std::optional<leash::schema::wallet_action_t> action,
      const leash::schema::amount_t& amount,
      leash::schema::session_error_code code,
      leash::schema::timestamp_seconds_t now);

  leash::storage::session_store& store_;
  const engine_options& options_;
  time_source_t clock_;
};

/// Per-step checks: action, chain, token and per-transaction cap. An empty
/// chain or token list on the session leaves that dimension unrestricted.
std::optional<leash::schema::session_error_code> check_step(
    const leash::schema::session_permissions_t& permissions,
    leash::schema::wallet_action_t action,
    const leash::schema::amount_t& amount,
    const std::optional<std::string>& chain,
    const std::optional<std::string>& token);

}  // namespace leash::execution
