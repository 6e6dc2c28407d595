#pragma once

#include <leash/execution/engine_options.hpp>
#include <leash/schema/execution_record.hpp>
#include <leash/schema/revocation_reason.hpp>
#include <leash/schema/session_key_state.hpp>
#include <leash/storage/session_store.hpp>

#include <optional>
#include <string>
#include <string_view>

// Session state transitions shared by the enforcer, the coordinator, the
// scheduler and the revocation handler.
namespace leash::execution {

using versioned_session_t =
    leash::storage::versioned<leash::schema::session_key_state_t>;
using versioned_challenge_t =
    leash::storage::versioned<leash::schema::delegation_challenge_t>;

/// Spendable and past its expiry instant.
bool is_lapsed(const leash::schema::session_key_state_t& session,
               leash::schema::timestamp_seconds_t now);

/// Width of the window before expiry in which auto-renewal starts.
leash::schema::duration_seconds_t lookahead_window(
    leash::schema::duration_seconds_t duration,
    const engine_options& options);

/// Active, auto-renewing, with quota left and inside the look-ahead window.
bool renewal_due(const leash::schema::session_key_state_t& session,
                 leash::schema::timestamp_seconds_t now,
                 const engine_options& options);

/// Stage the move of `current` into a terminal status on `txn`, releasing the
/// wallet's live slot when this session holds it. Returns the new state.
leash::schema::session_key_state_t stage_termination(
    leash::storage::session_store& store,
    leash::storage::session_store::transaction& txn,
    const versioned_session_t& current,
    leash::schema::session_status_t status,
    std::optional<leash::schema::revocation_reason_t> reason,
    leash::schema::timestamp_seconds_t now);

struct termination_outcome final {
  std::optional<leash::schema::session_key_state_t> session;
  std::optional<leash::schema::session_status_t> previous_status;
  bool changed{};
};

/// Move a session into `status` (expired or revoked). Total: a terminal
/// session is left as is, and a lost race is retried against the fresh
/// record until the transition lands or the session is terminal.
termination_outcome terminate_session(
    leash::storage::session_store& store,
    std::string_view session_key_id,
    leash::schema::session_status_t status,
    std::optional<leash::schema::revocation_reason_t> reason,
    leash::schema::timestamp_seconds_t now);

/// Load a session, applying passive expiry first when it has lapsed.
std::optional<versioned_session_t> load_session_at(
    leash::storage::session_store& store,
    std::string_view session_key_id,
    leash::schema::timestamp_seconds_t now);

leash::schema::execution_record_t make_record(
    std::string_view session_key_id,
    std::optional<leash::schema::wallet_action_t> action,
    const leash::schema::amount_t& amount,
    leash::schema::timestamp_seconds_t now,
    leash::schema::execution_outcome_t outcome,
    std::string note = {});

}  // namespace leash::execution
