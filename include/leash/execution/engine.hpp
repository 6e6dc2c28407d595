#pragma once

#include <leash/catalog/permission_catalog.hpp>
#include <leash/execution/challenge_coordinator.hpp>
#include <leash/execution/challenge_dispatcher.hpp>
#include <leash/execution/enforcer.hpp>
#include <leash/execution/engine_options.hpp>
#include <leash/execution/renewal_scheduler.hpp>
#include <leash/execution/revocation_handler.hpp>
#include <leash/execution/time_source.hpp>
#include <leash/schema/authorization_request.hpp>
#include <leash/schema/authorization_result.hpp>
#include <leash/schema/challenge_confirmation.hpp>
#include <leash/schema/execution_record.hpp>
#include <leash/schema/lifecycle_results.hpp>
#include <leash/schema/permission_overrides.hpp>
#include <leash/schema/reconciliation_result.hpp>
#include <leash/schema/renewal_pass_report.hpp>
#include <leash/schema/session_view.hpp>
#include <leash/storage/session_store.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace leash::execution {

/// Delegated session-key authorization engine.
///
/// Owns the session store and the components built on it, and exposes the
/// operations offered to the end user (create, renew, revoke, read model),
/// to agents (authorize, reverse) and to the custody provider
/// (complete_challenge). Every operation reports failures in-band through
/// a session_error_code; only storage or codec failures are fatal.
class engine final {
 public:
  /// Construct the engine over encoder/storage backends.
  ///
  /// `clock` and `dispatcher` are the seams to the outside world: tests
  /// inject a manual clock, deployments a dispatcher that calls the custody
  /// provider.
  engine(leash::storage::encoder_t& encoder,
         leash::storage::rocksdb_storage_t& storage,
         engine_options options = {},
         leash::catalog::permission_catalog catalog = {},
         time_source_t clock = make_system_time_source(),
         challenge_dispatcher_t dispatcher = make_logging_dispatcher());

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  /// Open a pending session and its create challenge.
  leash::schema::create_session_result_t create_session(
      std::string_view wallet_id,
      std::string_view user_id,
      std::string_view agent_type,
      const std::optional<leash::schema::permission_overrides_t>& overrides =
          std::nullopt);

  /// Custody provider callback. Idempotent.
  leash::schema::challenge_completion_result_t complete_challenge(
      const leash::schema::challenge_confirmation_t& confirmation);

  /// Manual renewal, same machinery as the scheduler.
  leash::schema::renewal_result_t renew_session(std::string_view session_key_id);

  leash::schema::revocation_result_t revoke_session(
      std::string_view session_key_id,
      leash::schema::revocation_reason_t reason =
          leash::schema::revocation_reason_t::user_requested);

  leash::schema::wallet_revocation_result_t revoke_wallet(
      std::string_view wallet_id,
      leash::schema::revocation_reason_t reason =
          leash::schema::revocation_reason_t::anomaly_detected);

  /// Read model; applies passive expiry.
  std::optional<leash::schema::session_view_t> view(
      std::string_view session_key_id);

  /// Every session ever created for the wallet, terminal ones included.
  std::vector<leash::schema::session_view_t> list_wallet_sessions(
      std::string_view wallet_id);

  /// The wallet's single live session, if any.
  std::optional<leash::schema::session_view_t> active_session(
      std::string_view wallet_id);

  leash::schema::authorization_result_t authorize(
      const leash::schema::authorization_request_t& request);

  leash::schema::authorization_result_t authorize_batch(
      const leash::schema::batch_authorization_request_t& request);

  leash::schema::reversal_result_t reverse(std::string_view session_key_id,
                                           const leash::schema::amount_t& amount);

  std::vector<leash::schema::execution_record_t> history(
      std::string_view session_key_id) const;

  /// Recompute spending from the ledger and compare it with the counter.
  leash::schema::reconciliation_result_t reconcile(
      std::string_view session_key_id) const;

  leash::schema::renewal_pass_report_t run_renewal_pass();
  void start_scheduler();
  void stop_scheduler();

  const leash::catalog::permission_catalog& catalog() const;
  const engine_options& options() const;

 private:
  engine_options options_;
  leash::catalog::permission_catalog catalog_;
  time_source_t clock_;
  leash::storage::session_store store_;
  challenge_coordinator coordinator_;
  enforcer enforcer_;
  revocation_handler revocations_;
  renewal_scheduler scheduler_;
};

leash::schema::session_view_t make_view(
    const leash::schema::session_key_state_t& session);

}  // namespace leash::execution
