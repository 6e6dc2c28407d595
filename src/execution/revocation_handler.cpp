#include <leash/execution/revocation_handler.hpp>

#include <leash/execution/result.hpp>

#include <spdlog/spdlog.h>

namespace leash::execution {

using leash::schema::session_error_code;
using leash::schema::session_status_t;

revocation_handler::revocation_handler(leash::storage::session_store& store,
                                       time_source_t clock)
    : store_{store}, clock_{std::move(clock)} {}

leash::schema::revocation_result_t revocation_handler::revoke(
    std::string_view session_key_id,
    leash::schema::revocation_reason_t reason) {
  using result_t = leash::schema::revocation_result_t;
  if (session_key_id.empty()) {
    return make_error<result_t>(session_error_code::invalid_request,
                                "session key id is required");
  }

  auto outcome = terminate_session(store_, session_key_id,
                                   session_status_t::revoked, reason, clock_());
  if (!outcome.session) {
    return make_error<result_t>(session_error_code::not_found);
  }

  auto result = result_t{};
  result.log = outcome.changed ? "revoked" : "already terminal";
  result.changed = outcome.changed;
  result.previous_status = outcome.previous_status;
  result.status = outcome.session->status;
  return result;
}

leash::schema::wallet_revocation_result_t revocation_handler::revoke_wallet(
    std::string_view wallet_id,
    leash::schema::revocation_reason_t reason) {
  using result_t = leash::schema::wallet_revocation_result_t;
  if (wallet_id.empty()) {
    return make_error<result_t>(session_error_code::invalid_request,
                                "wallet id is required");
  }

  auto result = result_t{};
  auto now = clock_();
  for (const auto& session_key_id : store_.wallet_session_ids(wallet_id)) {
    auto outcome = terminate_session(store_, session_key_id,
                                     session_status_t::revoked, reason, now);
    if (outcome.changed) {
      result.revoked_session_key_ids.push_back(session_key_id);
    }
  }
  spdlog::info("wallet {} revocation ({}): {} session(s) revoked", wallet_id,
               leash::schema::to_string(reason),
               result.revoked_session_key_ids.size());
  result.log = "revoked";
  return result;
}

}  // namespace leash::execution
