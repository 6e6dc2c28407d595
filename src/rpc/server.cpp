#include <spdlog/spdlog.h>
#include <leash/rpc/server.hpp>
#include <optional>
#include <string>
#include <vector>

using namespace leash::rpc;
using namespace leash::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

grpc::ServerUnaryReactor* finish_invalid(grpc::CallbackServerContext* context,
                                         const std::string& message) {
  spdlog::debug("rejecting malformed request: {}", message);
  auto* reactor = context->DefaultReactor();
  reactor->Finish(
      grpc::Status{grpc::StatusCode::INVALID_ARGUMENT, message});
  return reactor;
}

template <typename Response>
void set_outcome(Response* response, uint32_t code, const std::string& log) {
  response->set_code(code);
  response->set_reason(code == 0 ? std::string{"ok"}
                                 : std::string{to_string(
                                       static_cast<session_error_code>(code))});
  response->set_log(log);
}

std::optional<std::vector<wallet_action_t>> parse_actions(
    const google::protobuf::RepeatedPtrField<std::string>& names) {
  auto actions = std::vector<wallet_action_t>{};
  for (const auto& name : names) {
    auto action = try_from_string<wallet_action_t>(name);
    if (!action) {
      return std::nullopt;
    }
    actions.push_back(*action);
  }
  return actions;
}

std::optional<revocation_reason_t> parse_reason(const std::string& name,
                                                revocation_reason_t fallback) {
  if (name.empty()) {
    return fallback;
  }
  return try_from_string<revocation_reason_t>(name);
}

/// std::nullopt with `error` set when a field cannot be parsed.
std::optional<permission_overrides_t> parse_overrides(
    const leash::v1::PermissionOverrides& source,
    std::string& error) {
  auto overrides = permission_overrides_t{};
  if (source.has_allowed_actions()) {
    overrides.allowed_actions = parse_actions(source.allowed_actions().actions());
    if (!overrides.allowed_actions) {
      error = "unknown action in overrides";
      return std::nullopt;
    }
  }
  if (source.has_spending_limit()) {
    overrides.spending_limit = try_make_amount(source.spending_limit());
    if (!overrides.spending_limit) {
      error = "malformed spending_limit";
      return std::nullopt;
    }
  }
  if (source.has_duration_seconds()) {
    overrides.duration_seconds = source.duration_seconds();
  }
  if (source.has_max_amount_per_transaction()) {
    overrides.max_amount_per_transaction =
        try_make_amount(source.max_amount_per_transaction());
    if (!overrides.max_amount_per_transaction) {
      error = "malformed max_amount_per_transaction";
      return std::nullopt;
    }
  }
  if (source.has_allowed_chains()) {
    overrides.allowed_chains = std::vector<std::string>{
        std::begin(source.allowed_chains().chains()),
        std::end(source.allowed_chains().chains())};
  }
  if (source.has_allowed_tokens()) {
    overrides.allowed_tokens = std::vector<std::string>{
        std::begin(source.allowed_tokens().tokens()),
        std::end(source.allowed_tokens().tokens())};
  }
  if (source.has_max_renewals()) {
    overrides.max_renewals = source.max_renewals();
  }
  if (source.has_auto_renew()) {
    overrides.auto_renew = source.auto_renew();
  }
  return overrides;
}

void populate_view(const session_view_t& source,
                   leash::v1::SessionView* destination) {
  destination->set_session_key_id(source.session_key_id);
  destination->set_wallet_id(source.wallet_id);
  destination->set_agent_type(source.agent_type);
  if (source.delegate_address) {
    destination->set_delegate_address(*source.delegate_address);
  }
  destination->set_status(std::string{to_string(source.status)});
  destination->set_created_at(source.created_at);
  destination->set_expires_at(source.expires_at);
  destination->set_spending_used(to_string(source.spending_used));
  destination->set_spending_limit(to_string(source.spending_limit));
  destination->set_headroom(to_string(source.headroom));
  for (auto action : source.allowed_actions) {
    destination->add_allowed_actions(std::string{to_string(action)});
  }
  if (source.max_amount_per_transaction) {
    destination->set_max_amount_per_transaction(
        to_string(*source.max_amount_per_transaction));
  }
  for (const auto& chain : source.allowed_chains) {
    destination->add_allowed_chains(chain);
  }
  for (const auto& token : source.allowed_tokens) {
    destination->add_allowed_tokens(token);
  }
  destination->set_auto_renew(source.auto_renew);
  destination->set_renewals_used(source.renewals_used);
  destination->set_max_renewals(source.max_renewals);
}

void populate_authorization(const authorization_result_t& source,
                            leash::v1::AuthorizeResponse* destination) {
  set_outcome(destination, source.code, source.log);
  destination->set_admitted(source.code == 0);
  if (source.headroom) {
    destination->set_headroom(to_string(*source.headroom));
  }
  destination->set_spending_used(to_string(source.spending_used));
  for (const auto& record_id : source.record_ids) {
    destination->add_record_ids(record_id);
  }
}

std::optional<std::string> optional_string(bool present,
                                           const std::string& value) {
  if (!present) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

listener::listener(leash::execution::engine& engine) : engine_{engine} {}

grpc::ServerUnaryReactor* listener::CreateSession(
    grpc::CallbackServerContext* context,
    const leash::v1::CreateSessionRequest* request,
    leash::v1::CreateSessionResponse* response) {
  auto overrides = std::optional<permission_overrides_t>{};
  if (request->has_overrides()) {
    auto error = std::string{};
    overrides = parse_overrides(request->overrides(), error);
    if (!overrides) {
      return finish_invalid(context, error);
    }
  }

  auto result = engine_.create_session(request->wallet_id(),
                                       request->user_id(),
                                       request->agent_type(), overrides);
  set_outcome(response, result.code, result.log);
  response->set_session_key_id(result.session_key_id);
  response->set_challenge_id(result.challenge_id);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CompleteChallenge(
    grpc::CallbackServerContext* context,
    const leash::v1::CompleteChallengeRequest* request,
    leash::v1::CompleteChallengeResponse* response) {
  auto result = engine_.complete_challenge(challenge_confirmation_t{
      .challenge_id = request->challenge_id(),
      .success = request->success(),
      .delegate_address = optional_string(request->has_delegate_address(),
                                          request->delegate_address())});
  set_outcome(response, result.code, result.log);
  response->set_applied(result.applied);
  response->set_challenge_status(
      std::string{to_string(result.challenge_status)});
  if (result.session_status) {
    response->set_session_status(
        std::string{to_string(*result.session_status)});
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::RenewSession(
    grpc::CallbackServerContext* context,
    const leash::v1::RenewSessionRequest* request,
    leash::v1::RenewSessionResponse* response) {
  auto result = engine_.renew_session(request->session_key_id());
  set_outcome(response, result.code, result.log);
  response->set_challenge_id(result.challenge_id);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::RevokeSession(
    grpc::CallbackServerContext* context,
    const leash::v1::RevokeSessionRequest* request,
    leash::v1::RevokeSessionResponse* response) {
  auto reason = parse_reason(request->revocation_reason(),
                             revocation_reason_t::user_requested);
  if (!reason) {
    return finish_invalid(context, "unknown revocation_reason");
  }
  auto result = engine_.revoke_session(request->session_key_id(), *reason);
  set_outcome(response, result.code, result.log);
  response->set_changed(result.changed);
  if (result.previous_status) {
    response->set_previous_status(
        std::string{to_string(*result.previous_status)});
  }
  if (result.status) {
    response->set_status(std::string{to_string(*result.status)});
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::RevokeWallet(
    grpc::CallbackServerContext* context,
    const leash::v1::RevokeWalletRequest* request,
    leash::v1::RevokeWalletResponse* response) {
  auto reason = parse_reason(request->revocation_reason(),
                             revocation_reason_t::anomaly_detected);
  if (!reason) {
    return finish_invalid(context, "unknown revocation_reason");
  }
  auto result = engine_.revoke_wallet(request->wallet_id(), *reason);
  set_outcome(response, result.code, result.log);
  for (const auto& session_key_id : result.revoked_session_key_ids) {
    response->add_revoked_session_key_ids(session_key_id);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetSession(
    grpc::CallbackServerContext* context,
    const leash::v1::GetSessionRequest* request,
    leash::v1::GetSessionResponse* response) {
  auto view = engine_.view(request->session_key_id());
  if (!view) {
    set_outcome(response, to_code(session_error_code::not_found),
                "session not found");
    return finish_ok(context);
  }
  set_outcome(response, 0, "ok");
  populate_view(*view, response->mutable_session());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ListWalletSessions(
    grpc::CallbackServerContext* context,
    const leash::v1::ListWalletSessionsRequest* request,
    leash::v1::ListWalletSessionsResponse* response) {
  if (request->active_only()) {
    auto active = engine_.active_session(request->wallet_id());
    if (active) {
      populate_view(*active, response->add_sessions());
    }
    return finish_ok(context);
  }
  for (const auto& view : engine_.list_wallet_sessions(request->wallet_id())) {
    populate_view(view, response->add_sessions());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Authorize(
    grpc::CallbackServerContext* context,
    const leash::v1::AuthorizeRequest* request,
    leash::v1::AuthorizeResponse* response) {
  auto action = try_from_string<wallet_action_t>(request->action());
  if (!action) {
    return finish_invalid(context, "unknown action '" + request->action() + "'");
  }
  auto amount = try_make_amount(request->amount());
  if (!amount) {
    return finish_invalid(context, "malformed amount");
  }

  auto result = engine_.authorize(authorization_request_t{
      .session_key_id = request->session_key_id(),
      .action = *action,
      .amount = *amount,
      .agent_type =
          optional_string(request->has_agent_type(), request->agent_type()),
      .chain = optional_string(request->has_chain(), request->chain()),
      .token = optional_string(request->has_token(), request->token())});
  populate_authorization(result, response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::AuthorizeBatch(
    grpc::CallbackServerContext* context,
    const leash::v1::AuthorizeBatchRequest* request,
    leash::v1::AuthorizeResponse* response) {
  auto batch = batch_authorization_request_t{
      .session_key_id = request->session_key_id(),
      .agent_type =
          optional_string(request->has_agent_type(), request->agent_type())};
  for (const auto& step : request->steps()) {
    auto action = try_from_string<wallet_action_t>(step.action());
    if (!action) {
      return finish_invalid(context, "unknown action '" + step.action() + "'");
    }
    auto amount = try_make_amount(step.amount());
    if (!amount) {
      return finish_invalid(context, "malformed amount");
    }
    batch.steps.push_back(authorization_step_t{
        .action = *action,
        .amount = *amount,
        .chain = optional_string(step.has_chain(), step.chain()),
        .token = optional_string(step.has_token(), step.token())});
  }

  populate_authorization(engine_.authorize_batch(batch), response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Reverse(
    grpc::CallbackServerContext* context,
    const leash::v1::ReverseRequest* request,
    leash::v1::ReverseResponse* response) {
  auto amount = try_make_amount(request->amount());
  if (!amount) {
    return finish_invalid(context, "malformed amount");
  }
  auto result = engine_.reverse(request->session_key_id(), *amount);
  set_outcome(response, result.code, result.log);
  response->set_amount_reversed(to_string(result.amount_reversed));
  response->set_spending_used(to_string(result.spending_used));
  response->set_clamped(result.clamped);
  if (result.record_id) {
    response->set_record_id(*result.record_id);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetHistory(
    grpc::CallbackServerContext* context,
    const leash::v1::GetHistoryRequest* request,
    leash::v1::GetHistoryResponse* response) {
  for (const auto& record : engine_.history(request->session_key_id())) {
    auto* entry = response->add_records();
    entry->set_record_id(record.record_id);
    entry->set_session_key_id(record.session_key_id);
    if (record.action) {
      entry->set_action(std::string{to_string(*record.action)});
    }
    entry->set_amount(to_string(record.amount));
    entry->set_timestamp(record.timestamp);
    entry->set_outcome(std::string{to_string(record.outcome)});
    if (record.rejection_code) {
      entry->set_rejection_code(*record.rejection_code);
    }
    entry->set_note(record.note);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Reconcile(
    grpc::CallbackServerContext* context,
    const leash::v1::ReconcileRequest* request,
    leash::v1::ReconcileResponse* response) {
  auto result = engine_.reconcile(request->session_key_id());
  set_outcome(response, result.code, result.log);
  response->set_ledger_spent(to_string(result.ledger_spent));
  response->set_counter_spent(to_string(result.counter_spent));
  response->set_consistent(result.consistent);
  response->set_admitted_count(result.admitted_count);
  response->set_reversed_count(result.reversed_count);
  response->set_rejected_count(result.rejected_count);
  return finish_ok(context);
}
