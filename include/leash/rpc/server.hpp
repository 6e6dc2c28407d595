#pragma once

#include <leash/v1/session_service.grpc.pb.h>
#include <leash/execution/engine.hpp>

namespace leash::rpc {

/// Callback listener for leash.v1.SessionService.
///
/// Each handler parses the wire request into schema types, calls the engine
/// and copies the result back. Engine rejections travel in-band in the
/// response (`code`, `reason`, `log`) with transport status OK; only a
/// request that cannot be parsed (bad amount, unknown action or reason
/// spelling) is answered with INVALID_ARGUMENT.
struct listener final : public leash::v1::SessionService::CallbackService {
  explicit listener(leash::execution::engine& engine);

  /// Open a pending session and dispatch its create challenge.
  virtual grpc::ServerUnaryReactor* CreateSession(
      grpc::CallbackServerContext* context,
      const leash::v1::CreateSessionRequest* request,
      leash::v1::CreateSessionResponse* response) override final;

  /// Custody provider confirmation callback; duplicates are harmless.
  virtual grpc::ServerUnaryReactor* CompleteChallenge(
      grpc::CallbackServerContext* context,
      const leash::v1::CompleteChallengeRequest* request,
      leash::v1::CompleteChallengeResponse* response) override final;

  virtual grpc::ServerUnaryReactor* RenewSession(
      grpc::CallbackServerContext* context,
      const leash::v1::RenewSessionRequest* request,
      leash::v1::RenewSessionResponse* response) override final;

  virtual grpc::ServerUnaryReactor* RevokeSession(
      grpc::CallbackServerContext* context,
      const leash::v1::RevokeSessionRequest* request,
      leash::v1::RevokeSessionResponse* response) override final;

  virtual grpc::ServerUnaryReactor* RevokeWallet(
      grpc::CallbackServerContext* context,
      const leash::v1::RevokeWalletRequest* request,
      leash::v1::RevokeWalletResponse* response) override final;

  /// Read model for one session; applies passive expiry.
  virtual grpc::ServerUnaryReactor* GetSession(
      grpc::CallbackServerContext* context,
      const leash::v1::GetSessionRequest* request,
      leash::v1::GetSessionResponse* response) override final;

  virtual grpc::ServerUnaryReactor* ListWalletSessions(
      grpc::CallbackServerContext* context,
      const leash::v1::ListWalletSessionsRequest* request,
      leash::v1::ListWalletSessionsResponse* response) override final;

  /// Hot path: admit or reject one agent action.
  virtual grpc::ServerUnaryReactor* Authorize(
      grpc::CallbackServerContext* context,
      const leash::v1::AuthorizeRequest* request,
      leash::v1::AuthorizeResponse* response) override final;

  virtual grpc::ServerUnaryReactor* AuthorizeBatch(
      grpc::CallbackServerContext* context,
      const leash::v1::AuthorizeBatchRequest* request,
      leash::v1::AuthorizeResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Reverse(
      grpc::CallbackServerContext* context,
      const leash::v1::ReverseRequest* request,
      leash::v1::ReverseResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetHistory(
      grpc::CallbackServerContext* context,
      const leash::v1::GetHistoryRequest* request,
      leash::v1::GetHistoryResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Reconcile(
      grpc::CallbackServerContext* context,
      const leash::v1::ReconcileRequest* request,
      leash::v1::ReconcileResponse* response) override final;

  leash::execution::engine& engine_;
};

}  // namespace leash::rpc
