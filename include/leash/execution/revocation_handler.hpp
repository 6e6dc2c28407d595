#pragma once

#include <leash/execution/lifecycle.hpp>
#include <leash/execution/time_source.hpp>
#include <leash/schema/lifecycle_results.hpp>
#include <leash/schema/revocation_reason.hpp>
#include <leash/storage/session_store.hpp>

#include <string_view>

namespace leash::execution {

/// Immediate, idempotent invalidation. Revocation is not bounded by the
/// compare-and-swap retry budget: nothing in the engine can keep it from
/// landing. The ledger is left untouched.
class revocation_handler final {
 public:
  revocation_handler(leash::storage::session_store& store, time_source_t clock);

  leash::schema::revocation_result_t revoke(
      std::string_view session_key_id,
      leash::schema::revocation_reason_t reason);

  /// Revoke every non-terminal session of a wallet.
  leash::schema::wallet_revocation_result_t revoke_wallet(
      std::string_view wallet_id,
      leash::schema::revocation_reason_t reason);

 private:
  leash::storage::session_store& store_;
  time_source_t clock_;
};

}  // namespace leash::execution
