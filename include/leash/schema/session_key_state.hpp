#pragma once

#include <leash/schema/primitives.hpp>
#include <leash/schema/revocation_reason.hpp>
#include <leash/schema/session_permissions.hpp>
#include <leash/schema/session_status.hpp>

#include <optional>
#include <string>

// Schema type: session key state.
// Delegation: the persisted delegation grant. Records are never deleted;
// termination is a status transition so the ledger stays attributable.
namespace leash::schema {

template <uint16_t Version>
struct session_key_state;

template <>
struct session_key_state<1> final {
  uint16_t version{1};
  identifier_t session_key_id;
  identifier_t wallet_id;
  identifier_t user_id;
  std::string agent_type;
  std::optional<std::string> delegate_address;
  timestamp_seconds_t created_at{};
  timestamp_seconds_t expires_at{};
  duration_seconds_t duration_seconds{};
  session_status_t status{session_status_t::pending};
  session_permissions_t permissions;
  std::optional<timestamp_seconds_t> last_used_at;
  std::optional<timestamp_seconds_t> terminated_at;
  std::optional<revocation_reason_t> revocation_reason;
};

using session_key_state_t = session_key_state<1>;

}  // namespace leash::schema
