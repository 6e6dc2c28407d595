#pragma once

#include <leash/schema/primitives.hpp>
#include <leash/schema/session_status.hpp>
#include <leash/schema/wallet_action.hpp>

#include <optional>
#include <string>
#include <vector>

// Schema type: session view.
// Read model exposed to the end user / UI.
namespace leash::schema {

template <uint16_t Version>
struct session_view;

template <>
struct session_view<1> final {
  uint16_t version{1};
  identifier_t session_key_id;
  identifier_t wallet_id;
  std::string agent_type;
  std::optional<std::string> delegate_address;
  session_status_t status{session_status_t::pending};
  timestamp_seconds_t created_at{};
  timestamp_seconds_t expires_at{};
  amount_t spending_used{};
  amount_t spending_limit{};
  amount_t headroom{};
  std::vector<wallet_action_t> allowed_actions;
  std::optional<amount_t> max_amount_per_transaction;
  std::vector<std::string> allowed_chains;
  std::vector<std::string> allowed_tokens;
  bool auto_renew{};
  uint32_t renewals_used{};
  uint32_t max_renewals{};
};

using session_view_t = session_view<1>;

}  // namespace leash::schema
