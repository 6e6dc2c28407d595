#pragma once

#include <leash/schema/primitives.hpp>
#include <leash/schema/wallet_action.hpp>

#include <optional>
#include <string>
#include <vector>

// Schema type: session permissions.
// Delegation: value object embedded in a session key. spending_used never
// exceeds spending_limit after any mutation; spending_limit never changes
// after creation, renewal included.
namespace leash::schema {

template <uint16_t Version>
struct session_permissions;

template <>
struct session_permissions<1> final {
  uint16_t version{1};
  std::vector<wallet_action_t> allowed_actions;
  amount_t spending_limit{};
  amount_t spending_used{};
  std::optional<amount_t> max_amount_per_transaction;
  std::vector<std::string> allowed_chains;
  std::vector<std::string> allowed_tokens;
  bool auto_renew{};
  uint32_t max_renewals{};
  uint32_t renewals_used{};
};

using session_permissions_t = session_permissions<1>;

}  // namespace leash::schema
