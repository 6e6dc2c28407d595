#pragma once

#include <leash/schema/primitives.hpp>
#include <leash/schema/wallet_action.hpp>

#include <optional>
#include <string>
#include <vector>

// Schema type: permission overrides.
// Caller-supplied narrowing of a catalog profile. Unset fields inherit the
// catalog default.
namespace leash::schema {

template <uint16_t Version>
struct permission_overrides;

template <>
struct permission_overrides<1> final {
  uint16_t version{1};
  std::optional<std::vector<wallet_action_t>> allowed_actions;
  std::optional<amount_t> spending_limit;
  std::optional<duration_seconds_t> duration_seconds;
  std::optional<amount_t> max_amount_per_transaction;
  std::optional<std::vector<std::string>> allowed_chains;
  std::optional<std::vector<std::string>> allowed_tokens;
  std::optional<uint32_t> max_renewals;
  std::optional<bool> auto_renew;
};

using permission_overrides_t = permission_overrides<1>;

}  // namespace leash::schema
