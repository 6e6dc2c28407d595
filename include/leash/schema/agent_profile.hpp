#pragma once

#include <leash/schema/primitives.hpp>
#include <leash/schema/wallet_action.hpp>

#include <optional>
#include <string>
#include <vector>

// Schema type: agent profile.
// Permission catalog entry: the widest grant a session for this agent type
// may receive.
namespace leash::schema {

template <uint16_t Version>
struct agent_profile;

template <>
struct agent_profile<1> final {
  uint16_t version{1};
  std::string agent_type;
  bool known{};
  std::string display_name;
  std::string description;
  std::vector<wallet_action_t> allowed_actions;
  amount_t spending_limit{};
  duration_seconds_t duration_seconds{};
  std::optional<amount_t> max_amount_per_transaction;
  std::vector<std::string> allowed_chains;
  std::vector<std::string> allowed_tokens;
  uint32_t max_renewals{};
};

using agent_profile_t = agent_profile<1>;

}  // namespace leash::schema
