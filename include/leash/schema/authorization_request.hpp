#pragma once

#include <leash/schema/primitives.hpp>
#include <leash/schema/wallet_action.hpp>

#include <optional>
#include <string>
#include <vector>

namespace leash::schema {

template <uint16_t Version>
struct authorization_request;

template <>
struct authorization_request<1> final {
  uint16_t version{1};
  identifier_t session_key_id;
  wallet_action_t action{wallet_action_t::transfer};
  amount_t amount{};
  // When set, must match the agent type the session was granted to.
  std::optional<std::string> agent_type;
  std::optional<std::string> chain;
  // Token contract the action touches; checked when the session restricts
  // tokens.
  std::optional<std::string> token;
};

using authorization_request_t = authorization_request<1>;

/// One step of a multi-step flow admitted all or nothing.
template <uint16_t Version>
struct authorization_step;

template <>
struct authorization_step<1> final {
  uint16_t version{1};
  wallet_action_t action{wallet_action_t::transfer};
  amount_t amount{};
  std::optional<std::string> chain;
  std::optional<std::string> token;
};

using authorization_step_t = authorization_step<1>;

template <uint16_t Version>
struct batch_authorization_request;

template <>
struct batch_authorization_request<1> final {
  uint16_t version{1};
  identifier_t session_key_id;
  std::optional<std::string> agent_type;
  std::vector<authorization_step_t> steps;
};

using batch_authorization_request_t = batch_authorization_request<1>;

}  // namespace leash::schema
