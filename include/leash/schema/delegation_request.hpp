#pragma once

#include <leash/schema/challenge_kind.hpp>
#include <leash/schema/primitives.hpp>
#include <leash/schema/wallet_action.hpp>

#include <string>
#include <vector>

// Schema type: delegation request.
// Custody boundary: what the engine emits to the custody provider when a
// challenge is opened. Never carries signing material.
namespace leash::schema {

template <uint16_t Version>
struct delegation_request;

template <>
struct delegation_request<1> final {
  uint16_t version{1};
  identifier_t challenge_id;
  identifier_t session_key_id;
  identifier_t wallet_id;
  identifier_t user_id;
  std::string agent_type;
  challenge_kind_t kind{challenge_kind_t::create};
  std::vector<wallet_action_t> allowed_actions;
  amount_t spending_limit{};
  duration_seconds_t duration_seconds{};
};

using delegation_request_t = delegation_request<1>;

}  // namespace leash::schema
