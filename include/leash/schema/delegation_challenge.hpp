#pragma once

#include <leash/schema/challenge_kind.hpp>
#include <leash/schema/challenge_status.hpp>
#include <leash/schema/primitives.hpp>

#include <optional>
#include <string>

// Schema type: delegation challenge.
// Custody handshake: bridges a create/renew request to the provider's
// asynchronous confirmation.
namespace leash::schema {

template <uint16_t Version>
struct delegation_challenge;

template <>
struct delegation_challenge<1> final {
  uint16_t version{1};
  identifier_t challenge_id;
  identifier_t session_key_id;
  challenge_kind_t kind{challenge_kind_t::create};
  challenge_status_t status{challenge_status_t::awaiting_confirmation};
  timestamp_seconds_t created_at{};
  std::optional<timestamp_seconds_t> resolved_at;
  std::optional<std::string> delegate_address;
};

using delegation_challenge_t = delegation_challenge<1>;

}  // namespace leash::schema
