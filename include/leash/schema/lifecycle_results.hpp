#pragma once

#include <leash/schema/challenge_status.hpp>
#include <leash/schema/primitives.hpp>
#include <leash/schema/session_status.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema types: lifecycle operation results.
// code == 0 is success, otherwise a session_error_code.
namespace leash::schema {

template <uint16_t Version>
struct create_session_result;

template <>
struct create_session_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  identifier_t session_key_id;
  identifier_t challenge_id;
};

using create_session_result_t = create_session_result<1>;

template <uint16_t Version>
struct challenge_completion_result;

template <>
struct challenge_completion_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  // False when the confirmation was a duplicate or arrived too late.
  bool applied{};
  challenge_status_t challenge_status{
      challenge_status_t::awaiting_confirmation};
  std::optional<session_status_t> session_status;
};

using challenge_completion_result_t = challenge_completion_result<1>;

template <uint16_t Version>
struct renewal_result;

template <>
struct renewal_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  identifier_t challenge_id;
};

using renewal_result_t = renewal_result<1>;

template <uint16_t Version>
struct revocation_result;

template <>
struct revocation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  bool changed{};
  std::optional<session_status_t> previous_status;
  std::optional<session_status_t> status;
};

using revocation_result_t = revocation_result<1>;

template <uint16_t Version>
struct wallet_revocation_result;

template <>
struct wallet_revocation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  // Sessions that moved to revoked; already-terminal sessions are skipped.
  std::vector<identifier_t> revoked_session_key_ids;
};

using wallet_revocation_result_t = wallet_revocation_result<1>;

}  // namespace leash::schema
