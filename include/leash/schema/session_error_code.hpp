#pragma once

#include <leash/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace leash::schema {

/// Result codes returned in-band by every engine operation. Zero is success.
enum class session_error_code : uint32_t {
  not_found = 1,
  not_yet_active = 2,
  inactive = 3,
  expired = 4,
  action_not_permitted = 5,
  spending_limit_exceeded = 6,
  contention = 7,
  challenge_failed = 8,
  invalid_override = 9,
  unknown_agent_type = 10,
  agent_mismatch = 11,
  chain_not_permitted = 12,
  per_transaction_limit_exceeded = 13,
  renewal_in_progress = 14,
  renewal_quota_exhausted = 15,
  challenge_not_found = 16,
  invalid_request = 17,
  token_not_permitted = 18,
  renewal_not_enabled = 19,
};

inline constexpr auto kSessionErrorCodeMappings = std::array{
    enum_mapping_t<session_error_code>{"not_found",
                                       session_error_code::not_found},
    enum_mapping_t<session_error_code>{"not_yet_active",
                                       session_error_code::not_yet_active},
    enum_mapping_t<session_error_code>{"inactive",
                                       session_error_code::inactive},
    enum_mapping_t<session_error_code>{"expired",
                                       session_error_code::expired},
    enum_mapping_t<session_error_code>{
        "action_not_permitted", session_error_code::action_not_permitted},
    enum_mapping_t<session_error_code>{
        "spending_limit_exceeded",
        session_error_code::spending_limit_exceeded},
    enum_mapping_t<session_error_code>{"contention",
                                       session_error_code::contention},
    enum_mapping_t<session_error_code>{"challenge_failed",
                                       session_error_code::challenge_failed},
    enum_mapping_t<session_error_code>{"invalid_override",
                                       session_error_code::invalid_override},
    enum_mapping_t<session_error_code>{
        "unknown_agent_type", session_error_code::unknown_agent_type},
    enum_mapping_t<session_error_code>{"agent_mismatch",
                                       session_error_code::agent_mismatch},
    enum_mapping_t<session_error_code>{
        "chain_not_permitted", session_error_code::chain_not_permitted},
    enum_mapping_t<session_error_code>{
        "per_transaction_limit_exceeded",
        session_error_code::per_transaction_limit_exceeded},
    enum_mapping_t<session_error_code>{
        "renewal_in_progress", session_error_code::renewal_in_progress},
    enum_mapping_t<session_error_code>{
        "renewal_quota_exhausted",
        session_error_code::renewal_quota_exhausted},
    enum_mapping_t<session_error_code>{
        "challenge_not_found", session_error_code::challenge_not_found},
    enum_mapping_t<session_error_code>{"invalid_request",
                                       session_error_code::invalid_request},
    enum_mapping_t<session_error_code>{
        "token_not_permitted", session_error_code::token_not_permitted},
    enum_mapping_t<session_error_code>{
        "renewal_not_enabled", session_error_code::renewal_not_enabled}};

inline constexpr std::string_view to_string(const session_error_code value) {
  return to_string(value, kSessionErrorCodeMappings).value_or("unknown");
}

inline constexpr uint32_t to_code(const session_error_code value) {
  return static_cast<uint32_t>(value);
}

/// Only contention and a declined challenge may be retried unchanged.
inline constexpr bool is_retryable(const session_error_code value) {
  return value == session_error_code::contention ||
         value == session_error_code::challenge_failed;
}

}  // namespace leash::schema
