#pragma once

#include <leash/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: session status.
// Delegation: session key lifecycle. pending -> active only after the custody
// provider confirms; expired and revoked are terminal.
namespace leash::schema {

enum class session_status_t : uint8_t {
  pending = 0,
  active = 1,
  renewing = 2,
  expired = 3,
  revoked = 4
};

inline constexpr auto kSessionStatusMappings = std::array{
    enum_mapping_t<session_status_t>{"pending", session_status_t::pending},
    enum_mapping_t<session_status_t>{"active", session_status_t::active},
    enum_mapping_t<session_status_t>{"renewing", session_status_t::renewing},
    enum_mapping_t<session_status_t>{"expired", session_status_t::expired},
    enum_mapping_t<session_status_t>{"revoked", session_status_t::revoked}};

template <>
inline std::optional<session_status_t> try_from_string<session_status_t>(
    const std::string_view value) {
  return from_string(value, kSessionStatusMappings);
}

inline constexpr std::string_view to_string(const session_status_t value) {
  return to_string(value, kSessionStatusMappings).value_or("unknown");
}

inline constexpr bool is_terminal(const session_status_t value) {
  return value == session_status_t::expired ||
         value == session_status_t::revoked;
}

/// Renewing is treated as active for enforcement; it only blocks a second
/// concurrent renewal.
inline constexpr bool is_spendable(const session_status_t value) {
  return value == session_status_t::active ||
         value == session_status_t::renewing;
}

}  // namespace leash::schema
