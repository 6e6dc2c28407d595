#pragma once

#include <leash/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: revocation reason.
// Stored on the session when it is revoked; superseded is used when a newer
// session is activated for the same wallet.
namespace leash::schema {

enum class revocation_reason_t : uint8_t {
  user_requested = 0,
  anomaly_detected = 1,
  challenge_failed = 2,
  superseded = 3,
  administrative = 4
};

inline constexpr auto kRevocationReasonMappings = std::array{
    enum_mapping_t<revocation_reason_t>{"user_requested",
                                        revocation_reason_t::user_requested},
    enum_mapping_t<revocation_reason_t>{
        "anomaly_detected", revocation_reason_t::anomaly_detected},
    enum_mapping_t<revocation_reason_t>{
        "challenge_failed", revocation_reason_t::challenge_failed},
    enum_mapping_t<revocation_reason_t>{"superseded",
                                        revocation_reason_t::superseded},
    enum_mapping_t<revocation_reason_t>{"administrative",
                                        revocation_reason_t::administrative}};

template <>
inline std::optional<revocation_reason_t>
try_from_string<revocation_reason_t>(const std::string_view value) {
  return from_string(value, kRevocationReasonMappings);
}

inline constexpr std::string_view to_string(const revocation_reason_t value) {
  return to_string(value, kRevocationReasonMappings).value_or("unknown");
}

}  // namespace leash::schema
