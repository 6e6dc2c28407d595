#pragma once

#include <leash/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: challenge status.
// Custody handshake: a challenge leaves awaiting_confirmation exactly once.
namespace leash::schema {

enum class challenge_status_t : uint8_t {
  awaiting_confirmation = 0,
  confirmed = 1,
  failed = 2,
  expired = 3
};

inline constexpr auto kChallengeStatusMappings = std::array{
    enum_mapping_t<challenge_status_t>{
        "awaiting-confirmation", challenge_status_t::awaiting_confirmation},
    enum_mapping_t<challenge_status_t>{"confirmed",
                                       challenge_status_t::confirmed},
    enum_mapping_t<challenge_status_t>{"failed", challenge_status_t::failed},
    enum_mapping_t<challenge_status_t>{"expired",
                                       challenge_status_t::expired}};

template <>
inline std::optional<challenge_status_t> try_from_string<challenge_status_t>(
    const std::string_view value) {
  return from_string(value, kChallengeStatusMappings);
}

inline constexpr std::string_view to_string(const challenge_status_t value) {
  return to_string(value, kChallengeStatusMappings).value_or("unknown");
}

}  // namespace leash::schema
