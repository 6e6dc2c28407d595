#pragma once

#include <leash/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace leash::schema {

enum class challenge_kind_t : uint8_t { create = 0, renew = 1 };

inline constexpr auto kChallengeKindMappings = std::array{
    enum_mapping_t<challenge_kind_t>{"create", challenge_kind_t::create},
    enum_mapping_t<challenge_kind_t>{"renew", challenge_kind_t::renew}};

template <>
inline std::optional<challenge_kind_t> try_from_string<challenge_kind_t>(
    const std::string_view value) {
  return from_string(value, kChallengeKindMappings);
}

inline constexpr std::string_view to_string(const challenge_kind_t value) {
  return to_string(value, kChallengeKindMappings).value_or("unknown");
}

}  // namespace leash::schema
