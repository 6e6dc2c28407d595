#pragma once

#include <leash/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace leash::schema {

enum class execution_outcome_t : uint8_t {
  admitted = 0,
  rejected = 1,
  reversed = 2
};

inline constexpr auto kExecutionOutcomeMappings = std::array{
    enum_mapping_t<execution_outcome_t>{"admitted",
                                        execution_outcome_t::admitted},
    enum_mapping_t<execution_outcome_t>{"rejected",
                                        execution_outcome_t::rejected},
    enum_mapping_t<execution_outcome_t>{"reversed",
                                        execution_outcome_t::reversed}};

template <>
inline std::optional<execution_outcome_t>
try_from_string<execution_outcome_t>(const std::string_view value) {
  return from_string(value, kExecutionOutcomeMappings);
}

inline constexpr std::string_view to_string(const execution_outcome_t value) {
  return to_string(value, kExecutionOutcomeMappings).value_or("unknown");
}

}  // namespace leash::schema
