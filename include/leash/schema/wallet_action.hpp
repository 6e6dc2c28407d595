#pragma once

#include <leash/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: wallet action.
// Delegation: closed set of action tags an agent may be granted. Tags are
// agent-defined capabilities, never free text.
namespace leash::schema {

enum class wallet_action_t : uint8_t {
  transfer = 0,
  approve = 1,
  swap = 2,
  bridge = 3,
  cctp = 4,
  gateway = 5,
  convert = 6
};

inline constexpr auto kWalletActionMappings = std::array{
    enum_mapping_t<wallet_action_t>{"transfer", wallet_action_t::transfer},
    enum_mapping_t<wallet_action_t>{"approve", wallet_action_t::approve},
    enum_mapping_t<wallet_action_t>{"swap", wallet_action_t::swap},
    enum_mapping_t<wallet_action_t>{"bridge", wallet_action_t::bridge},
    enum_mapping_t<wallet_action_t>{"cctp", wallet_action_t::cctp},
    enum_mapping_t<wallet_action_t>{"gateway", wallet_action_t::gateway},
    enum_mapping_t<wallet_action_t>{"convert", wallet_action_t::convert}};

template <>
inline std::optional<wallet_action_t> try_from_string<wallet_action_t>(
    const std::string_view value) {
  return from_string(value, kWalletActionMappings);
}

inline constexpr std::string_view to_string(const wallet_action_t value) {
  return to_string(value, kWalletActionMappings).value_or("unknown");
}

}  // namespace leash::schema
