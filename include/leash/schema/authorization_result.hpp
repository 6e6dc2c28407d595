#pragma once

#include <leash/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: authorization result.
// Enforcer decision. code == 0 means admitted; otherwise a
// session_error_code. headroom is surfaced on spending_limit_exceeded so the
// caller can offer a partial amount.
namespace leash::schema {

template <uint16_t Version>
struct authorization_result;

template <>
struct authorization_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::optional<amount_t> headroom;
  amount_t spending_used{};
  std::vector<identifier_t> record_ids;
};

using authorization_result_t = authorization_result<1>;

template <uint16_t Version>
struct reversal_result;

template <>
struct reversal_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  amount_t amount_reversed{};
  amount_t spending_used{};
  bool clamped{};
  std::optional<identifier_t> record_id;
};

using reversal_result_t = reversal_result<1>;

}  // namespace leash::schema
