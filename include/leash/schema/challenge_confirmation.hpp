#pragma once

#include <leash/schema/primitives.hpp>

#include <optional>
#include <string>

// Schema type: challenge confirmation.
// Custody boundary: the asynchronous callback payload. Duplicates are
// expected.
namespace leash::schema {

template <uint16_t Version>
struct challenge_confirmation;

template <>
struct challenge_confirmation<1> final {
  uint16_t version{1};
  identifier_t challenge_id;
  bool success{};
  std::optional<std::string> delegate_address;
};

using challenge_confirmation_t = challenge_confirmation<1>;

}  // namespace leash::schema
