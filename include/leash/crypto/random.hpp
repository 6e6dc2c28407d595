#pragma once

#include <leash/schema/primitives.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace leash::crypto {

/// True when the OpenSSL DRBG is seeded and able to produce output.
bool available();

/// Cryptographically secure random bytes. Terminates through
/// leash::common::critical when the generator fails.
leash::schema::bytes_t random_bytes(std::size_t count);

/// Unguessable identifier: prefix followed by 32 lowercase hex characters.
leash::schema::identifier_t make_identifier(std::string_view prefix);

inline constexpr std::string_view kSessionKeyIdPrefix{"sk_"};
inline constexpr std::string_view kChallengeIdPrefix{"ch_"};
inline constexpr std::string_view kExecutionRecordIdPrefix{"er_"};

}  // namespace leash::crypto
