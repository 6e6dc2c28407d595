#pragma once
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace leash::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using amount_t = boost::multiprecision::uint256_t;
using timestamp_seconds_t = uint64_t;
using duration_seconds_t = uint64_t;

// Opaque identifiers. Session, challenge and ledger ids are minted by
// leash::crypto::make_identifier; wallet/user ids come from the custody
// provider.
using identifier_t = std::string;

inline constexpr duration_seconds_t kSecondsPerDay = 24 * 60 * 60;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);

/// Parse a base-10 amount in the smallest currency unit. Rejects signs,
/// whitespace, fractions and values wider than 256 bits.
std::optional<amount_t> try_make_amount(std::string_view decimal);
std::string to_string(const amount_t& amount);

}  // namespace leash::schema
