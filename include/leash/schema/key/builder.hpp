#pragma once
#include <leash/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

namespace leash::schema::key {

/// Raw, order-preserving key composition for the RocksDB keyspace.
/// Identifiers are length-prefixed so a prefix scan for one id never matches
/// another id that happens to start with it.
struct builder final {
  leash::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write_identifier(const std::string_view& id);
  builder& write_big_endian(uint64_t value);
};

}  // namespace leash::schema::key
