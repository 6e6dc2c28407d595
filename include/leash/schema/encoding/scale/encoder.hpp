#pragma once
#include <leash/common/critical.hpp>
#include <leash/schema/agent_profile.hpp>
#include <leash/schema/delegation_challenge.hpp>
#include <leash/schema/encoding/encoder.hpp>
#include <leash/schema/execution_record.hpp>
#include <leash/schema/session_key_state.hpp>
#include <scale/scale.hpp>

// Persisted schema types are plain aggregates of codec-native members
// (integers, enums, strings, vectors, optionals, uint256); SCALE encodes them
// field by field in declaration order, so member order is part of the
// on-disk format.
namespace leash::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  leash::schema::bytes_t encode(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const leash::schema::bytes_view_t& bytes);
};

template <typename T>
leash::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    leash::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const leash::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace leash::schema::encoding
