#pragma once
#include <leash/schema/primitives.hpp>
#include <optional>

namespace leash::schema::encoding {

// The codec is a build-time choice made through the Library tag; callers hold
// an encoder<Tag> and never touch the codec library directly.
template <typename Library>
struct encoder {
  template <typename T>
  leash::schema::bytes_t encode(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const leash::schema::bytes_view_t& bytes);
};

}  // namespace leash::schema::encoding
