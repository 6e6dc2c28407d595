#include <boost/endian/conversion.hpp>
#include <algorithm>
#include <leash/schema/key/builder.hpp>
#include <iterator>
#include <ranges>

using namespace leash::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write_identifier(const std::string_view& id) {
  auto length = boost::endian::native_to_big(static_cast<uint32_t>(id.size()));
  auto* raw = reinterpret_cast<const uint8_t*>(&length);
  std::ranges::copy_n(raw, sizeof(length), std::back_inserter(data));
  return write(id);
}

builder& builder::write_big_endian(uint64_t value) {
  auto big = boost::endian::native_to_big(value);
  auto* raw = reinterpret_cast<const uint8_t*>(&big);
  std::ranges::copy_n(raw, sizeof(big), std::back_inserter(data));
  return *this;
}
