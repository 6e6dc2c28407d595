#include <leash/crypto/random.hpp>

#include <leash/common/critical.hpp>

#include <openssl/err.h>
#include <openssl/rand.h>

#include <limits>

namespace leash::crypto {

namespace {

constexpr std::size_t kIdentifierEntropyBytes = 16;

}  // namespace

bool available() {
  return RAND_status() == 1;
}

leash::schema::bytes_t random_bytes(std::size_t count) {
  if (count > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    leash::common::critical("random byte request too large: {}", count);
  }
  auto bytes = leash::schema::bytes_t(count);
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    leash::common::critical("RAND_bytes failed: {}", ERR_get_error());
  }
  return bytes;
}

leash::schema::identifier_t make_identifier(std::string_view prefix) {
  auto entropy = random_bytes(kIdentifierEntropyBytes);
  auto id = std::string{prefix};
  id += leash::schema::to_hex(leash::schema::make_bytes_view(entropy));
  return id;
}

}  // namespace leash::crypto
