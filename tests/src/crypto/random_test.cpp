#include <gtest/gtest.h>
#include <leash/crypto/random.hpp>

#include <set>
#include <string>

TEST(random, generator_is_available) {
  EXPECT_TRUE(leash::crypto::available());
}

TEST(random, random_bytes_has_requested_length) {
  EXPECT_EQ(leash::crypto::random_bytes(32).size(), 32u);
  EXPECT_TRUE(leash::crypto::random_bytes(0).empty());
}

TEST(random, identifiers_carry_prefix_and_hex_body) {
  auto id = leash::crypto::make_identifier(leash::crypto::kSessionKeyIdPrefix);
  ASSERT_EQ(id.size(), leash::crypto::kSessionKeyIdPrefix.size() + 32u);
  EXPECT_EQ(id.rfind("sk_", 0), 0u);
  for (auto c : id.substr(3)) {
    EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << id;
  }
}

TEST(random, identifiers_do_not_repeat) {
  auto seen = std::set<std::string>{};
  for (auto i = 0; i < 1000; ++i) {
    EXPECT_TRUE(
        seen.insert(leash::crypto::make_identifier(
                        leash::crypto::kChallengeIdPrefix))
            .second);
  }
}
