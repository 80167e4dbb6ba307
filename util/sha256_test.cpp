#include "util/sha256.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

// NOLINTNEXTLINE
TEST(SHA256, HashString) {
  EXPECT_EQ(util::HashString("").Hex(),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(util::HashString("random content").Hex(),
            "276e3a2aee034b91dba3e553be3a560d27b380575fd43475fdc8f46d552709bb");
}

// NOLINTNEXTLINE
TEST(SHA256, Incremental) {
  util::SHA256 hasher;
  hasher.update("random ");
  hasher.update("content");
  util::SHA256_t digest;
  hasher.finalize(&digest);
  EXPECT_EQ(digest.Hex(), util::HashString("random content").Hex());
  EXPECT_FALSE(digest.isZero());
}

}  // namespace
