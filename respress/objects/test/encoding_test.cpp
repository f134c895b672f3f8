#include "respress/encoding.hpp"

#include <gtest/gtest.h>

#include "respress/features.hpp"

namespace respress {

static_assert(kNbCodecs == 3);
static_assert(GetEncodingStr(Encoding::zstd) == "zstd");
static_assert(GetEncodingStr(Encoding::br) == "br");
static_assert(GetEncodingStr(Encoding::gzip) == "gzip");
static_assert(GetEncodingStr(Encoding::none) == "identity");

TEST(EncodingTest, EnabledMatchesFeatures) {
  EXPECT_EQ(IsEncodingEnabled(Encoding::zstd), zstdEnabled());
  EXPECT_EQ(IsEncodingEnabled(Encoding::br), brotliEnabled());
  EXPECT_EQ(IsEncodingEnabled(Encoding::gzip), zlibEnabled());
  EXPECT_TRUE(IsEncodingEnabled(Encoding::none));
}

TEST(EncodingTest, OutOfRange) {
  const auto invalid = static_cast<Encoding>(kNbContentEncodings);
  EXPECT_EQ(GetEncodingStr(invalid), "unknown");
  EXPECT_FALSE(IsEncodingEnabled(invalid));
}

}  // namespace respress
