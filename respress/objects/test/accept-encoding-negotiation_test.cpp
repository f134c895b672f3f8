#include "respress/accept-encoding-negotiation.hpp"

#include <gtest/gtest.h>

#include <initializer_list>
#include <vector>

#include "respress/compression-config.hpp"
#include "respress/encoding.hpp"
#include "respress/features.hpp"

namespace respress {

namespace {

constexpr bool kGzipAndBrEnabled = zlibEnabled() && brotliEnabled();

EncodingSelector MakeSelector(std::initializer_list<Encoding> prefs) {
  CompressionConfig cfg;
  for (auto enc : prefs) {
    cfg.preferredFormats.push_back(enc);
  }
  return EncodingSelector(cfg);
}

}  // namespace

TEST(ParseAcceptEncodingTest, EntriesAndQualities) {
  const auto entries = ParseAcceptEncoding("gzip, br;q=0.8 , zstd;q=0, identity;q=0.1, *;q=0.2");
  const std::vector<AcceptEncodingEntry> expected{
      {"gzip", 1.0}, {"br", 0.8}, {"zstd", 0.0}, {"identity", 0.1}, {"*", 0.2}};
  EXPECT_EQ(entries, expected);
}

TEST(ParseAcceptEncodingTest, AliasesAndCase) {
  const auto entries = ParseAcceptEncoding("X-GZIP;Q=0.5, Brotli, ZSTD");
  const std::vector<AcceptEncodingEntry> expected{{"gzip", 0.5}, {"br", 1.0}, {"zstd", 1.0}};
  EXPECT_EQ(entries, expected);
}

TEST(ParseAcceptEncodingTest, MalformedEntriesAreDroppedIndividually) {
  const auto entries = ParseAcceptEncoding(",, deflate, compress, gzip;q=abc, ;q=1, br;q=, zstd;level=3;q=0.7, ");
  const std::vector<AcceptEncodingEntry> expected{{"zstd", 0.7}};
  EXPECT_EQ(entries, expected);
}

TEST(ParseAcceptEncodingTest, QualityIsClamped) {
  const auto entries = ParseAcceptEncoding("gzip;q=2, br;q=-1, zstd; q = 0.25");
  const std::vector<AcceptEncodingEntry> expected{{"gzip", 1.0}, {"br", 0.0}, {"zstd", 0.25}};
  EXPECT_EQ(entries, expected);
}

TEST(AcceptEncodingNegotiationTest, EmptyOrWhitespace) {
  EncodingSelector sel;
  EXPECT_EQ(sel.negotiateAcceptEncoding(""), Encoding::none);
  EXPECT_EQ(sel.negotiateAcceptEncoding("   \t"), Encoding::none);
}

TEST(AcceptEncodingNegotiationTest, SimpleExactMatches) {
  EncodingSelector sel;
  for (Encoding enc : {Encoding::zstd, Encoding::br, Encoding::gzip}) {
    SCOPED_TRACE(GetEncodingStr(enc));
    EXPECT_EQ(sel.negotiateAcceptEncoding(GetEncodingStr(enc)), IsEncodingEnabled(enc) ? enc : Encoding::none);
  }
}

TEST(AcceptEncodingNegotiationTest, AliasesSelectCodec) {
  EncodingSelector sel;
  if constexpr (zlibEnabled()) {
    EXPECT_EQ(sel.negotiateAcceptEncoding("x-gzip"), Encoding::gzip);
  }
  if constexpr (brotliEnabled()) {
    EXPECT_EQ(sel.negotiateAcceptEncoding("brotli"), Encoding::br);
  }
}

TEST(AcceptEncodingNegotiationTest, DefaultTiePriority) {
  if constexpr (!kGzipAndBrEnabled) {
    GTEST_SKIP();
  }
  EncodingSelector sel;
  if constexpr (zstdEnabled()) {
    EXPECT_EQ(sel.negotiateAcceptEncoding("gzip, br, zstd"), Encoding::zstd);
  }
  EXPECT_EQ(sel.negotiateAcceptEncoding("gzip, br"), Encoding::br);
  EXPECT_EQ(sel.negotiateAcceptEncoding("GZIP, BR"), Encoding::br);
}

TEST(AcceptEncodingNegotiationTest, HighestQualityWins) {
  if constexpr (!kGzipAndBrEnabled) {
    GTEST_SKIP();
  }
  EncodingSelector sel;
  EXPECT_EQ(sel.negotiateAcceptEncoding("gzip;q=1.0, br;q=0.5"), Encoding::gzip);
  EXPECT_EQ(sel.negotiateAcceptEncoding("gzip;q=0.5, br;q=1.0"), Encoding::br);
  EXPECT_EQ(sel.negotiateAcceptEncoding("zstd;q=0.1, gzip;q=0.2"), Encoding::gzip);
}

TEST(AcceptEncodingNegotiationTest, ZeroQualityIsNotAcceptable) {
  if constexpr (!kGzipAndBrEnabled) {
    GTEST_SKIP();
  }
  EncodingSelector sel;
  EXPECT_EQ(sel.negotiateAcceptEncoding("gzip;q=0"), Encoding::none);
  EXPECT_EQ(sel.negotiateAcceptEncoding("gzip;q=0, br"), Encoding::br);
  EXPECT_EQ(sel.negotiateAcceptEncoding("zstd;q=0.000, gzip;q=0.001"), Encoding::gzip);
}

TEST(AcceptEncodingNegotiationTest, IdentityNeverSelectsCodec) {
  EncodingSelector sel;
  EXPECT_EQ(sel.negotiateAcceptEncoding("identity"), Encoding::none);
  EXPECT_EQ(sel.negotiateAcceptEncoding("identity;q=0"), Encoding::none);
  EXPECT_EQ(sel.negotiateAcceptEncoding("deflate, compress"), Encoding::none);
}

TEST(AcceptEncodingNegotiationTest, Wildcard) {
  if constexpr (!kGzipAndBrEnabled) {
    GTEST_SKIP();
  }
  EncodingSelector sel;
  const Encoding mostPreferred = sel.preferenceOrdered().front();
  // '*' lends its quality to unlisted codecs, server order breaks the tie
  EXPECT_EQ(sel.negotiateAcceptEncoding("*"), mostPreferred);
  // explicit q=0 wins over '*'
  EXPECT_EQ(sel.negotiateAcceptEncoding("zstd;q=0, *"), Encoding::br);
  EXPECT_EQ(sel.negotiateAcceptEncoding("zstd;q=0, br;q=0, *;q=0.3"), Encoding::gzip);
  // explicit listing with higher q wins over '*'
  EXPECT_EQ(sel.negotiateAcceptEncoding("gzip;q=0.9, *;q=0.5"), Encoding::gzip);
  EXPECT_EQ(sel.negotiateAcceptEncoding("gzip;q=0.4, *;q=0.5"), mostPreferred);
  EXPECT_EQ(sel.negotiateAcceptEncoding("*;q=0"), Encoding::none);
}

TEST(AcceptEncodingNegotiationTest, FirstOccurrenceWins) {
  if constexpr (!kGzipAndBrEnabled) {
    GTEST_SKIP();
  }
  EncodingSelector sel;
  EXPECT_EQ(sel.negotiateAcceptEncoding("gzip;q=0, br;q=0.5, gzip;q=1"), Encoding::br);
}

TEST(AcceptEncodingNegotiationTest, ConfiguredPreferenceOrder) {
  if constexpr (!kGzipAndBrEnabled) {
    GTEST_SKIP();
  }
  auto sel = MakeSelector({Encoding::gzip, Encoding::br, Encoding::zstd});
  EXPECT_EQ(sel.negotiateAcceptEncoding("zstd, br, gzip"), Encoding::gzip);
  EXPECT_EQ(sel.negotiateAcceptEncoding("zstd, br"), Encoding::br);
  EXPECT_EQ(sel.negotiateAcceptEncoding("*"), Encoding::gzip);
  // quality still dominates the server preference
  EXPECT_EQ(sel.negotiateAcceptEncoding("gzip;q=0.5, br"), Encoding::br);
  if constexpr (zstdEnabled()) {
    EXPECT_EQ(sel.negotiateAcceptEncoding("gzip;q=0.5, zstd"), Encoding::zstd);
  }
}

TEST(AcceptEncodingNegotiationTest, UnlistedCodecsAreDisabled) {
  if constexpr (!brotliEnabled()) {
    GTEST_SKIP();
  }
  auto sel = MakeSelector({Encoding::br});
  ASSERT_EQ(sel.preferenceOrdered().size(), 1U);
  EXPECT_EQ(sel.negotiateAcceptEncoding("zstd, gzip"), Encoding::none);
  EXPECT_EQ(sel.negotiateAcceptEncoding("zstd, gzip, br;q=0.1"), Encoding::br);
  EXPECT_EQ(sel.negotiateAcceptEncoding("*"), Encoding::br);
}

TEST(AcceptEncodingNegotiationTest, DefaultOrderFollowsEnumeration) {
  EncodingSelector sel;
  Encoding previous = Encoding::zstd;
  for (Encoding enc : sel.preferenceOrdered()) {
    EXPECT_TRUE(IsEncodingEnabled(enc));
    EXPECT_NE(enc, Encoding::none);
    EXPECT_GE(static_cast<int>(enc), static_cast<int>(previous));
    previous = enc;
  }
}

}  // namespace respress
