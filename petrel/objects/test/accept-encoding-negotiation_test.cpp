#include "petrel/accept-encoding-negotiation.hpp"

#include <gtest/gtest.h>

#include "petrel/encoding.hpp"

namespace petrel {

TEST(AcceptEncodingNegotiationTest, EmptyOrWhitespace) {
  EXPECT_EQ(EncodingSelector::negotiateAcceptEncoding(""), Encoding::none);
  EXPECT_EQ(EncodingSelector::negotiateAcceptEncoding("   \t"), Encoding::none);
  EXPECT_EQ(EncodingSelector::negotiateAcceptEncoding(",,"), Encoding::none);
}

TEST(AcceptEncodingNegotiationTest, SimpleExactMatch) {
  EXPECT_EQ(EncodingSelector::negotiateAcceptEncoding("gzip"), Encoding::gzip);
}

TEST(AcceptEncodingNegotiationTest, GzipAmongOthers) {
  EXPECT_EQ(EncodingSelector::negotiateAcceptEncoding("encoding-1, gzip, encoding-2"), Encoding::gzip);
  EXPECT_EQ(EncodingSelector::negotiateAcceptEncoding("deflate,gzip"), Encoding::gzip);
  EXPECT_EQ(EncodingSelector::negotiateAcceptEncoding("gzip,br"), Encoding::gzip);
}

TEST(AcceptEncodingNegotiationTest, WhitespaceEverywhereIsRemoved) {
  EXPECT_EQ(EncodingSelector::negotiateAcceptEncoding("  g z i p  "), Encoding::gzip);
  EXPECT_EQ(EncodingSelector::negotiateAcceptEncoding("br ,\tgzip\t, deflate"), Encoding::gzip);
}

TEST(AcceptEncodingNegotiationTest, UnsupportedOnly) {
  EXPECT_EQ(EncodingSelector::negotiateAcceptEncoding("invalid-encoding"), Encoding::none);
  EXPECT_EQ(EncodingSelector::negotiateAcceptEncoding("deflate, br, zstd"), Encoding::none);
  EXPECT_EQ(EncodingSelector::negotiateAcceptEncoding("identity"), Encoding::none);
  EXPECT_EQ(EncodingSelector::negotiateAcceptEncoding("*"), Encoding::none);
}

TEST(AcceptEncodingNegotiationTest, TokenMatchIsExact) {
  EXPECT_EQ(EncodingSelector::negotiateAcceptEncoding("GZIP"), Encoding::none);
  EXPECT_EQ(EncodingSelector::negotiateAcceptEncoding("gzip;q=1"), Encoding::none);
  EXPECT_EQ(EncodingSelector::negotiateAcceptEncoding("x-gzip"), Encoding::none);
  EXPECT_EQ(EncodingSelector::negotiateAcceptEncoding("gzipped"), Encoding::none);
}

TEST(EncodingTest, EncodingStrings) {
  EXPECT_EQ(GetEncodingStr(Encoding::gzip), "gzip");
  EXPECT_EQ(GetEncodingStr(Encoding::none), "identity");
  EXPECT_EQ(kNbContentEncodings, 2);
}

}  // namespace petrel
