#include "petrel/header-line-parse.hpp"

#include <gtest/gtest.h>

#include "petrel/http-header.hpp"

namespace petrel::http {

TEST(HeaderLineParse, Simple) {
  auto hv = ParseHeaderLine("Content-Type: text/plain");
  EXPECT_EQ(hv.name, "Content-Type");
  EXPECT_EQ(hv.value, "text/plain");
}

TEST(HeaderLineParse, TrimsBothSides) {
  auto hv = ParseHeaderLine("  X-Custom \t:\t  some value  ");
  EXPECT_EQ(hv.name, "X-Custom");
  EXPECT_EQ(hv.value, "some value");
}

TEST(HeaderLineParse, SplitsOnFirstColonOnly) {
  auto hv = ParseHeaderLine("Host: localhost:4221");
  EXPECT_EQ(hv.name, "Host");
  EXPECT_EQ(hv.value, "localhost:4221");
}

TEST(HeaderLineParse, EmptyValue) {
  auto hv = ParseHeaderLine("X-Empty:");
  EXPECT_EQ(hv.name, "X-Empty");
  EXPECT_TRUE(hv.value.empty());
}

TEST(HeaderLineParse, NoColonIsMalformed) {
  auto hv = ParseHeaderLine("NoColonHere");
  EXPECT_TRUE(hv.name.empty());
  EXPECT_TRUE(hv.value.empty());
}

TEST(HeaderLineParse, Constexpr) {
  static_assert(ParseHeaderLine("A: b").name == "A");
  static_assert(ParseHeaderLine("A: b").value == "b");
  static_assert(ParseHeaderLine("invalid").name.empty());
}

}  // namespace petrel::http
