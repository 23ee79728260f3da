#include "petrel/content-negotiation.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

#include "petrel/encoder.hpp"
#include "petrel/gzip-encoder.hpp"
#include "petrel/http-constants.hpp"
#include "petrel/http-status-code.hpp"
#include "petrel/test_util.hpp"

namespace petrel {

namespace {

class FailingEncoder : public Encoder {
 public:
  void encodeFull([[maybe_unused]] std::size_t extraCapacity, [[maybe_unused]] std::string_view data,
                  std::string& buf) const override {
    buf.append("partial garbage");
    throw std::runtime_error("simulated compression failure");
  }
};

}  // namespace

class ContentNegotiatorTest : public ::testing::Test {
 protected:
  GzipEncoder gzipEncoder;
  ContentNegotiator negotiator{gzipEncoder};
};

TEST_F(ContentNegotiatorTest, PlainWhenNoAcceptEncoding) {
  auto resp = negotiator.makeTextResponse("abc", "");
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_EQ(resp.body(), "abc");
  EXPECT_EQ(resp.headerValue(http::ContentType), http::ContentTypeTextPlain);
  EXPECT_EQ(resp.headerValue(http::ContentLength), "3");
  EXPECT_FALSE(resp.headerValue(http::ContentEncoding).has_value());
  EXPECT_EQ(resp.serialize(), "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\nContent-Length: 3\r\n\r\nabc");
}

TEST_F(ContentNegotiatorTest, PlainWhenGzipNotAccepted) {
  auto resp = negotiator.makeTextResponse("abc", "deflate, br");
  EXPECT_EQ(resp.body(), "abc");
  EXPECT_FALSE(resp.headerValue(http::ContentEncoding).has_value());
}

TEST_F(ContentNegotiatorTest, GzipWhenAccepted) {
  for (std::string_view acceptEncoding : {"gzip", "encoding-1, gzip, encoding-2", " gzip ,deflate"}) {
    SCOPED_TRACE(acceptEncoding);
    auto resp = negotiator.makeTextResponse("abc", acceptEncoding);
    EXPECT_EQ(resp.status(), http::StatusCodeOK);
    EXPECT_EQ(resp.headerValue(http::ContentEncoding), http::gzip);
    EXPECT_EQ(resp.headerValue(http::ContentType), http::ContentTypeTextPlain);
    EXPECT_EQ(resp.headerValue(http::ContentLength), std::to_string(resp.body().size()));
    EXPECT_EQ(test::gunzip(resp.body()), "abc");
  }
}

TEST_F(ContentNegotiatorTest, GzipOfEmptyBody) {
  auto resp = negotiator.makeTextResponse("", "gzip");
  EXPECT_EQ(resp.headerValue(http::ContentEncoding), http::gzip);
  EXPECT_FALSE(resp.body().empty());
  EXPECT_EQ(test::gunzip(resp.body()), "");
}

TEST(ContentNegotiatorFallbackTest, CompressionFailureFallsBackToPlainBody) {
  FailingEncoder failingEncoder;
  ContentNegotiator negotiator(failingEncoder);

  auto resp = negotiator.makeTextResponse("hello", "gzip");
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_EQ(resp.body(), "hello");
  EXPECT_FALSE(resp.headerValue(http::ContentEncoding).has_value());
  EXPECT_EQ(resp.headerValue(http::ContentLength), "5");
  EXPECT_EQ(resp.headerValue(http::ContentType), http::ContentTypeTextPlain);
}

}  // namespace petrel
