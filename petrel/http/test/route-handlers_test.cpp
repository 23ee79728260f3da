#include "petrel/route-handlers.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <ios>
#include <iterator>
#include <string>
#include <string_view>

#include "petrel/http-constants.hpp"
#include "petrel/http-status-code.hpp"
#include "petrel/temp-file.hpp"

namespace petrel {

namespace {

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  return {std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

void WriteFile(const std::filesystem::path& path, std::string_view content) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
}

}  // namespace

TEST(UserAgentResponseTest, Simple) {
  auto resp = UserAgentResponse("foobar/1.2.3");
  EXPECT_EQ(resp.serialize(),
            "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\nContent-Length: 12\r\n\r\nfoobar/1.2.3");
}

TEST(UserAgentResponseTest, ContentLengthIsByteLength) {
  // 'é' is 2 bytes in UTF-8
  auto resp = UserAgentResponse("caf\xc3\xa9");
  EXPECT_EQ(resp.headerValue(http::ContentLength), "5");
}

TEST(UserAgentResponseTest, Empty) {
  auto resp = UserAgentResponse("");
  EXPECT_EQ(resp.headerValue(http::ContentLength), "0");
  EXPECT_TRUE(resp.body().empty());
}

class FileRouteHandlerTest : public ::testing::Test {
 protected:
  test::ScopedTempDir tmpDir;
  FileRouteHandler handler{tmpDir.dirPath()};
};

TEST_F(FileRouteHandlerTest, Resolve) {
  EXPECT_EQ(handler.resolve("a.txt"), (tmpDir.dirPath() / "a.txt").lexically_normal());
  EXPECT_EQ(handler.resolve("sub/../b.txt"), (tmpDir.dirPath() / "b.txt").lexically_normal());
  // joined, a leading slash does not make it absolute
  EXPECT_EQ(handler.resolve("/c.txt"), (tmpDir.dirPath() / "c.txt").lexically_normal());
}

TEST_F(FileRouteHandlerTest, ResolveWithEmptyBaseIsRelative) {
  FileRouteHandler relative{std::filesystem::path{}};
  EXPECT_EQ(relative.resolve("x.txt"), std::filesystem::path("x.txt"));
}

TEST_F(FileRouteHandlerTest, GetExistingFile) {
  WriteFile(tmpDir.dirPath() / "foo", "Hello, World!");

  auto resp = handler.get("foo");
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_EQ(resp.headerValue(http::ContentType), http::ContentTypeApplicationOctetStream);
  EXPECT_EQ(resp.headerValue(http::ContentLength), "13");
  EXPECT_EQ(resp.body(), "Hello, World!");
}

TEST_F(FileRouteHandlerTest, GetBinaryFile) {
  const std::string binary("\x00\x01\xff\r\n\x7f", 6);
  WriteFile(tmpDir.dirPath() / "bin", binary);

  auto resp = handler.get("bin");
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_EQ(resp.body(), binary);
  EXPECT_EQ(resp.headerValue(http::ContentLength), "6");
}

TEST_F(FileRouteHandlerTest, GetEmptyFile) {
  WriteFile(tmpDir.dirPath() / "empty", "");

  auto resp = handler.get("empty");
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_EQ(resp.headerValue(http::ContentLength), "0");
  EXPECT_TRUE(resp.body().empty());
}

TEST_F(FileRouteHandlerTest, GetMissingFile) {
  auto resp = handler.get("non_existent_file");
  EXPECT_EQ(resp.serialize(), "HTTP/1.1 404 Not Found\r\n\r\n");
}

TEST_F(FileRouteHandlerTest, GetDirectoryIsNotFound) {
  std::filesystem::create_directory(tmpDir.dirPath() / "subdir");

  EXPECT_EQ(handler.get("subdir").status(), http::StatusCodeNotFound);
  EXPECT_EQ(handler.get("").status(), http::StatusCodeNotFound);
}

TEST_F(FileRouteHandlerTest, PostCreatesFile) {
  auto resp = handler.post("created.txt", "hello");
  EXPECT_EQ(resp.serialize(), "HTTP/1.1 201 Created\r\n\r\n");
  EXPECT_EQ(ReadFile(tmpDir.dirPath() / "created.txt"), "hello");
}

TEST_F(FileRouteHandlerTest, PostTruncatesExistingFile) {
  WriteFile(tmpDir.dirPath() / "existing.txt", "a much longer previous content");

  EXPECT_EQ(handler.post("existing.txt", "short").status(), http::StatusCodeCreated);
  EXPECT_EQ(ReadFile(tmpDir.dirPath() / "existing.txt"), "short");
}

TEST_F(FileRouteHandlerTest, PostEmptyBodyCreatesEmptyFile) {
  EXPECT_EQ(handler.post("empty.txt", "").status(), http::StatusCodeCreated);
  EXPECT_TRUE(std::filesystem::exists(tmpDir.dirPath() / "empty.txt"));
  EXPECT_EQ(std::filesystem::file_size(tmpDir.dirPath() / "empty.txt"), 0U);
}

TEST_F(FileRouteHandlerTest, PostIntoMissingDirectoryIsBadRequest) {
  auto resp = handler.post("no/such/dir/file.txt", "data");
  EXPECT_EQ(resp.serialize(), "HTTP/1.1 400 Bad Request\r\n\r\n");
}

TEST_F(FileRouteHandlerTest, PostOnDirectoryIsBadRequest) {
  std::filesystem::create_directory(tmpDir.dirPath() / "adir");
  EXPECT_EQ(handler.post("adir", "data").status(), http::StatusCodeBadRequest);
}

TEST_F(FileRouteHandlerTest, PostThenGetRoundTrip) {
  ASSERT_EQ(handler.post("round.bin", "payload bytes").status(), http::StatusCodeCreated);
  auto resp = handler.get("round.bin");
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_EQ(resp.body(), "payload bytes");
}

}  // namespace petrel
