#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <system_error>
#include <thread>

#include "petrel/http-server-config.hpp"
#include "petrel/http-server.hpp"
#include "petrel/test_server_fixture.hpp"
#include "petrel/test_util.hpp"

using namespace std::chrono_literals;
using namespace petrel;

TEST(HttpServerLifecycle, EphemeralPortIsResolved) {
  HttpServer server(HttpServerConfig{}.withPort(0));
  EXPECT_NE(server.port(), 0);
  EXPECT_FALSE(server.isRunning());
}

TEST(HttpServerLifecycle, BindConflictThrows) {
  HttpServer first(HttpServerConfig{}.withPort(0).withReuseAddr(false));
  EXPECT_THROW(HttpServer(HttpServerConfig{}.withPort(first.port()).withReuseAddr(false)), std::system_error);
}

TEST(HttpServerLifecycle, InvalidConfigThrows) {
  EXPECT_THROW(HttpServer(HttpServerConfig{}.withPort(0).withReadBufferSize(0)), std::invalid_argument);
}

TEST(HttpServerLifecycle, StopReturnsFromRun) {
  HttpServer server(HttpServerConfig{}.withPort(0).withPollInterval(5ms));
  std::jthread loop([&server] { server.run(); });
  ASSERT_TRUE(test::WaitForServer(server, true));

  EXPECT_EQ(test::sendAndCollect(server.port(), "GET / HTTP/1.1\r\n\r\n"),
            "HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");

  server.stop();
  EXPECT_TRUE(test::WaitForServer(server, false));
}

TEST(HttpServerLifecycle, StopBeforeRun) {
  HttpServer server(HttpServerConfig{}.withPort(0).withPollInterval(5ms));
  server.stop();
  server.run();  // returns immediately
  EXPECT_FALSE(server.isRunning());
}

TEST(HttpServerLifecycle, TestServerFixtureStopsCleanly) {
  uint16_t port = 0;
  {
    test::TestServer ts(HttpServerConfig{});
    port = ts.port();
    EXPECT_TRUE(ts.server.isRunning());
    EXPECT_EQ(test::requestOrThrow(port, {.target = "/echo/x"}).body, "x");
    ts.stop();
    EXPECT_FALSE(ts.server.isRunning());
    EXPECT_EQ(ts.loopError(), nullptr);
  }
  EXPECT_NE(port, 0);
}
