#include "petrel/http-server.hpp"

#include <gtest/gtest.h>

#include <csignal>

#include "petrel/signal-handler.hpp"
#include "petrel/test_server_fixture.hpp"
#include "petrel/test_util.hpp"

namespace petrel {

class SignalHandlerGlobalTest : public ::testing::Test {
 protected:
  static void ResetStop() { SignalHandler::ResetStopRequest(); }

  void SetUp() override {
    ResetStop();
    SignalHandler::Enable();
  }

  void TearDown() override {
    SignalHandler::Disable();
    ResetStop();
  }
};

TEST_F(SignalHandlerGlobalTest, TerminationSignalStopsAcceptLoop) {
  test::TestServer ts;
  EXPECT_EQ(test::sendAndCollect(ts.port(), "GET / HTTP/1.1\r\n\r\n"), "HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");

  ASSERT_EQ(std::raise(SIGTERM), 0);
  EXPECT_TRUE(test::WaitForServer(ts.server, false));

  ts.stop();
  EXPECT_FALSE(ts.loopError());
}

TEST_F(SignalHandlerGlobalTest, StopWithoutSignal) {
  test::TestServer ts;
  ts.stop();
  EXPECT_FALSE(ts.server.isRunning());
  EXPECT_EQ(SignalHandler::ReceivedSignal(), 0);
}

}  // namespace petrel
