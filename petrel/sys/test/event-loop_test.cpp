#include "petrel/event-loop.hpp"

#include <gtest/gtest.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <chrono>
#include <cstdint>
#include <system_error>

#include "petrel/base-fd.hpp"

namespace petrel {

using namespace std::chrono_literals;

TEST(EventLoop, PollTimeoutReturnsEmptyNonNullSpan) {
  EventLoop loop(1ms);
  const auto events = loop.poll();
  EXPECT_TRUE(events.empty());
  EXPECT_NE(events.data(), nullptr);
}

TEST(EventLoop, ReportsReadableDescriptor) {
  EventLoop loop(100ms);
  BaseFd efd(::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK));
  ASSERT_TRUE(efd);
  loop.addOrThrow(EventLoop::EventFd{EventIn, efd.fd()});

  EXPECT_TRUE(loop.poll().empty());

  const uint64_t one = 1;
  ASSERT_EQ(::write(efd.fd(), &one, sizeof(one)), static_cast<ssize_t>(sizeof(one)));

  const auto events = loop.poll();
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(events[0].fd, efd.fd());
  EXPECT_NE(events[0].eventBmp & EventIn, 0U);
}

TEST(EventLoop, AddInvalidFdThrows) {
  EventLoop loop(1ms);
  EXPECT_THROW(loop.addOrThrow(EventLoop::EventFd{EventIn, -1}), std::system_error);
}

TEST(EventLoop, AddSameFdTwiceThrows) {
  EventLoop loop(1ms);
  BaseFd efd(::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK));
  loop.addOrThrow(EventLoop::EventFd{EventIn, efd.fd()});
  EXPECT_THROW(loop.addOrThrow(EventLoop::EventFd{EventIn, efd.fd()}), std::system_error);
}

}  // namespace petrel
