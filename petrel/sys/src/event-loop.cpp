#include "petrel/event-loop.hpp"

#include <sys/epoll.h>

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstring>
#include <span>

#include "petrel/base-fd.hpp"
#include "petrel/errno-throw.hpp"
#include "petrel/log.hpp"

namespace petrel {

EventLoop::EventLoop(std::chrono::milliseconds pollTimeout)
    : _pollTimeoutMs(static_cast<int>(pollTimeout.count())), _baseFd(::epoll_create1(EPOLL_CLOEXEC)) {
  if (!_baseFd) {
    throw_errno("epoll_create1 failed");
  }
  log::debug("EventLoop fd # {} opened with a poll timeout of {} ms", _baseFd.fd(), _pollTimeoutMs);
}

void EventLoop::addOrThrow(EventFd event) const {
  epoll_event ev{};
  ev.events = event.eventBmp;
  ev.data.fd = event.fd;
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_ADD, event.fd, &ev) != 0) {
    throw_errno("epoll_ctl ADD failed (fd # {}, events=0x{:x})", event.fd, event.eventBmp);
  }
}

std::span<const EventLoop::EventFd> EventLoop::poll() {
  const int nbReady =
      ::epoll_wait(_baseFd.fd(), _epollEvents.data(), static_cast<int>(_epollEvents.size()), _pollTimeoutMs);
  if (nbReady < 0) {
    if (errno == EINTR) {
      return {_readyEvents.data(), 0U};
    }
    log::error("epoll_wait failed on fd # {}: {}", _baseFd.fd(), std::strerror(errno));
    return {};
  }

  const auto nbReadyEvents = static_cast<std::size_t>(nbReady);
  for (std::size_t pos = 0; pos < nbReadyEvents; ++pos) {
    _readyEvents[pos] = EventFd{_epollEvents[pos].events, _epollEvents[pos].data.fd};
  }
  return {_readyEvents.data(), nbReadyEvents};
}

}  // namespace petrel
