#pragma once

#include <sys/epoll.h>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>

#include "petrel/base-fd.hpp"

namespace petrel {

using EventBmp = uint32_t;

inline constexpr EventBmp EventIn = EPOLLIN;

// epoll instance watching a handful of descriptors (the server only registers its listening socket).
// Each poll() reports at most kMaxEvents ready descriptors, the others are reported by the next call.
class EventLoop {
 public:
  static constexpr std::size_t kMaxEvents = 8;

  struct EventFd {
    EventBmp eventBmp;
    int fd;
  };

  // Throws std::system_error if the epoll instance cannot be created.
  explicit EventLoop(std::chrono::milliseconds pollTimeout);

  // Starts watching 'event.fd' for 'event.eventBmp'. Throws std::system_error on failure.
  void addOrThrow(EventFd event) const;

  // Waits at most the poll timeout for ready descriptors.
  //  - ready descriptors: non-empty span
  //  - timeout or EINTR: empty span with a non-null data() pointer
  //  - epoll_wait failure (logged): empty span with a null data() pointer
  [[nodiscard]] std::span<const EventFd> poll();

 private:
  int _pollTimeoutMs;
  BaseFd _baseFd;
  std::array<epoll_event, kMaxEvents> _epollEvents{};
  std::array<EventFd, kMaxEvents> _readyEvents{};
};

}  // namespace petrel
