#include "petrel/connection.hpp"

#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <span>
#include <string_view>
#include <utility>

#include "petrel/base-fd.hpp"
#include "petrel/errno-throw.hpp"
#include "petrel/log.hpp"
#include "petrel/socket.hpp"

namespace petrel {

namespace {
int ComputeConnectionFd(int socketFd) {
  sockaddr_in in_addr{};
  socklen_t in_len = sizeof(in_addr);
  // Accepted sockets are blocking: each one is served by its own thread.
  const int fd = ::accept4(socketFd, reinterpret_cast<sockaddr*>(&in_addr), &in_len, SOCK_CLOEXEC);
  if (fd < 0) {
    const auto savedErr = errno;
    if (savedErr == EAGAIN || savedErr == EWOULDBLOCK || savedErr == EINTR || savedErr == ECONNABORTED) {
      log::trace("Connection accept on socket fd # {} did not complete: {}", socketFd, std::strerror(savedErr));
      return BaseFd::kClosedFd;
    }
    throw_errno("Connection accept failed for socket fd # {}", socketFd);
  }
  log::debug("Connection fd # {} opened", fd);
  return fd;
}

}  // namespace

Connection::Connection(const Socket& socket) : _baseFd(ComputeConnectionFd(socket.fd())) {}

Connection::Connection(BaseFd&& bd) noexcept : _baseFd(std::move(bd)) {}

std::size_t Connection::readOnce(std::span<char> dst) const {
  while (true) {
    const auto nbRead = ::recv(_baseFd.fd(), dst.data(), dst.size(), 0);
    if (nbRead >= 0) {
      return static_cast<std::size_t>(nbRead);
    }
    if (errno != EINTR) {
      return kError;
    }
  }
}

bool Connection::writeAll(std::string_view data) const {
  while (!data.empty()) {
    const auto nbWritten = ::send(_baseFd.fd(), data.data(), data.size(), MSG_NOSIGNAL);
    if (nbWritten < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    data.remove_prefix(static_cast<std::size_t>(nbWritten));
  }
  return true;
}

}  // namespace petrel
