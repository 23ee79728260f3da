#include "petrel/socket.hpp"

#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdint>
#include <utility>

#include "petrel/base-fd.hpp"
#include "petrel/errno-throw.hpp"
#include "petrel/log.hpp"

namespace petrel {

namespace {
int ComputeSocketType(Socket::Type type) {
  switch (type) {
    case Socket::Type::Stream:
      return SOCK_STREAM | SOCK_CLOEXEC;
    case Socket::Type::StreamNonBlock:
      return SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC;
    default:
      std::unreachable();
  }
}
}  // namespace

Socket::Socket(Type type, int protocol) : _baseFd(::socket(AF_INET, ComputeSocketType(type), protocol)) {
  if (!_baseFd) {
    throw_errno("Unable to create a new socket");
  }
  log::debug("Socket fd # {} opened", _baseFd.fd());
}

void Socket::bindAndListen(bool reuseAddr, uint16_t& port) {
  const int fd = _baseFd.fd();
  static constexpr int kEnable = 1;
  if (reuseAddr && ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable)) < 0) {
    throw_errno("setsockopt(SO_REUSEADDR) failed for socket fd # {}", fd);
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(port);
  if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
    throw_errno("Failed to bind to port {}", port);
  }
  if (::listen(fd, SOMAXCONN) < 0) {
    throw_errno("listen failed for socket fd # {}", fd);
  }
  if (port == 0) {
    sockaddr_in actual{};
    socklen_t len = sizeof(actual);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&actual), &len) < 0) {
      throw_errno("getsockname failed for socket fd # {}", fd);
    }
    port = ntohs(actual.sin_port);
  }
  log::debug("Socket fd # {} listening on port {}", fd, port);
}

}  // namespace petrel
