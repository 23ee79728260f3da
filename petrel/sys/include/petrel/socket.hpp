#pragma once

#include <cstdint>

#include "petrel/base-fd.hpp"

namespace petrel {

// Simple RAII class wrapping a listening TCP socket (IPv4, all interfaces).
class Socket {
 public:
  enum class Type : std::uint8_t { Stream, StreamNonBlock };

  Socket() noexcept = default;

  // Construct a socket with the given type and protocol.
  // Throws std::system_error on failure.
  explicit Socket(Type type, int protocol = 0);

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Bind to 0.0.0.0:port and start listening. If port is 0, an ephemeral port is chosen and updated in the argument.
  // Throws std::system_error on failure.
  void bindAndListen(bool reuseAddr, uint16_t& port);

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace petrel
