#pragma once

#include <cstddef>
#include <limits>
#include <span>
#include <string_view>

#include "petrel/base-fd.hpp"
#include "petrel/socket.hpp"

namespace petrel {

// Simple RAII class wrapping a blocking connected socket.
class Connection {
 public:
  static constexpr std::size_t kError = std::numeric_limits<std::size_t>::max();

  Connection() noexcept = default;

  // Accept the next pending connection of the given listening socket.
  // Leaves the Connection closed when no connection is pending (or was aborted by the peer before accept).
  // Throws std::system_error for any other accept failure.
  explicit Connection(const Socket& socket);

  // Construct a Connection that takes ownership of an existing fd wrapped in BaseFd.
  explicit Connection(BaseFd&& bd) noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Perform a single blocking read of at most dst.size() bytes.
  // Returns the number of bytes read (0 when the peer closed), or kError on failure (errno is set).
  [[nodiscard]] std::size_t readOnce(std::span<char> dst) const;

  // Write all of 'data', continuing after partial writes. Never raises SIGPIPE.
  // Returns false on failure (errno is set).
  [[nodiscard]] bool writeAll(std::string_view data) const;

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace petrel
