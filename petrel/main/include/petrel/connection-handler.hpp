#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <utility>

#include "petrel/connection.hpp"
#include "petrel/router.hpp"

namespace petrel {

// States of a served connection. Transitions are linear:
//   Accepted -> Reading -> Parsed -> Dispatched -> WriteComplete -> Closed
// A read error or an empty read ends the connection from Reading, a write error from Dispatched.
enum class ConnectionState : std::uint8_t { Accepted, Reading, Parsed, Dispatched, WriteComplete, Closed };

std::string_view ConnectionStateName(ConnectionState state) noexcept;

// Serves exactly one request on a blocking connection: one read, one dispatch, one full write, then close.
// Copies are cheap and share the same immutable Router. serve() may be called concurrently.
class ConnectionHandler {
 public:
  ConnectionHandler(std::shared_ptr<const Router> router, std::size_t readBufferSize)
      : _router(std::move(router)), _readBufferSize(readBufferSize) {}

  // Serves the connection and closes it. Never throws: errors are logged and end the connection early.
  // Returns the last state reached before Closed (WriteComplete on success).
  ConnectionState serve(Connection cnx) const noexcept;

  [[nodiscard]] std::size_t readBufferSize() const noexcept { return _readBufferSize; }

 private:
  ConnectionState process(const Connection& cnx) const;

  std::shared_ptr<const Router> _router;
  std::size_t _readBufferSize;
};

}  // namespace petrel
