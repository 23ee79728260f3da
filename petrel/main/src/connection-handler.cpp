#include "petrel/connection-handler.hpp"

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include "petrel/connection.hpp"
#include "petrel/http-request.hpp"
#include "petrel/http-response.hpp"
#include "petrel/log.hpp"

namespace petrel {

std::string_view ConnectionStateName(ConnectionState state) noexcept {
  switch (state) {
    case ConnectionState::Accepted:
      return "Accepted";
    case ConnectionState::Reading:
      return "Reading";
    case ConnectionState::Parsed:
      return "Parsed";
    case ConnectionState::Dispatched:
      return "Dispatched";
    case ConnectionState::WriteComplete:
      return "WriteComplete";
    case ConnectionState::Closed:
      return "Closed";
    default:
      return "Unknown";
  }
}

ConnectionState ConnectionHandler::serve(Connection cnx) const noexcept {
  const int fd = cnx.fd();
  ConnectionState lastState = ConnectionState::Accepted;
  try {
    lastState = process(cnx);
  } catch (const std::exception& ex) {
    log::error("Exception while serving connection fd # {}: {}", fd, ex.what());
  }
  cnx.close();
  log::debug("Connection fd # {} closed after state {}", fd, ConnectionStateName(lastState));
  return lastState;
}

ConnectionState ConnectionHandler::process(const Connection& cnx) const {
  // Reading
  std::string buffer(_readBufferSize, '\0');
  const std::size_t nbRead = cnx.readOnce(buffer);
  if (nbRead == Connection::kError) {
    const auto err = errno;
    log::warn("Read error on fd # {}: {}", cnx.fd(), std::strerror(err));
    return ConnectionState::Reading;
  }
  if (nbRead == 0) {
    log::debug("Peer closed fd # {} before sending a request", cnx.fd());
    return ConnectionState::Reading;
  }
  buffer.resize(nbRead);

  // Parsed
  const HttpRequest request(std::move(buffer));
  log::debug("fd # {}: {} {} {}", cnx.fd(), request.method(), request.path(), request.version());

  // Dispatched
  const HttpResponse response = _router->dispatch(request);
  const std::string out = response.serialize();
  log::debug("fd # {}: {} ({} bytes)", cnx.fd(), response.statusLine(), out.size());

  // WriteComplete
  if (!cnx.writeAll(out)) {
    const auto err = errno;
    log::warn("Write error on fd # {}: {}", cnx.fd(), std::strerror(err));
    return ConnectionState::Dispatched;
  }
  return ConnectionState::WriteComplete;
}

}  // namespace petrel
