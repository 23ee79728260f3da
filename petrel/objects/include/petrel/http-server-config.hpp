#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "petrel/compression-config.hpp"

namespace petrel {

struct HttpServerConfig {
  static constexpr uint16_t kDefaultPort = 4221;

  // ============================
  // Listener / socket parameters
  // ============================
  // TCP port to bind on 0.0.0.0. 0 lets the OS pick an ephemeral free port. After construction
  // you can retrieve the effective port via HttpServer::port().
  uint16_t port{kDefaultPort};

  // If true, sets SO_REUSEADDR on the listening socket so that a restarted server can bind
  // while old connections linger in TIME_WAIT. Default: true.
  bool reuseAddr{true};

  // ============================
  // Request reading
  // ============================
  // Size of the single read performed per connection. Requests larger than this are truncated
  // (the parser only sees the first readBufferSize bytes). Must be > 0.
  std::size_t readBufferSize{1024};

  // Maximum time the accept loop blocks waiting for new connections before checking stop requests.
  // Must be > 0 and fit in an int of milliseconds.
  std::chrono::milliseconds pollInterval{std::chrono::milliseconds{500}};

  // ============================
  // Routing
  // ============================
  // Base directory under which /files/<name> are read and created. Empty means the current directory.
  std::string directory;

  // Compression configuration (gzip level for /echo responses).
  CompressionConfig compression;

  // Validates config. Throws std::invalid_argument if it is not valid.
  void validate() const;

  HttpServerConfig& withPort(uint16_t port);

  HttpServerConfig& withReuseAddr(bool on = true);

  HttpServerConfig& withReadBufferSize(std::size_t readBufferSize);

  HttpServerConfig& withPollInterval(std::chrono::milliseconds pollInterval);

  HttpServerConfig& withDirectory(std::string_view directory);

  HttpServerConfig& withCompression(const CompressionConfig& compressionConfig);

  bool operator==(const HttpServerConfig&) const noexcept = default;
};

}  // namespace petrel
