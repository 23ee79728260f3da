#include "petrel/http-server-config.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "petrel/compression-config.hpp"

namespace petrel {

HttpServerConfig& HttpServerConfig::withPort(uint16_t port) {
  this->port = port;
  return *this;
}

HttpServerConfig& HttpServerConfig::withReuseAddr(bool on) {
  this->reuseAddr = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withReadBufferSize(std::size_t readBufferSize) {
  this->readBufferSize = readBufferSize;
  return *this;
}

HttpServerConfig& HttpServerConfig::withPollInterval(std::chrono::milliseconds pollInterval) {
  this->pollInterval = pollInterval;
  return *this;
}

HttpServerConfig& HttpServerConfig::withDirectory(std::string_view directory) {
  this->directory = directory;
  return *this;
}

HttpServerConfig& HttpServerConfig::withCompression(const CompressionConfig& compressionConfig) {
  compression = compressionConfig;
  return *this;
}

void HttpServerConfig::validate() const {
  compression.validate();

  if (readBufferSize == 0) {
    throw std::invalid_argument("readBufferSize must be strictly positive");
  }

  if (pollInterval.count() <= 0) {
    throw std::invalid_argument("Poll interval must be strictly positive");
  }

  if (std::cmp_less(std::numeric_limits<int>::max(), pollInterval.count())) {
    throw std::invalid_argument("Poll interval value is too large");
  }
}

}  // namespace petrel
