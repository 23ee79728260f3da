#include "petrel/router-config.hpp"

#include <string_view>

#include "petrel/compression-config.hpp"
#include "petrel/http-server-config.hpp"

namespace petrel {

RouterConfig::RouterConfig(const HttpServerConfig& serverConfig)
    : directory(serverConfig.directory), compression(serverConfig.compression) {}

RouterConfig& RouterConfig::withDirectory(std::string_view dir) {
  directory = dir;
  return *this;
}

RouterConfig& RouterConfig::withCompression(const CompressionConfig& compressionConfig) {
  compression = compressionConfig;
  return *this;
}

}  // namespace petrel
