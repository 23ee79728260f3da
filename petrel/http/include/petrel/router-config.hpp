#pragma once

#include <string>
#include <string_view>

#include "petrel/compression-config.hpp"

namespace petrel {

struct HttpServerConfig;

struct RouterConfig {
  RouterConfig() = default;

  // Routing part of the server configuration.
  explicit RouterConfig(const HttpServerConfig& serverConfig);

  // Base directory for /files/<name>. Empty means the current working directory.
  std::string directory;

  // Compression applied to /echo responses when the client accepts gzip.
  CompressionConfig compression;

  RouterConfig& withDirectory(std::string_view dir);

  RouterConfig& withCompression(const CompressionConfig& compressionConfig);

  bool operator==(const RouterConfig&) const noexcept = default;
};

}  // namespace petrel
