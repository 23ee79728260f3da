#include "petrel/compression-config.hpp"

#include <spdlog/fmt/fmt.h>
#include <zlib.h>

#include <stdexcept>

namespace petrel {

void CompressionConfig::validate() const {
  if (zlib.level != Z_DEFAULT_COMPRESSION && (zlib.level < Zlib::kMinLevel || zlib.level > Zlib::kMaxLevel)) {
    throw std::invalid_argument(fmt::format("Invalid ZLIB compression level {}", zlib.level));
  }
}

}  // namespace petrel
