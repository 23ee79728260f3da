#pragma once

#include <zlib.h>

#include <cstdint>

namespace petrel {

struct CompressionConfig {
  // Throws std::invalid_argument if the configuration is invalid.
  void validate() const;

  struct Zlib {
    static constexpr int8_t kDefaultLevel = Z_BEST_COMPRESSION;
    static constexpr int8_t kMinLevel = Z_NO_COMPRESSION;
    static constexpr int8_t kMaxLevel = Z_BEST_COMPRESSION;

    // zlib compression level used for gzip responses. Z_DEFAULT_COMPRESSION (-1) is also accepted.
    int8_t level = kDefaultLevel;

    bool operator==(const Zlib&) const noexcept = default;
  } zlib;

  bool operator==(const CompressionConfig&) const noexcept = default;
};

}  // namespace petrel
