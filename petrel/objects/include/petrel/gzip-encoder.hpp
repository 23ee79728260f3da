#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "petrel/compression-config.hpp"
#include "petrel/encoder.hpp"

namespace petrel {

// One-shot gzip (RFC 1952) compression of a full buffer with zlib.
// Stateless between calls: a single instance can be shared by all connection threads.
class GzipEncoder : public Encoder {
 public:
  explicit GzipEncoder(const CompressionConfig& cfg = {}) noexcept : _level(cfg.zlib.level) {}

  // Appends the gzip member of 'data' to 'buf'. On failure 'buf' is left unchanged.
  // Throws std::runtime_error if zlib fails.
  void encodeFull(std::size_t extraCapacity, std::string_view data, std::string& buf) const override;

 private:
  int8_t _level;
};

}  // namespace petrel
