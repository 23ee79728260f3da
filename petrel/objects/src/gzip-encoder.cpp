#include "petrel/gzip-encoder.hpp"

#include <spdlog/fmt/fmt.h>
#include <zconf.h>
#include <zlib.h>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "petrel/log.hpp"

namespace petrel {

namespace {

// 16 added to the window bits asks zlib for a gzip header and trailer instead of the zlib ones.
constexpr int kGzipWindowBits = MAX_WBITS + 16;
constexpr int kMemLevel = 8;

class DeflateStream {
 public:
  explicit DeflateStream(int8_t level) {
    const int rc = deflateInit2(&_stream, level, Z_DEFLATED, kGzipWindowBits, kMemLevel, Z_DEFAULT_STRATEGY);
    if (rc != Z_OK) {
      throw std::runtime_error(fmt::format("deflateInit2 failed for level {} - error {}", level, rc));
    }
  }

  DeflateStream(const DeflateStream&) = delete;
  DeflateStream& operator=(const DeflateStream&) = delete;

  ~DeflateStream() {
    // Z_DATA_ERROR only means that the stream did not reach Z_STREAM_END, which is already reported by encodeFull.
    const int rc = deflateEnd(&_stream);
    if (rc != Z_OK && rc != Z_DATA_ERROR) {
      log::error("deflateEnd returned {}", rc);
    }
  }

  z_stream* operator->() noexcept { return &_stream; }
  z_stream* get() noexcept { return &_stream; }

 private:
  z_stream _stream{};
};

}  // namespace

void GzipEncoder::encodeFull(std::size_t extraCapacity, std::string_view data, std::string& buf) const {
  DeflateStream stream(_level);
  stream->next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  stream->avail_in = static_cast<uInt>(data.size());

  // deflateBound is an upper bound for the whole member: a single Z_FINISH call always completes.
  const auto bound = static_cast<std::size_t>(deflateBound(stream.get(), static_cast<uLong>(data.size())));
  const std::size_t oldSize = buf.size();
  buf.reserve(oldSize + bound + extraCapacity);

  int rc = Z_OK;
  buf.resize_and_overwrite(oldSize + bound, [&stream, &rc, oldSize, bound](char* out, std::size_t) {
    stream->next_out = reinterpret_cast<Bytef*>(out + oldSize);
    stream->avail_out = static_cast<uInt>(bound);
    rc = deflate(stream.get(), Z_FINISH);
    return oldSize + (bound - stream->avail_out);
  });

  if (rc != Z_STREAM_END) {
    buf.resize(oldSize);
    throw std::runtime_error(fmt::format("gzip compression of {} bytes failed - error {}", data.size(), rc));
  }
}

}  // namespace petrel
