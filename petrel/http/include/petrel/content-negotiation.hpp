#pragma once

#include <string>
#include <string_view>

#include "petrel/encoder.hpp"
#include "petrel/http-response.hpp"

namespace petrel {

// Builds 'text/plain' responses, compressing the body when the client accepts it.
//
// Compression is best effort: if the encoder throws, the failure is logged and the body is sent
// uncompressed, without any Content-Encoding header. Content-Length is always the byte length of
// the body actually sent.
//
// The negotiator does not own the encoder, which must outlive it and be usable from several threads.
class ContentNegotiator {
 public:
  explicit ContentNegotiator(const Encoder& gzipEncoder) noexcept : _gzipEncoder(&gzipEncoder) {}

  // 200 OK response with 'body' as text/plain, gzip-encoded if 'acceptEncoding' contains the "gzip" token.
  [[nodiscard]] HttpResponse makeTextResponse(std::string_view body, std::string_view acceptEncoding) const;

 private:
  const Encoder* _gzipEncoder;
};

}  // namespace petrel
