#include "petrel/content-negotiation.hpp"

#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include "petrel/accept-encoding-negotiation.hpp"
#include "petrel/encoding.hpp"
#include "petrel/http-constants.hpp"
#include "petrel/http-response.hpp"
#include "petrel/http-status-code.hpp"
#include "petrel/log.hpp"

namespace petrel {

HttpResponse ContentNegotiator::makeTextResponse(std::string_view body, std::string_view acceptEncoding) const {
  HttpResponse resp(http::StatusCodeOK);
  resp.header(http::ContentType, http::ContentTypeTextPlain);

  const Encoding encoding = EncodingSelector::negotiateAcceptEncoding(acceptEncoding);
  if (encoding == Encoding::gzip) {
    std::string compressed;
    try {
      _gzipEncoder->encodeFull(0, body, compressed);
      resp.header(http::ContentEncoding, GetEncodingStr(encoding));
      resp.header(http::ContentLength, compressed.size());
      resp.body(std::move(compressed));
      return resp;
    } catch (const std::exception& ex) {
      log::warn("gzip compression of {} bytes failed, sending uncompressed body: {}", body.size(), ex.what());
    }
  }

  resp.header(http::ContentLength, body.size());
  resp.body(std::string(body));
  return resp;
}

}  // namespace petrel
