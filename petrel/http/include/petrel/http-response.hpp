#pragma once

#include <concepts>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "petrel/http-header.hpp"
#include "petrel/http-status-code.hpp"

namespace petrel {

// -----------------------------------------------------------------------------
// HttpResponse
// -----------------------------------------------------------------------------
// Status + ordered headers + body, serialized in one shot by serialize():
//
//   "HTTP/1.1 " + "<code> <reason>" + "\r\n"
//   ("<name>: <value>\r\n")*          // insertion order
//   "\r\n"
//   <body>
//
// No header is ever added implicitly: handlers set Content-Type / Content-Length themselves
// when they return a body. A response with no header is serialized as "HTTP/1.1 <status>\r\n\r\n".
//
// header():
//   - Linear scan of the current headers for a case-insensitive match of the name. If found, the value is
//     replaced in place (keeping its position and the original name spelling). Otherwise the header is appended.
//
// Not thread-safe. Throws std::bad_alloc on growth failure.
// -----------------------------------------------------------------------------
class HttpResponse {
 public:
  // Creates a response with given status code and its standard reason phrase.
  explicit HttpResponse(http::StatusCode statusCode = http::StatusCodeOK);

  // Creates a response with given status code and a custom reason phrase.
  HttpResponse(http::StatusCode statusCode, std::string_view reason);

  // Standard reason phrase for the status codes produced by this server (empty for other codes).
  [[nodiscard]] static std::string_view ReasonPhraseFor(http::StatusCode statusCode) noexcept;

  [[nodiscard]] http::StatusCode status() const noexcept { return _statusCode; }

  [[nodiscard]] std::string_view reason() const noexcept { return _reason; }

  // Status line text without protocol version nor CRLF, for instance "200 OK".
  [[nodiscard]] std::string statusLine() const;

  [[nodiscard]] std::span<const http::Header> headers() const noexcept { return _headers; }

  // Value of the first header matching 'key' (case-insensitive), if any.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view key) const noexcept;

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Sets a header, replacing the value of an existing one with the same name (case-insensitive).
  HttpResponse& header(std::string_view key, std::string_view value) &;

  HttpResponse&& header(std::string_view key, std::string_view value) && { return std::move(header(key, value)); }

  HttpResponse& header(std::string_view key, std::integral auto value) & {
    return header(key, std::string_view(std::to_string(value)));
  }

  HttpResponse&& header(std::string_view key, std::integral auto value) && {
    return std::move(header(key, std::string_view(std::to_string(value))));
  }

  // Replaces the body. Headers are left untouched.
  HttpResponse& body(std::string body) & {
    _body = std::move(body);
    return *this;
  }

  HttpResponse&& body(std::string body) && { return std::move(this->body(std::move(body))); }

  // Renders the exact byte sequence to send on the wire.
  [[nodiscard]] std::string serialize() const;

  bool operator==(const HttpResponse&) const noexcept = default;

 private:
  http::StatusCode _statusCode;
  std::string _reason;
  std::vector<http::Header> _headers;
  std::string _body;
};

}  // namespace petrel
