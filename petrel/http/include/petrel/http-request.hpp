#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "petrel/string-equal-ignore-case.hpp"

namespace petrel {

// Single HTTP/1.1 request, parsed once from the bytes of one socket read.
//
// Parsing is lenient and never fails:
//   - head and body are separated by the first "\r\n\r\n" (no separator: everything is head, body is empty)
//   - the head is split in lines on '\n', a trailing '\r' being dropped
//   - the request line is split on single spaces: token 0 is the method, token 1 the path, token 2 the version.
//     Missing tokens are empty.
//   - every following line is trimmed. An empty line ends the headers, a line without ':' is ignored.
//     Names are lower-cased in place, values are trimmed, and the last occurrence of a name wins.
//
// All accessors return views into the request's own buffer, hence an HttpRequest is neither copyable nor movable.
class HttpRequest {
 public:
  using HeadersMap =
      std::unordered_map<std::string_view, std::string_view, CaseInsensitiveHashFunc, CaseInsensitiveEqualFunc>;

  // Takes ownership of the raw bytes and parses them.
  explicit HttpRequest(std::string raw);

  HttpRequest(const HttpRequest&) = delete;
  HttpRequest(HttpRequest&&) noexcept = delete;
  HttpRequest& operator=(const HttpRequest&) = delete;
  HttpRequest& operator=(HttpRequest&&) noexcept = delete;

  ~HttpRequest() = default;

  // Request method token, as sent by the client (no normalization).
  [[nodiscard]] std::string_view method() const noexcept { return _method; }

  // Request target, as sent by the client (no decoding, query string not split).
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // Protocol version token of the request line. Not validated, informational only.
  [[nodiscard]] std::string_view version() const noexcept { return _version; }

  // Everything after the first blank line, possibly empty.
  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Header map. Keys are always lower-case, lookups are case-insensitive.
  [[nodiscard]] const HeadersMap& headers() const noexcept { return _headers; }

  // Get the value of a header (case-insensitive lookup), or an empty view if it is absent.
  // If you need to distinguish between a missing header and an explicitly empty one, use headerValue().
  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view headerKey) const noexcept;

  // Like headerValueOrEmpty() but preserves the distinction between absence and an explicitly empty value.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view headerKey) const noexcept;

 private:
  void parse();

  void parseRequestLine(std::string_view requestLine);

  std::string _raw;
  std::string_view _method;
  std::string_view _path;
  std::string_view _version;
  std::string_view _body;
  HeadersMap _headers;
};

}  // namespace petrel
