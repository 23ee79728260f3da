#include "petrel/http-response.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "petrel/http-constants.hpp"
#include "petrel/http-header.hpp"
#include "petrel/http-status-code.hpp"
#include "petrel/string-equal-ignore-case.hpp"

namespace petrel {

HttpResponse::HttpResponse(http::StatusCode statusCode)
    : _statusCode(statusCode), _reason(ReasonPhraseFor(statusCode)) {}

HttpResponse::HttpResponse(http::StatusCode statusCode, std::string_view reason)
    : _statusCode(statusCode), _reason(reason) {}

std::string_view HttpResponse::ReasonPhraseFor(http::StatusCode statusCode) noexcept {
  switch (statusCode) {
    case http::StatusCodeOK:
      return http::ReasonOK;
    case http::StatusCodeCreated:
      return http::ReasonCreated;
    case http::StatusCodeBadRequest:
      return http::ReasonBadRequest;
    case http::StatusCodeNotFound:
      return http::ReasonNotFound;
    case http::StatusCodeMethodNotAllowed:
      return http::ReasonMethodNotAllowed;
    default:
      return {};
  }
}

std::string HttpResponse::statusLine() const {
  std::string ret = std::to_string(_statusCode);
  if (!_reason.empty()) {
    ret.push_back(' ');
    ret.append(_reason);
  }
  return ret;
}

std::optional<std::string_view> HttpResponse::headerValue(std::string_view key) const noexcept {
  auto it = std::ranges::find_if(_headers, [key](std::string_view name) { return CaseInsensitiveEqual(name, key); },
                                 &http::Header::name);
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

HttpResponse& HttpResponse::header(std::string_view key, std::string_view value) & {
  auto it = std::ranges::find_if(_headers, [key](std::string_view name) { return CaseInsensitiveEqual(name, key); },
                                 &http::Header::name);
  if (it == _headers.end()) {
    _headers.emplace_back(std::string(key), std::string(value));
  } else {
    it->value.assign(value);
  }
  return *this;
}

std::string HttpResponse::serialize() const {
  std::size_t headersSize = 0;
  for (const auto& [name, value] : _headers) {
    headersSize += name.size() + http::HeaderSep.size() + value.size() + http::CRLF.size();
  }

  std::string out;
  out.reserve(http::HTTP11Sv.size() + 1U + 4U + _reason.size() + headersSize + http::DoubleCRLF.size() +
              _body.size());

  out.append(http::HTTP11Sv);
  out.push_back(' ');
  out.append(statusLine());
  out.append(http::CRLF);
  for (const auto& [name, value] : _headers) {
    out.append(name);
    out.append(http::HeaderSep);
    out.append(value);
    out.append(http::CRLF);
  }
  out.append(http::CRLF);
  out.append(_body);
  return out;
}

}  // namespace petrel
