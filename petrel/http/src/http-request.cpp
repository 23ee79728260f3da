#include "petrel/http-request.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "petrel/header-line-parse.hpp"
#include "petrel/http-constants.hpp"
#include "petrel/string-trim.hpp"
#include "petrel/toupperlower.hpp"

namespace petrel {

namespace {

// Returns the line starting at 'pos' in 'head' (without its '\n' nor a trailing '\r') and advances 'pos'
// past the line terminator.
constexpr std::string_view NextLine(std::string_view head, std::size_t& pos) {
  const auto eol = head.find('\n', pos);
  std::string_view line =
      eol == std::string_view::npos ? head.substr(pos) : head.substr(pos, eol - pos);
  pos = eol == std::string_view::npos ? head.size() + 1 : eol + 1;
  if (line.ends_with('\r')) {
    line.remove_suffix(1);
  }
  return line;
}

// Returns the next token of 'line' separated by a single space, and advances 'pos'.
constexpr std::string_view NextToken(std::string_view line, std::size_t& pos) {
  if (pos > line.size()) {
    return {};
  }
  const auto sep = line.find(' ', pos);
  std::string_view token = sep == std::string_view::npos ? line.substr(pos) : line.substr(pos, sep - pos);
  pos = sep == std::string_view::npos ? line.size() + 1 : sep + 1;
  return token;
}

}  // namespace

HttpRequest::HttpRequest(std::string raw) : _raw(std::move(raw)) { parse(); }

void HttpRequest::parse() {
  const std::string_view raw(_raw);

  std::string_view head = raw;
  const auto headEnd = raw.find(http::DoubleCRLF);
  if (headEnd != std::string_view::npos) {
    head = raw.substr(0, headEnd);
    _body = raw.substr(headEnd + http::DoubleCRLF.size());
  }

  std::size_t pos = 0;
  parseRequestLine(NextLine(head, pos));

  while (pos <= head.size()) {
    const std::string_view line = TrimSpace(NextLine(head, pos));
    if (line.empty()) {
      // end of headers
      break;
    }
    const auto [name, value] = http::ParseHeaderLine(line);
    if (name.empty()) {
      // lenient: malformed header lines are skipped
      continue;
    }
    // name points into _raw, which we own: lower-case it in place
    auto* nameBeg = _raw.data() + (name.data() - raw.data());
    tolower(nameBeg, name.size());
    _headers.insert_or_assign(name, value);
  }
}

void HttpRequest::parseRequestLine(std::string_view requestLine) {
  std::size_t pos = 0;
  _method = NextToken(requestLine, pos);
  _path = NextToken(requestLine, pos);
  _version = NextToken(requestLine, pos);
}

std::string_view HttpRequest::headerValueOrEmpty(std::string_view headerKey) const noexcept {
  auto it = _headers.find(headerKey);
  if (it == _headers.end()) {
    return {};
  }
  return it->second;
}

std::optional<std::string_view> HttpRequest::headerValue(std::string_view headerKey) const noexcept {
  auto it = _headers.find(headerKey);
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace petrel
