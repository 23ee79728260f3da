#pragma once

#include <filesystem>
#include <string_view>
#include <utility>

#include "petrel/content-negotiation.hpp"
#include "petrel/http-response.hpp"

namespace petrel {

// any /echo/<text>: text/plain echo of <text>, gzip-encoded when accepted.
class EchoHandler {
 public:
  explicit EchoHandler(const ContentNegotiator& negotiator) noexcept : _negotiator(&negotiator) {}

  [[nodiscard]] HttpResponse operator()(std::string_view text, std::string_view acceptEncoding) const {
    return _negotiator->makeTextResponse(text, acceptEncoding);
  }

 private:
  const ContentNegotiator* _negotiator;
};

// any /user-agent: text/plain body with the User-Agent header value (empty if absent).
[[nodiscard]] HttpResponse UserAgentResponse(std::string_view userAgent);

// GET and POST /files/<name>, relative to a base directory.
// The target is the lexically normalized join of the base directory and <name>: it is not sandboxed.
class FileRouteHandler {
 public:
  // An empty base directory means the current working directory.
  explicit FileRouteHandler(std::filesystem::path baseDirectory) : _baseDirectory(std::move(baseDirectory)) {}

  // 200 OK with the file bytes as application/octet-stream if it is a readable regular file, 404 otherwise.
  [[nodiscard]] HttpResponse get(std::string_view name) const;

  // Creates or truncates the file and writes 'body' into it.
  // 201 Created on success, 400 Bad Request on any I/O error.
  [[nodiscard]] HttpResponse post(std::string_view name, std::string_view body) const;

  // Path of the file targeted by /files/<name>.
  [[nodiscard]] std::filesystem::path resolve(std::string_view name) const;

 private:
  std::filesystem::path _baseDirectory;
};

}  // namespace petrel
