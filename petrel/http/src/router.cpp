#include "petrel/router.hpp"

#include <string_view>

#include "petrel/http-constants.hpp"
#include "petrel/http-request.hpp"
#include "petrel/http-response.hpp"
#include "petrel/http-status-code.hpp"
#include "petrel/log.hpp"
#include "petrel/router-config.hpp"

namespace petrel {

namespace {

constexpr std::string_view kRootPath = "/";
constexpr std::string_view kEchoRoute = "/echo";
constexpr std::string_view kUserAgentRoute = "/user-agent";
constexpr std::string_view kFilesRoute = "/files";
constexpr std::string_view kFilesAllowedMethods = "GET, POST";

// Removes 'prefix' from 'path' only if present.
constexpr std::string_view TrimPrefix(std::string_view path, std::string_view prefix) {
  if (path.starts_with(prefix)) {
    path.remove_prefix(prefix.size());
  }
  return path;
}

}  // namespace

Router::Router(const RouterConfig& config)
    : _config(config),
      _gzipEncoder(_config.compression),
      _negotiator(_gzipEncoder),
      _echoHandler(_negotiator),
      _fileHandler(_config.directory) {
  _config.compression.validate();
}

HttpResponse Router::dispatch(const HttpRequest& request) const {
  HttpResponse resp = route(request);
  if (!resp.headerValue(http::ContentLength)) {
    resp.header(http::ContentLength, resp.body().size());
  }
  return resp;
}

HttpResponse Router::route(const HttpRequest& request) const {
  const std::string_view path = request.path();

  if (path == kRootPath) {
    return HttpResponse(http::StatusCodeOK);
  }
  if (path.starts_with(kEchoRoute)) {
    return _echoHandler(TrimPrefix(path, kEchoPrefix), request.headerValueOrEmpty(http::AcceptEncoding));
  }
  if (path.starts_with(kUserAgentRoute)) {
    return UserAgentResponse(request.headerValueOrEmpty(http::UserAgent));
  }
  if (path.starts_with(kFilesRoute)) {
    return dispatchFiles(request);
  }

  log::debug("No route for '{}'", path);
  return HttpResponse(http::StatusCodeNotFound);
}

HttpResponse Router::dispatchFiles(const HttpRequest& request) const {
  const std::string_view method = request.method();
  const std::string_view name = TrimPrefix(request.path(), kFilesPrefix);
  if (method == http::GET) {
    return _fileHandler.get(name);
  }
  if (method == http::POST) {
    return _fileHandler.post(name, request.body());
  }

  log::debug("Method '{}' not allowed on '{}'", method, request.path());
  HttpResponse resp(http::StatusCodeMethodNotAllowed);
  resp.header(http::Allow, kFilesAllowedMethods);
  return resp;
}

}  // namespace petrel
