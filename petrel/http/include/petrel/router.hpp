#pragma once

#include <string_view>

#include "petrel/content-negotiation.hpp"
#include "petrel/gzip-encoder.hpp"
#include "petrel/http-request.hpp"
#include "petrel/http-response.hpp"
#include "petrel/route-handlers.hpp"
#include "petrel/router-config.hpp"

namespace petrel {

// Fixed, ordered predicate chain over the request path (first match wins):
//   1. "/"                -> 200 OK, empty body
//   2. prefix "/echo"     -> echo of the path minus "/echo/", gzip-encoded if accepted
//   3. prefix "/user-agent" -> text/plain User-Agent header value
//   4. prefix "/files"    -> GET: read file, POST: create file, other methods: 405 with "Allow: GET, POST"
//   5. otherwise          -> 404 Not Found, empty body
//
// Every response returned by dispatch() carries a Content-Length header equal to its body size, handlers that
// return an empty body leave it to dispatch().
//
// A Router is immutable after construction and dispatch() may be called concurrently from several threads.
// It is not copyable nor movable as handlers refer to its members.
class Router {
 public:
  static constexpr std::string_view kEchoPrefix = "/echo/";
  static constexpr std::string_view kFilesPrefix = "/files/";

  // Throws std::invalid_argument if the compression configuration is invalid.
  explicit Router(const RouterConfig& config = {});

  Router(const Router&) = delete;
  Router(Router&&) noexcept = delete;
  Router& operator=(const Router&) = delete;
  Router& operator=(Router&&) noexcept = delete;

  ~Router() = default;

  [[nodiscard]] HttpResponse dispatch(const HttpRequest& request) const;

 private:
  [[nodiscard]] HttpResponse route(const HttpRequest& request) const;

  [[nodiscard]] HttpResponse dispatchFiles(const HttpRequest& request) const;

  RouterConfig _config;
  GzipEncoder _gzipEncoder;
  ContentNegotiator _negotiator;
  EchoHandler _echoHandler;
  FileRouteHandler _fileHandler;
};

}  // namespace petrel
