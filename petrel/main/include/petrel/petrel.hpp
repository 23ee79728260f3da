// petrel Umbrella Header
//
// Include this single header to pull in the public HTTP server API:
//   - HttpServer and its configuration (HttpServerConfig, CompressionConfig)
//   - Request / Response primitives (HttpRequest, HttpResponse)
//   - The fixed Router and its configuration (RouterConfig)
//   - Signal handling and version helpers for executables
//
// Usage Example:
//    #include <petrel/petrel.hpp>
//    int main() {
//      petrel::SignalHandler::Enable();
//      petrel::HttpServer server(petrel::HttpServerConfig{}.withDirectory("/tmp"));
//      server.run();
//    }
#pragma once

// IWYU pragma: begin_exports
#include "petrel/compression-config.hpp"
#include "petrel/http-request.hpp"
#include "petrel/http-response.hpp"
#include "petrel/http-server-config.hpp"
#include "petrel/http-server.hpp"
#include "petrel/http-status-code.hpp"
#include "petrel/log.hpp"
#include "petrel/router-config.hpp"
#include "petrel/router.hpp"
#include "petrel/signal-handler.hpp"
#include "petrel/version.hpp"
// IWYU pragma: end_exports
