#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include "petrel/connection-handler.hpp"
#include "petrel/event-loop.hpp"
#include "petrel/http-server-config.hpp"
#include "petrel/router.hpp"
#include "petrel/socket.hpp"

namespace petrel {

// HttpServer
//  - Binds and listens on 0.0.0.0:<port> at construction (port 0 picks an ephemeral port, see port()).
//  - run() is a single threaded accept loop: it waits for incoming connections through an EventLoop,
//    accepts all of them and serves each on its own detached thread (one request per connection).
//  - The Router is immutable and shared with the connection threads, that may outlive the server.
//  - No connection limit, timeout, nor backpressure.
//
// Stopping:
//  - stop() may be called from any thread. run() returns at the latest after one poll interval.
//  - run() also returns when SIGINT / SIGTERM were received while SignalHandler is enabled.
//  - Connections already being served are not interrupted.
//  - A stopped server cannot be restarted.
class HttpServer {
 public:
  // Validates the configuration, creates the Router and binds the listening socket.
  // Throws std::invalid_argument on invalid configuration and std::system_error if the socket cannot be bound.
  explicit HttpServer(HttpServerConfig config);

  HttpServer(const HttpServer&) = delete;
  HttpServer(HttpServer&&) noexcept = delete;
  HttpServer& operator=(const HttpServer&) = delete;
  HttpServer& operator=(HttpServer&&) noexcept = delete;

  ~HttpServer() = default;

  // Blocking accept loop. Returns after stop() or a termination signal.
  // Throws std::system_error on unrecoverable accept failures and std::runtime_error if polling fails.
  void run();

  // Requests run() to return. Thread safe.
  void stop() noexcept;

  // Effective bound port.
  [[nodiscard]] uint16_t port() const noexcept { return _config.port; }

  [[nodiscard]] const HttpServerConfig& config() const noexcept { return _config; }

  [[nodiscard]] bool isRunning() const noexcept { return _running.load(std::memory_order_acquire); }

 private:
  void acceptNewConnections();

  HttpServerConfig _config;
  Socket _listenSocket;
  EventLoop _eventLoop;
  ConnectionHandler _connectionHandler;
  std::atomic<bool> _stopRequested{false};
  std::atomic<bool> _running{false};
};

}  // namespace petrel
