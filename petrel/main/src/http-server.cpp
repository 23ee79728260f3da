#include "petrel/http-server.hpp"

#include <atomic>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

#include "petrel/connection-handler.hpp"
#include "petrel/connection.hpp"
#include "petrel/event-loop.hpp"
#include "petrel/http-server-config.hpp"
#include "petrel/log.hpp"
#include "petrel/router-config.hpp"
#include "petrel/router.hpp"
#include "petrel/signal-handler.hpp"
#include "petrel/socket.hpp"

namespace petrel {

namespace {

HttpServerConfig ValidatedConfig(HttpServerConfig config) {
  config.validate();
  return config;
}

class RunningGuard {
 public:
  explicit RunningGuard(std::atomic<bool>& running) noexcept : _running(running) {
    _running.store(true, std::memory_order_release);
  }

  RunningGuard(const RunningGuard&) = delete;
  RunningGuard& operator=(const RunningGuard&) = delete;

  ~RunningGuard() { _running.store(false, std::memory_order_release); }

 private:
  std::atomic<bool>& _running;
};

}  // namespace

HttpServer::HttpServer(HttpServerConfig config)
    : _config(ValidatedConfig(std::move(config))),
      _listenSocket(Socket::Type::StreamNonBlock),
      _eventLoop(_config.pollInterval),
      _connectionHandler(std::make_shared<const Router>(RouterConfig(_config)), _config.readBufferSize) {
  _listenSocket.bindAndListen(_config.reuseAddr, _config.port);
  _eventLoop.addOrThrow(EventLoop::EventFd{EventIn, _listenSocket.fd()});
  log::info("Server listening on 0.0.0.0:{}", _config.port);
  if (!_config.directory.empty()) {
    log::info("Serving files from directory '{}'", _config.directory);
  }
}

void HttpServer::run() {
  RunningGuard runningGuard(_running);
  log::debug("Accept loop started on port {}", _config.port);
  while (!_stopRequested.load(std::memory_order_acquire) && !SignalHandler::IsStopRequested()) {
    const auto events = _eventLoop.poll();
    if (events.data() == nullptr) {
      throw std::runtime_error("Unrecoverable error while polling the listening socket");
    }
    for (const auto& event : events) {
      if (event.fd == _listenSocket.fd()) {
        acceptNewConnections();
      }
    }
  }
  if (SignalHandler::IsStopRequested()) {
    log::warn("Signal {} received, stopping server on port {}", SignalHandler::ReceivedSignal(), _config.port);
  }
  log::info("Server on port {} stopped", _config.port);
}

void HttpServer::stop() noexcept {
  if (!_stopRequested.exchange(true, std::memory_order_acq_rel)) {
    log::debug("Stop requested for server on port {}", _config.port);
  }
}

void HttpServer::acceptNewConnections() {
  while (true) {
    Connection cnx(_listenSocket);
    if (!cnx) {
      // no more waiting connections
      break;
    }
    log::info("Accepted connection fd # {}", cnx.fd());
    try {
      std::thread([handler = _connectionHandler, cnx = std::move(cnx)]() mutable {
        handler.serve(std::move(cnx));
      }).detach();
    } catch (const std::system_error& ex) {
      // the connection is closed together with the lambda that owned it
      log::error("Unable to spawn a thread for a new connection: {}", ex.what());
    }
  }
}

}  // namespace petrel
