#include "petrel/signal-handler.hpp"

#include <csignal>

namespace {

volatile std::sig_atomic_t g_signalStatus{};

}  // namespace

// Only async-signal-safe work here: the accept loop reports the signal once it observes it.
extern "C" void PetrelSignalHandler(int sigNum) { g_signalStatus = sigNum; }

namespace petrel {

void SignalHandler::Enable() {
  std::signal(SIGINT, ::PetrelSignalHandler);
  std::signal(SIGTERM, ::PetrelSignalHandler);
}

void SignalHandler::Disable() {
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
}

bool SignalHandler::IsStopRequested() { return g_signalStatus != 0; }

int SignalHandler::ReceivedSignal() { return g_signalStatus; }

void SignalHandler::ResetStopRequest() { g_signalStatus = 0; }

}  // namespace petrel
