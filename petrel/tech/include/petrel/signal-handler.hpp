#pragma once

namespace petrel {

class SignalHandler {
 public:
  SignalHandler() noexcept = delete;

  // Sets up signal handlers for SIGINT and SIGTERM to request a stop of the accept loop.
  static void Enable();

  // Disables the signal handlers and restores default behavior.
  static void Disable();

  // Returns true if a termination signal was received.
  static bool IsStopRequested();

  // Number of the last termination signal received, 0 if none.
  static int ReceivedSignal();

 private:
  friend class SignalHandlerGlobalTest;

  // Resets the stop-requested flag (for testing purposes).
  static void ResetStopRequest();
};

}  // namespace petrel
