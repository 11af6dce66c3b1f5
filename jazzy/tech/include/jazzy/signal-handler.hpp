#pragma once

namespace jazzy {

class SignalHandler {
 public:
  SignalHandler() noexcept = delete;

  // Installs handlers for SIGINT and SIGTERM that record a stop request.
  // Typical use: server.runUntil(SignalHandler::IsStopRequested).
  static void Enable();

  // Restores the default behavior for SIGINT and SIGTERM.
  static void Disable();

  // Returns true if a termination signal was received since Enable().
  static bool IsStopRequested();

  // Number of the last received termination signal, 0 if none.
  static int LastSignal();

 private:
  friend class SignalHandlerTest;

  static void ResetStopRequest();
};

}  // namespace jazzy
