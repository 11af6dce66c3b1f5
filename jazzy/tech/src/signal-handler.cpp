#include "jazzy/signal-handler.hpp"

#include <csignal>

#include "jazzy/log.hpp"

namespace {

volatile std::sig_atomic_t g_lastSignal{};

}  // namespace

extern "C" void JazzySignalHandler(int sigNum) {
  ::jazzy::log::warn("Signal {} received, stopping", sigNum);
  g_lastSignal = sigNum;
}

namespace jazzy {

void SignalHandler::Enable() {
  g_lastSignal = 0;
  std::signal(SIGINT, ::JazzySignalHandler);
  std::signal(SIGTERM, ::JazzySignalHandler);
}

void SignalHandler::Disable() {
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
}

bool SignalHandler::IsStopRequested() { return g_lastSignal != 0; }

int SignalHandler::LastSignal() { return g_lastSignal; }

void SignalHandler::ResetStopRequest() { g_lastSignal = 0; }

}  // namespace jazzy
