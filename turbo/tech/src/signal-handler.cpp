#include "turbo/signal-handler.hpp"

#include <signal.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>

namespace {

volatile std::sig_atomic_t g_stopSignal{};
std::atomic<int64_t> g_maxDrainPeriodMs{5000};

}  // namespace

// Only async-signal-safe work here: the event loops poll IsStopRequested() and log the shutdown themselves.
extern "C" void TurboSignalHandler(int sigNum) { g_stopSignal = sigNum; }

namespace turbo {

SignalHandler::SignalHandler(std::chrono::milliseconds maxDrainPeriod) {
  g_stopSignal = 0;
  g_maxDrainPeriodMs.store(maxDrainPeriod.count(), std::memory_order_relaxed);

  struct sigaction action{};
  action.sa_handler = ::TurboSignalHandler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = SA_RESTART;
  ::sigaction(SIGINT, &action, &_previousInt);
  ::sigaction(SIGTERM, &action, &_previousTerm);
}

SignalHandler::~SignalHandler() {
  ::sigaction(SIGINT, &_previousInt, nullptr);
  ::sigaction(SIGTERM, &_previousTerm, nullptr);
}

bool SignalHandler::IsStopRequested() noexcept { return g_stopSignal != 0; }

int SignalHandler::StopSignal() noexcept { return g_stopSignal; }

std::chrono::milliseconds SignalHandler::MaxDrainPeriod() noexcept {
  return std::chrono::milliseconds{g_maxDrainPeriodMs.load(std::memory_order_relaxed)};
}

}  // namespace turbo
