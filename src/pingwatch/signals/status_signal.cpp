#include "pingwatch/signals/status_signal.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <pthread.h>
#include <signal.h>
#include <time.h>

namespace pingwatch::signals {

namespace {

// Bounds how long `Stop` waits for the watcher to notice the stop request.
constexpr long kPollIntervalNs = 200L * 1000L * 1000L;

} // namespace

StatusSignalWatcher::StatusSignalWatcher(int signal_number, Callback on_signal)
    : signal_number_(signal_number), on_signal_(std::move(on_signal)) {}

StatusSignalWatcher::~StatusSignalWatcher() {
  Stop();
}

bool StatusSignalWatcher::Start(std::string& error) {
  error.clear();
  if (worker_.joinable()) {
    error = "status signal watcher already running";
    return false;
  }
  if (!on_signal_) {
    error = "status signal watcher requires a callback";
    return false;
  }

  sigset_t mask;
  sigemptyset(&mask);
  if (sigaddset(&mask, signal_number_) != 0) {
    error = "invalid signal number: " + std::to_string(signal_number_);
    return false;
  }

  const int block_result = pthread_sigmask(SIG_BLOCK, &mask, nullptr);
  if (block_result != 0) {
    error = std::string("failed to block status signal: ") + std::strerror(block_result);
    return false;
  }

  stop_requested_.store(false);
  worker_ = std::thread(&StatusSignalWatcher::Run, this);
  return true;
}

void StatusSignalWatcher::Stop() {
  stop_requested_.store(true);
  if (worker_.joinable()) {
    worker_.join();
  }
}

void StatusSignalWatcher::Run() {
  sigset_t mask;
  sigemptyset(&mask);
  sigaddset(&mask, signal_number_);

  while (!stop_requested_.load()) {
    timespec timeout{};
    timeout.tv_sec = 0;
    timeout.tv_nsec = kPollIntervalNs;

    const int received = sigtimedwait(&mask, nullptr, &timeout);
    if (received == signal_number_) {
      on_signal_();
      continue;
    }
    // EAGAIN is the poll timeout and EINTR another handler; anything else
    // means the wait itself is broken and would spin.
    if (received < 0 && errno != EAGAIN && errno != EINTR) {
      return;
    }
  }
}

} // namespace pingwatch::signals
