#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <thread>

namespace pingwatch::signals {

// Turns an asynchronous POSIX signal (SIGUSR1 for `pingwatch`) into a plain
// function call on a dedicated thread.
//
// Contract:
// - `Start` blocks the signal in the calling thread. Threads created
//   afterwards inherit the mask, so the signal is only ever consumed by the
//   watcher via `sigtimedwait` and the callback never runs in signal context.
// - call `Start` before spawning other threads.
// - `Stop` (or the destructor) joins the watcher. The signal stays blocked so
//   a late request cannot terminate the process through the default action.
class StatusSignalWatcher {
public:
  using Callback = std::function<void()>;

  StatusSignalWatcher(int signal_number, Callback on_signal);
  ~StatusSignalWatcher();

  StatusSignalWatcher(const StatusSignalWatcher&) = delete;
  StatusSignalWatcher& operator=(const StatusSignalWatcher&) = delete;

  bool Start(std::string& error);
  void Stop();

  bool Running() const {
    return worker_.joinable();
  }

private:
  void Run();

  int signal_number_ = 0;
  Callback on_signal_;
  std::atomic<bool> stop_requested_{false};
  std::thread worker_;
};

} // namespace pingwatch::signals
