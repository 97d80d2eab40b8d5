#pragma once

#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace pingwatch::core {

// Destination for one line of text. The classifier and the logger only need
// this single capability, which keeps anomaly, heartbeat, status and log
// outputs swappable.
class ILineSink {
public:
  virtual ~ILineSink() = default;

  // Writes `line` followed by a newline.
  virtual void WriteLine(std::string_view line) = 0;
};

// Forwards lines to an ostream and flushes after each one so downstream
// pipes see anomalies immediately. Writes are serialized because the status
// watcher thread shares the stderr sink with the reducer and the logger.
class StreamLineSink final : public ILineSink {
public:
  explicit StreamLineSink(std::ostream& out) : out_(&out) {}

  void WriteLine(std::string_view line) override;

private:
  std::mutex mutex_;
  std::ostream* out_ = nullptr;
};

// Keeps every written line in memory. Used by tests and by callers that post
// process classifier output.
class MemoryLineSink final : public ILineSink {
public:
  void WriteLine(std::string_view line) override;

  std::vector<std::string> Lines() const;

private:
  mutable std::mutex mutex_;
  std::vector<std::string> lines_;
};

} // namespace pingwatch::core
