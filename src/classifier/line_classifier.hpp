#pragma once

#include "core/line_sink.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace pingwatch::classifier {

// Fixed for the lifetime of one classifier.
struct ClassifierConfig {
  // Replies slower than this are reported.
  double max_round_trip_ms = 500.0;
  // strftime pattern for the probe timestamp prefix.
  std::string time_format = "%Y-%m-%d %H:%M:%S";
  bool utc = false;
  // 0 disables heartbeats.
  double heartbeat_interval_s = 0.0;
  // A forward sequence step larger than this is reported as missed packets.
  std::uint32_t allowed_sequence_gap = 1;
};

// Returns false and fills `error` when a value would make the classifier
// misbehave (negative/non-finite thresholds, gap outside the 16-bit range).
bool ValidateClassifierConfig(const ClassifierConfig& config, std::string& error);

enum class LineOutcome {
  // Data line fully classified. Zero or more records were emitted.
  kProcessed,
  // `PING host (...)` banner.
  kBanner,
  // Start of ping's statistics trailer.
  kTrailer,
  // Blank line, or any line after the trailer.
  kIgnored,
  // Recoverable: reported on the primary and status sinks.
  kUnparseableTimestamp,
  // Recoverable: the line itself was emitted as the anomaly.
  kMissingSequence,
  // Fatal: ping runs without `-D`, so no line of the stream can be trusted.
  kFatalMissingTimestampPrefix,
};

const char* ToString(LineOutcome outcome);

inline bool IsFatal(LineOutcome outcome) {
  return outcome == LineOutcome::kFatalMissingTimestampPrefix;
}

struct ClassifierCounters {
  std::uint64_t lines_total = 0;
  std::uint64_t data_lines = 0;
  std::uint64_t anomaly_lines = 0;
  std::uint64_t missed_reports = 0;
  std::uint64_t missed_packets = 0;
  // Duplicate or late replies that did not advance the sequence.
  std::uint64_t out_of_order_replies = 0;
  std::uint64_t heartbeats = 0;
  std::uint64_t unparseable_timestamps = 0;
  std::uint64_t missing_sequence_lines = 0;
};

// Consistent pair read by status reports.
struct StatusSnapshot {
  std::string formatted_time;
  std::string line_text;
};

// Stateful reducer over `ping -D` output.
//
// Contract:
// - `Process` is called from one thread, one line at a time, in arrival order.
// - anomalies and missed-sequence records go to `primary`, heartbeats to
//   `heartbeat`, status reports and unparseable-timestamp notices to `status`.
// - output timestamps come from the probe; only heartbeat re-arming reads
//   `wall_clock`, so a stalled input cannot produce a heartbeat per line.
// - `ReportStatus` / `Snapshot` may be called from another thread at any time.
class LineClassifier {
public:
  using WallClock = std::function<double()>;

  LineClassifier(ClassifierConfig config, core::ILineSink& primary,
                 core::ILineSink& heartbeat, core::ILineSink& status);
  LineClassifier(ClassifierConfig config, core::ILineSink& primary,
                 core::ILineSink& heartbeat, core::ILineSink& status, WallClock wall_clock);

  LineClassifier(const LineClassifier&) = delete;
  LineClassifier& operator=(const LineClassifier&) = delete;

  LineOutcome Process(std::string_view line);

  // Writes `Last line at <time>: "<line>"` to the status sink and returns it.
  std::string ReportStatus() const;

  std::string FormatStatus() const;
  StatusSnapshot Snapshot() const;

  const ClassifierCounters& Counters() const {
    return counters_;
  }

  std::optional<std::uint16_t> LastSequence() const {
    return last_sequence_;
  }

  double LastEventTimestamp() const {
    return last_event_timestamp_;
  }

private:
  std::string FormatProbeTime(double timestamp) const;
  void EmitAnomaly(const std::string& formatted_time, const std::string& line, double timestamp);
  void MarkEvent(double timestamp);
  void UpdateSnapshot(std::string formatted_time, std::string line_text);

  ClassifierConfig config_;
  core::ILineSink& primary_;
  core::ILineSink& heartbeat_;
  core::ILineSink& status_;
  WallClock wall_clock_;

  std::optional<std::uint16_t> last_sequence_;
  double last_event_timestamp_ = 0.0;
  bool trailer_seen_ = false;
  ClassifierCounters counters_;

  mutable std::mutex snapshot_mutex_;
  StatusSnapshot snapshot_;
};

} // namespace pingwatch::classifier
