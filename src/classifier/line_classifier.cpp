#include "classifier/line_classifier.hpp"

#include "core/time_utils.hpp"
#include "probe/probe_line.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace pingwatch::classifier {

namespace {

// Shown for the time of lines whose timestamp could not be read, and for both
// fields before the first line arrives.
constexpr std::string_view kPlaceholderTime = "n/a";

std::string FormatSeconds(double seconds) {
  std::ostringstream out;
  out << seconds;
  return out.str();
}

} // namespace

bool ValidateClassifierConfig(const ClassifierConfig& config, std::string& error) {
  error.clear();

  if (!std::isfinite(config.max_round_trip_ms) || config.max_round_trip_ms < 0.0) {
    error = "max round-trip time must be a finite value >= 0 ms";
    return false;
  }
  if (!std::isfinite(config.heartbeat_interval_s) || config.heartbeat_interval_s < 0.0) {
    error = "heartbeat interval must be a finite value >= 0 s (0 disables heartbeats)";
    return false;
  }
  if (config.allowed_sequence_gap > probe::kMaxForwardSequenceStep) {
    error = "allowed sequence gap must be in [0, " +
            std::to_string(probe::kMaxForwardSequenceStep) + "]";
    return false;
  }
  if (config.time_format.empty()) {
    error = "time format cannot be empty";
    return false;
  }

  return true;
}

const char* ToString(LineOutcome outcome) {
  switch (outcome) {
  case LineOutcome::kProcessed:
    return "processed";
  case LineOutcome::kBanner:
    return "banner";
  case LineOutcome::kTrailer:
    return "trailer";
  case LineOutcome::kIgnored:
    return "ignored";
  case LineOutcome::kUnparseableTimestamp:
    return "unparseable_timestamp";
  case LineOutcome::kMissingSequence:
    return "missing_sequence";
  case LineOutcome::kFatalMissingTimestampPrefix:
    return "missing_timestamp_prefix";
  }

  return "processed";
}

LineClassifier::LineClassifier(ClassifierConfig config, core::ILineSink& primary,
                               core::ILineSink& heartbeat, core::ILineSink& status)
    : LineClassifier(std::move(config), primary, heartbeat, status, core::WallClockSeconds) {}

LineClassifier::LineClassifier(ClassifierConfig config, core::ILineSink& primary,
                               core::ILineSink& heartbeat, core::ILineSink& status, WallClock wall_clock)
    : config_(std::move(config)),
      primary_(primary),
      heartbeat_(heartbeat),
      status_(status),
      wall_clock_(wall_clock ? std::move(wall_clock) : WallClock(core::WallClockSeconds)) {
  last_event_timestamp_ = wall_clock_();
  snapshot_.formatted_time = std::string(kPlaceholderTime);
}

LineOutcome LineClassifier::Process(std::string_view line) {
  ++counters_.lines_total;

  if (trailer_seen_) {
    return LineOutcome::kIgnored;
  }

  const std::string_view trimmed = probe::TrimTrailing(line);
  if (trimmed.empty()) {
    return LineOutcome::kIgnored;
  }

  const auto tokens = probe::SplitOnSpace(trimmed);
  if (probe::LooksLikeUnprefixedReply(tokens)) {
    return LineOutcome::kFatalMissingTimestampPrefix;
  }
  if (probe::IsBannerLine(tokens)) {
    return LineOutcome::kBanner;
  }
  if (probe::IsStatisticsTrailer(tokens)) {
    trailer_seen_ = true;
    return LineOutcome::kTrailer;
  }

  const auto record = probe::ParseProbeRecord(trimmed, tokens);
  if (!record.has_value()) {
    ++counters_.unparseable_timestamps;
    const std::string notice = "Unparseable timestamp: " + std::string(trimmed);
    primary_.WriteLine(notice);
    status_.WriteLine(notice);
    UpdateSnapshot(std::string(kPlaceholderTime), std::string(trimmed));
    return LineOutcome::kUnparseableTimestamp;
  }

  ++counters_.data_lines;
  const double timestamp = record->timestamp;
  std::string formatted_time = FormatProbeTime(timestamp);

  // Without a sequence number the line cannot be tracked; whatever it is, it
  // is not a normal reply.
  if (!record->sequence_number.has_value()) {
    ++counters_.missing_sequence_lines;
    EmitAnomaly(formatted_time, record->raw_text, timestamp);
    UpdateSnapshot(std::move(formatted_time), record->raw_text);
    return LineOutcome::kMissingSequence;
  }

  const std::uint16_t sequence = *record->sequence_number;
  const bool too_slow =
      record->round_trip_ms.has_value() && *record->round_trip_ms > config_.max_round_trip_ms;
  const bool no_reply_time = !record->round_trip_ms.has_value();
  if (too_slow || record->has_suffix || no_reply_time) {
    EmitAnomaly(formatted_time, record->raw_text, timestamp);
  }

  // A step of 0 or more than half the sequence space is a duplicate or a
  // late reply: nothing was lost and the sequence must not move backwards.
  bool advances_sequence = true;
  if (last_sequence_.has_value()) {
    const std::uint32_t gap = probe::SequenceDistance(*last_sequence_, sequence);
    if (gap == 0U || gap > probe::kMaxForwardSequenceStep) {
      advances_sequence = false;
      ++counters_.out_of_order_replies;
    } else if (gap > config_.allowed_sequence_gap) {
      ++counters_.missed_reports;
      counters_.missed_packets += gap;
      primary_.WriteLine(formatted_time + " Missed icmp_seq=" + std::to_string(*last_sequence_) +
                         ":" + std::to_string(sequence) + " (" + std::to_string(gap) +
                         " packets)");
      MarkEvent(timestamp);
    }
  }

  if (config_.heartbeat_interval_s > 0.0 &&
      timestamp - last_event_timestamp_ > config_.heartbeat_interval_s) {
    ++counters_.heartbeats;
    heartbeat_.WriteLine("No anomalies found in the last " +
                         FormatSeconds(config_.heartbeat_interval_s) +
                         " s. Last input was at " + formatted_time);
    // Re-arm from the wall clock; the probe time is only a floor for input
    // stamped ahead of the local clock.
    MarkEvent(std::max(wall_clock_(), timestamp));
  }

  if (advances_sequence) {
    last_sequence_ = sequence;
  }
  UpdateSnapshot(std::move(formatted_time), record->raw_text);
  return LineOutcome::kProcessed;
}

std::string LineClassifier::ReportStatus() const {
  std::string status = FormatStatus();
  status_.WriteLine(status);
  return status;
}

std::string LineClassifier::FormatStatus() const {
  const StatusSnapshot snapshot = Snapshot();
  return "Last line at " + snapshot.formatted_time + ": \"" + snapshot.line_text + "\"";
}

StatusSnapshot LineClassifier::Snapshot() const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  return snapshot_;
}

std::string LineClassifier::FormatProbeTime(double timestamp) const {
  std::string formatted;
  if (core::FormatEpochSeconds(timestamp, config_.time_format, config_.utc, formatted)) {
    return formatted;
  }

  // Out of calendar range: fall back to the raw epoch value.
  std::ostringstream out;
  out << std::fixed << std::setprecision(6) << timestamp;
  return out.str();
}

void LineClassifier::EmitAnomaly(const std::string& formatted_time, const std::string& line,
                                 double timestamp) {
  ++counters_.anomaly_lines;
  primary_.WriteLine(formatted_time + " " + line);
  MarkEvent(timestamp);
}

void LineClassifier::MarkEvent(double timestamp) {
  last_event_timestamp_ = std::max(last_event_timestamp_, timestamp);
}

void LineClassifier::UpdateSnapshot(std::string formatted_time, std::string line_text) {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  snapshot_.formatted_time = std::move(formatted_time);
  snapshot_.line_text = std::move(line_text);
}

} // namespace pingwatch::classifier
