#include "../common/assertions.hpp"
#include "../common/ping_fixtures.hpp"
#include "classifier/line_classifier.hpp"
#include "core/line_sink.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/logging/logger.hpp"
#include "pingwatch/cli/router.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

using pingwatch::tests::common::FromLine;
using pingwatch::tests::common::kBaseEpochSeconds;
using pingwatch::tests::common::ReplyLine;

constexpr double kT = kBaseEpochSeconds;

pingwatch::classifier::ClassifierConfig SmokeConfig() {
  pingwatch::classifier::ClassifierConfig config;
  config.utc = true;
  config.max_round_trip_ms = 250.0;
  config.heartbeat_interval_s = 30.0;
  return config;
}

void VerifyFullSessionTranscript() {
  std::ostringstream input;
  input << "PING 8.8.8.8 (8.8.8.8) 56(84) bytes of data.\n"
        << ReplyLine(kT, 1, "14.2") << '\n'
        << ReplyLine(kT + 1, 2, "13.8") << '\n'
        << ReplyLine(kT + 2, 3, "412") << '\n'
        << ReplyLine(kT + 2.1, 3, "13.9", "(DUP!)") << '\n'
        << ReplyLine(kT + 6, 7, "14.0") << '\n'
        << FromLine(kT + 7, 8, "Destination Host Unreachable") << '\n'
        << "[garbage 64 bytes from 8.8.8.8: icmp_seq=9 ttl=118 time=13.1 ms\n"
        << ReplyLine(kT + 9, 9, "14.0") << '\n'
        << ReplyLine(kT + 60, 10, "14.1") << '\n'
        << ReplyLine(kT + 61, 11, "14.1") << '\n'
        << '\n'
        << "--- 8.8.8.8 ping statistics ---\n"
        << "11 packets transmitted, 10 received, +1 duplicates, 9% packet loss, time 61000ms\n"
        << "rtt min/avg/max/mdev = 13.1/50.0/412.0/100.0 ms\n";

  pingwatch::core::MemoryLineSink primary;
  pingwatch::core::MemoryLineSink heartbeat;
  pingwatch::core::MemoryLineSink status;
  pingwatch::classifier::LineClassifier classifier(SmokeConfig(), primary, heartbeat, status,
                                                   [] { return kT; });

  std::ostringstream log_output;
  pingwatch::core::logging::Logger logger(pingwatch::core::logging::LogLevel::kInfo, log_output);

  std::istringstream stream(input.str());
  const int exit_code = pingwatch::cli::ConsumeStream(stream, classifier, logger);
  if (exit_code != pingwatch::core::errors::ToInt(pingwatch::core::errors::ExitCode::kSuccess)) {
    pingwatch::tests::common::Fail("expected success exit code at end of stream");
  }

  pingwatch::tests::common::AssertLines(
      primary.Lines(),
      {
          "2020-08-11 17:20:40 " + ReplyLine(kT + 2, 3, "412"),
          "2020-08-11 17:20:40 " + ReplyLine(kT + 2.1, 3, "13.9", "(DUP!)"),
          "2020-08-11 17:20:44 Missed icmp_seq=3:7 (4 packets)",
          "2020-08-11 17:20:45 " + FromLine(kT + 7, 8, "Destination Host Unreachable"),
          "Unparseable timestamp: [garbage 64 bytes from 8.8.8.8: icmp_seq=9 ttl=118 time=13.1 ms",
      });
  pingwatch::tests::common::AssertLines(
      heartbeat.Lines(),
      {"No anomalies found in the last 30 s. Last input was at 2020-08-11 17:21:38"});
  pingwatch::tests::common::AssertLines(
      status.Lines(),
      {"Unparseable timestamp: [garbage 64 bytes from 8.8.8.8: icmp_seq=9 ttl=118 time=13.1 ms"});

  const std::string log_text = log_output.str();
  pingwatch::tests::common::AssertContains(log_text, "msg=\"probe banner detected\"");
  pingwatch::tests::common::AssertContains(log_text, "target=\"8.8.8.8\"");
  pingwatch::tests::common::AssertContains(log_text, "msg=\"input stream ended\"");
  pingwatch::tests::common::AssertContains(log_text, "anomalies=\"3\"");
  pingwatch::tests::common::AssertContains(log_text, "missed_packets=\"4\"");
  pingwatch::tests::common::AssertContains(log_text, "heartbeats=\"1\"");
  pingwatch::tests::common::AssertContains(log_text, "unparseable_timestamps=\"1\"");
  pingwatch::tests::common::AssertContains(log_text, "missing_sequence_lines=\"0\"");
  pingwatch::tests::common::AssertContains(log_text, "out_of_order_replies=\"1\"");

  // The skipped line is named in a warning so the operator can see what was lost.
  pingwatch::tests::common::AssertContains(log_text, "level=WARN");
  pingwatch::tests::common::AssertContains(log_text,
                                           "msg=\"unparseable timestamp, line skipped\"");
  pingwatch::tests::common::AssertContains(
      log_text, "line=\"[garbage 64 bytes from 8.8.8.8: icmp_seq=9 ttl=118 time=13.1 ms\"");

  const std::string final_status = classifier.FormatStatus();
  pingwatch::tests::common::AssertContains(final_status, "Last line at 2020-08-11 17:21:39");
  pingwatch::tests::common::AssertContains(final_status, "icmp_seq=11");
}

void VerifyUnprefixedStreamAborts() {
  std::istringstream stream("PING 8.8.8.8 (8.8.8.8) 56(84) bytes of data.\n"
                            "64 bytes from 8.8.8.8: icmp_seq=1 ttl=118 time=14.2 ms\n"
                            "64 bytes from 8.8.8.8: icmp_seq=2 ttl=118 time=14.0 ms\n");

  pingwatch::core::MemoryLineSink primary;
  pingwatch::core::MemoryLineSink heartbeat;
  pingwatch::core::MemoryLineSink status;
  pingwatch::classifier::LineClassifier classifier(SmokeConfig(), primary, heartbeat, status,
                                                   [] { return kT; });

  std::ostringstream log_output;
  pingwatch::core::logging::Logger logger(pingwatch::core::logging::LogLevel::kInfo, log_output);

  const int exit_code = pingwatch::cli::ConsumeStream(stream, classifier, logger);
  if (exit_code != pingwatch::core::errors::ToInt(
                       pingwatch::core::errors::ExitCode::kMissingTimestampPrefix)) {
    pingwatch::tests::common::Fail("expected missing-timestamp exit code");
  }
  if (classifier.Counters().lines_total != 2U) {
    pingwatch::tests::common::Fail("expected processing to stop at the first unprefixed reply");
  }
  if (!primary.Lines().empty()) {
    pingwatch::tests::common::Fail("fatal stream should not emit anomaly records");
  }

  const std::string log_text = log_output.str();
  pingwatch::tests::common::AssertContains(log_text, "level=ERROR");
  pingwatch::tests::common::AssertContains(log_text, "ping -D");
  pingwatch::tests::common::AssertContains(log_text, "msg=\"input stream aborted\"");
}

} // namespace

int main() {
  VerifyFullSessionTranscript();
  VerifyUnprefixedStreamAborts();

  std::cout << "stream_consume_smoke: ok\n";
  return 0;
}
