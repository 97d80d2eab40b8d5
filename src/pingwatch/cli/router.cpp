#include "pingwatch/cli/router.hpp"

#include "core/line_sink.hpp"
#include "core/errors/exit_codes.hpp"
#include "pingwatch/signals/status_signal.hpp"
#include "probe/probe_line.hpp"

#include <charconv>
#include <cmath>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>

#include <unistd.h>

namespace pingwatch::cli {

namespace {

constexpr std::string_view kVersion = "pingwatch 0.3.0";

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitMissingTimestampPrefix =
    core::errors::ToInt(core::errors::ExitCode::kMissingTimestampPrefix);
constexpr int kExitInteractiveInput =
    core::errors::ToInt(core::errors::ExitCode::kInteractiveInput);

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  ping -D <host> | pingwatch [--max-time-ms <T>] [--fmt <pattern>] [--utc]\n"
      << "                             [--heartbeat-interval <H>] [--heartbeat-output "
         "stdout|stderr]\n"
      << "                             [--allowed-seq-diff <N>] [--log-level "
         "<debug|info|warn|error>]\n"
      << "  pingwatch --help | --version\n"
      << "\n"
      << "Reads `ping -D` output from stdin and prints only anomalous lines.\n"
      << "\n"
      << "options:\n"
      << "  -t, --max-time-ms <T>       report round-trip times above T ms (default 500)\n"
      << "  --fmt <pattern>             strftime pattern for timestamps "
         "(default \"%Y-%m-%d %H:%M:%S\")\n"
      << "  --utc                       format timestamps in UTC instead of local time\n"
      << "  --heartbeat-interval <H>    print a liveness line when nothing was reported\n"
      << "                              for H seconds (default 0, disabled)\n"
      << "  --heartbeat-output <where>  stdout (default) or stderr\n"
      << "  --allowed-seq-diff <N>      report sequence steps larger than N (default 1)\n"
      << "  --log-level <level>         operational log level on stderr (default info)\n"
      << "\n"
      << "Send SIGUSR1 to print the last processed line to stderr.\n";
}

std::optional<std::string_view> TakeValue(const std::vector<std::string_view>& args,
                                          std::size_t& i, std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(args[i]);
    return std::nullopt;
  }
  ++i;
  return args[i];
}

bool ParseDoubleValue(std::string_view flag, std::string_view text, double& out,
                      std::string& error) {
  const std::string value_text(text);
  char* parse_end = nullptr;
  const double parsed = std::strtod(value_text.c_str(), &parse_end);
  if (value_text.empty() || parse_end == nullptr || *parse_end != '\0' ||
      !std::isfinite(parsed)) {
    error = "invalid value for " + std::string(flag) + ": '" + value_text +
            "' (expected a number)";
    return false;
  }
  out = parsed;
  return true;
}

bool ParseUnsignedValue(std::string_view flag, std::string_view text, std::uint32_t& out,
                        std::string& error) {
  std::uint32_t parsed = 0;
  const char* begin = text.data();
  const char* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (text.empty() || ec != std::errc() || ptr != end) {
    error = "invalid value for " + std::string(flag) + ": '" + std::string(text) +
            "' (expected a non-negative integer)";
    return false;
  }
  out = parsed;
  return true;
}

void LogStreamSummary(core::logging::Logger& logger, const classifier::ClassifierCounters& c,
                      std::string_view message) {
  const std::string lines = std::to_string(c.lines_total);
  const std::string data_lines = std::to_string(c.data_lines);
  const std::string anomalies = std::to_string(c.anomaly_lines);
  const std::string missed_reports = std::to_string(c.missed_reports);
  const std::string missed_packets = std::to_string(c.missed_packets);
  const std::string heartbeats = std::to_string(c.heartbeats);
  const std::string unparseable = std::to_string(c.unparseable_timestamps);
  const std::string missing_sequence = std::to_string(c.missing_sequence_lines);
  const std::string out_of_order = std::to_string(c.out_of_order_replies);
  logger.Info(message, {{"lines", lines},
                        {"data_lines", data_lines},
                        {"anomalies", anomalies},
                        {"missed_reports", missed_reports},
                        {"missed_packets", missed_packets},
                        {"heartbeats", heartbeats},
                        {"unparseable_timestamps", unparseable},
                        {"missing_sequence_lines", missing_sequence},
                        {"out_of_order_replies", out_of_order}});
}

} // namespace

bool ParseCliOptions(const std::vector<std::string_view>& args, CliOptions& options,
                     std::string& error) {
  error.clear();

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];

    // Help and version end parsing; anything after them is not validated.
    if (token == "--help" || token == "-h") {
      options.show_help = true;
      return true;
    }
    if (token == "--version") {
      options.show_version = true;
      return true;
    }

    if (token == "--max-time-ms" || token == "-t") {
      const auto value = TakeValue(args, i, error);
      if (!value.has_value() ||
          !ParseDoubleValue(token, *value, options.classifier.max_round_trip_ms, error)) {
        return false;
      }
      continue;
    }
    if (token == "--fmt") {
      const auto value = TakeValue(args, i, error);
      if (!value.has_value()) {
        return false;
      }
      options.classifier.time_format = std::string(*value);
      continue;
    }
    if (token == "--utc") {
      options.classifier.utc = true;
      continue;
    }
    if (token == "--heartbeat-interval") {
      const auto value = TakeValue(args, i, error);
      if (!value.has_value() ||
          !ParseDoubleValue(token, *value, options.classifier.heartbeat_interval_s, error)) {
        return false;
      }
      continue;
    }
    if (token == "--heartbeat-output") {
      const auto value = TakeValue(args, i, error);
      if (!value.has_value()) {
        return false;
      }
      if (*value == "stdout") {
        options.heartbeat_output = HeartbeatOutput::kStdout;
      } else if (*value == "stderr") {
        options.heartbeat_output = HeartbeatOutput::kStderr;
      } else {
        error = "invalid --heartbeat-output '" + std::string(*value) +
                "' (expected stdout|stderr)";
        return false;
      }
      continue;
    }
    if (token == "--allowed-seq-diff") {
      const auto value = TakeValue(args, i, error);
      if (!value.has_value() ||
          !ParseUnsignedValue(token, *value, options.classifier.allowed_sequence_gap, error)) {
        return false;
      }
      continue;
    }
    if (token == "--log-level") {
      const auto value = TakeValue(args, i, error);
      if (!value.has_value() ||
          !core::logging::ParseLogLevel(*value, options.log_level, error)) {
        return false;
      }
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }

    error = "unexpected argument: " + std::string(token) + " (input is read from stdin)";
    return false;
  }

  return true;
}

int ConsumeStream(std::istream& input, classifier::LineClassifier& classifier,
                  core::logging::Logger& logger) {
  std::string line;
  while (std::getline(input, line)) {
    const classifier::LineOutcome outcome = classifier.Process(line);

    switch (outcome) {
    case classifier::LineOutcome::kBanner: {
      const auto target = probe::ParseBannerTarget(line);
      if (target.has_value()) {
        logger.SetTarget(*target);
        logger.Info("probe banner detected", {{"target", *target}});
      }
      break;
    }
    case classifier::LineOutcome::kTrailer:
      logger.Debug("ping statistics trailer reached, ignoring remaining input");
      break;
    case classifier::LineOutcome::kUnparseableTimestamp:
      logger.Warn("unparseable timestamp, line skipped", {{"line", line}});
      break;
    case classifier::LineOutcome::kMissingSequence:
      logger.Debug("line without sequence number reported as anomaly",
                   {{"outcome", classifier::ToString(outcome)}});
      break;
    case classifier::LineOutcome::kFatalMissingTimestampPrefix:
      logger.Error("ping output carries no timestamp prefix, restart it as `ping -D <host>`",
                   {{"line", line}});
      LogStreamSummary(logger, classifier.Counters(), "input stream aborted");
      return kExitMissingTimestampPrefix;
    case classifier::LineOutcome::kProcessed:
    case classifier::LineOutcome::kIgnored:
      break;
    }
  }

  if (input.bad()) {
    logger.Error("failed to read input stream");
    LogStreamSummary(logger, classifier.Counters(), "input stream aborted");
    return kExitFailure;
  }

  LogStreamSummary(logger, classifier.Counters(), "input stream ended");
  return kExitSuccess;
}

int Dispatch(int argc, char** argv) {
  const std::vector<std::string_view> args(argv + (argc > 0 ? 1 : 0), argv + argc);

  CliOptions options;
  std::string error;
  if (!ParseCliOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  if (options.show_help) {
    PrintUsage(std::cout);
    return kExitSuccess;
  }
  if (options.show_version) {
    std::cout << kVersion << '\n';
    return kExitSuccess;
  }
  if (!classifier::ValidateClassifierConfig(options.classifier, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  if (isatty(STDIN_FILENO) != 0) {
    std::cerr << "error: pingwatch reads from a pipe, not from an interactive terminal\n"
              << "example: ping -D 8.8.8.8 | pingwatch\n";
    return kExitInteractiveInput;
  }

  core::StreamLineSink stdout_sink(std::cout);
  core::StreamLineSink stderr_sink(std::cerr);
  // Log records share the stderr sink so they never interleave with anomaly lines.
  core::logging::Logger logger(options.log_level, stderr_sink);
  core::ILineSink& heartbeat_sink =
      options.heartbeat_output == HeartbeatOutput::kStderr
          ? static_cast<core::ILineSink&>(stderr_sink)
          : static_cast<core::ILineSink&>(stdout_sink);

  classifier::LineClassifier line_classifier(options.classifier, stdout_sink, heartbeat_sink,
                                             stderr_sink);

  // Declared after the classifier so the watcher thread is joined first.
  signals::StatusSignalWatcher status_watcher(SIGUSR1,
                                              [&line_classifier]() {
                                                line_classifier.ReportStatus();
                                              });
  if (!status_watcher.Start(error)) {
    logger.Error("failed to install status signal watcher", {{"error", error}});
    return kExitFailure;
  }

  std::ostringstream max_rtt;
  max_rtt << options.classifier.max_round_trip_ms;
  std::ostringstream heartbeat;
  heartbeat << options.classifier.heartbeat_interval_s;
  const std::string allowed_gap = std::to_string(options.classifier.allowed_sequence_gap);
  logger.Info("reading ping output from stdin",
              {{"max_time_ms", max_rtt.str()},
               {"heartbeat_interval_s", heartbeat.str()},
               {"allowed_seq_diff", allowed_gap},
               {"time_format", options.classifier.time_format}});

  return ConsumeStream(std::cin, line_classifier, logger);
}

} // namespace pingwatch::cli
