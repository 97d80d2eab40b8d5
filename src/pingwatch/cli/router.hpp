#pragma once

#include "classifier/line_classifier.hpp"
#include "core/logging/logger.hpp"

#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace pingwatch::cli {

enum class HeartbeatOutput {
  kStdout,
  kStderr,
};

// Everything `pingwatch` accepts on the command line.
struct CliOptions {
  classifier::ClassifierConfig classifier;
  HeartbeatOutput heartbeat_output = HeartbeatOutput::kStdout;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
  bool show_help = false;
  bool show_version = false;
};

// Parses option tokens (without argv[0]). Unknown flags, missing values and
// positional arguments are usage errors. `--help`/`-h` and `--version` only
// count where an option name is expected, never as another option's value.
// Value ranges are checked afterwards by `classifier::ValidateClassifierConfig`.
bool ParseCliOptions(const std::vector<std::string_view>& args, CliOptions& options,
                     std::string& error);

// Feeds every line of `input` to `classifier` until EOF and maps the result to
// a process exit code:
//   0  => input ended normally
//   1  => input stream read error
//   10 => ping was started without `-D` (stream unusable)
int ConsumeStream(std::istream& input, classifier::LineClassifier& classifier,
                  core::logging::Logger& logger);

// Process entry: parses options, refuses interactive stdin, wires stdout /
// stderr sinks and the SIGUSR1 status watcher, then consumes stdin.
//   2  => usage error (unknown option / invalid value)
//   11 => stdin is a terminal
int Dispatch(int argc, char** argv);

} // namespace pingwatch::cli
