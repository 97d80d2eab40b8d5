#pragma once

namespace pingwatch::core::errors {

// Stable process-exit contract for pipelines that wrap `pingwatch`.
//
// The first three values preserve conventional meanings used by scripts:
// - 0 success (input stream ended)
// - 1 generic failure
// - 2 usage/argument failure
//
// Additional values classify the fatal input conditions so supervisors can
// restart the probe with the right flags without scraping stderr text.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kMissingTimestampPrefix = 10,
  kInteractiveInput = 11,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace pingwatch::core::errors
