#include "core/line_sink.hpp"
#include "core/logging/logger.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>

namespace {

void RequireContains(const std::string& text, const std::string& needle) {
  REQUIRE(text.find(needle) != std::string::npos);
}

} // namespace

TEST_CASE("ParseLogLevel accepts documented names case-insensitively", "[core][logging]") {
  using pingwatch::core::logging::LogLevel;
  LogLevel level = LogLevel::kInfo;
  std::string error;

  REQUIRE(pingwatch::core::logging::ParseLogLevel("DEBUG", level, error));
  REQUIRE(level == LogLevel::kDebug);
  REQUIRE(pingwatch::core::logging::ParseLogLevel("warning", level, error));
  REQUIRE(level == LogLevel::kWarn);
  REQUIRE(pingwatch::core::logging::ParseLogLevel("error", level, error));
  REQUIRE(level == LogLevel::kError);

  REQUIRE_FALSE(pingwatch::core::logging::ParseLogLevel("verbose", level, error));
  RequireContains(error, "debug|info|warn|error");
  REQUIRE_FALSE(pingwatch::core::logging::ParseLogLevel("", level, error));
}

TEST_CASE("Logger writes one key=value record with target and fields", "[core][logging]") {
  std::ostringstream out;
  pingwatch::core::logging::Logger logger(pingwatch::core::logging::LogLevel::kInfo, out);
  logger.SetTarget("8.8.8.8");
  logger.Info("input stream ended", {{"lines", "12"}, {"note", "say \"hi\""}});

  const std::string text = out.str();
  RequireContains(text, "ts_utc=");
  RequireContains(text, " level=INFO");
  RequireContains(text, " target=\"8.8.8.8\"");
  RequireContains(text, " msg=\"input stream ended\"");
  RequireContains(text, " lines=\"12\"");
  RequireContains(text, " note=\"say \\\"hi\\\"\"");
  REQUIRE(text.back() == '\n');
}

TEST_CASE("Logger drops records below the minimum level", "[core][logging]") {
  std::ostringstream out;
  pingwatch::core::logging::Logger logger(pingwatch::core::logging::LogLevel::kWarn, out);
  logger.Debug("hidden");
  logger.Info("hidden");
  REQUIRE(out.str().empty());

  logger.Warn("shown");
  RequireContains(out.str(), "level=WARN");
  REQUIRE(logger.Target() == "-");
}

TEST_CASE("Logger hands each record to a shared sink as one whole line", "[core][logging]") {
  pingwatch::core::MemoryLineSink sink;
  pingwatch::core::logging::Logger logger(pingwatch::core::logging::LogLevel::kInfo, sink);

  sink.WriteLine("anomaly record");
  logger.Warn("unparseable timestamp, line skipped", {{"line", "[x] junk"}});
  logger.Debug("hidden");

  const auto& lines = sink.Lines();
  REQUIRE(lines.size() == 2U);
  REQUIRE(lines[0] == "anomaly record");
  RequireContains(lines[1], "level=WARN");
  RequireContains(lines[1], " msg=\"unparseable timestamp, line skipped\"");
  RequireContains(lines[1], " line=\"[x] junk\"");
  REQUIRE(lines[1].find('\n') == std::string::npos);
}
