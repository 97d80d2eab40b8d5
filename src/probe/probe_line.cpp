#include "probe/probe_line.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <system_error>

namespace pingwatch::probe {

namespace {

constexpr std::string_view kBannerToken = "PING";
constexpr std::string_view kTrailerToken = "---";
constexpr std::string_view kSequencePrefix = "icmp_seq=";
constexpr std::string_view kLegacySequencePrefix = "icmp_req=";
constexpr std::string_view kRoundTripPrefix = "time=";

bool StartsWith(std::string_view text, std::string_view prefix) {
  return text.size() >= prefix.size() && text.substr(0, prefix.size()) == prefix;
}

// Accepts plain decimal notation only. strtod alone would also take "nan",
// "inf", hex floats and leading blanks, none of which ping ever prints.
std::optional<double> ParseDecimal(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  bool has_digits = false;
  bool has_dot = false;
  for (const char c : text) {
    if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
      has_digits = true;
      continue;
    }
    if (c == '.' && !has_dot) {
      has_dot = true;
      continue;
    }
    return std::nullopt;
  }
  if (!has_digits) {
    return std::nullopt;
  }

  const std::string value_text(text);
  char* parse_end = nullptr;
  const double parsed = std::strtod(value_text.c_str(), &parse_end);
  if (parse_end == nullptr || *parse_end != '\0') {
    return std::nullopt;
  }
  if (!std::isfinite(parsed)) {
    return std::nullopt;
  }

  return parsed;
}

std::optional<std::uint16_t> ParseSequenceValue(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  std::uint32_t parsed = 0;
  const char* begin = text.data();
  const char* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  if (parsed >= kSequenceModulus) {
    return std::nullopt;
  }

  return static_cast<std::uint16_t>(parsed);
}

} // namespace

std::string_view TrimTrailing(std::string_view line) {
  std::size_t end = line.size();
  while (end > 0U && std::isspace(static_cast<unsigned char>(line[end - 1])) != 0) {
    --end;
  }
  return line.substr(0, end);
}

std::vector<std::string_view> SplitOnSpace(std::string_view line) {
  std::vector<std::string_view> tokens;
  std::size_t start = 0;
  while (true) {
    const std::size_t space = line.find(' ', start);
    if (space == std::string_view::npos) {
      tokens.push_back(line.substr(start));
      break;
    }
    tokens.push_back(line.substr(start, space - start));
    start = space + 1;
  }
  return tokens;
}

std::optional<double> ParseBracketedTimestamp(std::string_view token) {
  if (token.size() < 3U || token.front() != '[') {
    return std::nullopt;
  }

  std::string_view inner = token.substr(1);
  if (!inner.empty() && inner.back() == ':') {
    inner.remove_suffix(1);
  }
  if (inner.empty() || inner.back() != ']') {
    return std::nullopt;
  }
  inner.remove_suffix(1);

  return ParseDecimal(inner);
}

std::optional<std::uint16_t> ParseSequenceNumber(const std::vector<std::string_view>& tokens) {
  for (const auto token : tokens) {
    if (StartsWith(token, kSequencePrefix)) {
      return ParseSequenceValue(token.substr(kSequencePrefix.size()));
    }
    if (StartsWith(token, kLegacySequencePrefix)) {
      return ParseSequenceValue(token.substr(kLegacySequencePrefix.size()));
    }
  }
  return std::nullopt;
}

std::optional<double> ParseRoundTripMs(const std::vector<std::string_view>& tokens) {
  for (const auto token : tokens) {
    if (StartsWith(token, kRoundTripPrefix)) {
      return ParseDecimal(token.substr(kRoundTripPrefix.size()));
    }
  }
  return std::nullopt;
}

bool IsBannerLine(const std::vector<std::string_view>& tokens) {
  return !tokens.empty() && tokens.front() == kBannerToken;
}

bool IsStatisticsTrailer(const std::vector<std::string_view>& tokens) {
  return !tokens.empty() && tokens.front() == kTrailerToken;
}

bool LooksLikeUnprefixedReply(const std::vector<std::string_view>& tokens) {
  if (tokens.size() != kUnprefixedReplyTokenCount) {
    return false;
  }
  return !ParseBracketedTimestamp(tokens.front()).has_value();
}

std::optional<std::string> ParseBannerTarget(std::string_view line) {
  const auto tokens = SplitOnSpace(TrimTrailing(line));
  if (!IsBannerLine(tokens) || tokens.size() < 2U || tokens[1].empty()) {
    return std::nullopt;
  }
  return std::string(tokens[1]);
}

std::optional<ProbeRecord> ParseProbeRecord(std::string_view line) {
  const std::string_view trimmed = TrimTrailing(line);
  return ParseProbeRecord(trimmed, SplitOnSpace(trimmed));
}

std::optional<ProbeRecord> ParseProbeRecord(std::string_view trimmed_line,
                                            const std::vector<std::string_view>& tokens) {
  if (tokens.empty()) {
    return std::nullopt;
  }

  const auto timestamp = ParseBracketedTimestamp(tokens.front());
  if (!timestamp.has_value()) {
    return std::nullopt;
  }

  // Skip the timestamp so a malformed prefix can never masquerade as a field.
  const std::vector<std::string_view> fields(tokens.begin() + 1, tokens.end());

  ProbeRecord record;
  record.timestamp = *timestamp;
  record.sequence_number = ParseSequenceNumber(fields);
  record.round_trip_ms = ParseRoundTripMs(fields);
  record.token_count = tokens.size();
  record.has_suffix = tokens.size() > kCanonicalReplyTokenCount;
  record.raw_text = std::string(trimmed_line);
  return record;
}

std::uint32_t SequenceDistance(std::uint16_t from, std::uint16_t to) {
  return (static_cast<std::uint32_t>(to) + kSequenceModulus - static_cast<std::uint32_t>(from)) %
         kSequenceModulus;
}

} // namespace pingwatch::probe
