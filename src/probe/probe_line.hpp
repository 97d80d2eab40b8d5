#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pingwatch::probe {

// `[ts] 64 bytes from 8.8.8.8: icmp_seq=1 ttl=118 time=14.2 ms`
constexpr std::size_t kCanonicalReplyTokenCount = 9;
// Same reply without the `-D` timestamp prefix.
constexpr std::size_t kUnprefixedReplyTokenCount = 8;
// icmp_seq is a 16-bit field and wraps to 0 after 65535.
constexpr std::uint32_t kSequenceModulus = 65536;
// Larger forward distances are read as a step backwards (late or duplicate
// reply) rather than as loss.
constexpr std::uint32_t kMaxForwardSequenceStep = kSequenceModulus / 2;

// One data line of `ping -D` output. Only the timestamp is guaranteed;
// filtered/unreachable replies carry no round-trip time, and lines that do not
// come from ping at all may carry no sequence number either.
struct ProbeRecord {
  double timestamp = 0.0;
  std::optional<std::uint16_t> sequence_number;
  std::optional<double> round_trip_ms;
  // True when the line has more tokens than a plain reply, e.g. `(DUP!)`.
  bool has_suffix = false;
  std::size_t token_count = 0;
  std::string raw_text;
};

// Drops trailing newline, carriage return and blanks.
std::string_view TrimTrailing(std::string_view line);

// Splits on every single space. Consecutive spaces yield empty tokens so the
// token count matches what ping itself produced.
std::vector<std::string_view> SplitOnSpace(std::string_view line);

// `[1597166438.798339]` or `[1597166438.798339]:` -> seconds since epoch.
std::optional<double> ParseBracketedTimestamp(std::string_view token);

// Value of the first `icmp_seq=` (or legacy `icmp_req=`) token, if it is a
// decimal number in [0, 65535].
std::optional<std::uint16_t> ParseSequenceNumber(const std::vector<std::string_view>& tokens);

// Value of the first `time=` token in milliseconds, if finite and >= 0.
std::optional<double> ParseRoundTripMs(const std::vector<std::string_view>& tokens);

bool IsBannerLine(const std::vector<std::string_view>& tokens);

// First line of ping's exit summary: `--- 8.8.8.8 ping statistics ---`.
bool IsStatisticsTrailer(const std::vector<std::string_view>& tokens);

// A reply that has exactly the unprefixed shape and no bracketed timestamp in
// front, meaning ping was started without `-D`.
bool LooksLikeUnprefixedReply(const std::vector<std::string_view>& tokens);

// Host named by `PING <host> (<ip>) ...`; nullopt for any other line.
std::optional<std::string> ParseBannerTarget(std::string_view line);

// Parses one data line. Returns nullopt only when the timestamp prefix is
// missing or malformed; every other field is optional.
std::optional<ProbeRecord> ParseProbeRecord(std::string_view line);

// Same as above for callers that already trimmed and tokenized the line.
std::optional<ProbeRecord> ParseProbeRecord(std::string_view trimmed_line,
                                            const std::vector<std::string_view>& tokens);

// Forward distance from `from` to `to` in modulo-65536 arithmetic.
std::uint32_t SequenceDistance(std::uint16_t from, std::uint16_t to);

} // namespace pingwatch::probe
