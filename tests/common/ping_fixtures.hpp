#ifndef PINGWATCH_TESTS_COMMON_PING_FIXTURES_HPP_
#define PINGWATCH_TESTS_COMMON_PING_FIXTURES_HPP_

#include <cstdint>
#include <string>

namespace pingwatch::tests::common {

// 2020-08-11 17:20:38 UTC
constexpr double kBaseEpochSeconds = 1597166438.0;

inline std::string Stamp(double epoch_seconds) {
  return "[" + std::to_string(epoch_seconds) + "]";
}

// `ping -D` echo reply, optionally with a trailing annotation such as `(DUP!)`.
inline std::string ReplyLine(double epoch_seconds, std::uint32_t sequence, const std::string& rtt,
                             const std::string& suffix = "") {
  std::string line = Stamp(epoch_seconds) + " 64 bytes from 8.8.8.8: icmp_seq=" +
                     std::to_string(sequence) + " ttl=118 time=" + rtt + " ms";
  if (!suffix.empty()) {
    line += " " + suffix;
  }
  return line;
}

// Error reply from an intermediate hop; carries no round-trip time.
inline std::string FromLine(double epoch_seconds, std::uint32_t sequence,
                            const std::string& reason) {
  return Stamp(epoch_seconds) + " From 10.0.0.1 icmp_seq=" + std::to_string(sequence) + " " +
         reason;
}

} // namespace pingwatch::tests::common

#endif // PINGWATCH_TESTS_COMMON_PING_FIXTURES_HPP_
