#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace taskq::util {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// UTC with millisecond precision, e.g. 2025-01-31T12:00:00.123Z
[[nodiscard]] inline auto format_iso8601(TimePoint tp) -> std::string {
  if (tp == TimePoint{})
    return {};
  auto const ms_tp = std::chrono::floor<std::chrono::milliseconds>(tp);
  return std::format("{:%Y-%m-%dT%H:%M:%S}Z", ms_tp);
}

[[nodiscard]] inline auto format_timestamp() -> std::string {
  return format_iso8601(Clock::now());
}

// Accepts the output of format_iso8601 and plain second-precision forms.
[[nodiscard]] inline auto parse_iso8601(std::string_view text)
    -> std::optional<TimePoint> {
  if (text.empty()) {
    return std::nullopt;
  }
  std::istringstream in{std::string(text)};
  std::chrono::sys_time<std::chrono::milliseconds> tp;
  in >> std::chrono::parse("%Y-%m-%dT%H:%M:%S", tp);
  if (in.fail()) {
    return std::nullopt;
  }
  return TimePoint{tp};
}

[[nodiscard]] inline auto format_local_timestamp(TimePoint tp) -> std::string {
  if (tp == TimePoint{}) {
    return "-";
  }
  return std::format("{:%Y-%m-%d %H:%M:%S}",
                     std::chrono::floor<std::chrono::seconds>(tp));
}

[[nodiscard]] inline auto to_unix_millis(TimePoint tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

} // namespace taskq::util
