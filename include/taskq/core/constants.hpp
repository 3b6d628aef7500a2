#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

namespace taskq {

inline constexpr std::string_view kStateVersion = "2.0";
inline constexpr std::string_view kLegacyStateVersion = "1.0";
inline constexpr std::string_view kMigratedSourcePath = "<migrated>";

namespace io {
constexpr std::size_t kEventBufferSize = 4096;
constexpr std::size_t kReadBufferSize = 4096;
constexpr std::size_t kFingerprintChunkSize = 4096;
constexpr std::size_t kMaxResultOutput = 64 * 1024;
} // namespace io

namespace timing {
constexpr auto kLockPollInterval = std::chrono::milliseconds(100);
constexpr auto kStateLockTimeout = std::chrono::milliseconds(500);
constexpr auto kDebounceWindow = std::chrono::milliseconds(500);
constexpr auto kDebounceMaxAge = std::chrono::seconds(60);
constexpr auto kWorkerKeepalive = std::chrono::seconds(60);
constexpr auto kWorkerRetryDelay = std::chrono::seconds(10);
constexpr auto kWorkerCyclePause = std::chrono::milliseconds(100);
constexpr auto kDaemonPollInterval = std::chrono::milliseconds(100);
constexpr auto kWatcherStopTimeout = std::chrono::seconds(1);
// State-lock attempts left for recording an outcome once stop is requested.
constexpr int kStopRecordAttempts = 3;
} // namespace timing

} // namespace taskq
