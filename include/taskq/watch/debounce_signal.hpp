#pragma once

#include "taskq/core/constants.hpp"

#include <ankerl/unordered_dense.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace taskq {

// Per-source wake-up signal. notify() collapses bursts of change events for
// the same path; raise()/wait_for() hand the surviving event to the source's
// worker.
class DebounceSignal {
public:
  using Clock = std::chrono::steady_clock;

  explicit DebounceSignal(
      std::chrono::milliseconds window = timing::kDebounceWindow);

  DebounceSignal(const DebounceSignal &) = delete;
  auto operator=(const DebounceSignal &) -> DebounceSignal & = delete;

  // False when `path` was accepted less than one window ago.
  [[nodiscard]] auto notify(std::string_view path) -> bool;
  [[nodiscard]] auto notify(std::string_view path, Clock::time_point now)
      -> bool;

  // Drops entries older than max_age; returns how many were removed.
  auto cleanup(std::chrono::milliseconds max_age = timing::kDebounceMaxAge)
      -> std::size_t;
  auto cleanup(std::chrono::milliseconds max_age, Clock::time_point now)
      -> std::size_t;

  auto raise() -> void;

  // Blocks until raised, closed, or timed out. Consumes the raised flag.
  // Returns true when woken by raise() or close().
  [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout) -> bool;

  // Permanently wakes every waiter.
  auto close() -> void;
  [[nodiscard]] auto closed() const -> bool;

  [[nodiscard]] auto tracked_paths() const -> std::size_t;
  [[nodiscard]] auto window() const noexcept -> std::chrono::milliseconds {
    return window_;
  }

private:
  struct PathHash {
    using is_transparent = void;
    using is_avalanching = void;
    auto operator()(std::string_view s) const noexcept -> std::uint64_t {
      return ankerl::unordered_dense::hash<std::string_view>{}(s);
    }
  };

  std::chrono::milliseconds window_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  ankerl::unordered_dense::map<std::string, Clock::time_point, PathHash,
                               std::equal_to<>>
      last_accepted_;
  bool raised_{false};
  bool closed_{false};
};

} // namespace taskq
