#pragma once

#include "taskq/core/constants.hpp"
#include "taskq/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>

namespace taskq {

struct LockOwner {
  std::int64_t pid{0};
  std::int64_t acquired_at_ms{0};
};

// Advisory exclusive lock keyed by a file path, built on flock(2). Locks are
// attached to the open file description, so two InterprocessLock objects
// contend even inside one process. The lock file carries "<pid>:<millis>"
// while held and is deleted on release.
class InterprocessLock {
public:
  explicit InterprocessLock(
      std::filesystem::path path,
      std::chrono::milliseconds poll_interval = timing::kLockPollInterval);
  ~InterprocessLock();

  InterprocessLock(const InterprocessLock &) = delete;
  auto operator=(const InterprocessLock &) -> InterprocessLock & = delete;
  InterprocessLock(InterprocessLock &&other) noexcept;
  auto operator=(InterprocessLock &&other) noexcept -> InterprocessLock &;

  // Polls every poll_interval until `timeout` elapses. A zero timeout makes
  // exactly one attempt. Error::LockTimeout on contention.
  [[nodiscard]] auto acquire(std::chrono::milliseconds timeout)
      -> Result<void>;

  // Idempotent.
  auto release() noexcept -> void;

  // True when another holder has the lock. Probes by acquiring and releasing.
  [[nodiscard]] auto is_held() -> bool;

  [[nodiscard]] auto owns() const noexcept -> bool { return fd_ >= 0; }
  [[nodiscard]] auto path() const noexcept -> const std::filesystem::path & {
    return path_;
  }

  [[nodiscard]] static auto read_owner(const std::filesystem::path &path)
      -> Result<LockOwner>;

private:
  [[nodiscard]] auto try_lock_once() -> Result<bool>;
  auto write_owner_record() -> Result<void>;

  std::filesystem::path path_;
  std::chrono::milliseconds poll_interval_;
  int fd_{-1};
};

// Scope guard around an acquired lock.
class LockGuard {
public:
  explicit LockGuard(InterprocessLock &lock) noexcept : lock_(&lock) {}
  ~LockGuard() {
    if (lock_ != nullptr) {
      lock_->release();
    }
  }
  LockGuard(const LockGuard &) = delete;
  auto operator=(const LockGuard &) -> LockGuard & = delete;

private:
  InterprocessLock *lock_;
};

} // namespace taskq
