#include "taskq/storage/file_lock.hpp"

#include "taskq/util/log.hpp"
#include "taskq/util/process.hpp"
#include "taskq/util/time.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <charconv>
#include <format>
#include <fstream>
#include <string>
#include <thread>
#include <utility>

namespace taskq {

InterprocessLock::InterprocessLock(std::filesystem::path path,
                                   std::chrono::milliseconds poll_interval)
    : path_(std::move(path)), poll_interval_(poll_interval) {}

InterprocessLock::~InterprocessLock() { release(); }

InterprocessLock::InterprocessLock(InterprocessLock &&other) noexcept
    : path_(std::move(other.path_)), poll_interval_(other.poll_interval_),
      fd_(std::exchange(other.fd_, -1)) {}

auto InterprocessLock::operator=(InterprocessLock &&other) noexcept
    -> InterprocessLock & {
  if (this == &other) {
    return *this;
  }
  release();
  path_ = std::move(other.path_);
  poll_interval_ = other.poll_interval_;
  fd_ = std::exchange(other.fd_, -1);
  return *this;
}

auto InterprocessLock::try_lock_once() -> Result<bool> {
  const int fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    return fail(errno_code());
  }
  if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
    const int err = errno;
    ::close(fd);
    if (err == EWOULDBLOCK || err == EINTR) {
      return ok(false);
    }
    return fail(std::error_code(err, std::system_category()));
  }

  // A previous holder may have unlinked the file between our open() and
  // flock(); holding a lock on an orphaned inode excludes nobody.
  struct stat fd_stat{};
  struct stat path_stat{};
  if (::fstat(fd, &fd_stat) != 0 || ::stat(path_.c_str(), &path_stat) != 0 ||
      fd_stat.st_ino != path_stat.st_ino || fd_stat.st_dev != path_stat.st_dev) {
    ::close(fd);
    return ok(false);
  }
  fd_ = fd;
  return ok(true);
}

auto InterprocessLock::write_owner_record() -> Result<void> {
  const auto record = std::format(
      "{}:{}\n", current_pid(), util::to_unix_millis(util::Clock::now()));
  if (::ftruncate(fd_, 0) != 0) {
    return fail(errno_code());
  }
  if (::pwrite(fd_, record.data(), record.size(), 0) < 0) {
    return fail(errno_code());
  }
  return ok();
}

auto InterprocessLock::acquire(std::chrono::milliseconds timeout)
    -> Result<void> {
  if (owns()) {
    return ok();
  }
  if (auto parent = path_.parent_path(); !parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return fail(ec);
    }
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  for (;;) {
    auto locked = try_lock_once();
    if (!locked) {
      log::warn("Lock {} unavailable: {}", path_.string(),
                locked.error().message());
      return fail(locked.error());
    }
    if (*locked) {
      if (auto r = write_owner_record(); !r) {
        log::warn("Cannot record owner in {}: {}", path_.string(),
                  r.error().message());
      }
      return ok();
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return fail(Error::LockTimeout);
    }
    std::this_thread::sleep_for(poll_interval_);
  }
}

auto InterprocessLock::release() noexcept -> void {
  if (fd_ < 0) {
    return;
  }
  // Unlink while still holding the lock so a waiter that wins flock() next
  // sees the inode mismatch and retries against a fresh file.
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  ::flock(fd_, LOCK_UN);
  ::close(fd_);
  fd_ = -1;
}

auto InterprocessLock::is_held() -> bool {
  if (owns()) {
    return true;
  }
  auto acquired = acquire(std::chrono::milliseconds{0});
  if (acquired) {
    release();
    return false;
  }
  return acquired.error() == make_error_code(Error::LockTimeout);
}

auto InterprocessLock::read_owner(const std::filesystem::path &path)
    -> Result<LockOwner> {
  std::ifstream in(path);
  if (!in) {
    return fail(Error::FileNotFound);
  }
  std::string line;
  std::getline(in, line);
  const auto colon = line.find(':');
  if (colon == std::string::npos) {
    return fail(Error::ParseError);
  }
  LockOwner owner;
  const auto *first = line.data();
  auto [p1, e1] = std::from_chars(first, first + colon, owner.pid);
  auto [p2, e2] = std::from_chars(first + colon + 1, first + line.size(),
                                  owner.acquired_at_ms);
  if (e1 != std::errc{} || e2 != std::errc{} || p1 != first + colon) {
    return fail(Error::ParseError);
  }
  return ok(owner);
}

} // namespace taskq
