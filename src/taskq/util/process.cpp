#include "taskq/util/process.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <unistd.h>

namespace taskq {

auto current_pid() noexcept -> std::int64_t {
  return static_cast<std::int64_t>(::getpid());
}

auto local_hostname() -> const std::string & {
  static const std::string host = [] {
    std::array<char, 256> buf{};
    if (::gethostname(buf.data(), buf.size() - 1) != 0) {
      return std::string{"localhost"};
    }
    return std::string{buf.data()};
  }();
  return host;
}

auto current_owner() -> ProcessOwner {
  return ProcessOwner{.pid = current_pid(), .host = local_hostname()};
}

auto is_process_alive(std::int64_t pid) noexcept -> bool {
  if (pid <= 0) {
    return false;
  }
  if (::kill(static_cast<pid_t>(pid), 0) == 0) {
    return true;
  }
  return errno == EPERM;
}

auto is_owner_alive(const ProcessOwner &owner) -> bool {
  if (!owner.host.empty() && owner.host != local_hostname()) {
    return true;
  }
  return is_process_alive(owner.pid);
}

} // namespace taskq
