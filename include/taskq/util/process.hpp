#pragma once

#include <cstdint>
#include <string>

namespace taskq {

// Identity recorded against a running task so another process can decide
// whether the owner is still around.
struct ProcessOwner {
  std::int64_t pid{0};
  std::string host;

  auto operator==(const ProcessOwner &) const -> bool = default;
};

[[nodiscard]] auto current_pid() noexcept -> std::int64_t;
[[nodiscard]] auto local_hostname() -> const std::string &;
[[nodiscard]] auto current_owner() -> ProcessOwner;

// A no-op signal probe: true if the pid exists, including when we lack
// permission to signal it.
[[nodiscard]] auto is_process_alive(std::int64_t pid) noexcept -> bool;

// Owners on another host cannot be probed and are assumed alive.
[[nodiscard]] auto is_owner_alive(const ProcessOwner &owner) -> bool;

} // namespace taskq
