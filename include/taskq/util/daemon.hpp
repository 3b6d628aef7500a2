#pragma once

#include "taskq/core/error.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string_view>

namespace taskq {

extern std::atomic<bool> g_shutdown_requested;

[[nodiscard]] auto daemonize() -> Result<void>;
[[nodiscard]] auto read_pid_file(std::string_view path) -> Result<std::int64_t>;
[[nodiscard]] auto remove_pid_file(std::string_view path) -> Result<void>;
[[nodiscard]] auto send_signal(std::int64_t pid, int signal_no) -> Result<void>;
[[nodiscard]] auto wait_for_process_exit(std::int64_t pid,
                                         std::chrono::milliseconds timeout)
    -> bool;
void setup_signal_handlers();
void wait_for_shutdown();
void request_shutdown() noexcept;

} // namespace taskq
