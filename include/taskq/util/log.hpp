#pragma once

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace taskq::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

inline constexpr std::array<std::string_view, 5> level_names = {
    "trace", "debug", "info", "warn", "error"};

inline constexpr std::array<std::string_view, 5> level_colors = {
    "\o{33}[90m", "\o{33}[36m", "\o{33}[32m", "\o{33}[33m", "\o{33}[31m"};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto level_color(Level level) -> std::string_view {
  return level_colors.at(std::to_underlying(level));
}

[[nodiscard]] auto parse_level(std::string_view name) noexcept -> Level;

// Lines are formatted on the calling thread and handed to a writer thread
// through a bounded channel. A full channel falls back to a direct write.
class Logger {
public:
  Logger() = default;
  ~Logger();

  Logger(const Logger &) = delete;
  auto operator=(const Logger &) -> Logger & = delete;

  auto start() -> void;
  auto stop() -> void;

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }
  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto enabled(Level level) const noexcept -> bool {
    return level >= this->level();
  }

  auto set_output_stderr() -> void;
  [[nodiscard]] auto set_output_file(std::string_view path) -> bool;

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (!enabled(level)) {
      return;
    }
    auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    std::string line;
    line.reserve(128);
    std::format_to(std::back_inserter(line), "[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] ",
                   now, level_color(level), level_name(level), "\o{33}[0m",
                   tid);
    std::format_to(std::back_inserter(line), fmt, std::forward<Args>(args)...);
    line.push_back('\n');
    submit(std::move(line));
  }

private:
  static constexpr std::size_t kQueueCapacity = 4096;
  static constexpr std::size_t kBatchSize = 64;
  using LogChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

  auto submit(std::string line) -> void;
  auto write_direct(std::string_view line) -> void;
  auto writer_loop(std::shared_ptr<LogChannel> channel) -> void;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::mutex output_mutex_;
  std::FILE *output_{stdout};
  std::FILE *file_{nullptr};
  boost::asio::io_context channel_ctx_{1};
  std::atomic<std::shared_ptr<LogChannel>> channel_;
  std::jthread writer_;
};

auto logger() -> Logger &;

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}
inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}
inline auto set_output_stderr() -> void { logger().set_output_stderr(); }
[[nodiscard]] inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}
inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace taskq::log
