#include "taskq/util/log.hpp"

#include <algorithm>
#include <optional>
#include <vector>

namespace taskq::log {

auto parse_level(std::string_view name) noexcept -> Level {
  const auto *it = std::ranges::find(level_names, name);
  if (it == level_names.end()) {
    return Level::Info;
  }
  return static_cast<Level>(std::distance(level_names.begin(), it));
}

auto logger() -> Logger & {
  static Logger instance;
  return instance;
}

Logger::~Logger() {
  stop();
  if (file_ != nullptr) {
    std::fclose(file_);
  }
}

auto Logger::start() -> void {
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  channel_ctx_.restart();
  auto channel =
      std::make_shared<LogChannel>(channel_ctx_.get_executor(), kQueueCapacity);
  channel_.store(channel, std::memory_order_release);
  writer_ = std::jthread(
      [this, channel = std::move(channel)] { writer_loop(channel); });
}

auto Logger::stop() -> void {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  if (auto channel = channel_.exchange(nullptr, std::memory_order_acq_rel)) {
    channel->close();
  }
  channel_ctx_.stop();
  if (writer_.joinable()) {
    writer_.join();
  }
}

auto Logger::set_output_stderr() -> void {
  std::scoped_lock lock(output_mutex_);
  output_ = stderr;
}

auto Logger::set_output_file(std::string_view path) -> bool {
  std::scoped_lock lock(output_mutex_);
  if (path.empty()) {
    output_ = stdout;
    if (file_ != nullptr) {
      std::fclose(file_);
      file_ = nullptr;
    }
    return true;
  }
  std::FILE *f = std::fopen(std::string(path).c_str(), "a");
  if (f == nullptr) {
    return false;
  }
  std::setvbuf(f, nullptr, _IOLBF, 0);
  if (file_ != nullptr) {
    std::fclose(file_);
  }
  file_ = f;
  output_ = f;
  return true;
}

auto Logger::submit(std::string line) -> void {
  auto channel = channel_.load(std::memory_order_acquire);
  if (!channel) {
    write_direct(line);
    return;
  }
  std::string pending = line;
  if (!channel->try_send(boost::system::error_code{}, std::move(line))) {
    write_direct(pending);
  }
}

auto Logger::write_direct(std::string_view line) -> void {
  std::scoped_lock lock(output_mutex_);
  std::fwrite(line.data(), 1, line.size(), output_);
  std::fflush(output_);
}

auto Logger::writer_loop(std::shared_ptr<LogChannel> channel) -> void {
  std::vector<std::string> batch;
  batch.reserve(kBatchSize);

  auto flush_batch = [&] {
    if (batch.empty()) {
      return;
    }
    std::scoped_lock lock(output_mutex_);
    for (const auto &line : batch) {
      std::fwrite(line.data(), 1, line.size(), output_);
    }
    std::fflush(output_);
    batch.clear();
  };

  auto drain = [&] {
    while (batch.size() < kBatchSize) {
      std::optional<std::string> line;
      if (!channel->try_receive(
              [&](const boost::system::error_code &ec, std::string item) {
                if (!ec) {
                  line = std::move(item);
                }
              })) {
        break;
      }
      if (line) {
        batch.push_back(std::move(*line));
      }
    }
  };

  while (running_.load(std::memory_order_acquire)) {
    boost::system::error_code recv_ec;
    channel->async_receive(
        [&](const boost::system::error_code &ec, std::string item) {
          recv_ec = ec;
          if (!ec) {
            batch.push_back(std::move(item));
          }
        });
    channel_ctx_.restart();
    (void)channel_ctx_.run_one();
    if (recv_ec) {
      break;
    }
    drain();
    flush_batch();
  }

  // Anything still buffered after close is written before the thread exits.
  for (;;) {
    const auto before = batch.size();
    drain();
    if (batch.size() == before) {
      break;
    }
    flush_batch();
  }
  flush_batch();
}

} // namespace taskq::log
