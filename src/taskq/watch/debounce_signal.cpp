#include "taskq/watch/debounce_signal.hpp"

namespace taskq {

DebounceSignal::DebounceSignal(std::chrono::milliseconds window)
    : window_(window) {}

auto DebounceSignal::notify(std::string_view path) -> bool {
  return notify(path, Clock::now());
}

auto DebounceSignal::notify(std::string_view path, Clock::time_point now)
    -> bool {
  std::scoped_lock lock(mutex_);
  auto it = last_accepted_.find(path);
  if (it != last_accepted_.end() && now - it->second < window_) {
    return false;
  }
  last_accepted_.insert_or_assign(std::string{path}, now);
  return true;
}

auto DebounceSignal::cleanup(std::chrono::milliseconds max_age)
    -> std::size_t {
  return cleanup(max_age, Clock::now());
}

auto DebounceSignal::cleanup(std::chrono::milliseconds max_age,
                             Clock::time_point now) -> std::size_t {
  std::scoped_lock lock(mutex_);
  return erase_if(last_accepted_, [&](const auto &entry) {
    return now - entry.second > max_age;
  });
}

auto DebounceSignal::raise() -> void {
  {
    std::scoped_lock lock(mutex_);
    raised_ = true;
  }
  cv_.notify_all();
}

auto DebounceSignal::wait_for(std::chrono::milliseconds timeout) -> bool {
  std::unique_lock lock(mutex_);
  const bool woken =
      cv_.wait_for(lock, timeout, [this] { return raised_ || closed_; });
  raised_ = false;
  return woken;
}

auto DebounceSignal::close() -> void {
  {
    std::scoped_lock lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

auto DebounceSignal::closed() const -> bool {
  std::scoped_lock lock(mutex_);
  return closed_;
}

auto DebounceSignal::tracked_paths() const -> std::size_t {
  std::scoped_lock lock(mutex_);
  return last_accepted_.size();
}

} // namespace taskq
