#pragma once

#include "taskq/core/error.hpp"
#include "taskq/util/json.hpp"
#include "taskq/util/log.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

namespace taskq {

// Output handle for a document being written to a temporary file.
class StateSink {
public:
  explicit StateSink(int fd) noexcept : fd_(fd) {}

  [[nodiscard]] auto write(std::string_view chunk) -> Result<void>;
  [[nodiscard]] auto bytes_written() const noexcept -> std::size_t {
    return written_;
  }

private:
  int fd_;
  std::size_t written_{0};
};

// Crash-consistent replacement of a single file: the new content is written
// to a sibling ".<name>.XXXXXX.tmp", fsynced, then renamed over the target.
// A failure at any step removes the temporary and leaves the target as it was.
class AtomicStateStore {
public:
  using Producer = std::move_only_function<Result<void>(StateSink &)>;

  [[nodiscard]] static auto write_with(const std::filesystem::path &path,
                                       Producer producer) -> Result<void>;

  [[nodiscard]] static auto write_text(const std::filesystem::path &path,
                                       std::string_view content)
      -> Result<void>;

  template <typename T>
  [[nodiscard]] static auto write(const std::filesystem::path &path,
                                  const T &document) -> Result<void> {
    return write_document(document).and_then(
        [&](const std::string &text) { return write_text(path, text); });
  }

  // FileNotFound when absent; other I/O failures as system errors.
  [[nodiscard]] static auto read_text(const std::filesystem::path &path)
      -> Result<std::string>;

  // Never fails: a missing or unparsable file yields `fallback`.
  template <typename T>
  [[nodiscard]] static auto read(const std::filesystem::path &path,
                                 T fallback) -> T {
    auto text = read_text(path);
    if (!text) {
      if (text.error() != make_error_code(Error::FileNotFound)) {
        log::warn("Cannot read {}: {}", path.string(), text.error().message());
      }
      return fallback;
    }
    std::string diagnostic;
    auto doc = read_document<T>(*text, &diagnostic);
    if (!doc) {
      log::warn("Ignoring malformed document {}: {}", path.string(),
                diagnostic);
      return fallback;
    }
    return std::move(*doc);
  }
};

} // namespace taskq
