#include "taskq/storage/atomic_store.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace taskq {
namespace {

auto sync_directory(const std::filesystem::path &dir) -> void {
  const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) {
    return;
  }
  if (::fsync(fd) != 0) {
    log::debug("fsync of directory {} failed: {}", dir.string(),
               errno_code().message());
  }
  ::close(fd);
}

} // namespace

auto StateSink::write(std::string_view chunk) -> Result<void> {
  while (!chunk.empty()) {
    const auto n = ::write(fd_, chunk.data(), chunk.size());
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return fail(errno_code());
    }
    chunk.remove_prefix(static_cast<std::size_t>(n));
    written_ += static_cast<std::size_t>(n);
  }
  return ok();
}

auto AtomicStateStore::write_with(const std::filesystem::path &path,
                                  Producer producer) -> Result<void> {
  if (path.empty() || !path.has_filename()) {
    return fail(Error::InvalidArgument);
  }
  auto dir = path.parent_path();
  if (dir.empty()) {
    dir = ".";
  }
  std::error_code mk_ec;
  std::filesystem::create_directories(dir, mk_ec);
  if (mk_ec) {
    return fail(mk_ec);
  }

  const auto pattern = (dir / ("." + path.filename().string() + ".XXXXXX.tmp"))
                           .string();
  std::vector<char> tmp_name(pattern.begin(), pattern.end());
  tmp_name.push_back('\0');

  auto fd = sys_check(::mkstemps(tmp_name.data(), 4));
  if (!fd) {
    return fail(fd.error());
  }
  const std::filesystem::path tmp_path{tmp_name.data()};

  auto discard = [&](std::error_code ec) -> Result<void> {
    ::close(*fd);
    std::error_code rm_ec;
    std::filesystem::remove(tmp_path, rm_ec);
    return fail(ec);
  };

  StateSink sink{*fd};
  if (auto r = producer(sink); !r) {
    return discard(r.error());
  }
  if (::fchmod(*fd, 0644) != 0) {
    return discard(errno_code());
  }
  if (::fsync(*fd) != 0) {
    return discard(errno_code());
  }
  if (::close(*fd) != 0) {
    const auto ec = errno_code();
    std::error_code rm_ec;
    std::filesystem::remove(tmp_path, rm_ec);
    return fail(ec);
  }
  if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
    const auto ec = errno_code();
    std::error_code rm_ec;
    std::filesystem::remove(tmp_path, rm_ec);
    return fail(ec);
  }
  sync_directory(dir);
  return ok();
}

auto AtomicStateStore::write_text(const std::filesystem::path &path,
                                  std::string_view content) -> Result<void> {
  return write_with(path, [content](StateSink &sink) {
    return sink.write(content);
  });
}

auto AtomicStateStore::read_text(const std::filesystem::path &path)
    -> Result<std::string> {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return fail(Error::FileNotFound);
  }
  // ifstream happily opens a directory and reads nothing from it.
  if (std::filesystem::is_directory(path, ec)) {
    return fail(Error::FileOpenFailed);
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return fail(Error::FileOpenFailed);
  }
  std::string text((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());
  if (in.bad()) {
    return fail(Error::FileOpenFailed);
  }
  return ok(std::move(text));
}

} // namespace taskq
