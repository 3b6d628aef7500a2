#include "taskq/util/daemon.hpp"

#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <format>
#include <string>
#include <string_view>

using namespace taskq;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

// Runs in the daemonized grandchild: only raw syscalls, then _exit.
[[noreturn]] void report_and_exit(const fs::path &report) {
  struct stat fd_stat{};
  struct stat null_stat{};
  const bool stdio_null = ::fstat(STDOUT_FILENO, &fd_stat) == 0 &&
                          ::stat("/dev/null", &null_stat) == 0 &&
                          fd_stat.st_rdev == null_stat.st_rdev;
  char cwd[64]{};
  const bool at_root = ::getcwd(cwd, sizeof(cwd)) != nullptr &&
                       std::string_view{cwd} == "/";
  const bool session_leader = ::getsid(0) == ::getpid();

  const auto line = std::format("{} {} {} {}\n", ::getpid(), stdio_null,
                                at_root, session_leader);
  const fs::path tmp{report.string() + ".tmp"};
  const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (fd >= 0) {
    (void)::write(fd, line.data(), line.size());
    (void)::close(fd);
    (void)::rename(tmp.c_str(), report.c_str());
  }
  ::_exit(0);
}

} // namespace

class DaemonTest : public ::testing::Test {
protected:
  void SetUp() override { dir_ = test::make_temp_dir("taskq_daemon_util"); }
  void TearDown() override { fs::remove_all(dir_); }

  fs::path dir_;
};

TEST_F(DaemonTest, DaemonizeDetachesWithNullStdio) {
  const auto report = dir_ / "report";
  const pid_t child = ::fork();
  ASSERT_GE(child, 0);
  if (child == 0) {
    if (daemonize()) {
      report_and_exit(report);
    }
    ::_exit(1);
  }

  // The first fork's parent exits as soon as it has forked again.
  int status = 0;
  ASSERT_EQ(::waitpid(child, &status, 0), child);
  EXPECT_TRUE(WIFEXITED(status));
  EXPECT_EQ(WEXITSTATUS(status), 0);

  ASSERT_TRUE(test::poll_until([&] { return fs::exists(report); }, 5s));
  const auto line = test::read_file(report);
  // "<pid> <stdio is /dev/null> <cwd is /> <session leader>"
  const auto first_space = line.find(' ');
  ASSERT_NE(first_space, std::string::npos);
  EXPECT_NE(line.substr(0, first_space), std::to_string(child));
  EXPECT_EQ(line.substr(first_space + 1), "true true false\n");
}

TEST_F(DaemonTest, PidFileRoundTrip) {
  const auto path = dir_ / "taskq.pid";
  EXPECT_EQ(read_pid_file(path.string()).error(),
            make_error_code(Error::FileNotFound));

  test::write_file(path, std::format("{}:1700000000000\n", ::getpid()));
  auto pid = read_pid_file(path.string());
  ASSERT_TRUE(pid.has_value());
  EXPECT_EQ(*pid, ::getpid());

  test::write_file(path, "not-a-pid\n");
  EXPECT_EQ(read_pid_file(path.string()).error(),
            make_error_code(Error::ParseError));

  ASSERT_TRUE(remove_pid_file(path.string()).has_value());
  EXPECT_FALSE(fs::exists(path));
}
