#include "core/process.hpp"

#include "core/fs_utils.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace tracr::core {

namespace {

constexpr int kPollSliceMs = 50;

int DecodeWaitStatus(const int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return status;
}

} // namespace

bool RunShellCommand(const std::string& command, ProcessResult& result, std::string& error,
                     const CancellationToken* cancel) {
  result = ProcessResult{};
  error.clear();

  std::error_code ec;
  const fs::path stderr_path = detail::BuildAtomicTempPath(fs::temp_directory_path(ec) /
                                                           "tracr-stderr");
  if (ec) {
    error = "unable to resolve temp directory: " + ec.message();
    return false;
  }
  const std::string stderr_file = stderr_path.string();

  int out_pipe[2] = {-1, -1};
  if (pipe(out_pipe) != 0) {
    error = "failed to create stdout pipe: " + std::string(std::strerror(errno));
    return false;
  }

  const pid_t pid = fork();
  if (pid < 0) {
    error = "failed to execute command: " + command + ": " + std::strerror(errno);
    close(out_pipe[0]);
    close(out_pipe[1]);
    return false;
  }
  if (pid == 0) {
    // Child: only async-signal-safe calls until exec.
    setpgid(0, 0);
    const int err_fd = open(stderr_file.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
    const int null_fd = open("/dev/null", O_RDONLY);
    if (err_fd < 0 || null_fd < 0) {
      _exit(127);
    }
    dup2(null_fd, STDIN_FILENO);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_fd, STDERR_FILENO);
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_fd);
    close(null_fd);
    execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
    _exit(127);
  }

  // Both sides call setpgid so the group exists before any kill below.
  setpgid(pid, pid);
  close(out_pipe[1]);

  using Clock = std::chrono::steady_clock;
  Clock::time_point kill_at{};
  bool killed = false;
  char buffer[4096];
  while (true) {
    pollfd readable{out_pipe[0], POLLIN, 0};
    const int ready = poll(&readable, 1, kPollSliceMs);
    if (ready < 0 && errno != EINTR) {
      break;
    }
    if (ready > 0) {
      const ssize_t n = read(out_pipe[0], buffer, sizeof(buffer));
      if (n > 0) {
        result.stdout_text.append(buffer, static_cast<std::size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        break;
      }
    }
    if (cancel != nullptr && cancel->IsCancelled() && !result.interrupted) {
      result.interrupted = true;
      kill(-pid, SIGTERM);
      kill_at = Clock::now() + kInterruptGrace;
    }
    if (result.interrupted && !killed && Clock::now() >= kill_at) {
      killed = true;
      kill(-pid, SIGKILL);
    }
  }
  close(out_pipe[0]);

  int status = 0;
  pid_t reaped = -1;
  do {
    reaped = waitpid(pid, &status, 0);
  } while (reaped < 0 && errno == EINTR);
  result.exit_code = reaped == pid ? DecodeWaitStatus(status) : -1;

  std::string read_error;
  if (!ReadTextFile(stderr_path, result.stderr_text, read_error)) {
    result.stderr_text.clear();
  }
  std::error_code remove_ec;
  (void)fs::remove(stderr_path, remove_ec);
  return true;
}

std::string ShellQuote(std::string_view text) {
  std::string quoted = "'";
  for (const char c : text) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

std::string ShellQuotePath(std::string_view path) {
  if (path.size() > 2U && path.substr(0, 2) == "~/") {
    return "~/" + ShellQuote(path.substr(2));
  }
  if (path == "~") {
    return "~";
  }
  return ShellQuote(path);
}

std::string WithDeadline(const std::string& command, std::chrono::milliseconds deadline) {
  const auto millis = deadline.count() > 0 ? deadline.count() : 1;
  // `timeout` accepts fractional seconds; keep millisecond resolution.
  const std::string seconds = std::to_string(millis / 1000) + "." +
                              std::to_string(1000 + millis % 1000).substr(1);
  // --foreground keeps the child in the caller's process group so an
  // interrupt reaches it.
  return "timeout --foreground --kill-after=5 " + seconds + " " + command;
}

} // namespace tracr::core
