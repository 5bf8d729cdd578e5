#pragma once

#include "core/cancellation.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace tracr::core {

struct ProcessResult {
  int exit_code = -1;
  std::string stdout_text;
  std::string stderr_text;
  // `cancel` fired while the child was running and its process group was
  // killed.
  bool interrupted = false;
};

// Runs `command` through `/bin/sh -c` in its own process group and captures
// stdout and stderr separately (stderr is staged in a temp file).
//
// Contract:
// - Returns false only when the process could not be spawned; `error` is set.
// - Otherwise returns true with `result.exit_code` holding the shell status
//   (128 + signal for signalled children).
// - When `cancel` fires the group gets SIGTERM, then SIGKILL after
//   `kInterruptGrace`; the call returns once the child is reaped.
bool RunShellCommand(const std::string& command, ProcessResult& result, std::string& error,
                     const CancellationToken* cancel = nullptr);

constexpr std::chrono::milliseconds kInterruptGrace{2000};

// Wraps `text` in single quotes for /bin/sh, escaping embedded quotes.
std::string ShellQuote(std::string_view text);

// Quotes a remote path while leaving a leading `~/` unquoted so the remote
// shell still expands it to the login user's home.
std::string ShellQuotePath(std::string_view path);

// Prefixes `command` with coreutils `timeout` so the child is killed after
// `deadline`. `timeout` exits 124 on expiry. The child stays in the caller's
// process group.
std::string WithDeadline(const std::string& command, std::chrono::milliseconds deadline);

constexpr int kDeadlineExpiredExitCode = 124;

} // namespace tracr::core
