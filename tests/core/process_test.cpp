#include "core/cancellation.hpp"
#include "core/process.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <csignal>
#include <string>
#include <thread>

TEST_CASE("RunShellCommand captures stdout, stderr and the exit status", "[core][process]") {
  tracr::core::ProcessResult result;
  std::string error;
  REQUIRE(tracr::core::RunShellCommand("printf 'out'; printf 'err' >&2; exit 3", result, error));
  REQUIRE(error.empty());
  REQUIRE(result.stdout_text == "out");
  REQUIRE(result.stderr_text == "err");
  REQUIRE(result.exit_code == 3);
  REQUIRE_FALSE(result.interrupted);
}

TEST_CASE("RunShellCommand kills the child's process group on cancellation",
          "[core][process]") {
  tracr::core::CancellationToken cancel;
  std::thread canceller([&cancel] {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    cancel.Cancel();
  });

  const auto started = std::chrono::steady_clock::now();
  tracr::core::ProcessResult result;
  std::string error;
  // The pipeline keeps a grandchild alive; both must go.
  const bool ran =
      tracr::core::RunShellCommand("sleep 30 | cat; echo finished", result, error, &cancel);
  const auto elapsed = std::chrono::steady_clock::now() - started;
  canceller.join();

  REQUIRE(ran);
  REQUIRE(result.interrupted);
  REQUIRE(result.exit_code == 128 + SIGTERM);
  REQUIRE(result.stdout_text.find("finished") == std::string::npos);
  REQUIRE(elapsed < std::chrono::seconds(10));
}

TEST_CASE("WithDeadline keeps the command in the caller's process group", "[core][process]") {
  const std::string wrapped =
      tracr::core::WithDeadline("ssh host -- true", std::chrono::milliseconds(1500));
  REQUIRE(wrapped == "timeout --foreground --kill-after=5 1.500 ssh host -- true");
}
