#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

namespace tracr::remote {

// Default budget for opening one session.
constexpr std::uint32_t kDefaultConnectAttempts = 3U;

// Bounded exponential backoff between connect attempts:
//   delay(n) = min(initial * multiplier^(n-1), max)   for n = 1 .. attempts-1
struct RetryPolicy {
  std::uint32_t max_attempts = kDefaultConnectAttempts;
  std::chrono::milliseconds initial_backoff{500};
  std::chrono::milliseconds max_backoff{4000};
  double multiplier = 2.0;
};

// Delay to wait after failed attempt number `attempt` (1-based).
std::chrono::milliseconds ComputeBackoff(const RetryPolicy& policy, std::uint32_t attempt);

std::uint32_t ComputeAttemptsRemaining(const RetryPolicy& policy, std::uint32_t attempts_used);

// Classifies SSH/transport error text. Refused, timed-out, unreachable and
// reset links are transient; authentication and host-key failures are not.
bool IsLikelyTransientConnectError(std::string_view error_text);

// True when stderr of a dispatched command shows the channel, not the remote
// command, failed.
bool IsLikelyTransportFailure(int exit_code, std::string_view stderr_text);

} // namespace tracr::remote
