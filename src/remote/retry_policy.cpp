#include "remote/retry_policy.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <string>

namespace tracr::remote {

namespace {

std::string ToLowerAscii(std::string_view value) {
  std::string lowered(value);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

bool ContainsAny(const std::string& haystack, std::initializer_list<std::string_view> needles) {
  return std::any_of(needles.begin(), needles.end(), [&](std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
  });
}

} // namespace

std::chrono::milliseconds ComputeBackoff(const RetryPolicy& policy, const std::uint32_t attempt) {
  if (attempt == 0U) {
    return std::chrono::milliseconds(0);
  }
  const double scaled = static_cast<double>(policy.initial_backoff.count()) *
                        std::pow(std::max(policy.multiplier, 1.0), attempt - 1U);
  const double capped = std::min(scaled, static_cast<double>(policy.max_backoff.count()));
  return std::chrono::milliseconds(static_cast<std::int64_t>(capped));
}

std::uint32_t ComputeAttemptsRemaining(const RetryPolicy& policy,
                                       const std::uint32_t attempts_used) {
  if (attempts_used >= policy.max_attempts) {
    return 0U;
  }
  return policy.max_attempts - attempts_used;
}

bool IsLikelyTransientConnectError(std::string_view error_text) {
  if (error_text.empty()) {
    return false;
  }
  const std::string normalized = ToLowerAscii(error_text);
  if (ContainsAny(normalized, {"permission denied", "host key verification failed",
                               "authentication", "could not resolve hostname"})) {
    return false;
  }
  return ContainsAny(normalized,
                     {"connection refused", "timed out", "timeout", "no route to host",
                      "network is unreachable", "host is unreachable", "connection reset",
                      "connection closed", "broken pipe", "unreachable"});
}

bool IsLikelyTransportFailure(const int exit_code, std::string_view stderr_text) {
  if (exit_code != 255) {
    return false;
  }
  const std::string normalized = ToLowerAscii(stderr_text);
  return ContainsAny(normalized, {"ssh:", "connection", "control socket", "mux_client",
                                  "broken pipe", "unreachable"});
}

} // namespace tracr::remote
