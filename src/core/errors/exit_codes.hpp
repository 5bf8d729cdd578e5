#pragma once

namespace tracr::core::errors {

// Stable process-exit contract for CLI automation.
//
// The first three values keep conventional meanings used by scripts:
// - 0 success
// - 1 generic command failure
// - 2 usage/argument failure
//
// Additional values classify operational failures so wrappers can branch
// without scraping stderr text.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kDescriptorInvalid = 10,
  kConnectFailed = 20,
  kRunFailed = 30,
  kRegistryConflict = 40,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace tracr::core::errors
