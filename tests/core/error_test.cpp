#include "core/errors/error.hpp"
#include "core/errors/exit_codes.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using tracr::core::errors::Error;
using tracr::core::errors::ErrorKind;

TEST_CASE("Error kinds map to stable codes", "[core][errors]") {
  REQUIRE(tracr::core::errors::ToStableErrorCode(ErrorKind::kConnection) == "CONNECTION_ERROR");
  REQUIRE(tracr::core::errors::ToStableErrorCode(ErrorKind::kTransfer) == "TRANSFER_ERROR");
  REQUIRE(tracr::core::errors::ToStableErrorCode(ErrorKind::kDeviceBusy) == "DEVICE_BUSY");
  REQUIRE(tracr::core::errors::ToStableErrorCode(ErrorKind::kUnsatisfiedConstraint) ==
          "UNSATISFIED_CONSTRAINT");
  REQUIRE(tracr::core::errors::ToStableErrorCode(ErrorKind::kMalformedDescriptor) ==
          "MALFORMED_DESCRIPTOR");
}

TEST_CASE("Fail fills the error and returns false", "[core][errors]") {
  Error error;
  REQUIRE(error.ok());
  REQUIRE_FALSE(tracr::core::errors::Fail(error, ErrorKind::kNotFound, "device 'x' not found"));
  REQUIRE_FALSE(error.ok());
  REQUIRE(tracr::core::errors::FormatError(error) == "NOT_FOUND: device 'x' not found");

  tracr::core::errors::Clear(error);
  REQUIRE(error.ok());
  REQUIRE(error.message.empty());
  REQUIRE(error.exit_code == -1);
}

TEST_CASE("FormatError includes remote exit code and flattened stderr", "[core][errors]") {
  Error error;
  error.exit_code = 125;
  error.stderr_text = "Unable to find image\nlocally\n";
  tracr::core::errors::Fail(error, ErrorKind::kRemoteCommand, "docker create failed");
  REQUIRE(tracr::core::errors::FormatError(error) ==
          "REMOTE_COMMAND_ERROR: docker create failed exit_code=125 stderr=Unable to find image "
          "locally");
}

TEST_CASE("StderrSnippet truncates long output", "[core][errors]") {
  const std::string long_text(500, 'e');
  const std::string snippet = tracr::core::errors::StderrSnippet(long_text, 10);
  REQUIRE(snippet == "eeeeeeeeee...");
}

TEST_CASE("Exit codes are stable", "[core][errors]") {
  using tracr::core::errors::ExitCode;
  using tracr::core::errors::ToInt;
  REQUIRE(ToInt(ExitCode::kSuccess) == 0);
  REQUIRE(ToInt(ExitCode::kUsage) == 2);
  REQUIRE(ToInt(ExitCode::kDescriptorInvalid) == 10);
  REQUIRE(ToInt(ExitCode::kConnectFailed) == 20);
  REQUIRE(ToInt(ExitCode::kRunFailed) == 30);
  REQUIRE(ToInt(ExitCode::kRegistryConflict) == 40);
}
