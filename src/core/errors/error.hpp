#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace tracr::core::errors {

// Failure taxonomy shared by every module. Transport-level kinds
// (`kConnection`, `kTimeout`) are retried at the connection boundary; all
// others propagate to the caller unchanged.
enum class ErrorKind {
  kNone,
  kConnection,
  kRemoteCommand,
  kTransfer,
  kTimeout,
  kCancelled,
  kDeviceBusy,
  kDuplicateDevice,
  kNotFound,
  kInvalidState,
  kMalformedDescriptor,
  kValidation,
  kUnsatisfiedConstraint,
  kIo,
};

// Grep-friendly upper-case code, e.g. `CONNECTION_ERROR`.
std::string_view ToStableErrorCode(ErrorKind kind);

struct Error {
  ErrorKind kind = ErrorKind::kNone;
  std::string message;
  // Populated for kRemoteCommand; -1 otherwise.
  int exit_code = -1;
  std::string stderr_text;
  // Number of connection attempts consumed before the error surfaced.
  std::uint32_t attempts = 0;

  bool ok() const {
    return kind == ErrorKind::kNone;
  }
};

void Clear(Error& error);

// Fills `error` and returns false so call sites can `return Fail(...)`.
bool Fail(Error& error, ErrorKind kind, std::string message);

// Single-line rendering:
//   "<CODE>: <message> [exit_code=N] [stderr=<first line>]"
std::string FormatError(const Error& error);

// First `max_chars` of stderr with newlines flattened; used in run records.
std::string StderrSnippet(std::string_view stderr_text, std::size_t max_chars = 240);

} // namespace tracr::core::errors
