#include "core/errors/error.hpp"

#include <algorithm>

namespace tracr::core::errors {

std::string_view ToStableErrorCode(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kNone:
    return "OK";
  case ErrorKind::kConnection:
    return "CONNECTION_ERROR";
  case ErrorKind::kRemoteCommand:
    return "REMOTE_COMMAND_ERROR";
  case ErrorKind::kTransfer:
    return "TRANSFER_ERROR";
  case ErrorKind::kTimeout:
    return "TIMEOUT";
  case ErrorKind::kCancelled:
    return "CANCELLED";
  case ErrorKind::kDeviceBusy:
    return "DEVICE_BUSY";
  case ErrorKind::kDuplicateDevice:
    return "DUPLICATE_DEVICE";
  case ErrorKind::kNotFound:
    return "NOT_FOUND";
  case ErrorKind::kInvalidState:
    return "INVALID_STATE";
  case ErrorKind::kMalformedDescriptor:
    return "MALFORMED_DESCRIPTOR";
  case ErrorKind::kValidation:
    return "VALIDATION_ERROR";
  case ErrorKind::kUnsatisfiedConstraint:
    return "UNSATISFIED_CONSTRAINT";
  case ErrorKind::kIo:
    return "IO_ERROR";
  }
  return "UNKNOWN";
}

void Clear(Error& error) {
  error = Error{};
}

bool Fail(Error& error, const ErrorKind kind, std::string message) {
  error.kind = kind;
  error.message = std::move(message);
  return false;
}

std::string StderrSnippet(std::string_view stderr_text, const std::size_t max_chars) {
  std::string snippet;
  snippet.reserve(std::min(stderr_text.size(), max_chars));
  for (const char c : stderr_text) {
    if (snippet.size() >= max_chars) {
      snippet += "...";
      break;
    }
    snippet.push_back(c == '\n' || c == '\r' ? ' ' : c);
  }
  while (!snippet.empty() && snippet.back() == ' ') {
    snippet.pop_back();
  }
  return snippet;
}

std::string FormatError(const Error& error) {
  std::string text(ToStableErrorCode(error.kind));
  text += ": ";
  text += error.message;
  if (error.kind == ErrorKind::kRemoteCommand && error.exit_code >= 0) {
    text += " exit_code=" + std::to_string(error.exit_code);
  }
  if (!error.stderr_text.empty()) {
    text += " stderr=" + StderrSnippet(error.stderr_text);
  }
  return text;
}

} // namespace tracr::core::errors
