#include "remote/device_identity.hpp"

#include "core/fs_utils.hpp"
#include "core/process.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace tracr::remote {

namespace {

using core::errors::ErrorKind;

std::string FirstLine(const std::string& text) {
  std::string line = text.substr(0, text.find('\n'));
  while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
    line.pop_back();
  }
  return line;
}

bool IsMissingFile(const core::errors::Error& error) {
  return error.kind == ErrorKind::kRemoteCommand &&
         error.stderr_text.find("No such file") != std::string::npos;
}

bool Stamp(ConnectionManager& manager, Session& session, const std::chrono::milliseconds timeout,
           core::errors::Error& error) {
  const std::string identity_path(kRemoteIdentityPath);
  const std::string directory = identity_path.substr(0, identity_path.rfind('/'));
  CommandResult mkdir_result;
  if (!manager.Execute(session, "mkdir -p " + core::ShellQuotePath(directory), timeout,
                       mkdir_result, error)) {
    return false;
  }

  std::error_code ec;
  const fs::path staged = core::detail::BuildAtomicTempPath(
      fs::temp_directory_path(ec) / ("tracr-identity-" + session.device().id));
  if (ec) {
    return core::errors::Fail(error, ErrorKind::kIo,
                              "unable to resolve temp directory: " + ec.message());
  }
  std::string write_error;
  if (!core::WriteTextFileAtomic(staged, session.device().id + "\n", write_error)) {
    return core::errors::Fail(error, ErrorKind::kIo, write_error);
  }
  const bool pushed = manager.Transfer(session, staged, identity_path, TransferDirection::kPush,
                                       timeout, error);
  std::error_code remove_ec;
  (void)fs::remove(staged, remove_ec);
  return pushed;
}

} // namespace

bool VerifyOrStampIdentity(ConnectionManager& manager, Session& session,
                           const std::chrono::milliseconds timeout, IdentityOutcome& outcome,
                           core::errors::Error& error) {
  core::errors::Clear(error);
  const std::string& expected = session.device().id;

  CommandResult result;
  core::errors::Error read_error;
  if (manager.Execute(session, "cat " + core::ShellQuotePath(kRemoteIdentityPath), timeout,
                      result, read_error)) {
    const std::string found = FirstLine(result.stdout_text);
    if (found != expected) {
      return core::errors::Fail(error, ErrorKind::kInvalidState,
                                "host " + session.device().host + " identifies as device '" +
                                    found + "', registry expects '" + expected +
                                    "' (remove " + std::string(kRemoteIdentityPath) +
                                    " on the board to re-stamp it)");
    }
    outcome = IdentityOutcome::kMatched;
    return true;
  }
  if (!IsMissingFile(read_error)) {
    error = read_error;
    return false;
  }

  if (!Stamp(manager, session, timeout, error)) {
    return false;
  }
  outcome = IdentityOutcome::kStamped;
  return true;
}

} // namespace tracr::remote
