#include "remote/connection_manager.hpp"

#include "core/checksum.hpp"
#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"
#include "core/process.hpp"

#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace tracr::remote {

using core::errors::Error;
using core::errors::ErrorKind;

const char* ToString(const TransferDirection direction) {
  switch (direction) {
  case TransferDirection::kPush:
    return "push";
  case TransferDirection::kPull:
    return "pull";
  }
  return "push";
}

Session::Session(ConnectionManager* manager, registry::Device device,
                 std::unique_ptr<IRemoteShell> shell)
    : manager_(manager), device_(std::move(device)), shell_(std::move(shell)) {}

Session::~Session() {
  if (manager_ != nullptr) {
    manager_->Close(*this);
  }
}

ConnectionManager::ConnectionManager(IRemoteShellFactory& factory, ConnectionOptions options,
                                     core::logging::Logger& logger, SleepFn sleep)
    : factory_(factory), options_(options), logger_(logger), sleep_(std::move(sleep)) {
  if (!sleep_) {
    sleep_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
  }
  if (options_.retry.max_attempts == 0U) {
    options_.retry.max_attempts = 1U;
  }
}

bool ConnectionManager::Connect(const registry::Device& device, std::unique_ptr<Session>& session,
                                Error& error, core::CancellationToken* cancel) {
  core::errors::Clear(error);
  session.reset();

  if (!AcquireLease(device.id)) {
    return core::errors::Fail(error, ErrorKind::kDeviceBusy,
                              "device " + device.id + " already has an open session");
  }

  std::unique_ptr<Session> candidate(new Session(this, device, factory_.Create(device)));
  candidate->BindCancellation(cancel);

  std::string last_error;
  for (std::uint32_t attempt = 1; attempt <= options_.retry.max_attempts; ++attempt) {
    if (cancel != nullptr && cancel->IsCancelled()) {
      error.attempts = candidate->connect_attempts_;
      ReleaseLease(device.id);
      candidate->manager_ = nullptr;
      return core::errors::Fail(error, ErrorKind::kCancelled,
                                "connect to " + registry::DescribeEndpoint(device) +
                                    " cancelled");
    }

    ++candidate->connect_attempts_;
    const OpenOutcome outcome = candidate->shell_->Open(options_.connect_timeout);
    if (outcome.ok) {
      candidate->open_ = true;
      logger_.Debug("session opened", {{"device_id", device.id},
                                       {"endpoint", registry::DescribeEndpoint(device)},
                                       {"attempt", std::to_string(attempt)}});
      session = std::move(candidate);
      return true;
    }

    last_error = outcome.error;
    const std::uint32_t remaining = ComputeAttemptsRemaining(options_.retry, attempt);
    logger_.Warn("connect attempt failed",
                 {{"device_id", device.id},
                  {"endpoint", registry::DescribeEndpoint(device)},
                  {"attempt", std::to_string(attempt)},
                  {"attempts_remaining", std::to_string(remaining)},
                  {"transient", outcome.transient ? "true" : "false"},
                  {"error", outcome.error}});
    if (!outcome.transient || remaining == 0U) {
      break;
    }

    const std::chrono::milliseconds delay = ComputeBackoff(options_.retry, attempt);
    if (cancel != nullptr) {
      if (cancel->WaitFor(delay)) {
        continue;
      }
    } else {
      sleep_(delay);
    }
  }

  candidate->shell_->Close();
  error.attempts = candidate->connect_attempts_;
  candidate->manager_ = nullptr;
  ReleaseLease(device.id);
  return core::errors::Fail(error, ErrorKind::kConnection,
                            "unable to connect to " + registry::DescribeEndpoint(device) +
                                " after " + std::to_string(error.attempts) +
                                " attempt(s): " + last_error);
}

bool ConnectionManager::Execute(Session& session, const std::string& command,
                                const std::chrono::milliseconds timeout, CommandResult& result,
                                Error& error) {
  core::errors::Clear(error);
  result = CommandResult{};
  if (!CheckUsable(session, error)) {
    return false;
  }

  logger_.Debug("remote execute", {{"device_id", session.device_.id}, {"command", command}});
  std::string dispatch_error;
  if (!session.shell_->Run(command, timeout, session.cancel_, result, dispatch_error)) {
    Close(session);
    return core::errors::Fail(error, ErrorKind::kConnection,
                              "failed to dispatch command on " + session.device_.id + ": " +
                                  dispatch_error);
  }

  if (result.cancelled) {
    logger_.Info("remote command interrupted",
                 {{"device_id", session.device_.id}, {"command", command}});
    return core::errors::Fail(error, ErrorKind::kCancelled,
                              "command interrupted on " + session.device_.id + ": " + command);
  }
  if (result.timed_out) {
    Close(session);
    return core::errors::Fail(error, ErrorKind::kTimeout,
                              "command exceeded " + std::to_string(timeout.count()) +
                                  "ms on " + session.device_.id + "; session closed");
  }
  if (result.transport_failed) {
    error.stderr_text = result.stderr_text;
    Close(session);
    return core::errors::Fail(error, ErrorKind::kConnection,
                              "control channel to " + session.device_.id + " failed");
  }
  if (result.exit_code != 0) {
    error.exit_code = result.exit_code;
    error.stderr_text = result.stderr_text;
    return core::errors::Fail(error, ErrorKind::kRemoteCommand,
                              "remote command failed on " + session.device_.id + ": " + command);
  }
  return true;
}

bool ConnectionManager::Transfer(Session& session, const fs::path& local_path,
                                 const std::string& remote_path,
                                 const TransferDirection direction,
                                 const std::chrono::milliseconds timeout, Error& error) {
  core::errors::Clear(error);
  if (!CheckUsable(session, error)) {
    return false;
  }

  core::CksumDigest source_digest;
  std::string local_error;
  if (direction == TransferDirection::kPush) {
    if (!core::ComputeFileCksum(local_path, source_digest, local_error)) {
      return core::errors::Fail(error, ErrorKind::kTransfer, local_error);
    }
  } else {
    std::string digest_text;
    if (!RemoteDigest(session, remote_path, timeout, digest_text, error)) {
      return false;
    }
    if (!core::ParseCksumOutput(digest_text, source_digest)) {
      return core::errors::Fail(error, ErrorKind::kTransfer,
                                "unparseable remote checksum for " + remote_path);
    }
  }

  if (direction == TransferDirection::kPull) {
    std::string dir_error;
    if (!core::EnsureParentDirectory(local_path, dir_error)) {
      return core::errors::Fail(error, ErrorKind::kTransfer, dir_error);
    }
  }

  CommandResult copy_result;
  std::string dispatch_error;
  if (!session.shell_->Copy(local_path, remote_path, direction, timeout, session.cancel_,
                            copy_result, dispatch_error)) {
    Close(session);
    return core::errors::Fail(error, ErrorKind::kTransfer,
                              "failed to dispatch transfer: " + dispatch_error);
  }
  if (copy_result.cancelled) {
    return core::errors::Fail(error, ErrorKind::kCancelled,
                              "transfer interrupted: " + local_path.string() + " " +
                                  ToString(direction) + " " + remote_path);
  }
  if (copy_result.timed_out || copy_result.transport_failed) {
    Close(session);
    error.stderr_text = copy_result.stderr_text;
    return core::errors::Fail(error, ErrorKind::kTransfer,
                              std::string(copy_result.timed_out ? "transfer timed out"
                                                                : "transfer channel failed") +
                                  ": " + local_path.string() + " " + ToString(direction) + " " +
                                  remote_path);
  }
  if (copy_result.exit_code != 0) {
    error.exit_code = copy_result.exit_code;
    error.stderr_text = copy_result.stderr_text;
    return core::errors::Fail(error, ErrorKind::kTransfer,
                              "copy failed: " + local_path.string() + " " +
                                  ToString(direction) + " " + remote_path);
  }

  core::CksumDigest destination_digest;
  if (direction == TransferDirection::kPush) {
    std::string digest_text;
    if (!RemoteDigest(session, remote_path, timeout, digest_text, error)) {
      return false;
    }
    if (!core::ParseCksumOutput(digest_text, destination_digest)) {
      return core::errors::Fail(error, ErrorKind::kTransfer,
                                "unparseable remote checksum for " + remote_path);
    }
  } else if (!core::ComputeFileCksum(local_path, destination_digest, local_error)) {
    return core::errors::Fail(error, ErrorKind::kTransfer, local_error);
  }

  if (destination_digest.size_bytes != source_digest.size_bytes) {
    return core::errors::Fail(error, ErrorKind::kTransfer,
                              "truncated copy of " + remote_path + ": expected " +
                                  std::to_string(source_digest.size_bytes) + " bytes, got " +
                                  std::to_string(destination_digest.size_bytes));
  }
  if (destination_digest.crc != source_digest.crc) {
    return core::errors::Fail(error, ErrorKind::kTransfer,
                              "checksum mismatch for " + remote_path + ": expected " +
                                  core::ToString(source_digest) + ", got " +
                                  core::ToString(destination_digest));
  }

  logger_.Debug("transfer verified", {{"device_id", session.device_.id},
                                      {"direction", ToString(direction)},
                                      {"remote_path", remote_path},
                                      {"bytes", std::to_string(source_digest.size_bytes)}});
  return true;
}

void ConnectionManager::Close(Session& session) {
  if (session.manager_ == nullptr) {
    return;
  }
  if (session.shell_ != nullptr) {
    session.shell_->Close();
  }
  if (session.open_) {
    logger_.Debug("session closed", {{"device_id", session.device_.id}});
  }
  session.open_ = false;
  session.manager_ = nullptr;
  ReleaseLease(session.device_.id);
}

bool ConnectionManager::IsLeased(std::string_view device_id) const {
  std::lock_guard<std::mutex> lock(lease_mu_);
  return leased_.find(device_id) != leased_.end();
}

bool ConnectionManager::AcquireLease(const std::string& device_id) {
  std::lock_guard<std::mutex> lock(lease_mu_);
  return leased_.insert(device_id).second;
}

void ConnectionManager::ReleaseLease(const std::string& device_id) {
  std::lock_guard<std::mutex> lock(lease_mu_);
  leased_.erase(device_id);
}

bool ConnectionManager::CheckUsable(Session& session, Error& error) const {
  if (!session.open_) {
    return core::errors::Fail(error, ErrorKind::kConnection,
                              "session to " + session.device_.id + " is closed");
  }
  if (session.cancel_ != nullptr && session.cancel_->IsCancelled()) {
    return core::errors::Fail(error, ErrorKind::kCancelled,
                              "session to " + session.device_.id + " cancelled");
  }
  return true;
}

bool ConnectionManager::RemoteDigest(Session& session, const std::string& remote_path,
                                     const std::chrono::milliseconds timeout,
                                     std::string& digest_text, Error& error) {
  CommandResult result;
  if (!Execute(session, "cksum " + core::ShellQuotePath(remote_path), timeout, result, error)) {
    if (error.kind == ErrorKind::kRemoteCommand) {
      error.kind = ErrorKind::kTransfer;
      error.message = "unable to checksum remote file " + remote_path;
    }
    return false;
  }
  digest_text = result.stdout_text;
  return true;
}

} // namespace tracr::remote
