#pragma once

#include "core/cancellation.hpp"
#include "core/errors/error.hpp"
#include "registry/device_model.hpp"
#include "remote/remote_shell.hpp"
#include "remote/retry_policy.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>

namespace tracr::core::logging {
class Logger;
}

namespace tracr::remote {

class ConnectionManager;

// Exclusive, reusable control session to one device.
//
// A session owns the device lease from `Connect` until `Close` or
// destruction, whichever comes first, so every exit path (including command
// failures and exceptions) releases the lease and tears the channel down.
class Session {
public:
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;
  Session(Session&&) = delete;
  Session& operator=(Session&&) = delete;

  const registry::Device& device() const {
    return device_;
  }

  bool is_open() const {
    return open_;
  }

  std::uint32_t connect_attempts() const {
    return connect_attempts_;
  }

  // Commands dispatched on this session fail kCancelled once `token` fires,
  // and a command already in flight is interrupted. The session stays open.
  void BindCancellation(core::CancellationToken* token) {
    cancel_ = token;
  }

private:
  friend class ConnectionManager;

  Session(ConnectionManager* manager, registry::Device device,
          std::unique_ptr<IRemoteShell> shell);

  ConnectionManager* manager_ = nullptr;
  registry::Device device_;
  std::unique_ptr<IRemoteShell> shell_;
  core::CancellationToken* cancel_ = nullptr;
  bool open_ = false;
  std::uint32_t connect_attempts_ = 0;
};

struct ConnectionOptions {
  RetryPolicy retry;
  std::chrono::milliseconds connect_timeout{5000};
};

using SleepFn = std::function<void(std::chrono::milliseconds)>;

// Opens, verifies and reuses remote-control sessions.
//
// Errors:
// - Connect: kConnection after the retry budget is exhausted (or at once for
//   non-transient failures), kDeviceBusy when another pass holds the device,
//   kCancelled when cancellation arrives during backoff.
// - Execute: kRemoteCommand (non-zero exit, carries exit code and stderr),
//   kTimeout / kConnection (session is closed), kCancelled (before dispatch
//   or when the bound token interrupts the command).
// - Transfer: kTransfer on copy failure, checksum mismatch or truncation;
//   kCancelled as for Execute.
class ConnectionManager {
public:
  ConnectionManager(IRemoteShellFactory& factory, ConnectionOptions options,
                    core::logging::Logger& logger, SleepFn sleep = {});

  ConnectionManager(const ConnectionManager&) = delete;
  ConnectionManager& operator=(const ConnectionManager&) = delete;

  bool Connect(const registry::Device& device, std::unique_ptr<Session>& session,
               core::errors::Error& error, core::CancellationToken* cancel = nullptr);

  bool Execute(Session& session, const std::string& command, std::chrono::milliseconds timeout,
               CommandResult& result, core::errors::Error& error);

  // Copies `local_path` <-> `remote_path` and verifies byte count and CRC on
  // both ends afterwards.
  bool Transfer(Session& session, const std::filesystem::path& local_path,
                const std::string& remote_path, TransferDirection direction,
                std::chrono::milliseconds timeout, core::errors::Error& error);

  // Idempotent.
  void Close(Session& session);

  bool IsLeased(std::string_view device_id) const;

  const ConnectionOptions& options() const {
    return options_;
  }

private:
  bool AcquireLease(const std::string& device_id);
  void ReleaseLease(const std::string& device_id);
  bool CheckUsable(Session& session, core::errors::Error& error) const;
  bool RemoteDigest(Session& session, const std::string& remote_path,
                    std::chrono::milliseconds timeout, std::string& digest_text,
                    core::errors::Error& error);

  IRemoteShellFactory& factory_;
  ConnectionOptions options_;
  core::logging::Logger& logger_;
  SleepFn sleep_;

  mutable std::mutex lease_mu_;
  std::set<std::string, std::less<>> leased_;
};

} // namespace tracr::remote
