#pragma once

#include "core/cancellation.hpp"
#include "registry/device_model.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace tracr::remote {

struct CommandResult {
  int exit_code = -1;
  std::string stdout_text;
  std::string stderr_text;
  // Deadline expired before the command finished.
  bool timed_out = false;
  // The control channel itself failed (as opposed to the remote command
  // exiting non-zero). The session must not be reused.
  bool transport_failed = false;
  // The caller's cancellation token fired and the command was interrupted.
  // The channel itself stays usable.
  bool cancelled = false;
};

enum class TransferDirection {
  kPush,
  kPull,
};

const char* ToString(TransferDirection direction);

struct OpenOutcome {
  bool ok = false;
  // Refused/timed-out/unreachable: worth another attempt after backoff.
  bool transient = false;
  std::string error;
};

// One control channel to one device. Implementations are used by a single
// thread at a time (the connection manager's exclusive lease guarantees it).
//
// Contract:
// - `Open` establishes the channel; it may be called again after `Close`.
// - `Run`/`Copy` return false only when the command could not be dispatched
//   at all; remote failures are reported through `CommandResult`.
// - A non-null `cancel` is watched while the command runs; once it fires the
//   command is interrupted promptly and reported with `cancelled` set.
// - `Close` is idempotent and never fails.
class IRemoteShell {
public:
  virtual ~IRemoteShell() = default;

  virtual OpenOutcome Open(std::chrono::milliseconds timeout) = 0;

  virtual bool Run(const std::string& command, std::chrono::milliseconds timeout,
                   const core::CancellationToken* cancel, CommandResult& result,
                   std::string& error) = 0;

  virtual bool Copy(const std::filesystem::path& local_path, const std::string& remote_path,
                    TransferDirection direction, std::chrono::milliseconds timeout,
                    const core::CancellationToken* cancel, CommandResult& result,
                    std::string& error) = 0;

  virtual void Close() = 0;
};

class IRemoteShellFactory {
public:
  virtual ~IRemoteShellFactory() = default;

  virtual std::unique_ptr<IRemoteShell> Create(const registry::Device& device) = 0;
};

} // namespace tracr::remote
