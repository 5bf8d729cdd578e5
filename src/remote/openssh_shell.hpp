#pragma once

#include "remote/remote_shell.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace tracr::remote {

struct OpenSshOptions {
  // Directory holding the per-device ControlMaster sockets.
  std::filesystem::path control_dir = "/tmp";
  std::string ssh_binary = "ssh";
  std::string scp_binary = "scp";
  // Extra `-o Key=Value` pairs appended to every invocation.
  std::vector<std::string> extra_options;
};

// IRemoteShell backed by the OpenSSH client.
//
// `Open` starts a background ControlMaster; `Run` and `Copy` multiplex over
// it, so one session is one authenticated TCP connection for its lifetime.
// BatchMode keeps every invocation non-interactive.
class OpenSshShell final : public IRemoteShell {
public:
  OpenSshShell(registry::Device device, OpenSshOptions options);
  ~OpenSshShell() override;

  OpenSshShell(const OpenSshShell&) = delete;
  OpenSshShell& operator=(const OpenSshShell&) = delete;

  OpenOutcome Open(std::chrono::milliseconds timeout) override;

  bool Run(const std::string& command, std::chrono::milliseconds timeout,
           const core::CancellationToken* cancel, CommandResult& result,
           std::string& error) override;

  bool Copy(const std::filesystem::path& local_path, const std::string& remote_path,
            TransferDirection direction, std::chrono::milliseconds timeout,
            const core::CancellationToken* cancel, CommandResult& result,
            std::string& error) override;

  void Close() override;

  // Exposed for tests: the argument string shared by ssh invocations.
  std::string CommonSshArgs(std::chrono::milliseconds connect_timeout) const;
  std::string Target() const;
  std::filesystem::path ControlPath() const;

private:
  registry::Device device_;
  OpenSshOptions options_;
  bool master_running_ = false;
};

class OpenSshShellFactory final : public IRemoteShellFactory {
public:
  explicit OpenSshShellFactory(OpenSshOptions options) : options_(std::move(options)) {}

  std::unique_ptr<IRemoteShell> Create(const registry::Device& device) override;

private:
  OpenSshOptions options_;
};

// scp resolves relative remote paths against the login home, so `~/x`
// becomes `x`.
std::string ScpRemotePath(const std::string& remote_path);

} // namespace tracr::remote
