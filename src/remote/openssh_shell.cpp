#include "remote/openssh_shell.hpp"

#include "core/process.hpp"
#include "remote/retry_policy.hpp"

#include <algorithm>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace tracr::remote {

namespace {

long long CeilSeconds(const std::chrono::milliseconds duration) {
  const long long millis = std::max<long long>(duration.count(), 1000);
  return (millis + 999) / 1000;
}

CommandResult ToCommandResult(const core::ProcessResult& process) {
  CommandResult result;
  result.exit_code = process.exit_code;
  result.stdout_text = process.stdout_text;
  result.stderr_text = process.stderr_text;
  result.cancelled = process.interrupted;
  result.timed_out = !result.cancelled && process.exit_code == core::kDeadlineExpiredExitCode;
  result.transport_failed = !result.timed_out && !result.cancelled &&
                            IsLikelyTransportFailure(process.exit_code, process.stderr_text);
  return result;
}

} // namespace

OpenSshShell::OpenSshShell(registry::Device device, OpenSshOptions options)
    : device_(std::move(device)), options_(std::move(options)) {}

OpenSshShell::~OpenSshShell() {
  Close();
}

std::string OpenSshShell::Target() const {
  const std::string& host = device_.host.empty() ? device_.name : device_.host;
  if (device_.user.empty()) {
    return host;
  }
  return device_.user + "@" + host;
}

fs::path OpenSshShell::ControlPath() const {
  const std::string key = device_.id.empty() ? device_.host : device_.id;
  return options_.control_dir / ("tracr-" + key + ".sock");
}

std::string OpenSshShell::CommonSshArgs(const std::chrono::milliseconds connect_timeout) const {
  std::ostringstream args;
  args << "-o BatchMode=yes -o StrictHostKeyChecking=accept-new"
       << " -o ConnectTimeout=" << CeilSeconds(connect_timeout)
       << " -o ControlPath=" << core::ShellQuote(ControlPath().string());
  if (!device_.identity_file.empty()) {
    args << " -i " << core::ShellQuote(device_.identity_file);
  }
  for (const auto& option : options_.extra_options) {
    args << " -o " << core::ShellQuote(option);
  }
  return args.str();
}

OpenOutcome OpenSshShell::Open(const std::chrono::milliseconds timeout) {
  OpenOutcome outcome;
  std::error_code ec;
  fs::create_directories(options_.control_dir, ec);
  if (ec) {
    outcome.error = "unable to create control dir " + options_.control_dir.string() + ": " +
                    ec.message();
    return outcome;
  }

  const std::string start = options_.ssh_binary + " " + CommonSshArgs(timeout) + " -p " +
                            std::to_string(device_.port) +
                            " -o ControlMaster=yes -o ControlPersist=yes -f -N " +
                            core::ShellQuote(Target()) + " >/dev/null";
  core::ProcessResult process;
  std::string spawn_error;
  if (!core::RunShellCommand(core::WithDeadline(start, timeout + std::chrono::seconds(2)),
                             process, spawn_error)) {
    outcome.error = spawn_error;
    return outcome;
  }
  if (process.exit_code != 0) {
    if (process.exit_code == core::kDeadlineExpiredExitCode) {
      outcome.error = "connection timed out";
      outcome.transient = true;
    } else {
      outcome.error = process.stderr_text.empty()
                          ? "ssh exited with code " + std::to_string(process.exit_code)
                          : process.stderr_text;
      outcome.transient = IsLikelyTransientConnectError(outcome.error);
    }
    return outcome;
  }

  const std::string check = options_.ssh_binary + " -o ControlPath=" +
                            core::ShellQuote(ControlPath().string()) + " -O check " +
                            core::ShellQuote(Target());
  if (!core::RunShellCommand(check, process, spawn_error)) {
    outcome.error = spawn_error;
    return outcome;
  }
  if (process.exit_code != 0) {
    outcome.error = "control master did not come up: " + process.stderr_text;
    outcome.transient = true;
    return outcome;
  }

  master_running_ = true;
  outcome.ok = true;
  return outcome;
}

bool OpenSshShell::Run(const std::string& command, const std::chrono::milliseconds timeout,
                       const core::CancellationToken* cancel, CommandResult& result,
                       std::string& error) {
  error.clear();
  const std::string invocation = options_.ssh_binary + " " + CommonSshArgs(timeout) + " -p " +
                                 std::to_string(device_.port) + " -o ControlMaster=no " +
                                 core::ShellQuote(Target()) + " -- " + core::ShellQuote(command);
  core::ProcessResult process;
  if (!core::RunShellCommand(core::WithDeadline(invocation, timeout), process, error, cancel)) {
    return false;
  }
  result = ToCommandResult(process);
  return true;
}

bool OpenSshShell::Copy(const fs::path& local_path, const std::string& remote_path,
                        const TransferDirection direction,
                        const std::chrono::milliseconds timeout,
                        const core::CancellationToken* cancel, CommandResult& result,
                        std::string& error) {
  error.clear();
  const std::string remote_spec =
      core::ShellQuote(Target() + ":" + ScpRemotePath(remote_path));
  const std::string local_spec = core::ShellQuote(local_path.string());

  std::string invocation = options_.scp_binary + " -q " + CommonSshArgs(timeout) + " -P " +
                           std::to_string(device_.port) + " ";
  if (direction == TransferDirection::kPush) {
    invocation += local_spec + " " + remote_spec;
  } else {
    invocation += remote_spec + " " + local_spec;
  }

  core::ProcessResult process;
  if (!core::RunShellCommand(core::WithDeadline(invocation, timeout), process, error, cancel)) {
    return false;
  }
  result = ToCommandResult(process);
  return true;
}

void OpenSshShell::Close() {
  if (!master_running_) {
    return;
  }
  master_running_ = false;
  const std::string stop = options_.ssh_binary + " -o ControlPath=" +
                           core::ShellQuote(ControlPath().string()) + " -O exit " +
                           core::ShellQuote(Target()) + " >/dev/null";
  core::ProcessResult process;
  std::string spawn_error;
  if (!core::RunShellCommand(core::WithDeadline(stop, std::chrono::seconds(5)), process,
                             spawn_error)) {
    return;
  }
  std::error_code ec;
  (void)fs::remove(ControlPath(), ec);
}

std::unique_ptr<IRemoteShell> OpenSshShellFactory::Create(const registry::Device& device) {
  return std::make_unique<OpenSshShell>(device, options_);
}

std::string ScpRemotePath(const std::string& remote_path) {
  if (remote_path.rfind("~/", 0) == 0) {
    return remote_path.substr(2);
  }
  if (remote_path == "~") {
    return ".";
  }
  return remote_path;
}

} // namespace tracr::remote
