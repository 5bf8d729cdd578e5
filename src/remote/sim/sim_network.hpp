#pragma once

#include "remote/remote_shell.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace tracr::remote::sim {

// Behavior of one simulated board. Defaults describe a healthy, prepared
// arm64 device whose containers exit 0 on the first status poll.
struct SimHostSpec {
  std::string machine = "aarch64";
  std::string os_family = "Linux";
  std::string os_release = "5.15.0-1034-raspi";
  std::string mac;
  std::string hostname;

  bool reachable = true;
  // Connect attempts refused before the host starts accepting.
  std::uint32_t transient_failures = 0;
  bool reject_auth = false;

  bool docker_available = true;
  // `sh <script>` stands in for host preparation: exit 0 installs the
  // container engine, anything else leaves the board as it was.
  int prepare_exit_code = 0;
  std::string engine_version = "24.0.7";
  // Images present before the run (e.g. an already-built base image).
  std::vector<std::string> images;
  bool fail_all_builds = false;
  // `docker build` fails when the tag contains any of these.
  std::vector<std::string> failing_build_tags;

  bool corrupt_pushes = false;
  bool truncate_pushes = false;

  int container_exit_code = 0;
  // Status polls before the container exits; negative runs until stopped.
  int run_polls = 1;
  bool fail_stop = false;
  // Written to the mounted telemetry log, one line per status poll while
  // running and the remainder on exit.
  std::vector<std::string> telemetry_lines;

  // Commands containing these substrings time out / lose the channel.
  std::string hang_on;
  std::string drop_on;
  // Commands containing this substring run until the caller cancels them or
  // their deadline passes.
  std::string block_on;
};

// Deterministic in-memory LAN: hosts, their files, images and containers.
//
// It understands exactly the remote command vocabulary the orchestrator
// emits (`mkdir -p`, `cksum`, `cat`, `tail -c`, `uname`, `sh <script>`,
// `docker ...`).
// Anything else exits 127. All state sits behind one mutex so concurrent
// device workers can share a network.
class SimNetwork {
public:
  void AddHost(const std::string& host, SimHostSpec spec);
  void UpdateHost(const std::string& host, const std::function<void(SimHostSpec&)>& mutate);
  bool HasHost(const std::string& host) const;
  std::vector<std::string> Hosts() const;
  bool HostSpec(const std::string& host, SimHostSpec& spec) const;

  std::uint32_t ConnectAttempts(const std::string& host) const;
  std::uint32_t OpenSessions(const std::string& host) const;
  std::vector<std::string> CommandLog(const std::string& host) const;
  // Every dispatched command across hosts as "<host> <command>", in order.
  std::vector<std::string> GlobalLog() const;

  bool HasImage(const std::string& host, const std::string& tag) const;
  bool ReadRemoteFile(const std::string& host, const std::string& path,
                      std::string& contents) const;
  void WriteRemoteFile(const std::string& host, const std::string& path, std::string contents);
  // "created" | "running" | "exited" | "" when absent.
  std::string ContainerState(const std::string& host, const std::string& name) const;

  OpenOutcome Open(const std::string& host);
  void Release(const std::string& host);
  CommandResult Execute(const std::string& host, const std::string& command,
                        std::chrono::milliseconds timeout = std::chrono::seconds(30),
                        const core::CancellationToken* cancel = nullptr);
  // Commands currently parked on a `block_on` match.
  std::uint32_t BlockedCommands(const std::string& host) const;
  CommandResult Copy(const std::string& host, const std::filesystem::path& local_path,
                     const std::string& remote_path, TransferDirection direction);

private:
  struct Container {
    std::string image;
    std::string log_dir;
    std::string state = "created";
    int polls_remaining = 0;
    int exit_code = 0;
    std::size_t lines_emitted = 0;
  };

  struct HostState {
    SimHostSpec spec;
    std::map<std::string, std::string> files;
    std::set<std::string> images;
    std::map<std::string, Container> containers;
    std::uint32_t connect_attempts = 0;
    std::uint32_t open_sessions = 0;
    std::uint32_t blocked = 0;
    std::vector<std::string> log;
  };

  CommandResult Dispatch(HostState& host, const std::vector<std::string>& argv);
  CommandResult Docker(HostState& host, const std::vector<std::string>& argv);
  CommandResult DockerBuild(HostState& host, const std::vector<std::string>& argv);
  CommandResult DockerCreate(HostState& host, const std::vector<std::string>& argv);
  CommandResult DockerInspect(HostState& host, const std::vector<std::string>& argv);
  static void EmitTelemetry(HostState& host, Container& container, bool flush_all);

  mutable std::mutex mu_;
  std::map<std::string, HostState> hosts_;
  std::vector<std::string> global_log_;
};

// Splits a /bin/sh command line into words: single quotes, double quotes
// and backslash escapes are honored; `~` is left literal.
bool SplitShellWords(std::string_view command, std::vector<std::string>& words,
                     std::string& error);

class SimShell final : public IRemoteShell {
public:
  SimShell(SimNetwork& network, registry::Device device);
  ~SimShell() override;

  OpenOutcome Open(std::chrono::milliseconds timeout) override;
  bool Run(const std::string& command, std::chrono::milliseconds timeout,
           const core::CancellationToken* cancel, CommandResult& result,
           std::string& error) override;
  bool Copy(const std::filesystem::path& local_path, const std::string& remote_path,
            TransferDirection direction, std::chrono::milliseconds timeout,
            const core::CancellationToken* cancel, CommandResult& result,
            std::string& error) override;
  void Close() override;

private:
  SimNetwork& network_;
  registry::Device device_;
  bool open_ = false;
};

class SimShellFactory final : public IRemoteShellFactory {
public:
  explicit SimShellFactory(SimNetwork& network) : network_(network) {}

  std::unique_ptr<IRemoteShell> Create(const registry::Device& device) override;

private:
  SimNetwork& network_;
};

} // namespace tracr::remote::sim
