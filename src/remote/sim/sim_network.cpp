#include "remote/sim/sim_network.hpp"

#include "core/checksum.hpp"
#include "core/fs_utils.hpp"
#include "core/process.hpp"

#include <algorithm>
#include <exception>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

namespace tracr::remote::sim {

namespace {

constexpr std::string_view kTelemetryMountPoint = "/var/log/tracr";
constexpr std::chrono::milliseconds kBlockedSlice{10};

CommandResult Exit(int code, std::string out = {}, std::string err = {}) {
  CommandResult result;
  result.exit_code = code;
  result.stdout_text = std::move(out);
  result.stderr_text = std::move(err);
  return result;
}

bool Contains(const std::string& haystack, const std::string& needle) {
  return !needle.empty() && haystack.find(needle) != std::string::npos;
}

std::string JoinWords(const std::vector<std::string>& words) {
  std::string joined;
  for (const auto& word : words) {
    if (!joined.empty()) {
      joined.push_back(' ');
    }
    joined += word;
  }
  return joined;
}

// First `FROM` image of a Dockerfile, or empty.
std::string FromImage(const std::string& dockerfile) {
  std::size_t pos = 0;
  while (pos < dockerfile.size()) {
    std::size_t end = dockerfile.find('\n', pos);
    if (end == std::string::npos) {
      end = dockerfile.size();
    }
    const std::string line = dockerfile.substr(pos, end - pos);
    if (line.rfind("FROM ", 0) == 0) {
      std::string image = line.substr(5);
      const std::size_t space = image.find(' ');
      if (space != std::string::npos) {
        image.resize(space);
      }
      return image;
    }
    pos = end + 1U;
  }
  return {};
}

// Waits out a blocked command; true when `cancel` fired before `timeout`.
bool ParkUntilCancelled(const std::chrono::milliseconds timeout,
                        const core::CancellationToken* cancel) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (cancel != nullptr && cancel->IsCancelled()) {
      return true;
    }
    std::this_thread::sleep_for(kBlockedSlice);
  }
  return cancel != nullptr && cancel->IsCancelled();
}

} // namespace

bool SplitShellWords(std::string_view command, std::vector<std::string>& words,
                     std::string& error) {
  words.clear();
  error.clear();

  std::string current;
  bool in_word = false;
  std::size_t i = 0;
  while (i < command.size()) {
    const char c = command[i];
    if (c == ' ' || c == '\t' || c == '\n') {
      if (in_word) {
        words.push_back(current);
        current.clear();
        in_word = false;
      }
      ++i;
      continue;
    }
    in_word = true;
    if (c == '\'') {
      const std::size_t close = command.find('\'', i + 1U);
      if (close == std::string_view::npos) {
        error = "unterminated single quote";
        return false;
      }
      current.append(command.substr(i + 1U, close - i - 1U));
      i = close + 1U;
    } else if (c == '"') {
      ++i;
      bool closed = false;
      while (i < command.size()) {
        const char d = command[i];
        if (d == '"') {
          closed = true;
          ++i;
          break;
        }
        if (d == '\\' && i + 1U < command.size() &&
            (command[i + 1U] == '"' || command[i + 1U] == '\\' || command[i + 1U] == '$')) {
          current.push_back(command[i + 1U]);
          i += 2U;
          continue;
        }
        current.push_back(d);
        ++i;
      }
      if (!closed) {
        error = "unterminated double quote";
        return false;
      }
    } else if (c == '\\' && i + 1U < command.size()) {
      current.push_back(command[i + 1U]);
      i += 2U;
    } else {
      current.push_back(c);
      ++i;
    }
  }
  if (in_word) {
    words.push_back(current);
  }
  return true;
}

void SimNetwork::AddHost(const std::string& host, SimHostSpec spec) {
  std::lock_guard<std::mutex> lock(mu_);
  HostState& state = hosts_[host];
  state.images.insert(spec.images.begin(), spec.images.end());
  state.spec = std::move(spec);
}

void SimNetwork::UpdateHost(const std::string& host,
                            const std::function<void(SimHostSpec&)>& mutate) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = hosts_.find(host);
  if (it != hosts_.end()) {
    mutate(it->second.spec);
  }
}

bool SimNetwork::HasHost(const std::string& host) const {
  std::lock_guard<std::mutex> lock(mu_);
  return hosts_.count(host) != 0U;
}

std::vector<std::string> SimNetwork::Hosts() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<std::string> hosts;
  for (const auto& [name, state] : hosts_) {
    hosts.push_back(name);
  }
  return hosts;
}

bool SimNetwork::HostSpec(const std::string& host, SimHostSpec& spec) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = hosts_.find(host);
  if (it == hosts_.end()) {
    return false;
  }
  spec = it->second.spec;
  return true;
}

std::uint32_t SimNetwork::ConnectAttempts(const std::string& host) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = hosts_.find(host);
  return it == hosts_.end() ? 0U : it->second.connect_attempts;
}

std::uint32_t SimNetwork::OpenSessions(const std::string& host) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = hosts_.find(host);
  return it == hosts_.end() ? 0U : it->second.open_sessions;
}

std::vector<std::string> SimNetwork::CommandLog(const std::string& host) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = hosts_.find(host);
  return it == hosts_.end() ? std::vector<std::string>{} : it->second.log;
}

std::vector<std::string> SimNetwork::GlobalLog() const {
  std::lock_guard<std::mutex> lock(mu_);
  return global_log_;
}

bool SimNetwork::HasImage(const std::string& host, const std::string& tag) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = hosts_.find(host);
  return it != hosts_.end() && it->second.images.count(tag) != 0U;
}

bool SimNetwork::ReadRemoteFile(const std::string& host, const std::string& path,
                                std::string& contents) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = hosts_.find(host);
  if (it == hosts_.end()) {
    return false;
  }
  const auto file = it->second.files.find(path);
  if (file == it->second.files.end()) {
    return false;
  }
  contents = file->second;
  return true;
}

void SimNetwork::WriteRemoteFile(const std::string& host, const std::string& path,
                                 std::string contents) {
  std::lock_guard<std::mutex> lock(mu_);
  hosts_[host].files[path] = std::move(contents);
}

std::string SimNetwork::ContainerState(const std::string& host, const std::string& name) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = hosts_.find(host);
  if (it == hosts_.end()) {
    return {};
  }
  const auto container = it->second.containers.find(name);
  return container == it->second.containers.end() ? std::string{} : container->second.state;
}

OpenOutcome SimNetwork::Open(const std::string& host) {
  std::lock_guard<std::mutex> lock(mu_);
  OpenOutcome outcome;
  const auto it = hosts_.find(host);
  if (it == hosts_.end()) {
    outcome.transient = true;
    outcome.error = "ssh: connect to host " + host + " port 22: No route to host";
    return outcome;
  }
  HostState& state = it->second;
  ++state.connect_attempts;
  if (!state.spec.reachable) {
    outcome.transient = true;
    outcome.error = "ssh: connect to host " + host + " port 22: No route to host";
    return outcome;
  }
  if (state.spec.transient_failures > 0U) {
    --state.spec.transient_failures;
    outcome.transient = true;
    outcome.error = "ssh: connect to host " + host + " port 22: Connection refused";
    return outcome;
  }
  if (state.spec.reject_auth) {
    outcome.error = "Permission denied (publickey).";
    return outcome;
  }
  ++state.open_sessions;
  outcome.ok = true;
  return outcome;
}

void SimNetwork::Release(const std::string& host) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = hosts_.find(host);
  if (it != hosts_.end() && it->second.open_sessions > 0U) {
    --it->second.open_sessions;
  }
}

std::uint32_t SimNetwork::BlockedCommands(const std::string& host) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = hosts_.find(host);
  return it == hosts_.end() ? 0U : it->second.blocked;
}

CommandResult SimNetwork::Execute(const std::string& host, const std::string& command,
                                  const std::chrono::milliseconds timeout,
                                  const core::CancellationToken* cancel) {
  std::unique_lock<std::mutex> lock(mu_);
  const auto it = hosts_.find(host);
  if (it == hosts_.end()) {
    CommandResult result = Exit(255, {}, "ssh: Could not resolve hostname " + host);
    result.transport_failed = true;
    return result;
  }
  HostState& state = it->second;
  state.log.push_back(command);
  global_log_.push_back(host + " " + command);

  if (Contains(command, state.spec.hang_on)) {
    CommandResult result = Exit(124);
    result.timed_out = true;
    return result;
  }
  if (Contains(command, state.spec.drop_on)) {
    CommandResult result = Exit(255, {}, "Connection to " + host + " closed by remote host.");
    result.transport_failed = true;
    return result;
  }
  if (Contains(command, state.spec.block_on)) {
    // Host entries are never erased, so `state` survives the unlock.
    ++state.blocked;
    lock.unlock();
    const bool cancelled = ParkUntilCancelled(timeout, cancel);
    lock.lock();
    --state.blocked;
    CommandResult result = Exit(cancelled ? 143 : core::kDeadlineExpiredExitCode);
    result.cancelled = cancelled;
    result.timed_out = !cancelled;
    return result;
  }

  std::vector<std::string> argv;
  std::string split_error;
  if (!SplitShellWords(command, argv, split_error)) {
    return Exit(2, {}, "sh: syntax error: " + split_error);
  }
  if (argv.empty()) {
    return Exit(0);
  }
  return Dispatch(state, argv);
}

CommandResult SimNetwork::Dispatch(HostState& host, const std::vector<std::string>& argv) {
  const std::string& program = argv[0];
  if (program == "mkdir") {
    return Exit(0);
  }
  if (program == "true") {
    return Exit(0);
  }
  if (program == "uname") {
    return Exit(0, host.spec.os_family + " " + host.spec.os_release + " " + host.spec.machine +
                       "\n");
  }
  if (program == "cksum" || program == "cat") {
    if (argv.size() < 2U) {
      return Exit(1, {}, program + ": missing operand");
    }
    const auto file = host.files.find(argv[1]);
    if (file == host.files.end()) {
      return Exit(1, {}, program + ": " + argv[1] + ": No such file or directory");
    }
    if (program == "cat") {
      return Exit(0, file->second);
    }
    return Exit(0, core::ToString(core::ComputeCksum(file->second)) + " " + argv[1] + "\n");
  }
  if (program == "tail") {
    // tail -c +N <path>
    if (argv.size() != 4U || argv[1] != "-c" || argv[2].empty() || argv[2][0] != '+') {
      return Exit(1, {}, "tail: unsupported invocation");
    }
    const auto file = host.files.find(argv[3]);
    if (file == host.files.end()) {
      return Exit(1, {}, "tail: cannot open '" + argv[3] + "' for reading");
    }
    std::size_t start = 0;
    try {
      start = static_cast<std::size_t>(std::stoull(argv[2].substr(1)));
    } catch (const std::exception&) {
      return Exit(1, {}, "tail: invalid number of bytes: " + argv[2]);
    }
    const std::size_t offset = start == 0U ? 0U : start - 1U;
    return Exit(0, offset >= file->second.size() ? std::string{} : file->second.substr(offset));
  }
  if (program == "sh") {
    if (argv.size() != 2U) {
      return Exit(2, {}, "sh: unsupported invocation");
    }
    if (host.files.count(argv[1]) == 0U) {
      return Exit(2, {}, "sh: 0: cannot open " + argv[1] + ": No such file");
    }
    if (host.spec.prepare_exit_code != 0) {
      return Exit(host.spec.prepare_exit_code, "Reading package lists...\n",
                  "E: Unable to locate package docker-ce");
    }
    host.spec.docker_available = true;
    return Exit(0, "Reading package lists...\ncontainer engine installed\n");
  }
  if (program == "docker") {
    if (!host.spec.docker_available) {
      return Exit(127, {}, "sh: 1: docker: not found");
    }
    return Docker(host, argv);
  }
  return Exit(127, {}, "sh: 1: " + program + ": not found");
}

CommandResult SimNetwork::Docker(HostState& host, const std::vector<std::string>& argv) {
  if (argv.size() < 2U) {
    return Exit(1, {}, "docker: missing command");
  }
  const std::string& sub = argv[1];
  if (sub == "version") {
    return Exit(0, host.spec.engine_version + "\n");
  }
  if (sub == "image" && argv.size() >= 4U && argv[2] == "inspect") {
    if (host.images.count(argv[3]) == 0U) {
      return Exit(1, "[]\n", "Error: No such image: " + argv[3]);
    }
    return Exit(0, "[{\"RepoTags\":[\"" + argv[3] + "\"]}]\n");
  }
  if (sub == "build") {
    return DockerBuild(host, argv);
  }
  if (sub == "create") {
    return DockerCreate(host, argv);
  }
  if (sub == "inspect") {
    return DockerInspect(host, argv);
  }
  if (sub == "start" || sub == "stop") {
    if (argv.size() < 3U) {
      return Exit(1, {}, "docker " + sub + ": requires a container");
    }
    const std::string& name = argv.back();
    const auto it = host.containers.find(name);
    if (it == host.containers.end()) {
      return Exit(1, {}, "Error response from daemon: No such container: " + name);
    }
    Container& container = it->second;
    if (sub == "start") {
      container.state = "running";
      container.polls_remaining = host.spec.run_polls;
      container.exit_code = host.spec.container_exit_code;
      return Exit(0, name + "\n");
    }
    if (host.spec.fail_stop) {
      return Exit(1, {}, "Error response from daemon: cannot stop container: " + name);
    }
    if (container.state == "running") {
      container.state = "exited";
      container.exit_code = 137;
    }
    return Exit(0, name + "\n");
  }
  if (sub == "rm") {
    if (argv.size() < 3U) {
      return Exit(1, {}, "docker rm: requires a container");
    }
    host.containers.erase(argv.back());
    return Exit(0, argv.back() + "\n");
  }
  return Exit(1, {}, "docker: '" + sub + "' is not a docker command.");
}

CommandResult SimNetwork::DockerBuild(HostState& host, const std::vector<std::string>& argv) {
  std::string tag;
  std::string dockerfile;
  std::string context;
  for (std::size_t i = 2; i < argv.size(); ++i) {
    if ((argv[i] == "-t" || argv[i] == "--tag") && i + 1U < argv.size()) {
      tag = argv[++i];
    } else if ((argv[i] == "-f" || argv[i] == "--file") && i + 1U < argv.size()) {
      dockerfile = argv[++i];
    } else {
      context = argv[i];
    }
  }
  if (tag.empty() || dockerfile.empty() || context.empty()) {
    return Exit(1, {}, "docker build: requires -t, -f and a context: " + JoinWords(argv));
  }
  const auto file = host.files.find(dockerfile);
  if (file == host.files.end()) {
    return Exit(1, {}, "unable to prepare context: unable to evaluate symlinks in Dockerfile "
                       "path: lstat " +
                           dockerfile + ": no such file or directory");
  }
  const std::string from = FromImage(file->second);
  if (from.rfind("tracr-", 0) == 0 && host.images.count(from) == 0U) {
    return Exit(1, {}, "ERROR: pull access denied for " + from);
  }
  bool failing = host.spec.fail_all_builds;
  for (const auto& pattern : host.spec.failing_build_tags) {
    failing = failing || Contains(tag, pattern);
  }
  if (failing) {
    return Exit(1, "Step 1/4 : FROM " + from + "\n",
                "ERROR: failed to solve: process \"/bin/sh -c pip install\" did not complete "
                "successfully: exit code: 1");
  }
  host.images.insert(tag);
  return Exit(0, "Successfully tagged " + tag + "\n");
}

CommandResult SimNetwork::DockerCreate(HostState& host, const std::vector<std::string>& argv) {
  static const std::set<std::string> kValueOptions = {"--name", "--memory", "--cpus", "-p",
                                                      "-v",     "-e",       "--label"};
  std::string name;
  std::string image;
  std::string log_dir;
  for (std::size_t i = 2; i < argv.size(); ++i) {
    const std::string& arg = argv[i];
    if (kValueOptions.count(arg) != 0U && i + 1U < argv.size()) {
      const std::string& value = argv[++i];
      if (arg == "--name") {
        name = value;
      } else if (arg == "-v") {
        const std::size_t colon = value.find(':');
        if (colon != std::string::npos) {
          std::string target = value.substr(colon + 1U);
          const std::size_t mode = target.find(':');
          if (mode != std::string::npos) {
            target.resize(mode);
          }
          if (target == kTelemetryMountPoint) {
            log_dir = value.substr(0, colon);
          }
        }
      }
      continue;
    }
    if (!arg.empty() && arg[0] == '-') {
      continue;
    }
    image = arg;
    break;
  }
  if (name.empty() || image.empty()) {
    return Exit(125, {}, "docker create: requires --name and an image");
  }
  if (host.images.count(image) == 0U) {
    return Exit(125, {}, "Unable to find image '" + image + "' locally");
  }
  if (host.containers.count(name) != 0U) {
    return Exit(125, {}, "Conflict. The container name \"/" + name + "\" is already in use");
  }
  Container container;
  container.image = image;
  container.log_dir = log_dir;
  host.containers.emplace(name, container);
  return Exit(0, "sha256:" + name + "\n");
}

CommandResult SimNetwork::DockerInspect(HostState& host, const std::vector<std::string>& argv) {
  if (argv.size() < 3U) {
    return Exit(1, {}, "docker inspect: requires a container");
  }
  const std::string& name = argv.back();
  const auto it = host.containers.find(name);
  if (it == host.containers.end()) {
    return Exit(1, "[]\n", "Error: No such object: " + name);
  }
  Container& container = it->second;
  if (container.state == "running" && container.polls_remaining >= 0) {
    if (container.polls_remaining > 0) {
      --container.polls_remaining;
    }
    if (container.polls_remaining == 0) {
      container.state = "exited";
      EmitTelemetry(host, container, true);
    } else {
      EmitTelemetry(host, container, false);
    }
  } else if (container.state == "running") {
    EmitTelemetry(host, container, false);
  }
  const int code = container.state == "exited" ? container.exit_code : 0;
  return Exit(0, container.state + " " + std::to_string(code) + "\n");
}

void SimNetwork::EmitTelemetry(HostState& host, Container& container, const bool flush_all) {
  if (container.log_dir.empty()) {
    return;
  }
  std::string& log = host.files[container.log_dir + "/telemetry.jsonl"];
  const auto& lines = host.spec.telemetry_lines;
  while (container.lines_emitted < lines.size()) {
    log += lines[container.lines_emitted];
    log.push_back('\n');
    ++container.lines_emitted;
    if (!flush_all) {
      break;
    }
  }
}

CommandResult SimNetwork::Copy(const std::string& host, const fs::path& local_path,
                               const std::string& remote_path,
                               const TransferDirection direction) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = hosts_.find(host);
  if (it == hosts_.end()) {
    CommandResult result = Exit(255, {}, "ssh: Could not resolve hostname " + host);
    result.transport_failed = true;
    return result;
  }
  HostState& state = it->second;
  const std::string label = std::string("scp ") + ToString(direction) + " " +
                            local_path.string() + " " + remote_path;
  state.log.push_back(label);
  global_log_.push_back(host + " " + label);

  std::string read_error;
  if (direction == TransferDirection::kPush) {
    std::string contents;
    if (!core::ReadTextFile(local_path, contents, read_error)) {
      return Exit(1, {}, "scp: " + local_path.string() + ": No such file or directory");
    }
    if (state.spec.corrupt_pushes) {
      if (contents.empty()) {
        contents.push_back('\0');
      } else {
        contents[0] = static_cast<char>(contents[0] ^ 0x01);
      }
    }
    if (state.spec.truncate_pushes && !contents.empty()) {
      contents.pop_back();
    }
    state.files[remote_path] = std::move(contents);
    return Exit(0);
  }

  const auto file = state.files.find(remote_path);
  if (file == state.files.end()) {
    return Exit(1, {}, "scp: " + remote_path + ": No such file or directory");
  }
  if (!core::WriteTextFileAtomic(local_path, file->second, read_error)) {
    return Exit(1, {}, "scp: " + local_path.string() + ": " + read_error);
  }
  return Exit(0);
}

SimShell::SimShell(SimNetwork& network, registry::Device device)
    : network_(network), device_(std::move(device)) {}

SimShell::~SimShell() {
  Close();
}

OpenOutcome SimShell::Open(std::chrono::milliseconds /*timeout*/) {
  OpenOutcome outcome = network_.Open(device_.host);
  open_ = outcome.ok;
  return outcome;
}

bool SimShell::Run(const std::string& command, const std::chrono::milliseconds timeout,
                   const core::CancellationToken* cancel, CommandResult& result,
                   std::string& error) {
  error.clear();
  if (!open_) {
    error = "control channel to " + device_.host + " is not open";
    return false;
  }
  result = network_.Execute(device_.host, command, timeout, cancel);
  return true;
}

bool SimShell::Copy(const fs::path& local_path, const std::string& remote_path,
                    const TransferDirection direction, std::chrono::milliseconds /*timeout*/,
                    const core::CancellationToken* /*cancel*/, CommandResult& result,
                    std::string& error) {
  error.clear();
  if (!open_) {
    error = "control channel to " + device_.host + " is not open";
    return false;
  }
  result = network_.Copy(device_.host, local_path, remote_path, direction);
  return true;
}

void SimShell::Close() {
  if (!open_) {
    return;
  }
  open_ = false;
  network_.Release(device_.host);
}

std::unique_ptr<IRemoteShell> SimShellFactory::Create(const registry::Device& device) {
  return std::make_unique<SimShell>(network_, device);
}

} // namespace tracr::remote::sim
