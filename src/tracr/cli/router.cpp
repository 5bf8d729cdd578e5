#include "tracr/cli/router.hpp"

#include "core/errors/error.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/id_utils.hpp"
#include "core/logging/logger.hpp"
#include "deploy/orchestrator.hpp"
#include "deploy/run_record.hpp"
#include "experiment/binding_validator.hpp"
#include "experiment/experiment_catalog.hpp"
#include "network/discovery.hpp"
#include "network/lan_config_store.hpp"
#include "network/lan_controller.hpp"
#include "network/subnet.hpp"
#include "registry/device_registry.hpp"
#include "remote/connection_manager.hpp"
#include "remote/openssh_shell.hpp"
#include "telemetry/aggregator.hpp"
#include "telemetry/collector.hpp"
#include "tracr/config/controller_config.hpp"

#include <algorithm>
#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace tracr::cli {

namespace {

using core::errors::Error;
using core::errors::ErrorKind;

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitDescriptorInvalid =
    core::errors::ToInt(core::errors::ExitCode::kDescriptorInvalid);
constexpr int kExitConnectFailed = core::errors::ToInt(core::errors::ExitCode::kConnectFailed);
constexpr int kExitRunFailed = core::errors::ToInt(core::errors::ExitCode::kRunFailed);
constexpr int kExitRegistryConflict =
    core::errors::ToInt(core::errors::ExitCode::kRegistryConflict);


// Set from the SIGINT handler; a watcher thread turns it into an abort.
std::atomic<bool> g_interrupt_requested{false};

void HandleInterrupt(int /*signal*/) {
  g_interrupt_requested.store(true);
}

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  tracr [--config <path>] [--log-level <debug|info|warn|error>] <command>\n"
      << "\n"
      << "commands:\n"
      << "  setup controller --host <ip> --mac <mac> --user <user> [--arch <arch>] "
         "[--subnet <cidr>] [--name <alias>] [--identity <file>] [--port <n>]\n"
      << "  device ls [--role <controller|participant>] [--arch <arch>]\n"
      << "  device add --name <alias> --host <ip> --mac <mac> --arch <arch> --user <user> "
         "[--identity <file>] [--port <n>] [--os <family>]\n"
      << "  device rm <device_id>\n"
      << "  device update <device_id> [--name ..] [--host ..] [--mac ..] [--arch ..] "
         "[--user ..] [--identity ..] [--port ..] [--os ..]\n"
      << "  device prepare <device_id> --script <path>\n"
      << "  network discover <cidr> [--register]\n"
      << "  network connect\n"
      << "  experiment ls\n"
      << "  experiment add <name>\n"
      << "  experiment validate <name>\n"
      << "  experiment run <name>\n"
      << "  telemetry aggregate <run_id> [--csv]\n"
      << "  version\n";
}

int ExitCodeFor(const Error& error) {
  switch (error.kind) {
  case ErrorKind::kMalformedDescriptor:
  case ErrorKind::kValidation:
  case ErrorKind::kUnsatisfiedConstraint:
    return kExitDescriptorInvalid;
  case ErrorKind::kConnection:
  case ErrorKind::kTimeout:
  case ErrorKind::kDeviceBusy:
    return kExitConnectFailed;
  case ErrorKind::kDuplicateDevice:
  case ErrorKind::kInvalidState:
  case ErrorKind::kNotFound:
    return kExitRegistryConflict;
  default:
    return kExitFailure;
  }
}

int ReportError(std::string_view context, const Error& error) {
  std::cerr << "error: " << context << ": " << core::errors::FormatError(error) << '\n';
  return ExitCodeFor(error);
}

struct GlobalOptions {
  std::string config_path;
  std::optional<core::logging::LogLevel> log_level;
};

// Flag parsing shared by every subcommand: `--key value` pairs, bare
// `--switch` flags, and positional arguments in order.
struct ParsedArgs {
  std::map<std::string, std::string, std::less<>> values;
  std::map<std::string, bool, std::less<>> switches;
  std::vector<std::string> positionals;

  bool Has(std::string_view key) const {
    return values.find(key) != values.end();
  }

  std::string Value(std::string_view key) const {
    const auto it = values.find(key);
    return it == values.end() ? std::string{} : it->second;
  }

  bool Switch(std::string_view key) const {
    return switches.find(key) != switches.end();
  }
};

bool ParseArgs(const std::vector<std::string_view>& args,
               const std::vector<std::string_view>& value_options,
               const std::vector<std::string_view>& switch_options, ParsedArgs& parsed,
               std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token.size() > 2U && token.substr(0, 2) == "--") {
      if (std::find(switch_options.begin(), switch_options.end(), token) !=
          switch_options.end()) {
        parsed.switches[std::string(token)] = true;
        continue;
      }
      if (std::find(value_options.begin(), value_options.end(), token) ==
          value_options.end()) {
        error = "unknown option: " + std::string(token);
        return false;
      }
      if (i + 1 >= args.size()) {
        error = "missing value for " + std::string(token);
        return false;
      }
      parsed.values[std::string(token)] = std::string(args[i + 1]);
      ++i;
      continue;
    }
    parsed.positionals.emplace_back(token);
  }
  return true;
}

bool RequireOptions(const ParsedArgs& parsed, const std::vector<std::string_view>& required,
                    std::string& error) {
  for (const auto key : required) {
    if (!parsed.Has(key) || parsed.Value(key).empty()) {
      error = "missing required option " + std::string(key);
      return false;
    }
  }
  return true;
}

bool ParsePort(const std::string& text, std::uint16_t& port, std::string& error) {
  unsigned value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size() || value == 0U || value > 65535U) {
    error = "invalid port '" + text + "' (expected 1-65535)";
    return false;
  }
  port = static_cast<std::uint16_t>(value);
  return true;
}

// Everything a device-touching command needs, built from the controller
// config in dependency order.
struct CommandContext {
  config::ControllerConfig config;
  std::unique_ptr<core::logging::Logger> logger;
  std::unique_ptr<network::LanConfigStore> store;
  std::unique_ptr<registry::DeviceRegistry> registry;
  std::unique_ptr<remote::OpenSshShellFactory> ssh_factory;
  std::unique_ptr<remote::ConnectionManager> connections;
  std::unique_ptr<network::LanController> controller;
};

bool OpenContext(const GlobalOptions& global, const DispatchEnvironment& environment,
                 CommandContext& context, int& exit_code) {
  const fs::path home = config::ResolveTracrHome();
  const fs::path config_path = global.config_path.empty()
                                   ? home / "controller_config.json"
                                   : fs::path(global.config_path);
  std::string config_error;
  if (!config::LoadControllerConfig(config_path, home, context.config, config_error)) {
    std::cerr << "error: invalid controller config: " << config_error << '\n';
    exit_code = kExitUsage;
    return false;
  }
  if (global.log_level.has_value()) {
    context.config.log_level = *global.log_level;
  }

  context.logger = std::make_unique<core::logging::Logger>(context.config.log_level);
  context.store = std::make_unique<network::LanConfigStore>(context.config.network_file,
                                                            context.config.lan_name);
  context.registry = std::make_unique<registry::DeviceRegistry>(context.store.get());
  Error error;
  if (!context.registry->Load(error)) {
    exit_code = ReportError("failed to load network file " +
                                context.config.network_file.string(),
                            error);
    return false;
  }

  remote::IRemoteShellFactory* factory = environment.shell_factory;
  if (factory == nullptr) {
    context.ssh_factory =
        std::make_unique<remote::OpenSshShellFactory>(config::ToOpenSshOptions(context.config));
    factory = context.ssh_factory.get();
  }
  context.connections = std::make_unique<remote::ConnectionManager>(
      *factory, config::ToConnectionOptions(context.config), *context.logger);
  context.controller = std::make_unique<network::LanController>(
      *context.registry, *context.store, *context.connections, *context.logger,
      network::LanControllerSettings{
          .experiments_root = context.config.experiments_root,
          .probe_timeout = std::chrono::milliseconds(context.config.ssh.command_timeout_ms),
      });
  return true;
}

void PrintDevice(const registry::Device& device) {
  std::cout << device.id << "  " << registry::ToString(device.role) << "  "
            << registry::ToString(device.state) << "  "
            << (device.name.empty() ? "-" : device.name) << "  "
            << registry::DescribeEndpoint(device) << "  " << (device.mac.empty() ? "-" : device.mac)
            << "  " << (device.arch.empty() ? "-" : device.arch) << "  "
            << (device.os_family.empty() ? "-" : device.os_family + " " + device.os_version)
            << '\n';
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }
  std::cout << "tracr 0.1.0\n";
  return kExitSuccess;
}

int CommandSetupController(const GlobalOptions& global, const DispatchEnvironment& environment,
                           const std::vector<std::string_view>& args) {
  ParsedArgs parsed;
  std::string error;
  if (!ParseArgs(args,
                 {"--host", "--mac", "--user", "--arch", "--subnet", "--name", "--identity",
                  "--port"},
                 {}, parsed, error) ||
      !RequireOptions(parsed, {"--host", "--mac", "--user"}, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  if (!parsed.positionals.empty()) {
    std::cerr << "error: setup controller does not accept positional arguments\n";
    return kExitUsage;
  }

  registry::Device attributes;
  attributes.host = parsed.Value("--host");
  attributes.mac = parsed.Value("--mac");
  attributes.user = parsed.Value("--user");
  attributes.arch = parsed.Value("--arch");
  attributes.name = parsed.Value("--name");
  attributes.identity_file = parsed.Value("--identity");
  if (parsed.Has("--port") && !ParsePort(parsed.Value("--port"), attributes.port, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  const std::string subnet = parsed.Value("--subnet");
  if (!subnet.empty()) {
    network::Ipv4Subnet parsed_subnet;
    if (!network::ParseCidr(subnet, parsed_subnet, error)) {
      std::cerr << "error: " << error << '\n';
      return kExitUsage;
    }
  }

  CommandContext context;
  int exit_code = kExitSuccess;
  if (!OpenContext(global, environment, context, exit_code)) {
    return exit_code;
  }
  std::string device_id;
  Error setup_error;
  if (!context.controller->SetupController(attributes, subnet, device_id, setup_error)) {
    return ReportError("controller setup failed", setup_error);
  }
  std::cout << "controller: " << device_id << '\n';
  std::cout << "network_file: " << context.config.network_file.string() << '\n';
  std::cout << "experiments_root: " << context.config.experiments_root.string() << '\n';
  return kExitSuccess;
}

int CommandSetup(const GlobalOptions& global, const DispatchEnvironment& environment,
                 const std::vector<std::string_view>& args) {
  if (args.empty() || args.front() != "controller") {
    std::cerr << "error: setup requires the 'controller' subcommand\n";
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  return CommandSetupController(global, environment,
                                std::vector<std::string_view>(args.begin() + 1, args.end()));
}

// Fields shared by `device add` and `device update`.
bool FillDevicePatch(const ParsedArgs& parsed, registry::DevicePatch& patch,
                     std::string& error) {
  const auto assign = [&parsed](std::string_view key, std::optional<std::string>& field) {
    if (parsed.Has(key)) {
      field = parsed.Value(key);
    }
  };
  assign("--name", patch.name);
  assign("--host", patch.host);
  assign("--mac", patch.mac);
  assign("--arch", patch.arch);
  assign("--user", patch.user);
  assign("--identity", patch.identity_file);
  assign("--os", patch.os_family);
  if (parsed.Has("--port")) {
    std::uint16_t port = 22;
    if (!ParsePort(parsed.Value("--port"), port, error)) {
      return false;
    }
    patch.port = port;
  }
  return true;
}

const std::vector<std::string_view> kDeviceFieldOptions = {
    "--name", "--host", "--mac", "--arch", "--user", "--identity", "--port", "--os"};

int CommandDevice(const GlobalOptions& global, const DispatchEnvironment& environment,
                  const std::vector<std::string_view>& args) {
  if (args.empty()) {
    std::cerr << "error: device requires a subcommand (ls|add|rm|update|prepare)\n";
    return kExitUsage;
  }
  const std::string_view subcommand = args.front();
  const std::vector<std::string_view> sub_args(args.begin() + 1, args.end());

  ParsedArgs parsed;
  std::string error;
  if (subcommand == "ls") {
    if (!ParseArgs(sub_args, {"--role", "--arch"}, {}, parsed, error)) {
      std::cerr << "error: " << error << '\n';
      return kExitUsage;
    }
  } else if (subcommand == "add") {
    if (!ParseArgs(sub_args, kDeviceFieldOptions, {}, parsed, error) ||
        !RequireOptions(parsed, {"--name", "--host", "--mac", "--arch", "--user"}, error)) {
      std::cerr << "error: " << error << '\n';
      return kExitUsage;
    }
  } else if (subcommand == "rm" || subcommand == "update") {
    if (!ParseArgs(sub_args, subcommand == "rm" ? std::vector<std::string_view>{}
                                                : kDeviceFieldOptions,
                   {}, parsed, error)) {
      std::cerr << "error: " << error << '\n';
      return kExitUsage;
    }
    if (parsed.positionals.size() != 1U) {
      std::cerr << "error: device " << subcommand << " requires exactly 1 argument: <device_id>\n";
      return kExitUsage;
    }
  } else if (subcommand == "prepare") {
    if (!ParseArgs(sub_args, {"--script"}, {}, parsed, error) ||
        !RequireOptions(parsed, {"--script"}, error)) {
      std::cerr << "error: " << error << '\n';
      return kExitUsage;
    }
    if (parsed.positionals.size() != 1U) {
      std::cerr << "error: device prepare requires exactly 1 argument: <device_id>\n";
      return kExitUsage;
    }
  } else {
    std::cerr << "error: unknown device subcommand: " << subcommand << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  registry::DevicePatch patch;
  if (!FillDevicePatch(parsed, patch, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  registry::DeviceFilter filter;
  if (parsed.Has("--role")) {
    registry::DeviceRole role = registry::DeviceRole::kParticipant;
    if (!registry::ParseDeviceRole(parsed.Value("--role"), role)) {
      std::cerr << "error: invalid role '" << parsed.Value("--role")
                << "' (expected controller|participant)\n";
      return kExitUsage;
    }
    filter.role = role;
  }
  if (subcommand == "ls" && parsed.Has("--arch")) {
    filter.arch = parsed.Value("--arch");
  }

  CommandContext context;
  int exit_code = kExitSuccess;
  if (!OpenContext(global, environment, context, exit_code)) {
    return exit_code;
  }
  Error registry_error;

  if (subcommand == "ls") {
    const auto devices = context.registry->List(filter);
    for (const auto& device : devices) {
      PrintDevice(device);
    }
    std::cout << "devices: " << devices.size() << '\n';
    return kExitSuccess;
  }

  if (subcommand == "add") {
    registry::Device attributes;
    attributes.name = *patch.name;
    attributes.host = *patch.host;
    attributes.mac = *patch.mac;
    attributes.arch = *patch.arch;
    attributes.user = *patch.user;
    attributes.identity_file = patch.identity_file.value_or("");
    attributes.os_family = patch.os_family.value_or("");
    attributes.port = patch.port.value_or(22);
    attributes.role = registry::DeviceRole::kParticipant;
    std::string device_id;
    if (!context.registry->Register(attributes, device_id, registry_error)) {
      return ReportError("device registration failed", registry_error);
    }
    std::cout << "device registered: " << device_id << '\n';
    return kExitSuccess;
  }

  const std::string& device_id = parsed.positionals.front();
  if (subcommand == "prepare") {
    network::PrepareReport prepare;
    Error prepare_error;
    const bool prepared = context.controller->PrepareDevice(
        device_id, fs::path(parsed.Value("--script")), prepare, prepare_error);
    if (!prepare.output.empty()) {
      std::cout << prepare.output;
      if (prepare.output.back() != '\n') {
        std::cout << '\n';
      }
    }
    if (!prepared) {
      return ReportError("host preparation failed", prepare_error);
    }
    std::cout << "device prepared: " << device_id << "  engine=" << prepare.engine_version
              << (prepare.prepared_before ? "  (already prepared)" : "") << '\n';
    return kExitSuccess;
  }
  if (subcommand == "rm") {
    if (!context.registry->Remove(device_id, registry_error)) {
      return ReportError("device removal failed", registry_error);
    }
    std::cout << "device removed: " << device_id << '\n';
    return kExitSuccess;
  }

  if (!context.registry->Update(device_id, patch, registry_error)) {
    return ReportError("device update failed", registry_error);
  }
  registry::Device updated;
  if (context.registry->Get(device_id, updated, registry_error)) {
    PrintDevice(updated);
  }
  return kExitSuccess;
}

int CommandNetworkDiscover(CommandContext& context, const DispatchEnvironment& environment,
                           const ParsedArgs& parsed) {
  network::Ipv4Subnet subnet;
  std::string error;
  if (!network::ParseCidr(parsed.positionals.front(), subnet, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  network::TcpPortProber tcp_prober;
  network::IHostProber& prober =
      environment.prober != nullptr ? *environment.prober : static_cast<network::IHostProber&>(
                                                                tcp_prober);
  network::DiscoverySequence sequence = context.controller->Discover(subnet, prober);
  const bool do_register = parsed.Switch("--register");

  std::size_t candidates = 0;
  std::size_t registered = 0;
  registry::Device candidate;
  while (sequence.Next(candidate)) {
    ++candidates;
    std::cout << "candidate: " << candidate.host << "  "
              << (candidate.mac.empty() ? "-" : candidate.mac) << "  "
              << (candidate.name.empty() ? "-" : candidate.name) << '\n';
    if (!do_register) {
      continue;
    }
    std::string device_id;
    Error register_error;
    if (context.registry->Register(candidate, device_id, register_error)) {
      ++registered;
      std::cout << "  registered: " << device_id << '\n';
    } else {
      std::cout << "  skipped: " << core::errors::FormatError(register_error) << '\n';
    }
  }

  Error record_error;
  if (!context.controller->RecordDiscovery(subnet, record_error)) {
    return ReportError("failed to record discovery", record_error);
  }
  std::cout << "subnet: " << network::FormatCidr(subnet) << '\n';
  std::cout << "probed: " << sequence.probed() << '\n';
  std::cout << "candidates: " << candidates << '\n';
  if (do_register) {
    std::cout << "registered: " << registered << '\n';
  }
  return kExitSuccess;
}

int CommandNetworkConnect(CommandContext& context) {
  const auto statuses = context.controller->EstablishAll();
  std::size_t unreachable = 0;
  for (const auto& [device_id, status] : statuses) {
    std::cout << device_id << "  " << (status.reachable ? "reachable" : "unreachable") << "  "
              << (status.prepared ? "prepared" : "not_prepared")
              << "  attempts=" << status.attempts;
    if (!status.engine_version.empty()) {
      std::cout << "  engine=" << status.engine_version;
    }
    if (status.identity_stamped) {
      std::cout << "  identity=stamped";
    }
    if (!status.error.ok()) {
      std::cout << "  error=\"" << core::errors::FormatError(status.error) << '"';
    }
    std::cout << '\n';
    unreachable += status.reachable ? 0U : 1U;
  }
  std::cout << "devices: " << statuses.size() << '\n';
  std::cout << "unreachable: " << unreachable << '\n';
  return unreachable == 0U ? kExitSuccess : kExitConnectFailed;
}

int CommandNetwork(const GlobalOptions& global, const DispatchEnvironment& environment,
                   const std::vector<std::string_view>& args) {
  if (args.empty()) {
    std::cerr << "error: network requires a subcommand (discover|connect)\n";
    return kExitUsage;
  }
  const std::string_view subcommand = args.front();
  const std::vector<std::string_view> sub_args(args.begin() + 1, args.end());
  ParsedArgs parsed;
  std::string error;
  if (subcommand == "discover") {
    if (!ParseArgs(sub_args, {}, {"--register"}, parsed, error)) {
      std::cerr << "error: " << error << '\n';
      return kExitUsage;
    }
    if (parsed.positionals.size() != 1U) {
      std::cerr << "error: network discover requires exactly 1 argument: <cidr>\n";
      return kExitUsage;
    }
  } else if (subcommand == "connect") {
    if (!sub_args.empty()) {
      std::cerr << "error: network connect does not accept arguments\n";
      return kExitUsage;
    }
  } else {
    std::cerr << "error: unknown network subcommand: " << subcommand << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  CommandContext context;
  int exit_code = kExitSuccess;
  if (!OpenContext(global, environment, context, exit_code)) {
    return exit_code;
  }
  if (subcommand == "discover") {
    return CommandNetworkDiscover(context, environment, parsed);
  }
  return CommandNetworkConnect(context);
}

void PrintPlan(const experiment::BindingPlan& plan) {
  for (std::size_t w = 0; w < plan.waves.size(); ++w) {
    std::cout << "wave " << w << " (order " << plan.waves[w].order << "):\n";
    for (const std::size_t index : plan.waves[w].bindings) {
      const auto& binding = plan.bindings[index];
      std::cout << "  " << binding.role << " -> " << binding.device_id << " [" << binding.arch
                << "]\n";
    }
  }
  for (const auto& warning : plan.warnings) {
    std::cout << "warning: " << warning << '\n';
  }
}

void PrintRunRecord(const deploy::RunRecord& record, const fs::path& run_dir) {
  std::cout << "run_id: " << record.run_id << '\n';
  std::cout << "status: " << deploy::ToString(record.status) << '\n';
  if (record.aborted) {
    std::cout << "aborted: true\n";
  }
  for (const auto& binding : record.bindings) {
    std::cout << "  " << binding.role << "  " << binding.device_id << "  "
              << deploy::ToReportedStatus(binding.state);
    if (binding.exit_code.has_value()) {
      std::cout << "  exit_code=" << *binding.exit_code;
    }
    if (!binding.error_code.empty()) {
      std::cout << "  " << binding.error_code << ": " << binding.error_message;
    }
    if (!binding.note.empty()) {
      std::cout << "  (" << binding.note << ')';
    }
    std::cout << '\n';
  }
  for (const auto& device_id : record.unconfirmed_stops) {
    std::cout << "warning: container on " << device_id << " may still be running\n";
  }
  for (const auto& warning : record.warnings) {
    std::cout << "warning: " << warning << '\n';
  }
  std::cout << "run_dir: " << run_dir.string() << '\n';
}

int CommandExperimentRun(CommandContext& context, const std::string& name) {
  experiment::ExperimentCatalog catalog(context.config.experiments_root);
  experiment::Experiment loaded;
  experiment::ValidationReport report;
  Error error;
  if (!catalog.Load(name, loaded, report, error)) {
    if (!report.issues.empty()) {
      std::cerr << experiment::FormatIssues(report) << '\n';
    }
    return ReportError("cannot load experiment '" + name + "'", error);
  }

  const deploy::OrchestratorOptions options = config::ToOrchestratorOptions(context.config);
  telemetry::TelemetryCollector collector(options.runs_root, loaded.log_file,
                                          *context.logger, options.command_timeout,
                                          options.transfer_timeout);
  deploy::Orchestrator orchestrator(*context.registry, *context.connections, options,
                                    *context.logger, &collector);
  orchestrator.SetTransitionObserver([](const std::string& role, deploy::BindingState state) {
    std::cout << "[" << role << "] " << deploy::ToString(state) << '\n';
  });

  g_interrupt_requested.store(false);
  const auto previous_handler = std::signal(SIGINT, HandleInterrupt);
  std::atomic<bool> run_done{false};
  std::thread interrupt_watcher([&orchestrator, &run_done]() {
    while (!run_done.load()) {
      if (g_interrupt_requested.exchange(false)) {
        orchestrator.Abort();
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
  });

  const std::string run_id = core::MakeRunId(std::chrono::system_clock::now());
  deploy::RunRecord record;
  const bool dispatched = context.controller->OrchestrateDeployment(loaded, orchestrator, run_id,
                                                                    report, record, error);

  run_done.store(true);
  interrupt_watcher.join();
  std::signal(SIGINT, previous_handler == SIG_ERR ? SIG_DFL : previous_handler);

  if (!dispatched) {
    if (!report.issues.empty()) {
      std::cerr << experiment::FormatIssues(report) << '\n';
    }
    return ReportError("experiment run blocked", error);
  }

  const fs::path run_dir = options.runs_root / run_id;
  telemetry::ExperimentRecord aggregate;
  Error aggregate_error;
  if (telemetry::AggregateRun(options.runs_root, run_id, loaded.log_file, aggregate,
                              aggregate_error)) {
    fs::path csv_path;
    std::string csv_error;
    if (!telemetry::WriteMetricsCsv(aggregate, run_dir, csv_path, csv_error)) {
      context.logger->Warn("metrics.csv not written", {{"error", csv_error}});
    }
  } else {
    context.logger->Warn("telemetry aggregation failed",
                         {{"error", core::errors::FormatError(aggregate_error)}});
  }

  PrintRunRecord(record, run_dir);
  return record.status == deploy::RunStatus::kSucceeded ? kExitSuccess : kExitRunFailed;
}

int CommandExperiment(const GlobalOptions& global, const DispatchEnvironment& environment,
                      const std::vector<std::string_view>& args) {
  if (args.empty()) {
    std::cerr << "error: experiment requires a subcommand (ls|add|validate|run)\n";
    return kExitUsage;
  }
  const std::string_view subcommand = args.front();
  const std::vector<std::string_view> sub_args(args.begin() + 1, args.end());
  if (subcommand == "ls") {
    if (!sub_args.empty()) {
      std::cerr << "error: experiment ls does not accept arguments\n";
      return kExitUsage;
    }
  } else if (subcommand == "add" || subcommand == "validate" || subcommand == "run") {
    if (sub_args.size() != 1U || sub_args.front().empty() || sub_args.front().front() == '-') {
      std::cerr << "error: experiment " << subcommand << " requires exactly 1 argument: <name>\n";
      return kExitUsage;
    }
  } else {
    std::cerr << "error: unknown experiment subcommand: " << subcommand << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  CommandContext context;
  int exit_code = kExitSuccess;
  if (!OpenContext(global, environment, context, exit_code)) {
    return exit_code;
  }
  experiment::ExperimentCatalog catalog(context.config.experiments_root);
  Error error;

  if (subcommand == "ls") {
    const auto entries = catalog.List();
    for (const auto& entry : entries) {
      std::cout << entry.name << "  "
                << (entry.experiment_id.empty() ? "-" : entry.experiment_id) << "  constraints="
                << entry.constraint_count;
      if (!entry.problem.empty()) {
        std::cout << "  problem=\"" << entry.problem << '"';
      }
      std::cout << '\n';
    }
    std::cout << "experiments: " << entries.size() << '\n';
    return kExitSuccess;
  }

  const std::string name(sub_args.front());
  if (subcommand == "add") {
    experiment::Experiment created;
    if (!catalog.Create(name, created, error)) {
      std::cerr << "error: cannot create experiment '" << name
                << "': " << core::errors::FormatError(error) << '\n';
      return error.kind == ErrorKind::kValidation ? kExitUsage : kExitFailure;
    }
    std::cout << "experiment created: " << created.directory.string() << '\n';
    std::cout << "experiment_id: " << created.id << '\n';
    return kExitSuccess;
  }

  if (subcommand == "run") {
    return CommandExperimentRun(context, name);
  }

  experiment::Experiment loaded;
  experiment::ValidationReport report;
  if (!catalog.Load(name, loaded, report, error)) {
    if (!report.issues.empty()) {
      std::cerr << experiment::FormatIssues(report) << '\n';
    }
    std::cerr << "error: cannot load experiment '" << name
              << "': " << core::errors::FormatError(error) << '\n';
    return error.kind == ErrorKind::kNotFound ? kExitFailure : kExitDescriptorInvalid;
  }
  experiment::BindingPlan plan;
  if (!experiment::Validate(loaded, context.registry->List(), plan, report, error)) {
    if (!report.issues.empty()) {
      std::cerr << experiment::FormatIssues(report) << '\n';
    }
    return ReportError("experiment '" + name + "' is not deployable", error);
  }
  std::cout << "experiment valid: " << name << '\n';
  PrintPlan(plan);
  return kExitSuccess;
}

int CommandTelemetry(const GlobalOptions& global, const DispatchEnvironment& environment,
                     const std::vector<std::string_view>& args) {
  if (args.empty() || args.front() != "aggregate") {
    std::cerr << "error: telemetry requires the 'aggregate' subcommand\n";
    return kExitUsage;
  }
  ParsedArgs parsed;
  std::string error;
  if (!ParseArgs(std::vector<std::string_view>(args.begin() + 1, args.end()), {}, {"--csv"},
                 parsed, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  if (parsed.positionals.size() != 1U) {
    std::cerr << "error: telemetry aggregate requires exactly 1 argument: <run_id>\n";
    return kExitUsage;
  }

  CommandContext context;
  int exit_code = kExitSuccess;
  if (!OpenContext(global, environment, context, exit_code)) {
    return exit_code;
  }
  const std::string& run_id = parsed.positionals.front();
  std::string log_file = experiment::kDefaultLogFileName;
  experiment::Experiment snapshot;
  Error snapshot_error;
  if (experiment::ExperimentCatalog::LoadSnapshot(context.config.runs_root / run_id, snapshot,
                                                  snapshot_error)) {
    log_file = snapshot.log_file;
  } else if (snapshot_error.kind != ErrorKind::kNotFound) {
    std::cerr << "error: cannot read descriptor snapshot of run '" << run_id
              << "': " << core::errors::FormatError(snapshot_error) << '\n';
    return kExitFailure;
  }
  telemetry::ExperimentRecord record;
  Error aggregate_error;
  if (!telemetry::AggregateRun(context.config.runs_root, run_id, log_file, record,
                               aggregate_error)) {
    std::cerr << "error: cannot aggregate run '" << run_id
              << "': " << core::errors::FormatError(aggregate_error) << '\n';
    return kExitFailure;
  }
  std::cout << telemetry::ToJson(record) << '\n';
  if (parsed.Switch("--csv")) {
    fs::path csv_path;
    if (!telemetry::WriteMetricsCsv(record, context.config.runs_root / run_id, csv_path, error)) {
      std::cerr << "error: failed to write metrics.csv: " << error << '\n';
      return kExitFailure;
    }
    std::cout << "metrics_csv: " << csv_path.string() << '\n';
  }
  return kExitSuccess;
}

bool ParseGlobalOptions(const std::vector<std::string_view>& args, GlobalOptions& global,
                        std::size_t& consumed, std::string& error) {
  consumed = 0;
  while (consumed < args.size()) {
    const std::string_view token = args[consumed];
    if (token != "--config" && token != "--log-level") {
      break;
    }
    if (consumed + 1 >= args.size()) {
      error = "missing value for " + std::string(token);
      return false;
    }
    const std::string_view value = args[consumed + 1];
    if (token == "--config") {
      global.config_path = std::string(value);
    } else {
      core::logging::LogLevel level = core::logging::LogLevel::kInfo;
      std::string level_error;
      if (!core::logging::ParseLogLevel(value, level, level_error)) {
        error = "invalid --log-level: " + level_error;
        return false;
      }
      global.log_level = level;
    }
    consumed += 2;
  }
  return true;
}

} // namespace

int Dispatch(int argc, char** argv) {
  return Dispatch(argc, argv, DispatchEnvironment{});
}

int Dispatch(int argc, char** argv, const DispatchEnvironment& environment) {
  const std::vector<std::string_view> all_args(argv + (argc > 0 ? 1 : 0), argv + argc);
  GlobalOptions global;
  std::size_t consumed = 0;
  std::string error;
  if (!ParseGlobalOptions(all_args, global, consumed, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  if (consumed >= all_args.size()) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command = all_args[consumed];
  const std::vector<std::string_view> args(all_args.begin() + static_cast<long>(consumed) + 1,
                                           all_args.end());

  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "setup") {
    return CommandSetup(global, environment, args);
  }
  if (command == "device") {
    return CommandDevice(global, environment, args);
  }
  if (command == "network") {
    return CommandNetwork(global, environment, args);
  }
  if (command == "experiment") {
    return CommandExperiment(global, environment, args);
  }
  if (command == "telemetry") {
    return CommandTelemetry(global, environment, args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace tracr::cli
