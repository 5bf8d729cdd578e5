#include "network/lan_controller.hpp"

#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"
#include "registry/device_registry.hpp"
#include "core/process.hpp"
#include "remote/capability_probe.hpp"
#include "remote/connection_manager.hpp"
#include "remote/device_identity.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace tracr::network {
namespace {

using core::errors::Error;
using core::errors::ErrorKind;

constexpr std::string_view kRemotePrepareDir = "~/.config/tracr/prepare";
constexpr std::size_t kPrepareOutputTail = 2048;

std::chrono::system_clock::time_point NowMillis() {
  return core::FromEpochMilliseconds(core::ToEpochMilliseconds(std::chrono::system_clock::now()));
}

std::string Tail(const std::string& text, const std::size_t limit) {
  return text.size() <= limit ? text : text.substr(text.size() - limit);
}

} // namespace

LanController::LanController(registry::DeviceRegistry& registry, LanConfigStore& store,
                             remote::ConnectionManager& connections,
                             core::logging::Logger& logger, LanControllerSettings settings)
    : registry_(registry), store_(store), connections_(connections), logger_(logger),
      settings_(std::move(settings)) {}

DiscoverySequence LanController::Discover(const Ipv4Subnet& subnet, IHostProber& prober) const {
  logger_.Info("discovery started", {{"subnet", FormatCidr(subnet)},
                                     {"hosts", std::to_string(subnet.HostCount())}});
  return DiscoverySequence(subnet, prober);
}

bool LanController::RecordDiscovery(const Ipv4Subnet& subnet, Error& error) {
  const LanDocument document = store_.Document();
  std::string store_error;
  if (!store_.SaveMetadata(document.lan.name, FormatCidr(subnet), NowMillis(),
                           document.experiments_root.empty()
                               ? settings_.experiments_root.string()
                               : document.experiments_root,
                           store_error)) {
    return core::errors::Fail(error, ErrorKind::kIo, store_error);
  }
  return true;
}

bool LanController::SetupController(const registry::Device& attributes,
                                    const std::string& subnet, std::string& device_id,
                                    Error& error) {
  const auto controllers = registry_.List({.role = registry::DeviceRole::kController});
  if (controllers.empty()) {
    registry::Device controller = attributes;
    controller.role = registry::DeviceRole::kController;
    if (!registry_.Register(controller, device_id, error)) {
      return false;
    }
    logger_.Info("controller registered", {{"device_id", device_id}, {"host", attributes.host}});
  } else {
    device_id = controllers.front().id;
    registry::DevicePatch patch;
    patch.host = attributes.host;
    patch.mac = attributes.mac;
    patch.user = attributes.user;
    if (!attributes.name.empty()) {
      patch.name = attributes.name;
    }
    if (!attributes.arch.empty()) {
      patch.arch = attributes.arch;
    }
    if (!attributes.identity_file.empty()) {
      patch.identity_file = attributes.identity_file;
    }
    if (!registry_.Update(device_id, patch, error)) {
      return false;
    }
    logger_.Info("controller updated", {{"device_id", device_id}, {"host", attributes.host}});
  }

  const LanDocument document = store_.Document();
  std::string store_error;
  if (!store_.SaveMetadata(document.lan.name, subnet.empty() ? document.lan.subnet : subnet,
                           std::nullopt, settings_.experiments_root.string(), store_error)) {
    return core::errors::Fail(error, ErrorKind::kIo, store_error);
  }
  return true;
}

bool LanController::Controller(ControllerNode& node, Error& error) const {
  const auto controllers = registry_.List({.role = registry::DeviceRole::kController});
  if (controllers.empty()) {
    return core::errors::Fail(error, ErrorKind::kNotFound,
                              "no controller registered (run `tracr setup controller`)");
  }
  const LanDocument document = store_.Document();
  const std::filesystem::path root = document.experiments_root.empty()
                                         ? settings_.experiments_root
                                         : std::filesystem::path(document.experiments_root);
  node = ControllerNode(controllers.front(), root, document.audit);
  return true;
}

bool LanController::CheckIdentity(remote::Session& session, bool& stamped, Error& error) {
  remote::IdentityOutcome outcome = remote::IdentityOutcome::kMatched;
  if (!remote::VerifyOrStampIdentity(connections_, session, settings_.probe_timeout, outcome,
                                     error)) {
    logger_.Warn("device identity check failed",
                 {{"device_id", session.device().id},
                  {"host", session.device().host},
                  {"error", core::errors::FormatError(error)}});
    return false;
  }
  stamped = outcome == remote::IdentityOutcome::kStamped;
  if (stamped) {
    logger_.Info("device identity stamped", {{"device_id", session.device().id},
                                              {"host", session.device().host}});
  }
  return true;
}

bool LanController::Resync(const registry::Device& device,
                           const remote::CapabilityReport& report, Error& error) {
  registry::DevicePatch patch;
  patch.os_family = report.os_family;
  patch.os_version = report.os_version;
  patch.last_synced_at = NowMillis();
  if (device.state == registry::ConfigState::kUnconfigured && !report.arch.empty()) {
    patch.arch = report.arch;
  }
  if (!registry_.Update(device.id, patch, error)) {
    logger_.Warn("device resync failed", {{"device_id", device.id},
                                          {"error", core::errors::FormatError(error)}});
    return false;
  }
  return true;
}

ConnectionStatus LanController::ConnectAndResync(const registry::Device& device) {
  ConnectionStatus status;
  std::unique_ptr<remote::Session> session;
  if (!connections_.Connect(device, session, status.error)) {
    status.attempts = status.error.attempts;
    logger_.Warn("device unreachable", {{"device_id", device.id},
                                        {"host", device.host},
                                        {"error", core::errors::FormatError(status.error)}});
    return status;
  }
  status.reachable = true;
  status.attempts = session->connect_attempts();

  if (!CheckIdentity(*session, status.identity_stamped, status.error)) {
    connections_.Close(*session);
    return status;
  }

  remote::CapabilityReport report;
  Error probe_error;
  if (!remote::ProbeCapabilities(connections_, *session, settings_.probe_timeout, report,
                                 probe_error)) {
    status.error = probe_error;
    connections_.Close(*session);
    return status;
  }
  connections_.Close(*session);
  status.prepared = report.prepared;
  status.engine_version = report.engine_version;

  Error resync_error;
  if (!Resync(device, report, resync_error)) {
    status.error = resync_error;
  }
  return status;
}

bool LanController::PrepareDevice(const std::string& device_id,
                                  const std::filesystem::path& script, PrepareReport& report,
                                  Error& error) {
  core::errors::Clear(error);
  report = PrepareReport{};
  registry::Device device;
  if (!registry_.Get(device_id, device, error)) {
    return false;
  }
  std::error_code ec;
  if (!std::filesystem::is_regular_file(script, ec)) {
    return core::errors::Fail(error, ErrorKind::kIo,
                              "host preparation script not found: " + script.string());
  }

  std::unique_ptr<remote::Session> session;
  if (!connections_.Connect(device, session, error)) {
    return false;
  }
  bool stamped = false;
  if (!CheckIdentity(*session, stamped, error)) {
    connections_.Close(*session);
    return false;
  }

  remote::CapabilityReport before;
  if (!remote::ProbeCapabilities(connections_, *session, settings_.probe_timeout, before,
                                 error)) {
    connections_.Close(*session);
    return false;
  }
  report.prepared_before = before.prepared;

  const std::string remote_dir(kRemotePrepareDir);
  const std::string remote_script = remote_dir + "/" + script.filename().string();
  remote::CommandResult result;
  logger_.Info("host preparation started", {{"device_id", device.id},
                                            {"script", script.filename().string()}});
  if (!connections_.Execute(*session, "mkdir -p " + core::ShellQuotePath(remote_dir),
                            settings_.probe_timeout, result, error) ||
      !connections_.Transfer(*session, script, remote_script, remote::TransferDirection::kPush,
                             settings_.probe_timeout, error)) {
    connections_.Close(*session);
    return false;
  }

  const bool ran = connections_.Execute(*session, "sh " + core::ShellQuotePath(remote_script),
                                        settings_.prepare_timeout, result, error);
  report.exit_code = ran ? result.exit_code : error.exit_code;
  report.output = Tail(result.stdout_text, kPrepareOutputTail);
  if (!ran) {
    logger_.Error("host preparation failed", {{"device_id", device.id},
                                              {"error", core::errors::FormatError(error)}});
    connections_.Close(*session);
    return false;
  }

  remote::CapabilityReport after;
  const bool probed = remote::ProbeCapabilities(connections_, *session, settings_.probe_timeout,
                                                after, error);
  connections_.Close(*session);
  if (!probed) {
    return false;
  }
  report.prepared = after.prepared;
  report.engine_version = after.engine_version;
  if (!after.prepared) {
    return core::errors::Fail(error, ErrorKind::kRemoteCommand,
                              "host preparation finished on " + device.id +
                                  " but no container engine answers");
  }
  logger_.Info("host preparation finished", {{"device_id", device.id},
                                             {"engine_version", after.engine_version}});
  return Resync(device, after, error);
}

std::map<std::string, ConnectionStatus> LanController::EstablishAll() {
  const std::vector<registry::Device> devices = registry_.List();
  std::vector<ConnectionStatus> statuses(devices.size());
  std::vector<std::thread> workers;
  workers.reserve(devices.size());
  for (std::size_t i = 0; i < devices.size(); ++i) {
    workers.emplace_back(
        [this, &devices, &statuses, i] { statuses[i] = ConnectAndResync(devices[i]); });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  std::map<std::string, ConnectionStatus> result;
  std::size_t reachable = 0;
  for (std::size_t i = 0; i < devices.size(); ++i) {
    reachable += statuses[i].reachable ? 1U : 0U;
    result.emplace(devices[i].id, std::move(statuses[i]));
  }
  logger_.Info("connectivity check finished",
               {{"devices", std::to_string(devices.size())},
                {"reachable", std::to_string(reachable)}});
  return result;
}

bool LanController::ConfirmReachable(const experiment::BindingPlan& plan, Error& error) {
  for (const auto& binding : plan.bindings) {
    registry::Device device;
    if (!registry_.Get(binding.device_id, device, error)) {
      return false;
    }
    std::unique_ptr<remote::Session> session;
    Error connect_error;
    if (!connections_.Connect(device, session, connect_error)) {
      return core::errors::Fail(error, ErrorKind::kUnsatisfiedConstraint,
                                "role '" + binding.role + "' is bound to unreachable device " +
                                    device.id + " (" + device.host + "): " +
                                    core::errors::FormatError(connect_error));
    }
    bool stamped = false;
    const bool verified = CheckIdentity(*session, stamped, error);
    connections_.Close(*session);
    if (!verified) {
      return false;
    }
  }
  return true;
}

bool LanController::OrchestrateDeployment(const experiment::Experiment& experiment,
                                          deploy::Orchestrator& orchestrator,
                                          const std::string& run_id,
                                          experiment::ValidationReport& report,
                                          deploy::RunRecord& record, Error& error) {
  ControllerNode controller(registry::Device{}, settings_.experiments_root);
  if (!Controller(controller, error)) {
    return false;
  }

  experiment::BindingPlan plan;
  if (!experiment::Validate(experiment, registry_.List(), plan, report, error)) {
    return false;
  }
  for (const auto& warning : plan.warnings) {
    logger_.Warn("binding plan warning", {{"message", warning}});
  }
  if (!ConfirmReachable(plan, error)) {
    logger_.Error("deployment blocked", {{"error", core::errors::FormatError(error)}});
    return false;
  }

  controller.RecordDispatch(run_id, experiment.id, NowMillis());
  std::string store_error;
  if (!store_.SaveAudit(controller.audit(), store_error)) {
    return core::errors::Fail(error, ErrorKind::kIo, "recording dispatch: " + store_error);
  }

  const auto record_outcome = [&](const std::string& status) {
    if (!controller.RecordOutcome(run_id, status)) {
      logger_.Warn("run missing from audit trail", {{"run_id", run_id}});
      return true;
    }
    return store_.SaveAudit(controller.audit(), store_error);
  };

  if (!orchestrator.Run(experiment, plan, run_id, record, error)) {
    if (!record_outcome("failed")) {
      logger_.Warn("failed to record run outcome", {{"error", store_error}});
    }
    return false;
  }

  if (!record_outcome(deploy::ToString(record.status))) {
    logger_.Warn("failed to record run outcome", {{"error", store_error}});
    record.warnings.push_back("audit trail not updated: " + store_error);
  }
  return true;
}

} // namespace tracr::network
