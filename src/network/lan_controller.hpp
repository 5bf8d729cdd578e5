#pragma once

#include "core/errors/error.hpp"
#include "deploy/orchestrator.hpp"
#include "deploy/run_record.hpp"
#include "experiment/binding_validator.hpp"
#include "experiment/descriptor_parser.hpp"
#include "experiment/experiment_model.hpp"
#include "network/discovery.hpp"
#include "network/lan_config_store.hpp"
#include "network/lan_model.hpp"
#include "network/subnet.hpp"
#include "registry/device_model.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

namespace tracr::core::logging {
class Logger;
}

namespace tracr::registry {
class DeviceRegistry;
}

namespace tracr::remote {
class ConnectionManager;
class Session;
struct CapabilityReport;
}

namespace tracr::network {

// Outcome of one `EstablishAll` connection attempt.
struct ConnectionStatus {
  bool reachable = false;
  // Container engine answered the capability probe.
  bool prepared = false;
  std::uint32_t attempts = 0;
  std::string engine_version;
  // First connection wrote the registry id onto the board.
  bool identity_stamped = false;
  core::errors::Error error;
};

// Outcome of `PrepareDevice`.
struct PrepareReport {
  bool prepared_before = false;
  bool prepared = false;
  std::string engine_version;
  int exit_code = -1;
  // Tail of the script's stdout.
  std::string output;
};

struct LanControllerSettings {
  std::filesystem::path experiments_root;
  std::chrono::milliseconds probe_timeout{30000};
  // Package installs on a Pi are slow.
  std::chrono::milliseconds prepare_timeout{1800000};
};

// Controller-side entry points over one LAN: discovery, connectivity
// fan-out and deployment dispatch. The registry stays the single source of
// device state; this class keeps no device copies between calls.
class LanController {
public:
  LanController(registry::DeviceRegistry& registry, LanConfigStore& store,
                remote::ConnectionManager& connections, core::logging::Logger& logger,
                LanControllerSettings settings);

  // Does not mutate the registry; callers register what they accept.
  DiscoverySequence Discover(const Ipv4Subnet& subnet, IHostProber& prober) const;

  // Remembers the scanned subnet and scan time in the LAN file.
  bool RecordDiscovery(const Ipv4Subnet& subnet, core::errors::Error& error);

  // Registers the controller device (or updates the existing one) and
  // stores LAN metadata. `subnet` may be empty.
  bool SetupController(const registry::Device& attributes, const std::string& subnet,
                       std::string& device_id, core::errors::Error& error);

  // kNotFound when no controller is registered.
  bool Controller(ControllerNode& node, core::errors::Error& error) const;

  // Connects to every participant and the controller in parallel. Each
  // reachable device must carry its own registry id in its identity file
  // (stamped on first contact) and is then resynced from its capability
  // probe; unreachable or mismatched ones are left untouched. Sessions are
  // closed before returning.
  std::map<std::string, ConnectionStatus> EstablishAll();

  // Runs a host-preparation script on one device: pushes `script` (verified
  // transfer), runs it with /bin/sh, then re-probes and resyncs.
  //
  // Errors:
  // - kNotFound for an unknown device id; kIo when `script` is unreadable.
  // - kConnection / kTimeout / kTransfer from the session.
  // - kInvalidState when the identity file names another device.
  // - kRemoteCommand when the script exits non-zero (exit code and stderr
  //   attached), or when it succeeds but no container engine answers.
  bool PrepareDevice(const std::string& device_id, const std::filesystem::path& script,
                     PrepareReport& report, core::errors::Error& error);

  // Validates, confirms every bound device is reachable, records the
  // dispatch in the controller audit trail and runs the plan.
  //
  // Errors (all before any build starts):
  // - kMalformedDescriptor / kValidation from validation.
  // - kUnsatisfiedConstraint when a constraint has no free matching device
  //   or its bound device cannot be reached.
  // - kInvalidState when a bound board's identity file names another device.
  // - kNotFound when no controller is registered; kIo on audit writes.
  bool OrchestrateDeployment(const experiment::Experiment& experiment,
                             deploy::Orchestrator& orchestrator, const std::string& run_id,
                             experiment::ValidationReport& report, deploy::RunRecord& record,
                             core::errors::Error& error);

private:
  ConnectionStatus ConnectAndResync(const registry::Device& device);
  bool CheckIdentity(remote::Session& session, bool& stamped, core::errors::Error& error);
  bool Resync(const registry::Device& device, const remote::CapabilityReport& report,
              core::errors::Error& error);
  bool ConfirmReachable(const experiment::BindingPlan& plan, core::errors::Error& error);

  registry::DeviceRegistry& registry_;
  LanConfigStore& store_;
  remote::ConnectionManager& connections_;
  core::logging::Logger& logger_;
  LanControllerSettings settings_;
};

} // namespace tracr::network
