#pragma once

#include "core/cancellation.hpp"
#include "core/errors/error.hpp"
#include "deploy/artifact_collector.hpp"
#include "deploy/image_builder.hpp"
#include "deploy/run_record.hpp"
#include "experiment/binding_validator.hpp"
#include "experiment/experiment_model.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace tracr::core::logging {
class Logger;
}

namespace tracr::registry {
class DeviceRegistry;
}

namespace tracr::remote {
class ConnectionManager;
class Session;
} // namespace tracr::remote

namespace tracr::deploy {

// When wave N+1 may start building.
enum class WaveGate {
  // Every wave-N binding is Deployed (or already terminal).
  kDeployed,
  // Every wave-N binding is terminal.
  kCompleted,
};

const char* ToString(WaveGate gate);
bool ParseWaveGate(std::string_view raw, WaveGate& gate, std::string& error);

struct OrchestratorOptions {
  std::filesystem::path runs_root;
  std::string remote_workdir = "~/.tracr/work";
  std::map<std::string, std::string> base_images = DefaultBaseImages();
  std::chrono::milliseconds command_timeout{600000};
  std::chrono::milliseconds transfer_timeout{120000};
  std::chrono::milliseconds poll_interval{2000};
  WaveGate wave_gate = WaveGate::kDeployed;
  bool live_telemetry = false;
  std::string lan_name;
};

using TransitionObserver = std::function<void(const std::string& role, BindingState state)>;

// Drives one BindingPlan through build, deploy, launch and completion.
//
// Waves run strictly in order. Each binding of the current wave gets its own
// worker thread which holds the device's exclusive session for the whole
// pass. Containers in a wave launch together once every member has passed
// deployment. A failure anywhere halts waves that have not started yet; work
// already running is left to finish unless `Abort` is called.
//
// `Run` fails only for pre-flight problems, before anything touches a
// device:
// - kInvalidState: plan and experiment disagree.
// - kValidation: no base image configured for a bound architecture.
// - kNotFound: a bound device left the registry.
// - kIo: local staging or run directory setup failed.
// Everything after pre-flight is recorded in `record` and `Run` returns true.
class Orchestrator {
public:
  Orchestrator(registry::DeviceRegistry& registry, remote::ConnectionManager& connections,
               OrchestratorOptions options, core::logging::Logger& logger,
               IRunArtifactCollector* collector = nullptr);
  ~Orchestrator();

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;

  bool Run(const experiment::Experiment& experiment, const experiment::BindingPlan& plan,
           const std::string& run_id, RunRecord& record, core::errors::Error& error);

  // Thread-safe; no-op when no run is active. Running containers get a
  // best-effort stop.
  void Abort();

  // Called after every binding transition, outside internal locks.
  void SetTransitionObserver(TransitionObserver observer);

  const OrchestratorOptions& options() const {
    return options_;
  }

private:
  struct RunContext;

  bool Preflight(const experiment::Experiment& experiment, const experiment::BindingPlan& plan,
                 const std::string& run_id, RunRecord& record,
                 std::vector<StagedBuild>& staged, core::errors::Error& error);
  void ExecuteWaves(RunContext& context, const experiment::BindingPlan& plan);
  void RunBinding(RunContext& context, std::size_t index);
  bool BuildImages(remote::Session& session, const StagedBuild& staged,
                   const RemoteLayout& layout, core::errors::Error& error);
  bool PollContainer(RunContext& context, remote::Session& session, std::size_t index,
                     const std::string& remote_log_path, int& exit_code,
                     core::errors::Error& error);
  bool RunCommand(remote::Session& session, const std::string& command,
                  core::errors::Error& error);
  void CollectTelemetry(RunContext& context, remote::Session& session, std::size_t index,
                        const std::string& remote_log_path, bool final_pass);
  void Teardown(RunContext& context, remote::Session& session, std::size_t index);

  registry::DeviceRegistry& registry_;
  remote::ConnectionManager& connections_;
  OrchestratorOptions options_;
  core::logging::Logger& logger_;
  IRunArtifactCollector* collector_ = nullptr;

  std::mutex observer_mu_;
  TransitionObserver observer_;

  std::mutex active_mu_;
  RunContext* active_ = nullptr;
};

} // namespace tracr::deploy
