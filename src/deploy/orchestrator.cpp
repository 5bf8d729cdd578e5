#include "deploy/orchestrator.hpp"

#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"
#include "core/process.hpp"
#include "core/time_utils.hpp"
#include "events/timeline.hpp"
#include "experiment/experiment_catalog.hpp"
#include "registry/device_registry.hpp"
#include "remote/connection_manager.hpp"

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <sstream>
#include <system_error>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

namespace tracr::deploy {
namespace {

using core::errors::Error;
using core::errors::ErrorKind;

std::chrono::system_clock::time_point NowMillis() {
  return core::FromEpochMilliseconds(core::ToEpochMilliseconds(std::chrono::system_clock::now()));
}

std::string Lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

// `docker inspect -f '{{.State.Status}} {{.State.ExitCode}}'` output.
bool ParseContainerStatus(const std::string& text, std::string& status, int& exit_code) {
  std::istringstream in(text);
  if (!(in >> status >> exit_code)) {
    return false;
  }
  return true;
}

} // namespace

const char* ToString(const WaveGate gate) {
  switch (gate) {
  case WaveGate::kDeployed:
    return "deployed";
  case WaveGate::kCompleted:
    return "completed";
  }
  return "deployed";
}

bool ParseWaveGate(std::string_view raw, WaveGate& gate, std::string& error) {
  const std::string normalized = Lowercase(std::string(raw));
  if (normalized == "deployed") {
    gate = WaveGate::kDeployed;
    return true;
  }
  if (normalized == "completed") {
    gate = WaveGate::kCompleted;
    return true;
  }
  error = "invalid wave gate '" + std::string(raw) + "' (expected deployed|completed)";
  return false;
}

// Shared state of one run. Every read or write of `record.bindings` goes
// through `mu`; timeline sequence numbers are allocated under the same lock
// so transition order and event order agree.
struct Orchestrator::RunContext {
  RunContext(RunRecord& run_record, events::Timeline& run_timeline,
             const experiment::Experiment& run_experiment, std::vector<StagedBuild> staged_builds,
             std::vector<std::size_t> wave_sizes, TransitionObserver transition_observer,
             core::logging::Logger& run_logger)
      : record(run_record), timeline(run_timeline), experiment(run_experiment),
        staged(std::move(staged_builds)), launch_open(wave_sizes.size(), false),
        observer(std::move(transition_observer)), logger(run_logger) {}

  RunRecord& record;
  events::Timeline& timeline;
  const experiment::Experiment& experiment;
  std::vector<StagedBuild> staged;
  std::vector<bool> launch_open;
  TransitionObserver observer;
  core::logging::Logger& logger;
  core::CancellationToken cancel;

  std::mutex mu;
  std::condition_variable cv;
  bool halted = false;

  BindingRecord Snapshot(const std::size_t index) {
    std::lock_guard<std::mutex> lock(mu);
    return record.bindings[index];
  }

  bool IsHalted() {
    std::lock_guard<std::mutex> lock(mu);
    return halted;
  }

  void Advance(const std::size_t index, const BindingState to) {
    Transition(index, to, {});
  }

  void Succeed(const std::size_t index, const int exit_code) {
    Transition(index, BindingState::kSucceeded,
               [exit_code](BindingRecord& binding) { binding.exit_code = exit_code; });
  }

  void Fail(const std::size_t index, const Error& error) {
    Transition(index, BindingState::kFailed, [&error](BindingRecord& binding) {
      binding.error_code = std::string(core::errors::ToStableErrorCode(error.kind));
      binding.error_message = error.message;
      if (error.exit_code >= 0) {
        binding.exit_code = error.exit_code;
      }
      binding.stderr_snippet = core::errors::StderrSnippet(error.stderr_text);
    });
  }

  void Transition(const std::size_t index, const BindingState to,
                  const std::function<void(BindingRecord&)>& mutate) {
    std::string role;
    std::string device_id;
    BindingState from = BindingState::kUnbuilt;
    bool applied = false;
    {
      std::lock_guard<std::mutex> lock(mu);
      BindingRecord& binding = record.bindings[index];
      role = binding.role;
      device_id = binding.device_id;
      from = binding.state;
      if (IsValidTransition(binding.state, to)) {
        if (mutate) {
          mutate(binding);
        }
        const auto at = NowMillis();
        const std::uint64_t seq =
            timeline.Emit(events::EventType::kBindingTransition,
                          {{"role", binding.role},
                           {"device_id", binding.device_id},
                           {"from", ToString(binding.state)},
                           {"to", ToString(to)},
                           {"wave", std::to_string(binding.wave_index)}},
                          at);
        binding.state = to;
        binding.transitions.push_back({.state = to, .at = at, .seq = seq});
        if (to == BindingState::kFailed) {
          halted = true;
        }
        applied = true;
      }
    }
    if (!applied) {
      logger.Warn("ignored invalid binding transition",
                  {{"role", role}, {"from", ToString(from)}, {"to", ToString(to)}});
      return;
    }
    cv.notify_all();
    logger.Info("binding transition", {{"role", role},
                                       {"device_id", device_id},
                                       {"state", ToString(to)}});
    if (observer) {
      observer(role, to);
    }
  }

  void AddNote(const std::size_t index, const std::string& note) {
    std::lock_guard<std::mutex> lock(mu);
    std::string& target = record.bindings[index].note;
    target = target.empty() ? note : target + "; " + note;
  }

  void AddTelemetry(const std::size_t index, const CollectionStats& stats, const bool final_pass) {
    std::lock_guard<std::mutex> lock(mu);
    BindingRecord& binding = record.bindings[index];
    binding.telemetry_entries += stats.accepted;
    binding.telemetry_malformed += stats.malformed;
    timeline.Emit(events::EventType::kTelemetryCollected,
                  {{"role", binding.role},
                   {"device_id", binding.device_id},
                   {"phase", final_pass ? "final" : "live"},
                   {"accepted", std::to_string(stats.accepted)},
                   {"malformed", std::to_string(stats.malformed)},
                   {"foreign", std::to_string(stats.foreign)}},
                  NowMillis());
  }

  void AddUnconfirmedStop(const std::size_t index, const Error& error) {
    std::lock_guard<std::mutex> lock(mu);
    BindingRecord& binding = record.bindings[index];
    record.unconfirmed_stops.push_back(binding.device_id);
    timeline.Emit(events::EventType::kStopUnconfirmed,
                  {{"role", binding.role},
                   {"device_id", binding.device_id},
                   {"container", binding.container_name},
                   {"error", core::errors::FormatError(error)}},
                  NowMillis());
  }

  void CancelWave(const std::vector<std::size_t>& members, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mu);
    for (const std::size_t index : members) {
      record.bindings[index].note = "not started: " + reason;
    }
  }

  // Blocks until every member has passed deployment (or is terminal when
  // `require_terminal`).
  void WaitForWave(const std::vector<std::size_t>& members, const bool require_terminal) {
    std::unique_lock<std::mutex> lock(mu);
    cv.wait(lock, [&] {
      return std::all_of(members.begin(), members.end(), [&](const std::size_t index) {
        const BindingState state = record.bindings[index].state;
        return require_terminal ? IsTerminal(state) : HasPassedDeployment(state);
      });
    });
  }

  void OpenLaunch(const std::size_t wave) {
    {
      std::lock_guard<std::mutex> lock(mu);
      launch_open[wave] = true;
    }
    cv.notify_all();
  }

  // Returns false when the run is aborted before the wave may launch.
  bool WaitForLaunch(const std::size_t wave) {
    std::unique_lock<std::mutex> lock(mu);
    cv.wait(lock, [&] { return launch_open[wave] || cancel.IsCancelled(); });
    return !cancel.IsCancelled();
  }

  void Wake() {
    { std::lock_guard<std::mutex> lock(mu); }
    cv.notify_all();
  }
};

Orchestrator::Orchestrator(registry::DeviceRegistry& registry,
                           remote::ConnectionManager& connections, OrchestratorOptions options,
                           core::logging::Logger& logger, IRunArtifactCollector* collector)
    : registry_(registry), connections_(connections), options_(std::move(options)),
      logger_(logger), collector_(collector) {}

Orchestrator::~Orchestrator() = default;

void Orchestrator::SetTransitionObserver(TransitionObserver observer) {
  std::lock_guard<std::mutex> lock(observer_mu_);
  observer_ = std::move(observer);
}

void Orchestrator::Abort() {
  std::lock_guard<std::mutex> lock(active_mu_);
  if (active_ == nullptr || active_->cancel.IsCancelled()) {
    return;
  }
  logger_.Warn("abort requested", {{"run_id", active_->record.run_id}});
  active_->timeline.Emit(events::EventType::kAbortRequested, {{"run_id", active_->record.run_id}},
                         NowMillis());
  active_->cancel.Cancel();
  active_->Wake();
}

bool Orchestrator::Run(const experiment::Experiment& experiment,
                       const experiment::BindingPlan& plan, const std::string& run_id,
                       RunRecord& record, Error& error) {
  core::errors::Clear(error);

  RunRecord working;
  std::vector<StagedBuild> staged;
  if (!Preflight(experiment, plan, run_id, working, staged, error)) {
    logger_.Error("deployment pre-flight failed", {{"error", core::errors::FormatError(error)}});
    return false;
  }

  const fs::path run_dir = options_.runs_root / run_id;
  events::Timeline timeline(run_dir);
  TransitionObserver observer;
  {
    std::lock_guard<std::mutex> lock(observer_mu_);
    observer = observer_;
  }
  std::vector<std::size_t> wave_sizes;
  for (const auto& wave : plan.waves) {
    wave_sizes.push_back(wave.bindings.size());
  }
  RunContext context(working, timeline, experiment, std::move(staged), std::move(wave_sizes),
                     std::move(observer), logger_);

  const core::logging::ScopedLogField run_field(logger_, "run_id", run_id);
  logger_.Info("run started", {{"experiment_id", experiment.id},
                               {"bindings", std::to_string(plan.bindings.size())},
                               {"waves", std::to_string(plan.waves.size())},
                               {"wave_gate", ToString(options_.wave_gate)}});
  timeline.Emit(events::EventType::kRunStarted,
                {{"run_id", run_id},
                 {"experiment_id", experiment.id},
                 {"lan", options_.lan_name},
                 {"bindings", std::to_string(plan.bindings.size())},
                 {"waves", std::to_string(plan.waves.size())},
                 {"wave_gate", ToString(options_.wave_gate)}},
                working.started_at);
  for (const auto& warning : plan.warnings) {
    working.warnings.push_back(warning);
    timeline.Emit(events::EventType::kWarning, {{"message", warning}}, NowMillis());
  }

  {
    std::lock_guard<std::mutex> lock(active_mu_);
    active_ = &context;
  }
  ExecuteWaves(context, plan);
  {
    std::lock_guard<std::mutex> lock(active_mu_);
    active_ = nullptr;
  }

  working.aborted = context.cancel.IsCancelled();
  working.finished_at = NowMillis();
  const bool all_succeeded =
      std::all_of(working.bindings.begin(), working.bindings.end(), [](const BindingRecord& b) {
        return b.state == BindingState::kSucceeded;
      });
  working.status = all_succeeded ? RunStatus::kSucceeded : RunStatus::kFailed;
  timeline.Emit(events::EventType::kRunFinished,
                {{"run_id", run_id},
                 {"status", ToString(working.status)},
                 {"aborted", working.aborted ? "true" : "false"}},
                *working.finished_at);
  if (!timeline.LastWriteError().empty()) {
    working.warnings.push_back("timeline incomplete: " + timeline.LastWriteError());
  }

  fs::path written_path;
  std::string write_error;
  if (!WriteRunRecord(working, run_dir, written_path, write_error)) {
    logger_.Error("failed to write run record", {{"error", write_error}});
  }
  logger_.Info("run finished", {{"status", ToString(working.status)},
                                {"aborted", working.aborted ? "true" : "false"},
                                {"run_record", written_path.string()}});

  record = std::move(working);
  return true;
}

bool Orchestrator::Preflight(const experiment::Experiment& experiment,
                             const experiment::BindingPlan& plan, const std::string& run_id,
                             RunRecord& record, std::vector<StagedBuild>& staged, Error& error) {
  if (run_id.empty()) {
    return core::errors::Fail(error, ErrorKind::kInvalidState, "run id is empty");
  }
  if (plan.experiment_id != experiment.id) {
    return core::errors::Fail(error, ErrorKind::kInvalidState,
                              "binding plan belongs to experiment '" + plan.experiment_id +
                                  "', not '" + experiment.id + "'");
  }
  if (plan.bindings.empty() || plan.waves.empty()) {
    return core::errors::Fail(error, ErrorKind::kInvalidState, "binding plan is empty");
  }

  std::vector<std::size_t> wave_of(plan.bindings.size(), plan.waves.size());
  for (std::size_t w = 0; w < plan.waves.size(); ++w) {
    for (const std::size_t index : plan.waves[w].bindings) {
      if (index >= plan.bindings.size() || wave_of[index] != plan.waves.size()) {
        return core::errors::Fail(error, ErrorKind::kInvalidState,
                                  "binding plan waves are inconsistent");
      }
      wave_of[index] = w;
    }
  }

  record = RunRecord{};
  record.run_id = run_id;
  record.experiment_id = experiment.id;
  record.experiment_name = experiment.name;
  record.lan_name = options_.lan_name;
  record.wave_gate = ToString(options_.wave_gate);
  record.started_at = NowMillis();

  const fs::path run_dir = options_.runs_root / run_id;
  const fs::path stage_root = run_dir / "build";
  staged.clear();
  for (std::size_t i = 0; i < plan.bindings.size(); ++i) {
    const experiment::Binding& binding = plan.bindings[i];
    if (wave_of[i] == plan.waves.size()) {
      return core::errors::Fail(error, ErrorKind::kInvalidState,
                                "binding '" + binding.role + "' is not scheduled in any wave");
    }
    if (binding.constraint_index >= experiment.constraints.size() ||
        experiment.constraints[binding.constraint_index].role != binding.role) {
      return core::errors::Fail(error, ErrorKind::kInvalidState,
                                "binding '" + binding.role + "' does not match the experiment");
    }

    registry::Device device;
    if (!registry_.Get(binding.device_id, device, error)) {
      return false;
    }
    const auto base = options_.base_images.find(Lowercase(binding.arch));
    if (base == options_.base_images.end() || base->second.empty()) {
      return core::errors::Fail(error, ErrorKind::kValidation,
                                "no base image configured for architecture '" + binding.arch +
                                    "'");
    }

    const experiment::DeviceConstraint& constraint =
        experiment.constraints[binding.constraint_index];
    StagedBuild build;
    std::string stage_error;
    if (!StageBuild(experiment, constraint, run_id, base->second, stage_root, build,
                    stage_error)) {
      return core::errors::Fail(error, ErrorKind::kIo,
                                "staging build for '" + binding.role + "': " + stage_error);
    }

    BindingRecord entry;
    entry.role = binding.role;
    entry.device_id = binding.device_id;
    entry.endpoint = registry::DescribeEndpoint(device);
    entry.arch = binding.arch;
    entry.order = binding.order;
    entry.wave_index = wave_of[i];
    entry.image_tag = build.runtime_tag;
    entry.container_name = ContainerName(run_id, binding.role);
    record.bindings.push_back(std::move(entry));
    staged.push_back(std::move(build));
  }

  std::string archive_error;
  if (!experiment::ExperimentCatalog::ArchiveSnapshot(experiment, run_dir, archive_error)) {
    return core::errors::Fail(error, ErrorKind::kIo,
                              "archiving experiment snapshot: " + archive_error);
  }
  return true;
}

void Orchestrator::ExecuteWaves(RunContext& context, const experiment::BindingPlan& plan) {
  std::vector<std::thread> workers;
  for (std::size_t w = 0; w < plan.waves.size(); ++w) {
    const experiment::Wave& wave = plan.waves[w];
    const std::string wave_label = std::to_string(w);

    if (context.cancel.IsCancelled() || context.IsHalted()) {
      const std::string reason = context.cancel.IsCancelled()
                                     ? "run aborted"
                                     : "an earlier binding failed";
      context.CancelWave(wave.bindings, reason);
      context.timeline.Emit(events::EventType::kWaveCancelled,
                            {{"wave", wave_label},
                             {"order", std::to_string(wave.order)},
                             {"reason", reason}},
                            NowMillis());
      logger_.Warn("wave cancelled", {{"wave", wave_label}, {"reason", reason}});
      continue;
    }

    context.timeline.Emit(events::EventType::kWaveStarted,
                          {{"wave", wave_label},
                           {"order", std::to_string(wave.order)},
                           {"bindings", std::to_string(wave.bindings.size())}},
                          NowMillis());
    logger_.Info("wave started", {{"wave", wave_label}, {"order", std::to_string(wave.order)}});
    for (const std::size_t index : wave.bindings) {
      workers.emplace_back([this, &context, index] { RunBinding(context, index); });
    }

    context.WaitForWave(wave.bindings, false);
    context.OpenLaunch(w);
    if (options_.wave_gate == WaveGate::kCompleted) {
      context.WaitForWave(wave.bindings, true);
    }
    context.timeline.Emit(events::EventType::kWaveGateOpened,
                          {{"wave", wave_label}, {"gate", ToString(options_.wave_gate)}},
                          NowMillis());
  }

  for (auto& worker : workers) {
    worker.join();
  }
}

void Orchestrator::RunBinding(RunContext& context, const std::size_t index) {
  const BindingRecord binding = context.Snapshot(index);
  const StagedBuild& staged = context.staged[index];
  const experiment::DeviceConstraint* constraint = nullptr;
  for (const auto& candidate : context.experiment.constraints) {
    if (candidate.role == binding.role) {
      constraint = &candidate;
    }
  }

  Error error;
  registry::Device device;
  if (!registry_.Get(binding.device_id, device, error)) {
    context.Fail(index, error);
    return;
  }

  std::unique_ptr<remote::Session> session;
  if (!connections_.Connect(device, session, error, &context.cancel)) {
    context.Fail(index, error);
    return;
  }

  const RemoteLayout layout =
      MakeRemoteLayout(options_.remote_workdir, binding.arch, context.record.run_id, binding.role);

  context.Advance(index, BindingState::kBuilding);
  if (!BuildImages(*session, staged, layout, error)) {
    context.Fail(index, error);
    return;
  }
  context.Advance(index, BindingState::kBuilt);

  context.Advance(index, BindingState::kDeploying);
  CreateOptions create{
      .container_name = binding.container_name,
      .image = staged.runtime_tag,
      .log_dir = layout.log_dir,
      .run_id = context.record.run_id,
      .device_id = binding.device_id,
      .role = binding.role,
      .config_json = context.experiment.config_json,
      .container = constraint != nullptr ? constraint->container : experiment::ContainerOptions{},
  };
  if (!RunCommand(*session, "mkdir -p " + core::ShellQuotePath(layout.log_dir), error)) {
    context.Fail(index, error);
    return;
  }
  // A container left over from an interrupted pass would block `docker create`.
  Error stale;
  if (!RunCommand(*session, "docker rm -f " + core::ShellQuote(binding.container_name), stale) &&
      stale.kind != ErrorKind::kRemoteCommand) {
    context.Fail(index, stale);
    return;
  }
  if (!RunCommand(*session, BuildCreateCommand(create), error)) {
    context.Fail(index, error);
    return;
  }
  context.Advance(index, BindingState::kDeployed);

  if (!context.WaitForLaunch(binding.wave_index)) {
    session->BindCancellation(nullptr);
    Teardown(context, *session, index);
    core::errors::Fail(error, ErrorKind::kCancelled, "run aborted before launch");
    context.Fail(index, error);
    return;
  }

  if (!RunCommand(*session, "docker start " + core::ShellQuote(binding.container_name), error)) {
    session->BindCancellation(nullptr);
    if (session->is_open()) {
      Teardown(context, *session, index);
    }
    context.Fail(index, error);
    return;
  }
  context.Advance(index, BindingState::kRunning);

  const std::string log_path = layout.TelemetryPath();
  int exit_code = 0;
  if (PollContainer(context, *session, index, log_path, exit_code, error)) {
    CollectTelemetry(context, *session, index, log_path, true);
    Teardown(context, *session, index);
    if (exit_code == 0) {
      context.Succeed(index, exit_code);
    } else {
      Error exited;
      exited.exit_code = exit_code;
      core::errors::Fail(exited, ErrorKind::kRemoteCommand,
                         "container exited with code " + std::to_string(exit_code));
      context.Fail(index, exited);
    }
    return;
  }

  if (error.kind == ErrorKind::kCancelled) {
    session->BindCancellation(nullptr);
    Error stop_error;
    bool stopped = session->is_open() &&
                   RunCommand(*session, "docker stop " + core::ShellQuote(binding.container_name),
                              stop_error);
    if (!session->is_open() && stop_error.ok()) {
      core::errors::Fail(stop_error, ErrorKind::kConnection, "session closed before stop");
    }
    if (!stopped) {
      logger_.Warn("container stop unconfirmed",
                   {{"role", binding.role},
                    {"device_id", binding.device_id},
                    {"error", core::errors::FormatError(stop_error)}});
      context.AddUnconfirmedStop(index, stop_error);
    }
    if (session->is_open()) {
      CollectTelemetry(context, *session, index, log_path, true);
      if (stopped) {
        Teardown(context, *session, index);
      }
    }
    context.Fail(index, error);
    return;
  }

  if (session->is_open()) {
    CollectTelemetry(context, *session, index, log_path, true);
  }
  context.Fail(index, error);
}

bool Orchestrator::BuildImages(remote::Session& session, const StagedBuild& staged,
                               const RemoteLayout& layout, Error& error) {
  Error probe;
  if (!RunCommand(session, "docker image inspect " + core::ShellQuote(staged.base_tag), probe)) {
    if (probe.kind != ErrorKind::kRemoteCommand) {
      error = probe;
      return false;
    }
    const std::string base_file = layout.base_context + "/Dockerfile";
    logger_.Info("building base image", {{"device_id", session.device().id},
                                         {"image", staged.base_tag}});
    if (!RunCommand(session, "mkdir -p " + core::ShellQuotePath(layout.base_context), error) ||
        !connections_.Transfer(session, staged.base_dockerfile, base_file,
                               remote::TransferDirection::kPush, options_.transfer_timeout,
                               error) ||
        !RunCommand(session, BuildImageCommand(staged.base_tag, base_file, layout.base_context),
                    error)) {
      return false;
    }
  }

  const std::string& context = layout.build_context;
  if (!RunCommand(session, "mkdir -p " + core::ShellQuotePath(context), error)) {
    return false;
  }
  const std::vector<std::pair<fs::path, std::string>> uploads = {
      {staged.deps_dockerfile, context + "/Dockerfile.deps"},
      {staged.runtime_dockerfile, context + "/Dockerfile.runtime"},
      {staged.wrapper, context + "/" + kWrapperFileName},
      {staged.script, context + "/" + staged.script_name},
  };
  for (const auto& [local, remote] : uploads) {
    if (!connections_.Transfer(session, local, remote, remote::TransferDirection::kPush,
                               options_.transfer_timeout, error)) {
      return false;
    }
  }

  logger_.Info("building experiment images", {{"device_id", session.device().id},
                                              {"image", staged.runtime_tag}});
  return RunCommand(session,
                    BuildImageCommand(staged.deps_tag, context + "/Dockerfile.deps", context),
                    error) &&
         RunCommand(session,
                    BuildImageCommand(staged.runtime_tag, context + "/Dockerfile.runtime",
                                      context),
                    error);
}

bool Orchestrator::PollContainer(RunContext& context, remote::Session& session,
                                 const std::size_t index, const std::string& remote_log_path,
                                 int& exit_code, Error& error) {
  const std::string command = "docker inspect -f " +
                              core::ShellQuote("{{.State.Status}} {{.State.ExitCode}}") + " " +
                              core::ShellQuote(context.Snapshot(index).container_name);
  while (true) {
    if (context.cancel.IsCancelled()) {
      return core::errors::Fail(error, ErrorKind::kCancelled, "run aborted while running");
    }
    remote::CommandResult result;
    if (!connections_.Execute(session, command, options_.command_timeout, result, error)) {
      if (error.kind == ErrorKind::kCancelled) {
        error.message = "run aborted while running";
      }
      return false;
    }
    std::string status;
    int code = 0;
    if (!ParseContainerStatus(result.stdout_text, status, code)) {
      return core::errors::Fail(error, ErrorKind::kRemoteCommand,
                                "unexpected container status '" + result.stdout_text + "'");
    }
    if (status == "exited" || status == "dead") {
      exit_code = code;
      return true;
    }
    if (options_.live_telemetry) {
      CollectTelemetry(context, session, index, remote_log_path, false);
    }
    if (context.cancel.WaitFor(options_.poll_interval)) {
      return core::errors::Fail(error, ErrorKind::kCancelled, "run aborted while running");
    }
  }
}

bool Orchestrator::RunCommand(remote::Session& session, const std::string& command,
                              Error& error) {
  remote::CommandResult result;
  return connections_.Execute(session, command, options_.command_timeout, result, error);
}

void Orchestrator::CollectTelemetry(RunContext& context, remote::Session& session,
                                    const std::size_t index, const std::string& remote_log_path,
                                    const bool final_pass) {
  if (collector_ == nullptr) {
    return;
  }
  const BindingRecord binding = context.Snapshot(index);
  const CollectionTarget target{
      .run_id = context.record.run_id,
      .device_id = binding.device_id,
      .role = binding.role,
      .remote_log_path = remote_log_path,
  };
  CollectionStats stats;
  Error error;
  const bool ok = final_pass
                      ? collector_->CollectFinal(connections_, session, target, stats, error)
                      : collector_->CollectLive(connections_, session, target, stats, error);
  if (!ok) {
    logger_.Warn("telemetry collection failed",
                 {{"role", binding.role},
                  {"device_id", binding.device_id},
                  {"phase", final_pass ? "final" : "live"},
                  {"error", core::errors::FormatError(error)}});
    if (final_pass) {
      context.AddNote(index, "telemetry collection failed: " + core::errors::FormatError(error));
    }
    return;
  }
  if (final_pass || stats.accepted > 0U || stats.malformed > 0U) {
    context.AddTelemetry(index, stats, final_pass);
  }
}

void Orchestrator::Teardown(RunContext& context, remote::Session& session,
                            const std::size_t index) {
  const BindingRecord binding = context.Snapshot(index);
  Error error;
  if (!RunCommand(session, "docker rm -f " + core::ShellQuote(binding.container_name), error)) {
    logger_.Warn("container teardown failed", {{"role", binding.role},
                                               {"device_id", binding.device_id},
                                               {"error", core::errors::FormatError(error)}});
    context.AddNote(index, "teardown failed: " + core::errors::FormatError(error));
  }
}

} // namespace tracr::deploy
