#include "common/assertions.hpp"
#include "common/sim_lan.hpp"
#include "common/temp_dir.hpp"

#include "deploy/orchestrator.hpp"
#include "experiment/binding_validator.hpp"
#include "experiment/descriptor_parser.hpp"
#include "telemetry/collector.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>

namespace fs = std::filesystem;

using tracr::core::errors::Error;
using tracr::deploy::BindingState;
using tracr::tests::common::AssertContains;
using tracr::tests::common::AssertOk;
using tracr::tests::common::AssertTrue;
using tracr::tests::common::IndexOf;

namespace {

// A board stuck in `docker build` is interrupted by Abort instead of holding
// the run until the command deadline.
void AbortInterruptsInFlightBuild() {
  tracr::tests::common::ScopedTempDir temp("tracr-abort-build");
  tracr::tests::common::SimLan lan;

  tracr::remote::sim::SimHostSpec slow;
  slow.block_on = "docker build";
  const std::string slow_id = lan.AddParticipant("10.0.9.61", "arm64", slow);

  const fs::path directory = tracr::tests::common::WriteExperiment(
      temp.path() / "TestCases", "slow-build",
      R"({"id":"exp-slow-build","name":"slow-build","deviceConstraints":[
           {"role":"builder","arch":"arm64","runtimeScript":"main.py","order":0}]})",
      {"main.py"});

  tracr::experiment::Experiment experiment;
  tracr::experiment::ValidationReport report;
  Error error;
  AssertOk(tracr::experiment::LoadDescriptor(directory, experiment, report, error), error,
           "load slow-build experiment");
  tracr::experiment::BindingPlan plan;
  AssertOk(tracr::experiment::Validate(experiment, lan.registry.List(), plan, report, error),
           error, "validate slow-build");

  tracr::deploy::OrchestratorOptions options;
  options.runs_root = temp.path() / "runs";
  options.poll_interval = std::chrono::milliseconds(2);
  tracr::deploy::Orchestrator orchestrator(lan.registry, lan.connections, options, lan.logger,
                                           nullptr);

  using Clock = std::chrono::steady_clock;
  Clock::time_point aborted_at{};
  std::thread aborter([&] {
    const auto give_up = Clock::now() + std::chrono::seconds(10);
    while (lan.network.BlockedCommands("10.0.9.61") == 0U && Clock::now() < give_up) {
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    aborted_at = Clock::now();
    orchestrator.Abort();
  });

  tracr::deploy::RunRecord record;
  const bool ran = orchestrator.Run(experiment, plan, "run-slow-build", record, error);
  const auto returned_at = Clock::now();
  aborter.join();
  AssertOk(ran, error, "run slow-build");

  AssertTrue(returned_at - aborted_at < std::chrono::seconds(5),
             "abort returns without waiting for the build deadline");
  AssertTrue(record.aborted, "slow-build run is marked aborted");
  const auto* builder = record.FindBinding("builder");
  AssertTrue(builder != nullptr && builder->device_id == slow_id, "builder bound");
  AssertTrue(builder->state == BindingState::kFailed && builder->error_code == "CANCELLED",
             "building binding is cancelled");
  AssertContains(builder->error_message, "interrupted");
  AssertTrue(lan.network.BlockedCommands("10.0.9.61") == 0U, "no command left parked");
  AssertTrue(IndexOf(lan.network.CommandLog("10.0.9.61"), "docker create") < 0,
             "nothing deployed after the interrupted build");
  AssertTrue(lan.network.OpenSessions("10.0.9.61") == 0U, "session released");
}

} // namespace

int main() {
  AbortInterruptsInFlightBuild();

  tracr::tests::common::ScopedTempDir temp("tracr-abort");
  tracr::tests::common::SimLan lan;

  tracr::remote::sim::SimHostSpec stubborn;
  stubborn.run_polls = -1;
  stubborn.fail_stop = true;
  stubborn.telemetry_lines = {
      R"({"metric":"rssi_dbm","value":-61,"timestamp":"2024-05-01T10:00:00Z"})",
      R"({"metric":"rssi_dbm","value":-63,"timestamp":"2024-05-01T10:00:01Z"})",
  };
  const std::string stubborn_id = lan.AddParticipant("10.0.8.51", "arm64", stubborn);

  tracr::remote::sim::SimHostSpec polite;
  polite.run_polls = -1;
  const std::string polite_id = lan.AddParticipant("10.0.8.52", "arm64", polite);
  lan.AddParticipant("10.0.8.53", "arm64");

  const fs::path directory = tracr::tests::common::WriteExperiment(
      temp.path() / "TestCases", "soak",
      R"({"id":"exp-soak","name":"soak","deviceConstraints":[
           {"role":"beacon","arch":"arm64","runtimeScript":"soak.py","order":0},
           {"role":"scanner","arch":"arm64","runtimeScript":"soak.py","order":0},
           {"role":"reporter","arch":"arm64","runtimeScript":"soak.py","order":1}]})",
      {"soak.py"});

  tracr::experiment::Experiment experiment;
  tracr::experiment::ValidationReport report;
  Error error;
  AssertOk(tracr::experiment::LoadDescriptor(directory, experiment, report, error), error,
           "load experiment");
  tracr::experiment::BindingPlan plan;
  AssertOk(tracr::experiment::Validate(experiment, lan.registry.List(), plan, report, error),
           error, "validate");

  const fs::path runs_root = temp.path() / "runs";
  tracr::telemetry::TelemetryCollector collector(runs_root, experiment.log_file, lan.logger);
  tracr::deploy::OrchestratorOptions options;
  options.runs_root = runs_root;
  options.poll_interval = std::chrono::milliseconds(2);
  options.wave_gate = tracr::deploy::WaveGate::kCompleted;
  tracr::deploy::Orchestrator orchestrator(lan.registry, lan.connections, options, lan.logger,
                                           &collector);

  // Nothing to abort yet.
  orchestrator.Abort();

  // Abort once both long-running containers are up.
  std::atomic<int> running{0};
  orchestrator.SetTransitionObserver([&](const std::string&, BindingState state) {
    if (state == BindingState::kRunning && ++running == 2) {
      orchestrator.Abort();
    }
  });

  tracr::deploy::RunRecord record;
  AssertOk(orchestrator.Run(experiment, plan, "run-soak", record, error), error, "run");
  AssertTrue(record.aborted, "run is marked aborted");
  AssertTrue(record.status == tracr::deploy::RunStatus::kFailed, "aborted run fails");

  const auto* beacon = record.FindBinding("beacon");
  const auto* scanner = record.FindBinding("scanner");
  const auto* reporter = record.FindBinding("reporter");
  AssertTrue(beacon != nullptr && scanner != nullptr && reporter != nullptr,
             "all roles recorded");
  AssertTrue(beacon->device_id == stubborn_id && scanner->device_id == polite_id,
             "wave 0 bound in registration order");

  AssertTrue(beacon->state == BindingState::kFailed && beacon->error_code == "CANCELLED",
             "running binding is cancelled");
  AssertTrue(scanner->state == BindingState::kFailed && scanner->error_code == "CANCELLED",
             "second running binding is cancelled");
  AssertContains(scanner->error_message, "run aborted");

  // A refused stop leaves the container running and is reported.
  AssertTrue(record.unconfirmed_stops.size() == 1U && record.unconfirmed_stops[0] == stubborn_id,
             "unconfirmed stop names the stubborn board");
  AssertTrue(lan.network.ContainerState("10.0.8.51", beacon->container_name) == "running",
             "stubborn container still running");
  AssertTrue(lan.network.ContainerState("10.0.8.52", scanner->container_name).empty(),
             "stopped container torn down");
  AssertTrue(IndexOf(lan.network.CommandLog("10.0.8.51"), "docker stop") >= 0,
             "stop was attempted on the stubborn board");

  AssertTrue(reporter->state == BindingState::kUnbuilt, "later wave never starts");
  AssertContains(reporter->note, "not started: run aborted");
  AssertTrue(lan.network.CommandLog("10.0.8.53").empty(), "later wave's board is untouched");

  const fs::path run_dir = runs_root / "run-soak";
  const std::string events = tracr::tests::common::ReadFileToString(run_dir / "events.jsonl");
  AssertContains(events, "\"abort_requested\"");
  AssertContains(events, "\"stop_unconfirmed\"");
  AssertContains(events, "\"wave_cancelled\"");
  const std::string run_json = tracr::tests::common::ReadFileToString(run_dir / "run.json");
  AssertContains(run_json, "\"aborted\":true");
  AssertContains(run_json, "\"unconfirmed_stops\":[\"" + stubborn_id + "\"]");

  for (const auto& host : lan.network.Hosts()) {
    AssertTrue(lan.network.OpenSessions(host) == 0U, "sessions closed on " + host);
  }

  // Abort after the run is a no-op.
  orchestrator.Abort();
  return 0;
}
