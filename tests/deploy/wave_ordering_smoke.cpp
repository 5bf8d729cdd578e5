#include "common/assertions.hpp"
#include "common/sim_lan.hpp"
#include "common/temp_dir.hpp"

#include "deploy/orchestrator.hpp"
#include "experiment/binding_validator.hpp"
#include "experiment/descriptor_parser.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using tracr::core::errors::Error;
using tracr::deploy::BindingState;
using tracr::tests::common::AssertContains;
using tracr::tests::common::AssertOk;
using tracr::tests::common::AssertTrue;
using tracr::tests::common::IndexOf;

namespace {

std::uint64_t SeqOrFail(const tracr::deploy::BindingRecord& binding, BindingState state) {
  const auto seq = binding.SeqOf(state);
  AssertTrue(seq.has_value(),
             binding.role + " never reached " + tracr::deploy::ToString(state));
  return *seq;
}

} // namespace

int main() {
  tracr::tests::common::ScopedTempDir temp("tracr-wave-ordering");
  tracr::tests::common::SimLan lan;
  const std::string left_id = lan.AddParticipant("10.0.5.21", "arm64");
  const std::string right_id = lan.AddParticipant("10.0.5.22", "arm64");
  const std::string joiner_id = lan.AddParticipant("10.0.5.23", "arm64");

  const fs::path directory = tracr::tests::common::WriteExperiment(
      temp.path() / "TestCases", "mesh",
      R"({"id":"exp-mesh","name":"mesh","deviceConstraints":[
           {"role":"left","arch":"arm64","runtimeScript":"scripts/node.py","order":0},
           {"role":"right","arch":"arm64","runtimeScript":"scripts/node.py","order":0},
           {"role":"joiner","arch":"arm64","runtimeScript":"scripts/join.py",
            "after":["left","right"]}]})",
      {"scripts/node.py", "scripts/join.py"});

  tracr::experiment::Experiment experiment;
  tracr::experiment::ValidationReport report;
  Error error;
  AssertOk(tracr::experiment::LoadDescriptor(directory, experiment, report, error), error,
           "load experiment");
  tracr::experiment::BindingPlan plan;
  AssertOk(tracr::experiment::Validate(experiment, lan.registry.List(), plan, report, error),
           error, "validate");
  AssertTrue(plan.waves.size() == 2U, "orders [0, 0, 1] give two waves");

  tracr::deploy::OrchestratorOptions options;
  options.runs_root = temp.path() / "runs";
  options.poll_interval = std::chrono::milliseconds(1);
  options.lan_name = "lab";
  tracr::deploy::Orchestrator orchestrator(lan.registry, lan.connections, options, lan.logger);

  std::vector<std::string> observed;
  std::mutex observed_mu;
  orchestrator.SetTransitionObserver([&](const std::string& role, BindingState state) {
    std::lock_guard<std::mutex> lock(observed_mu);
    observed.push_back(role + ":" + tracr::deploy::ToString(state));
  });

  tracr::deploy::RunRecord record;
  AssertOk(orchestrator.Run(experiment, plan, "run-waves", record, error), error, "run");
  AssertTrue(record.status == tracr::deploy::RunStatus::kSucceeded, "run succeeds");
  AssertTrue(record.wave_gate == "deployed", "default gate is recorded");
  AssertTrue(record.warnings.size() == 1U, "shared order warning carried into the run");
  AssertContains(record.warnings[0], "'left', 'right' share order 0");

  const auto* left = record.FindBinding("left");
  const auto* right = record.FindBinding("right");
  const auto* joiner = record.FindBinding("joiner");
  AssertTrue(left != nullptr && right != nullptr && joiner != nullptr, "all roles recorded");
  AssertTrue(left->device_id == left_id && right->device_id == right_id &&
                 joiner->device_id == joiner_id,
             "roles bound in registration order");
  AssertTrue(left->wave_index == 0U && right->wave_index == 0U && joiner->wave_index == 1U,
             "wave indices recorded");
  AssertTrue(joiner->order == 1, "derived order recorded");

  // Wave 0 launches together, and only once every member is deployed.
  const std::uint64_t wave0_deployed = std::max(SeqOrFail(*left, BindingState::kDeployed),
                                                SeqOrFail(*right, BindingState::kDeployed));
  AssertTrue(SeqOrFail(*left, BindingState::kRunning) > wave0_deployed,
             "left starts after right is deployed");
  AssertTrue(SeqOrFail(*right, BindingState::kRunning) > wave0_deployed,
             "right starts after left is deployed");
  // Wave 1 does not start building before wave 0 has passed deployment.
  AssertTrue(SeqOrFail(*joiner, BindingState::kBuilding) > wave0_deployed,
             "joiner builds after wave 0 is deployed");

  const auto global = lan.network.GlobalLog();
  const long left_create = IndexOf(global, "10.0.5.21 docker create");
  const long right_create = IndexOf(global, "10.0.5.22 docker create");
  const long first_start = std::min(IndexOf(global, "10.0.5.21 docker start"),
                                    IndexOf(global, "10.0.5.22 docker start"));
  const long joiner_first = IndexOf(global, "10.0.5.23 ");
  AssertTrue(left_create >= 0 && right_create >= 0 && joiner_first >= 0, "commands dispatched");
  AssertTrue(first_start > std::max(left_create, right_create),
             "no container starts before its whole wave is created");
  AssertTrue(joiner_first > std::max(left_create, right_create),
             "joiner is untouched until wave 0 is deployed");

  // Each binding passes every state once, in order.
  const std::vector<BindingState> lifecycle = {
      BindingState::kBuilding,  BindingState::kBuilt,   BindingState::kDeploying,
      BindingState::kDeployed,  BindingState::kRunning, BindingState::kSucceeded};
  for (const auto& binding : record.bindings) {
    AssertTrue(binding.transitions.size() == lifecycle.size(),
               binding.role + " has one transition per state");
    for (std::size_t i = 0; i < lifecycle.size(); ++i) {
      AssertTrue(binding.transitions[i].state == lifecycle[i], binding.role + " state order");
      AssertTrue(i == 0U || binding.transitions[i].seq > binding.transitions[i - 1U].seq,
                 binding.role + " sequence numbers increase");
    }
    AssertTrue(binding.exit_code == 0, binding.role + " exit code recorded");
    AssertTrue(lan.network.ContainerState(binding.endpoint.substr(binding.endpoint.find('@') + 1U),
                                          binding.container_name)
                   .empty(),
               binding.role + " container torn down");
  }
  AssertTrue(observed.size() == 18U, "observer sees every transition");
  AssertTrue(std::find(observed.begin(), observed.end(), "joiner:succeeded") != observed.end(),
             "observer sees the terminal state");

  // Each board builds its own base layer under its architecture tag.
  AssertTrue(lan.network.HasImage("10.0.5.21", "tracr-base:arm64"), "base image built");
  AssertTrue(lan.network.HasImage("10.0.5.23", "tracr-mesh-joiner:run-waves"),
             "runtime image built");

  const fs::path run_dir = options.runs_root / "run-waves";
  const std::string run_json = tracr::tests::common::ReadFileToString(run_dir / "run.json");
  AssertContains(run_json, "\"status\":\"succeeded\"");
  AssertContains(run_json, "\"wave_gate\":\"deployed\"");
  const std::string events = tracr::tests::common::ReadFileToString(run_dir / "events.jsonl");
  AssertContains(events, "\"wave_gate_opened\"");
  AssertContains(events, "\"run_finished\"");
  AssertTrue(fs::is_regular_file(run_dir / "experiment.json"), "descriptor snapshot archived");
  AssertTrue(fs::is_regular_file(run_dir / "build" / "joiner" / "Dockerfile.runtime"),
             "build inputs staged under the run");
  return 0;
}
