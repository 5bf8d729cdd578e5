#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tracr::deploy {

// Per-binding state machine:
//   Unbuilt -> Building -> Built -> Deploying -> Deployed -> Running
//     -> {Succeeded | Failed}
// Any non-terminal state may move to Failed.
enum class BindingState {
  kUnbuilt,
  kBuilding,
  kBuilt,
  kDeploying,
  kDeployed,
  kRunning,
  kSucceeded,
  kFailed,
};

const char* ToString(BindingState state);
// Coarse status shown to users: pending|building|deployed|running|succeeded|failed.
const char* ToReportedStatus(BindingState state);
bool IsTerminal(BindingState state);
bool IsValidTransition(BindingState from, BindingState to);
// Deployed or any later state, including Failed.
bool HasPassedDeployment(BindingState state);

enum class RunStatus {
  kRunning,
  kSucceeded,
  kFailed,
};

const char* ToString(RunStatus status);

struct StateTransition {
  BindingState state = BindingState::kUnbuilt;
  std::chrono::system_clock::time_point at{};
  // Run-global order shared with the event timeline.
  std::uint64_t seq = 0;
};

struct BindingRecord {
  std::string role;
  std::string device_id;
  std::string endpoint;
  std::string arch;
  std::int64_t order = 0;
  std::size_t wave_index = 0;

  BindingState state = BindingState::kUnbuilt;
  std::vector<StateTransition> transitions;

  std::string image_tag;
  std::string container_name;
  std::optional<int> exit_code;
  std::string error_code;
  std::string error_message;
  std::string stderr_snippet;
  // Why a binding never left Unbuilt, or other non-error context.
  std::string note;

  std::uint64_t telemetry_entries = 0;
  std::uint64_t telemetry_malformed = 0;

  std::optional<std::uint64_t> SeqOf(BindingState state) const;
};

// One execution attempt of an experiment against one LAN. Created when
// deployment starts; immutable once `status` is terminal.
struct RunRecord {
  std::string run_id;
  std::string experiment_id;
  std::string experiment_name;
  std::string lan_name;
  std::string wave_gate;
  std::chrono::system_clock::time_point started_at{};
  std::optional<std::chrono::system_clock::time_point> finished_at;
  RunStatus status = RunStatus::kRunning;
  bool aborted = false;
  std::vector<BindingRecord> bindings;
  // Device IDs whose container may still be running after an abort.
  std::vector<std::string> unconfirmed_stops;
  std::vector<std::string> warnings;

  const BindingRecord* FindBinding(const std::string& role) const;
};

std::string ToJson(const RunRecord& record);

// `<run_dir>/run.json`, written atomically.
bool WriteRunRecord(const RunRecord& record, const std::filesystem::path& run_dir,
                    std::filesystem::path& written_path, std::string& error);

} // namespace tracr::deploy
