#include "deploy/run_record.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

namespace fs = std::filesystem;

namespace tracr::deploy {

const char* ToString(const BindingState state) {
  switch (state) {
  case BindingState::kUnbuilt:
    return "unbuilt";
  case BindingState::kBuilding:
    return "building";
  case BindingState::kBuilt:
    return "built";
  case BindingState::kDeploying:
    return "deploying";
  case BindingState::kDeployed:
    return "deployed";
  case BindingState::kRunning:
    return "running";
  case BindingState::kSucceeded:
    return "succeeded";
  case BindingState::kFailed:
    return "failed";
  }
  return "unbuilt";
}

const char* ToReportedStatus(const BindingState state) {
  switch (state) {
  case BindingState::kUnbuilt:
    return "pending";
  case BindingState::kBuilding:
  case BindingState::kBuilt:
  case BindingState::kDeploying:
    return "building";
  case BindingState::kDeployed:
    return "deployed";
  case BindingState::kRunning:
    return "running";
  case BindingState::kSucceeded:
    return "succeeded";
  case BindingState::kFailed:
    return "failed";
  }
  return "pending";
}

bool IsTerminal(const BindingState state) {
  return state == BindingState::kSucceeded || state == BindingState::kFailed;
}

bool IsValidTransition(const BindingState from, const BindingState to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (to == BindingState::kFailed) {
    return true;
  }
  return static_cast<int>(to) == static_cast<int>(from) + 1;
}

bool HasPassedDeployment(const BindingState state) {
  return static_cast<int>(state) >= static_cast<int>(BindingState::kDeployed);
}

const char* ToString(const RunStatus status) {
  switch (status) {
  case RunStatus::kRunning:
    return "running";
  case RunStatus::kSucceeded:
    return "succeeded";
  case RunStatus::kFailed:
    return "failed";
  }
  return "running";
}

std::optional<std::uint64_t> BindingRecord::SeqOf(const BindingState target) const {
  for (const auto& transition : transitions) {
    if (transition.state == target) {
      return transition.seq;
    }
  }
  return std::nullopt;
}

const BindingRecord* RunRecord::FindBinding(const std::string& role) const {
  for (const auto& binding : bindings) {
    if (binding.role == role) {
      return &binding;
    }
  }
  return nullptr;
}

std::string ToJson(const RunRecord& record) {
  std::vector<std::string> bindings;
  for (const auto& binding : record.bindings) {
    std::vector<std::string> transitions;
    for (const auto& transition : binding.transitions) {
      transitions.push_back(core::JsonObjectWriter()
                                .String("state", ToString(transition.state))
                                .String("at_utc", core::FormatUtcTimestamp(transition.at))
                                .UInt("seq", transition.seq)
                                .Finish());
    }

    core::JsonObjectWriter writer;
    writer.String("role", binding.role)
        .String("device_id", binding.device_id)
        .String("endpoint", binding.endpoint)
        .String("arch", binding.arch)
        .Int("order", binding.order)
        .UInt("wave", binding.wave_index)
        .String("state", ToString(binding.state))
        .String("status", ToReportedStatus(binding.state))
        .String("image", binding.image_tag)
        .String("container", binding.container_name);
    if (binding.exit_code.has_value()) {
      writer.Int("exit_code", *binding.exit_code);
    } else {
      writer.Null("exit_code");
    }
    writer.String("error_code", binding.error_code)
        .String("error", binding.error_message)
        .String("stderr", binding.stderr_snippet)
        .String("note", binding.note)
        .UInt("telemetry_entries", binding.telemetry_entries)
        .UInt("telemetry_malformed", binding.telemetry_malformed)
        .Raw("transitions", core::JoinJsonArray(transitions));
    bindings.push_back(writer.Finish());
  }

  core::JsonObjectWriter writer;
  writer.String("run_id", record.run_id)
      .String("experiment_id", record.experiment_id)
      .String("experiment_name", record.experiment_name)
      .String("lan", record.lan_name)
      .String("wave_gate", record.wave_gate)
      .String("status", ToString(record.status))
      .Bool("aborted", record.aborted)
      .String("started_at_utc", core::FormatUtcTimestamp(record.started_at));
  if (record.finished_at.has_value()) {
    writer.String("finished_at_utc", core::FormatUtcTimestamp(*record.finished_at));
  } else {
    writer.Null("finished_at_utc");
  }
  writer.Raw("bindings", core::JoinJsonArray(bindings))
      .StringArray("unconfirmed_stops", record.unconfirmed_stops)
      .StringArray("warnings", record.warnings);
  return writer.Finish();
}

bool WriteRunRecord(const RunRecord& record, const fs::path& run_dir, fs::path& written_path,
                    std::string& error) {
  written_path = run_dir / "run.json";
  return core::WriteTextFileAtomic(written_path, ToJson(record) + "\n", error);
}

} // namespace tracr::deploy
