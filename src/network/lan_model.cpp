#include "network/lan_model.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

namespace tracr::network {

void RefreshMembership(Lan& lan, const std::vector<registry::Device>& devices) {
  lan.controller_id.clear();
  lan.participant_ids.clear();
  for (const auto& device : devices) {
    if (device.role == registry::DeviceRole::kController) {
      lan.controller_id = device.id;
    } else {
      lan.participant_ids.push_back(device.id);
    }
  }
}

std::string ToJson(const AuditEntry& entry) {
  return core::JsonObjectWriter()
      .String("run_id", entry.run_id)
      .String("experiment_id", entry.experiment_id)
      .String("dispatched_at_utc", core::FormatUtcTimestamp(entry.dispatched_at))
      .String("status", entry.status)
      .Finish();
}

bool FromJson(const core::json::Value& value, AuditEntry& entry, std::string& error) {
  const auto* run_id = value.Find("run_id");
  const auto* experiment_id = value.Find("experiment_id");
  const auto* dispatched = value.Find("dispatched_at_utc");
  const auto* status = value.Find("status");
  if (run_id == nullptr || !run_id->IsString() || experiment_id == nullptr ||
      !experiment_id->IsString() || dispatched == nullptr || !dispatched->IsString()) {
    error = "audit entry requires string fields run_id, experiment_id, dispatched_at_utc";
    return false;
  }
  AuditEntry parsed;
  parsed.run_id = run_id->string_value;
  parsed.experiment_id = experiment_id->string_value;
  if (!core::ParseUtcTimestamp(dispatched->string_value, parsed.dispatched_at)) {
    error = "audit entry has invalid dispatched_at_utc '" + dispatched->string_value + "'";
    return false;
  }
  if (status != nullptr && status->IsString()) {
    parsed.status = status->string_value;
  }
  entry = std::move(parsed);
  return true;
}

ControllerNode::ControllerNode(registry::Device device, std::filesystem::path experiments_root,
                               std::vector<AuditEntry> audit)
    : device_(std::move(device)), experiments_root_(std::move(experiments_root)),
      audit_(std::move(audit)) {}

void ControllerNode::RecordDispatch(const std::string& run_id, const std::string& experiment_id,
                                    const std::chrono::system_clock::time_point dispatched_at) {
  AuditEntry entry;
  entry.run_id = run_id;
  entry.experiment_id = experiment_id;
  entry.dispatched_at = std::chrono::time_point_cast<std::chrono::milliseconds>(dispatched_at);
  audit_.push_back(std::move(entry));
}

bool ControllerNode::RecordOutcome(const std::string& run_id, const std::string& status) {
  for (auto& entry : audit_) {
    if (entry.run_id == run_id) {
      entry.status = status;
      return true;
    }
  }
  return false;
}

} // namespace tracr::network
