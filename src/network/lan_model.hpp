#pragma once

#include "core/json_dom.hpp"
#include "registry/device_model.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tracr::network {

// One dispatched run as remembered by the controller.
struct AuditEntry {
  std::string run_id;
  std::string experiment_id;
  std::chrono::system_clock::time_point dispatched_at{};
  // dispatched | succeeded | failed
  std::string status = "dispatched";
};

// One named network configuration. Holds only device IDs; the registry is
// the arena that owns the records.
struct Lan {
  std::string name = "default";
  std::string subnet;
  std::optional<std::chrono::system_clock::time_point> discovered_at;
  std::string controller_id;
  std::vector<std::string> participant_ids;
};

// Rebuilds the ID references from the registry's current contents.
void RefreshMembership(Lan& lan, const std::vector<registry::Device>& devices);

std::string ToJson(const AuditEntry& entry);
bool FromJson(const core::json::Value& value, AuditEntry& entry, std::string& error);

// Controller-only state wrapped around the controller Device: where its
// experiments live and which runs it has dispatched.
class ControllerNode {
public:
  ControllerNode(registry::Device device, std::filesystem::path experiments_root,
                 std::vector<AuditEntry> audit = {});

  const registry::Device& device() const {
    return device_;
  }
  const std::filesystem::path& experiments_root() const {
    return experiments_root_;
  }
  const std::vector<AuditEntry>& audit() const {
    return audit_;
  }

  void RecordDispatch(const std::string& run_id, const std::string& experiment_id,
                      std::chrono::system_clock::time_point dispatched_at);
  // Returns false when `run_id` was never dispatched.
  bool RecordOutcome(const std::string& run_id, const std::string& status);

private:
  registry::Device device_;
  std::filesystem::path experiments_root_;
  std::vector<AuditEntry> audit_;
};

} // namespace tracr::network
