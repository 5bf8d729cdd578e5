#pragma once

#include "network/lan_model.hpp"
#include "registry/registry_store.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace tracr::network {

constexpr int kLanSchemaVersion = 1;

// Everything persisted for one LAN.
struct LanDocument {
  Lan lan;
  std::string experiments_root;
  std::vector<AuditEntry> audit;
  std::vector<registry::Device> devices;
};

std::string RenderLanDocument(const LanDocument& document);
bool ParseLanDocument(std::string_view text, LanDocument& document, std::string& error);

// One JSON file per LAN, rewritten atomically on every registry mutation.
//
// File shape:
//   {"schema_version":1,"name":..,"subnet":..,"discovered_at_utc":..|null,
//    "controller":{"device_id":..,"experiments_root":..},
//    "devices":[...],"audit":[...]}
class LanConfigStore final : public registry::IRegistryStore {
public:
  explicit LanConfigStore(std::filesystem::path path, std::string default_name = "default");

  const std::filesystem::path& path() const {
    return path_;
  }

  bool Exists() const;

  // A missing file loads as an empty LAN.
  bool LoadDevices(std::vector<registry::Device>& devices, std::string& error) override;
  bool SaveDevices(const std::vector<registry::Device>& devices, std::string& error) override;

  LanDocument Document() const;

  bool SaveMetadata(const std::string& name, const std::string& subnet,
                    std::optional<std::chrono::system_clock::time_point> discovered_at,
                    const std::string& experiments_root, std::string& error);
  bool SaveAudit(const std::vector<AuditEntry>& audit, std::string& error);

private:
  bool LoadLocked(std::string& error);
  bool WriteLocked(const LanDocument& next, std::string& error);

  mutable std::mutex mu_;
  std::filesystem::path path_;
  LanDocument document_;
  bool loaded_ = false;
};

} // namespace tracr::network
