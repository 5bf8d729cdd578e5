#include "network/lan_config_store.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace tracr::network {

namespace {

using JsonValue = core::json::Value;

bool ReadOptionalString(const JsonValue& object, std::string_view key, std::string& out,
                        std::string& error) {
  const JsonValue* field = object.Find(key);
  if (field == nullptr || field->IsNull()) {
    out.clear();
    return true;
  }
  if (!field->IsString()) {
    error = "LAN config field '" + std::string(key) + "' must be a string";
    return false;
  }
  out = field->string_value;
  return true;
}

} // namespace

std::string RenderLanDocument(const LanDocument& document) {
  std::ostringstream out;
  out << "{\n";
  out << "  \"schema_version\": " << kLanSchemaVersion << ",\n";
  out << "  \"name\": \"" << core::EscapeJson(document.lan.name) << "\",\n";
  out << "  \"subnet\": \"" << core::EscapeJson(document.lan.subnet) << "\",\n";
  if (document.lan.discovered_at.has_value()) {
    out << "  \"discovered_at_utc\": \""
        << core::FormatUtcTimestamp(*document.lan.discovered_at) << "\",\n";
  } else {
    out << "  \"discovered_at_utc\": null,\n";
  }
  out << "  \"controller\": "
      << core::JsonObjectWriter()
             .String("device_id", document.lan.controller_id)
             .String("experiments_root", document.experiments_root)
             .Finish()
      << ",\n";

  out << "  \"devices\": [";
  for (std::size_t i = 0; i < document.devices.size(); ++i) {
    out << (i == 0U ? "\n    " : ",\n    ") << registry::ToJson(document.devices[i]);
  }
  out << (document.devices.empty() ? "],\n" : "\n  ],\n");

  out << "  \"audit\": [";
  for (std::size_t i = 0; i < document.audit.size(); ++i) {
    out << (i == 0U ? "\n    " : ",\n    ") << ToJson(document.audit[i]);
  }
  out << (document.audit.empty() ? "]\n" : "\n  ]\n");
  out << "}\n";
  return out.str();
}

bool ParseLanDocument(std::string_view text, LanDocument& document, std::string& error) {
  JsonValue root;
  if (!core::json::Parse(text, root, error)) {
    error = "invalid LAN config JSON: " + error;
    return false;
  }
  if (!root.IsObject()) {
    error = "LAN config root must be an object";
    return false;
  }

  const JsonValue* schema = root.Find("schema_version");
  if (schema != nullptr &&
      (!schema->IsNumber() || static_cast<int>(schema->number_value) > kLanSchemaVersion)) {
    error = "unsupported LAN config schema_version";
    return false;
  }

  LanDocument parsed;
  if (!ReadOptionalString(root, "name", parsed.lan.name, error) ||
      !ReadOptionalString(root, "subnet", parsed.lan.subnet, error)) {
    return false;
  }
  if (parsed.lan.name.empty()) {
    parsed.lan.name = "default";
  }

  std::string discovered_text;
  if (!ReadOptionalString(root, "discovered_at_utc", discovered_text, error)) {
    return false;
  }
  if (!discovered_text.empty()) {
    std::chrono::system_clock::time_point discovered_at;
    if (!core::ParseUtcTimestamp(discovered_text, discovered_at)) {
      error = "LAN config has invalid discovered_at_utc '" + discovered_text + "'";
      return false;
    }
    parsed.lan.discovered_at = discovered_at;
  }

  if (const JsonValue* controller = root.Find("controller"); controller != nullptr) {
    if (!controller->IsObject()) {
      error = "LAN config field 'controller' must be an object";
      return false;
    }
    if (!ReadOptionalString(*controller, "device_id", parsed.lan.controller_id, error) ||
        !ReadOptionalString(*controller, "experiments_root", parsed.experiments_root, error)) {
      return false;
    }
  }

  if (const JsonValue* devices = root.Find("devices"); devices != nullptr) {
    if (!devices->IsArray()) {
      error = "LAN config field 'devices' must be an array";
      return false;
    }
    for (std::size_t i = 0; i < devices->array_value.size(); ++i) {
      registry::Device device;
      std::string device_error;
      if (!registry::FromJson(devices->array_value[i], device, device_error)) {
        error = "devices[" + std::to_string(i) + "]: " + device_error;
        return false;
      }
      parsed.devices.push_back(std::move(device));
    }
  }

  if (const JsonValue* audit = root.Find("audit"); audit != nullptr) {
    if (!audit->IsArray()) {
      error = "LAN config field 'audit' must be an array";
      return false;
    }
    for (std::size_t i = 0; i < audit->array_value.size(); ++i) {
      AuditEntry entry;
      std::string entry_error;
      if (!FromJson(audit->array_value[i], entry, entry_error)) {
        error = "audit[" + std::to_string(i) + "]: " + entry_error;
        return false;
      }
      parsed.audit.push_back(std::move(entry));
    }
  }

  const std::string stored_controller = parsed.lan.controller_id;
  RefreshMembership(parsed.lan, parsed.devices);
  if (!stored_controller.empty() && stored_controller != parsed.lan.controller_id) {
    error = "controller.device_id '" + stored_controller +
            "' does not match the controller-role device";
    return false;
  }

  document = std::move(parsed);
  return true;
}

LanConfigStore::LanConfigStore(fs::path path, std::string default_name)
    : path_(std::move(path)) {
  document_.lan.name = default_name.empty() ? "default" : std::move(default_name);
}

bool LanConfigStore::Exists() const {
  std::error_code ec;
  return fs::exists(path_, ec);
}

bool LanConfigStore::LoadLocked(std::string& error) {
  if (loaded_) {
    return true;
  }
  std::error_code ec;
  if (!fs::exists(path_, ec)) {
    loaded_ = true;
    return true;
  }
  std::string text;
  if (!core::ReadTextFile(path_, text, error)) {
    return false;
  }
  LanDocument parsed;
  if (!ParseLanDocument(text, parsed, error)) {
    error = path_.string() + ": " + error;
    return false;
  }
  document_ = std::move(parsed);
  loaded_ = true;
  return true;
}

bool LanConfigStore::LoadDevices(std::vector<registry::Device>& devices, std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  loaded_ = false;
  if (!LoadLocked(error)) {
    return false;
  }
  devices = document_.devices;
  return true;
}

bool LanConfigStore::SaveDevices(const std::vector<registry::Device>& devices,
                                 std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!LoadLocked(error)) {
    return false;
  }
  LanDocument next = document_;
  next.devices = devices;
  RefreshMembership(next.lan, next.devices);
  return WriteLocked(next, error);
}

LanDocument LanConfigStore::Document() const {
  std::lock_guard<std::mutex> lock(mu_);
  return document_;
}

bool LanConfigStore::SaveMetadata(
    const std::string& name, const std::string& subnet,
    std::optional<std::chrono::system_clock::time_point> discovered_at,
    const std::string& experiments_root, std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!LoadLocked(error)) {
    return false;
  }
  LanDocument next = document_;
  if (!name.empty()) {
    next.lan.name = name;
  }
  next.lan.subnet = subnet;
  if (discovered_at.has_value()) {
    next.lan.discovered_at =
        std::chrono::time_point_cast<std::chrono::milliseconds>(*discovered_at);
  }
  next.experiments_root = experiments_root;
  return WriteLocked(next, error);
}

bool LanConfigStore::SaveAudit(const std::vector<AuditEntry>& audit, std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!LoadLocked(error)) {
    return false;
  }
  LanDocument next = document_;
  next.audit = audit;
  return WriteLocked(next, error);
}

bool LanConfigStore::WriteLocked(const LanDocument& next, std::string& error) {
  if (!core::WriteTextFileAtomic(path_, RenderLanDocument(next), error)) {
    return false;
  }
  document_ = next;
  return true;
}

} // namespace tracr::network
