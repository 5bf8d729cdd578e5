#include "registry/device_registry.hpp"

#include "core/id_utils.hpp"

#include <algorithm>

namespace tracr::registry {

using core::errors::Error;
using core::errors::ErrorKind;

namespace {

void ApplyPatch(const DevicePatch& patch, Device& device) {
  if (patch.name) {
    device.name = *patch.name;
  }
  if (patch.host) {
    device.host = *patch.host;
  }
  if (patch.mac) {
    device.mac = NormalizeMac(*patch.mac);
  }
  if (patch.arch) {
    device.arch = *patch.arch;
  }
  if (patch.os_family) {
    device.os_family = *patch.os_family;
  }
  if (patch.os_version) {
    device.os_version = *patch.os_version;
  }
  if (patch.user) {
    device.user = *patch.user;
  }
  if (patch.identity_file) {
    device.identity_file = *patch.identity_file;
  }
  if (patch.port) {
    device.port = *patch.port;
  }
  if (patch.role) {
    device.role = *patch.role;
  }
  if (patch.last_synced_at) {
    device.last_synced_at = *patch.last_synced_at;
  }
  device.state = DeriveConfigState(device);
}

} // namespace

DeviceRegistry::DeviceRegistry(IRegistryStore* store) : store_(store) {}

bool DeviceRegistry::Load(Error& error) {
  core::errors::Clear(error);
  if (store_ == nullptr) {
    return true;
  }

  std::vector<Device> devices;
  std::string load_error;
  if (!store_->LoadDevices(devices, load_error)) {
    return core::errors::Fail(error, ErrorKind::kIo, load_error);
  }

  std::unique_lock<std::shared_mutex> lock(map_mu_);
  records_.clear();
  next_seq_ = 1;
  for (auto& device : devices) {
    if (records_.count(device.id) != 0U) {
      records_.clear();
      return core::errors::Fail(error, ErrorKind::kDuplicateDevice,
                                "stored registry contains duplicate device id " + device.id);
    }
    next_seq_ = std::max(next_seq_, device.registration_seq + 1U);
    auto record = std::make_shared<Record>();
    record->device = std::move(device);
    records_.emplace(record->device.id, std::move(record));
  }
  return true;
}

bool DeviceRegistry::Register(const Device& attributes, std::string& device_id, Error& error) {
  core::errors::Clear(error);

  Device device = attributes;
  device.mac = NormalizeMac(device.mac);
  if (device.host.empty()) {
    return core::errors::Fail(error, ErrorKind::kInvalidState,
                              "device host/IP is required for registration");
  }
  if (device.id.empty()) {
    device.id = core::MakeUuidV4();
  }
  device.state = DeriveConfigState(device);

  std::unique_lock<std::shared_mutex> lock(map_mu_);
  if (records_.count(device.id) != 0U) {
    return core::errors::Fail(error, ErrorKind::kDuplicateDevice,
                              "device id already registered: " + device.id);
  }
  if (HasEndpointConflictLocked(device.host, device.mac, "")) {
    return core::errors::Fail(error, ErrorKind::kDuplicateDevice,
                              "device with host " + device.host + " and MAC " +
                                  (device.mac.empty() ? "<none>" : device.mac) +
                                  " is already registered");
  }
  if (device.role == DeviceRole::kController && HasControllerLocked("")) {
    return core::errors::Fail(error, ErrorKind::kInvalidState,
                              "LAN already has a controller device");
  }

  device.registration_seq = next_seq_;
  auto record = std::make_shared<Record>();
  record->device = device;
  records_.emplace(device.id, record);

  if (!PersistLocked(error)) {
    records_.erase(device.id);
    return false;
  }

  ++next_seq_;
  device_id = device.id;
  return true;
}

bool DeviceRegistry::Get(std::string_view device_id, Device& device, Error& error) const {
  core::errors::Clear(error);
  std::shared_lock<std::shared_mutex> lock(map_mu_);
  const auto it = records_.find(device_id);
  if (it == records_.end()) {
    return core::errors::Fail(error, ErrorKind::kNotFound,
                              "device not found: " + std::string(device_id));
  }
  device = it->second->device;
  return true;
}

bool DeviceRegistry::Update(std::string_view device_id, const DevicePatch& patch, Error& error) {
  core::errors::Clear(error);

  const std::shared_ptr<Record> record = FindRecord(device_id);
  if (record == nullptr) {
    return core::errors::Fail(error, ErrorKind::kNotFound,
                              "device not found: " + std::string(device_id));
  }

  std::lock_guard<std::mutex> record_lock(record->mu);
  std::unique_lock<std::shared_mutex> lock(map_mu_);
  if (records_.find(device_id) == records_.end()) {
    // Removed while this update waited for the record lock.
    return core::errors::Fail(error, ErrorKind::kNotFound,
                              "device not found: " + std::string(device_id));
  }

  const Device before = record->device;
  if (patch.arch.has_value() && *patch.arch != before.arch &&
      before.state == ConfigState::kConfigured) {
    return core::errors::Fail(error, ErrorKind::kInvalidState,
                              "architecture of configured device " + before.id +
                                  " is immutable (" + before.arch + " -> " + *patch.arch +
                                  "); re-register the device instead");
  }

  Device after = before;
  ApplyPatch(patch, after);
  if (after.host.empty()) {
    return core::errors::Fail(error, ErrorKind::kInvalidState, "device host/IP cannot be empty");
  }
  if ((after.host != before.host || after.mac != before.mac) &&
      HasEndpointConflictLocked(after.host, after.mac, before.id)) {
    return core::errors::Fail(error, ErrorKind::kDuplicateDevice,
                              "host " + after.host + " and MAC " + after.mac +
                                  " already belong to another device");
  }
  if (after.role == DeviceRole::kController && before.role != DeviceRole::kController &&
      HasControllerLocked(before.id)) {
    return core::errors::Fail(error, ErrorKind::kInvalidState,
                              "LAN already has a controller device");
  }
  if (before.role == DeviceRole::kController && after.role != DeviceRole::kController) {
    return core::errors::Fail(error, ErrorKind::kInvalidState,
                              "device " + before.id +
                                  " is the LAN controller and cannot be demoted");
  }

  record->device = after;
  if (!PersistLocked(error)) {
    record->device = before;
    return false;
  }
  return true;
}

std::vector<Device> DeviceRegistry::List(const DeviceFilter& filter) const {
  std::vector<Device> matches;
  {
    std::shared_lock<std::shared_mutex> lock(map_mu_);
    for (const auto& [id, record] : records_) {
      if (filter.Matches(record->device)) {
        matches.push_back(record->device);
      }
    }
  }
  std::sort(matches.begin(), matches.end(), [](const Device& a, const Device& b) {
    return a.registration_seq < b.registration_seq;
  });
  return matches;
}

bool DeviceRegistry::Remove(std::string_view device_id, Error& error) {
  core::errors::Clear(error);

  const std::shared_ptr<Record> record = FindRecord(device_id);
  if (record == nullptr) {
    return core::errors::Fail(error, ErrorKind::kNotFound,
                              "device not found: " + std::string(device_id));
  }

  std::lock_guard<std::mutex> record_lock(record->mu);
  std::unique_lock<std::shared_mutex> lock(map_mu_);
  const auto it = records_.find(device_id);
  if (it == records_.end()) {
    return core::errors::Fail(error, ErrorKind::kNotFound,
                              "device not found: " + std::string(device_id));
  }

  std::shared_ptr<Record> removed = it->second;
  records_.erase(it);
  if (!PersistLocked(error)) {
    records_.emplace(removed->device.id, removed);
    return false;
  }
  return true;
}

std::size_t DeviceRegistry::Size() const {
  std::shared_lock<std::shared_mutex> lock(map_mu_);
  return records_.size();
}

std::shared_ptr<DeviceRegistry::Record> DeviceRegistry::FindRecord(
    std::string_view device_id) const {
  std::shared_lock<std::shared_mutex> lock(map_mu_);
  const auto it = records_.find(device_id);
  return it == records_.end() ? nullptr : it->second;
}

bool DeviceRegistry::HasEndpointConflictLocked(const std::string& host, const std::string& mac,
                                               std::string_view exclude_id) const {
  return std::any_of(records_.begin(), records_.end(), [&](const auto& entry) {
    const Device& other = entry.second->device;
    return other.id != exclude_id && other.host == host && other.mac == mac;
  });
}

bool DeviceRegistry::HasControllerLocked(std::string_view exclude_id) const {
  return std::any_of(records_.begin(), records_.end(), [&](const auto& entry) {
    const Device& other = entry.second->device;
    return other.id != exclude_id && other.role == DeviceRole::kController;
  });
}

std::vector<Device> DeviceRegistry::SnapshotLocked() const {
  std::vector<Device> devices;
  devices.reserve(records_.size());
  for (const auto& [id, record] : records_) {
    devices.push_back(record->device);
  }
  std::sort(devices.begin(), devices.end(), [](const Device& a, const Device& b) {
    return a.registration_seq < b.registration_seq;
  });
  return devices;
}

bool DeviceRegistry::PersistLocked(Error& error) const {
  if (store_ == nullptr) {
    return true;
  }
  std::string save_error;
  if (!store_->SaveDevices(SnapshotLocked(), save_error)) {
    return core::errors::Fail(error, ErrorKind::kIo,
                              "failed to persist device registry: " + save_error);
  }
  return true;
}

} // namespace tracr::registry
