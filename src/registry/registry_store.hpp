#pragma once

#include "registry/device_model.hpp"

#include <string>
#include <vector>

namespace tracr::registry {

// Durable backing for the device registry. The registry hands over a full
// snapshot on every mutation; implementations must publish it atomically
// (all-or-nothing) and report failure so the mutation can be rolled back.
class IRegistryStore {
public:
  virtual ~IRegistryStore() = default;

  virtual bool LoadDevices(std::vector<Device>& devices, std::string& error) = 0;

  virtual bool SaveDevices(const std::vector<Device>& devices, std::string& error) = 0;
};

} // namespace tracr::registry
