#pragma once

#include "core/errors/error.hpp"
#include "registry/device_model.hpp"
#include "registry/registry_store.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace tracr::registry {

// Arena of every Device known to one LAN. Other components hold device IDs
// and read through this registry; nothing caches Device copies across a
// deployment wave.
//
// Concurrency:
// - each record has its own mutex held for the whole read-modify-write of an
//   update, so updates to the same device are serialized
// - mutations take the map lock exclusively from validation through
//   persistence, so endpoint and controller checks see a stable map; reads
//   share it
// - a mutation whose persistence fails is rolled back in memory
class DeviceRegistry {
public:
  // `store` may be null for a purely in-memory registry.
  explicit DeviceRegistry(IRegistryStore* store = nullptr);

  DeviceRegistry(const DeviceRegistry&) = delete;
  DeviceRegistry& operator=(const DeviceRegistry&) = delete;

  // Replaces in-memory contents with the store's snapshot.
  bool Load(core::errors::Error& error);

  // Fails kDuplicateDevice when the host+MAC pair or the explicit id already
  // exists, kInvalidState for a second controller. On success `device_id`
  // holds the (possibly generated) id.
  bool Register(const Device& attributes, std::string& device_id, core::errors::Error& error);

  bool Get(std::string_view device_id, Device& device, core::errors::Error& error) const;

  // Fails kNotFound, kInvalidState (architecture change on a configured
  // device, promoting a second controller or demoting the controller) or
  // kDuplicateDevice (host+MAC collision).
  bool Update(std::string_view device_id, const DevicePatch& patch, core::errors::Error& error);

  // Matching devices in registration order.
  std::vector<Device> List(const DeviceFilter& filter = {}) const;

  bool Remove(std::string_view device_id, core::errors::Error& error);

  std::size_t Size() const;

private:
  struct Record {
    std::mutex mu;
    Device device;
  };

  std::shared_ptr<Record> FindRecord(std::string_view device_id) const;
  bool HasEndpointConflictLocked(const std::string& host, const std::string& mac,
                                 std::string_view exclude_id) const;
  bool HasControllerLocked(std::string_view exclude_id) const;
  std::vector<Device> SnapshotLocked() const;
  bool PersistLocked(core::errors::Error& error) const;

  IRegistryStore* store_ = nullptr;
  mutable std::shared_mutex map_mu_;
  std::map<std::string, std::shared_ptr<Record>, std::less<>> records_;
  std::uint64_t next_seq_ = 1;
};

} // namespace tracr::registry
