#pragma once

#include "core/json_dom.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tracr::registry {

enum class DeviceRole {
  kController,
  kParticipant,
};

enum class ConfigState {
  kUnconfigured,
  kConfigured,
};

const char* ToString(DeviceRole role);
const char* ToString(ConfigState state);
bool ParseDeviceRole(std::string_view text, DeviceRole& role);
bool ParseConfigState(std::string_view text, ConfigState& state);

// Identity and connection facts for one board on the LAN.
//
// `arch` is frozen once the device is configured; different hardware behind
// the same address must be re-registered.
struct Device {
  std::string id;
  std::string name;
  std::string host;
  std::string mac;
  std::string arch;
  std::string os_family;
  std::string os_version;
  std::string user;
  std::string identity_file;
  std::uint16_t port = 22;
  DeviceRole role = DeviceRole::kParticipant;
  ConfigState state = ConfigState::kUnconfigured;
  // Monotonic registration order; the binding validator's tie-break.
  std::uint64_t registration_seq = 0;
  std::optional<std::chrono::system_clock::time_point> last_synced_at;

  bool operator==(const Device& other) const = default;
};

// Partial update applied by `DeviceRegistry::Update`. Unset fields are kept.
struct DevicePatch {
  std::optional<std::string> name;
  std::optional<std::string> host;
  std::optional<std::string> mac;
  std::optional<std::string> arch;
  std::optional<std::string> os_family;
  std::optional<std::string> os_version;
  std::optional<std::string> user;
  std::optional<std::string> identity_file;
  std::optional<std::uint16_t> port;
  std::optional<DeviceRole> role;
  std::optional<std::chrono::system_clock::time_point> last_synced_at;
};

struct DeviceFilter {
  std::optional<DeviceRole> role;
  std::optional<std::string> arch;
  std::optional<ConfigState> state;

  bool Matches(const Device& device) const;
};

// Configured means every field needed to reach and build for the device is
// known: host, MAC, architecture and login user.
ConfigState DeriveConfigState(const Device& device);

// Normalizes MAC text to lowercase colon-separated form so `AA-BB-..` and
// `aa:bb:..` compare equal in the uniqueness check.
std::string NormalizeMac(std::string_view mac);

// Stable `user@host` / `host` rendering for logs.
std::string DescribeEndpoint(const Device& device);

std::string ToJson(const Device& device);
bool FromJson(const core::json::Value& value, Device& device, std::string& error);

} // namespace tracr::registry
