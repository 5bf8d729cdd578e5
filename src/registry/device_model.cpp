#include "registry/device_model.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace tracr::registry {

namespace {

using JsonValue = core::json::Value;

bool ReadString(const JsonValue& object, std::string_view key, std::string& out, bool required,
                std::string& error) {
  const JsonValue* field = object.Find(key);
  if (field == nullptr || field->IsNull()) {
    if (required) {
      error = "device record missing required field '" + std::string(key) + "'";
      return false;
    }
    out.clear();
    return true;
  }
  if (!field->IsString()) {
    error = "device field '" + std::string(key) + "' must be a string";
    return false;
  }
  out = field->string_value;
  return true;
}

bool ReadUnsigned(const JsonValue& object, std::string_view key, std::uint64_t max_value,
                  std::uint64_t& out, std::string& error) {
  const JsonValue* field = object.Find(key);
  if (field == nullptr) {
    return true;
  }
  const double number = field->number_value;
  if (!field->IsNumber() || !std::isfinite(number) || number < 0.0 ||
      std::floor(number) != number || number > static_cast<double>(max_value)) {
    error = "device field '" + std::string(key) + "' must be a non-negative integer";
    return false;
  }
  out = static_cast<std::uint64_t>(number);
  return true;
}

} // namespace

const char* ToString(const DeviceRole role) {
  switch (role) {
  case DeviceRole::kController:
    return "controller";
  case DeviceRole::kParticipant:
    return "participant";
  }
  return "participant";
}

const char* ToString(const ConfigState state) {
  switch (state) {
  case ConfigState::kUnconfigured:
    return "unconfigured";
  case ConfigState::kConfigured:
    return "configured";
  }
  return "unconfigured";
}

bool ParseDeviceRole(std::string_view text, DeviceRole& role) {
  if (text == "controller") {
    role = DeviceRole::kController;
    return true;
  }
  if (text == "participant") {
    role = DeviceRole::kParticipant;
    return true;
  }
  return false;
}

bool ParseConfigState(std::string_view text, ConfigState& state) {
  if (text == "unconfigured") {
    state = ConfigState::kUnconfigured;
    return true;
  }
  if (text == "configured") {
    state = ConfigState::kConfigured;
    return true;
  }
  return false;
}

bool DeviceFilter::Matches(const Device& device) const {
  if (role.has_value() && device.role != *role) {
    return false;
  }
  if (arch.has_value() && device.arch != *arch) {
    return false;
  }
  if (state.has_value() && device.state != *state) {
    return false;
  }
  return true;
}

ConfigState DeriveConfigState(const Device& device) {
  if (device.host.empty() || device.mac.empty() || device.arch.empty() || device.user.empty()) {
    return ConfigState::kUnconfigured;
  }
  return ConfigState::kConfigured;
}

std::string NormalizeMac(std::string_view mac) {
  std::string normalized;
  normalized.reserve(mac.size());
  for (const char c : mac) {
    if (c == '-') {
      normalized.push_back(':');
    } else if (std::isspace(static_cast<unsigned char>(c)) == 0) {
      normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
  }
  return normalized;
}

std::string DescribeEndpoint(const Device& device) {
  std::string endpoint = device.user.empty() ? device.host : device.user + "@" + device.host;
  if (device.port != 22U) {
    endpoint += ":" + std::to_string(device.port);
  }
  return endpoint;
}

std::string ToJson(const Device& device) {
  core::JsonObjectWriter writer;
  writer.String("id", device.id)
      .String("name", device.name)
      .String("host", device.host)
      .String("mac", device.mac)
      .String("arch", device.arch)
      .String("os_family", device.os_family)
      .String("os_version", device.os_version)
      .String("user", device.user)
      .String("identity_file", device.identity_file)
      .UInt("port", device.port)
      .String("role", ToString(device.role))
      .String("state", ToString(device.state))
      .UInt("registration_seq", device.registration_seq);
  if (device.last_synced_at.has_value()) {
    writer.Int("last_synced_at_ms", core::ToEpochMilliseconds(*device.last_synced_at));
  } else {
    writer.Null("last_synced_at_ms");
  }
  return writer.Finish();
}

bool FromJson(const JsonValue& value, Device& device, std::string& error) {
  if (!value.IsObject()) {
    error = "device record must be an object";
    return false;
  }

  Device parsed;
  if (!ReadString(value, "id", parsed.id, true, error) ||
      !ReadString(value, "name", parsed.name, false, error) ||
      !ReadString(value, "host", parsed.host, true, error) ||
      !ReadString(value, "mac", parsed.mac, false, error) ||
      !ReadString(value, "arch", parsed.arch, false, error) ||
      !ReadString(value, "os_family", parsed.os_family, false, error) ||
      !ReadString(value, "os_version", parsed.os_version, false, error) ||
      !ReadString(value, "user", parsed.user, false, error) ||
      !ReadString(value, "identity_file", parsed.identity_file, false, error)) {
    return false;
  }

  std::uint64_t port = 22;
  if (!ReadUnsigned(value, "port", 65535U, port, error)) {
    return false;
  }
  parsed.port = static_cast<std::uint16_t>(port);

  std::string role_text;
  if (!ReadString(value, "role", role_text, true, error)) {
    return false;
  }
  if (!ParseDeviceRole(role_text, parsed.role)) {
    error = "device field 'role' must be controller or participant";
    return false;
  }

  std::string state_text;
  if (!ReadString(value, "state", state_text, false, error)) {
    return false;
  }
  if (state_text.empty()) {
    parsed.state = DeriveConfigState(parsed);
  } else if (!ParseConfigState(state_text, parsed.state)) {
    error = "device field 'state' must be configured or unconfigured";
    return false;
  }

  if (!ReadUnsigned(value, "registration_seq", UINT64_MAX, parsed.registration_seq, error)) {
    return false;
  }

  if (const JsonValue* synced = value.Find("last_synced_at_ms");
      synced != nullptr && synced->IsNumber()) {
    parsed.last_synced_at =
        core::FromEpochMilliseconds(static_cast<std::int64_t>(synced->number_value));
  }

  device = std::move(parsed);
  return true;
}

} // namespace tracr::registry
