#include "tracr/config/controller_config.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <cmath>
#include <cstdlib>
#include <system_error>

namespace fs = std::filesystem;

namespace tracr::config {
namespace {

using core::json::Value;

bool ReadInteger(const Value& object, std::string_view key, const std::string& path,
                 std::int64_t minimum, std::int64_t& out, std::string& error) {
  const Value* value = object.Find(key);
  if (value == nullptr) {
    return true;
  }
  const std::string full_path = path + "." + std::string(key);
  if (!value->IsNumber() || std::floor(value->number_value) != value->number_value ||
      value->number_value < static_cast<double>(minimum) || value->number_value > 9.0e15) {
    error = full_path + ": expected an integer >= " + std::to_string(minimum);
    return false;
  }
  out = static_cast<std::int64_t>(value->number_value);
  return true;
}

bool ReadString(const Value& object, std::string_view key, const std::string& path,
                std::string& out, std::string& error) {
  const Value* value = object.Find(key);
  if (value == nullptr) {
    return true;
  }
  if (!value->IsString() || value->string_value.empty()) {
    error = path + "." + std::string(key) + ": expected a non-empty string";
    return false;
  }
  out = value->string_value;
  return true;
}

bool ReadPath(const Value& object, std::string_view key, const std::string& path, fs::path& out,
              std::string& error) {
  std::string raw;
  if (!ReadString(object, key, path, raw, error)) {
    return false;
  }
  if (!raw.empty()) {
    out = core::ExpandHome(raw);
  }
  return true;
}

bool ReadBool(const Value& object, std::string_view key, const std::string& path, bool& out,
              std::string& error) {
  const Value* value = object.Find(key);
  if (value == nullptr) {
    return true;
  }
  if (!value->IsBool()) {
    error = path + "." + std::string(key) + ": expected a boolean";
    return false;
  }
  out = value->bool_value;
  return true;
}

const Value* ReadSection(const Value& root, std::string_view key, std::string& error) {
  const Value* section = root.Find(key);
  if (section != nullptr && !section->IsObject()) {
    error = "$." + std::string(key) + ": expected an object";
  }
  return section;
}

bool ParseSsh(const Value& ssh, SshSettings& settings, std::string& error) {
  const std::string path = "$.ssh";
  return ReadInteger(ssh, "connect_timeout_ms", path, 1, settings.connect_timeout_ms, error) &&
         ReadInteger(ssh, "retry_limit", path, 1, settings.retry_limit, error) &&
         ReadInteger(ssh, "backoff_initial_ms", path, 0, settings.backoff_initial_ms, error) &&
         ReadInteger(ssh, "backoff_max_ms", path, 0, settings.backoff_max_ms, error) &&
         ReadInteger(ssh, "command_timeout_ms", path, 1, settings.command_timeout_ms, error) &&
         ReadInteger(ssh, "transfer_timeout_ms", path, 1, settings.transfer_timeout_ms, error) &&
         ReadString(ssh, "control_dir", path, settings.control_dir, error);
}

bool ParseOrchestrator(const Value& section, OrchestratorSettings& settings,
                       std::string& error) {
  const std::string path = "$.orchestrator";
  if (!ReadInteger(section, "poll_interval_ms", path, 1, settings.poll_interval_ms, error) ||
      !ReadBool(section, "live_telemetry", path, settings.live_telemetry, error)) {
    return false;
  }
  std::string gate;
  if (!ReadString(section, "wave_gate", path, gate, error)) {
    return false;
  }
  if (!gate.empty()) {
    std::string gate_error;
    if (!deploy::ParseWaveGate(gate, settings.wave_gate, gate_error)) {
      error = path + ".wave_gate: " + gate_error;
      return false;
    }
  }
  return true;
}

} // namespace

fs::path ResolveTracrHome() {
  const char* configured = std::getenv("TRACR_HOME");
  if (configured != nullptr && *configured != '\0') {
    return core::ExpandHome(configured);
  }
  return core::ExpandHome("~/.tracr");
}

ControllerConfig DefaultControllerConfig(const fs::path& home) {
  ControllerConfig config;
  config.home = home;
  config.network_file = home / "networks" / (config.lan_name + ".json");
  config.experiments_root = home / "TestCases";
  config.runs_root = home / "runs";
  config.base_images = deploy::DefaultBaseImages();
  return config;
}

bool ParseControllerConfig(std::string_view text, const fs::path& home, ControllerConfig& config,
                           std::string& error) {
  error.clear();
  Value root;
  std::string parse_error;
  if (!core::json::Parse(text, root, parse_error)) {
    error = "$: " + parse_error;
    return false;
  }
  if (!root.IsObject()) {
    error = "$: expected an object";
    return false;
  }

  ControllerConfig parsed = DefaultControllerConfig(home);
  if (!ReadString(root, "lan_name", "$", parsed.lan_name, error)) {
    return false;
  }
  parsed.network_file = home / "networks" / (parsed.lan_name + ".json");
  if (!ReadPath(root, "network_file", "$", parsed.network_file, error) ||
      !ReadPath(root, "experiments_root", "$", parsed.experiments_root, error) ||
      !ReadPath(root, "runs_root", "$", parsed.runs_root, error) ||
      !ReadString(root, "remote_workdir", "$", parsed.remote_workdir, error)) {
    return false;
  }

  std::string level;
  if (!ReadString(root, "log_level", "$", level, error)) {
    return false;
  }
  if (!level.empty()) {
    std::string level_error;
    if (!core::logging::ParseLogLevel(level, parsed.log_level, level_error)) {
      error = "$.log_level: " + level_error;
      return false;
    }
  }

  const Value* ssh = ReadSection(root, "ssh", error);
  if (!error.empty() || (ssh != nullptr && !ParseSsh(*ssh, parsed.ssh, error))) {
    return false;
  }
  const Value* orchestrator = ReadSection(root, "orchestrator", error);
  if (!error.empty() ||
      (orchestrator != nullptr &&
       !ParseOrchestrator(*orchestrator, parsed.orchestrator, error))) {
    return false;
  }
  if (parsed.ssh.backoff_max_ms < parsed.ssh.backoff_initial_ms) {
    error = "$.ssh.backoff_max_ms: must be >= backoff_initial_ms";
    return false;
  }

  const Value* images = ReadSection(root, "base_images", error);
  if (!error.empty()) {
    return false;
  }
  if (images != nullptr) {
    for (const auto& [arch, image] : images->object_value) {
      if (!image.IsString() || image.string_value.empty()) {
        error = "$.base_images." + arch + ": expected a non-empty string";
        return false;
      }
      parsed.base_images[arch] = image.string_value;
    }
  }

  config = std::move(parsed);
  return true;
}

bool LoadControllerConfig(const fs::path& path, const fs::path& home, ControllerConfig& config,
                          std::string& error) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    config = DefaultControllerConfig(home);
    return true;
  }
  std::string text;
  if (!core::ReadTextFile(path, text, error)) {
    return false;
  }
  if (!ParseControllerConfig(text, home, config, error)) {
    error = path.string() + ": " + error;
    return false;
  }
  return true;
}

remote::ConnectionOptions ToConnectionOptions(const ControllerConfig& config) {
  remote::ConnectionOptions options;
  options.retry.max_attempts = static_cast<std::uint32_t>(config.ssh.retry_limit);
  options.retry.initial_backoff = std::chrono::milliseconds(config.ssh.backoff_initial_ms);
  options.retry.max_backoff = std::chrono::milliseconds(config.ssh.backoff_max_ms);
  options.connect_timeout = std::chrono::milliseconds(config.ssh.connect_timeout_ms);
  return options;
}

remote::OpenSshOptions ToOpenSshOptions(const ControllerConfig& config) {
  remote::OpenSshOptions options;
  options.control_dir = core::ExpandHome(config.ssh.control_dir);
  return options;
}

deploy::OrchestratorOptions ToOrchestratorOptions(const ControllerConfig& config) {
  deploy::OrchestratorOptions options;
  options.runs_root = config.runs_root;
  options.remote_workdir = config.remote_workdir;
  options.base_images = config.base_images;
  options.command_timeout = std::chrono::milliseconds(config.ssh.command_timeout_ms);
  options.transfer_timeout = std::chrono::milliseconds(config.ssh.transfer_timeout_ms);
  options.poll_interval = std::chrono::milliseconds(config.orchestrator.poll_interval_ms);
  options.wave_gate = config.orchestrator.wave_gate;
  options.live_telemetry = config.orchestrator.live_telemetry;
  options.lan_name = config.lan_name;
  return options;
}

} // namespace tracr::config
