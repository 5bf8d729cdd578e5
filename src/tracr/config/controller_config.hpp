#pragma once

#include "core/logging/logger.hpp"
#include "deploy/orchestrator.hpp"
#include "remote/connection_manager.hpp"
#include "remote/openssh_shell.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace tracr::config {

struct SshSettings {
  std::int64_t connect_timeout_ms = 5000;
  std::int64_t retry_limit = 3;
  std::int64_t backoff_initial_ms = 500;
  std::int64_t backoff_max_ms = 4000;
  std::int64_t command_timeout_ms = 600000;
  std::int64_t transfer_timeout_ms = 120000;
  std::string control_dir = "/tmp";
};

struct OrchestratorSettings {
  std::int64_t poll_interval_ms = 2000;
  deploy::WaveGate wave_gate = deploy::WaveGate::kDeployed;
  bool live_telemetry = false;
};

// Controller-side settings. Every field has a default so a missing config
// file is a valid configuration.
struct ControllerConfig {
  std::filesystem::path home;
  std::string lan_name = "default";
  std::filesystem::path network_file;
  std::filesystem::path experiments_root;
  std::filesystem::path runs_root;
  std::string remote_workdir = "~/.tracr/work";
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
  SshSettings ssh;
  OrchestratorSettings orchestrator;
  std::map<std::string, std::string> base_images;
};

// $TRACR_HOME, or ~/.tracr.
std::filesystem::path ResolveTracrHome();

ControllerConfig DefaultControllerConfig(const std::filesystem::path& home);

// Overlays `text` on the defaults. Unknown keys are ignored; ill-typed or
// out-of-range values fail with their JSON path, e.g.
// "$.ssh.retry_limit: expected an integer >= 1".
bool ParseControllerConfig(std::string_view text, const std::filesystem::path& home,
                           ControllerConfig& config, std::string& error);

// A missing file yields the defaults.
bool LoadControllerConfig(const std::filesystem::path& path, const std::filesystem::path& home,
                          ControllerConfig& config, std::string& error);

remote::ConnectionOptions ToConnectionOptions(const ControllerConfig& config);
remote::OpenSshOptions ToOpenSshOptions(const ControllerConfig& config);
deploy::OrchestratorOptions ToOrchestratorOptions(const ControllerConfig& config);

} // namespace tracr::config
