#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tracr::experiment {

constexpr const char* kDescriptorFileName = "experiment.json";
constexpr const char* kDefaultLogFileName = "telemetry.jsonl";

// Optional `docker create` knobs carried per constraint.
struct ContainerOptions {
  std::optional<std::uint32_t> memory_mb;
  std::optional<double> cpus;
  // host:container
  std::string volume;
  std::string port;

  bool operator==(const ContainerOptions& other) const = default;
};

// Role requirement, not a bound device: what a device must offer and what
// runs on it.
struct DeviceConstraint {
  std::string role;
  std::string arch;
  std::vector<std::string> extra_deps;
  // Relative to the experiment directory.
  std::string runtime_script;
  // Unset while drafting; derived from `after` when possible.
  std::optional<std::int64_t> order;
  std::vector<std::string> after;
  ContainerOptions container;
  std::size_t declaration_index = 0;

  bool operator==(const DeviceConstraint& other) const = default;
};

struct Experiment {
  std::string id;
  std::string name;
  std::vector<DeviceConstraint> constraints;
  // Canonical JSON of the free-form `config` object.
  std::string config_json = "{}";
  // Name of the normalized telemetry log inside each run directory.
  std::string log_file = kDefaultLogFileName;
  // Directory the descriptor was loaded from; empty for in-memory drafts.
  std::filesystem::path directory;

  bool operator==(const Experiment& other) const = default;
};

} // namespace tracr::experiment
