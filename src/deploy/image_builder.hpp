#pragma once

#include "experiment/experiment_model.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace tracr::deploy {

// Where telemetry lands inside every runtime container; bind-mounted from
// the per-binding log directory on the device.
constexpr const char* kContainerLogDir = "/var/log/tracr";
constexpr const char* kTelemetryFileName = "telemetry.jsonl";
constexpr const char* kWrapperFileName = "tracr_wrapper.sh";

// Architecture tag -> base `FROM` image.
std::map<std::string, std::string> DefaultBaseImages();

// Lowercase docker-safe slug: [a-z0-9_.-], other runs collapse to '-'.
std::string DockerSlug(const std::string& text);

std::string BaseImageTag(const std::string& arch);
std::string DepsImageTag(const std::string& experiment, const std::string& role,
                         const std::string& run_id);
std::string RuntimeImageTag(const std::string& experiment, const std::string& role,
                            const std::string& run_id);
std::string ContainerName(const std::string& run_id, const std::string& role);

std::string RenderBaseDockerfile(const std::string& from_image);
std::string RenderDepsDockerfile(const std::string& base_tag,
                                 const std::vector<std::string>& extra_deps);
std::string RenderRuntimeDockerfile(const std::string& deps_tag, const std::string& script_name);
// Entrypoint wrapper: runs the user script and appends start, wall time and
// exit code samples to the telemetry log.
std::string RenderWrapperScript();

// Remote paths for one binding, all under the configured work directory.
struct RemoteLayout {
  std::string base_context;
  std::string build_context;
  std::string log_dir;

  std::string TelemetryPath() const {
    return log_dir + "/" + kTelemetryFileName;
  }
};

RemoteLayout MakeRemoteLayout(const std::string& remote_workdir, const std::string& arch,
                              const std::string& run_id, const std::string& role);

// Files staged locally for one binding before anything touches a device.
struct StagedBuild {
  std::filesystem::path base_dockerfile;
  std::filesystem::path deps_dockerfile;
  std::filesystem::path runtime_dockerfile;
  std::filesystem::path wrapper;
  std::filesystem::path script;
  std::string script_name;
  std::string base_tag;
  std::string deps_tag;
  std::string runtime_tag;
};

// Writes Dockerfiles and the wrapper under `<stage_root>/<role>/` and
// `<stage_root>/base-<arch>/`, and copies the runtime script.
bool StageBuild(const experiment::Experiment& experiment,
                const experiment::DeviceConstraint& constraint, const std::string& run_id,
                const std::string& base_from, const std::filesystem::path& stage_root,
                StagedBuild& staged, std::string& error);

struct CreateOptions {
  std::string container_name;
  std::string image;
  std::string log_dir;
  std::string run_id;
  std::string device_id;
  std::string role;
  std::string config_json;
  experiment::ContainerOptions container;
};

std::string BuildCreateCommand(const CreateOptions& options);
std::string BuildImageCommand(const std::string& tag, const std::string& dockerfile,
                              const std::string& context);

} // namespace tracr::deploy
