#include "deploy/image_builder.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/process.hpp"

#include <cctype>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace tracr::deploy {

std::map<std::string, std::string> DefaultBaseImages() {
  return {
      {"arm64", "arm64v8/python:3.10-slim"},
      {"armv7", "arm32v7/python:3.10-slim"},
      {"x86_64", "python:3.10-slim"},
  };
}

std::string DockerSlug(const std::string& text) {
  std::string slug;
  bool pending_dash = false;
  for (const char raw : text) {
    const auto c = static_cast<unsigned char>(raw);
    if (std::isalnum(c) != 0 || c == '_' || c == '.') {
      if (pending_dash && !slug.empty()) {
        slug.push_back('-');
      }
      pending_dash = false;
      slug.push_back(static_cast<char>(std::tolower(c)));
    } else {
      pending_dash = true;
    }
  }
  return slug.empty() ? "x" : slug;
}

std::string BaseImageTag(const std::string& arch) {
  return "tracr-base:" + DockerSlug(arch);
}

std::string DepsImageTag(const std::string& experiment, const std::string& role,
                         const std::string& run_id) {
  return "tracr-" + DockerSlug(experiment) + "-" + DockerSlug(role) + "-deps:" + run_id;
}

std::string RuntimeImageTag(const std::string& experiment, const std::string& role,
                            const std::string& run_id) {
  return "tracr-" + DockerSlug(experiment) + "-" + DockerSlug(role) + ":" + run_id;
}

std::string ContainerName(const std::string& run_id, const std::string& role) {
  return "tracr-" + run_id + "-" + DockerSlug(role);
}

std::string RenderBaseDockerfile(const std::string& from_image) {
  std::ostringstream out;
  out << "FROM " << from_image << "\n"
      << "ENV PYTHONUNBUFFERED=1\n"
      << "RUN mkdir -p " << kContainerLogDir << " /opt/tracr\n";
  return out.str();
}

std::string RenderDepsDockerfile(const std::string& base_tag,
                                 const std::vector<std::string>& extra_deps) {
  std::ostringstream out;
  out << "FROM " << base_tag << "\n";
  if (!extra_deps.empty()) {
    out << "RUN pip install --no-cache-dir";
    for (const auto& dep : extra_deps) {
      out << ' ' << core::ShellQuote(dep);
    }
    out << "\n";
  }
  return out.str();
}

std::string RenderRuntimeDockerfile(const std::string& deps_tag, const std::string& script_name) {
  std::ostringstream out;
  out << "FROM " << deps_tag << "\n"
      << "WORKDIR /opt/tracr\n"
      << "COPY " << script_name << " /opt/tracr/" << script_name << "\n"
      << "COPY " << kWrapperFileName << " /opt/tracr/" << kWrapperFileName << "\n"
      << "RUN chmod +x /opt/tracr/" << kWrapperFileName << "\n"
      << "ENTRYPOINT [\"/opt/tracr/" << kWrapperFileName << "\", \"/opt/tracr/"
      << core::EscapeJson(script_name) << "\"]\n";
  return out.str();
}

std::string RenderWrapperScript() {
  return R"SH(#!/bin/sh
# tracr monitoring wrapper: runs the experiment script and records
# lifecycle samples next to whatever the script itself emits.
LOG_DIR=/var/log/tracr
TELEMETRY="$LOG_DIR/telemetry.jsonl"
export TRACR_TELEMETRY_PATH="$TELEMETRY"
mkdir -p "$LOG_DIR"
touch "$TELEMETRY"

emit() {
  printf '{"run_id":"%s","device_id":"%s","metric":"%s","value":%s,"timestamp":"%s"}\n' \
    "$TRACR_RUN_ID" "$TRACR_DEVICE_ID" "$1" "$2" "$(date -u +%Y-%m-%dT%H:%M:%SZ)" \
    >> "$TELEMETRY"
}

start=$(date +%s)
emit wrapper_started 1
python3 "$@"
status=$?
end=$(date +%s)
emit wall_time_s $((end - start))
emit exit_code "$status"
exit "$status"
)SH";
}

RemoteLayout MakeRemoteLayout(const std::string& remote_workdir, const std::string& arch,
                              const std::string& run_id, const std::string& role) {
  std::string root = remote_workdir;
  while (root.size() > 1U && root.back() == '/') {
    root.pop_back();
  }
  RemoteLayout layout;
  layout.base_context = root + "/base/" + DockerSlug(arch);
  layout.build_context = root + "/builds/" + run_id + "/" + DockerSlug(role);
  layout.log_dir = root + "/runs/" + run_id + "/" + DockerSlug(role);
  return layout;
}

bool StageBuild(const experiment::Experiment& experiment,
                const experiment::DeviceConstraint& constraint, const std::string& run_id,
                const std::string& base_from, const fs::path& stage_root, StagedBuild& staged,
                std::string& error) {
  const std::string experiment_label = experiment.name.empty() ? experiment.id : experiment.name;
  StagedBuild result;
  result.base_tag = BaseImageTag(constraint.arch);
  result.deps_tag = DepsImageTag(experiment_label, constraint.role, run_id);
  result.runtime_tag = RuntimeImageTag(experiment_label, constraint.role, run_id);
  result.script_name = fs::path(constraint.runtime_script).filename().string();
  if (result.script_name.empty() || result.script_name == kWrapperFileName) {
    error = "runtime script '" + constraint.runtime_script + "' has an unusable file name";
    return false;
  }

  const fs::path base_dir = stage_root / ("base-" + DockerSlug(constraint.arch));
  const fs::path role_dir = stage_root / DockerSlug(constraint.role);
  result.base_dockerfile = base_dir / "Dockerfile";
  result.deps_dockerfile = role_dir / "Dockerfile.deps";
  result.runtime_dockerfile = role_dir / "Dockerfile.runtime";
  result.wrapper = role_dir / kWrapperFileName;
  result.script = role_dir / result.script_name;

  std::string script_text;
  const fs::path source_script = experiment.directory / constraint.runtime_script;
  if (!core::ReadTextFile(source_script, script_text, error)) {
    return false;
  }

  if (!core::WriteTextFileAtomic(result.base_dockerfile, RenderBaseDockerfile(base_from),
                                 error) ||
      !core::WriteTextFileAtomic(result.deps_dockerfile,
                                 RenderDepsDockerfile(result.base_tag, constraint.extra_deps),
                                 error) ||
      !core::WriteTextFileAtomic(result.runtime_dockerfile,
                                 RenderRuntimeDockerfile(result.deps_tag, result.script_name),
                                 error) ||
      !core::WriteTextFileAtomic(result.wrapper, RenderWrapperScript(), error) ||
      !core::WriteTextFileAtomic(result.script, script_text, error)) {
    return false;
  }

  staged = std::move(result);
  return true;
}

std::string BuildCreateCommand(const CreateOptions& options) {
  std::ostringstream out;
  out << "docker create --name " << core::ShellQuote(options.container_name);
  if (options.container.memory_mb.has_value()) {
    out << " --memory " << *options.container.memory_mb << "m";
  }
  if (options.container.cpus.has_value()) {
    out << " --cpus " << core::FormatJsonDouble(*options.container.cpus);
  }
  if (!options.container.port.empty()) {
    out << " -p " << core::ShellQuote(options.container.port);
  }
  if (!options.container.volume.empty()) {
    out << " -v " << core::ShellQuotePath(options.container.volume);
  }
  out << " -v " << core::ShellQuotePath(options.log_dir + ":" + kContainerLogDir)
      << " -e " << core::ShellQuote("TRACR_RUN_ID=" + options.run_id)
      << " -e " << core::ShellQuote("TRACR_DEVICE_ID=" + options.device_id)
      << " -e " << core::ShellQuote("TRACR_ROLE=" + options.role)
      << " -e " << core::ShellQuote("TRACR_CONFIG=" + options.config_json) << ' '
      << core::ShellQuote(options.image);
  return out.str();
}

std::string BuildImageCommand(const std::string& tag, const std::string& dockerfile,
                              const std::string& context) {
  return "docker build -t " + core::ShellQuote(tag) + " -f " + core::ShellQuotePath(dockerfile) +
         " " + core::ShellQuotePath(context);
}

} // namespace tracr::deploy
