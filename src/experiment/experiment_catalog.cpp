#include "experiment/experiment_catalog.hpp"

#include "core/fs_utils.hpp"
#include "core/id_utils.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

namespace fs = std::filesystem;

namespace tracr::experiment {

namespace {

constexpr const char* kSkeletonScript = R"(import json
import os
import time

TELEMETRY_PATH = os.environ.get("TRACR_TELEMETRY_PATH", "/var/log/tracr/telemetry.jsonl")
CONFIG = json.loads(os.environ.get("TRACR_CONFIG", "{}"))


def emit(metric, value):
    with open(TELEMETRY_PATH, "a") as log:
        log.write(json.dumps({
            "metric": metric,
            "value": value,
            "timestamp": time.strftime("%Y-%m-%dT%H:%M:%SZ", time.gmtime()),
        }) + "\n")


if __name__ == "__main__":
    start = time.time()
    # experiment workload goes here
    emit("workload_s", time.time() - start)
)";

} // namespace

bool IsValidExperimentName(const std::string& name) {
  if (name.empty() || name == "." || name == "..") {
    return false;
  }
  return std::all_of(name.begin(), name.end(), [](unsigned char c) {
    return std::isalnum(c) != 0 || c == '-' || c == '_' || c == '.';
  });
}

ExperimentCatalog::ExperimentCatalog(fs::path root) : root_(std::move(root)) {}

std::vector<CatalogEntry> ExperimentCatalog::List() const {
  std::vector<CatalogEntry> entries;
  std::error_code ec;
  if (!fs::is_directory(root_, ec)) {
    return entries;
  }
  for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    if (!it->is_directory(type_ec)) {
      continue;
    }
    CatalogEntry entry;
    entry.name = it->path().filename().string();
    entry.directory = it->path();

    Experiment experiment;
    ValidationReport report;
    core::errors::Error load_error;
    if (LoadDescriptor(it->path(), experiment, report, load_error)) {
      entry.experiment_id = experiment.id;
      entry.constraint_count = experiment.constraints.size();
    } else {
      entry.problem = core::errors::FormatError(load_error);
    }
    entries.push_back(std::move(entry));
  }
  std::sort(entries.begin(), entries.end(),
            [](const CatalogEntry& a, const CatalogEntry& b) { return a.name < b.name; });
  return entries;
}

bool ExperimentCatalog::Create(const std::string& name, Experiment& created,
                               core::errors::Error& error) const {
  core::errors::Clear(error);
  if (!IsValidExperimentName(name)) {
    return core::errors::Fail(error, core::errors::ErrorKind::kValidation,
                              "experiment name '" + name +
                                  "' may only contain letters, digits, '-', '_' and '.'");
  }
  const fs::path directory = root_ / name;
  std::error_code ec;
  if (fs::exists(directory, ec)) {
    return core::errors::Fail(error, core::errors::ErrorKind::kInvalidState,
                              "experiment directory already exists: " + directory.string());
  }

  Experiment draft;
  draft.id = core::MakeUuidV4();
  draft.name = name;
  DeviceConstraint worker;
  worker.role = "worker";
  worker.arch = "arm64";
  worker.runtime_script = "scripts/main.py";
  draft.constraints.push_back(worker);
  draft.directory = directory;

  std::string io_error;
  if (!core::WriteTextFileAtomic(directory / "scripts" / "main.py", kSkeletonScript, io_error) ||
      !core::WriteTextFileAtomic(directory / kDescriptorFileName, RenderDescriptor(draft),
                                 io_error)) {
    return core::errors::Fail(error, core::errors::ErrorKind::kIo, io_error);
  }
  created = std::move(draft);
  return true;
}

bool ExperimentCatalog::Load(const std::string& name, Experiment& experiment,
                             ValidationReport& report, core::errors::Error& error) const {
  if (!IsValidExperimentName(name)) {
    report = ValidationReport{};
    return core::errors::Fail(error, core::errors::ErrorKind::kNotFound,
                              "invalid experiment name '" + name + "'");
  }
  return LoadDescriptor(root_ / name, experiment, report, error);
}

bool ExperimentCatalog::ArchiveSnapshot(const Experiment& experiment, const fs::path& run_dir,
                                        std::string& error) {
  return core::WriteTextFileAtomic(run_dir / kDescriptorFileName, RenderDescriptor(experiment),
                                   error);
}

bool ExperimentCatalog::LoadSnapshot(const fs::path& run_dir, Experiment& experiment,
                                     core::errors::Error& error) {
  ValidationReport report;
  if (!LoadDescriptor(run_dir, experiment, report, error)) {
    return false;
  }
  experiment.directory.clear();
  return true;
}

} // namespace tracr::experiment
