#pragma once

#include "core/errors/error.hpp"
#include "experiment/descriptor_parser.hpp"
#include "experiment/experiment_model.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace tracr::experiment {

struct CatalogEntry {
  std::string name;
  std::filesystem::path directory;
  // Empty when the descriptor is missing or malformed.
  std::string experiment_id;
  std::size_t constraint_count = 0;
  std::string problem;
};

// The controller's experiment repository: one subdirectory per experiment
// holding `experiment.json` and its scripts. Experiments are only ever
// added; runs archive a descriptor snapshot instead of mutating the source.
class ExperimentCatalog {
public:
  explicit ExperimentCatalog(std::filesystem::path root);

  const std::filesystem::path& root() const {
    return root_;
  }

  // Entries sorted by directory name. A missing root lists as empty.
  std::vector<CatalogEntry> List() const;

  // Materializes `<root>/<name>/` with a draft descriptor (fresh UUID id,
  // one unordered constraint) and `scripts/main.py`. Fails kInvalidState if
  // the directory already exists.
  bool Create(const std::string& name, Experiment& created, core::errors::Error& error) const;

  bool Load(const std::string& name, Experiment& experiment, ValidationReport& report,
            core::errors::Error& error) const;

  // Writes the descriptor as it stood at dispatch into `run_dir`.
  static bool ArchiveSnapshot(const Experiment& experiment, const std::filesystem::path& run_dir,
                              std::string& error);

  // Reads the snapshot archived in `run_dir`. kNotFound when the run has
  // none; kMalformedDescriptor when it no longer parses.
  static bool LoadSnapshot(const std::filesystem::path& run_dir, Experiment& experiment,
                           core::errors::Error& error);

private:
  std::filesystem::path root_;
};

bool IsValidExperimentName(const std::string& name);

} // namespace tracr::experiment
