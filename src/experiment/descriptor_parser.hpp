#pragma once

#include "core/errors/error.hpp"
#include "experiment/experiment_model.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace tracr::experiment {

struct ValidationIssue {
  std::string path;
  std::string message;

  bool operator==(const ValidationIssue& other) const = default;
};

struct ValidationReport {
  bool valid = false;
  std::vector<ValidationIssue> issues;
};

// "$.a: msg; $.b: msg"
std::string FormatIssues(const ValidationReport& report);

// Parses descriptor JSON.
//
// Contract:
// - On schema violation returns false with `error.kind ==
//   kMalformedDescriptor` and every issue listed in `report` under its JSON
//   path.
// - Rejects duplicate roles, unknown or self `after` references, cyclic
//   `after` chains and explicit orders that contradict `after`.
// - Fills missing orders from `after` (one past the latest prerequisite)
//   when every prerequisite has an order.
bool ParseDescriptor(std::string_view json_text, Experiment& experiment,
                     ValidationReport& report, core::errors::Error& error);

// Reads `<directory>/experiment.json` and records `directory` on success.
bool LoadDescriptor(const std::filesystem::path& directory, Experiment& experiment,
                    ValidationReport& report, core::errors::Error& error);

// Inverse of ParseDescriptor for drafts and run snapshots. Derived orders
// are written out explicitly.
std::string RenderDescriptor(const Experiment& experiment);

} // namespace tracr::experiment
