#include "common/assertions.hpp"
#include "common/temp_dir.hpp"

#include "experiment/binding_validator.hpp"
#include "experiment/experiment_catalog.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

using tracr::core::errors::Error;
using tracr::core::errors::ErrorKind;
using tracr::experiment::Experiment;
using tracr::experiment::ExperimentCatalog;
using tracr::experiment::ValidationReport;
using tracr::tests::common::AssertContains;
using tracr::tests::common::AssertErrorKind;
using tracr::tests::common::AssertOk;
using tracr::tests::common::AssertTrue;

int main() {
  tracr::tests::common::ScopedTempDir temp("tracr-catalog");
  const ExperimentCatalog catalog(temp.path() / "TestCases");
  AssertTrue(catalog.List().empty(), "missing root lists as empty");

  Experiment created;
  Error error;
  AssertOk(catalog.Create("soil-probe", created, error), error, "create experiment");
  AssertTrue(created.id.size() == 36U, "draft gets a UUID id");
  AssertTrue(created.name == "soil-probe", "draft is named after its directory");
  AssertTrue(created.directory == catalog.root() / "soil-probe", "draft directory");
  AssertTrue(fs::is_regular_file(created.directory / "experiment.json"), "descriptor written");
  const std::string script =
      tracr::tests::common::ReadFileToString(created.directory / "scripts" / "main.py");
  AssertContains(script, "TRACR_TELEMETRY_PATH");

  Experiment loaded;
  ValidationReport report;
  AssertOk(catalog.Load("soil-probe", loaded, report, error), error, "load draft");
  AssertTrue(loaded.id == created.id, "draft id survives a reload");
  AssertTrue(loaded.constraints.size() == 1U && !loaded.constraints[0].order.has_value(),
             "draft constraint is unordered");

  // Drafts need an order before they can be bound.
  tracr::experiment::BindingPlan plan;
  AssertErrorKind(tracr::experiment::Validate(loaded, {}, plan, report, error), error,
                  ErrorKind::kValidation, "validating an unordered draft");

  AssertErrorKind(catalog.Create("soil-probe", created, error), error, ErrorKind::kInvalidState,
                  "creating an existing experiment");
  AssertErrorKind(catalog.Create("bad/name", created, error), error, ErrorKind::kValidation,
                  "creating with a path separator");
  AssertErrorKind(catalog.Create("..", created, error), error, ErrorKind::kValidation,
                  "creating the parent directory");

  AssertErrorKind(catalog.Load("absent", loaded, report, error), error, ErrorKind::kNotFound,
                  "loading an unknown experiment");
  AssertErrorKind(catalog.Load("../soil-probe", loaded, report, error), error,
                  ErrorKind::kNotFound, "loading outside the catalog");

  tracr::tests::common::WriteFileOrFail(catalog.root() / "broken" / "experiment.json", "{");
  fs::create_directories(catalog.root() / "empty");
  tracr::tests::common::WriteFileOrFail(catalog.root() / "notes.txt", "not an experiment\n");

  const auto entries = catalog.List();
  AssertTrue(entries.size() == 3U, "one entry per directory");
  AssertTrue(entries[0].name == "broken" && entries[1].name == "empty" &&
                 entries[2].name == "soil-probe",
             "entries sorted by name");
  AssertContains(entries[0].problem, "MALFORMED_DESCRIPTOR");
  AssertContains(entries[1].problem, "NOT_FOUND");
  AssertTrue(entries[2].problem.empty() && entries[2].experiment_id == created.id &&
                 entries[2].constraint_count == 1U,
             "healthy entry carries its id and constraint count");

  // A run keeps the descriptor as dispatched.
  const fs::path run_dir = temp.path() / "runs" / "run-1";
  std::string archive_error;
  AssertTrue(ExperimentCatalog::ArchiveSnapshot(loaded, run_dir, archive_error), archive_error);
  Experiment snapshot;
  AssertOk(tracr::experiment::LoadDescriptor(run_dir, snapshot, report, error), error,
           "load snapshot");
  snapshot.directory = loaded.directory;
  AssertTrue(snapshot == loaded, "snapshot matches the dispatched descriptor");
  return 0;
}
