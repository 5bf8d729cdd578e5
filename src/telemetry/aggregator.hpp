#pragma once

#include "core/errors/error.hpp"
#include "telemetry/telemetry_entry.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tracr::telemetry {

struct MetricSummary {
  std::uint64_t count = 0;
  std::uint64_t numeric_count = 0;
  std::optional<double> min;
  std::optional<double> max;
  std::optional<double> mean;
  // Raw value of the latest sample (file order breaks timestamp ties).
  std::string last_value;
  std::chrono::system_clock::time_point first_ts{};
  std::chrono::system_clock::time_point last_ts{};

  bool operator==(const MetricSummary& other) const = default;
};

// Read-only projection of one run's telemetry: device -> metric -> summary.
struct ExperimentRecord {
  std::string run_id;
  std::map<std::string, std::map<std::string, MetricSummary>> devices;
  std::uint64_t entries_total = 0;

  bool operator==(const ExperimentRecord& other) const = default;
};

// Groups entries of `run_id` by device and metric. Entries of other runs
// are ignored.
ExperimentRecord Aggregate(const std::string& run_id, const std::vector<TelemetryEntry>& entries);

// Recomputes the record from the run's stored entries. Idempotent.
bool AggregateRun(const std::filesystem::path& runs_root, const std::string& run_id,
                  const std::string& file_name, ExperimentRecord& record,
                  core::errors::Error& error);

std::string ToJson(const ExperimentRecord& record);

// `<run_dir>/metrics.csv`: one row per device and metric.
bool WriteMetricsCsv(const ExperimentRecord& record, const std::filesystem::path& run_dir,
                     std::filesystem::path& written_path, std::string& error);

} // namespace tracr::telemetry
