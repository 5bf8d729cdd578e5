#pragma once

#include "telemetry/log_reader.hpp"
#include "telemetry/telemetry_entry.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace tracr::telemetry {

// Append-only normalized entries for one run:
// `<runs_root>/<run_id>/<file_name>`, one JSON object per line.
class TelemetryStore {
public:
  TelemetryStore(std::filesystem::path runs_root, std::string run_id,
                 std::string file_name = "telemetry.jsonl");

  TelemetryStore(const TelemetryStore&) = delete;
  TelemetryStore& operator=(const TelemetryStore&) = delete;

  const std::filesystem::path& path() const {
    return path_;
  }
  const std::string& run_id() const {
    return run_id_;
  }

  bool Append(const std::vector<TelemetryEntry>& entries, std::string& error);

  // A run that never produced telemetry reads as empty.
  bool ReadAll(std::vector<TelemetryEntry>& entries, IngestStats& stats,
               std::string& error) const;

private:
  std::filesystem::path path_;
  std::string run_id_;
  mutable std::mutex mu_;
};

} // namespace tracr::telemetry
