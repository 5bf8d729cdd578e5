#include "telemetry/telemetry_store.hpp"

#include "core/fs_utils.hpp"

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace tracr::telemetry {

TelemetryStore::TelemetryStore(fs::path runs_root, std::string run_id, std::string file_name)
    : path_(runs_root / run_id / file_name), run_id_(std::move(run_id)) {}

bool TelemetryStore::Append(const std::vector<TelemetryEntry>& entries, std::string& error) {
  if (entries.empty()) {
    return true;
  }
  std::lock_guard<std::mutex> lock(mu_);
  if (!core::EnsureParentDirectory(path_, error)) {
    return false;
  }
  std::ofstream out(path_, std::ios::binary | std::ios::app);
  if (!out) {
    error = "failed to open telemetry store '" + path_.string() + "' for append";
    return false;
  }
  for (const auto& entry : entries) {
    out << ToJson(entry) << '\n';
  }
  out.flush();
  if (!out) {
    error = "failed while appending to telemetry store '" + path_.string() + "'";
    return false;
  }
  return true;
}

bool TelemetryStore::ReadAll(std::vector<TelemetryEntry>& entries, IngestStats& stats,
                             std::string& error) const {
  entries.clear();
  stats = IngestStats{};
  std::lock_guard<std::mutex> lock(mu_);
  std::error_code ec;
  if (!fs::exists(path_, ec)) {
    return true;
  }
  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    error = "unable to read telemetry store: " + path_.string();
    return false;
  }
  // Stored lines always carry both IDs; the run ID guards against a file
  // copied in from another run.
  TelemetryLineReader reader(in, IngestContext{.run_id = run_id_, .device_id = {}});
  TelemetryEntry entry;
  while (reader.Next(entry)) {
    entries.push_back(entry);
  }
  stats = reader.stats();
  if (in.bad()) {
    error = "failed while reading telemetry store: " + path_.string();
    return false;
  }
  return true;
}

} // namespace tracr::telemetry
