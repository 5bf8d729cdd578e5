#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace tracr::telemetry {

// One timestamped sample from one device within one run.
//
// Numeric JSON values are typed (`numeric_value`); anything else passes
// through untyped as `raw_value` so unknown metrics still reach export.
struct TelemetryEntry {
  std::string run_id;
  std::string device_id;
  std::string metric;
  std::optional<double> numeric_value;
  std::string raw_value;
  std::chrono::system_clock::time_point timestamp{};

  bool operator==(const TelemetryEntry& other) const = default;
};

// Identity of the stream being ingested; fills IDs a line omits.
struct IngestContext {
  std::string run_id;
  std::string device_id;
};

enum class LineOutcome {
  kAccepted,
  // Blank line.
  kEmpty,
  // Well-formed, but tagged with another run or device.
  kForeign,
  kMalformed,
};

// Accepts `run_id`/`runID`, `device_id`/`deviceID`, `metric`, `value` and
// `timestamp`/`ts` (ISO-8601). Timestamps are truncated to milliseconds.
LineOutcome ParseTelemetryLine(std::string_view line, const IngestContext& context,
                               TelemetryEntry& entry);

// Normalized store line.
std::string ToJson(const TelemetryEntry& entry);

} // namespace tracr::telemetry
