#include "telemetry/aggregator.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"
#include "telemetry/telemetry_store.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace tracr::telemetry {

namespace {

// RFC 4180 quoting for free-form values.
std::string CsvField(const std::string& raw) {
  if (raw.find_first_of(",\"\n\r") == std::string::npos) {
    return raw;
  }
  std::string quoted = "\"";
  for (const char c : raw) {
    if (c == '"') {
      quoted += "\"\"";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('"');
  return quoted;
}

std::string OptionalNumber(const std::optional<double>& value) {
  return value.has_value() ? core::FormatJsonDouble(*value) : std::string{};
}

} // namespace

ExperimentRecord Aggregate(const std::string& run_id, const std::vector<TelemetryEntry>& entries) {
  ExperimentRecord record;
  record.run_id = run_id;
  std::map<std::string, std::map<std::string, double>> sums;

  for (const auto& entry : entries) {
    if (entry.run_id != run_id) {
      continue;
    }
    ++record.entries_total;
    MetricSummary& summary = record.devices[entry.device_id][entry.metric];
    if (summary.count == 0U) {
      summary.first_ts = entry.timestamp;
      summary.last_ts = entry.timestamp;
      summary.last_value = entry.raw_value;
    } else {
      if (entry.timestamp < summary.first_ts) {
        summary.first_ts = entry.timestamp;
      }
      if (entry.timestamp >= summary.last_ts) {
        summary.last_ts = entry.timestamp;
        summary.last_value = entry.raw_value;
      }
    }
    ++summary.count;

    if (entry.numeric_value.has_value()) {
      const double value = *entry.numeric_value;
      ++summary.numeric_count;
      summary.min = summary.min.has_value() ? std::min(*summary.min, value) : value;
      summary.max = summary.max.has_value() ? std::max(*summary.max, value) : value;
      sums[entry.device_id][entry.metric] += value;
    }
  }

  for (auto& [device_id, metrics] : record.devices) {
    for (auto& [metric, summary] : metrics) {
      if (summary.numeric_count > 0U) {
        summary.mean = sums[device_id][metric] / static_cast<double>(summary.numeric_count);
      }
    }
  }
  return record;
}

bool AggregateRun(const fs::path& runs_root, const std::string& run_id,
                  const std::string& file_name, ExperimentRecord& record,
                  core::errors::Error& error) {
  core::errors::Clear(error);
  std::error_code ec;
  if (!fs::is_directory(runs_root / run_id, ec)) {
    return core::errors::Fail(error, core::errors::ErrorKind::kNotFound,
                              "no run directory for " + run_id + " under " + runs_root.string());
  }
  TelemetryStore store(runs_root, run_id, file_name);
  std::vector<TelemetryEntry> entries;
  IngestStats stats;
  std::string read_error;
  if (!store.ReadAll(entries, stats, read_error)) {
    return core::errors::Fail(error, core::errors::ErrorKind::kIo, read_error);
  }
  record = Aggregate(run_id, entries);
  return true;
}

std::string ToJson(const ExperimentRecord& record) {
  std::vector<std::string> devices;
  for (const auto& [device_id, metrics] : record.devices) {
    std::vector<std::string> metric_rows;
    for (const auto& [metric, summary] : metrics) {
      core::JsonObjectWriter row;
      row.String("metric", metric)
          .UInt("count", summary.count)
          .UInt("numeric_count", summary.numeric_count);
      if (summary.min.has_value()) {
        row.Double("min", *summary.min).Double("max", *summary.max).Double("mean", *summary.mean);
      } else {
        row.Null("min").Null("max").Null("mean");
      }
      row.String("last_value", summary.last_value)
          .String("first_ts_utc", core::FormatUtcTimestamp(summary.first_ts))
          .String("last_ts_utc", core::FormatUtcTimestamp(summary.last_ts));
      metric_rows.push_back(row.Finish());
    }
    devices.push_back(core::JsonObjectWriter()
                          .String("device_id", device_id)
                          .Raw("metrics", core::JoinJsonArray(metric_rows))
                          .Finish());
  }
  return core::JsonObjectWriter()
      .String("run_id", record.run_id)
      .UInt("entries_total", record.entries_total)
      .Raw("devices", core::JoinJsonArray(devices))
      .Finish();
}

bool WriteMetricsCsv(const ExperimentRecord& record, const fs::path& run_dir,
                     fs::path& written_path, std::string& error) {
  if (run_dir.empty()) {
    error = "run directory cannot be empty";
    return false;
  }

  std::error_code ec;
  fs::create_directories(run_dir, ec);
  if (ec) {
    error = "failed to create run directory '" + run_dir.string() + "': " + ec.message();
    return false;
  }

  written_path = run_dir / "metrics.csv";
  std::ofstream out_file(written_path, std::ios::binary | std::ios::trunc);
  if (!out_file) {
    error = "failed to open output file '" + written_path.string() + "' for writing";
    return false;
  }

  out_file << "run_id,device_id,metric,count,numeric_count,min,max,mean,last_value,"
              "first_ts_utc,last_ts_utc\n";
  for (const auto& [device_id, metrics] : record.devices) {
    for (const auto& [metric, summary] : metrics) {
      out_file << CsvField(record.run_id) << ',' << CsvField(device_id) << ','
               << CsvField(metric) << ',' << summary.count << ',' << summary.numeric_count << ','
               << OptionalNumber(summary.min) << ',' << OptionalNumber(summary.max) << ','
               << OptionalNumber(summary.mean) << ',' << CsvField(summary.last_value) << ','
               << core::FormatUtcTimestamp(summary.first_ts) << ','
               << core::FormatUtcTimestamp(summary.last_ts) << '\n';
    }
  }

  if (!out_file) {
    error = "failed while writing output file '" + written_path.string() + "'";
    return false;
  }
  return true;
}

} // namespace tracr::telemetry
