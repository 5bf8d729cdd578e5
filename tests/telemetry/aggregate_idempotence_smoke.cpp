#include "common/assertions.hpp"
#include "common/temp_dir.hpp"

#include "telemetry/aggregator.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

using tracr::core::errors::Error;
using tracr::core::errors::ErrorKind;
using tracr::tests::common::AssertContains;
using tracr::tests::common::AssertErrorKind;
using tracr::tests::common::AssertOk;
using tracr::tests::common::AssertTrue;

int main() {
  tracr::tests::common::ScopedTempDir temp("tracr-aggregate");
  const fs::path runs_root = temp.path() / "runs";

  // Store lines as the collector writes them, plus one copied in from
  // another run and one the store cannot parse.
  tracr::tests::common::WriteFileOrFail(
      runs_root / "run-a" / "telemetry.jsonl",
      "{\"run_id\":\"run-a\",\"device_id\":\"dev-1\",\"metric\":\"lat_ms\",\"value\":12,"
      "\"timestamp\":\"2024-05-01T10:00:01.000Z\"}\n"
      "{\"run_id\":\"run-a\",\"device_id\":\"dev-1\",\"metric\":\"lat_ms\",\"value\":8,"
      "\"timestamp\":\"2024-05-01T10:00:00.000Z\"}\n"
      "{\"run_id\":\"run-a\",\"device_id\":\"dev-1\",\"metric\":\"lat_ms\",\"value\":10,"
      "\"timestamp\":\"2024-05-01T10:00:01.000Z\"}\n"
      "{\"run_id\":\"run-a\",\"device_id\":\"dev-2\",\"metric\":\"note\","
      "\"value\":\"hello, \\\"lab\\\"\",\"timestamp\":\"2024-05-01T10:00:03.000Z\"}\n"
      "{\"run_id\":\"run-b\",\"device_id\":\"dev-1\",\"metric\":\"lat_ms\",\"value\":999,"
      "\"timestamp\":\"2024-05-01T10:00:02.000Z\"}\n"
      "truncated{\n");

  tracr::telemetry::ExperimentRecord first;
  Error error;
  AssertOk(tracr::telemetry::AggregateRun(runs_root, "run-a", "telemetry.jsonl", first, error),
           error, "aggregate");
  AssertTrue(first.run_id == "run-a", "run id recorded");
  AssertTrue(first.entries_total == 4U, "other runs and broken lines are ignored");
  AssertTrue(first.devices.size() == 2U, "two devices");

  const auto& latency = first.devices.at("dev-1").at("lat_ms");
  AssertTrue(latency.count == 3U && latency.numeric_count == 3U, "latency counts");
  AssertTrue(latency.min == 8.0 && latency.max == 12.0 && latency.mean == 10.0,
             "latency min, max and mean");
  AssertTrue(latency.last_value == "10", "timestamp tie resolved by file order");

  const auto& note = first.devices.at("dev-2").at("note");
  AssertTrue(note.count == 1U && note.numeric_count == 0U && !note.min.has_value(),
             "text metric has no numeric summary");
  AssertTrue(note.last_value == "hello, \"lab\"", "text value passes through");

  // Aggregation is a pure projection of the store.
  tracr::telemetry::ExperimentRecord second;
  AssertOk(tracr::telemetry::AggregateRun(runs_root, "run-a", "telemetry.jsonl", second, error),
           error, "aggregate again");
  AssertTrue(first == second, "repeated aggregation is identical");
  AssertTrue(tracr::telemetry::ToJson(first) == tracr::telemetry::ToJson(second),
             "rendering is stable");
  AssertContains(tracr::telemetry::ToJson(first), "\"entries_total\":4");
  AssertContains(tracr::telemetry::ToJson(first), "\"min\":null");

  fs::path csv_path;
  std::string csv_error;
  AssertTrue(tracr::telemetry::WriteMetricsCsv(first, runs_root / "run-a", csv_path, csv_error),
             "write csv: " + csv_error);
  const std::string csv = tracr::tests::common::ReadFileToString(csv_path);
  AssertTrue(csv.rfind("run_id,device_id,metric,count,numeric_count,min,max,mean,last_value,"
                       "first_ts_utc,last_ts_utc\n",
                       0) == 0,
             "csv header");
  AssertContains(csv, "run-a,dev-1,lat_ms,3,3,8,12,10,10,2024-05-01T10:00:00.000Z,"
                      "2024-05-01T10:00:01.000Z\n");
  AssertContains(csv, "run-a,dev-2,note,1,0,,,,\"hello, \"\"lab\"\"\",");

  // A run directory without telemetry aggregates to an empty record.
  fs::create_directories(runs_root / "run-quiet");
  tracr::telemetry::ExperimentRecord quiet;
  AssertOk(tracr::telemetry::AggregateRun(runs_root, "run-quiet", "telemetry.jsonl", quiet, error),
           error, "aggregate quiet run");
  AssertTrue(quiet.entries_total == 0U && quiet.devices.empty(), "quiet run is empty");

  tracr::telemetry::ExperimentRecord missing;
  AssertErrorKind(
      tracr::telemetry::AggregateRun(runs_root, "run-zzz", "telemetry.jsonl", missing, error),
      error, ErrorKind::kNotFound, "unknown run");
  return 0;
}
