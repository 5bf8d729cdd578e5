#include "telemetry/telemetry_entry.hpp"

#include "core/json_dom.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <cmath>

namespace tracr::telemetry {

namespace {

using JsonValue = core::json::Value;

// First present alias; a present-but-null field counts as absent.
const JsonValue* FindAlias(const JsonValue& object, std::string_view primary,
                           std::string_view alias) {
  const JsonValue* field = object.Find(primary);
  if (field == nullptr || field->IsNull()) {
    field = object.Find(alias);
  }
  return field == nullptr || field->IsNull() ? nullptr : field;
}

bool ResolveIdentity(const JsonValue* field, const std::string& expected, std::string& out,
                     bool& foreign) {
  if (field == nullptr) {
    out = expected;
    return !out.empty();
  }
  if (!field->IsString() || field->string_value.empty()) {
    return false;
  }
  out = field->string_value;
  foreign = foreign || (!expected.empty() && out != expected);
  return true;
}

} // namespace

LineOutcome ParseTelemetryLine(std::string_view line, const IngestContext& context,
                               TelemetryEntry& entry) {
  std::size_t first = 0;
  while (first < line.size() && (line[first] == ' ' || line[first] == '\t' ||
                                 line[first] == '\r' || line[first] == '\n')) {
    ++first;
  }
  if (first == line.size()) {
    return LineOutcome::kEmpty;
  }

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(line, root, parse_error) || !root.IsObject()) {
    return LineOutcome::kMalformed;
  }

  TelemetryEntry parsed;
  bool foreign = false;
  if (!ResolveIdentity(FindAlias(root, "run_id", "runID"), context.run_id, parsed.run_id,
                       foreign) ||
      !ResolveIdentity(FindAlias(root, "device_id", "deviceID"), context.device_id,
                       parsed.device_id, foreign)) {
    return LineOutcome::kMalformed;
  }

  const JsonValue* metric = root.Find("metric");
  if (metric == nullptr || !metric->IsString() || metric->string_value.empty()) {
    return LineOutcome::kMalformed;
  }
  parsed.metric = metric->string_value;

  const JsonValue* value = root.Find("value");
  if (value == nullptr) {
    return LineOutcome::kMalformed;
  }
  if (value->IsNumber() && std::isfinite(value->number_value)) {
    parsed.numeric_value = value->number_value;
    parsed.raw_value = core::FormatJsonDouble(value->number_value);
  } else if (value->IsString()) {
    parsed.raw_value = value->string_value;
  } else {
    parsed.raw_value = core::SerializeJson(*value);
  }

  const JsonValue* timestamp = FindAlias(root, "timestamp", "ts");
  if (timestamp == nullptr || !timestamp->IsString() ||
      !core::ParseUtcTimestamp(timestamp->string_value, parsed.timestamp)) {
    return LineOutcome::kMalformed;
  }
  parsed.timestamp = std::chrono::time_point_cast<std::chrono::milliseconds>(parsed.timestamp);

  if (foreign) {
    return LineOutcome::kForeign;
  }
  entry = std::move(parsed);
  return LineOutcome::kAccepted;
}

std::string ToJson(const TelemetryEntry& entry) {
  core::JsonObjectWriter writer;
  writer.String("run_id", entry.run_id)
      .String("device_id", entry.device_id)
      .String("metric", entry.metric);
  if (entry.numeric_value.has_value()) {
    writer.Double("value", *entry.numeric_value);
  } else {
    writer.String("value", entry.raw_value);
  }
  writer.String("timestamp", core::FormatUtcTimestamp(entry.timestamp));
  return writer.Finish();
}

} // namespace tracr::telemetry
