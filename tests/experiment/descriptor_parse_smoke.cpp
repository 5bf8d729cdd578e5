#include "common/assertions.hpp"
#include "common/temp_dir.hpp"

#include "experiment/descriptor_parser.hpp"

#include <algorithm>
#include <string>

using tracr::core::errors::Error;
using tracr::core::errors::ErrorKind;
using tracr::experiment::Experiment;
using tracr::experiment::ParseDescriptor;
using tracr::experiment::ValidationReport;
using tracr::tests::common::AssertContains;
using tracr::tests::common::AssertErrorKind;
using tracr::tests::common::AssertOk;
using tracr::tests::common::AssertTrue;

namespace {

bool HasIssue(const ValidationReport& report, const std::string& path) {
  return std::any_of(report.issues.begin(), report.issues.end(),
                     [&](const tracr::experiment::ValidationIssue& issue) {
                       return issue.path == path;
                     });
}

void ExpectMalformed(const std::string& json, const std::string& path,
                     const std::string& message_part) {
  Experiment experiment;
  ValidationReport report;
  Error error;
  AssertErrorKind(ParseDescriptor(json, experiment, report, error), error,
                  ErrorKind::kMalformedDescriptor, "descriptor rejected at " + path);
  AssertTrue(!report.valid, "rejected descriptor is not valid");
  AssertTrue(HasIssue(report, path), "expected issue at " + path + ", got: " + error.message);
  AssertContains(error.message, message_part);
}

} // namespace

int main() {
  const std::string descriptor = R"({
    "id": "exp-7f3c",
    "name": "mqtt-latency",
    "deviceConstraints": [
      {"role": "broker", "arch": "x86_64", "runtimeScript": "scripts/broker.py", "order": 0,
       "port": 1883},
      {"role": "sensor", "arch": "arm64", "runtimeScript": "scripts/sensor.py",
       "extraDeps": ["paho-mqtt==1.6.1"], "after": ["broker"], "memoryMb": 256, "cpus": 1.5},
      {"role": "viewer", "arch": "arm64", "runtimeScript": "scripts/viewer.py",
       "after": ["sensor", "broker"], "volume": "/srv/data:/data"}
    ],
    "config": {"qos": 1, "broker_host": "10.0.3.1"}
  })";

  Experiment experiment;
  ValidationReport report;
  Error error;
  AssertOk(ParseDescriptor(descriptor, experiment, report, error), error, "parse descriptor");
  AssertTrue(report.valid && report.issues.empty(), "valid descriptor has no issues");
  AssertTrue(experiment.id == "exp-7f3c" && experiment.name == "mqtt-latency", "identity");
  AssertTrue(experiment.constraints.size() == 3U, "three constraints");
  AssertTrue(experiment.log_file == "telemetry.jsonl", "default telemetry log name");

  const auto& broker = experiment.constraints[0];
  const auto& sensor = experiment.constraints[1];
  const auto& viewer = experiment.constraints[2];
  AssertTrue(broker.container.port == "1883:1883", "bare port maps to itself");
  AssertTrue(sensor.order.has_value() && *sensor.order == 1, "order derived from after");
  AssertTrue(viewer.order.has_value() && *viewer.order == 2,
             "order is one past the latest prerequisite");
  AssertTrue(sensor.extra_deps.size() == 1U && sensor.extra_deps[0] == "paho-mqtt==1.6.1",
             "extra deps parsed");
  AssertTrue(sensor.container.memory_mb == 256U, "memory limit parsed");
  AssertTrue(sensor.container.cpus.has_value() && *sensor.container.cpus == 1.5,
             "cpu limit parsed");
  AssertTrue(viewer.container.volume == "/srv/data:/data", "volume parsed");
  AssertTrue(viewer.declaration_index == 2U, "declaration index recorded");
  AssertTrue(experiment.config_json == R"({"broker_host":"10.0.3.1","qos":1})",
             "config is canonical JSON, got " + experiment.config_json);

  // Rendered drafts parse back to the same experiment, derived orders included.
  Experiment reparsed;
  AssertOk(ParseDescriptor(tracr::experiment::RenderDescriptor(experiment), reparsed, report,
                           error),
           error, "parse rendered descriptor");
  AssertTrue(reparsed == experiment, "rendered descriptor keeps every field");

  // An unordered prerequisite leaves its dependents unordered as well.
  AssertOk(ParseDescriptor(R"({"id":"draft","deviceConstraints":[
             {"role":"a","arch":"arm64","runtimeScript":"a.py"},
             {"role":"b","arch":"arm64","runtimeScript":"b.py","after":["a"]}]})",
                           experiment, report, error),
           error, "parse draft");
  AssertTrue(!experiment.constraints[1].order.has_value(), "draft order stays unset");

  ExpectMalformed("{not json", "$", "");
  ExpectMalformed("[1, 2]", "$", "must be an object");
  ExpectMalformed(R"({"deviceConstraints":[]})", "$.id", "is required");
  ExpectMalformed(R"({"id":"x"})", "$.deviceConstraints", "is required");
  ExpectMalformed(R"({"id":"x","deviceConstraints":[{"arch":"arm64","runtimeScript":"a.py"}]})",
                  "$.deviceConstraints[0].role", "is required");
  ExpectMalformed(
      R"({"id":"x","deviceConstraints":[{"role":"a","arch":7,"runtimeScript":"a.py"}]})",
      "$.deviceConstraints[0].arch", "must be a string");
  ExpectMalformed(
      R"({"id":"x","deviceConstraints":[{"role":"a","arch":"arm64","runtimeScript":"../a.py"}]})",
      "$.deviceConstraints[0].runtimeScript", "inside the experiment directory");
  ExpectMalformed(R"({"id":"x","deviceConstraints":[
                      {"role":"a","arch":"arm64","runtimeScript":"a.py","order":-1}]})",
                  "$.deviceConstraints[0].order", "non-negative integer");
  ExpectMalformed(R"({"id":"x","deviceConstraints":[
                      {"role":"a","arch":"arm64","runtimeScript":"a.py","memoryMb":2}]})",
                  "$.deviceConstraints[0].memoryMb", "integer >= 4");
  ExpectMalformed(R"({"id":"x","deviceConstraints":[
                      {"role":"a","arch":"arm64","runtimeScript":"a.py","port":"8080"}]})",
                  "$.deviceConstraints[0].port", "host:container");
  ExpectMalformed(R"({"id":"x","config":[1],"deviceConstraints":[
                      {"role":"a","arch":"arm64","runtimeScript":"a.py"}]})",
                  "$.config", "must be an object");

  ExpectMalformed(R"({"id":"x","deviceConstraints":[
                      {"role":"a","arch":"arm64","runtimeScript":"a.py"},
                      {"role":"a","arch":"arm64","runtimeScript":"b.py"}]})",
                  "$.deviceConstraints[1].role", "duplicates role 'a'");
  ExpectMalformed(R"({"id":"x","deviceConstraints":[
                      {"role":"a","arch":"arm64","runtimeScript":"a.py","after":["ghost"]}]})",
                  "$.deviceConstraints[0].after[0]", "unknown role 'ghost'");
  ExpectMalformed(R"({"id":"x","deviceConstraints":[
                      {"role":"a","arch":"arm64","runtimeScript":"a.py","after":["a"]}]})",
                  "$.deviceConstraints[0].after[0]", "cannot depend on itself");
  ExpectMalformed(R"({"id":"x","deviceConstraints":[
                      {"role":"a","arch":"arm64","runtimeScript":"a.py","after":["b"]},
                      {"role":"b","arch":"arm64","runtimeScript":"b.py","after":["a"]}]})",
                  "$.deviceConstraints", "cyclic 'after' dependency among roles 'a', 'b'");
  ExpectMalformed(R"({"id":"x","deviceConstraints":[
                      {"role":"a","arch":"arm64","runtimeScript":"a.py","order":3},
                      {"role":"b","arch":"arm64","runtimeScript":"b.py","order":2,
                       "after":["a"]}]})",
                  "$.deviceConstraints[1].order", "greater than order 3");

  // Every structural issue is reported, not only the first one.
  AssertTrue(!ParseDescriptor(R"({"deviceConstraints":[{"role":"a"},{"arch":"arm64"}]})",
                              experiment, report, error),
             "descriptor with several problems");
  AssertTrue(HasIssue(report, "$.id") && HasIssue(report, "$.deviceConstraints[0].arch") &&
                 HasIssue(report, "$.deviceConstraints[1].role") &&
                 HasIssue(report, "$.deviceConstraints[1].runtimeScript"),
             "all issues reported: " + tracr::experiment::FormatIssues(report));

  tracr::tests::common::ScopedTempDir temp("tracr-descriptor");
  AssertErrorKind(tracr::experiment::LoadDescriptor(temp.path() / "absent", experiment, report,
                                                    error),
                  error, ErrorKind::kNotFound, "missing descriptor file");

  tracr::tests::common::WriteFileOrFail(temp.path() / "broken" / "experiment.json",
                                        R"({"id":"x","deviceConstraints":"none"})");
  AssertErrorKind(tracr::experiment::LoadDescriptor(temp.path() / "broken", experiment, report,
                                                    error),
                  error, ErrorKind::kMalformedDescriptor, "broken descriptor file");
  AssertContains(error.message, "experiment.json");
  AssertContains(error.message, "$.deviceConstraints: must be an array");
  return 0;
}
