#include "experiment/descriptor_parser.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "core/json_utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <sstream>

namespace fs = std::filesystem;

namespace tracr::experiment {

namespace {

using JsonValue = core::json::Value;

void AddIssue(ValidationReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

bool TryGetInteger(const JsonValue& value, std::int64_t min_value, std::int64_t& out) {
  if (!value.IsNumber() || !std::isfinite(value.number_value)) {
    return false;
  }
  const double floored = std::floor(value.number_value);
  if (floored != value.number_value || floored < static_cast<double>(min_value) ||
      floored > static_cast<double>(std::numeric_limits<std::int32_t>::max())) {
    return false;
  }
  out = static_cast<std::int64_t>(floored);
  return true;
}

bool ReadRequiredString(const JsonValue& object, std::string_view key, const std::string& path,
                        std::string& out, ValidationReport& report) {
  const JsonValue* field = object.Find(key);
  if (field == nullptr) {
    AddIssue(report, path, "is required");
    return false;
  }
  if (!field->IsString()) {
    AddIssue(report, path, "must be a string");
    return false;
  }
  if (field->string_value.empty()) {
    AddIssue(report, path, "must not be empty");
    return false;
  }
  out = field->string_value;
  return true;
}

void ReadStringArray(const JsonValue& object, std::string_view key, const std::string& path,
                     std::vector<std::string>& out, ValidationReport& report) {
  const JsonValue* field = object.Find(key);
  if (field == nullptr || field->IsNull()) {
    return;
  }
  if (!field->IsArray()) {
    AddIssue(report, path, "must be an array of strings");
    return;
  }
  for (std::size_t i = 0; i < field->array_value.size(); ++i) {
    const JsonValue& item = field->array_value[i];
    if (!item.IsString() || item.string_value.empty()) {
      AddIssue(report, path + "[" + std::to_string(i) + "]", "must be a non-empty string");
      continue;
    }
    out.push_back(item.string_value);
  }
}

// `host:container` mapping; a bare number maps the same port on both sides.
void ReadMapping(const JsonValue& object, std::string_view key, const std::string& path,
                 std::string& out, ValidationReport& report) {
  const JsonValue* field = object.Find(key);
  if (field == nullptr || field->IsNull()) {
    return;
  }
  std::int64_t port = 0;
  if (key == "port" && TryGetInteger(*field, 1, port) && port <= 65535) {
    out = std::to_string(port) + ":" + std::to_string(port);
    return;
  }
  if (!field->IsString()) {
    AddIssue(report, path, "must be a 'host:container' string");
    return;
  }
  const std::string& text = field->string_value;
  const std::size_t colon = text.find(':');
  if (colon == std::string::npos || colon == 0U || colon + 1U >= text.size()) {
    AddIssue(report, path, "must be a 'host:container' string");
    return;
  }
  out = text;
}

void ParseConstraint(const JsonValue& item, std::size_t index, DeviceConstraint& constraint,
                     ValidationReport& report) {
  const std::string base = "$.deviceConstraints[" + std::to_string(index) + "]";
  constraint.declaration_index = index;
  if (!item.IsObject()) {
    AddIssue(report, base, "must be an object");
    return;
  }

  (void)ReadRequiredString(item, "role", base + ".role", constraint.role, report);
  (void)ReadRequiredString(item, "arch", base + ".arch", constraint.arch, report);
  if (ReadRequiredString(item, "runtimeScript", base + ".runtimeScript",
                         constraint.runtime_script, report)) {
    const fs::path script(constraint.runtime_script);
    if (script.is_absolute() ||
        std::any_of(script.begin(), script.end(), [](const fs::path& part) {
          return part == "..";
        })) {
      AddIssue(report, base + ".runtimeScript",
               "must be a path inside the experiment directory");
    }
  }
  ReadStringArray(item, "extraDeps", base + ".extraDeps", constraint.extra_deps, report);
  ReadStringArray(item, "after", base + ".after", constraint.after, report);

  if (const JsonValue* order = item.Find("order"); order != nullptr && !order->IsNull()) {
    std::int64_t value = 0;
    if (!TryGetInteger(*order, 0, value)) {
      AddIssue(report, base + ".order", "must be a non-negative integer");
    } else {
      constraint.order = value;
    }
  }

  if (const JsonValue* memory = item.Find("memoryMb"); memory != nullptr && !memory->IsNull()) {
    std::int64_t value = 0;
    if (!TryGetInteger(*memory, 4, value)) {
      AddIssue(report, base + ".memoryMb", "must be an integer >= 4");
    } else {
      constraint.container.memory_mb = static_cast<std::uint32_t>(value);
    }
  }
  if (const JsonValue* cpus = item.Find("cpus"); cpus != nullptr && !cpus->IsNull()) {
    if (!cpus->IsNumber() || !std::isfinite(cpus->number_value) || cpus->number_value <= 0.0) {
      AddIssue(report, base + ".cpus", "must be a positive number");
    } else {
      constraint.container.cpus = cpus->number_value;
    }
  }
  ReadMapping(item, "volume", base + ".volume", constraint.container.volume, report);
  ReadMapping(item, "port", base + ".port", constraint.container.port, report);
}

// Checks `after` references, rejects cycles and inconsistent orders, then
// derives missing orders. Runs only on structurally valid constraints.
void ResolveOrdering(std::vector<DeviceConstraint>& constraints, ValidationReport& report) {
  std::map<std::string, std::size_t> by_role;
  for (std::size_t i = 0; i < constraints.size(); ++i) {
    const auto [it, inserted] = by_role.emplace(constraints[i].role, i);
    if (!inserted) {
      AddIssue(report, "$.deviceConstraints[" + std::to_string(i) + "].role",
               "duplicates role '" + constraints[i].role + "' declared at index " +
                   std::to_string(it->second));
    }
  }

  bool references_ok = true;
  std::vector<std::vector<std::size_t>> dependents(constraints.size());
  std::vector<std::size_t> indegree(constraints.size(), 0U);
  for (std::size_t i = 0; i < constraints.size(); ++i) {
    for (std::size_t j = 0; j < constraints[i].after.size(); ++j) {
      const std::string& dep = constraints[i].after[j];
      const std::string path =
          "$.deviceConstraints[" + std::to_string(i) + "].after[" + std::to_string(j) + "]";
      const auto it = by_role.find(dep);
      if (it == by_role.end()) {
        AddIssue(report, path, "references unknown role '" + dep + "'");
        references_ok = false;
        continue;
      }
      if (it->second == i) {
        AddIssue(report, path, "role cannot depend on itself");
        references_ok = false;
        continue;
      }
      dependents[it->second].push_back(i);
      ++indegree[i];
    }
  }
  if (!references_ok || !report.issues.empty()) {
    return;
  }

  // Kahn's algorithm in declaration order.
  std::vector<std::size_t> topo;
  std::vector<std::size_t> pending = indegree;
  for (std::size_t i = 0; i < constraints.size(); ++i) {
    if (pending[i] == 0U) {
      topo.push_back(i);
    }
  }
  for (std::size_t cursor = 0; cursor < topo.size(); ++cursor) {
    for (const std::size_t next : dependents[topo[cursor]]) {
      if (--pending[next] == 0U) {
        topo.push_back(next);
      }
    }
  }
  if (topo.size() != constraints.size()) {
    std::string cycle;
    for (std::size_t i = 0; i < constraints.size(); ++i) {
      if (pending[i] != 0U) {
        cycle += cycle.empty() ? "'" + constraints[i].role + "'" : ", '" + constraints[i].role + "'";
      }
    }
    AddIssue(report, "$.deviceConstraints", "cyclic 'after' dependency among roles " + cycle);
    return;
  }

  for (const std::size_t i : topo) {
    DeviceConstraint& constraint = constraints[i];
    std::optional<std::int64_t> latest;
    bool all_known = true;
    for (const auto& dep : constraint.after) {
      const DeviceConstraint& prerequisite = constraints[by_role[dep]];
      if (!prerequisite.order.has_value()) {
        all_known = false;
        continue;
      }
      latest = std::max(latest.value_or(*prerequisite.order), *prerequisite.order);
      if (constraint.order.has_value() && *constraint.order <= *prerequisite.order) {
        AddIssue(report, "$.deviceConstraints[" + std::to_string(i) + "].order",
                 "must be greater than order " + std::to_string(*prerequisite.order) +
                     " of prerequisite '" + dep + "'");
      }
    }
    if (!constraint.order.has_value() && all_known && latest.has_value()) {
      constraint.order = *latest + 1;
    }
  }
}

} // namespace

std::string FormatIssues(const ValidationReport& report) {
  std::string out;
  for (const auto& issue : report.issues) {
    if (!out.empty()) {
      out += "; ";
    }
    out += issue.path + ": " + issue.message;
  }
  return out;
}

bool ParseDescriptor(std::string_view json_text, Experiment& experiment,
                     ValidationReport& report, core::errors::Error& error) {
  core::errors::Clear(error);
  report = ValidationReport{};

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    AddIssue(report, "$", parse_error);
    return core::errors::Fail(error, core::errors::ErrorKind::kMalformedDescriptor,
                              FormatIssues(report));
  }
  if (!root.IsObject()) {
    AddIssue(report, "$", "descriptor root must be an object");
    return core::errors::Fail(error, core::errors::ErrorKind::kMalformedDescriptor,
                              FormatIssues(report));
  }

  Experiment parsed;
  (void)ReadRequiredString(root, "id", "$.id", parsed.id, report);
  if (const JsonValue* name = root.Find("name"); name != nullptr && !name->IsNull()) {
    if (!name->IsString()) {
      AddIssue(report, "$.name", "must be a string");
    } else {
      parsed.name = name->string_value;
    }
  }
  if (const JsonValue* log_file = root.Find("logFile"); log_file != nullptr) {
    if (!log_file->IsString() || log_file->string_value.empty() ||
        log_file->string_value.find('/') != std::string::npos) {
      AddIssue(report, "$.logFile", "must be a plain file name");
    } else {
      parsed.log_file = log_file->string_value;
    }
  }

  const JsonValue* constraints = root.Find("deviceConstraints");
  if (constraints == nullptr) {
    AddIssue(report, "$.deviceConstraints", "is required");
  } else if (!constraints->IsArray()) {
    AddIssue(report, "$.deviceConstraints", "must be an array");
  } else {
    for (std::size_t i = 0; i < constraints->array_value.size(); ++i) {
      DeviceConstraint constraint;
      ParseConstraint(constraints->array_value[i], i, constraint, report);
      parsed.constraints.push_back(std::move(constraint));
    }
  }

  if (const JsonValue* config = root.Find("config"); config != nullptr && !config->IsNull()) {
    if (!config->IsObject()) {
      AddIssue(report, "$.config", "must be an object");
    } else {
      parsed.config_json = core::SerializeJson(*config);
    }
  }

  if (report.issues.empty()) {
    ResolveOrdering(parsed.constraints, report);
  }
  if (!report.issues.empty()) {
    return core::errors::Fail(error, core::errors::ErrorKind::kMalformedDescriptor,
                              FormatIssues(report));
  }

  report.valid = true;
  experiment = std::move(parsed);
  return true;
}

bool LoadDescriptor(const fs::path& directory, Experiment& experiment, ValidationReport& report,
                    core::errors::Error& error) {
  core::errors::Clear(error);
  const fs::path descriptor_path = directory / kDescriptorFileName;
  std::string text;
  std::string read_error;
  if (!core::ReadTextFile(descriptor_path, text, read_error)) {
    report = ValidationReport{};
    return core::errors::Fail(error, core::errors::ErrorKind::kNotFound, read_error);
  }
  Experiment parsed;
  if (!ParseDescriptor(text, parsed, report, error)) {
    error.message = descriptor_path.string() + ": " + error.message;
    return false;
  }
  parsed.directory = directory;
  experiment = std::move(parsed);
  return true;
}

std::string RenderDescriptor(const Experiment& experiment) {
  std::ostringstream out;
  out << "{\n";
  out << "  \"id\": \"" << core::EscapeJson(experiment.id) << "\",\n";
  if (!experiment.name.empty()) {
    out << "  \"name\": \"" << core::EscapeJson(experiment.name) << "\",\n";
  }
  if (experiment.log_file != kDefaultLogFileName) {
    out << "  \"logFile\": \"" << core::EscapeJson(experiment.log_file) << "\",\n";
  }
  out << "  \"deviceConstraints\": [";
  for (std::size_t i = 0; i < experiment.constraints.size(); ++i) {
    const DeviceConstraint& constraint = experiment.constraints[i];
    core::JsonObjectWriter writer;
    writer.String("role", constraint.role)
        .String("arch", constraint.arch)
        .StringArray("extraDeps", constraint.extra_deps)
        .String("runtimeScript", constraint.runtime_script);
    if (constraint.order.has_value()) {
      writer.Int("order", *constraint.order);
    }
    if (!constraint.after.empty()) {
      writer.StringArray("after", constraint.after);
    }
    if (constraint.container.memory_mb.has_value()) {
      writer.UInt("memoryMb", *constraint.container.memory_mb);
    }
    if (constraint.container.cpus.has_value()) {
      writer.Double("cpus", *constraint.container.cpus);
    }
    if (!constraint.container.volume.empty()) {
      writer.String("volume", constraint.container.volume);
    }
    if (!constraint.container.port.empty()) {
      writer.String("port", constraint.container.port);
    }
    out << (i == 0U ? "\n    " : ",\n    ") << writer.Finish();
  }
  out << (experiment.constraints.empty() ? "],\n" : "\n  ],\n");
  out << "  \"config\": " << experiment.config_json << "\n";
  out << "}\n";
  return out.str();
}

} // namespace tracr::experiment
