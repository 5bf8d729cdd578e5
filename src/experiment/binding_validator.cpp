#include "experiment/binding_validator.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace tracr::experiment {

namespace {

void AddIssue(ValidationReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

std::string ConstraintPath(std::size_t index, const char* field) {
  return "$.deviceConstraints[" + std::to_string(index) + "]." + field;
}

} // namespace

bool ArchMatches(const std::string& required, const std::string& device_arch) {
  return required.size() == device_arch.size() &&
         std::equal(required.begin(), required.end(), device_arch.begin(), [](char a, char b) {
           return std::tolower(static_cast<unsigned char>(a)) ==
                  std::tolower(static_cast<unsigned char>(b));
         });
}

bool Validate(const Experiment& experiment, const std::vector<registry::Device>& lan_devices,
              BindingPlan& plan, ValidationReport& report, core::errors::Error& error) {
  core::errors::Clear(error);
  report = ValidationReport{};
  BindingPlan result;
  result.experiment_id = experiment.id;

  if (experiment.constraints.empty()) {
    AddIssue(report, "$.deviceConstraints", "must declare at least one constraint");
  }
  for (const auto& constraint : experiment.constraints) {
    if (!constraint.order.has_value()) {
      AddIssue(report, ConstraintPath(constraint.declaration_index, "order"),
               "is required before deployment");
    }
    if (!experiment.directory.empty()) {
      std::error_code ec;
      if (!fs::is_regular_file(experiment.directory / constraint.runtime_script, ec)) {
        AddIssue(report, ConstraintPath(constraint.declaration_index, "runtimeScript"),
                 "file '" + constraint.runtime_script + "' not found in " +
                     experiment.directory.string());
      }
    }
  }
  if (!report.issues.empty()) {
    return core::errors::Fail(error, core::errors::ErrorKind::kValidation,
                              FormatIssues(report));
  }

  std::vector<const DeviceConstraint*> sequence;
  for (const auto& constraint : experiment.constraints) {
    sequence.push_back(&constraint);
  }
  std::stable_sort(sequence.begin(), sequence.end(),
                   [](const DeviceConstraint* a, const DeviceConstraint* b) {
                     if (*a->order != *b->order) {
                       return *a->order < *b->order;
                     }
                     return a->declaration_index < b->declaration_index;
                   });

  std::vector<const registry::Device*> candidates;
  for (const auto& device : lan_devices) {
    if (device.role == registry::DeviceRole::kParticipant &&
        device.state == registry::ConfigState::kConfigured) {
      candidates.push_back(&device);
    }
  }
  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const registry::Device* a, const registry::Device* b) {
                     return a->registration_seq < b->registration_seq;
                   });

  std::vector<bool> taken(candidates.size(), false);
  for (const DeviceConstraint* constraint : sequence) {
    bool bound = false;
    for (std::size_t i = 0; i < candidates.size(); ++i) {
      if (taken[i] || !ArchMatches(constraint->arch, candidates[i]->arch)) {
        continue;
      }
      taken[i] = true;
      result.bindings.push_back({.role = constraint->role,
                                 .constraint_index = constraint->declaration_index,
                                 .device_id = candidates[i]->id,
                                 .arch = candidates[i]->arch,
                                 .order = *constraint->order});
      bound = true;
      break;
    }
    if (!bound) {
      AddIssue(report, ConstraintPath(constraint->declaration_index, "arch"),
               "no unbound configured participant with arch '" + constraint->arch +
                   "' for role '" + constraint->role + "'");
    }
  }
  if (!report.issues.empty()) {
    return core::errors::Fail(error, core::errors::ErrorKind::kUnsatisfiedConstraint,
                              FormatIssues(report));
  }

  for (std::size_t i = 0; i < result.bindings.size(); ++i) {
    const Binding& binding = result.bindings[i];
    if (result.waves.empty() || result.waves.back().order != binding.order) {
      result.waves.push_back(Wave{.order = binding.order, .bindings = {}});
    }
    result.waves.back().bindings.push_back(i);
  }
  for (const auto& wave : result.waves) {
    if (wave.bindings.size() < 2U) {
      continue;
    }
    std::string roles;
    for (const std::size_t index : wave.bindings) {
      roles += (roles.empty() ? "'" : ", '") + result.bindings[index].role + "'";
    }
    result.warnings.push_back("roles " + roles + " share order " + std::to_string(wave.order) +
                              " and will deploy concurrently");
  }

  report.valid = true;
  plan = std::move(result);
  return true;
}

} // namespace tracr::experiment
