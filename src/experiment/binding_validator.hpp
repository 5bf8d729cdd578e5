#pragma once

#include "core/errors/error.hpp"
#include "experiment/descriptor_parser.hpp"
#include "experiment/experiment_model.hpp"
#include "registry/device_model.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tracr::experiment {

// One constraint bound to one concrete device.
struct Binding {
  std::string role;
  std::size_t constraint_index = 0;
  std::string device_id;
  std::string arch;
  std::int64_t order = 0;

  bool operator==(const Binding& other) const = default;
};

// Deployment waves: bindings sharing an order index deploy concurrently.
struct Wave {
  std::int64_t order = 0;
  // Indices into BindingPlan::bindings, in declaration order.
  std::vector<std::size_t> bindings;

  bool operator==(const Wave& other) const = default;
};

struct BindingPlan {
  std::string experiment_id;
  // Sorted by (order, declaration index).
  std::vector<Binding> bindings;
  std::vector<Wave> waves;
  std::vector<std::string> warnings;

  bool operator==(const BindingPlan& other) const = default;
};

// Binds constraints to configured participant devices.
//
// Assignment is first-fit and bijective: constraints in (order, declaration)
// sequence each take the earliest-registered unbound device with a matching
// architecture. The function is pure; equal inputs give equal plans.
//
// Errors:
// - kValidation: no constraints, missing orders, runtime scripts absent from
//   the experiment directory.
// - kUnsatisfiedConstraint: some constraint has no free matching device.
bool Validate(const Experiment& experiment, const std::vector<registry::Device>& lan_devices,
              BindingPlan& plan, ValidationReport& report, core::errors::Error& error);

bool ArchMatches(const std::string& required, const std::string& device_arch);

} // namespace tracr::experiment
