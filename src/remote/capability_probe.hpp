#pragma once

#include "core/errors/error.hpp"
#include "remote/connection_manager.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace tracr::remote {

// What a device reports about itself after connect. `prepared` is the
// host-preparation precondition: a reachable container engine.
struct CapabilityReport {
  std::string os_family;
  std::string os_version;
  std::string arch;
  std::string engine_version;
  bool prepared = false;
};

// Maps `uname -m` spellings onto the architecture tags used by descriptors
// (`aarch64` -> `arm64`, `armv7l` -> `armv7`, `amd64` -> `x86_64`).
std::string NormalizeArch(std::string_view machine);

// Parses `uname -s -r -m` output ("Linux 5.15.0-1034-raspi aarch64").
bool ParseUnameOutput(std::string_view output, CapabilityReport& report);

// Runs the probe on an open session. Fails only when `uname` itself cannot
// run; a missing container engine yields `prepared == false`.
bool ProbeCapabilities(ConnectionManager& manager, Session& session,
                       std::chrono::milliseconds timeout, CapabilityReport& report,
                       core::errors::Error& error);

} // namespace tracr::remote
