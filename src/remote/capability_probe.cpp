#include "remote/capability_probe.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace tracr::remote {

namespace {

std::string Trim(std::string_view text) {
  std::size_t begin = 0;
  while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }
  std::size_t end = text.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1U])) != 0) {
    --end;
  }
  return std::string(text.substr(begin, end - begin));
}

} // namespace

std::string NormalizeArch(std::string_view machine) {
  std::string lowered(machine);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "aarch64" || lowered == "arm64" || lowered == "armv8l") {
    return "arm64";
  }
  if (lowered == "armv7l" || lowered == "armv7" || lowered == "armhf") {
    return "armv7";
  }
  if (lowered == "amd64" || lowered == "x86_64" || lowered == "x64") {
    return "x86_64";
  }
  return lowered;
}

bool ParseUnameOutput(std::string_view output, CapabilityReport& report) {
  std::istringstream in{std::string(output)};
  std::string family;
  std::string release;
  std::string machine;
  if (!(in >> family >> release >> machine)) {
    return false;
  }
  report.os_family = family;
  report.os_version = release;
  report.arch = NormalizeArch(machine);
  return true;
}

bool ProbeCapabilities(ConnectionManager& manager, Session& session,
                       const std::chrono::milliseconds timeout, CapabilityReport& report,
                       core::errors::Error& error) {
  report = CapabilityReport{};

  CommandResult uname_result;
  if (!manager.Execute(session, "uname -s -r -m", timeout, uname_result, error)) {
    return false;
  }
  if (!ParseUnameOutput(uname_result.stdout_text, report)) {
    return core::errors::Fail(error, core::errors::ErrorKind::kRemoteCommand,
                              "unexpected uname output from " + session.device().id + ": " +
                                  Trim(uname_result.stdout_text));
  }

  CommandResult docker_result;
  core::errors::Error docker_error;
  if (manager.Execute(session, "docker version --format '{{.Server.Version}}'", timeout,
                      docker_result, docker_error)) {
    report.engine_version = Trim(docker_result.stdout_text);
    report.prepared = !report.engine_version.empty();
    return true;
  }
  if (docker_error.kind != core::errors::ErrorKind::kRemoteCommand) {
    error = docker_error;
    return false;
  }
  report.prepared = false;
  return true;
}

} // namespace tracr::remote
