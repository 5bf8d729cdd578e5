#include "common/assertions.hpp"

#include "core/logging/logger.hpp"
#include "registry/device_model.hpp"
#include "remote/capability_probe.hpp"
#include "remote/connection_manager.hpp"
#include "remote/retry_policy.hpp"
#include "remote/sim/sim_network.hpp"

#include <chrono>
#include <sstream>
#include <string>
#include <vector>

using tracr::core::errors::Error;
using tracr::core::errors::ErrorKind;
using tracr::tests::common::AssertContains;
using tracr::tests::common::AssertErrorKind;
using tracr::tests::common::AssertOk;
using tracr::tests::common::AssertTrue;
using tracr::tests::common::Fail;

namespace {

tracr::registry::Device MakeDevice(const std::string& id, const std::string& host) {
  tracr::registry::Device device;
  device.id = id;
  device.host = host;
  device.mac = "dc:a6:32:00:00:01";
  device.arch = "arm64";
  device.user = "pi";
  return device;
}

} // namespace

int main() {
  using std::chrono::milliseconds;

  // Backoff schedule: 500, 1000, 2000, 4000, then capped.
  const tracr::remote::RetryPolicy policy;
  if (tracr::remote::ComputeBackoff(policy, 1) != milliseconds(500) ||
      tracr::remote::ComputeBackoff(policy, 2) != milliseconds(1000) ||
      tracr::remote::ComputeBackoff(policy, 3) != milliseconds(2000) ||
      tracr::remote::ComputeBackoff(policy, 4) != milliseconds(4000) ||
      tracr::remote::ComputeBackoff(policy, 9) != milliseconds(4000)) {
    Fail("default backoff schedule should double from 500ms and cap at 4000ms");
  }
  AssertTrue(tracr::remote::ComputeAttemptsRemaining(policy, 1) == 2U, "two attempts remain");
  AssertTrue(tracr::remote::ComputeAttemptsRemaining(policy, 3) == 0U, "budget exhausted");

  AssertTrue(tracr::remote::IsLikelyTransientConnectError(
                 "ssh: connect to host 10.0.0.5 port 22: Connection refused"),
             "refused is transient");
  AssertTrue(tracr::remote::IsLikelyTransientConnectError(
                 "ssh: connect to host 10.0.0.5 port 22: No route to host"),
             "no route is transient");
  AssertTrue(!tracr::remote::IsLikelyTransientConnectError("Permission denied (publickey)."),
             "auth failure is not transient");
  AssertTrue(!tracr::remote::IsLikelyTransientConnectError(
                 "Host key verification failed."),
             "host key failure is not transient");

  tracr::remote::sim::SimNetwork network;
  tracr::remote::sim::SimShellFactory factory(network);
  std::ostringstream log;
  tracr::core::logging::Logger logger(tracr::core::logging::LogLevel::kDebug, log);
  std::vector<milliseconds> sleeps;
  tracr::remote::ConnectionManager manager(
      factory, tracr::remote::ConnectionOptions{}, logger,
      [&sleeps](milliseconds delay) { sleeps.push_back(delay); });

  // Two refusals, then the board accepts on the third attempt.
  tracr::remote::sim::SimHostSpec flaky;
  flaky.transient_failures = 2;
  network.AddHost("10.0.0.5", flaky);
  {
    std::unique_ptr<tracr::remote::Session> session;
    Error error;
    AssertOk(manager.Connect(MakeDevice("flaky", "10.0.0.5"), session, error), error,
             "connect after transient refusals");
    AssertTrue(session->connect_attempts() == 3U, "third attempt should succeed");
    if (sleeps.size() != 2U || sleeps[0] != milliseconds(500) || sleeps[1] != milliseconds(1000)) {
      Fail("backoff between attempts should be 500ms then 1000ms");
    }

    tracr::remote::CapabilityReport report;
    AssertOk(tracr::remote::ProbeCapabilities(manager, *session, milliseconds(1000), report, error),
             error, "probe capabilities");
    AssertTrue(report.arch == "arm64", "aarch64 should normalize to arm64");
    AssertTrue(report.os_family == "Linux", "os family from uname");
    AssertTrue(report.os_version == "5.15.0-1034-raspi", "os version from uname");
    AssertTrue(report.prepared && report.engine_version == "24.0.7",
               "docker should be reported as prepared");
  }
  AssertTrue(network.OpenSessions("10.0.0.5") == 0U, "session destructor should close channel");
  AssertTrue(!manager.IsLeased("flaky"), "session destructor should release the lease");

  // Unreachable: the whole budget is spent, then kConnection with attempts.
  sleeps.clear();
  tracr::remote::sim::SimHostSpec dead;
  dead.reachable = false;
  network.AddHost("10.0.0.6", dead);
  {
    std::unique_ptr<tracr::remote::Session> session;
    Error error;
    AssertErrorKind(manager.Connect(MakeDevice("dead", "10.0.0.6"), session, error), error,
                    ErrorKind::kConnection, "connect to unreachable host");
    AssertTrue(error.attempts == 3U, "all three attempts should be consumed");
    AssertTrue(network.ConnectAttempts("10.0.0.6") == 3U, "host should see three attempts");
    AssertContains(error.message, "No route to host");
    AssertTrue(session == nullptr, "no session on failure");
    AssertTrue(!manager.IsLeased("dead"), "failed connect must release the lease");
  }

  // Authentication failures are not retried.
  sleeps.clear();
  tracr::remote::sim::SimHostSpec locked;
  locked.reject_auth = true;
  network.AddHost("10.0.0.7", locked);
  {
    std::unique_ptr<tracr::remote::Session> session;
    Error error;
    AssertErrorKind(manager.Connect(MakeDevice("locked", "10.0.0.7"), session, error), error,
                    ErrorKind::kConnection, "connect with rejected key");
    AssertTrue(error.attempts == 1U, "auth failure should stop after one attempt");
    AssertTrue(sleeps.empty(), "no backoff after a permanent failure");
  }

  // No container engine: reachable but not prepared.
  tracr::remote::sim::SimHostSpec bare;
  bare.docker_available = false;
  network.AddHost("10.0.0.8", bare);
  {
    std::unique_ptr<tracr::remote::Session> session;
    Error error;
    AssertOk(manager.Connect(MakeDevice("bare", "10.0.0.8"), session, error), error,
             "connect to bare host");
    tracr::remote::CapabilityReport report;
    AssertOk(tracr::remote::ProbeCapabilities(manager, *session, milliseconds(1000), report, error),
             error, "probe bare host");
    AssertTrue(!report.prepared, "host without docker should not be prepared");
  }

  // Cancellation during backoff stops the retry loop.
  tracr::core::CancellationToken cancel;
  cancel.Cancel();
  {
    std::unique_ptr<tracr::remote::Session> session;
    Error error;
    AssertErrorKind(manager.Connect(MakeDevice("flaky", "10.0.0.5"), session, error, &cancel),
                    error, ErrorKind::kCancelled, "connect with cancelled token");
    AssertTrue(!manager.IsLeased("flaky"), "cancelled connect must release the lease");
  }

  AssertContains(log.str(), "connect attempt failed");
  return 0;
}
