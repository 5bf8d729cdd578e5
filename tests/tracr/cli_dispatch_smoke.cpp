#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using tracr::tests::common::AssertContains;
using tracr::tests::common::AssertNotContains;
using tracr::tests::common::AssertTrue;
using tracr::tests::common::DispatchCaptured;
using tracr::tests::common::DispatchOutput;

namespace {

// Value printed after `prefix` on its own output line.
std::string ValueAfter(const std::string& text, const std::string& prefix) {
  const std::size_t start = text.find(prefix);
  AssertTrue(start != std::string::npos, "missing output line: " + prefix);
  const std::size_t value = start + prefix.size();
  return text.substr(value, text.find('\n', value) - value);
}

void ExpectExit(const DispatchOutput& output, int expected, const std::string& context) {
  if (output.exit_code != expected) {
    tracr::tests::common::Fail(context + ": expected exit " + std::to_string(expected) +
                               ", got " + std::to_string(output.exit_code) +
                               "\nstdout:\n" + output.out + "\nstderr:\n" + output.err);
  }
}

} // namespace

int main() {
  tracr::tests::common::ScopedTempDir temp("tracr-cli-dispatch");
  const fs::path home = temp.path();
  const fs::path config_path = home / "controller_config.json";
  tracr::tests::common::WriteFileOrFail(
      config_path, "{\n"
                   "  \"lan_name\": \"lab\",\n"
                   "  \"network_file\": \"" + (home / "networks" / "lab.json").string() + "\",\n"
                   "  \"experiments_root\": \"" + (home / "TestCases").string() + "\",\n"
                   "  \"runs_root\": \"" + (home / "runs").string() + "\",\n"
                   "  \"log_level\": \"error\",\n"
                   "  \"ssh\": {\"retry_limit\": 1, \"backoff_initial_ms\": 0, "
                   "\"backoff_max_ms\": 0}\n"
                   "}\n");
  const auto run = [&config_path](std::vector<std::string> args) {
    args.insert(args.begin(), {"tracr", "--config", config_path.string()});
    return DispatchCaptured(args);
  };

  // Invocation contract.
  ExpectExit(DispatchCaptured({"tracr"}), 2, "no command");
  const auto help = DispatchCaptured({"tracr", "help"});
  ExpectExit(help, 0, "help");
  AssertContains(help.out, "experiment run <name>");
  const auto unknown = DispatchCaptured({"tracr", "launch"});
  ExpectExit(unknown, 2, "unknown command");
  AssertContains(unknown.err, "unknown subcommand: launch");
  const auto version = DispatchCaptured({"tracr", "version"});
  ExpectExit(version, 0, "version");
  AssertTrue(version.out == "tracr 0.1.0\n", "version banner");
  ExpectExit(DispatchCaptured({"tracr", "version", "--verbose"}), 2, "version with arguments");
  ExpectExit(DispatchCaptured({"tracr", "--log-level", "loud", "version"}), 2, "bad log level");
  ExpectExit(DispatchCaptured({"tracr", "--config"}), 2, "config without a value");

  // Device registry commands.
  const auto added = run({"device", "add", "--name", "edge-1", "--host", "10.0.9.11", "--mac",
                          "DC-A6-32-00-00-11", "--arch", "arm64", "--user", "pi"});
  ExpectExit(added, 0, "device add");
  const std::string device_id = ValueAfter(added.out, "device registered: ");
  AssertTrue(!device_id.empty(), "device id printed");
  AssertTrue(fs::is_regular_file(home / "networks" / "lab.json"), "network file written");

  ExpectExit(run({"device", "add", "--name", "edge-1b", "--host", "10.0.9.11", "--mac",
                  "dc:a6:32:00:00:11", "--arch", "arm64", "--user", "pi"}),
             40, "duplicate endpoint");
  const auto incomplete = run({"device", "add", "--name", "edge-2", "--host", "10.0.9.12"});
  ExpectExit(incomplete, 2, "missing required options");
  AssertContains(incomplete.err, "missing required option --mac");
  ExpectExit(run({"device", "add", "--name", "edge-2", "--host", "10.0.9.12", "--mac",
                  "dc:a6:32:00:00:12", "--arch", "arm64", "--user", "pi", "--port", "70000"}),
             2, "port out of range");

  const auto listed = run({"device", "ls"});
  ExpectExit(listed, 0, "device ls");
  AssertContains(listed.out, device_id + "  participant  configured  edge-1  pi@10.0.9.11  "
                                         "dc:a6:32:00:00:11  arm64");
  AssertContains(listed.out, "devices: 1");
  AssertContains(run({"device", "ls", "--arch", "x86_64"}).out, "devices: 0");
  ExpectExit(run({"device", "ls", "--role", "gateway"}), 2, "invalid role filter");

  const auto updated = run({"device", "update", device_id, "--port", "2222", "--os", "Linux"});
  ExpectExit(updated, 0, "device update");
  AssertContains(updated.out, "pi@10.0.9.11:2222");
  const auto immutable = run({"device", "update", device_id, "--arch", "armv7"});
  ExpectExit(immutable, 40, "architecture is immutable once configured");
  AssertContains(immutable.err, "immutable");
  ExpectExit(run({"device", "update"}), 2, "update without an id");
  ExpectExit(run({"device", "update", "no-such-device", "--name", "x"}), 40, "unknown id");

  // Controller setup registers once and updates afterwards.
  const auto setup = run({"setup", "controller", "--host", "10.0.9.1", "--mac",
                          "dc:a6:32:00:00:01", "--user", "admin", "--subnet", "10.0.9.0/24"});
  ExpectExit(setup, 0, "setup controller");
  const std::string controller_id = ValueAfter(setup.out, "controller: ");
  const auto again = run({"setup", "controller", "--host", "10.0.9.2", "--mac",
                          "dc:a6:32:00:00:02", "--user", "admin"});
  ExpectExit(again, 0, "setup controller again");
  AssertTrue(ValueAfter(again.out, "controller: ") == controller_id, "controller id kept");
  const auto controllers = run({"device", "ls", "--role", "controller"});
  AssertContains(controllers.out, "admin@10.0.9.2");
  AssertContains(controllers.out, "devices: 1");
  AssertContains(tracr::tests::common::ReadFileToString(home / "networks" / "lab.json"),
                 "10.0.9.0/24");
  ExpectExit(run({"setup", "controller", "--host", "10.0.9.1", "--mac", "dc:a6:32:00:00:01",
                  "--user", "admin", "--subnet", "10.0.9.0/33"}),
             2, "invalid subnet");
  ExpectExit(run({"setup"}), 2, "setup without subcommand");

  const auto removed = run({"device", "rm", device_id});
  ExpectExit(removed, 0, "device rm");
  AssertContains(removed.out, "device removed: " + device_id);
  ExpectExit(run({"device", "rm", device_id}), 40, "removing twice");
  AssertNotContains(run({"device", "ls"}).out, device_id);

  // Experiment catalog commands.
  const auto created = run({"experiment", "add", "soil-probe"});
  ExpectExit(created, 0, "experiment add");
  AssertTrue(!ValueAfter(created.out, "experiment_id: ").empty(), "experiment id printed");
  AssertTrue(fs::is_regular_file(home / "TestCases" / "soil-probe" / "experiment.json"),
             "descriptor skeleton written");
  ExpectExit(run({"experiment", "add", "soil-probe"}), 1, "experiment exists");
  ExpectExit(run({"experiment", "add", "soil/probe"}), 2, "invalid experiment name");
  ExpectExit(run({"experiment", "add"}), 2, "experiment add without a name");

  const auto experiments = run({"experiment", "ls"});
  ExpectExit(experiments, 0, "experiment ls");
  AssertContains(experiments.out, "soil-probe  ");
  AssertContains(experiments.out, "experiments: 1");

  // The skeleton is a draft until every constraint has an order.
  const auto draft = run({"experiment", "validate", "soil-probe"});
  ExpectExit(draft, 10, "draft experiment is not deployable");
  AssertContains(draft.err, "not deployable");
  ExpectExit(run({"experiment", "validate", "missing"}), 1, "unknown experiment");

  // Telemetry of a run that never happened.
  const auto aggregate = run({"telemetry", "aggregate", "run-unknown"});
  ExpectExit(aggregate, 1, "aggregate unknown run");
  AssertContains(aggregate.err, "NOT_FOUND");
  ExpectExit(run({"telemetry", "summarize", "run-unknown"}), 2, "unknown telemetry command");

  // A broken config is a usage error reported with its JSON path.
  const fs::path bad_config = home / "bad_config.json";
  tracr::tests::common::WriteFileOrFail(bad_config, R"({"ssh":{"retry_limit":0}})");
  const auto bad = DispatchCaptured({"tracr", "--config", bad_config.string(), "device", "ls"});
  ExpectExit(bad, 2, "invalid config");
  AssertContains(bad.err, "$.ssh.retry_limit");
  return 0;
}
