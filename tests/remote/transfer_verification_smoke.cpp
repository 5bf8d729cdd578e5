#include "common/assertions.hpp"
#include "common/sim_lan.hpp"
#include "common/temp_dir.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

using tracr::core::errors::Error;
using tracr::core::errors::ErrorKind;
using tracr::remote::TransferDirection;
using tracr::tests::common::AssertContains;
using tracr::tests::common::AssertErrorKind;
using tracr::tests::common::AssertOk;
using tracr::tests::common::AssertTrue;

int main() {
  using std::chrono::milliseconds;
  tracr::tests::common::ScopedTempDir temp("tracr-transfer");
  tracr::tests::common::SimLan lan;
  const std::string board_id = lan.AddParticipant("10.0.1.10", "arm64");

  const fs::path local = temp.path() / "Dockerfile";
  tracr::tests::common::WriteFileOrFail(local, "FROM tracr-base:arm64\nRUN pip install numpy\n");

  tracr::registry::Device board;
  Error error;
  AssertOk(lan.registry.Get(board_id, board, error), error, "get board");

  {
    std::unique_ptr<tracr::remote::Session> session;
    AssertOk(lan.connections.Connect(board, session, error), error, "connect");

    const std::string remote_path = "~/.tracr/work/builds/run-1/sensor/Dockerfile.deps";
    AssertOk(lan.connections.Transfer(*session, local, remote_path, TransferDirection::kPush,
                                      milliseconds(1000), error),
             error, "verified push");
    std::string stored;
    AssertTrue(lan.network.ReadRemoteFile("10.0.1.10", remote_path, stored),
               "pushed file should exist remotely");
    AssertTrue(stored == tracr::tests::common::ReadFileToString(local),
               "pushed bytes should match");

    // Pull back a remote log and verify it landed locally.
    lan.network.WriteRemoteFile("10.0.1.10", "/var/tmp/telemetry.jsonl",
                                "{\"metric\":\"temp_c\",\"value\":41.5}\n");
    const fs::path pulled = temp.path() / "raw" / "board.telemetry.jsonl";
    AssertOk(lan.connections.Transfer(*session, pulled, "/var/tmp/telemetry.jsonl",
                                      TransferDirection::kPull, milliseconds(1000), error),
             error, "verified pull");
    AssertContains(tracr::tests::common::ReadFileToString(pulled), "temp_c");

    AssertErrorKind(lan.connections.Transfer(*session, temp.path() / "missing.jsonl",
                                             "/var/tmp/absent.jsonl", TransferDirection::kPull,
                                             milliseconds(1000), error),
                    error, ErrorKind::kTransfer, "pull of missing remote file");
    AssertErrorKind(lan.connections.Transfer(*session, temp.path() / "absent-local",
                                             "/tmp/x", TransferDirection::kPush,
                                             milliseconds(1000), error),
                    error, ErrorKind::kTransfer, "push of missing local file");
    AssertTrue(session->is_open(), "copy failures keep the session usable");
  }

  // A flipped bit on the wire is caught by the CRC comparison.
  lan.network.UpdateHost("10.0.1.10", [](tracr::remote::sim::SimHostSpec& spec) {
    spec.corrupt_pushes = true;
  });
  {
    std::unique_ptr<tracr::remote::Session> session;
    AssertOk(lan.connections.Connect(board, session, error), error, "reconnect");
    AssertErrorKind(lan.connections.Transfer(*session, local, "/tmp/corrupt",
                                             TransferDirection::kPush, milliseconds(1000), error),
                    error, ErrorKind::kTransfer, "corrupted push");
    AssertContains(error.message, "checksum mismatch");
  }

  // A short write is caught by the byte count.
  lan.network.UpdateHost("10.0.1.10", [](tracr::remote::sim::SimHostSpec& spec) {
    spec.corrupt_pushes = false;
    spec.truncate_pushes = true;
  });
  {
    std::unique_ptr<tracr::remote::Session> session;
    AssertOk(lan.connections.Connect(board, session, error), error, "reconnect");
    AssertErrorKind(lan.connections.Transfer(*session, local, "/tmp/short",
                                             TransferDirection::kPush, milliseconds(1000), error),
                    error, ErrorKind::kTransfer, "truncated push");
    AssertContains(error.message, "truncated");
  }

  // Deadlines close the session; a lost channel does too.
  lan.network.UpdateHost("10.0.1.10", [](tracr::remote::sim::SimHostSpec& spec) {
    spec.truncate_pushes = false;
    spec.hang_on = "sleep";
    spec.drop_on = "reboot";
  });
  {
    std::unique_ptr<tracr::remote::Session> session;
    AssertOk(lan.connections.Connect(board, session, error), error, "reconnect");
    tracr::remote::CommandResult result;
    AssertErrorKind(lan.connections.Execute(*session, "sleep 600", milliseconds(10), result,
                                            error),
                    error, ErrorKind::kTimeout, "hung command");
    AssertTrue(!session->is_open(), "timeout should close the session");
    AssertTrue(!lan.connections.IsLeased(board_id), "closed session releases the lease");
    AssertErrorKind(lan.connections.Execute(*session, "true", milliseconds(10), result, error),
                    error, ErrorKind::kConnection, "command on closed session");
  }
  {
    std::unique_ptr<tracr::remote::Session> session;
    AssertOk(lan.connections.Connect(board, session, error), error, "reconnect");
    tracr::remote::CommandResult result;
    AssertErrorKind(lan.connections.Execute(*session, "sudo reboot", milliseconds(10), result,
                                            error),
                    error, ErrorKind::kConnection, "dropped channel");
    AssertTrue(!session->is_open(), "transport failure should close the session");

    AssertOk(lan.connections.Connect(board, session, error), error, "reconnect after drop");
    AssertErrorKind(lan.connections.Execute(*session, "false-command", milliseconds(10), result,
                                            error),
                    error, ErrorKind::kRemoteCommand, "unknown remote program");
    AssertTrue(error.exit_code == 127, "exit code should be carried");
    AssertTrue(session->is_open(), "remote failures keep the session open");
  }
  return 0;
}
