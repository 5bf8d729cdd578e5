#include "common/assertions.hpp"
#include "common/sim_lan.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using tracr::core::errors::Error;
using tracr::core::errors::ErrorKind;
using tracr::tests::common::AssertErrorKind;
using tracr::tests::common::AssertOk;
using tracr::tests::common::AssertTrue;

int main() {
  tracr::tests::common::SimLan lan;
  const std::string board_id = lan.AddParticipant("10.0.2.10", "armv7");
  tracr::registry::Device board;
  Error error;
  AssertOk(lan.registry.Get(board_id, board, error), error, "get board");

  std::unique_ptr<tracr::remote::Session> first;
  AssertOk(lan.connections.Connect(board, first, error), error, "first connect");
  AssertTrue(lan.connections.IsLeased(board_id), "device should be leased");

  std::unique_ptr<tracr::remote::Session> second;
  AssertErrorKind(lan.connections.Connect(board, second, error), error, ErrorKind::kDeviceBusy,
                  "second connect to leased device");
  AssertTrue(lan.network.ConnectAttempts("10.0.2.10") == 1U,
             "a busy device must not be dialled again");

  // The session is reused for many commands.
  tracr::remote::CommandResult result;
  for (int i = 0; i < 3; ++i) {
    AssertOk(lan.connections.Execute(*first, "uname -s -r -m", std::chrono::milliseconds(100),
                                     result, error),
             error, "reuse session");
  }
  AssertTrue(lan.network.ConnectAttempts("10.0.2.10") == 1U, "commands reuse one channel");

  lan.connections.Close(*first);
  lan.connections.Close(*first);
  AssertTrue(!lan.connections.IsLeased(board_id), "close should release the lease");
  AssertTrue(lan.network.OpenSessions("10.0.2.10") == 0U, "close should close the channel");
  first.reset();

  // Concurrent connects race for one lease; exactly one wins.
  std::atomic<int> winners{0};
  std::atomic<int> busy{0};
  std::vector<std::unique_ptr<tracr::remote::Session>> sessions(8);
  std::vector<std::thread> threads;
  for (std::size_t i = 0; i < sessions.size(); ++i) {
    threads.emplace_back([&, i] {
      Error local;
      if (lan.connections.Connect(board, sessions[i], local)) {
        ++winners;
      } else if (local.kind == ErrorKind::kDeviceBusy) {
        ++busy;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  AssertTrue(winners.load() == 1, "exactly one concurrent connect should win");
  AssertTrue(busy.load() == 7, "every other connect should report the device busy");
  AssertTrue(lan.network.OpenSessions("10.0.2.10") == 1U, "one open channel at most");

  sessions.clear();
  AssertTrue(!lan.connections.IsLeased(board_id), "destroying sessions releases the lease");
  AssertTrue(lan.network.OpenSessions("10.0.2.10") == 0U, "destroying sessions closes channels");
  return 0;
}
