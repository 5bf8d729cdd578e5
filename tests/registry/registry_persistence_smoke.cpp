#include "common/assertions.hpp"
#include "common/temp_dir.hpp"

#include "core/time_utils.hpp"
#include "network/lan_config_store.hpp"
#include "registry/device_registry.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

using tracr::core::errors::Error;
using tracr::core::errors::ErrorKind;
using tracr::tests::common::AssertContains;
using tracr::tests::common::AssertErrorKind;
using tracr::tests::common::AssertOk;
using tracr::tests::common::AssertTrue;
using tracr::tests::common::Fail;

int main() {
  tracr::tests::common::ScopedTempDir temp("tracr-registry-persistence");
  const fs::path network_file = temp.path() / "networks" / "lab.json";

  std::string controller_id;
  std::string board_id;
  tracr::registry::Device board_before;
  {
    tracr::network::LanConfigStore store(network_file, "lab");
    tracr::registry::DeviceRegistry registry(&store);
    Error error;
    AssertOk(registry.Load(error), error, "load missing file as empty LAN");
    AssertTrue(registry.Size() == 0U, "missing file should load empty");

    tracr::registry::Device controller;
    controller.host = "192.168.1.2";
    controller.mac = "b8:27:eb:00:00:02";
    controller.arch = "x86_64";
    controller.user = "ops";
    controller.role = tracr::registry::DeviceRole::kController;
    AssertOk(registry.Register(controller, controller_id, error), error, "register controller");

    tracr::registry::Device board;
    board.name = "jetson-1";
    board.host = "192.168.1.40";
    board.mac = "b8:27:eb:00:00:40";
    board.arch = "arm64";
    board.user = "nvidia";
    board.identity_file = "~/.ssh/id_ed25519";
    board.port = 2222;
    board.os_family = "Linux";
    board.os_version = "5.10.120-tegra";
    board.last_synced_at = tracr::core::FromEpochMilliseconds(1'700'000'000'250);
    AssertOk(registry.Register(board, board_id, error), error, "register board");
    AssertOk(registry.Get(board_id, board_before, error), error, "get board");
  }

  AssertTrue(fs::exists(network_file), "LAN file should be written on mutation");
  const std::string text = tracr::tests::common::ReadFileToString(network_file);
  AssertContains(text, "\"schema_version\": 1");
  AssertContains(text, "\"name\": \"lab\"");
  AssertContains(text, board_id);

  {
    tracr::network::LanConfigStore store(network_file, "lab");
    tracr::registry::DeviceRegistry registry(&store);
    Error error;
    AssertOk(registry.Load(error), error, "reload registry");
    AssertTrue(registry.Size() == 2U, "both devices should survive a reload");

    tracr::registry::Device board_after;
    AssertOk(registry.Get(board_id, board_after, error), error, "get reloaded board");
    if (!(board_after == board_before)) {
      Fail("reloaded device should equal the stored one field for field");
    }

    const tracr::network::LanDocument document = store.Document();
    AssertTrue(document.lan.controller_id == controller_id,
               "LAN file should reference the controller by id");
    AssertTrue(document.lan.participant_ids.size() == 1U &&
                   document.lan.participant_ids.front() == board_id,
               "LAN file should reference participants by id");

    // Registration order continues after the highest stored sequence.
    tracr::registry::Device late;
    late.host = "192.168.1.41";
    std::string late_id;
    AssertOk(registry.Register(late, late_id, error), error, "register after reload");
    tracr::registry::Device late_stored;
    AssertOk(registry.Get(late_id, late_stored, error), error, "get late device");
    AssertTrue(late_stored.registration_seq == 3U, "sequence should continue after reload");
  }

  // A store that cannot be written rolls the mutation back.
  {
    const fs::path blocker = temp.path() / "blocker";
    tracr::tests::common::WriteFileOrFail(blocker, "not a directory");
    tracr::network::LanConfigStore store(blocker / "lan.json", "broken");
    tracr::registry::DeviceRegistry registry(&store);
    Error error;
    AssertOk(registry.Load(error), error, "load from unwritable location");

    tracr::registry::Device device;
    device.host = "192.168.1.50";
    std::string device_id;
    AssertErrorKind(registry.Register(device, device_id, error), error, ErrorKind::kIo,
                    "register with failing store");
    AssertTrue(registry.Size() == 0U, "failed persistence must roll the registration back");
  }

  // A corrupt LAN file is reported, not silently replaced.
  {
    const fs::path corrupt = temp.path() / "corrupt.json";
    tracr::tests::common::WriteFileOrFail(corrupt, "{\"devices\": [");
    tracr::network::LanConfigStore store(corrupt, "corrupt");
    tracr::registry::DeviceRegistry registry(&store);
    Error error;
    AssertErrorKind(registry.Load(error), error, ErrorKind::kIo, "load corrupt LAN file");
  }
  return 0;
}
