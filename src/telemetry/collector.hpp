#pragma once

#include "core/errors/error.hpp"
#include "deploy/artifact_collector.hpp"
#include "telemetry/log_reader.hpp"
#include "telemetry/telemetry_entry.hpp"
#include "telemetry/telemetry_store.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tracr::core::logging {
class Logger;
}

namespace tracr::telemetry {

// Moves device telemetry logs into the run's normalized store.
//
// Live passes read only the bytes appended since the previous pass
// (`tail -c +N`); the final pass pulls the whole log into
// `<run_dir>/raw/<device_id>.telemetry.jsonl` and ingests whatever the live
// passes have not consumed yet, so every complete line is stored exactly
// once.
class TelemetryCollector : public deploy::IRunArtifactCollector {
public:
  TelemetryCollector(std::filesystem::path runs_root, std::string file_name,
                     core::logging::Logger& logger,
                     std::chrono::milliseconds command_timeout = std::chrono::seconds(30),
                     std::chrono::milliseconds transfer_timeout = std::chrono::seconds(120));

  bool CollectLive(remote::ConnectionManager& connections, remote::Session& session,
                   const deploy::CollectionTarget& target, deploy::CollectionStats& stats,
                   core::errors::Error& error) override;

  bool CollectFinal(remote::ConnectionManager& connections, remote::Session& session,
                    const deploy::CollectionTarget& target, deploy::CollectionStats& stats,
                    core::errors::Error& error) override;

  // Local ingest of an already-retrieved log; used by the final pass and
  // for logs copied off a device by hand.
  bool IngestLog(const deploy::CollectionTarget& target, const std::string& text,
                 std::size_t start_offset, deploy::CollectionStats& stats,
                 std::size_t& consumed_bytes, core::errors::Error& error);

  TelemetryStore& StoreFor(const std::string& run_id);

private:
  std::size_t OffsetOf(const deploy::CollectionTarget& target) const;
  void AdvanceOffset(const deploy::CollectionTarget& target, std::size_t consumed);

  std::filesystem::path runs_root_;
  std::string file_name_;
  core::logging::Logger& logger_;
  std::chrono::milliseconds command_timeout_;
  std::chrono::milliseconds transfer_timeout_;

  mutable std::mutex mu_;
  std::map<std::string, std::unique_ptr<TelemetryStore>> stores_;
  // "<run_id>/<device_id>" -> bytes of the remote log already ingested.
  std::map<std::string, std::size_t> offsets_;
};

} // namespace tracr::telemetry
