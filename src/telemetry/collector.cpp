#include "telemetry/collector.hpp"

#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"
#include "core/process.hpp"
#include "remote/connection_manager.hpp"

#include <utility>

namespace fs = std::filesystem;

namespace tracr::telemetry {
namespace {

using core::errors::Error;
using core::errors::ErrorKind;

std::string OffsetKey(const deploy::CollectionTarget& target) {
  return target.run_id + "/" + target.device_id;
}

} // namespace

TelemetryCollector::TelemetryCollector(fs::path runs_root, std::string file_name,
                                       core::logging::Logger& logger,
                                       const std::chrono::milliseconds command_timeout,
                                       const std::chrono::milliseconds transfer_timeout)
    : runs_root_(std::move(runs_root)), file_name_(std::move(file_name)), logger_(logger),
      command_timeout_(command_timeout), transfer_timeout_(transfer_timeout) {}

TelemetryStore& TelemetryCollector::StoreFor(const std::string& run_id) {
  std::lock_guard<std::mutex> lock(mu_);
  auto& slot = stores_[run_id];
  if (!slot) {
    slot = std::make_unique<TelemetryStore>(runs_root_, run_id, file_name_);
  }
  return *slot;
}

std::size_t TelemetryCollector::OffsetOf(const deploy::CollectionTarget& target) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = offsets_.find(OffsetKey(target));
  return it == offsets_.end() ? 0U : it->second;
}

void TelemetryCollector::AdvanceOffset(const deploy::CollectionTarget& target,
                                       const std::size_t consumed) {
  std::lock_guard<std::mutex> lock(mu_);
  offsets_[OffsetKey(target)] += consumed;
}

bool TelemetryCollector::IngestLog(const deploy::CollectionTarget& target,
                                   const std::string& text, const std::size_t start_offset,
                                   deploy::CollectionStats& stats, std::size_t& consumed_bytes,
                                   Error& error) {
  consumed_bytes = 0;
  if (start_offset >= text.size()) {
    return true;
  }
  const IngestContext context{.run_id = target.run_id, .device_id = target.device_id};
  std::vector<TelemetryEntry> entries;
  IngestStats ingest;
  IngestText(std::string_view(text).substr(start_offset), context, entries, ingest,
             consumed_bytes);

  std::string store_error;
  if (!entries.empty() && !StoreFor(target.run_id).Append(entries, store_error)) {
    consumed_bytes = 0;
    return core::errors::Fail(error, ErrorKind::kIo, store_error);
  }
  stats.accepted += ingest.accepted;
  stats.malformed += ingest.malformed;
  stats.foreign += ingest.foreign;
  return true;
}

bool TelemetryCollector::CollectLive(remote::ConnectionManager& connections,
                                     remote::Session& session,
                                     const deploy::CollectionTarget& target,
                                     deploy::CollectionStats& stats, Error& error) {
  const std::size_t offset = OffsetOf(target);
  remote::CommandResult result;
  const std::string command = "tail -c +" + std::to_string(offset + 1U) + " " +
                              core::ShellQuotePath(target.remote_log_path);
  if (!connections.Execute(session, command, command_timeout_, result,
                           error)) {
    if (error.kind == ErrorKind::kRemoteCommand) {
      // Wrapper has not created the log yet.
      logger_.Debug("telemetry log not readable yet", {{"device_id", target.device_id}});
      core::errors::Clear(error);
      return true;
    }
    return false;
  }

  std::size_t consumed = 0;
  if (!IngestLog(target, result.stdout_text, 0, stats, consumed, error)) {
    return false;
  }
  AdvanceOffset(target, consumed);
  return true;
}

bool TelemetryCollector::CollectFinal(remote::ConnectionManager& connections,
                                      remote::Session& session,
                                      const deploy::CollectionTarget& target,
                                      deploy::CollectionStats& stats, Error& error) {
  const fs::path raw_path =
      runs_root_ / target.run_id / "raw" / (target.device_id + ".telemetry.jsonl");
  if (!connections.Transfer(session, raw_path, target.remote_log_path,
                            remote::TransferDirection::kPull,
                            transfer_timeout_, error)) {
    return false;
  }

  std::string text;
  std::string read_error;
  if (!core::ReadTextFile(raw_path, text, read_error)) {
    return core::errors::Fail(error, ErrorKind::kIo, read_error);
  }
  // The container has exited; an unterminated last line is complete.
  if (!text.empty() && text.back() != '\n') {
    text.push_back('\n');
  }

  std::size_t consumed = 0;
  if (!IngestLog(target, text, OffsetOf(target), stats, consumed, error)) {
    return false;
  }
  AdvanceOffset(target, consumed);
  logger_.Info("telemetry collected", {{"device_id", target.device_id},
                                       {"role", target.role},
                                       {"accepted", std::to_string(stats.accepted)},
                                       {"malformed", std::to_string(stats.malformed)}});
  return true;
}

} // namespace tracr::telemetry
