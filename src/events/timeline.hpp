#pragma once

#include "events/event_model.hpp"
#include "events/jsonl_writer.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tracr::events {

// Run timeline shared by the orchestrator and its device workers.
//
// `seq` allocation and the file append happen under one mutex, so
// `events.jsonl` lines are in `seq` order. Without a run directory events
// stay in memory. Write failures are kept in `LastWriteError` and never fail
// `Emit`.
class Timeline {
public:
  explicit Timeline(std::filesystem::path run_dir = {});

  Timeline(const Timeline&) = delete;
  Timeline& operator=(const Timeline&) = delete;

  // Returns the event's sequence number.
  std::uint64_t Emit(EventType type, std::map<std::string, std::string> payload,
                     std::chrono::system_clock::time_point ts = std::chrono::system_clock::now());

  std::vector<Event> Events() const;
  std::uint64_t LastSeq() const;
  std::string LastWriteError() const;

  const std::filesystem::path& run_dir() const {
    return run_dir_;
  }

private:
  std::filesystem::path run_dir_;
  mutable std::mutex mu_;
  std::optional<EventLogWriter> log_;
  std::uint64_t next_seq_ = 1;
  std::vector<Event> events_;
  std::string last_write_error_;
};

} // namespace tracr::events
