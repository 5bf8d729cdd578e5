#pragma once

#include "events/event_model.hpp"

#include <filesystem>
#include <fstream>
#include <string>

namespace tracr::events {

// Append-only `<run_dir>/events.jsonl` sink. The run directory and file are
// created on the first append and the stream stays open for the run; every
// line is flushed before `Append` returns.
class EventLogWriter {
public:
  explicit EventLogWriter(std::filesystem::path run_dir);

  EventLogWriter(const EventLogWriter&) = delete;
  EventLogWriter& operator=(const EventLogWriter&) = delete;

  bool Append(const Event& event, std::string& error);

  const std::filesystem::path& path() const {
    return path_;
  }

private:
  bool EnsureOpen(std::string& error);

  std::filesystem::path run_dir_;
  std::filesystem::path path_;
  std::ofstream out_;
};

} // namespace tracr::events
