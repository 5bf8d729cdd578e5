#include "events/jsonl_writer.hpp"

#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace tracr::events {

EventLogWriter::EventLogWriter(fs::path run_dir)
    : run_dir_(std::move(run_dir)), path_(run_dir_ / "events.jsonl") {}

bool EventLogWriter::EnsureOpen(std::string& error) {
  if (out_.is_open()) {
    return true;
  }
  std::error_code ec;
  fs::create_directories(run_dir_, ec);
  if (ec) {
    error = "cannot create run directory '" + run_dir_.string() + "': " + ec.message();
    return false;
  }
  out_.open(path_, std::ios::binary | std::ios::app);
  if (!out_.is_open()) {
    error = "cannot open '" + path_.string() + "' for append";
    return false;
  }
  return true;
}

bool EventLogWriter::Append(const Event& event, std::string& error) {
  if (!EnsureOpen(error)) {
    return false;
  }
  out_ << ToJson(event) << '\n';
  out_.flush();
  if (!out_) {
    error = "write to '" + path_.string() + "' failed";
    out_.close();
    return false;
  }
  return true;
}

} // namespace tracr::events
