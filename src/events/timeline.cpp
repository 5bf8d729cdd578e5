#include "events/timeline.hpp"

#include <utility>

namespace tracr::events {

Timeline::Timeline(std::filesystem::path run_dir) : run_dir_(std::move(run_dir)) {
  if (!run_dir_.empty()) {
    log_.emplace(run_dir_);
  }
}

std::uint64_t Timeline::Emit(EventType type, std::map<std::string, std::string> payload,
                             std::chrono::system_clock::time_point ts) {
  std::lock_guard<std::mutex> lock(mu_);
  Event event;
  event.seq = next_seq_++;
  event.ts = ts;
  event.type = type;
  event.payload = std::move(payload);

  std::string error;
  if (log_.has_value() && !log_->Append(event, error)) {
    last_write_error_ = error;
  }
  events_.push_back(event);
  return event.seq;
}

std::vector<Event> Timeline::Events() const {
  std::lock_guard<std::mutex> lock(mu_);
  return events_;
}

std::uint64_t Timeline::LastSeq() const {
  std::lock_guard<std::mutex> lock(mu_);
  return next_seq_ - 1U;
}

std::string Timeline::LastWriteError() const {
  std::lock_guard<std::mutex> lock(mu_);
  return last_write_error_;
}

} // namespace tracr::events
