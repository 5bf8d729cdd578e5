#include "telemetry/log_reader.hpp"

namespace tracr::telemetry {

namespace {

void Count(LineOutcome outcome, IngestStats& stats) {
  switch (outcome) {
  case LineOutcome::kAccepted:
    ++stats.accepted;
    break;
  case LineOutcome::kMalformed:
    ++stats.malformed;
    break;
  case LineOutcome::kForeign:
    ++stats.foreign;
    break;
  case LineOutcome::kEmpty:
    break;
  }
}

} // namespace

TelemetryLineReader::TelemetryLineReader(std::istream& in, IngestContext context)
    : in_(in), context_(std::move(context)) {}

bool TelemetryLineReader::Next(TelemetryEntry& entry) {
  std::string line;
  while (std::getline(in_, line)) {
    ++stats_.lines;
    const LineOutcome outcome = ParseTelemetryLine(line, context_, entry);
    Count(outcome, stats_);
    if (outcome == LineOutcome::kAccepted) {
      return true;
    }
  }
  return false;
}

void IngestText(std::string_view text, const IngestContext& context,
                std::vector<TelemetryEntry>& entries, IngestStats& stats,
                std::size_t& consumed_bytes) {
  consumed_bytes = 0;
  while (consumed_bytes < text.size()) {
    const std::size_t newline = text.find('\n', consumed_bytes);
    if (newline == std::string_view::npos) {
      break;
    }
    const std::string_view line = text.substr(consumed_bytes, newline - consumed_bytes);
    consumed_bytes = newline + 1U;
    ++stats.lines;
    TelemetryEntry entry;
    const LineOutcome outcome = ParseTelemetryLine(line, context, entry);
    Count(outcome, stats);
    if (outcome == LineOutcome::kAccepted) {
      entries.push_back(std::move(entry));
    }
  }
}

} // namespace tracr::telemetry
