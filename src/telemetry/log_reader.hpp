#pragma once

#include "telemetry/telemetry_entry.hpp"

#include <cstdint>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace tracr::telemetry {

struct IngestStats {
  std::uint64_t lines = 0;
  std::uint64_t accepted = 0;
  std::uint64_t malformed = 0;
  std::uint64_t foreign = 0;
};

// Lazy, finite sequence of entries parsed line-by-line from a log stream.
// Malformed and foreign lines are skipped and counted, never fatal.
class TelemetryLineReader {
public:
  TelemetryLineReader(std::istream& in, IngestContext context);

  // Returns false at end of stream.
  bool Next(TelemetryEntry& entry);

  const IngestStats& stats() const {
    return stats_;
  }

private:
  std::istream& in_;
  IngestContext context_;
  IngestStats stats_;
};

// Parses every complete line of `text`; a trailing partial line is left
// unconsumed and its length reported through `consumed_bytes`.
void IngestText(std::string_view text, const IngestContext& context,
                std::vector<TelemetryEntry>& entries, IngestStats& stats,
                std::size_t& consumed_bytes);

} // namespace tracr::telemetry
