#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace tracr::events {

// Timeline categories written to `events.jsonl`. Serialized names are
// stable; run inspection and tests match on them.
enum class EventType {
  kRunStarted,
  kWaveStarted,
  kWaveGateOpened,
  kWaveCancelled,
  kBindingTransition,
  kTelemetryCollected,
  kAbortRequested,
  kStopUnconfirmed,
  kRunFinished,
  kWarning,
};

// One timeline entry. `seq` is allocated by the timeline and orders events
// across all device workers of a run; `ts` is wall-clock time.
struct Event {
  std::uint64_t seq = 0;
  std::chrono::system_clock::time_point ts{};
  EventType type = EventType::kWarning;
  std::map<std::string, std::string> payload;
};

std::string_view EventTypeName(EventType type);

// {"seq":..,"ts_utc":"..","type":"..","payload":{..}} with payload keys sorted.
std::string ToJson(const Event& event);

} // namespace tracr::events
