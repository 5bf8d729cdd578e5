#include "events/event_model.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

namespace tracr::events {

std::string_view EventTypeName(EventType type) {
  switch (type) {
  case EventType::kRunStarted:
    return "run_started";
  case EventType::kWaveStarted:
    return "wave_started";
  case EventType::kWaveGateOpened:
    return "wave_gate_opened";
  case EventType::kWaveCancelled:
    return "wave_cancelled";
  case EventType::kBindingTransition:
    return "binding_transition";
  case EventType::kTelemetryCollected:
    return "telemetry_collected";
  case EventType::kAbortRequested:
    return "abort_requested";
  case EventType::kStopUnconfirmed:
    return "stop_unconfirmed";
  case EventType::kRunFinished:
    return "run_finished";
  case EventType::kWarning:
    return "warning";
  }
  return "unknown";
}

std::string ToJson(const Event& event) {
  core::JsonObjectWriter payload;
  for (const auto& [key, value] : event.payload) {
    payload.String(key, value);
  }
  return core::JsonObjectWriter()
      .UInt("seq", event.seq)
      .String("ts_utc", core::FormatUtcTimestamp(event.ts))
      .String("type", EventTypeName(event.type))
      .Raw("payload", payload.Finish())
      .Finish();
}

} // namespace tracr::events
