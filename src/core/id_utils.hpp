#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace tracr::core {

// Random RFC 4122 version-4 UUID in canonical lowercase form.
std::string MakeUuidV4();

bool IsUuid(std::string_view text);

// Sortable run identifier: `run-<YYYYmmddTHHMMSS>-<8 hex>`.
std::string MakeRunId(std::chrono::system_clock::time_point now);

} // namespace tracr::core
