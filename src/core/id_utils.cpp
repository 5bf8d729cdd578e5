#include "core/id_utils.hpp"

#include <cctype>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace tracr::core {

namespace {

std::uint64_t NextRandom64() {
  static std::mutex mu;
  static std::mt19937_64 engine{std::random_device{}()};
  std::lock_guard<std::mutex> lock(mu);
  return engine();
}

} // namespace

std::string MakeUuidV4() {
  std::uint64_t hi = NextRandom64();
  std::uint64_t lo = NextRandom64();
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  std::ostringstream out;
  out << std::hex << std::setfill('0') << std::setw(8) << (hi >> 32U) << '-' << std::setw(4)
      << ((hi >> 16U) & 0xFFFFU) << '-' << std::setw(4) << (hi & 0xFFFFU) << '-' << std::setw(4)
      << (lo >> 48U) << '-' << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
  return out.str();
}

bool IsUuid(std::string_view text) {
  if (text.size() != 36U) {
    return false;
  }
  for (std::size_t i = 0; i < text.size(); ++i) {
    const bool dash_slot = i == 8U || i == 13U || i == 18U || i == 23U;
    if (dash_slot) {
      if (text[i] != '-') {
        return false;
      }
    } else if (std::isxdigit(static_cast<unsigned char>(text[i])) == 0) {
      return false;
    }
  }
  return true;
}

std::string MakeRunId(std::chrono::system_clock::time_point now) {
  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(now);
  std::tm utc_time{};
  gmtime_r(&epoch_seconds, &utc_time);

  std::ostringstream out;
  out << "run-" << std::put_time(&utc_time, "%Y%m%dT%H%M%S") << '-' << std::hex
      << std::setw(8) << std::setfill('0') << (NextRandom64() & 0xFFFFFFFFULL);
  return out.str();
}

} // namespace tracr::core
