#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace tracr::core {

// POSIX `cksum` digest: CRC-32 (polynomial 0x04C11DB7, MSB first) over the
// data followed by its length, then inverted. Matching the coreutils output
// lets a transfer be verified against `cksum <path>` on the remote side.
struct CksumDigest {
  std::uint32_t crc = 0;
  std::uint64_t size_bytes = 0;

  bool operator==(const CksumDigest& other) const {
    return crc == other.crc && size_bytes == other.size_bytes;
  }
  bool operator!=(const CksumDigest& other) const {
    return !(*this == other);
  }
};

CksumDigest ComputeCksum(std::string_view data);

bool ComputeFileCksum(const std::filesystem::path& path, CksumDigest& digest, std::string& error);

// Parses the first line of `cksum` output: "<crc> <size> [name]".
bool ParseCksumOutput(std::string_view output, CksumDigest& digest);

std::string ToString(const CksumDigest& digest);

} // namespace tracr::core
