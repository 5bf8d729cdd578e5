#include "core/checksum.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <fstream>

namespace tracr::core {

namespace {

constexpr std::uint32_t kCksumPolynomial = 0x04C11DB7U;

constexpr std::array<std::uint32_t, 256> BuildCksumTable() {
  std::array<std::uint32_t, 256> table{};
  for (std::uint32_t i = 0; i < 256U; ++i) {
    std::uint32_t c = i << 24U;
    for (int bit = 0; bit < 8; ++bit) {
      c = (c & 0x80000000U) != 0U ? (c << 1U) ^ kCksumPolynomial : (c << 1U);
    }
    table[i] = c;
  }
  return table;
}

constexpr std::array<std::uint32_t, 256> kCksumTable = BuildCksumTable();

class CksumAccumulator {
public:
  void Update(const char* data, std::size_t size) {
    for (std::size_t i = 0; i < size; ++i) {
      const auto byte = static_cast<unsigned char>(data[i]);
      crc_ = (crc_ << 8U) ^ kCksumTable[((crc_ >> 24U) ^ byte) & 0xFFU];
    }
    size_ += size;
  }

  CksumDigest Finish() const {
    std::uint32_t crc = crc_;
    for (std::uint64_t length = size_; length != 0U; length >>= 8U) {
      crc = (crc << 8U) ^ kCksumTable[((crc >> 24U) ^ (length & 0xFFU)) & 0xFFU];
    }
    return CksumDigest{.crc = ~crc, .size_bytes = size_};
  }

private:
  std::uint32_t crc_ = 0;
  std::uint64_t size_ = 0;
};

} // namespace

CksumDigest ComputeCksum(std::string_view data) {
  CksumAccumulator accumulator;
  accumulator.Update(data.data(), data.size());
  return accumulator.Finish();
}

bool ComputeFileCksum(const std::filesystem::path& path, CksumDigest& digest, std::string& error) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "unable to open file for checksum: " + path.string();
    return false;
  }

  CksumAccumulator accumulator;
  char buffer[8192];
  while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
    accumulator.Update(buffer, static_cast<std::size_t>(input.gcount()));
  }
  if (input.bad()) {
    error = "failed while reading file for checksum: " + path.string();
    return false;
  }

  digest = accumulator.Finish();
  return true;
}

bool ParseCksumOutput(std::string_view output, CksumDigest& digest) {
  std::size_t pos = 0;
  while (pos < output.size() && std::isspace(static_cast<unsigned char>(output[pos])) != 0) {
    ++pos;
  }

  const char* begin = output.data() + pos;
  const char* end = output.data() + output.size();
  std::uint32_t crc = 0;
  auto [crc_end, crc_ec] = std::from_chars(begin, end, crc);
  if (crc_ec != std::errc() || crc_end == end || *crc_end != ' ') {
    return false;
  }

  std::uint64_t size = 0;
  auto [size_end, size_ec] = std::from_chars(crc_end + 1, end, size);
  if (size_ec != std::errc()) {
    return false;
  }
  if (size_end != end && *size_end != ' ' && *size_end != '\n' && *size_end != '\r') {
    return false;
  }

  digest.crc = crc;
  digest.size_bytes = size;
  return true;
}

std::string ToString(const CksumDigest& digest) {
  return std::to_string(digest.crc) + " " + std::to_string(digest.size_bytes);
}

} // namespace tracr::core
