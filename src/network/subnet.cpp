#include "network/subnet.hpp"

#include <charconv>

namespace tracr::network {

namespace {

constexpr std::uint8_t kMinPrefixLength = 8U;

std::uint32_t MaskFor(const std::uint8_t prefix_length) {
  return prefix_length == 0U ? 0U : ~std::uint32_t{0} << (32U - prefix_length);
}

} // namespace

std::uint64_t Ipv4Subnet::HostCount() const {
  const std::uint64_t span = std::uint64_t{1} << (32U - prefix_length);
  return prefix_length >= 31U ? span : span - 2U;
}

std::uint32_t Ipv4Subnet::HostAt(const std::uint64_t index) const {
  const std::uint32_t offset = static_cast<std::uint32_t>(index);
  return prefix_length >= 31U ? base + offset : base + offset + 1U;
}

bool Ipv4Subnet::Contains(const std::uint32_t address) const {
  return (address & MaskFor(prefix_length)) == base;
}

bool ParseIpv4(std::string_view text, std::uint32_t& address) {
  std::uint32_t parsed = 0;
  std::size_t pos = 0;
  for (int octet = 0; octet < 4; ++octet) {
    if (octet > 0) {
      if (pos >= text.size() || text[pos] != '.') {
        return false;
      }
      ++pos;
    }
    const std::size_t start = pos;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      ++pos;
    }
    if (pos == start || pos - start > 3U) {
      return false;
    }
    unsigned value = 0;
    const auto [ptr, ec] = std::from_chars(text.data() + start, text.data() + pos, value);
    if (ec != std::errc() || ptr != text.data() + pos || value > 255U) {
      return false;
    }
    parsed = (parsed << 8U) | value;
  }
  if (pos != text.size()) {
    return false;
  }
  address = parsed;
  return true;
}

bool ParseCidr(std::string_view text, Ipv4Subnet& subnet, std::string& error) {
  error.clear();
  const std::size_t slash = text.find('/');
  const std::string_view address_text = text.substr(0, slash);
  std::uint32_t address = 0;
  if (!ParseIpv4(address_text, address)) {
    error = "invalid IPv4 address '" + std::string(address_text) + "'";
    return false;
  }

  unsigned prefix = 32U;
  if (slash != std::string_view::npos) {
    const std::string_view prefix_text = text.substr(slash + 1U);
    const auto [ptr, ec] =
        std::from_chars(prefix_text.data(), prefix_text.data() + prefix_text.size(), prefix);
    if (prefix_text.empty() || ec != std::errc() ||
        ptr != prefix_text.data() + prefix_text.size()) {
      error = "invalid prefix length in '" + std::string(text) + "'";
      return false;
    }
  }
  if (prefix < kMinPrefixLength || prefix > 32U) {
    error = "prefix length must be between /8 and /32, got /" + std::to_string(prefix);
    return false;
  }

  subnet.prefix_length = static_cast<std::uint8_t>(prefix);
  subnet.base = address & MaskFor(subnet.prefix_length);
  return true;
}

std::string FormatIpv4(const std::uint32_t address) {
  return std::to_string((address >> 24U) & 0xFFU) + "." + std::to_string((address >> 16U) & 0xFFU) +
         "." + std::to_string((address >> 8U) & 0xFFU) + "." + std::to_string(address & 0xFFU);
}

std::string FormatCidr(const Ipv4Subnet& subnet) {
  return FormatIpv4(subnet.base) + "/" + std::to_string(subnet.prefix_length);
}

} // namespace tracr::network
