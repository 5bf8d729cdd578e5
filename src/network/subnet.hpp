#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace tracr::network {

// IPv4 network in CIDR form. `base` is already masked.
struct Ipv4Subnet {
  std::uint32_t base = 0;
  std::uint8_t prefix_length = 32;

  // Probe-able host addresses: network and broadcast addresses are excluded
  // for prefixes shorter than /31.
  std::uint64_t HostCount() const;
  std::uint32_t HostAt(std::uint64_t index) const;
  bool Contains(std::uint32_t address) const;
};

// Accepts `a.b.c.d/nn` with nn in [8, 32]; a bare address is a /32.
bool ParseCidr(std::string_view text, Ipv4Subnet& subnet, std::string& error);
bool ParseIpv4(std::string_view text, std::uint32_t& address);
std::string FormatIpv4(std::uint32_t address);
std::string FormatCidr(const Ipv4Subnet& subnet);

} // namespace tracr::network
