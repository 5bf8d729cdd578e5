#pragma once

#include "network/subnet.hpp"
#include "registry/device_model.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace tracr::network {

struct ProbeResult {
  bool alive = false;
  std::string mac;
  std::string hostname;
};

// Seam between the discovery walk and the network. Production probes TCP;
// tests substitute a scripted prober.
class IHostProber {
public:
  virtual ~IHostProber() = default;

  virtual ProbeResult Probe(const std::string& address) = 0;
};

// Treats a host as a candidate when its SSH port accepts a TCP connection
// within `timeout`. MAC comes from the kernel ARP cache populated by that
// connection attempt; the hostname from reverse DNS.
class TcpPortProber final : public IHostProber {
public:
  explicit TcpPortProber(std::uint16_t port = 22,
                         std::chrono::milliseconds timeout = std::chrono::milliseconds(100),
                         std::filesystem::path arp_table = "/proc/net/arp");

  ProbeResult Probe(const std::string& address) override;

private:
  std::uint16_t port_;
  std::chrono::milliseconds timeout_;
  std::filesystem::path arp_table_;
};

// Finds `address` in /proc/net/arp text. Incomplete entries (all-zero MAC)
// do not count.
bool LookupArpEntry(std::string_view arp_table_text, std::string_view address, std::string& mac);

// Lazy, finite, restartable walk over a subnet. Each `Next` probes hosts
// until one answers; the registry is never touched.
class DiscoverySequence {
public:
  DiscoverySequence(Ipv4Subnet subnet, IHostProber& prober);

  // Fills `candidate` with an unconfigured participant and returns true, or
  // returns false once the subnet is exhausted.
  bool Next(registry::Device& candidate);

  void Restart();

  std::uint64_t probed() const {
    return cursor_;
  }

  const Ipv4Subnet& subnet() const {
    return subnet_;
  }

private:
  Ipv4Subnet subnet_;
  IHostProber& prober_;
  std::uint64_t cursor_ = 0;
};

} // namespace tracr::network
