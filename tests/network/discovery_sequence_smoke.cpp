#include "common/assertions.hpp"
#include "common/sim_lan.hpp"

#include "network/discovery.hpp"
#include "network/subnet.hpp"

#include <string>
#include <vector>

using tracr::tests::common::AssertTrue;
using tracr::tests::common::Fail;

int main() {
  tracr::network::Ipv4Subnet subnet;
  std::string error;

  if (!tracr::network::ParseCidr("192.168.7.77/24", subnet, error)) {
    Fail("valid CIDR rejected: " + error);
  }
  AssertTrue(tracr::network::FormatCidr(subnet) == "192.168.7.0/24", "base should be masked");
  AssertTrue(subnet.HostCount() == 254U, "/24 has 254 probe-able hosts");
  AssertTrue(tracr::network::FormatIpv4(subnet.HostAt(0)) == "192.168.7.1", "first host");
  AssertTrue(tracr::network::FormatIpv4(subnet.HostAt(253)) == "192.168.7.254", "last host");

  AssertTrue(tracr::network::ParseCidr("10.1.2.3", subnet, error) && subnet.HostCount() == 1U,
             "bare address is a /32");
  AssertTrue(tracr::network::ParseCidr("10.1.2.0/31", subnet, error) && subnet.HostCount() == 2U,
             "/31 keeps both addresses");
  AssertTrue(!tracr::network::ParseCidr("10.1.2.0/7", subnet, error), "/7 is too wide");
  AssertTrue(!tracr::network::ParseCidr("10.1.2/24", subnet, error), "three octets rejected");
  AssertTrue(!tracr::network::ParseCidr("10.1.2.300/24", subnet, error), "octet range checked");
  AssertTrue(!tracr::network::ParseCidr("10.1.2.0/abc", subnet, error), "prefix must be numeric");

  const std::string arp =
      "IP address       HW type     Flags       HW address            Mask     Device\n"
      "192.168.7.20     0x1         0x2         dc:a6:32:aa:bb:cc     *        eth0\n"
      "192.168.7.21     0x1         0x0         00:00:00:00:00:00     *        eth0\n";
  std::string mac;
  AssertTrue(tracr::network::LookupArpEntry(arp, "192.168.7.20", mac) &&
                 mac == "dc:a6:32:aa:bb:cc",
             "complete ARP entry should resolve");
  AssertTrue(!tracr::network::LookupArpEntry(arp, "192.168.7.21", mac),
             "incomplete ARP entry should not resolve");
  AssertTrue(!tracr::network::LookupArpEntry(arp, "192.168.7.2", mac),
             "prefix of another address must not match");

  tracr::remote::sim::SimNetwork network;
  tracr::remote::sim::SimHostSpec board;
  board.mac = "DC:A6:32:00:00:05";
  board.hostname = "pi-five";
  network.AddHost("192.168.7.5", board);
  tracr::remote::sim::SimHostSpec offline;
  offline.reachable = false;
  network.AddHost("192.168.7.6", offline);
  network.AddHost("192.168.7.9", tracr::remote::sim::SimHostSpec{});

  if (!tracr::network::ParseCidr("192.168.7.0/28", subnet, error)) {
    Fail("valid /28 rejected: " + error);
  }
  tracr::tests::common::SimNetworkProber prober(network);
  tracr::network::DiscoverySequence sequence(subnet, prober);

  // Lazy: nothing is probed until the first Next.
  AssertTrue(prober.probed().empty(), "sequence should not probe on construction");

  tracr::registry::Device candidate;
  AssertTrue(sequence.Next(candidate), "first candidate expected");
  AssertTrue(candidate.host == "192.168.7.5", "first live host");
  AssertTrue(candidate.mac == "dc:a6:32:00:00:05", "MAC should be normalized");
  AssertTrue(candidate.name == "pi-five", "hostname becomes the alias");
  AssertTrue(candidate.role == tracr::registry::DeviceRole::kParticipant, "participant role");
  AssertTrue(candidate.state == tracr::registry::ConfigState::kUnconfigured,
             "candidates are unconfigured");
  AssertTrue(sequence.probed() == 5U, "probing stops at the first live host");

  AssertTrue(sequence.Next(candidate) && candidate.host == "192.168.7.9",
             "offline host is skipped");
  AssertTrue(!sequence.Next(candidate), "sequence is finite");
  AssertTrue(sequence.probed() == 14U, "/28 has 14 hosts");
  AssertTrue(!sequence.Next(candidate), "exhausted sequence stays exhausted");

  sequence.Restart();
  AssertTrue(sequence.Next(candidate) && candidate.host == "192.168.7.5",
             "restart walks the subnet again");
  return 0;
}
