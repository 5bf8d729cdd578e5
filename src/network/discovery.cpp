#include "network/discovery.hpp"

#include "core/fs_utils.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>

namespace tracr::network {

namespace {

// Closes the probe socket on every return path.
class SocketGuard {
public:
  explicit SocketGuard(int fd) : fd_(fd) {}
  ~SocketGuard() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }
  SocketGuard(const SocketGuard&) = delete;
  SocketGuard& operator=(const SocketGuard&) = delete;

  int get() const {
    return fd_;
  }

private:
  int fd_;
};

bool ConnectWithTimeout(const sockaddr_in& target, const std::chrono::milliseconds timeout) {
  SocketGuard sock(::socket(AF_INET, SOCK_STREAM, 0));
  if (sock.get() < 0) {
    return false;
  }
  const int flags = ::fcntl(sock.get(), F_GETFL, 0);
  if (flags < 0 || ::fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
    return false;
  }

  const int rc =
      ::connect(sock.get(), reinterpret_cast<const sockaddr*>(&target), sizeof(target));
  if (rc == 0) {
    return true;
  }
  if (errno != EINPROGRESS) {
    return false;
  }

  pollfd pfd{};
  pfd.fd = sock.get();
  pfd.events = POLLOUT;
  if (::poll(&pfd, 1, static_cast<int>(timeout.count())) <= 0) {
    return false;
  }
  int so_error = 0;
  socklen_t len = sizeof(so_error);
  if (::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
    return false;
  }
  return so_error == 0;
}

std::string ReverseLookup(const sockaddr_in& target) {
  char host[NI_MAXHOST] = {};
  if (::getnameinfo(reinterpret_cast<const sockaddr*>(&target), sizeof(target), host,
                    sizeof(host), nullptr, 0, NI_NAMEREQD) != 0) {
    return {};
  }
  return host;
}

} // namespace

TcpPortProber::TcpPortProber(std::uint16_t port, std::chrono::milliseconds timeout,
                             std::filesystem::path arp_table)
    : port_(port), timeout_(timeout), arp_table_(std::move(arp_table)) {}

ProbeResult TcpPortProber::Probe(const std::string& address) {
  ProbeResult result;
  sockaddr_in target{};
  target.sin_family = AF_INET;
  target.sin_port = htons(port_);
  if (::inet_pton(AF_INET, address.c_str(), &target.sin_addr) != 1) {
    return result;
  }
  if (!ConnectWithTimeout(target, timeout_)) {
    return result;
  }
  result.alive = true;

  std::string table;
  std::string read_error;
  if (core::ReadTextFile(arp_table_, table, read_error)) {
    (void)LookupArpEntry(table, address, result.mac);
  }
  result.hostname = ReverseLookup(target);
  return result;
}

bool LookupArpEntry(std::string_view arp_table_text, std::string_view address, std::string& mac) {
  std::istringstream lines{std::string(arp_table_text)};
  std::string line;
  while (std::getline(lines, line)) {
    std::istringstream fields(line);
    std::string ip;
    std::string hw_type;
    std::string flags;
    std::string hw_address;
    if (!(fields >> ip >> hw_type >> flags >> hw_address)) {
      continue;
    }
    if (ip != address) {
      continue;
    }
    if (flags == "0x0" || hw_address == "00:00:00:00:00:00") {
      return false;
    }
    mac = registry::NormalizeMac(hw_address);
    return true;
  }
  return false;
}

DiscoverySequence::DiscoverySequence(Ipv4Subnet subnet, IHostProber& prober)
    : subnet_(subnet), prober_(prober) {}

bool DiscoverySequence::Next(registry::Device& candidate) {
  const std::uint64_t total = subnet_.HostCount();
  while (cursor_ < total) {
    const std::string address = FormatIpv4(subnet_.HostAt(cursor_));
    ++cursor_;
    const ProbeResult probe = prober_.Probe(address);
    if (!probe.alive) {
      continue;
    }
    registry::Device device;
    device.host = address;
    device.mac = probe.mac.empty() ? std::string{} : registry::NormalizeMac(probe.mac);
    device.name = probe.hostname;
    device.role = registry::DeviceRole::kParticipant;
    device.state = registry::DeriveConfigState(device);
    candidate = std::move(device);
    return true;
  }
  return false;
}

void DiscoverySequence::Restart() {
  cursor_ = 0;
}

} // namespace tracr::network
