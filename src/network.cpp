#include "djonline/network.h"
#include "djonline/presence.h"

#include <algorithm>
#include <cstdint>
#include <utility>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

namespace djonline {
namespace {

constexpr const char* kNoIpv4Addresses = "No IPv4 addresses";

bool ParseIpv4(const std::string& text, uint32_t* out) {
  if (text.empty()) {
    return false;
  }
  in_addr addr{};
  if (inet_pton(AF_INET, text.c_str(), &addr) != 1) {
    return false;
  }
  *out = ntohl(addr.s_addr);
  return true;
}

std::string FormatIpv4(uint32_t host_order) {
  in_addr addr{};
  addr.s_addr = htonl(host_order);
  char buffer[INET_ADDRSTRLEN] = {0};
  if (inet_ntop(AF_INET, &addr, buffer, sizeof(buffer)) == nullptr) {
    return {};
  }
  return buffer;
}

uint32_t MaskFromPrefix(int prefix_length) {
  if (prefix_length <= 0) {
    return 0;
  }
  if (prefix_length >= 32) {
    return 0xffffffff;
  }
  return 0xffffffffu << (32 - prefix_length);
}

std::string SockaddrToString(const sockaddr* addr) {
  if (!addr || addr->sa_family != AF_INET) {
    return {};
  }
  const auto* in = reinterpret_cast<const sockaddr_in*>(addr);
  char buffer[INET_ADDRSTRLEN] = {0};
  if (inet_ntop(AF_INET, &in->sin_addr, buffer, sizeof(buffer)) == nullptr) {
    return {};
  }
  return buffer;
}

}  // namespace

std::vector<NetworkInterface> EnumerateInterfaces() {
  std::vector<NetworkInterface> result;
  ifaddrs* ifaddr = nullptr;
  if (getifaddrs(&ifaddr) != 0) {
    return result;
  }
  // getifaddrs() reports one entry per address; fold them per interface name
  // keeping the order in which interfaces first appear.
  for (ifaddrs* ifa = ifaddr; ifa; ifa = ifa->ifa_next) {
    if (!ifa->ifa_name) {
      continue;
    }
    auto it = std::find_if(result.begin(), result.end(),
                           [&](const NetworkInterface& iface) {
                             return iface.name == ifa->ifa_name;
                           });
    if (it == result.end()) {
      NetworkInterface iface;
      iface.name = ifa->ifa_name;
      iface.display_name = ifa->ifa_name;
      result.push_back(iface);
      it = result.end() - 1;
    }
    it->up = it->up || (ifa->ifa_flags & IFF_UP) != 0;
    it->loopback = it->loopback || (ifa->ifa_flags & IFF_LOOPBACK) != 0;

    if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) {
      continue;
    }
    InterfaceAddress address;
    address.address = SockaddrToString(ifa->ifa_addr);
    address.prefix_length =
        PrefixLengthFromNetmask(SockaddrToString(ifa->ifa_netmask));
    if (address.prefix_length < 0) {
      address.prefix_length = 0;
    }
    address.has_broadcast =
        (ifa->ifa_flags & IFF_BROADCAST) != 0 && ifa->ifa_broadaddr != nullptr;
    it->addresses.push_back(address);
  }
  freeifaddrs(ifaddr);
  return result;
}

std::string DescribeIpv4Addresses(const NetworkInterface& iface) {
  std::string summary;
  for (const auto& address : iface.addresses) {
    if (!address.has_broadcast) {
      continue;
    }
    if (!summary.empty()) {
      summary += ", ";
    }
    summary += address.address + "/" + std::to_string(address.prefix_length);
  }
  if (summary.empty()) {
    return kNoIpv4Addresses;
  }
  return summary;
}

std::string DescribeInterface(const NetworkInterface& iface) {
  const std::string& display_name =
      iface.display_name.empty() ? iface.name : iface.display_name;
  std::string description = display_name;
  if (display_name != iface.name) {
    description += " (" + iface.name + ")";
  }
  description += ": " + DescribeIpv4Addresses(iface);
  return description;
}

std::vector<std::string> DescribeInterfaces(const std::vector<NetworkInterface>& interfaces) {
  std::vector<std::string> descriptions;
  descriptions.reserve(interfaces.size());
  for (const auto& iface : interfaces) {
    descriptions.push_back(DescribeInterface(iface));
  }
  std::sort(descriptions.begin(), descriptions.end());
  return descriptions;
}

bool AddressInSubnet(const std::string& address,
                     const std::string& network,
                     int prefix_length) {
  uint32_t a = 0;
  uint32_t n = 0;
  if (!ParseIpv4(address, &a) || !ParseIpv4(network, &n)) {
    return false;
  }
  if (prefix_length < 0 || prefix_length > 32) {
    return false;
  }
  const uint32_t mask = MaskFromPrefix(prefix_length);
  return (a & mask) == (n & mask);
}

int PrefixLengthFromNetmask(const std::string& netmask) {
  uint32_t mask = 0;
  if (!ParseIpv4(netmask, &mask)) {
    return -1;
  }
  int length = 0;
  while (length < 32 && (mask & (0x80000000u >> length)) != 0) {
    ++length;
  }
  // Reject non-contiguous masks.
  if (mask != MaskFromPrefix(length)) {
    return -1;
  }
  return length;
}

std::string BroadcastAddress(const std::string& address, int prefix_length) {
  uint32_t a = 0;
  if (!ParseIpv4(address, &a) || prefix_length < 0 || prefix_length > 32) {
    return {};
  }
  return FormatIpv4(a | ~MaskFromPrefix(prefix_length));
}

NetworkDiagnostics::NetworkDiagnostics(InterfaceProvider provider)
    : provider_(std::move(provider)) {}

std::vector<NetworkInterface> NetworkDiagnostics::Interfaces() const {
  if (!provider_) {
    return {};
  }
  return provider_();
}

std::vector<std::string> NetworkDiagnostics::ListInterfaces() const {
  std::vector<NetworkInterface> candidates;
  for (const auto& iface : Interfaces()) {
    if (iface.up && !iface.loopback) {
      candidates.push_back(iface);
    }
  }
  return DescribeInterfaces(candidates);
}

std::vector<std::string> NetworkDiagnostics::ListConflictingInterfaces(
    const PresenceClaimant& claimant) const {
  const auto interfaces = claimant.GetMatchingInterfaces();
  if (interfaces.size() <= 1) {
    return {};
  }
  return DescribeInterfaces(interfaces);
}

}  // namespace djonline
