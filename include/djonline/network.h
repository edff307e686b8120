#pragma once

#include <functional>
#include <string>
#include <vector>

namespace djonline {

class PresenceClaimant;

/**
 * One IPv4 address bound to a network interface.
 */
struct InterfaceAddress {
  /// Dotted-quad address.
  std::string address;
  /// Network prefix length (0-32).
  int prefix_length = 0;
  /// Whether the address has a broadcast address (IPv4 on a broadcast link).
  bool has_broadcast = false;
};

/**
 * Snapshot of a local network interface.
 */
struct NetworkInterface {
  /// Raw interface name (e.g. "eth0").
  std::string name;
  /// Human readable name; equal to the raw name on Linux.
  std::string display_name;
  bool up = false;
  bool loopback = false;
  std::vector<InterfaceAddress> addresses;
};

using InterfaceProvider = std::function<std::vector<NetworkInterface>()>;

/// Enumerate local interfaces using getifaddrs(). Returns empty on failure.
std::vector<NetworkInterface> EnumerateInterfaces();

/// Comma-joined "address/prefix" list of broadcast-capable addresses,
/// or "No IPv4 addresses".
std::string DescribeIpv4Addresses(const NetworkInterface& iface);

/// "display (raw): addresses"; the raw name is omitted when it matches the
/// display name.
std::string DescribeInterface(const NetworkInterface& iface);

/// Describe each interface and sort the descriptions.
std::vector<std::string> DescribeInterfaces(const std::vector<NetworkInterface>& interfaces);

/// Whether an IPv4 address lies inside network/prefix_length.
bool AddressInSubnet(const std::string& address,
                     const std::string& network,
                     int prefix_length);

/// Convert a dotted-quad netmask into a prefix length (-1 if invalid).
int PrefixLengthFromNetmask(const std::string& netmask);

/// Compute the directed broadcast address for address/prefix_length.
std::string BroadcastAddress(const std::string& address, int prefix_length);

/**
 * Read-only network troubleshooting helpers. Interface state is read fresh on
 * every call.
 */
class NetworkDiagnostics {
 public:
  explicit NetworkDiagnostics(InterfaceProvider provider = EnumerateInterfaces);

  /// Up, non-loopback interfaces rendered for troubleshooting, sorted.
  std::vector<std::string> ListInterfaces() const;

  /// Descriptions of the interfaces that saw DJ Link traffic, sorted, when
  /// there is more than one of them. Empty otherwise.
  std::vector<std::string> ListConflictingInterfaces(const PresenceClaimant& claimant) const;

  /// Current raw interface list from the provider.
  std::vector<NetworkInterface> Interfaces() const;

 private:
  InterfaceProvider provider_;
};

}  // namespace djonline
