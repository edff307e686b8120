#pragma once

#include "djonline/network.h"

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace djonline {

/**
 * Well-known DJ Link UDP port carrying keep-alive announcements.
 */
constexpr uint16_t kAnnouncePort = 50000;

constexpr uint8_t kDeviceNameLength = 20;

/**
 * A device seen on the DJ Link network.
 */
struct DeviceInfo {
  /// Player/device number reported in keep-alive.
  uint8_t device_number = 0;
  /// Device type byte reported in keep-alive (raw value).
  uint8_t device_type = 0;
  /// Device name field (trimmed ASCII).
  std::string device_name;
  /// IP address reported by the device.
  std::string ip_address;
  /// MAC address reported by the device.
  std::array<uint8_t, 6> mac_address = {0, 0, 0, 0, 0, 0};
  /// Last time a packet was observed from this device.
  std::chrono::steady_clock::time_point last_seen;
};

/**
 * A device that was visible during discovery but lies outside the subnet of
 * the interface the presence was claimed on.
 */
struct UnreachablePeer {
  std::string name;
  std::string address;
};

/**
 * Passive listener that tracks which devices are currently visible.
 */
class DeviceObserver {
 public:
  virtual ~DeviceObserver() = default;

  /// Start listening. Starting an already running observer is a no-op.
  virtual bool Start() = 0;
  /// Non-blocking snapshot of the devices currently visible.
  virtual std::vector<DeviceInfo> GetCurrentDevices() const = 0;
  /// Return the last Start() error message, if any.
  virtual std::string GetLastError() const = 0;
};

/**
 * Something that can establish a virtual presence on the DJ Link network.
 */
class PresenceClaimant {
 public:
  virtual ~PresenceClaimant() = default;

  /// Choose between a real player number (1-4) and a virtual one.
  virtual void SetUseStandardPlayerNumber(bool use_standard) = 0;
  /// Establish the presence. On failure GetLastError() explains why.
  virtual bool Start() = 0;
  /// Player number claimed by the last successful Start().
  virtual uint8_t GetDeviceNumber() const = 0;
  /// Return the last Start() error message, if any.
  virtual std::string GetLastError() const = 0;
  /// Interfaces on which DJ Link traffic was observed.
  virtual std::vector<NetworkInterface> GetMatchingInterfaces() const = 0;
  /// Visible devices that cannot be reached from the claimed interface.
  virtual std::vector<UnreachablePeer> FindUnreachablePeers() const = 0;
};

}  // namespace djonline
