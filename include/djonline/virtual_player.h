#pragma once

#include "djonline/log.h"
#include "djonline/network.h"
#include "djonline/presence.h"

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace djonline {

class KeepAliveListener;

/// Highest player number a real CDJ may use.
constexpr uint8_t kMaxStandardPlayerNumber = 4;
/// First and last player numbers used when not posing as a real player.
constexpr uint8_t kFirstVirtualPlayerNumber = 7;
constexpr uint8_t kLastVirtualPlayerNumber = 15;

/**
 * Virtual player configuration.
 */
struct VirtualPlayerConfig {
  /// Device name used in announce packets (ASCII, padded to 20 bytes).
  std::string device_name = "djonline";
  /// Device type byte (0x01 CDJ, 0x03 Mixer, 0x04 Rekordbox).
  uint8_t device_type = 0x01;
  /// MAC address used in announce packets.
  std::array<uint8_t, 6> mac_address = {0, 0, 0, 0, 0, 0};
  /// Local bind address for the announce socket.
  std::string bind_address = "0.0.0.0";
  /// Announce interval in milliseconds (keep-alives ~1500 ms).
  int announce_interval_ms = 1500;
  /// Enable opening the announce socket and sending keep-alives.
  bool send_announces = true;
  /// Source of local interface information.
  InterfaceProvider interface_provider = EnumerateInterfaces;
  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;

  /**
   * Validate configuration values.
   *
   * @param error Optional output string describing the first validation error.
   * @return true if the configuration is valid.
   */
  bool Validate(std::string* error = nullptr) const;
};

/**
 * Claims a player number on the network the listener found devices on and
 * announces itself there.
 */
class VirtualPlayer : public PresenceClaimant {
 public:
  /// The listener must outlive the player.
  VirtualPlayer(VirtualPlayerConfig config, KeepAliveListener& listener);
  ~VirtualPlayer() override;

  VirtualPlayer(const VirtualPlayer&) = delete;
  VirtualPlayer& operator=(const VirtualPlayer&) = delete;

  void SetUseStandardPlayerNumber(bool use_standard) override;
  bool GetUseStandardPlayerNumber() const;

  /// Pick an interface and player number and start announcing.
  bool Start() override;
  /// Stop announcing. No-op when not running.
  void Stop();
  bool IsRunning() const;

  uint8_t GetDeviceNumber() const override;
  std::string GetLastError() const override;
  /// Address claimed on the local interface, empty when not running.
  std::string GetLocalAddress() const;
  /// Directed broadcast address of the claimed interface.
  std::string GetBroadcastAddress() const;

  std::vector<NetworkInterface> GetMatchingInterfaces() const override;
  std::vector<UnreachablePeer> FindUnreachablePeers() const override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace djonline
