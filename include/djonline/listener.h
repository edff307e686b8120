#pragma once

#include "djonline/log.h"
#include "djonline/presence.h"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace djonline {

class KeepAliveListener;

#ifdef DJONLINE_TESTING
namespace test {
void InjectPacket(KeepAliveListener& listener,
                  const std::vector<uint8_t>& packet,
                  const std::string& source_address);
void SetDeviceLastSeen(KeepAliveListener& listener,
                       uint8_t device_number,
                       std::chrono::steady_clock::time_point when);
void PruneDevices(KeepAliveListener& listener,
                  std::chrono::steady_clock::time_point now);
size_t GetDeviceRecordCount(KeepAliveListener& listener);
}  // namespace test
#endif

/**
 * A device joining or leaving the set of visible devices.
 */
enum class DeviceEventType {
  kSeen,
  kExpired,
};

struct DeviceEvent {
  DeviceEventType type = DeviceEventType::kSeen;
  DeviceInfo device;
};

/**
 * Lightweight counters for packet flow and error reporting.
 */
struct ListenerMetrics {
  uint64_t packets_received = 0;
  uint64_t parse_errors = 0;
  uint64_t ignored_packets = 0;
  uint64_t callback_exceptions = 0;
};

/**
 * Listener configuration.
 */
struct ListenerConfig {
  /// Local bind address for the announcement socket (usually 0.0.0.0).
  std::string bind_address = "0.0.0.0";
  /// Device timeout for discovery pruning.
  std::chrono::milliseconds device_timeout{4000};
  /// How often to check for device expiry.
  std::chrono::milliseconds device_prune_interval{1000};
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
 * Watches UDP port 50000 for keep-alive announcements and keeps the set of
 * devices currently visible on the network.
 */
class KeepAliveListener : public DeviceObserver {
 public:
  using DeviceEventCallback = std::function<void(const DeviceEvent&)>;

  explicit KeepAliveListener(ListenerConfig config);
  /// Stop background threads and close the socket.
  ~KeepAliveListener() override;

  KeepAliveListener(const KeepAliveListener&) = delete;
  KeepAliveListener& operator=(const KeepAliveListener&) = delete;

  /// Open the socket and start background threads. No-op when running.
  bool Start() override;
  /// Stop background threads and close the socket.
  void Stop();
  bool IsRunning() const;

  /// Set callback invoked when a device appears or expires.
  void SetDeviceEventCallback(DeviceEventCallback cb);

  /// Drop packets from this address (our own announcements).
  void AddIgnoredAddress(const std::string& address);
  void RemoveIgnoredAddress(const std::string& address);

  std::vector<DeviceInfo> GetCurrentDevices() const override;
  std::string GetLastError() const override;
  ListenerMetrics GetMetrics() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

#ifdef DJONLINE_TESTING
  friend void test::InjectPacket(KeepAliveListener& listener,
                                 const std::vector<uint8_t>& packet,
                                 const std::string& source_address);
  friend void test::SetDeviceLastSeen(KeepAliveListener& listener,
                                      uint8_t device_number,
                                      std::chrono::steady_clock::time_point when);
  friend void test::PruneDevices(KeepAliveListener& listener,
                                 std::chrono::steady_clock::time_point now);
  friend size_t test::GetDeviceRecordCount(KeepAliveListener& listener);
#endif
};

}  // namespace djonline
