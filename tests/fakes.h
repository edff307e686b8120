#pragma once

// In-memory collaborators for driving the acquisition state machine in tests.

#include "djonline/network.h"
#include "djonline/presence.h"
#include "djonline/session_ui.h"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace djonline {
namespace fakes {

inline DeviceInfo MakeDevice(uint8_t number, const std::string& name, const std::string& ip) {
  DeviceInfo device;
  device.device_number = number;
  device.device_type = 0x01;
  device.device_name = name;
  device.ip_address = ip;
  return device;
}

inline NetworkInterface MakeInterface(const std::string& name,
                                      const std::vector<std::string>& cidrs,
                                      bool up = true,
                                      bool loopback = false) {
  NetworkInterface iface;
  iface.name = name;
  iface.display_name = name;
  iface.up = up;
  iface.loopback = loopback;
  for (const auto& cidr : cidrs) {
    const auto slash = cidr.find('/');
    InterfaceAddress address;
    address.address = cidr.substr(0, slash);
    address.prefix_length = std::stoi(cidr.substr(slash + 1));
    address.has_broadcast = true;
    iface.addresses.push_back(address);
  }
  return iface;
}

class FakeObserver : public DeviceObserver {
 public:
  bool Start() override {
    start_calls.fetch_add(1);
    return start_result;
  }

  // Devices become visible from the given 1-based poll onwards.
  void ShowDevicesFromPoll(int poll, std::vector<DeviceInfo> visible) {
    std::lock_guard<std::mutex> lock(mutex_);
    appear_at_ = poll;
    devices_ = std::move(visible);
  }

  std::vector<DeviceInfo> GetCurrentDevices() const override {
    const int poll = polls.fetch_add(1) + 1;
    std::lock_guard<std::mutex> lock(mutex_);
    if (appear_at_ > 0 && poll >= appear_at_) {
      return devices_;
    }
    return {};
  }

  std::string GetLastError() const override { return last_error; }

  bool start_result = true;
  std::string last_error;
  std::atomic<int> start_calls{0};
  mutable std::atomic<int> polls{0};

 private:
  mutable std::mutex mutex_;
  int appear_at_ = 0;
  std::vector<DeviceInfo> devices_;
};

class FakeClaimant : public PresenceClaimant {
 public:
  void SetUseStandardPlayerNumber(bool use_standard) override {
    use_standard_calls.push_back(use_standard);
  }

  bool Start() override {
    ++start_calls;
    if (!start_exception.empty()) {
      throw std::runtime_error(start_exception);
    }
    return start_result;
  }

  uint8_t GetDeviceNumber() const override { return start_result ? device_number : 0; }
  std::string GetLastError() const override { return last_error; }
  std::vector<NetworkInterface> GetMatchingInterfaces() const override { return matching; }
  std::vector<UnreachablePeer> FindUnreachablePeers() const override { return unreachable; }

  bool start_result = true;
  // Thrown from Start() when set.
  std::string start_exception;
  uint8_t device_number = 7;
  std::string last_error;
  std::vector<NetworkInterface> matching;
  std::vector<UnreachablePeer> unreachable;
  std::vector<bool> use_standard_calls;
  int start_calls = 0;
};

struct RecordedAlert {
  AlertKind kind;
  std::string title;
  std::string message;
};

class FakeUi : public SessionUi {
 public:
  IndicatorHandle ShowSearching(Action on_continue_offline, Action on_quit) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++searching_shown;
    continue_offline = std::move(on_continue_offline);
    quit = std::move(on_quit);
    return next_handle_++;
  }

  IndicatorHandle ShowTroubleshooting(const std::string& report,
                                      Action on_continue_offline,
                                      Action on_quit) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++troubleshooting_shown;
    reports.push_back(report);
    continue_offline = std::move(on_continue_offline);
    quit = std::move(on_quit);
    troubleshooting_handle = next_handle_++;
    return troubleshooting_handle;
  }

  void RefreshTroubleshooting(IndicatorHandle handle, const std::string& report) override {
    std::lock_guard<std::mutex> lock(mutex_);
    refreshed_handles.push_back(handle);
    reports.push_back(report);
  }

  void Dismiss(IndicatorHandle handle) override {
    std::lock_guard<std::mutex> lock(mutex_);
    dismissed.push_back(handle);
  }

  void Alert(AlertKind kind, const std::string& title, const std::string& message) override {
    std::lock_guard<std::mutex> lock(mutex_);
    alerts.push_back({kind, title, message});
  }

  Action continue_offline;
  Action quit;
  int searching_shown = 0;
  int troubleshooting_shown = 0;
  IndicatorHandle troubleshooting_handle = kNoIndicator;
  std::vector<std::string> reports;
  std::vector<IndicatorHandle> refreshed_handles;
  std::vector<IndicatorHandle> dismissed;
  std::vector<RecordedAlert> alerts;

 private:
  std::mutex mutex_;
  IndicatorHandle next_handle_ = 1;
};

}  // namespace fakes
}  // namespace djonline
