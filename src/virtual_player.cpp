#include "djonline/virtual_player.h"
#include "djonline/listener.h"

#include "wire.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <set>
#include <sstream>
#include <thread>

namespace djonline {

bool VirtualPlayerConfig::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (device_name.empty()) {
    return fail("device_name must not be empty");
  }
  if (announce_interval_ms <= 0) {
    return fail("announce_interval_ms must be positive");
  }
  if (!interface_provider) {
    return fail("interface_provider must be set");
  }
  return true;
}

struct VirtualPlayer::Impl {
  Impl(VirtualPlayerConfig config, KeepAliveListener& listener)
      : config_(std::move(config)), listener_(listener) {}

  void SetUseStandardPlayerNumber(bool use_standard) {
    use_standard_.store(use_standard);
  }

  bool GetUseStandardPlayerNumber() const { return use_standard_.load(); }

  bool Start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_) {
      return true;
    }
    SetLastError({});
    std::string error;
    if (!config_.Validate(&error)) {
      return Fail(error);
    }

    const auto devices = listener_.GetCurrentDevices();
    if (devices.empty()) {
      return Fail("No DJ Link devices found, cannot choose a network");
    }
    const DeviceInfo& target = devices.front();

    // Every interface with an address on the same subnet as the first device
    // saw its traffic; the first of them becomes ours.
    std::vector<NetworkInterface> matching;
    InterfaceAddress local;
    std::string local_interface;
    for (const auto& iface : config_.interface_provider()) {
      if (!iface.up || iface.loopback) {
        continue;
      }
      for (const auto& address : iface.addresses) {
        if (!AddressInSubnet(target.ip_address, address.address, address.prefix_length)) {
          continue;
        }
        if (local_interface.empty()) {
          local = address;
          local_interface = iface.name;
        }
        matching.push_back(iface);
        break;
      }
    }
    if (matching.empty()) {
      return Fail("No network interface shares a subnet with " +
                  target.device_name + " (" + target.ip_address + ")");
    }

    const uint8_t number = ChooseDeviceNumber(devices);
    if (number == 0) {
      return Fail(use_standard_ ? "No unused standard player number (1-4) available"
                                : "No unused virtual player number available");
    }

    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      matching_interfaces_ = matching;
      local_address_ = local.address;
      prefix_length_ = local.prefix_length;
      broadcast_address_ = BroadcastAddress(local.address, local.prefix_length);
    }
    device_number_ = number;

    if (config_.send_announces) {
      std::string error;
      if (!socket_.Bind(config_.bind_address, 0, &error)) {
        ClearClaim();
        return Fail(error);
      }
      listener_.AddIgnoredAddress(local.address);
      stopping_ = false;
      try {
        announce_thread_ = std::thread([this]() { AnnounceLoop(); });
      } catch (const std::exception& ex) {
        listener_.RemoveIgnoredAddress(local.address);
        socket_.Close();
        ClearClaim();
        return Fail(std::string("thread start failed: ") + ex.what());
      }
    }
    running_ = true;

    std::ostringstream oss;
    oss << "Claimed player number " << +number << " on " << local_interface
        << " (" << local.address << "/" << local.prefix_length << ")";
    Log(oss.str(), config_.log_callback);
    return true;
  }

  void Stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (!running_.exchange(false)) {
      return;
    }
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      stopping_ = true;
    }
    stop_cv_.notify_all();
    if (announce_thread_.joinable()) {
      announce_thread_.join();
    }
    socket_.Close();
    const std::string local = GetLocalAddress();
    if (config_.send_announces && !local.empty()) {
      listener_.RemoveIgnoredAddress(local);
    }
    ClearClaim();
  }

  bool IsRunning() const { return running_; }

  uint8_t GetDeviceNumber() const { return device_number_; }

  std::string GetLastError() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_error_;
  }

  std::string GetLocalAddress() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return local_address_;
  }

  std::string GetBroadcastAddress() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return broadcast_address_;
  }

  std::vector<NetworkInterface> GetMatchingInterfaces() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return matching_interfaces_;
  }

  std::vector<UnreachablePeer> FindUnreachablePeers() const {
    std::string local;
    int prefix = 0;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      local = local_address_;
      prefix = prefix_length_;
    }
    std::vector<UnreachablePeer> result;
    if (!running_ || local.empty()) {
      return result;
    }
    for (const auto& device : listener_.GetCurrentDevices()) {
      if (!AddressInSubnet(device.ip_address, local, prefix)) {
        result.push_back({device.device_name, device.ip_address});
      }
    }
    return result;
  }

 private:
  bool Fail(const std::string& message) {
    SetLastError(message);
    Log(message, config_.log_callback);
    return false;
  }

  void SetLastError(const std::string& message) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_error_ = message;
  }

  void ClearClaim() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    local_address_.clear();
    broadcast_address_.clear();
    prefix_length_ = 0;
    device_number_ = 0;
  }

  // Lowest number in the allowed range that no visible device uses, or 0.
  uint8_t ChooseDeviceNumber(const std::vector<DeviceInfo>& devices) const {
    std::set<uint8_t> used;
    for (const auto& device : devices) {
      used.insert(device.device_number);
    }
    const uint8_t first = use_standard_ ? 1 : kFirstVirtualPlayerNumber;
    const uint8_t last =
        use_standard_ ? kMaxStandardPlayerNumber : kLastVirtualPlayerNumber;
    for (uint8_t number = first; number <= last; ++number) {
      if (used.count(number) == 0) {
        return number;
      }
    }
    return 0;
  }

  // Periodically broadcast keep-alive packets on port 50000.
  void AnnounceLoop() {
    wire::KeepAlive info;
    info.device_number = device_number_;
    info.device_type = config_.device_type;
    info.device_name = config_.device_name;
    info.mac_address = config_.mac_address;
    info.ip_address = GetLocalAddress();
    const auto packet = wire::BuildKeepAlive(info);
    const std::string broadcast = GetBroadcastAddress();
    std::unique_lock<std::mutex> lock(state_mutex_);
    while (!stopping_) {
      lock.unlock();
      std::string error;
      if (!socket_.SendTo(packet, broadcast, kAnnouncePort, &error)) {
        Log("Failed to send announce packet: " + error, config_.log_callback);
      }
      lock.lock();
      stop_cv_.wait_for(lock, std::chrono::milliseconds(config_.announce_interval_ms),
                        [this]() { return stopping_; });
    }
  }

  VirtualPlayerConfig config_;
  KeepAliveListener& listener_;
  std::atomic<bool> use_standard_{false};
  std::atomic<bool> running_{false};
  std::atomic<uint8_t> device_number_{0};
  std::mutex lifecycle_mutex_;
  wire::DatagramSocket socket_;

  mutable std::mutex state_mutex_;
  std::condition_variable stop_cv_;
  bool stopping_ = false;
  std::string last_error_;
  std::string local_address_;
  std::string broadcast_address_;
  int prefix_length_ = 0;
  std::vector<NetworkInterface> matching_interfaces_;

  std::thread announce_thread_;
};

VirtualPlayer::VirtualPlayer(VirtualPlayerConfig config, KeepAliveListener& listener)
    : impl_(new Impl(std::move(config), listener)) {}

VirtualPlayer::~VirtualPlayer() { impl_->Stop(); }

void VirtualPlayer::SetUseStandardPlayerNumber(bool use_standard) {
  impl_->SetUseStandardPlayerNumber(use_standard);
}

bool VirtualPlayer::GetUseStandardPlayerNumber() const {
  return impl_->GetUseStandardPlayerNumber();
}

bool VirtualPlayer::Start() { return impl_->Start(); }
void VirtualPlayer::Stop() { impl_->Stop(); }
bool VirtualPlayer::IsRunning() const { return impl_->IsRunning(); }

uint8_t VirtualPlayer::GetDeviceNumber() const { return impl_->GetDeviceNumber(); }

std::string VirtualPlayer::GetLastError() const { return impl_->GetLastError(); }

std::string VirtualPlayer::GetLocalAddress() const { return impl_->GetLocalAddress(); }

std::string VirtualPlayer::GetBroadcastAddress() const {
  return impl_->GetBroadcastAddress();
}

std::vector<NetworkInterface> VirtualPlayer::GetMatchingInterfaces() const {
  return impl_->GetMatchingInterfaces();
}

std::vector<UnreachablePeer> VirtualPlayer::FindUnreachablePeers() const {
  return impl_->FindUnreachablePeers();
}

}  // namespace djonline
