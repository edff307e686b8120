#include "djonline/listener.h"
#include "djonline/test_hooks.h"

#include "wire.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <set>
#include <thread>
#include <unordered_map>

#include <arpa/inet.h>

namespace djonline {
namespace {

constexpr size_t kReceiveBufferSize = 512;
constexpr std::chrono::milliseconds kReceiveWait{200};
// Expired records are forgotten after this many device timeouts.
constexpr int kForgetAfterTimeouts = 10;

void LogCallbackError(const char* name, const LogCallback& log) {
  std::string message = "callback threw exception: ";
  message += name;
  Log(message, log);
}

}  // namespace

bool ListenerConfig::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (device_timeout.count() <= 0 || device_prune_interval.count() <= 0) {
    return fail("device timeouts must be positive");
  }
  if (!bind_address.empty() && bind_address != "0.0.0.0") {
    in_addr parsed{};
    if (inet_pton(AF_INET, bind_address.c_str(), &parsed) != 1) {
      return fail("bind_address must be a valid IPv4 address");
    }
  }
  return true;
}

struct ListenerMetricsAtomic {
  std::atomic<uint64_t> packets_received{0};
  std::atomic<uint64_t> parse_errors{0};
  std::atomic<uint64_t> ignored_packets{0};
  std::atomic<uint64_t> callback_exceptions{0};

  ListenerMetrics Snapshot() const {
    ListenerMetrics snapshot;
    snapshot.packets_received = packets_received.load();
    snapshot.parse_errors = parse_errors.load();
    snapshot.ignored_packets = ignored_packets.load();
    snapshot.callback_exceptions = callback_exceptions.load();
    return snapshot;
  }
};

struct KeepAliveListener::Impl {
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

  explicit Impl(ListenerConfig config) : config_(std::move(config)) {}

  bool Start() {
    if (running_.exchange(true)) {
      return true;
    }
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    SetLastError({});
    std::string error;
    if (!config_.Validate(&error)) {
      SetLastError(error);
      Log(error, config_.log_callback);
      running_ = false;
      return false;
    }
    if (!socket_.Bind(config_.bind_address, kAnnouncePort, &error)) {
      SetLastError(error);
      Log(error, config_.log_callback);
      running_ = false;
      return false;
    }
    try {
      recv_thread_ = std::thread([this]() { RecvLoop(); });
      expiry_thread_ = std::thread([this]() { ExpiryLoop(); });
    } catch (const std::exception& ex) {
      const std::string message = std::string("thread start failed: ") + ex.what();
      SetLastError(message);
      Log(message, config_.log_callback);
      running_ = false;
      StopThreads();
      return false;
    }
    return true;
  }

  void Stop() {
    if (!running_.exchange(false)) {
      return;
    }
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    StopThreads();
  }

  bool IsRunning() const { return running_; }

  void SetDeviceEventCallback(DeviceEventCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    device_event_cb_ = std::move(cb);
  }

  void AddIgnoredAddress(const std::string& address) {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    ignored_addresses_.insert(address);
  }

  void RemoveIgnoredAddress(const std::string& address) {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    ignored_addresses_.erase(address);
  }

  std::vector<DeviceInfo> GetCurrentDevices() const {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    std::vector<DeviceInfo> result;
    result.reserve(devices_.size());
    for (const auto& entry : devices_) {
      if (entry.second.active) {
        result.push_back(entry.second.info);
      }
    }
    std::sort(result.begin(), result.end(),
              [](const DeviceInfo& a, const DeviceInfo& b) {
                return a.device_number < b.device_number;
              });
    return result;
  }

  std::string GetLastError() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
  }

  ListenerMetrics GetMetrics() const { return metrics_.Snapshot(); }

 private:
  struct DeviceRecord {
    DeviceInfo info;
    bool active = false;
  };

  void SetLastError(const std::string& message) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_ = message;
  }

  // Call with running_ cleared. The socket outlives the receive thread.
  void StopThreads() {
    {
      std::lock_guard<std::mutex> lock(stop_mutex_);
    }
    stop_cv_.notify_all();
    if (recv_thread_.joinable()) {
      recv_thread_.join();
    }
    if (expiry_thread_.joinable()) {
      expiry_thread_.join();
    }
    socket_.Close();
  }

  void RecordCallbackException(const char* name) {
    metrics_.callback_exceptions.fetch_add(1);
    LogCallbackError(name, config_.log_callback);
  }

  void ProcessPacket(const uint8_t* data, size_t length,
                     const std::string& addr_string) {
    if (!wire::HasHeader(data, length) || length <= wire::kPacketTypeOffset) {
      metrics_.parse_errors.fetch_add(1);
      return;
    }
    metrics_.packets_received.fetch_add(1);
    if (data[wire::kPacketTypeOffset] != wire::kKeepAliveType) {
      return;
    }
    {
      std::lock_guard<std::mutex> lock(devices_mutex_);
      if (!addr_string.empty() && ignored_addresses_.count(addr_string) > 0) {
        metrics_.ignored_packets.fetch_add(1);
        return;
      }
    }
    wire::KeepAlive info;
    if (!wire::ParseKeepAlive(data, length, &info)) {
      metrics_.parse_errors.fetch_add(1);
      return;
    }
    if (info.device_number == 0) {
      metrics_.parse_errors.fetch_add(1);
      return;
    }
    if ((info.ip_address.empty() || info.ip_address == "0.0.0.0") &&
        !addr_string.empty()) {
      info.ip_address = addr_string;
    }
    Track(info);
  }

  void RecvLoop() {
    std::array<uint8_t, kReceiveBufferSize> buffer{};
    std::string source;
    while (running_) {
      const ssize_t bytes =
          socket_.Receive(buffer.data(), buffer.size(), kReceiveWait, &source);
      if (bytes > 0) {
        ProcessPacket(buffer.data(), static_cast<size_t>(bytes), source);
      } else if (bytes < 0) {
        Log("Receive on announcement socket failed", config_.log_callback);
        std::this_thread::sleep_for(kReceiveWait);
      }
    }
  }

  void ExpiryLoop() {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    while (!stop_cv_.wait_for(lock, config_.device_prune_interval,
                              [this]() { return !running_; })) {
      lock.unlock();
      Expire(std::chrono::steady_clock::now());
      lock.lock();
    }
  }

  // Devices silent for longer than the timeout leave the current set; their
  // records are dropped once they have been silent much longer.
  void Expire(std::chrono::steady_clock::time_point now) {
    std::vector<DeviceInfo> expired;
    {
      std::lock_guard<std::mutex> lock(devices_mutex_);
      const auto forget_after = config_.device_timeout * kForgetAfterTimeouts;
      for (auto it = devices_.begin(); it != devices_.end();) {
        DeviceRecord& record = it->second;
        const auto silence = now - record.info.last_seen;
        if (record.active && silence > config_.device_timeout) {
          record.active = false;
          expired.push_back(record.info);
        }
        if (!record.active && silence > forget_after) {
          it = devices_.erase(it);
        } else {
          ++it;
        }
      }
    }
    for (const auto& device : expired) {
      Notify({DeviceEventType::kExpired, device});
    }
  }

  // Only a device joining the current set is reported; later keep-alives
  // refresh its record silently.
  void Track(const wire::KeepAlive& packet) {
    DeviceInfo joined;
    bool is_new = false;
    {
      std::lock_guard<std::mutex> lock(devices_mutex_);
      DeviceRecord& record = devices_[packet.device_number];
      record.info.device_number = packet.device_number;
      record.info.device_type = packet.device_type;
      record.info.device_name = packet.device_name;
      record.info.ip_address = packet.ip_address;
      record.info.mac_address = packet.mac_address;
      record.info.last_seen = std::chrono::steady_clock::now();
      is_new = !record.active;
      record.active = true;
      joined = record.info;
    }
    if (is_new) {
      Notify({DeviceEventType::kSeen, joined});
    }
  }

  void Notify(const DeviceEvent& event) {
    DeviceEventCallback cb_copy;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      cb_copy = device_event_cb_;
    }
    if (!cb_copy) {
      return;
    }
    try {
      cb_copy(event);
    } catch (...) {
      RecordCallbackException("DeviceEventCallback");
    }
  }

  ListenerConfig config_;
  std::atomic<bool> running_{false};
  std::mutex lifecycle_mutex_;
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  wire::DatagramSocket socket_;

  mutable std::mutex error_mutex_;
  std::string last_error_;
  ListenerMetricsAtomic metrics_;

  mutable std::mutex callback_mutex_;
  DeviceEventCallback device_event_cb_;

  mutable std::mutex devices_mutex_;
  std::unordered_map<uint8_t, DeviceRecord> devices_;
  std::set<std::string> ignored_addresses_;

  std::thread recv_thread_;
  std::thread expiry_thread_;
};

KeepAliveListener::KeepAliveListener(ListenerConfig config)
    : impl_(new Impl(std::move(config))) {}

KeepAliveListener::~KeepAliveListener() { impl_->Stop(); }

bool KeepAliveListener::Start() { return impl_->Start(); }
void KeepAliveListener::Stop() { impl_->Stop(); }
bool KeepAliveListener::IsRunning() const { return impl_->IsRunning(); }

void KeepAliveListener::SetDeviceEventCallback(DeviceEventCallback cb) {
  impl_->SetDeviceEventCallback(std::move(cb));
}

void KeepAliveListener::AddIgnoredAddress(const std::string& address) {
  impl_->AddIgnoredAddress(address);
}

void KeepAliveListener::RemoveIgnoredAddress(const std::string& address) {
  impl_->RemoveIgnoredAddress(address);
}

std::vector<DeviceInfo> KeepAliveListener::GetCurrentDevices() const {
  return impl_->GetCurrentDevices();
}

std::string KeepAliveListener::GetLastError() const {
  return impl_->GetLastError();
}

ListenerMetrics KeepAliveListener::GetMetrics() const {
  return impl_->GetMetrics();
}

#ifdef DJONLINE_TESTING
namespace test {

std::vector<uint8_t> BuildKeepAlivePacket(uint8_t device_number,
                                          uint8_t device_type,
                                          const std::string& device_name,
                                          const std::array<uint8_t, 6>& mac_address,
                                          const std::string& ip_address) {
  wire::KeepAlive info;
  info.device_number = device_number;
  info.device_type = device_type;
  info.device_name = device_name;
  info.mac_address = mac_address;
  info.ip_address = ip_address;
  return wire::BuildKeepAlive(info);
}

bool ParseKeepAlivePacket(const std::vector<uint8_t>& data, DeviceInfo* out) {
  if (!out) {
    return false;
  }
  wire::KeepAlive info;
  if (!wire::ParseKeepAlive(data.data(), data.size(), &info)) {
    return false;
  }
  out->device_number = info.device_number;
  out->device_type = info.device_type;
  out->device_name = info.device_name;
  out->ip_address = info.ip_address;
  out->mac_address = info.mac_address;
  out->last_seen = std::chrono::steady_clock::now();
  return true;
}

void InjectKeepAlive(KeepAliveListener& listener,
                     uint8_t device_number,
                     uint8_t device_type,
                     const std::string& device_name,
                     const std::string& ip_address,
                     const std::array<uint8_t, 6>& mac_address) {
  InjectPacket(listener,
               BuildKeepAlivePacket(device_number, device_type, device_name,
                                    mac_address, ip_address),
               ip_address);
}

void InjectPacket(KeepAliveListener& listener,
                  const std::vector<uint8_t>& packet,
                  const std::string& source_address) {
  listener.impl_->ProcessPacket(packet.data(), packet.size(), source_address);
}

void SetDeviceLastSeen(KeepAliveListener& listener,
                       uint8_t device_number,
                       std::chrono::steady_clock::time_point when) {
  std::lock_guard<std::mutex> lock(listener.impl_->devices_mutex_);
  auto it = listener.impl_->devices_.find(device_number);
  if (it != listener.impl_->devices_.end()) {
    it->second.info.last_seen = when;
  }
}

void PruneDevices(KeepAliveListener& listener,
                  std::chrono::steady_clock::time_point now) {
  listener.impl_->Expire(now);
}

size_t GetDeviceRecordCount(KeepAliveListener& listener) {
  std::lock_guard<std::mutex> lock(listener.impl_->devices_mutex_);
  return listener.impl_->devices_.size();
}

}  // namespace test
#endif

}  // namespace djonline
