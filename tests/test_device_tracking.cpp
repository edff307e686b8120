// Tests for device discovery tracking and expiry.
#include "djonline/test_hooks.h"

#include <gtest/gtest.h>

#include <stdexcept>

namespace {

djonline::ListenerConfig QuietConfig() {
  djonline::ListenerConfig config;
  config.log_callback = [](const std::string&) {};
  return config;
}

}  // namespace

TEST(DeviceTrackingTest, OnlyArrivalIsReported) {
  djonline::KeepAliveListener listener(QuietConfig());

  std::vector<djonline::DeviceEvent> events;
  listener.SetDeviceEventCallback([&](const djonline::DeviceEvent& event) {
    events.push_back(event);
  });

  const std::array<uint8_t, 6> mac = {0, 1, 2, 3, 4, 5};
  djonline::test::InjectKeepAlive(listener, 1, 0x01, "CDJ-1", "192.168.0.2", mac);

  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].type, djonline::DeviceEventType::kSeen);
  EXPECT_EQ(events[0].device.device_number, 1);
  EXPECT_EQ(events[0].device.device_name, "CDJ-1");

  // Later keep-alives refresh the record without another event.
  djonline::test::InjectKeepAlive(listener, 1, 0x01, "CDJ-1B", "192.168.0.3", mac);
  djonline::test::InjectKeepAlive(listener, 1, 0x01, "CDJ-1B", "192.168.0.3", mac);
  EXPECT_EQ(events.size(), 1u);
  EXPECT_EQ(listener.GetMetrics().packets_received, 3u);

  const auto devices = listener.GetCurrentDevices();
  ASSERT_EQ(devices.size(), 1u);
  EXPECT_EQ(devices[0].device_name, "CDJ-1B");
  EXPECT_EQ(devices[0].ip_address, "192.168.0.3");
}

TEST(DeviceTrackingTest, CurrentDevicesSortedByNumber) {
  djonline::KeepAliveListener listener(QuietConfig());
  const std::array<uint8_t, 6> mac = {0, 1, 2, 3, 4, 5};
  djonline::test::InjectKeepAlive(listener, 3, 0x01, "CDJ-3", "192.168.0.4", mac);
  djonline::test::InjectKeepAlive(listener, 33, 0x03, "DJM-900", "192.168.0.9", mac);
  djonline::test::InjectKeepAlive(listener, 1, 0x01, "CDJ-1", "192.168.0.2", mac);

  const auto devices = listener.GetCurrentDevices();
  ASSERT_EQ(devices.size(), 3u);
  EXPECT_EQ(devices[0].device_number, 1);
  EXPECT_EQ(devices[1].device_number, 3);
  EXPECT_EQ(devices[2].device_number, 33);
  EXPECT_EQ(devices[2].ip_address, "192.168.0.9");
}

TEST(DeviceTrackingTest, ExpiredDevicesPruned) {
  auto config = QuietConfig();
  config.device_timeout = std::chrono::milliseconds(100);
  djonline::KeepAliveListener listener(config);

  std::vector<djonline::DeviceEvent> events;
  listener.SetDeviceEventCallback([&](const djonline::DeviceEvent& event) {
    events.push_back(event);
  });

  const std::array<uint8_t, 6> mac = {9, 8, 7, 6, 5, 4};
  djonline::test::InjectKeepAlive(listener, 2, 0x01, "CDJ-2", "192.168.0.3", mac);
  ASSERT_EQ(listener.GetCurrentDevices().size(), 1u);

  const auto now = std::chrono::steady_clock::now();
  djonline::test::SetDeviceLastSeen(listener, 2,
                                    now - config.device_timeout - std::chrono::milliseconds(1));
  djonline::test::PruneDevices(listener, now);

  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.back().type, djonline::DeviceEventType::kExpired);
  EXPECT_TRUE(listener.GetCurrentDevices().empty());
  EXPECT_EQ(djonline::test::GetDeviceRecordCount(listener), 1u);

  djonline::test::SetDeviceLastSeen(listener, 2, now - (config.device_timeout * 11));
  djonline::test::PruneDevices(listener, now);
  EXPECT_EQ(djonline::test::GetDeviceRecordCount(listener), 0u);
}

TEST(DeviceTrackingTest, ReturningDeviceIsSeenAgain) {
  auto config = QuietConfig();
  config.device_timeout = std::chrono::milliseconds(100);
  djonline::KeepAliveListener listener(config);

  std::vector<djonline::DeviceEvent> events;
  listener.SetDeviceEventCallback([&](const djonline::DeviceEvent& event) {
    events.push_back(event);
  });

  const std::array<uint8_t, 6> mac = {9, 8, 7, 6, 5, 4};
  djonline::test::InjectKeepAlive(listener, 2, 0x01, "CDJ-2", "192.168.0.3", mac);
  const auto now = std::chrono::steady_clock::now();
  djonline::test::SetDeviceLastSeen(listener, 2, now - std::chrono::milliseconds(500));
  djonline::test::PruneDevices(listener, now);
  djonline::test::InjectKeepAlive(listener, 2, 0x01, "CDJ-2", "192.168.0.3", mac);

  ASSERT_EQ(events.size(), 3u);
  EXPECT_EQ(events[2].type, djonline::DeviceEventType::kSeen);
  EXPECT_EQ(listener.GetCurrentDevices().size(), 1u);
}

TEST(DeviceTrackingTest, IgnoredAddressesAreDropped) {
  djonline::KeepAliveListener listener(QuietConfig());
  listener.AddIgnoredAddress("192.168.0.50");

  const std::array<uint8_t, 6> mac = {0, 0, 0, 0, 0, 7};
  djonline::test::InjectKeepAlive(listener, 7, 0x01, "djonline", "192.168.0.50", mac);
  EXPECT_TRUE(listener.GetCurrentDevices().empty());
  EXPECT_EQ(listener.GetMetrics().ignored_packets, 1u);

  listener.RemoveIgnoredAddress("192.168.0.50");
  djonline::test::InjectKeepAlive(listener, 7, 0x01, "djonline", "192.168.0.50", mac);
  EXPECT_EQ(listener.GetCurrentDevices().size(), 1u);
}

TEST(DeviceTrackingTest, MalformedPacketsCounted) {
  djonline::KeepAliveListener listener(QuietConfig());
  const std::array<uint8_t, 6> mac = {0, 0, 0, 0, 0, 1};

  djonline::test::InjectPacket(listener, std::vector<uint8_t>(8, 0x51), "192.168.0.2");
  djonline::test::InjectPacket(
      listener, djonline::test::BuildKeepAlivePacket(0, 0x01, "CDJ", mac, "192.168.0.2"),
      "192.168.0.2");

  const auto metrics = listener.GetMetrics();
  EXPECT_EQ(metrics.parse_errors, 2u);
  EXPECT_TRUE(listener.GetCurrentDevices().empty());
}

TEST(DeviceTrackingTest, MissingAddressFallsBackToSource) {
  djonline::KeepAliveListener listener(QuietConfig());
  const std::array<uint8_t, 6> mac = {0, 0, 0, 0, 0, 1};
  djonline::test::InjectPacket(
      listener, djonline::test::BuildKeepAlivePacket(4, 0x01, "CDJ-4", mac, "0.0.0.0"),
      "169.254.10.4");

  const auto devices = listener.GetCurrentDevices();
  ASSERT_EQ(devices.size(), 1u);
  EXPECT_EQ(devices[0].ip_address, "169.254.10.4");
}

TEST(DeviceTrackingTest, CallbackExceptionsCounted) {
  std::vector<std::string> logs;
  djonline::ListenerConfig config;
  config.log_callback = [&](const std::string& message) { logs.push_back(message); };
  djonline::KeepAliveListener listener(config);
  listener.SetDeviceEventCallback([](const djonline::DeviceEvent&) {
    throw std::runtime_error("boom");
  });

  const std::array<uint8_t, 6> mac = {0, 0, 0, 0, 0, 1};
  djonline::test::InjectKeepAlive(listener, 1, 0x01, "CDJ-1", "192.168.0.2", mac);

  EXPECT_EQ(listener.GetMetrics().callback_exceptions, 1u);
  ASSERT_EQ(logs.size(), 1u);
  EXPECT_NE(logs[0].find("DeviceEventCallback"), std::string::npos);
  EXPECT_EQ(listener.GetCurrentDevices().size(), 1u);
}

TEST(DeviceTrackingTest, StopReturnsWithoutWaitingForExpiryInterval) {
  auto config = QuietConfig();
  config.bind_address = "127.0.0.1";
  config.device_prune_interval = std::chrono::seconds(30);
  djonline::KeepAliveListener listener(config);
  if (!listener.Start()) {
    GTEST_SKIP() << "cannot bind port 50000: " << listener.GetLastError();
  }
  EXPECT_TRUE(listener.IsRunning());
  EXPECT_TRUE(listener.Start());

  const auto before = std::chrono::steady_clock::now();
  listener.Stop();
  EXPECT_LT(std::chrono::steady_clock::now() - before, std::chrono::seconds(5));
  EXPECT_FALSE(listener.IsRunning());
  listener.Stop();
}
