// Thread safety smoke tests for concurrent gestures and device updates.
#include "djonline/acquisition.h"
#include "djonline/test_hooks.h"

#include "fakes.h"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

TEST(ThreadSafetyTest, ConcurrentGesturesSetEachFlagOnce) {
  djonline::AcquisitionSession session(false, djonline::kSearchTries);
  std::atomic<int> quit_wins{0};
  std::atomic<int> offline_wins{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < 1000; ++i) {
        if (session.RequestQuit()) {
          quit_wins.fetch_add(1);
        }
        if (session.RequestContinueOffline()) {
          offline_wins.fetch_add(1);
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(quit_wins.load(), 1);
  EXPECT_EQ(offline_wins.load(), 1);
}

TEST(ThreadSafetyTest, PollingWhileDevicesChange) {
  djonline::ListenerConfig config;
  config.log_callback = [](const std::string&) {};
  djonline::KeepAliveListener listener(config);

  std::atomic<bool> done{false};
  std::thread writer([&]() {
    const std::array<uint8_t, 6> mac = {0, 1, 2, 3, 4, 5};
    for (int i = 0; i < 1000; ++i) {
      const uint8_t number = static_cast<uint8_t>(1 + (i % 4));
      djonline::test::InjectKeepAlive(listener, number, 0x01,
                                      "CDJ-" + std::to_string(i), "192.168.0.2", mac);
    }
    done = true;
  });
  std::thread reader([&]() {
    while (!done) {
      const auto devices = listener.GetCurrentDevices();
      EXPECT_LE(devices.size(), 4u);
    }
  });

  writer.join();
  reader.join();
  EXPECT_EQ(listener.GetCurrentDevices().size(), 4u);
}
