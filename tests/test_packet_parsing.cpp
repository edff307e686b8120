// Tests for parsing keep-alive announcements.
#include "djonline/test_hooks.h"

#include <gtest/gtest.h>

TEST(PacketParsingTest, ParseKeepAlivePacket) {
  const std::array<uint8_t, 6> mac = {0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0xff};
  const auto packet = djonline::test::BuildKeepAlivePacket(
      0x03, 0x01, "CDJ-3000", mac, "192.168.0.10");
  EXPECT_EQ(packet.size(), 0x36u);

  djonline::DeviceInfo info;
  ASSERT_TRUE(djonline::test::ParseKeepAlivePacket(packet, &info));
  EXPECT_EQ(info.device_number, 0x03);
  EXPECT_EQ(info.device_type, 0x01);
  EXPECT_EQ(info.device_name, "CDJ-3000");
  EXPECT_EQ(info.ip_address, "192.168.0.10");
  EXPECT_EQ(info.mac_address, mac);
}

TEST(PacketParsingTest, TruncatesLongDeviceNames) {
  const std::array<uint8_t, 6> mac = {0, 0, 0, 0, 0, 1};
  const auto packet = djonline::test::BuildKeepAlivePacket(
      0x21, 0x03, "DJM-900NXS2 with a very long name", mac, "10.0.0.2");

  djonline::DeviceInfo info;
  ASSERT_TRUE(djonline::test::ParseKeepAlivePacket(packet, &info));
  EXPECT_EQ(info.device_name.size(), djonline::kDeviceNameLength);
  EXPECT_EQ(info.device_name, "DJM-900NXS2 with a v");
}

TEST(PacketParsingTest, RejectUndersizedPacket) {
  const std::array<uint8_t, 6> mac = {0, 0, 0, 0, 0, 1};
  auto packet = djonline::test::BuildKeepAlivePacket(0x01, 0x01, "CDJ-1", mac, "10.0.0.2");
  packet.resize(0x30);

  djonline::DeviceInfo info;
  EXPECT_FALSE(djonline::test::ParseKeepAlivePacket(packet, &info));
}

TEST(PacketParsingTest, RejectInvalidHeader) {
  const std::array<uint8_t, 6> mac = {0, 0, 0, 0, 0, 1};
  auto packet = djonline::test::BuildKeepAlivePacket(0x01, 0x01, "CDJ-1", mac, "10.0.0.2");
  packet[0] = 0x00;

  djonline::DeviceInfo info;
  EXPECT_FALSE(djonline::test::ParseKeepAlivePacket(packet, &info));
}

TEST(PacketParsingTest, RejectOtherPacketTypes) {
  const std::array<uint8_t, 6> mac = {0, 0, 0, 0, 0, 1};
  auto packet = djonline::test::BuildKeepAlivePacket(0x01, 0x01, "CDJ-1", mac, "10.0.0.2");
  packet[0x0a] = 0x0a;

  djonline::DeviceInfo info;
  EXPECT_FALSE(djonline::test::ParseKeepAlivePacket(packet, &info));
}
