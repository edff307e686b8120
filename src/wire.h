#pragma once

// Keep-alive codec and the datagram socket shared by the listener and the
// virtual player. Not part of the public API.

#include "djonline/presence.h"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <sys/types.h>

namespace djonline {
namespace wire {

constexpr uint8_t kHeader[10] = {
    0x51, 0x73, 0x70, 0x74, 0x31, 0x57, 0x6d, 0x4a, 0x4f, 0x4c,
};

constexpr size_t kHeaderSize = sizeof(kHeader);
constexpr size_t kPacketTypeOffset = 0x0a;

// Keep-alive layout (type 0x06, port 50000).
constexpr uint8_t kKeepAliveType = 0x06;
constexpr size_t kKeepAlivePacketSize = 0x36;
// Some devices start the name at 0x0b, the rest one byte later.
constexpr size_t kKeepAliveNameOffset = 0x0b;
constexpr size_t kKeepAliveShiftedNameOffset = 0x0c;
constexpr size_t kKeepAliveDeviceNumber = 0x24;
constexpr size_t kKeepAliveDeviceType = 0x25;
constexpr size_t kKeepAliveMac = 0x26;
constexpr size_t kKeepAliveIp = 0x2c;
constexpr size_t kKeepAlivePeerType = 0x34;

struct KeepAlive {
  uint8_t device_number = 0;
  uint8_t device_type = 0;
  std::string device_name;
  std::string ip_address;
  std::array<uint8_t, 6> mac_address = {0, 0, 0, 0, 0, 0};
};

/// Validate the 10-byte magic header.
bool HasHeader(const uint8_t* data, size_t length);

/// Decode a keep-alive. Returns false for short packets and other types.
bool ParseKeepAlive(const uint8_t* data, size_t length, KeepAlive* out);

/// Encode a keep-alive announcement; names longer than 20 bytes are cut.
std::vector<uint8_t> BuildKeepAlive(const KeepAlive& info);

/**
 * IPv4 UDP socket with broadcast enabled. Receive() waits with a timeout so
 * a polling thread can notice shutdown; Close() must not race it.
 */
class DatagramSocket {
 public:
  DatagramSocket() = default;
  ~DatagramSocket() { Close(); }

  DatagramSocket(const DatagramSocket&) = delete;
  DatagramSocket& operator=(const DatagramSocket&) = delete;

  /// Bind to address:port. An empty or 0.0.0.0 address binds every
  /// interface; port 0 picks an ephemeral port. No-op when already bound.
  bool Bind(const std::string& address, uint16_t port, std::string* error);
  void Close();
  bool is_open() const { return fd_ >= 0; }

  /// Wait up to timeout for one datagram. Returns its size, 0 when nothing
  /// arrived, or -1 on error. source receives the sender's address.
  ssize_t Receive(uint8_t* buffer,
                  size_t capacity,
                  std::chrono::milliseconds timeout,
                  std::string* source);

  /// Send one datagram; a short send counts as a failure.
  bool SendTo(const std::vector<uint8_t>& data,
              const std::string& address,
              uint16_t port,
              std::string* error);

 private:
  int fd_ = -1;
};

}  // namespace wire
}  // namespace djonline
