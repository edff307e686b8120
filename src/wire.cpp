#include "wire.h"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

namespace djonline {
namespace wire {
namespace {

// NUL terminated, space padded on the right.
std::string ReadName(const uint8_t* field) {
  const char* begin = reinterpret_cast<const char*>(field);
  const char* end = std::find(begin, begin + kDeviceNameLength, '\0');
  std::string name(begin, end);
  name.erase(name.find_last_not_of(' ') + 1);
  return name;
}

std::string FormatIpv4(const uint8_t* bytes) {
  return std::to_string(bytes[0]) + "." + std::to_string(bytes[1]) + "." +
         std::to_string(bytes[2]) + "." + std::to_string(bytes[3]);
}

// Empty and 0.0.0.0 mean any address.
bool ToSockaddr(const std::string& address, uint16_t port, sockaddr_in* out) {
  std::memset(out, 0, sizeof(*out));
  out->sin_family = AF_INET;
  out->sin_port = htons(port);
  if (address.empty() || address == "0.0.0.0") {
    out->sin_addr.s_addr = htonl(INADDR_ANY);
    return true;
  }
  return inet_pton(AF_INET, address.c_str(), &out->sin_addr) == 1;
}

bool SetError(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
  return false;
}

std::string Errno(const std::string& call) {
  return call + " failed: " + std::strerror(errno);
}

}  // namespace

bool HasHeader(const uint8_t* data, size_t length) {
  return length >= kHeaderSize && std::equal(kHeader, kHeader + kHeaderSize, data);
}

bool ParseKeepAlive(const uint8_t* data, size_t length, KeepAlive* out) {
  if (!out || length < kKeepAlivePacketSize || !HasHeader(data, length) ||
      data[kPacketTypeOffset] != kKeepAliveType) {
    return false;
  }
  out->device_name = ReadName(data + kKeepAliveNameOffset);
  if (out->device_name.empty()) {
    out->device_name = ReadName(data + kKeepAliveShiftedNameOffset);
  }
  out->device_number = data[kKeepAliveDeviceNumber];
  out->device_type = data[kKeepAliveDeviceType];
  std::copy_n(data + kKeepAliveMac, out->mac_address.size(), out->mac_address.begin());
  out->ip_address = FormatIpv4(data + kKeepAliveIp);
  return true;
}

std::vector<uint8_t> BuildKeepAlive(const KeepAlive& info) {
  std::vector<uint8_t> packet(kKeepAlivePacketSize, 0);
  std::copy(kHeader, kHeader + kHeaderSize, packet.begin());
  packet[kPacketTypeOffset] = kKeepAliveType;

  const size_t name_length = std::min<size_t>(info.device_name.size(), kDeviceNameLength);
  std::copy_n(info.device_name.begin(), name_length,
              packet.begin() + kKeepAliveShiftedNameOffset);

  packet[0x20] = 0x01;
  packet[0x21] = 0x02;
  packet[0x23] = static_cast<uint8_t>(kKeepAlivePacketSize);
  packet[kKeepAliveDeviceNumber] = info.device_number;
  packet[kKeepAliveDeviceType] = info.device_type;
  std::copy(info.mac_address.begin(), info.mac_address.end(),
            packet.begin() + kKeepAliveMac);

  in_addr ip{};
  if (!info.ip_address.empty() && inet_pton(AF_INET, info.ip_address.c_str(), &ip) == 1) {
    const auto* bytes = reinterpret_cast<const uint8_t*>(&ip);
    std::copy(bytes, bytes + 4, packet.begin() + kKeepAliveIp);
  }
  packet[0x30] = 0x01;
  packet[kKeepAlivePeerType] = info.device_type;
  return packet;
}

bool DatagramSocket::Bind(const std::string& address, uint16_t port, std::string* error) {
  if (is_open()) {
    return true;
  }
  sockaddr_in local{};
  if (!ToSockaddr(address, port, &local)) {
    return SetError(error, "invalid bind address " + address);
  }
  fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd_ < 0) {
    return SetError(error, Errno("socket()"));
  }
  const int on = 1;
  if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) < 0) {
    const std::string message = Errno("setsockopt(SO_REUSEADDR)");
    Close();
    return SetError(error, message);
  }
  if (::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &on, sizeof(on)) < 0) {
    const std::string message = Errno("setsockopt(SO_BROADCAST)");
    Close();
    return SetError(error, message);
  }
  if (::bind(fd_, reinterpret_cast<const sockaddr*>(&local), sizeof(local)) < 0) {
    const std::string message =
        Errno("bind(" + address + ":" + std::to_string(port) + ")");
    Close();
    return SetError(error, message);
  }
  return true;
}

void DatagramSocket::Close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

ssize_t DatagramSocket::Receive(uint8_t* buffer,
                                size_t capacity,
                                std::chrono::milliseconds timeout,
                                std::string* source) {
  if (!is_open()) {
    return -1;
  }
  fd_set readable;
  FD_ZERO(&readable);
  FD_SET(fd_, &readable);
  timeval wait{};
  wait.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  wait.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  const int ready = ::select(fd_ + 1, &readable, nullptr, nullptr, &wait);
  if (ready < 0) {
    return errno == EINTR ? 0 : -1;
  }
  if (ready == 0) {
    return 0;
  }
  sockaddr_in from{};
  socklen_t from_length = sizeof(from);
  const ssize_t bytes = ::recvfrom(fd_, buffer, capacity, 0,
                                   reinterpret_cast<sockaddr*>(&from), &from_length);
  if (bytes > 0 && source) {
    *source = FormatIpv4(reinterpret_cast<const uint8_t*>(&from.sin_addr));
  }
  return bytes;
}

bool DatagramSocket::SendTo(const std::vector<uint8_t>& data,
                            const std::string& address,
                            uint16_t port,
                            std::string* error) {
  sockaddr_in target{};
  if (!ToSockaddr(address, port, &target)) {
    return SetError(error, "invalid destination address " + address);
  }
  const ssize_t sent = ::sendto(fd_, data.data(), data.size(), 0,
                                reinterpret_cast<const sockaddr*>(&target), sizeof(target));
  if (sent < 0) {
    return SetError(error, Errno("sendto(" + address + ")"));
  }
  if (static_cast<size_t>(sent) != data.size()) {
    return SetError(error, "short send to " + address + ": " + std::to_string(sent) +
                               " of " + std::to_string(data.size()) + " bytes");
  }
  return true;
}

}  // namespace wire
}  // namespace djonline
