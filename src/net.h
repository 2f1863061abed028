#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>

namespace vidsync {
namespace internal {

// Convert a string address and port into a sockaddr_in (empty/0.0.0.0 is any).
sockaddr_in MakeSockaddr(const std::string& address, uint16_t port);

// Format an address as "ip:port".
std::string AddrToString(const sockaddr_in& addr);

bool IsValidIpv4(const std::string& address);

// Owning file descriptor; closes on destruction.
class ScopedFd {
 public:
  ScopedFd() = default;
  explicit ScopedFd(int fd) : fd_(fd) {}
  ~ScopedFd() { reset(); }

  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;
  ScopedFd(ScopedFd&& other) noexcept : fd_(other.release()) {}
  ScopedFd& operator=(ScopedFd&& other) noexcept {
    if (this != &other) {
      reset(other.release());
    }
    return *this;
  }

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  int release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
  }
  void reset(int fd = -1);

 private:
  int fd_ = -1;
};

// Minimal UDP socket wrapper for multicast send/recv.
class UdpSocket {
 public:
  UdpSocket() = default;
  ~UdpSocket() { Close(); }

  UdpSocket(const UdpSocket&) = delete;
  UdpSocket& operator=(const UdpSocket&) = delete;

  // Create the socket and bind it. Port 0 binds an ephemeral port.
  bool Open(uint16_t port, const std::string& bind_address);
  // Create an unbound socket for sending only.
  bool OpenForSend();
  bool JoinGroup(const std::string& group, const std::string& interface_address);
  bool SetMulticastTtl(int ttl);
  bool SetMulticastInterface(const std::string& interface_address);
  void Close();

  int fd() const { return fd_; }
  uint16_t LocalPort() const;
  const std::string& last_error() const { return last_error_; }

  ssize_t SendTo(const void* data, size_t length, const sockaddr_in& addr);
  ssize_t RecvFrom(uint8_t* buffer, size_t length, sockaddr_in* addr,
                   socklen_t* addr_len);

 private:
  bool Create();

  int fd_ = -1;
  std::string last_error_;
};

// Listening TCP socket.
class TcpListener {
 public:
  TcpListener() = default;
  ~TcpListener() { Close(); }

  TcpListener(const TcpListener&) = delete;
  TcpListener& operator=(const TcpListener&) = delete;

  bool Open(uint16_t port, const std::string& bind_address, int backlog);
  void Close();
  // Accept a pending connection; returns an invalid fd on failure.
  ScopedFd Accept(sockaddr_in* peer);

  int fd() const { return fd_; }
  uint16_t LocalPort() const;
  const std::string& last_error() const { return last_error_; }

 private:
  int fd_ = -1;
  std::string last_error_;
};

enum class WaitResult {
  kReady,
  kTimeout,
  kError,
};

// Wait up to timeout for fd to become readable (select()).
WaitResult WaitReadable(int fd, std::chrono::milliseconds timeout);

enum class RecvStatus {
  kOk,
  kClosed,
  kTimeout,
  kError,
};

// Receive exactly length bytes unless the peer closes, times out, or errors.
RecvStatus RecvExact(int fd, uint8_t* out, size_t length, size_t* received);

// Receive up to length bytes once, retrying on EINTR.
RecvStatus RecvSome(int fd, uint8_t* out, size_t length, size_t* received);

// Send the whole buffer without raising SIGPIPE.
bool SendAll(int fd, const void* data, size_t length);

// Send text followed by '\n'.
bool SendLine(int fd, const std::string& text);

// Read one '\n'-terminated line (terminator and trailing '\r' stripped).
RecvStatus RecvLine(int fd, size_t max_length, std::string* line);

// Apply SO_RCVTIMEO and SO_SNDTIMEO.
bool SetSocketTimeouts(int fd, std::chrono::milliseconds timeout);

// Connect with a timeout using a non-blocking connect.
ScopedFd ConnectTcp(const std::string& host, uint16_t port,
                    std::chrono::milliseconds timeout, std::string* error);

std::string ErrnoString(const char* what);

}  // namespace internal
}  // namespace vidsync
