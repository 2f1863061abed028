#include "net.h"

#include <cerrno>
#include <cstring>
#include <sstream>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <sys/select.h>
#include <unistd.h>

namespace vidsync {
namespace internal {

sockaddr_in MakeSockaddr(const std::string& address, uint16_t port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (address.empty() || address == "0.0.0.0") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else {
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
      addr.sin_addr.s_addr = htonl(INADDR_ANY);
    }
  }
  return addr;
}

std::string AddrToString(const sockaddr_in& addr) {
  char buffer[INET_ADDRSTRLEN] = {0};
  if (inet_ntop(AF_INET, &addr.sin_addr, buffer, sizeof(buffer)) == nullptr) {
    return {};
  }
  return std::string(buffer) + ":" + std::to_string(ntohs(addr.sin_port));
}

bool IsValidIpv4(const std::string& address) {
  if (address.empty()) {
    return false;
  }
  in_addr parsed{};
  return inet_pton(AF_INET, address.c_str(), &parsed) == 1;
}

std::string ErrnoString(const char* what) {
  return std::string(what) + " failed: " + std::strerror(errno);
}

void ScopedFd::reset(int fd) {
  if (fd_ >= 0) {
    ::close(fd_);
  }
  fd_ = fd;
}

namespace {

uint16_t SocketLocalPort(int fd) {
  if (fd < 0) {
    return 0;
  }
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
    return 0;
  }
  return ntohs(addr.sin_port);
}

bool SetReuseAddr(int fd, std::string* error) {
  int reuse = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
    *error = ErrnoString("setsockopt(SO_REUSEADDR)");
    return false;
  }
  return true;
}

std::string BindError(const std::string& address, uint16_t port) {
  std::ostringstream oss;
  oss << "bind(" << (address.empty() ? "0.0.0.0" : address) << ":" << port
      << ") failed: " << std::strerror(errno);
  return oss.str();
}

}  // namespace

bool UdpSocket::Create() {
  if (fd_ >= 0) {
    return true;
  }
  fd_ = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_UDP);
  if (fd_ < 0) {
    last_error_ = ErrnoString("socket()");
    return false;
  }
  return true;
}

bool UdpSocket::Open(uint16_t port, const std::string& bind_address) {
  if (!Create()) {
    return false;
  }
  if (!SetReuseAddr(fd_, &last_error_)) {
    Close();
    return false;
  }
  sockaddr_in addr = MakeSockaddr(bind_address, port);
  if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    last_error_ = BindError(bind_address, port);
    Close();
    return false;
  }
  return true;
}

bool UdpSocket::OpenForSend() { return Create(); }

bool UdpSocket::JoinGroup(const std::string& group,
                          const std::string& interface_address) {
  ip_mreq mreq{};
  if (inet_pton(AF_INET, group.c_str(), &mreq.imr_multiaddr) != 1) {
    last_error_ = "invalid multicast group: " + group;
    return false;
  }
  if (interface_address.empty()) {
    mreq.imr_interface.s_addr = htonl(INADDR_ANY);
  } else if (inet_pton(AF_INET, interface_address.c_str(),
                       &mreq.imr_interface) != 1) {
    last_error_ = "invalid multicast interface: " + interface_address;
    return false;
  }
  if (::setsockopt(fd_, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) < 0) {
    last_error_ = "setsockopt(IP_ADD_MEMBERSHIP " + group + ") failed: " +
                  std::strerror(errno);
    return false;
  }
  return true;
}

bool UdpSocket::SetMulticastTtl(int ttl) {
  const unsigned char value = static_cast<unsigned char>(ttl);
  if (::setsockopt(fd_, IPPROTO_IP, IP_MULTICAST_TTL, &value, sizeof(value)) < 0) {
    last_error_ = ErrnoString("setsockopt(IP_MULTICAST_TTL)");
    return false;
  }
  return true;
}

bool UdpSocket::SetMulticastInterface(const std::string& interface_address) {
  in_addr addr{};
  if (inet_pton(AF_INET, interface_address.c_str(), &addr) != 1) {
    last_error_ = "invalid multicast interface: " + interface_address;
    return false;
  }
  if (::setsockopt(fd_, IPPROTO_IP, IP_MULTICAST_IF, &addr, sizeof(addr)) < 0) {
    last_error_ = ErrnoString("setsockopt(IP_MULTICAST_IF)");
    return false;
  }
  return true;
}

void UdpSocket::Close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

uint16_t UdpSocket::LocalPort() const { return SocketLocalPort(fd_); }

ssize_t UdpSocket::SendTo(const void* data, size_t length,
                          const sockaddr_in& addr) {
  return ::sendto(fd_, data, length, 0,
                  reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
}

ssize_t UdpSocket::RecvFrom(uint8_t* buffer, size_t length, sockaddr_in* addr,
                            socklen_t* addr_len) {
  return ::recvfrom(fd_, buffer, length, 0,
                    reinterpret_cast<sockaddr*>(addr), addr_len);
}

bool TcpListener::Open(uint16_t port, const std::string& bind_address,
                       int backlog) {
  if (fd_ >= 0) {
    return true;
  }
  fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd_ < 0) {
    last_error_ = ErrnoString("socket()");
    return false;
  }
  if (!SetReuseAddr(fd_, &last_error_)) {
    Close();
    return false;
  }
  sockaddr_in addr = MakeSockaddr(bind_address, port);
  if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    last_error_ = BindError(bind_address, port);
    Close();
    return false;
  }
  if (::listen(fd_, backlog) < 0) {
    last_error_ = ErrnoString("listen()");
    Close();
    return false;
  }
  return true;
}

void TcpListener::Close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

ScopedFd TcpListener::Accept(sockaddr_in* peer) {
  sockaddr_in addr{};
  socklen_t addr_len = sizeof(addr);
  int fd = -1;
  do {
    fd = ::accept4(fd_, reinterpret_cast<sockaddr*>(&addr), &addr_len, SOCK_CLOEXEC);
  } while (fd < 0 && errno == EINTR);
  if (fd < 0) {
    last_error_ = ErrnoString("accept()");
    return ScopedFd();
  }
  if (peer) {
    *peer = addr;
  }
  return ScopedFd(fd);
}

uint16_t TcpListener::LocalPort() const { return SocketLocalPort(fd_); }

WaitResult WaitReadable(int fd, std::chrono::milliseconds timeout) {
  if (fd < 0) {
    return WaitResult::kError;
  }
  fd_set readfds;
  FD_ZERO(&readfds);
  FD_SET(fd, &readfds);
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  const int ready = ::select(fd + 1, &readfds, nullptr, nullptr, &tv);
  if (ready < 0) {
    return errno == EINTR ? WaitResult::kTimeout : WaitResult::kError;
  }
  return ready == 0 ? WaitResult::kTimeout : WaitResult::kReady;
}

RecvStatus RecvSome(int fd, uint8_t* out, size_t length, size_t* received) {
  *received = 0;
  while (true) {
    const ssize_t bytes = ::recv(fd, out, length, 0);
    if (bytes > 0) {
      *received = static_cast<size_t>(bytes);
      return RecvStatus::kOk;
    }
    if (bytes == 0) {
      return RecvStatus::kClosed;
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return RecvStatus::kTimeout;
    }
    return RecvStatus::kError;
  }
}

RecvStatus RecvExact(int fd, uint8_t* out, size_t length, size_t* received) {
  size_t total = 0;
  while (total < length) {
    size_t got = 0;
    const RecvStatus status = RecvSome(fd, out + total, length - total, &got);
    if (status != RecvStatus::kOk) {
      *received = total;
      return status;
    }
    total += got;
  }
  *received = total;
  return RecvStatus::kOk;
}

bool SendAll(int fd, const void* data, size_t length) {
  const uint8_t* cursor = static_cast<const uint8_t*>(data);
  size_t remaining = length;
  while (remaining > 0) {
    const ssize_t sent = ::send(fd, cursor, remaining, MSG_NOSIGNAL);
    if (sent < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    cursor += sent;
    remaining -= static_cast<size_t>(sent);
  }
  return true;
}

bool SendLine(int fd, const std::string& text) {
  const std::string line = text + "\n";
  return SendAll(fd, line.data(), line.size());
}

RecvStatus RecvLine(int fd, size_t max_length, std::string* line) {
  line->clear();
  while (line->size() < max_length) {
    uint8_t byte = 0;
    size_t got = 0;
    const RecvStatus status = RecvSome(fd, &byte, 1, &got);
    if (status != RecvStatus::kOk) {
      // A line cut short by EOF still counts if anything arrived.
      if (status == RecvStatus::kClosed && !line->empty()) {
        break;
      }
      return status;
    }
    if (byte == '\n') {
      break;
    }
    line->push_back(static_cast<char>(byte));
  }
  while (!line->empty() && line->back() == '\r') {
    line->pop_back();
  }
  return RecvStatus::kOk;
}

bool SetSocketTimeouts(int fd, std::chrono::milliseconds timeout) {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
    return false;
  }
  return ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

ScopedFd ConnectTcp(const std::string& host, uint16_t port,
                    std::chrono::milliseconds timeout, std::string* error) {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return ScopedFd();
  };

  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* result = nullptr;
  const std::string service = std::to_string(port);
  const int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &result);
  if (rc != 0 || result == nullptr) {
    return fail("cannot resolve " + host + ": " + gai_strerror(rc));
  }
  sockaddr_in addr{};
  std::memcpy(&addr, result->ai_addr, sizeof(addr));
  ::freeaddrinfo(result);

  ScopedFd fd(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
  if (!fd.valid()) {
    return fail(ErrnoString("socket()"));
  }
  const int flags = ::fcntl(fd.get(), F_GETFL, 0);
  if (flags < 0 || ::fcntl(fd.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
    return fail(ErrnoString("fcntl(O_NONBLOCK)"));
  }
  if (::connect(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    if (errno != EINPROGRESS) {
      return fail(ErrnoString("connect()"));
    }
    fd_set writefds;
    FD_ZERO(&writefds);
    FD_SET(fd.get(), &writefds);
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    const int ready = ::select(fd.get() + 1, nullptr, &writefds, nullptr, &tv);
    if (ready == 0) {
      errno = ETIMEDOUT;
      return fail(ErrnoString("connect()"));
    }
    if (ready < 0) {
      return fail(ErrnoString("select()"));
    }
    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (::getsockopt(fd.get(), SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
      return fail(ErrnoString("getsockopt(SO_ERROR)"));
    }
    if (so_error != 0) {
      errno = so_error;
      return fail(ErrnoString("connect()"));
    }
  }
  if (::fcntl(fd.get(), F_SETFL, flags) < 0) {
    return fail(ErrnoString("fcntl()"));
  }
  return fd;
}

}  // namespace internal
}  // namespace vidsync
