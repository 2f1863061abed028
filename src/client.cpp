#include "vidsync/client.h"

#include "net.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace vidsync {
namespace {

// Handshake and reply lines are a single short word.
constexpr size_t kMaxReplyLength = 64;

}  // namespace

const char* SendFileResultName(SendFileResult result) {
  switch (result) {
    case SendFileResult::kOk:
      return "ok";
    case SendFileResult::kFileNotFound:
      return "file not found";
    case SendFileResult::kConnectionFailed:
      return "connection failed";
    case SendFileResult::kBusy:
      return "busy";
    case SendFileResult::kUnexpectedResponse:
      return "unexpected response";
    case SendFileResult::kTimeout:
      return "timeout";
    case SendFileResult::kTransferFailed:
      return "transfer failed";
  }
  return "unknown";
}

bool SendCommand(Command command, const std::string& group, uint16_t port,
                 const ClientOptions& options, std::string* error) {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (!internal::IsValidIpv4(group)) {
    return fail("invalid group address: " + group);
  }
  internal::UdpSocket socket;
  if (!socket.OpenForSend()) {
    return fail(socket.last_error());
  }
  if (!socket.SetMulticastTtl(options.multicast_ttl)) {
    return fail(socket.last_error());
  }
  if (!options.multicast_interface.empty() &&
      !socket.SetMulticastInterface(options.multicast_interface)) {
    return fail(socket.last_error());
  }
  const std::string payload = CommandName(command);
  const sockaddr_in addr = internal::MakeSockaddr(group, port);
  const ssize_t sent = socket.SendTo(payload.data(), payload.size(), addr);
  if (sent != static_cast<ssize_t>(payload.size())) {
    return fail(internal::ErrnoString("sendto()"));
  }
  return true;
}

SendFileResult SendFile(const std::string& path, const std::string& host,
                        uint16_t port, const ClientOptions& options,
                        std::string* error) {
  auto fail = [&](SendFileResult result, const std::string& message) {
    if (error) {
      *error = message;
    }
    return result;
  };

  struct stat st {};
  if (::stat(path.c_str(), &st) < 0 || !S_ISREG(st.st_mode)) {
    return fail(SendFileResult::kFileNotFound, "File not found: " + path);
  }
  internal::ScopedFd file(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (!file.valid()) {
    return fail(SendFileResult::kFileNotFound,
                internal::ErrnoString(("open(" + path + ")").c_str()));
  }
  const uint64_t total = static_cast<uint64_t>(st.st_size);

  std::string connect_error;
  internal::ScopedFd sock =
      internal::ConnectTcp(host, port, options.connect_timeout, &connect_error);
  if (!sock.valid()) {
    return fail(SendFileResult::kConnectionFailed, connect_error);
  }
  if (!internal::SetSocketTimeouts(sock.get(), options.connect_timeout)) {
    return fail(SendFileResult::kConnectionFailed,
                internal::ErrnoString("setsockopt(SO_RCVTIMEO)"));
  }

  std::string line;
  internal::RecvStatus status =
      internal::RecvLine(sock.get(), kMaxReplyLength, &line);
  if (status == internal::RecvStatus::kTimeout) {
    return fail(SendFileResult::kTimeout, "timed out waiting for handshake");
  }
  if (status != internal::RecvStatus::kOk) {
    return fail(SendFileResult::kConnectionFailed,
                "connection closed before handshake");
  }
  if (line == kReplyBusy) {
    return fail(SendFileResult::kBusy, "device is busy (playback in progress)");
  }
  if (line != kReplyReady) {
    return fail(SendFileResult::kUnexpectedResponse,
                "unexpected response: " + line);
  }

  auto send_failure = [&](const char* what) {
    const bool timed_out = errno == EAGAIN || errno == EWOULDBLOCK;
    return fail(timed_out ? SendFileResult::kTimeout
                          : SendFileResult::kTransferFailed,
                internal::ErrnoString(what));
  };

  std::array<uint8_t, kLengthHeaderSize> header{};
  EncodeLengthHeader(total, header.data());
  if (!internal::SendAll(sock.get(), header.data(), header.size())) {
    return send_failure("send(length)");
  }

  std::vector<uint8_t> buffer(std::max<size_t>(options.chunk_size, 1));
  uint64_t sent = 0;
  while (sent < total) {
    const size_t want =
        static_cast<size_t>(std::min<uint64_t>(buffer.size(), total - sent));
    const ssize_t bytes = ::read(file.get(), buffer.data(), want);
    if (bytes < 0) {
      if (errno == EINTR) {
        continue;
      }
      return fail(SendFileResult::kTransferFailed,
                  internal::ErrnoString(("read(" + path + ")").c_str()));
    }
    if (bytes == 0) {
      return fail(SendFileResult::kTransferFailed,
                  "file shrank during transfer: " + path);
    }
    if (!internal::SendAll(sock.get(), buffer.data(), static_cast<size_t>(bytes))) {
      return send_failure("send(data)");
    }
    sent += static_cast<uint64_t>(bytes);
    if (options.progress_callback) {
      options.progress_callback(sent, total);
    }
  }

  if (!internal::SetSocketTimeouts(sock.get(), options.reply_timeout)) {
    return fail(SendFileResult::kTransferFailed,
                internal::ErrnoString("setsockopt(SO_RCVTIMEO)"));
  }
  status = internal::RecvLine(sock.get(), kMaxReplyLength, &line);
  if (status == internal::RecvStatus::kTimeout) {
    return fail(SendFileResult::kTimeout, "timed out waiting for confirmation");
  }
  if (status != internal::RecvStatus::kOk) {
    return fail(SendFileResult::kTransferFailed,
                "connection closed before confirmation");
  }
  if (line != kReplyOk) {
    return fail(SendFileResult::kTransferFailed, "device reported: " + line);
  }
  return SendFileResult::kOk;
}

}  // namespace vidsync
