#include "vidsync/file_transfer.h"

#include "logging.h"
#include "net.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <exception>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <stdio.h>
#include <unistd.h>

namespace vidsync {
namespace {

// Only one connection is served at a time; later ones wait in the backlog.
constexpr int kListenBacklog = 1;

bool WriteAll(int fd, const uint8_t* data, size_t length) {
  size_t written = 0;
  while (written < length) {
    const ssize_t result = ::write(fd, data + written, length - written);
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    written += static_cast<size_t>(result);
  }
  return true;
}

TransferResult FromRecvStatus(internal::RecvStatus status) {
  return status == internal::RecvStatus::kTimeout
             ? TransferResult::kConnectionTimeout
             : TransferResult::kPartialTransfer;
}

}  // namespace

struct FileTransferServer::Impl {
  explicit Impl(const DeviceConfig& config)
      : config_(config),
        logger_(config),
        staging_path_(config.EffectiveStagingPath()) {}

  ~Impl() { Stop(); }

  void SetCanReceivePredicate(CanReceivePredicate predicate) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    can_receive_ = std::move(predicate);
  }

  void SetTransferCallback(TransferCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    transfer_cb_ = std::move(cb);
  }

  bool Start() {
    if (running_.exchange(true)) {
      return true;
    }
    start_error_.clear();
    if (!listener_.Open(config_.transfer_port, config_.bind_address,
                        kListenBacklog)) {
      return FailStart(listener_.last_error());
    }
    bound_port_ = listener_.LocalPort();
    try {
      accept_thread_ = std::thread([this]() { AcceptLoop(); });
    } catch (const std::exception& ex) {
      listener_.Close();
      return FailStart(std::string("thread start failed: ") + ex.what());
    }
    logger_.Info("File receiver listening on port " +
                 std::to_string(bound_port_.load()));
    return true;
  }

  void Stop() {
    if (!running_.exchange(false)) {
      return;
    }
    {
      // Unblock a transfer waiting on its socket; it ends as a failed transfer.
      std::lock_guard<std::mutex> lock(state_mutex_);
      if (active_fd_ >= 0) {
        ::shutdown(active_fd_, SHUT_RDWR);
      }
    }
    if (accept_thread_.joinable()) {
      accept_thread_.join();
    }
    listener_.Close();
  }

  bool IsRunning() const { return running_; }

  bool IsReceiving() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return receiving_;
  }

  uint16_t BoundPort() const { return bound_port_; }
  std::string GetLastError() const { return start_error_; }

 private:
  bool FailStart(const std::string& error) {
    start_error_ = error;
    logger_.Error(error);
    running_ = false;
    return false;
  }

  void AcceptLoop() {
    while (running_) {
      const internal::WaitResult wait =
          internal::WaitReadable(listener_.fd(), config_.poll_interval);
      if (wait == internal::WaitResult::kTimeout) {
        continue;
      }
      if (wait == internal::WaitResult::kError) {
        if (running_) {
          logger_.Error(internal::ErrnoString("File receiver select()"));
          std::this_thread::sleep_for(config_.poll_interval);
        }
        continue;
      }
      if (!running_) {
        break;
      }
      sockaddr_in peer{};
      internal::ScopedFd conn = listener_.Accept(&peer);
      if (!conn.valid()) {
        if (running_) {
          logger_.Error("File receiver error: " + listener_.last_error());
        }
        continue;
      }
      TransferReport report;
      report.peer = internal::AddrToString(peer);
      const bool served = HandleConnection(conn.get(), &report);
      conn.reset();
      if (served) {
        NotifyTransfer(report);
      }
    }
  }

  enum class Admission {
    kAccepted,
    kBusy,
    kStopping,
  };

  // Returns false if the connection was dropped because the server is stopping.
  bool HandleConnection(int fd, TransferReport* report) {
    const std::string& peer = report->peer;
    const Admission admission = BeginTransfer(fd);
    if (admission == Admission::kStopping) {
      logger_.Info("Refusing file transfer from " + peer + " - shutting down");
      SendReply(fd, kReplyError);
      EndTransfer();
      return false;
    }
    if (admission == Admission::kBusy) {
      logger_.Warning("Rejecting file transfer from " + peer +
                      " - playback in progress");
      SendReply(fd, kReplyBusy);
      EndTransfer();
      report->result = TransferResult::kBusy;
      return true;
    }

    logger_.Info("Accepting file transfer from " + peer);
    if (!internal::SetSocketTimeouts(fd, config_.transfer_timeout)) {
      logger_.Warning(internal::ErrnoString("setsockopt(SO_RCVTIMEO)"));
    }
    if (!internal::SendLine(fd, kReplyReady)) {
      logger_.Error(internal::ErrnoString("send(READY)"));
      EndTransfer();
      report->result = TransferResult::kPartialTransfer;
      return true;
    }
    report->result = ReceiveFile(fd, report);
    EndTransfer();
    return true;
  }

  // Marks the transfer in progress before asking the predicate, so a start
  // racing with this accept either sees the flag or is seen by the predicate.
  // Stop() clears running_ before it takes state_mutex_, so either it sees
  // active_fd_ here or this sees running_ false.
  Admission BeginTransfer(int fd) {
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      active_fd_ = fd;
      if (!running_) {
        return Admission::kStopping;
      }
      receiving_ = true;
    }
    if (EvaluatePredicate()) {
      return Admission::kAccepted;
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    receiving_ = false;
    return Admission::kBusy;
  }

  bool EvaluatePredicate() {
    CanReceivePredicate predicate;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      predicate = can_receive_;
    }
    if (!predicate) {
      return true;
    }
    try {
      return predicate();
    } catch (const std::exception& ex) {
      logger_.Error(std::string("can-receive predicate threw exception: ") +
                    ex.what());
      return false;
    }
  }

  void EndTransfer() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    receiving_ = false;
    active_fd_ = -1;
  }

  TransferResult ReceiveFile(int fd, TransferReport* report) {
    std::array<uint8_t, kLengthHeaderSize> header{};
    size_t header_bytes = 0;
    const internal::RecvStatus header_status =
        internal::RecvExact(fd, header.data(), header.size(), &header_bytes);
    if (header_status != internal::RecvStatus::kOk) {
      logger_.Error("Failed to receive file size (" +
                    std::to_string(header_bytes) + " of " +
                    std::to_string(kLengthHeaderSize) + " bytes)");
      SendReply(fd, kReplyError);
      return header_status == internal::RecvStatus::kTimeout
                 ? TransferResult::kConnectionTimeout
                 : TransferResult::kProtocolError;
    }
    const uint64_t declared = DecodeLengthHeader(header.data());
    report->declared_bytes = declared;
    logger_.Info("Receiving file of " + std::to_string(declared) + " bytes");

    internal::ScopedFd file(::open(staging_path_.c_str(),
                                   O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!file.valid()) {
      logger_.Error(internal::ErrnoString(("open(" + staging_path_ + ")").c_str()));
      SendReply(fd, kReplyError);
      return TransferResult::kIoError;
    }

    std::vector<uint8_t> buffer(config_.transfer_chunk_size);
    uint64_t received = 0;
    TransferResult result = TransferResult::kCompleted;
    while (received < declared) {
      const size_t want = static_cast<size_t>(
          std::min<uint64_t>(buffer.size(), declared - received));
      size_t got = 0;
      const internal::RecvStatus status =
          internal::RecvSome(fd, buffer.data(), want, &got);
      if (status != internal::RecvStatus::kOk) {
        result = FromRecvStatus(status);
        break;
      }
      if (!WriteAll(file.get(), buffer.data(), got)) {
        logger_.Error(internal::ErrnoString(("write(" + staging_path_ + ")").c_str()));
        result = TransferResult::kIoError;
        break;
      }
      received += got;
    }
    report->received_bytes = received;

    if (result == TransferResult::kCompleted && ::fsync(file.get()) < 0) {
      logger_.Error(internal::ErrnoString(("fsync(" + staging_path_ + ")").c_str()));
      result = TransferResult::kIoError;
    }
    if (::close(file.release()) < 0 && result == TransferResult::kCompleted) {
      logger_.Error(internal::ErrnoString(("close(" + staging_path_ + ")").c_str()));
      result = TransferResult::kIoError;
    }

    if (result == TransferResult::kCompleted) {
      if (::rename(staging_path_.c_str(), config_.media_path.c_str()) == 0) {
        logger_.Info("File received successfully: " + config_.media_path);
        SendReply(fd, kReplyOk);
        return result;
      }
      logger_.Error(internal::ErrnoString(
          ("rename(" + staging_path_ + ", " + config_.media_path + ")").c_str()));
      result = TransferResult::kIoError;
    } else if (result != TransferResult::kIoError) {
      logger_.Error("Incomplete transfer: " + std::to_string(received) + "/" +
                    std::to_string(declared) + " (" + TransferResultName(result) +
                    ")");
    }
    SendReply(fd, kReplyError);
    RemoveStaging();
    return result;
  }

  void SendReply(int fd, const char* reply) {
    if (!internal::SendLine(fd, reply)) {
      logger_.Debug(internal::ErrnoString(
          (std::string("send(") + reply + ")").c_str()));
    }
  }

  void RemoveStaging() {
    if (::unlink(staging_path_.c_str()) < 0 && errno != ENOENT) {
      logger_.Warning(internal::ErrnoString(("unlink(" + staging_path_ + ")").c_str()));
    }
  }

  void NotifyTransfer(const TransferReport& report) {
    TransferCallback cb_copy;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      cb_copy = transfer_cb_;
    }
    if (!cb_copy) {
      return;
    }
    try {
      cb_copy(report);
    } catch (const std::exception& ex) {
      logger_.Error(std::string("transfer callback threw exception: ") + ex.what());
    }
  }

  DeviceConfig config_;
  internal::Logger logger_;
  std::string staging_path_;
  internal::TcpListener listener_;
  std::atomic<bool> running_{false};
  std::thread accept_thread_;
  std::atomic<uint16_t> bound_port_{0};
  std::string start_error_;

  mutable std::mutex state_mutex_;
  bool receiving_ = false;
  int active_fd_ = -1;

  std::mutex callback_mutex_;
  CanReceivePredicate can_receive_;
  TransferCallback transfer_cb_;
};

FileTransferServer::FileTransferServer(const DeviceConfig& config)
    : impl_(new Impl(config)) {}

FileTransferServer::~FileTransferServer() = default;

void FileTransferServer::SetCanReceivePredicate(CanReceivePredicate predicate) {
  impl_->SetCanReceivePredicate(std::move(predicate));
}

void FileTransferServer::SetTransferCallback(TransferCallback cb) {
  impl_->SetTransferCallback(std::move(cb));
}

bool FileTransferServer::Start() { return impl_->Start(); }

void FileTransferServer::Stop() { impl_->Stop(); }

bool FileTransferServer::IsRunning() const { return impl_->IsRunning(); }

bool FileTransferServer::IsReceiving() const { return impl_->IsReceiving(); }

uint16_t FileTransferServer::BoundPort() const { return impl_->BoundPort(); }

std::string FileTransferServer::GetLastError() const {
  return impl_->GetLastError();
}

}  // namespace vidsync
