#include "vidsync/command_listener.h"

#include "logging.h"
#include "net.h"

#include <array>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <utility>

namespace vidsync {
namespace {

// Commands are a few bytes; anything larger is truncated and rejected.
constexpr size_t kMaxDatagramSize = 1024;

}  // namespace

struct CommandListener::Impl {
  explicit Impl(const DeviceConfig& config) : config_(config), logger_(config) {}

  ~Impl() { Stop(); }

  void SetCommandCallback(CommandCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    command_cb_ = std::move(cb);
  }

  bool Start() {
    if (running_.exchange(true)) {
      return true;
    }
    start_error_.clear();
    if (!socket_.Open(config_.multicast_port, config_.bind_address)) {
      return FailStart(socket_.last_error());
    }
    if (!socket_.JoinGroup(config_.multicast_group, config_.multicast_interface)) {
      socket_.Close();
      return FailStart(socket_.last_error());
    }
    bound_port_ = socket_.LocalPort();
    try {
      recv_thread_ = std::thread([this]() { RecvLoop(); });
    } catch (const std::exception& ex) {
      socket_.Close();
      return FailStart(std::string("thread start failed: ") + ex.what());
    }
    logger_.Info("Listening for multicast on " + config_.multicast_group + ":" +
                 std::to_string(bound_port_.load()));
    return true;
  }

  void Stop() {
    if (!running_.exchange(false)) {
      return;
    }
    // The loop observes running_ within one poll interval.
    if (recv_thread_.joinable()) {
      recv_thread_.join();
    }
    socket_.Close();
  }

  bool IsRunning() const { return running_; }
  uint16_t BoundPort() const { return bound_port_; }
  std::string GetLastError() const { return start_error_; }
  uint64_t UnrecognizedCount() const { return unrecognized_; }

 private:
  bool FailStart(const std::string& error) {
    start_error_ = error;
    logger_.Error(error);
    running_ = false;
    return false;
  }

  void RecvLoop() {
    std::array<uint8_t, kMaxDatagramSize> buffer{};
    while (running_) {
      const internal::WaitResult wait =
          internal::WaitReadable(socket_.fd(), config_.poll_interval);
      if (wait == internal::WaitResult::kTimeout) {
        continue;
      }
      if (wait == internal::WaitResult::kError) {
        if (running_) {
          logger_.Error(internal::ErrnoString("Multicast select()"));
          std::this_thread::sleep_for(config_.poll_interval);
        }
        continue;
      }
      sockaddr_in addr{};
      socklen_t addr_len = sizeof(addr);
      const ssize_t bytes =
          socket_.RecvFrom(buffer.data(), buffer.size(), &addr, &addr_len);
      if (bytes < 0) {
        if (running_) {
          logger_.Error(internal::ErrnoString("Multicast receive"));
        }
        continue;
      }
      const std::string payload(reinterpret_cast<const char*>(buffer.data()),
                                static_cast<size_t>(bytes));
      HandleDatagram(payload, internal::AddrToString(addr));
    }
  }

  void HandleDatagram(const std::string& payload, const std::string& sender) {
    logger_.Debug("Received from " + sender + ": " + payload);
    const std::optional<Command> command = ParseCommand(payload);
    if (!command.has_value()) {
      logger_.Debug("Unknown command: " + payload);
      ++unrecognized_;
      return;
    }
    CommandCallback cb_copy;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      cb_copy = command_cb_;
    }
    if (!cb_copy) {
      return;
    }
    try {
      cb_copy(command.value(), sender);
    } catch (const std::exception& ex) {
      logger_.Error(std::string("command callback threw exception: ") + ex.what());
    } catch (...) {
      logger_.Error("command callback threw exception");
    }
  }

  DeviceConfig config_;
  internal::Logger logger_;
  internal::UdpSocket socket_;
  std::atomic<bool> running_{false};
  std::thread recv_thread_;
  std::atomic<uint16_t> bound_port_{0};
  std::atomic<uint64_t> unrecognized_{0};
  std::string start_error_;

  std::mutex callback_mutex_;
  CommandCallback command_cb_;
};

CommandListener::CommandListener(const DeviceConfig& config)
    : impl_(new Impl(config)) {}

CommandListener::~CommandListener() = default;

void CommandListener::SetCommandCallback(CommandCallback cb) {
  impl_->SetCommandCallback(std::move(cb));
}

bool CommandListener::Start() { return impl_->Start(); }

void CommandListener::Stop() { impl_->Stop(); }

bool CommandListener::IsRunning() const { return impl_->IsRunning(); }

uint16_t CommandListener::BoundPort() const { return impl_->BoundPort(); }

std::string CommandListener::GetLastError() const {
  return impl_->GetLastError();
}

uint64_t CommandListener::UnrecognizedCount() const {
  return impl_->UnrecognizedCount();
}

}  // namespace vidsync
