#include "vidsync/controller.h"

#include "logging.h"
#include "vidsync/command_listener.h"
#include "vidsync/playback.h"
#include "vidsync/test_hooks.h"

#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <utility>

namespace vidsync {
namespace {

struct DeviceMetricsAtomic {
  std::atomic<uint64_t> commands_received{0};
  std::atomic<uint64_t> commands_ignored{0};
  std::atomic<uint64_t> transfers_completed{0};
  std::atomic<uint64_t> transfers_rejected{0};
  std::atomic<uint64_t> transfers_failed{0};
  std::atomic<uint64_t> callback_exceptions{0};

  DeviceMetrics Snapshot() const {
    DeviceMetrics snapshot;
    snapshot.commands_received = commands_received.load();
    snapshot.commands_ignored = commands_ignored.load();
    snapshot.transfers_completed = transfers_completed.load();
    snapshot.transfers_rejected = transfers_rejected.load();
    snapshot.transfers_failed = transfers_failed.load();
    snapshot.callback_exceptions = callback_exceptions.load();
    return snapshot;
  }
};

}  // namespace

struct DeviceController::Impl {
  Impl(DeviceConfig config, std::shared_ptr<PlaybackEngine> engine)
      : config_(std::move(config)),
        logger_(config_),
        engine_(engine ? std::move(engine)
                       : std::shared_ptr<PlaybackEngine>(
                             std::make_shared<OmxPlayerEngine>(config_))),
        playback_(engine_, config_),
        listener_(config_),
        transfer_(config_) {
    listener_.SetCommandCallback(
        [this](Command command, const std::string& sender) {
          Dispatch(command, sender);
        });
    transfer_.SetCanReceivePredicate([this]() { return CanReceive(); });
    transfer_.SetTransferCallback(
        [this](const TransferReport& report) { OnTransfer(report); });
  }

  ~Impl() { Stop(); }

  bool Start() {
    start_error_.clear();
    std::string error;
    if (!config_.Validate(&error)) {
      return FailStart(error);
    }
    if (!listener_.Start()) {
      return FailStart(listener_.GetLastError());
    }
    if (!transfer_.Start()) {
      listener_.Stop();
      return FailStart(transfer_.GetLastError());
    }
    logger_.Info("Device ready (media " + config_.media_path + ")");
    return true;
  }

  // Listeners go first so no command can launch a player after playback stops.
  void Stop() {
    listener_.Stop();
    transfer_.Stop();
    if (playback_.Stop() == PlaybackResult::kOk) {
      logger_.Info("Stopped playback on shutdown");
    }
  }

  bool Run() {
    if (!Start()) {
      return false;
    }
    while (!shutdown_requested_.load()) {
      std::this_thread::sleep_for(config_.poll_interval);
      // Notices a player that exited on its own and returns to idle.
      playback_.IsActive();
    }
    logger_.Info("Shutting down");
    Stop();
    return true;
  }

  void RequestShutdown() noexcept { shutdown_requested_.store(true); }

  void SetTransferCallback(TransferCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    user_transfer_cb_ = std::move(cb);
  }

  void Dispatch(Command command, const std::string& sender) {
    ++metrics_.commands_received;
    logger_.Info(std::string("Received ") + CommandName(command) + " from " + sender);
    switch (command) {
      case Command::kPlay:
        StartPlayback(false);
        break;
      case Command::kLoad:
        StartPlayback(true);
        break;
      case Command::kStop:
        playback_.Stop();
        break;
      case Command::kGo:
        playback_.Resume();
        break;
    }
  }

  bool CanReceive() {
    std::lock_guard<std::mutex> gate(gate_mutex_);
    return !playback_.IsActive();
  }

  bool FailStart(const std::string& error) {
    start_error_ = error;
    logger_.Error(error);
    return false;
  }

  // Holding the gate across the check and the start keeps a transfer accept
  // from slipping between them.
  void StartPlayback(bool paused) {
    std::lock_guard<std::mutex> gate(gate_mutex_);
    if (transfer_.IsReceiving()) {
      logger_.Warning(std::string("Cannot ") + (paused ? "load" : "play") +
                      " - file transfer in progress");
      ++metrics_.commands_ignored;
      return;
    }
    if (playback_.IsActive()) {
      logger_.Info("Already playing");
      ++metrics_.commands_ignored;
      return;
    }
    const PlaybackResult result =
        paused ? playback_.Preload(config_.media_path, config_.audio_output)
               : playback_.Start(config_.media_path, config_.audio_output, false);
    if (result != PlaybackResult::kOk) {
      logger_.Warning(std::string(paused ? "Load" : "Play") + " failed: " +
                      PlaybackResultName(result));
    }
  }

  void OnTransfer(const TransferReport& report) {
    switch (report.result) {
      case TransferResult::kCompleted:
        ++metrics_.transfers_completed;
        break;
      case TransferResult::kBusy:
        ++metrics_.transfers_rejected;
        break;
      default:
        ++metrics_.transfers_failed;
        logger_.Warning("Transfer from " + report.peer + " failed: " +
                        TransferResultName(report.result));
        break;
    }
    TransferCallback cb_copy;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      cb_copy = user_transfer_cb_;
    }
    if (!cb_copy) {
      return;
    }
    try {
      cb_copy(report);
    } catch (const std::exception& ex) {
      ++metrics_.callback_exceptions;
      logger_.Error(std::string("transfer callback threw exception: ") + ex.what());
    } catch (...) {
      ++metrics_.callback_exceptions;
      logger_.Error("transfer callback threw exception");
    }
  }

  DeviceMetrics GetMetrics() const {
    DeviceMetrics snapshot = metrics_.Snapshot();
    const uint64_t unrecognized = listener_.UnrecognizedCount();
    snapshot.commands_received += unrecognized;
    snapshot.commands_ignored += unrecognized;
    return snapshot;
  }

  DeviceConfig config_;
  internal::Logger logger_;
  std::shared_ptr<PlaybackEngine> engine_;
  PlaybackManager playback_;
  CommandListener listener_;
  FileTransferServer transfer_;

  std::mutex gate_mutex_;
  std::atomic<bool> shutdown_requested_{false};
  DeviceMetricsAtomic metrics_;
  std::string start_error_;

  std::mutex callback_mutex_;
  TransferCallback user_transfer_cb_;
};

DeviceController::DeviceController(DeviceConfig config)
    : impl_(new Impl(std::move(config), nullptr)) {}

DeviceController::DeviceController(DeviceConfig config,
                                   std::shared_ptr<PlaybackEngine> engine)
    : impl_(new Impl(std::move(config), std::move(engine))) {}

DeviceController::~DeviceController() = default;

bool DeviceController::Start() { return impl_->Start(); }

void DeviceController::Stop() { impl_->Stop(); }

bool DeviceController::Run() { return impl_->Run(); }

void DeviceController::RequestShutdown() noexcept { impl_->RequestShutdown(); }

void DeviceController::SetTransferCallback(TransferCallback cb) {
  impl_->SetTransferCallback(std::move(cb));
}

PlaybackStatus DeviceController::GetPlaybackStatus() const {
  return impl_->playback_.GetStatus();
}

bool DeviceController::IsTransferInProgress() const {
  return impl_->transfer_.IsReceiving();
}

uint16_t DeviceController::CommandPort() const {
  return impl_->listener_.BoundPort();
}

uint16_t DeviceController::TransferPort() const {
  return impl_->transfer_.BoundPort();
}

const DeviceConfig& DeviceController::config() const { return impl_->config_; }

std::string DeviceController::GetLastError() const { return impl_->start_error_; }

DeviceMetrics DeviceController::GetMetrics() const { return impl_->GetMetrics(); }

#ifdef VIDSYNC_TESTING
namespace test {

void DispatchCommand(DeviceController& controller, Command command) {
  controller.impl_->Dispatch(command, "test");
}

bool CanReceiveFile(DeviceController& controller) {
  return controller.impl_->CanReceive();
}

}  // namespace test
#endif

}  // namespace vidsync
