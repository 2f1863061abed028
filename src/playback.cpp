#include "vidsync/playback.h"

#include "logging.h"

#include <thread>
#include <utility>

#include <sys/stat.h>

namespace vidsync {
namespace {

// Interval between liveness checks while waiting for a graceful exit.
constexpr std::chrono::milliseconds kExitPollInterval{50};

bool FileExists(const std::string& path) {
  struct stat st {};
  return ::stat(path.c_str(), &st) == 0;
}

}  // namespace

PlaybackManager::PlaybackManager(std::shared_ptr<PlaybackEngine> engine,
                                 const DeviceConfig& config)
    : engine_(std::move(engine)),
      preload_grace_(config.preload_grace),
      stop_timeout_(config.stop_timeout),
      logger_(new internal::Logger(config)) {}

PlaybackManager::~PlaybackManager() = default;

PlaybackResult PlaybackManager::Start(const std::string& media_path,
                                      AudioOutput audio, bool paused) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (handle_.valid()) {
    logger_->Warning("Already playing");
    return PlaybackResult::kAlreadyActive;
  }
  if (!FileExists(media_path)) {
    logger_->Error("Video file not found: " + media_path);
    return PlaybackResult::kMediaNotFound;
  }

  logger_->Info(std::string("Starting playback of ") + media_path + " (audio " +
                AudioOutputName(audio) + (paused ? ", paused)" : ")"));
  std::string error;
  const std::optional<SessionHandle> handle =
      engine_->Launch(media_path, audio, &error);
  if (!handle.has_value() || !handle->valid()) {
    logger_->Error("Failed to start player: " + error);
    return PlaybackResult::kEngineSpawnFailure;
  }
  handle_ = handle.value();
  status_ = PlaybackStatus::kPlaying;

  if (paused) {
    // The engine only reads control input once it has initialized and there
    // is no ready signal, so this is a fixed wait rather than a handshake.
    std::this_thread::sleep_for(preload_grace_);
    if (!engine_->SendControl(handle_, ControlInstruction::kPause)) {
      logger_->Error("Failed to send pause to player");
    } else {
      status_ = PlaybackStatus::kLoaded;
      logger_->Info("Video loaded and paused");
    }
  }
  return PlaybackResult::kOk;
}

PlaybackResult PlaybackManager::Preload(const std::string& media_path,
                                        AudioOutput audio) {
  return Start(media_path, audio, true);
}

PlaybackResult PlaybackManager::Resume() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!handle_.valid()) {
    logger_->Warning("No video loaded");
    return PlaybackResult::kNotLoaded;
  }
  if (status_ != PlaybackStatus::kLoaded) {
    logger_->Warning("Video not in paused state");
    return PlaybackResult::kNotLoaded;
  }
  if (!engine_->SendControl(handle_, ControlInstruction::kResume)) {
    logger_->Error("Failed to send resume to player");
    return PlaybackResult::kNotLoaded;
  }
  status_ = PlaybackStatus::kPlaying;
  logger_->Info("Playback started");
  return PlaybackResult::kOk;
}

PlaybackResult PlaybackManager::Stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!handle_.valid()) {
    return PlaybackResult::kNothingToStop;
  }
  if (!engine_->SendControl(handle_, ControlInstruction::kQuit)) {
    logger_->Warning("Failed to send quit to player");
  }
  const auto deadline = std::chrono::steady_clock::now() + stop_timeout_;
  bool alive = engine_->IsAlive(handle_);
  while (alive && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(kExitPollInterval);
    alive = engine_->IsAlive(handle_);
  }
  if (alive) {
    logger_->Warning("Player did not exit, killing its process group");
    engine_->ForceTerminate(handle_);
  }
  ClearSessionLocked();
  logger_->Info("Playback stopped");
  return PlaybackResult::kOk;
}

bool PlaybackManager::IsActive() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!handle_.valid()) {
    return false;
  }
  if (engine_->IsAlive(handle_)) {
    return true;
  }
  logger_->Info("Player exited");
  ClearSessionLocked();
  return false;
}

PlaybackStatus PlaybackManager::GetStatus() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_;
}

void PlaybackManager::ClearSessionLocked() {
  engine_->Release(handle_);
  handle_ = SessionHandle{};
  status_ = PlaybackStatus::kIdle;
}

}  // namespace vidsync
