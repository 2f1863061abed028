#pragma once

#include "vidsync/engine.h"
#include "vidsync/vidsync.h"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace vidsync {

namespace internal {
class Logger;
}  // namespace internal

/**
 * Owns the lifecycle of at most one playback session.
 *
 * All state transitions happen under a single mutex, so the manager can be
 * driven from the command thread while the transfer thread polls IsActive().
 */
class PlaybackManager {
 public:
  PlaybackManager(std::shared_ptr<PlaybackEngine> engine,
                  const DeviceConfig& config);
  ~PlaybackManager();

  PlaybackManager(const PlaybackManager&) = delete;
  PlaybackManager& operator=(const PlaybackManager&) = delete;

  /**
   * Launch a session. With paused set, the session is paused after the
   * preload grace period and ends up Loaded instead of Playing.
   */
  PlaybackResult Start(const std::string& media_path, AudioOutput audio,
                       bool paused);
  /// Start(media_path, audio, true).
  PlaybackResult Preload(const std::string& media_path, AudioOutput audio);
  /// Unpause a Loaded session.
  PlaybackResult Resume();
  /// Quit the session, force-killing it after the stop timeout. Idempotent.
  PlaybackResult Stop();
  /// Poll engine liveness, returning to Idle if the engine exited on its own.
  bool IsActive();
  PlaybackStatus GetStatus() const;

 private:
  void ClearSessionLocked();

  std::shared_ptr<PlaybackEngine> engine_;
  std::chrono::milliseconds preload_grace_;
  std::chrono::milliseconds stop_timeout_;
  std::unique_ptr<internal::Logger> logger_;

  mutable std::mutex mutex_;
  PlaybackStatus status_ = PlaybackStatus::kIdle;
  SessionHandle handle_;
};

}  // namespace vidsync
