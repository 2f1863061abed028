#pragma once

#include "vidsync/vidsync.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace vidsync {

/**
 * Opaque reference to a running engine instance.
 */
struct SessionHandle {
  int64_t id = -1;

  bool valid() const { return id >= 0; }
};

/**
 * Instructions written to a session's control channel.
 */
enum class ControlInstruction {
  kPause,
  kResume,
  kQuit,
};

/**
 * Capability for launching and controlling an external playback engine.
 *
 * Implementations must be safe to call from the thread that owns the
 * PlaybackManager lock; they are never called concurrently for one handle.
 */
class PlaybackEngine {
 public:
  virtual ~PlaybackEngine() = default;

  /**
   * Launch the engine for a media file.
   *
   * @param error Optional output describing why the launch failed.
   * @return a handle for the new session, or std::nullopt on spawn failure.
   */
  virtual std::optional<SessionHandle> Launch(const std::string& media_path,
                                              AudioOutput audio,
                                              std::string* error) = 0;
  /// Write an instruction to the session's control channel.
  virtual bool SendControl(const SessionHandle& handle,
                           ControlInstruction instruction) = 0;
  /// Return true while the engine process has not exited.
  virtual bool IsAlive(const SessionHandle& handle) = 0;
  /// Kill the session's entire process group and reap it.
  virtual void ForceTerminate(const SessionHandle& handle) = 0;
  /// Close the control channel and forget the handle.
  virtual void Release(const SessionHandle& handle) = 0;
};

/**
 * Engine that runs an omxplayer-compatible binary in its own process group,
 * controlled through a FIFO attached to its stdin.
 */
class OmxPlayerEngine : public PlaybackEngine {
 public:
  explicit OmxPlayerEngine(const DeviceConfig& config);
  ~OmxPlayerEngine() override;

  OmxPlayerEngine(const OmxPlayerEngine&) = delete;
  OmxPlayerEngine& operator=(const OmxPlayerEngine&) = delete;

  std::optional<SessionHandle> Launch(const std::string& media_path,
                                      AudioOutput audio,
                                      std::string* error) override;
  bool SendControl(const SessionHandle& handle,
                   ControlInstruction instruction) override;
  bool IsAlive(const SessionHandle& handle) override;
  void ForceTerminate(const SessionHandle& handle) override;
  void Release(const SessionHandle& handle) override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace vidsync
