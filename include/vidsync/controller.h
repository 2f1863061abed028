#pragma once

#include "vidsync/engine.h"
#include "vidsync/file_transfer.h"
#include "vidsync/vidsync.h"

#include <memory>
#include <string>

namespace vidsync {

class DeviceController;

#ifdef VIDSYNC_TESTING
namespace test {
void DispatchCommand(DeviceController& controller, Command command);
bool CanReceiveFile(DeviceController& controller);
}  // namespace test
#endif

/**
 * Process-wide orchestrator for one playback device.
 *
 * Routes multicast commands to the playback session while enforcing that a
 * file transfer and a playback session never overlap.
 */
class DeviceController {
 public:
  using TransferCallback = FileTransferServer::TransferCallback;

  /// Construct a controller driving an OmxPlayerEngine.
  explicit DeviceController(DeviceConfig config);
  /// Construct a controller driving the provided engine.
  DeviceController(DeviceConfig config, std::shared_ptr<PlaybackEngine> engine);
  /// Stop playback, both listeners and their threads.
  ~DeviceController();

  DeviceController(const DeviceController&) = delete;
  DeviceController& operator=(const DeviceController&) = delete;

  /// Validate the config, bind both listeners and start their threads.
  bool Start();
  /// Stop playback and both listeners; joins their threads.
  void Stop();
  /**
   * Start, then block until RequestShutdown() is observed, then stop.
   *
   * @return false if startup failed.
   */
  bool Run();
  /// Ask Run() to return. Async-signal-safe.
  void RequestShutdown() noexcept;

  /// Set callback invoked after each transfer connection closes.
  void SetTransferCallback(TransferCallback cb);

  PlaybackStatus GetPlaybackStatus() const;
  bool IsTransferInProgress() const;
  /// Bound command port (0 before Start()).
  uint16_t CommandPort() const;
  /// Bound transfer port (0 before Start()).
  uint16_t TransferPort() const;
  const DeviceConfig& config() const;
  /// Return the last Start() error message, if any.
  std::string GetLastError() const;
  /// Return counters for commands and transfers.
  DeviceMetrics GetMetrics() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

#ifdef VIDSYNC_TESTING
  friend void test::DispatchCommand(DeviceController& controller,
                                    Command command);
  friend bool test::CanReceiveFile(DeviceController& controller);
#endif
};

}  // namespace vidsync
