#pragma once

#include "vidsync/vidsync.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace vidsync {

/**
 * TCP server that receives replacement media files, one connection at a time.
 *
 * A connection is answered READY only when the can-receive predicate holds;
 * the payload is streamed to the staging path and renamed onto the media path
 * once every declared byte has arrived.
 */
class FileTransferServer {
 public:
  using CanReceivePredicate = std::function<bool()>;
  using TransferCallback = std::function<void(const TransferReport&)>;

  explicit FileTransferServer(const DeviceConfig& config);
  /// Stop the accept thread and close the socket.
  ~FileTransferServer();

  FileTransferServer(const FileTransferServer&) = delete;
  FileTransferServer& operator=(const FileTransferServer&) = delete;

  /// Predicate evaluated for each connection (default: always true).
  void SetCanReceivePredicate(CanReceivePredicate predicate);
  /// Callback invoked on the server thread after each connection closes.
  void SetTransferCallback(TransferCallback cb);

  /// Bind, listen and start the accept thread.
  bool Start();
  /// Close the socket and join the accept thread.
  void Stop();
  bool IsRunning() const;

  /// True from accept until the connection closes; false once BUSY is decided.
  bool IsReceiving() const;

  /// Port the socket is bound to (useful when configured with port 0).
  uint16_t BoundPort() const;
  /// Return the last Start() error message, if any.
  std::string GetLastError() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace vidsync
