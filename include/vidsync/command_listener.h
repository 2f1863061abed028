#pragma once

#include "vidsync/vidsync.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace vidsync {

/**
 * Receives command datagrams on the multicast group and dispatches them.
 */
class CommandListener {
 public:
  /// Invoked on the listener thread with the parsed command and "ip:port".
  using CommandCallback =
      std::function<void(Command command, const std::string& sender)>;

  explicit CommandListener(const DeviceConfig& config);
  /// Stop the receive thread and close the socket.
  ~CommandListener();

  CommandListener(const CommandListener&) = delete;
  CommandListener& operator=(const CommandListener&) = delete;

  /// Set the dispatch callback. Must be called before Start().
  void SetCommandCallback(CommandCallback cb);

  /// Bind, join the group and start the receive thread.
  bool Start();
  /// Close the socket and join the receive thread.
  void Stop();
  bool IsRunning() const;

  /// Port the socket is bound to (useful when configured with port 0).
  uint16_t BoundPort() const;
  /// Return the last Start() error message, if any.
  std::string GetLastError() const;
  /// Number of datagrams dropped as unrecognized commands.
  uint64_t UnrecognizedCount() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace vidsync
