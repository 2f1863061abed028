#pragma once

#include "vidsync/vidsync.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace vidsync {

/**
 * Outcome of pushing a file to a device.
 */
enum class SendFileResult {
  kOk,
  kFileNotFound,
  kConnectionFailed,
  /// Device answered BUSY (playback in progress).
  kBusy,
  /// Handshake line was neither READY nor BUSY.
  kUnexpectedResponse,
  kTimeout,
  /// Device answered ERROR, or the connection broke mid-transfer.
  kTransferFailed,
};

const char* SendFileResultName(SendFileResult result);

struct ClientOptions {
  using ProgressCallback = std::function<void(uint64_t sent, uint64_t total)>;

  /// Multicast TTL for command datagrams.
  int multicast_ttl = 2;
  /// Local interface address for outgoing multicast (empty means default).
  std::string multicast_interface;
  /// Connect and handshake timeout.
  std::chrono::milliseconds connect_timeout{10000};
  /// Wait for the final OK/ERROR after the payload is sent.
  std::chrono::milliseconds reply_timeout{30000};
  size_t chunk_size = kDefaultChunkSize;
  /// Optional progress callback, invoked after each chunk.
  ProgressCallback progress_callback;
};

/**
 * Send one command datagram to a group (or unicast address).
 *
 * @param error Optional output string describing the failure.
 */
bool SendCommand(Command command, const std::string& group, uint16_t port,
                 const ClientOptions& options = {}, std::string* error = nullptr);

/**
 * Push a file to a device's transfer port.
 *
 * @param error Optional output string with details on failure.
 */
SendFileResult SendFile(const std::string& path, const std::string& host,
                        uint16_t port, const ClientOptions& options = {},
                        std::string* error = nullptr);

}  // namespace vidsync
