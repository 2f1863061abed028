#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace vidsync {

/**
 * Well-known ports and addresses used by devices and the operator client.
 */
constexpr uint16_t kDefaultCommandPort = 5000;
constexpr uint16_t kDefaultTransferPort = 5001;
constexpr const char* kDefaultMulticastGroup = "239.255.42.1";
constexpr const char* kDefaultMediaPath = "/home/pi/video/current_video.mp4";

/**
 * File transfer protocol constants.
 */
constexpr size_t kLengthHeaderSize = 8;
constexpr size_t kDefaultChunkSize = 64 * 1024;
constexpr const char* kReplyReady = "READY";
constexpr const char* kReplyBusy = "BUSY";
constexpr const char* kReplyOk = "OK";
constexpr const char* kReplyError = "ERROR";

/**
 * Commands accepted on the multicast command channel.
 */
enum class Command {
  kPlay,
  kStop,
  kLoad,
  kGo,
};

/**
 * State of the local playback session. Exactly one value holds at a time.
 */
enum class PlaybackStatus {
  kIdle,
  kLoaded,
  kPlaying,
};

/**
 * Audio routing targets understood by the playback engine.
 */
enum class AudioOutput {
  kHdmi,
  kLocal,
  kBoth,
};

enum class LogLevel {
  kDebug,
  kInfo,
  kWarning,
  kError,
};

/**
 * Outcome of a playback session operation.
 */
enum class PlaybackResult {
  kOk,
  /// Media file does not exist.
  kMediaNotFound,
  /// The external engine could not be launched.
  kEngineSpawnFailure,
  /// Resume requested while no session is loaded and paused.
  kNotLoaded,
  /// Start requested while a session is already live.
  kAlreadyActive,
  /// Stop requested while idle.
  kNothingToStop,
};

/**
 * Outcome of one accepted file transfer connection.
 */
enum class TransferResult {
  kCompleted,
  /// Rejected with BUSY because playback was active.
  kBusy,
  /// Length header missing or truncated.
  kProtocolError,
  /// Peer closed before the declared length was received.
  kPartialTransfer,
  /// Peer stopped sending for longer than the transfer timeout.
  kConnectionTimeout,
  /// Local staging file or rename failure.
  kIoError,
};

/**
 * Parse a command datagram payload (whitespace-trimmed, case-insensitive).
 *
 * @return the command, or std::nullopt for unrecognized text.
 */
std::optional<Command> ParseCommand(const std::string& payload);

/// Upper-case wire name of a command ("PLAY", "STOP", "LOAD", "GO").
const char* CommandName(Command command);
const char* PlaybackStatusName(PlaybackStatus status);
const char* PlaybackResultName(PlaybackResult result);
const char* TransferResultName(TransferResult result);
/// Engine argument for an audio target ("hdmi", "local", "both").
const char* AudioOutputName(AudioOutput output);
std::optional<AudioOutput> ParseAudioOutput(const std::string& text);
const char* LogLevelName(LogLevel level);

/// Encode a payload length as the 8-byte big-endian transfer header.
void EncodeLengthHeader(uint64_t length, uint8_t* out);
/// Decode the 8-byte big-endian transfer header.
uint64_t DecodeLengthHeader(const uint8_t* data);

/**
 * Device configuration. Supplied once at startup and not mutated afterwards.
 */
struct DeviceConfig {
  using LogCallback = std::function<void(LogLevel, const std::string&)>;

  /// Destination media file played by the engine and replaced by transfers.
  std::string media_path = kDefaultMediaPath;
  /// Staging file for in-flight transfers (empty means media_path + ".tmp").
  std::string staging_path;

  /// Multicast group joined by the command listener.
  std::string multicast_group = kDefaultMulticastGroup;
  /// UDP port for commands (0 selects an ephemeral port).
  uint16_t multicast_port = kDefaultCommandPort;
  /// Local interface address used to join the group (empty means any).
  std::string multicast_interface;
  /// Local bind address for both listeners (usually 0.0.0.0).
  std::string bind_address = "0.0.0.0";
  /// TCP port for file transfers (0 selects an ephemeral port).
  uint16_t transfer_port = kDefaultTransferPort;

  /// Audio routing target passed to the engine.
  AudioOutput audio_output = AudioOutput::kHdmi;
  /// Player executable (looked up on PATH).
  std::string player_binary = "omxplayer";
  /// FIFO attached to the player's stdin for control input.
  std::string control_fifo_path = "/tmp/omxplayer_fifo";

  /// Socket wait timeout for listener loops; bounds shutdown latency.
  std::chrono::milliseconds poll_interval{200};
  /// Wait after launching a preloaded session before pausing it.
  std::chrono::milliseconds preload_grace{500};
  /// Wait for a graceful engine exit before killing its process group.
  std::chrono::milliseconds stop_timeout{2000};
  /// Receive timeout on an accepted transfer connection.
  std::chrono::milliseconds transfer_timeout{30000};
  /// Maximum bytes read from the transfer socket per call.
  size_t transfer_chunk_size = kDefaultChunkSize;

  /// Minimum level that is logged.
  LogLevel log_level = LogLevel::kInfo;
  /// Optional log sink (defaults to stderr).
  LogCallback log_callback;

  /// Staging path with the default applied.
  std::string EffectiveStagingPath() const;

  /**
   * Validate configuration values.
   *
   * @param error Optional output string describing the first validation error.
   * @return true if the configuration is valid.
   */
  bool Validate(std::string* error = nullptr) const;
};

/**
 * Counters for command and transfer traffic.
 */
struct DeviceMetrics {
  uint64_t commands_received = 0;
  uint64_t commands_ignored = 0;
  uint64_t transfers_completed = 0;
  uint64_t transfers_rejected = 0;
  uint64_t transfers_failed = 0;
  uint64_t callback_exceptions = 0;
};

/**
 * Summary of one transfer connection, reported after it closes.
 */
struct TransferReport {
  TransferResult result = TransferResult::kCompleted;
  /// Peer address as "ip:port".
  std::string peer;
  /// Length from the header (0 if it was never received).
  uint64_t declared_bytes = 0;
  uint64_t received_bytes = 0;
};

}  // namespace vidsync
