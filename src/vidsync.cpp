#include "vidsync/vidsync.h"

#include "net.h"

#include <algorithm>
#include <cctype>

#include <arpa/inet.h>

namespace vidsync {
namespace {

constexpr const char* kWhitespace = " \t\r\n\v\f";

std::string TrimAndUpper(const std::string& text) {
  const size_t first = text.find_first_not_of(kWhitespace);
  if (first == std::string::npos) {
    return {};
  }
  const size_t last = text.find_last_not_of(kWhitespace);
  std::string out = text.substr(first, last - first + 1);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return out;
}

}  // namespace

std::optional<Command> ParseCommand(const std::string& payload) {
  const std::string command = TrimAndUpper(payload);
  if (command == "PLAY") {
    return Command::kPlay;
  }
  if (command == "STOP") {
    return Command::kStop;
  }
  if (command == "LOAD") {
    return Command::kLoad;
  }
  if (command == "GO") {
    return Command::kGo;
  }
  return std::nullopt;
}

const char* CommandName(Command command) {
  switch (command) {
    case Command::kPlay:
      return "PLAY";
    case Command::kStop:
      return "STOP";
    case Command::kLoad:
      return "LOAD";
    case Command::kGo:
      return "GO";
  }
  return "UNKNOWN";
}

const char* PlaybackStatusName(PlaybackStatus status) {
  switch (status) {
    case PlaybackStatus::kIdle:
      return "idle";
    case PlaybackStatus::kLoaded:
      return "loaded";
    case PlaybackStatus::kPlaying:
      return "playing";
  }
  return "unknown";
}

const char* PlaybackResultName(PlaybackResult result) {
  switch (result) {
    case PlaybackResult::kOk:
      return "ok";
    case PlaybackResult::kMediaNotFound:
      return "media not found";
    case PlaybackResult::kEngineSpawnFailure:
      return "engine spawn failure";
    case PlaybackResult::kNotLoaded:
      return "not loaded";
    case PlaybackResult::kAlreadyActive:
      return "already active";
    case PlaybackResult::kNothingToStop:
      return "nothing to stop";
  }
  return "unknown";
}

const char* TransferResultName(TransferResult result) {
  switch (result) {
    case TransferResult::kCompleted:
      return "completed";
    case TransferResult::kBusy:
      return "busy";
    case TransferResult::kProtocolError:
      return "protocol error";
    case TransferResult::kPartialTransfer:
      return "partial transfer";
    case TransferResult::kConnectionTimeout:
      return "connection timeout";
    case TransferResult::kIoError:
      return "i/o error";
  }
  return "unknown";
}

const char* AudioOutputName(AudioOutput output) {
  switch (output) {
    case AudioOutput::kHdmi:
      return "hdmi";
    case AudioOutput::kLocal:
      return "local";
    case AudioOutput::kBoth:
      return "both";
  }
  return "hdmi";
}

std::optional<AudioOutput> ParseAudioOutput(const std::string& text) {
  if (text == "hdmi") {
    return AudioOutput::kHdmi;
  }
  if (text == "local") {
    return AudioOutput::kLocal;
  }
  if (text == "both") {
    return AudioOutput::kBoth;
  }
  return std::nullopt;
}

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarning:
      return "WARNING";
    case LogLevel::kError:
      return "ERROR";
  }
  return "INFO";
}

void EncodeLengthHeader(uint64_t length, uint8_t* out) {
  for (size_t i = 0; i < kLengthHeaderSize; ++i) {
    out[i] = static_cast<uint8_t>((length >> (8 * (kLengthHeaderSize - 1 - i))) & 0xff);
  }
}

uint64_t DecodeLengthHeader(const uint8_t* data) {
  uint64_t value = 0;
  for (size_t i = 0; i < kLengthHeaderSize; ++i) {
    value = (value << 8) | static_cast<uint64_t>(data[i]);
  }
  return value;
}

std::string DeviceConfig::EffectiveStagingPath() const {
  if (!staging_path.empty()) {
    return staging_path;
  }
  return media_path + ".tmp";
}

bool DeviceConfig::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (media_path.empty()) {
    return fail("media_path must not be empty");
  }
  if (EffectiveStagingPath() == media_path) {
    return fail("staging_path must differ from media_path");
  }
  if (!internal::IsValidIpv4(multicast_group)) {
    return fail("multicast_group must be a valid IPv4 address");
  }
  in_addr group{};
  inet_pton(AF_INET, multicast_group.c_str(), &group);
  if (!IN_MULTICAST(ntohl(group.s_addr))) {
    return fail("multicast_group must be in 224.0.0.0/4");
  }
  if (!multicast_interface.empty() && !internal::IsValidIpv4(multicast_interface)) {
    return fail("multicast_interface must be a valid IPv4 address");
  }
  if (!bind_address.empty() && bind_address != "0.0.0.0") {
    if (!internal::IsValidIpv4(bind_address)) {
      return fail("bind_address must be a valid IPv4 address");
    }
  }
  if (multicast_port != 0 && multicast_port == transfer_port) {
    return fail("multicast_port and transfer_port must differ");
  }
  if (player_binary.empty() || control_fifo_path.empty()) {
    return fail("player_binary and control_fifo_path must not be empty");
  }
  if (poll_interval.count() <= 0 || stop_timeout.count() <= 0 ||
      transfer_timeout.count() <= 0) {
    return fail("poll_interval and timeouts must be positive");
  }
  if (preload_grace.count() < 0) {
    return fail("preload_grace must not be negative");
  }
  if (transfer_chunk_size == 0) {
    return fail("transfer_chunk_size must be positive");
  }
  return true;
}

}  // namespace vidsync
