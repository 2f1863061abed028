#pragma once

#include "vidsync/vidsync.h"

#include <string>
#include <utility>

namespace vidsync {
namespace internal {

// Level-filtered log sink. Falls back to stderr when no callback is set.
class Logger {
 public:
  Logger() = default;
  Logger(DeviceConfig::LogCallback callback, LogLevel min_level)
      : callback_(std::move(callback)), min_level_(min_level) {}
  explicit Logger(const DeviceConfig& config)
      : Logger(config.log_callback, config.log_level) {}

  void Log(LogLevel level, const std::string& message) const;

  void Debug(const std::string& message) const { Log(LogLevel::kDebug, message); }
  void Info(const std::string& message) const { Log(LogLevel::kInfo, message); }
  void Warning(const std::string& message) const {
    Log(LogLevel::kWarning, message);
  }
  void Error(const std::string& message) const { Log(LogLevel::kError, message); }

 private:
  DeviceConfig::LogCallback callback_;
  LogLevel min_level_ = LogLevel::kInfo;
};

}  // namespace internal
}  // namespace vidsync
