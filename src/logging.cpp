#include "logging.h"

#include <ctime>
#include <iostream>
#include <sstream>

namespace vidsync {
namespace internal {
namespace {

// Format the wall-clock time as "YYYY-MM-DD HH:MM:SS".
std::string Timestamp() {
  const std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  char buffer[32] = {0};
  if (std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local) == 0) {
    return {};
  }
  return buffer;
}

}  // namespace

void Logger::Log(LogLevel level, const std::string& message) const {
  if (level < min_level_) {
    return;
  }
  if (callback_) {
    callback_(level, message);
    return;
  }
  std::ostringstream line;
  line << Timestamp() << " [" << LogLevelName(level) << "] " << message << '\n';
  std::cerr << line.str() << std::flush;
}

}  // namespace internal
}  // namespace vidsync
