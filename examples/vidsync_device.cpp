// Device daemon: plays the shared media file on multicast command and accepts
// replacement files over TCP.
#include "vidsync/controller.h"

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

namespace {

vidsync::DeviceController* g_controller = nullptr;

void HandleSignal(int) {
  if (g_controller) {
    g_controller->RequestShutdown();
  }
}

void PrintUsage(const char* program) {
  std::cout << "Usage: " << program << " [options]\n"
            << "  --video <path>            media file (default "
            << vidsync::kDefaultMediaPath << ")\n"
            << "  --multicast-group <ip>    command group (default "
            << vidsync::kDefaultMulticastGroup << ")\n"
            << "  --multicast-port <port>   command port (default "
            << vidsync::kDefaultCommandPort << ")\n"
            << "  --transfer-port <port>    file transfer port (default "
            << vidsync::kDefaultTransferPort << ")\n"
            << "  --audio hdmi|local|both   audio output (default hdmi)\n"
            << "  --interface <ip>          interface used to join the group\n"
            << "  -v, --verbose             debug logging\n";
}

bool ParsePort(const std::string& text, uint16_t* out) {
  char* end = nullptr;
  const unsigned long value = std::strtoul(text.c_str(), &end, 10);
  if (text.empty() || *end != '\0' || value > 65535) {
    return false;
  }
  *out = static_cast<uint16_t>(value);
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  vidsync::DeviceConfig config;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto next = [&](std::string* value) {
      if (i + 1 >= argc) {
        std::cerr << arg << " requires a value\n";
        return false;
      }
      *value = argv[++i];
      return true;
    };
    std::string value;
    if (arg == "-h" || arg == "--help") {
      PrintUsage(argv[0]);
      return 0;
    } else if (arg == "-v" || arg == "--verbose") {
      config.log_level = vidsync::LogLevel::kDebug;
    } else if (arg == "--video") {
      if (!next(&config.media_path)) {
        return 1;
      }
    } else if (arg == "--multicast-group") {
      if (!next(&config.multicast_group)) {
        return 1;
      }
    } else if (arg == "--interface") {
      if (!next(&config.multicast_interface)) {
        return 1;
      }
    } else if (arg == "--multicast-port" || arg == "--transfer-port") {
      if (!next(&value)) {
        return 1;
      }
      uint16_t* port = arg == "--multicast-port" ? &config.multicast_port
                                                 : &config.transfer_port;
      if (!ParsePort(value, port)) {
        std::cerr << "Invalid port: " << value << "\n";
        return 1;
      }
    } else if (arg == "--audio") {
      if (!next(&value)) {
        return 1;
      }
      const auto audio = vidsync::ParseAudioOutput(value);
      if (!audio.has_value()) {
        std::cerr << "Invalid audio output: " << value << "\n";
        return 1;
      }
      config.audio_output = audio.value();
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      PrintUsage(argv[0]);
      return 1;
    }
  }

  std::string error;
  if (!config.Validate(&error)) {
    std::cerr << "Invalid configuration: " << error << std::endl;
    return 1;
  }

  const std::filesystem::path media_dir =
      std::filesystem::path(config.media_path).parent_path();
  if (!media_dir.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(media_dir, ec);
    if (ec) {
      std::cerr << "Failed to create " << media_dir << ": " << ec.message()
                << std::endl;
      return 1;
    }
  }

  vidsync::DeviceController controller(config);
  g_controller = &controller;
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  const bool ok = controller.Run();
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  g_controller = nullptr;
  if (!ok) {
    std::cerr << "Failed to start device: " << controller.GetLastError() << std::endl;
    return 1;
  }
  return 0;
}
