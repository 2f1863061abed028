// Operator client: send a command to every device, or push a file to one.
#include "vidsync/client.h"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

void PrintUsage(const char* program) {
  std::cout << "Usage: " << program
            << " play|stop|load|go|send <file> <host> [-g group] [-i ip] [-p port]\n"
            << "  -g, --group <ip>   multicast group (default "
            << vidsync::kDefaultMulticastGroup << ")\n"
            << "  -i, --interface <ip>  local interface for outgoing commands\n"
            << "  -p, --port <port>  port (default " << vidsync::kDefaultCommandPort
            << " for commands, " << vidsync::kDefaultTransferPort << " for send)\n\n"
            << "For synchronized playback: \"load\" on every device, then \"go\".\n";
}

}  // namespace

int main(int argc, char** argv) {
  std::string group = vidsync::kDefaultMulticastGroup;
  vidsync::ClientOptions options;
  uint16_t port = 0;
  bool port_set = false;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      PrintUsage(argv[0]);
      return 0;
    }
    if (arg == "-g" || arg == "--group" || arg == "-i" || arg == "--interface" ||
        arg == "-p" || arg == "--port") {
      if (i + 1 >= argc) {
        std::cerr << arg << " requires a value\n";
        return 1;
      }
      const std::string value = argv[++i];
      if (arg == "-g" || arg == "--group") {
        group = value;
        continue;
      }
      if (arg == "-i" || arg == "--interface") {
        options.multicast_interface = value;
        continue;
      }
      char* end = nullptr;
      const unsigned long parsed = std::strtoul(value.c_str(), &end, 10);
      if (value.empty() || *end != '\0' || parsed == 0 || parsed > 65535) {
        std::cerr << "Invalid port: " << value << "\n";
        return 1;
      }
      port = static_cast<uint16_t>(parsed);
      port_set = true;
      continue;
    }
    positional.push_back(arg);
  }

  if (positional.empty()) {
    PrintUsage(argv[0]);
    return 1;
  }

  const std::string& verb = positional[0];
  if (verb == "send") {
    if (positional.size() < 3) {
      std::cerr << "Usage: send <file> <host> [-p port]\n";
      return 1;
    }
    options.progress_callback = [](uint64_t sent, uint64_t total) {
      const uint64_t percent = total == 0 ? 100 : sent * 100 / total;
      std::cout << "\rProgress: " << percent << "%" << std::flush;
    };
    const std::string& path = positional[1];
    const std::string& host = positional[2];
    std::cout << "Sending " << path << " to " << host << std::endl;
    std::string error;
    const vidsync::SendFileResult result = vidsync::SendFile(
        path, host, port_set ? port : vidsync::kDefaultTransferPort, options, &error);
    std::cout << std::endl;
    if (result != vidsync::SendFileResult::kOk) {
      std::cerr << "Transfer failed (" << vidsync::SendFileResultName(result)
                << "): " << error << std::endl;
      return 1;
    }
    std::cout << "File sent successfully" << std::endl;
    return 0;
  }

  const auto command = vidsync::ParseCommand(verb);
  if (!command.has_value()) {
    std::cerr << "Unknown command: " << verb << "\n";
    PrintUsage(argv[0]);
    return 1;
  }
  std::string error;
  const uint16_t command_port = port_set ? port : vidsync::kDefaultCommandPort;
  if (!vidsync::SendCommand(command.value(), group, command_port, options, &error)) {
    std::cerr << "Failed to send command: " << error << std::endl;
    return 1;
  }
  std::cout << "Sent " << vidsync::CommandName(command.value()) << " to " << group
            << ":" << command_port << std::endl;
  return 0;
}
