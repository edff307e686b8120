// Example: find DJ Link devices and claim a player number, with an operator
// prompt while searching.
#include "djonline/acquisition.h"
#include "djonline/console_ui.h"
#include "djonline/listener.h"
#include "djonline/network.h"
#include "djonline/virtual_player.h"

#include <atomic>
#include <cstring>
#include <iostream>
#include <string>

#include <sys/select.h>
#include <unistd.h>

namespace {

struct Options {
  bool offline = false;
  bool real_player = false;
  std::string bind_address = "0.0.0.0";
};

void PrintUsage(const char* program) {
  std::cerr << "Usage: " << program << " [--offline] [--real-player] [--bind <ip>]"
            << std::endl;
}

bool ParseOptions(int argc, char** argv, Options* out) {
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--offline") == 0) {
      out->offline = true;
    } else if (std::strcmp(argv[i], "--real-player") == 0) {
      out->real_player = true;
    } else if (std::strcmp(argv[i], "--bind") == 0 && i + 1 < argc) {
      out->bind_address = argv[++i];
    } else {
      return false;
    }
  }
  return true;
}

// Wait up to 200 ms for a key on stdin.
bool ReadKey(char* key) {
  fd_set readfds;
  FD_ZERO(&readfds);
  FD_SET(STDIN_FILENO, &readfds);
  timeval tv{};
  tv.tv_sec = 0;
  tv.tv_usec = 200000;
  if (::select(STDIN_FILENO + 1, &readfds, nullptr, nullptr, &tv) <= 0) {
    return false;
  }
  return ::read(STDIN_FILENO, key, 1) == 1;
}

const char* DescribeEvent(djonline::DeviceEventType type) {
  switch (type) {
    case djonline::DeviceEventType::kSeen:
      return "seen";
    case djonline::DeviceEventType::kExpired:
      return "expired";
  }
  return "unknown";
}

}  // namespace

int main(int argc, char** argv) {
  Options options;
  if (!ParseOptions(argc, argv, &options)) {
    PrintUsage(argv[0]);
    return 2;
  }

  std::atomic<bool> quit{false};
  djonline::StartupHooks hooks;
  hooks.finish_startup = []() { std::cout << "Startup finished." << std::endl; };
  hooks.application_quit = [&quit]() { quit = true; };

  if (options.offline) {
    hooks.finish_startup();
    return 0;
  }

  djonline::ListenerConfig listener_config;
  listener_config.bind_address = options.bind_address;
  djonline::KeepAliveListener listener(listener_config);
  listener.SetDeviceEventCallback([](const djonline::DeviceEvent& event) {
    std::cout << "Device " << DescribeEvent(event.type) << ": "
              << event.device.device_name << " (" << +event.device.device_number
              << ") @ " << event.device.ip_address << std::endl;
  });

  djonline::VirtualPlayerConfig player_config;
  player_config.bind_address = options.bind_address;
  djonline::VirtualPlayer player(player_config, listener);

  djonline::NetworkDiagnostics diagnostics;
  djonline::UiDispatcher dispatcher;
  if (!dispatcher.Start()) {
    std::cerr << "Failed to start UI thread" << std::endl;
    return 1;
  }
  djonline::ConsoleSessionUi ui(dispatcher, std::cout);

  djonline::AcquisitionConfig config;
  config.use_real_player_number = options.real_player;
  djonline::AcquisitionStateMachine machine(config, listener, player, diagnostics, ui,
                                            hooks);
  if (!machine.Start()) {
    std::cerr << "Failed to start: " << machine.GetLastError() << std::endl;
    return 1;
  }

  // Operator keys are handled on the UI thread while the worker searches.
  while (machine.IsRunning()) {
    char key = 0;
    if (ReadKey(&key)) {
      dispatcher.Post([&ui, key]() { ui.HandleKey(key); });
    }
  }

  const auto result = machine.Wait();
  dispatcher.Flush();
  if (!result.has_value()) {
    std::cerr << "Attempt did not run: " << machine.GetLastError() << std::endl;
    return 1;
  }
  std::cout << "Attempt ended: " << djonline::ToString(result->outcome) << std::endl;
  if (quit || result->outcome != djonline::AcquisitionOutcome::kOnline) {
    dispatcher.Stop();
    return result->outcome == djonline::AcquisitionOutcome::kClaimFailed ? 1 : 0;
  }

  std::cout << "Announcing as player " << +result->player_number
            << ". Press Enter to stop." << std::endl;
  std::string line;
  std::getline(std::cin, line);
  player.Stop();
  listener.Stop();
  dispatcher.Stop();
  return 0;
}
