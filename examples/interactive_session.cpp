// Interactive player sync with menu-driven commands against simulated devices.
#include "playsync/playsync.h"
#include "simulated_devices.h"

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace {

// ANSI color codes for terminal output
const char* kColorReset = "\033[0m";
const char* kColorBold = "\033[1m";
const char* kColorGreen = "\033[32m";
const char* kColorYellow = "\033[33m";
const char* kColorCyan = "\033[36m";
const char* kColorMagenta = "\033[35m";
const char* kColorRed = "\033[31m";

std::atomic<bool> g_running{true};

void ClearScreen() {
  std::cout << "\033[2J\033[H";
}

void PrintHeader() {
  std::cout << kColorBold << kColorCyan;
  std::cout << "╔════════════════════════════════════════════════════════════════╗\n";
  std::cout << "║                 Interactive Player Sync Console                ║\n";
  std::cout << "╚════════════════════════════════════════════════════════════════╝\n";
  std::cout << kColorReset << "\n";
}

void PrintCurrentState(playsync::PlayerSync& sync) {
  const playsync::PlaybackState state = sync.GetState();

  std::cout << kColorBold << "Current Playback State:\n" << kColorReset;
  std::cout << "─────────────────────────────────────\n";
  std::cout << kColorYellow << "Active device: " << kColorReset
            << state.active_device_id.value_or("none");
  if (state.is_local_device_active) {
    std::cout << " (this browser)";
  }
  std::cout << "\n";

  std::cout << kColorYellow << "Playing:       " << kColorReset;
  switch (state.play_state) {
    case playsync::PlayState::kPlaying:
      std::cout << kColorGreen << "▶ playing" << kColorReset;
      break;
    case playsync::PlayState::kPaused:
      std::cout << "⏸ paused";
      break;
    case playsync::PlayState::kUnknown:
      std::cout << "- unknown";
      break;
  }
  std::cout << "\n";
  std::cout << kColorYellow << "Last source:   " << kColorReset
            << playsync::ToString(state.last_source) << "\n";
  std::cout << kColorYellow << "Local device:  " << kColorReset
            << sync.GetLocalDeviceId().value_or("not connected") << "\n\n";
}

void PrintDevices(playsync::PlayerSync& sync) {
  const auto devices = sync.GetDevices();

  std::cout << kColorBold << "Available Devices (" << devices.size() << "):\n" << kColorReset;
  std::cout << "─────────────────────────────────────\n";
  if (devices.empty()) {
    std::cout << kColorYellow << "No devices available...\n" << kColorReset;
  }
  for (const auto& device : devices) {
    std::cout << "  [" << kColorGreen << std::setw(12) << device.id << kColorReset << "] "
              << device.name << " (" << device.type << ")";
    if (device.is_active) {
      std::cout << kColorGreen << " active" << kColorReset;
    }
    std::cout << "\n";
  }
  std::cout << "\n";
}

void PrintMenu(bool hidden) {
  std::cout << kColorBold << "Main Menu:\n" << kColorReset;
  std::cout << "─────────────────────────────────────\n";
  std::cout << kColorCyan << "Playback Control:\n" << kColorReset;
  std::cout << "  1. Play\n";
  std::cout << "  2. Pause\n";
  std::cout << "  3. Toggle\n";
  std::cout << "  4. Play Track At Offset\n";
  std::cout << "\n";

  std::cout << kColorMagenta << "Devices:\n" << kColorReset;
  std::cout << "  5. Transfer Playback\n";
  std::cout << "  6. Activate Audio (user gesture)\n";
  std::cout << "  7. Toggle Page Visibility (" << (hidden ? "hidden" : "visible") << ")\n";
  std::cout << "\n";

  std::cout << kColorCyan << "Local Player Events:\n" << kColorReset;
  std::cout << "  8. Local Player Ready\n";
  std::cout << "  9. Local Player Not Ready\n";
  std::cout << "  0. Press Play/Pause In Local Player\n";
  std::cout << "\n";

  std::cout << kColorYellow << "Information:\n" << kColorReset;
  std::cout << "  d. Show Devices\n";
  std::cout << "  f. Refresh From Remote\n";
  std::cout << "  m. Show Metrics\n";
  std::cout << "\n";

  std::cout << kColorRed << "Other:\n" << kColorReset;
  std::cout << "  q. Quit\n";
  std::cout << "\n";
  std::cout << kColorBold << "Enter choice: " << kColorReset;
}

void Pause(std::chrono::seconds delay) {
  std::this_thread::sleep_for(delay);
}

void HandleTransfer(playsync::PlayerSync& sync) {
  PrintDevices(sync);
  std::cout << "Enter device id: ";
  std::string id;
  std::getline(std::cin, id);
  if (id.empty()) {
    return;
  }
  std::cout << "Start playing there? (y/n/keep): ";
  std::string answer;
  std::getline(std::cin, answer);
  std::optional<bool> play;
  if (answer == "y") {
    play = true;
  } else if (answer == "n") {
    play = false;
  }

  sync.TransferTo(id, play);
  std::cout << kColorGreen << "✓ Transferred to " << id << "\n" << kColorReset;
  Pause(std::chrono::seconds(1));
}

void HandlePlayTrack(playsync::PlayerSync& sync) {
  std::cout << "\nEnter track URI: ";
  std::string uri;
  std::getline(std::cin, uri);
  if (uri.empty()) {
    return;
  }
  std::cout << "Enter start position (seconds): ";
  double seconds = 0;
  std::cin >> seconds;
  std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
  if (seconds < 0) {
    std::cout << kColorRed << "Error: position must not be negative\n" << kColorReset;
    Pause(std::chrono::seconds(2));
    return;
  }
  sync.SyncCurrentSong(uri, static_cast<int64_t>(seconds * 1000.0));
  std::cout << kColorGreen << "▶ " << uri << "\n" << kColorReset;
  Pause(std::chrono::seconds(1));
}

void ShowMetrics(playsync::PlayerSync& sync) {
  const playsync::SyncMetrics metrics = sync.GetMetrics();
  std::cout << "\ncommands issued:    " << metrics.commands_issued
            << "\ncommand failures:   " << metrics.command_failures
            << "\nremote requests:    " << metrics.remote_requests
            << "\nremote errors:      " << metrics.remote_errors
            << "\npolls:              " << metrics.polls
            << "\nreconcile retries:  " << metrics.reconcile_retries
            << "\nreconcile degraded: " << metrics.reconcile_degraded
            << "\npushes dropped:     " << metrics.pushes_dropped << "\n\n";
  std::cout << "Press Enter to return to menu...";
  std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
}

}  // namespace

int main() {
  example::SimulatedCloud cloud(std::chrono::milliseconds(80));
  cloud.AddDevice("living-room", "Living Room TV", "TV");
  cloud.AddDevice("web-player", "This Browser", "Computer");
  cloud.AddDevice("kitchen", "Kitchen Speaker", "Speaker");
  auto player = std::make_shared<example::SimulatedWebPlayer>(&cloud, "web-player");

  playsync::Config config;
  config.fetch_json = cloud.Transport();
  config.get_access_token = []() { return std::string("demo-token"); };
  config.log_callback = [](const std::string&) {
    // Silent - too noisy for interactive menu
  };

  std::string error;
  if (!config.Validate(&error)) {
    std::cerr << "Configuration error: " << error << "\n";
    return 1;
  }

  playsync::PlayerSync sync(player, config);
  if (!sync.Start()) {
    std::cerr << "Failed to start sync: " << sync.GetLastError() << "\n";
    return 1;
  }
  player->Connect();

  bool hidden = false;
  while (g_running) {
    ClearScreen();
    PrintHeader();
    PrintCurrentState(sync);
    PrintMenu(hidden);

    std::string choice;
    if (!std::getline(std::cin, choice)) {
      break;
    }
    if (choice.empty()) {
      continue;
    }

    try {
      switch (choice[0]) {
        case '1':
          sync.SetPlaying(true);
          break;
        case '2':
          sync.SetPlaying(false);
          break;
        case '3':
          sync.Toggle();
          break;
        case '4':
          HandlePlayTrack(sync);
          break;
        case '5':
          HandleTransfer(sync);
          break;
        case '6':
          if (sync.ActivateAutoplayGuard()) {
            std::cout << kColorGreen << "✓ Audio unlocked\n" << kColorReset;
          } else {
            std::cout << kColorRed << "Audio unlock failed\n" << kColorReset;
          }
          Pause(std::chrono::seconds(1));
          break;
        case '7':
          hidden = !hidden;
          sync.SetVisibility(hidden ? playsync::Visibility::kHidden
                                    : playsync::Visibility::kVisible);
          break;
        case '8':
          player->Connect();
          break;
        case '9':
          player->Disconnect();
          break;
        case '0':
          player->PressPlayPause();
          break;
        case 'd':
        case 'D':
          PrintDevices(sync);
          std::cout << "Press Enter to return to menu...";
          std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
          break;
        case 'f':
        case 'F':
          if (!sync.Refresh()) {
            std::cout << kColorRed << "Refresh failed\n" << kColorReset;
            Pause(std::chrono::seconds(1));
          }
          break;
        case 'm':
        case 'M':
          ShowMetrics(sync);
          break;
        case 'q':
        case 'Q':
          g_running = false;
          break;
        default:
          std::cout << kColorRed << "Invalid choice.\n" << kColorReset;
          Pause(std::chrono::seconds(2));
          break;
      }
    } catch (const std::exception& e) {
      std::cout << kColorRed << "Error: " << e.what() << "\n" << kColorReset;
      Pause(std::chrono::seconds(2));
    }
  }

  sync.Dispose();
  std::cout << "Goodbye.\n";
  return 0;
}
