// Example: drive a full session against simulated devices and print every
// state change.
#include "playsync/playsync.h"
#include "simulated_devices.h"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

void PrintState(const playsync::PlaybackState& state) {
  std::cout << "state: device=" << state.active_device_id.value_or("-")
            << " local=" << (state.is_local_device_active ? "y" : "n")
            << " playing=" << playsync::ToString(state.play_state)
            << " source=" << playsync::ToString(state.last_source) << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
  const int latency_ms = argc > 1 ? std::atoi(argv[1]) : 40;

  example::SimulatedCloud cloud{std::chrono::milliseconds(latency_ms)};
  cloud.AddDevice("web-player", "Browser", "Computer");
  cloud.AddDevice("kitchen", "Kitchen Speaker", "Speaker");
  auto player = std::make_shared<example::SimulatedWebPlayer>(&cloud, "web-player");

  playsync::Config config;
  config.fetch_json = cloud.Transport();
  config.get_access_token = []() { return std::string("demo-token"); };
  config.poll_interval_visible = std::chrono::milliseconds(500);
  config.verbose = true;

  playsync::PlayerSync sync(player, config);
  auto unsubscribe = sync.OnChange(PrintState);
  if (!sync.Start()) {
    std::cerr << "Failed to start sync: " << sync.GetLastError() << std::endl;
    return 1;
  }

  try {
    std::cout << "-- local player connects" << std::endl;
    player->Connect();

    std::cout << "-- play before the autoplay guard" << std::endl;
    sync.SetPlaying(true);

    std::cout << "-- user gesture unlocks audio" << std::endl;
    if (!sync.ActivateAutoplayGuard()) {
      std::cerr << "Autoplay guard activation failed" << std::endl;
    }
    sync.SetPlaying(true);

    std::cout << "-- devices" << std::endl;
    for (const auto& device : sync.GetDevices()) {
      std::cout << "  " << device.id << " (" << device.name << ")"
                << (device.is_active ? " [active]" : "") << std::endl;
    }

    std::cout << "-- transfer to kitchen, then pause" << std::endl;
    auto transfer = sync.TransferToAsync("kitchen", true);
    auto pause = sync.SetPlayingAsync(false);
    transfer.get();
    pause.get();

    std::cout << "-- late ready event from the local player" << std::endl;
    player->Connect();

    std::cout << "-- start a track on the active device" << std::endl;
    sync.SyncCurrentSong("spotify:track:4uLU6hMCjMI75M1A2tKUQC", 30000);

    std::cout << "-- transfer back to the browser" << std::endl;
    sync.TransferTo(player->device_id(), false);
    sync.Toggle();
  } catch (const playsync::SyncError& e) {
    std::cerr << "Command failed: " << e.what() << std::endl;
  }

  const playsync::SyncMetrics metrics = sync.GetMetrics();
  std::cout << "commands=" << metrics.commands_issued
            << " requests=" << metrics.remote_requests
            << " retries=" << metrics.reconcile_retries
            << " degraded=" << metrics.reconcile_degraded
            << " dropped_pushes=" << metrics.pushes_dropped << std::endl;

  unsubscribe();
  sync.Dispose();
  return 0;
}
