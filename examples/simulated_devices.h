// In-process stand-ins for the playback cloud and the embedded web player,
// used by the examples so they run without network access.
#pragma once

#include "playsync/playsync.h"

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>

namespace example {

class SimulatedCloud {
 public:
  explicit SimulatedCloud(std::chrono::milliseconds latency) : latency_(latency) {}

  // Register an output device. The first one registered becomes active.
  void AddDevice(const std::string& id, const std::string& name, const std::string& type) {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_[id] = {name, type};
    if (!active_.has_value()) {
      active_ = id;
    }
  }

  void SetPlaying(const std::string& device_id, bool playing) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_ = device_id;
    playing_ = playing;
  }

  playsync::Config::FetchJson Transport() {
    return [this](const playsync::RemoteRequest& request) { return Handle(request); };
  }

 private:
  struct DeviceInfo {
    std::string name;
    std::string type;
  };

  nlohmann::json Handle(const playsync::RemoteRequest& request) {
    std::this_thread::sleep_for(latency_);
    if (request.access_token.empty()) {
      throw playsync::RemoteError(401, "missing access token");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string path = request.path.substr(0, request.path.find('?'));

    if (request.method == playsync::HttpMethod::kGet && path == playsync::kPlayerPath) {
      if (!active_.has_value()) {
        throw playsync::RemoteError(playsync::kStatusNoContent, "no active session");
      }
      const DeviceInfo& info = devices_[active_.value()];
      nlohmann::json body;
      body["device"] = {{"id", active_.value()}, {"name", info.name}, {"type", info.type}};
      body["is_playing"] = playing_;
      body["progress_ms"] = progress_ms_;
      if (!item_uri_.empty()) {
        body["item"] = {{"uri", item_uri_}};
      }
      return body;
    }

    if (request.method == playsync::HttpMethod::kGet && path == playsync::kDevicesPath) {
      nlohmann::json list = nlohmann::json::array();
      for (const auto& entry : devices_) {
        list.push_back({{"id", entry.first},
                        {"name", entry.second.name},
                        {"type", entry.second.type},
                        {"is_active", active_.has_value() && active_.value() == entry.first},
                        {"volume_percent", 60}});
      }
      return {{"devices", list}};
    }

    if (request.method == playsync::HttpMethod::kPut && path == playsync::kPlayerPath) {
      const std::string id = request.body.at("device_ids").at(0).get<std::string>();
      if (devices_.find(id) == devices_.end()) {
        throw playsync::RemoteError(playsync::kStatusNotFound, "device not found");
      }
      active_ = id;
      playing_ = request.body.value("play", false);
      return nullptr;
    }

    if (request.method == playsync::HttpMethod::kPut &&
        (path == playsync::kPlayPath || path == playsync::kPausePath)) {
      if (!active_.has_value()) {
        throw playsync::RemoteError(playsync::kStatusNotFound, "no active device");
      }
      playing_ = path == playsync::kPlayPath;
      if (request.body.is_object() && request.body.contains("uris")) {
        item_uri_ = request.body["uris"].at(0).get<std::string>();
        progress_ms_ = request.body.value("position_ms", int64_t{0});
      }
      return nullptr;
    }

    throw playsync::RemoteError(400, "unsupported request " + request.path);
  }

  std::chrono::milliseconds latency_;
  std::mutex mutex_;
  std::map<std::string, DeviceInfo> devices_;
  std::optional<std::string> active_;
  bool playing_ = false;
  std::string item_uri_;
  int64_t progress_ms_ = 0;
};

// Embedded player that reports its state changes to the cloud as well.
class SimulatedWebPlayer : public playsync::LocalPlayer {
 public:
  SimulatedWebPlayer(SimulatedCloud* cloud, std::string device_id)
      : cloud_(cloud), device_id_(std::move(device_id)) {}

  void SetReadyCallback(DeviceCallback cb) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ready_cb_ = std::move(cb);
  }
  void SetNotReadyCallback(DeviceCallback cb) override {
    std::lock_guard<std::mutex> lock(mutex_);
    not_ready_cb_ = std::move(cb);
  }
  void SetStateCallback(StateCallback cb) override {
    std::lock_guard<std::mutex> lock(mutex_);
    state_cb_ = std::move(cb);
  }

  void Resume() override { Apply(false); }
  void Pause() override { Apply(true); }

  bool SupportsActivation() const override { return true; }
  void ActivateElement() override {}

  std::optional<playsync::LocalPlayerState> GetCurrentState() override {
    std::lock_guard<std::mutex> lock(mutex_);
    playsync::LocalPlayerState state;
    state.paused = paused_;
    return state;
  }

  // Simulate the SDK connecting and registering its device.
  void Connect() {
    DeviceCallback cb;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cb = ready_cb_;
    }
    if (cb) {
      cb(device_id_);
    }
  }

  void Disconnect() {
    DeviceCallback cb;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cb = not_ready_cb_;
    }
    if (cb) {
      cb(device_id_);
    }
  }

  // Simulate the user pressing play/pause on the embedded widget itself.
  void PressPlayPause() {
    bool paused = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      paused = !paused_;
    }
    Apply(paused);
  }

  const std::string& device_id() const { return device_id_; }

 private:
  void Apply(bool paused) {
    StateCallback cb;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      paused_ = paused;
      cb = state_cb_;
    }
    cloud_->SetPlaying(device_id_, !paused);
    if (cb) {
      playsync::LocalPlayerState state;
      state.paused = paused;
      cb(state);
    }
  }

  SimulatedCloud* cloud_;
  std::string device_id_;
  std::mutex mutex_;
  DeviceCallback ready_cb_;
  DeviceCallback not_ready_cb_;
  StateCallback state_cb_;
  bool paused_ = true;
};

}  // namespace example
