#include "playsync/playsync.h"
#include "playsync/test_hooks.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <map>
#include <mutex>
#include <random>
#include <sstream>
#include <system_error>
#include <thread>
#include <utility>

namespace playsync {
namespace {

using Clock = std::chrono::steady_clock;

constexpr const char* kDeviceIdQuery = "?device_id=";

// Forward declarations
void LogMessage(const std::string& message, const Config* config);

std::string StringField(const nlohmann::json& object, const char* key) {
  const auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

// Append the device target used by play/pause so the call lands on the
// device the engine believes is active.
std::string BuildDeviceTargetedPath(const std::string& path,
                                    const std::optional<std::string>& device_id) {
  if (!device_id.has_value() || device_id->empty()) {
    return path;
  }
  return path + kDeviceIdQuery + device_id.value();
}

nlohmann::json BuildTransferBody(const std::string& device_id,
                                 std::optional<bool> desired_playing) {
  nlohmann::json body;
  body["device_ids"] = nlohmann::json::array({device_id});
  body["play"] = desired_playing.value_or(false);
  return body;
}

nlohmann::json BuildPlayItemBody(const std::string& uri, int64_t position_ms) {
  nlohmann::json body;
  body["uris"] = nlohmann::json::array({uri});
  body["position_ms"] = std::max<int64_t>(0, position_ms);
  return body;
}

// Parse the GET /me/player payload. A payload without is_playing is rejected.
bool ParseRemotePlaybackState(const nlohmann::json& data, RemotePlaybackState* out) {
  if (!out || !data.is_object()) {
    return false;
  }
  const auto playing = data.find("is_playing");
  if (playing == data.end() || !playing->is_boolean()) {
    return false;
  }
  RemotePlaybackState state;
  state.is_playing = playing->get<bool>();

  const auto device = data.find("device");
  if (device != data.end() && device->is_object()) {
    const std::string id = StringField(*device, "id");
    if (!id.empty()) {
      state.device_id = id;
    }
    state.device_name = StringField(*device, "name");
    state.device_type = StringField(*device, "type");
  }

  const auto progress = data.find("progress_ms");
  if (progress != data.end() && progress->is_number_integer()) {
    state.progress_ms = progress->get<int64_t>();
  }

  const auto item = data.find("item");
  if (item != data.end() && item->is_object()) {
    const std::string uri = StringField(*item, "uri");
    if (!uri.empty()) {
      state.item_uri = uri;
    }
  }
  *out = std::move(state);
  return true;
}

// Parse the GET /me/player/devices payload. Entries without an id are skipped.
bool ParseRemoteDevices(const nlohmann::json& data, std::vector<RemoteDevice>* out) {
  if (!out || !data.is_object()) {
    return false;
  }
  const auto devices = data.find("devices");
  if (devices == data.end() || !devices->is_array()) {
    return false;
  }
  std::vector<RemoteDevice> result;
  result.reserve(devices->size());
  for (const auto& entry : *devices) {
    if (!entry.is_object()) {
      continue;
    }
    RemoteDevice device;
    device.id = StringField(entry, "id");
    if (device.id.empty()) {
      continue;
    }
    device.name = StringField(entry, "name");
    device.type = StringField(entry, "type");
    const auto active = entry.find("is_active");
    device.is_active = active != entry.end() && active->is_boolean() &&
                       active->get<bool>();
    const auto volume = entry.find("volume_percent");
    if (volume != entry.end() && volume->is_number_integer()) {
      device.volume_percent = volume->get<int>();
    }
    result.push_back(std::move(device));
  }
  *out = std::move(result);
  return true;
}

// Compare only the fields a command set. No session never matches.
bool RemoteMatchesExpected(const std::optional<RemotePlaybackState>& remote,
                           std::optional<bool> expected_playing,
                           const std::optional<std::string>& expected_device) {
  if (!remote.has_value()) {
    return false;
  }
  if (expected_playing.has_value() && remote->is_playing != expected_playing.value()) {
    return false;
  }
  if (expected_device.has_value() && remote->device_id != expected_device) {
    return false;
  }
  return true;
}

std::chrono::milliseconds PollIntervalFor(const Config& config, Visibility visibility) {
  return visibility == Visibility::kVisible ? config.poll_interval_visible
                                            : config.poll_interval_hidden;
}

std::string Describe(const PlaybackState& state) {
  std::ostringstream oss;
  oss << "device=" << state.active_device_id.value_or("none")
      << " local=" << (state.is_local_device_active ? "y" : "n")
      << " playing=" << ToString(state.play_state)
      << " source=" << ToString(state.last_source);
  return oss.str();
}

void LogMessage(const std::string& message, const Config* config) {
  if (config && config->log_callback) {
    config->log_callback(message);
    return;
  }
  std::cerr << "[playsync] " << message << std::endl;
}

// Fields the in-flight command expects the remote side to report afterwards.
struct ExpectedState {
  std::optional<bool> playing;
  std::optional<std::string> device_id;
};

// FIFO gate for mutating commands. A ticket is taken at call time; its
// holder runs once every earlier ticket has been released.
class CommandQueue {
 public:
  class Ticket {
   public:
    Ticket(CommandQueue* queue, uint64_t number) : queue_(queue), number_(number) {}
    Ticket(Ticket&& other) noexcept
        : queue_(other.queue_), number_(other.number_), acquired_(other.acquired_) {
      other.queue_ = nullptr;
    }
    Ticket(const Ticket&) = delete;
    Ticket& operator=(const Ticket&) = delete;
    Ticket& operator=(Ticket&&) = delete;
    ~Ticket() { Release(); }

    // Block until every earlier ticket has been released.
    void Wait() {
      if (queue_ && !acquired_) {
        queue_->WaitTurn(number_);
        acquired_ = true;
      }
    }

    // Pass the turn on. An unused ticket still waits for its turn first so
    // later tickets never overtake it.
    void Release() {
      if (!queue_) {
        return;
      }
      Wait();
      queue_->Advance();
      queue_ = nullptr;
    }

   private:
    CommandQueue* queue_ = nullptr;
    uint64_t number_ = 0;
    bool acquired_ = false;
  };

  Ticket Take() {
    std::lock_guard<std::mutex> lock(mutex_);
    return Ticket(this, next_++);
  }

 private:
  void WaitTurn(uint64_t number) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&]() { return serving_ == number; });
  }

  void Advance() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++serving_;
    cv_.notify_all();
  }

  std::mutex mutex_;
  std::condition_variable cv_;
  uint64_t next_ = 0;
  uint64_t serving_ = 0;
};

class ScopedTurn {
 public:
  explicit ScopedTurn(CommandQueue::Ticket& ticket) : ticket_(ticket) { ticket_.Wait(); }
  ~ScopedTurn() { ticket_.Release(); }

  ScopedTurn(const ScopedTurn&) = delete;
  ScopedTurn& operator=(const ScopedTurn&) = delete;

 private:
  CommandQueue::Ticket& ticket_;
};

}  // namespace

const char* ToString(PlayState state) {
  switch (state) {
    case PlayState::kPlaying:
      return "playing";
    case PlayState::kPaused:
      return "paused";
    case PlayState::kUnknown:
      break;
  }
  return "unknown";
}

const char* ToString(StateSource source) {
  switch (source) {
    case StateSource::kLocalPush:
      return "local-push";
    case StateSource::kRemotePoll:
      return "remote-poll";
    case StateSource::kUnknown:
      break;
  }
  return "unknown";
}

const char* ToString(HttpMethod method) {
  switch (method) {
    case HttpMethod::kPut:
      return "PUT";
    case HttpMethod::kPost:
      return "POST";
    case HttpMethod::kGet:
      break;
  }
  return "GET";
}

bool PlaybackState::operator==(const PlaybackState& other) const {
  return active_device_id == other.active_device_id &&
         is_local_device_active == other.is_local_device_active &&
         play_state == other.play_state &&
         last_source == other.last_source;
}

bool Config::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (!fetch_json) {
    return fail("fetch_json must be set");
  }
  if (poll_interval_visible.count() <= 0 || poll_interval_hidden.count() <= 0) {
    return fail("poll intervals must be positive");
  }
  if (reconcile_settle_delay.count() < 0 || reconcile_jitter_min.count() < 0 ||
      reconcile_jitter_max.count() < 0) {
    return fail("reconcile delays must not be negative");
  }
  if (reconcile_jitter_min > reconcile_jitter_max) {
    return fail("reconcile_jitter_min must be <= reconcile_jitter_max");
  }
  if (transfer_poll_interval.count() <= 0 || transfer_poll_attempts <= 0) {
    return fail("transfer policy must be positive");
  }
  if (local_transfer_grace.count() < 0 || external_transfer_ttl.count() < 0) {
    return fail("transfer protection windows must not be negative");
  }
  return true;
}

struct SyncMetricsAtomic {
  std::atomic<uint64_t> commands_issued{0};
  std::atomic<uint64_t> command_failures{0};
  std::atomic<uint64_t> remote_requests{0};
  std::atomic<uint64_t> remote_errors{0};
  std::atomic<uint64_t> polls{0};
  std::atomic<uint64_t> poll_errors{0};
  std::atomic<uint64_t> reconcile_retries{0};
  std::atomic<uint64_t> reconcile_degraded{0};
  std::atomic<uint64_t> pushes_dropped{0};
  std::atomic<uint64_t> callback_exceptions{0};
  std::atomic<uint64_t> state_changes{0};

  SyncMetrics Snapshot() const {
    SyncMetrics snapshot;
    snapshot.commands_issued = commands_issued.load();
    snapshot.command_failures = command_failures.load();
    snapshot.remote_requests = remote_requests.load();
    snapshot.remote_errors = remote_errors.load();
    snapshot.polls = polls.load();
    snapshot.poll_errors = poll_errors.load();
    snapshot.reconcile_retries = reconcile_retries.load();
    snapshot.reconcile_degraded = reconcile_degraded.load();
    snapshot.pushes_dropped = pushes_dropped.load();
    snapshot.callback_exceptions = callback_exceptions.load();
    snapshot.state_changes = state_changes.load();
    return snapshot;
  }
};

struct PlayerSync::Impl {
#ifdef PLAYSYNC_TESTING
  friend std::chrono::milliseconds test::ScheduledPollInterval(PlayerSync& sync);
  friend uint64_t test::PollCycles(PlayerSync& sync);
  friend bool test::IsTransferSuppressed(PlayerSync& sync);
  friend std::optional<std::string> test::IntendedDevice(PlayerSync& sync);
  friend bool test::IsAutoplayUnlocked(PlayerSync& sync);
#endif

  Impl(std::shared_ptr<LocalPlayer> player, Config config)
      : player_(std::move(player)),
        config_(std::move(config)),
        subscribers_(std::make_shared<SubscriberRegistry>()),
        rng_(std::random_device{}()) {
    visibility_ = config_.initial_visibility;
    scheduled_interval_ = PollIntervalFor(config_, visibility_);
  }

  bool Start() {
    if (disposed_) {
      start_error_ = "player sync disposed";
      return false;
    }
    if (started_.exchange(true)) {
      return true;
    }
    start_error_.clear();
    std::string error;
    if (!player_) {
      error = "local player must not be null";
    } else if (config_.Validate(&error)) {
      error.clear();
    }
    if (!error.empty()) {
      start_error_ = error;
      Log(error);
      started_ = false;
      return false;
    }
    AttachListeners();
    try {
      poll_thread_ = std::thread([this]() { PollLoop(); });
    } catch (const std::system_error& ex) {
      start_error_ = std::string("poll thread start failed: ") + ex.what();
      Log(start_error_);
      DetachListeners();
      started_ = false;
      return false;
    }
    return true;
  }

  void Dispose() {
    if (disposed_.exchange(true)) {
      return;
    }
    bool on_poll_thread = false;
    {
      std::lock_guard<std::mutex> lock(timer_mutex_);
      on_poll_thread = poll_thread_id_ == std::this_thread::get_id();
      timer_cv_.notify_all();
    }
    if (started_) {
      DetachListeners();
    }
    // A state callback on the poll thread cannot join its own thread; the
    // loop exits on its own and the destructor joins it.
    if (!on_poll_thread) {
      JoinPollThread();
    }
    std::lock_guard<std::mutex> lock(subscribers_->mutex);
    subscribers_->callbacks.clear();
  }

  void JoinPollThread() {
    if (poll_thread_.joinable()) {
      poll_thread_.join();
    }
  }

  // Wait for every command queued before this call to finish.
  void Drain() {
    CommandQueue::Ticket ticket = queue_.Take();
    ticket.Release();
  }

  CommandQueue::Ticket TakeTicket() { return queue_.Take(); }

  void ThrowIfDisposed() const {
    if (disposed_) {
      throw DisposedError();
    }
  }

  Unsubscribe OnChange(StateCallback cb) {
    ThrowIfDisposed();
    if (!cb) {
      return []() {};
    }
    uint64_t id = 0;
    {
      // The first call goes through the publish drain so it can never
      // arrive after a newer state.
      std::lock_guard<std::mutex> state_lock(state_mutex_);
      std::lock_guard<std::mutex> lock(subscribers_->mutex);
      id = subscribers_->next_id++;
      subscribers_->callbacks.emplace(id, std::move(cb));
      unprimed_subscribers_.push_back(id);
    }
    Publish();
    std::weak_ptr<SubscriberRegistry> registry = subscribers_;
    return [registry, id]() {
      if (auto locked = registry.lock()) {
        std::lock_guard<std::mutex> lock(locked->mutex);
        locked->callbacks.erase(id);
      }
    };
  }

  void SetPlaying(CommandQueue::Ticket& ticket, bool target) {
    RunCommand(ticket, "set_playing", [&](ExpectedState* expected) {
      return SetPlayingStep(target, expected);
    });
  }

  void TransferTo(CommandQueue::Ticket& ticket, const std::string& device_id,
                  std::optional<bool> desired_playing) {
    RunCommand(ticket, "transfer", [&](ExpectedState* expected) {
      return TransferStep(device_id, desired_playing, expected);
    });
  }

  void SyncCurrentSong(CommandQueue::Ticket& ticket, const std::string& uri,
                       int64_t position_ms) {
    RunCommand(ticket, "sync_current_song", [&](ExpectedState* expected) {
      return SyncSongStep(uri, position_ms, expected);
    });
  }

  bool Refresh() {
    ThrowIfDisposed();
    Trace("refreshing state");
    const PlaybackState current = GetState();
    if (current.is_local_device_active) {
      const auto local = player_ ? player_->GetCurrentState() : std::nullopt;
      if (local.has_value()) {
        HandleLocalState(local.value());
        return true;
      }
    }
    return PollOnce();
  }

  bool ActivateAutoplayGuard() {
    ThrowIfDisposed();
    Trace("activating autoplay guard");
    try {
      if (player_ && player_->SupportsActivation()) {
        player_->ActivateElement();
      }
      if (config_.audio_unlock) {
        config_.audio_unlock();
      }
    } catch (const std::exception& ex) {
      Log(std::string("failed to activate autoplay guard: ") + ex.what());
      return false;
    }
    autoplay_unlocked_ = true;
    Trace("autoplay guard activated");
    return true;
  }

  void SetVisibility(Visibility visibility) {
    if (disposed_) {
      return;
    }
    std::lock_guard<std::mutex> lock(timer_mutex_);
    if (visibility_ == visibility) {
      return;
    }
    visibility_ = visibility;
    ++visibility_epoch_;
    timer_cv_.notify_all();
  }

  PlaybackState GetState() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
  }

  std::optional<std::string> GetLocalDeviceId() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return local_device_id_;
  }

  std::vector<RemoteDevice> GetDevices() {
    ThrowIfDisposed();
    nlohmann::json data;
    try {
      data = Request(HttpMethod::kGet, kDevicesPath);
    } catch (const RemoteError& ex) {
      if (!ex.IsNoActiveDevice()) {
        throw;
      }
      return {};
    }
    std::vector<RemoteDevice> devices;
    if (data.is_null()) {
      return devices;
    }
    if (!ParseRemoteDevices(data, &devices)) {
      throw SyncError("malformed device list from remote surface");
    }
    return devices;
  }

  std::string GetLastError() const { return start_error_; }

  SyncMetrics GetMetrics() const { return metrics_.Snapshot(); }

 private:
  struct SubscriberRegistry {
    std::mutex mutex;
    uint64_t next_id = 1;
    std::map<uint64_t, StateCallback> callbacks;
  };

  void Log(const std::string& message) const { LogMessage(message, &config_); }

  void Trace(const std::string& message) const {
    if (config_.verbose) {
      Log(message);
    }
  }

  void RecordCallbackException(const char* name, const std::exception& ex) {
    metrics_.callback_exceptions.fetch_add(1);
    std::string message = "callback threw exception: ";
    message += name;
    message += ": ";
    message += ex.what();
    Log(message);
  }

  // Run a mutating command in its turn. The step reports whether it issued
  // anything; only issued commands are reconciled. The turn is released on
  // every exit path.
  template <typename Step>
  void RunCommand(CommandQueue::Ticket& ticket, const char* name, Step&& step) {
    ScopedTurn turn(ticket);
    ThrowIfDisposed();
    Trace(std::string("command ") + name);
    ExpectedState expected;
    bool issued = false;
    try {
      issued = step(&expected);
    } catch (const std::exception& ex) {
      metrics_.command_failures.fetch_add(1);
      Log(std::string(name) + " failed: " + ex.what());
      throw;
    }
    if (!issued) {
      return;
    }
    metrics_.commands_issued.fetch_add(1);
    Reconcile(expected);
  }

  bool SetPlayingStep(bool target, ExpectedState* expected) {
    const PlaybackState current = GetState();
    if (current.play_state == PlayStateFrom(target)) {
      Trace("already in desired state, skipping");
      return false;
    }
    if (target && config_.require_autoplay_unlock && !autoplay_unlocked_) {
      Trace("play blocked until the autoplay guard is activated");
      MarkPlayStateUnknown();
      return false;
    }
    expected->playing = target;

    if (current.is_local_device_active) {
      if (target) {
        player_->Resume();
      } else {
        player_->Pause();
      }
      return true;
    }

    std::optional<std::string> target_device;
    if (config_.target_active_device) {
      target_device = current.active_device_id;
    }
    const std::string path =
        BuildDeviceTargetedPath(target ? kPlayPath : kPausePath, target_device);
    try {
      Request(HttpMethod::kPut, path);
    } catch (const RemoteError& ex) {
      if (!ex.IsNoActiveDevice()) {
        throw;
      }
      Trace("no active device for playback command");
      MarkPlayStateUnknown();
      return false;
    }
    return true;
  }

  bool TransferStep(const std::string& device_id, std::optional<bool> desired_playing,
                    ExpectedState* expected) {
    {
      // Guard before the remote call so mid-transfer pushes cannot pull the
      // active device back.
      std::lock_guard<std::mutex> lock(state_mutex_);
      intended_device_ = device_id;
      suppress_local_push_ = true;
      suppression_release_at_.reset();
    }
    expected->device_id = device_id;
    if (desired_playing.has_value()) {
      expected->playing = desired_playing;
    }
    Request(HttpMethod::kPut, kPlayerPath, BuildTransferBody(device_id, desired_playing));
    // Commit the confirmed device right away. Reconciliation may still read a
    // stale replica, but it only degrades the play state, so later commands
    // keep addressing the device the transfer landed on.
    CommitRemote(WaitForTransferCompletion(device_id, desired_playing));
    ScheduleSuppressionRelease(device_id);
    return true;
  }

  bool SyncSongStep(const std::string& uri, int64_t position_ms, ExpectedState* expected) {
    expected->playing = true;
    std::optional<std::string> target_device;
    if (config_.target_active_device) {
      target_device = GetState().active_device_id;
    }
    try {
      Request(HttpMethod::kPut, BuildDeviceTargetedPath(kPlayPath, target_device),
              BuildPlayItemBody(uri, position_ms));
    } catch (const RemoteError& ex) {
      if (!ex.IsNoActiveDevice()) {
        throw;
      }
      Trace("no active device for sync command");
      MarkPlayStateUnknown();
      return false;
    }
    return true;
  }

  // Poll until the remote side reports the target device (and the desired
  // playing flag, when one was given).
  RemotePlaybackState WaitForTransferCompletion(const std::string& device_id,
                                                std::optional<bool> desired_playing) {
    for (int attempt = 0; attempt < config_.transfer_poll_attempts; ++attempt) {
      if (!SleepFor(config_.transfer_poll_interval)) {
        throw DisposedError();
      }
      const auto remote = FetchRemoteState();
      if (remote.has_value() && remote->device_id == device_id) {
        if (!desired_playing.has_value() ||
            remote->is_playing == desired_playing.value()) {
          Trace("transfer to " + device_id + " confirmed");
          return remote.value();
        }
      }
    }
    throw TransferTimeoutError(device_id);
  }

  void ScheduleSuppressionRelease(const std::string& device_id) {
    const auto now = Clock::now();
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (local_device_id_.has_value() && local_device_id_.value() == device_id) {
      suppression_release_at_ = now + config_.local_transfer_grace;
      return;
    }
    if (config_.external_transfer_ttl.count() > 0) {
      suppression_release_at_ = now + config_.external_transfer_ttl;
      Trace("external device transfer, protection expires after ttl");
      return;
    }
    Trace("external device transfer, keeping protection until the next transfer");
  }

  // Lazily end an elapsed protection window. Caller holds state_mutex_.
  void ExpireProtectionLocked(Clock::time_point now) {
    if (suppress_local_push_ && suppression_release_at_.has_value() &&
        now >= suppression_release_at_.value()) {
      suppress_local_push_ = false;
      intended_device_.reset();
      suppression_release_at_.reset();
    }
  }

  bool IsSuppressedLocked(Clock::time_point now) {
    ExpireProtectionLocked(now);
    return suppress_local_push_;
  }

  // Verify a command's effect: settle, poll, retry once with jitter, then
  // fall back to unknown instead of guessing.
  void Reconcile(const ExpectedState& expected) {
    if (!SleepFor(config_.reconcile_settle_delay)) {
      return;
    }
    std::optional<RemotePlaybackState> remote;
    if (VerifyOnce(expected, &remote)) {
      CommitRemote(remote);
      return;
    }
    metrics_.reconcile_retries.fetch_add(1);
    if (!SleepFor(JitterDelay())) {
      return;
    }
    if (VerifyOnce(expected, &remote)) {
      CommitRemote(remote);
      return;
    }
    metrics_.reconcile_degraded.fetch_add(1);
    Log("state reconciliation failed, marking as unknown");
    CommitIfChanged([](PlaybackState& next) {
      next.play_state = PlayState::kUnknown;
      next.last_source = StateSource::kUnknown;
      return true;
    });
  }

  bool VerifyOnce(const ExpectedState& expected,
                  std::optional<RemotePlaybackState>* remote) {
    try {
      *remote = FetchRemoteState();
    } catch (const std::exception& ex) {
      Log(std::string("verification poll failed: ") + ex.what());
      return false;
    }
    return RemoteMatchesExpected(*remote, expected.playing, expected.device_id);
  }

  std::chrono::milliseconds JitterDelay() {
    const auto low = config_.reconcile_jitter_min.count();
    const auto high = config_.reconcile_jitter_max.count();
    if (high <= low) {
      return config_.reconcile_jitter_min;
    }
    std::uniform_int_distribution<std::chrono::milliseconds::rep> dist(low, high);
    return std::chrono::milliseconds(dist(rng_));
  }

  nlohmann::json Request(HttpMethod method, const std::string& path,
                         nlohmann::json body = nullptr) {
    if (!config_.fetch_json) {
      throw SyncError("fetch_json not configured");
    }
    RemoteRequest request;
    request.method = method;
    request.path = path;
    request.body = std::move(body);
    if (config_.get_access_token) {
      request.access_token = config_.get_access_token();
    }
    metrics_.remote_requests.fetch_add(1);
    try {
      return config_.fetch_json(request);
    } catch (const RemoteError& ex) {
      if (!ex.IsNoActiveDevice()) {
        metrics_.remote_errors.fetch_add(1);
      }
      throw;
    } catch (const std::exception&) {
      metrics_.remote_errors.fetch_add(1);
      throw;
    }
  }

  // Fetch remote playback state. No session (204/404 or an empty body)
  // yields nullopt.
  std::optional<RemotePlaybackState> FetchRemoteState() {
    nlohmann::json data;
    try {
      data = Request(HttpMethod::kGet, kPlayerPath);
    } catch (const RemoteError& ex) {
      if (ex.IsNoActiveDevice()) {
        return std::nullopt;
      }
      throw;
    }
    if (data.is_null()) {
      return std::nullopt;
    }
    RemotePlaybackState state;
    if (!ParseRemotePlaybackState(data, &state)) {
      throw SyncError("malformed playback state from remote surface");
    }
    return state;
  }

  bool PollOnce() {
    metrics_.polls.fetch_add(1);
    std::optional<RemotePlaybackState> remote;
    try {
      remote = FetchRemoteState();
    } catch (const std::exception& ex) {
      metrics_.poll_errors.fetch_add(1);
      Log(std::string("failed to poll remote state: ") + ex.what());
      return false;
    }
    CommitRemote(remote);
    return true;
  }

  // Remote poller. Runs only while the local device is not confirmed active;
  // a visibility change restarts the wait with the new cadence.
  void PollLoop() {
    std::unique_lock<std::mutex> lock(timer_mutex_);
    poll_thread_id_ = std::this_thread::get_id();
    while (!disposed_) {
      const auto interval = PollIntervalFor(config_, visibility_);
      scheduled_interval_ = interval;
      const uint64_t epoch = visibility_epoch_;
      const bool woken = timer_cv_.wait_for(lock, interval, [&]() {
        return disposed_.load() || visibility_epoch_ != epoch;
      });
      if (woken) {
        continue;
      }
      lock.unlock();
      poll_cycles_.fetch_add(1);
      if (!GetState().is_local_device_active) {
        PollOnce();
      }
      lock.lock();
    }
  }

  // Interruptible delay. Returns false if the engine was disposed meanwhile.
  bool SleepFor(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(timer_mutex_);
    return !timer_cv_.wait_for(lock, delay, [this]() { return disposed_.load(); });
  }

  void AttachListeners() {
    player_->SetReadyCallback([this](const std::string& device_id) {
      HandleReady(device_id);
    });
    player_->SetNotReadyCallback([this](const std::string& device_id) {
      HandleNotReady(device_id);
    });
    player_->SetStateCallback([this](const LocalPlayerState& state) {
      HandleLocalState(state);
    });
  }

  void DetachListeners() {
    player_->SetReadyCallback(nullptr);
    player_->SetNotReadyCallback(nullptr);
    player_->SetStateCallback(nullptr);
  }

  void HandleReady(const std::string& device_id) {
    const auto now = Clock::now();
    std::optional<std::string> intended;
    bool adopted = false;
    CommitIfChanged([&](PlaybackState& next) {
      local_device_id_ = device_id;
      ExpireProtectionLocked(now);
      if (intended_device_.has_value() && intended_device_.value() != device_id) {
        intended = intended_device_;
        return false;
      }
      next.active_device_id = device_id;
      next.is_local_device_active = true;
      next.last_source = StateSource::kLocalPush;
      adopted = true;
      return true;
    });
    if (adopted) {
      Trace("local player ready: " + device_id);
    } else {
      Trace("local player ready but intended device is " + intended.value_or("") +
            ", not switching");
    }
  }

  void HandleNotReady(const std::string& device_id) {
    CommitIfChanged([&](PlaybackState& next) {
      if (!next.is_local_device_active || next.active_device_id != device_id) {
        return false;
      }
      next.is_local_device_active = false;
      next.play_state = PlayState::kUnknown;
      next.last_source = StateSource::kUnknown;
      return true;
    });
  }

  void HandleLocalState(const LocalPlayerState& state) {
    const auto now = Clock::now();
    bool dropped = false;
    CommitIfChanged([&](PlaybackState& next) {
      if (IsSuppressedLocked(now)) {
        dropped = true;
        return false;
      }
      if (!next.is_local_device_active) {
        return false;
      }
      next.play_state = PlayStateFrom(!state.paused);
      next.last_source = StateSource::kLocalPush;
      return true;
    });
    if (dropped) {
      metrics_.pushes_dropped.fetch_add(1);
      Log("ignoring local state change while transfer protection is active");
    }
  }

  void MarkPlayStateUnknown() {
    CommitIfChanged([](PlaybackState& next) {
      next.play_state = PlayState::kUnknown;
      return true;
    });
  }

  void CommitRemote(const std::optional<RemotePlaybackState>& remote) {
    CommitIfChanged([&](PlaybackState& next) {
      next.last_source = StateSource::kRemotePoll;
      if (!remote.has_value()) {
        next.active_device_id.reset();
        next.is_local_device_active = false;
        next.play_state = PlayState::kUnknown;
        return true;
      }
      next.active_device_id = remote->device_id;
      next.is_local_device_active = remote->device_id.has_value() &&
                                    remote->device_id == local_device_id_;
      next.play_state = PlayStateFrom(remote->is_playing);
      return true;
    });
  }

  // The only writer of state_. The mutator runs under state_mutex_ and may
  // decline by returning false; subscribers hear about structural changes only.
  template <typename Mutator>
  void CommitIfChanged(Mutator&& mutate) {
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      PlaybackState next = state_;
      if (!mutate(next) || next == state_) {
        return;
      }
      state_ = std::move(next);
      ++state_version_;
    }
    metrics_.state_changes.fetch_add(1);
    Publish();
  }

  // Deliver committed states in order. A commit or subscription that lands
  // while another thread is dispatching is picked up by that thread's drain
  // loop. New subscribers get the current state once; a newer commit reaches
  // everyone and supersedes that first call.
  void Publish() {
    std::unique_lock<std::mutex> lock(state_mutex_);
    if (dispatching_) {
      return;
    }
    dispatching_ = true;
    while (published_version_ != state_version_ || !unprimed_subscribers_.empty()) {
      const PlaybackState snapshot = state_;
      const bool changed = published_version_ != state_version_;
      std::vector<uint64_t> only;
      if (changed) {
        published_version_ = state_version_;
        unprimed_subscribers_.clear();
      } else {
        only.swap(unprimed_subscribers_);
      }
      lock.unlock();
      if (changed) {
        Trace("state updated: " + Describe(snapshot));
        Notify(snapshot, nullptr);
      } else {
        Notify(snapshot, &only);
      }
      lock.lock();
    }
    dispatching_ = false;
  }

  // Invoke subscribers outside every lock. `only` restricts delivery to the
  // listed subscriber ids.
  void Notify(const PlaybackState& state, const std::vector<uint64_t>* only) {
    std::vector<StateCallback> callbacks;
    {
      std::lock_guard<std::mutex> lock(subscribers_->mutex);
      callbacks.reserve(subscribers_->callbacks.size());
      for (const auto& entry : subscribers_->callbacks) {
        if (only && std::find(only->begin(), only->end(), entry.first) == only->end()) {
          continue;
        }
        callbacks.push_back(entry.second);
      }
    }
    for (const auto& cb : callbacks) {
      try {
        cb(state);
      } catch (const std::exception& ex) {
        RecordCallbackException("StateCallback", ex);
      }
    }
  }

  std::shared_ptr<LocalPlayer> player_;
  Config config_;
  std::atomic<bool> started_{false};
  std::atomic<bool> disposed_{false};
  std::atomic<bool> autoplay_unlocked_{false};
  std::string start_error_;
  SyncMetricsAtomic metrics_;
  CommandQueue queue_;

  mutable std::mutex state_mutex_;
  PlaybackState state_;
  uint64_t state_version_ = 0;
  uint64_t published_version_ = 0;
  bool dispatching_ = false;
  std::vector<uint64_t> unprimed_subscribers_;
  std::optional<std::string> local_device_id_;
  std::optional<std::string> intended_device_;
  bool suppress_local_push_ = false;
  std::optional<Clock::time_point> suppression_release_at_;

  std::shared_ptr<SubscriberRegistry> subscribers_;

  std::mutex timer_mutex_;
  std::condition_variable timer_cv_;
  Visibility visibility_ = Visibility::kVisible;
  uint64_t visibility_epoch_ = 0;
  std::chrono::milliseconds scheduled_interval_{0};
  std::atomic<uint64_t> poll_cycles_{0};

  std::mt19937 rng_;
  std::thread poll_thread_;
  std::thread::id poll_thread_id_;
};

PlayerSync::PlayerSync(std::shared_ptr<LocalPlayer> player, Config config)
    : impl_(new Impl(std::move(player), std::move(config))) {}

PlayerSync::~PlayerSync() {
  impl_->Dispose();
  impl_->JoinPollThread();
  impl_->Drain();
}

bool PlayerSync::Start() { return impl_->Start(); }
void PlayerSync::Dispose() { impl_->Dispose(); }

PlayerSync::Unsubscribe PlayerSync::OnChange(StateCallback cb) {
  return impl_->OnChange(std::move(cb));
}

void PlayerSync::SetPlaying(bool target) {
  auto ticket = impl_->TakeTicket();
  impl_->SetPlaying(ticket, target);
}

void PlayerSync::Toggle() {
  const PlaybackState current = impl_->GetState();
  SetPlaying(current.play_state != PlayState::kPlaying);
}

void PlayerSync::TransferTo(const std::string& device_id,
                            std::optional<bool> desired_playing) {
  auto ticket = impl_->TakeTicket();
  impl_->TransferTo(ticket, device_id, desired_playing);
}

void PlayerSync::SyncCurrentSong(const std::string& uri, int64_t position_ms) {
  auto ticket = impl_->TakeTicket();
  impl_->SyncCurrentSong(ticket, uri, position_ms);
}

std::future<void> PlayerSync::SetPlayingAsync(bool target) {
  Impl* impl = impl_.get();
  impl->ThrowIfDisposed();
  auto ticket = impl->TakeTicket();
  return std::async(std::launch::async,
                    [impl, target, ticket = std::move(ticket)]() mutable {
                      impl->SetPlaying(ticket, target);
                    });
}

std::future<void> PlayerSync::TransferToAsync(const std::string& device_id,
                                              std::optional<bool> desired_playing) {
  Impl* impl = impl_.get();
  impl->ThrowIfDisposed();
  auto ticket = impl->TakeTicket();
  return std::async(std::launch::async,
                    [impl, device_id, desired_playing,
                     ticket = std::move(ticket)]() mutable {
                      impl->TransferTo(ticket, device_id, desired_playing);
                    });
}

std::future<void> PlayerSync::SyncCurrentSongAsync(const std::string& uri,
                                                   int64_t position_ms) {
  Impl* impl = impl_.get();
  impl->ThrowIfDisposed();
  auto ticket = impl->TakeTicket();
  return std::async(std::launch::async,
                    [impl, uri, position_ms, ticket = std::move(ticket)]() mutable {
                      impl->SyncCurrentSong(ticket, uri, position_ms);
                    });
}

bool PlayerSync::Refresh() { return impl_->Refresh(); }
bool PlayerSync::ActivateAutoplayGuard() { return impl_->ActivateAutoplayGuard(); }
void PlayerSync::SetVisibility(Visibility visibility) { impl_->SetVisibility(visibility); }

PlaybackState PlayerSync::GetState() const { return impl_->GetState(); }

std::optional<std::string> PlayerSync::GetLocalDeviceId() const {
  return impl_->GetLocalDeviceId();
}

std::vector<RemoteDevice> PlayerSync::GetDevices() { return impl_->GetDevices(); }

std::string PlayerSync::GetLastError() const { return impl_->GetLastError(); }

SyncMetrics PlayerSync::GetMetrics() const { return impl_->GetMetrics(); }

#ifdef PLAYSYNC_TESTING
namespace test {

nlohmann::json BuildTransferBody(const std::string& device_id,
                                 std::optional<bool> desired_playing) {
  return ::playsync::BuildTransferBody(device_id, desired_playing);
}

nlohmann::json BuildPlayItemBody(const std::string& uri, int64_t position_ms) {
  return ::playsync::BuildPlayItemBody(uri, position_ms);
}

std::string BuildDeviceTargetedPath(const std::string& path,
                                    const std::optional<std::string>& device_id) {
  return ::playsync::BuildDeviceTargetedPath(path, device_id);
}

bool ParseRemotePlaybackState(const nlohmann::json& data, RemotePlaybackState* out) {
  return ::playsync::ParseRemotePlaybackState(data, out);
}

bool ParseRemoteDevices(const nlohmann::json& data, std::vector<RemoteDevice>* out) {
  return ::playsync::ParseRemoteDevices(data, out);
}

bool RemoteMatchesExpected(const std::optional<RemotePlaybackState>& remote,
                           std::optional<bool> expected_playing,
                           const std::optional<std::string>& expected_device) {
  return ::playsync::RemoteMatchesExpected(remote, expected_playing, expected_device);
}

std::chrono::milliseconds PollIntervalFor(const Config& config, Visibility visibility) {
  return ::playsync::PollIntervalFor(config, visibility);
}

std::chrono::milliseconds ScheduledPollInterval(PlayerSync& sync) {
  std::lock_guard<std::mutex> lock(sync.impl_->timer_mutex_);
  return sync.impl_->scheduled_interval_;
}

uint64_t PollCycles(PlayerSync& sync) {
  return sync.impl_->poll_cycles_.load();
}

bool IsTransferSuppressed(PlayerSync& sync) {
  std::lock_guard<std::mutex> lock(sync.impl_->state_mutex_);
  return sync.impl_->IsSuppressedLocked(Clock::now());
}

std::optional<std::string> IntendedDevice(PlayerSync& sync) {
  std::lock_guard<std::mutex> lock(sync.impl_->state_mutex_);
  sync.impl_->ExpireProtectionLocked(Clock::now());
  return sync.impl_->intended_device_;
}

bool IsAutoplayUnlocked(PlayerSync& sync) {
  return sync.impl_->autoplay_unlocked_.load();
}

}  // namespace test
#endif

}  // namespace playsync
