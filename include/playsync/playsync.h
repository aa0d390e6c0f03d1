#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace playsync {

class PlayerSync;

#ifdef PLAYSYNC_TESTING
namespace test {
std::chrono::milliseconds ScheduledPollInterval(PlayerSync& sync);
uint64_t PollCycles(PlayerSync& sync);
bool IsTransferSuppressed(PlayerSync& sync);
std::optional<std::string> IntendedDevice(PlayerSync& sync);
bool IsAutoplayUnlocked(PlayerSync& sync);
}  // namespace test
#endif

/**
 * Remote surface paths used by the engine.
 */
constexpr const char* kPlayerPath = "/me/player";
constexpr const char* kDevicesPath = "/me/player/devices";
constexpr const char* kPlayPath = "/me/player/play";
constexpr const char* kPausePath = "/me/player/pause";

/**
 * HTTP statuses the remote surface uses for "nothing is active".
 */
constexpr int kStatusNoContent = 204;
constexpr int kStatusNotFound = 404;

/**
 * Tri-state playing flag. kUnknown means no device state has been verified.
 */
enum class PlayState {
  kUnknown,
  kPaused,
  kPlaying,
};

/**
 * Which path produced the last committed state.
 */
enum class StateSource {
  kUnknown,
  kLocalPush,
  kRemotePoll,
};

enum class Visibility {
  kVisible,
  kHidden,
};

enum class HttpMethod {
  kGet,
  kPut,
  kPost,
};

const char* ToString(PlayState state);
const char* ToString(StateSource source);
const char* ToString(HttpMethod method);

/// Map a verified boolean onto the tri-state.
inline PlayState PlayStateFrom(bool playing) {
  return playing ? PlayState::kPlaying : PlayState::kPaused;
}

/**
 * The single reconciled view of what is playing where.
 */
struct PlaybackState {
  /// Device the engine believes is active, if any.
  std::optional<std::string> active_device_id;
  /// Whether the active device is the embedded local player.
  bool is_local_device_active = false;
  /// Verified playing state, kUnknown when unverified.
  PlayState play_state = PlayState::kUnknown;
  /// Path that produced the current state.
  StateSource last_source = StateSource::kUnknown;

  bool operator==(const PlaybackState& other) const;
  bool operator!=(const PlaybackState& other) const { return !(*this == other); }
};

/**
 * Playback state reported by the remote surface (GET /me/player).
 */
struct RemotePlaybackState {
  /// Active device id; absent when the session has no device.
  std::optional<std::string> device_id;
  std::string device_name;
  std::string device_type;
  bool is_playing = false;
  /// Position of the current item in ms.
  int64_t progress_ms = 0;
  /// URI of the current item, if any.
  std::optional<std::string> item_uri;
};

/**
 * A device known to the remote surface (GET /me/player/devices).
 */
struct RemoteDevice {
  std::string id;
  std::string name;
  std::string type;
  bool is_active = false;
  std::optional<int> volume_percent;
};

/**
 * State pushed by the embedded player's state-changed event.
 */
struct LocalPlayerState {
  bool paused = true;
  int64_t position_ms = 0;
  std::string track_uri;
};

/**
 * One authenticated call against the remote surface.
 */
struct RemoteRequest {
  HttpMethod method = HttpMethod::kGet;
  std::string path;
  /// Optional JSON body (null when the call has none).
  nlohmann::json body;
  /// Bearer credential from Config::get_access_token (may be empty).
  std::string access_token;
};

/**
 * Base class for errors raised by the engine and its collaborators.
 */
class SyncError : public std::runtime_error {
 public:
  explicit SyncError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Raised by the remote transport. Carries an HTTP-like status.
 */
class RemoteError : public SyncError {
 public:
  RemoteError(int status, const std::string& message)
      : SyncError(message), status_(status) {}

  int status() const { return status_; }
  /// True for the statuses that mean "no active device / no session".
  bool IsNoActiveDevice() const {
    return status_ == kStatusNoContent || status_ == kStatusNotFound;
  }

 private:
  int status_;
};

/**
 * Raised when a transfer is not confirmed within the wait budget.
 */
class TransferTimeoutError : public SyncError {
 public:
  explicit TransferTimeoutError(const std::string& device_id)
      : SyncError("transfer to device " + device_id +
                  " did not complete within timeout"),
        device_id_(device_id) {}

  const std::string& device_id() const { return device_id_; }

 private:
  std::string device_id_;
};

/**
 * Raised for commands issued against a disposed engine.
 */
class DisposedError : public SyncError {
 public:
  DisposedError() : SyncError("player sync disposed") {}
};

/**
 * Handle to the embedded playback SDK that registers as one output device.
 *
 * Callbacks may fire on any thread. Passing nullptr to a Set*Callback method
 * detaches the previous listener.
 */
class LocalPlayer {
 public:
  using DeviceCallback = std::function<void(const std::string& device_id)>;
  using StateCallback = std::function<void(const LocalPlayerState&)>;

  virtual ~LocalPlayer() = default;

  /// Register the "ready" listener (device id of the local player).
  virtual void SetReadyCallback(DeviceCallback cb) = 0;
  /// Register the "not ready" listener.
  virtual void SetNotReadyCallback(DeviceCallback cb) = 0;
  /// Register the state-changed listener.
  virtual void SetStateCallback(StateCallback cb) = 0;

  /// Resume local playback. Throws on failure.
  virtual void Resume() = 0;
  /// Pause local playback. Throws on failure.
  virtual void Pause() = 0;

  /// Whether ActivateElement() does anything on this platform.
  virtual bool SupportsActivation() const { return false; }
  /// Unlock the output element from inside a user gesture.
  virtual void ActivateElement() {}
  /// Query the current local state, if the SDK supports it.
  virtual std::optional<LocalPlayerState> GetCurrentState() { return std::nullopt; }
};

/**
 * Lightweight counters for commands, polling and reconciliation.
 */
struct SyncMetrics {
  uint64_t commands_issued = 0;
  uint64_t command_failures = 0;
  uint64_t remote_requests = 0;
  uint64_t remote_errors = 0;
  uint64_t polls = 0;
  uint64_t poll_errors = 0;
  uint64_t reconcile_retries = 0;
  uint64_t reconcile_degraded = 0;
  uint64_t pushes_dropped = 0;
  uint64_t callback_exceptions = 0;
  uint64_t state_changes = 0;
};

/**
 * Engine configuration: collaborators, cadence and retry policy.
 */
struct Config {
  using LogCallback = std::function<void(const std::string&)>;
  using TokenProvider = std::function<std::string()>;
  using FetchJson = std::function<nlohmann::json(const RemoteRequest&)>;
  using AudioUnlock = std::function<void()>;

  /// Bearer credential provider for the remote surface (optional).
  TokenProvider get_access_token;
  /// Remote transport. Returns parsed JSON (null for an empty body) or throws
  /// RemoteError. Required.
  FetchJson fetch_json;
  /// Platform hook that opens and closes a near-silent audio output (optional).
  AudioUnlock audio_unlock;

  /// Poll interval while the host is visible.
  std::chrono::milliseconds poll_interval_visible{1500};
  /// Poll interval while the host is hidden.
  std::chrono::milliseconds poll_interval_hidden{5000};
  /// Visibility assumed at start.
  Visibility initial_visibility = Visibility::kVisible;

  /// Delay before the first post-command verification poll.
  std::chrono::milliseconds reconcile_settle_delay{200};
  /// Jitter bounds for the single verification retry.
  std::chrono::milliseconds reconcile_jitter_min{100};
  std::chrono::milliseconds reconcile_jitter_max{300};

  /// Spacing between transfer confirmation polls.
  std::chrono::milliseconds transfer_poll_interval{300};
  /// Number of transfer confirmation polls before timing out.
  int transfer_poll_attempts = 10;
  /// Suppression release delay after a transfer back to the local device.
  std::chrono::milliseconds local_transfer_grace{2000};
  /// Suppression lifetime after a transfer to another device (0 = until the
  /// user transfers again).
  std::chrono::milliseconds external_transfer_ttl{0};

  /// Block play commands until ActivateAutoplayGuard() has succeeded once.
  bool require_autoplay_unlock = true;
  /// Address remote play/pause and play-item requests to the device
  /// believed active.
  bool target_active_device = true;

  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;
  /// Log routine trace in addition to errors.
  bool verbose = false;

  /**
   * Validate configuration values.
   *
   * @param error Optional output string describing the first validation error.
   * @return true if the configuration is valid.
   */
  bool Validate(std::string* error = nullptr) const;
};

/**
 * Coordinates one logical playback stream across the embedded local player
 * and the remote control surface.
 *
 * Commands are blocking and totally ordered: each runs only after every
 * earlier command, including its reconciliation, has finished. The *Async
 * variants take their place in line on the calling thread and complete on a
 * worker thread.
 */
class PlayerSync {
 public:
  using StateCallback = std::function<void(const PlaybackState&)>;
  using Unsubscribe = std::function<void()>;

  /// Construct with a fully unknown state. Listeners attach in Start().
  PlayerSync(std::shared_ptr<LocalPlayer> player, Config config);
  /// Dispose if still running.
  ~PlayerSync();

  PlayerSync(const PlayerSync&) = delete;
  PlayerSync& operator=(const PlayerSync&) = delete;

  /// Validate config, attach the local player listeners and start polling.
  bool Start();
  /// Detach listeners, stop polling and clear subscribers. Idempotent.
  void Dispose();

  /// Register a state subscriber. Invoked immediately with the current state.
  Unsubscribe OnChange(StateCallback cb);

  /// Drive playback to the target state. No-op if already there.
  void SetPlaying(bool target);
  /// Flip playback, treating unknown as paused.
  void Toggle();
  /// Move playback to a device and wait for the remote side to confirm it.
  void TransferTo(const std::string& device_id,
                  std::optional<bool> desired_playing = std::nullopt);
  /// Start a specific item at an offset on whichever device is active.
  void SyncCurrentSong(const std::string& uri, int64_t position_ms = 0);

  std::future<void> SetPlayingAsync(bool target);
  std::future<void> TransferToAsync(const std::string& device_id,
                                    std::optional<bool> desired_playing = std::nullopt);
  std::future<void> SyncCurrentSongAsync(const std::string& uri,
                                         int64_t position_ms = 0);

  /// Poll the remote surface once and commit the result.
  bool Refresh();
  /// Unlock audio output. Call from inside a genuine user gesture.
  bool ActivateAutoplayGuard();
  /// Report a host visibility transition.
  void SetVisibility(Visibility visibility);

  /// Return the current reconciled state.
  PlaybackState GetState() const;
  /// Return the id announced by the local player's last ready event.
  std::optional<std::string> GetLocalDeviceId() const;
  /// Return the devices known to the remote surface.
  std::vector<RemoteDevice> GetDevices();
  /// Return the last Start() error message, if any.
  std::string GetLastError() const;
  /// Return counters for commands, polls and callbacks.
  SyncMetrics GetMetrics() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

#ifdef PLAYSYNC_TESTING
  friend std::chrono::milliseconds test::ScheduledPollInterval(PlayerSync& sync);
  friend uint64_t test::PollCycles(PlayerSync& sync);
  friend bool test::IsTransferSuppressed(PlayerSync& sync);
  friend std::optional<std::string> test::IntendedDevice(PlayerSync& sync);
  friend bool test::IsAutoplayUnlocked(PlayerSync& sync);
#endif
};

}  // namespace playsync
