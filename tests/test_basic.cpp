// Basic tests for playsync data helpers.
#include "playsync/playsync.h"

#include <gtest/gtest.h>

TEST(PlayStateTest, ToStringNamesEveryValue) {
  EXPECT_STREQ(playsync::ToString(playsync::PlayState::kUnknown), "unknown");
  EXPECT_STREQ(playsync::ToString(playsync::PlayState::kPaused), "paused");
  EXPECT_STREQ(playsync::ToString(playsync::PlayState::kPlaying), "playing");
}

TEST(PlayStateTest, FromBoolMapsToVerifiedStates) {
  EXPECT_EQ(playsync::PlayStateFrom(true), playsync::PlayState::kPlaying);
  EXPECT_EQ(playsync::PlayStateFrom(false), playsync::PlayState::kPaused);
}

TEST(StateSourceTest, ToStringNamesEveryValue) {
  EXPECT_STREQ(playsync::ToString(playsync::StateSource::kUnknown), "unknown");
  EXPECT_STREQ(playsync::ToString(playsync::StateSource::kLocalPush), "local-push");
  EXPECT_STREQ(playsync::ToString(playsync::StateSource::kRemotePoll), "remote-poll");
}

TEST(HttpMethodTest, ToStringMatchesVerbs) {
  EXPECT_STREQ(playsync::ToString(playsync::HttpMethod::kGet), "GET");
  EXPECT_STREQ(playsync::ToString(playsync::HttpMethod::kPut), "PUT");
  EXPECT_STREQ(playsync::ToString(playsync::HttpMethod::kPost), "POST");
}

TEST(PlaybackStateTest, DefaultIsFullyUnknown) {
  playsync::PlaybackState state;
  EXPECT_FALSE(state.active_device_id.has_value());
  EXPECT_FALSE(state.is_local_device_active);
  EXPECT_EQ(state.play_state, playsync::PlayState::kUnknown);
  EXPECT_EQ(state.last_source, playsync::StateSource::kUnknown);
}

TEST(PlaybackStateTest, EqualityComparesEveryField) {
  playsync::PlaybackState a;
  playsync::PlaybackState b;
  EXPECT_EQ(a, b);

  b.active_device_id = "dev-1";
  EXPECT_NE(a, b);
  a.active_device_id = "dev-1";
  EXPECT_EQ(a, b);

  b.is_local_device_active = true;
  EXPECT_NE(a, b);
  a.is_local_device_active = true;

  b.play_state = playsync::PlayState::kPaused;
  EXPECT_NE(a, b);
  a.play_state = playsync::PlayState::kPaused;

  b.last_source = playsync::StateSource::kRemotePoll;
  EXPECT_NE(a, b);
  a.last_source = playsync::StateSource::kRemotePoll;
  EXPECT_EQ(a, b);
}

TEST(RemoteErrorTest, NoActiveDeviceStatuses) {
  EXPECT_TRUE(playsync::RemoteError(204, "no content").IsNoActiveDevice());
  EXPECT_TRUE(playsync::RemoteError(404, "not found").IsNoActiveDevice());
  EXPECT_FALSE(playsync::RemoteError(500, "server").IsNoActiveDevice());
  EXPECT_FALSE(playsync::RemoteError(401, "unauthorized").IsNoActiveDevice());
  EXPECT_EQ(playsync::RemoteError(429, "slow down").status(), 429);
}

TEST(ErrorTest, TransferTimeoutNamesDevice) {
  playsync::TransferTimeoutError error("speaker-7");
  EXPECT_EQ(error.device_id(), "speaker-7");
  EXPECT_NE(std::string(error.what()).find("speaker-7"), std::string::npos);
}

TEST(ErrorTest, ErrorsShareBaseClass) {
  try {
    throw playsync::DisposedError();
  } catch (const playsync::SyncError& error) {
    EXPECT_NE(std::string(error.what()).find("disposed"), std::string::npos);
  }
}

TEST(ConfigTest, DefaultsMatchExpected) {
  playsync::Config config;
  EXPECT_EQ(config.poll_interval_visible.count(), 1500);
  EXPECT_EQ(config.poll_interval_hidden.count(), 5000);
  EXPECT_EQ(config.initial_visibility, playsync::Visibility::kVisible);
  EXPECT_EQ(config.reconcile_settle_delay.count(), 200);
  EXPECT_EQ(config.reconcile_jitter_min.count(), 100);
  EXPECT_EQ(config.reconcile_jitter_max.count(), 300);
  EXPECT_EQ(config.transfer_poll_interval.count(), 300);
  EXPECT_EQ(config.transfer_poll_attempts, 10);
  EXPECT_EQ(config.local_transfer_grace.count(), 2000);
  EXPECT_EQ(config.external_transfer_ttl.count(), 0);
  EXPECT_TRUE(config.require_autoplay_unlock);
  EXPECT_TRUE(config.target_active_device);
  EXPECT_FALSE(config.verbose);
}

TEST(PlayerSyncTest, InitialStateIsUnknown) {
  playsync::Config config;
  config.fetch_json = [](const playsync::RemoteRequest&) { return nlohmann::json(); };
  playsync::PlayerSync sync(nullptr, config);
  EXPECT_EQ(sync.GetState(), playsync::PlaybackState());
  EXPECT_FALSE(sync.GetLocalDeviceId().has_value());
}

TEST(PlayerSyncTest, StartRejectsMissingPlayer) {
  playsync::Config config;
  config.fetch_json = [](const playsync::RemoteRequest&) { return nlohmann::json(); };
  config.log_callback = [](const std::string&) {};
  playsync::PlayerSync sync(nullptr, config);
  EXPECT_FALSE(sync.Start());
  EXPECT_NE(sync.GetLastError().find("local player"), std::string::npos);
}
