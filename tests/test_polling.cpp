// Tests for the remote poller and its visibility-driven cadence.
#include "fakes.h"

#include <gtest/gtest.h>

#include <thread>

using playsync::HttpMethod;
using playsync::PlayState;
using playsync::StateSource;
using playsync::Visibility;
using playsync_test::FakeLocalPlayer;
using playsync_test::FakeRemote;

namespace {

playsync::Config PollingConfig(FakeRemote& remote) {
  playsync::Config config = playsync_test::FastConfig(remote);
  config.poll_interval_visible = std::chrono::milliseconds(10);
  config.poll_interval_hidden = std::chrono::milliseconds(40);
  return config;
}

}  // namespace

TEST(PollingTest, CadenceFollowsVisibility) {
  FakeRemote remote;
  playsync::Config config = playsync_test::FastConfig(remote);
  config.poll_interval_visible = std::chrono::milliseconds(1500);
  config.poll_interval_hidden = std::chrono::milliseconds(5000);
  playsync::PlayerSync sync(std::make_shared<FakeLocalPlayer>(), config);
  ASSERT_TRUE(sync.Start());

  EXPECT_TRUE(playsync_test::WaitFor([&]() {
    return playsync::test::ScheduledPollInterval(sync).count() == 1500;
  }));

  sync.SetVisibility(Visibility::kHidden);
  EXPECT_TRUE(playsync_test::WaitFor([&]() {
    return playsync::test::ScheduledPollInterval(sync).count() == 5000;
  }));

  sync.SetVisibility(Visibility::kVisible);
  EXPECT_TRUE(playsync_test::WaitFor([&]() {
    return playsync::test::ScheduledPollInterval(sync).count() == 1500;
  }));
}

TEST(PollingTest, StartsHiddenWhenConfigured) {
  FakeRemote remote;
  playsync::Config config = playsync_test::FastConfig(remote);
  config.poll_interval_hidden = std::chrono::milliseconds(7000);
  config.initial_visibility = Visibility::kHidden;
  playsync::PlayerSync sync(std::make_shared<FakeLocalPlayer>(), config);
  EXPECT_EQ(playsync::test::ScheduledPollInterval(sync).count(), 7000);
}

TEST(PollingTest, PollerAdoptsRemoteState) {
  FakeRemote remote;
  remote.SetActive("R1", true);
  playsync::PlayerSync sync(std::make_shared<FakeLocalPlayer>(), PollingConfig(remote));
  ASSERT_TRUE(sync.Start());

  ASSERT_TRUE(playsync_test::WaitFor([&]() {
    return sync.GetState().last_source == StateSource::kRemotePoll;
  }));
  const playsync::PlaybackState state = sync.GetState();
  EXPECT_EQ(state.active_device_id.value_or(""), "R1");
  EXPECT_EQ(state.play_state, PlayState::kPlaying);
  EXPECT_GE(sync.GetMetrics().polls, 1u);
}

TEST(PollingTest, PollerSeesExternalChanges) {
  FakeRemote remote;
  remote.SetActive("R1", true);
  playsync::PlayerSync sync(std::make_shared<FakeLocalPlayer>(), PollingConfig(remote));
  ASSERT_TRUE(sync.Start());
  ASSERT_TRUE(playsync_test::WaitFor([&]() {
    return sync.GetState().play_state == PlayState::kPlaying;
  }));

  remote.SetActive("R2", false);
  ASSERT_TRUE(playsync_test::WaitFor([&]() {
    return sync.GetState().active_device_id.value_or("") == "R2";
  }));
  EXPECT_EQ(sync.GetState().play_state, PlayState::kPaused);
}

TEST(PollingTest, PollingSkippedWhileLocalDeviceActive) {
  FakeRemote remote;
  remote.SetActive("L1", false);
  auto player = std::make_shared<FakeLocalPlayer>();
  playsync::PlayerSync sync(player, PollingConfig(remote));
  ASSERT_TRUE(sync.Start());
  player->EmitReady("L1");
  ASSERT_TRUE(sync.GetState().is_local_device_active);

  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  const size_t gets = remote.Count(HttpMethod::kGet, playsync::kPlayerPath);
  const uint64_t cycles = playsync::test::PollCycles(sync);
  std::this_thread::sleep_for(std::chrono::milliseconds(100));

  EXPECT_EQ(remote.Count(HttpMethod::kGet, playsync::kPlayerPath), gets);
  EXPECT_GT(playsync::test::PollCycles(sync), cycles);
  EXPECT_TRUE(sync.GetState().is_local_device_active);
}

TEST(PollingTest, PollingResumesWhenLocalDeviceLost) {
  FakeRemote remote;
  remote.SetActive("L1", false);
  auto player = std::make_shared<FakeLocalPlayer>();
  playsync::PlayerSync sync(player, PollingConfig(remote));
  ASSERT_TRUE(sync.Start());
  player->EmitReady("L1");

  remote.SetActive("R5", true);
  player->EmitNotReady("L1");
  ASSERT_TRUE(playsync_test::WaitFor([&]() {
    return sync.GetState().active_device_id.value_or("") == "R5";
  }));
  EXPECT_FALSE(sync.GetState().is_local_device_active);
  EXPECT_EQ(sync.GetState().play_state, PlayState::kPlaying);
}

TEST(PollingTest, RefreshPrefersLocalStateWhenLocalActive) {
  FakeRemote remote;
  remote.SetActive("L1", false);
  auto player = std::make_shared<FakeLocalPlayer>();
  playsync::LocalPlayerState local;
  local.paused = false;
  player->SetCurrentState(local);
  playsync::PlayerSync sync(player, playsync_test::FastConfig(remote));
  ASSERT_TRUE(sync.Start());
  player->EmitReady("L1");

  ASSERT_TRUE(sync.Refresh());
  EXPECT_EQ(sync.GetState().play_state, PlayState::kPlaying);
  EXPECT_EQ(sync.GetState().last_source, StateSource::kLocalPush);
  EXPECT_EQ(remote.Count(HttpMethod::kGet, playsync::kPlayerPath), 0u);
}

TEST(PollingTest, RefreshPollsRemoteWithoutLocalState) {
  FakeRemote remote;
  remote.SetActive("L1", true);
  auto player = std::make_shared<FakeLocalPlayer>();
  playsync::PlayerSync sync(player, playsync_test::FastConfig(remote));
  ASSERT_TRUE(sync.Start());
  player->EmitReady("L1");

  ASSERT_TRUE(sync.Refresh());
  EXPECT_EQ(remote.Count(HttpMethod::kGet, playsync::kPlayerPath), 1u);
  EXPECT_TRUE(sync.GetState().is_local_device_active);
  EXPECT_EQ(sync.GetState().play_state, PlayState::kPlaying);
}

TEST(PollingTest, DisposeStopsPolling) {
  FakeRemote remote;
  remote.SetActive("R1", true);
  playsync::PlayerSync sync(std::make_shared<FakeLocalPlayer>(), PollingConfig(remote));
  ASSERT_TRUE(sync.Start());
  ASSERT_TRUE(playsync_test::WaitFor([&]() { return sync.GetMetrics().polls > 0; }));

  sync.Dispose();
  const size_t gets = remote.Count(HttpMethod::kGet, playsync::kPlayerPath);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(remote.Count(HttpMethod::kGet, playsync::kPlayerPath), gets);
  sync.SetVisibility(Visibility::kHidden);
}
