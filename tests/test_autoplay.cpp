// Tests for the autoplay gate.
#include "fakes.h"

#include <gtest/gtest.h>

using playsync::HttpMethod;
using playsync::PlayState;
using playsync_test::FakeLocalPlayer;
using playsync_test::FakeRemote;

TEST(AutoplayTest, PlayBlockedUntilGuardActivated) {
  FakeRemote remote;
  remote.SetActive("L1", false);
  auto player = std::make_shared<FakeLocalPlayer>();
  playsync::PlayerSync sync(player, playsync_test::FastConfig(remote));
  ASSERT_TRUE(sync.Start());
  player->EmitReady("L1");
  player->EmitState(true);
  ASSERT_EQ(sync.GetState().play_state, PlayState::kPaused);

  EXPECT_NO_THROW(sync.SetPlaying(true));
  EXPECT_EQ(player->resume_calls(), 0);
  EXPECT_EQ(sync.GetState().play_state, PlayState::kUnknown);
  EXPECT_FALSE(playsync::test::IsAutoplayUnlocked(sync));
  EXPECT_EQ(sync.GetMetrics().commands_issued, 0u);
}

TEST(AutoplayTest, RemotePlayBlockedUntilGuardActivated) {
  FakeRemote remote;
  remote.SetActive("R1", false);
  playsync::PlayerSync sync(std::make_shared<FakeLocalPlayer>(),
                            playsync_test::FastConfig(remote));
  ASSERT_TRUE(sync.Refresh());

  sync.SetPlaying(true);
  EXPECT_EQ(remote.Count(HttpMethod::kPut, "/"), 0u);
  EXPECT_EQ(sync.GetState().play_state, PlayState::kUnknown);
}

TEST(AutoplayTest, PauseIsNotGated) {
  FakeRemote remote;
  remote.SetActive("R1", true);
  playsync::PlayerSync sync(std::make_shared<FakeLocalPlayer>(),
                            playsync_test::FastConfig(remote));
  ASSERT_TRUE(sync.Refresh());

  sync.SetPlaying(false);
  EXPECT_EQ(remote.Count(HttpMethod::kPut, playsync::kPausePath), 1u);
  EXPECT_EQ(sync.GetState().play_state, PlayState::kPaused);
}

TEST(AutoplayTest, ActivationUnlocksLocalPlay) {
  FakeRemote remote;
  remote.SetActive("L1", false);
  auto player = std::make_shared<FakeLocalPlayer>();
  player->SetSupportsActivation(true);
  player->SetOnResume([&]() { remote.SetActive("L1", true); });
  int unlocks = 0;
  playsync::Config config = playsync_test::FastConfig(remote);
  config.audio_unlock = [&]() { ++unlocks; };
  playsync::PlayerSync sync(player, config);
  ASSERT_TRUE(sync.Start());
  player->EmitReady("L1");

  ASSERT_TRUE(sync.ActivateAutoplayGuard());
  EXPECT_EQ(player->activation_calls(), 1);
  EXPECT_EQ(unlocks, 1);
  EXPECT_TRUE(playsync::test::IsAutoplayUnlocked(sync));

  sync.SetPlaying(true);
  EXPECT_EQ(player->resume_calls(), 1);
  EXPECT_EQ(sync.GetState().play_state, PlayState::kPlaying);
}

TEST(AutoplayTest, ActivationSkippedWhenUnsupported) {
  FakeRemote remote;
  auto player = std::make_shared<FakeLocalPlayer>();
  playsync::PlayerSync sync(player, playsync_test::FastConfig(remote));
  EXPECT_TRUE(sync.ActivateAutoplayGuard());
  EXPECT_EQ(player->activation_calls(), 0);
}

TEST(AutoplayTest, FailedActivationKeepsGateClosed) {
  FakeRemote remote;
  auto player = std::make_shared<FakeLocalPlayer>();
  player->SetSupportsActivation(true);
  player->SetFailActivation(true);
  std::vector<std::string> logs;
  playsync::Config config = playsync_test::FastConfig(remote);
  config.log_callback = [&](const std::string& message) { logs.push_back(message); };
  playsync::PlayerSync sync(player, config);

  EXPECT_FALSE(sync.ActivateAutoplayGuard());
  EXPECT_FALSE(playsync::test::IsAutoplayUnlocked(sync));
  ASSERT_FALSE(logs.empty());
  EXPECT_NE(logs.back().find("activation rejected"), std::string::npos);
}

TEST(AutoplayTest, FailedAudioUnlockKeepsGateClosed) {
  FakeRemote remote;
  playsync::Config config = playsync_test::FastConfig(remote);
  config.audio_unlock = []() { throw std::runtime_error("no audio output"); };
  playsync::PlayerSync sync(std::make_shared<FakeLocalPlayer>(), config);
  EXPECT_FALSE(sync.ActivateAutoplayGuard());
  EXPECT_FALSE(playsync::test::IsAutoplayUnlocked(sync));
}

TEST(AutoplayTest, GateDisabledByConfig) {
  FakeRemote remote;
  remote.SetActive("R1", false);
  playsync::Config config = playsync_test::FastConfig(remote);
  config.require_autoplay_unlock = false;
  playsync::PlayerSync sync(std::make_shared<FakeLocalPlayer>(), config);
  ASSERT_TRUE(sync.Refresh());

  sync.SetPlaying(true);
  EXPECT_EQ(remote.Count(HttpMethod::kPut, playsync::kPlayPath), 1u);
  EXPECT_EQ(sync.GetState().play_state, PlayState::kPlaying);
}
