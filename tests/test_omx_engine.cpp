// Tests for the subprocess engine using small shell scripts as the player.
#include "vidsync/engine.h"
#include "vidsync/playback.h"

#include "test_util.h"

#include <gtest/gtest.h>

#include <memory>

#include <sys/stat.h>

namespace {

class OmxPlayerEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(dir_.valid());
    config_ = vidsync_test::MakeTestConfig(dir_);
    ASSERT_TRUE(vidsync_test::WriteFile(config_.media_path, "video"));
  }

  // Install an executable shell script and point the config at it.
  void UsePlayerScript(const std::string& body) {
    const std::string path = dir_.File("fake-player.sh");
    ASSERT_TRUE(vidsync_test::WriteFile(path, "#!/bin/sh\n" + body));
    ASSERT_EQ(::chmod(path.c_str(), 0755), 0);
    config_.player_binary = path;
  }

  vidsync_test::TempDir dir_;
  vidsync::DeviceConfig config_;
};

}  // namespace

TEST_F(OmxPlayerEngineTest, MissingBinaryFailsLaunch) {
  config_.player_binary = dir_.File("no-such-player");
  vidsync::OmxPlayerEngine engine(config_);
  std::string error;
  const auto handle =
      engine.Launch(config_.media_path, vidsync::AudioOutput::kHdmi, &error);
  EXPECT_FALSE(handle.has_value());
  EXPECT_NE(error.find("exec"), std::string::npos);
}

TEST_F(OmxPlayerEngineTest, PassesPlayerArguments) {
  const std::string args_file = dir_.File("args.txt");
  UsePlayerScript("echo \"$@\" > " + args_file + "\nhead -c 1 > /dev/null\n");
  vidsync::OmxPlayerEngine engine(config_);
  std::string error;
  const auto handle =
      engine.Launch(config_.media_path, vidsync::AudioOutput::kLocal, &error);
  ASSERT_TRUE(handle.has_value()) << error;

  EXPECT_TRUE(engine.SendControl(*handle, vidsync::ControlInstruction::kQuit));
  EXPECT_TRUE(vidsync_test::WaitUntil([&]() { return !engine.IsAlive(*handle); }));
  engine.Release(*handle);

  EXPECT_EQ(vidsync_test::ReadFile(args_file),
            "-o local --no-osd --aspect-mode letterbox " + config_.media_path + "\n");
}

TEST_F(OmxPlayerEngineTest, ReportsExitedProcess) {
  UsePlayerScript("exit 0\n");
  vidsync::OmxPlayerEngine engine(config_);
  std::string error;
  const auto handle =
      engine.Launch(config_.media_path, vidsync::AudioOutput::kHdmi, &error);
  ASSERT_TRUE(handle.has_value()) << error;
  EXPECT_TRUE(vidsync_test::WaitUntil([&]() { return !engine.IsAlive(*handle); }));
  engine.Release(*handle);
}

TEST_F(OmxPlayerEngineTest, ForceTerminateKillsIgnoringPlayer) {
  UsePlayerScript("exec sleep 30\n");
  vidsync::OmxPlayerEngine engine(config_);
  std::string error;
  const auto handle =
      engine.Launch(config_.media_path, vidsync::AudioOutput::kHdmi, &error);
  ASSERT_TRUE(handle.has_value()) << error;
  EXPECT_TRUE(engine.IsAlive(*handle));

  engine.ForceTerminate(*handle);
  EXPECT_FALSE(engine.IsAlive(*handle));
  engine.Release(*handle);
  EXPECT_FALSE(engine.SendControl(*handle, vidsync::ControlInstruction::kPause));
}

TEST_F(OmxPlayerEngineTest, ManagerStopEscalatesToKill) {
  UsePlayerScript("exec sleep 30\n");
  auto engine = std::make_shared<vidsync::OmxPlayerEngine>(config_);
  vidsync::PlaybackManager manager(engine, config_);
  ASSERT_EQ(manager.Start(config_.media_path, vidsync::AudioOutput::kHdmi, false),
            vidsync::PlaybackResult::kOk);
  EXPECT_TRUE(manager.IsActive());

  const auto started = std::chrono::steady_clock::now();
  EXPECT_EQ(manager.Stop(), vidsync::PlaybackResult::kOk);
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
  EXPECT_EQ(manager.GetStatus(), vidsync::PlaybackStatus::kIdle);
  EXPECT_FALSE(manager.IsActive());
}

TEST_F(OmxPlayerEngineTest, ManagerStopQuitsCooperativePlayer) {
  UsePlayerScript("head -c 1 > /dev/null\n");
  auto engine = std::make_shared<vidsync::OmxPlayerEngine>(config_);
  vidsync::PlaybackManager manager(engine, config_);
  ASSERT_EQ(manager.Start(config_.media_path, vidsync::AudioOutput::kHdmi, false),
            vidsync::PlaybackResult::kOk);
  EXPECT_EQ(manager.Stop(), vidsync::PlaybackResult::kOk);
  EXPECT_EQ(manager.Stop(), vidsync::PlaybackResult::kNothingToStop);
}
