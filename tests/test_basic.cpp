// Basic tests for vidsync constants, defaults and name helpers.
#include "vidsync/vidsync.h"

#include <gtest/gtest.h>

#include <string>

TEST(ConstantsTest, DefaultEndpointsMatchDeployment) {
  EXPECT_EQ(vidsync::kDefaultCommandPort, 5000);
  EXPECT_EQ(vidsync::kDefaultTransferPort, 5001);
  EXPECT_STREQ(vidsync::kDefaultMulticastGroup, "239.255.42.1");
  EXPECT_STREQ(vidsync::kDefaultMediaPath, "/home/pi/video/current_video.mp4");
}

TEST(ConstantsTest, TransferProtocolReplies) {
  EXPECT_EQ(vidsync::kLengthHeaderSize, 8u);
  EXPECT_EQ(vidsync::kDefaultChunkSize, 65536u);
  EXPECT_STREQ(vidsync::kReplyReady, "READY");
  EXPECT_STREQ(vidsync::kReplyBusy, "BUSY");
  EXPECT_STREQ(vidsync::kReplyOk, "OK");
  EXPECT_STREQ(vidsync::kReplyError, "ERROR");
}

TEST(DeviceConfigTest, DefaultsMatchDeployment) {
  vidsync::DeviceConfig config;
  EXPECT_EQ(config.media_path, vidsync::kDefaultMediaPath);
  EXPECT_EQ(config.multicast_group, "239.255.42.1");
  EXPECT_EQ(config.multicast_port, 5000);
  EXPECT_EQ(config.transfer_port, 5001);
  EXPECT_EQ(config.audio_output, vidsync::AudioOutput::kHdmi);
  EXPECT_EQ(config.player_binary, "omxplayer");
  EXPECT_EQ(config.control_fifo_path, "/tmp/omxplayer_fifo");
  EXPECT_EQ(config.preload_grace.count(), 500);
  EXPECT_EQ(config.stop_timeout.count(), 2000);
  EXPECT_EQ(config.transfer_timeout.count(), 30000);
}

TEST(DeviceConfigTest, StagingPathDefaultsBesideMedia) {
  vidsync::DeviceConfig config;
  config.media_path = "/srv/media/clip.mp4";
  EXPECT_EQ(config.EffectiveStagingPath(), "/srv/media/clip.mp4.tmp");

  config.staging_path = "/srv/media/incoming.part";
  EXPECT_EQ(config.EffectiveStagingPath(), "/srv/media/incoming.part");
}

TEST(NamesTest, AudioOutputRoundTripsThroughEngineArgument) {
  EXPECT_STREQ(vidsync::AudioOutputName(vidsync::AudioOutput::kHdmi), "hdmi");
  EXPECT_STREQ(vidsync::AudioOutputName(vidsync::AudioOutput::kLocal), "local");
  EXPECT_STREQ(vidsync::AudioOutputName(vidsync::AudioOutput::kBoth), "both");
  EXPECT_EQ(vidsync::ParseAudioOutput("local"), vidsync::AudioOutput::kLocal);
  EXPECT_FALSE(vidsync::ParseAudioOutput("spdif").has_value());
  EXPECT_FALSE(vidsync::ParseAudioOutput("HDMI").has_value());
}

TEST(NamesTest, StatusAndResultNames) {
  EXPECT_STREQ(vidsync::PlaybackStatusName(vidsync::PlaybackStatus::kLoaded), "loaded");
  EXPECT_STREQ(vidsync::PlaybackResultName(vidsync::PlaybackResult::kMediaNotFound),
               "media not found");
  EXPECT_STREQ(vidsync::TransferResultName(vidsync::TransferResult::kPartialTransfer),
               "partial transfer");
  EXPECT_STREQ(vidsync::LogLevelName(vidsync::LogLevel::kWarning), "WARNING");
}
