// Repository: Lenscast
// Component: PipelineConfig Unit Tests
// Purpose: JSON session config parsing, environment overrides and validation.
// Copyright (c) 2025 Lenscast

#include "lenscast/config/PipelineConfig.hpp"

#include <cstdlib>
#include <gtest/gtest.h>

using namespace lenscast::config;

namespace {

class ScopedEnv {
 public:
  ScopedEnv(const char* name, const char* value) : name_(name) { ::setenv(name, value, 1); }
  ~ScopedEnv() { ::unsetenv(name_); }

 private:
  const char* name_;
};

}  // namespace

TEST(PipelineConfigTest, DefaultsMatchDeviceProfile)
{
  MediaSessionConfig config;
  EXPECT_EQ(config.mode, SessionMode::kAudioGateway);
  EXPECT_EQ(config.video_quality, VideoQuality::kMedium);
  EXPECT_EQ(config.frame_rate, 24);
  EXPECT_EQ(config.time_limit.count(), 0);
  EXPECT_EQ(config.audio.sample_rate, 24000);
  EXPECT_EQ(config.audio.channels, 1);
  EXPECT_EQ(config.audio.bitrate, 64000);
  EXPECT_EQ(config.audio.connect_timeout, std::chrono::milliseconds(5000));
  EXPECT_EQ(config.rtmp.target_bitrate, 2'000'000);
  EXPECT_EQ(config.rtmp.keyframe_interval_seconds, 1);
  EXPECT_EQ(config.rtmp.pending_frame_policy, PendingFramePolicy::kDrop);
  EXPECT_EQ(config.preview.jpeg_quality, 50);
}

TEST(PipelineConfigTest, ParsesNestedSections)
{
  const std::string json = R"({
    "mode": "rtmp",
    "video_quality": "high",
    "frame_rate": 30,
    "time_limit_seconds": 600,
    "rtmp": {
      "url": "rtmp://ingest.example.com/live/key",
      "target_bitrate": 3500000,
      "pending_frame_policy": "BUFFER",
      "pending_frame_capacity": 5,
      "stop_timeout_ms": 1200
    },
    "preview": { "enabled": true, "jpeg_quality": 70 }
  })";

  MediaSessionConfig config;
  std::string error;
  ASSERT_TRUE(ParseMediaSessionConfig(json, &config, &error)) << error;
  EXPECT_EQ(config.mode, SessionMode::kRtmpBroadcast);
  EXPECT_EQ(config.video_quality, VideoQuality::kHigh);
  EXPECT_EQ(config.frame_rate, 30);
  EXPECT_EQ(config.time_limit.count(), 600);
  EXPECT_EQ(config.rtmp.url, "rtmp://ingest.example.com/live/key");
  EXPECT_EQ(config.rtmp.target_bitrate, 3500000);
  EXPECT_EQ(config.rtmp.pending_frame_policy, PendingFramePolicy::kBuffer);
  EXPECT_EQ(config.rtmp.pending_frame_capacity, 5u);
  EXPECT_EQ(config.rtmp.stop_timeout.count(), 1200);
  EXPECT_TRUE(config.preview.enabled);
  EXPECT_EQ(config.preview.jpeg_quality, 70);
  EXPECT_TRUE(ValidateMediaSessionConfig(config, &error)) << error;
}

TEST(PipelineConfigTest, TransportUrlShorthandFollowsMode)
{
  MediaSessionConfig config;
  std::string error;
  ASSERT_TRUE(ParseMediaSessionConfig(
      R"({"mode":"AUDIO_GATEWAY","transport_url":"wss://gw.example.com/audio"})", &config,
      &error));
  EXPECT_EQ(config.audio.url, "wss://gw.example.com/audio");
  EXPECT_TRUE(config.rtmp.url.empty());

  MediaSessionConfig video;
  ASSERT_TRUE(ParseMediaSessionConfig(
      R"({"mode":"RTMP_BROADCAST","transport_url":"rtmp://x/live/k","target_bitrate":1000000})",
      &video, &error));
  EXPECT_EQ(video.rtmp.url, "rtmp://x/live/k");
  EXPECT_EQ(video.rtmp.target_bitrate, 1000000);
}

TEST(PipelineConfigTest, RejectsMalformedInputWithoutTouchingOutput)
{
  MediaSessionConfig config;
  config.frame_rate = 15;
  std::string error;

  EXPECT_FALSE(ParseMediaSessionConfig("{not json", &config, &error));
  EXPECT_FALSE(error.empty());

  error.clear();
  EXPECT_FALSE(ParseMediaSessionConfig(R"({"frame_rate":30,"mode":"carrier-pigeon"})", &config,
                                       &error));
  EXPECT_NE(error.find("carrier-pigeon"), std::string::npos);

  EXPECT_FALSE(ParseMediaSessionConfig(R"({"frame_rate":"fast"})", &config, &error));
  EXPECT_EQ(config.frame_rate, 15);
}

TEST(PipelineConfigTest, EnvironmentOverrides)
{
  ScopedEnv gw("LENSCAST_AUDIO_GATEWAY_URL", "ws://localhost:9000/audio");
  ScopedEnv rtmp("LENSCAST_RTMP_URL", "rtmp://localhost/live/test");
  ScopedEnv bitrate("LENSCAST_TARGET_BITRATE", "1500000");
  ScopedEnv quality("LENSCAST_VIDEO_QUALITY", "low");

  MediaSessionConfig config;
  ApplyEnvironmentOverrides(&config);
  EXPECT_EQ(config.audio.url, "ws://localhost:9000/audio");
  EXPECT_EQ(config.rtmp.url, "rtmp://localhost/live/test");
  EXPECT_EQ(config.rtmp.target_bitrate, 1500000);
  EXPECT_EQ(config.video_quality, VideoQuality::kLow);
}

TEST(PipelineConfigTest, InvalidEnvironmentValuesAreIgnored)
{
  ScopedEnv bitrate("LENSCAST_TARGET_BITRATE", "lots");
  ScopedEnv quality("LENSCAST_VIDEO_QUALITY", "ultra");

  MediaSessionConfig config;
  ApplyEnvironmentOverrides(&config);
  EXPECT_EQ(config.rtmp.target_bitrate, 2'000'000);
  EXPECT_EQ(config.video_quality, VideoQuality::kMedium);
}

TEST(PipelineConfigTest, Validation)
{
  std::string error;
  MediaSessionConfig config;
  config.audio.url = "http://gw.example.com";
  EXPECT_FALSE(ValidateMediaSessionConfig(config, &error));
  EXPECT_NE(error.find("ws://"), std::string::npos);

  config.audio.url = "ws://gw.example.com";
  EXPECT_TRUE(ValidateMediaSessionConfig(config, &error));

  config.mode = SessionMode::kRtmpBroadcast;
  config.rtmp.url = "rtmps://live-api-s.facebook.com:443/rtmp/key";
  EXPECT_TRUE(ValidateMediaSessionConfig(config, &error));
  config.rtmp.keyframe_interval_seconds = 0;
  EXPECT_FALSE(ValidateMediaSessionConfig(config, &error));

  MediaSessionConfig preview;
  preview.mode = SessionMode::kPreviewOnly;
  EXPECT_TRUE(ValidateMediaSessionConfig(preview, &error));
  preview.preview.jpeg_quality = 101;
  EXPECT_FALSE(ValidateMediaSessionConfig(preview, &error));
}

TEST(PipelineConfigTest, EnumNamesParseBack)
{
  for (auto q : {VideoQuality::kLow, VideoQuality::kMedium, VideoQuality::kHigh}) {
    EXPECT_EQ(ParseVideoQuality(VideoQualityName(q)), q);
  }
  for (auto m : {SessionMode::kAudioGateway, SessionMode::kRtmpBroadcast,
                 SessionMode::kPreviewOnly}) {
    EXPECT_EQ(ParseSessionMode(SessionModeName(m)), m);
  }
  EXPECT_EQ(ParsePendingFramePolicy("drop"), PendingFramePolicy::kDrop);
  EXPECT_FALSE(ParseVideoQuality("ultra").has_value());
}
