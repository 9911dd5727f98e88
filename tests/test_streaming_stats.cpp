// Repository: Lenscast
// Component: StreamingStats Unit Tests
// Purpose: Counter snapshots, fps derivation and display formatting.
// Copyright (c) 2025 Lenscast

#include "lenscast/transport/StreamingStats.hpp"

#include <gtest/gtest.h>

using namespace lenscast::transport;
using namespace std::chrono_literals;

TEST(StreamingStatsTest, FpsIsFramesOverConnectedSeconds)
{
  StreamingStatsTracker tracker;
  const auto t0 = StreamingStatsTracker::Clock::time_point(100s);
  tracker.MarkConnected(t0);
  for (int i = 0; i < 48; ++i) tracker.RecordSent(1000);
  tracker.RecordDropped();

  const auto stats = tracker.Snapshot(t0 + 2s);
  EXPECT_EQ(stats.frames_sent, 48);
  EXPECT_EQ(stats.bytes_sent, 48000);
  EXPECT_DOUBLE_EQ(stats.fps, 24.0);
  EXPECT_EQ(stats.connection_time.count(), 2000);
  EXPECT_EQ(tracker.frames_dropped(), 1);
}

TEST(StreamingStatsTest, NotConnectedReportsZeroRate)
{
  StreamingStatsTracker tracker;
  tracker.RecordSent(10);
  const auto stats = tracker.Snapshot(StreamingStatsTracker::Clock::now());
  EXPECT_EQ(stats.frames_sent, 1);
  EXPECT_DOUBLE_EQ(stats.fps, 0.0);
  EXPECT_EQ(stats.connection_time.count(), 0);
}

TEST(StreamingStatsTest, ResetClearsEverything)
{
  StreamingStatsTracker tracker;
  const auto t0 = StreamingStatsTracker::Clock::time_point(5s);
  tracker.MarkConnected(t0);
  tracker.RecordSent(500);
  tracker.RecordDropped();
  tracker.Reset();

  const auto stats = tracker.Snapshot(t0 + 10s);
  EXPECT_EQ(stats.frames_sent, 0);
  EXPECT_EQ(stats.bytes_sent, 0);
  EXPECT_DOUBLE_EQ(stats.fps, 0.0);
  EXPECT_EQ(stats.connection_time.count(), 0);
  EXPECT_EQ(tracker.frames_dropped(), 0);
}

TEST(StreamingStatsTest, ConnectionTimeFormatting)
{
  EXPECT_EQ(FormatConnectionTime(0ms), "00:00:00");
  EXPECT_EQ(FormatConnectionTime(59'999ms), "00:00:59");
  EXPECT_EQ(FormatConnectionTime(3'723'000ms), "01:02:03");
  EXPECT_EQ(FormatConnectionTime(-5ms), "00:00:00");
}
