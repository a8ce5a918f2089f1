/*
 *  (c) 2025, wilddolphin2022
 *  For WebRTCsays.ai project
 *  https://github.com/wilddolphin2022
 *
 *  Use of this source code is governed by a BSD-style license
 *  that can be found in the LICENSE file in the root of the source
 *  tree. An additional intellectual property rights grant can be found
 *  in the file PATENTS.  All contributing project authors may
 *  be found in the AUTHORS file in the root of the source tree.
 */

#include "media_devices.h"

#include <gtest/gtest.h>

namespace {

TEST(MediaDevicesTest, NoDeviceInfoResolvesNothing) {
  EXPECT_EQ(ResolveCameraId(nullptr, ""), "");
  EXPECT_EQ(ResolveCameraId(nullptr, "0"), "");
}

TEST(MediaDevicesTest, RejectsEmptyConstraints) {
  WebRtcMediaDevices devices(WebRtcMediaDevices::Environment{});
  MediaConstraints constraints;
  constraints.video = false;
  constraints.audio = false;
  CaptureResult result = devices.GetUserMedia(constraints, nullptr);
  EXPECT_EQ(result.error, MediaError::kMalformedConstraints);
  EXPECT_FALSE(result.message.empty());
  EXPECT_FALSE(result.camera_started);
}

TEST(MediaDevicesTest, WithoutFactoryCreatesNothing) {
  WebRtcMediaDevices devices(WebRtcMediaDevices::Environment{});
  CaptureResult result = devices.GetUserMedia(MediaConstraints(), nullptr);
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.audio, nullptr);
  EXPECT_EQ(devices.CreateStream("s1"), nullptr);
  EXPECT_EQ(devices.CreateBlackVideoTrack(640, 480), nullptr);
  EXPECT_EQ(devices.GetDisplayMedia(), nullptr);
  devices.StopDisplayMedia();
  devices.Release();
}

TEST(ConsoleStreamRendererTest, IgnoresMissingStreams) {
  ConsoleStreamRenderer renderer(1);
  renderer.RenderLocal(nullptr);
  renderer.RenderRemote("peer-1", nullptr);
  renderer.RenderScreenShare(nullptr);
  EXPECT_EQ(renderer.frames("peer-1"), 0);
  EXPECT_EQ(renderer.frames("screen-share"), 0);
}

}  // namespace
