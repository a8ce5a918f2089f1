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

#include "media_pipeline.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "api/video/i420_buffer.h"
#include "pc/audio_track.h"
#include "pc/media_stream.h"

#include "manual_task_queue.h"
#include "mock_huddle.h"

namespace {

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::ReturnRef;
using ::testing::SaveArg;
using webrtc::TimeDelta;

webrtc::VideoFrame MakeFrame(int width, int height) {
  rtc::scoped_refptr<webrtc::I420Buffer> buffer = webrtc::I420Buffer::Create(width, height);
  webrtc::I420Buffer::SetBlack(buffer.get());
  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x) {
      buffer->MutableDataY()[y * buffer->StrideY() + x] = static_cast<uint8_t>(x);
    }
  }
  return webrtc::VideoFrame::Builder()
      .set_video_frame_buffer(buffer)
      .set_timestamp_us(0)
      .build();
}

class MediaPipelineTest : public ::testing::Test {
 protected:
  MediaPipelineTest() : queue_(CreateManualTaskQueue()) {
    ON_CALL(delegate_, room_information()).WillByDefault(ReturnRef(room_));
    roster_ = std::make_unique<RosterManager>(queue_.get(), &delegate_);
    options_.fps = 10;
    options_.resolution = "vga";
    ON_CALL(devices_, CreateStream(_)).WillByDefault([](const std::string& id) {
      return MediaStreamRef(webrtc::MediaStream::Create(id));
    });
    ON_CALL(devices_, GetUserMedia(_, _))
        .WillByDefault([this](const MediaConstraints& constraints,
                              rtc::VideoSinkInterface<webrtc::VideoFrame>* sink) {
          camera_sink_ = sink;
          CaptureResult result;
          result.audio = webrtc::AudioTrack::Create("mic", nullptr);
          result.camera_started = constraints.video;
          return result;
        });
    pipeline_ = std::make_unique<MediaPipeline>(queue_.get(), options_, &bus_, roster_.get(),
                                                &devices_, &renderer_, &detector_,
                                                &segmenter_);
    bus_.Subscribe([this](const SessionNotification& n) { events_.push_back(n); });
  }

  std::shared_ptr<NiceMock<MockMediaConnection>> AddPeer(const std::string& peer_id) {
    auto media = std::make_shared<NiceMock<MockMediaConnection>>(peer_id);
    datas_.push_back(std::make_shared<NiceMock<MockDataConnection>>(peer_id));
    EXPECT_TRUE(roster_->Add(media, datas_.back()).ok());
    return media;
  }

  int CountEvents(SessionEvent event) const {
    int count = 0;
    for (const auto& n : events_) {
      if (n.event == event) count++;
    }
    return count;
  }

  ManualTaskQueuePtr queue_;
  RoomInformation room_;
  NiceMock<MockRosterDelegate> delegate_;
  std::unique_ptr<RosterManager> roster_;
  EventBus bus_;
  MediaOptions options_;
  NiceMock<MockMediaDevices> devices_;
  NiceMock<MockStreamRenderer> renderer_;
  NiceMock<MockFaceDetector> detector_;
  NiceMock<MockBodySegmenter> segmenter_;
  std::unique_ptr<MediaPipeline> pipeline_;
  rtc::VideoSinkInterface<webrtc::VideoFrame>* camera_sink_ = nullptr;
  std::vector<std::shared_ptr<NiceMock<MockDataConnection>>> datas_;
  std::vector<SessionNotification> events_;
};

TEST(MediaConstraintsTest, PortraitSwapsWidthAndHeight) {
  MediaOptions options;
  options.resolution = "vga";
  MediaConstraints landscape = ResolveMediaConstraints(options, false);
  EXPECT_EQ(landscape.max_width, 640);
  EXPECT_EQ(landscape.max_height, 481);
  EXPECT_TRUE(landscape.video);

  options.portrait = true;
  MediaConstraints portrait = ResolveMediaConstraints(options, true);
  EXPECT_EQ(portrait.min_width, 481);
  EXPECT_EQ(portrait.min_height, 640);
  EXPECT_FALSE(portrait.video);
}

TEST(MediaErrorTest, FixedMessages) {
  EXPECT_STREQ(MediaErrorMessage(MediaError::kPermissionDenied), "permission denied in browser");
  EXPECT_STREQ(MediaErrorMessage(MediaError::kMalformedConstraints), "empty constraints object");
}

TEST_F(MediaPipelineTest, GrabFailureIsReturnedAsValue) {
  EXPECT_CALL(devices_, GetUserMedia(_, _)).WillOnce(Return(CaptureResult{MediaError::kDeviceInUse}));
  CaptureResult result = pipeline_->Grab({}, false, false);
  EXPECT_EQ(result.error, MediaError::kDeviceInUse);
  EXPECT_EQ(result.message, "webcam or mic are already in use");
  EXPECT_EQ(pipeline_->local_stream(), nullptr);
  EXPECT_EQ(CountEvents(SessionEvent::kMediaStreamReady), 0);
}

TEST_F(MediaPipelineTest, GrabBuildsStreamAndStartsLoop) {
  EXPECT_CALL(devices_, CreateOutputVideoTrack(_));
  EXPECT_CALL(renderer_, RenderLocal(_));
  CaptureResult result = pipeline_->Grab({"cam0", "mic0"}, false, false);
  ASSERT_TRUE(result.ok());
  ASSERT_NE(pipeline_->local_stream(), nullptr);
  EXPECT_EQ(pipeline_->local_stream()->GetAudioTracks().size(), 1u);
  EXPECT_TRUE(pipeline_->loop_running());
  EXPECT_EQ(camera_sink_, pipeline_->composer());
  EXPECT_EQ(CountEvents(SessionEvent::kMediaStreamReady), 1);
}

TEST_F(MediaPipelineTest, CameraOffUsesBlackPlaceholder) {
  EXPECT_CALL(devices_, CreateBlackVideoTrack(640, 480));
  EXPECT_CALL(devices_, CreateOutputVideoTrack(_)).Times(0);
  ASSERT_TRUE(pipeline_->Grab({}, true, true).ok());
  EXPECT_FALSE(pipeline_->loop_running());
  EXPECT_TRUE(pipeline_->camera_muted());
  EXPECT_TRUE(pipeline_->microphone_muted());
  EXPECT_FALSE(pipeline_->local_stream()->GetAudioTracks()[0]->enabled());
}

TEST_F(MediaPipelineTest, MicrophoneMuteNeverRenegotiates) {
  ASSERT_TRUE(pipeline_->Grab({}, false, false).ok());
  auto media = AddPeer("p1");
  EXPECT_CALL(*media, ReplaceOrAddTracks(_, _)).Times(0);
  Json::Value sent;
  EXPECT_CALL(*datas_[0], Send(_)).WillOnce([&](const Json::Value& message) {
    sent = message;
    return true;
  });
  pipeline_->ToggleMicrophone();
  EXPECT_FALSE(pipeline_->local_stream()->GetAudioTracks()[0]->enabled());
  EXPECT_TRUE(sent["micMute"].asBool());
  EXPECT_FALSE(sent["camMute"].asBool());
}

TEST_F(MediaPipelineTest, CameraUnmuteRenegotiatesOncePerConnection) {
  ASSERT_TRUE(pipeline_->Grab({}, true, false).ok());
  auto first = AddPeer("p1");
  auto second = AddPeer("p2");
  EXPECT_CALL(devices_, Release());
  EXPECT_CALL(*first, ReplaceOrAddTracks(_, _))
      .WillOnce([](MediaStreamRef, CompletionCallback done) { done(webrtc::RTCError::OK()); });
  EXPECT_CALL(*second, ReplaceOrAddTracks(_, _))
      .WillOnce([](MediaStreamRef, CompletionCallback done) { done(webrtc::RTCError::OK()); });
  EXPECT_CALL(*datas_[0], Send(_));
  EXPECT_CALL(*datas_[1], Send(_));
  pipeline_->MuteCamera(false);
  EXPECT_FALSE(pipeline_->camera_muted());
  EXPECT_TRUE(pipeline_->loop_running());
  EXPECT_FALSE(pipeline_->renegotiation_pending("p1"));
}

TEST_F(MediaPipelineTest, CameraMuteStopsVideoWithoutRenegotiation) {
  ASSERT_TRUE(pipeline_->Grab({}, false, false).ok());
  auto media = AddPeer("p1");
  EXPECT_CALL(*media, ReplaceOrAddTracks(_, _)).Times(0);
  EXPECT_CALL(devices_, StopVideo());
  pipeline_->MuteCamera(true);
  EXPECT_FALSE(pipeline_->loop_running());
  EXPECT_TRUE(pipeline_->camera_muted());
}

TEST_F(MediaPipelineTest, ReplacementsAreSerializedPerConnection) {
  ASSERT_TRUE(pipeline_->Grab({}, true, false).ok());
  auto media = AddPeer("p1");
  std::vector<CompletionCallback> pending;
  EXPECT_CALL(*media, ReplaceOrAddTracks(_, _))
      .Times(2)
      .WillRepeatedly([&](MediaStreamRef, CompletionCallback done) {
        pending.push_back(std::move(done));
      });
  pipeline_->MuteCamera(false);
  pipeline_->MuteCamera(true);
  pipeline_->MuteCamera(false);
  pipeline_->MuteCamera(true);
  pipeline_->MuteCamera(false);
  // Only the first replacement was issued, the newest stream is queued.
  ASSERT_EQ(pending.size(), 1u);
  EXPECT_TRUE(pipeline_->renegotiation_pending("p1"));
  CompletionCallback first = std::move(pending[0]);
  first(webrtc::RTCError::OK());
  ASSERT_EQ(pending.size(), 2u);
  CompletionCallback second = std::move(pending[1]);
  second(webrtc::RTCError(webrtc::RTCErrorType::INTERNAL_ERROR, "offer failed"));
  EXPECT_FALSE(pipeline_->renegotiation_pending("p1"));
}

TEST_F(MediaPipelineTest, TickMirrorsAndPublishes) {
  ASSERT_TRUE(pipeline_->Grab({}, false, false).ok());
  ASSERT_NE(camera_sink_, nullptr);
  camera_sink_->OnFrame(MakeFrame(4, 2));
  queue_->AdvanceTime(TimeDelta::Millis(100));
  EXPECT_EQ(pipeline_->composer()->frames_published(), 1);
  rtc::scoped_refptr<webrtc::I420Buffer> surface = pipeline_->composer()->surface();
  ASSERT_NE(surface, nullptr);
  EXPECT_EQ(surface->DataY()[0], 3);
  EXPECT_EQ(surface->DataY()[3], 0);
}

TEST_F(MediaPipelineTest, ReentrantTicksAreDropped) {
  ASSERT_TRUE(pipeline_->Grab({}, false, false).ok());
  camera_sink_->OnFrame(MakeFrame(4, 2));
  pipeline_->RegisterFaceDetectorCallback(
      "draw", [](const DetectionRegion&, FrameComposer&, const std::string&) {
        return webrtc::RTCError::OK();
      });
  ASSERT_TRUE(pipeline_->SetFaceDetectorCallbackEnabled("draw", true));
  std::function<void(std::vector<DetectionRegion>)> held;
  EXPECT_CALL(detector_, Detect(_, _)).WillOnce(SaveArg<1>(&held));

  queue_->AdvanceTime(TimeDelta::Millis(100));
  EXPECT_TRUE(pipeline_->processing());
  queue_->AdvanceTime(TimeDelta::Millis(300));
  EXPECT_EQ(pipeline_->dropped_ticks(), 3);

  held({DetectionRegion{0, 0, 2, 2}});
  EXPECT_FALSE(pipeline_->processing());
}

TEST_F(MediaPipelineTest, FailingDetectionCallbackDoesNotAbortTick) {
  ASSERT_TRUE(pipeline_->Grab({}, false, false).ok());
  camera_sink_->OnFrame(MakeFrame(4, 2));
  std::vector<std::string> called;
  pipeline_->RegisterFaceDetectorCallback(
      "broken", [&](const DetectionRegion&, FrameComposer&, const std::string& name) {
        called.push_back(name);
        return webrtc::RTCError(webrtc::RTCErrorType::INTERNAL_ERROR, "draw failed");
      });
  pipeline_->RegisterFaceDetectorCallback(
      "overlay", [&](const DetectionRegion& region, FrameComposer& surface,
                     const std::string& name) {
        called.push_back(name);
        surface.FillRect(region, 255);
        return webrtc::RTCError::OK();
      });
  pipeline_->SetFaceDetectorCallbackEnabled("broken", true);
  pipeline_->SetFaceDetectorCallbackEnabled("overlay", true);
  ON_CALL(detector_, Detect(_, _))
      .WillByDefault([](const webrtc::VideoFrame&,
                        std::function<void(std::vector<DetectionRegion>)> done) {
        done({DetectionRegion{0, 0, 1, 1}});
      });
  queue_->AdvanceTime(TimeDelta::Millis(100));
  ASSERT_EQ(called.size(), 2u);
  EXPECT_EQ(called[1], "overlay");
  EXPECT_EQ(pipeline_->composer()->surface()->DataY()[0], 255);
  EXPECT_EQ(pipeline_->composer()->frames_published(), 1);
}

TEST_F(MediaPipelineTest, BlurRunsBeforeDetection) {
  ASSERT_TRUE(pipeline_->Grab({}, false, false).ok());
  camera_sink_->OnFrame(MakeFrame(4, 2));
  pipeline_->BlurBackground(true);
  EXPECT_CALL(segmenter_, Blur(_, MediaPipeline::kBlurIntensity, _))
      .WillOnce([](const webrtc::VideoFrame& frame, int,
                   std::function<void(std::optional<webrtc::VideoFrame>)> done) {
        done(frame);
      });
  queue_->AdvanceTime(TimeDelta::Millis(100));
  EXPECT_EQ(pipeline_->composer()->frames_published(), 1);
}

TEST_F(MediaPipelineTest, ReRegisteringKeepsEnableFlag) {
  DetectionCallbackEntry* entry = pipeline_->RegisterFaceDetectorCallback("a", nullptr);
  EXPECT_FALSE(entry->enable);
  pipeline_->SetFaceDetectorCallbackEnabled("a", true);
  DetectionCallbackEntry* again = pipeline_->RegisterFaceDetectorCallback(
      "a", [](const DetectionRegion&, FrameComposer&, const std::string&) {
        return webrtc::RTCError::OK();
      });
  EXPECT_EQ(entry, again);
  EXPECT_TRUE(again->enable);
  EXPECT_FALSE(pipeline_->SetFaceDetectorCallbackEnabled("missing", true));
}

TEST_F(MediaPipelineTest, MediaStatusOfUnknownPeerIsIgnored) {
  AddPeer("p1");
  pipeline_->SetConnectionMediaStatus("stranger", false, false);
  EXPECT_EQ(CountEvents(SessionEvent::kMediaStreamReset), 0);
  EXPECT_TRUE(roster_->FindOne("p1")->cam_mute);
}

TEST_F(MediaPipelineTest, MediaStatusUpdatesKnownPeer) {
  AddPeer("p1");
  pipeline_->SetConnectionMediaStatus("p1", false, true);
  PeerConnectionEntry* entry = roster_->FindOne("p1");
  EXPECT_FALSE(entry->cam_mute);
  EXPECT_TRUE(entry->mic_mute);
  ASSERT_EQ(CountEvents(SessionEvent::kMediaStreamReset), 1);
  EXPECT_EQ(events_.back().detail["peerId"].asString(), "p1");
}

TEST_F(MediaPipelineTest, PermissionCheckReportsDenial) {
  EXPECT_CALL(devices_, GetUserMedia(_, _))
      .WillOnce(Return(CaptureResult{MediaError::kPermissionDenied}));
  EXPECT_CALL(devices_, EnumerateDevices()).Times(0);
  PermissionState state = pipeline_->GrantPermissions();
  EXPECT_TRUE(state.denied);
  EXPECT_TRUE(state.camera);
}

TEST_F(MediaPipelineTest, PermissionCheckListsDevices) {
  std::vector<MediaDeviceInfo> devices = {
      {MediaDeviceInfo::Kind::kVideoInput, "0", "FaceTime"},
      {MediaDeviceInfo::Kind::kAudioInput, "1", "Built-in"},
  };
  EXPECT_CALL(devices_, Release());
  EXPECT_CALL(devices_, EnumerateDevices()).WillOnce(Return(devices));
  PermissionState state = pipeline_->GrantPermissions();
  EXPECT_FALSE(state.denied);
  ASSERT_EQ(state.cameras().size(), 1u);
  EXPECT_EQ(state.cameras()[0].name, "FaceTime");
  EXPECT_EQ(state.microphones().size(), 1u);
}

}  // namespace
