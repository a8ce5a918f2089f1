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

#ifndef WEBRTC_HUDDLE_MOCK_HUDDLE_H_
#define WEBRTC_HUDDLE_MOCK_HUDDLE_H_

#include <memory>
#include <string>
#include <vector>

#include <gmock/gmock.h>

#include "media_pipeline.h"
#include "peer_session.h"
#include "roster.h"
#include "signaling_channel.h"

class MockSignalingSocket : public SignalingSocket {
 public:
  MOCK_METHOD(void, SetObserver, (SignalingSocketObserver*), (override));
  MOCK_METHOD(void, Open, (const std::string&), (override));
  MOCK_METHOD(void, Close, (), (override));
  MOCK_METHOD(bool, IsConnected, (), (const, override));
  MOCK_METHOD(std::string, Id, (), (const, override));
  MOCK_METHOD(bool, Emit, (const std::string&, const Json::Value&, AckCallback), (override));
};

// Keeps the callbacks it is given so tests can fire them.
class MockDataConnection : public DataConnection {
 public:
  explicit MockDataConnection(const std::string& peer) : peer_(peer) {
    ON_CALL(*this, open()).WillByDefault(::testing::Return(true));
    ON_CALL(*this, Send(::testing::_)).WillByDefault(::testing::Return(true));
  }

  std::string peer() const override { return peer_; }
  MOCK_METHOD(bool, open, (), (const, override));
  MOCK_METHOD(bool, Send, (const Json::Value&), (override));
  MOCK_METHOD(void, Close, (), (override));

  void SetOnOpen(std::function<void()> callback) override { on_open = std::move(callback); }
  void SetOnData(std::function<void(const Json::Value&)> callback) override {
    on_data = std::move(callback);
  }
  void SetOnClose(std::function<void()> callback) override { on_close = std::move(callback); }

  std::function<void()> on_open;
  std::function<void(const Json::Value&)> on_data;
  std::function<void()> on_close;

 private:
  const std::string peer_;
};

class MockMediaConnection : public MediaConnection {
 public:
  explicit MockMediaConnection(const std::string& peer,
                               const Json::Value& metadata = Json::Value())
      : peer_(peer), metadata_(metadata) {}

  std::string peer() const override { return peer_; }
  const Json::Value& metadata() const override { return metadata_; }
  MOCK_METHOD(void, Answer, (MediaStreamRef), (override));
  MOCK_METHOD(void, Close, (), (override));
  MOCK_METHOD(MediaStreamRef, remote_stream, (), (const, override));
  MOCK_METHOD(void, ReplaceOrAddTracks, (MediaStreamRef, CompletionCallback), (override));

  void SetOnStream(std::function<void(MediaStreamRef)> callback) override {
    on_stream = std::move(callback);
  }
  void SetOnClose(std::function<void()> callback) override { on_close = std::move(callback); }
  void SetOnError(std::function<void(webrtc::RTCError)> callback) override {
    on_error = std::move(callback);
  }

  std::function<void(MediaStreamRef)> on_stream;
  std::function<void()> on_close;
  std::function<void(webrtc::RTCError)> on_error;

 private:
  const std::string peer_;
  const Json::Value metadata_;
};

class MockPeerSessionProvider : public PeerSessionProvider {
 public:
  void SetObserver(PeerSessionProviderObserver* observer) override { observer_ = observer; }
  MOCK_METHOD(void, Open, (), (override));
  MOCK_METHOD(void, Reconnect, (), (override));
  MOCK_METHOD(void, Destroy, (), (override));
  MOCK_METHOD(bool, disconnected, (), (const, override));
  MOCK_METHOD(bool, destroyed, (), (const, override));
  MOCK_METHOD(std::string, id, (), (const, override));
  MOCK_METHOD(std::shared_ptr<MediaConnection>, Call,
              (const std::string&, MediaStreamRef, const Json::Value&), (override));
  MOCK_METHOD(std::shared_ptr<DataConnection>, Connect, (const std::string&), (override));

  PeerSessionProviderObserver* observer() const { return observer_; }

 private:
  PeerSessionProviderObserver* observer_ = nullptr;
};

class MockPeerSessionProviderFactory : public PeerSessionProviderFactory {
 public:
  MOCK_METHOD(std::unique_ptr<PeerSessionProvider>, Create, (const std::string&), (override));
};

class MockRosterDelegate : public RosterDelegate {
 public:
  MOCK_METHOD(const RoomInformation&, room_information, (), (const, override));
  MOCK_METHOD(MediaTrackState, local_media_state, (), (const, override));
  MOCK_METHOD(void, RenderRemoteStream, (const std::string&, MediaStreamRef), (override));
  MOCK_METHOD(void, StopScreenShare, (), (override));
};

class MockMediaDevices : public MediaDevices {
 public:
  MOCK_METHOD(std::vector<MediaDeviceInfo>, EnumerateDevices, (), (override));
  MOCK_METHOD(CaptureResult, GetUserMedia,
              (const MediaConstraints&, rtc::VideoSinkInterface<webrtc::VideoFrame>*),
              (override));
  MOCK_METHOD(void, StopVideo, (), (override));
  MOCK_METHOD(void, Release, (), (override));
  MOCK_METHOD(rtc::scoped_refptr<webrtc::VideoTrackInterface>, CreateBlackVideoTrack,
              (int, int), (override));
  MOCK_METHOD(rtc::scoped_refptr<webrtc::VideoTrackInterface>, CreateOutputVideoTrack,
              (rtc::scoped_refptr<webrtc::VideoTrackSourceInterface>), (override));
  MOCK_METHOD(MediaStreamRef, CreateStream, (const std::string&), (override));
  MOCK_METHOD(MediaStreamRef, GetDisplayMedia, (), (override));
  MOCK_METHOD(void, StopDisplayMedia, (), (override));
};

class MockStreamRenderer : public StreamRenderer {
 public:
  MOCK_METHOD(void, RenderLocal, (MediaStreamRef), (override));
  MOCK_METHOD(void, RenderRemote, (const std::string&, MediaStreamRef), (override));
  MOCK_METHOD(void, RenderScreenShare, (MediaStreamRef), (override));
};

class MockFaceDetector : public FaceDetector {
 public:
  MOCK_METHOD(void, Detect,
              (const webrtc::VideoFrame&, std::function<void(std::vector<DetectionRegion>)>),
              (override));
};

class MockBodySegmenter : public BodySegmenter {
 public:
  MOCK_METHOD(void, Blur,
              (const webrtc::VideoFrame&, int,
               std::function<void(std::optional<webrtc::VideoFrame>)>),
              (override));
};

#endif  // WEBRTC_HUDDLE_MOCK_HUDDLE_H_
