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

#ifndef WEBRTC_HUDDLE_MEDIA_DEVICES_H_
#define WEBRTC_HUDDLE_MEDIA_DEVICES_H_

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "api/media_stream_interface.h"
#include "api/peer_connection_interface.h"
#include "api/scoped_refptr.h"
#include "api/task_queue/task_queue_base.h"
#include "api/video/video_frame.h"
#include "api/video/video_sink_interface.h"
#include "modules/audio_device/include/audio_device.h"
#include "modules/video_capture/video_capture.h"
#include "rtc_base/thread.h"

#include "media_pipeline.h"
#include "video.h"

class ScreenCaptureSource;

// Capture index or unique id of the camera named, numbered or identified
// by |selector|. An empty selector picks the first camera. Returns an empty
// string when nothing matches.
std::string ResolveCameraId(webrtc::VideoCaptureModule::DeviceInfo* info,
                            const std::string& selector);

// MediaDevices on top of the libwebrtc capture modules.
class WebRtcMediaDevices : public MediaDevices {
 public:
  struct Environment {
    webrtc::PeerConnectionFactoryInterface* factory = nullptr;
    // Owner thread of |adm|.
    rtc::Thread* worker_thread = nullptr;
    webrtc::AudioDeviceModule* adm = nullptr;
    webrtc::TaskQueueBase* session_queue = nullptr;
    int screen_fps = 15;
  };

  explicit WebRtcMediaDevices(Environment environment);
  ~WebRtcMediaDevices() override;

  WebRtcMediaDevices(const WebRtcMediaDevices&) = delete;
  WebRtcMediaDevices& operator=(const WebRtcMediaDevices&) = delete;

  // MediaDevices
  std::vector<MediaDeviceInfo> EnumerateDevices() override;
  CaptureResult GetUserMedia(const MediaConstraints& constraints,
                             rtc::VideoSinkInterface<webrtc::VideoFrame>* camera_sink) override;
  void StopVideo() override;
  void Release() override;
  rtc::scoped_refptr<webrtc::VideoTrackInterface> CreateBlackVideoTrack(int width,
                                                                        int height) override;
  rtc::scoped_refptr<webrtc::VideoTrackInterface> CreateOutputVideoTrack(
      rtc::scoped_refptr<webrtc::VideoTrackSourceInterface> source) override;
  MediaStreamRef CreateStream(const std::string& id) override;
  MediaStreamRef GetDisplayMedia() override;
  void StopDisplayMedia() override;

 private:
  MediaError AcquireMicrophone(const std::string& selector);
  MediaError StartCamera(const MediaConstraints& constraints,
                         rtc::VideoSinkInterface<webrtc::VideoFrame>* camera_sink);

  const Environment env_;
  rtc::scoped_refptr<webrtc::VideoCaptureModule> camera_;
  rtc::scoped_refptr<webrtc::AudioTrackInterface> microphone_;
  rtc::scoped_refptr<BlackVideoTrackSource> black_source_;
  rtc::scoped_refptr<ScreenCaptureSource> screen_source_;
};

// StreamRenderer for the console application: logs frame arrival per peer.
class ConsoleStreamRenderer : public StreamRenderer {
 public:
  // One log line per |log_every| frames and peer.
  explicit ConsoleStreamRenderer(int log_every = 300);
  ~ConsoleStreamRenderer() override;

  // StreamRenderer
  void RenderLocal(MediaStreamRef stream) override;
  void RenderRemote(const std::string& peer_id, MediaStreamRef stream) override;
  void RenderScreenShare(MediaStreamRef stream) override;

  int frames(const std::string& name) const;

 private:
  class FrameLogger;
  struct Attachment {
    rtc::scoped_refptr<webrtc::VideoTrackInterface> track;
    std::unique_ptr<FrameLogger> sink;
  };

  void Attach(const std::string& name, MediaStreamRef stream);
  void Detach(const std::string& name);

  const int log_every_;
  std::map<std::string, Attachment> attachments_;
};

#endif  // WEBRTC_HUDDLE_MEDIA_DEVICES_H_
