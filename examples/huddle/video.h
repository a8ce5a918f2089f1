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

#ifndef WEBRTC_HUDDLE_VIDEO_H_
#define WEBRTC_HUDDLE_VIDEO_H_

#include <cstdint>
#include <optional>

#include "api/scoped_refptr.h"
#include "api/task_queue/pending_task_safety_flag.h"
#include "api/task_queue/task_queue_base.h"
#include "api/video/i420_buffer.h"
#include "api/video/video_frame.h"
#include "api/video/video_sink_interface.h"
#include "media/base/video_broadcaster.h"
#include "pc/video_track_source.h"
#include "rtc_base/synchronization/mutex.h"
#include "rtc_base/thread_annotations.h"

// Detected region in surface pixel coordinates.
struct DetectionRegion {
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;
};

// Local video source fed by pushed frames. This is what the encoder pulls
// frames from.
class ComposedVideoTrackSource : public webrtc::VideoTrackSource {
 public:
  ComposedVideoTrackSource() : webrtc::VideoTrackSource(/*remote=*/false) {
    SetState(webrtc::MediaSourceInterface::kLive);
  }

  void PushFrame(const webrtc::VideoFrame& frame) { broadcaster_.OnFrame(frame); }
  rtc::VideoSinkWants wants() const { return broadcaster_.wants(); }

 protected:
  rtc::VideoSourceInterface<webrtc::VideoFrame>* source() override {
    return &broadcaster_;
  }

 private:
  rtc::VideoBroadcaster broadcaster_;
};

// Source of black frames for the placeholder track sent while the camera
// is off. Emits one frame per second on |task_queue| once started.
class BlackVideoTrackSource : public ComposedVideoTrackSource {
 public:
  BlackVideoTrackSource(webrtc::TaskQueueBase* task_queue, int width, int height);
  ~BlackVideoTrackSource() override;

  void Start();
  void Stop();

 private:
  void EmitFrame();

  webrtc::TaskQueueBase* const task_queue_;
  rtc::scoped_refptr<webrtc::I420Buffer> black_;
  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> safety_;
};

// Drawing surface of the outbound camera stream. Camera frames arrive on
// the capture thread; all other calls happen on the session queue.
class FrameComposer : public rtc::VideoSinkInterface<webrtc::VideoFrame> {
 public:
  explicit FrameComposer(rtc::scoped_refptr<ComposedVideoTrackSource> output);

  // rtc::VideoSinkInterface
  void OnFrame(const webrtc::VideoFrame& frame) override;

  // Copies the latest camera frame onto the surface. Returns false until a
  // frame arrived.
  bool Draw();
  // Flips the surface horizontally.
  void Mirror();
  void FillRect(const DetectionRegion& region, uint8_t luma);
  // Replaces the surface, e.g. with a blurred copy of it.
  void SetSurface(const webrtc::VideoFrame& frame);
  // Hands the surface to the output source.
  void Publish();
  // Forgets the latest camera frame.
  void Reset();

  std::optional<webrtc::VideoFrame> surface_frame() const;
  rtc::scoped_refptr<webrtc::I420Buffer> surface() const { return surface_; }
  const rtc::scoped_refptr<ComposedVideoTrackSource>& output() const { return output_; }
  int frames_published() const { return frames_published_; }

 private:
  rtc::scoped_refptr<ComposedVideoTrackSource> output_;
  mutable webrtc::Mutex mutex_;
  std::optional<webrtc::VideoFrame> latest_ RTC_GUARDED_BY(mutex_);
  rtc::scoped_refptr<webrtc::I420Buffer> surface_;
  int frames_published_ = 0;
};

#endif  // WEBRTC_HUDDLE_VIDEO_H_
