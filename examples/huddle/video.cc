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

#include "video.h"

#include <algorithm>
#include <utility>

#include "rtc_base/time_utils.h"
#include "third_party/libyuv/include/libyuv/planar_functions.h"

#include "option.h"

BlackVideoTrackSource::BlackVideoTrackSource(webrtc::TaskQueueBase* task_queue,
                                             int width,
                                             int height)
    : task_queue_(task_queue),
      black_(webrtc::I420Buffer::Create(width, height)),
      safety_(webrtc::PendingTaskSafetyFlag::CreateDetached()) {
  webrtc::I420Buffer::SetBlack(black_.get());
}

BlackVideoTrackSource::~BlackVideoTrackSource() {
  safety_->SetNotAlive();
}

void BlackVideoTrackSource::Start() {
  Stop();
  EmitFrame();
}

void BlackVideoTrackSource::Stop() {
  safety_->SetNotAlive();
  safety_ = webrtc::PendingTaskSafetyFlag::CreateDetached();
}

void BlackVideoTrackSource::EmitFrame() {
  PushFrame(webrtc::VideoFrame::Builder()
                .set_video_frame_buffer(black_)
                .set_timestamp_us(rtc::TimeMicros())
                .build());
  task_queue_->PostDelayedTask(webrtc::SafeTask(safety_, [this]() { EmitFrame(); }),
                               webrtc::TimeDelta::Seconds(1));
}

FrameComposer::FrameComposer(rtc::scoped_refptr<ComposedVideoTrackSource> output)
    : output_(std::move(output)) {}

void FrameComposer::OnFrame(const webrtc::VideoFrame& frame) {
  webrtc::MutexLock lock(&mutex_);
  latest_ = frame;
}

bool FrameComposer::Draw() {
  std::optional<webrtc::VideoFrame> latest;
  {
    webrtc::MutexLock lock(&mutex_);
    latest = latest_;
  }
  if (!latest) {
    return false;
  }
  rtc::scoped_refptr<webrtc::I420BufferInterface> i420 =
      latest->video_frame_buffer()->ToI420();
  if (!i420) {
    APP_LOG(AS_WARNING) << "Camera frame could not be converted to I420";
    return false;
  }
  surface_ = webrtc::I420Buffer::Copy(*i420);
  return true;
}

void FrameComposer::Mirror() {
  if (!surface_) {
    return;
  }
  rtc::scoped_refptr<webrtc::I420Buffer> mirrored =
      webrtc::I420Buffer::Create(surface_->width(), surface_->height());
  libyuv::I420Mirror(surface_->DataY(), surface_->StrideY(),
                     surface_->DataU(), surface_->StrideU(),
                     surface_->DataV(), surface_->StrideV(),
                     mirrored->MutableDataY(), mirrored->StrideY(),
                     mirrored->MutableDataU(), mirrored->StrideU(),
                     mirrored->MutableDataV(), mirrored->StrideV(),
                     surface_->width(), surface_->height());
  surface_ = mirrored;
}

void FrameComposer::FillRect(const DetectionRegion& region, uint8_t luma) {
  if (!surface_) {
    return;
  }
  const int x0 = std::clamp(region.x, 0, surface_->width());
  const int y0 = std::clamp(region.y, 0, surface_->height());
  const int x1 = std::clamp(region.x + region.width, 0, surface_->width());
  const int y1 = std::clamp(region.y + region.height, 0, surface_->height());
  uint8_t* y_plane = surface_->MutableDataY();
  for (int y = y0; y < y1; ++y) {
    std::fill(y_plane + y * surface_->StrideY() + x0,
              y_plane + y * surface_->StrideY() + x1, luma);
  }
}

void FrameComposer::SetSurface(const webrtc::VideoFrame& frame) {
  rtc::scoped_refptr<webrtc::I420BufferInterface> i420 =
      frame.video_frame_buffer()->ToI420();
  if (i420) {
    surface_ = webrtc::I420Buffer::Copy(*i420);
  }
}

void FrameComposer::Publish() {
  std::optional<webrtc::VideoFrame> frame = surface_frame();
  if (!frame || !output_) {
    return;
  }
  output_->PushFrame(*frame);
  frames_published_++;
}

void FrameComposer::Reset() {
  webrtc::MutexLock lock(&mutex_);
  latest_.reset();
}

std::optional<webrtc::VideoFrame> FrameComposer::surface_frame() const {
  if (!surface_) {
    return std::nullopt;
  }
  return webrtc::VideoFrame::Builder()
      .set_video_frame_buffer(surface_)
      .set_timestamp_us(rtc::TimeMicros())
      .build();
}
