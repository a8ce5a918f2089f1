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

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <utility>

#include "api/audio_options.h"
#include "api/make_ref_counted.h"
#include "api/units/time_delta.h"
#include "api/video/i420_buffer.h"
#include "modules/desktop_capture/desktop_capture_options.h"
#include "modules/desktop_capture/desktop_capturer.h"
#include "modules/desktop_capture/desktop_frame.h"
#include "modules/video_capture/video_capture_factory.h"
#include "rtc_base/time_utils.h"
#include "third_party/libyuv/include/libyuv/convert.h"

#include "option.h"

namespace {

constexpr int kNameSize = 256;

bool IsNumber(const std::string& text) {
  if (text.empty()) return false;
  for (char c : text) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

}  // namespace

// Screen frames converted to I420, captured on a thread of their own.
class ScreenCaptureSource : public ComposedVideoTrackSource,
                            public webrtc::DesktopCapturer::Callback {
 public:
  ScreenCaptureSource(std::unique_ptr<webrtc::DesktopCapturer> capturer, int fps)
      : capturer_(std::move(capturer)),
        interval_(webrtc::TimeDelta::Millis(1000 / std::max(1, fps))),
        thread_(rtc::Thread::Create()) {
    thread_->SetName("ScreenCapture", nullptr);
  }

  ~ScreenCaptureSource() override { Stop(); }

  bool Start() {
    if (!thread_->Start()) {
      APP_LOG(AS_ERROR) << "Failed to start screen capture thread";
      return false;
    }
    running_ = true;
    thread_->PostTask([this]() {
      capturer_->Start(this);
      CaptureNext();
    });
    return true;
  }

  void Stop() {
    if (!running_.exchange(false)) return;
    thread_->Stop();
    SetState(webrtc::MediaSourceInterface::kEnded);
  }

  bool is_screencast() const override { return true; }

  // webrtc::DesktopCapturer::Callback
  void OnCaptureResult(webrtc::DesktopCapturer::Result result,
                       std::unique_ptr<webrtc::DesktopFrame> frame) override {
    if (result != webrtc::DesktopCapturer::Result::SUCCESS || !frame) {
      if (result == webrtc::DesktopCapturer::Result::ERROR_PERMANENT) {
        APP_LOG(AS_ERROR) << "Screen capture failed permanently";
        running_ = false;
      }
      return;
    }
    const int width = frame->size().width();
    const int height = frame->size().height();
    rtc::scoped_refptr<webrtc::I420Buffer> buffer = webrtc::I420Buffer::Create(width, height);
    if (libyuv::ARGBToI420(frame->data(), frame->stride(),
                           buffer->MutableDataY(), buffer->StrideY(),
                           buffer->MutableDataU(), buffer->StrideU(),
                           buffer->MutableDataV(), buffer->StrideV(),
                           width, height) != 0) {
      APP_LOG(AS_WARNING) << "Screen frame conversion failed";
      return;
    }
    PushFrame(webrtc::VideoFrame::Builder()
                  .set_video_frame_buffer(buffer)
                  .set_timestamp_us(rtc::TimeMicros())
                  .build());
  }

 private:
  void CaptureNext() {
    if (!running_) return;
    capturer_->CaptureFrame();
    thread_->PostDelayedTask([this]() { CaptureNext(); }, interval_);
  }

  std::unique_ptr<webrtc::DesktopCapturer> capturer_;
  const webrtc::TimeDelta interval_;
  std::unique_ptr<rtc::Thread> thread_;
  std::atomic<bool> running_{false};
};

std::string ResolveCameraId(webrtc::VideoCaptureModule::DeviceInfo* info,
                            const std::string& selector) {
  if (!info) return "";
  const uint32_t count = info->NumberOfDevices();
  for (uint32_t i = 0; i < count; ++i) {
    char name[kNameSize] = {0};
    char unique_id[kNameSize] = {0};
    if (info->GetDeviceName(i, name, sizeof(name), unique_id, sizeof(unique_id)) != 0) {
      continue;
    }
    if (selector.empty() || selector == name || selector == unique_id ||
        (IsNumber(selector) && static_cast<uint32_t>(atoi(selector.c_str())) == i)) {
      return unique_id;
    }
  }
  return "";
}

WebRtcMediaDevices::WebRtcMediaDevices(Environment environment)
    : env_(std::move(environment)) {}

WebRtcMediaDevices::~WebRtcMediaDevices() {
  StopDisplayMedia();
  Release();
  if (black_source_) {
    black_source_->Stop();
  }
}

std::vector<MediaDeviceInfo> WebRtcMediaDevices::EnumerateDevices() {
  std::vector<MediaDeviceInfo> devices;
  std::unique_ptr<webrtc::VideoCaptureModule::DeviceInfo> info(
      webrtc::VideoCaptureFactory::CreateDeviceInfo());
  if (info) {
    const uint32_t count = info->NumberOfDevices();
    for (uint32_t i = 0; i < count; ++i) {
      char name[kNameSize] = {0};
      char unique_id[kNameSize] = {0};
      if (info->GetDeviceName(i, name, sizeof(name), unique_id, sizeof(unique_id)) == 0) {
        devices.push_back({MediaDeviceInfo::Kind::kVideoInput, unique_id, name});
      }
    }
  }
  if (env_.adm && env_.worker_thread) {
    env_.worker_thread->BlockingCall([this, &devices]() {
      const int16_t count = env_.adm->RecordingDevices();
      for (int16_t i = 0; i < count; ++i) {
        char name[webrtc::kAdmMaxDeviceNameSize] = {0};
        char guid[webrtc::kAdmMaxGuidSize] = {0};
        if (env_.adm->RecordingDeviceName(i, name, guid) == 0) {
          devices.push_back({MediaDeviceInfo::Kind::kAudioInput, guid, name});
        }
      }
    });
  }
  return devices;
}

CaptureResult WebRtcMediaDevices::GetUserMedia(
    const MediaConstraints& constraints,
    rtc::VideoSinkInterface<webrtc::VideoFrame>* camera_sink) {
  CaptureResult result;
  if (!constraints.video && !constraints.audio) {
    result.error = MediaError::kMalformedConstraints;
    result.message = MediaErrorMessage(result.error);
    return result;
  }
  if (!env_.factory) {
    result.error = MediaError::kUnknown;
    result.message = "no PeerConnectionFactory";
    return result;
  }

  if (constraints.audio) {
    result.error = AcquireMicrophone(constraints.microphone);
    if (!result.ok()) {
      result.message = MediaErrorMessage(result.error);
      return result;
    }
    result.audio = microphone_;
  }

  if (constraints.video) {
    result.error = StartCamera(constraints, camera_sink);
    if (!result.ok()) {
      result.message = MediaErrorMessage(result.error);
      result.audio = nullptr;
      microphone_ = nullptr;
      return result;
    }
    result.camera_started = camera_ != nullptr;
  }
  return result;
}

MediaError WebRtcMediaDevices::AcquireMicrophone(const std::string& selector) {
  if (env_.adm && env_.worker_thread) {
    MediaError error = MediaError::kNone;
    env_.worker_thread->BlockingCall([this, &selector, &error]() {
      const int16_t count = env_.adm->RecordingDevices();
      if (count <= 0) {
        error = MediaError::kMissingDevice;
        return;
      }
      if (selector.empty()) return;
      for (int16_t i = 0; i < count; ++i) {
        char name[webrtc::kAdmMaxDeviceNameSize] = {0};
        char guid[webrtc::kAdmMaxGuidSize] = {0};
        if (env_.adm->RecordingDeviceName(i, name, guid) != 0) continue;
        if (selector == name || selector == guid ||
            (IsNumber(selector) && atoi(selector.c_str()) == i)) {
          if (env_.adm->Recording()) {
            error = MediaError::kDeviceInUse;
          } else if (env_.adm->SetRecordingDevice(i) != 0) {
            error = MediaError::kDeviceInUse;
          }
          return;
        }
      }
      error = MediaError::kConstraintsUnsatisfiable;
    });
    if (error != MediaError::kNone) {
      return error;
    }
  }

  rtc::scoped_refptr<webrtc::AudioSourceInterface> source =
      env_.factory->CreateAudioSource(cricket::AudioOptions());
  if (!source) {
    return MediaError::kPermissionDenied;
  }
  microphone_ = env_.factory->CreateAudioTrack("audio-" + HuddleCreateRandomId(8), source.get());
  return microphone_ ? MediaError::kNone : MediaError::kUnknown;
}

MediaError WebRtcMediaDevices::StartCamera(
    const MediaConstraints& constraints,
    rtc::VideoSinkInterface<webrtc::VideoFrame>* camera_sink) {
  std::unique_ptr<webrtc::VideoCaptureModule::DeviceInfo> info(
      webrtc::VideoCaptureFactory::CreateDeviceInfo());
  if (!info || info->NumberOfDevices() == 0) {
    return MediaError::kMissingDevice;
  }
  const std::string unique_id = ResolveCameraId(info.get(), constraints.camera);
  if (unique_id.empty()) {
    return MediaError::kConstraintsUnsatisfiable;
  }

  webrtc::VideoCaptureCapability requested;
  requested.width = constraints.max_width > 0 ? constraints.max_width : 640;
  requested.height = constraints.max_height > 0 ? constraints.max_height : 480;
  requested.maxFPS = constraints.fps;
  requested.videoType = webrtc::VideoType::kI420;
  webrtc::VideoCaptureCapability capability;
  if (info->GetBestMatchedCapability(unique_id.c_str(), requested, capability) < 0) {
    APP_LOG(AS_WARNING) << "No capability of " << unique_id << " near " << requested.width
                        << "x" << requested.height;
    capability = requested;
  }

  // A permission check only verifies the device exists.
  if (!camera_sink) {
    return MediaError::kNone;
  }

  StopVideo();
  camera_ = webrtc::VideoCaptureFactory::Create(unique_id.c_str());
  if (!camera_) {
    return MediaError::kPermissionDenied;
  }
  camera_->RegisterCaptureDataCallback(camera_sink);
  if (camera_->StartCapture(capability) != 0) {
    camera_->DeRegisterCaptureDataCallback();
    camera_ = nullptr;
    return MediaError::kDeviceInUse;
  }
  APP_LOG(AS_INFO) << "Camera " << unique_id << " capturing " << capability.width << "x"
                   << capability.height << "@" << capability.maxFPS;
  return MediaError::kNone;
}

void WebRtcMediaDevices::StopVideo() {
  if (!camera_) return;
  camera_->StopCapture();
  camera_->DeRegisterCaptureDataCallback();
  camera_ = nullptr;
}

void WebRtcMediaDevices::Release() {
  StopVideo();
  if (microphone_) {
    microphone_->set_enabled(false);
    microphone_ = nullptr;
  }
}

rtc::scoped_refptr<webrtc::VideoTrackInterface> WebRtcMediaDevices::CreateBlackVideoTrack(
    int width,
    int height) {
  if (!env_.factory || !env_.session_queue) return nullptr;
  if (black_source_) {
    black_source_->Stop();
  }
  black_source_ = rtc::make_ref_counted<BlackVideoTrackSource>(env_.session_queue, width, height);
  black_source_->Start();
  return env_.factory->CreateVideoTrack(black_source_, "black-" + HuddleCreateRandomId(8));
}

rtc::scoped_refptr<webrtc::VideoTrackInterface> WebRtcMediaDevices::CreateOutputVideoTrack(
    rtc::scoped_refptr<webrtc::VideoTrackSourceInterface> source) {
  if (!env_.factory) return nullptr;
  if (black_source_) {
    black_source_->Stop();
    black_source_ = nullptr;
  }
  return env_.factory->CreateVideoTrack(source, "camera-" + HuddleCreateRandomId(8));
}

MediaStreamRef WebRtcMediaDevices::CreateStream(const std::string& id) {
  if (!env_.factory) return nullptr;
  return env_.factory->CreateLocalMediaStream(id);
}

MediaStreamRef WebRtcMediaDevices::GetDisplayMedia() {
  if (!env_.factory) return nullptr;
  std::unique_ptr<webrtc::DesktopCapturer> capturer =
      webrtc::DesktopCapturer::CreateScreenCapturer(
          webrtc::DesktopCaptureOptions::CreateDefault());
  if (!capturer) {
    APP_LOG(AS_WARNING) << "No screen capturer on this platform";
    return nullptr;
  }
  webrtc::DesktopCapturer::SourceList sources;
  if (!capturer->GetSourceList(&sources) || sources.empty()) {
    APP_LOG(AS_WARNING) << "No screen to capture";
    return nullptr;
  }
  if (!capturer->SelectSource(sources.front().id)) {
    APP_LOG(AS_WARNING) << "Failed to select screen " << sources.front().id;
    return nullptr;
  }

  StopDisplayMedia();
  screen_source_ = rtc::make_ref_counted<ScreenCaptureSource>(std::move(capturer),
                                                              env_.screen_fps);
  if (!screen_source_->Start()) {
    screen_source_ = nullptr;
    return nullptr;
  }
  const std::string id = HuddleCreateRandomId(8);
  MediaStreamRef stream = env_.factory->CreateLocalMediaStream("screen-" + id);
  stream->AddTrack(env_.factory->CreateVideoTrack(screen_source_, "screen-video-" + id));
  return stream;
}

void WebRtcMediaDevices::StopDisplayMedia() {
  if (!screen_source_) return;
  screen_source_->Stop();
  screen_source_ = nullptr;
}

// ConsoleStreamRenderer

class ConsoleStreamRenderer::FrameLogger : public rtc::VideoSinkInterface<webrtc::VideoFrame> {
 public:
  FrameLogger(const std::string& name, int log_every) : name_(name), log_every_(log_every) {}

  void OnFrame(const webrtc::VideoFrame& frame) override {
    int count = ++frames_;
    if (count == 1 || (log_every_ > 0 && count % log_every_ == 0)) {
      APP_LOG(AS_INFO) << "Video from " << name_ << ": " << frame.width() << "x"
                       << frame.height() << ", " << count << " frames";
    }
  }

  int frames() const { return frames_.load(); }

 private:
  const std::string name_;
  const int log_every_;
  std::atomic<int> frames_{0};
};

ConsoleStreamRenderer::ConsoleStreamRenderer(int log_every) : log_every_(log_every) {}

ConsoleStreamRenderer::~ConsoleStreamRenderer() {
  while (!attachments_.empty()) {
    Detach(attachments_.begin()->first);
  }
}

void ConsoleStreamRenderer::RenderLocal(MediaStreamRef stream) {
  if (!stream) return;
  APP_LOG(AS_INFO) << "Local stream " << stream->id() << ": "
                   << stream->GetVideoTracks().size() << " video, "
                   << stream->GetAudioTracks().size() << " audio tracks";
}

void ConsoleStreamRenderer::RenderRemote(const std::string& peer_id, MediaStreamRef stream) {
  Attach(peer_id, stream);
}

void ConsoleStreamRenderer::RenderScreenShare(MediaStreamRef stream) {
  if (!stream) {
    APP_LOG(AS_INFO) << "Screen share ended";
    Detach("screen-share");
    return;
  }
  Attach("screen-share", stream);
}

int ConsoleStreamRenderer::frames(const std::string& name) const {
  auto it = attachments_.find(name);
  return it == attachments_.end() ? 0 : it->second.sink->frames();
}

void ConsoleStreamRenderer::Attach(const std::string& name, MediaStreamRef stream) {
  if (!stream || stream->GetVideoTracks().empty()) {
    APP_LOG(AS_VERBOSE) << "No video from " << name;
    Detach(name);
    return;
  }
  rtc::scoped_refptr<webrtc::VideoTrackInterface> track = stream->GetVideoTracks().front();
  auto it = attachments_.find(name);
  if (it != attachments_.end() && it->second.track == track) {
    return;
  }
  Detach(name);
  Attachment attachment;
  attachment.track = track;
  attachment.sink = std::make_unique<FrameLogger>(name, log_every_);
  track->AddOrUpdateSink(attachment.sink.get(), rtc::VideoSinkWants());
  attachments_[name] = std::move(attachment);
}

void ConsoleStreamRenderer::Detach(const std::string& name) {
  auto it = attachments_.find(name);
  if (it == attachments_.end()) return;
  it->second.track->RemoveSink(it->second.sink.get());
  attachments_.erase(it);
}
