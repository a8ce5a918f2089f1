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

#include <algorithm>
#include <utility>

#include "api/make_ref_counted.h"
#include "api/units/time_delta.h"

namespace {

// Width to height ratio of the capture constraints.
constexpr double kVideoScale = 1.33;

std::vector<MediaDeviceInfo> FilterDevices(const std::vector<MediaDeviceInfo>& devices,
                                           MediaDeviceInfo::Kind kind) {
  std::vector<MediaDeviceInfo> filtered;
  for (const auto& device : devices) {
    if (device.kind == kind) filtered.push_back(device);
  }
  return filtered;
}

}  // namespace

const char* MediaErrorMessage(MediaError error) {
  switch (error) {
    case MediaError::kNone: return "";
    case MediaError::kMissingDevice: return "required track is missing";
    case MediaError::kDeviceInUse: return "webcam or mic are already in use";
    case MediaError::kConstraintsUnsatisfiable:
      return "constraints can not be satisfied by avb. devices";
    case MediaError::kPermissionDenied: return "permission denied in browser";
    case MediaError::kMalformedConstraints: return "empty constraints object";
    case MediaError::kUnknown: return "unknown media error";
  }
  return "unknown media error";
}

MediaConstraints ResolveMediaConstraints(const MediaOptions& options, bool mute_video) {
  MediaConstraints constraints;
  const int resolution = HuddleResolutionWidth(options.resolution);
  const int scaled = static_cast<int>(resolution / kVideoScale);
  const int width = options.portrait ? scaled : resolution;
  const int height = options.portrait ? resolution : scaled;
  constraints.video = !mute_video;
  constraints.audio = true;
  constraints.camera = options.camera;
  constraints.microphone = options.microphone;
  constraints.min_width = constraints.max_width = width;
  constraints.min_height = constraints.max_height = height;
  constraints.fps = options.fps;
  return constraints;
}

std::vector<MediaDeviceInfo> PermissionState::cameras() const {
  return FilterDevices(devices, MediaDeviceInfo::Kind::kVideoInput);
}

std::vector<MediaDeviceInfo> PermissionState::microphones() const {
  return FilterDevices(devices, MediaDeviceInfo::Kind::kAudioInput);
}

MediaPipeline::MediaPipeline(webrtc::TaskQueueBase* task_queue,
                             const MediaOptions& options,
                             EventBus* bus,
                             RosterManager* roster,
                             MediaDevices* devices,
                             StreamRenderer* renderer,
                             FaceDetector* face_detector,
                             BodySegmenter* body_segmenter)
    : task_queue_(task_queue),
      options_(options),
      bus_(bus),
      roster_(roster),
      devices_(devices),
      renderer_(renderer),
      face_detector_(face_detector),
      body_segmenter_(body_segmenter),
      output_source_(rtc::make_ref_counted<ComposedVideoTrackSource>()),
      composer_(std::make_unique<FrameComposer>(output_source_)),
      tick_flag_(webrtc::PendingTaskSafetyFlag::CreateDetached()),
      safety_(webrtc::PendingTaskSafetyFlag::CreateDetached()) {
  state_.cam_mute = options.cam_mute;
  state_.mic_mute = options.mic_mute;
  selection_.camera = options.camera;
  selection_.microphone = options.microphone;
}

MediaPipeline::~MediaPipeline() {
  safety_->SetNotAlive();
  tick_flag_->SetNotAlive();
}

CaptureResult MediaPipeline::Grab(const MediaDeviceSelection& devices,
                                  bool mute_video,
                                  bool mute_audio) {
  MediaConstraints constraints = ResolveMediaConstraints(options_, mute_video);
  if (!devices.camera.empty()) constraints.camera = devices.camera;
  if (!devices.microphone.empty()) constraints.microphone = devices.microphone;

  StopLoop();
  CaptureResult result =
      devices_->GetUserMedia(constraints, mute_video ? nullptr : composer_.get());
  if (!result.ok()) {
    if (result.message.empty()) {
      result.message = MediaErrorMessage(result.error);
    }
    APP_LOG(AS_ERROR) << "Failed to grab user media: " << result.message;
    return result;
  }

  MediaStreamRef stream = devices_->CreateStream("huddle-" + HuddleCreateRandomId(8));
  if (!stream) {
    result.error = MediaError::kUnknown;
    result.message = "failed to create the local stream";
    return result;
  }
  if (mute_video) {
    rtc::scoped_refptr<webrtc::VideoTrackInterface> black =
        devices_->CreateBlackVideoTrack(kBlackTrackWidth, kBlackTrackHeight);
    if (black) {
      black->set_enabled(false);
      stream->AddTrack(black);
    }
  } else {
    rtc::scoped_refptr<webrtc::VideoTrackInterface> video =
        devices_->CreateOutputVideoTrack(output_source_);
    if (video) {
      stream->AddTrack(video);
    }
  }
  if (result.audio) {
    result.audio->set_enabled(!mute_audio);
    stream->AddTrack(result.audio);
  }

  selection_ = devices;
  state_.cam_mute = mute_video;
  state_.mic_mute = mute_audio;
  local_stream_ = stream;
  APP_LOG(AS_INFO) << "Local stream " << stream->id() << " ready, camera "
                   << (mute_video ? "off" : "on") << ", microphone "
                   << (mute_audio ? "off" : "on");

  if (renderer_) {
    renderer_->RenderLocal(local_stream_);
  }
  bus_->Publish(SessionEvent::kMediaStreamReady);
  if (!mute_video && result.camera_started) {
    StartLoop();
  }
  return result;
}

void MediaPipeline::Release() {
  StopLoop();
  devices_->Release();
  composer_->Reset();
  local_stream_ = nullptr;
}

PermissionState MediaPipeline::GrantPermissions() {
  PermissionState state;
  if (!local_stream_) {
    CaptureResult check =
        devices_->GetUserMedia(ResolveMediaConstraints(options_, false), nullptr);
    if (!check.ok()) {
      APP_LOG(AS_WARNING) << "Media permission check failed: "
                          << MediaErrorMessage(check.error);
      state.denied = true;
      state.camera = check.error == MediaError::kPermissionDenied;
      state.microphone = check.error == MediaError::kPermissionDenied;
      return state;
    }
    devices_->Release();
  }
  state.devices = devices_->EnumerateDevices();
  return state;
}

void MediaPipeline::MuteCamera(bool mute) {
  state_.cam_mute = mute;
  if (!mute) {
    Release();
    CaptureResult result = Grab(selection_, false, state_.mic_mute);
    if (result.ok()) {
      ReplaceTracksOnAllConnections();
    } else {
      APP_LOG(AS_ERROR) << "Camera restart failed: " << result.message;
    }
  } else {
    if (local_stream_) {
      for (const auto& track : local_stream_->GetVideoTracks()) {
        track->set_enabled(false);
      }
    }
    devices_->StopVideo();
    StopLoop();
  }
  BroadcastMuteState();
}

void MediaPipeline::MuteMicrophone(bool mute) {
  state_.mic_mute = mute;
  if (local_stream_) {
    for (const auto& track : local_stream_->GetAudioTracks()) {
      track->set_enabled(!mute);
    }
  }
  BroadcastMuteState();
}

DetectionCallbackEntry* MediaPipeline::RegisterFaceDetectorCallback(
    const std::string& name,
    DetectionCallback callback) {
  for (auto& entry : detection_callbacks_) {
    if (entry->name == name) {
      entry->callback = std::move(callback);
      return entry.get();
    }
  }
  auto entry = std::make_unique<DetectionCallbackEntry>();
  entry->name = name;
  entry->callback = std::move(callback);
  detection_callbacks_.push_back(std::move(entry));
  return detection_callbacks_.back().get();
}

bool MediaPipeline::SetFaceDetectorCallbackEnabled(const std::string& name, bool enable) {
  for (auto& entry : detection_callbacks_) {
    if (entry->name == name) {
      entry->enable = enable;
      return true;
    }
  }
  return false;
}

void MediaPipeline::SetConnectionMediaStatus(const std::string& peer_id,
                                             bool cam_mute,
                                             bool mic_mute) {
  PeerConnectionEntry* entry = roster_->FindOne(peer_id);
  if (!entry) {
    APP_LOG(AS_VERBOSE) << "Mute status from unknown peer " << peer_id;
    return;
  }
  entry->cam_mute = cam_mute;
  entry->mic_mute = mic_mute;
  MediaStreamRef stream = entry->media ? entry->media->remote_stream() : entry->stream;
  if (renderer_ && stream) {
    renderer_->RenderRemote(peer_id, stream);
  }
  Json::Value detail;
  detail["peerId"] = peer_id;
  detail["camMute"] = cam_mute;
  detail["micMute"] = mic_mute;
  bus_->Publish(SessionEvent::kMediaStreamReset, detail);
}

bool MediaPipeline::renegotiation_pending(const std::string& peer_id) const {
  return renegotiations_.find(peer_id) != renegotiations_.end();
}

void MediaPipeline::StartLoop() {
  StopLoop();
  loop_running_ = true;
  ScheduleTick();
}

void MediaPipeline::StopLoop() {
  tick_flag_->SetNotAlive();
  tick_flag_ = webrtc::PendingTaskSafetyFlag::CreateDetached();
  loop_running_ = false;
  processing_ = false;
  generation_++;
}

void MediaPipeline::ScheduleTick() {
  const int fps = std::max(1, options_.fps);
  task_queue_->PostDelayedTask(webrtc::SafeTask(tick_flag_, [this]() { Tick(); }),
                               webrtc::TimeDelta::Millis(1000 / fps));
}

void MediaPipeline::Tick() {
  ScheduleTick();
  if (processing_) {
    dropped_ticks_++;
    APP_LOG(AS_VERBOSE) << "Dropped tick, " << dropped_ticks_ << " so far";
    return;
  }
  processing_ = true;
  const int generation = generation_;

  if (!composer_->Draw() || state_.cam_mute) {
    FinishTick(generation);
    return;
  }
  composer_->Mirror();

  if (blur_ > 0 && body_segmenter_) {
    std::optional<webrtc::VideoFrame> frame = composer_->surface_frame();
    body_segmenter_->Blur(
        *frame, blur_,
        [this, flag = safety_, generation](std::optional<webrtc::VideoFrame> blurred) {
          if (!flag->alive() || generation != generation_) return;
          if (blurred) {
            composer_->SetSurface(*blurred);
          } else {
            APP_LOG(AS_WARNING) << "Background blur failed";
          }
          RunDetection(generation);
        });
    return;
  }
  RunDetection(generation);
}

void MediaPipeline::RunDetection(int generation) {
  bool any_enabled = std::any_of(
      detection_callbacks_.begin(), detection_callbacks_.end(),
      [](const std::unique_ptr<DetectionCallbackEntry>& entry) { return entry->enable; });
  if (!any_enabled || !face_detector_) {
    FinishTick(generation);
    return;
  }
  std::optional<webrtc::VideoFrame> frame = composer_->surface_frame();
  face_detector_->Detect(
      *frame, [this, flag = safety_, generation](std::vector<DetectionRegion> regions) {
        if (!flag->alive() || generation != generation_) return;
        if (!regions.empty()) {
          for (const auto& entry : detection_callbacks_) {
            if (!entry->enable || !entry->callback) continue;
            webrtc::RTCError error = entry->callback(regions.front(), *composer_, entry->name);
            if (!error.ok()) {
              APP_LOG(AS_WARNING) << "Face detection callback '" << entry->name
                                  << "' failed: " << error.message();
            }
          }
        }
        FinishTick(generation);
      });
}

void MediaPipeline::FinishTick(int generation) {
  if (generation != generation_) {
    return;
  }
  if (!state_.cam_mute) {
    composer_->Publish();
  }
  processing_ = false;
}

void MediaPipeline::ReplaceTracksOnAllConnections() {
  if (!local_stream_) {
    return;
  }
  for (const auto& entry : roster_->connections()) {
    if (entry->media) {
      ReplaceTracks(entry->peer_id, local_stream_);
    }
  }
}

void MediaPipeline::ReplaceTracks(const std::string& peer_id, MediaStreamRef stream) {
  Renegotiation& renegotiation = renegotiations_[peer_id];
  if (renegotiation.in_flight) {
    // Only the newest stream matters once the running replacement is done.
    renegotiation.queued = stream;
    return;
  }
  PeerConnectionEntry* entry = roster_->FindOne(peer_id);
  if (!entry || !entry->media) {
    renegotiations_.erase(peer_id);
    return;
  }
  renegotiation.in_flight = true;
  APP_LOG(AS_VERBOSE) << "Replacing tracks towards " << peer_id;
  entry->media->ReplaceOrAddTracks(
      stream, [this, flag = safety_, peer_id](webrtc::RTCError error) {
        if (!flag->alive()) return;
        if (!error.ok()) {
          APP_LOG(AS_WARNING) << "Track replacement towards " << peer_id
                              << " failed: " << error.message();
        }
        auto it = renegotiations_.find(peer_id);
        if (it == renegotiations_.end()) return;
        MediaStreamRef next = std::move(it->second.queued);
        it->second.queued = nullptr;
        it->second.in_flight = false;
        if (next) {
          ReplaceTracks(peer_id, next);
        } else {
          renegotiations_.erase(it);
        }
      });
}

void MediaPipeline::BroadcastMuteState() {
  roster_->Broadcast(MuteMediaMessage(state_));
}
