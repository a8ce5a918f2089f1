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

#ifndef WEBRTC_HUDDLE_MEDIA_PIPELINE_H_
#define WEBRTC_HUDDLE_MEDIA_PIPELINE_H_

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "api/media_stream_interface.h"
#include "api/rtc_error.h"
#include "api/scoped_refptr.h"
#include "api/task_queue/pending_task_safety_flag.h"
#include "api/task_queue/task_queue_base.h"
#include "api/video/video_frame.h"
#include "api/video/video_sink_interface.h"

#include "events.h"
#include "option.h"
#include "peer_session.h"
#include "roster.h"
#include "video.h"

// Local media acquisition failures.
enum class MediaError {
  kNone,
  kMissingDevice,
  kDeviceInUse,
  kConstraintsUnsatisfiable,
  kPermissionDenied,
  kMalformedConstraints,
  kUnknown,
};

const char* MediaErrorMessage(MediaError error);

struct MediaConstraints {
  bool video = true;
  bool audio = true;
  std::string camera;
  std::string microphone;
  int min_width = 0;
  int max_width = 0;
  int min_height = 0;
  int max_height = 0;
  int fps = 30;
};

// Derives capture constraints from the configured resolution. Portrait
// orientation swaps width and height.
MediaConstraints ResolveMediaConstraints(const MediaOptions& options, bool mute_video);

struct MediaDeviceInfo {
  enum class Kind { kVideoInput, kAudioInput };
  Kind kind;
  std::string id;
  std::string name;
};

struct CaptureResult {
  MediaError error = MediaError::kNone;
  std::string message;
  rtc::scoped_refptr<webrtc::AudioTrackInterface> audio;
  bool camera_started = false;

  bool ok() const { return error == MediaError::kNone; }
};

// Local capture devices.
class MediaDevices {
 public:
  virtual ~MediaDevices() = default;

  virtual std::vector<MediaDeviceInfo> EnumerateDevices() = 0;
  // Starts capture. Camera frames go to |camera_sink| until StopVideo() or
  // Release().
  virtual CaptureResult GetUserMedia(const MediaConstraints& constraints,
                                     rtc::VideoSinkInterface<webrtc::VideoFrame>* camera_sink) = 0;
  virtual void StopVideo() = 0;
  virtual void Release() = 0;

  virtual rtc::scoped_refptr<webrtc::VideoTrackInterface> CreateBlackVideoTrack(int width,
                                                                                int height) = 0;
  virtual rtc::scoped_refptr<webrtc::VideoTrackInterface> CreateOutputVideoTrack(
      rtc::scoped_refptr<webrtc::VideoTrackSourceInterface> source) = 0;
  virtual MediaStreamRef CreateStream(const std::string& id) = 0;
  // Screen capture stream, null when no screen can be captured.
  virtual MediaStreamRef GetDisplayMedia() = 0;
  virtual void StopDisplayMedia() = 0;
};

// Output of streams. Rendering itself belongs to the host.
class StreamRenderer {
 public:
  virtual ~StreamRenderer() = default;

  virtual void RenderLocal(MediaStreamRef stream) = 0;
  virtual void RenderRemote(const std::string& peer_id, MediaStreamRef stream) = 0;
  // A null |stream| clears the screen share surface.
  virtual void RenderScreenShare(MediaStreamRef stream) = 0;
};

// Face detection service. |done| runs on the session queue.
class FaceDetector {
 public:
  virtual ~FaceDetector() = default;
  virtual void Detect(const webrtc::VideoFrame& frame,
                      std::function<void(std::vector<DetectionRegion>)> done) = 0;
};

// Background segmentation service. |done| gets the blurred frame, or
// nothing when segmentation failed. Runs on the session queue.
class BodySegmenter {
 public:
  virtual ~BodySegmenter() = default;
  virtual void Blur(const webrtc::VideoFrame& frame,
                    int intensity,
                    std::function<void(std::optional<webrtc::VideoFrame>)> done) = 0;
};

using DetectionCallback = std::function<webrtc::RTCError(
    const DetectionRegion& region, FrameComposer& surface, const std::string& name)>;

struct DetectionCallbackEntry {
  std::string name;
  bool enable = false;
  DetectionCallback callback;
};

struct MediaDeviceSelection {
  std::string camera;
  std::string microphone;
};

struct PermissionState {
  bool denied = false;
  bool camera = false;
  bool microphone = false;
  std::vector<MediaDeviceInfo> devices;

  std::vector<MediaDeviceInfo> cameras() const;
  std::vector<MediaDeviceInfo> microphones() const;
};

// Local camera and microphone, the composed outbound stream and its
// renegotiation towards every roster connection.
class MediaPipeline {
 public:
  static constexpr int kBlurIntensity = 20;
  static constexpr int kBlackTrackWidth = 640;
  static constexpr int kBlackTrackHeight = 480;

  MediaPipeline(webrtc::TaskQueueBase* task_queue,
                const MediaOptions& options,
                EventBus* bus,
                RosterManager* roster,
                MediaDevices* devices,
                StreamRenderer* renderer,
                FaceDetector* face_detector,
                BodySegmenter* body_segmenter);
  ~MediaPipeline();

  MediaPipeline(const MediaPipeline&) = delete;
  MediaPipeline& operator=(const MediaPipeline&) = delete;

  // Acquires the devices and builds the local stream. Failures are reported
  // in the result, the previous stream is kept then.
  CaptureResult Grab(const MediaDeviceSelection& devices, bool mute_video, bool mute_audio);
  void Release();
  MediaStreamRef local_stream() const { return local_stream_; }

  PermissionState GrantPermissions();

  void MuteCamera(bool mute);
  void ToggleCamera() { MuteCamera(!state_.cam_mute); }
  void MuteMicrophone(bool mute);
  void ToggleMicrophone() { MuteMicrophone(!state_.mic_mute); }
  bool camera_muted() const { return state_.cam_mute; }
  bool microphone_muted() const { return state_.mic_mute; }

  void BlurBackground(bool enable) { blur_ = enable ? kBlurIntensity : 0; }
  int blur() const { return blur_; }

  // Registers |callback| under |name|, or replaces the callback of an
  // existing registration keeping its enable flag. New registrations start
  // disabled.
  DetectionCallbackEntry* RegisterFaceDetectorCallback(const std::string& name,
                                                       DetectionCallback callback);
  bool SetFaceDetectorCallbackEnabled(const std::string& name, bool enable);

  // Applies a peer's muteMedia message. Unknown peers are ignored.
  void SetConnectionMediaStatus(const std::string& peer_id, bool cam_mute, bool mic_mute);

  // Processing loop.
  bool processing() const { return processing_; }
  bool loop_running() const { return loop_running_; }
  int dropped_ticks() const { return dropped_ticks_; }
  FrameComposer* composer() const { return composer_.get(); }

  // Replacements still running or queued for |peer_id|.
  bool renegotiation_pending(const std::string& peer_id) const;

 private:
  struct Renegotiation {
    bool in_flight = false;
    MediaStreamRef queued;
  };

  void StartLoop();
  void StopLoop();
  void ScheduleTick();
  void Tick();
  void ContinueAfterBlur(int generation);
  void RunDetection(int generation);
  void FinishTick(int generation);

  void ReplaceTracksOnAllConnections();
  void ReplaceTracks(const std::string& peer_id, MediaStreamRef stream);
  void BroadcastMuteState();

  webrtc::TaskQueueBase* const task_queue_;
  const MediaOptions options_;
  EventBus* const bus_;
  RosterManager* const roster_;
  MediaDevices* const devices_;
  StreamRenderer* const renderer_;
  FaceDetector* const face_detector_;
  BodySegmenter* const body_segmenter_;

  rtc::scoped_refptr<ComposedVideoTrackSource> output_source_;
  std::unique_ptr<FrameComposer> composer_;
  MediaDeviceSelection selection_;
  MediaStreamRef local_stream_;
  MediaTrackState state_;
  int blur_ = 0;
  std::vector<std::unique_ptr<DetectionCallbackEntry>> detection_callbacks_;

  bool loop_running_ = false;
  bool processing_ = false;
  int generation_ = 0;
  int dropped_ticks_ = 0;
  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> tick_flag_;

  std::map<std::string, Renegotiation> renegotiations_;
  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> safety_;
};

#endif  // WEBRTC_HUDDLE_MEDIA_PIPELINE_H_
