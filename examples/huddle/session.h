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

#ifndef WEBRTC_HUDDLE_SESSION_H_
#define WEBRTC_HUDDLE_SESSION_H_

#include <functional>
#include <memory>
#include <string>

#include <json/json.h>

#include "api/rtc_error.h"
#include "api/task_queue/task_queue_base.h"

#include "action_protocol.h"
#include "events.h"
#include "media_pipeline.h"
#include "option.h"
#include "peer_session.h"
#include "peer_transport.h"
#include "room_protocol.h"
#include "roster.h"
#include "screen_record.h"
#include "screen_share.h"
#include "signaling_channel.h"

// Local user state echoed to peers.
struct UserSettings {
  bool cam_mute = false;
  bool mic_mute = false;
  bool share = false;
  bool record = false;
  bool is_creator = false;
  std::string peer_id;
};

// One client's view of a huddle. Owns every component and runs all of
// them on the session task queue.
class HUDDLE_API HuddleSession : public RosterDelegate,
                                 public RoomProtocolDelegate,
                                 public ActionContext {
 public:
  struct Dependencies {
    webrtc::TaskQueueBase* task_queue = nullptr;
    std::unique_ptr<SignalingSocket> socket;
    PeerSessionProviderFactory* provider_factory = nullptr;
    MediaDevices* devices = nullptr;
    StreamRenderer* renderer = nullptr;
    FaceDetector* face_detector = nullptr;
    BodySegmenter* body_segmenter = nullptr;
  };

  using NotifyCallback = std::function<void(const std::string& title, const std::string& text)>;

  explicit HuddleSession(Dependencies dependencies);
  ~HuddleSession() override;

  HuddleSession(const HuddleSession&) = delete;
  HuddleSession& operator=(const HuddleSession&) = delete;

  // Configures every component. Publishes onAppReady.
  webrtc::RTCError Initialize(const Options& options);

  void OpenConnection(const std::string& token, CompletionCallback done);
  void CloseConnection(CompletionCallback done);

  // Opens the peer transport. Publishes onPeerTransportReady on success.
  void InitialPeerTransport(const std::string& token, CompletionCallback done);

  CaptureResult StartStreamUserMedia(const MediaDeviceSelection& devices);
  PermissionState GrantPermissions();

  webrtc::RTCError JoinRoom(const std::string& room_id, const Json::Value& user_data);
  webrtc::RTCError NotifyJoinSuccess();

  void ToggleCamera();
  void ToggleMicrophone();

  // Shares the screen returned by the media devices.
  void StartShareScreen(CompletionCallback done);
  void StopShareScreen();

  void SetRecordState(bool record);
  bool IsRecordingScreen() const;

  static ActionEnvelope GetAction(const std::string& name,
                                  const Json::Value& attributes = Json::Value(Json::objectValue),
                                  const Json::Value& users = Json::Value(Json::arrayValue),
                                  bool moderator = false);
  webrtc::RTCError RequestAction(const ActionEnvelope& action);
  void RegisterAction(const std::string& name, std::unique_ptr<ActionHandler> handler);

  // Peer message subscribers. The default tag is the peer data channel.
  void On(const std::string& tag, const std::string& event, RoomProtocol::MessageHandler handler);
  void On(const std::string& event, RoomProtocol::MessageHandler handler);

  void Settle();

  void SetNotifyCallback(NotifyCallback callback) { notify_ = std::move(callback); }

  EventBus& bus() { return bus_; }
  const UserSettings& user_settings() const { return settings_; }
  SignalingChannel* signaling() const { return signaling_.get(); }
  RosterManager* roster() const { return roster_.get(); }
  RoomProtocol* room() const { return room_.get(); }
  PeerTransport* peer_transport() const { return peer_.get(); }
  MediaPipeline* media() const { return media_.get(); }
  ScreenShare* screen_share() const { return share_.get(); }

  // RosterDelegate
  const RoomInformation& room_information() const override;
  MediaTrackState local_media_state() const override;
  void RenderRemoteStream(const std::string& peer_id, MediaStreamRef stream) override;
  void StopScreenShare() override;

  // RoomProtocolDelegate
  std::string LocalPeerId() const override;
  void SetLocalCreator(bool creator) override;
  void ConnectToNewUser(const Json::Value& data) override;
  void RunAction(const Json::Value& action) override;
  webrtc::RTCError ReleaseLocalMedia() override;
  webrtc::RTCError DisconnectPeerTransport() override;

  // ActionContext
  const Options& Config() const override { return options_; }
  webrtc::RTCError Emit(const std::string& event, const Json::Value& args) override;
  void Publish(SessionEvent event, const Json::Value& detail) override;
  void Notify(const std::string& title, const std::string& text) override;
  webrtc::RTCError LeaveRoom() override;
  void MuteCamera() override;
  void UnmuteCamera() override;
  void MuteMicrophone() override;
  void UnmuteMicrophone() override;
  const RosterManager& Roster() const override { return *roster_; }

 private:
  void HandlePeerData(const std::string& peer_id, const Json::Value& message);
  void HandleSideChannelCall(std::shared_ptr<MediaConnection> call);
  void RegisterPeerDataHandlers();
  void SyncMediaSettings();

  webrtc::TaskQueueBase* const task_queue_;
  PeerSessionProviderFactory* const provider_factory_;
  MediaDevices* const devices_;
  StreamRenderer* const renderer_;
  FaceDetector* const face_detector_;
  BodySegmenter* const body_segmenter_;

  Options options_;
  UserSettings settings_;
  Json::Value user_data_ = Json::Value(Json::objectValue);
  std::string token_;
  NotifyCallback notify_;
  bool initialized_ = false;

  EventBus bus_;
  std::unique_ptr<SignalingChannel> signaling_;
  std::unique_ptr<RosterManager> roster_;
  std::unique_ptr<RoomProtocol> room_;
  std::unique_ptr<ActionProtocol> actions_;
  std::unique_ptr<ScreenRecordStatus> record_;
  std::unique_ptr<MediaPipeline> media_;
  std::unique_ptr<PeerTransport> peer_;
  std::unique_ptr<ScreenShare> share_;
};

#endif  // WEBRTC_HUDDLE_SESSION_H_
