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

#include "session.h"

#include <utility>

HuddleSession::HuddleSession(Dependencies dependencies)
    : task_queue_(dependencies.task_queue),
      provider_factory_(dependencies.provider_factory),
      devices_(dependencies.devices),
      renderer_(dependencies.renderer),
      face_detector_(dependencies.face_detector),
      body_segmenter_(dependencies.body_segmenter) {
  signaling_ = std::make_unique<SignalingChannel>(task_queue_, std::move(dependencies.socket));
  roster_ = std::make_unique<RosterManager>(task_queue_, this);
  room_ = std::make_unique<RoomProtocol>(task_queue_, signaling_.get(), roster_.get(), &bus_,
                                         this);
  actions_ = std::make_unique<ActionProtocol>(signaling_.get(), room_.get(), &bus_, this);
  record_ = std::make_unique<ScreenRecordStatus>(&bus_, roster_.get());
  signaling_->SetOnGaveUp([this](webrtc::RTCError error) {
    Json::Value detail(Json::objectValue);
    detail["message"] = error.message();
    bus_.Publish(SessionEvent::kSignalingFailed, detail);
  });
}

HuddleSession::~HuddleSession() = default;

webrtc::RTCError HuddleSession::Initialize(const Options& options) {
  if (initialized_) {
    return webrtc::RTCError(webrtc::RTCErrorType::INVALID_STATE, "Session already initialized");
  }
  options_ = options;
  webrtc::RTCError error = signaling_->Initialize(options_.signaling);
  if (!error.ok()) {
    return error;
  }
  error = room_->Listen();
  if (!error.ok()) {
    return error;
  }

  media_ = std::make_unique<MediaPipeline>(task_queue_, options_.media, &bus_, roster_.get(),
                                           devices_, renderer_, face_detector_,
                                           body_segmenter_);
  peer_ = std::make_unique<PeerTransport>(task_queue_, provider_factory_, options_.peer, &bus_,
                                          roster_.get());
  share_ = std::make_unique<ScreenShare>(task_queue_, provider_factory_, options_.peer, &bus_,
                                         roster_.get(), devices_, renderer_,
                                         [this]() { return LocalPeerId(); });

  peer_->SetLocalStreamSource([this]() { return media_->local_stream(); });
  peer_->SetSideChannelHandler(
      [this](std::shared_ptr<MediaConnection> call) { HandleSideChannelCall(std::move(call)); });
  peer_->SetPeerDataHandler([this](const std::string& peer_id, const Json::Value& message) {
    HandlePeerData(peer_id, message);
  });
  RegisterPeerDataHandlers();

  settings_.cam_mute = options_.media.cam_mute;
  settings_.mic_mute = options_.media.mic_mute;
  initialized_ = true;
  APP_LOG(AS_INFO) << "Huddle session initialized";
  bus_.Publish(SessionEvent::kAppReady);
  return webrtc::RTCError::OK();
}

void HuddleSession::OpenConnection(const std::string& token, CompletionCallback done) {
  if (!initialized_) {
    done(webrtc::RTCError(webrtc::RTCErrorType::INVALID_STATE, "Session not initialized"));
    return;
  }
  token_ = token;
  signaling_->SetConnection(true, token, std::move(done));
}

void HuddleSession::CloseConnection(CompletionCallback done) {
  signaling_->SetConnection(false, "", std::move(done));
}

void HuddleSession::InitialPeerTransport(const std::string& token, CompletionCallback done) {
  if (!initialized_) {
    done(webrtc::RTCError(webrtc::RTCErrorType::INVALID_STATE, "Session not initialized"));
    return;
  }
  token_ = token;
  peer_->Open(token, [this, done = std::move(done)](webrtc::RTCError error) {
    if (error.ok()) {
      settings_.peer_id = peer_->GetId();
      Json::Value detail(Json::objectValue);
      detail["peerId"] = settings_.peer_id;
      bus_.Publish(SessionEvent::kPeerTransportReady, detail);
    }
    if (done) {
      done(std::move(error));
    }
  });
}

CaptureResult HuddleSession::StartStreamUserMedia(const MediaDeviceSelection& devices) {
  if (!initialized_) {
    CaptureResult result;
    result.error = MediaError::kUnknown;
    result.message = "Session not initialized";
    return result;
  }
  CaptureResult result = media_->Grab(devices, settings_.cam_mute, settings_.mic_mute);
  if (!result.ok()) {
    APP_LOG(AS_ERROR) << "Local media failed: " << result.message;
  }
  return result;
}

PermissionState HuddleSession::GrantPermissions() {
  if (!initialized_) {
    return PermissionState();
  }
  return media_->GrantPermissions();
}

webrtc::RTCError HuddleSession::JoinRoom(const std::string& room_id,
                                         const Json::Value& user_data) {
  if (!initialized_) {
    return webrtc::RTCError(webrtc::RTCErrorType::INVALID_STATE, "Session not initialized");
  }
  user_data_ = user_data.isObject() ? user_data : Json::Value(Json::objectValue);
  return room_->Join(room_id, user_data_);
}

webrtc::RTCError HuddleSession::NotifyJoinSuccess() {
  if (!room_->joined()) {
    return webrtc::RTCError(webrtc::RTCErrorType::INVALID_STATE, "Not in a room");
  }
  return room_->NotifyJoinSuccess(room_->room_id());
}

void HuddleSession::ToggleCamera() {
  if (!media_) return;
  media_->ToggleCamera();
  SyncMediaSettings();
}

void HuddleSession::ToggleMicrophone() {
  if (!media_) return;
  media_->ToggleMicrophone();
  SyncMediaSettings();
}

void HuddleSession::StartShareScreen(CompletionCallback done) {
  if (!initialized_) {
    done(webrtc::RTCError(webrtc::RTCErrorType::INVALID_STATE, "Session not initialized"));
    return;
  }
  MediaStreamRef screen = devices_->GetDisplayMedia();
  if (!screen) {
    done(webrtc::RTCError(webrtc::RTCErrorType::RESOURCE_EXHAUSTED, "No screen to capture"));
    return;
  }
  settings_.share = true;
  share_->Start(screen, token_, [this, done = std::move(done)](webrtc::RTCError error) {
    settings_.share = share_->sharing();
    done(std::move(error));
  });
}

void HuddleSession::StopShareScreen() {
  if (!share_) return;
  share_->Stop();
  settings_.share = false;
}

void HuddleSession::SetRecordState(bool record) {
  record_->SetRecordState(record);
  settings_.record = record;
}

bool HuddleSession::IsRecordingScreen() const {
  return record_->IsRecordingScreen();
}

ActionEnvelope HuddleSession::GetAction(const std::string& name,
                                        const Json::Value& attributes,
                                        const Json::Value& users,
                                        bool moderator) {
  return ActionEnvelope::Create(name, attributes, users, moderator);
}

webrtc::RTCError HuddleSession::RequestAction(const ActionEnvelope& action) {
  return actions_->Request(action);
}

void HuddleSession::RegisterAction(const std::string& name,
                                   std::unique_ptr<ActionHandler> handler) {
  actions_->RegisterHandler(name, std::move(handler));
}

void HuddleSession::On(const std::string& tag,
                       const std::string& event,
                       RoomProtocol::MessageHandler handler) {
  room_->On(tag, event, std::move(handler));
}

void HuddleSession::On(const std::string& event, RoomProtocol::MessageHandler handler) {
  room_->On(kPeerDataChannel, event, std::move(handler));
}

void HuddleSession::Settle() {
  roster_->Settle();
}

const RoomInformation& HuddleSession::room_information() const {
  return room_->information();
}

MediaTrackState HuddleSession::local_media_state() const {
  MediaTrackState state;
  state.cam_mute = media_ ? media_->camera_muted() : settings_.cam_mute;
  state.mic_mute = media_ ? media_->microphone_muted() : settings_.mic_mute;
  state.share = share_ && share_->sharing();
  state.record = record_->recording();
  return state;
}

void HuddleSession::RenderRemoteStream(const std::string& peer_id, MediaStreamRef stream) {
  if (renderer_) {
    renderer_->RenderRemote(peer_id, stream);
  }
}

void HuddleSession::StopScreenShare() {
  StopShareScreen();
}

std::string HuddleSession::LocalPeerId() const {
  return settings_.peer_id;
}

void HuddleSession::SetLocalCreator(bool creator) {
  settings_.is_creator = creator;
}

void HuddleSession::ConnectToNewUser(const Json::Value& data) {
  const std::string peer_id = PeerIdOf(data);
  if (peer_id.empty() || peer_id == settings_.peer_id) {
    return;
  }
  if (!peer_) {
    APP_LOG(AS_WARNING) << "User " << peer_id << " connected before initialization";
    return;
  }
  webrtc::RTCError error = peer_->EstablishConnectionWithUser(peer_id, data);
  if (!error.ok()) {
    APP_LOG(AS_WARNING) << "Connecting to " << peer_id << " failed: " << error.message();
    return;
  }
  bus_.Publish(SessionEvent::kUserConnected, data);
}

void HuddleSession::RunAction(const Json::Value& action) {
  actions_->Run(action);
}

webrtc::RTCError HuddleSession::ReleaseLocalMedia() {
  if (media_) {
    media_->Release();
  }
  return webrtc::RTCError::OK();
}

webrtc::RTCError HuddleSession::DisconnectPeerTransport() {
  if (!peer_) {
    return webrtc::RTCError(webrtc::RTCErrorType::INVALID_STATE, "No peer transport");
  }
  peer_->Disconnect();
  return webrtc::RTCError::OK();
}

webrtc::RTCError HuddleSession::Emit(const std::string& event, const Json::Value& args) {
  return signaling_->Emit(event, args);
}

void HuddleSession::Publish(SessionEvent event, const Json::Value& detail) {
  bus_.Publish(event, detail);
}

void HuddleSession::Notify(const std::string& title, const std::string& text) {
  if (notify_) {
    notify_(title, text);
    return;
  }
  APP_LOG(AS_INFO) << title << ": " << text;
}

webrtc::RTCError HuddleSession::LeaveRoom() {
  return room_->Left(user_data_);
}

void HuddleSession::MuteCamera() {
  if (media_ && !media_->camera_muted()) ToggleCamera();
}

void HuddleSession::UnmuteCamera() {
  if (media_ && media_->camera_muted()) ToggleCamera();
}

void HuddleSession::MuteMicrophone() {
  if (media_ && !media_->microphone_muted()) ToggleMicrophone();
}

void HuddleSession::UnmuteMicrophone() {
  if (media_ && media_->microphone_muted()) ToggleMicrophone();
}

void HuddleSession::HandlePeerData(const std::string& peer_id, const Json::Value& message) {
  if (!message.isObject() || !message["event"].isString()) {
    APP_LOG(AS_VERBOSE) << "Ignoring malformed message from " << peer_id;
    return;
  }
  Json::Value data = message;
  data["peerId"] = peer_id;
  room_->Dispatch(kPeerDataChannel, message["event"].asString(), data);
}

void HuddleSession::HandleSideChannelCall(std::shared_ptr<MediaConnection> call) {
  if (JsonString(call->metadata(), "type") == kScreenSharingCallType) {
    share_->HandleIncomingCall(std::move(call));
    return;
  }
  APP_LOG(AS_WARNING) << "Unknown side channel call from " << call->peer();
  call->Close();
}

void HuddleSession::RegisterPeerDataHandlers() {
  room_->On(kPeerDataChannel, "muteMedia", [this](const Json::Value& data) {
    bool cam_mute = true;
    bool mic_mute = true;
    if (!ReadJsonBool(data, "camMute", true, &cam_mute) ||
        !ReadJsonBool(data, "micMute", true, &mic_mute)) {
      APP_LOG(AS_WARNING) << "Dropping muteMedia from " << PeerIdOf(data)
                          << ": mute flags are not bools";
      return;
    }
    media_->SetConnectionMediaStatus(PeerIdOf(data), cam_mute, mic_mute);
  });
  room_->On(kPeerDataChannel, "screenShare", [this](const Json::Value& data) {
    share_->HandlePeerMessage(PeerIdOf(data), data);
  });
  room_->On(kPeerDataChannel, "recordScreen", [this](const Json::Value& data) {
    record_->HandlePeerMessage(PeerIdOf(data), data);
  });
}

void HuddleSession::SyncMediaSettings() {
  settings_.cam_mute = media_->camera_muted();
  settings_.mic_mute = media_->microphone_muted();
}
