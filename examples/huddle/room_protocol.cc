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

#include "room_protocol.h"

#include "option.h"

const char kPeerDataChannel[] = "peerData";

namespace {

const Json::Value& FirstArgument(const Json::Value& args) {
  static const Json::Value kEmpty(Json::objectValue);
  if (args.isArray() && !args.empty()) {
    return args[0];
  }
  return kEmpty;
}

}  // namespace

RoomProtocol::RoomProtocol(webrtc::TaskQueueBase* task_queue,
                           SignalingChannel* channel,
                           RosterManager* roster,
                           EventBus* bus,
                           RoomProtocolDelegate* delegate)
    : task_queue_(task_queue),
      channel_(channel),
      roster_(roster),
      bus_(bus),
      delegate_(delegate),
      safety_(webrtc::PendingTaskSafetyFlag::CreateDetached()) {}

RoomProtocol::~RoomProtocol() {
  safety_->SetNotAlive();
}

webrtc::RTCError RoomProtocol::Listen() {
  if (listening_) {
    return webrtc::RTCError::OK();
  }
  using Handler = void (RoomProtocol::*)(const Json::Value&);
  static const struct {
    const char* event;
    Handler handler;
  } kHandlers[] = {
      {"wait-accept-room-join", &RoomProtocol::HandleWaitAcceptRoomJoin},
      {"admit-user-to-join", &RoomProtocol::HandleAdmitUserToJoin},
      {"remove-user-from-waiting-list", &RoomProtocol::HandleRemoveUserFromWaitingList},
      {"connect-room-success", &RoomProtocol::HandleConnectRoomSuccess},
      {"room-information", &RoomProtocol::HandleRoomInformation},
      {"user-connected", &RoomProtocol::HandleUserConnected},
      {"user-left-room", &RoomProtocol::HandleUserLeft},
      {"user-disconnected", &RoomProtocol::HandleUserLeft},
      {"room-id-invalid", &RoomProtocol::HandleRoomIdInvalid},
      {"run-action", &RoomProtocol::HandleRunAction},
      {"you-are-ban", &RoomProtocol::HandleYouAreBan},
  };
  for (const auto& entry : kHandlers) {
    Handler handler = entry.handler;
    webrtc::RTCError error = channel_->Listen(
        entry.event, [this, handler](const Json::Value& args) {
          (this->*handler)(FirstArgument(args));
        });
    if (!error.ok()) {
      return error;
    }
  }
  for (const char* event : {"successfully-run-action", "failed-run-action", "info-room-data"}) {
    std::string name = event;
    webrtc::RTCError error = channel_->Listen(name, [this, name](const Json::Value& args) {
      HandleDiagnostic(name, FirstArgument(args));
    });
    if (!error.ok()) {
      return error;
    }
  }
  listening_ = true;
  APP_LOG(AS_VERBOSE) << "All room listeners registered";
  return webrtc::RTCError::OK();
}

webrtc::RTCError RoomProtocol::Join(const std::string& room_id,
                                    const Json::Value& user_data) {
  Json::Value args(Json::arrayValue);
  args.append(room_id);
  args.append(WithPeerId(user_data));
  if (channel_->IsConnected()) {
    APP_LOG(AS_INFO) << "Joining room " << room_id;
    return channel_->Emit("join-room", args);
  }
  APP_LOG(AS_INFO) << "Joining room " << room_id << " once connected";
  channel_->OnceConnected([this, flag = safety_, args]() {
    if (!flag->alive()) return;
    webrtc::RTCError error = channel_->Emit("join-room", args);
    if (!error.ok()) {
      APP_LOG(AS_ERROR) << "Queued join failed: " << error.message();
    }
  });
  return webrtc::RTCError::OK();
}

webrtc::RTCError RoomProtocol::NotifyJoinSuccess(const std::string& room_id) {
  Json::Value args(Json::arrayValue);
  args.append(room_id);
  args.append(WithPeerId(Json::Value(Json::objectValue)));
  return channel_->Emit("join-room-successfully", args);
}

webrtc::RTCError RoomProtocol::Left(const Json::Value& user_data) {
  if (!joined() || !channel_->IsConnected()) {
    return webrtc::RTCError(webrtc::RTCErrorType::INVALID_STATE, "Not in a connected room");
  }
  const std::string room_id = information_.id;
  webrtc::RTCError first_error = webrtc::RTCError::OK();
  auto step = [&first_error](const char* name, webrtc::RTCError error) {
    if (error.ok()) return;
    APP_LOG(AS_WARNING) << "Leaving room, " << name << " failed: " << error.message();
    if (first_error.ok()) first_error = std::move(error);
  };

  APP_LOG(AS_INFO) << "Leaving room " << room_id;
  roster_->CloseAll();
  step("media release", delegate_->ReleaseLocalMedia());
  step("peer disconnect", delegate_->DisconnectPeerTransport());

  Json::Value args(Json::arrayValue);
  args.append(room_id);
  args.append(WithPeerId(user_data));
  webrtc::RTCError emit_error = channel_->Emit(
      "left-room", args, [this, flag = safety_](const Json::Value& /*ack*/) {
        // The acknowledgement arrives from inside the socket dispatch.
        task_queue_->PostTask(webrtc::SafeTask(flag, [this]() {
          channel_->SetConnection(false, "", nullptr);
        }));
      });
  if (!emit_error.ok()) {
    channel_->SetConnection(false, "", nullptr);
  }
  step("server notification", std::move(emit_error));

  information_ = RoomInformation();
  return first_error;
}

void RoomProtocol::On(const std::string& tag,
                      const std::string& event,
                      MessageHandler handler) {
  APP_LOG(AS_VERBOSE) << "Handler set for " << tag << ":" << event;
  handlers_[std::make_pair(tag, event)] = std::move(handler);
}

bool RoomProtocol::Dispatch(const std::string& tag,
                            const std::string& event,
                            const Json::Value& data) {
  auto it = handlers_.find(std::make_pair(tag, event));
  if (it == handlers_.end() || !it->second) {
    APP_LOG(AS_VERBOSE) << "Handler not found for " << tag << " type " << event << " event";
    return false;
  }
  it->second(data);
  return true;
}

void RoomProtocol::HandleWaitAcceptRoomJoin(const Json::Value& data) {
  bus_->Publish(SessionEvent::kRoomAdmitWait, data);
}

void RoomProtocol::HandleAdmitUserToJoin(const Json::Value& data) {
  const std::string peer_id = PeerIdOf(data);
  if (!roster_->AddToWaitingList({peer_id, data})) {
    APP_LOG(AS_VERBOSE) << peer_id << " already waiting";
  }
  bus_->Publish(SessionEvent::kAdmissionRequest, data);
}

void RoomProtocol::HandleRemoveUserFromWaitingList(const Json::Value& data) {
  roster_->RemoveFromWaitingListByPeerId(PeerIdOf(data));
  bus_->Publish(SessionEvent::kAdmissionCancel, data);
}

void RoomProtocol::HandleConnectRoomSuccess(const Json::Value& data) {
  bus_->Publish(SessionEvent::kRoomJoined, data);
}

void RoomProtocol::HandleRoomInformation(const Json::Value& data) {
  information_ = ParseRoomInformation(data);
  APP_LOG(AS_INFO) << "Room " << information_.id << " has "
                   << information_.users.size() << " members";
  const RoomMember* self = information_.FindMember(delegate_->LocalPeerId());
  if (self && self->creator_known) {
    delegate_->SetLocalCreator(self->creator);
  }
}

void RoomProtocol::HandleUserConnected(const Json::Value& data) {
  delegate_->ConnectToNewUser(data);
  bus_->Publish(SessionEvent::kUserJoined, data);
}

void RoomProtocol::HandleUserLeft(const Json::Value& data) {
  roster_->Remove(PeerIdOf(data));
  bus_->Publish(SessionEvent::kRoomLeft, data);
}

void RoomProtocol::HandleRoomIdInvalid(const Json::Value& data) {
  APP_LOG(AS_ERROR) << "Room id is invalid";
  bus_->Publish(SessionEvent::kRoomInvalid, data);
}

void RoomProtocol::HandleRunAction(const Json::Value& data) {
  delegate_->RunAction(data);
}

void RoomProtocol::HandleYouAreBan(const Json::Value& data) {
  APP_LOG(AS_WARNING) << "Banned from room " << information_.id;
  bus_->Publish(SessionEvent::kRoomBanned, data);
}

void RoomProtocol::HandleDiagnostic(const std::string& event, const Json::Value& data) {
  APP_LOG(AS_VERBOSE) << event << ": " << data.toStyledString();
}

Json::Value RoomProtocol::WithPeerId(const Json::Value& user_data) const {
  Json::Value data(Json::objectValue);
  data["peerId"] = delegate_->LocalPeerId();
  if (user_data.isObject()) {
    for (const auto& key : user_data.getMemberNames()) {
      data[key] = user_data[key];
    }
  }
  return data;
}
