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

#ifndef WEBRTC_HUDDLE_ROOM_PROTOCOL_H_
#define WEBRTC_HUDDLE_ROOM_PROTOCOL_H_

#include <functional>
#include <map>
#include <string>
#include <utility>

#include <json/json.h>

#include "api/rtc_error.h"
#include "api/scoped_refptr.h"
#include "api/task_queue/pending_task_safety_flag.h"
#include "api/task_queue/task_queue_base.h"

#include "events.h"
#include "roster.h"
#include "signaling_channel.h"

// Tag of messages received on peer data connections.
extern const char kPeerDataChannel[];

// Session services the room protocol drives.
class RoomProtocolDelegate {
 public:
  virtual std::string LocalPeerId() const = 0;
  virtual void SetLocalCreator(bool creator) = 0;
  virtual void ConnectToNewUser(const Json::Value& data) = 0;
  virtual void RunAction(const Json::Value& action) = 0;
  // Room exit steps.
  virtual webrtc::RTCError ReleaseLocalMedia() = 0;
  virtual webrtc::RTCError DisconnectPeerTransport() = 0;

 protected:
  virtual ~RoomProtocolDelegate() = default;
};

// Room membership over the signaling channel, and dispatch of inbound
// control and peer messages.
class RoomProtocol {
 public:
  using MessageHandler = std::function<void(const Json::Value& data)>;

  RoomProtocol(webrtc::TaskQueueBase* task_queue,
               SignalingChannel* channel,
               RosterManager* roster,
               EventBus* bus,
               RoomProtocolDelegate* delegate);
  ~RoomProtocol();

  RoomProtocol(const RoomProtocol&) = delete;
  RoomProtocol& operator=(const RoomProtocol&) = delete;

  // Registers the control message handlers. Only the first call does.
  webrtc::RTCError Listen();

  // Sends join-room now, or on the next connect while disconnected.
  webrtc::RTCError Join(const std::string& room_id, const Json::Value& user_data);
  webrtc::RTCError NotifyJoinSuccess(const std::string& room_id);
  // Tears the session down step by step. Every step runs; the first
  // failure is returned. The signaling channel closes once the server
  // acknowledged the leave.
  webrtc::RTCError Left(const Json::Value& user_data);

  // Handler of (tag, event) peer messages. Registering again replaces.
  void On(const std::string& tag, const std::string& event, MessageHandler handler);
  // Returns false when no handler is registered.
  bool Dispatch(const std::string& tag, const std::string& event, const Json::Value& data);

  const RoomInformation& information() const { return information_; }
  const std::string& room_id() const { return information_.id; }
  bool joined() const { return !information_.id.empty(); }

 private:
  void HandleWaitAcceptRoomJoin(const Json::Value& data);
  void HandleAdmitUserToJoin(const Json::Value& data);
  void HandleRemoveUserFromWaitingList(const Json::Value& data);
  void HandleConnectRoomSuccess(const Json::Value& data);
  void HandleRoomInformation(const Json::Value& data);
  void HandleUserConnected(const Json::Value& data);
  void HandleUserLeft(const Json::Value& data);
  void HandleRoomIdInvalid(const Json::Value& data);
  void HandleRunAction(const Json::Value& data);
  void HandleYouAreBan(const Json::Value& data);
  void HandleDiagnostic(const std::string& event, const Json::Value& data);

  Json::Value WithPeerId(const Json::Value& user_data) const;

  webrtc::TaskQueueBase* const task_queue_;
  SignalingChannel* const channel_;
  RosterManager* const roster_;
  EventBus* const bus_;
  RoomProtocolDelegate* const delegate_;
  RoomInformation information_;
  bool listening_ = false;
  std::map<std::pair<std::string, std::string>, MessageHandler> handlers_;
  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> safety_;
};

#endif  // WEBRTC_HUDDLE_ROOM_PROTOCOL_H_
