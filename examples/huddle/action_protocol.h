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

#ifndef WEBRTC_HUDDLE_ACTION_PROTOCOL_H_
#define WEBRTC_HUDDLE_ACTION_PROTOCOL_H_

#include <map>
#include <memory>
#include <optional>
#include <string>

#include <json/json.h>

#include "api/rtc_error.h"

#include "events.h"
#include "option.h"
#include "roster.h"
#include "room_protocol.h"
#include "signaling_channel.h"

// "faceDetectDraw" -> "face-detect-draw".
std::string CamelToKebab(const std::string& name);
// "face-detect-draw" -> "faceDetectDraw".
std::string KebabToCamel(const std::string& name);

// Moderated action relayed through the coordination server.
struct ActionEnvelope {
  std::string name;  // kebab-case
  Json::Value attributes = Json::Value(Json::objectValue);
  // Objects carrying a "peerId". Empty means everybody.
  Json::Value users = Json::Value(Json::arrayValue);
  bool moderator = false;

  // |users| may be one peer id string, one object or an array of objects.
  static ActionEnvelope Create(const std::string& name,
                               const Json::Value& attributes = Json::Value(Json::objectValue),
                               const Json::Value& users = Json::Value(Json::arrayValue),
                               bool moderator = false);

  Json::Value ToJson() const;
};

webrtc::RTCErrorOr<ActionEnvelope> ParseActionEnvelope(const Json::Value& json);

// What action handlers may touch.
class ActionContext {
 public:
  virtual std::string LocalPeerId() const = 0;
  virtual const Options& Config() const = 0;
  virtual webrtc::RTCError Emit(const std::string& event, const Json::Value& args) = 0;
  virtual void Publish(SessionEvent event, const Json::Value& detail) = 0;
  virtual void Notify(const std::string& title, const std::string& text) = 0;
  virtual webrtc::RTCError LeaveRoom() = 0;
  virtual void MuteCamera() = 0;
  virtual void UnmuteCamera() = 0;
  virtual void MuteMicrophone() = 0;
  virtual void UnmuteMicrophone() = 0;
  virtual const RosterManager& Roster() const = 0;

 protected:
  virtual ~ActionContext() = default;
};

class ActionHandler {
 public:
  virtual ~ActionHandler() = default;
  virtual webrtc::RTCError Run(ActionContext& context, const ActionEnvelope& action) = 0;
};

enum class ActionKind {
  kAdmit,
  kBan,
  kChat,
  kFaceDetectDraw,
};

// Built in action of a camelCase name. "faceApi" is the older name of
// face detect draw.
std::optional<ActionKind> ActionKindFromName(const std::string& camel_name);
std::unique_ptr<ActionHandler> CreateBuiltinActionHandler(ActionKind kind);

// Relays action requests and runs inbound actions.
class ActionProtocol {
 public:
  ActionProtocol(SignalingChannel* channel,
                 RoomProtocol* room,
                 EventBus* bus,
                 ActionContext* context);
  ~ActionProtocol();

  ActionProtocol(const ActionProtocol&) = delete;
  ActionProtocol& operator=(const ActionProtocol&) = delete;

  // Host handlers win over built in ones of the same name.
  void RegisterHandler(const std::string& name, std::unique_ptr<ActionHandler> handler);

  // Sends run-room-action for the joined room. Does nothing outside a room
  // or for an envelope without a name.
  webrtc::RTCError Request(const ActionEnvelope& action);

  // Runs an inbound action. Failures end up as onActionFailed.
  void Run(const Json::Value& action);
  void Run(const ActionEnvelope& action);

 private:
  ActionHandler* Resolve(const std::string& camel_name);
  void PublishFailure(const std::string& name, const std::string& message);

  SignalingChannel* const channel_;
  RoomProtocol* const room_;
  EventBus* const bus_;
  ActionContext* const context_;
  std::map<std::string, std::unique_ptr<ActionHandler>> custom_;
  std::map<ActionKind, std::unique_ptr<ActionHandler>> builtins_;
  std::map<std::string, ActionHandler*> resolved_;
};

#endif  // WEBRTC_HUDDLE_ACTION_PROTOCOL_H_
