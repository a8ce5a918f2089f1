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

#include "action_protocol.h"

#include <cctype>
#include <utility>

namespace {

bool Truthy(const Json::Value& value) {
  if (value.isBool()) {
    return value.asBool();
  }
  if (value.isString()) {
    return !value.asString().empty();
  }
  if (value.isNumeric()) {
    return value.asDouble() != 0;
  }
  return value.isObject() || value.isArray();
}

Json::Value NormalizeUsers(const Json::Value& users) {
  Json::Value result(Json::arrayValue);
  if (users.isString()) {
    Json::Value user(Json::objectValue);
    user["peerId"] = users.asString();
    result.append(user);
  } else if (users.isObject()) {
    if (users["peerId"].isString()) {
      result.append(users);
    }
  } else if (users.isArray()) {
    for (const Json::Value& user : users) {
      if (user.isObject() && user["peerId"].isString()) {
        result.append(user);
      }
    }
  }
  return result;
}

class AdmitActionHandler : public ActionHandler {
 public:
  webrtc::RTCError Run(ActionContext& context, const ActionEnvelope& action) override {
    const Json::Value& attributes = action.attributes;
    if (PeerIdOf(attributes) != context.LocalPeerId()) {
      return webrtc::RTCError::OK();
    }
    if (Truthy(attributes["status"]) && Truthy(attributes["access"])) {
      Json::Value access(Json::objectValue);
      access["access"] = attributes["access"];
      Json::Value args(Json::arrayValue);
      args.append(attributes["roomId"]);
      args.append(access);
      return context.Emit("join-room-from-waiting-list", args);
    }
    context.Notify("Request Declined", "Your request to join this room was not approved.");
    context.Publish(SessionEvent::kExitConference, Json::Value(Json::objectValue));
    return webrtc::RTCError::OK();
  }
};

class BanActionHandler : public ActionHandler {
 public:
  webrtc::RTCError Run(ActionContext& context, const ActionEnvelope& action) override {
    const Json::Value& banned = action.attributes["ban"];
    if (!banned.isObject()) {
      return webrtc::RTCError(webrtc::RTCErrorType::INVALID_PARAMETER,
                              "ban attribute missing");
    }
    if (PeerIdOf(banned) == context.LocalPeerId()) {
      context.Notify("User ban", "You have been banned from this meeting by a moderator.");
      webrtc::RTCError error = context.LeaveRoom();
      if (!error.ok()) {
        APP_LOG(AS_WARNING) << "Leaving banned room: " << error.message();
      }
      context.Publish(SessionEvent::kExitConference, Json::Value(Json::objectValue));
      return webrtc::RTCError::OK();
    }
    context.Notify("User ban", JsonString(banned, "name") +
                                   " have been banned from this meeting by a moderator.");
    return webrtc::RTCError::OK();
  }
};

class PublishActionHandler : public ActionHandler {
 public:
  explicit PublishActionHandler(SessionEvent event) : event_(event) {}

  webrtc::RTCError Run(ActionContext& context, const ActionEnvelope& action) override {
    context.Publish(event_, action.attributes);
    return webrtc::RTCError::OK();
  }

 private:
  const SessionEvent event_;
};

}  // namespace

std::string CamelToKebab(const std::string& name) {
  std::string result;
  for (char c : name) {
    if (std::isupper(static_cast<unsigned char>(c))) {
      if (!result.empty()) {
        result += '-';
      }
      result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    } else {
      result += c;
    }
  }
  return result;
}

std::string KebabToCamel(const std::string& name) {
  std::string result;
  bool upper = false;
  for (char c : name) {
    if (c == '-') {
      upper = !result.empty();
      continue;
    }
    result += upper ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c;
    upper = false;
  }
  return result;
}

ActionEnvelope ActionEnvelope::Create(const std::string& name,
                                      const Json::Value& attributes,
                                      const Json::Value& users,
                                      bool moderator) {
  ActionEnvelope action;
  action.name = CamelToKebab(name);
  if (attributes.isObject()) {
    action.attributes = attributes;
  }
  action.users = NormalizeUsers(users);
  action.moderator = moderator;
  return action;
}

Json::Value ActionEnvelope::ToJson() const {
  Json::Value json(Json::objectValue);
  json["name"] = name;
  json["attributes"] = attributes;
  json["users"] = users;
  json["moderator"] = moderator;
  return json;
}

webrtc::RTCErrorOr<ActionEnvelope> ParseActionEnvelope(const Json::Value& json) {
  if (!json.isObject()) {
    return webrtc::RTCError(webrtc::RTCErrorType::SYNTAX_ERROR, "action is not an object");
  }
  const Json::Value& name = json["name"];
  if (!name.isString() || name.asString().empty()) {
    return webrtc::RTCError(webrtc::RTCErrorType::INVALID_PARAMETER, "action has no name");
  }
  bool moderator = false;
  if (!ReadJsonBool(json, "moderator", false, &moderator)) {
    APP_LOG(AS_WARNING) << "Dropping action " << name.asString() << ": moderator is not a bool";
    return webrtc::RTCError(webrtc::RTCErrorType::INVALID_PARAMETER,
                            "action moderator is not a bool");
  }
  return ActionEnvelope::Create(name.asString(), json["attributes"], json["users"], moderator);
}

std::optional<ActionKind> ActionKindFromName(const std::string& camel_name) {
  if (camel_name == "admit") {
    return ActionKind::kAdmit;
  }
  if (camel_name == "ban") {
    return ActionKind::kBan;
  }
  if (camel_name == "chat") {
    return ActionKind::kChat;
  }
  if (camel_name == "faceDetectDraw" || camel_name == "faceApi") {
    return ActionKind::kFaceDetectDraw;
  }
  return std::nullopt;
}

std::unique_ptr<ActionHandler> CreateBuiltinActionHandler(ActionKind kind) {
  switch (kind) {
    case ActionKind::kAdmit:
      return std::make_unique<AdmitActionHandler>();
    case ActionKind::kBan:
      return std::make_unique<BanActionHandler>();
    case ActionKind::kChat:
      return std::make_unique<PublishActionHandler>(SessionEvent::kChatMessageReceived);
    case ActionKind::kFaceDetectDraw:
      return std::make_unique<PublishActionHandler>(SessionEvent::kFaceDetectDraw);
  }
  return nullptr;
}

ActionProtocol::ActionProtocol(SignalingChannel* channel,
                               RoomProtocol* room,
                               EventBus* bus,
                               ActionContext* context)
    : channel_(channel), room_(room), bus_(bus), context_(context) {}

ActionProtocol::~ActionProtocol() = default;

void ActionProtocol::RegisterHandler(const std::string& name,
                                     std::unique_ptr<ActionHandler> handler) {
  const std::string camel = KebabToCamel(name);
  resolved_.erase(camel);
  if (handler) {
    custom_[camel] = std::move(handler);
  } else {
    custom_.erase(camel);
  }
}

webrtc::RTCError ActionProtocol::Request(const ActionEnvelope& action) {
  if (!room_->joined() || action.name.empty()) {
    APP_LOG(AS_VERBOSE) << "Ignoring action request '" << action.name << "' outside a room";
    return webrtc::RTCError::OK();
  }
  Json::Value args(Json::arrayValue);
  args.append(room_->room_id());
  args.append(action.ToJson());
  return channel_->Emit("run-room-action", args);
}

void ActionProtocol::Run(const Json::Value& action) {
  webrtc::RTCErrorOr<ActionEnvelope> parsed = ParseActionEnvelope(action);
  if (!parsed.ok()) {
    PublishFailure(JsonString(action, "name"),
                   parsed.error().message());
    return;
  }
  Run(parsed.value());
}

void ActionProtocol::Run(const ActionEnvelope& action) {
  const std::string camel = KebabToCamel(action.name);
  ActionHandler* handler = Resolve(camel);
  if (!handler) {
    PublishFailure(action.name, "Unknown action");
    return;
  }
  webrtc::RTCError error = handler->Run(*context_, action);
  if (!error.ok()) {
    PublishFailure(action.name, error.message());
    return;
  }
  std::string event = "on" + camel + "Action";
  event[2] = static_cast<char>(std::toupper(static_cast<unsigned char>(event[2])));
  bus_->PublishAction(event, action.attributes);
}

ActionHandler* ActionProtocol::Resolve(const std::string& camel_name) {
  auto cached = resolved_.find(camel_name);
  if (cached != resolved_.end()) {
    return cached->second;
  }
  ActionHandler* handler = nullptr;
  auto custom = custom_.find(camel_name);
  if (custom != custom_.end()) {
    handler = custom->second.get();
  } else if (std::optional<ActionKind> kind = ActionKindFromName(camel_name)) {
    std::unique_ptr<ActionHandler>& builtin = builtins_[*kind];
    if (!builtin) {
      builtin = CreateBuiltinActionHandler(*kind);
    }
    handler = builtin.get();
  }
  if (handler) {
    resolved_[camel_name] = handler;
  }
  return handler;
}

void ActionProtocol::PublishFailure(const std::string& name, const std::string& message) {
  APP_LOG(AS_WARNING) << "Action '" << name << "' failed: " << message;
  Json::Value detail(Json::objectValue);
  detail["name"] = name;
  detail["message"] = message;
  bus_->Publish(SessionEvent::kActionFailed, detail);
}
