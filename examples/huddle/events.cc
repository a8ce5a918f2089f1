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

#include "events.h"

#include <algorithm>

#include "option.h"

const char* SessionEventName(SessionEvent event) {
  switch (event) {
    case SessionEvent::kAppReady: return "onAppReady";
    case SessionEvent::kRoomAdmitWait: return "onRoomAdmitWait";
    case SessionEvent::kAdmissionRequest: return "onAdmissionRequest";
    case SessionEvent::kAdmissionCancel: return "onAdmissionCancel";
    case SessionEvent::kRoomJoined: return "onRoomJoined";
    case SessionEvent::kUserJoined: return "onUserJoined";
    case SessionEvent::kUserConnected: return "onUserConnected";
    case SessionEvent::kRoomLeft: return "onRoomLeft";
    case SessionEvent::kRoomInvalid: return "onRoomInvalid";
    case SessionEvent::kRoomBanned: return "onRoomBanned";
    case SessionEvent::kPeerConnectionFailed: return "onPeerConnectionFailed";
    case SessionEvent::kSignalingFailed: return "onSignalingFailed";
    case SessionEvent::kPeerTransportReady: return "onPeerTransportReady";
    case SessionEvent::kMediaStreamReady: return "onMediaStreamReady";
    case SessionEvent::kMediaStreamReset: return "onMediaStreamReset";
    case SessionEvent::kScreenShareDisplay: return "onScreenShareDisplay";
    case SessionEvent::kScreenRecordStateChange: return "onScreenRecordStateChange";
    case SessionEvent::kExitConference: return "onExitConference";
    case SessionEvent::kChatMessageReceived: return "onChatMessageReceived";
    case SessionEvent::kFaceDetectDraw: return "onFaceDetectDraw";
    case SessionEvent::kAction: return "onAction";
    case SessionEvent::kActionFailed: return "onActionFailed";
  }
  return "onUnknown";
}

bool IsTerminalSessionEvent(SessionEvent event) {
  return event == SessionEvent::kRoomInvalid ||
         event == SessionEvent::kRoomBanned ||
         event == SessionEvent::kSignalingFailed ||
         event == SessionEvent::kExitConference;
}

EventBus::SubscriptionId EventBus::Subscribe(Handler handler) {
  return AddSubscriber(true, SessionEvent::kAppReady, std::move(handler));
}

EventBus::SubscriptionId EventBus::Subscribe(SessionEvent event, Handler handler) {
  return AddSubscriber(false, event, std::move(handler));
}

EventBus::SubscriptionId EventBus::AddSubscriber(bool all_events,
                                                 SessionEvent event,
                                                 Handler handler) {
  auto subscriber = std::make_shared<Subscriber>();
  subscriber->id = next_id_++;
  subscriber->all_events = all_events;
  subscriber->event = event;
  subscriber->handler = std::move(handler);
  subscribers_.push_back(subscriber);
  return subscriber->id;
}

void EventBus::Unsubscribe(SubscriptionId id) {
  auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
                         [id](const std::shared_ptr<Subscriber>& s) { return s->id == id; });
  if (it == subscribers_.end()) {
    return;
  }
  (*it)->active = false;
  subscribers_.erase(it);
}

void EventBus::Publish(SessionEvent event, const Json::Value& detail) {
  Deliver({event, SessionEventName(event), detail});
}

void EventBus::PublishAction(const std::string& name, const Json::Value& detail) {
  Deliver({SessionEvent::kAction, name, detail});
}

void EventBus::Deliver(const SessionNotification& notification) {
  APP_LOG(AS_VERBOSE) << "Publishing " << notification.name;
  // Snapshot so that subscribers added during delivery wait for the next one.
  std::vector<std::shared_ptr<Subscriber>> snapshot = subscribers_;
  for (const auto& subscriber : snapshot) {
    if (!subscriber->active) {
      continue;
    }
    if (!subscriber->all_events && subscriber->event != notification.event) {
      continue;
    }
    if (subscriber->handler) {
      subscriber->handler(notification);
    }
  }
}
