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

#ifndef WEBRTC_HUDDLE_EVENTS_H_
#define WEBRTC_HUDDLE_EVENTS_H_

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <json/json.h>

// Local application notifications.
enum class SessionEvent {
  kAppReady,
  kRoomAdmitWait,
  kAdmissionRequest,
  kAdmissionCancel,
  kRoomJoined,
  kUserJoined,
  kUserConnected,
  kRoomLeft,
  kRoomInvalid,
  kRoomBanned,
  kPeerConnectionFailed,
  kSignalingFailed,
  kPeerTransportReady,
  kMediaStreamReady,
  kMediaStreamReset,
  kScreenShareDisplay,
  kScreenRecordStateChange,
  kExitConference,
  kChatMessageReceived,
  kFaceDetectDraw,
  kAction,  // named on<Name>Action
  kActionFailed,
};

// Wire name of |event|, e.g. "onRoomJoined". kAction returns "onAction".
const char* SessionEventName(SessionEvent event);

// True for notifications after which the host is expected to leave.
bool IsTerminalSessionEvent(SessionEvent event);

struct SessionNotification {
  SessionEvent event;
  std::string name;
  Json::Value detail;
};

// Typed publish/subscribe bus. Delivery is synchronous and follows
// subscription order. A subscriber added while a publish is in progress
// first sees the next publish; one removed while a publish is in progress
// is not called again, including for the current notification.
class EventBus {
 public:
  using Handler = std::function<void(const SessionNotification&)>;
  using SubscriptionId = int;

  EventBus() = default;
  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Receives every notification.
  SubscriptionId Subscribe(Handler handler);
  // Receives only |event|.
  SubscriptionId Subscribe(SessionEvent event, Handler handler);
  void Unsubscribe(SubscriptionId id);

  void Publish(SessionEvent event, const Json::Value& detail = Json::Value(Json::objectValue));
  // Publishes kAction under an explicit name such as "onBanAction".
  void PublishAction(const std::string& name, const Json::Value& detail);

  size_t subscriber_count() const { return subscribers_.size(); }

 private:
  struct Subscriber {
    SubscriptionId id;
    bool all_events;
    SessionEvent event;
    Handler handler;
    bool active = true;
  };

  SubscriptionId AddSubscriber(bool all_events, SessionEvent event, Handler handler);
  void Deliver(const SessionNotification& notification);

  std::vector<std::shared_ptr<Subscriber>> subscribers_;
  SubscriptionId next_id_ = 1;
};

#endif  // WEBRTC_HUDDLE_EVENTS_H_
