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

#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace {

TEST(EventBusTest, DeliversInSubscriptionOrder) {
  EventBus bus;
  std::vector<std::string> seen;
  bus.Subscribe([&](const SessionNotification& n) { seen.push_back("all:" + n.name); });
  bus.Subscribe(SessionEvent::kRoomJoined,
                [&](const SessionNotification& n) { seen.push_back("joined:" + n.name); });
  bus.Publish(SessionEvent::kRoomJoined);
  bus.Publish(SessionEvent::kRoomLeft);
  ASSERT_EQ(seen.size(), 3u);
  EXPECT_EQ(seen[0], "all:onRoomJoined");
  EXPECT_EQ(seen[1], "joined:onRoomJoined");
  EXPECT_EQ(seen[2], "all:onRoomLeft");
}

TEST(EventBusTest, UnsubscribeDuringPublishSuppressesLaterSubscriber) {
  EventBus bus;
  int second_calls = 0;
  EventBus::SubscriptionId second = 0;
  bus.Subscribe([&](const SessionNotification&) { bus.Unsubscribe(second); });
  second = bus.Subscribe([&](const SessionNotification&) { second_calls++; });
  bus.Publish(SessionEvent::kAppReady);
  EXPECT_EQ(second_calls, 0);
  EXPECT_EQ(bus.subscriber_count(), 1u);
}

TEST(EventBusTest, SubscribeDuringPublishStartsWithNextPublish) {
  EventBus bus;
  int late_calls = 0;
  bool added = false;
  bus.Subscribe([&](const SessionNotification&) {
    if (added) return;
    added = true;
    bus.Subscribe([&](const SessionNotification&) { late_calls++; });
  });
  bus.Publish(SessionEvent::kAppReady);
  EXPECT_EQ(late_calls, 0);
  bus.Publish(SessionEvent::kAppReady);
  EXPECT_EQ(late_calls, 1);
}

TEST(EventBusTest, ActionNotificationsCarryTheirName) {
  EventBus bus;
  SessionNotification received{SessionEvent::kAppReady, "", Json::Value()};
  bus.Subscribe(SessionEvent::kAction,
                [&](const SessionNotification& n) { received = n; });
  Json::Value detail;
  detail["peerId"] = "p2";
  bus.PublishAction("onBanAction", detail);
  EXPECT_EQ(received.event, SessionEvent::kAction);
  EXPECT_EQ(received.name, "onBanAction");
  EXPECT_EQ(received.detail["peerId"].asString(), "p2");
}

TEST(EventBusTest, TerminalEvents) {
  EXPECT_TRUE(IsTerminalSessionEvent(SessionEvent::kRoomBanned));
  EXPECT_TRUE(IsTerminalSessionEvent(SessionEvent::kRoomInvalid));
  EXPECT_TRUE(IsTerminalSessionEvent(SessionEvent::kExitConference));
  EXPECT_TRUE(IsTerminalSessionEvent(SessionEvent::kSignalingFailed));
  EXPECT_STREQ(SessionEventName(SessionEvent::kSignalingFailed), "onSignalingFailed");
  EXPECT_FALSE(IsTerminalSessionEvent(SessionEvent::kRoomLeft));
  EXPECT_STREQ(SessionEventName(SessionEvent::kScreenRecordStateChange),
               "onScreenRecordStateChange");
}

}  // namespace
