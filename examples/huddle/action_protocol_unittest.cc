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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "manual_task_queue.h"
#include "mock_huddle.h"

namespace {

using ::testing::_;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::ReturnRef;

class MockActionContext : public ActionContext {
 public:
  MOCK_METHOD(std::string, LocalPeerId, (), (const, override));
  MOCK_METHOD(const Options&, Config, (), (const, override));
  MOCK_METHOD(webrtc::RTCError, Emit, (const std::string&, const Json::Value&), (override));
  MOCK_METHOD(void, Publish, (SessionEvent, const Json::Value&), (override));
  MOCK_METHOD(void, Notify, (const std::string&, const std::string&), (override));
  MOCK_METHOD(webrtc::RTCError, LeaveRoom, (), (override));
  MOCK_METHOD(void, MuteCamera, (), (override));
  MOCK_METHOD(void, UnmuteCamera, (), (override));
  MOCK_METHOD(void, MuteMicrophone, (), (override));
  MOCK_METHOD(void, UnmuteMicrophone, (), (override));
  MOCK_METHOD(const RosterManager&, Roster, (), (const, override));
};

class MockRoomProtocolDelegate : public RoomProtocolDelegate {
 public:
  MOCK_METHOD(std::string, LocalPeerId, (), (const, override));
  MOCK_METHOD(void, SetLocalCreator, (bool), (override));
  MOCK_METHOD(void, ConnectToNewUser, (const Json::Value&), (override));
  MOCK_METHOD(void, RunAction, (const Json::Value&), (override));
  MOCK_METHOD(webrtc::RTCError, ReleaseLocalMedia, (), (override));
  MOCK_METHOD(webrtc::RTCError, DisconnectPeerTransport, (), (override));
};

class CountingHandler : public ActionHandler {
 public:
  explicit CountingHandler(int* runs, webrtc::RTCError result = webrtc::RTCError::OK())
      : runs_(runs), result_(std::move(result)) {}

  webrtc::RTCError Run(ActionContext& context, const ActionEnvelope& action) override {
    ++*runs_;
    return result_;
  }

 private:
  int* runs_;
  webrtc::RTCError result_;
};

Json::Value BanAction(const std::string& peer_id, const std::string& name) {
  Json::Value action;
  action["name"] = "ban";
  action["attributes"]["ban"]["peerId"] = peer_id;
  action["attributes"]["ban"]["name"] = name;
  return action;
}

TEST(ActionEnvelopeTest, NamesConvertBetweenCases) {
  EXPECT_EQ(CamelToKebab("faceDetectDraw"), "face-detect-draw");
  EXPECT_EQ(CamelToKebab("ban"), "ban");
  EXPECT_EQ(KebabToCamel("face-detect-draw"), "faceDetectDraw");
  EXPECT_EQ(KebabToCamel("faceApi"), "faceApi");
}

TEST(ActionEnvelopeTest, CreateNormalizesUsers) {
  ActionEnvelope single = ActionEnvelope::Create("chat", Json::Value(Json::objectValue), "p1");
  ASSERT_EQ(single.users.size(), 1u);
  EXPECT_EQ(single.users[0]["peerId"].asString(), "p1");

  Json::Value users(Json::arrayValue);
  Json::Value with_id;
  with_id["peerId"] = "p2";
  users.append(with_id);
  users.append("p3");
  users.append(Json::Value(Json::objectValue));
  ActionEnvelope filtered =
      ActionEnvelope::Create("faceDetectDraw", Json::Value(Json::objectValue), users, true);
  EXPECT_EQ(filtered.name, "face-detect-draw");
  ASSERT_EQ(filtered.users.size(), 1u);
  EXPECT_EQ(filtered.users[0]["peerId"].asString(), "p2");
  EXPECT_TRUE(filtered.ToJson()["moderator"].asBool());
}

TEST(ActionEnvelopeTest, ParseRejectsNamelessActions) {
  EXPECT_FALSE(ParseActionEnvelope(Json::Value("ban")).ok());
  EXPECT_FALSE(ParseActionEnvelope(Json::Value(Json::objectValue)).ok());
  auto parsed = ParseActionEnvelope(BanAction("p1", "Alice"));
  ASSERT_TRUE(parsed.ok());
  EXPECT_EQ(parsed.value().attributes["ban"]["name"].asString(), "Alice");
}

TEST(ActionEnvelopeTest, ParseRejectsMistypedModeratorFlag) {
  Json::Value action = BanAction("p1", "Alice");
  action["moderator"] = "true";
  auto parsed = ParseActionEnvelope(action);
  ASSERT_FALSE(parsed.ok());
  EXPECT_EQ(parsed.error().type(), webrtc::RTCErrorType::INVALID_PARAMETER);
  action["moderator"] = true;
  ASSERT_TRUE(ParseActionEnvelope(action).ok());
  EXPECT_TRUE(ParseActionEnvelope(action).value().moderator);
}

class ActionProtocolTest : public ::testing::Test {
 protected:
  ActionProtocolTest() : queue_(CreateManualTaskQueue()) {
    auto socket = std::make_unique<NiceMock<MockSignalingSocket>>();
    socket_ = socket.get();
    ON_CALL(*socket_, IsConnected()).WillByDefault(Return(true));
    ON_CALL(*socket_, Emit(_, _, _)).WillByDefault(Return(true));
    channel_ = std::make_unique<SignalingChannel>(queue_.get(), std::move(socket));
    EXPECT_TRUE(channel_->Initialize(SignalingReconnectOptions()).ok());
    ON_CALL(roster_delegate_, room_information()).WillByDefault(ReturnRef(room_info_));
    roster_ = std::make_unique<RosterManager>(queue_.get(), &roster_delegate_);
    ON_CALL(room_delegate_, LocalPeerId()).WillByDefault(Return("p2"));
    room_ = std::make_unique<RoomProtocol>(queue_.get(), channel_.get(), roster_.get(), &bus_,
                                           &room_delegate_);
    ON_CALL(context_, LocalPeerId()).WillByDefault(Return("p2"));
    ON_CALL(context_, Config()).WillByDefault(ReturnRef(options_));
    ON_CALL(context_, Roster()).WillByDefault(ReturnRef(*roster_));
    ON_CALL(context_, Emit(_, _)).WillByDefault(Return(webrtc::RTCError::OK()));
    ON_CALL(context_, LeaveRoom()).WillByDefault(Return(webrtc::RTCError::OK()));
    ON_CALL(context_, Publish(_, _))
        .WillByDefault([this](SessionEvent event, const Json::Value& detail) {
          bus_.Publish(event, detail);
        });
    actions_ = std::make_unique<ActionProtocol>(channel_.get(), room_.get(), &bus_, &context_);
    bus_.Subscribe([this](const SessionNotification& n) { events_.push_back(n); });
  }

  bool Published(const std::string& name) const {
    for (const SessionNotification& n : events_) {
      if (n.name == name) {
        return true;
      }
    }
    return false;
  }

  ManualTaskQueuePtr queue_;
  NiceMock<MockSignalingSocket>* socket_;
  std::unique_ptr<SignalingChannel> channel_;
  RoomInformation room_info_;
  NiceMock<MockRosterDelegate> roster_delegate_;
  std::unique_ptr<RosterManager> roster_;
  EventBus bus_;
  NiceMock<MockRoomProtocolDelegate> room_delegate_;
  std::unique_ptr<RoomProtocol> room_;
  Options options_;
  NiceMock<MockActionContext> context_;
  std::unique_ptr<ActionProtocol> actions_;
  std::vector<SessionNotification> events_;
};

TEST_F(ActionProtocolTest, BanOfLocalPeerLeavesTheConference) {
  {
    InSequence sequence;
    EXPECT_CALL(context_, Notify("User ban", "You have been banned from this meeting by a moderator."));
    EXPECT_CALL(context_, LeaveRoom());
    EXPECT_CALL(context_, Publish(SessionEvent::kExitConference, _));
  }
  actions_->Run(BanAction("p2", "Bob"));
  EXPECT_TRUE(Published("onExitConference"));
  EXPECT_TRUE(Published("onBanAction"));
}

TEST_F(ActionProtocolTest, BanOfAnotherPeerOnlyNotifies) {
  EXPECT_CALL(context_, Notify("User ban", "Alice have been banned from this meeting by a moderator."));
  EXPECT_CALL(context_, LeaveRoom()).Times(0);
  EXPECT_CALL(context_, Publish(SessionEvent::kExitConference, _)).Times(0);
  actions_->Run(BanAction("p1", "Alice"));
  EXPECT_FALSE(Published("onExitConference"));
  EXPECT_TRUE(Published("onBanAction"));
}

TEST_F(ActionProtocolTest, AdmitWithAccessRejoinsFromWaitingList) {
  Json::Value action;
  action["name"] = "admit";
  action["attributes"]["peerId"] = "p2";
  action["attributes"]["roomId"] = "room-1";
  action["attributes"]["status"] = true;
  action["attributes"]["access"] = "granted";
  EXPECT_CALL(context_, Emit("join-room-from-waiting-list", _))
      .WillOnce([](const std::string&, const Json::Value& args) {
        EXPECT_EQ(args[0].asString(), "room-1");
        EXPECT_EQ(args[1]["access"].asString(), "granted");
        return webrtc::RTCError::OK();
      });
  actions_->Run(action);
  EXPECT_TRUE(Published("onAdmitAction"));
}

TEST_F(ActionProtocolTest, DeclinedAdmitExitsTheConference) {
  Json::Value action;
  action["name"] = "admit";
  action["attributes"]["peerId"] = "p2";
  action["attributes"]["status"] = false;
  EXPECT_CALL(context_, Notify("Request Declined", "Your request to join this room was not approved."));
  EXPECT_CALL(context_, Emit(_, _)).Times(0);
  actions_->Run(action);
  EXPECT_TRUE(Published("onExitConference"));
}

TEST_F(ActionProtocolTest, AdmitForAnotherPeerIsIgnored) {
  Json::Value action;
  action["name"] = "admit";
  action["attributes"]["peerId"] = "p1";
  EXPECT_CALL(context_, Notify(_, _)).Times(0);
  EXPECT_CALL(context_, Emit(_, _)).Times(0);
  actions_->Run(action);
}

TEST_F(ActionProtocolTest, LegacyFaceApiNameDraws) {
  Json::Value action;
  action["name"] = "faceApi";
  action["attributes"]["x"] = 10;
  actions_->Run(action);
  ASSERT_FALSE(events_.empty());
  EXPECT_EQ(events_[0].event, SessionEvent::kFaceDetectDraw);
  EXPECT_EQ(events_[0].detail["x"].asInt(), 10);
}

TEST_F(ActionProtocolTest, CustomHandlerTakesPrecedence) {
  Json::Value chat;
  chat["name"] = "chat";
  chat["attributes"]["text"] = "hi";
  actions_->Run(chat);
  EXPECT_TRUE(Published("onChatMessageReceived"));
  events_.clear();

  int runs = 0;
  actions_->RegisterHandler("chat", std::make_unique<CountingHandler>(&runs));
  actions_->Run(chat);
  EXPECT_EQ(runs, 1);
  EXPECT_FALSE(Published("onChatMessageReceived"));
  EXPECT_TRUE(Published("onChatAction"));
}

TEST_F(ActionProtocolTest, FailureIsPublishedNotPropagated) {
  int runs = 0;
  actions_->RegisterHandler(
      "mute-all",
      std::make_unique<CountingHandler>(
          &runs, webrtc::RTCError(webrtc::RTCErrorType::INTERNAL_ERROR, "boom")));
  Json::Value action;
  action["name"] = "mute-all";
  actions_->Run(action);
  EXPECT_EQ(runs, 1);
  ASSERT_EQ(events_.size(), 1u);
  EXPECT_EQ(events_[0].event, SessionEvent::kActionFailed);
  EXPECT_EQ(events_[0].detail["name"].asString(), "mute-all");
  EXPECT_EQ(events_[0].detail["message"].asString(), "boom");
}

TEST_F(ActionProtocolTest, MistypedActionIsPublishedAsFailure) {
  EXPECT_CALL(context_, Notify(_, _)).Times(0);
  Json::Value action = BanAction("p1", "Alice");
  action["moderator"] = Json::Value(Json::arrayValue);
  actions_->Run(action);
  ASSERT_EQ(events_.size(), 1u);
  EXPECT_EQ(events_[0].event, SessionEvent::kActionFailed);
  EXPECT_EQ(events_[0].detail["name"].asString(), "ban");
}

TEST_F(ActionProtocolTest, UnknownActionFails) {
  Json::Value action;
  action["name"] = "teleport";
  actions_->Run(action);
  ASSERT_EQ(events_.size(), 1u);
  EXPECT_EQ(events_[0].event, SessionEvent::kActionFailed);
}

TEST_F(ActionProtocolTest, RequestNeedsAJoinedRoom) {
  EXPECT_CALL(*socket_, Emit(_, _, _)).Times(0);
  EXPECT_TRUE(actions_->Request(ActionEnvelope::Create("chat")).ok());
  ::testing::Mock::VerifyAndClearExpectations(socket_);

  Json::Value info;
  info["id"] = "room-1";
  Json::Value args(Json::arrayValue);
  args.append(info);
  EXPECT_TRUE(room_->Listen().ok());
  channel_->OnEvent("room-information", args);

  EXPECT_CALL(*socket_, Emit("run-room-action", _, _))
      .WillOnce([](const std::string&, const Json::Value& args, SignalingSocket::AckCallback) {
        EXPECT_EQ(args[0].asString(), "room-1");
        EXPECT_EQ(args[1]["name"].asString(), "face-detect-draw");
        return true;
      });
  EXPECT_TRUE(actions_->Request(ActionEnvelope::Create("faceDetectDraw")).ok());
  EXPECT_TRUE(actions_->Request(ActionEnvelope()).ok());
}

}  // namespace
