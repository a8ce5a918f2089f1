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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "manual_task_queue.h"
#include "mock_huddle.h"

namespace {

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::ReturnRef;
using ::testing::SaveArg;

class MockRoomProtocolDelegate : public RoomProtocolDelegate {
 public:
  MOCK_METHOD(std::string, LocalPeerId, (), (const, override));
  MOCK_METHOD(void, SetLocalCreator, (bool), (override));
  MOCK_METHOD(void, ConnectToNewUser, (const Json::Value&), (override));
  MOCK_METHOD(void, RunAction, (const Json::Value&), (override));
  MOCK_METHOD(webrtc::RTCError, ReleaseLocalMedia, (), (override));
  MOCK_METHOD(webrtc::RTCError, DisconnectPeerTransport, (), (override));
};

Json::Value Args(const Json::Value& data) {
  Json::Value args(Json::arrayValue);
  args.append(data);
  return args;
}

Json::Value RoomInformationMessage() {
  Json::Value data;
  data["id"] = "room-1";
  Json::Value p1;
  p1["peerId"] = "p1";
  p1["creator"] = true;
  Json::Value p2;
  p2["peerId"] = "p2";
  p2["creator"] = false;
  data["users"].append(p1);
  data["users"].append(p2);
  return data;
}

class RoomProtocolTest : public ::testing::Test {
 protected:
  RoomProtocolTest() : queue_(CreateManualTaskQueue()) {
    auto socket = std::make_unique<NiceMock<MockSignalingSocket>>();
    socket_ = socket.get();
    ON_CALL(*socket_, IsConnected()).WillByDefault(Return(true));
    ON_CALL(*socket_, Emit(_, _, _)).WillByDefault(Return(true));
    channel_ = std::make_unique<SignalingChannel>(queue_.get(), std::move(socket));
    EXPECT_TRUE(channel_->Initialize(SignalingReconnectOptions()).ok());
    ON_CALL(roster_delegate_, room_information()).WillByDefault(ReturnRef(room_));
    roster_ = std::make_unique<RosterManager>(queue_.get(), &roster_delegate_);
    ON_CALL(delegate_, LocalPeerId()).WillByDefault(Return("p2"));
    ON_CALL(delegate_, ReleaseLocalMedia()).WillByDefault(Return(webrtc::RTCError::OK()));
    ON_CALL(delegate_, DisconnectPeerTransport()).WillByDefault(Return(webrtc::RTCError::OK()));
    room_protocol_ = std::make_unique<RoomProtocol>(queue_.get(), channel_.get(), roster_.get(),
                                                    &bus_, &delegate_);
    EXPECT_TRUE(room_protocol_->Listen().ok());
    bus_.Subscribe([this](const SessionNotification& n) { events_.push_back(n); });
  }

  void Deliver(const std::string& event, const Json::Value& data) {
    channel_->OnEvent(event, Args(data));
  }

  ManualTaskQueuePtr queue_;
  NiceMock<MockSignalingSocket>* socket_;
  std::unique_ptr<SignalingChannel> channel_;
  RoomInformation room_;
  NiceMock<MockRosterDelegate> roster_delegate_;
  std::unique_ptr<RosterManager> roster_;
  EventBus bus_;
  NiceMock<MockRoomProtocolDelegate> delegate_;
  std::unique_ptr<RoomProtocol> room_protocol_;
  std::vector<SessionNotification> events_;
};

TEST_F(RoomProtocolTest, RoomInformationDerivesLocalCreatorFlag) {
  EXPECT_CALL(delegate_, SetLocalCreator(false));
  Deliver("room-information", RoomInformationMessage());
  EXPECT_EQ(room_protocol_->room_id(), "room-1");
  ASSERT_EQ(room_protocol_->information().users.size(), 2u);
  EXPECT_TRUE(room_protocol_->information().users[0].creator);
}

TEST_F(RoomProtocolTest, RoomInformationWithoutCreatorKeepsLocalFlag) {
  EXPECT_CALL(delegate_, SetLocalCreator(_)).Times(0);
  Json::Value data;
  data["id"] = "room-1";
  Json::Value self;
  self["peerId"] = "p2";
  self["name"] = "Bob";
  data["users"].append(self);
  Deliver("room-information", data);
  ASSERT_EQ(room_protocol_->information().users.size(), 1u);
  EXPECT_FALSE(room_protocol_->information().users[0].creator_known);
}

TEST_F(RoomProtocolTest, RoomInformationAcceptsRoomCreatorSpelling) {
  EXPECT_CALL(delegate_, SetLocalCreator(true));
  Json::Value data;
  data["roomId"] = "room-2";
  Json::Value self;
  self["peerJsId"] = "p2";
  self["roomCreator"] = true;
  data["users"].append(self);
  Deliver("room-information", data);
  EXPECT_EQ(room_protocol_->room_id(), "room-2");
}

TEST_F(RoomProtocolTest, ListenRegistersOnce) {
  EXPECT_TRUE(room_protocol_->Listen().ok());
  EXPECT_CALL(delegate_, RunAction(_)).Times(1);
  Json::Value action;
  action["name"] = "chat";
  Deliver("run-action", action);
}

TEST_F(RoomProtocolTest, UserConnectedEstablishesConnectionAndNotifies) {
  Json::Value data;
  data["peerId"] = "p3";
  EXPECT_CALL(delegate_, ConnectToNewUser(data));
  Deliver("user-connected", data);
  ASSERT_EQ(events_.size(), 1u);
  EXPECT_EQ(events_[0].event, SessionEvent::kUserJoined);
  EXPECT_EQ(events_[0].detail["peerId"].asString(), "p3");
}

TEST_F(RoomProtocolTest, UserLeftRemovesFromRoster) {
  auto media = std::make_shared<NiceMock<MockMediaConnection>>("p4");
  auto data = std::make_shared<NiceMock<MockDataConnection>>("p4");
  ASSERT_TRUE(roster_->Add(media, data).ok());
  Json::Value message;
  message["peerJsId"] = "p4";
  Deliver("user-disconnected", message);
  EXPECT_EQ(roster_->size(), 0u);
  // A duplicate delivery is harmless.
  Deliver("user-left-room", message);
  ASSERT_EQ(events_.size(), 2u);
  EXPECT_EQ(events_[1].name, "onRoomLeft");
}

TEST_F(RoomProtocolTest, RepeatedAdmissionRequestsNotifyEveryTime) {
  Json::Value request;
  request["peerId"] = "p9";
  request["name"] = "Eve";
  Deliver("admit-user-to-join", request);
  Deliver("admit-user-to-join", request);
  EXPECT_EQ(roster_->waiting_list().size(), 1u);
  ASSERT_EQ(events_.size(), 2u);
  EXPECT_EQ(events_[0].event, SessionEvent::kAdmissionRequest);
  EXPECT_EQ(events_[1].event, SessionEvent::kAdmissionRequest);
  EXPECT_EQ(events_[1].detail["name"].asString(), "Eve");

  Deliver("remove-user-from-waiting-list", request);
  EXPECT_TRUE(roster_->waiting_list().empty());
  EXPECT_EQ(events_.back().event, SessionEvent::kAdmissionCancel);
}

TEST_F(RoomProtocolTest, TerminalRoomNotifications) {
  Deliver("room-id-invalid", Json::Value(Json::objectValue));
  Deliver("you-are-ban", Json::Value(Json::objectValue));
  Deliver("info-room-data", Json::Value(Json::objectValue));
  ASSERT_EQ(events_.size(), 2u);
  EXPECT_EQ(events_[0].event, SessionEvent::kRoomInvalid);
  EXPECT_EQ(events_[1].event, SessionEvent::kRoomBanned);
  EXPECT_TRUE(IsTerminalSessionEvent(events_[1].event));
}

TEST_F(RoomProtocolTest, JoinSendsImmediatelyWhenConnected) {
  Json::Value args;
  EXPECT_CALL(*socket_, Emit("join-room", _, _)).WillOnce([&](const std::string&,
                                                              const Json::Value& a,
                                                              SignalingSocket::AckCallback) {
    args = a;
    return true;
  });
  Json::Value user;
  user["name"] = "Bob";
  EXPECT_TRUE(room_protocol_->Join("room-1", user).ok());
  EXPECT_EQ(args[0].asString(), "room-1");
  EXPECT_EQ(args[1]["peerId"].asString(), "p2");
  EXPECT_EQ(args[1]["name"].asString(), "Bob");
}

TEST_F(RoomProtocolTest, JoinIsQueuedUntilConnected) {
  ON_CALL(*socket_, IsConnected()).WillByDefault(Return(false));
  EXPECT_CALL(*socket_, Emit("join-room", _, _)).Times(0);
  EXPECT_TRUE(room_protocol_->Join("room-1", Json::Value()).ok());
  ::testing::Mock::VerifyAndClearExpectations(socket_);

  EXPECT_CALL(*socket_, Emit("join-room", _, _)).WillOnce(Return(true));
  channel_->OnConnect();
}

TEST_F(RoomProtocolTest, LeftRequiresJoinedRoom) {
  EXPECT_EQ(room_protocol_->Left(Json::Value()).type(), webrtc::RTCErrorType::INVALID_STATE);
}

TEST_F(RoomProtocolTest, LeftRunsEveryStepAndReportsFirstFailure) {
  Deliver("room-information", RoomInformationMessage());
  EXPECT_CALL(delegate_, ReleaseLocalMedia())
      .WillOnce(Return(webrtc::RTCError(webrtc::RTCErrorType::INTERNAL_ERROR, "device stuck")));
  EXPECT_CALL(delegate_, DisconnectPeerTransport())
      .WillOnce(Return(webrtc::RTCError(webrtc::RTCErrorType::NETWORK_ERROR, "gone")));
  EXPECT_CALL(roster_delegate_, StopScreenShare());
  SignalingSocket::AckCallback ack;
  EXPECT_CALL(*socket_, Emit("left-room", _, _))
      .WillOnce([&](const std::string&, const Json::Value&, SignalingSocket::AckCallback a) {
        ack = std::move(a);
        return true;
      });

  webrtc::RTCError error = room_protocol_->Left(Json::Value());
  EXPECT_EQ(error.type(), webrtc::RTCErrorType::INTERNAL_ERROR);
  EXPECT_FALSE(room_protocol_->joined());

  // The channel closes only after the server acknowledged.
  EXPECT_CALL(*socket_, Close()).Times(1);
  ASSERT_TRUE(ack);
  ack(Json::Value(Json::arrayValue));
  queue_->RunPending();
  EXPECT_FALSE(channel_->initialized());
}

TEST_F(RoomProtocolTest, LeftClosesChannelWhenNotificationFails) {
  Deliver("room-information", RoomInformationMessage());
  EXPECT_CALL(*socket_, Emit("left-room", _, _)).WillOnce(Return(false));
  EXPECT_CALL(*socket_, Close());
  EXPECT_EQ(room_protocol_->Left(Json::Value()).type(), webrtc::RTCErrorType::NETWORK_ERROR);
}

TEST_F(RoomProtocolTest, PeerHandlersLastWriteWins) {
  int first = 0;
  int second = 0;
  room_protocol_->On(kPeerDataChannel, "wave", [&](const Json::Value&) { first++; });
  room_protocol_->On(kPeerDataChannel, "wave", [&](const Json::Value&) { second++; });
  EXPECT_TRUE(room_protocol_->Dispatch(kPeerDataChannel, "wave", Json::Value()));
  EXPECT_FALSE(room_protocol_->Dispatch(kPeerDataChannel, "unknown", Json::Value()));
  EXPECT_EQ(first, 0);
  EXPECT_EQ(second, 1);
}

}  // namespace
