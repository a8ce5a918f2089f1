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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "manual_task_queue.h"
#include "mock_huddle.h"

namespace {

using ::testing::_;
using ::testing::ByMove;
using ::testing::NiceMock;
using ::testing::Return;

class SessionTest : public ::testing::Test {
 protected:
  SessionTest() : queue_(CreateManualTaskQueue()) {
    auto socket = std::make_unique<NiceMock<MockSignalingSocket>>();
    socket_ = socket.get();
    ON_CALL(*socket_, IsConnected()).WillByDefault(Return(true));
    ON_CALL(*socket_, Emit(_, _, _)).WillByDefault(Return(true));

    HuddleSession::Dependencies dependencies;
    dependencies.task_queue = queue_.get();
    dependencies.socket = std::move(socket);
    dependencies.provider_factory = &factory_;
    dependencies.devices = &devices_;
    dependencies.renderer = &renderer_;
    dependencies.face_detector = &detector_;
    dependencies.body_segmenter = &segmenter_;
    session_ = std::make_unique<HuddleSession>(std::move(dependencies));
    session_->bus().Subscribe([this](const SessionNotification& n) { events_.push_back(n); });
  }

  void InitializeAndOpenTransport(const std::string& local_id) {
    ASSERT_TRUE(session_->Initialize(options_).ok());
    auto provider = std::make_unique<NiceMock<MockPeerSessionProvider>>();
    provider_ = provider.get();
    EXPECT_CALL(factory_, Create("token")).WillOnce(Return(ByMove(std::move(provider))));
    bool opened = false;
    session_->InitialPeerTransport("token", [&opened](webrtc::RTCError error) {
      opened = error.ok();
    });
    provider_->observer()->OnOpen(local_id);
    provider_->observer()->OnServerMessage("welcome", Json::Value());
    ASSERT_TRUE(opened);
  }

  void Deliver(const std::string& event, const Json::Value& data) {
    Json::Value args(Json::arrayValue);
    args.append(data);
    session_->signaling()->OnEvent(event, args);
  }

  void JoinRoomWithMembers() {
    Json::Value info;
    info["id"] = "room-1";
    Json::Value p1;
    p1["peerId"] = "p1";
    p1["creator"] = true;
    Json::Value p2;
    p2["peerId"] = "p2";
    info["users"].append(p1);
    info["users"].append(p2);
    Deliver("room-information", info);
  }

  int Count(const std::string& name) const {
    int count = 0;
    for (const SessionNotification& n : events_) {
      if (n.name == name) ++count;
    }
    return count;
  }

  ManualTaskQueuePtr queue_;
  NiceMock<MockSignalingSocket>* socket_;
  MockPeerSessionProviderFactory factory_;
  NiceMock<MockPeerSessionProvider>* provider_ = nullptr;
  NiceMock<MockMediaDevices> devices_;
  NiceMock<MockStreamRenderer> renderer_;
  NiceMock<MockFaceDetector> detector_;
  NiceMock<MockBodySegmenter> segmenter_;
  Options options_;
  std::unique_ptr<HuddleSession> session_;
  std::vector<SessionNotification> events_;
};

TEST_F(SessionTest, InitializePublishesAppReadyOnce) {
  EXPECT_TRUE(session_->Initialize(options_).ok());
  EXPECT_EQ(Count("onAppReady"), 1);
  EXPECT_FALSE(session_->Initialize(options_).ok());
}

TEST_F(SessionTest, OperationsNeedInitialize) {
  EXPECT_EQ(session_->JoinRoom("room-1", Json::Value()).type(),
            webrtc::RTCErrorType::INVALID_STATE);
  webrtc::RTCError result = webrtc::RTCError::OK();
  session_->OpenConnection("token", [&result](webrtc::RTCError error) { result = error; });
  EXPECT_EQ(result.type(), webrtc::RTCErrorType::INVALID_STATE);
}

TEST_F(SessionTest, SignalingThatGivesUpIsTerminal) {
  options_.signaling.attempts = 1;
  ASSERT_TRUE(session_->Initialize(options_).ok());
  session_->OpenConnection("token", nullptr);
  session_->signaling()->OnConnectError("refused");
  queue_->AdvanceTime(webrtc::TimeDelta::Seconds(5));
  EXPECT_EQ(Count("onSignalingFailed"), 0);
  session_->signaling()->OnConnectError("refused");
  ASSERT_EQ(Count("onSignalingFailed"), 1);
  EXPECT_TRUE(IsTerminalSessionEvent(events_.back().event));
  EXPECT_FALSE(events_.back().detail["message"].asString().empty());
}

TEST_F(SessionTest, PeerTransportReadySetsLocalId) {
  InitializeAndOpenTransport("p2");
  EXPECT_EQ(session_->LocalPeerId(), "p2");
  EXPECT_EQ(session_->user_settings().peer_id, "p2");
  ASSERT_EQ(Count("onPeerTransportReady"), 1);
}

TEST_F(SessionTest, UserConnectedJoinsTheRoster) {
  InitializeAndOpenTransport("p2");
  auto media = std::make_shared<NiceMock<MockMediaConnection>>("p3");
  auto data = std::make_shared<NiceMock<MockDataConnection>>("p3");
  EXPECT_CALL(*provider_, Call("p3", _, _)).WillOnce(Return(media));
  EXPECT_CALL(*provider_, Connect("p3")).WillOnce(Return(data));

  Json::Value user;
  user["peerId"] = "p3";
  Deliver("user-connected", user);

  ASSERT_NE(session_->roster()->FindOne("p3"), nullptr);
  EXPECT_EQ(Count("onUserConnected"), 1);
  ASSERT_EQ(Count("onUserJoined"), 1);
  EXPECT_EQ(events_.back().name, "onUserJoined");
  EXPECT_EQ(events_.back().detail["peerId"].asString(), "p3");
}

TEST_F(SessionTest, MuteMediaFromPeerUpdatesItsEntry) {
  InitializeAndOpenTransport("p2");
  auto media = std::make_shared<NiceMock<MockMediaConnection>>("p3");
  ON_CALL(*provider_, Call(_, _, _)).WillByDefault(Return(media));
  ON_CALL(*provider_, Connect(_))
      .WillByDefault(Return(std::make_shared<NiceMock<MockDataConnection>>("p3")));
  Json::Value user;
  user["peerId"] = "p3";
  Deliver("user-connected", user);

  auto inbound = std::make_shared<NiceMock<MockDataConnection>>("p3");
  provider_->observer()->OnConnection(inbound);
  Json::Value message;
  message["event"] = "muteMedia";
  message["camMute"] = false;
  message["micMute"] = true;
  inbound->on_data(message);

  PeerConnectionEntry* entry = session_->roster()->FindOne("p3");
  ASSERT_NE(entry, nullptr);
  EXPECT_FALSE(entry->cam_mute);
  EXPECT_TRUE(entry->mic_mute);
  EXPECT_EQ(Count("onMediaStreamReset"), 1);
}

TEST_F(SessionTest, MistypedPeerFlagsAreDropped) {
  InitializeAndOpenTransport("p2");
  auto media = std::make_shared<NiceMock<MockMediaConnection>>("p3");
  ON_CALL(*provider_, Call(_, _, _)).WillByDefault(Return(media));
  ON_CALL(*provider_, Connect(_))
      .WillByDefault(Return(std::make_shared<NiceMock<MockDataConnection>>("p3")));
  Json::Value user;
  user["peerId"] = "p3";
  Deliver("user-connected", user);
  const size_t events_before = events_.size();

  auto inbound = std::make_shared<NiceMock<MockDataConnection>>("p3");
  provider_->observer()->OnConnection(inbound);
  Json::Value mute;
  mute["event"] = "muteMedia";
  mute["camMute"] = "true";
  inbound->on_data(mute);
  mute["camMute"] = false;
  mute["micMute"] = Json::Value(Json::arrayValue);
  inbound->on_data(mute);

  Json::Value record;
  record["event"] = "recordScreen";
  record["record"] = "yes";
  inbound->on_data(record);

  Json::Value share;
  share["event"] = "screenShare";
  share["status"] = Json::Value(Json::objectValue);
  inbound->on_data(share);

  PeerConnectionEntry* entry = session_->roster()->FindOne("p3");
  ASSERT_NE(entry, nullptr);
  EXPECT_TRUE(entry->cam_mute);
  EXPECT_TRUE(entry->mic_mute);
  EXPECT_FALSE(entry->record);
  EXPECT_EQ(events_.size(), events_before);
}

TEST_F(SessionTest, SideChannelCallWithScalarMetadataIsRejected) {
  InitializeAndOpenTransport("p2");
  auto call = std::make_shared<NiceMock<MockMediaConnection>>("p5", Json::Value("screen-sharing"));
  EXPECT_CALL(*call, Answer(_)).Times(0);
  EXPECT_CALL(*call, Close());
  provider_->observer()->OnCall(call);
  EXPECT_EQ(session_->roster()->FindOne("p5"), nullptr);
}

TEST_F(SessionTest, PeerMessagesReachRegisteredSubscribers) {
  InitializeAndOpenTransport("p2");
  Json::Value received;
  session_->On("reaction", [&received](const Json::Value& data) { received = data; });

  auto inbound = std::make_shared<NiceMock<MockDataConnection>>("p4");
  provider_->observer()->OnConnection(inbound);
  Json::Value message;
  message["event"] = "reaction";
  message["emoji"] = "wave";
  inbound->on_data(message);
  EXPECT_EQ(received["emoji"].asString(), "wave");
  EXPECT_EQ(received["peerId"].asString(), "p4");

  // Unregistered events are dropped.
  message["event"] = "unknown";
  inbound->on_data(message);
}

TEST_F(SessionTest, BanOfLocalUserLeavesTheRoom) {
  InitializeAndOpenTransport("p2");
  JoinRoomWithMembers();
  EXPECT_FALSE(session_->user_settings().is_creator);

  std::vector<std::string> notices;
  session_->SetNotifyCallback([&notices](const std::string& title, const std::string&) {
    notices.push_back(title);
  });
  EXPECT_CALL(*socket_, Emit("left-room", _, _)).WillOnce(Return(true));
  EXPECT_CALL(*provider_, Destroy());
  EXPECT_CALL(devices_, Release());

  Json::Value action;
  action["name"] = "ban";
  action["attributes"]["ban"]["peerId"] = "p2";
  action["attributes"]["ban"]["name"] = "Bob";
  Deliver("run-action", action);

  EXPECT_EQ(notices, std::vector<std::string>({"User ban"}));
  EXPECT_EQ(Count("onExitConference"), 1);
  EXPECT_FALSE(session_->room()->joined());
}

TEST_F(SessionTest, BanOfAnotherUserOnlyNotifies) {
  InitializeAndOpenTransport("p1");
  JoinRoomWithMembers();
  EXPECT_TRUE(session_->user_settings().is_creator);

  std::vector<std::string> texts;
  session_->SetNotifyCallback([&texts](const std::string&, const std::string& text) {
    texts.push_back(text);
  });
  EXPECT_CALL(*socket_, Emit("left-room", _, _)).Times(0);

  Json::Value action;
  action["name"] = "ban";
  action["attributes"]["ban"]["peerId"] = "p2";
  action["attributes"]["ban"]["name"] = "Bob";
  Deliver("run-action", action);

  EXPECT_EQ(texts, std::vector<std::string>({"Bob have been banned from this meeting by a moderator."}));
  EXPECT_EQ(Count("onExitConference"), 0);
  EXPECT_TRUE(session_->room()->joined());
}

TEST_F(SessionTest, JoinCarriesLocalPeerId) {
  InitializeAndOpenTransport("p2");
  Json::Value args;
  EXPECT_CALL(*socket_, Emit("join-room", _, _))
      .WillOnce([&args](const std::string&, const Json::Value& sent,
                        SignalingSocket::AckCallback) {
        args = sent;
        return true;
      });
  Json::Value user;
  user["name"] = "Bob";
  EXPECT_TRUE(session_->JoinRoom("room-1", user).ok());
  EXPECT_EQ(args[0].asString(), "room-1");
  EXPECT_EQ(args[1]["peerId"].asString(), "p2");
  EXPECT_EQ(args[1]["name"].asString(), "Bob");
}

TEST_F(SessionTest, ScreenShareCallsFromPeersAreRouted) {
  InitializeAndOpenTransport("p2");
  auto media = std::make_shared<NiceMock<MockMediaConnection>>("p1");
  ON_CALL(*provider_, Call(_, _, _)).WillByDefault(Return(media));
  ON_CALL(*provider_, Connect(_))
      .WillByDefault(Return(std::make_shared<NiceMock<MockDataConnection>>("p1")));
  Json::Value user;
  user["peerId"] = "p1";
  Deliver("user-connected", user);

  Json::Value metadata;
  metadata["type"] = "screen-sharing";
  metadata["peerId"] = "p1";
  metadata["sharePeerId"] = "p1-share";
  auto share = std::make_shared<NiceMock<MockMediaConnection>>("p1-share", metadata);
  EXPECT_CALL(*share, Answer(_));
  provider_->observer()->OnCall(share);
  EXPECT_TRUE(session_->roster()->FindOne("p1")->share);
}

}  // namespace
