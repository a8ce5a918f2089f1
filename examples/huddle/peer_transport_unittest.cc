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

#include "peer_transport.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "manual_task_queue.h"
#include "mock_huddle.h"

namespace {

using ::testing::_;
using ::testing::ByMove;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::ReturnRef;
using webrtc::TimeDelta;

class PeerTransportTest : public ::testing::Test {
 protected:
  PeerTransportTest() : queue_(CreateManualTaskQueue()) {
    ON_CALL(delegate_, room_information()).WillByDefault(ReturnRef(room_));
    roster_ = std::make_unique<RosterManager>(queue_.get(), &delegate_);
    auto provider = std::make_unique<NiceMock<MockPeerSessionProvider>>();
    provider_ = provider.get();
    ON_CALL(*provider_, disconnected()).WillByDefault(Return(true));
    EXPECT_CALL(factory_, Create("token")).WillOnce(Return(ByMove(std::move(provider))));
    options_.connection_delay_ms = 10000;
    options_.max_reconnect_attempts = 5;
    options_.reconnect_delay_ms = 1000;
    transport_ = std::make_unique<PeerTransport>(queue_.get(), &factory_, options_,
                                                 &bus_, roster_.get());
    bus_.Subscribe(SessionEvent::kPeerConnectionFailed,
                   [this](const SessionNotification& n) {
                     failures_.push_back(n.detail["message"].asString());
                   });
  }

  void Open() {
    transport_->Open("token", [this](webrtc::RTCError error) {
      open_calls_++;
      open_result_ = std::move(error);
    });
  }

  void OpenAndWelcome() {
    Open();
    provider_->observer()->OnOpen("local-id");
    provider_->observer()->OnServerMessage("welcome", Json::Value());
  }

  ManualTaskQueuePtr queue_;
  RoomInformation room_;
  NiceMock<MockRosterDelegate> delegate_;
  std::unique_ptr<RosterManager> roster_;
  EventBus bus_;
  PeerOptions options_;
  MockPeerSessionProviderFactory factory_;
  NiceMock<MockPeerSessionProvider>* provider_;
  std::unique_ptr<PeerTransport> transport_;
  std::vector<std::string> failures_;
  int open_calls_ = 0;
  webrtc::RTCError open_result_ = webrtc::RTCError::OK();
};

TEST_F(PeerTransportTest, ResolvesAfterOpenAndWelcome) {
  Open();
  provider_->observer()->OnOpen("local-id");
  EXPECT_EQ(open_calls_, 0);
  EXPECT_EQ(transport_->GetId(), "");
  provider_->observer()->OnServerMessage("welcome", Json::Value());
  EXPECT_EQ(open_calls_, 1);
  EXPECT_TRUE(open_result_.ok());
  EXPECT_EQ(transport_->GetId(), "local-id");

  // The timeout lost the race and stays silent.
  queue_->AdvanceTime(TimeDelta::Seconds(11));
  EXPECT_EQ(open_calls_, 1);
  EXPECT_TRUE(failures_.empty());
}

TEST_F(PeerTransportTest, WelcomeBeforeOpenDoesNotResolve) {
  Open();
  provider_->observer()->OnServerMessage("welcome", Json::Value());
  EXPECT_EQ(open_calls_, 0);
}

TEST_F(PeerTransportTest, TimeoutRejectsAndPublishesFailure) {
  Open();
  provider_->observer()->OnOpen("local-id");
  queue_->AdvanceTime(TimeDelta::Millis(9999));
  EXPECT_EQ(open_calls_, 0);
  queue_->AdvanceTime(TimeDelta::Millis(1));
  EXPECT_EQ(open_calls_, 1);
  EXPECT_EQ(open_result_.type(), webrtc::RTCErrorType::NETWORK_ERROR);
  ASSERT_EQ(failures_.size(), 1u);
  EXPECT_EQ(failures_[0], "Peer connection timeout");

  // A late welcome does not resolve a second time.
  provider_->observer()->OnServerMessage("welcome", Json::Value());
  EXPECT_EQ(open_calls_, 1);
  EXPECT_EQ(transport_->reconnect_timer()->attempt(), 0);
}

TEST_F(PeerTransportTest, ServerErrorIsFatalBeforeAndAfterReady) {
  Open();
  provider_->observer()->OnError("server-error", "boom");
  EXPECT_EQ(open_calls_, 1);
  EXPECT_EQ(open_result_.type(), webrtc::RTCErrorType::INTERNAL_ERROR);
  ASSERT_EQ(failures_.size(), 1u);

  provider_->observer()->OnError("server-error", "again");
  EXPECT_EQ(failures_.size(), 2u);
  EXPECT_EQ(open_calls_, 1);
}

TEST_F(PeerTransportTest, NonServerErrorsAreNotPublished) {
  OpenAndWelcome();
  provider_->observer()->OnError("network", "lost");
  EXPECT_TRUE(failures_.empty());
}

TEST_F(PeerTransportTest, DisconnectRetriesWithDoublingDelay) {
  OpenAndWelcome();
  EXPECT_CALL(*provider_, Reconnect()).Times(1);
  provider_->observer()->OnDisconnected();
  EXPECT_EQ(queue_->NextTaskDelay(), TimeDelta::Millis(1000));
  queue_->AdvanceTime(TimeDelta::Millis(1000));
  EXPECT_EQ(transport_->reconnect_timer()->attempt(), 1);

  provider_->observer()->OnDisconnected();
  // 1000 * 2 plus jitter below one second.
  EXPECT_GE(queue_->NextTaskDelay(), TimeDelta::Millis(2000));
  EXPECT_LT(queue_->NextTaskDelay(), TimeDelta::Millis(3000));
}

TEST_F(PeerTransportTest, GivesUpAfterMaxAttempts) {
  OpenAndWelcome();
  for (int i = 0; i < 5; ++i) {
    provider_->observer()->OnDisconnected();
    queue_->AdvanceTime(TimeDelta::Seconds(31));
  }
  EXPECT_TRUE(failures_.empty());
  provider_->observer()->OnDisconnected();
  ASSERT_EQ(failures_.size(), 1u);
  EXPECT_EQ(failures_[0], "Failed to reconnect after 5 attempts");
}

TEST_F(PeerTransportTest, OpenResetsReconnectState) {
  OpenAndWelcome();
  provider_->observer()->OnDisconnected();
  queue_->AdvanceTime(TimeDelta::Seconds(2));
  provider_->observer()->OnDisconnected();
  queue_->AdvanceTime(TimeDelta::Seconds(4));
  EXPECT_EQ(transport_->reconnect_timer()->attempt(), 2);
  provider_->observer()->OnOpen("local-id");
  EXPECT_EQ(transport_->reconnect_timer()->attempt(), 0);
  provider_->observer()->OnDisconnected();
  EXPECT_EQ(queue_->NextTaskDelay(), TimeDelta::Millis(1000));
}

TEST_F(PeerTransportTest, UntaggedCallJoinsRosterAndIsAnswered) {
  OpenAndWelcome();
  auto call = std::make_shared<NiceMock<MockMediaConnection>>("p3");
  auto data = std::make_shared<NiceMock<MockDataConnection>>("p3");
  EXPECT_CALL(*provider_, Connect("p3")).WillOnce(Return(data));
  EXPECT_CALL(*call, Answer(_));
  provider_->observer()->OnCall(call);
  EXPECT_NE(roster_->FindOne("p3"), nullptr);
}

TEST_F(PeerTransportTest, DuplicateCallIsClosedInsteadOfAnswered) {
  OpenAndWelcome();
  auto first_call = std::make_shared<NiceMock<MockMediaConnection>>("p3");
  auto first_data = std::make_shared<NiceMock<MockDataConnection>>("p3");
  EXPECT_CALL(*provider_, Connect("p3")).WillOnce(Return(first_data));
  provider_->observer()->OnCall(first_call);
  ASSERT_EQ(roster_->size(), 1u);

  auto second_call = std::make_shared<NiceMock<MockMediaConnection>>("p3");
  auto second_data = std::make_shared<NiceMock<MockDataConnection>>("p3");
  EXPECT_CALL(*provider_, Connect("p3")).WillOnce(Return(second_data));
  EXPECT_CALL(*second_call, Answer(_)).Times(0);
  EXPECT_CALL(*second_call, Close());
  EXPECT_CALL(*second_data, Close());
  provider_->observer()->OnCall(second_call);
  EXPECT_EQ(roster_->size(), 1u);
  EXPECT_EQ(roster_->FindOne("p3")->media, first_call);
}

TEST_F(PeerTransportTest, TaggedCallGoesToSideChannel) {
  OpenAndWelcome();
  Json::Value metadata;
  metadata["type"] = kScreenSharingCallType;
  auto call = std::make_shared<NiceMock<MockMediaConnection>>("share-p4", metadata);
  std::shared_ptr<MediaConnection> handed;
  transport_->SetSideChannelHandler(
      [&](std::shared_ptr<MediaConnection> c) { handed = c; });
  EXPECT_CALL(*provider_, Connect(_)).Times(0);
  EXPECT_CALL(*call, Answer(_)).Times(0);
  provider_->observer()->OnCall(call);
  EXPECT_EQ(handed, call);
  EXPECT_EQ(roster_->size(), 0u);
}

TEST_F(PeerTransportTest, InboundDataIsDispatchedWithSender) {
  OpenAndWelcome();
  std::string sender;
  std::string event;
  transport_->SetPeerDataHandler([&](const std::string& peer, const Json::Value& m) {
    sender = peer;
    event = m["event"].asString();
  });
  auto connection = std::make_shared<NiceMock<MockDataConnection>>("p5");
  provider_->observer()->OnConnection(connection);
  Json::Value message;
  message["event"] = "muteMedia";
  connection->on_data(message);
  EXPECT_EQ(sender, "p5");
  EXPECT_EQ(event, "muteMedia");
}

TEST_F(PeerTransportTest, EstablishConnectionAddsToRoster) {
  EXPECT_EQ(transport_->EstablishConnectionWithUser("p6", Json::Value()).type(),
            webrtc::RTCErrorType::INVALID_STATE);
  OpenAndWelcome();
  EXPECT_CALL(*provider_, Call("p6", _, _))
      .WillOnce(Return(std::make_shared<NiceMock<MockMediaConnection>>("p6")));
  EXPECT_CALL(*provider_, Connect("p6"))
      .WillOnce(Return(std::make_shared<NiceMock<MockDataConnection>>("p6")));
  EXPECT_TRUE(transport_->EstablishConnectionWithUser("p6", Json::Value()).ok());
  EXPECT_EQ(roster_->size(), 1u);
}

TEST_F(PeerTransportTest, DisconnectStopsReconnecting) {
  OpenAndWelcome();
  EXPECT_CALL(*provider_, Destroy());
  transport_->Disconnect();
  EXPECT_FALSE(transport_->reconnect_timer()->enabled());
  EXPECT_EQ(transport_->GetId(), "");
}

}  // namespace
