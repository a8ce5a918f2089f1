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

#include "screen_share.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "pc/media_stream.h"

#include "manual_task_queue.h"
#include "mock_huddle.h"
#include "screen_record.h"

namespace {

using ::testing::_;
using ::testing::ByMove;
using ::testing::DoAll;
using ::testing::Eq;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::ReturnRef;
using ::testing::SaveArg;
using webrtc::TimeDelta;

class ScreenShareTest : public ::testing::Test {
 protected:
  ScreenShareTest() : queue_(CreateManualTaskQueue()) {
    ON_CALL(delegate_, room_information()).WillByDefault(ReturnRef(room_));
    roster_ = std::make_unique<RosterManager>(queue_.get(), &delegate_);
    options_.connection_delay_ms = 10000;
    share_ = std::make_unique<ScreenShare>(queue_.get(), &factory_, options_, &bus_,
                                           roster_.get(), &devices_, &renderer_,
                                           []() { return std::string("local"); });
    bus_.Subscribe(SessionEvent::kScreenShareDisplay, [this](const SessionNotification& n) {
      display_.push_back(n.detail["status"].asBool());
    });
  }

  NiceMock<MockDataConnection>* AddPeer(const std::string& peer_id) {
    medias_.push_back(std::make_shared<NiceMock<MockMediaConnection>>(peer_id));
    datas_.push_back(std::make_shared<NiceMock<MockDataConnection>>(peer_id));
    EXPECT_TRUE(roster_->Add(medias_.back(), datas_.back()).ok());
    return datas_.back().get();
  }

  NiceMock<MockPeerSessionProvider>* ExpectProvider() {
    auto provider = std::make_unique<NiceMock<MockPeerSessionProvider>>();
    NiceMock<MockPeerSessionProvider>* raw = provider.get();
    EXPECT_CALL(factory_, Create("token")).WillOnce(Return(ByMove(std::move(provider))));
    return raw;
  }

  void StartShare() {
    share_->Start(webrtc::MediaStream::Create("screen"), "token",
                  [this](webrtc::RTCError error) {
                    start_calls_++;
                    start_result_ = std::move(error);
                  });
  }

  ManualTaskQueuePtr queue_;
  RoomInformation room_;
  NiceMock<MockRosterDelegate> delegate_;
  std::unique_ptr<RosterManager> roster_;
  EventBus bus_;
  PeerOptions options_;
  MockPeerSessionProviderFactory factory_;
  NiceMock<MockMediaDevices> devices_;
  NiceMock<MockStreamRenderer> renderer_;
  std::unique_ptr<ScreenShare> share_;
  std::vector<std::shared_ptr<NiceMock<MockMediaConnection>>> medias_;
  std::vector<std::shared_ptr<NiceMock<MockDataConnection>>> datas_;
  std::vector<bool> display_;
  int start_calls_ = 0;
  webrtc::RTCError start_result_ = webrtc::RTCError::OK();
};

TEST_F(ScreenShareTest, StartCallsEveryPeerOnceWelcomed) {
  AddPeer("p1");
  AddPeer("p2");
  NiceMock<MockPeerSessionProvider>* provider = ExpectProvider();
  Json::Value metadata;
  EXPECT_CALL(*provider, Call("p1", _, _))
      .WillOnce(DoAll(SaveArg<2>(&metadata),
                      Return(std::make_shared<NiceMock<MockMediaConnection>>("p1"))));
  EXPECT_CALL(*provider, Call("p2", _, _))
      .WillOnce(Return(std::make_shared<NiceMock<MockMediaConnection>>("p2")));

  StartShare();
  EXPECT_TRUE(share_->sharing());
  EXPECT_EQ(display_, std::vector<bool>({true}));
  provider->observer()->OnOpen("share-id");
  provider->observer()->OnServerMessage("welcome", Json::Value());

  EXPECT_EQ(start_calls_, 1);
  EXPECT_TRUE(start_result_.ok());
  EXPECT_EQ(metadata["type"].asString(), "screen-sharing");
  EXPECT_EQ(metadata["peerId"].asString(), "local");
  EXPECT_EQ(metadata["sharePeerId"].asString(), "share-id");
}

TEST_F(ScreenShareTest, UsersConnectingWhileSharingAreCalled) {
  NiceMock<MockPeerSessionProvider>* provider = ExpectProvider();
  StartShare();
  provider->observer()->OnOpen("share-id");
  provider->observer()->OnServerMessage("welcome", Json::Value());

  EXPECT_CALL(*provider, Call("p3", _, _))
      .WillOnce(Return(std::make_shared<NiceMock<MockMediaConnection>>("p3")));
  Json::Value user;
  user["peerId"] = "p3";
  bus_.Publish(SessionEvent::kUserConnected, user);
}

TEST_F(ScreenShareTest, HandshakeTimeoutEndsTheShare) {
  ExpectProvider();
  StartShare();
  queue_->AdvanceTime(TimeDelta::Seconds(11));
  EXPECT_EQ(start_calls_, 1);
  EXPECT_EQ(start_result_.type(), webrtc::RTCErrorType::NETWORK_ERROR);
  EXPECT_FALSE(share_->sharing());
  EXPECT_EQ(display_, std::vector<bool>({true, false}));
}

TEST_F(ScreenShareTest, LostServerLinkDuringHandshakeStopsAfterCallbacksReturn) {
  NiceMock<MockPeerSessionProvider>* provider = ExpectProvider();
  StartShare();
  EXPECT_CALL(*provider, Destroy()).Times(0);
  // The provider reports a closed socket as an error followed by a
  // disconnect, both from the same call stack.
  provider->observer()->OnError("network", "socket closed");
  ASSERT_NE(provider->observer(), nullptr);
  provider->observer()->OnDisconnected();
  EXPECT_EQ(start_calls_, 1);
  EXPECT_EQ(start_result_.type(), webrtc::RTCErrorType::INTERNAL_ERROR);
  EXPECT_TRUE(share_->sharing());
  ::testing::Mock::VerifyAndClearExpectations(provider);

  EXPECT_CALL(*provider, Destroy());
  EXPECT_CALL(devices_, StopDisplayMedia());
  queue_->RunPending();
  EXPECT_FALSE(share_->sharing());
  EXPECT_EQ(display_, std::vector<bool>({true, false}));
}

TEST_F(ScreenShareTest, StopWhenIdleOnlyPublishes) {
  NiceMock<MockDataConnection>* data = AddPeer("p1");
  EXPECT_CALL(*data, Send(_)).Times(0);
  EXPECT_CALL(devices_, StopDisplayMedia()).Times(0);
  share_->Stop();
  EXPECT_EQ(display_, std::vector<bool>({false}));
}

TEST_F(ScreenShareTest, StopTellsPeersAndDestroysTheSession) {
  NiceMock<MockDataConnection>* data = AddPeer("p1");
  NiceMock<MockPeerSessionProvider>* provider = ExpectProvider();
  auto call = std::make_shared<NiceMock<MockMediaConnection>>("p1");
  ON_CALL(*provider, Call(_, _, _)).WillByDefault(Return(call));
  StartShare();
  provider->observer()->OnOpen("share-id");
  provider->observer()->OnServerMessage("welcome", Json::Value());

  Json::Value sent;
  EXPECT_CALL(*data, Send(_)).WillOnce(DoAll(SaveArg<0>(&sent), Return(true)));
  EXPECT_CALL(*call, Close());
  EXPECT_CALL(*provider, Destroy());
  EXPECT_CALL(devices_, StopDisplayMedia());
  share_->Stop();

  EXPECT_EQ(sent["event"].asString(), "screenShare");
  EXPECT_FALSE(sent["status"].asBool());
  EXPECT_EQ(sent["peerId"].asString(), "local");
  EXPECT_FALSE(share_->sharing());
  EXPECT_EQ(share_->share_id(), "");
  EXPECT_EQ(display_, std::vector<bool>({true, false}));
}

TEST_F(ScreenShareTest, IncomingShareIsAnsweredWithoutStream) {
  AddPeer("p1");
  Json::Value metadata;
  metadata["type"] = "screen-sharing";
  metadata["peerId"] = "p1";
  metadata["sharePeerId"] = "p1-share";
  auto call = std::make_shared<NiceMock<MockMediaConnection>>("p1-share", metadata);
  EXPECT_CALL(*call, Answer(Eq(nullptr)));
  share_->HandleIncomingCall(call);

  PeerConnectionEntry* entry = roster_->FindOne(RosterField::kSharePeerId, "p1-share");
  ASSERT_NE(entry, nullptr);
  EXPECT_EQ(entry->peer_id, "p1");
  EXPECT_TRUE(entry->share);
  EXPECT_EQ(entry->share_media, call);

  EXPECT_CALL(renderer_, RenderScreenShare(_));
  call->on_stream(webrtc::MediaStream::Create("remote-screen"));
  EXPECT_EQ(display_, std::vector<bool>({true}));
}

TEST_F(ScreenShareTest, IncomingShareFromUnknownPeerIsClosed) {
  Json::Value metadata;
  metadata["type"] = "screen-sharing";
  metadata["peerId"] = "stranger";
  auto call = std::make_shared<NiceMock<MockMediaConnection>>("stranger-share", metadata);
  EXPECT_CALL(*call, Close());
  EXPECT_CALL(*call, Answer(_)).Times(0);
  share_->HandleIncomingCall(call);
}

TEST_F(ScreenShareTest, RemoteStopClearsTheSharer) {
  AddPeer("p1");
  Json::Value metadata;
  metadata["peerId"] = "p1";
  auto call = std::make_shared<NiceMock<MockMediaConnection>>("p1-share", metadata);
  share_->HandleIncomingCall(call);

  EXPECT_CALL(*call, Close());
  EXPECT_CALL(renderer_, RenderScreenShare(Eq(nullptr)));
  Json::Value message;
  message["event"] = "screenShare";
  message["status"] = false;
  message["peerId"] = "p1";
  share_->HandlePeerMessage("p1", message);
  EXPECT_FALSE(roster_->FindOne("p1")->share);
  EXPECT_EQ(display_, std::vector<bool>({false}));
}

TEST_F(ScreenShareTest, RecordStatusFollowsCreators) {
  ScreenRecordStatus record(&bus_, roster_.get());
  NiceMock<MockDataConnection>* data = AddPeer("p1");
  AddPeer("p2");
  roster_->SetData("p1", RosterField::kIsCreator, true);

  std::vector<Json::Value> changes;
  bus_.Subscribe(SessionEvent::kScreenRecordStateChange,
                 [&changes](const SessionNotification& n) { changes.push_back(n.detail); });

  Json::Value message;
  message["event"] = "recordScreen";
  message["record"] = true;
  record.HandlePeerMessage("p2", message);
  EXPECT_FALSE(record.IsRecordingScreen());
  record.HandlePeerMessage("p1", message);
  EXPECT_TRUE(record.IsRecordingScreen());
  record.HandlePeerMessage("unknown", message);
  ASSERT_EQ(changes.size(), 2u);
  EXPECT_EQ(changes[1]["peerId"].asString(), "p1");

  Json::Value sent;
  EXPECT_CALL(*data, Send(_)).WillOnce(DoAll(SaveArg<0>(&sent), Return(true)));
  record.SetRecordState(true);
  EXPECT_TRUE(record.recording());
  EXPECT_EQ(sent["event"].asString(), "recordScreen");
  EXPECT_TRUE(sent["record"].asBool());
  EXPECT_EQ(changes.size(), 3u);
}

TEST_F(ScreenShareTest, RecordStatusDropsMistypedFlag) {
  ScreenRecordStatus record(&bus_, roster_.get());
  AddPeer("p1");
  roster_->SetData("p1", RosterField::kIsCreator, true);
  int changes = 0;
  bus_.Subscribe(SessionEvent::kScreenRecordStateChange,
                 [&changes](const SessionNotification&) { changes++; });

  Json::Value message;
  message["event"] = "recordScreen";
  message["record"] = "yes";
  record.HandlePeerMessage("p1", message);
  message["record"] = 1;
  record.HandlePeerMessage("p1", message);
  EXPECT_FALSE(roster_->FindOne("p1")->record);
  EXPECT_FALSE(record.IsRecordingScreen());
  EXPECT_EQ(changes, 0);
}

TEST_F(ScreenShareTest, MistypedStopMessageKeepsTheSharer) {
  AddPeer("p1");
  Json::Value metadata;
  metadata["peerId"] = "p1";
  auto call = std::make_shared<NiceMock<MockMediaConnection>>("p1-share", metadata);
  share_->HandleIncomingCall(call);

  EXPECT_CALL(*call, Close()).Times(0);
  Json::Value message;
  message["event"] = "screenShare";
  message["status"] = "false";
  share_->HandlePeerMessage("p1", message);
  EXPECT_TRUE(roster_->FindOne("p1")->share);
  EXPECT_TRUE(display_.empty());
  ::testing::Mock::VerifyAndClearExpectations(call.get());
}

}  // namespace
