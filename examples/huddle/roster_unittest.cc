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

#include "roster.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "pc/media_stream.h"

#include "manual_task_queue.h"
#include "mock_huddle.h"

namespace {

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::ReturnRef;

class RosterManagerTest : public ::testing::Test {
 protected:
  RosterManagerTest() : queue_(CreateManualTaskQueue()) {
    RoomMember member;
    member.peer_id = "p1";
    member.name = "Alice";
    member.creator = true;
    room_.id = "room-1";
    room_.users.push_back(member);
    ON_CALL(delegate_, room_information()).WillByDefault(ReturnRef(room_));
    ON_CALL(delegate_, local_media_state()).WillByDefault(Return(MediaTrackState{true, false}));
    roster_ = std::make_unique<RosterManager>(queue_.get(), &delegate_);
  }

  struct Pair {
    std::shared_ptr<NiceMock<MockMediaConnection>> media;
    std::shared_ptr<NiceMock<MockDataConnection>> data;
  };

  Pair AddPeer(const std::string& peer_id, const Json::Value& join = Json::Value()) {
    Pair pair{std::make_shared<NiceMock<MockMediaConnection>>(peer_id),
              std::make_shared<NiceMock<MockDataConnection>>(peer_id)};
    EXPECT_TRUE(roster_->Add(pair.media, pair.data, join).ok());
    return pair;
  }

  ManualTaskQueuePtr queue_;
  RoomInformation room_;
  NiceMock<MockRosterDelegate> delegate_;
  std::unique_ptr<RosterManager> roster_;
};

TEST_F(RosterManagerTest, AddTakesNameFromRoomInformation) {
  AddPeer("p1");
  PeerConnectionEntry* entry = roster_->FindOne("p1");
  ASSERT_NE(entry, nullptr);
  EXPECT_EQ(entry->name, "Alice");
  EXPECT_TRUE(entry->is_creator);
  EXPECT_TRUE(entry->cam_mute);
  EXPECT_FALSE(entry->active);
}

TEST_F(RosterManagerTest, JoinDataOverridesRoomInformation) {
  Json::Value join;
  join["name"] = "Bob";
  join["isCreator"] = false;
  AddPeer("p1", join);
  EXPECT_EQ(roster_->FindOne("p1")->name, "Bob");
  EXPECT_FALSE(roster_->FindOne("p1")->is_creator);
}

TEST_F(RosterManagerTest, JoinDataAcceptsRoomCreatorSpelling) {
  Json::Value join;
  join["roomCreator"] = true;
  AddPeer("p2", join);
  EXPECT_TRUE(roster_->FindOne("p2")->is_creator);

  Json::Value demoted;
  demoted["roomCreator"] = false;
  AddPeer("p1", demoted);
  EXPECT_FALSE(roster_->FindOne("p1")->is_creator);
}

TEST_F(RosterManagerTest, SetDataRejectsMistypedValues) {
  AddPeer("p1");
  EXPECT_FALSE(roster_->SetData("p1", RosterField::kRecord, "yes"));
  EXPECT_FALSE(roster_->SetData("p1", RosterField::kName, true));
  EXPECT_FALSE(roster_->FindOne("p1")->record);
  EXPECT_EQ(roster_->FindOne("p1")->name, "Alice");
}

TEST_F(RosterManagerTest, AddingSamePeerTwiceKeepsOneEntry) {
  AddPeer("p1");
  AddPeer("p1");
  EXPECT_EQ(roster_->size(), 1u);
}

TEST_F(RosterManagerTest, AddRequiresBothSubConnections) {
  auto media = std::make_shared<NiceMock<MockMediaConnection>>("p1");
  EXPECT_FALSE(roster_->Add(media, nullptr).ok());
  EXPECT_EQ(roster_->size(), 0u);
}

TEST_F(RosterManagerTest, DataOpenSendsLocalMuteState) {
  Pair pair = AddPeer("p1");
  Json::Value sent;
  EXPECT_CALL(*pair.data, Send(_)).WillOnce([&](const Json::Value& message) {
    sent = message;
    return true;
  });
  ASSERT_TRUE(pair.data->on_open);
  pair.data->on_open();
  EXPECT_EQ(sent["event"].asString(), "muteMedia");
  EXPECT_TRUE(sent["camMute"].asBool());
  EXPECT_FALSE(sent["micMute"].asBool());
}

TEST_F(RosterManagerTest, RemoteStreamMarksEntryActive) {
  Pair pair = AddPeer("p1");
  EXPECT_CALL(delegate_, RenderRemoteStream("p1", _));
  ASSERT_TRUE(pair.media->on_stream);
  pair.media->on_stream(MediaStreamRef());
  EXPECT_TRUE(roster_->FindOne("p1")->active);
}

TEST_F(RosterManagerTest, RemoveUnknownPeerIsNoOp) {
  AddPeer("p1");
  roster_->Remove("nobody");
  EXPECT_EQ(roster_->size(), 1u);
  EXPECT_FALSE(roster_->settle_pending());
}

TEST_F(RosterManagerTest, RemoveClosesOnce) {
  Pair pair = AddPeer("p1");
  EXPECT_CALL(*pair.media, Close()).Times(1);
  EXPECT_CALL(*pair.data, Close()).Times(1);
  roster_->Remove("p1");
  roster_->Remove("p1");
  EXPECT_EQ(roster_->size(), 0u);
}

TEST_F(RosterManagerTest, RemovalsCoalesceIntoOneSettle) {
  Pair p1 = AddPeer("p1");
  Pair p2 = AddPeer("p2");
  Pair p3 = AddPeer("p3");
  for (Pair* pair : {&p1, &p2, &p3}) {
    pair->media->on_stream(webrtc::MediaStream::Create(pair->media->peer()));
  }
  ::testing::Mock::VerifyAndClearExpectations(&delegate_);

  EXPECT_CALL(delegate_, RenderRemoteStream("p1", _)).Times(0);
  EXPECT_CALL(delegate_, RenderRemoteStream("p2", _)).Times(0);
  EXPECT_CALL(delegate_, RenderRemoteStream("p3", _)).Times(1);
  roster_->Remove("p1");
  roster_->Remove("p2");
  EXPECT_TRUE(roster_->settle_pending());
  EXPECT_EQ(queue_->pending_tasks(), 1u);
  queue_->RunPending();
  EXPECT_FALSE(roster_->settle_pending());
}

TEST_F(RosterManagerTest, BroadcastSkipsClosedDataConnections) {
  Pair open_pair = AddPeer("p1");
  Pair closed_pair = AddPeer("p2");
  ON_CALL(*closed_pair.data, open()).WillByDefault(Return(false));
  EXPECT_CALL(*open_pair.data, Send(_)).Times(1);
  EXPECT_CALL(*closed_pair.data, Send(_)).Times(0);
  roster_->Broadcast(MuteMediaMessage(MediaTrackState()));
}

TEST_F(RosterManagerTest, FindAndSetDataByField) {
  AddPeer("p1");
  AddPeer("p2");
  EXPECT_TRUE(roster_->SetData("p2", RosterField::kSharePeerId, "share-p2"));
  EXPECT_TRUE(roster_->SetData("share-p2", RosterField::kShare, true, RosterField::kSharePeerId));
  EXPECT_FALSE(roster_->SetData("p2", RosterField::kPeerId, "other"));
  EXPECT_FALSE(roster_->SetData("missing", RosterField::kShare, true));
  PeerConnectionEntry* entry = roster_->FindOne(RosterField::kShare, true);
  ASSERT_NE(entry, nullptr);
  EXPECT_EQ(entry->peer_id, "p2");
  EXPECT_EQ(roster_->Find(RosterField::kShare, false).size(), 1u);
}

TEST_F(RosterManagerTest, WaitingListDeduplicatesByPeer) {
  EXPECT_TRUE(roster_->AddToWaitingList({"p9", Json::Value()}));
  EXPECT_FALSE(roster_->AddToWaitingList({"p9", Json::Value()}));
  EXPECT_TRUE(roster_->AddToWaitingList({"p8", Json::Value()}));
  roster_->RemoveFromWaitingList(5);
  EXPECT_EQ(roster_->waiting_list().size(), 2u);
  roster_->RemoveFromWaitingListByPeerId("p9");
  ASSERT_EQ(roster_->waiting_list().size(), 1u);
  EXPECT_EQ(roster_->waiting_list()[0].peer_id, "p8");
}

TEST_F(RosterManagerTest, CloseAllStopsShareAndClearsEverything) {
  Pair pair = AddPeer("p1");
  roster_->AddToWaitingList({"p9", Json::Value()});
  EXPECT_CALL(delegate_, StopScreenShare());
  EXPECT_CALL(*pair.media, Close());
  roster_->CloseAll();
  EXPECT_EQ(roster_->size(), 0u);
  EXPECT_TRUE(roster_->waiting_list().empty());
}

TEST(RoomInformationTest, AcceptsLegacyFieldNames) {
  Json::Value data;
  data["roomId"] = "r";
  Json::Value user;
  user["peerJsId"] = "p1";
  user["name"] = "A";
  user["roomCreator"] = true;
  data["users"].append(user);
  RoomInformation info = ParseRoomInformation(data);
  EXPECT_EQ(info.id, "r");
  ASSERT_EQ(info.users.size(), 1u);
  EXPECT_EQ(info.users[0].peer_id, "p1");
  EXPECT_TRUE(info.users[0].creator);
  EXPECT_NE(info.FindMember("p1"), nullptr);
  EXPECT_EQ(info.FindMember("p2"), nullptr);
}

}  // namespace
