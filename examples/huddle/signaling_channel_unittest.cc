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

#include "signaling_channel.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "manual_task_queue.h"
#include "mock_huddle.h"

namespace {

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using webrtc::TimeDelta;

class SignalingChannelTest : public ::testing::Test {
 protected:
  SignalingChannelTest() : queue_(CreateManualTaskQueue()) {
    auto socket = std::make_unique<NiceMock<MockSignalingSocket>>();
    socket_ = socket.get();
    ON_CALL(*socket_, Emit(_, _, _)).WillByDefault(Return(true));
    channel_ = std::make_unique<SignalingChannel>(queue_.get(), std::move(socket));
  }

  void Initialize(int attempts = 5) {
    SignalingReconnectOptions options;
    options.attempts = attempts;
    ASSERT_TRUE(channel_->Initialize(options).ok());
  }

  ManualTaskQueuePtr queue_;
  NiceMock<MockSignalingSocket>* socket_;
  std::unique_ptr<SignalingChannel> channel_;
};

TEST_F(SignalingChannelTest, EmitAndListenFailBeforeInitialize) {
  EXPECT_CALL(*socket_, Emit(_, _, _)).Times(0);
  webrtc::RTCError emit = channel_->Emit("join-room", Json::arrayValue);
  EXPECT_EQ(emit.type(), webrtc::RTCErrorType::INVALID_STATE);
  webrtc::RTCError listen = channel_->Listen("room-information", [](const Json::Value&) {});
  EXPECT_EQ(listen.type(), webrtc::RTCErrorType::INVALID_STATE);
}

TEST_F(SignalingChannelTest, CompletesOnlyAfterReadySignal) {
  Initialize();
  EXPECT_CALL(*socket_, Open("secret"));
  bool done = false;
  webrtc::RTCError result = webrtc::RTCError(webrtc::RTCErrorType::INTERNAL_ERROR);
  channel_->SetConnection(true, "secret", [&](webrtc::RTCError error) {
    done = true;
    result = std::move(error);
  });
  channel_->OnConnect();
  EXPECT_FALSE(done);
  channel_->OnEvent(kConnectionReadyEvent, Json::arrayValue);
  EXPECT_TRUE(done);
  EXPECT_TRUE(result.ok());
}

TEST_F(SignalingChannelTest, ErrorBeforeReadyRejects) {
  Initialize();
  webrtc::RTCError result = webrtc::RTCError::OK();
  int calls = 0;
  channel_->SetConnection(true, "t", [&](webrtc::RTCError error) {
    calls++;
    result = std::move(error);
  });
  channel_->OnConnect();
  channel_->OnDisconnect("transport close");
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(result.type(), webrtc::RTCErrorType::NETWORK_ERROR);
  // A late ready signal does not complete twice.
  channel_->OnEvent(kConnectionReadyEvent, Json::arrayValue);
  EXPECT_EQ(calls, 1);
}

TEST_F(SignalingChannelTest, ConnectErrorsBackOffExponentially) {
  Initialize(0);
  channel_->SetConnection(true, "t", nullptr);
  const int64_t expected[] = {1000, 1500, 2250, 3375, 5000, 5000};
  for (int64_t delay_ms : expected) {
    channel_->OnConnectError("refused");
    EXPECT_EQ(channel_->reconnect_timer()->last_delay(), TimeDelta::Millis(delay_ms));
    EXPECT_EQ(queue_->NextTaskDelay(), TimeDelta::Millis(delay_ms));
    EXPECT_CALL(*socket_, Open("t"));
    queue_->AdvanceTime(TimeDelta::Millis(delay_ms));
    ::testing::Mock::VerifyAndClearExpectations(socket_);
  }
}

TEST_F(SignalingChannelTest, ReportsFailureOnceAttemptsRunOut) {
  Initialize();
  std::vector<webrtc::RTCError> failures;
  channel_->SetOnGaveUp(
      [&failures](webrtc::RTCError error) { failures.push_back(std::move(error)); });
  channel_->SetConnection(true, "t", nullptr);
  const int64_t expected[] = {1000, 1500, 2250, 3375, 5000};
  for (int64_t delay_ms : expected) {
    channel_->OnConnectError("refused");
    EXPECT_EQ(channel_->reconnect_timer()->last_delay(), TimeDelta::Millis(delay_ms));
    EXPECT_CALL(*socket_, Open("t"));
    queue_->AdvanceTime(TimeDelta::Millis(delay_ms));
    ::testing::Mock::VerifyAndClearExpectations(socket_);
  }
  EXPECT_TRUE(failures.empty());

  // The fifth retry failed too.
  EXPECT_CALL(*socket_, Open(_)).Times(0);
  channel_->OnConnectError("refused");
  ASSERT_EQ(failures.size(), 1u);
  EXPECT_EQ(failures[0].type(), webrtc::RTCErrorType::NETWORK_ERROR);
  EXPECT_FALSE(channel_->reconnect_timer()->pending());

  channel_->OnDisconnect("transport close");
  queue_->AdvanceTime(TimeDelta::Seconds(30));
  EXPECT_EQ(failures.size(), 1u);
}

TEST_F(SignalingChannelTest, ConnectResetsAttemptCount) {
  Initialize();
  channel_->SetConnection(true, "t", nullptr);
  channel_->OnConnectError("refused");
  queue_->AdvanceTime(TimeDelta::Seconds(1));
  channel_->OnConnectError("refused");
  EXPECT_EQ(channel_->reconnect_timer()->attempt(), 2);
  queue_->AdvanceTime(TimeDelta::Seconds(2));
  channel_->OnConnect();
  EXPECT_EQ(channel_->reconnect_timer()->attempt(), 0);
  channel_->OnDisconnect("ping timeout");
  EXPECT_EQ(channel_->reconnect_timer()->last_delay(), TimeDelta::Millis(1000));
}

TEST_F(SignalingChannelTest, StopsAfterMaximumAttempts) {
  Initialize(2);
  channel_->SetConnection(true, "t", nullptr);
  EXPECT_CALL(*socket_, Open("t")).Times(2);
  for (int i = 0; i < 4; ++i) {
    channel_->OnConnectError("refused");
    queue_->AdvanceTime(TimeDelta::Seconds(10));
  }
  EXPECT_FALSE(channel_->reconnect_timer()->pending());
}

TEST_F(SignalingChannelTest, VoluntaryDisconnectIsNotRetried) {
  Initialize();
  channel_->SetConnection(true, "t", nullptr);
  channel_->OnConnectError("refused");
  EXPECT_TRUE(channel_->reconnect_timer()->pending());
  EXPECT_CALL(*socket_, Close());
  channel_->SetConnection(false, "", nullptr);
  EXPECT_FALSE(channel_->reconnect_timer()->pending());
  EXPECT_CALL(*socket_, Open(_)).Times(0);
  channel_->OnDisconnect(kClientDisconnectReason);
  queue_->AdvanceTime(TimeDelta::Seconds(30));
}

TEST_F(SignalingChannelTest, ClientDisconnectReasonIsNotRetried) {
  Initialize();
  channel_->SetConnection(true, "t", nullptr);
  channel_->OnConnect();
  channel_->OnDisconnect(kClientDisconnectReason);
  EXPECT_FALSE(channel_->reconnect_timer()->pending());
}

TEST_F(SignalingChannelTest, DispatchesEventsToEveryListener) {
  Initialize();
  int first = 0;
  int second = 0;
  ASSERT_TRUE(channel_->Listen("user-connected", [&](const Json::Value& args) {
    EXPECT_EQ(args[0]["peerId"].asString(), "p3");
    first++;
  }).ok());
  ASSERT_TRUE(channel_->Listen("user-connected", [&](const Json::Value&) { second++; }).ok());
  Json::Value args(Json::arrayValue);
  Json::Value data;
  data["peerId"] = "p3";
  args.append(data);
  channel_->OnEvent("user-connected", args);
  EXPECT_EQ(first, 1);
  EXPECT_EQ(second, 1);
}

TEST_F(SignalingChannelTest, OnceConnectedRunsOnNextConnectOnly) {
  Initialize();
  int runs = 0;
  channel_->OnceConnected([&] { runs++; });
  channel_->OnConnect();
  channel_->OnConnect();
  EXPECT_EQ(runs, 1);
}

}  // namespace
