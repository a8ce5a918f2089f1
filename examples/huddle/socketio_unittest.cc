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

#include "socketio.h"

#include <gtest/gtest.h>

namespace {

TEST(SocketIoCodecTest, EncodesEventWithAckId) {
  SocketIoPacket packet;
  packet.type = SocketIoPacketType::kEvent;
  packet.id = 12;
  packet.data = Json::Value(Json::arrayValue);
  packet.data.append("left-room");
  packet.data.append("room1");
  EXPECT_EQ(EncodeSocketIoPacket(packet), "212[\"left-room\",\"room1\"]");
}

TEST(SocketIoCodecTest, EncodesConnectWithNamespace) {
  SocketIoPacket packet;
  packet.type = SocketIoPacketType::kConnect;
  packet.nsp = "/admin";
  EXPECT_EQ(EncodeSocketIoPacket(packet), "0/admin,");
}

TEST(SocketIoCodecTest, DecodesEvent) {
  auto packet = DecodeSocketIoPacket("2[\"user-connected\",{\"peerId\":\"p3\"}]");
  ASSERT_TRUE(packet.ok());
  EXPECT_EQ(packet.value().type, SocketIoPacketType::kEvent);
  EXPECT_FALSE(packet.value().id.has_value());
  EXPECT_EQ(packet.value().data[0].asString(), "user-connected");
  EXPECT_EQ(packet.value().data[1]["peerId"].asString(), "p3");
}

TEST(SocketIoCodecTest, DecodesAckWithNamespaceAndId) {
  auto packet = DecodeSocketIoPacket("3/chat,7[true]");
  ASSERT_TRUE(packet.ok());
  EXPECT_EQ(packet.value().type, SocketIoPacketType::kAck);
  EXPECT_EQ(packet.value().nsp, "/chat");
  ASSERT_TRUE(packet.value().id.has_value());
  EXPECT_EQ(*packet.value().id, 7);
  EXPECT_TRUE(packet.value().data[0].asBool());
}

TEST(SocketIoCodecTest, DecodesConnectWithoutPayload) {
  auto packet = DecodeSocketIoPacket("0");
  ASSERT_TRUE(packet.ok());
  EXPECT_EQ(packet.value().type, SocketIoPacketType::kConnect);
  EXPECT_TRUE(packet.value().data.isNull());
}

TEST(SocketIoCodecTest, RejectsMalformedInput) {
  EXPECT_EQ(DecodeSocketIoPacket("").error().type(),
            webrtc::RTCErrorType::SYNTAX_ERROR);
  EXPECT_EQ(DecodeSocketIoPacket("2[\"x\",").error().type(),
            webrtc::RTCErrorType::SYNTAX_ERROR);
  EXPECT_EQ(DecodeSocketIoPacket("2{}").error().type(),
            webrtc::RTCErrorType::INVALID_PARAMETER);
  EXPECT_EQ(DecodeSocketIoPacket("5-[\"bin\"]").error().type(),
            webrtc::RTCErrorType::UNSUPPORTED_OPERATION);
}

TEST(SignalingUrlTest, ParsesSchemesAndPorts) {
  auto secure = ParseSignalingUrl("wss://meet.example.com");
  ASSERT_TRUE(secure.ok());
  EXPECT_TRUE(secure.value().secure);
  EXPECT_EQ(secure.value().host, "meet.example.com");
  EXPECT_EQ(secure.value().port, "443");
  EXPECT_EQ(secure.value().path, "/socket.io/");

  auto plain = ParseSignalingUrl("http://127.0.0.1:3000/rtc");
  ASSERT_TRUE(plain.ok());
  EXPECT_FALSE(plain.value().secure);
  EXPECT_EQ(plain.value().port, "3000");
  EXPECT_EQ(plain.value().path, "/rtc/");

  EXPECT_FALSE(ParseSignalingUrl("meet.example.com").ok());
  EXPECT_FALSE(ParseSignalingUrl("ftp://meet.example.com").ok());
}

TEST(SignalingUrlTest, EncodesTokenForQuery) {
  EXPECT_EQ(UrlEncode("a b/c=d"), "a%20b%2Fc%3Dd");
  EXPECT_EQ(UrlEncode("abc-_.~"), "abc-_.~");
}

}  // namespace
