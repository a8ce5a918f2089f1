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

#include "wsock.h"

#include <gtest/gtest.h>

namespace {

std::string ServerFrame(uint8_t first_byte, const std::string& payload) {
  std::string frame;
  frame.push_back(static_cast<char>(first_byte));
  frame.push_back(static_cast<char>(payload.size()));
  return frame + payload;
}

TEST(WebSocketFrameReaderTest, WaitsForCompleteFrame) {
  WebSocketFrameReader reader;
  std::string frame = ServerFrame(0x81, "hello");
  reader.append(frame.data(), 3);
  EXPECT_TRUE(reader.drain().empty());
  reader.append(frame.data() + 3, frame.size() - 3);
  auto frames = reader.drain();
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0].type, WebSocketFrameReader::Frame::Type::kText);
  EXPECT_EQ(frames[0].payload, "hello");
  EXPECT_EQ(reader.buffered(), 0u);
}

TEST(WebSocketFrameReaderTest, ReassemblesFragments) {
  WebSocketFrameReader reader;
  std::string bytes = ServerFrame(0x01, "42[\"a\",") + ServerFrame(0x00, "1,") +
                      ServerFrame(0x80, "2]");
  reader.append(bytes.data(), bytes.size());
  auto frames = reader.drain();
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0].payload, "42[\"a\",1,2]");
}

TEST(WebSocketFrameReaderTest, SurfacesControlFrames) {
  WebSocketFrameReader reader;
  std::string bytes = ServerFrame(0x89, "hb") + ServerFrame(0x88, "");
  reader.append(bytes.data(), bytes.size());
  auto frames = reader.drain();
  ASSERT_EQ(frames.size(), 2u);
  EXPECT_EQ(frames[0].type, WebSocketFrameReader::Frame::Type::kPing);
  EXPECT_EQ(frames[0].payload, "hb");
  EXPECT_EQ(frames[1].type, WebSocketFrameReader::Frame::Type::kClose);
}

TEST(WebSocketFrameReaderTest, RejectsOversizedLength) {
  WebSocketFrameReader reader;
  std::string bytes = ServerFrame(0x81, "ok");
  bytes.push_back(static_cast<char>(0x81));
  bytes.push_back(static_cast<char>(127));
  bytes.append(8, static_cast<char>(0xFF));
  bytes.append("tail");
  reader.append(bytes.data(), bytes.size());
  auto frames = reader.drain();
  ASSERT_EQ(frames.size(), 2u);
  EXPECT_EQ(frames[0].payload, "ok");
  EXPECT_EQ(frames[1].type, WebSocketFrameReader::Frame::Type::kError);
  EXPECT_EQ(reader.buffered(), 0u);
}

TEST(WebSocketFrameReaderTest, WaitsForLargeFrameWithinLimit) {
  WebSocketFrameReader reader;
  std::string header;
  header.push_back(static_cast<char>(0x81));
  header.push_back(static_cast<char>(127));
  const uint64_t length = kMaxWebSocketPayload;
  for (int shift = 56; shift >= 0; shift -= 8) {
    header.push_back(static_cast<char>((length >> shift) & 0xFF));
  }
  reader.append(header.data(), header.size());
  EXPECT_TRUE(reader.drain().empty());
  EXPECT_EQ(reader.buffered(), header.size());
}

TEST(WebSocketFrameTest, ClientFramesAreMaskedAndDecodable) {
  std::string payload(300, 'x');
  std::string frame = EncodeWebSocketFrame(0x1, payload);
  EXPECT_EQ(static_cast<uint8_t>(frame[0]), 0x81);
  EXPECT_EQ(static_cast<uint8_t>(frame[1]), 0x80 | 126);
  WebSocketFrameReader reader;
  reader.append(frame.data(), frame.size());
  auto frames = reader.drain();
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0].payload, payload);
}

TEST(WebSocketClientTest, Base64) {
  EXPECT_EQ(WebSocketClient::base64_encode("huddle"), "aHVkZGxl");
  EXPECT_EQ(WebSocketClient::base64_encode("ab"), "YWI=");
  EXPECT_EQ(WebSocketClient::generate_websocket_key().size(), 24u);
}

}  // namespace
