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

#include "option.h"

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace {

Json::Value ParseJson(const std::string& text) {
  Json::Value value;
  Json::CharReaderBuilder builder;
  std::string errors;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  EXPECT_TRUE(reader->parse(text.data(), text.data() + text.size(), &value, &errors)) << errors;
  return value;
}

TEST(OptionTest, DefaultsMatchDocumentedPolicy) {
  Options opts = parseOptions({"--room=r1"});
  EXPECT_TRUE(opts.signaling.enabled);
  EXPECT_EQ(opts.signaling.attempts, 5);
  EXPECT_EQ(opts.signaling.delay_ms, 1000);
  EXPECT_EQ(opts.signaling.max_delay_ms, 5000);
  EXPECT_DOUBLE_EQ(opts.signaling.backoff_factor, 1.5);
  EXPECT_EQ(opts.peer.connection_delay_ms, 10000);
  EXPECT_EQ(opts.peer.max_reconnect_attempts, 5);
  EXPECT_EQ(opts.peer.key, "peerjs");
  EXPECT_EQ(opts.media.fps, 30);
  EXPECT_EQ(opts.media.resolution, "vga");
  EXPECT_EQ(opts.room, "r1");
}

TEST(OptionTest, ParsesValuesAndFlags) {
  Options opts = parseOptions({"--signaling_url='wss://meet.example.com'", "--token=abc",
                               "--user_name=alice", "--peer_host=peer.example.com",
                               "--peer_port=9000", "--no-secure", "--no-reconnection",
                               "--reconnection_attempts=0", "--backoff_factor=2",
                               "--resolution=hd", "--portrait", "--cam_mute", "--debug"});
  EXPECT_EQ(opts.signaling_url, "wss://meet.example.com");
  EXPECT_EQ(opts.token, "abc");
  EXPECT_EQ(opts.user_name, "alice");
  EXPECT_EQ(opts.peer.host, "peer.example.com");
  EXPECT_EQ(opts.peer.port, 9000);
  EXPECT_FALSE(opts.peer.secure);
  EXPECT_FALSE(opts.signaling.enabled);
  EXPECT_EQ(opts.signaling.attempts, 0);
  EXPECT_DOUBLE_EQ(opts.signaling.backoff_factor, 2.0);
  EXPECT_EQ(opts.media.resolution, "hd");
  EXPECT_TRUE(opts.media.portrait);
  EXPECT_TRUE(opts.media.cam_mute);
  EXPECT_FALSE(opts.media.mic_mute);
  EXPECT_TRUE(opts.debug);
}

TEST(OptionTest, InvalidNumbersKeepDefaults) {
  Options opts = parseOptions({"--peer_port=abc", "--fps=0"});
  EXPECT_EQ(opts.peer.port, 443);
  EXPECT_EQ(opts.media.fps, 30);
}

TEST(OptionTest, HelpStopsParsing) {
  Options opts = parseOptions({"--help", "--room=ignored"});
  EXPECT_TRUE(opts.help);
  EXPECT_FALSE(opts.help_string.empty());
  EXPECT_TRUE(opts.room.empty());
}

TEST(OptionTest, GeneratesUserNameWhenMissing) {
  Options opts = parseOptions({"--room=r1"});
  EXPECT_FALSE(opts.user_name.empty());
  EXPECT_NE(opts.user_name.find('-'), std::string::npos);
}

TEST(OptionTest, AppliesNestedConfig) {
  Options opts;
  applyConfigJson(ParseJson(R"({
      "room": "daily",
      "signaling": {"attempts": -1, "delay": 250, "backoffFactor": 3},
      "peer": {"host": "p.example.com", "reconnectDelay": 2000},
      "media": {"fps": 15, "micMute": true}
  })"), opts);
  EXPECT_EQ(opts.room, "daily");
  EXPECT_EQ(opts.signaling.attempts, -1);
  EXPECT_EQ(opts.signaling.delay_ms, 250);
  EXPECT_DOUBLE_EQ(opts.signaling.backoff_factor, 3.0);
  EXPECT_EQ(opts.peer.host, "p.example.com");
  EXPECT_EQ(opts.peer.reconnect_delay_ms, 2000);
  EXPECT_EQ(opts.media.fps, 15);
  EXPECT_TRUE(opts.media.mic_mute);
}

TEST(OptionTest, IgnoresMistypedConfigMembers) {
  Options opts;
  applyConfigJson(ParseJson(R"({"room": 5, "peer": {"port": "x"}, "media": []})"), opts);
  EXPECT_TRUE(opts.room.empty());
  EXPECT_EQ(opts.peer.port, 443);
  EXPECT_EQ(opts.media.fps, 30);
}

TEST(OptionTest, CommandLineOverridesConfigFile) {
  std::string path = testing::TempDir() + "huddle_option_test.json";
  FILE* fp = fopen(path.c_str(), "wb");
  ASSERT_NE(fp, nullptr);
  const std::string contents = R"({"room": "from-file", "token": "file-token"})";
  fwrite(contents.data(), 1, contents.size(), fp);
  fclose(fp);

  Options opts = parseOptions({"--config", path, "--room=from-args"});
  EXPECT_EQ(opts.config_path, path);
  EXPECT_EQ(opts.room, "from-args");
  EXPECT_EQ(opts.token, "file-token");
  remove(path.c_str());
}

TEST(OptionTest, ResolutionWidths) {
  EXPECT_EQ(HuddleResolutionWidth("qvga"), 320);
  EXPECT_EQ(HuddleResolutionWidth("hd"), 1280);
  EXPECT_EQ(HuddleResolutionWidth("fhd"), 1920);
  EXPECT_EQ(HuddleResolutionWidth("8k"), 640);
}

TEST(OptionTest, RandomIdsUseLowercaseAlphabet) {
  std::string id = HuddleCreateRandomId(12);
  ASSERT_EQ(id.size(), 12u);
  for (char c : id) {
    EXPECT_TRUE((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) << c;
  }
  EXPECT_NE(HuddleCreateRandomId(), HuddleCreateRandomId());
}

}  // namespace
