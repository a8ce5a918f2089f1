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

#include "peerjs_provider.h"

#include <gtest/gtest.h>

namespace {

TEST(PeerJsProviderTest, MapsServerErrorsToProviderErrorTypes) {
  EXPECT_EQ(PeerJsErrorType("ERROR"), "server-error");
  EXPECT_EQ(PeerJsErrorType("ID-TAKEN"), "unavailable-id");
  EXPECT_EQ(PeerJsErrorType("INVALID-KEY"), "invalid-key");
  EXPECT_EQ(PeerJsErrorType("OPEN"), "");
  EXPECT_EQ(PeerJsErrorType("welcome"), "");
}

TEST(PeerJsProviderTest, BuildsSocketPath) {
  PeerOptions options;
  options.path = "/myapp";
  options.key = "peerjs";
  EXPECT_EQ(BuildPeerJsPath(options, "abc", "t0k"),
            "/myapp/peerjs?key=peerjs&id=abc&token=t0k");
}

TEST(PeerJsProviderTest, EncodesTokenInSocketPath) {
  PeerOptions options;
  EXPECT_EQ(BuildPeerJsPath(options, "id1", "a b/c"),
            "/peerjs?key=peerjs&id=id1&token=a%20b%2Fc");
}

TEST(PeerJsProviderTest, EmptyPathBecomesRoot) {
  PeerOptions options;
  options.path = "";
  EXPECT_EQ(BuildPeerJsPath(options, "x", ""), "/peerjs?key=peerjs&id=x&token=");
}

}  // namespace
