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

#ifndef WEBRTC_HUDDLE_SCREEN_RECORD_H_
#define WEBRTC_HUDDLE_SCREEN_RECORD_H_

#include <string>

#include <json/json.h>

#include "events.h"
#include "roster.h"

// Recording status shared with the room. Recording itself is done by the
// host.
class ScreenRecordStatus {
 public:
  ScreenRecordStatus(EventBus* bus, RosterManager* roster);

  ScreenRecordStatus(const ScreenRecordStatus&) = delete;
  ScreenRecordStatus& operator=(const ScreenRecordStatus&) = delete;

  // Local recording started or stopped. Tells every peer.
  void SetRecordState(bool record);
  // recordScreen peer message.
  void HandlePeerMessage(const std::string& peer_id, const Json::Value& message);

  // True while a room creator records.
  bool IsRecordingScreen() const;
  bool recording() const { return record_; }

 private:
  void PublishState(bool status, const std::string& peer_id);

  EventBus* const bus_;
  RosterManager* const roster_;
  bool record_ = false;
};

#endif  // WEBRTC_HUDDLE_SCREEN_RECORD_H_
