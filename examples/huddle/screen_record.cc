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

#include "screen_record.h"

#include "option.h"

ScreenRecordStatus::ScreenRecordStatus(EventBus* bus, RosterManager* roster)
    : bus_(bus), roster_(roster) {}

void ScreenRecordStatus::SetRecordState(bool record) {
  record_ = record;
  APP_LOG(AS_INFO) << "Screen recording " << (record ? "started" : "stopped");
  PublishState(record, std::string());
  Json::Value message(Json::objectValue);
  message["event"] = "recordScreen";
  message["record"] = record;
  roster_->Broadcast(message);
}

void ScreenRecordStatus::HandlePeerMessage(const std::string& peer_id,
                                           const Json::Value& message) {
  bool record = false;
  if (!ReadJsonBool(message, "record", false, &record)) {
    APP_LOG(AS_WARNING) << "Dropping recordScreen from " << peer_id << ": record is not a bool";
    return;
  }
  if (!roster_->SetData(peer_id, RosterField::kRecord, record)) {
    APP_LOG(AS_VERBOSE) << "recordScreen from unknown peer " << peer_id;
    return;
  }
  PublishState(record, peer_id);
}

bool ScreenRecordStatus::IsRecordingScreen() const {
  for (const auto& entry : roster_->connections()) {
    if (entry->is_creator && entry->record) {
      return true;
    }
  }
  return false;
}

void ScreenRecordStatus::PublishState(bool status, const std::string& peer_id) {
  Json::Value detail(Json::objectValue);
  detail["status"] = status;
  if (!peer_id.empty()) {
    detail["peerId"] = peer_id;
  }
  bus_->Publish(SessionEvent::kScreenRecordStateChange, detail);
}
