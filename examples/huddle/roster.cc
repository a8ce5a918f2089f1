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

#include <algorithm>
#include <utility>

#include "option.h"

namespace {

Json::Value FieldValue(const PeerConnectionEntry& entry, RosterField field) {
  switch (field) {
    case RosterField::kPeerId: return entry.peer_id;
    case RosterField::kSharePeerId: return entry.share_peer_id;
    case RosterField::kName: return entry.name;
    case RosterField::kIsCreator: return entry.is_creator;
    case RosterField::kShare: return entry.share;
    case RosterField::kRecord: return entry.record;
    case RosterField::kActive: return entry.active;
  }
  return Json::Value();
}

}  // namespace

const RoomMember* RoomInformation::FindMember(const std::string& peer_id) const {
  for (const auto& member : users) {
    if (member.peer_id == peer_id) return &member;
  }
  return nullptr;
}

RoomInformation ParseRoomInformation(const Json::Value& data) {
  RoomInformation info;
  if (!data.isObject()) {
    return info;
  }
  info.id = JsonString(data, "id", JsonString(data, "roomId"));
  const Json::Value& users = data["users"];
  if (!users.isArray()) {
    return info;
  }
  for (const auto& user : users) {
    if (!user.isObject()) continue;
    RoomMember member;
    member.peer_id = PeerIdOf(user);
    member.name = JsonString(user, "name");
    const Json::Value& creator = user.isMember("creator") ? user["creator"] : user["roomCreator"];
    member.creator_known = creator.isBool();
    member.creator = creator.isBool() && creator.asBool();
    info.users.push_back(std::move(member));
  }
  return info;
}

std::string PeerIdOf(const Json::Value& data) {
  if (!data.isObject()) {
    return std::string();
  }
  if (data["peerId"].isString()) {
    return data["peerId"].asString();
  }
  return JsonString(data, "peerJsId");
}

Json::Value MuteMediaMessage(const MediaTrackState& state) {
  Json::Value message;
  message["event"] = "muteMedia";
  message["camMute"] = state.cam_mute;
  message["micMute"] = state.mic_mute;
  return message;
}

RosterManager::RosterManager(webrtc::TaskQueueBase* task_queue,
                             RosterDelegate* delegate)
    : task_queue_(task_queue),
      delegate_(delegate),
      safety_(webrtc::PendingTaskSafetyFlag::CreateDetached()) {}

RosterManager::~RosterManager() {
  safety_->SetNotAlive();
  for (auto& entry : connections_) {
    CloseEntry(*entry);
  }
}

webrtc::RTCError RosterManager::Add(std::shared_ptr<MediaConnection> media,
                                    std::shared_ptr<DataConnection> data,
                                    const Json::Value& join_data) {
  if (!media || !data) {
    return webrtc::RTCError(webrtc::RTCErrorType::INVALID_PARAMETER,
                            "Both sub-connections are required");
  }
  const std::string peer_id = media->peer();
  if (FindOne(peer_id)) {
    APP_LOG(AS_VERBOSE) << "Peer " << peer_id << " already in roster";
    return webrtc::RTCError::OK();
  }

  auto entry = std::make_unique<PeerConnectionEntry>();
  entry->peer_id = peer_id;
  entry->media = media;
  entry->data = data;
  if (const RoomMember* member = delegate_->room_information().FindMember(peer_id)) {
    entry->name = member->name;
    entry->is_creator = member->creator;
  }
  if (join_data.isObject()) {
    if (join_data["name"].isString()) entry->name = join_data["name"].asString();
    const Json::Value& creator =
        join_data.isMember("isCreator") ? join_data["isCreator"] : join_data["roomCreator"];
    if (creator.isBool()) entry->is_creator = creator.asBool();
  }

  std::weak_ptr<DataConnection> weak_data = data;
  data->SetOnOpen([this, flag = safety_, weak_data]() {
    if (!flag->alive()) return;
    if (auto connection = weak_data.lock()) {
      connection->Send(MuteMediaMessage(delegate_->local_media_state()));
    }
  });
  media->SetOnStream([this, flag = safety_, peer_id](MediaStreamRef stream) {
    if (!flag->alive()) return;
    PeerConnectionEntry* found = FindOne(peer_id);
    if (!found) return;
    found->stream = stream;
    found->active = true;
    delegate_->RenderRemoteStream(peer_id, stream);
  });
  media->SetOnError([peer_id](webrtc::RTCError error) {
    APP_LOG(AS_WARNING) << "Media connection to " << peer_id
                        << " failed: " << error.message();
  });

  APP_LOG(AS_INFO) << "Roster add " << peer_id << " (" << entry->name << ")";
  connections_.push_back(std::move(entry));
  return webrtc::RTCError::OK();
}

void RosterManager::Remove(const std::string& peer_id) {
  auto it = std::find_if(connections_.begin(), connections_.end(),
                         [&](const std::unique_ptr<PeerConnectionEntry>& entry) {
                           return entry->peer_id == peer_id;
                         });
  if (it == connections_.end()) {
    return;
  }
  std::unique_ptr<PeerConnectionEntry> entry = std::move(*it);
  connections_.erase(it);
  CloseEntry(*entry);
  APP_LOG(AS_INFO) << "Roster remove " << peer_id;

  if (!settle_pending_) {
    settle_pending_ = true;
    task_queue_->PostTask(webrtc::SafeTask(safety_, [this]() {
      if (settle_pending_) Settle();
    }));
  }
}

void RosterManager::Settle() {
  settle_pending_ = false;
  for (const auto& entry : connections_) {
    if (entry->stream) {
      delegate_->RenderRemoteStream(entry->peer_id, entry->stream);
    }
  }
}

void RosterManager::CloseAll() {
  delegate_->StopScreenShare();
  std::vector<std::unique_ptr<PeerConnectionEntry>> entries;
  entries.swap(connections_);
  for (auto& entry : entries) {
    CloseEntry(*entry);
  }
  waiting_list_.clear();
  settle_pending_ = false;
}

void RosterManager::CloseEntry(PeerConnectionEntry& entry) {
  if (entry.media) {
    entry.media->SetOnStream(nullptr);
    entry.media->Close();
    entry.media = nullptr;
  }
  if (entry.data) {
    entry.data->SetOnOpen(nullptr);
    entry.data->Close();
    entry.data = nullptr;
  }
  if (entry.share_media) {
    entry.share_media->Close();
    entry.share_media = nullptr;
  }
}

PeerConnectionEntry* RosterManager::FindOne(RosterField field,
                                            const Json::Value& value) const {
  for (const auto& entry : connections_) {
    if (FieldValue(*entry, field) == value) return entry.get();
  }
  return nullptr;
}

std::vector<PeerConnectionEntry*> RosterManager::Find(RosterField field,
                                                      const Json::Value& value) const {
  std::vector<PeerConnectionEntry*> found;
  for (const auto& entry : connections_) {
    if (FieldValue(*entry, field) == value) found.push_back(entry.get());
  }
  return found;
}

bool RosterManager::SetData(const std::string& peer_id,
                            RosterField field,
                            const Json::Value& value,
                            RosterField key) {
  PeerConnectionEntry* entry = FindOne(key, Json::Value(peer_id));
  if (!entry) {
    return false;
  }
  const bool string_field =
      field == RosterField::kSharePeerId || field == RosterField::kName;
  if (field != RosterField::kPeerId && (string_field ? !value.isString() : !value.isBool())) {
    APP_LOG(AS_WARNING) << "Mistyped roster value for " << peer_id;
    return false;
  }
  switch (field) {
    case RosterField::kPeerId:
      APP_LOG(AS_WARNING) << "Peer id is immutable";
      return false;
    case RosterField::kSharePeerId: entry->share_peer_id = value.asString(); break;
    case RosterField::kName: entry->name = value.asString(); break;
    case RosterField::kIsCreator: entry->is_creator = value.asBool(); break;
    case RosterField::kShare: entry->share = value.asBool(); break;
    case RosterField::kRecord: entry->record = value.asBool(); break;
    case RosterField::kActive: entry->active = value.asBool(); break;
  }
  return true;
}

void RosterManager::Broadcast(const Json::Value& message) {
  for (const auto& entry : connections_) {
    if (!entry->data || !entry->data->open()) {
      APP_LOG(AS_VERBOSE) << "Data connection to " << entry->peer_id
                          << " not open, skipping " << JsonString(message, "event");
      continue;
    }
    entry->data->Send(message);
  }
}

bool RosterManager::AddToWaitingList(WaitingListEntry entry) {
  for (const auto& waiting : waiting_list_) {
    if (waiting.peer_id == entry.peer_id) {
      return false;
    }
  }
  waiting_list_.push_back(std::move(entry));
  return true;
}

void RosterManager::RemoveFromWaitingList(size_t index) {
  if (index >= waiting_list_.size()) {
    return;
  }
  waiting_list_.erase(waiting_list_.begin() + index);
}

void RosterManager::RemoveFromWaitingListByPeerId(const std::string& peer_id) {
  waiting_list_.erase(std::remove_if(waiting_list_.begin(), waiting_list_.end(),
                                     [&](const WaitingListEntry& entry) {
                                       return entry.peer_id == peer_id;
                                     }),
                      waiting_list_.end());
}
