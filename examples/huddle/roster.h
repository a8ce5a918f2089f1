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

#ifndef WEBRTC_HUDDLE_ROSTER_H_
#define WEBRTC_HUDDLE_ROSTER_H_

#include <memory>
#include <string>
#include <vector>

#include <json/json.h>

#include "api/rtc_error.h"
#include "api/scoped_refptr.h"
#include "api/task_queue/pending_task_safety_flag.h"
#include "api/task_queue/task_queue_base.h"

#include "peer_session.h"

struct RoomMember {
  std::string peer_id;
  std::string name;
  bool creator = false;
  // The payload carried a creator flag.
  bool creator_known = false;
};

struct RoomInformation {
  std::string id;
  std::vector<RoomMember> users;

  const RoomMember* FindMember(const std::string& peer_id) const;
};

// Parses a room-information payload. Accepts "peerId" or the older
// "peerJsId", and "creator" or "roomCreator".
RoomInformation ParseRoomInformation(const Json::Value& data);

// Peer id carried by a control or peer message, "peerId" or "peerJsId".
std::string PeerIdOf(const Json::Value& data);

struct MediaTrackState {
  bool cam_mute = false;
  bool mic_mute = false;
  bool share = false;
  bool record = false;
};

struct WaitingListEntry {
  std::string peer_id;
  Json::Value request;
};

struct PeerConnectionEntry {
  std::string peer_id;
  std::shared_ptr<MediaConnection> media;
  std::shared_ptr<DataConnection> data;
  std::shared_ptr<MediaConnection> share_media;
  std::string share_peer_id;
  std::string name;
  bool is_creator = false;
  bool cam_mute = true;
  bool mic_mute = true;
  bool share = false;
  bool record = false;
  MediaStreamRef stream;
  bool active = false;
};

enum class RosterField {
  kPeerId,
  kSharePeerId,
  kName,
  kIsCreator,
  kShare,
  kRecord,
  kActive,
};

// Session services the roster relies on.
class RosterDelegate {
 public:
  virtual const RoomInformation& room_information() const = 0;
  virtual MediaTrackState local_media_state() const = 0;
  virtual void RenderRemoteStream(const std::string& peer_id, MediaStreamRef stream) = 0;
  virtual void StopScreenShare() = 0;

 protected:
  virtual ~RosterDelegate() = default;
};

// Connected peers and the admission waiting list.
class RosterManager {
 public:
  RosterManager(webrtc::TaskQueueBase* task_queue, RosterDelegate* delegate);
  ~RosterManager();

  RosterManager(const RosterManager&) = delete;
  RosterManager& operator=(const RosterManager&) = delete;

  // Adding a peer that is already present succeeds without changes.
  webrtc::RTCError Add(std::shared_ptr<MediaConnection> media,
                       std::shared_ptr<DataConnection> data,
                       const Json::Value& join_data = Json::Value());
  void Remove(const std::string& peer_id);
  void CloseAll();

  // Re-routes every current entry's stream to rendering. Removals schedule
  // one settle pass for after the current task; calling it directly is
  // also allowed.
  void Settle();
  bool settle_pending() const { return settle_pending_; }

  PeerConnectionEntry* FindOne(const std::string& peer_id) const {
    return FindOne(RosterField::kPeerId, Json::Value(peer_id));
  }
  PeerConnectionEntry* FindOne(RosterField field, const Json::Value& value) const;
  std::vector<PeerConnectionEntry*> Find(RosterField field, const Json::Value& value) const;

  // Sets one field of the entry matching |peer_id| on |key|.
  bool SetData(const std::string& peer_id,
               RosterField field,
               const Json::Value& value,
               RosterField key = RosterField::kPeerId);

  // Sends |message| on every open data sub-connection.
  void Broadcast(const Json::Value& message);

  const std::vector<std::unique_ptr<PeerConnectionEntry>>& connections() const {
    return connections_;
  }
  size_t size() const { return connections_.size(); }

  bool AddToWaitingList(WaitingListEntry entry);
  void RemoveFromWaitingList(size_t index);
  void RemoveFromWaitingListByPeerId(const std::string& peer_id);
  const std::vector<WaitingListEntry>& waiting_list() const { return waiting_list_; }

 private:
  void CloseEntry(PeerConnectionEntry& entry);

  webrtc::TaskQueueBase* const task_queue_;
  RosterDelegate* const delegate_;
  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> safety_;
  std::vector<std::unique_ptr<PeerConnectionEntry>> connections_;
  std::vector<WaitingListEntry> waiting_list_;
  bool settle_pending_ = false;
};

// Local mute flags in the muteMedia peer message form.
Json::Value MuteMediaMessage(const MediaTrackState& state);

#endif  // WEBRTC_HUDDLE_ROSTER_H_
