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

#ifndef WEBRTC_HUDDLE_SCREEN_SHARE_H_
#define WEBRTC_HUDDLE_SCREEN_SHARE_H_

#include <functional>
#include <map>
#include <memory>
#include <string>

#include <json/json.h>

#include "api/rtc_error.h"
#include "api/scoped_refptr.h"
#include "api/task_queue/pending_task_safety_flag.h"
#include "api/task_queue/task_queue_base.h"

#include "events.h"
#include "media_pipeline.h"
#include "option.h"
#include "peer_session.h"
#include "peer_transport.h"
#include "roster.h"

// Screen sharing over a second provider session. Outgoing shares call every
// roster peer with screen-sharing metadata, incoming ones arrive as side
// channel calls of the main peer transport.
class ScreenShare : public PeerSessionProviderObserver {
 public:
  using LocalIdSource = std::function<std::string()>;

  ScreenShare(webrtc::TaskQueueBase* task_queue,
              PeerSessionProviderFactory* factory,
              const PeerOptions& options,
              EventBus* bus,
              RosterManager* roster,
              MediaDevices* devices,
              StreamRenderer* renderer,
              LocalIdSource local_id);
  ~ScreenShare() override;

  ScreenShare(const ScreenShare&) = delete;
  ScreenShare& operator=(const ScreenShare&) = delete;

  // Shares |stream|. |done| runs once the share session is welcomed and
  // the roster has been called, or with the error that ended the share.
  void Start(MediaStreamRef stream, const std::string& token, CompletionCallback done);
  void Stop();

  // Screen-sharing call from a remote peer.
  void HandleIncomingCall(std::shared_ptr<MediaConnection> call);
  // screenShare peer message.
  void HandlePeerMessage(const std::string& peer_id, const Json::Value& message);

  bool sharing() const { return sharing_; }
  bool ready() const { return handshake_ && handshake_->completed() && provider_; }
  const std::string& share_id() const { return id_; }

  // PeerSessionProviderObserver
  void OnOpen(const std::string& id) override;
  void OnServerMessage(const std::string& type, const Json::Value& message) override;
  void OnCall(std::shared_ptr<MediaConnection> call) override;
  void OnConnection(std::shared_ptr<DataConnection> connection) override;
  void OnDisconnected() override;
  void OnError(const std::string& type, const std::string& message) override;

 private:
  void CallPeer(const std::string& peer_id);
  void PublishDisplay(bool status, const std::string& peer_id);

  webrtc::TaskQueueBase* const task_queue_;
  PeerSessionProviderFactory* const factory_;
  const PeerOptions options_;
  EventBus* const bus_;
  RosterManager* const roster_;
  MediaDevices* const devices_;
  StreamRenderer* const renderer_;
  const LocalIdSource local_id_;
  EventBus::SubscriptionId user_connected_ = 0;

  std::unique_ptr<PeerSessionProvider> provider_;
  std::unique_ptr<ProviderHandshake> handshake_;
  std::string id_;
  bool sharing_ = false;
  MediaStreamRef stream_;
  std::map<std::string, std::shared_ptr<MediaConnection>> calls_;
  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> safety_;
};

#endif  // WEBRTC_HUDDLE_SCREEN_SHARE_H_
