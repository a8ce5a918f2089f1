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

#ifndef WEBRTC_HUDDLE_PEER_TRANSPORT_H_
#define WEBRTC_HUDDLE_PEER_TRANSPORT_H_

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <json/json.h>

#include "api/rtc_error.h"
#include "api/scoped_refptr.h"
#include "api/task_queue/pending_task_safety_flag.h"
#include "api/task_queue/task_queue_base.h"
#include "api/units/time_delta.h"

#include "backoff.h"
#include "events.h"
#include "option.h"
#include "peer_session.h"
#include "roster.h"

// Server message confirming a provider session.
extern const char kProviderWelcomeMessage[];

// Two phase open of a provider session: the provider reports "open", then
// the server's welcome message arrives. Whichever of success, failure and
// the timeout comes first completes; the others are ignored.
class ProviderHandshake {
 public:
  ProviderHandshake(webrtc::TaskQueueBase* task_queue, webrtc::TimeDelta timeout);
  ~ProviderHandshake();

  ProviderHandshake(const ProviderHandshake&) = delete;
  ProviderHandshake& operator=(const ProviderHandshake&) = delete;

  void Start(CompletionCallback done);
  void OnOpen();
  void OnServerMessage(const std::string& type);
  void Fail(webrtc::RTCError error);
  // Drops a pending completion without running it.
  void Abandon();

  bool pending() const { return static_cast<bool>(done_); }
  bool completed() const { return completed_; }
  bool timed_out() const { return timed_out_; }

 private:
  void Finish(webrtc::RTCError error);

  webrtc::TaskQueueBase* const task_queue_;
  const webrtc::TimeDelta timeout_;
  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> timeout_flag_;
  CompletionCallback done_;
  bool opened_ = false;
  bool completed_ = false;
  bool timed_out_ = false;
};

// Reconnecting peer-to-peer session endpoint of the local user.
class PeerTransport : public PeerSessionProviderObserver {
 public:
  using StreamSource = std::function<MediaStreamRef()>;
  using CallHandler = std::function<void(std::shared_ptr<MediaConnection>)>;
  using PeerDataHandler =
      std::function<void(const std::string& peer_id, const Json::Value& message)>;

  PeerTransport(webrtc::TaskQueueBase* task_queue,
                PeerSessionProviderFactory* factory,
                const PeerOptions& options,
                EventBus* bus,
                RosterManager* roster);
  ~PeerTransport() override;

  PeerTransport(const PeerTransport&) = delete;
  PeerTransport& operator=(const PeerTransport&) = delete;

  // Completes once the provider is open and welcomed, or with an error when
  // the provider fails first or the connection delay runs out.
  void Open(const std::string& token, CompletionCallback done);

  // Empty until Open() completed.
  std::string GetId() const;
  bool ready() const { return handshake_ && handshake_->completed(); }

  // Stream answered to incoming calls and sent to new users.
  void SetLocalStreamSource(StreamSource source) { local_stream_ = std::move(source); }
  // Receives calls tagged with a metadata type, e.g. screen sharing.
  void SetSideChannelHandler(CallHandler handler) { side_channel_ = std::move(handler); }
  // Receives messages of data connections opened by remote peers.
  void SetPeerDataHandler(PeerDataHandler handler) { peer_data_ = std::move(handler); }

  // Calls |peer_id| and opens the companion data connection; both are
  // handed to the roster.
  webrtc::RTCError EstablishConnectionWithUser(const std::string& peer_id,
                                               const Json::Value& join_data);

  void Disconnect();

  const ReconnectTimer* reconnect_timer() const { return reconnect_.get(); }

  // PeerSessionProviderObserver
  void OnOpen(const std::string& id) override;
  void OnServerMessage(const std::string& type, const Json::Value& message) override;
  void OnCall(std::shared_ptr<MediaConnection> call) override;
  void OnConnection(std::shared_ptr<DataConnection> connection) override;
  void OnDisconnected() override;
  void OnError(const std::string& type, const std::string& message) override;

 private:
  void AttemptReconnection();
  void PublishConnectionFailed(const std::string& message);
  MediaStreamRef local_stream() const;

  webrtc::TaskQueueBase* const task_queue_;
  PeerSessionProviderFactory* const factory_;
  const PeerOptions options_;
  EventBus* const bus_;
  RosterManager* const roster_;
  std::unique_ptr<PeerSessionProvider> provider_;
  std::unique_ptr<ProviderHandshake> handshake_;
  std::unique_ptr<ReconnectTimer> reconnect_;
  std::string id_;
  StreamSource local_stream_;
  CallHandler side_channel_;
  PeerDataHandler peer_data_;
  std::map<std::string, std::vector<std::shared_ptr<DataConnection>>> inbound_;
  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> safety_;
};

#endif  // WEBRTC_HUDDLE_PEER_TRANSPORT_H_
