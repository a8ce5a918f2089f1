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

#ifndef WEBRTC_HUDDLE_PEERJS_PROVIDER_H_
#define WEBRTC_HUDDLE_PEERJS_PROVIDER_H_

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <json/json.h>

#include "api/data_channel_interface.h"
#include "api/jsep.h"
#include "api/peer_connection_interface.h"
#include "api/rtc_error.h"
#include "api/scoped_refptr.h"
#include "api/task_queue/pending_task_safety_flag.h"
#include "api/task_queue/task_queue_base.h"
#include "rtc_base/thread.h"

#include "option.h"
#include "peer_session.h"
#include "wsock.h"

class LambdaCreateSessionDescriptionObserver
    : public webrtc::CreateSessionDescriptionObserver {
 public:
  LambdaCreateSessionDescriptionObserver(
      std::function<void(std::unique_ptr<webrtc::SessionDescriptionInterface> desc)> on_success,
      std::function<void(webrtc::RTCError)> on_failure)
      : on_success_(std::move(on_success)), on_failure_(std::move(on_failure)) {}
  void OnSuccess(webrtc::SessionDescriptionInterface* desc) override {
    // Takes ownership of |desc|, per CreateSessionDescriptionObserver.
    on_success_(std::unique_ptr<webrtc::SessionDescriptionInterface>(desc));
  }
  void OnFailure(webrtc::RTCError error) override { on_failure_(std::move(error)); }

 private:
  std::function<void(std::unique_ptr<webrtc::SessionDescriptionInterface> desc)> on_success_;
  std::function<void(webrtc::RTCError)> on_failure_;
};

class LambdaSetLocalDescriptionObserver
    : public webrtc::SetLocalDescriptionObserverInterface {
 public:
  explicit LambdaSetLocalDescriptionObserver(std::function<void(webrtc::RTCError)> on_complete)
      : on_complete_(std::move(on_complete)) {}
  void OnSetLocalDescriptionComplete(webrtc::RTCError error) override {
    on_complete_(std::move(error));
  }

 private:
  std::function<void(webrtc::RTCError)> on_complete_;
};

class LambdaSetRemoteDescriptionObserver
    : public webrtc::SetRemoteDescriptionObserverInterface {
 public:
  explicit LambdaSetRemoteDescriptionObserver(std::function<void(webrtc::RTCError)> on_complete)
      : on_complete_(std::move(on_complete)) {}
  void OnSetRemoteDescriptionComplete(webrtc::RTCError error) override {
    on_complete_(std::move(error));
  }

 private:
  std::function<void(webrtc::RTCError)> on_complete_;
};

// Provider error type of a PeerJS server message type, empty when the
// message is not an error.
std::string PeerJsErrorType(const std::string& server_type);

// "<path>peerjs?key=..&id=..&token=.."
std::string BuildPeerJsPath(const PeerOptions& options,
                            const std::string& id,
                            const std::string& token);

class PeerJsProvider;

// Offer/answer and candidate exchange of one PeerJS connection, relayed
// through the PeerJS server. Lives on the session thread, which is also
// the PeerConnection signaling thread.
class PeerJsNegotiator : public webrtc::PeerConnectionObserver,
                         public std::enable_shared_from_this<PeerJsNegotiator> {
 public:
  PeerJsNegotiator(PeerJsProvider* provider,
                   const std::string& peer,
                   const std::string& connection_id,
                   const std::string& type);
  ~PeerJsNegotiator() override;

  bool CreatePeerConnection(webrtc::PeerConnectionFactoryInterface* factory,
                            const webrtc::PeerConnectionInterface::RTCConfiguration& config);

  const std::string& connection_id() const { return connection_id_; }
  const std::string& remote_peer() const { return peer_; }

  void HandleOffer(const Json::Value& payload);
  void HandleAnswer(const Json::Value& payload);
  void HandleCandidate(const Json::Value& payload);

  // Closes the PeerConnection and forgets the provider.
  void Shutdown();
  bool closed() const { return closed_; }

 protected:
  void MakeOffer();
  void MakeAnswer();
  webrtc::PeerConnectionInterface* pc() const { return pc_.get(); }
  PeerJsProvider* provider() const { return provider_; }
  bool negotiated() const { return negotiated_; }
  bool remote_offer_applied() const { return remote_offer_applied_; }

  virtual void DecorateOffer(Json::Value& payload) const {}
  virtual void OnRemoteOffer() = 0;
  virtual void OnNegotiated() {}
  virtual void OnFailed(webrtc::RTCError error) = 0;
  virtual void OnShutdown() {}

  // webrtc::PeerConnectionObserver
  void OnSignalingChange(webrtc::PeerConnectionInterface::SignalingState new_state) override {}
  void OnDataChannel(rtc::scoped_refptr<webrtc::DataChannelInterface> channel) override {}
  void OnRenegotiationNeeded() override;
  void OnIceGatheringChange(webrtc::PeerConnectionInterface::IceGatheringState new_state) override {}
  void OnIceCandidate(const webrtc::IceCandidateInterface* candidate) override;
  void OnConnectionChange(webrtc::PeerConnectionInterface::PeerConnectionState new_state) override;

 private:
  void ApplyRemoteDescription(const Json::Value& sdp, bool offer);
  void SetLocalAndSend(std::unique_ptr<webrtc::SessionDescriptionInterface> desc,
                       const std::string& message_type);
  Json::Value BasePayload() const;
  void DrainCandidates();

  PeerJsProvider* provider_;
  const std::string peer_;
  const std::string connection_id_;
  const std::string type_;
  rtc::scoped_refptr<webrtc::PeerConnectionInterface> pc_;
  std::vector<std::unique_ptr<webrtc::IceCandidateInterface>> pending_candidates_;
  bool remote_description_set_ = false;
  bool remote_offer_applied_ = false;
  bool negotiated_ = false;
  bool closed_ = false;
  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> safety_;
};

class PeerJsMediaConnection : public MediaConnection, public PeerJsNegotiator {
 public:
  PeerJsMediaConnection(PeerJsProvider* provider,
                        const std::string& peer,
                        const std::string& connection_id,
                        const Json::Value& metadata);

  // Adds the tracks of |local_stream|, or receive-only transceivers when
  // there is none, and sends the offer.
  void StartCall(MediaStreamRef local_stream);

  // MediaConnection
  std::string peer() const override { return remote_peer(); }
  const Json::Value& metadata() const override { return metadata_; }
  void Answer(MediaStreamRef local_stream) override;
  void Close() override;
  MediaStreamRef remote_stream() const override { return remote_stream_; }
  void ReplaceOrAddTracks(MediaStreamRef stream, CompletionCallback done) override;
  void SetOnStream(std::function<void(MediaStreamRef)> callback) override {
    on_stream_ = std::move(callback);
  }
  void SetOnClose(std::function<void()> callback) override { on_close_ = std::move(callback); }
  void SetOnError(std::function<void(webrtc::RTCError)> callback) override {
    on_error_ = std::move(callback);
  }

 protected:
  void DecorateOffer(Json::Value& payload) const override;
  void OnRemoteOffer() override;
  void OnNegotiated() override;
  void OnFailed(webrtc::RTCError error) override;
  void OnShutdown() override;
  void OnTrack(rtc::scoped_refptr<webrtc::RtpTransceiverInterface> transceiver) override;

 private:
  // Returns true when a sender had to be added. With |replace| a sender
  // already sending a track of the same kind gets the new track instead.
  bool AddStreamTracks(MediaStreamRef stream, bool replace);
  void FinishRenegotiation(webrtc::RTCError error);

  const Json::Value metadata_;
  bool answered_ = false;
  MediaStreamRef remote_stream_;
  std::vector<CompletionCallback> renegotiation_done_;
  std::function<void(MediaStreamRef)> on_stream_;
  std::function<void()> on_close_;
  std::function<void(webrtc::RTCError)> on_error_;
};

class PeerJsDataConnection : public DataConnection,
                             public PeerJsNegotiator,
                             public webrtc::DataChannelObserver {
 public:
  PeerJsDataConnection(PeerJsProvider* provider,
                       const std::string& peer,
                       const std::string& connection_id,
                       const std::string& label);
  ~PeerJsDataConnection() override;

  // Creates the data channel and sends the offer.
  bool StartConnect();

  // DataConnection
  std::string peer() const override { return remote_peer(); }
  bool open() const override;
  bool Send(const Json::Value& message) override;
  void Close() override;
  void SetOnOpen(std::function<void()> callback) override { on_open_ = std::move(callback); }
  void SetOnData(std::function<void(const Json::Value&)> callback) override {
    on_data_ = std::move(callback);
  }
  void SetOnClose(std::function<void()> callback) override { on_close_ = std::move(callback); }

  // webrtc::DataChannelObserver
  void OnStateChange() override;
  void OnMessage(const webrtc::DataBuffer& buffer) override;

 protected:
  void DecorateOffer(Json::Value& payload) const override;
  void OnRemoteOffer() override { MakeAnswer(); }
  void OnFailed(webrtc::RTCError error) override;
  void OnShutdown() override;
  void OnDataChannel(rtc::scoped_refptr<webrtc::DataChannelInterface> channel) override;

 private:
  void AttachChannel(rtc::scoped_refptr<webrtc::DataChannelInterface> channel);

  const std::string label_;
  rtc::scoped_refptr<webrtc::DataChannelInterface> channel_;
  bool was_open_ = false;
  std::function<void()> on_open_;
  std::function<void(const Json::Value&)> on_data_;
  std::function<void()> on_close_;
};

// PeerSessionProvider talking to a PeerJS server over a websocket.
class PeerJsProvider : public PeerSessionProvider {
 public:
  static constexpr int kHeartbeatIntervalMs = 5000;

  struct Environment {
    rtc::Thread* network_thread = nullptr;
    // Also the PeerConnection signaling thread.
    webrtc::TaskQueueBase* session_queue = nullptr;
    webrtc::PeerConnectionFactoryInterface* factory = nullptr;
    webrtc::PeerConnectionInterface::RTCConfiguration rtc_config;
  };

  PeerJsProvider(const PeerOptions& options, const std::string& token, Environment environment);
  ~PeerJsProvider() override;

  PeerJsProvider(const PeerJsProvider&) = delete;
  PeerJsProvider& operator=(const PeerJsProvider&) = delete;

  // PeerSessionProvider
  void SetObserver(PeerSessionProviderObserver* observer) override { observer_ = observer; }
  void Open() override;
  void Reconnect() override;
  void Destroy() override;
  bool disconnected() const override { return disconnected_; }
  bool destroyed() const override { return destroyed_; }
  std::string id() const override { return id_; }
  std::shared_ptr<MediaConnection> Call(const std::string& peer,
                                        MediaStreamRef stream,
                                        const Json::Value& metadata) override;
  std::shared_ptr<DataConnection> Connect(const std::string& peer) override;

  const Environment& environment() const { return env_; }

  // Connection side.
  void SendToServer(const std::string& type, const std::string& dst, const Json::Value& payload);
  void RemoveConnection(const std::string& connection_id);

 private:
  void StartSocket();
  void HandleServerMessage(const std::string& text);
  void HandleSocketClosed(const std::string& reason);
  void HandleOffer(const std::string& src, const Json::Value& payload);
  void RouteToConnection(const std::string& type, const Json::Value& payload);
  void CloseConnectionsTo(const std::string& peer);
  void ScheduleHeartbeat();
  void PostToSession(std::function<void()> task);

  const PeerOptions options_;
  const std::string token_;
  const Environment env_;
  std::unique_ptr<WebSocketClient> ws_;
  PeerSessionProviderObserver* observer_ = nullptr;
  std::string id_;
  bool open_ = false;
  bool disconnected_ = true;
  bool destroyed_ = false;
  std::map<std::string, std::shared_ptr<PeerJsNegotiator>> connections_;
  std::map<std::string, std::vector<Json::Value>> lost_messages_;
  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> heartbeat_flag_;
  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> safety_;
};

class PeerJsProviderFactory : public PeerSessionProviderFactory {
 public:
  PeerJsProviderFactory(const PeerOptions& options, PeerJsProvider::Environment environment)
      : options_(options), environment_(std::move(environment)) {}

  std::unique_ptr<PeerSessionProvider> Create(const std::string& token) override {
    return std::make_unique<PeerJsProvider>(options_, token, environment_);
  }

 private:
  const PeerOptions options_;
  const PeerJsProvider::Environment environment_;
};

#endif  // WEBRTC_HUDDLE_PEERJS_PROVIDER_H_
