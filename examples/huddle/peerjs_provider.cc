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

#include <utility>

#include "absl/types/optional.h"
#include "api/make_ref_counted.h"
#include "api/rtp_sender_interface.h"
#include "api/rtp_transceiver_interface.h"
#include "api/units/time_delta.h"

#include "socketio.h"

namespace {

std::string WriteCompact(const Json::Value& value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, value);
}

bool ParseJson(const std::string& text, Json::Value* out) {
  Json::CharReaderBuilder reader_builder;
  std::unique_ptr<Json::CharReader> reader(reader_builder.newCharReader());
  std::string errs;
  return reader->parse(text.data(), text.data() + text.size(), out, &errs);
}

cricket::MediaType MediaTypeOfKind(const std::string& kind) {
  return kind == webrtc::MediaStreamTrackInterface::kAudioKind ? cricket::MEDIA_TYPE_AUDIO
                                                               : cricket::MEDIA_TYPE_VIDEO;
}

}  // namespace

std::string PeerJsErrorType(const std::string& server_type) {
  if (server_type == "ERROR") return "server-error";
  if (server_type == "ID-TAKEN") return "unavailable-id";
  if (server_type == "INVALID-KEY") return "invalid-key";
  return "";
}

std::string BuildPeerJsPath(const PeerOptions& options,
                            const std::string& id,
                            const std::string& token) {
  std::string path = options.path.empty() ? "/" : options.path;
  if (path.front() != '/') path = "/" + path;
  if (path.back() != '/') path += '/';
  return path + "peerjs?key=" + UrlEncode(options.key) + "&id=" + UrlEncode(id) +
         "&token=" + UrlEncode(token);
}

// PeerJsNegotiator

PeerJsNegotiator::PeerJsNegotiator(PeerJsProvider* provider,
                                   const std::string& peer,
                                   const std::string& connection_id,
                                   const std::string& type)
    : provider_(provider),
      peer_(peer),
      connection_id_(connection_id),
      type_(type),
      safety_(webrtc::PendingTaskSafetyFlag::CreateDetached()) {}

PeerJsNegotiator::~PeerJsNegotiator() {
  safety_->SetNotAlive();
  if (pc_ && !closed_) {
    pc_->Close();
  }
}

bool PeerJsNegotiator::CreatePeerConnection(
    webrtc::PeerConnectionFactoryInterface* factory,
    const webrtc::PeerConnectionInterface::RTCConfiguration& config) {
  if (!factory) {
    APP_LOG(AS_ERROR) << "No PeerConnectionFactory for " << connection_id_;
    return false;
  }
  webrtc::PeerConnectionDependencies dependencies(this);
  auto result = factory->CreatePeerConnectionOrError(config, std::move(dependencies));
  if (!result.ok()) {
    APP_LOG(AS_ERROR) << "Failed to create PeerConnection for " << connection_id_ << ": "
                      << result.error().message();
    return false;
  }
  pc_ = result.MoveValue();
  return true;
}

void PeerJsNegotiator::MakeOffer() {
  if (closed_ || !pc_) return;
  auto self = shared_from_this();
  pc_->CreateOffer(
      rtc::make_ref_counted<LambdaCreateSessionDescriptionObserver>(
          [self, flag = safety_](std::unique_ptr<webrtc::SessionDescriptionInterface> desc) {
            if (!flag->alive()) return;
            self->SetLocalAndSend(std::move(desc), "OFFER");
          },
          [self, flag = safety_](webrtc::RTCError error) {
            if (!flag->alive()) return;
            self->OnFailed(std::move(error));
          })
          .get(),
      webrtc::PeerConnectionInterface::RTCOfferAnswerOptions());
}

void PeerJsNegotiator::MakeAnswer() {
  if (closed_ || !pc_) return;
  auto self = shared_from_this();
  pc_->CreateAnswer(
      rtc::make_ref_counted<LambdaCreateSessionDescriptionObserver>(
          [self, flag = safety_](std::unique_ptr<webrtc::SessionDescriptionInterface> desc) {
            if (!flag->alive()) return;
            self->SetLocalAndSend(std::move(desc), "ANSWER");
          },
          [self, flag = safety_](webrtc::RTCError error) {
            if (!flag->alive()) return;
            self->OnFailed(std::move(error));
          })
          .get(),
      webrtc::PeerConnectionInterface::RTCOfferAnswerOptions());
}

void PeerJsNegotiator::SetLocalAndSend(std::unique_ptr<webrtc::SessionDescriptionInterface> desc,
                                       const std::string& message_type) {
  std::string sdp;
  if (!desc->ToString(&sdp)) {
    OnFailed(webrtc::RTCError(webrtc::RTCErrorType::INTERNAL_ERROR,
                              "Failed to serialize local description"));
    return;
  }
  const std::string sdp_type = webrtc::SdpTypeToString(desc->GetType());
  auto self = shared_from_this();
  pc_->SetLocalDescription(
      std::move(desc),
      rtc::make_ref_counted<LambdaSetLocalDescriptionObserver>(
          [self, flag = safety_, sdp, sdp_type, message_type](webrtc::RTCError error) {
            if (!flag->alive()) return;
            if (!error.ok()) {
              self->OnFailed(std::move(error));
              return;
            }
            Json::Value payload = self->BasePayload();
            payload["sdp"]["type"] = sdp_type;
            payload["sdp"]["sdp"] = sdp;
            if (message_type == "OFFER") {
              self->DecorateOffer(payload);
            } else {
              self->negotiated_ = true;
            }
            if (self->provider_) {
              self->provider_->SendToServer(message_type, self->peer_, payload);
            }
          }));
}

void PeerJsNegotiator::ApplyRemoteDescription(const Json::Value& sdp, bool offer) {
  if (closed_ || !pc_) return;
  if (!sdp.isObject() || !sdp["sdp"].isString()) {
    APP_LOG(AS_WARNING) << "Ignoring description without sdp on " << connection_id_;
    return;
  }
  absl::optional<webrtc::SdpType> type =
      webrtc::SdpTypeFromString(JsonString(sdp, "type", offer ? "offer" : "answer"));
  if (!type) {
    APP_LOG(AS_WARNING) << "Unknown sdp type on " << connection_id_;
    return;
  }
  webrtc::SdpParseError parse_error;
  std::unique_ptr<webrtc::SessionDescriptionInterface> desc =
      webrtc::CreateSessionDescription(*type, sdp["sdp"].asString(), &parse_error);
  if (!desc) {
    OnFailed(webrtc::RTCError(webrtc::RTCErrorType::SYNTAX_ERROR,
                              "Bad remote sdp: " + parse_error.description));
    return;
  }
  auto self = shared_from_this();
  pc_->SetRemoteDescription(
      std::move(desc),
      rtc::make_ref_counted<LambdaSetRemoteDescriptionObserver>(
          [self, flag = safety_, offer](webrtc::RTCError error) {
            if (!flag->alive()) return;
            if (!error.ok()) {
              self->OnFailed(std::move(error));
              return;
            }
            self->remote_description_set_ = true;
            self->DrainCandidates();
            if (offer) {
              self->remote_offer_applied_ = true;
              self->OnRemoteOffer();
            } else {
              self->negotiated_ = true;
              self->OnNegotiated();
            }
          }));
}

void PeerJsNegotiator::HandleOffer(const Json::Value& payload) {
  ApplyRemoteDescription(payload["sdp"], true);
}

void PeerJsNegotiator::HandleAnswer(const Json::Value& payload) {
  ApplyRemoteDescription(payload["sdp"], false);
}

void PeerJsNegotiator::HandleCandidate(const Json::Value& payload) {
  if (closed_ || !pc_ || !payload.isObject()) return;
  const Json::Value& candidate = payload["candidate"];
  if (!candidate.isObject() || !candidate["candidate"].isString()) {
    APP_LOG(AS_VERBOSE) << "Ignoring empty candidate on " << connection_id_;
    return;
  }
  webrtc::SdpParseError parse_error;
  std::unique_ptr<webrtc::IceCandidateInterface> ice(webrtc::CreateIceCandidate(
      JsonString(candidate, "sdpMid"), JsonInt(candidate, "sdpMLineIndex", 0),
      candidate["candidate"].asString(), &parse_error));
  if (!ice) {
    APP_LOG(AS_WARNING) << "Bad candidate on " << connection_id_ << ": "
                        << parse_error.description;
    return;
  }
  if (!remote_description_set_) {
    pending_candidates_.push_back(std::move(ice));
    return;
  }
  if (!pc_->AddIceCandidate(ice.get())) {
    APP_LOG(AS_WARNING) << "Failed to add candidate on " << connection_id_;
  }
}

void PeerJsNegotiator::DrainCandidates() {
  for (const auto& candidate : pending_candidates_) {
    if (!pc_->AddIceCandidate(candidate.get())) {
      APP_LOG(AS_WARNING) << "Failed to add queued candidate on " << connection_id_;
    }
  }
  pending_candidates_.clear();
}

void PeerJsNegotiator::Shutdown() {
  if (closed_) return;
  closed_ = true;
  safety_->SetNotAlive();
  pending_candidates_.clear();
  OnShutdown();
  if (pc_) {
    pc_->Close();
  }
  provider_ = nullptr;
}

Json::Value PeerJsNegotiator::BasePayload() const {
  Json::Value payload(Json::objectValue);
  payload["type"] = type_;
  payload["connectionId"] = connection_id_;
  return payload;
}

void PeerJsNegotiator::OnRenegotiationNeeded() {
  // The first offer is sent explicitly; later track changes renegotiate.
  if (!negotiated_ || closed_) return;
  if (pc_->signaling_state() != webrtc::PeerConnectionInterface::kStable) return;
  APP_LOG(AS_VERBOSE) << "Renegotiating " << connection_id_;
  MakeOffer();
}

void PeerJsNegotiator::OnIceCandidate(const webrtc::IceCandidateInterface* candidate) {
  if (closed_ || !provider_) return;
  std::string sdp;
  if (!candidate->ToString(&sdp)) {
    APP_LOG(AS_WARNING) << "Failed to serialize candidate on " << connection_id_;
    return;
  }
  Json::Value payload = BasePayload();
  payload["candidate"]["candidate"] = sdp;
  payload["candidate"]["sdpMid"] = candidate->sdp_mid();
  payload["candidate"]["sdpMLineIndex"] = candidate->sdp_mline_index();
  provider_->SendToServer("CANDIDATE", peer_, payload);
}

void PeerJsNegotiator::OnConnectionChange(
    webrtc::PeerConnectionInterface::PeerConnectionState new_state) {
  APP_LOG(AS_VERBOSE) << connection_id_ << " state "
                      << static_cast<int>(new_state);
  if (new_state == webrtc::PeerConnectionInterface::PeerConnectionState::kFailed) {
    OnFailed(webrtc::RTCError(webrtc::RTCErrorType::NETWORK_ERROR,
                              "Connection to " + peer_ + " failed"));
  }
}

// PeerJsMediaConnection

PeerJsMediaConnection::PeerJsMediaConnection(PeerJsProvider* provider,
                                             const std::string& peer,
                                             const std::string& connection_id,
                                             const Json::Value& metadata)
    : PeerJsNegotiator(provider, peer, connection_id, "media"),
      metadata_(metadata.isNull() ? Json::Value(Json::objectValue) : metadata) {}

void PeerJsMediaConnection::StartCall(MediaStreamRef local_stream) {
  answered_ = true;
  if (local_stream) {
    AddStreamTracks(local_stream, false);
  } else {
    webrtc::RtpTransceiverInit init;
    init.direction = webrtc::RtpTransceiverDirection::kRecvOnly;
    for (cricket::MediaType type : {cricket::MEDIA_TYPE_AUDIO, cricket::MEDIA_TYPE_VIDEO}) {
      auto result = pc()->AddTransceiver(type, init);
      if (!result.ok()) {
        APP_LOG(AS_WARNING) << "Failed to add receive-only transceiver on " << connection_id()
                            << ": " << result.error().message();
      }
    }
  }
  MakeOffer();
}

void PeerJsMediaConnection::Answer(MediaStreamRef local_stream) {
  if (answered_ || closed()) {
    APP_LOG(AS_WARNING) << "Call " << connection_id() << " already answered";
    return;
  }
  answered_ = true;
  if (local_stream) {
    AddStreamTracks(local_stream, false);
  }
  if (remote_offer_applied()) {
    MakeAnswer();
  }
}

void PeerJsMediaConnection::Close() {
  if (closed()) return;
  auto self = shared_from_this();
  if (provider()) {
    provider()->RemoveConnection(connection_id());
  }
  Shutdown();
}

void PeerJsMediaConnection::ReplaceOrAddTracks(MediaStreamRef stream, CompletionCallback done) {
  if (closed() || !stream) {
    done(webrtc::RTCError(webrtc::RTCErrorType::INVALID_STATE,
                          "No connection or stream to replace tracks on"));
    return;
  }
  if (!AddStreamTracks(stream, true)) {
    done(webrtc::RTCError::OK());
    return;
  }
  // An added sender renegotiates; |done| runs when the answer is applied.
  renegotiation_done_.push_back(std::move(done));
}

bool PeerJsMediaConnection::AddStreamTracks(MediaStreamRef stream, bool replace) {
  std::vector<rtc::scoped_refptr<webrtc::MediaStreamTrackInterface>> tracks;
  for (const auto& track : stream->GetAudioTracks()) tracks.push_back(track);
  for (const auto& track : stream->GetVideoTracks()) tracks.push_back(track);

  bool added = false;
  for (const auto& track : tracks) {
    if (replace) {
      rtc::scoped_refptr<webrtc::RtpSenderInterface> sending;
      for (const auto& sender : pc()->GetSenders()) {
        if (sender->media_type() == MediaTypeOfKind(track->kind()) && sender->track()) {
          sending = sender;
          break;
        }
      }
      if (sending) {
        if (!sending->SetTrack(track.get())) {
          APP_LOG(AS_WARNING) << "Failed to replace " << track->kind() << " track on "
                              << connection_id();
        }
        continue;
      }
    }
    auto result = pc()->AddTrack(track, {stream->id()});
    if (!result.ok()) {
      APP_LOG(AS_WARNING) << "Failed to add " << track->kind() << " track on "
                          << connection_id() << ": " << result.error().message();
      continue;
    }
    added = true;
  }
  return added;
}

void PeerJsMediaConnection::FinishRenegotiation(webrtc::RTCError error) {
  std::vector<CompletionCallback> callbacks = std::move(renegotiation_done_);
  renegotiation_done_.clear();
  for (auto& callback : callbacks) {
    callback(error);
  }
}

void PeerJsMediaConnection::DecorateOffer(Json::Value& payload) const {
  payload["metadata"] = metadata_;
}

void PeerJsMediaConnection::OnRemoteOffer() {
  if (answered_) {
    MakeAnswer();
  }
}

void PeerJsMediaConnection::OnNegotiated() {
  FinishRenegotiation(webrtc::RTCError::OK());
}

void PeerJsMediaConnection::OnFailed(webrtc::RTCError error) {
  APP_LOG(AS_ERROR) << "Media connection " << connection_id() << " with " << peer()
                    << " failed: " << error.message();
  FinishRenegotiation(error);
  if (on_error_) {
    on_error_(std::move(error));
  }
}

void PeerJsMediaConnection::OnShutdown() {
  FinishRenegotiation(webrtc::RTCError(webrtc::RTCErrorType::INVALID_STATE, "Connection closed"));
  std::function<void()> on_close = std::move(on_close_);
  on_close_ = nullptr;
  if (on_close) {
    on_close();
  }
}

void PeerJsMediaConnection::OnTrack(
    rtc::scoped_refptr<webrtc::RtpTransceiverInterface> transceiver) {
  if (remote_stream_ || closed()) return;
  rtc::scoped_refptr<webrtc::RtpReceiverInterface> receiver = transceiver->receiver();
  std::vector<rtc::scoped_refptr<webrtc::MediaStreamInterface>> streams = receiver->streams();
  if (!streams.empty()) {
    remote_stream_ = streams.front();
  } else if (provider() && provider()->environment().factory) {
    remote_stream_ = provider()->environment().factory->CreateLocalMediaStream(peer());
    rtc::scoped_refptr<webrtc::MediaStreamTrackInterface> track = receiver->track();
    if (track->kind() == webrtc::MediaStreamTrackInterface::kAudioKind) {
      remote_stream_->AddTrack(
          rtc::scoped_refptr<webrtc::AudioTrackInterface>(
              static_cast<webrtc::AudioTrackInterface*>(track.get())));
    } else {
      remote_stream_->AddTrack(
          rtc::scoped_refptr<webrtc::VideoTrackInterface>(
              static_cast<webrtc::VideoTrackInterface*>(track.get())));
    }
  }
  if (remote_stream_ && on_stream_) {
    APP_LOG(AS_INFO) << "Remote stream from " << peer();
    on_stream_(remote_stream_);
  }
}

// PeerJsDataConnection

PeerJsDataConnection::PeerJsDataConnection(PeerJsProvider* provider,
                                           const std::string& peer,
                                           const std::string& connection_id,
                                           const std::string& label)
    : PeerJsNegotiator(provider, peer, connection_id, "data"),
      label_(label.empty() ? connection_id : label) {}

PeerJsDataConnection::~PeerJsDataConnection() {
  if (channel_) {
    channel_->UnregisterObserver();
  }
}

bool PeerJsDataConnection::StartConnect() {
  webrtc::DataChannelInit init;
  init.ordered = true;
  auto result = pc()->CreateDataChannelOrError(label_, &init);
  if (!result.ok()) {
    APP_LOG(AS_ERROR) << "Failed to create data channel " << label_ << ": "
                      << result.error().message();
    return false;
  }
  AttachChannel(result.MoveValue());
  MakeOffer();
  return true;
}

bool PeerJsDataConnection::open() const {
  return channel_ && !closed() &&
         channel_->state() == webrtc::DataChannelInterface::kOpen;
}

bool PeerJsDataConnection::Send(const Json::Value& message) {
  if (!open()) {
    APP_LOG(AS_VERBOSE) << "Data connection to " << peer() << " not open";
    return false;
  }
  return channel_->Send(webrtc::DataBuffer(WriteCompact(message)));
}

void PeerJsDataConnection::Close() {
  if (closed()) return;
  auto self = shared_from_this();
  if (provider()) {
    provider()->RemoveConnection(connection_id());
  }
  Shutdown();
}

void PeerJsDataConnection::OnStateChange() {
  if (!channel_ || closed()) return;
  webrtc::DataChannelInterface::DataState state = channel_->state();
  if (state == webrtc::DataChannelInterface::kOpen && !was_open_) {
    was_open_ = true;
    APP_LOG(AS_VERBOSE) << "Data connection " << connection_id() << " with " << peer()
                        << " open";
    if (on_open_) on_open_();
  } else if (state == webrtc::DataChannelInterface::kClosed && provider()) {
    // Not from inside the channel callback.
    std::weak_ptr<PeerJsNegotiator> weak = weak_from_this();
    provider()->environment().session_queue->PostTask([weak]() {
      if (auto self = weak.lock()) {
        static_cast<PeerJsDataConnection*>(self.get())->Close();
      }
    });
  }
}

void PeerJsDataConnection::OnMessage(const webrtc::DataBuffer& buffer) {
  if (buffer.binary) {
    APP_LOG(AS_VERBOSE) << "Ignoring binary message from " << peer();
    return;
  }
  std::string text(buffer.data.data<char>(), buffer.data.size());
  Json::Value message;
  if (!ParseJson(text, &message)) {
    APP_LOG(AS_WARNING) << "Ignoring malformed message from " << peer();
    return;
  }
  if (on_data_) {
    on_data_(message);
  }
}

void PeerJsDataConnection::DecorateOffer(Json::Value& payload) const {
  payload["label"] = label_;
  payload["reliable"] = true;
  payload["serialization"] = "json";
}

void PeerJsDataConnection::OnFailed(webrtc::RTCError error) {
  APP_LOG(AS_ERROR) << "Data connection " << connection_id() << " with " << peer()
                    << " failed: " << error.message();
}

void PeerJsDataConnection::OnShutdown() {
  if (channel_) {
    channel_->UnregisterObserver();
    channel_->Close();
  }
  std::function<void()> on_close = std::move(on_close_);
  on_close_ = nullptr;
  if (on_close) {
    on_close();
  }
}

void PeerJsDataConnection::OnDataChannel(
    rtc::scoped_refptr<webrtc::DataChannelInterface> channel) {
  if (channel_) {
    APP_LOG(AS_WARNING) << "Extra data channel " << channel->label() << " from " << peer();
    return;
  }
  AttachChannel(std::move(channel));
}

void PeerJsDataConnection::AttachChannel(
    rtc::scoped_refptr<webrtc::DataChannelInterface> channel) {
  channel_ = std::move(channel);
  channel_->RegisterObserver(this);
  if (channel_->state() == webrtc::DataChannelInterface::kOpen) {
    OnStateChange();
  }
}

// PeerJsProvider

PeerJsProvider::PeerJsProvider(const PeerOptions& options,
                               const std::string& token,
                               Environment environment)
    : options_(options),
      token_(token),
      env_(std::move(environment)),
      ws_(std::make_unique<WebSocketClient>(env_.network_thread)),
      heartbeat_flag_(webrtc::PendingTaskSafetyFlag::CreateDetached()),
      safety_(webrtc::PendingTaskSafetyFlag::CreateDetached()) {}

PeerJsProvider::~PeerJsProvider() {
  safety_->SetNotAlive();
  heartbeat_flag_->SetNotAlive();
  std::map<std::string, std::shared_ptr<PeerJsNegotiator>> connections = std::move(connections_);
  connections_.clear();
  for (auto& connection : connections) {
    connection.second->Shutdown();
  }
  env_.network_thread->BlockingCall([this]() {
    ws_->disconnect();
    ws_.reset();
  });
}

void PeerJsProvider::PostToSession(std::function<void()> task) {
  env_.session_queue->PostTask(webrtc::SafeTask(safety_, std::move(task)));
}

void PeerJsProvider::Open() {
  if (destroyed_) {
    APP_LOG(AS_ERROR) << "Cannot open a destroyed peer session";
    return;
  }
  if (id_.empty()) {
    id_ = HuddleCreateRandomId(16);
  }
  StartSocket();
}

void PeerJsProvider::Reconnect() {
  if (destroyed_) {
    APP_LOG(AS_ERROR) << "Cannot reconnect a destroyed peer session";
    return;
  }
  if (!disconnected_) {
    APP_LOG(AS_VERBOSE) << "Peer session " << id_ << " is still connected";
    return;
  }
  APP_LOG(AS_INFO) << "Reconnecting peer session " << id_;
  StartSocket();
}

void PeerJsProvider::StartSocket() {
  WebSocketClient::Config config;
  config.host = options_.host;
  config.port = std::to_string(options_.port);
  config.use_ssl = options_.secure;
  config.path = BuildPeerJsPath(options_, id_, token_);

  open_ = false;
  env_.network_thread->PostTask([this, config]() {
    ws_->disconnect();
    ws_->set_message_callback([this](const std::string& text) {
      PostToSession([this, text]() { HandleServerMessage(text); });
    });
    ws_->set_closed_callback([this](const std::string& reason) {
      PostToSession([this, reason]() { HandleSocketClosed(reason); });
    });
    if (!ws_->connect(config)) {
      PostToSession([this]() { HandleSocketClosed("Could not connect to peer server"); });
      return;
    }
    ws_->start_listening();
  });
}

void PeerJsProvider::Destroy() {
  if (destroyed_) return;
  APP_LOG(AS_INFO) << "Destroying peer session " << id_;
  destroyed_ = true;
  open_ = false;
  disconnected_ = true;
  heartbeat_flag_->SetNotAlive();
  std::map<std::string, std::shared_ptr<PeerJsNegotiator>> connections = std::move(connections_);
  connections_.clear();
  lost_messages_.clear();
  for (auto& connection : connections) {
    connection.second->Shutdown();
  }
  env_.network_thread->PostTask([this]() { ws_->disconnect(); });
}

std::shared_ptr<MediaConnection> PeerJsProvider::Call(const std::string& peer,
                                                      MediaStreamRef stream,
                                                      const Json::Value& metadata) {
  if (destroyed_ || !open_) {
    APP_LOG(AS_WARNING) << "Cannot call " << peer << ", peer session not open";
    return nullptr;
  }
  const std::string connection_id = "mc_" + HuddleCreateRandomId(12);
  auto connection =
      std::make_shared<PeerJsMediaConnection>(this, peer, connection_id, metadata);
  if (!connection->CreatePeerConnection(env_.factory, env_.rtc_config)) {
    return nullptr;
  }
  connections_[connection_id] = connection;
  connection->StartCall(stream);
  return connection;
}

std::shared_ptr<DataConnection> PeerJsProvider::Connect(const std::string& peer) {
  if (destroyed_ || !open_) {
    APP_LOG(AS_WARNING) << "Cannot connect to " << peer << ", peer session not open";
    return nullptr;
  }
  const std::string connection_id = "dc_" + HuddleCreateRandomId(12);
  auto connection = std::make_shared<PeerJsDataConnection>(this, peer, connection_id, "");
  if (!connection->CreatePeerConnection(env_.factory, env_.rtc_config)) {
    return nullptr;
  }
  connections_[connection_id] = connection;
  if (!connection->StartConnect()) {
    connections_.erase(connection_id);
    connection->Shutdown();
    return nullptr;
  }
  return connection;
}

void PeerJsProvider::SendToServer(const std::string& type,
                                  const std::string& dst,
                                  const Json::Value& payload) {
  if (!open_) {
    APP_LOG(AS_WARNING) << "Dropping " << type << ", peer server not connected";
    return;
  }
  Json::Value message(Json::objectValue);
  message["type"] = type;
  if (!dst.empty()) message["dst"] = dst;
  if (!payload.isNull()) message["payload"] = payload;
  if (!ws_->send_message(WriteCompact(message))) {
    APP_LOG(AS_WARNING) << "Failed to send " << type << " to peer server";
  }
}

void PeerJsProvider::RemoveConnection(const std::string& connection_id) {
  connections_.erase(connection_id);
  lost_messages_.erase(connection_id);
}

void PeerJsProvider::HandleServerMessage(const std::string& text) {
  Json::Value message;
  if (!ParseJson(text, &message) || !message.isObject()) {
    APP_LOG(AS_WARNING) << "Ignoring malformed peer server message";
    return;
  }
  const std::string type = JsonString(message, "type");
  const std::string src = JsonString(message, "src");
  const Json::Value& payload = message["payload"];

  std::string error_type = PeerJsErrorType(type);
  if (!error_type.empty()) {
    std::string text_message = JsonString(payload, "msg", type);
    if (observer_) observer_->OnError(error_type, text_message);
    return;
  }

  if (type == "OPEN") {
    open_ = true;
    disconnected_ = false;
    ScheduleHeartbeat();
    if (observer_) observer_->OnOpen(id_);
  } else if (type == "LEAVE" || type == "EXPIRE") {
    APP_LOG(AS_INFO) << "Peer " << src << (type == "LEAVE" ? " left" : " expired");
    CloseConnectionsTo(src);
  } else if (type == "OFFER") {
    HandleOffer(src, payload);
  } else if (type == "ANSWER" || type == "CANDIDATE") {
    RouteToConnection(type, payload);
  } else if (!type.empty()) {
    if (observer_) observer_->OnServerMessage(type, message);
  }
}

void PeerJsProvider::HandleSocketClosed(const std::string& reason) {
  open_ = false;
  heartbeat_flag_->SetNotAlive();
  heartbeat_flag_ = webrtc::PendingTaskSafetyFlag::CreateDetached();
  if (destroyed_) return;
  disconnected_ = true;
  APP_LOG(AS_WARNING) << "Peer server connection lost: " << reason;
  if (observer_) observer_->OnError("network", reason);
  // The error handler may have detached the observer.
  if (observer_) observer_->OnDisconnected();
}

void PeerJsProvider::HandleOffer(const std::string& src, const Json::Value& payload) {
  const std::string connection_id = JsonString(payload, "connectionId");
  if (connection_id.empty()) {
    APP_LOG(AS_WARNING) << "Offer from " << src << " without a connection id";
    return;
  }
  auto existing = connections_.find(connection_id);
  if (existing != connections_.end()) {
    existing->second->HandleOffer(payload);
    return;
  }

  const std::string kind = JsonString(payload, "type");
  std::shared_ptr<PeerJsNegotiator> negotiator;
  std::shared_ptr<PeerJsMediaConnection> media;
  std::shared_ptr<PeerJsDataConnection> data;
  if (kind == "media") {
    media = std::make_shared<PeerJsMediaConnection>(this, src, connection_id,
                                                    payload["metadata"]);
    negotiator = media;
  } else if (kind == "data") {
    data = std::make_shared<PeerJsDataConnection>(this, src, connection_id,
                                                  JsonString(payload, "label"));
    negotiator = data;
  } else {
    APP_LOG(AS_WARNING) << "Offer of unknown connection type '" << kind << "' from " << src;
    return;
  }
  if (!negotiator->CreatePeerConnection(env_.factory, env_.rtc_config)) {
    return;
  }
  connections_[connection_id] = negotiator;
  negotiator->HandleOffer(payload);

  auto lost = lost_messages_.find(connection_id);
  if (lost != lost_messages_.end()) {
    std::vector<Json::Value> messages = std::move(lost->second);
    lost_messages_.erase(lost);
    for (const auto& queued : messages) {
      RouteToConnection(JsonString(queued, "type"), queued["payload"]);
    }
  }

  if (!observer_) return;
  if (media) {
    observer_->OnCall(media);
  } else {
    observer_->OnConnection(data);
  }
}

void PeerJsProvider::RouteToConnection(const std::string& type, const Json::Value& payload) {
  const std::string connection_id = JsonString(payload, "connectionId");
  if (connection_id.empty()) {
    APP_LOG(AS_VERBOSE) << "Ignoring " << type << " without a connection id";
    return;
  }
  auto it = connections_.find(connection_id);
  if (it == connections_.end()) {
    // Candidates may overtake the offer.
    Json::Value queued(Json::objectValue);
    queued["type"] = type;
    queued["payload"] = payload;
    lost_messages_[connection_id].push_back(queued);
    return;
  }
  if (type == "ANSWER") {
    it->second->HandleAnswer(payload);
  } else {
    it->second->HandleCandidate(payload);
  }
}

void PeerJsProvider::CloseConnectionsTo(const std::string& peer) {
  std::vector<std::shared_ptr<PeerJsNegotiator>> closing;
  for (auto it = connections_.begin(); it != connections_.end();) {
    if (it->second->remote_peer() == peer) {
      closing.push_back(it->second);
      it = connections_.erase(it);
    } else {
      ++it;
    }
  }
  for (auto& connection : closing) {
    connection->Shutdown();
  }
}

void PeerJsProvider::ScheduleHeartbeat() {
  heartbeat_flag_->SetNotAlive();
  heartbeat_flag_ = webrtc::PendingTaskSafetyFlag::CreateDetached();
  env_.session_queue->PostDelayedTask(
      webrtc::SafeTask(heartbeat_flag_,
                       [this]() {
                         if (!open_) return;
                         SendToServer("HEARTBEAT", "", Json::Value());
                         ScheduleHeartbeat();
                       }),
      webrtc::TimeDelta::Millis(kHeartbeatIntervalMs));
}
