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

#include "peer_transport.h"

#include <algorithm>
#include <utility>

const char kScreenSharingCallType[] = "screen-sharing";
const char kProviderWelcomeMessage[] = "welcome";

namespace {

// Upper bound of the doubling reconnect delay.
constexpr webrtc::TimeDelta kMaxPeerReconnectDelay = webrtc::TimeDelta::Seconds(30);

bool IsTaggedCall(const MediaConnection& call) {
  return !JsonString(call.metadata(), "type").empty();
}

}  // namespace

ProviderHandshake::ProviderHandshake(webrtc::TaskQueueBase* task_queue,
                                     webrtc::TimeDelta timeout)
    : task_queue_(task_queue),
      timeout_(timeout),
      timeout_flag_(webrtc::PendingTaskSafetyFlag::CreateDetached()) {}

ProviderHandshake::~ProviderHandshake() {
  timeout_flag_->SetNotAlive();
}

void ProviderHandshake::Start(CompletionCallback done) {
  done_ = std::move(done);
  opened_ = false;
  completed_ = false;
  timed_out_ = false;
  task_queue_->PostDelayedTask(
      webrtc::SafeTask(timeout_flag_,
                       [this]() {
                         if (!pending()) return;
                         timed_out_ = true;
                         Finish(webrtc::RTCError(webrtc::RTCErrorType::NETWORK_ERROR,
                                                 "Peer connection timeout"));
                       }),
      timeout_);
}

void ProviderHandshake::OnOpen() {
  opened_ = true;
}

void ProviderHandshake::OnServerMessage(const std::string& type) {
  if (type != kProviderWelcomeMessage || !opened_ || !pending()) {
    return;
  }
  completed_ = true;
  Finish(webrtc::RTCError::OK());
}

void ProviderHandshake::Fail(webrtc::RTCError error) {
  if (!pending()) {
    return;
  }
  Finish(std::move(error));
}

void ProviderHandshake::Abandon() {
  timeout_flag_->SetNotAlive();
  timeout_flag_ = webrtc::PendingTaskSafetyFlag::CreateDetached();
  done_ = nullptr;
}

void ProviderHandshake::Finish(webrtc::RTCError error) {
  timeout_flag_->SetNotAlive();
  timeout_flag_ = webrtc::PendingTaskSafetyFlag::CreateDetached();
  CompletionCallback done = std::move(done_);
  done_ = nullptr;
  done(std::move(error));
}

PeerTransport::PeerTransport(webrtc::TaskQueueBase* task_queue,
                             PeerSessionProviderFactory* factory,
                             const PeerOptions& options,
                             EventBus* bus,
                             RosterManager* roster)
    : task_queue_(task_queue),
      factory_(factory),
      options_(options),
      bus_(bus),
      roster_(roster),
      safety_(webrtc::PendingTaskSafetyFlag::CreateDetached()) {}

PeerTransport::~PeerTransport() {
  safety_->SetNotAlive();
  if (provider_) {
    provider_->SetObserver(nullptr);
    provider_->Destroy();
  }
}

void PeerTransport::Open(const std::string& token, CompletionCallback done) {
  if (provider_) {
    done(webrtc::RTCError(webrtc::RTCErrorType::INVALID_STATE,
                          "Peer transport already open"));
    return;
  }
  provider_ = factory_->Create(token);
  if (!provider_) {
    done(webrtc::RTCError(webrtc::RTCErrorType::INTERNAL_ERROR,
                          "Failed to create peer session provider"));
    return;
  }
  reconnect_ = std::make_unique<ReconnectTimer>(
      task_queue_, std::make_unique<JitteredDoublingBackoff>(
                       webrtc::TimeDelta::Millis(options_.reconnect_delay_ms),
                       kMaxPeerReconnectDelay, options_.max_reconnect_attempts));
  handshake_ = std::make_unique<ProviderHandshake>(
      task_queue_, webrtc::TimeDelta::Millis(options_.connection_delay_ms));
  handshake_->Start([this, done = std::move(done)](webrtc::RTCError error) {
    if (error.ok()) {
      APP_LOG(AS_INFO) << "Peer transport ready, id " << id_;
    } else if (handshake_->timed_out()) {
      APP_LOG(AS_ERROR) << "Peer transport handshake timed out";
      PublishConnectionFailed(error.message());
    }
    done(std::move(error));
  });
  provider_->SetObserver(this);
  provider_->Open();
}

std::string PeerTransport::GetId() const {
  return ready() ? id_ : std::string();
}

webrtc::RTCError PeerTransport::EstablishConnectionWithUser(
    const std::string& peer_id,
    const Json::Value& join_data) {
  if (!provider_ || !ready()) {
    return webrtc::RTCError(webrtc::RTCErrorType::INVALID_STATE,
                            "Peer transport is not ready");
  }
  if (!roster_) {
    return webrtc::RTCError(webrtc::RTCErrorType::UNSUPPORTED_OPERATION,
                            "Peer transport has no roster");
  }
  std::shared_ptr<MediaConnection> media =
      provider_->Call(peer_id, local_stream(), Json::Value(Json::objectValue));
  std::shared_ptr<DataConnection> data = provider_->Connect(peer_id);
  if (!media || !data) {
    if (media) media->Close();
    if (data) data->Close();
    return webrtc::RTCError(webrtc::RTCErrorType::NETWORK_ERROR,
                            "Failed to connect to " + peer_id);
  }
  APP_LOG(AS_INFO) << "Connecting to user " << peer_id;
  return roster_->Add(media, data, join_data);
}

void PeerTransport::Disconnect() {
  if (reconnect_) {
    reconnect_->set_enabled(false);
  }
  if (handshake_) {
    handshake_->Fail(webrtc::RTCError(webrtc::RTCErrorType::NETWORK_ERROR,
                                      "Peer transport closed"));
  }
  for (auto& peer : inbound_) {
    for (auto& connection : peer.second) {
      connection->SetOnData(nullptr);
      connection->Close();
    }
  }
  inbound_.clear();
  if (provider_) {
    APP_LOG(AS_INFO) << "Destroying peer transport " << id_;
    provider_->SetObserver(nullptr);
    provider_->Destroy();
    provider_ = nullptr;
  }
  id_.clear();
}

void PeerTransport::OnOpen(const std::string& id) {
  APP_LOG(AS_INFO) << "Peer session open, id " << id;
  id_ = id;
  reconnect_->OnConnected();
  handshake_->OnOpen();
}

void PeerTransport::OnServerMessage(const std::string& type,
                                    const Json::Value& /*message*/) {
  APP_LOG(AS_VERBOSE) << "Peer server message " << type;
  handshake_->OnServerMessage(type);
}

void PeerTransport::OnCall(std::shared_ptr<MediaConnection> call) {
  if (IsTaggedCall(*call)) {
    if (side_channel_) {
      side_channel_(call);
    } else {
      APP_LOG(AS_WARNING) << "No handler for "
                          << JsonString(call->metadata(), "type") << " call from "
                          << call->peer();
    }
    return;
  }
  if (!roster_) {
    APP_LOG(AS_WARNING) << "Rejecting call from " << call->peer();
    call->Close();
    return;
  }

  std::shared_ptr<DataConnection> data = provider_->Connect(call->peer());
  if (!data) {
    APP_LOG(AS_ERROR) << "Failed to open data connection to " << call->peer();
    call->Close();
    return;
  }
  if (roster_->FindOne(call->peer())) {
    APP_LOG(AS_WARNING) << "Closing duplicate call from " << call->peer();
    call->Close();
    data->Close();
    return;
  }
  webrtc::RTCError error = roster_->Add(call, data);
  if (!error.ok()) {
    APP_LOG(AS_ERROR) << "Failed to add " << call->peer() << ": " << error.message();
    return;
  }
  call->Answer(local_stream());
}

void PeerTransport::OnConnection(std::shared_ptr<DataConnection> connection) {
  const std::string peer_id = connection->peer();
  APP_LOG(AS_VERBOSE) << "Data connection from " << peer_id;
  connection->SetOnData([this, flag = safety_, peer_id](const Json::Value& message) {
    if (!flag->alive()) return;
    if (!message.isObject()) {
      APP_LOG(AS_WARNING) << "Ignoring non object peer message from " << peer_id;
      return;
    }
    if (peer_data_) {
      peer_data_(peer_id, message);
    }
  });
  DataConnection* raw = connection.get();
  connection->SetOnClose([this, flag = safety_, peer_id, raw]() {
    if (!flag->alive()) return;
    // Released after the close callback returned.
    task_queue_->PostTask(webrtc::SafeTask(safety_, [this, peer_id, raw]() {
      auto it = inbound_.find(peer_id);
      if (it == inbound_.end()) return;
      auto& list = it->second;
      list.erase(std::remove_if(list.begin(), list.end(),
                                [raw](const std::shared_ptr<DataConnection>& c) {
                                  return c.get() == raw;
                                }),
                 list.end());
      if (list.empty()) inbound_.erase(it);
    }));
  });
  inbound_[peer_id].push_back(std::move(connection));
}

void PeerTransport::OnDisconnected() {
  APP_LOG(AS_WARNING) << "Peer session disconnected, attempting to reconnect";
  AttemptReconnection();
}

void PeerTransport::OnError(const std::string& type, const std::string& message) {
  APP_LOG(AS_ERROR) << "Peer session error " << type << ": " << message;
  if (type == "server-error") {
    PublishConnectionFailed(message);
  }
  if (handshake_ && handshake_->pending()) {
    handshake_->Fail(webrtc::RTCError(type == "server-error"
                                          ? webrtc::RTCErrorType::INTERNAL_ERROR
                                          : webrtc::RTCErrorType::NETWORK_ERROR,
                                      message));
  }
}

void PeerTransport::AttemptReconnection() {
  if (!reconnect_ || !provider_) {
    return;
  }
  ReconnectTimer::Result result = reconnect_->Schedule([this]() {
    if (!provider_ || !provider_->disconnected() || provider_->destroyed()) {
      return;
    }
    APP_LOG(AS_INFO) << "Peer reconnect attempt " << reconnect_->attempt();
    provider_->Reconnect();
  });
  if (result == ReconnectTimer::Result::kExhausted) {
    PublishConnectionFailed("Failed to reconnect after " +
                            std::to_string(reconnect_->max_attempts()) + " attempts");
  }
}

void PeerTransport::PublishConnectionFailed(const std::string& message) {
  Json::Value detail;
  detail["message"] = message;
  bus_->Publish(SessionEvent::kPeerConnectionFailed, detail);
}

MediaStreamRef PeerTransport::local_stream() const {
  return local_stream_ ? local_stream_() : MediaStreamRef();
}
