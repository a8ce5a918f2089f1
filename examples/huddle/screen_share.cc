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

#include "screen_share.h"

#include <utility>

ScreenShare::ScreenShare(webrtc::TaskQueueBase* task_queue,
                         PeerSessionProviderFactory* factory,
                         const PeerOptions& options,
                         EventBus* bus,
                         RosterManager* roster,
                         MediaDevices* devices,
                         StreamRenderer* renderer,
                         LocalIdSource local_id)
    : task_queue_(task_queue),
      factory_(factory),
      options_(options),
      bus_(bus),
      roster_(roster),
      devices_(devices),
      renderer_(renderer),
      local_id_(std::move(local_id)),
      safety_(webrtc::PendingTaskSafetyFlag::CreateDetached()) {
  user_connected_ = bus_->Subscribe(
      SessionEvent::kUserConnected, [this](const SessionNotification& notification) {
        CallPeer(PeerIdOf(notification.detail));
      });
}

ScreenShare::~ScreenShare() {
  safety_->SetNotAlive();
  bus_->Unsubscribe(user_connected_);
  if (provider_) {
    provider_->SetObserver(nullptr);
    provider_->Destroy();
  }
}

void ScreenShare::Start(MediaStreamRef stream,
                        const std::string& token,
                        CompletionCallback done) {
  if (sharing_) {
    done(webrtc::RTCError(webrtc::RTCErrorType::INVALID_STATE, "Screen share already active"));
    return;
  }
  if (!stream) {
    done(webrtc::RTCError(webrtc::RTCErrorType::INVALID_PARAMETER, "No screen to share"));
    return;
  }
  provider_ = factory_->Create(token);
  if (!provider_) {
    done(webrtc::RTCError(webrtc::RTCErrorType::INTERNAL_ERROR,
                          "Failed to create screen share session"));
    return;
  }
  sharing_ = true;
  stream_ = stream;
  PublishDisplay(true, local_id_());

  handshake_ = std::make_unique<ProviderHandshake>(
      task_queue_, webrtc::TimeDelta::Millis(options_.connection_delay_ms));
  handshake_->Start([this, done = std::move(done)](webrtc::RTCError error) {
    if (!error.ok()) {
      APP_LOG(AS_ERROR) << "Screen share session failed: " << error.message();
      // Failures arrive from inside provider callbacks; tear the provider
      // down once they returned.
      task_queue_->PostTask(webrtc::SafeTask(safety_, [this]() {
        if (sharing_) {
          Stop();
        }
      }));
      done(std::move(error));
      return;
    }
    APP_LOG(AS_INFO) << "Screen share session ready, id " << id_;
    for (const auto& entry : roster_->connections()) {
      CallPeer(entry->peer_id);
    }
    done(webrtc::RTCError::OK());
  });
  provider_->SetObserver(this);
  provider_->Open();
}

void ScreenShare::Stop() {
  if (!sharing_) {
    PublishDisplay(false, local_id_());
    return;
  }
  sharing_ = false;

  Json::Value message(Json::objectValue);
  message["event"] = "screenShare";
  message["status"] = false;
  message["peerId"] = local_id_();
  roster_->Broadcast(message);
  PublishDisplay(false, local_id_());

  for (auto& call : calls_) {
    call.second->Close();
  }
  calls_.clear();
  if (provider_) {
    provider_->SetObserver(nullptr);
    provider_->Destroy();
    provider_ = nullptr;
  }
  if (stream_) {
    for (const auto& track : stream_->GetVideoTracks()) {
      track->set_enabled(false);
    }
    stream_ = nullptr;
  }
  devices_->StopDisplayMedia();
  id_.clear();
  if (handshake_) {
    handshake_->Fail(webrtc::RTCError(webrtc::RTCErrorType::NETWORK_ERROR,
                                      "Screen share stopped"));
  }
}

void ScreenShare::HandleIncomingCall(std::shared_ptr<MediaConnection> call) {
  const Json::Value& metadata = call->metadata();
  const std::string share_peer_id = JsonString(metadata, "sharePeerId");
  PeerConnectionEntry* entry = nullptr;
  if (!share_peer_id.empty()) {
    entry = roster_->FindOne(RosterField::kSharePeerId, Json::Value(share_peer_id));
  }
  if (!entry) {
    entry = roster_->FindOne(PeerIdOf(metadata));
  }
  if (!entry) {
    APP_LOG(AS_WARNING) << "Screen share from unknown peer " << call->peer();
    call->Close();
    return;
  }
  if (entry->share_media && entry->share_media != call) {
    entry->share_media->Close();
  }
  entry->share_media = call;
  entry->share = true;
  entry->share_peer_id = share_peer_id;

  const std::string peer_id = entry->peer_id;
  call->SetOnStream([this, flag = safety_, peer_id](MediaStreamRef stream) {
    if (!flag->alive()) return;
    APP_LOG(AS_INFO) << "Screen share stream from " << peer_id;
    renderer_->RenderScreenShare(stream);
    PublishDisplay(true, peer_id);
  });
  call->SetOnError([peer_id](webrtc::RTCError error) {
    APP_LOG(AS_WARNING) << "Screen share from " << peer_id << " failed: " << error.message();
  });
  call->Answer(nullptr);
}

void ScreenShare::HandlePeerMessage(const std::string& peer_id, const Json::Value& message) {
  bool status = false;
  if (!ReadJsonBool(message, "status", false, &status)) {
    APP_LOG(AS_WARNING) << "Dropping screenShare from " << peer_id << ": status is not a bool";
    return;
  }
  if (status) {
    return;
  }
  std::string sender = PeerIdOf(message);
  if (sender.empty()) {
    sender = peer_id;
  }
  if (PeerConnectionEntry* entry = roster_->FindOne(sender)) {
    entry->share = false;
    if (entry->share_media) {
      entry->share_media->Close();
      entry->share_media = nullptr;
    }
  }
  renderer_->RenderScreenShare(nullptr);
  PublishDisplay(false, sender);
}

void ScreenShare::OnOpen(const std::string& id) {
  id_ = id;
  handshake_->OnOpen();
}

void ScreenShare::OnServerMessage(const std::string& type, const Json::Value& message) {
  handshake_->OnServerMessage(type);
}

void ScreenShare::OnCall(std::shared_ptr<MediaConnection> call) {
  APP_LOG(AS_VERBOSE) << "Refusing call to the screen share session from " << call->peer();
  call->Close();
}

void ScreenShare::OnConnection(std::shared_ptr<DataConnection> connection) {
  connection->Close();
}

void ScreenShare::OnDisconnected() {
  APP_LOG(AS_WARNING) << "Screen share session lost its server link";
}

void ScreenShare::OnError(const std::string& type, const std::string& message) {
  APP_LOG(AS_ERROR) << "Screen share session error " << type << ": " << message;
  if (handshake_ && handshake_->pending()) {
    handshake_->Fail(webrtc::RTCError(webrtc::RTCErrorType::INTERNAL_ERROR, message));
  }
}

void ScreenShare::CallPeer(const std::string& peer_id) {
  if (!sharing_ || !ready() || peer_id.empty()) {
    return;
  }
  Json::Value metadata(Json::objectValue);
  metadata["type"] = kScreenSharingCallType;
  metadata["peerId"] = local_id_();
  metadata["sharePeerId"] = id_;
  std::shared_ptr<MediaConnection> call = provider_->Call(peer_id, stream_, metadata);
  if (!call) {
    APP_LOG(AS_WARNING) << "Failed to share screen with " << peer_id;
    return;
  }
  auto previous = calls_.find(peer_id);
  if (previous != calls_.end()) {
    previous->second->Close();
  }
  calls_[peer_id] = call;
}

void ScreenShare::PublishDisplay(bool status, const std::string& peer_id) {
  Json::Value detail(Json::objectValue);
  detail["status"] = status;
  detail["peerId"] = peer_id;
  bus_->Publish(SessionEvent::kScreenShareDisplay, detail);
}
