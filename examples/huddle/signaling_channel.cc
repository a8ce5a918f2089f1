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

#include "signaling_channel.h"

#include <utility>

const char kClientDisconnectReason[] = "io client disconnect";
const char kConnectionReadyEvent[] = "connection:ready";

SignalingChannel::SignalingChannel(webrtc::TaskQueueBase* task_queue,
                                   std::unique_ptr<SignalingSocket> socket)
    : task_queue_(task_queue), socket_(std::move(socket)) {
  socket_->SetObserver(this);
}

SignalingChannel::~SignalingChannel() {
  socket_->SetObserver(nullptr);
}

webrtc::RTCError SignalingChannel::Initialize(
    const SignalingReconnectOptions& options) {
  options_ = options;
  reconnect_ = std::make_unique<ReconnectTimer>(
      task_queue_,
      std::make_unique<ExponentialBackoff>(
          webrtc::TimeDelta::Millis(options.delay_ms), options.backoff_factor,
          webrtc::TimeDelta::Millis(options.max_delay_ms), options.attempts));
  reconnect_->set_enabled(options.enabled);
  initialized_ = true;
  APP_LOG(AS_INFO) << "Signaling initialized, reconnection "
                   << (options.enabled ? "enabled" : "disabled")
                   << " attempts=" << options.attempts;
  return webrtc::RTCError::OK();
}

void SignalingChannel::SetConnection(bool status,
                                     const std::string& token,
                                     CompletionCallback done) {
  if (!initialized_) {
    if (done) {
      done(webrtc::RTCError(webrtc::RTCErrorType::INVALID_STATE,
                            "Signaling channel is not initialized"));
    }
    return;
  }

  if (!status) {
    APP_LOG(AS_INFO) << "Closing signaling connection";
    reconnect_->set_enabled(false);
    once_connected_.clear();
    if (handshake_ != Handshake::kIdle) {
      CompleteHandshake(webrtc::RTCError(webrtc::RTCErrorType::NETWORK_ERROR,
                                         "Connection closed before ready"));
    }
    socket_->Close();
    initialized_ = false;
    if (done) {
      done(webrtc::RTCError::OK());
    }
    return;
  }

  if (handshake_ != Handshake::kIdle) {
    CompleteHandshake(webrtc::RTCError(webrtc::RTCErrorType::NETWORK_ERROR,
                                       "Superseded by a new connection"));
  }
  token_ = token;
  reconnect_->set_enabled(options_.enabled);
  reconnect_->OnConnected();
  pending_done_ = std::move(done);
  handshake_ = Handshake::kAwaitingConnect;
  socket_->Open(token_);
}

webrtc::RTCError SignalingChannel::Emit(const std::string& event,
                                        const Json::Value& args,
                                        SignalingSocket::AckCallback ack) {
  if (!initialized_) {
    return webrtc::RTCError(webrtc::RTCErrorType::INVALID_STATE,
                            "Cannot emit '" + event + "' before initialize");
  }
  if (!socket_->Emit(event, args, std::move(ack))) {
    return webrtc::RTCError(webrtc::RTCErrorType::NETWORK_ERROR,
                            "Failed to send '" + event + "'");
  }
  return webrtc::RTCError::OK();
}

webrtc::RTCError SignalingChannel::Listen(const std::string& event,
                                          EventHandler handler) {
  if (!initialized_) {
    return webrtc::RTCError(webrtc::RTCErrorType::INVALID_STATE,
                            "Cannot listen to '" + event + "' before initialize");
  }
  handlers_[event].push_back(std::move(handler));
  return webrtc::RTCError::OK();
}

void SignalingChannel::OnceConnected(std::function<void()> callback) {
  once_connected_.push_back(std::move(callback));
}

bool SignalingChannel::IsConnected() const {
  return socket_->IsConnected();
}

std::string SignalingChannel::GetId() const {
  return socket_->Id();
}

void SignalingChannel::OnConnect() {
  APP_LOG(AS_INFO) << "Signaling connected, id " << socket_->Id();
  if (reconnect_) {
    reconnect_->OnConnected();
  }
  if (handshake_ == Handshake::kAwaitingConnect) {
    handshake_ = Handshake::kAwaitingReady;
  }
  std::vector<std::function<void()>> callbacks;
  callbacks.swap(once_connected_);
  for (auto& callback : callbacks) {
    callback();
  }
}

void SignalingChannel::OnDisconnect(const std::string& reason) {
  APP_LOG(AS_WARNING) << "Signaling disconnected: " << reason;
  if (handshake_ != Handshake::kIdle) {
    CompleteHandshake(webrtc::RTCError(webrtc::RTCErrorType::NETWORK_ERROR,
                                       "Disconnected before ready: " + reason));
  }
  if (reason == kClientDisconnectReason) {
    return;
  }
  AttemptReconnection();
}

void SignalingChannel::OnConnectError(const std::string& message) {
  APP_LOG(AS_ERROR) << "Signaling connect error: " << message;
  if (handshake_ != Handshake::kIdle) {
    CompleteHandshake(webrtc::RTCError(webrtc::RTCErrorType::NETWORK_ERROR,
                                       "Connection failed: " + message));
  }
  AttemptReconnection();
}

void SignalingChannel::OnEvent(const std::string& event,
                               const Json::Value& args) {
  if (event == kConnectionReadyEvent && handshake_ == Handshake::kAwaitingReady) {
    APP_LOG(AS_INFO) << "Signaling connection ready";
    CompleteHandshake(webrtc::RTCError::OK());
  }
  auto it = handlers_.find(event);
  if (it == handlers_.end()) {
    APP_LOG(AS_VERBOSE) << "No listener for signaling event " << event;
    return;
  }
  // Copy, a handler may register more listeners.
  std::vector<EventHandler> handlers = it->second;
  for (auto& handler : handlers) {
    handler(args);
  }
}

void SignalingChannel::AttemptReconnection() {
  if (!reconnect_ || !reconnect_->enabled() || socket_->IsConnected()) {
    return;
  }
  ReconnectTimer::Result result = reconnect_->Schedule([this]() {
    if (socket_->IsConnected()) {
      return;
    }
    APP_LOG(AS_INFO) << "Signaling reconnect attempt " << reconnect_->attempt();
    socket_->Open(token_);
  });
  if (result == ReconnectTimer::Result::kExhausted) {
    const std::string message = "Signaling gave up after " +
                                std::to_string(reconnect_->attempt()) + " reconnect attempts";
    APP_LOG(AS_ERROR) << message;
    // Reported once; a new SetConnection(true) starts over.
    reconnect_->set_enabled(false);
    if (on_gave_up_) {
      on_gave_up_(webrtc::RTCError(webrtc::RTCErrorType::NETWORK_ERROR, message));
    }
  }
}

void SignalingChannel::CompleteHandshake(webrtc::RTCError error) {
  handshake_ = Handshake::kIdle;
  CompletionCallback done = std::move(pending_done_);
  pending_done_ = nullptr;
  if (done) {
    done(std::move(error));
  }
}
