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

#ifndef WEBRTC_HUDDLE_SOCKETIO_H_
#define WEBRTC_HUDDLE_SOCKETIO_H_

#include <map>
#include <memory>
#include <optional>
#include <string>

#include <json/json.h>

#include "api/rtc_error.h"
#include "api/scoped_refptr.h"
#include "api/task_queue/pending_task_safety_flag.h"
#include "api/task_queue/task_queue_base.h"
#include "rtc_base/thread.h"

#include "signaling_channel.h"
#include "wsock.h"

enum class SocketIoPacketType {
  kConnect = 0,
  kDisconnect = 1,
  kEvent = 2,
  kAck = 3,
  kConnectError = 4,
};

struct SocketIoPacket {
  SocketIoPacketType type = SocketIoPacketType::kEvent;
  std::string nsp = "/";
  std::optional<int> id;
  Json::Value data;  // null when absent
};

// Socket.IO v5 text encoding, without the Engine.IO message prefix.
std::string EncodeSocketIoPacket(const SocketIoPacket& packet);
webrtc::RTCErrorOr<SocketIoPacket> DecodeSocketIoPacket(const std::string& text);

struct SignalingUrl {
  bool secure = false;
  std::string host;
  std::string port;
  std::string path = "/socket.io/";
};

// Accepts ws, wss, http and https urls.
webrtc::RTCErrorOr<SignalingUrl> ParseSignalingUrl(const std::string& url);
std::string UrlEncode(const std::string& value);

// SignalingSocket over Engine.IO v4 with the websocket transport only.
class SocketIoSignalingSocket : public SignalingSocket {
 public:
  SocketIoSignalingSocket(const SignalingUrl& url,
                          rtc::Thread* network_thread,
                          webrtc::TaskQueueBase* session_queue);
  ~SocketIoSignalingSocket() override;

  void SetObserver(SignalingSocketObserver* observer) override;
  void Open(const std::string& token) override;
  void Close() override;
  bool IsConnected() const override { return connected_; }
  std::string Id() const override { return sid_; }
  bool Emit(const std::string& event,
            const Json::Value& args,
            AckCallback ack) override;

 private:
  void PostToSession(std::function<void()> task);
  void HandleEngineIoPacket(const std::string& text);
  void HandleSocketIoPacket(const SocketIoPacket& packet);
  void HandleTransportClosed(const std::string& reason);
  bool Send(const std::string& text);

  const SignalingUrl url_;
  rtc::Thread* const network_thread_;
  webrtc::TaskQueueBase* const session_queue_;
  std::unique_ptr<WebSocketClient> ws_;
  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> safety_;
  SignalingSocketObserver* observer_ = nullptr;
  bool transport_open_ = false;
  bool connected_ = false;
  std::string sid_;
  int next_ack_id_ = 0;
  std::map<int, AckCallback> acks_;
};

#endif  // WEBRTC_HUDDLE_SOCKETIO_H_
