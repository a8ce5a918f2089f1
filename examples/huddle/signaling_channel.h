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

#ifndef WEBRTC_HUDDLE_SIGNALING_CHANNEL_H_
#define WEBRTC_HUDDLE_SIGNALING_CHANNEL_H_

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <json/json.h>

#include "api/rtc_error.h"
#include "api/task_queue/task_queue_base.h"

#include "backoff.h"
#include "option.h"

// Reason reported by a socket for a disconnect the client asked for.
extern const char kClientDisconnectReason[];
// Application level readiness signal sent by the server after connect.
extern const char kConnectionReadyEvent[];

class SignalingSocketObserver {
 public:
  virtual void OnConnect() = 0;
  virtual void OnDisconnect(const std::string& reason) = 0;
  virtual void OnConnectError(const std::string& message) = 0;
  // |args| is the array of event arguments.
  virtual void OnEvent(const std::string& event, const Json::Value& args) = 0;

 protected:
  virtual ~SignalingSocketObserver() = default;
};

// Duplex event transport towards the coordination server. Callbacks are
// delivered on the session task queue.
class SignalingSocket {
 public:
  using AckCallback = std::function<void(const Json::Value& args)>;

  virtual ~SignalingSocket() = default;

  virtual void SetObserver(SignalingSocketObserver* observer) = 0;
  // Starts a connection attempt; |token| travels as connection metadata.
  virtual void Open(const std::string& token) = 0;
  // Client initiated close. Reported as kClientDisconnectReason, if at all.
  virtual void Close() = 0;
  virtual bool IsConnected() const = 0;
  virtual std::string Id() const = 0;
  virtual bool Emit(const std::string& event,
                    const Json::Value& args,
                    AckCallback ack) = 0;
};

// Reconnecting control channel. Connecting is a two phase handshake: the
// transport connect, then the server's connection:ready event.
class SignalingChannel : public SignalingSocketObserver {
 public:
  using CompletionCallback = std::function<void(webrtc::RTCError)>;
  using EventHandler = std::function<void(const Json::Value& args)>;

  SignalingChannel(webrtc::TaskQueueBase* task_queue,
                   std::unique_ptr<SignalingSocket> socket);
  ~SignalingChannel() override;

  SignalingChannel(const SignalingChannel&) = delete;
  SignalingChannel& operator=(const SignalingChannel&) = delete;

  // Configures without connecting.
  webrtc::RTCError Initialize(const SignalingReconnectOptions& options);

  // status == true connects and completes once the handshake finished or
  // failed. status == false is a voluntary disconnect that is never retried.
  void SetConnection(bool status,
                     const std::string& token,
                     CompletionCallback done);

  webrtc::RTCError Emit(const std::string& event,
                        const Json::Value& args,
                        SignalingSocket::AckCallback ack = nullptr);
  webrtc::RTCError Listen(const std::string& event, EventHandler handler);

  // Runs |callback| on the next successful transport connect.
  void OnceConnected(std::function<void()> callback);

  // Called once reconnecting ran out of attempts. The channel stays down.
  void SetOnGaveUp(CompletionCallback callback) { on_gave_up_ = std::move(callback); }

  bool initialized() const { return initialized_; }
  bool IsConnected() const;
  std::string GetId() const;
  const ReconnectTimer* reconnect_timer() const { return reconnect_.get(); }

  // SignalingSocketObserver
  void OnConnect() override;
  void OnDisconnect(const std::string& reason) override;
  void OnConnectError(const std::string& message) override;
  void OnEvent(const std::string& event, const Json::Value& args) override;

 private:
  enum class Handshake { kIdle, kAwaitingConnect, kAwaitingReady };

  void AttemptReconnection();
  void CompleteHandshake(webrtc::RTCError error);

  webrtc::TaskQueueBase* const task_queue_;
  std::unique_ptr<SignalingSocket> socket_;
  std::unique_ptr<ReconnectTimer> reconnect_;
  SignalingReconnectOptions options_;
  bool initialized_ = false;
  std::string token_;
  Handshake handshake_ = Handshake::kIdle;
  CompletionCallback pending_done_;
  std::map<std::string, std::vector<EventHandler>> handlers_;
  std::vector<std::function<void()>> once_connected_;
  CompletionCallback on_gave_up_;
};

#endif  // WEBRTC_HUDDLE_SIGNALING_CHANNEL_H_
