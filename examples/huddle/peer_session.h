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

#ifndef WEBRTC_HUDDLE_PEER_SESSION_H_
#define WEBRTC_HUDDLE_PEER_SESSION_H_

#include <functional>
#include <memory>
#include <string>

#include <json/json.h>

#include "api/media_stream_interface.h"
#include "api/rtc_error.h"
#include "api/scoped_refptr.h"

using MediaStreamRef = rtc::scoped_refptr<webrtc::MediaStreamInterface>;
using CompletionCallback = std::function<void(webrtc::RTCError)>;

// Metadata tag of screen sharing calls.
extern const char kScreenSharingCallType[];

// Reliable JSON message channel to one remote peer.
class DataConnection {
 public:
  virtual ~DataConnection() = default;

  virtual std::string peer() const = 0;
  virtual bool open() const = 0;
  virtual bool Send(const Json::Value& message) = 0;
  virtual void Close() = 0;

  virtual void SetOnOpen(std::function<void()> callback) = 0;
  virtual void SetOnData(std::function<void(const Json::Value&)> callback) = 0;
  virtual void SetOnClose(std::function<void()> callback) = 0;
};

// Audio/video call with one remote peer.
class MediaConnection {
 public:
  virtual ~MediaConnection() = default;

  virtual std::string peer() const = 0;
  virtual const Json::Value& metadata() const = 0;
  // A null |local_stream| answers receive-only.
  virtual void Answer(MediaStreamRef local_stream) = 0;
  virtual void Close() = 0;
  virtual MediaStreamRef remote_stream() const = 0;

  // For each track of |stream| replaces the track of the sender of the same
  // kind, or adds a sender when there is none. |done| runs once any
  // renegotiation this caused has finished.
  virtual void ReplaceOrAddTracks(MediaStreamRef stream, CompletionCallback done) = 0;

  virtual void SetOnStream(std::function<void(MediaStreamRef)> callback) = 0;
  virtual void SetOnClose(std::function<void()> callback) = 0;
  virtual void SetOnError(std::function<void(webrtc::RTCError)> callback) = 0;
};

class PeerSessionProviderObserver {
 public:
  virtual void OnOpen(const std::string& id) = 0;
  // Server messages other than the built in ones, e.g. "welcome".
  virtual void OnServerMessage(const std::string& type, const Json::Value& message) = 0;
  virtual void OnCall(std::shared_ptr<MediaConnection> call) = 0;
  virtual void OnConnection(std::shared_ptr<DataConnection> connection) = 0;
  virtual void OnDisconnected() = 0;
  // |type| is e.g. "server-error", "unavailable-id", "invalid-key", "network".
  virtual void OnError(const std::string& type, const std::string& message) = 0;

 protected:
  virtual ~PeerSessionProviderObserver() = default;
};

// Peer-to-peer session endpoint registered with a brokering server.
class PeerSessionProvider {
 public:
  virtual ~PeerSessionProvider() = default;

  virtual void SetObserver(PeerSessionProviderObserver* observer) = 0;
  virtual void Open() = 0;
  // Reopens the server link keeping the id.
  virtual void Reconnect() = 0;
  virtual void Destroy() = 0;
  virtual bool disconnected() const = 0;
  virtual bool destroyed() const = 0;
  virtual std::string id() const = 0;

  virtual std::shared_ptr<MediaConnection> Call(const std::string& peer,
                                                MediaStreamRef stream,
                                                const Json::Value& metadata) = 0;
  virtual std::shared_ptr<DataConnection> Connect(const std::string& peer) = 0;
};

class PeerSessionProviderFactory {
 public:
  virtual ~PeerSessionProviderFactory() = default;
  virtual std::unique_ptr<PeerSessionProvider> Create(const std::string& token) = 0;
};

#endif  // WEBRTC_HUDDLE_PEER_SESSION_H_
